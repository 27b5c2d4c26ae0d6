// -*- mode:c++;indent-tabs-mode:nil;c-basic-offset:4;coding:utf-8 -*-
// vi: set et ft=cpp ts=4 sts=4 sw=4 fenc=utf-8 :vi
//
// Copyright 2024 Mozilla Foundation
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once
#include <cstddef>
#include <cstdlib>
#include <stdexcept>
#include <string>

#if defined(__cpp_exceptions) || defined(__EXCEPTIONS) || defined(_CPPUNWIND)
#define JSTREAM_LOGIC_ERROR(s) throw std::logic_error(s)
#else
#define JSTREAM_LOGIC_ERROR(s) abort()
#endif

namespace jstream {

enum Status
{
    success,
    absent_value,
    unexpected_eof,
    malformed_path,
    unsupported_path,
    unexpected_character,
    invalid_utf8_encoding,
};

const char*
StatusToString(Status status);

// Base of every error raised for bad input or bad arguments. Engine
// bugs are reported with JSTREAM_LOGIC_ERROR instead.
class Error : public std::runtime_error
{
  public:
    Error(Status status, const std::string& message, size_t offset = 0);

    Status status() const
    {
        return status_;
    }

    // 1-based count of bytes read when the error was detected, or 0
    // when the error does not come from a byte stream.
    size_t offset() const
    {
        return offset_;
    }

  private:
    Status status_;
    size_t offset_;
};

class UnexpectedCharacter : public Error
{
  public:
    UnexpectedCharacter(int c, size_t offset, const std::string& expected);

    int character() const
    {
        return c_;
    }

    const std::string& expected() const
    {
        return expected_;
    }

  private:
    int c_;
    std::string expected_;
};

class InvalidUtf8Encoding : public Error
{
  public:
    explicit InvalidUtf8Encoding(size_t offset);
};

class UnsupportedPath : public Error
{
  public:
    explicit UnsupportedPath(const std::string& message);
};

// Renders a byte for diagnostics, e.g. 'a', 0x0a or "end of input".
std::string
describeByte(int c);

} // namespace jstream
