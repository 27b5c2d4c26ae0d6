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
#include <cstdio>
#include <istream>
#include <string>
#include <utility>

namespace jstream {

// Returned by ByteSource::read() once the source is exhausted.
static constexpr int kEof = -1;

// A readable source of single bytes. Exhaustion is reported by
// returning kEof, never by throwing.
class ByteSource
{
  public:
    virtual ~ByteSource() = default;

    // Returns the next byte as 0..255, or kEof.
    virtual int read() = 0;

    // Number of bytes handed out so far.
    size_t position() const
    {
        return position_;
    }

  protected:
    size_t position_ = 0;
};

class StringSource : public ByteSource
{
  public:
    explicit StringSource(const std::string& data) : data_(data)
    {
    }

    explicit StringSource(std::string&& data) : data_(std::move(data))
    {
    }

    int read() override;

  private:
    std::string data_;
};

// Reads from a stdio stream. The caller keeps ownership of the FILE.
class FileSource : public ByteSource
{
  public:
    explicit FileSource(FILE* f) : f_(f)
    {
    }

    int read() override;

  private:
    FILE* f_;
};

class StreamSource : public ByteSource
{
  public:
    explicit StreamSource(std::istream& stream) : stream_(stream)
    {
    }

    int read() override;

  private:
    std::istream& stream_;
};

} // namespace jstream
