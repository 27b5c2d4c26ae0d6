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

#include "error.h"
#include "byte_cursor.h"

#include <sstream>

namespace jstream {

std::string
describeByte(int c)
{
    if (c == kEof)
        return "end of input";
    char buf[8];
    if (0x20 <= c && c < 0x7f) {
        buf[0] = '\'';
        buf[1] = c;
        buf[2] = '\'';
        buf[3] = '\0';
    } else {
        buf[0] = '0';
        buf[1] = 'x';
        buf[2] = "0123456789abcdef"[(c & 0xF0) >> 4];
        buf[3] = "0123456789abcdef"[c & 0x0F];
        buf[4] = '\0';
    }
    return buf;
}

static std::string
unexpectedMessage(int c, size_t offset, const std::string& expected)
{
    std::ostringstream oss;
    oss << "Expected " << expected << " at position " << offset << " but got "
        << describeByte(c);
    return oss.str();
}

static std::string
utf8Message(size_t offset)
{
    std::ostringstream oss;
    oss << "Invalid UTF-8 encoding at byte number " << offset;
    return oss.str();
}

Error::Error(Status status, const std::string& message, size_t offset)
  : std::runtime_error(message), status_(status), offset_(offset)
{
}

UnexpectedCharacter::UnexpectedCharacter(int c,
                                         size_t offset,
                                         const std::string& expected)
  : Error(c == kEof ? unexpected_eof : unexpected_character,
          unexpectedMessage(c, offset, expected),
          offset)
  , c_(c)
  , expected_(expected)
{
}

InvalidUtf8Encoding::InvalidUtf8Encoding(size_t offset)
  : Error(invalid_utf8_encoding, utf8Message(offset), offset)
{
}

UnsupportedPath::UnsupportedPath(const std::string& message)
  : Error(unsupported_path, message)
{
}

const char*
StatusToString(Status status)
{
    switch (status) {
        case success:
            return "success";
        case absent_value:
            return "absent_value";
        case unexpected_eof:
            return "unexpected_eof";
        case malformed_path:
            return "malformed_path";
        case unsupported_path:
            return "unsupported_path";
        case unexpected_character:
            return "unexpected_character";
        case invalid_utf8_encoding:
            return "invalid_utf8_encoding";
        default:
            JSTREAM_LOGIC_ERROR("Unhandled jstream status value.");
    }
}

} // namespace jstream
