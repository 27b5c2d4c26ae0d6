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
#include "byte_cursor.h"

#include <string>

namespace jstream {

// Streaming UTF-8 decoder.
//
// Sequences are assembled the way Thompson and Pike laid them out and
// checked against RFC 3629 as they are read: overlong forms, the lead
// byte 0xED of UTF-16 surrogates and codepoints above U+10FFFF are
// rejected, and optionally noncharacters too. Each maximal invalid
// subsequence counts as one error.
class Utf8Decoder
{
  public:
    enum Errors
    {
        Strict,  // throw InvalidUtf8Encoding
        Replace, // substitute U+FFFD
        Ignore,  // drop the offending bytes
    };

    static constexpr int kReplacementCharacter = 0xFFFD;

    explicit Utf8Decoder(ByteSource& source,
                         Errors errors = Strict,
                         bool reject_noncharacters = false);

    // Returns the next codepoint, or kEof.
    int next();

    size_t offset() const
    {
        return cursor_.offset();
    }

    // Decodes all of `bytes` and returns them re-encoded as UTF-8.
    static std::string transcode(const std::string& bytes,
                                 Errors errors = Strict,
                                 bool reject_noncharacters = false);

  private:
    bool reject();

    ByteCursor cursor_;
    Errors errors_;
    bool reject_noncharacters_;
};

bool
isNoncharacter(int codepoint);

void
appendUtf8(std::string& out, int codepoint);

} // namespace jstream
