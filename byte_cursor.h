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
#include "byte_source.h"

namespace jstream {

// Byte reader with an absolute offset and one byte of push-back.
class ByteCursor
{
  public:
    explicit ByteCursor(ByteSource& source) : source_(source)
    {
    }

    // Returns the pushed back byte if there is one, otherwise reads
    // from the source. Reading end of input also counts as a read.
    int next();

    // Queues c, which may be kEof, to be returned by the next call to
    // next(). Only one byte may be queued at a time.
    void pushBack(int c);

    // Skips JSON whitespace.
    int nextNonSpace();

    size_t offset() const
    {
        return offset_;
    }

    bool hasPushBack() const
    {
        return pushed_;
    }

  private:
    ByteSource& source_;
    size_t offset_ = 0;
    int pushback_ = kEof;
    bool pushed_ = false;
};

inline bool
isJsonSpace(int c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

} // namespace jstream
