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

#include "byte_cursor.h"
#include "error.h"

namespace jstream {

int
ByteCursor::next()
{
    if (pushed_) {
        pushed_ = false;
        return pushback_;
    }
    ++offset_;
    return source_.read();
}

void
ByteCursor::pushBack(int c)
{
    if (pushed_)
        JSTREAM_LOGIC_ERROR("Byte pushed back while another is queued.");
    pushback_ = c;
    pushed_ = true;
}

int
ByteCursor::nextNonSpace()
{
    int c;
    do {
        c = next();
    } while (isJsonSpace(c));
    return c;
}

} // namespace jstream
