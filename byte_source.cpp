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

#include "byte_source.h"

namespace jstream {

int
StringSource::read()
{
    if (position_ >= data_.size())
        return kEof;
    return data_[position_++] & 255;
}

int
FileSource::read()
{
    int c = getc(f_);
    if (c == EOF)
        return kEof;
    ++position_;
    return c & 255;
}

int
StreamSource::read()
{
    std::istream::int_type c = stream_.get();
    if (c == std::istream::traits_type::eof())
        return kEof;
    ++position_;
    return c & 255;
}

} // namespace jstream
