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
#include "json.h"
#include "parser.h"
#include "path.h"

#include <vector>

namespace jstream {

// Walks the events of a parser and hands out the values found at the
// target paths, one per call to next(). A matched container is loaded
// through the same parser, after which the walk resumes. Nothing more
// is read once every target has been found.
//
// Throws UnsupportedPath if one target lies inside another, because
// loading the outer value would consume the inner one.
class PathMatcher
{
  public:
    PathMatcher(Parser& parser, const std::vector<Path>& targets);

    // Stores the next match and returns true, or returns false once
    // every target was found or the document ended.
    bool next(Path& path, Json& value);

    size_t remaining() const
    {
        return remaining_;
    }

  private:
    bool match();

    Parser& parser_;
    std::vector<Path> targets_;
    std::vector<bool> found_;
    size_t remaining_;
    Path path_;
};

} // namespace jstream
