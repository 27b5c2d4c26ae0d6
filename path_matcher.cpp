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

#include "path_matcher.h"
#include "error.h"

#include <algorithm>

namespace jstream {

static std::string
quotePath(const Path& path)
{
    return '"' + toDotPath(path) + '"';
}

PathMatcher::PathMatcher(Parser& parser, const std::vector<Path>& targets)
  : parser_(parser)
{
    for (const Path& target : targets)
        if (std::find(targets_.begin(), targets_.end(), target) ==
            targets_.end())
            targets_.push_back(target);
    for (const Path& a : targets_)
        for (const Path& b : targets_)
            if (a.size() < b.size() && isPrefixOf(a, b))
                throw UnsupportedPath("Path " + quotePath(a) +
                                      " is a prefix of path " + quotePath(b));
    found_.assign(targets_.size(), false);
    remaining_ = targets_.size();
}

bool
PathMatcher::match()
{
    for (size_t i = 0; i < targets_.size(); ++i) {
        if (!found_[i] && targets_[i] == path_) {
            found_[i] = true;
            --remaining_;
            return true;
        }
    }
    return false;
}

bool
PathMatcher::next(Path& path, Json& value)
{
    while (remaining_) {
        Event event = parser_.next();
        if (event.type == Event::EndOfStream)
            return false;
        if (event.isSeparator())
            continue;
        if (event.type == Event::ObjectClose ||
            event.type == Event::ArrayClose) {
            if (path_.empty())
                JSTREAM_LOGIC_ERROR("Container closed at the document root.");
            path_.pop_back();
            // the document is complete, leave what follows unread
            if (path_.empty())
                return false;
            continue;
        }
        if (event.type == Event::ObjectKey) {
            path_.back().setKey(parser_.convert(event).getString());
            continue;
        }

        // a value inside an array advances the index
        if (!path_.empty() && path_.back().isIndex())
            path_.back().setIndex(path_.back().getIndex() + 1);

        if (match()) {
            path = path_;
            value = event.isScalar() ? parser_.convert(event)
                                     : parser_.load(event);
            return true;
        }
        if (event.type == Event::ObjectOpen)
            path_.emplace_back("");
        else if (event.type == Event::ArrayOpen)
            path_.emplace_back(-1);
    }
    return false;
}

void
Parser::yieldPaths(const std::vector<Path>& targets,
                   const std::function<bool(const Path&, Json&)>& callback)
{
    PathMatcher matcher(*this, targets);
    Path path;
    Json value;
    while (matcher.next(path, value))
        if (!callback(path, value))
            break;
}

} // namespace jstream
