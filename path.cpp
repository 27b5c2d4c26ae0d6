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

#include "path.h"
#include "error.h"

#include <climits>
#include <sstream>

namespace jstream {

const std::string&
PathSegment::getKey() const
{
    switch (kind_) {
        case Key:
            return key_;
        default:
            JSTREAM_LOGIC_ERROR("Path segment is not a key.");
    }
}

long long
PathSegment::getIndex() const
{
    switch (kind_) {
        case Index:
            return index_;
        default:
            JSTREAM_LOGIC_ERROR("Path segment is not an index.");
    }
}

[[noreturn]] static void
pathError(const std::string& text, size_t pos, const char* message)
{
    std::ostringstream oss;
    oss << "Dot path parse error at position " << pos << " in \"" << text
        << "\": " << message;
    throw Error(malformed_path, oss.str());
}

static void
appendSegment(Path& path,
              const std::string& text,
              size_t pos,
              const std::string& segment,
              bool escaped)
{
    if (segment.empty())
        pathError(text, pos, "empty segment");
    if (!escaped) {
        long long index = 0;
        size_t i;
        for (i = 0; i < segment.size(); ++i) {
            int c = segment[i] & 255;
            if (!('0' <= c && c <= '9'))
                break;
            if (index > (LLONG_MAX - (c - '0')) / 10)
                pathError(text, pos, "array index out of range");
            index = index * 10 + (c - '0');
        }
        if (i == segment.size()) {
            path.emplace_back(index);
            return;
        }
    }
    path.emplace_back(segment);
}

Path
parseDotPath(const std::string& text)
{
    Path path;
    if (text.empty())
        return path;
    std::string segment;
    bool escaped = false;
    size_t pos = 0;
    while (pos < text.size()) {
        char c = text[pos++];
        if (c != '.') {
            segment += c;
        } else if (pos < text.size() && text[pos] == '.') {
            segment += '.';
            escaped = true;
            ++pos;
        } else {
            appendSegment(path, text, pos, segment, escaped);
            segment.clear();
            escaped = false;
        }
    }
    appendSegment(path, text, pos, segment, escaped);
    return path;
}

std::string
toDotPath(const Path& path)
{
    std::string b;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i)
            b += '.';
        if (path[i].isIndex()) {
            b += std::to_string(path[i].getIndex());
        } else {
            for (char c : path[i].getKey()) {
                if (c == '.')
                    b += '.';
                b += c;
            }
        }
    }
    return b;
}

bool
isPrefixOf(const Path& prefix, const Path& path)
{
    if (prefix.size() > path.size())
        return false;
    for (size_t i = 0; i < prefix.size(); ++i)
        if (prefix[i] != path[i])
            return false;
    return true;
}

} // namespace jstream
