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
#include <string>
#include <vector>

namespace jstream {

// An object key or an array index.
class PathSegment
{
  public:
    enum Kind
    {
        Key,
        Index,
    };

    PathSegment(const char* key) : kind_(Key), key_(key), index_(0)
    {
    }

    PathSegment(const std::string& key) : kind_(Key), key_(key), index_(0)
    {
    }

    PathSegment(int index) : kind_(Index), index_(index)
    {
    }

    PathSegment(long long index) : kind_(Index), index_(index)
    {
    }

    Kind kind() const
    {
        return kind_;
    }

    bool isKey() const
    {
        return kind_ == Key;
    }

    bool isIndex() const
    {
        return kind_ == Index;
    }

    const std::string& getKey() const;
    long long getIndex() const;

    void setKey(const std::string& key)
    {
        kind_ = Key;
        key_ = key;
    }

    void setIndex(long long index)
    {
        kind_ = Index;
        key_.clear();
        index_ = index;
    }

    bool operator==(const PathSegment& other) const
    {
        if (kind_ != other.kind_)
            return false;
        return kind_ == Key ? key_ == other.key_ : index_ == other.index_;
    }

    bool operator!=(const PathSegment& other) const
    {
        return !(*this == other);
    }

  private:
    Kind kind_;
    std::string key_;
    long long index_;
};

typedef std::vector<PathSegment> Path;

// Parses "people.0.first..name" into {"people", 0, "first.name"}.
// A digit-only segment is an index and ".." is a literal dot.
Path
parseDotPath(const std::string& text);

// Inverse of parseDotPath().
std::string
toDotPath(const Path& path);

bool
isPrefixOf(const Path& prefix, const Path& path);

} // namespace jstream
