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
#include "error.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace jstream {

class Json
{
  public:
    enum Type
    {
        Null,
        Bool,
        Long,
        Double,
        String,
        Array,
        Object
    };

    // Object members in the order their keys first appeared.
    typedef std::vector<std::pair<std::string, Json>> Members;

  private:
    Type type_;
    union
    {
        bool bool_value;
        long long long_value;
        double double_value;
        std::string string_value;
        std::vector<Json> array_value;
        Members object_value;
    };

  public:
    // Parses a complete document held in memory.
    static std::pair<Status, Json> parse(const std::string& s);

    Json(const Json&);
    Json(Json&&) noexcept;
    Json(unsigned long);
    Json(unsigned long long);
    Json(const char*);
    Json(const std::string&);
    ~Json();

    Json(const std::nullptr_t = nullptr) : type_(Null)
    {
    }

    Json(bool value) : type_(Bool), bool_value(value)
    {
    }

    Json(int value) : type_(Long), long_value(value)
    {
    }

    Json(unsigned value) : type_(Long), long_value(value)
    {
    }

    Json(long value) : type_(Long), long_value(value)
    {
    }

    Json(long long value) : type_(Long), long_value(value)
    {
    }

    Json(float value) : type_(Double), double_value(value)
    {
    }

    Json(double value) : type_(Double), double_value(value)
    {
    }

    Json(std::string&& value) : type_(String), string_value(std::move(value))
    {
    }

    Json& operator=(const Json&);
    Json& operator=(Json&&) noexcept;

    Type getType() const
    {
        return type_;
    }

    bool isNull() const
    {
        return type_ == Null;
    }

    bool isBool() const
    {
        return type_ == Bool;
    }

    bool isNumber() const
    {
        return type_ == Long || type_ == Double;
    }

    bool isLong() const
    {
        return type_ == Long;
    }

    bool isDouble() const
    {
        return type_ == Double;
    }

    bool isString() const
    {
        return type_ == String;
    }

    bool isArray() const
    {
        return type_ == Array;
    }

    bool isObject() const
    {
        return type_ == Object;
    }

    bool getBool() const;
    double getNumber() const;
    long long getLong() const;
    double getDouble() const;
    std::string& getString();
    const std::string& getString() const;
    std::vector<Json>& getArray();
    const std::vector<Json>& getArray() const;
    Members& getObject();
    const Members& getObject() const;

    bool contains(const std::string& key) const;

    // Returns the member named key, or nullptr.
    const Json* find(const std::string& key) const;

    void setArray();
    void setObject();

    Json& operator[](size_t index);

    // Appends a null member if key is absent, so assigning to an
    // existing key keeps its position.
    Json& operator[](const std::string& key);

    // Values of different types are never equal, so 1 != 1.0. Object
    // member order is ignored.
    bool operator==(const Json& other) const;

    bool operator!=(const Json& other) const
    {
        return !(*this == other);
    }

  private:
    void clear();
    void releaseChildren(std::vector<Json>& pending);
};

} // namespace jstream
