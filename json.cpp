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

#include "json.h"
#include "byte_source.h"
#include "parser.h"

#include <climits>
#include <new>

namespace jstream {

Json::Json(unsigned long value)
{
    if (value <= LLONG_MAX) {
        type_ = Long;
        long_value = value;
    } else {
        type_ = Double;
        double_value = value;
    }
}

Json::Json(unsigned long long value)
{
    if (value <= LLONG_MAX) {
        type_ = Long;
        long_value = value;
    } else {
        type_ = Double;
        double_value = value;
    }
}

Json::Json(const char* value)
{
    if (value) {
        type_ = String;
        new (&string_value) std::string(value);
    } else {
        type_ = Null;
    }
}

Json::Json(const std::string& value) : type_(String), string_value(value)
{
}

Json::~Json()
{
    if (type_ >= String)
        clear();
}

// Moves nested containers out of this one onto pending.
void
Json::releaseChildren(std::vector<Json>& pending)
{
    if (type_ == Array) {
        for (Json& child : array_value)
            if (child.type_ >= Array)
                pending.push_back(std::move(child));
    } else if (type_ == Object) {
        for (auto& member : object_value)
            if (member.second.type_ >= Array)
                pending.push_back(std::move(member.second));
    }
}

void
Json::clear()
{
    switch (type_) {
        case String:
            string_value.~basic_string();
            break;
        case Array:
        case Object: {
            // flatten first so destroying a deep tree never recurses
            std::vector<Json> pending;
            releaseChildren(pending);
            while (!pending.empty()) {
                Json child = std::move(pending.back());
                pending.pop_back();
                child.releaseChildren(pending);
            }
            if (type_ == Array)
                array_value.~vector();
            else
                object_value.~Members();
            break;
        }
        default:
            break;
    }
    type_ = Null;
}

Json::Json(const Json& other) : type_(other.type_)
{
    switch (type_) {
        case Null:
            break;
        case Bool:
            bool_value = other.bool_value;
            break;
        case Long:
            long_value = other.long_value;
            break;
        case Double:
            double_value = other.double_value;
            break;
        case String:
            new (&string_value) std::string(other.string_value);
            break;
        case Array:
            new (&array_value) std::vector<Json>(other.array_value);
            break;
        case Object:
            new (&object_value) Members(other.object_value);
            break;
        default:
            JSTREAM_LOGIC_ERROR("Unhandled JSON type.");
    }
}

Json&
Json::operator=(const Json& other)
{
    if (this != &other) {
        if (type_ >= String)
            clear();
        type_ = other.type_;
        switch (type_) {
            case Null:
                break;
            case Bool:
                bool_value = other.bool_value;
                break;
            case Long:
                long_value = other.long_value;
                break;
            case Double:
                double_value = other.double_value;
                break;
            case String:
                new (&string_value) std::string(other.string_value);
                break;
            case Array:
                new (&array_value) std::vector<Json>(other.array_value);
                break;
            case Object:
                new (&object_value) Members(other.object_value);
                break;
            default:
                JSTREAM_LOGIC_ERROR("Unhandled JSON type.");
        }
    }
    return *this;
}

Json::Json(Json&& other) noexcept : type_(other.type_)
{
    switch (type_) {
        case Null:
            break;
        case Bool:
            bool_value = other.bool_value;
            break;
        case Long:
            long_value = other.long_value;
            break;
        case Double:
            double_value = other.double_value;
            break;
        case String:
            new (&string_value) std::string(std::move(other.string_value));
            break;
        case Array:
            new (&array_value) std::vector<Json>(std::move(other.array_value));
            break;
        case Object:
            new (&object_value) Members(std::move(other.object_value));
            break;
        default:
            JSTREAM_LOGIC_ERROR("Unhandled JSON type.");
    }
    other.clear();
}

Json&
Json::operator=(Json&& other) noexcept
{
    if (this != &other) {
        if (type_ >= String)
            clear();
        type_ = other.type_;
        switch (type_) {
            case Null:
                break;
            case Bool:
                bool_value = other.bool_value;
                break;
            case Long:
                long_value = other.long_value;
                break;
            case Double:
                double_value = other.double_value;
                break;
            case String:
                new (&string_value) std::string(std::move(other.string_value));
                break;
            case Array:
                new (&array_value)
                  std::vector<Json>(std::move(other.array_value));
                break;
            case Object:
                new (&object_value) Members(std::move(other.object_value));
                break;
            default:
                JSTREAM_LOGIC_ERROR("Unhandled JSON type.");
        }
        other.clear();
    }
    return *this;
}

bool
Json::getBool() const
{
    switch (type_) {
        case Bool:
            return bool_value;
        default:
            JSTREAM_LOGIC_ERROR("JSON value is not a bool.");
    }
}

double
Json::getNumber() const
{
    switch (type_) {
        case Long:
            return long_value;
        case Double:
            return double_value;
        default:
            JSTREAM_LOGIC_ERROR("JSON value is not a number.");
    }
}

long long
Json::getLong() const
{
    switch (type_) {
        case Long:
            return long_value;
        default:
            JSTREAM_LOGIC_ERROR("JSON value is not a long.");
    }
}

double
Json::getDouble() const
{
    switch (type_) {
        case Double:
            return double_value;
        default:
            JSTREAM_LOGIC_ERROR("JSON value is not a floating-point number.");
    }
}

std::string&
Json::getString()
{
    switch (type_) {
        case String:
            return string_value;
        default:
            JSTREAM_LOGIC_ERROR("JSON value is not a string.");
    }
}

const std::string&
Json::getString() const
{
    switch (type_) {
        case String:
            return string_value;
        default:
            JSTREAM_LOGIC_ERROR("JSON value is not a string.");
    }
}

std::vector<Json>&
Json::getArray()
{
    switch (type_) {
        case Array:
            return array_value;
        default:
            JSTREAM_LOGIC_ERROR("JSON value is not an array.");
    }
}

const std::vector<Json>&
Json::getArray() const
{
    switch (type_) {
        case Array:
            return array_value;
        default:
            JSTREAM_LOGIC_ERROR("JSON value is not an array.");
    }
}

Json::Members&
Json::getObject()
{
    switch (type_) {
        case Object:
            return object_value;
        default:
            JSTREAM_LOGIC_ERROR("JSON value is not an object.");
    }
}

const Json::Members&
Json::getObject() const
{
    switch (type_) {
        case Object:
            return object_value;
        default:
            JSTREAM_LOGIC_ERROR("JSON value is not an object.");
    }
}

void
Json::setArray()
{
    if (type_ >= String)
        clear();
    type_ = Array;
    new (&array_value) std::vector<Json>();
}

void
Json::setObject()
{
    if (type_ >= String)
        clear();
    type_ = Object;
    new (&object_value) Members();
}

const Json*
Json::find(const std::string& key) const
{
    if (!isObject())
        return nullptr;
    for (const auto& member : object_value)
        if (member.first == key)
            return &member.second;
    return nullptr;
}

bool
Json::contains(const std::string& key) const
{
    return find(key) != nullptr;
}

Json&
Json::operator[](size_t index)
{
    if (!isArray())
        setArray();
    if (index >= array_value.size()) {
        array_value.resize(index + 1);
    }
    return array_value[index];
}

Json&
Json::operator[](const std::string& key)
{
    if (!isObject())
        setObject();
    for (auto& member : object_value)
        if (member.first == key)
            return member.second;
    object_value.emplace_back(key, Json());
    return object_value.back().second;
}

bool
Json::operator==(const Json& other) const
{
    if (type_ != other.type_)
        return false;
    switch (type_) {
        case Null:
            return true;
        case Bool:
            return bool_value == other.bool_value;
        case Long:
            return long_value == other.long_value;
        case Double:
            return double_value == other.double_value;
        case String:
            return string_value == other.string_value;
        case Array:
            return array_value == other.array_value;
        case Object: {
            if (object_value.size() != other.object_value.size())
                return false;
            for (const auto& member : object_value) {
                const Json* value = other.find(member.first);
                if (!value || *value != member.second)
                    return false;
            }
            return true;
        }
        default:
            JSTREAM_LOGIC_ERROR("Unhandled JSON type.");
    }
}

std::pair<Status, Json>
Json::parse(const std::string& s)
{
    std::pair<Status, Json> res;
    StringSource source(s);
    Parser parser(source);
    try {
        res.second = parser.load();
        res.first = success;
    } catch (const Error& e) {
        res.first = e.status();
        res.second = Json();
    }
    return res;
}

} // namespace jstream
