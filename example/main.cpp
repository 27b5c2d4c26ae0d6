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
//
// Example usage of the jstream library
//
// This example demonstrates:
// - Walking a document event by event
// - Skipping string bytes without buffering them
// - Loading values into Json trees
// - Picking values out of a document by dot path
// - Decoding UTF-8 with different error policies
// - Error handling

#include "../error.h"
#include "../parser.h"
#include "../path.h"
#include "../utf8.h"
#include <iostream>
#include <sstream>
#include <string>

using jstream::Event;
using jstream::Json;
using jstream::Parser;
using jstream::StringSource;

static std::string
describe(const Json& json)
{
    std::ostringstream os;
    switch (json.getType()) {
        case Json::Null:
            os << "null";
            break;
        case Json::Bool:
            os << (json.getBool() ? "true" : "false");
            break;
        case Json::Long:
            os << json.getLong();
            break;
        case Json::Double:
            os << json.getDouble();
            break;
        case Json::String:
            os << '"' << json.getString() << '"';
            break;
        case Json::Array:
            os << "array of " << json.getArray().size();
            break;
        case Json::Object:
            os << "object of " << json.getObject().size();
            break;
    }
    return os.str();
}

// Example 1: Walk the events of a document
void example_events()
{
    std::cout << "\n=== Example 1: Events ===" << std::endl;

    std::string json = R"({"name": "Ada", "langs": ["en", "fr"], "age": 36})";
    StringSource source(json);
    Parser parser(source);
    for (;;) {
        Event event = parser.next();
        std::cout << "  " << jstream::EventTypeToString(event.type);
        if (event.bytes)
            std::cout << " " << event.bytes->read();
        std::cout << std::endl;
        if (event.type == Event::EndOfStream)
            break;
    }
}

// Example 2: Only look at the keys, the parser drains what we skip
void example_skip()
{
    std::cout << "\n=== Example 2: Skipping Values ===" << std::endl;

    std::string json = R"({"blob": "a very long string we never read", "id": 7})";
    StringSource source(json);
    Parser parser(source);
    for (Event event = parser.next(); event.type != Event::EndOfStream;
         event = parser.next()) {
        if (event.type == Event::ObjectKey)
            std::cout << "  key: " << parser.convert(event).getString()
                      << std::endl;
    }
}

// Example 3: Load a value into a Json tree
void example_load()
{
    std::cout << "\n=== Example 3: Loading ===" << std::endl;

    std::string json = R"({"users": [{"id": 1, "name": "Alice"}, {"id": 2}]})";
    StringSource source(json);
    Parser parser(source);
    Json doc = parser.load();

    std::cout << "  users: " << describe(doc["users"]) << std::endl;
    std::cout << "  first name: " << describe(doc["users"][0]["name"])
              << std::endl;

    // Load just the array, then keep walking
    std::string rows = R"([[1, 2], [3.5, "x"]])";
    StringSource rows_source(rows);
    Parser rows_parser(rows_source);
    rows_parser.next();
    for (Event event = rows_parser.next(); event.type == Event::ArrayOpen;
         event = rows_parser.next()) {
        Json row = rows_parser.load(event);
        std::cout << "  row: " << describe(row[0]) << ", " << describe(row[1])
                  << std::endl;
    }
}

// Example 4: Select values by dot path
void example_paths()
{
    std::cout << "\n=== Example 4: Paths ===" << std::endl;

    std::string json = R"({
        "database": {"host": "localhost", "port": 5432},
        "servers": [{"host": "a"}, {"host": "b"}],
        "v1.2": true
    })";
    StringSource source(json);
    Parser parser(source);
    parser.yieldPaths({ jstream::parseDotPath("database.port"),
                        jstream::parseDotPath("servers.1.host"),
                        jstream::parseDotPath("v1..2") },
                      [](const jstream::Path& path, Json& value) {
                          std::cout << "  " << jstream::toDotPath(path)
                                    << " = " << describe(value) << std::endl;
                          return true;
                      });
}

// Example 5: UTF-8 error policies
void example_utf8()
{
    std::cout << "\n=== Example 5: UTF-8 ===" << std::endl;

    std::string bytes = "caf\xc3\xa9 \xff!";
    std::cout << "  replace: "
              << jstream::Utf8Decoder::transcode(
                   bytes, jstream::Utf8Decoder::Replace)
              << std::endl;
    std::cout << "  ignore: "
              << jstream::Utf8Decoder::transcode(bytes,
                                                 jstream::Utf8Decoder::Ignore)
              << std::endl;
    try {
        jstream::Utf8Decoder::transcode(bytes);
    } catch (const jstream::InvalidUtf8Encoding& e) {
        std::cout << "  strict: " << e.what() << std::endl;
    }
}

// Example 6: Error handling
void example_error_handling()
{
    std::cout << "\n=== Example 6: Error Handling ===" << std::endl;

    auto result = Json::parse(R"({"a": 1, "b": 2,})");
    std::cout << "  status: " << jstream::StatusToString(result.first)
              << std::endl;

    std::string json = "[1, 2}";
    StringSource source(json);
    Parser parser(source);
    try {
        parser.load();
    } catch (const jstream::UnexpectedCharacter& e) {
        std::cout << "  " << e.what() << std::endl;
    }
}

int main()
{
    std::cout << "jstream Example Program" << std::endl;
    std::cout << "=======================" << std::endl;

    example_events();
    example_skip();
    example_load();
    example_paths();
    example_utf8();
    example_error_handling();

    std::cout << "\nAll examples completed!" << std::endl;
    return 0;
}
