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
#include "grammar.h"
#include "parser.h"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>

#define ARRAYLEN(A) \
    ((sizeof(A) / sizeof(*(A))) / ((unsigned)!(sizeof(A) % sizeof(*(A)))))

#define BENCH(ITERATIONS, WORK_PER_RUN, CODE) \
    do { \
        auto start = std::chrono::high_resolution_clock::now(); \
        for (int __i = 0; __i < ITERATIONS; ++__i) { \
            std::atomic_signal_fence(std::memory_order_acq_rel); \
            CODE; \
        } \
        auto end = std::chrono::high_resolution_clock::now(); \
        auto duration = \
          std::chrono::duration_cast<std::chrono::nanoseconds>(end - start); \
        long long work = (WORK_PER_RUN) * (ITERATIONS); \
        double nanos = (duration.count() + work - 1) / (double)work; \
        printf("%10g ns %2dx %s\n", nanos, (ITERATIONS), #CODE); \
    } while (0)

using jstream::ByteCursor;
using jstream::Event;
using jstream::Expected;
using jstream::GrammarStack;
using jstream::Json;
using jstream::Parser;
using jstream::ParserOptions;
using jstream::StringSource;
using jstream::UnexpectedCharacter;

// Renders the whole event sequence, e.g. "ArrayOpen ArrayValueNumber(1)
// ArrayClose EndOfStream".
static std::string
events(const std::string& json, const ParserOptions& options = ParserOptions())
{
    StringSource source(json);
    Parser parser(source, options);
    std::string b;
    for (;;) {
        Event event = parser.next();
        if (!b.empty())
            b += ' ';
        b += jstream::EventTypeToString(event.type);
        if (event.bytes) {
            b += '(';
            b += event.bytes->read();
            b += ')';
        }
        if (event.type == Event::EndOfStream)
            return b;
    }
}

static const struct
{
    std::string json;
    std::string events;
} kEvents[] = {
    { "\"test\"", "String(test) EndOfStream" },
    { "[1]", "ArrayOpen ArrayValueNumber(1) ArrayClose EndOfStream" },
    { "{\"a\": 0}",
      "ObjectOpen ObjectKey(a) ObjectValueNumber(0) ObjectClose EndOfStream" },
    { "-3.1415", "Number(-3.1415) EndOfStream" },
    { "null", "Null EndOfStream" },
    { " true ", "True EndOfStream" },
    { "[]", "ArrayOpen ArrayClose EndOfStream" },
    { "{}", "ObjectOpen ObjectClose EndOfStream" },
    { "[[1],{\"b\":null},true,\"s\",2.5e3]",
      "ArrayOpen ArrayOpen ArrayValueNumber(1) ArrayClose ObjectOpen "
      "ObjectKey(b) ObjectValueNull ObjectClose ArrayValueTrue "
      "ArrayValueString(s) ArrayValueNumber(2.5e3) ArrayClose EndOfStream" },
    { "{\"a\":{\"b\":[false]},\"c\":\"d\"}",
      "ObjectOpen ObjectKey(a) ObjectOpen ObjectKey(b) ArrayOpen "
      "ArrayValueFalse ArrayClose ObjectClose ObjectKey(c) "
      "ObjectValueString(d) ObjectClose EndOfStream" },
    { "\"a\\nb\\u0041\\\"\"", "String(a\\nb\\u0041\\\") EndOfStream" },
};

void
events_test()
{
    for (size_t i = 0; i < ARRAYLEN(kEvents); ++i) {
        std::string got = events(kEvents[i].json);
        if (got != kEvents[i].events) {
            printf("error: events(%s) was\n\t%s\nbut should have been\n\t%s\n",
                   kEvents[i].json.c_str(),
                   got.c_str(),
                   kEvents[i].events.c_str());
            exit(1);
        }
    }
}

void
whitespace_test()
{
    if (events(" \t{\r\n\"a\" :\n[ 1 ,2\t] , \"b\" : { } }\n ") !=
        events("{\"a\":[1,2],\"b\":{}}"))
        exit(2);
}

void
trailing_comma_test()
{
    if (events("[1,]") != events("[1]"))
        exit(3);
    if (events("{\"a\":0,}") != events("{\"a\":0}"))
        exit(4);
    if (events("[[],{},]") != events("[[],{}]"))
        exit(5);
}

void
separator_test()
{
    ParserOptions options;
    options.emit_separators = true;
    std::string got = events("{\"a\":[1,2],\"b\":3}", options);
    if (got != "ObjectOpen ObjectKey(a) KeyValueSep ArrayOpen "
               "ArrayValueNumber(1) ArrayItemSep ArrayValueNumber(2) "
               "ArrayClose ObjectItemSep ObjectKey(b) KeyValueSep "
               "ObjectValueNumber(3) ObjectClose EndOfStream") {
        printf("error: separator events were %s\n", got.c_str());
        exit(6);
    }
    StringSource source("[{\"x\":1},2]");
    Parser parser(source, options);
    parser.next();
    if (parser.load() != Json::parse("{\"x\":1}").second)
        exit(7);
    if (parser.load() != Json(2))
        exit(8);
}

void
control_character_test()
{
    StringSource source("[\"ab\x01\"]");
    Parser parser(source);
    if (parser.next().type != Event::ArrayOpen)
        exit(9);
    Event event = parser.next();
    if (event.type != Event::ArrayValueString)
        exit(10);
    try {
        event.bytes->read();
        exit(11);
    } catch (const UnexpectedCharacter& e) {
        if (e.character() != 1 || e.offset() != 5)
            exit(12);
        if (e.status() != jstream::unexpected_character)
            exit(13);
    }
}

void
unexpected_character_test()
{
    StringSource source("[1}");
    Parser parser(source);
    try {
        for (;;)
            if (parser.next().type == Event::EndOfStream)
                break;
        exit(14);
    } catch (const UnexpectedCharacter& e) {
        if (e.character() != '}' || e.offset() != 3)
            exit(15);
        if (e.expected() != "',' or ']'")
            exit(16);
        if (std::string(e.what()) !=
            "Expected ',' or ']' at position 3 but got '}'")
            exit(17);
    }

    StringSource source2("[1");
    Parser parser2(source2);
    try {
        for (;;)
            if (parser2.next().type == Event::EndOfStream)
                break;
        exit(18);
    } catch (const UnexpectedCharacter& e) {
        if (e.character() != jstream::kEof || e.offset() != 3)
            exit(19);
        if (e.status() != jstream::unexpected_eof)
            exit(61);
    }
}

void
drain_test()
{
    StringSource source("[\"abc\",\"def\",12345,6]");
    Parser parser(source);
    parser.next();
    Event event = parser.next();
    if (event.bytes->next() != 'a')
        exit(20);
    event = parser.next();
    if (event.type != Event::ArrayValueString || event.bytes->read() != "def")
        exit(21);
    event = parser.next();
    if (event.type != Event::ArrayValueNumber)
        exit(22);
    event = parser.next();
    if (event.bytes->read() != "6")
        exit(23);
    if (!event.bytes->exhausted())
        exit(24);
    try {
        event.bytes->next();
        exit(25);
    } catch (const std::logic_error&) {
    }
    if (parser.next().type != Event::ArrayClose)
        exit(26);
    if (parser.next().type != Event::EndOfStream)
        exit(27);
    if (parser.next().type != Event::EndOfStream)
        exit(28);
}

void
number_grammar_test()
{
    StringSource source("01");
    Parser parser(source);
    Event event = parser.next();
    if (event.type != Event::Number || event.bytes->read() != "0")
        exit(29);
    try {
        parser.next();
        exit(30);
    } catch (const UnexpectedCharacter& e) {
        if (e.character() != '1')
            exit(31);
    }

    ParserOptions options;
    options.allow_exponent = false;
    StringSource source2("[1e5]");
    Parser parser2(source2, options);
    parser2.next();
    event = parser2.next();
    if (event.bytes->read() != "1")
        exit(32);
    try {
        parser2.next();
        exit(33);
    } catch (const UnexpectedCharacter& e) {
        if (e.character() != 'e')
            exit(34);
    }
}

void
cursor_test()
{
    StringSource source(" \t\nx");
    ByteCursor cursor(source);
    if (cursor.nextNonSpace() != 'x' || cursor.offset() != 4)
        exit(35);
    cursor.pushBack('x');
    try {
        cursor.pushBack('y');
        exit(36);
    } catch (const std::logic_error&) {
    }
    if (cursor.next() != 'x' || cursor.offset() != 4)
        exit(37);
    if (cursor.next() != jstream::kEof || cursor.offset() != 5)
        exit(38);
}

void
grammar_stack_test()
{
    GrammarStack stack;
    if (stack.size() != 2 || stack.top().mandatory() != jstream::kValueStart)
        exit(39);
    stack.push(Expected(jstream::kArrayItemSep, jstream::kArrayClose));
    try {
        stack.popMandatory();
        exit(40);
    } catch (const std::logic_error&) {
    }
    if (stack.pop().mandatory() != jstream::kValueStart)
        exit(41);
    if (stack.popMandatory() != jstream::kEndOfInput)
        exit(42);
    try {
        stack.pop();
        exit(43);
    } catch (const std::logic_error&) {
    }
    if (jstream::kArrayItemSep == jstream::kObjectItemSep)
        exit(44);
    if (!jstream::kArrayItemSep.matches(',') ||
        !jstream::kObjectItemSep.matches(','))
        exit(45);
}

void
load_test()
{
    StringSource source("{\"a\": [1, 2.5, \"x\", null, true, false], \"b\": {}}");
    Parser parser(source);
    Json want;
    want["a"].setArray();
    want["a"].getArray().push_back(1);
    want["a"].getArray().push_back(2.5);
    want["a"].getArray().push_back("x");
    want["a"].getArray().push_back(nullptr);
    want["a"].getArray().push_back(true);
    want["a"].getArray().push_back(false);
    want["b"].setObject();
    if (parser.load() != want)
        exit(46);
    if (parser.next().type != Event::EndOfStream)
        exit(47);

    StringSource source2("[1] 2");
    Parser parser2(source2);
    try {
        parser2.load();
        exit(48);
    } catch (const UnexpectedCharacter& e) {
        if (e.character() != '2')
            exit(49);
    }

    StringSource source3("[{\"a\":1},2]");
    Parser parser3(source3);
    parser3.next();
    if (parser3.load() != Json::parse("{\"a\":1}").second)
        exit(50);
    Event event = parser3.next();
    if (event.type != Event::ArrayValueNumber || parser3.convert(event) != 2)
        exit(51);

    StringSource source4("[]");
    Parser parser4(source4);
    parser4.next();
    try {
        parser4.load();
        exit(52);
    } catch (const jstream::Error& e) {
        if (e.status() != jstream::absent_value)
            exit(53);
    }
}

void
string_options_test()
{
    ParserOptions options;
    options.decode_escapes = false;
    StringSource source("\"a\\u0041\"");
    Parser parser(source, options);
    if (parser.load() != Json("a\\u0041"))
        exit(54);

    StringSource source2("\"a\\u0041\"");
    Parser parser2(source2);
    if (parser2.load() != Json("aA"))
        exit(55);

    options = ParserOptions();
    options.utf8_errors = jstream::Utf8Decoder::Replace;
    StringSource source3("[\"x\xffy\"]");
    Parser parser3(source3, options);
    if (parser3.load()[0] != Json("x\xef\xbf\xbdy"))
        exit(56);

    options.utf8_errors = jstream::Utf8Decoder::Ignore;
    StringSource source4("\"x\xffy\"");
    Parser parser4(source4, options);
    if (parser4.load() != Json("xy"))
        exit(57);
}

void
stream_source_test()
{
    std::istringstream in("{\"k\": [true]}");
    jstream::StreamSource source(in);
    Parser parser(source);
    if (parser.load() != Json::parse("{\"k\":[true]}").second)
        exit(58);
    if (source.position() != 13)
        exit(59);
}

// Nesting depth is bounded by memory rather than the native stack.
void
deep_nesting_test()
{
    const int kDepth = 100000;
    std::string json(kDepth, '[');
    json.append(kDepth, ']');
    StringSource source(json);
    Parser parser(source);
    int opens = 0, closes = 0;
    for (;;) {
        Event event = parser.next();
        if (event.type == Event::ArrayOpen)
            ++opens;
        else if (event.type == Event::ArrayClose)
            ++closes;
        else if (event.type == Event::EndOfStream)
            break;
    }
    if (opens != kDepth || closes != kDepth)
        exit(60);
}

// A materialized tree as deep as the event stream must also be torn
// down without recursing once per level.
void
deep_load_test()
{
    const int kDepth = 1000000;
    {
        std::string json(kDepth, '[');
        json.append(kDepth, ']');
        StringSource source(json);
        Parser parser(source);
        Json root = parser.load();
        int depth = 1;
        const Json* j = &root;
        while (j->isArray() && !j->getArray().empty()) {
            j = &j->getArray()[0];
            ++depth;
        }
        if (depth != kDepth || !j->isArray())
            exit(62);
    }
    {
        std::string json;
        for (int i = 0; i < kDepth / 4; ++i)
            json += "{\"a\":[";
        for (int i = 0; i < kDepth / 4; ++i)
            json += "]}";
        StringSource source(json);
        Parser parser(source);
        Json root = parser.load();
        Json moved = std::move(root);
        if (!moved.isObject() || !root.isNull())
            exit(63);
    }
}

void
wide_object_test()
{
    const int kKeys = 100000;
    std::string json = "{";
    for (int i = 0; i < kKeys; ++i)
        json += "\"k" + std::to_string(i) + "\":" + std::to_string(i) + ",";
    json += "\"k5\":-1}";
    StringSource source(json);
    Parser parser(source);
    Json root = parser.load();
    const Json::Members& members = root.getObject();
    if (members.size() != (size_t)kKeys)
        exit(64);
    if (members[5].first != "k5" || members[5].second != Json(-1))
        exit(65);
    if (members[kKeys - 1].first != "k" + std::to_string(kKeys - 1))
        exit(66);
}

// Encoding errors inside a string are located in the stream, not in
// the string body.
void
string_encoding_offset_test()
{
    static const struct
    {
        std::string json;
        size_t offset;
        int partial;
    } kOffsets[] = {
        { "[\"abcdefgh\xff\"]", 11, 0 },
        { "{\"ab\xff\": 1}", 5, 0 },
        { "\"ab\xff\"", 4, 1 },
        { "[1, \"\\n\xc3\"]", 9, 0 },
    };
    for (size_t i = 0; i < ARRAYLEN(kOffsets); ++i) {
        StringSource source(kOffsets[i].json);
        Parser parser(source);
        Event event;
        do {
            event = parser.next();
        } while (!event.bytes || event.baseType() == Event::Number);
        for (int j = 0; j < kOffsets[i].partial; ++j)
            event.bytes->next();
        try {
            parser.convert(event);
            exit(67);
        } catch (const jstream::InvalidUtf8Encoding& e) {
            if (e.offset() != kOffsets[i].offset) {
                printf("error: %zu: utf-8 error at %zu, want %zu\n",
                       i,
                       e.offset(),
                       kOffsets[i].offset);
                exit(68);
            }
        }
    }
    std::string json = "[\"abcdefgh\xff\"]";
    StringSource source(json);
    Parser parser(source);
    try {
        parser.load();
        exit(69);
    } catch (const jstream::InvalidUtf8Encoding& e) {
        if (e.offset() != 11)
            exit(70);
    }
}

int
main()
{
    events_test();
    whitespace_test();
    trailing_comma_test();
    separator_test();
    control_character_test();
    unexpected_character_test();
    drain_test();
    number_grammar_test();
    cursor_test();
    grammar_stack_test();
    load_test();
    string_options_test();
    stream_source_test();
    deep_nesting_test();
    deep_load_test();
    wide_object_test();
    string_encoding_offset_test();

    BENCH(2000, 1, events_test());
    BENCH(2000, 1, load_test());
    BENCH(20, 1, deep_nesting_test());
    BENCH(5, 1, wide_object_test());
}
