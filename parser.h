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
#include "byte_cursor.h"
#include "grammar.h"
#include "json.h"
#include "path.h"
#include "utf8.h"

#include <functional>
#include <string>
#include <vector>

namespace jstream {

// Raw bytes of one string, key or number, produced on demand. String
// bytes exclude the quotes and keep backslash escapes as written.
class ByteSequence
{
  public:
    enum Kind
    {
        StringBytes,
        NumberBytes,
    };

    ByteSequence() = default;
    ByteSequence(const ByteSequence&) = delete;
    ByteSequence& operator=(const ByteSequence&) = delete;

    bool hasNext();

    // Returns the next byte. Calling this when hasNext() is false is a
    // logic error.
    int next();

    // Consumes whatever the caller did not read.
    void drainRemaining();

    // Joins the remaining bytes.
    std::string read();

    bool exhausted() const
    {
        return done_ && !has_lookahead_;
    }

  private:
    friend class Parser;

    enum State
    {
        Idle,
        StrChar,
        StrEscape,
        StrHex,
        NumStart,
        NumSign,
        NumZero,
        NumInt,
        NumDot,
        NumFrac,
        NumExp,
        NumExpSign,
        NumExpDigits,
    };

    void reset(ByteCursor* cursor, Kind kind, bool allow_exponent);
    bool advance(int* out);
    bool lexString(int c, int* out);
    bool lexNumber(int c, int* out);
    bool endNumber(int c);

    ByteCursor* cursor_ = nullptr;
    size_t start_ = 0; // offset of the opening quote
    size_t yielded_ = 0;
    State state_ = Idle;
    int hex_digits_ = 0;
    int lookahead_ = 0;
    bool has_lookahead_ = false;
    bool done_ = true;
    bool allow_exponent_ = true;
};

struct Event
{
    enum Type
    {
        EndOfStream,
        ArrayOpen,
        ArrayClose,
        ArrayItemSep,
        ObjectOpen,
        ObjectClose,
        ObjectKey,
        KeyValueSep,
        ObjectItemSep,
        String,
        Number,
        Null,
        True,
        False,
        ArrayValueString,
        ArrayValueNumber,
        ArrayValueNull,
        ArrayValueTrue,
        ArrayValueFalse,
        ObjectValueString,
        ObjectValueNumber,
        ObjectValueNull,
        ObjectValueTrue,
        ObjectValueFalse,
    };

    Type type = EndOfStream;

    // Set for strings, numbers and keys. Valid until the next event.
    ByteSequence* bytes = nullptr;

    bool isScalar() const;
    bool isSeparator() const;
    bool isArrayValue() const;

    // True if the event begins a value: a container open or a scalar.
    bool startsValue() const
    {
        return type == ArrayOpen || type == ObjectOpen || isScalar();
    }

    // The scalar type with its container context removed, e.g.
    // ArrayValueNumber becomes Number.
    Type baseType() const;
};

const char*
EventTypeToString(Event::Type type);

struct ParserOptions
{
    // Report ':' and ',' as events.
    bool emit_separators = false;

    // Accept 1e10 in addition to the narrower integer and fraction
    // grammar.
    bool allow_exponent = true;

    // Decode backslash escapes when strings are converted to Json.
    bool decode_escapes = true;

    // Policy applied when strings are converted to Json.
    Utf8Decoder::Errors utf8_errors = Utf8Decoder::Strict;
    bool reject_noncharacters = false;
};

// Pull parser which turns a byte source into a sequence of events. The
// grammar is driven by an explicit stack so no recursion happens on
// document depth.
class Parser
{
  public:
    explicit Parser(ByteSource& source);
    Parser(ByteSource& source, const ParserOptions& options);
    Parser(const Parser&) = delete;
    Parser& operator=(const Parser&) = delete;

    // Returns the next event. The byte sequence of the previous event
    // is drained first. Keeps returning EndOfStream once the document
    // has ended.
    Event next();

    // Materializes the next value. If it is the whole document then
    // end of input is consumed as well.
    Json load();

    // Materializes the value whose first event was already consumed.
    Json load(const Event& first);

    // Converts a scalar or key event to its Json value.
    Json convert(const Event& event);

    // Invokes callback for each value whose location is one of
    // targets. Returning false from the callback stops parsing.
    void yieldPaths(const std::vector<Path>& targets,
                    const std::function<bool(const Path&, Json&)>& callback);

    const ParserOptions& options() const
    {
        return options_;
    }

    size_t offset() const
    {
        return cursor_.offset();
    }

  private:
    enum ContainerContext
    {
        ArrayValue,
        ObjectValue,
    };

    bool parseNext(Event& event);
    int expect(const Expected& expected, Matcher* matched);
    void expectLiteral(const char* rest);
    void onValue(int c, const Matcher& matched, Event& event);
    void afterScalar(const Matcher& matched);
    void afterClose();
    std::string convertString(ByteSequence* bytes);

    ByteCursor cursor_;
    GrammarStack stack_;
    std::vector<ContainerContext> contexts_;
    ByteSequence sequence_;
    ParserOptions options_;
    bool started_ = false;
    bool finished_ = false;
};

} // namespace jstream
