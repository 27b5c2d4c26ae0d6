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

#include "parser.h"
#include "error.h"

namespace jstream {

static bool
isHexDigit(int c)
{
    return ('0' <= c && c <= '9') || ('a' <= c && c <= 'f') ||
           ('A' <= c && c <= 'F');
}

bool
Event::isScalar() const
{
    return type >= String;
}

bool
Event::isSeparator() const
{
    return type == KeyValueSep || type == ArrayItemSep ||
           type == ObjectItemSep;
}

bool
Event::isArrayValue() const
{
    return ArrayValueString <= type && type <= ArrayValueFalse;
}

Event::Type
Event::baseType() const
{
    if (type >= ObjectValueString)
        return static_cast<Type>(type - (ObjectValueString - String));
    if (type >= ArrayValueString)
        return static_cast<Type>(type - (ArrayValueString - String));
    return type;
}

const char*
EventTypeToString(Event::Type type)
{
    switch (type) {
        case Event::EndOfStream:
            return "EndOfStream";
        case Event::ArrayOpen:
            return "ArrayOpen";
        case Event::ArrayClose:
            return "ArrayClose";
        case Event::ArrayItemSep:
            return "ArrayItemSep";
        case Event::ObjectOpen:
            return "ObjectOpen";
        case Event::ObjectClose:
            return "ObjectClose";
        case Event::ObjectKey:
            return "ObjectKey";
        case Event::KeyValueSep:
            return "KeyValueSep";
        case Event::ObjectItemSep:
            return "ObjectItemSep";
        case Event::String:
            return "String";
        case Event::Number:
            return "Number";
        case Event::Null:
            return "Null";
        case Event::True:
            return "True";
        case Event::False:
            return "False";
        case Event::ArrayValueString:
            return "ArrayValueString";
        case Event::ArrayValueNumber:
            return "ArrayValueNumber";
        case Event::ArrayValueNull:
            return "ArrayValueNull";
        case Event::ArrayValueTrue:
            return "ArrayValueTrue";
        case Event::ArrayValueFalse:
            return "ArrayValueFalse";
        case Event::ObjectValueString:
            return "ObjectValueString";
        case Event::ObjectValueNumber:
            return "ObjectValueNumber";
        case Event::ObjectValueNull:
            return "ObjectValueNull";
        case Event::ObjectValueTrue:
            return "ObjectValueTrue";
        case Event::ObjectValueFalse:
            return "ObjectValueFalse";
        default:
            JSTREAM_LOGIC_ERROR("Unhandled event type.");
    }
}

void
ByteSequence::reset(ByteCursor* cursor, Kind kind, bool allow_exponent)
{
    cursor_ = cursor;
    start_ = cursor->offset();
    yielded_ = 0;
    state_ = kind == StringBytes ? StrChar : NumStart;
    hex_digits_ = 0;
    has_lookahead_ = false;
    done_ = false;
    allow_exponent_ = allow_exponent;
}

bool
ByteSequence::hasNext()
{
    if (has_lookahead_)
        return true;
    if (done_)
        return false;
    if (advance(&lookahead_)) {
        has_lookahead_ = true;
        return true;
    }
    done_ = true;
    state_ = Idle;
    return false;
}

int
ByteSequence::next()
{
    if (!hasNext())
        JSTREAM_LOGIC_ERROR("Read past the end of a byte sequence.");
    has_lookahead_ = false;
    ++yielded_;
    return lookahead_;
}

void
ByteSequence::drainRemaining()
{
    int c;
    has_lookahead_ = false;
    while (!done_) {
        if (!advance(&c)) {
            done_ = true;
            state_ = Idle;
        }
    }
}

std::string
ByteSequence::read()
{
    std::string b;
    while (hasNext())
        b += static_cast<char>(next());
    return b;
}

// Reads one byte of the value and returns false when the value has
// ended. The closing quote of a string is consumed, whereas the byte
// after a number is pushed back.
bool
ByteSequence::advance(int* out)
{
    int c = cursor_->next();
    switch (state_) {
        case StrChar:
        case StrEscape:
        case StrHex:
            return lexString(c, out);
        case Idle:
            JSTREAM_LOGIC_ERROR("Advanced an idle byte sequence.");
        default:
            return lexNumber(c, out);
    }
}

bool
ByteSequence::lexString(int c, int* out)
{
    switch (state_) {
        case StrChar:
            if (c == '"')
                return false;
            if (c == '\\') {
                state_ = StrEscape;
            } else if (c == kEof || c < 0x20) {
                throw UnexpectedCharacter(
                  c, cursor_->offset(), "a string character or '\"'");
            }
            break;
        case StrEscape:
            switch (c) {
                case '"':
                case '\\':
                case '/':
                case 'b':
                case 'f':
                case 'n':
                case 'r':
                case 't':
                    state_ = StrChar;
                    break;
                case 'u':
                    state_ = StrHex;
                    hex_digits_ = 0;
                    break;
                default:
                    throw UnexpectedCharacter(
                      c, cursor_->offset(), "an escape character");
            }
            break;
        case StrHex:
            if (!isHexDigit(c))
                throw UnexpectedCharacter(c, cursor_->offset(), "a hex digit");
            if (++hex_digits_ == 4)
                state_ = StrChar;
            break;
        default:
            JSTREAM_LOGIC_ERROR("Unhandled string lexer state.");
    }
    *out = c;
    return true;
}

bool
ByteSequence::endNumber(int c)
{
    cursor_->pushBack(c);
    return false;
}

bool
ByteSequence::lexNumber(int c, int* out)
{
    bool exponent = allow_exponent_ && (c == 'e' || c == 'E');
    switch (state_) {
        case NumStart:
            if (c == '-') {
                state_ = NumSign;
            } else if (c == '0') {
                state_ = NumZero;
            } else if (isDigit(c)) {
                state_ = NumInt;
            } else {
                throw UnexpectedCharacter(c, cursor_->offset(), "a number");
            }
            break;
        case NumSign:
            if (c == '0') {
                state_ = NumZero;
            } else if (isDigit(c)) {
                state_ = NumInt;
            } else {
                throw UnexpectedCharacter(c, cursor_->offset(), "a digit");
            }
            break;
        case NumZero:
            if (c == '.') {
                state_ = NumDot;
            } else if (exponent) {
                state_ = NumExp;
            } else {
                return endNumber(c);
            }
            break;
        case NumInt:
            if (c == '.') {
                state_ = NumDot;
            } else if (exponent) {
                state_ = NumExp;
            } else if (!isDigit(c)) {
                return endNumber(c);
            }
            break;
        case NumDot:
            if (!isDigit(c))
                throw UnexpectedCharacter(c, cursor_->offset(), "a digit");
            state_ = NumFrac;
            break;
        case NumFrac:
            if (exponent) {
                state_ = NumExp;
            } else if (!isDigit(c)) {
                return endNumber(c);
            }
            break;
        case NumExp:
            if (c == '+' || c == '-') {
                state_ = NumExpSign;
            } else if (isDigit(c)) {
                state_ = NumExpDigits;
            } else {
                throw UnexpectedCharacter(
                  c, cursor_->offset(), "a digit or exponent sign");
            }
            break;
        case NumExpSign:
            if (!isDigit(c))
                throw UnexpectedCharacter(c, cursor_->offset(), "a digit");
            state_ = NumExpDigits;
            break;
        case NumExpDigits:
            if (!isDigit(c))
                return endNumber(c);
            break;
        default:
            JSTREAM_LOGIC_ERROR("Unhandled number lexer state.");
    }
    *out = c;
    return true;
}

Parser::Parser(ByteSource& source) : cursor_(source)
{
}

Parser::Parser(ByteSource& source, const ParserOptions& options)
  : cursor_(source), options_(options)
{
}

Event
Parser::next()
{
    sequence_.drainRemaining();
    Event event;
    if (finished_)
        return event;
    started_ = true;
    while (!parseNext(event)) {
    }
    return event;
}

// Skips whitespace and tests the next byte against an entry of the
// grammar stack. When the optional half of a pair matches, the
// mandatory half goes back on the stack.
int
Parser::expect(const Expected& expected, Matcher* matched)
{
    int c = cursor_.nextNonSpace();
    if (expected.hasOptional() && expected.optional().matches(c)) {
        stack_.push(Expected(expected.mandatory()));
        *matched = expected.optional();
        return c;
    }
    if (expected.mandatory().matches(c)) {
        *matched = expected.mandatory();
        return c;
    }
    throw UnexpectedCharacter(c, cursor_.offset(), expected.describe());
}

void
Parser::expectLiteral(const char* rest)
{
    for (const char* p = rest; *p; ++p) {
        Matcher matcher = Matcher::literal(*p & 255);
        int c = cursor_.next();
        if (!matcher.matches(c))
            throw UnexpectedCharacter(c, cursor_.offset(), matcher.describe());
    }
}

// Returns false if the production taken emits no event.
bool
Parser::parseNext(Event& event)
{
    Matcher matched = kEndOfInput;
    int c = expect(stack_.pop(), &matched);
    switch (matched.id()) {
        case Matcher::EndOfInput:
            finished_ = true;
            event.type = Event::EndOfStream;
            return true;
        case Matcher::ValueStart:
        case Matcher::ArrayValueStart:
        case Matcher::ObjectValueStart:
            onValue(c, matched, event);
            return true;
        case Matcher::ObjectKeyStart:
            stack_.push(Expected(kKeyValueSep));
            sequence_.reset(
              &cursor_, ByteSequence::StringBytes, options_.allow_exponent);
            event.type = Event::ObjectKey;
            event.bytes = &sequence_;
            return true;
        case Matcher::ObjectClose:
            afterClose();
            event.type = Event::ObjectClose;
            return true;
        case Matcher::ArrayClose:
            afterClose();
            event.type = Event::ArrayClose;
            return true;
        case Matcher::KeyValueSep:
            stack_.push(Expected(kObjectValueStart));
            event.type = Event::KeyValueSep;
            return options_.emit_separators;
        case Matcher::ObjectItemSep:
            stack_.push(Expected(kObjectKeyStart, stack_.popMandatory()));
            event.type = Event::ObjectItemSep;
            return options_.emit_separators;
        case Matcher::ArrayItemSep:
            stack_.push(Expected(kArrayValueStart, stack_.popMandatory()));
            event.type = Event::ArrayItemSep;
            return options_.emit_separators;
        default:
            JSTREAM_LOGIC_ERROR("Unhandled grammar production.");
    }
}

void
Parser::onValue(int c, const Matcher& matched, Event& event)
{
    Event::Type type;
    switch (c) {
        case '{':
        case '[':
            if (matched == kArrayValueStart)
                contexts_.push_back(ArrayValue);
            else if (matched == kObjectValueStart)
                contexts_.push_back(ObjectValue);
            if (c == '{') {
                stack_.push(Expected(kObjectKeyStart, kObjectClose));
                event.type = Event::ObjectOpen;
            } else {
                stack_.push(Expected(kArrayValueStart, kArrayClose));
                event.type = Event::ArrayOpen;
            }
            return;
        case '"':
            sequence_.reset(
              &cursor_, ByteSequence::StringBytes, options_.allow_exponent);
            event.bytes = &sequence_;
            type = Event::String;
            break;
        case 'n':
            expectLiteral("ull");
            type = Event::Null;
            break;
        case 't':
            expectLiteral("rue");
            type = Event::True;
            break;
        case 'f':
            expectLiteral("alse");
            type = Event::False;
            break;
        default:
            if (!isNumberStart(c))
                JSTREAM_LOGIC_ERROR("Value matcher accepted a non-value byte.");
            // the lexer wants to see the sign or first digit
            cursor_.pushBack(c);
            sequence_.reset(
              &cursor_, ByteSequence::NumberBytes, options_.allow_exponent);
            event.bytes = &sequence_;
            type = Event::Number;
            break;
    }
    if (matched == kArrayValueStart)
        type = static_cast<Event::Type>(
          type + (Event::ArrayValueString - Event::String));
    else if (matched == kObjectValueStart)
        type = static_cast<Event::Type>(
          type + (Event::ObjectValueString - Event::String));
    event.type = type;
    afterScalar(matched);
}

// A value inside a container is followed by an item separator, or by
// the close that was pending beneath it.
void
Parser::afterScalar(const Matcher& matched)
{
    if (matched == kArrayValueStart)
        stack_.push(Expected(kArrayItemSep, stack_.popMandatory()));
    else if (matched == kObjectValueStart)
        stack_.push(Expected(kObjectItemSep, stack_.popMandatory()));
}

void
Parser::afterClose()
{
    if (contexts_.empty())
        return;
    ContainerContext context = contexts_.back();
    contexts_.pop_back();
    if (context == ArrayValue)
        stack_.push(Expected(kArrayItemSep, stack_.popMandatory()));
    else
        stack_.push(Expected(kObjectItemSep, stack_.popMandatory()));
}

} // namespace jstream
