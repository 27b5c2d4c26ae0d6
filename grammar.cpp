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

#include "grammar.h"
#include "byte_source.h"
#include "error.h"

namespace jstream {

bool
isDigit(int c)
{
    return '0' <= c && c <= '9';
}

bool
isNumberStart(int c)
{
    return c == '-' || isDigit(c);
}

bool
isValueStart(int c)
{
    switch (c) {
        case '{':
        case '[':
        case '"':
        case 'n':
        case 't':
        case 'f':
            return true;
        default:
            return isNumberStart(c);
    }
}

static bool
isItemSep(int c)
{
    return c == ',';
}

const Matcher kEndOfInput(Matcher::EndOfInput, kEof);
const Matcher kValueStart(Matcher::ValueStart, isValueStart);
const Matcher kArrayValueStart(Matcher::ArrayValueStart, isValueStart);
const Matcher kObjectValueStart(Matcher::ObjectValueStart, isValueStart);
const Matcher kObjectKeyStart(Matcher::ObjectKeyStart, '"');
const Matcher kObjectClose(Matcher::ObjectClose, '}');
const Matcher kArrayClose(Matcher::ArrayClose, ']');
const Matcher kKeyValueSep(Matcher::KeyValueSep, ':');
const Matcher kArrayItemSep(Matcher::ArrayItemSep, isItemSep);
const Matcher kObjectItemSep(Matcher::ObjectItemSep, isItemSep);

std::string
Matcher::describe() const
{
    switch (id_) {
        case EndOfInput:
            return "end of input";
        case ValueStart:
            return "a value";
        case ArrayValueStart:
            return "an array value";
        case ObjectValueStart:
            return "an object value";
        case ObjectKeyStart:
            return "an object key";
        case ObjectClose:
            return "'}'";
        case ArrayClose:
            return "']'";
        case KeyValueSep:
            return "':'";
        case ArrayItemSep:
        case ObjectItemSep:
            return "','";
        case LiteralByte:
            return describeByte(byte_);
        default:
            JSTREAM_LOGIC_ERROR("Unhandled matcher identity.");
    }
}

std::string
Expected::describe() const
{
    if (has_optional_)
        return optional_.describe() + " or " + mandatory_.describe();
    return mandatory_.describe();
}

GrammarStack::GrammarStack()
{
    stack_.reserve(16);
    stack_.push_back(Expected(kEndOfInput));
    stack_.push_back(Expected(kValueStart));
}

Expected
GrammarStack::pop()
{
    if (stack_.empty())
        JSTREAM_LOGIC_ERROR("Popped an empty grammar stack.");
    Expected expected = stack_.back();
    stack_.pop_back();
    return expected;
}

Matcher
GrammarStack::popMandatory()
{
    Expected expected = pop();
    if (expected.hasOptional())
        JSTREAM_LOGIC_ERROR("Expected a plain matcher on the grammar stack.");
    return expected.mandatory();
}

const Expected&
GrammarStack::top() const
{
    if (stack_.empty())
        JSTREAM_LOGIC_ERROR("Grammar stack is empty.");
    return stack_.back();
}

} // namespace jstream
