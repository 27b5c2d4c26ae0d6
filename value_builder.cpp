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

#include "error.h"
#include "parser.h"
#include "jtckdint.h"

#include "double-conversion/string-to-double.h"

#include <unordered_map>

#define UTF16_MASK 0xfc00
#define UTF16_MOAR 0xd800 // 0xD800..0xDBFF
#define UTF16_CONT 0xdc00 // 0xDC00..0xDFFF

#define IsHighSurrogate(wc) (((wc) & UTF16_MASK) == UTF16_MOAR)
#define IsLowSurrogate(wc) (((wc) & UTF16_MASK) == UTF16_CONT)
#define MergeUtf16(hi, lo) ((((hi) - 0xD800) << 10) + ((lo) - 0xDC00) + 0x10000)

namespace jstream {

alignas(signed char) static const signed char kHexToInt[256] = {
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x00
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x10
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x20
    0,  1,  2,  3,  4,  5,  6,  7,  8,  9,  -1, -1, -1, -1, -1, -1, // 0x30
    -1, 10, 11, 12, 13, 14, 15, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x40
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x50
    -1, 10, 11, 12, 13, 14, 15, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x60
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x70
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x80
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x90
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xa0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xb0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xc0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xd0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xe0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xf0
};

static const double_conversion::StringToDoubleConverter kJsonToDouble(
  double_conversion::StringToDoubleConverter::ALLOW_TRAILING_JUNK,
  0.0,
  1.0,
  "Infinity",
  "NaN");

// Reads four hex digits at p, or returns -1.
static int
readHex4(const std::string& s, size_t p)
{
    int A, B, C, D;
    if (p + 4 <= s.size() && //
        (A = kHexToInt[s[p + 0] & 255]) != -1 && //
        (B = kHexToInt[s[p + 1] & 255]) != -1 && //
        (C = kHexToInt[s[p + 2] & 255]) != -1 && //
        (D = kHexToInt[s[p + 3] & 255]) != -1) { //
        return A << 12 | B << 8 | C << 4 | D;
    }
    return -1;
}

// Decodes the backslash escapes of a string whose escape grammar the
// lexer has already validated. UTF-16 surrogates that don't pair up
// are echoed as written rather than corrupting the UTF-8.
static std::string
unescape(const std::string& s)
{
    int c, u;
    std::string b;
    b.reserve(s.size());
    for (size_t p = 0; p < s.size();) {
        if ((c = s[p++] & 255) != '\\') {
            b += c;
            continue;
        }
        if (p >= s.size())
            JSTREAM_LOGIC_ERROR("Dangling backslash in lexed string.");
        switch ((c = s[p++] & 255)) {
            case '"':
            case '/':
            case '\\':
                b += c;
                break;
            case 'b':
                b += '\b';
                break;
            case 'f':
                b += '\f';
                break;
            case 'n':
                b += '\n';
                break;
            case 'r':
                b += '\r';
                break;
            case 't':
                b += '\t';
                break;
            case 'u':
                if ((c = readHex4(s, p)) == -1)
                    JSTREAM_LOGIC_ERROR("Malformed unicode escape in lexed string.");
                if (!IsHighSurrogate(c) && !IsLowSurrogate(c)) {
                    p += 4;
                } else if (IsHighSurrogate(c) && //
                           p + 4 + 6 <= s.size() && //
                           s[p + 4] == '\\' && //
                           s[p + 5] == 'u' && //
                           (u = readHex4(s, p + 6)) != -1 && //
                           IsLowSurrogate(u)) {
                    p += 4 + 6;
                    c = MergeUtf16(c, u);
                } else {
                    // Echo invalid \uXXXX sequences
                    // Rather than corrupting UTF-8!
                    b += "\\u";
                    break;
                }
                appendUtf8(b, c);
                break;
            default:
                JSTREAM_LOGIC_ERROR("Unhandled escape in lexed string.");
        }
    }
    return b;
}

// Integers become Long unless they overflow, in which case they are
// treated like any lexeme with a fraction or exponent.
static Json
toNumber(const std::string& s)
{
    long long x = 0;
    int d = +1;
    size_t p = 0;
    if (p < s.size() && s[p] == '-') {
        d = -1;
        ++p;
    }
    if (p == s.size())
        JSTREAM_LOGIC_ERROR("Empty number lexeme.");
    for (; p < s.size(); ++p) {
        int c = s[p] & 255;
        if (!isDigit(c))
            goto UseDubble;
        if (ckd_mul(&x, x, 10) || ckd_add(&x, x, (c - '0') * d))
            goto UseDubble;
    }
    return Json(x);

UseDubble: {
    int processed;
    double res = kJsonToDouble.StringToDouble(
      s.data(), static_cast<int>(s.size()), &processed);
    if (processed <= 0)
        JSTREAM_LOGIC_ERROR("Lexed number rejected by double conversion.");
    return Json(res);
}
}

std::string
Parser::convertString(ByteSequence* bytes)
{
    // body offsets count from the first byte not yet read
    size_t base = bytes->start_ + bytes->yielded_;
    std::string raw = bytes->read();
    std::string s;
    try {
        s = Utf8Decoder::transcode(
          raw, options_.utf8_errors, options_.reject_noncharacters);
    } catch (const InvalidUtf8Encoding& e) {
        throw InvalidUtf8Encoding(base + e.offset());
    }
    if (options_.decode_escapes)
        s = unescape(s);
    return s;
}

Json
Parser::convert(const Event& event)
{
    switch (event.baseType()) {
        case Event::ObjectKey:
        case Event::String:
            return Json(convertString(event.bytes));
        case Event::Number:
            return toNumber(event.bytes->read());
        case Event::Null:
            return Json(nullptr);
        case Event::True:
            return Json(true);
        case Event::False:
            return Json(false);
        default:
            JSTREAM_LOGIC_ERROR("Event carries no scalar value.");
    }
}

// A container being filled by load(). Objects index their keys so a
// duplicate is found without scanning the members.
struct OpenContainer
{
    explicit OpenContainer(Json* json) : json(json)
    {
    }

    Json* json;
    std::unordered_map<std::string, size_t> keys;
};

// Attaches value to the open container, under the pending key if it is
// an object, and returns the stored copy.
static Json&
attach(OpenContainer& parent, const std::string& key, Json&& value)
{
    if (parent.json->isArray()) {
        std::vector<Json>& array = parent.json->getArray();
        array.emplace_back(std::move(value));
        return array.back();
    }
    Json::Members& members = parent.json->getObject();
    auto found = parent.keys.find(key);
    if (found != parent.keys.end()) {
        Json& slot = members[found->second].second;
        slot = std::move(value);
        return slot;
    }
    parent.keys.emplace(key, members.size());
    members.emplace_back(key, std::move(value));
    return members.back().second;
}

Json
Parser::load(const Event& first)
{
    Json root;
    switch (first.type) {
        case Event::ObjectOpen:
            root.setObject();
            break;
        case Event::ArrayOpen:
            root.setArray();
            break;
        default:
            if (!first.isScalar())
                throw Error(absent_value,
                            std::string("Expected a value but got ") +
                              EventTypeToString(first.type),
                            offset());
            return convert(first);
    }

    // Pointers stay valid because a container only grows while it is
    // the innermost open one.
    std::vector<OpenContainer> stack;
    std::string key;
    stack.emplace_back(&root);
    for (;;) {
        Event event = next();
        switch (event.type) {
            case Event::ObjectOpen:
            case Event::ArrayOpen: {
                Json& child = attach(stack.back(), key, Json());
                if (event.type == Event::ObjectOpen)
                    child.setObject();
                else
                    child.setArray();
                stack.emplace_back(&child);
                break;
            }
            case Event::ObjectClose:
            case Event::ArrayClose:
                stack.pop_back();
                if (stack.empty())
                    return root;
                break;
            case Event::ObjectKey:
                key = convertString(event.bytes);
                break;
            case Event::KeyValueSep:
            case Event::ArrayItemSep:
            case Event::ObjectItemSep:
                break;
            case Event::EndOfStream:
                JSTREAM_LOGIC_ERROR("Document ended inside a container.");
            default:
                attach(stack.back(), key, convert(event));
                break;
        }
    }
}

Json
Parser::load()
{
    bool document = !started_;
    Event first;
    do {
        first = next();
    } while (first.isSeparator());
    Json value = load(first);
    if (document)
        next();
    return value;
}

} // namespace jstream
