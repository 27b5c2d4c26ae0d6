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

#include "utf8.h"
#include "error.h"

#include <climits>

#define ThomPikeCont(x) (0200 == (0300 & (x)))
#define ThomPikeByte(x) ((x) & (((1 << ThomPikeMsb(x)) - 1) | 3))
#define ThomPikeLen(x) (7 - ThomPikeMsb(x))
#define ThomPikeMsb(x) ((255 & (x)) < 252 ? Bsr(255 & ~(x)) : 1)
#define ThomPikeMerge(x, y) ((x) << 6 | (077 & (y)))

namespace jstream {

#if defined(__GNUC__) || defined(__clang__)
#define Bsr(x) (__builtin_clz(x) ^ (sizeof(int) * CHAR_BIT - 1))
#else
static int
Bsr(int x)
{
    int r = 0;
    if (x & 0xFFFF0000u) {
        x >>= 16;
        r |= 16;
    }
    if (x & 0xFF00) {
        x >>= 8;
        r |= 8;
    }
    if (x & 0xF0) {
        x >>= 4;
        r |= 4;
    }
    if (x & 0xC) {
        x >>= 2;
        r |= 2;
    }
    if (x & 0x2) {
        r |= 1;
    }
    return r;
}
#endif

// Narrows the first continuation byte so that overlong forms and
// codepoints above U+10FFFF are caught at the byte where they go wrong.
// Returns false for lead bytes that never begin a valid sequence, which
// includes 0xED since it leads the UTF-16 surrogate halves.
static bool
secondByteRange(int c, int* lo, int* hi)
{
    *lo = 0200;
    *hi = 0277;
    switch (c) {
        case 0xE0:
            *lo = 0240;
            return true;
        case 0xED:
            return false;
        case 0xF0:
            *lo = 0220;
            return true;
        case 0xF4:
            *hi = 0217;
            return true;
        default:
            return 0xC2 <= c && c <= 0xF4;
    }
}

bool
isNoncharacter(int codepoint)
{
    return (0xFDD0 <= codepoint && codepoint <= 0xFDEF) ||
           (codepoint & 0xFFFE) == 0xFFFE;
}

void
appendUtf8(std::string& out, int codepoint)
{
    if (codepoint < 0) {
        JSTREAM_LOGIC_ERROR("Negative Unicode codepoint.");
    } else if (codepoint <= 0x7F) {
        out.push_back(static_cast<char>(codepoint));
    } else if (codepoint <= 0x7FF) {
        out.push_back(static_cast<char>(0300 | (codepoint >> 6)));
        out.push_back(static_cast<char>(0200 | (codepoint & 077)));
    } else if (codepoint <= 0xFFFF) {
        out.push_back(static_cast<char>(0340 | (codepoint >> 12)));
        out.push_back(static_cast<char>(0200 | ((codepoint >> 6) & 077)));
        out.push_back(static_cast<char>(0200 | (codepoint & 077)));
    } else if (codepoint <= 0x10FFFF) {
        out.push_back(static_cast<char>(0360 | (codepoint >> 18)));
        out.push_back(static_cast<char>(0200 | ((codepoint >> 12) & 077)));
        out.push_back(static_cast<char>(0200 | ((codepoint >> 6) & 077)));
        out.push_back(static_cast<char>(0200 | (codepoint & 077)));
    } else {
        JSTREAM_LOGIC_ERROR("Unicode codepoint out of range.");
    }
}

Utf8Decoder::Utf8Decoder(ByteSource& source,
                         Errors errors,
                         bool reject_noncharacters)
  : cursor_(source), errors_(errors), reject_noncharacters_(reject_noncharacters)
{
}

// Applies the error policy to one maximal invalid subsequence. Returns
// true if a replacement character should be emitted for it.
bool
Utf8Decoder::reject()
{
    switch (errors_) {
        case Strict:
            throw InvalidUtf8Encoding(cursor_.offset());
        case Replace:
            return true;
        case Ignore:
            return false;
        default:
            JSTREAM_LOGIC_ERROR("Unhandled UTF-8 error policy.");
    }
}

int
Utf8Decoder::next()
{
    for (;;) {
        int c = cursor_.next();
        if (c == kEof)
            return kEof;
        if (!(c & 0200))
            return c;

        // stray continuation byte, or a lead byte nothing valid starts with
        int lo, hi;
        int n = ThomPikeLen(c);
        if (n < 2 || !secondByteRange(c, &lo, &hi)) {
            if (reject())
                return kReplacementCharacter;
            continue;
        }

        int i, b;
        int cp = ThomPikeByte(c);
        for (i = 1; i < n; ++i) {
            b = cursor_.next();
            if (b == kEof || !ThomPikeCont(b) ||
                (i == 1 && (b < lo || b > hi))) {
                // the byte may begin the next sequence
                cursor_.pushBack(b);
                break;
            }
            cp = ThomPikeMerge(cp, b);
        }
        if (i < n) {
            if (reject())
                return kReplacementCharacter;
            continue;
        }

        if (reject_noncharacters_ && isNoncharacter(cp)) {
            if (reject())
                return kReplacementCharacter;
            continue;
        }
        return cp;
    }
}

std::string
Utf8Decoder::transcode(const std::string& bytes,
                       Errors errors,
                       bool reject_noncharacters)
{
    std::string out;
    out.reserve(bytes.size());
    StringSource source(bytes);
    Utf8Decoder decoder(source, errors, reject_noncharacters);
    int c;
    while ((c = decoder.next()) != kEof)
        appendUtf8(out, c);
    return out;
}

} // namespace jstream
