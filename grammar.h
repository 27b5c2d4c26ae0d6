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

// A matcher both tests the next input byte and names the grammar
// production that was taken, so matchers compare by identity.
class Matcher
{
  public:
    enum Id
    {
        EndOfInput,
        ValueStart,
        ArrayValueStart,
        ObjectValueStart,
        ObjectKeyStart,
        ObjectClose,
        ArrayClose,
        KeyValueSep,
        ArrayItemSep,
        ObjectItemSep,
        LiteralByte,
    };

    enum Kind
    {
        Literal,
        Predicate,
    };

    constexpr Matcher(Id id, int byte)
      : id_(id), kind_(Literal), byte_(byte), predicate_(nullptr)
    {
    }

    constexpr Matcher(Id id, bool (*predicate)(int))
      : id_(id), kind_(Predicate), byte_(0), predicate_(predicate)
    {
    }

    // Ad hoc matcher for one fixed byte, e.g. the 'u' of "null".
    static constexpr Matcher literal(int byte)
    {
        return Matcher(LiteralByte, byte);
    }

    bool matches(int c) const
    {
        return kind_ == Literal ? c == byte_ : predicate_(c);
    }

    Id id() const
    {
        return id_;
    }

    Kind kind() const
    {
        return kind_;
    }

    std::string describe() const;

    bool operator==(const Matcher& other) const
    {
        return id_ == other.id_ && (id_ != LiteralByte || byte_ == other.byte_);
    }

    bool operator!=(const Matcher& other) const
    {
        return !(*this == other);
    }

  private:
    Id id_;
    Kind kind_;
    int byte_;
    bool (*predicate_)(int);
};

bool
isValueStart(int c);

bool
isNumberStart(int c);

bool
isDigit(int c);

extern const Matcher kEndOfInput;
extern const Matcher kValueStart;
extern const Matcher kArrayValueStart;
extern const Matcher kObjectValueStart;
extern const Matcher kObjectKeyStart;
extern const Matcher kObjectClose;
extern const Matcher kArrayClose;
extern const Matcher kKeyValueSep;
extern const Matcher kArrayItemSep;
extern const Matcher kObjectItemSep;

// One grammar stack entry: a mandatory matcher, optionally preceded by
// an alternative that is tried first.
class Expected
{
  public:
    Expected(const Matcher& mandatory)
      : optional_(mandatory), mandatory_(mandatory), has_optional_(false)
    {
    }

    Expected(const Matcher& optional, const Matcher& mandatory)
      : optional_(optional), mandatory_(mandatory), has_optional_(true)
    {
    }

    bool hasOptional() const
    {
        return has_optional_;
    }

    const Matcher& optional() const
    {
        return optional_;
    }

    const Matcher& mandatory() const
    {
        return mandatory_;
    }

    std::string describe() const;

  private:
    Matcher optional_;
    Matcher mandatory_;
    bool has_optional_;
};

// Pushdown stack of what the grammar permits next.
class GrammarStack
{
  public:
    GrammarStack();

    void push(const Expected& expected)
    {
        stack_.push_back(expected);
    }

    Expected pop();

    // Pops an entry that must be a plain matcher, such as the close of
    // the enclosing container.
    Matcher popMandatory();

    bool empty() const
    {
        return stack_.empty();
    }

    size_t size() const
    {
        return stack_.size();
    }

    const Expected& top() const;

  private:
    std::vector<Expected> stack_;
};

} // namespace jstream
