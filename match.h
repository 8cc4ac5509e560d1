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
#include "transform.h"
#include "value.h"
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace dt {

class Matcher;
class Path;
struct Context;

using MatcherPtr = std::shared_ptr<const Matcher>;
using Values = std::vector<Value>;

// Tests keys and values. A matcher is either constant (denotes exactly one
// value) or a pattern (denotes any number). Matchers are immutable and are
// shared freely between chains.
class Matcher
{
  public:
    enum class Kind
    {
        Const,
        Numeric,
        NumericQuoted,
        Word,
        String,
        Bytes,
        Boolean,
        NullMatch,
        Resolved,
        Wildcard,
        WildcardFirst,
        Regex,
        RegexFirst,
        Special,
        Subst,
        Reference,
        Concat,
        Glob,
        SequencePattern,
        MappingPattern,
        SetPattern,
        StringGlob,
        BytesGlob,
        ValueGroup
    };

    explicit Matcher(Kind kind) : kind_(kind)
    {
    }

    virtual ~Matcher() = default;

    Kind kind() const
    {
        return kind_;
    }

    bool isConst() const
    {
        return kind_ <= Kind::Resolved;
    }

    virtual bool isPattern() const
    {
        return false;
    }

    virtual bool isTemplate() const
    {
        return false;
    }

    virtual bool isReference() const
    {
        return false;
    }

    // 0 = root, 1 = current node, 2 = parent, ...
    virtual int referenceDepth() const
    {
        return 0;
    }

    virtual Value value() const
    {
        return Value();
    }

    virtual bool test(const Value& candidate) const = 0;

    // Candidates accepted by this matcher, in their original order.
    virtual Values matches(const Values& candidates) const;

    // Whether this matcher, read as a pattern, may be compared against
    // another path's matcher. Specials admit the first-match forms.
    virtual bool matchable(const Matcher& other, bool specials = false) const;

    virtual std::string render() const = 0;

    // Dotted notation form used where a matcher is embedded in a key.
    virtual std::string quote() const
    {
        return render();
    }

    // Returns the substituted matcher, or nullptr when nothing changed.
    virtual MatcherPtr resolve(const Value& bindings, bool partial) const
    {
        return nullptr;
    }

    // Traversal time lookup of a reference. False when the target is
    // missing.
    virtual bool resolveRef(const Context& ctx,
                            const Value& node,
                            Value& out) const
    {
        return false;
    }

  protected:
    Kind kind_;
};

// Literal key or value. The kind selects how it renders.
class ConstMatcher : public Matcher
{
  public:
    ConstMatcher(Kind kind, Value value)
      : Matcher(kind), value_(std::move(value))
    {
    }

    Value value() const override
    {
        return value_;
    }

    bool isInt() const
    {
        return value_.isInt();
    }

    bool test(const Value& candidate) const override;
    std::string render() const override;
    std::string quote() const override;

  private:
    Value value_;
};

class NullMatcher : public Matcher
{
  public:
    NullMatcher() : Matcher(Kind::NullMatch)
    {
    }

    bool test(const Value& candidate) const override
    {
        return candidate.isNull();
    }

    std::string render() const override
    {
        return "None";
    }
};

class WildcardMatcher : public Matcher
{
  public:
    explicit WildcardMatcher(bool first = false)
      : Matcher(first ? Kind::WildcardFirst : Kind::Wildcard)
    {
    }

    bool isPattern() const override
    {
        return true;
    }

    Value value() const override
    {
        return Value(render());
    }

    bool test(const Value&) const override
    {
        return true;
    }

    Values matches(const Values& candidates) const override;
    bool matchable(const Matcher& other, bool specials) const override;
    std::string render() const override;
};

// Full match of a regular expression. Non-text candidates are matched
// through their string rendering and are yielded unchanged.
class RegexMatcher : public Matcher
{
  public:
    RegexMatcher(const std::string& source, bool first = false);

    bool isPattern() const override
    {
        return true;
    }

    const std::string& source() const
    {
        return source_;
    }

    Value value() const override
    {
        return Value(render());
    }

    bool test(const Value& candidate) const override;
    Values matches(const Values& candidates) const override;
    bool matchable(const Matcher& other, bool specials) const override;
    std::string render() const override;

  private:
    std::string source_;
    std::regex re_;
};

// The append tokens "+" and "+?".
class SpecialMatcher : public Matcher
{
  public:
    explicit SpecialMatcher(std::string token)
      : Matcher(Kind::Special), token_(std::move(token))
    {
    }

    Value value() const override
    {
        return Value(token_);
    }

    bool test(const Value& candidate) const override
    {
        return candidate.isString() && candidate.getString() == token_;
    }

    bool matchable(const Matcher& other, bool specials) const override
    {
        return other.kind() == Kind::Special;
    }

    std::string render() const override
    {
        return token_;
    }

  private:
    std::string token_;
};

// Placeholder bound before traversal, either by position ($0) or by name
// ($(name)), optionally transformed ($(0|int)).
class SubstMatcher : public Matcher
{
  public:
    SubstMatcher(Value key, Transforms transforms = {})
      : Matcher(Kind::Subst),
        key_(std::move(key)),
        transforms_(std::move(transforms))
    {
    }

    bool isPattern() const override
    {
        return true;
    }

    bool isTemplate() const override
    {
        return true;
    }

    Value value() const override
    {
        return key_;
    }

    bool test(const Value&) const override
    {
        return false;
    }

    bool matchable(const Matcher&, bool) const override
    {
        return false;
    }

    std::string render() const override;
    MatcherPtr resolve(const Value& bindings, bool partial) const override;

  private:
    Value key_;
    Transforms transforms_;
};

// A key taken from the data itself, looked up by an inner chain relative
// to the root, the current node or one of its ancestors.
class ReferenceMatcher : public Matcher
{
  public:
    ReferenceMatcher(std::shared_ptr<const Path> path, int depth);

    bool isPattern() const override;

    bool isReference() const override
    {
        return true;
    }

    int referenceDepth() const override
    {
        return depth_;
    }

    bool test(const Value&) const override
    {
        return false;
    }

    bool matchable(const Matcher&, bool) const override
    {
        return false;
    }

    std::string render() const override;
    bool resolveRef(const Context& ctx,
                    const Value& node,
                    Value& out) const override;

  private:
    std::shared_ptr<const Path> path_;
    int depth_;
};

struct ConcatPart
{
    MatcherPtr op;
    Transforms transforms;
};

// Key built by adding its parts together: strings concatenate, numbers
// sum.
class ConcatMatcher : public Matcher
{
  public:
    explicit ConcatMatcher(std::vector<ConcatPart> parts)
      : Matcher(Kind::Concat), parts_(std::move(parts))
    {
    }

    Value value() const override;
    bool test(const Value& candidate) const override;
    bool isTemplate() const override;
    bool isReference() const override;
    int referenceDepth() const override;
    std::string render() const override;
    MatcherPtr resolve(const Value& bindings, bool partial) const override;
    bool resolveRef(const Context& ctx,
                    const Value& node,
                    Value& out) const override;

  private:
    std::vector<ConcatPart> parts_;
};

enum class Pred
{
    Eq,
    Ne,
    Lt,
    Gt,
    Le,
    Ge
};

const char*
PredToString(Pred pred);

// Candidates satisfying `pred` against `ref`. Equality goes through the
// matcher so patterns keep their meaning; orderings compare against the
// matcher's value and skip candidates of an unrelated kind.
Values
applyPred(Pred pred, const Matcher& ref, const Values& candidates);

bool
testPred(Pred pred, const Matcher& ref, const Value& candidate);

} // namespace dt
