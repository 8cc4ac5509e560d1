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
#include "match.h"
#include "transform.h"
#include "value.h"
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace dt {

class Segment;
class Filter;

using FilterPtr = std::shared_ptr<const Filter>;
using Filters = std::vector<FilterPtr>;

// Part of a filter key: a key matcher, or a slot / slice segment that
// reaches into a sequence.
struct FilterKeyPart
{
    MatcherPtr key;
    std::shared_ptr<const Segment> segment;
};

// Field path tested by a filter, e.g. `user.id` or `tags[*]`.
class FilterKey
{
  public:
    FilterKey() = default;
    explicit FilterKey(std::vector<FilterKeyPart> parts)
      : parts_(std::move(parts))
    {
    }

    const std::vector<FilterKeyPart>& parts() const
    {
        return parts_;
    }

    bool isDotted() const
    {
        return parts_.size() > 1;
    }

    // Values reached from `node`. A single key part yields every match;
    // a dotted key follows the first match at each key level.
    Values values(const Value& node) const;

    std::string render() const;
    bool matchable(const FilterKey& other) const;
    std::optional<std::string> match(const FilterKey& other) const;

  private:
    std::vector<FilterKeyPart> parts_;
};

// Predicate over a candidate value, used after `&` on accessors and in
// filtered slices.
class Filter
{
  public:
    enum class Kind
    {
        KeyValue,
        And,
        Or,
        Group,
        Not,
        First
    };

    explicit Filter(Kind kind) : kind_(kind)
    {
    }

    virtual ~Filter() = default;

    Kind kind() const
    {
        return kind_;
    }

    virtual bool test(const Value& node, const TransformRegistry& reg) const = 0;

    // Positions of `items` accepted by the filter, in result order.
    virtual std::vector<size_t> select(const Values& items,
                                       const TransformRegistry& reg) const;

    virtual std::string render() const = 0;
    virtual bool matchable(const Filter& other) const = 0;
    virtual std::optional<std::string> match(const Filter& other) const = 0;

  protected:
    Kind kind_;
};

class KeyValueFilter : public Filter
{
  public:
    KeyValueFilter(FilterKey key,
                   Pred pred,
                   MatcherPtr value,
                   Transforms transforms = {})
      : Filter(Kind::KeyValue),
        key_(std::move(key)),
        pred_(pred),
        value_(std::move(value)),
        transforms_(std::move(transforms))
    {
    }

    bool test(const Value& node, const TransformRegistry& reg) const override;
    std::string render() const override;
    bool matchable(const Filter& other) const override;
    std::optional<std::string> match(const Filter& other) const override;

  private:
    FilterKey key_;
    Pred pred_;
    MatcherPtr value_;
    Transforms transforms_;

    bool anyMatch(const Value& node, const TransformRegistry& reg) const;
};

// And, Or, Group, Not and First over other filters.
class CompoundFilter : public Filter
{
  public:
    CompoundFilter(Kind kind, Filters filters)
      : Filter(kind), filters_(std::move(filters))
    {
    }

    const Filters& filters() const
    {
        return filters_;
    }

    bool test(const Value& node, const TransformRegistry& reg) const override;
    std::vector<size_t> select(const Values& items,
                               const TransformRegistry& reg) const override;
    std::string render() const override;
    bool matchable(const Filter& other) const override;
    std::optional<std::string> match(const Filter& other) const override;

  private:
    Filters filters_;
};

// Positions of `items` surviving every filter in turn.
std::vector<size_t>
selectFiltered(const Filters& filters,
               const Values& items,
               const TransformRegistry& reg);

bool
passesFilters(const Filters& filters,
              const Value& node,
              const TransformRegistry& reg);

std::string
renderFilters(const Filters& filters);

// `...` inside a container pattern: between `min` and `max` elements,
// each accepted by `pattern` when one is given.
class GlobMatcher : public Matcher
{
  public:
    GlobMatcher(MatcherPtr pattern, size_t min, std::optional<size_t> max)
      : Matcher(Kind::Glob), pattern_(std::move(pattern)), min_(min), max_(max)
    {
    }

    const MatcherPtr& pattern() const
    {
        return pattern_;
    }

    size_t min() const
    {
        return min_;
    }

    const std::optional<size_t>& max() const
    {
        return max_;
    }

    bool test(const Value& candidate) const override;
    std::string render() const override;

  private:
    MatcherPtr pattern_;
    size_t min_;
    std::optional<size_t> max_;
};

// Container flavour a pattern insists on. Loose accepts either mutability.
enum class Flavour
{
    Loose,
    List,
    Tuple,
    Dict,
    Set,
    FrozenSet
};

// [a, ..., b]: elements matched in order with backtracking over globs.
class SequencePattern : public Matcher
{
  public:
    SequencePattern(std::vector<MatcherPtr> elements,
                    Flavour flavour = Flavour::Loose)
      : Matcher(Kind::SequencePattern),
        elements_(std::move(elements)),
        flavour_(flavour)
    {
    }

    bool test(const Value& candidate) const override;
    std::string render() const override;

  private:
    std::vector<MatcherPtr> elements_;
    Flavour flavour_;
};

// One entry of a mapping pattern. A GlobMatcher key makes it a glob entry
// covering the keys no concrete entry consumed; a null value accepts
// anything.
struct MappingEntry
{
    MatcherPtr key;
    MatcherPtr value;
};

class MappingPattern : public Matcher
{
  public:
    MappingPattern(std::vector<MappingEntry> entries,
                   Flavour flavour = Flavour::Loose)
      : Matcher(Kind::MappingPattern),
        entries_(std::move(entries)),
        flavour_(flavour)
    {
    }

    bool test(const Value& candidate) const override;
    std::string render() const override;

  private:
    std::vector<MappingEntry> entries_;
    Flavour flavour_;
};

class SetPattern : public Matcher
{
  public:
    SetPattern(std::vector<MatcherPtr> elements,
               Flavour flavour = Flavour::Loose)
      : Matcher(Kind::SetPattern),
        elements_(std::move(elements)),
        flavour_(flavour)
    {
    }

    bool test(const Value& candidate) const override;
    std::string render() const override;

  private:
    std::vector<MatcherPtr> elements_;
    Flavour flavour_;
};

// Literal fragments with globs between them: "ab"..."yz". The parts are
// either fragments (String or Bytes ConstMatchers) or GlobMatchers whose
// pattern, if any, is a Regex giving the character class.
class TextGlob : public Matcher
{
  public:
    TextGlob(std::vector<MatcherPtr> parts, bool bytes = false);

    bool test(const Value& candidate) const override;
    std::string render() const override;

  private:
    std::vector<MatcherPtr> parts_;
    std::regex re_;
};

// (a, b, ...): the first alternative that accepts the candidate wins.
class ValueGroup : public Matcher
{
  public:
    explicit ValueGroup(std::vector<MatcherPtr> alternatives)
      : Matcher(Kind::ValueGroup), alternatives_(std::move(alternatives))
    {
    }

    bool test(const Value& candidate) const override;
    std::string render() const override;

  private:
    std::vector<MatcherPtr> alternatives_;
};

} // namespace dt
