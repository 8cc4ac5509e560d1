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
#include "filter.h"
#include "match.h"
#include "segment.h"
#include "value.h"
#include <climits>
#include <optional>
#include <string>

namespace dt {

// The whole current value, optionally filtered. Used for the empty path.
class EmptySegment : public Segment
{
  public:
    explicit EmptySegment(Filters filters = {})
      : Segment(Kind::Empty), filters_(std::move(filters))
    {
    }

    Children items(const Value& node,
                   const Context& ctx,
                   bool filtered = true) const override;
    SegmentPtr concrete(const Value& key) const override;

    Value defaultValue() const override
    {
        return Value();
    }

    bool isEmpty(const Value&, const Context&) const override
    {
        return false;
    }

    Value update(Value node, const Value& key, const Payload& val) const override;
    Value upsert(Value node, const Payload& val, const Context& ctx) const override;
    Value pop(Value node, const Value& key) const override;
    Value remove(Value node, const Payload& val, const Context& ctx) const override;
    std::optional<Values> match(const Segment& other,
                                bool specials) const override;
    std::string render(bool top) const override;

  private:
    Filters filters_;
};

// Mapping key access, `.key`. On a sequence a literal integer key reads as
// an index unless the traversal is strict.
class KeySegment : public Segment
{
  public:
    KeySegment(MatcherPtr matcher, Filters filters = {})
      : KeySegment(Kind::Key, std::move(matcher), std::move(filters))
    {
    }

    bool isPattern() const override
    {
        return matcher_->isPattern();
    }

    bool isTemplate() const override
    {
        return matcher_->isTemplate();
    }

    int referenceDepth() const override
    {
        return matcher_->isReference() ? matcher_->referenceDepth() : 0;
    }

    const Matcher* matcher() const override
    {
        return matcher_.get();
    }

    const MatcherPtr& matcherPtr() const
    {
        return matcher_;
    }

    const Filters& filters() const
    {
        return filters_;
    }

    Children items(const Value& node,
                   const Context& ctx,
                   bool filtered = true) const override;
    SegmentPtr concrete(const Value& key) const override;
    Value defaultValue() const override;
    Value update(Value node, const Value& key, const Payload& val) const override;
    Value upsert(Value node, const Payload& val, const Context& ctx) const override;
    Value pop(Value node, const Value& key) const override;
    std::optional<Values> match(const Segment& other,
                                bool specials) const override;
    std::string render(bool top) const override;
    SegmentPtr resolve(const Value& bindings, bool partial) const override;

  protected:
    KeySegment(Kind kind, MatcherPtr matcher, Filters filters)
      : Segment(kind), matcher_(std::move(matcher)), filters_(std::move(filters))
    {
    }

    // Same segment kind around another matcher.
    virtual SegmentPtr rebind(MatcherPtr matcher) const;

    // Keys this segment writes to on upsert: the ones present, or its
    // literal key. False when a reference cannot be resolved.
    bool upsertKeys(const Value& node, const Context& ctx, Values& keys) const;

    // Children whose key the matcher selects, then the filters.
    Children matchChildren(Children all,
                           const Value& node,
                           const Context& ctx,
                           bool filtered) const;
    Children selectChildren(Children children,
                            const Context& ctx,
                            bool filtered) const;
    std::string renderKey(bool slot) const;

    MatcherPtr matcher_;
    Filters filters_;
};

// Record field access, `@field`.
class AttrSegment : public KeySegment
{
  public:
    AttrSegment(MatcherPtr matcher, Filters filters = {})
      : KeySegment(Kind::Attr, std::move(matcher), std::move(filters))
    {
    }

    Children items(const Value& node,
                   const Context& ctx,
                   bool filtered = true) const override;
    SegmentPtr concrete(const Value& key) const override;
    Value defaultValue() const override;
    Value update(Value node, const Value& key, const Payload& val) const override;
    Value pop(Value node, const Value& key) const override;
    std::string render(bool top) const override;

  protected:
    SegmentPtr rebind(MatcherPtr matcher) const override;
};

// Sequence index access, `[n]`. Falls back to mapping keys unless strict.
class SlotSegment : public KeySegment
{
  public:
    SlotSegment(MatcherPtr matcher, Filters filters = {})
      : KeySegment(Kind::Slot, std::move(matcher), std::move(filters))
    {
    }

    Children items(const Value& node,
                   const Context& ctx,
                   bool filtered = true) const override;
    SegmentPtr concrete(const Value& key) const override;
    Value defaultValue() const override;
    Value update(Value node, const Value& key, const Payload& val) const override;
    Value upsert(Value node, const Payload& val, const Context& ctx) const override;
    Value pop(Value node, const Value& key) const override;
    Value remove(Value node, const Payload& val, const Context& ctx) const override;
    std::string render(bool top) const override;

    // True for a literal non-negative integer index.
    bool isIndex() const;

  protected:
    SegmentPtr rebind(MatcherPtr matcher) const override;
};

// Stands for the length of the sequence in a slice bound, `[+:]`.
constexpr long long kSliceEnd = LLONG_MAX;

// Half-open range with a step, `[start:stop:step]`.
class SliceSegment : public Segment
{
  public:
    SliceSegment(std::optional<long long> start = std::nullopt,
                 std::optional<long long> stop = std::nullopt,
                 std::optional<long long> step = std::nullopt)
      : Segment(Kind::Slice), start_(start), stop_(stop), step_(step)
    {
    }

    Children items(const Value& node,
                   const Context& ctx,
                   bool filtered = true) const override;
    SegmentPtr concrete(const Value& key) const override;

    Value defaultValue() const override
    {
        return Value::sequence();
    }

    bool isEmpty(const Value& node, const Context& ctx) const override;
    Value update(Value node, const Value& key, const Payload& val) const override;
    Value upsert(Value node, const Payload& val, const Context& ctx) const override;
    Value pop(Value node, const Value& key) const override;
    Value remove(Value node, const Payload& val, const Context& ctx) const override;
    std::optional<Values> match(const Segment& other,
                                bool specials) const override;
    std::string render(bool top) const override;

    // Bounds with kSliceEnd replaced by `size`, as a (start, stop, step)
    // tuple of ints or nulls.
    Value key(size_t size) const;

    // Number of positions the slice can select regardless of the data.
    unsigned long long cardinality() const;

  private:
    std::optional<long long> start_;
    std::optional<long long> stop_;
    std::optional<long long> step_;
};

// `[filter]`: the filtered elements of a sequence as one derived view.
class SliceFilterSegment : public Segment
{
  public:
    explicit SliceFilterSegment(Filters filters)
      : Segment(Kind::SliceFilter), filters_(std::move(filters))
    {
    }

    Children items(const Value& node,
                   const Context& ctx,
                   bool filtered = true) const override;
    SegmentPtr concrete(const Value& key) const override;

    bool isEmpty(const Value& node, const Context&) const override
    {
        return !node.truthy();
    }

    Value update(Value node, const Value& key, const Payload& val) const override;
    Value upsert(Value node, const Payload& val, const Context& ctx) const override;
    Value pop(Value node, const Value& key) const override;
    Value remove(Value node, const Payload& val, const Context& ctx) const override;
    bool pushChildren(DepthStack& stack,
                      Frame& frame,
                      bool paths,
                      const Sink& sink) const override;
    std::optional<Values> match(const Segment& other,
                                bool specials) const override;
    std::string render(bool top) const override;

  private:
    Filters filters_;
};

// `[+]` appends, `[+?]` appends unless already present.
class AppenderSegment : public Segment
{
  public:
    explicit AppenderSegment(bool unique = false);

    const Matcher* matcher() const override
    {
        return matcher_.get();
    }

    bool unique() const
    {
        return unique_;
    }

    Children items(const Value& node,
                   const Context& ctx,
                   bool filtered = true) const override;
    SegmentPtr concrete(const Value& key) const override;

    Value defaultValue() const override
    {
        return Value::sequence();
    }

    bool isEmpty(const Value&, const Context&) const override
    {
        return true;
    }

    Value update(Value node, const Value& key, const Payload& val) const override;
    Value upsert(Value node, const Payload& val, const Context& ctx) const override;

    Value remove(Value node, const Payload&, const Context&) const override
    {
        return node;
    }

    bool pushChildren(DepthStack&, Frame&, bool, const Sink&) const override
    {
        return true;
    }

    std::optional<Values> match(const Segment& other,
                                bool specials) const override;
    std::string render(bool top) const override;

  private:
    bool unique_;
    MatcherPtr matcher_;
};

// `-`: the rest of the chain removes on update and updates on remove.
class InvertSegment : public Segment
{
  public:
    InvertSegment() : Segment(Kind::Invert)
    {
    }

    Children items(const Value& node,
                   const Context& ctx,
                   bool filtered = true) const override;
    SegmentPtr concrete(const Value& key) const override;
    Value doUpdate(const OpList& ops,
                   Value node,
                   const Payload& val,
                   const UpdateArgs& args,
                   const Context& ctx) const override;
    Value doRemove(const OpList& ops,
                   Value node,
                   const Payload& val,
                   bool nop,
                   const Context& ctx) const override;
    std::optional<Values> match(const Segment& other,
                                bool specials) const override;

    std::string render(bool top) const override
    {
        return "-";
    }
};

} // namespace dt
