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
#include "transform.h"
#include "value.h"
#include <string>
#include <vector>

namespace dt {

// Decorates another segment. Everything not overridden is forwarded to
// the wrapped segment.
class WrapSegment : public Segment
{
  public:
    WrapSegment(Kind kind, SegmentPtr inner)
      : Segment(kind), inner_(std::move(inner))
    {
    }

    const SegmentPtr& inner() const
    {
        return inner_;
    }

    bool isPattern() const override
    {
        return inner_->isPattern();
    }

    bool isRecursive() const override
    {
        return inner_->isRecursive();
    }

    bool isTemplate() const override
    {
        return inner_->isTemplate();
    }

    int referenceDepth() const override
    {
        return inner_->referenceDepth();
    }

    const Segment* unwrap() const override
    {
        return inner_->unwrap();
    }

    const Matcher* matcher() const override
    {
        return inner_->matcher();
    }

    Children items(const Value& node,
                   const Context& ctx,
                   bool filtered = true) const override
    {
        return inner_->items(node, ctx, filtered);
    }

    SegmentPtr concrete(const Value& key) const override
    {
        return inner_->concrete(key);
    }

    Value defaultValue() const override
    {
        return inner_->defaultValue();
    }

    bool isEmpty(const Value& node, const Context& ctx) const override
    {
        return inner_->isEmpty(node, ctx);
    }

    Value update(Value node, const Value& key, const Payload& val) const override
    {
        return inner_->update(std::move(node), key, val);
    }

    Value upsert(Value node, const Payload& val, const Context& ctx) const override
    {
        return inner_->upsert(std::move(node), val, ctx);
    }

    Value pop(Value node, const Value& key) const override
    {
        return inner_->pop(std::move(node), key);
    }

    Value remove(Value node, const Payload& val, const Context& ctx) const override
    {
        return inner_->remove(std::move(node), val, ctx);
    }

    bool pushChildren(DepthStack& stack,
                      Frame& frame,
                      bool paths,
                      const Sink& sink) const override
    {
        return inner_->pushChildren(stack, frame, paths, sink);
    }

    Value doUpdate(const OpList& ops,
                   Value node,
                   const Payload& val,
                   const UpdateArgs& args,
                   const Context& ctx) const override
    {
        return inner_->doUpdate(ops, std::move(node), val, args, ctx);
    }

    Value doRemove(const OpList& ops,
                   Value node,
                   const Payload& val,
                   bool nop,
                   const Context& ctx) const override
    {
        return inner_->doRemove(ops, std::move(node), val, nop, ctx);
    }

    const Segment* leafOp() const override
    {
        return inner_->leafOp();
    }

    std::optional<Values> match(const Segment& other,
                                bool specials) const override
    {
        return inner_->match(other, specials);
    }

    SegmentPtr resolve(const Value& bindings, bool partial) const override;

  protected:
    // Same wrapper around another inner segment.
    virtual SegmentPtr rewrap(SegmentPtr inner) const = 0;

    SegmentPtr inner_;
};

// `~`: matches and recurses like the wrapped segment but never performs
// the final mutation.
class NopWrap : public WrapSegment
{
  public:
    explicit NopWrap(SegmentPtr inner) : WrapSegment(Kind::Nop, std::move(inner))
    {
    }

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
    std::string render(bool top) const override;

  protected:
    SegmentPtr rewrap(SegmentPtr inner) const override;
};

// `key=value`, `[*]>3`, `key|int=7`: keeps the children whose value, after
// the guard's transforms, satisfies the predicate. Matched children keep
// their original value.
class ValueGuard : public WrapSegment
{
  public:
    ValueGuard(SegmentPtr inner,
               Pred pred,
               MatcherPtr guard,
               Transforms transforms = {})
      : WrapSegment(Kind::Guard, std::move(inner)),
        pred_(pred),
        guard_(std::move(guard)),
        transforms_(std::move(transforms))
    {
    }

    bool accepts(const Value& value, const Context& ctx) const;

    Children items(const Value& node,
                   const Context& ctx,
                   bool filtered = true) const override;

    bool isEmpty(const Value& node, const Context& ctx) const override
    {
        return items(node, ctx).empty();
    }

    Value upsert(Value node, const Payload& val, const Context& ctx) const override;
    Value remove(Value node, const Payload& val, const Context& ctx) const override;
    bool pushChildren(DepthStack& stack,
                      Frame& frame,
                      bool paths,
                      const Sink& sink) const override;
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
    std::string render(bool top) const override;
    SegmentPtr resolve(const Value& bindings, bool partial) const override;

  protected:
    SegmentPtr rewrap(SegmentPtr inner) const override;

  private:
    Pred pred_;
    MatcherPtr guard_;
    Transforms transforms_;
};

// `:type` / `:!type`: the wrapped segment only applies to nodes of (or,
// negated, not of) the listed kinds.
class TypeRestriction : public WrapSegment
{
  public:
    TypeRestriction(SegmentPtr inner,
                    std::vector<std::string> kinds,
                    bool negate = false)
      : WrapSegment(Kind::Restrict, std::move(inner)),
        kinds_(std::move(kinds)),
        negate_(negate)
    {
    }

    bool allows(const Value& node) const;

    Children items(const Value& node,
                   const Context& ctx,
                   bool filtered = true) const override;
    bool pushChildren(DepthStack& stack,
                      Frame& frame,
                      bool paths,
                      const Sink& sink) const override;
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
    std::string render(bool top) const override;

  protected:
    SegmentPtr rewrap(SegmentPtr inner) const override;

  private:
    std::vector<std::string> kinds_;
    bool negate_;
};

// Kind names a type restriction understands.
bool
isKnownKind(const std::string& kind);

// `seg&filter`: applies filters to the children of a segment that carries
// none of its own, such as a type restricted key.
class FilterWrap : public WrapSegment
{
  public:
    FilterWrap(SegmentPtr inner, Filters filters)
      : WrapSegment(Kind::Filtered, std::move(inner)), filters_(std::move(filters))
    {
    }

    Children items(const Value& node,
                   const Context& ctx,
                   bool filtered = true) const override;

    bool isEmpty(const Value& node, const Context& ctx) const override
    {
        return items(node, ctx).empty();
    }

    Value upsert(Value node, const Payload& val, const Context& ctx) const override;
    Value remove(Value node, const Payload& val, const Context& ctx) const override;
    bool pushChildren(DepthStack& stack,
                      Frame& frame,
                      bool paths,
                      const Sink& sink) const override;
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
    std::string render(bool top) const override;

  protected:
    SegmentPtr rewrap(SegmentPtr inner) const override;

  private:
    Filters filters_;
};

} // namespace dt
