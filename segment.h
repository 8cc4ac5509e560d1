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
#include "transform.h"
#include "value.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dt {

class Segment;
class DepthStack;

using SegmentPtr = std::shared_ptr<const Segment>;
using Prefix = std::vector<SegmentPtr>;

// Value to store or remove. An empty payload means ANY: remove whatever
// is there, or store the segment's default.
using Payload = std::optional<Value>;

// Ancestors of the node being visited, nearest first, kept as a shared
// list so each frame can extend it without copying.
struct ParentLink
{
    Value node;
    std::shared_ptr<const ParentLink> next;
};

// Call scoped state carried by every frame.
struct Context
{
    Value root;
    bool strict = false;
    bool trackParents = false;
    std::shared_ptr<const ParentLink> parents;
    const TransformRegistry* registry = nullptr;

    const TransformRegistry& transforms() const
    {
        return registry ? *registry : TransformRegistry::global();
    }

    // Context for the children of `node`.
    Context descend(const Value& node) const;

    // Ancestor `n` levels above the current node (0 = parent), or nullptr.
    const Value* ancestor(size_t n) const;
};

struct Child
{
    Value key;
    Value value;
};

using Children = std::vector<Child>;

// Remaining operators of a chain. Frames share one vector and advance an
// offset into it.
class OpList
{
  public:
    OpList() = default;
    explicit OpList(std::vector<SegmentPtr> ops);
    explicit OpList(std::shared_ptr<const std::vector<SegmentPtr>> ops)
      : ops_(std::move(ops))
    {
    }

    bool empty() const
    {
        return !ops_ || offset_ >= ops_->size();
    }

    size_t size() const
    {
        return ops_ ? ops_->size() - offset_ : 0;
    }

    const SegmentPtr& front() const
    {
        return (*ops_)[offset_];
    }

    OpList tail() const;

    // `branch` followed by the operators of this list.
    OpList prepend(const std::vector<SegmentPtr>& branch) const;

    std::vector<SegmentPtr> toVector() const;

  private:
    std::shared_ptr<const std::vector<SegmentPtr>> ops_;
    size_t offset_ = 0;
};

struct Frame
{
    OpList ops;
    Value node;
    Prefix prefix;
    Context ctx;
};

// Stack of frame stacks indexed by depth. Groups open a new level per
// branch so frames of sibling branches never interleave.
class DepthStack
{
  public:
    DepthStack() : levels_(1)
    {
    }

    void push(Frame frame)
    {
        levels_.back().push_back(std::move(frame));
    }

    Frame pop()
    {
        Frame frame = std::move(levels_.back().back());
        levels_.back().pop_back();
        return frame;
    }

    bool currentEmpty() const
    {
        return levels_.back().empty();
    }

    size_t level() const
    {
        return levels_.size() - 1;
    }

    void pushLevel()
    {
        levels_.emplace_back();
    }

    void popLevel()
    {
        levels_.pop_back();
    }

  private:
    std::vector<std::vector<Frame>> levels_;
};

// One enumerated location. A result with `cut` set carries no value and
// tells the consumer to stop.
struct Result
{
    Prefix path;
    Value value;
    bool cut = false;
};

using Results = std::vector<Result>;

// Receives results; returning false stops the enumeration.
using Sink = std::function<bool(Result&)>;

enum class Cut
{
    None,
    Hard,
    Soft
};

struct Branch
{
    std::vector<SegmentPtr> ops;
    Cut cut = Cut::None;
};

using Branches = std::vector<Branch>;

// Segments visited so far by an update, for error messages.
using Trail = std::vector<std::pair<const Segment*, Value>>;

struct UpdateArgs
{
    bool hasDefaults = false;
    bool nop = false;
    bool nopFromUnwrap = false;
    Trail trail;
};

// One step of an operator chain.
//
// Accessors enumerate children with items() and write them back with
// update() / pop(). Traversal goes through pushChildren(), mutation through
// doUpdate() / doRemove(); the defaults implement the common accessor
// behaviour on top of the primitives, so wrappers and groups only override
// what differs.
class Segment
{
  public:
    enum class Kind
    {
        Empty,
        Key,
        Attr,
        Slot,
        Slice,
        SliceFilter,
        Appender,
        Invert,
        Recursive,
        RecursiveFirst,
        GroupOr,
        GroupAnd,
        GroupFirst,
        GroupNot,
        Nop,
        Guard,
        Restrict,
        Filtered
    };

    explicit Segment(Kind kind) : kind_(kind)
    {
    }

    virtual ~Segment() = default;

    Kind kind() const
    {
        return kind_;
    }

    virtual bool isPattern() const
    {
        return false;
    }

    virtual bool isRecursive() const
    {
        return false;
    }

    virtual bool isTemplate() const
    {
        return false;
    }

    virtual int referenceDepth() const
    {
        return 0;
    }

    // The segment under any wrappers.
    virtual const Segment* unwrap() const
    {
        return this;
    }

    virtual const Matcher* matcher() const
    {
        return nullptr;
    }

    virtual Children items(const Value& node,
                           const Context& ctx,
                           bool filtered = true) const = 0;

    // Segment that denotes exactly the child `key` found by items().
    virtual SegmentPtr concrete(const Value& key) const = 0;

    virtual Value defaultValue() const
    {
        return Value::mapping();
    }

    virtual bool isEmpty(const Value& node, const Context& ctx) const
    {
        return items(node, ctx).empty();
    }

    virtual Value update(Value node, const Value& key, const Payload& val) const
    {
        return node;
    }

    virtual Value upsert(Value node, const Payload& val, const Context& ctx) const
    {
        return val ? *val : defaultValue();
    }

    virtual Value pop(Value node, const Value& key) const
    {
        return node;
    }

    virtual Value remove(Value node, const Payload& val, const Context& ctx) const;

    // Pushes one frame per child; returns false if the sink asked to stop.
    virtual bool pushChildren(DepthStack& stack,
                              Frame& frame,
                              bool paths,
                              const Sink& sink) const;

    virtual Value doUpdate(const OpList& ops,
                           Value node,
                           const Payload& val,
                           const UpdateArgs& args,
                           const Context& ctx) const;

    virtual Value doRemove(const OpList& ops,
                           Value node,
                           const Payload& val,
                           bool nop,
                           const Context& ctx) const;

    // Accessor used to enumerate everything for a negation.
    virtual const Segment* leafOp() const
    {
        return this;
    }

    virtual Values excludedKeys(const Value& node, const Context& ctx) const;

    // Compares this segment, read as a pattern, with a segment of another
    // path. Returns the matched groups, or nothing on mismatch.
    virtual std::optional<Values> match(const Segment& other,
                                        bool specials = false) const
    {
        return std::nullopt;
    }

    virtual std::string render(bool top = false) const = 0;

    // Returns the substituted segment, or nullptr when nothing changed.
    virtual SegmentPtr resolve(const Value& bindings, bool partial) const
    {
        return nullptr;
    }

  protected:
    Kind kind_;
};

} // namespace dt
