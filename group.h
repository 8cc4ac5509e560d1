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
#include "segment.h"
#include "value.h"
#include <string>
#include <vector>

namespace dt {

// Sub-chains tried from the current node, each followed by the rest of the
// outer chain. Every branch is expanded on its own stack level.
class GroupSegment : public Segment
{
  public:
    GroupSegment(Kind kind, Branches branches)
      : Segment(kind), branches_(std::move(branches))
    {
    }

    const Branches& branches() const
    {
        return branches_;
    }

    bool isPattern() const override
    {
        return true;
    }

    bool isTemplate() const override;
    int referenceDepth() const override;

    Children items(const Value& node,
                   const Context& ctx,
                   bool filtered = true) const override;
    SegmentPtr concrete(const Value& key) const override;
    Value defaultValue() const override;
    Value update(Value node, const Value& key, const Payload& val) const override;

    // Defaults built for a group stay empty; the branches fill them in.
    Value upsert(Value node, const Payload&, const Context&) const override
    {
        return node;
    }

    Value pop(Value node, const Value& key) const override;
    const Segment* leafOp() const override;
    Values excludedKeys(const Value& node, const Context& ctx) const override;
    std::optional<Values> match(const Segment& other,
                                bool specials) const override;
    SegmentPtr resolve(const Value& bindings, bool partial) const override;

  protected:
    virtual SegmentPtr rebuild(Branches branches) const = 0;

    // Branch ops rendered back to back.
    static std::string renderBranch(const Branch& branch, bool top);

    // Fallback for an update nothing matched: the first branch that names a
    // concrete path without a `~` is created.
    Value buildFirst(const OpList& ops,
                     Value node,
                     const Payload& val,
                     const UpdateArgs& args,
                     const Context& ctx) const;

    Branches branches_;
};

// `(a, b)`: every branch in order. `a#` stops after a branch that matched;
// `a##` lets later branches run but drops what overlaps its paths.
class OrGroup : public GroupSegment
{
  public:
    explicit OrGroup(Branches branches)
      : GroupSegment(Kind::GroupOr, std::move(branches))
    {
    }

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
    SegmentPtr rebuild(Branches branches) const override;

  private:
    // Concrete paths the branch reaches from `node`, minus those
    // overlapping `softcut`.
    std::vector<Prefix> reach(const OpList& ops,
                              const Value& node,
                              const Context& ctx,
                              const std::vector<Prefix>& softcut) const;
};

// `(a, b)?`: the first match of the first branch that has one.
class FirstGroup : public GroupSegment
{
  public:
    explicit FirstGroup(Branches branches)
      : GroupSegment(Kind::GroupFirst, std::move(branches))
    {
    }

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
    SegmentPtr rebuild(Branches branches) const override;
};

// `(a & b)`: results of all branches, or nothing unless each matched.
class AndGroup : public GroupSegment
{
  public:
    explicit AndGroup(Branches branches)
      : GroupSegment(Kind::GroupAnd, std::move(branches))
    {
    }

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
    SegmentPtr rebuild(Branches branches) const override;
};

// `(!a)`: the children of the branch's accessor that it does not select.
class NotGroup : public GroupSegment
{
  public:
    explicit NotGroup(Branch branch)
      : GroupSegment(Kind::GroupNot, Branches{ std::move(branch) })
    {
    }

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
    SegmentPtr rebuild(Branches branches) const override;

  private:
    // Ops after the negated accessor, followed by the outer chain.
    OpList rest(const OpList& ops) const;
};

} // namespace dt
