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

#include "segment.h"
#include "engine.h"

#include <algorithm>

namespace dt {

Context
Context::descend(const Value& node) const
{
    if (!trackParents)
        return *this;
    Context res = *this;
    res.parents = std::make_shared<const ParentLink>(ParentLink{ node, parents });
    return res;
}

const Value*
Context::ancestor(size_t n) const
{
    const ParentLink* link = parents.get();
    for (; link && n; --n)
        link = link->next.get();
    return link ? &link->node : nullptr;
}

OpList::OpList(std::vector<SegmentPtr> ops)
  : ops_(std::make_shared<const std::vector<SegmentPtr>>(std::move(ops)))
{
}

OpList
OpList::tail() const
{
    OpList res = *this;
    ++res.offset_;
    return res;
}

OpList
OpList::prepend(const std::vector<SegmentPtr>& branch) const
{
    std::vector<SegmentPtr> ops = branch;
    if (ops_)
        ops.insert(ops.end(), ops_->begin() + offset_, ops_->end());
    return OpList(std::move(ops));
}

std::vector<SegmentPtr>
OpList::toVector() const
{
    if (!ops_)
        return {};
    return std::vector<SegmentPtr>(ops_->begin() + offset_, ops_->end());
}

Value
Segment::remove(Value node, const Payload& val, const Context& ctx) const
{
    for (const Child& c : items(node, ctx))
        if (!val || c.value == *val)
            node = pop(node, c.key);
    return node;
}

bool
Segment::pushChildren(DepthStack& stack,
                      Frame& frame,
                      bool paths,
                      const Sink& sink) const
{
    Children children = items(frame.node, frame.ctx);
    if (children.empty())
        return true;
    Context ctx = frame.ctx.descend(frame.node);
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
        Prefix prefix = frame.prefix;
        if (paths)
            prefix.push_back(concrete(it->key));
        stack.push(Frame{ frame.ops, it->value, std::move(prefix), ctx });
    }
    return true;
}

Value
Segment::doUpdate(const OpList& ops,
                  Value node,
                  const Payload& val,
                  const UpdateArgs& args,
                  const Context& ctx) const
{
    if (ops.empty()) {
        if (args.nop)
            return node;
        if (ctx.strict && items(node, ctx).empty())
            return node;
        return upsert(node, val, ctx);
    }
    if (!args.hasDefaults && isEmpty(node, ctx)) {
        if (args.nop || ops.front()->kind() == Kind::Nop)
            return node;
        UpdateArgs sub{ true, args.nop, false, args.trail };
        Value built = updates(ops, buildDefault(ops, ctx), val, sub, ctx);
        return upsert(node, built, ctx);
    }
    bool passNop = args.nop && !args.nopFromUnwrap;
    Context inner = ctx.descend(node);
    for (Child& c : items(node, ctx)) {
        Value child = c.value.isNull() ? buildDefault(ops, ctx) : c.value;
        UpdateArgs sub{ args.hasDefaults, passNop, false, args.trail };
        sub.trail.emplace_back(this, c.key);
        node = update(node, c.key, updates(ops, child, val, sub, inner));
    }
    return node;
}

Value
Segment::doRemove(const OpList& ops,
                  Value node,
                  const Payload& val,
                  bool nop,
                  const Context& ctx) const
{
    if (ops.empty()) {
        if (nop)
            return node;
        if (ctx.strict && items(node, ctx).empty())
            return node;
        return remove(node, val, ctx);
    }
    Context inner = ctx.descend(node);
    for (Child& c : items(node, ctx))
        node = update(node, c.key, removes(ops, c.value, val, false, inner));
    return node;
}

Values
Segment::excludedKeys(const Value& node, const Context& ctx) const
{
    Values keys;
    for (Child& c : items(node, ctx))
        keys.push_back(std::move(c.key));
    return keys;
}

} // namespace dt
