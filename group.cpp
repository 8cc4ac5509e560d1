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

#include "group.h"
#include "access.h"
#include "engine.h"
#include "wrap.h"

#include <algorithm>
#include <iterator>

namespace dt {

// Drops the stack levels a branch left behind when it stopped early.
static void
unwind(DepthStack& stack, size_t level)
{
    while (stack.level() > level)
        stack.popLevel();
}

static UpdateArgs
forward(const UpdateArgs& args, bool nop)
{
    return UpdateArgs{ args.hasDefaults, nop, false, args.trail };
}

// ---- GroupSegment ---------------------------------------------------------

bool
GroupSegment::isTemplate() const
{
    for (const Branch& b : branches_)
        for (const SegmentPtr& op : b.ops)
            if (op->isTemplate())
                return true;
    return false;
}

int
GroupSegment::referenceDepth() const
{
    int depth = 0;
    for (const Branch& b : branches_)
        for (const SegmentPtr& op : b.ops)
            depth = std::max(depth, op->referenceDepth());
    return depth;
}

Children
GroupSegment::items(const Value& node, const Context& ctx, bool filtered) const
{
    Children res;
    for (const Branch& b : branches_) {
        if (b.ops.empty())
            continue;
        Children part = b.ops.front()->items(node, ctx, filtered);
        if (part.empty() && kind_ == Kind::GroupAnd)
            return {};
        res.insert(res.end(), part.begin(), part.end());
        if (!part.empty() && kind_ == Kind::GroupFirst)
            break;
    }
    return res;
}

SegmentPtr
GroupSegment::concrete(const Value& key) const
{
    const Segment* leaf = leafOp();
    if (leaf == this)
        return std::make_shared<KeySegment>(
          std::make_shared<ConstMatcher>(Matcher::Kind::Word, key));
    return leaf->concrete(key);
}

Value
GroupSegment::defaultValue() const
{
    for (const Branch& b : branches_) {
        if (b.ops.empty())
            continue;
        const Segment* head = b.ops.front()->unwrap();
        if (head->kind() == Kind::Slot || head->kind() == Kind::Slice)
            return Value::sequence();
        if (head->kind() == Kind::Key)
            return Value::mapping();
        return head->defaultValue();
    }
    return Value::mapping();
}

Value
GroupSegment::update(Value node, const Value& key, const Payload& val) const
{
    const Segment* leaf = leafOp();
    return leaf == this ? node : leaf->update(std::move(node), key, val);
}

Value
GroupSegment::pop(Value node, const Value& key) const
{
    const Segment* leaf = leafOp();
    return leaf == this ? node : leaf->pop(std::move(node), key);
}

const Segment*
GroupSegment::leafOp() const
{
    for (const Branch& b : branches_)
        if (!b.ops.empty())
            return b.ops.front()->leafOp();
    return this;
}

Values
GroupSegment::excludedKeys(const Value& node, const Context& ctx) const
{
    Values keys;
    for (const Branch& b : branches_) {
        if (b.ops.empty())
            continue;
        for (Value& k : b.ops.front()->excludedKeys(node, ctx))
            if (std::find(keys.begin(), keys.end(), k) == keys.end())
                keys.push_back(std::move(k));
    }
    return keys;
}

std::optional<Values>
GroupSegment::match(const Segment& other, bool) const
{
    if (other.kind() != kind_)
        return std::nullopt;
    std::string mine = render(true);
    if (mine != other.render(true))
        return std::nullopt;
    return Values{ Value(mine) };
}

SegmentPtr
GroupSegment::resolve(const Value& bindings, bool partial) const
{
    bool changed = false;
    Branches branches = branches_;
    for (Branch& b : branches) {
        for (SegmentPtr& op : b.ops) {
            SegmentPtr r = op->resolve(bindings, partial);
            if (r) {
                op = std::move(r);
                changed = true;
            }
        }
    }
    return changed ? rebuild(std::move(branches)) : nullptr;
}

std::string
GroupSegment::renderBranch(const Branch& branch, bool top)
{
    std::string s;
    for (size_t j = 0; j < branch.ops.size(); ++j)
        s += branch.ops[j]->render(top && j == 0);
    return s;
}

Value
GroupSegment::buildFirst(const OpList& ops,
                         Value node,
                         const Payload& val,
                         const UpdateArgs& args,
                         const Context& ctx) const
{
    for (const Branch& b : branches_) {
        OpList branch = ops.prepend(b.ops);
        if (branch.empty() || !isConcretePath(branch))
            continue;
        bool nop = std::any_of(b.ops.begin(), b.ops.end(), [](const SegmentPtr& op) {
            return op->kind() == Kind::Nop;
        });
        if (nop)
            continue;
        return updates(branch, std::move(node), val, forward(args, args.nop), ctx);
    }
    return node;
}

// ---- OrGroup --------------------------------------------------------------

bool
OrGroup::pushChildren(DepthStack& stack,
                      Frame& frame,
                      bool paths,
                      const Sink& sink) const
{
    std::vector<Prefix> softcut;
    for (const Branch& b : branches_) {
        OpList ops = frame.ops.prepend(b.ops);
        if (ops.empty())
            continue;
        bool soft = b.cut == Cut::Soft;
        bool usePaths = paths || soft || !softcut.empty();
        bool found = false;
        bool stopped = false;
        size_t level = stack.level();
        stack.pushLevel();
        stack.push(Frame{ ops, frame.node, frame.prefix, frame.ctx });
        process(stack, usePaths, [&](Result& res) {
            // a cut from a nested group ends this branch only
            if (res.cut)
                return false;
            if (!softcut.empty() && !res.path.empty() &&
                pathOverlaps(softcut, res.path))
                return true;
            found = true;
            if (soft && !res.path.empty())
                softcut.push_back(res.path);
            if (!paths)
                res.path.clear();
            if (!sink(res)) {
                stopped = true;
                return false;
            }
            return true;
        });
        unwind(stack, level);
        if (stopped)
            return false;
        if (found && b.cut == Cut::Hard) {
            Result cut;
            cut.cut = true;
            return sink(cut);
        }
    }
    return true;
}

std::vector<Prefix>
OrGroup::reach(const OpList& ops,
               const Value& node,
               const Context& ctx,
               const std::vector<Prefix>& softcut) const
{
    std::vector<Prefix> found;
    walk(ops, node, ctx, true, [&](Result& res) {
        if (!softcut.empty() && !res.path.empty() && pathOverlaps(softcut, res.path))
            return true;
        found.push_back(std::move(res.path));
        return true;
    });
    return found;
}

Value
OrGroup::doUpdate(const OpList& ops,
                  Value node,
                  const Payload& val,
                  const UpdateArgs& args,
                  const Context& ctx) const
{
    bool matched = false;
    std::vector<Prefix> softcut;
    for (const Branch& b : branches_) {
        OpList branch = ops.prepend(b.ops);
        if (branch.empty())
            continue;
        std::vector<Prefix> found = reach(branch, node, ctx, softcut);
        if (found.empty())
            continue;
        matched = true;
        if (b.cut == Cut::Soft)
            for (const Prefix& p : found)
                if (!p.empty())
                    softcut.push_back(p);
        if (!softcut.empty()) {
            bool nop = args.nop;
            for (const SegmentPtr& op : b.ops)
                nop = nop || op->kind() == Kind::Nop;
            for (Prefix& p : found)
                node = updates(OpList(std::move(p)), node, val, forward(args, nop), ctx);
        } else {
            node = updates(branch, node, val, forward(args, args.nop), ctx);
        }
        if (b.cut == Cut::Hard)
            return node;
    }
    if (!matched)
        return buildFirst(ops, std::move(node), val, args, ctx);
    return node;
}

Value
OrGroup::doRemove(const OpList& ops,
                  Value node,
                  const Payload& val,
                  bool nop,
                  const Context& ctx) const
{
    std::vector<Prefix> softcut;
    for (const Branch& b : branches_) {
        OpList branch = ops.prepend(b.ops);
        if (branch.empty())
            continue;
        std::vector<Prefix> found = reach(branch, node, ctx, softcut);
        if (found.empty())
            continue;
        if (b.cut == Cut::Soft)
            for (const Prefix& p : found)
                if (!p.empty())
                    softcut.push_back(p);
        if (!softcut.empty()) {
            for (Prefix& p : found)
                node = removes(OpList(std::move(p)), node, val, nop, ctx);
        } else {
            node = removes(branch, node, val, nop, ctx);
        }
        if (b.cut == Cut::Hard)
            return node;
    }
    return node;
}

std::string
OrGroup::render(bool top) const
{
    std::string s = "(";
    for (size_t i = 0; i < branches_.size(); ++i) {
        const Branch& b = branches_[i];
        if (i)
            s += ",";
        s += renderBranch(b, top);
        if (b.cut == Cut::Hard)
            s += "#";
        else if (b.cut == Cut::Soft)
            s += "##";
    }
    return s + ")";
}

SegmentPtr
OrGroup::rebuild(Branches branches) const
{
    return std::make_shared<OrGroup>(std::move(branches));
}

// ---- FirstGroup -----------------------------------------------------------

bool
FirstGroup::pushChildren(DepthStack& stack,
                         Frame& frame,
                         bool paths,
                         const Sink& sink) const
{
    for (const Branch& b : branches_) {
        OpList ops = frame.ops.prepend(b.ops);
        if (ops.empty())
            continue;
        Result hit;
        bool found = false;
        size_t level = stack.level();
        stack.pushLevel();
        stack.push(Frame{ ops, frame.node, frame.prefix, frame.ctx });
        process(stack, paths, [&](Result& res) {
            hit = std::move(res);
            found = true;
            return false;
        });
        unwind(stack, level);
        if (found)
            return sink(hit);
    }
    return true;
}

Value
FirstGroup::doUpdate(const OpList& ops,
                     Value node,
                     const Payload& val,
                     const UpdateArgs& args,
                     const Context& ctx) const
{
    for (const Branch& b : branches_) {
        OpList branch = ops.prepend(b.ops);
        if (!branch.empty() && hasAny(branch, node, ctx))
            return updates(branch, std::move(node), val, forward(args, args.nop), ctx);
    }
    return buildFirst(ops, std::move(node), val, args, ctx);
}

Value
FirstGroup::doRemove(const OpList& ops,
                     Value node,
                     const Payload& val,
                     bool nop,
                     const Context& ctx) const
{
    for (const Branch& b : branches_) {
        OpList branch = ops.prepend(b.ops);
        if (!branch.empty() && hasAny(branch, node, ctx))
            return removes(branch, std::move(node), val, nop, ctx);
    }
    return node;
}

std::string
FirstGroup::render(bool top) const
{
    std::string s = "(";
    for (size_t i = 0; i < branches_.size(); ++i)
        s += (i ? "," : "") + renderBranch(branches_[i], top);
    return s + ")?";
}

SegmentPtr
FirstGroup::rebuild(Branches branches) const
{
    return std::make_shared<FirstGroup>(std::move(branches));
}

// ---- AndGroup -------------------------------------------------------------

bool
AndGroup::pushChildren(DepthStack& stack,
                       Frame& frame,
                       bool paths,
                       const Sink& sink) const
{
    Results all;
    for (const Branch& b : branches_) {
        OpList ops = frame.ops.prepend(b.ops);
        if (ops.empty())
            continue;
        Results found;
        size_t level = stack.level();
        stack.pushLevel();
        stack.push(Frame{ ops, frame.node, frame.prefix, frame.ctx });
        process(stack, paths, [&found](Result& res) {
            found.push_back(std::move(res));
            return true;
        });
        unwind(stack, level);
        if (found.empty())
            return true;
        std::move(found.begin(), found.end(), std::back_inserter(all));
    }
    for (Result& res : all)
        if (!sink(res))
            return false;
    return true;
}

// A branch can take part in an update when it already matches, or when it
// is a plain concrete path that can be created.
static bool
updatable(const OpList& ops, const Value& node, const Context& ctx)
{
    if (hasAny(ops, node, ctx))
        return true;
    if (!isConcretePath(ops))
        return false;
    const SegmentPtr& head = ops.front();
    if (head->kind() == Segment::Kind::Filtered)
        return false;
    auto key = dynamic_cast<const KeySegment*>(head->unwrap());
    return !(key && !key->filters().empty());
}

Value
AndGroup::doUpdate(const OpList& ops,
                   Value node,
                   const Payload& val,
                   const UpdateArgs& args,
                   const Context& ctx) const
{
    for (const Branch& b : branches_) {
        OpList branch = ops.prepend(b.ops);
        if (!branch.empty() && !updatable(branch, node, ctx))
            return node;
    }
    for (const Branch& b : branches_) {
        OpList branch = ops.prepend(b.ops);
        if (!branch.empty())
            node = updates(branch, node, val, forward(args, args.nop), ctx);
    }
    return node;
}

Value
AndGroup::doRemove(const OpList& ops,
                   Value node,
                   const Payload& val,
                   bool nop,
                   const Context& ctx) const
{
    for (const Branch& b : branches_) {
        OpList branch = ops.prepend(b.ops);
        if (!branch.empty() && !hasAny(branch, node, ctx))
            return node;
    }
    for (const Branch& b : branches_) {
        OpList branch = ops.prepend(b.ops);
        if (!branch.empty())
            node = removes(branch, node, val, nop, ctx);
    }
    return node;
}

std::string
AndGroup::render(bool top) const
{
    std::string s = "(";
    for (size_t i = 0; i < branches_.size(); ++i)
        s += (i ? "&" : "") + renderBranch(branches_[i], top);
    return s + ")";
}

SegmentPtr
AndGroup::rebuild(Branches branches) const
{
    return std::make_shared<AndGroup>(std::move(branches));
}

// ---- NotGroup -------------------------------------------------------------

Children
NotGroup::items(const Value& node, const Context& ctx, bool) const
{
    const Branch& inner = branches_.front();
    if (inner.ops.empty())
        return {};
    const SegmentPtr& head = inner.ops.front();
    Values excluded = head->excludedKeys(node, ctx);
    Children res;
    for (Child& c : head->leafOp()->items(node, ctx, false))
        if (std::find(excluded.begin(), excluded.end(), c.key) == excluded.end())
            res.push_back(std::move(c));
    return res;
}

OpList
NotGroup::rest(const OpList& ops) const
{
    const std::vector<SegmentPtr>& inner = branches_.front().ops;
    return ops.prepend(std::vector<SegmentPtr>(inner.begin() + 1, inner.end()));
}

bool
NotGroup::pushChildren(DepthStack& stack,
                       Frame& frame,
                       bool paths,
                       const Sink&) const
{
    const Segment* leaf = leafOp();
    if (leaf == this)
        return true;
    OpList tail = rest(frame.ops);
    Children children = items(frame.node, frame.ctx);
    Context ctx = frame.ctx.descend(frame.node);
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
        Prefix prefix = frame.prefix;
        if (paths)
            prefix.push_back(leaf->concrete(it->key));
        stack.push(Frame{ tail, it->value, std::move(prefix), ctx });
    }
    return true;
}

Value
NotGroup::doUpdate(const OpList& ops,
                   Value node,
                   const Payload& val,
                   const UpdateArgs& args,
                   const Context& ctx) const
{
    const Segment* leaf = leafOp();
    if (leaf == this)
        return node;
    OpList tail = rest(ops);
    Context inner = ctx.descend(node);
    for (Child& c : items(node, ctx)) {
        if (!tail.empty()) {
            UpdateArgs sub = forward(args, args.nop);
            sub.trail.emplace_back(leaf, c.key);
            node = leaf->update(node, c.key, updates(tail, c.value, val, sub, inner));
        } else if (!args.nop) {
            node = leaf->update(node, c.key, val);
        }
    }
    return node;
}

Value
NotGroup::doRemove(const OpList& ops,
                   Value node,
                   const Payload& val,
                   bool nop,
                   const Context& ctx) const
{
    const Segment* leaf = leafOp();
    if (leaf == this)
        return node;
    OpList tail = rest(ops);
    Context inner = ctx.descend(node);
    Children children = items(node, ctx);
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
        if (!tail.empty())
            node = leaf->update(node, it->key, removes(tail, it->value, val, false, inner));
        else if (!nop && (!val || it->value == *val))
            node = leaf->pop(node, it->key);
    }
    return node;
}

std::string
NotGroup::render(bool top) const
{
    return "(!" + renderBranch(branches_.front(), top) + ")";
}

SegmentPtr
NotGroup::rebuild(Branches branches) const
{
    return std::make_shared<NotGroup>(branches.empty() ? Branch() : std::move(branches.front()));
}

} // namespace dt
