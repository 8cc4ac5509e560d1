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

#include "recursive.h"
#include "access.h"
#include "engine.h"
#include "path.h"

#include <algorithm>

namespace dt {

bool
DepthRange::contains(long long depth, long long toLeaf) const
{
    if (unbounded())
        return true;
    std::optional<long long> lo = start;
    std::optional<long long> hi = stop;
    if (lo && *lo < 0) {
        if (toLeaf != -*lo - 1)
            return false;
        if (!stop && !step)
            return true;
        lo = depth;
    }
    if (hi && *hi < 0) {
        if (toLeaf < -*hi - 1)
            return false;
        hi.reset();
    }
    if (!stop && !step)
        return depth == *lo;
    long long from = lo ? *lo : 0;
    if (step) {
        if (*step <= 0)
            return false;
        if (depth < from || (hi && depth > *hi))
            return false;
        return (depth - from) % *step == 0;
    }
    if (hi)
        return from <= depth && depth <= *hi;
    return depth >= from;
}

std::string
DepthRange::render() const
{
    if (unbounded())
        return "";
    std::string s = ":" + (start ? std::to_string(*start) : std::string());
    if (stop || step)
        s += ":" + (stop ? std::to_string(*stop) : std::string());
    if (step)
        s += ":" + std::to_string(*step);
    return s;
}

RecursiveSegment::RecursiveSegment(MatcherPtr inner,
                                   DepthRange depth,
                                   Filters filters,
                                   bool first)
  : Segment(first ? Kind::RecursiveFirst : Kind::Recursive),
    inner_(std::move(inner)),
    depth_(depth),
    filters_(std::move(filters)),
    first_(first)
{
    Branch branch;
    branch.ops.push_back(std::make_shared<KeySegment>(inner_));
    accessors_.push_back(std::move(branch));
}

RecursiveSegment::RecursiveSegment(Branches accessors,
                                   DepthRange depth,
                                   Filters filters,
                                   bool first)
  : Segment(first ? Kind::RecursiveFirst : Kind::Recursive),
    accessors_(std::move(accessors)),
    depth_(depth),
    filters_(std::move(filters)),
    first_(first)
{
}

bool
RecursiveSegment::isTemplate() const
{
    for (const Branch& b : accessors_)
        for (const SegmentPtr& op : b.ops)
            if (op->isTemplate())
                return true;
    return false;
}

int
RecursiveSegment::referenceDepth() const
{
    int depth = 0;
    for (const Branch& b : accessors_)
        for (const SegmentPtr& op : b.ops)
            depth = std::max(depth, op->referenceDepth());
    return depth;
}

bool
RecursiveSegment::consumes(const Segment& seg) const
{
    if (inner_) {
        const Matcher* m = seg.matcher();
        return m && !inner_->matches(Values{ m->value() }).empty();
    }
    for (const Branch& b : accessors_)
        if (!b.ops.empty() && b.ops.front()->match(seg, true))
            return true;
    return false;
}

std::vector<RecursiveSegment::Hit>
RecursiveSegment::children(const Value& node, const Context& ctx) const
{
    std::vector<Hit> hits;
    if (!node.isContainer())
        return hits;
    for (const Branch& b : accessors_) {
        if (b.ops.empty())
            continue;
        const Segment* acc = b.ops.front().get();
        bool matched = false;
        for (Child& c : acc->items(node, ctx)) {
            matched = true;
            hits.push_back(Hit{ acc, std::move(c) });
        }
        if (matched && b.cut == Cut::Hard)
            break;
    }
    return hits;
}

long long
RecursiveSegment::toLeaf(const Value& node, const Context& ctx, Seen& seen) const
{
    const void* id = node.identity();
    if (id && std::find(seen.begin(), seen.end(), id) != seen.end())
        return 0;
    std::vector<Hit> hits = children(node, ctx);
    if (hits.empty())
        return 0;
    if (id)
        seen.push_back(id);
    long long best = 0;
    for (const Hit& h : hits)
        best = std::max(best, toLeaf(h.child.value, ctx, seen));
    if (id)
        seen.pop_back();
    return best + 1;
}

bool
RecursiveSegment::selects(const Value& value,
                          long long depth,
                          const Context& ctx) const
{
    if (!filters_.empty() && !passesFilters(filters_, value, ctx.transforms()))
        return false;
    long long leaf = 0;
    if (depth_.fromLeaf()) {
        Seen fresh;
        leaf = toLeaf(value, ctx, fresh);
    }
    return depth_.contains(depth, leaf);
}

bool
RecursiveSegment::collect(const Value& node,
                          const Context& ctx,
                          bool paths,
                          long long depth,
                          const Prefix& prefix,
                          const ValueTest& guard,
                          Seen& seen,
                          Matches& out) const
{
    const void* id = node.identity();
    if (id && std::find(seen.begin(), seen.end(), id) != seen.end())
        return true;
    std::vector<Hit> hits = children(node, ctx);
    if (hits.empty())
        return true;
    if (id)
        seen.push_back(id);
    bool more = true;
    for (const Hit& h : hits) {
        Prefix cp = prefix;
        if (paths)
            cp.push_back(h.accessor->concrete(h.child.key));
        if (selects(h.child.value, depth, ctx) &&
            (!guard || guard(h.child.value))) {
            out.emplace_back(cp, h.child.value);
            if (first_) {
                more = false;
                break;
            }
        }
        if (!collect(h.child.value, ctx, paths, depth + 1, cp, guard, seen, out)) {
            more = false;
            break;
        }
    }
    if (id)
        seen.pop_back();
    return more;
}

void
RecursiveSegment::collectMatches(const Value& node,
                                 const Context& ctx,
                                 bool paths,
                                 const Prefix& prefix,
                                 const ValueTest& guard,
                                 Matches& out) const
{
    Seen seen;
    collect(node, ctx, paths, 0, prefix, guard, seen, out);
}

Children
RecursiveSegment::items(const Value& node, const Context& ctx, bool) const
{
    Children res;
    for (Hit& h : children(node, ctx))
        res.push_back(std::move(h.child));
    return res;
}

SegmentPtr
RecursiveSegment::concrete(const Value& key) const
{
    return accessors_.front().ops.front()->concrete(key);
}

Value
RecursiveSegment::update(Value node, const Value& key, const Payload& val) const
{
    return accessors_.front().ops.front()->update(node, key, val);
}

Value
RecursiveSegment::pop(Value node, const Value& key) const
{
    return accessors_.front().ops.front()->pop(node, key);
}

bool
RecursiveSegment::pushChildren(DepthStack& stack,
                               Frame& frame,
                               bool paths,
                               const Sink&) const
{
    Matches found;
    collectMatches(frame.node, frame.ctx, paths, frame.prefix, ValueTest(), found);
    for (auto it = found.rbegin(); it != found.rend(); ++it)
        stack.push(Frame{ frame.ops, it->second, std::move(it->first), frame.ctx });
    return true;
}

Value
RecursiveSegment::updateAt(const OpList& ops,
                           Value node,
                           const Payload& val,
                           const UpdateArgs& args,
                           const Context& ctx,
                           const ValueTest& guard,
                           long long depth,
                           Seen& seen) const
{
    const void* id = node.identity();
    if (id && std::find(seen.begin(), seen.end(), id) != seen.end())
        return node;
    std::vector<Hit> hits = children(node, ctx);
    if (hits.empty())
        return node;
    if (id)
        seen.push_back(id);
    for (const Hit& h : hits) {
        const Value& key = h.child.key;
        Value v = updateAt(ops, h.child.value, val, args, ctx, guard, depth + 1, seen);
        node = h.accessor->update(node, key, v);
        if (!selects(v, depth, ctx) || (guard && !guard(v)))
            continue;
        if (!ops.empty()) {
            UpdateArgs sub{ args.hasDefaults, args.nop, false, args.trail };
            sub.trail.emplace_back(this, key);
            node = h.accessor->update(node, key, updates(ops, v, val, sub, ctx));
        } else if (!args.nop) {
            node = h.accessor->update(node, key, val);
        }
    }
    if (id)
        seen.pop_back();
    return node;
}

Value
RecursiveSegment::updateRecursive(const OpList& ops,
                                  Value node,
                                  const Payload& val,
                                  const UpdateArgs& args,
                                  const Context& ctx,
                                  const ValueTest& guard) const
{
    Seen seen;
    return updateAt(ops, std::move(node), val, args, ctx, guard, 0, seen);
}

Value
RecursiveSegment::removeAt(const OpList& ops,
                           Value node,
                           const Payload& val,
                           bool nop,
                           const Context& ctx,
                           const ValueTest& guard,
                           long long depth,
                           Seen& seen) const
{
    const void* id = node.identity();
    if (id && std::find(seen.begin(), seen.end(), id) != seen.end())
        return node;
    std::vector<Hit> hits = children(node, ctx);
    if (hits.empty())
        return node;
    if (id)
        seen.push_back(id);
    std::vector<const Hit*> doomed;
    for (const Hit& h : hits) {
        const Value& key = h.child.key;
        Value v = removeAt(ops, h.child.value, val, nop, ctx, guard, depth + 1, seen);
        node = h.accessor->update(node, key, v);
        if (!selects(v, depth, ctx) || (guard && !guard(v)))
            continue;
        if (!ops.empty())
            node = h.accessor->update(node, key, removes(ops, v, val, false, ctx));
        else if (!nop && (!val || v == *val))
            doomed.push_back(&h);
    }
    for (auto it = doomed.rbegin(); it != doomed.rend(); ++it)
        node = (*it)->accessor->pop(node, (*it)->child.key);
    if (id)
        seen.pop_back();
    return node;
}

Value
RecursiveSegment::removeRecursive(const OpList& ops,
                                  Value node,
                                  const Payload& val,
                                  bool nop,
                                  const Context& ctx,
                                  const ValueTest& guard) const
{
    Seen seen;
    return removeAt(ops, std::move(node), val, nop, ctx, guard, 0, seen);
}

Value
RecursiveSegment::doUpdate(const OpList& ops,
                           Value node,
                           const Payload& val,
                           const UpdateArgs& args,
                           const Context& ctx) const
{
    return updateRecursive(ops, std::move(node), val, args, ctx, ValueTest());
}

Value
RecursiveSegment::doRemove(const OpList& ops,
                           Value node,
                           const Payload& val,
                           bool nop,
                           const Context& ctx) const
{
    return removeRecursive(ops, std::move(node), val, nop, ctx, ValueTest());
}

std::optional<Values>
RecursiveSegment::match(const Segment& other, bool) const
{
    if (!consumes(other))
        return std::nullopt;
    return Values{ Value(other.render(true)) };
}

std::string
RecursiveSegment::render(bool top) const
{
    std::string s;
    if (!inner_) {
        s = "*(";
        for (size_t i = 0; i < accessors_.size(); ++i) {
            const Branch& b = accessors_[i];
            if (i)
                s += ", ";
            for (size_t j = 0; j < b.ops.size(); ++j)
                s += b.ops[j]->render(j == 0);
            if (b.cut == Cut::Hard)
                s += "#";
            else if (b.cut == Cut::Soft)
                s += "##";
        }
        s += ")";
    } else {
        switch (inner_->kind()) {
            case Matcher::Kind::Wildcard:
            case Matcher::Kind::WildcardFirst:
                s = "**";
                break;
            case Matcher::Kind::Word:
            case Matcher::Kind::String:
            case Matcher::Kind::Numeric:
            case Matcher::Kind::NumericQuoted:
                s = "*" + normalize(inner_->value());
                break;
            default:
                s = "*" + inner_->render();
        }
    }
    s += depth_.render();
    if (!filters_.empty())
        s += "&" + renderFilters(filters_);
    if (!top)
        s = "." + s;
    if (first_)
        s += "?";
    return s;
}

SegmentPtr
RecursiveSegment::resolve(const Value& bindings, bool partial) const
{
    if (inner_) {
        MatcherPtr m = inner_->resolve(bindings, partial);
        if (!m)
            return nullptr;
        return std::make_shared<RecursiveSegment>(m, depth_, filters_, first_);
    }
    bool changed = false;
    Branches accessors = accessors_;
    for (Branch& b : accessors) {
        for (SegmentPtr& op : b.ops) {
            SegmentPtr r = op->resolve(bindings, partial);
            if (r) {
                op = std::move(r);
                changed = true;
            }
        }
    }
    if (!changed)
        return nullptr;
    return std::make_shared<RecursiveSegment>(std::move(accessors), depth_, filters_, first_);
}

} // namespace dt
