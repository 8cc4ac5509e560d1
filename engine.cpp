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

#include "engine.h"
#include "access.h"
#include "error.h"

#include <algorithm>

namespace dt {

bool
needsParents(const std::vector<SegmentPtr>& ops)
{
    for (const SegmentPtr& op : ops)
        if (op->referenceDepth() >= 2)
            return true;
    return false;
}

Context
makeContext(const Value& root,
            const std::vector<SegmentPtr>& ops,
            bool strict,
            const TransformRegistry* registry)
{
    Context ctx;
    ctx.root = root;
    ctx.strict = strict;
    ctx.trackParents = needsParents(ops);
    ctx.registry = registry;
    return ctx;
}

Value
buildDefault(const OpList& ops, const Context& ctx)
{
    if (ops.empty())
        return Value();
    const Segment& cur = *ops.front();
    OpList rest = ops.tail();
    if (rest.empty()) {
        const Segment* inner = cur.unwrap();
        if (inner->kind() == Segment::Kind::Slot &&
            static_cast<const SlotSegment*>(inner)->isIndex()) {
            long long idx = inner->matcher()->value().getInt();
            return Value::sequence(Value::Items(idx < 0 ? 0 : idx + 1));
        }
        return cur.defaultValue();
    }
    return cur.upsert(cur.defaultValue(), buildDefault(rest, ctx), ctx);
}

Value
emptyLike(const Value& node)
{
    switch (node.getType()) {
        case Value::Sequence:
            return Value::sequence(Value::Items(), node.getMutability());
        case Value::Set:
            return Value::set(Value::Items(), node.getMutability());
        case Value::Record:
            return Value::record(node.getRecord().name,
                                 std::vector<Value::Field>(),
                                 node.getMutability());
        case Value::String:
            return Value("");
        case Value::Bytes:
            return Value::bytes("");
        case Value::Mapping:
            return Value::mapping(Value::Entries(), node.getMutability());
        default:
            return Value::mapping();
    }
}

Value
build(const OpList& ops, const Value& node, const Context& ctx)
{
    if (ops.empty())
        return node.deepCopy();
    const Segment& cur = *ops.front();
    OpList rest = ops.tail();
    Value built = emptyLike(node);
    for (const Child& c : cur.items(node, ctx)) {
        Value v = rest.empty() ? c.value.deepCopy() : build(rest, c.value, ctx);
        built = cur.update(built, c.key, v);
    }
    if (built.truthy())
        return built;
    return buildDefault(ops, ctx);
}

bool
process(DepthStack& stack, bool paths, const Sink& sink)
{
    size_t start = stack.level();
    while (stack.level() >= start && !stack.currentEmpty()) {
        Frame frame = stack.pop();
        if (frame.ops.empty()) {
            Result res{ std::move(frame.prefix), std::move(frame.node) };
            if (!sink(res))
                return false;
            continue;
        }
        SegmentPtr op = frame.ops.front();
        frame.ops = frame.ops.tail();
        if (!op->pushChildren(stack, frame, paths, sink))
            return false;
    }
    return true;
}

void
walk(const OpList& ops,
     const Value& node,
     const Context& ctx,
     bool paths,
     const Sink& sink)
{
    DepthStack stack;
    stack.push(Frame{ ops, node, Prefix(), ctx });
    process(stack, paths, [&sink](Result& res) {
        if (res.cut)
            return false;
        return sink(res);
    });
}

Results
collect(const OpList& ops, const Value& node, const Context& ctx, bool paths)
{
    Results results;
    walk(ops, node, ctx, paths, [&results](Result& res) {
        results.push_back(std::move(res));
        return true;
    });
    return results;
}

bool
hasAny(const OpList& ops, const Value& node, const Context& ctx)
{
    bool found = false;
    walk(ops, node, ctx, false, [&found](Result&) {
        found = true;
        return false;
    });
    return found;
}

bool
first(const OpList& ops, const Value& node, const Context& ctx, Value& out)
{
    bool found = false;
    walk(ops, node, ctx, false, [&found, &out](Result& res) {
        out = std::move(res.value);
        found = true;
        return false;
    });
    return found;
}

static bool
isScalar(const Value& node)
{
    switch (node.getType()) {
        case Value::Null:
        case Value::Bool:
        case Value::Int:
        case Value::Float:
            return true;
        default:
            return false;
    }
}

Value
updates(const OpList& ops,
        Value node,
        const Payload& val,
        const UpdateArgs& args,
        const Context& ctx)
{
    if (!args.hasDefaults && isScalar(node)) {
        std::string where = formatTrail(args.trail);
        std::string location = where.empty() ? "" : " at '" + where + "'";
        throw TypeError("Cannot update " + kindName(node) + location +
                        " - use a dict, list, or other container");
    }
    if (ops.empty())
        return val ? *val : node;
    return ops.front()->doUpdate(ops.tail(), std::move(node), val, args, ctx);
}

Value
removes(const OpList& ops,
        Value node,
        const Payload& val,
        bool nop,
        const Context& ctx)
{
    if (ops.empty())
        return node;
    return ops.front()->doRemove(ops.tail(), std::move(node), val, nop, ctx);
}

bool
pathOverlaps(const std::vector<Prefix>& cuts, const Prefix& path)
{
    for (const Prefix& cut : cuts) {
        size_t n = std::min(cut.size(), path.size());
        bool all = true;
        for (size_t j = 0; j < n && all; ++j)
            all = cut[j]->match(*path[j], true).has_value();
        if (all)
            return true;
    }
    return false;
}

bool
isConcretePath(const OpList& ops)
{
    for (const SegmentPtr& op : ops.toVector())
        if (op->unwrap()->isPattern())
            return false;
    return true;
}

std::string
formatTrail(const Trail& trail)
{
    std::string res;
    for (size_t i = 0; i < trail.size(); ++i) {
        const Segment* cur = trail[i].first->unwrap();
        const Value& key = trail[i].second;
        if (cur->kind() == Segment::Kind::Attr)
            res += "@" + key.str();
        else if (cur->kind() == Segment::Kind::Slot || key.isInt())
            res += "[" + key.str() + "]";
        else if (i)
            res += "." + key.str();
        else
            res += key.str();
    }
    return res;
}

std::string
kindName(const Value& value)
{
    switch (value.getType()) {
        case Value::Null:
            return "NoneType";
        case Value::Bool:
            return "bool";
        case Value::Int:
            return "int";
        case Value::Float:
            return "float";
        case Value::String:
            return "str";
        case Value::Bytes:
            return "bytes";
        case Value::Sequence:
            return value.isMutable() ? "list" : "tuple";
        case Value::Mapping:
            return value.isMutable() ? "dict" : "mappingproxy";
        case Value::Set:
            return value.isMutable() ? "set" : "frozenset";
        case Value::Record:
            return value.getRecord().name;
    }
    return "object";
}

} // namespace dt
