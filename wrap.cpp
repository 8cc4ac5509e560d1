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

#include "wrap.h"
#include "engine.h"
#include "recursive.h"

namespace dt {

SegmentPtr
WrapSegment::resolve(const Value& bindings, bool partial) const
{
    SegmentPtr inner = inner_->resolve(bindings, partial);
    return inner ? rewrap(std::move(inner)) : nullptr;
}

// ---- shared by guards and filters ------------------------------------------

static const RecursiveSegment*
asRecursive(const SegmentPtr& seg)
{
    return dynamic_cast<const RecursiveSegment*>(seg.get());
}

static Children
keep(Children children, const ValueTest& test)
{
    Children res;
    for (Child& c : children)
        if (test(c.value))
            res.push_back(std::move(c));
    return res;
}

// Recursive inners yield their matches first and are then tested; other
// segments push the children that items() already tested.
static bool
pushTested(const Segment& self,
           const SegmentPtr& inner,
           DepthStack& stack,
           Frame& frame,
           bool paths,
           const ValueTest& test)
{
    if (const RecursiveSegment* rec = asRecursive(inner)) {
        RecursiveSegment::Matches found;
        rec->collectMatches(frame.node, frame.ctx, paths, frame.prefix, test, found);
        for (auto it = found.rbegin(); it != found.rend(); ++it)
            stack.push(Frame{ frame.ops, it->second, std::move(it->first), frame.ctx });
        return true;
    }
    Children children = self.items(frame.node, frame.ctx);
    Context ctx = frame.ctx.descend(frame.node);
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
        Prefix prefix = frame.prefix;
        if (paths)
            prefix.push_back(self.concrete(it->key));
        stack.push(Frame{ frame.ops, it->value, std::move(prefix), ctx });
    }
    return true;
}

static Value
upsertTested(const Segment& self,
             const SegmentPtr& inner,
             Value node,
             const Payload& val,
             const Context& ctx)
{
    for (const Child& c : self.items(node, ctx))
        node = inner->update(node, c.key, val);
    return node;
}

static Value
removeTested(const Segment& self,
             const SegmentPtr& inner,
             Value node,
             const Payload& val,
             const Context& ctx)
{
    Children children = self.items(node, ctx);
    for (auto it = children.rbegin(); it != children.rend(); ++it)
        if (!val || it->value == *val)
            node = inner->pop(node, it->key);
    return node;
}

// ---- NopWrap --------------------------------------------------------------

Value
NopWrap::doUpdate(const OpList& ops,
                  Value node,
                  const Payload& val,
                  const UpdateArgs& args,
                  const Context& ctx) const
{
    UpdateArgs sub{ args.hasDefaults, true, true, args.trail };
    return inner_->doUpdate(ops, std::move(node), val, sub, ctx);
}

Value
NopWrap::doRemove(const OpList& ops,
                  Value node,
                  const Payload& val,
                  bool,
                  const Context& ctx) const
{
    return inner_->doRemove(ops, std::move(node), val, true, ctx);
}

std::string
NopWrap::render(bool top) const
{
    std::string s = inner_->render(top);
    if (s.empty())
        return "~";
    if (s == "[]")
        return "~[]";
    if (s[0] == '[')
        return "[~" + s.substr(1);
    if (top)
        return "~" + s;
    if (s[0] == '.')
        return ".~" + s.substr(1);
    if (s[0] == '@')
        return "@~" + s.substr(1);
    return "~" + s;
}

SegmentPtr
NopWrap::rewrap(SegmentPtr inner) const
{
    return std::make_shared<NopWrap>(std::move(inner));
}

// ---- ValueGuard -----------------------------------------------------------

bool
ValueGuard::accepts(const Value& value, const Context& ctx) const
{
    if (transforms_.empty())
        return testPred(pred_, *guard_, value);
    return testPred(pred_, *guard_, ctx.transforms().apply(value, transforms_));
}

Children
ValueGuard::items(const Value& node, const Context& ctx, bool filtered) const
{
    Children children = inner_->items(node, ctx, filtered);
    if (!filtered)
        return children;
    return keep(std::move(children),
                [this, &ctx](const Value& v) { return accepts(v, ctx); });
}

Value
ValueGuard::upsert(Value node, const Payload& val, const Context& ctx) const
{
    return upsertTested(*this, inner_, std::move(node), val, ctx);
}

Value
ValueGuard::remove(Value node, const Payload& val, const Context& ctx) const
{
    return removeTested(*this, inner_, std::move(node), val, ctx);
}

bool
ValueGuard::pushChildren(DepthStack& stack,
                         Frame& frame,
                         bool paths,
                         const Sink&) const
{
    const Context& ctx = frame.ctx;
    return pushTested(*this, inner_, stack, frame, paths,
                      [this, &ctx](const Value& v) { return accepts(v, ctx); });
}

Value
ValueGuard::doUpdate(const OpList& ops,
                     Value node,
                     const Payload& val,
                     const UpdateArgs& args,
                     const Context& ctx) const
{
    if (const RecursiveSegment* rec = asRecursive(inner_))
        return rec->updateRecursive(ops, std::move(node), val, args, ctx,
                                    [this, &ctx](const Value& v) { return accepts(v, ctx); });
    return Segment::doUpdate(ops, std::move(node), val, args, ctx);
}

Value
ValueGuard::doRemove(const OpList& ops,
                     Value node,
                     const Payload& val,
                     bool nop,
                     const Context& ctx) const
{
    if (const RecursiveSegment* rec = asRecursive(inner_))
        return rec->removeRecursive(ops, std::move(node), val, nop, ctx,
                                    [this, &ctx](const Value& v) { return accepts(v, ctx); });
    return Segment::doRemove(ops, std::move(node), val, nop, ctx);
}

std::string
ValueGuard::render(bool top) const
{
    std::string s = inner_->render(top);
    for (const Transform& t : transforms_)
        s += "|" + t.render();
    return s + PredToString(pred_) + guard_->render();
}

SegmentPtr
ValueGuard::resolve(const Value& bindings, bool partial) const
{
    SegmentPtr inner = inner_->resolve(bindings, partial);
    MatcherPtr guard = guard_->resolve(bindings, partial);
    if (!inner && !guard)
        return nullptr;
    return std::make_shared<ValueGuard>(inner ? inner : inner_,
                                        pred_,
                                        guard ? guard : guard_,
                                        transforms_);
}

SegmentPtr
ValueGuard::rewrap(SegmentPtr inner) const
{
    return std::make_shared<ValueGuard>(std::move(inner), pred_, guard_, transforms_);
}

// ---- TypeRestriction ------------------------------------------------------

static const char* const kKinds[] = { "str",  "bytes", "int",       "float",
                                      "bool", "dict",  "list",      "tuple",
                                      "set",  "frozenset", "record" };

bool
isKnownKind(const std::string& kind)
{
    for (const char* k : kKinds)
        if (kind == k)
            return true;
    return false;
}

static bool
admits(const std::string& kind, const Value& node)
{
    if (kind == "int")
        return node.isInt() || node.isBool();
    if (kind == "record")
        return node.isRecord();
    return kindName(node) == kind;
}

bool
TypeRestriction::allows(const Value& node) const
{
    bool found = false;
    for (const std::string& kind : kinds_) {
        if (admits(kind, node)) {
            found = true;
            break;
        }
    }
    return found != negate_;
}

Children
TypeRestriction::items(const Value& node, const Context& ctx, bool filtered) const
{
    if (!allows(node))
        return {};
    return inner_->items(node, ctx, filtered);
}

bool
TypeRestriction::pushChildren(DepthStack& stack,
                              Frame& frame,
                              bool paths,
                              const Sink& sink) const
{
    if (!allows(frame.node))
        return true;
    return inner_->pushChildren(stack, frame, paths, sink);
}

Value
TypeRestriction::doUpdate(const OpList& ops,
                          Value node,
                          const Payload& val,
                          const UpdateArgs& args,
                          const Context& ctx) const
{
    if (!allows(node))
        return node;
    return inner_->doUpdate(ops, std::move(node), val, args, ctx);
}

Value
TypeRestriction::doRemove(const OpList& ops,
                          Value node,
                          const Payload& val,
                          bool nop,
                          const Context& ctx) const
{
    if (!allows(node))
        return node;
    return inner_->doRemove(ops, std::move(node), val, nop, ctx);
}

std::string
TypeRestriction::render(bool top) const
{
    std::string names;
    for (size_t i = 0; i < kinds_.size(); ++i)
        names += (i ? ", " : "") + kinds_[i];
    if (kinds_.size() != 1)
        names = "(" + names + ")";
    return inner_->render(top) + (negate_ ? ":!" : ":") + names;
}

SegmentPtr
TypeRestriction::rewrap(SegmentPtr inner) const
{
    return std::make_shared<TypeRestriction>(std::move(inner), kinds_, negate_);
}

// ---- FilterWrap -----------------------------------------------------------

Children
FilterWrap::items(const Value& node, const Context& ctx, bool filtered) const
{
    Children children = inner_->items(node, ctx, filtered);
    if (!filtered || children.empty())
        return children;
    Values vals;
    for (const Child& c : children)
        vals.push_back(c.value);
    Children res;
    for (size_t i : selectFiltered(filters_, vals, ctx.transforms()))
        res.push_back(children[i]);
    return res;
}

Value
FilterWrap::upsert(Value node, const Payload& val, const Context& ctx) const
{
    return upsertTested(*this, inner_, std::move(node), val, ctx);
}

Value
FilterWrap::remove(Value node, const Payload& val, const Context& ctx) const
{
    return removeTested(*this, inner_, std::move(node), val, ctx);
}

bool
FilterWrap::pushChildren(DepthStack& stack,
                         Frame& frame,
                         bool paths,
                         const Sink&) const
{
    const TransformRegistry& reg = frame.ctx.transforms();
    return pushTested(*this, inner_, stack, frame, paths, [this, &reg](const Value& v) {
        return passesFilters(filters_, v, reg);
    });
}

Value
FilterWrap::doUpdate(const OpList& ops,
                     Value node,
                     const Payload& val,
                     const UpdateArgs& args,
                     const Context& ctx) const
{
    if (const RecursiveSegment* rec = asRecursive(inner_)) {
        const TransformRegistry& reg = ctx.transforms();
        return rec->updateRecursive(ops, std::move(node), val, args, ctx,
                                    [this, &reg](const Value& v) {
                                        return passesFilters(filters_, v, reg);
                                    });
    }
    return Segment::doUpdate(ops, std::move(node), val, args, ctx);
}

Value
FilterWrap::doRemove(const OpList& ops,
                     Value node,
                     const Payload& val,
                     bool nop,
                     const Context& ctx) const
{
    if (const RecursiveSegment* rec = asRecursive(inner_)) {
        const TransformRegistry& reg = ctx.transforms();
        return rec->removeRecursive(ops, std::move(node), val, nop, ctx,
                                    [this, &reg](const Value& v) {
                                        return passesFilters(filters_, v, reg);
                                    });
    }
    return Segment::doRemove(ops, std::move(node), val, nop, ctx);
}

std::string
FilterWrap::render(bool top) const
{
    std::string s = inner_->render(top);
    std::string f = "&" + renderFilters(filters_);
    if (!s.empty() && s.back() == ']')
        return s.substr(0, s.size() - 1) + f + "]";
    return s + f;
}

SegmentPtr
FilterWrap::rewrap(SegmentPtr inner) const
{
    return std::make_shared<FilterWrap>(std::move(inner), filters_);
}

} // namespace dt
