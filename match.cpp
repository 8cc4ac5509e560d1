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

#include "match.h"
#include "engine.h"
#include "error.h"
#include "path.h"

#include <algorithm>

namespace dt {

Values
Matcher::matches(const Values& candidates) const
{
    Values res;
    for (const Value& v : candidates)
        if (test(v))
            res.push_back(v);
    return res;
}

bool
Matcher::matchable(const Matcher& other, bool specials) const
{
    return other.isConst();
}

bool
ConstMatcher::test(const Value& candidate) const
{
    return value_ == candidate;
}

std::string
ConstMatcher::render() const
{
    switch (kind_) {
        case Kind::NumericQuoted:
            if (value_.isFloat())
                return "#'" + value_.str() + "'";
            return value_.str();
        case Kind::String:
            if (!value_.isString())
                return value_.str();
            return quoteString(value_.getString());
        case Kind::Bytes:
            return "b" + quoteString(value_.getString());
        default:
            return value_.str();
    }
}

std::string
ConstMatcher::quote() const
{
    switch (kind_) {
        case Kind::Word: {
            if (!value_.isString())
                return render();
            const std::string& s = value_.getString();
            if (isNumericString(s) || needsQuoting(s))
                return quoteString(s);
            return s;
        }
        case Kind::String:
            if (!value_.isString())
                return render();
            return quoteString(value_.getString());
        default:
            return render();
    }
}

Values
WildcardMatcher::matches(const Values& candidates) const
{
    if (kind_ == Kind::Wildcard || candidates.empty())
        return candidates;
    return Values{ candidates.front() };
}

bool
WildcardMatcher::matchable(const Matcher& other, bool specials) const
{
    if (other.isConst())
        return true;
    if (kind_ == Kind::Wildcard)
        return specials;
    return specials && (other.kind() == Kind::Special ||
                        other.kind() == Kind::WildcardFirst ||
                        other.kind() == Kind::RegexFirst);
}

std::string
WildcardMatcher::render() const
{
    return kind_ == Kind::Wildcard ? "*" : "*?";
}

RegexMatcher::RegexMatcher(const std::string& source, bool first)
  : Matcher(first ? Kind::RegexFirst : Kind::Regex),
    source_(source),
    re_(source)
{
}

bool
RegexMatcher::test(const Value& candidate) const
{
    if (candidate.isString() || candidate.isBytes())
        return std::regex_match(candidate.getString(), re_);
    return std::regex_match(candidate.str(), re_);
}

Values
RegexMatcher::matches(const Values& candidates) const
{
    Values res;
    for (const Value& v : candidates) {
        if (!test(v))
            continue;
        res.push_back(v);
        if (kind_ == Kind::RegexFirst)
            break;
    }
    return res;
}

bool
RegexMatcher::matchable(const Matcher& other, bool specials) const
{
    if (other.isConst())
        return true;
    if (!specials)
        return false;
    if (other.kind() == Kind::Special)
        return true;
    if (kind_ == Kind::Regex)
        return other.kind() == Kind::Regex || other.kind() == Kind::RegexFirst;
    return other.kind() == Kind::RegexFirst;
}

std::string
RegexMatcher::render() const
{
    std::string s = "/" + source_ + "/";
    if (kind_ == Kind::RegexFirst)
        s += '?';
    return s;
}

static std::string
renderTransforms(const Transforms& transforms)
{
    std::string s;
    for (const Transform& t : transforms) {
        s += '|';
        s += t.render();
    }
    return s;
}

std::string
SubstMatcher::render() const
{
    if (key_.isInt() && transforms_.empty())
        return "$" + key_.str();
    return "$(" + key_.str() + renderTransforms(transforms_) + ")";
}

static const Value*
lookup(const Value& bindings, const Value& key)
{
    if (bindings.isSequence() && key.isInt()) {
        const Value::Items& items = bindings.getItems();
        long long i = key.getInt();
        if (i < 0)
            i += static_cast<long long>(items.size());
        if (i < 0 || i >= static_cast<long long>(items.size()))
            return nullptr;
        return &items[i];
    }
    return bindings.find(key);
}

MatcherPtr
SubstMatcher::resolve(const Value& bindings, bool partial) const
{
    const Value* bound = lookup(bindings, key_);
    if (!bound) {
        if (partial)
            return nullptr;
        throw TemplateError("Unbound substitution " + render());
    }
    Value val = TransformRegistry::global().apply(*bound, transforms_);
    return std::make_shared<ConstMatcher>(Kind::Resolved, Value(val.str()));
}

ReferenceMatcher::ReferenceMatcher(std::shared_ptr<const Path> path, int depth)
  : Matcher(Kind::Reference), path_(std::move(path)), depth_(depth)
{
}

bool
ReferenceMatcher::isPattern() const
{
    return path_ && !path_->empty() && path_->isPattern();
}

std::string
ReferenceMatcher::render() const
{
    std::string s = "$$(";
    s.append(depth_, '^');
    if (path_)
        s += path_->assemble();
    s += ')';
    return s;
}

bool
ReferenceMatcher::resolveRef(const Context& ctx,
                             const Value& node,
                             Value& out) const
{
    const Value* target;
    if (depth_ == 0)
        target = &ctx.root;
    else if (depth_ == 1)
        target = &node;
    else
        target = ctx.ancestor(depth_ - 2);
    if (!target)
        return false;
    if (!path_ || path_->empty()) {
        out = *target;
        return true;
    }
    Context inner = makeContext(*target, path_->ops(), false, ctx.registry);
    const TransformRegistry& reg = ctx.transforms();
    if (path_->isPattern()) {
        Results found = collect(path_->opList(), *target, inner, false);
        Value::Items items;
        for (Result& r : found)
            items.push_back(path_->apply(r.value, reg));
        out = Value::sequence(std::move(items), Value::CopyOnWrite);
        return true;
    }
    Value found;
    if (!first(path_->opList(), *target, inner, found))
        return false;
    out = path_->apply(found, reg);
    return true;
}

static Value
reduce(const Values& values)
{
    Value acc = values.front();
    for (size_t i = 1; i < values.size(); ++i)
        acc = addValues(acc, values[i]);
    return acc;
}

Value
ConcatMatcher::value() const
{
    const TransformRegistry& reg = TransformRegistry::global();
    Values vals;
    for (const ConcatPart& p : parts_)
        vals.push_back(reg.apply(p.op->value(), p.transforms));
    return reduce(vals);
}

bool
ConcatMatcher::test(const Value& candidate) const
{
    return value() == candidate;
}

bool
ConcatMatcher::isTemplate() const
{
    for (const ConcatPart& p : parts_)
        if (p.op->isTemplate())
            return true;
    return false;
}

bool
ConcatMatcher::isReference() const
{
    for (const ConcatPart& p : parts_)
        if (p.op->isReference())
            return true;
    return false;
}

int
ConcatMatcher::referenceDepth() const
{
    int d = 0;
    for (const ConcatPart& p : parts_)
        d = std::max(d, p.op->referenceDepth());
    return d;
}

std::string
ConcatMatcher::render() const
{
    std::string s;
    for (size_t i = 0; i < parts_.size(); ++i) {
        if (i)
            s += '+';
        s += parts_[i].op->quote() + renderTransforms(parts_[i].transforms);
    }
    return s;
}

MatcherPtr
ConcatMatcher::resolve(const Value& bindings, bool partial) const
{
    std::vector<ConcatPart> parts;
    bool changed = false;
    bool concrete = true;
    for (const ConcatPart& p : parts_) {
        MatcherPtr op = p.op->resolve(bindings, partial);
        if (op)
            changed = true;
        else
            op = p.op;
        if (!op->isConst())
            concrete = false;
        parts.push_back(ConcatPart{ op, p.transforms });
    }
    if (!changed)
        return nullptr;
    if (!concrete)
        return std::make_shared<ConcatMatcher>(std::move(parts));
    const TransformRegistry& reg = TransformRegistry::global();
    Values vals;
    for (const ConcatPart& p : parts)
        vals.push_back(reg.apply(p.op->value(), p.transforms));
    return std::make_shared<ConstMatcher>(Kind::Resolved,
                                          Value(reduce(vals).str()));
}

bool
ConcatMatcher::resolveRef(const Context& ctx,
                          const Value& node,
                          Value& out) const
{
    const TransformRegistry& reg = ctx.transforms();
    Values vals;
    for (const ConcatPart& p : parts_) {
        Value v;
        if (p.op->isReference()) {
            if (!p.op->resolveRef(ctx, node, v))
                return false;
        } else {
            v = p.op->value();
        }
        vals.push_back(reg.apply(v, p.transforms));
    }
    out = reduce(vals);
    return true;
}

const char*
PredToString(Pred pred)
{
    switch (pred) {
        case Pred::Eq:
            return "=";
        case Pred::Ne:
            return "!=";
        case Pred::Lt:
            return "<";
        case Pred::Gt:
            return ">";
        case Pred::Le:
            return "<=";
        case Pred::Ge:
            return ">=";
        default:
            return "?";
    }
}

Values
applyPred(Pred pred, const Matcher& ref, const Values& candidates)
{
    if (pred == Pred::Eq)
        return ref.matches(candidates);
    Values res;
    if (pred == Pred::Ne) {
        // matches() returns a subsequence, so walking both in step
        // identifies exactly the candidates it accepted.
        Values matched = ref.matches(candidates);
        size_t j = 0;
        for (const Value& v : candidates) {
            if (j < matched.size() && matched[j] == v) {
                ++j;
                continue;
            }
            res.push_back(v);
        }
        return res;
    }
    Value rv = ref.value();
    for (const Value& v : candidates) {
        int c;
        if (!compare(v, rv, c))
            continue;
        bool ok;
        switch (pred) {
            case Pred::Lt:
                ok = c < 0;
                break;
            case Pred::Gt:
                ok = c > 0;
                break;
            case Pred::Le:
                ok = c <= 0;
                break;
            default:
                ok = c >= 0;
                break;
        }
        if (ok)
            res.push_back(v);
    }
    return res;
}

bool
testPred(Pred pred, const Matcher& ref, const Value& candidate)
{
    return !applyPred(pred, ref, Values{ candidate }).empty();
}

} // namespace dt
