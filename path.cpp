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

#include "path.h"

#include <cctype>
#include <cstring>
#include <regex>

namespace dt {

Path::Path() : ops_(std::make_shared<const std::vector<SegmentPtr>>())
{
}

Path::Path(std::vector<SegmentPtr> ops, Transforms transforms)
  : ops_(std::make_shared<const std::vector<SegmentPtr>>(std::move(ops))),
    transforms_(std::move(transforms))
{
}

Path
Path::withTransforms(Transforms transforms) const
{
    Path res = *this;
    res.transforms_ = std::move(transforms);
    return res;
}

Path
Path::withGuard(Pred pred, MatcherPtr guard) const
{
    Path res = *this;
    res.guardPred_ = pred;
    res.guard_ = std::move(guard);
    return res;
}

bool
Path::isPattern() const
{
    for (const SegmentPtr& op : *ops_)
        if (op->isPattern())
            return true;
    return false;
}

bool
Path::isInverted() const
{
    return !ops_->empty() && ops_->front()->kind() == Segment::Kind::Invert;
}

bool
Path::isTemplate() const
{
    for (const SegmentPtr& op : *ops_)
        if (op->isTemplate())
            return true;
    return guard_ && guard_->isTemplate();
}

Value
Path::apply(const Value& value, const TransformRegistry& registry) const
{
    if (transforms_.empty())
        return value;
    return registry.apply(value, transforms_);
}

bool
Path::guardMatches(const Value& value) const
{
    if (!guard_)
        return true;
    return testPred(guardPred_, *guard_, value);
}

Path
Path::resolve(const Value& bindings, bool partial) const
{
    std::vector<SegmentPtr> ops;
    bool changed = false;
    for (const SegmentPtr& op : *ops_) {
        SegmentPtr resolved = op->resolve(bindings, partial);
        if (resolved) {
            changed = true;
            ops.push_back(std::move(resolved));
        } else {
            ops.push_back(op);
        }
    }
    MatcherPtr guard = guard_ ? guard_->resolve(bindings, partial) : nullptr;
    if (!changed && !guard)
        return *this;
    Path res(std::move(ops), transforms_);
    res.guardPred_ = guardPred_;
    res.guard_ = guard ? guard : guard_;
    return res;
}

std::string
Path::assemble(size_t start, bool pedantic) const
{
    std::string s = dt::assemble(*ops_, start, pedantic);
    for (const Transform& t : transforms_)
        s += "|" + t.render();
    return s;
}

std::string
assemble(const std::vector<SegmentPtr>& ops, size_t start, bool pedantic)
{
    std::vector<std::string> parts;
    bool top = true;
    for (size_t i = start; i < ops.size(); ++i) {
        parts.push_back(ops[i]->render(top));
        if (ops[i]->kind() != Segment::Kind::Invert)
            top = false;
    }
    size_t n = parts.size();
    if (!pedantic && !top && n > 1 && parts[n - 1] == "[]" && parts[n - 2] != "[]")
        parts.pop_back();
    std::string s;
    for (const std::string& p : parts)
        s += p;
    return s;
}

static const std::regex kNumericKey(
  "-?0[xX][0-9a-fA-F]+|-?0[oO][0-7]+|-?0[bB][01]+"
  "|-?[0-9][0-9_]*[eE][+-]?[0-9]+|-?[0-9]+(?:_[0-9]+)+|-?[0-9]+");

bool
needsQuoting(const std::string& key)
{
    if (key.empty())
        return true;
    unsigned char c0 = key[0];
    if (std::isdigit(c0) ||
        (key.size() > 1 && c0 == '-' && std::isdigit((unsigned char)key[1])))
        return !std::regex_match(key, kNumericKey);
    for (char c : key)
        if (std::strchr(".[]*:|+?/=,@&()!~#{} \t\n\r", c))
            return true;
    return false;
}

bool
isNumericString(const std::string& key)
{
    size_t i = 0;
    size_t n = key.size();
    while (i < n && std::isspace((unsigned char)key[i]))
        ++i;
    while (n > i && std::isspace((unsigned char)key[n - 1]))
        --n;
    if (i < n && (key[i] == '+' || key[i] == '-'))
        ++i;
    if (i == n)
        return false;
    bool digit = false;
    for (; i < n; ++i) {
        if (std::isdigit((unsigned char)key[i])) {
            digit = true;
        } else if (key[i] == '_' && digit && i + 1 < n) {
            digit = false;
        } else {
            return false;
        }
    }
    return digit;
}

std::string
quoteString(const std::string& key)
{
    std::string s = "'";
    for (char c : key) {
        if (c == '\\' || c == '\'')
            s += '\\';
        s += c;
    }
    s += '\'';
    return s;
}

std::string
quote(const Value& key, bool asKey)
{
    switch (key.getType()) {
        case Value::String:
            if (needsQuoting(key.getString()))
                return quoteString(key.getString());
            return key.getString();
        case Value::Float: {
            std::string s = key.str();
            if (s.find('.') == std::string::npos || !asKey)
                return s;
            return "#'" + s + "'";
        }
        case Value::Bytes:
            return key.toString();
        default:
            return key.str();
    }
}

std::string
normalize(const Value& key, bool asKey)
{
    if (key.isString() && isNumericString(key.getString()))
        return quoteString(key.getString());
    return quote(key, asKey);
}

} // namespace dt
