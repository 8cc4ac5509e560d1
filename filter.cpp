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

#include "filter.h"
#include "path.h"
#include "segment.h"

#include <algorithm>

namespace dt {

static bool
elementMatches(const MatcherPtr& pattern, const Value& val)
{
    if (!pattern)
        return true;
    return !pattern->matches(Values{ val }).empty();
}

static void
keyValues(const std::vector<FilterKeyPart>& parts,
          size_t i,
          const Value& node,
          Values& out)
{
    if (i == parts.size()) {
        out.push_back(node);
        return;
    }
    const FilterKeyPart& part = parts[i];
    if (part.segment) {
        Context ctx;
        for (const Child& c : part.segment->items(node, ctx))
            keyValues(parts, i + 1, c.value, out);
        return;
    }
    if (!node.isMapping())
        return;
    for (const Value::Entry& e : node.getEntries()) {
        if (!part.key->test(e.first))
            continue;
        keyValues(parts, i + 1, e.second, out);
        // intermediate levels of a dotted key follow the first match only
        if (i + 1 < parts.size())
            return;
    }
}

Values
FilterKey::values(const Value& node) const
{
    Values out;
    keyValues(parts_, 0, node, out);
    return out;
}

std::string
FilterKey::render() const
{
    std::string s;
    for (size_t i = 0; i < parts_.size(); ++i) {
        const FilterKeyPart& p = parts_[i];
        if (p.segment) {
            s += p.segment->render(false);
            continue;
        }
        if (i && !parts_[i - 1].segment)
            s += '.';
        s += p.key->quote();
    }
    return s;
}

bool
FilterKey::matchable(const FilterKey& other) const
{
    if (parts_.size() != other.parts_.size())
        return false;
    for (size_t i = 0; i < parts_.size(); ++i) {
        const FilterKeyPart& a = parts_[i];
        const FilterKeyPart& b = other.parts_[i];
        if (!a.segment != !b.segment)
            return false;
        if (a.segment) {
            if (a.segment->kind() != b.segment->kind())
                return false;
        } else if (!a.key->matchable(*b.key)) {
            return false;
        }
    }
    return true;
}

std::optional<std::string>
FilterKey::match(const FilterKey& other) const
{
    if (!matchable(other))
        return std::nullopt;
    std::string s;
    for (size_t i = 0; i < parts_.size(); ++i) {
        const FilterKeyPart& a = parts_[i];
        const FilterKeyPart& b = other.parts_[i];
        if (i)
            s += '.';
        if (a.segment) {
            if (!a.segment->match(*b.segment))
                return std::nullopt;
            s += b.segment->render(false);
            continue;
        }
        Values m = a.key->matches(Values{ b.key->value() });
        if (m.empty())
            return std::nullopt;
        s += m.front().str();
    }
    return s;
}

std::vector<size_t>
Filter::select(const Values& items, const TransformRegistry& reg) const
{
    std::vector<size_t> res;
    for (size_t i = 0; i < items.size(); ++i)
        if (test(items[i], reg))
            res.push_back(i);
    return res;
}

bool
KeyValueFilter::anyMatch(const Value& node, const TransformRegistry& reg) const
{
    if (!node.isMapping())
        return false;
    Pred pred = pred_ == Pred::Ne ? Pred::Eq : pred_;
    for (const Value& v : key_.values(node)) {
        Value val = transforms_.empty() ? v : reg.apply(v, transforms_);
        if (testPred(pred, *value_, val))
            return true;
    }
    return false;
}

bool
KeyValueFilter::test(const Value& node, const TransformRegistry& reg) const
{
    if (pred_ == Pred::Ne)
        return !anyMatch(node, reg);
    return anyMatch(node, reg);
}

std::string
KeyValueFilter::render() const
{
    std::string s = key_.render();
    for (const Transform& t : transforms_)
        s += "|" + t.render();
    s += PredToString(pred_);
    s += value_->render();
    return s;
}

bool
KeyValueFilter::matchable(const Filter& other) const
{
    if (other.kind() == Kind::KeyValue)
        return true;
    if (other.kind() == Kind::Or) {
        const auto& alts = static_cast<const CompoundFilter&>(other).filters();
        for (const FilterPtr& f : alts)
            if (matchable(*f))
                return true;
    }
    return false;
}

std::optional<std::string>
KeyValueFilter::match(const Filter& other) const
{
    if (other.kind() == Kind::Or) {
        const auto& alts = static_cast<const CompoundFilter&>(other).filters();
        for (const FilterPtr& f : alts) {
            std::optional<std::string> m = match(*f);
            if (m)
                return m;
        }
        return std::nullopt;
    }
    if (other.kind() != Kind::KeyValue)
        return std::nullopt;
    const KeyValueFilter& kv = static_cast<const KeyValueFilter&>(other);
    if (kv.pred_ != pred_)
        return std::nullopt;
    if (!key_.match(kv.key_) || !value_->matchable(*kv.value_))
        return std::nullopt;
    if (value_->matches(Values{ kv.value_->value() }).empty())
        return std::nullopt;
    return kv.render();
}

bool
CompoundFilter::test(const Value& node, const TransformRegistry& reg) const
{
    switch (kind_) {
        case Kind::And:
            for (const FilterPtr& f : filters_)
                if (!f->test(node, reg))
                    return false;
            return true;
        case Kind::Or:
            for (const FilterPtr& f : filters_)
                if (f->test(node, reg))
                    return true;
            return false;
        case Kind::Not:
            return !filters_.empty() && !filters_.front()->test(node, reg);
        default:
            return filters_.empty() || filters_.front()->test(node, reg);
    }
}

std::vector<size_t>
CompoundFilter::select(const Values& items, const TransformRegistry& reg) const
{
    switch (kind_) {
        case Kind::And:
            return selectFiltered(filters_, items, reg);
        case Kind::Or: {
            std::vector<size_t> res;
            std::vector<bool> seen(items.size());
            for (const FilterPtr& f : filters_) {
                for (size_t i : f->select(items, reg)) {
                    if (seen[i])
                        continue;
                    seen[i] = true;
                    res.push_back(i);
                }
            }
            return res;
        }
        case Kind::First: {
            if (filters_.empty())
                return {};
            std::vector<size_t> res = filters_.front()->select(items, reg);
            if (res.size() > 1)
                res.resize(1);
            return res;
        }
        case Kind::Group:
            if (filters_.empty())
                return Filter::select(items, reg);
            return filters_.front()->select(items, reg);
        default:
            return Filter::select(items, reg);
    }
}

std::string
CompoundFilter::render() const
{
    std::string s;
    switch (kind_) {
        case Kind::And:
        case Kind::Or:
            for (size_t i = 0; i < filters_.size(); ++i) {
                if (i)
                    s += kind_ == Kind::And ? '&' : ',';
                s += filters_[i]->render();
            }
            return s;
        case Kind::Group:
            return "(" + (filters_.empty() ? s : filters_.front()->render()) + ")";
        case Kind::First:
            return (filters_.empty() ? s : filters_.front()->render()) + "?";
        default:
            return "!" + (filters_.empty() ? s : filters_.front()->render());
    }
}

bool
CompoundFilter::matchable(const Filter& other) const
{
    if (other.kind() != kind_)
        return false;
    const Filters& theirs = static_cast<const CompoundFilter&>(other).filters_;
    if (theirs.size() != filters_.size())
        return false;
    if (kind_ == Kind::Group || kind_ == Kind::Not)
        return filters_.empty() || filters_.front()->matchable(*theirs.front());
    return true;
}

std::optional<std::string>
CompoundFilter::match(const Filter& other) const
{
    if (!matchable(other))
        return std::nullopt;
    const Filters& theirs = static_cast<const CompoundFilter&>(other).filters_;
    std::string s;
    for (size_t i = 0; i < filters_.size(); ++i) {
        if (!filters_[i]->matchable(*theirs[i]))
            return std::nullopt;
        std::optional<std::string> m = filters_[i]->match(*theirs[i]);
        if (!m)
            return std::nullopt;
        if (i)
            s += kind_ == Kind::Or ? ',' : '&';
        s += *m;
    }
    switch (kind_) {
        case Kind::Group:
            return "(" + s + ")";
        case Kind::First:
            return s + "?";
        case Kind::Not:
            return "!" + s;
        default:
            return s;
    }
}

std::vector<size_t>
selectFiltered(const Filters& filters,
               const Values& items,
               const TransformRegistry& reg)
{
    std::vector<size_t> idx(items.size());
    for (size_t i = 0; i < idx.size(); ++i)
        idx[i] = i;
    for (const FilterPtr& f : filters) {
        Values sub;
        for (size_t i : idx)
            sub.push_back(items[i]);
        std::vector<size_t> next;
        for (size_t j : f->select(sub, reg))
            next.push_back(idx[j]);
        idx = std::move(next);
    }
    return idx;
}

bool
passesFilters(const Filters& filters,
              const Value& node,
              const TransformRegistry& reg)
{
    for (const FilterPtr& f : filters)
        if (!f->test(node, reg))
            return false;
    return true;
}

std::string
renderFilters(const Filters& filters)
{
    std::string s;
    for (size_t i = 0; i < filters.size(); ++i) {
        if (i)
            s += '&';
        s += filters[i]->render();
    }
    return s;
}

bool
GlobMatcher::test(const Value& candidate) const
{
    return elementMatches(pattern_, candidate);
}

std::string
GlobMatcher::render() const
{
    std::string s = "...";
    if (pattern_)
        s += pattern_->render();
    if (min_ == 0 && max_)
        s += std::to_string(*max_);
    else if (min_ != 0 && !max_)
        s += std::to_string(min_) + ":";
    else if (min_ != 0)
        s += std::to_string(min_) + ":" + std::to_string(*max_);
    return s;
}

static const char*
prefixOf(Flavour flavour)
{
    switch (flavour) {
        case Flavour::List:
            return "l";
        case Flavour::Tuple:
            return "t";
        case Flavour::Dict:
            return "d";
        case Flavour::Set:
            return "s";
        case Flavour::FrozenSet:
            return "fs";
        default:
            return "";
    }
}

static bool
flavourAccepts(Flavour flavour, Value::Type type, const Value& v)
{
    if (v.getType() != type)
        return false;
    switch (flavour) {
        case Flavour::List:
        case Flavour::Dict:
        case Flavour::Set:
            return v.getMutability() == Value::InPlace;
        case Flavour::Tuple:
        case Flavour::FrozenSet:
            return v.getMutability() == Value::CopyOnWrite;
        default:
            return true;
    }
}

static const GlobMatcher*
asGlob(const MatcherPtr& m)
{
    if (m && m->kind() == Matcher::Kind::Glob)
        return static_cast<const GlobMatcher*>(m.get());
    return nullptr;
}

static bool
matchSequence(const std::vector<MatcherPtr>& elements,
              size_t ei,
              const Value::Items& actual,
              size_t ai)
{
    if (ei == elements.size())
        return ai == actual.size();
    size_t left = actual.size() - ai;
    if (const GlobMatcher* glob = asGlob(elements[ei])) {
        if (glob->min() > left)
            return false;
        size_t hi = glob->max() ? std::min(*glob->max(), left) : left;
        for (size_t count = glob->min(); count <= hi; ++count) {
            bool ok = true;
            for (size_t k = ai; k < ai + count && ok; ++k)
                ok = glob->test(actual[k]);
            // a longer span includes the element that just failed
            if (!ok)
                break;
            if (matchSequence(elements, ei + 1, actual, ai + count))
                return true;
        }
        return false;
    }
    if (!left || !elementMatches(elements[ei], actual[ai]))
        return false;
    return matchSequence(elements, ei + 1, actual, ai + 1);
}

bool
SequencePattern::test(const Value& candidate) const
{
    if (!flavourAccepts(flavour_, Value::Sequence, candidate))
        return false;
    return matchSequence(elements_, 0, candidate.getItems(), 0);
}

std::string
SequencePattern::render() const
{
    std::string s = prefixOf(flavour_);
    s += '[';
    for (size_t i = 0; i < elements_.size(); ++i) {
        if (i)
            s += ", ";
        s += elements_[i]->render();
    }
    s += ']';
    return s;
}

// Tries every way of handing the members in `remaining` to globs[gi..],
// each glob taking between its min and max of the members it accepts.
template <typename Accepts>
static bool
partition(const std::vector<const GlobMatcher*>& globs,
          size_t gi,
          const std::vector<size_t>& remaining,
          const Accepts& accepts)
{
    if (gi == globs.size())
        return remaining.empty();
    const GlobMatcher* glob = globs[gi];
    std::vector<size_t> eligible;
    for (size_t m : remaining)
        if (accepts(gi, m))
            eligible.push_back(m);
    if (eligible.size() < glob->min())
        return false;
    size_t hi = glob->max() ? std::min(*glob->max(), remaining.size())
                            : remaining.size();
    hi = std::min(hi, eligible.size());
    for (size_t count = glob->min(); count <= hi; ++count) {
        std::vector<char> pick(eligible.size(), 0);
        std::fill(pick.begin(), pick.begin() + count, 1);
        do {
            std::vector<size_t> leftover;
            for (size_t m : remaining) {
                auto it = std::find(eligible.begin(), eligible.end(), m);
                if (it == eligible.end() || !pick[it - eligible.begin()])
                    leftover.push_back(m);
            }
            if (partition(globs, gi + 1, leftover, accepts))
                return true;
        } while (std::prev_permutation(pick.begin(), pick.end()));
    }
    return false;
}

template <typename Accepts>
static bool
matchRemainder(const std::vector<const GlobMatcher*>& globs,
               const std::vector<size_t>& remaining,
               const Accepts& accepts)
{
    if (globs.empty())
        return remaining.empty();
    if (globs.size() > 1)
        return partition(globs, 0, remaining, accepts);
    const GlobMatcher* glob = globs.front();
    for (size_t m : remaining)
        if (!accepts(0, m))
            return false;
    if (remaining.size() < glob->min())
        return false;
    return !glob->max() || remaining.size() <= *glob->max();
}

bool
MappingPattern::test(const Value& candidate) const
{
    if (!flavourAccepts(flavour_, Value::Mapping, candidate))
        return false;
    const Value::Entries& actual = candidate.getEntries();
    std::vector<bool> consumed(actual.size());
    std::vector<const GlobMatcher*> globs;
    std::vector<MatcherPtr> globValues;
    for (const MappingEntry& e : entries_) {
        if (const GlobMatcher* glob = asGlob(e.key)) {
            globs.push_back(glob);
            globValues.push_back(e.value);
            continue;
        }
        bool found = false;
        for (size_t i = 0; i < actual.size() && !found; ++i) {
            if (consumed[i])
                continue;
            if (elementMatches(e.key, actual[i].first) &&
                elementMatches(e.value, actual[i].second)) {
                consumed[i] = true;
                found = true;
            }
        }
        if (!found)
            return false;
    }
    std::vector<size_t> remaining;
    for (size_t i = 0; i < actual.size(); ++i)
        if (!consumed[i])
            remaining.push_back(i);
    auto accepts = [&](size_t gi, size_t m) {
        return globs[gi]->test(actual[m].first) &&
               elementMatches(globValues[gi], actual[m].second);
    };
    return matchRemainder(globs, remaining, accepts);
}

std::string
MappingPattern::render() const
{
    std::string s = prefixOf(flavour_);
    s += '{';
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (i)
            s += ", ";
        s += entries_[i].key->render();
        if (entries_[i].value)
            s += ": " + entries_[i].value->render();
    }
    s += '}';
    return s;
}

bool
SetPattern::test(const Value& candidate) const
{
    if (!flavourAccepts(flavour_, Value::Set, candidate))
        return false;
    const Value::Items& actual = candidate.getItems();
    std::vector<bool> consumed(actual.size());
    std::vector<const GlobMatcher*> globs;
    for (const MatcherPtr& e : elements_) {
        if (const GlobMatcher* glob = asGlob(e)) {
            globs.push_back(glob);
            continue;
        }
        bool found = false;
        for (size_t i = 0; i < actual.size() && !found; ++i) {
            if (!consumed[i] && elementMatches(e, actual[i])) {
                consumed[i] = true;
                found = true;
            }
        }
        if (!found)
            return false;
    }
    std::vector<size_t> remaining;
    for (size_t i = 0; i < actual.size(); ++i)
        if (!consumed[i])
            remaining.push_back(i);
    auto accepts = [&](size_t gi, size_t m) {
        return globs[gi]->test(actual[m]);
    };
    return matchRemainder(globs, remaining, accepts);
}

std::string
SetPattern::render() const
{
    std::string s = prefixOf(flavour_);
    s += '{';
    for (size_t i = 0; i < elements_.size(); ++i) {
        if (i)
            s += ", ";
        s += elements_[i]->render();
    }
    s += '}';
    return s;
}

static std::string
escapeRegex(const std::string& s)
{
    static const std::string kSpecial = "\\^$.|?*+()[]{}";
    std::string res;
    for (char c : s) {
        if (kSpecial.find(c) != std::string::npos)
            res += '\\';
        res += c;
    }
    return res;
}

static std::string
compileGlob(const std::vector<MatcherPtr>& parts)
{
    std::string re = "^";
    for (const MatcherPtr& p : parts) {
        const GlobMatcher* glob = asGlob(p);
        if (!glob) {
            re += escapeRegex(p->value().getString());
            continue;
        }
        std::string unit = ".";
        if (glob->pattern() && (glob->pattern()->kind() == Matcher::Kind::Regex ||
                                glob->pattern()->kind() == Matcher::Kind::RegexFirst))
            unit = static_cast<const RegexMatcher&>(*glob->pattern()).source();
        re += unit;
        size_t lo = glob->min();
        const std::optional<size_t>& hi = glob->max();
        if (lo == 0 && !hi)
            re += '*';
        else if (lo == 0)
            re += "{0," + std::to_string(*hi) + "}";
        else if (!hi)
            re += "{" + std::to_string(lo) + ",}";
        else
            re += "{" + std::to_string(lo) + "," + std::to_string(*hi) + "}";
    }
    re += '$';
    return re;
}

TextGlob::TextGlob(std::vector<MatcherPtr> parts, bool bytes)
  : Matcher(bytes ? Kind::BytesGlob : Kind::StringGlob),
    parts_(std::move(parts)),
    re_(compileGlob(parts_))
{
}

bool
TextGlob::test(const Value& candidate) const
{
    bool bytes = kind_ == Kind::BytesGlob;
    if (bytes ? !candidate.isBytes() : !candidate.isString())
        return false;
    return std::regex_match(candidate.getString(), re_);
}

std::string
TextGlob::render() const
{
    std::string s;
    for (const MatcherPtr& p : parts_)
        s += p->render();
    return s;
}

bool
ValueGroup::test(const Value& candidate) const
{
    for (const MatcherPtr& alt : alternatives_)
        if (elementMatches(alt, candidate))
            return true;
    return false;
}

std::string
ValueGroup::render() const
{
    std::string s = "(";
    for (size_t i = 0; i < alternatives_.size(); ++i) {
        if (i)
            s += ", ";
        s += alternatives_[i]->render();
    }
    s += ')';
    return s;
}

} // namespace dt
