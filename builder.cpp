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

#include "builder.h"
#include "access.h"
#include "error.h"
#include "group.h"
#include "wrap.h"

#include <cmath>

namespace dt {
namespace ops {

MatcherPtr
word(const std::string& key)
{
    return std::make_shared<ConstMatcher>(Matcher::Kind::Word, Value(key));
}

MatcherPtr
text(const std::string& value)
{
    return std::make_shared<ConstMatcher>(Matcher::Kind::String, Value(value));
}

MatcherPtr
bytes(const std::string& value)
{
    return std::make_shared<ConstMatcher>(Matcher::Kind::Bytes, Value::bytes(value));
}

MatcherPtr
num(long long value)
{
    return std::make_shared<ConstMatcher>(Matcher::Kind::Numeric, Value(value));
}

MatcherPtr
num(double value)
{
    if (std::isfinite(value) && value == std::floor(value) &&
        std::fabs(value) < 9.2e18)
        return num(static_cast<long long>(value));
    return std::make_shared<ConstMatcher>(Matcher::Kind::Numeric, Value(value));
}

MatcherPtr
numq(double value)
{
    return std::make_shared<ConstMatcher>(Matcher::Kind::NumericQuoted, Value(value));
}

MatcherPtr
boolean(bool value)
{
    return std::make_shared<ConstMatcher>(Matcher::Kind::Boolean, Value(value));
}

MatcherPtr
none()
{
    return std::make_shared<NullMatcher>();
}

MatcherPtr
wild(bool first)
{
    return std::make_shared<WildcardMatcher>(first);
}

MatcherPtr
regex(const std::string& source, bool first)
{
    return std::make_shared<RegexMatcher>(source, first);
}

MatcherPtr
subst(Value key, Transforms transforms)
{
    return std::make_shared<SubstMatcher>(std::move(key), std::move(transforms));
}

MatcherPtr
ref(Path path, int depth)
{
    return std::make_shared<ReferenceMatcher>(
      std::make_shared<const Path>(std::move(path)), depth);
}

MatcherPtr
concat(std::vector<ConcatPart> parts)
{
    return std::make_shared<ConcatMatcher>(std::move(parts));
}

MatcherPtr
lit(const Value& value)
{
    switch (value.getType()) {
        case Value::Null:
            return none();
        case Value::Bool:
            return boolean(value.getBool());
        case Value::Int:
            return num(value.getInt());
        case Value::Float:
            return num(value.getFloat());
        case Value::String:
            return text(value.getString());
        case Value::Bytes:
            return bytes(value.getString());
        default:
            return std::make_shared<ConstMatcher>(Matcher::Kind::Const, value);
    }
}

MatcherPtr
glob(MatcherPtr pattern, size_t min, std::optional<size_t> max)
{
    return std::make_shared<GlobMatcher>(std::move(pattern), min, max);
}

MatcherPtr
seqOf(std::vector<MatcherPtr> elements, Flavour flavour)
{
    return std::make_shared<SequencePattern>(std::move(elements), flavour);
}

MatcherPtr
mapOf(std::vector<MappingEntry> entries, Flavour flavour)
{
    return std::make_shared<MappingPattern>(std::move(entries), flavour);
}

MatcherPtr
setOf(std::vector<MatcherPtr> elements, Flavour flavour)
{
    return std::make_shared<SetPattern>(std::move(elements), flavour);
}

MatcherPtr
textGlob(std::vector<MatcherPtr> parts, bool bytes)
{
    return std::make_shared<TextGlob>(std::move(parts), bytes);
}

MatcherPtr
oneOf(std::vector<MatcherPtr> alternatives)
{
    return std::make_shared<ValueGroup>(std::move(alternatives));
}

FilterKey
field(const std::vector<std::string>& names)
{
    std::vector<FilterKeyPart> parts;
    for (const std::string& name : names)
        parts.push_back(FilterKeyPart{ word(name), nullptr });
    return FilterKey(std::move(parts));
}

FilterPtr
where(FilterKey key, Pred pred, MatcherPtr value, Transforms transforms)
{
    return std::make_shared<KeyValueFilter>(
      std::move(key), pred, std::move(value), std::move(transforms));
}

FilterPtr
where(const std::string& name, Pred pred, MatcherPtr value)
{
    return where(field({ name }), pred, std::move(value));
}

FilterPtr
filterAnd(Filters filters)
{
    return std::make_shared<CompoundFilter>(Filter::Kind::And, std::move(filters));
}

FilterPtr
filterOr(Filters filters)
{
    return std::make_shared<CompoundFilter>(Filter::Kind::Or, std::move(filters));
}

FilterPtr
filterGroup(Filters filters)
{
    return std::make_shared<CompoundFilter>(Filter::Kind::Group, std::move(filters));
}

FilterPtr
filterNot(FilterPtr filter)
{
    return std::make_shared<CompoundFilter>(Filter::Kind::Not,
                                            Filters{ std::move(filter) });
}

FilterPtr
filterFirst(FilterPtr filter)
{
    return std::make_shared<CompoundFilter>(Filter::Kind::First,
                                            Filters{ std::move(filter) });
}

SegmentPtr
root(Filters filters)
{
    return std::make_shared<EmptySegment>(std::move(filters));
}

SegmentPtr
key(const std::string& name, Filters filters)
{
    return key(word(name), std::move(filters));
}

SegmentPtr
key(long long index)
{
    return key(num(index));
}

SegmentPtr
key(MatcherPtr matcher, Filters filters)
{
    return std::make_shared<KeySegment>(std::move(matcher), std::move(filters));
}

SegmentPtr
attr(const std::string& name)
{
    return attr(word(name));
}

SegmentPtr
attr(MatcherPtr matcher, Filters filters)
{
    return std::make_shared<AttrSegment>(std::move(matcher), std::move(filters));
}

SegmentPtr
slot(long long index)
{
    return slot(num(index));
}

SegmentPtr
slot(MatcherPtr matcher, Filters filters)
{
    return std::make_shared<SlotSegment>(std::move(matcher), std::move(filters));
}

SegmentPtr
slice(std::optional<long long> start,
      std::optional<long long> stop,
      std::optional<long long> step)
{
    return std::make_shared<SliceSegment>(start, stop, step);
}

SegmentPtr
sliceFilter(Filters filters)
{
    return std::make_shared<SliceFilterSegment>(std::move(filters));
}

SegmentPtr
append(bool unique)
{
    return std::make_shared<AppenderSegment>(unique);
}

SegmentPtr
invert()
{
    return std::make_shared<InvertSegment>();
}

SegmentPtr
recursive(MatcherPtr inner, DepthRange depth, Filters filters, bool first)
{
    return std::make_shared<RecursiveSegment>(
      std::move(inner), depth, std::move(filters), first);
}

SegmentPtr
recursive(Branches accessors, DepthRange depth, Filters filters, bool first)
{
    return std::make_shared<RecursiveSegment>(
      std::move(accessors), depth, std::move(filters), first);
}

Branch
branch(std::vector<SegmentPtr> ops, Cut cut)
{
    Branch b;
    b.ops = std::move(ops);
    b.cut = cut;
    return b;
}

SegmentPtr
anyOf(Branches branches)
{
    return std::make_shared<OrGroup>(std::move(branches));
}

SegmentPtr
allOf(Branches branches)
{
    return std::make_shared<AndGroup>(std::move(branches));
}

SegmentPtr
firstOf(Branches branches)
{
    return std::make_shared<FirstGroup>(std::move(branches));
}

SegmentPtr
noneOf(Branch branch)
{
    return std::make_shared<NotGroup>(std::move(branch));
}

SegmentPtr
nop(SegmentPtr inner)
{
    return std::make_shared<NopWrap>(std::move(inner));
}

SegmentPtr
guard(SegmentPtr inner, Pred pred, MatcherPtr value, Transforms transforms)
{
    return std::make_shared<ValueGuard>(
      std::move(inner), pred, std::move(value), std::move(transforms));
}

SegmentPtr
typed(SegmentPtr inner, std::vector<std::string> kinds, bool negate)
{
    for (const std::string& kind : kinds)
        if (!isKnownKind(kind))
            throw Error("Unknown type restriction '" + kind + "'");
    return std::make_shared<TypeRestriction>(std::move(inner), std::move(kinds), negate);
}

SegmentPtr
filtered(SegmentPtr inner, Filters filters)
{
    return std::make_shared<FilterWrap>(std::move(inner), std::move(filters));
}

} // namespace ops
} // namespace dt
