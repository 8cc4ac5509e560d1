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
#include "filter.h"
#include "match.h"
#include "path.h"
#include "recursive.h"
#include "segment.h"
#include "value.h"
#include <optional>
#include <string>
#include <vector>

// Constructors for operator chains. Each helper returns the shared,
// immutable object the engine consumes, so chains can be written inline:
//
//     dt::Path p({ ops::key("hello"), ops::key("there"), ops::slot(1) });
//
namespace dt {
namespace ops {

// ---- matchers -------------------------------------------------------------

MatcherPtr
word(const std::string& key);

// Quoted string literal, 'a.b'.
MatcherPtr
text(const std::string& value);

MatcherPtr
bytes(const std::string& value);

MatcherPtr
num(long long value);

// Integral doubles become ints, so 7.0 addresses the key 7.
MatcherPtr
num(double value);

// #'7.0': keeps float identity.
MatcherPtr
numq(double value);

MatcherPtr
boolean(bool value);

MatcherPtr
none();

MatcherPtr
wild(bool first = false);

MatcherPtr
regex(const std::string& source, bool first = false);

// Positional ($0) when `key` is an int, named ($(name)) otherwise.
MatcherPtr
subst(Value key, Transforms transforms = {});

// Key taken from the data: `depth` 0 is the root, 1 the current node,
// 2 its parent.
MatcherPtr
ref(Path path, int depth = 0);

MatcherPtr
concat(std::vector<ConcatPart> parts);

// Literal matcher for an arbitrary value, chosen by its kind.
MatcherPtr
lit(const Value& value);

MatcherPtr
glob(MatcherPtr pattern = nullptr,
     size_t min = 0,
     std::optional<size_t> max = std::nullopt);

MatcherPtr
seqOf(std::vector<MatcherPtr> elements, Flavour flavour = Flavour::Loose);

MatcherPtr
mapOf(std::vector<MappingEntry> entries, Flavour flavour = Flavour::Loose);

MatcherPtr
setOf(std::vector<MatcherPtr> elements, Flavour flavour = Flavour::Loose);

MatcherPtr
textGlob(std::vector<MatcherPtr> parts, bool bytes = false);

MatcherPtr
oneOf(std::vector<MatcherPtr> alternatives);

// ---- filters --------------------------------------------------------------

// Dotted field path; each name is a key part.
FilterKey
field(const std::vector<std::string>& names);

FilterPtr
where(FilterKey key, Pred pred, MatcherPtr value, Transforms transforms = {});

FilterPtr
where(const std::string& name, Pred pred, MatcherPtr value);

FilterPtr
filterAnd(Filters filters);

FilterPtr
filterOr(Filters filters);

FilterPtr
filterGroup(Filters filters);

FilterPtr
filterNot(FilterPtr filter);

FilterPtr
filterFirst(FilterPtr filter);

// ---- segments -------------------------------------------------------------

SegmentPtr
root(Filters filters = {});

SegmentPtr
key(const std::string& name, Filters filters = {});

SegmentPtr
key(long long index);

SegmentPtr
key(MatcherPtr matcher, Filters filters = {});

SegmentPtr
attr(const std::string& name);

SegmentPtr
attr(MatcherPtr matcher, Filters filters = {});

SegmentPtr
slot(long long index);

SegmentPtr
slot(MatcherPtr matcher, Filters filters = {});

SegmentPtr
slice(std::optional<long long> start = std::nullopt,
      std::optional<long long> stop = std::nullopt,
      std::optional<long long> step = std::nullopt);

SegmentPtr
sliceFilter(Filters filters);

SegmentPtr
append(bool unique = false);

SegmentPtr
invert();

SegmentPtr
recursive(MatcherPtr inner,
          DepthRange depth = {},
          Filters filters = {},
          bool first = false);

SegmentPtr
recursive(Branches accessors,
          DepthRange depth = {},
          Filters filters = {},
          bool first = false);

Branch
branch(std::vector<SegmentPtr> ops, Cut cut = Cut::None);

SegmentPtr
anyOf(Branches branches);

SegmentPtr
allOf(Branches branches);

SegmentPtr
firstOf(Branches branches);

SegmentPtr
noneOf(Branch branch);

SegmentPtr
nop(SegmentPtr inner);

SegmentPtr
guard(SegmentPtr inner, Pred pred, MatcherPtr value, Transforms transforms = {});

SegmentPtr
typed(SegmentPtr inner, std::vector<std::string> kinds, bool negate = false);

SegmentPtr
filtered(SegmentPtr inner, Filters filters);

} // namespace ops
} // namespace dt
