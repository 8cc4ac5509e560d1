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
#include "builder.h"
#include "error.h"
#include "path.h"
#include "segment.h"
#include "transform.h"
#include "value.h"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dt {

// Call scoped settings.
struct Options
{
    // Disables the key / index fallbacks between mappings and sequences.
    bool strict = false;

    // When false, mutations work on a deep copy and the caller's root is
    // left untouched.
    bool mutate = true;

    // Run the chain's transforms on values read (get) and written (update).
    bool applyTransforms = true;

    // Transform table; null selects TransformRegistry::global().
    const TransformRegistry* registry = nullptr;
};

using ValuePred = std::function<bool(const Value&)>;
using PathPred = std::function<bool(const Path&)>;
using Plucked = std::vector<std::pair<std::string, Value>>;
using PathValue = std::pair<Path, Value>;
using PathValues = std::vector<PathValue>;

// Default predicate of updateIf(): skips null values.
bool
isNotNull(const Value& value);

// The single value at a concrete path, or `dflt`. For a pattern, a tuple of
// every match, or `patternDefault` (an empty tuple unless given) when
// nothing matched.
Value
get(const Value& root,
    const Path& path,
    const Value& dflt = Value(),
    const std::optional<Value>& patternDefault = std::nullopt,
    const Options& opts = {});

// Every value the chain reaches, transforms applied.
Values
getAll(const Value& root, const Path& path, const Options& opts = {});

// Values of each path in turn, skipping paths that matched nothing.
Values
getMulti(const Value& root, const std::vector<Path>& paths, const Options& opts = {});

bool
has(const Value& root, const Path& path, const Options& opts = {});

// Stores `val` at every location the chain matches, building missing
// containers on the way. Returns the root, which is a new value whenever a
// copy-on-write container had to be rebuilt.
Value
update(Value root, const Path& path, const Value& val, const Options& opts = {});

// Update with an explicit payload. An empty payload stores each segment's
// default, and through an inverted chain removes whatever is there.
Value
update(Value root, const Path& path, const Payload& val, const Options& opts = {});

// update() when `pred(val)` holds; a null predicate always updates.
Value
updateIf(Value root,
         const Path& path,
         const Value& val,
         const ValuePred& pred = isNotNull,
         const Options& opts = {});

Value
updateMulti(Value root, const PathValues& items, const Options& opts = {});

// Removes every match, or only matches equal to `val` when one is given.
// Absent paths are not an error.
Value
remove(Value root,
       const Path& path,
       const Payload& val = std::nullopt,
       const Options& opts = {});

// remove() when `pred(path)` holds.
Value
removeIf(Value root,
         const Path& path,
         const PathPred& pred,
         const Payload& val = std::nullopt,
         const Options& opts = {});

Value
removeMulti(Value root, const std::vector<Path>& paths, const Options& opts = {});

// Existing value at `path`, or `val` after storing it. `root` is rebound
// when a copy-on-write container had to be rebuilt.
Value
setdefault(Value& root, const Path& path, const Value& val, const Options& opts = {});

// Dotted notation of every concrete path the chain matches, first seen
// order, without duplicates.
std::vector<std::string>
expand(const Value& root, const Path& path, const Options& opts = {});

std::vector<std::string>
expandMulti(const Value& root,
            const std::vector<Path>& paths,
            const Options& opts = {});

// (dotted path, value) of every match.
Plucked
pluck(const Value& root, const Path& path, const Options& opts = {});

Plucked
pluckMulti(const Value& root,
           const std::vector<Path>& paths,
           const Options& opts = {});

// Visits (concrete path, value) pairs in traversal order until `visit`
// returns false or a cut ends the enumeration.
void
walk(const Value& root,
     const Path& path,
     const std::function<bool(const Path&, const Value&)>& visit,
     const Options& opts = {});

// Fresh structure holding copies of what the chain matches; defaults where
// nothing did. The result is merged into `root`.
Value
build(Value root, const Path& path, const Options& opts = {});

Value
buildMulti(Value root, const std::vector<Path>& paths, const Options& opts = {});

// Rewrites every match with its transformed value.
Value
apply(Value root, const Path& path, const Options& opts = {});

Value
applyMulti(Value root, const std::vector<Path>& paths, const Options& opts = {});

// Normal form: (path, leaf value) pairs that rebuild `root` when replayed
// through updateMulti().
Plucked
unpack(const Value& root, const Options& opts = {});

// Matches a pattern chain against another chain without any data. Returns
// the dotted form of `path` when it matches. With `partial`, a shorter
// pattern matches a longer path, its last group taking the remainder.
std::optional<std::string>
match(const Path& pattern, const Path& path, bool partial = true);

// As match(), also returning the matched groups.
std::optional<std::pair<std::string, Values>>
matchGroups(const Path& pattern, const Path& path, bool partial = true);

// True when one path is a prefix of the other.
bool
overlaps(const Path& a, const Path& b);

// Compiled chains keyed by their source text, least recently used evicted
// first.
class PathCache
{
  public:
    using Compiler = std::function<Path(const std::string& source)>;

    static constexpr size_t kMaxEntries = 300;

    const Path& get(const std::string& source, const Compiler& compile);

    size_t size() const
    {
        return cache_.size();
    }

    void clear()
    {
        cache_.clear();
    }

  private:
    struct CacheEntry
    {
        Path path;
        uint64_t lastUsedTick = 0;
    };

    std::unordered_map<std::string, CacheEntry> cache_;
    uint64_t clock_ = 0;

    void evictOldest();
};

PathCache&
getThreadLocalCache();

} // namespace dt
