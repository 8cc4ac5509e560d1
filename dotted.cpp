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

#include "dotted.h"
#include "engine.h"
#include "recursive.h"

#include <algorithm>
#include <unordered_set>

namespace dt {

namespace {

const TransformRegistry&
registryOf(const Options& opts)
{
    return opts.registry ? *opts.registry : TransformRegistry::global();
}

Context
contextFor(const Value& root, const Path& path, const Options& opts)
{
    return makeContext(root, path.ops(), opts.strict, opts.registry);
}

void
requireResolved(const Path& path)
{
    if (path.isTemplate())
        throw TemplateError("Unresolved substitution in '" + path.assemble() + "'");
}

// Raw values the chain reaches, filtered by its top-level guard.
Values
reached(const Value& root, const Path& path, const Options& opts, bool stopAtFirst)
{
    requireResolved(path);
    Values out;
    walk(path.opList(), root, contextFor(root, path, opts), false, [&](Result& res) {
        if (!path.guardMatches(res.value))
            return true;
        out.push_back(std::move(res.value));
        return !stopAtFirst;
    });
    return out;
}

// Concrete paths whose value passes the top-level guard.
std::vector<Prefix>
guarded(const Value& root, const Path& path, const Context& ctx)
{
    std::vector<Prefix> out;
    walk(path.opList(), root, ctx, true, [&](Result& res) {
        if (path.guardMatches(res.value))
            out.push_back(std::move(res.path));
        return true;
    });
    return out;
}

Value
updateWith(Value root, const Path& path, const Payload& val, const Options& opts)
{
    requireResolved(path);
    if (!opts.mutate)
        root = root.deepCopy();
    Payload v = val;
    if (v && opts.applyTransforms)
        v = path.apply(*v, registryOf(opts));
    Context ctx = contextFor(root, path, opts);
    if (!path.guard())
        return updates(path.opList(), std::move(root), v, UpdateArgs(), ctx);
    for (Prefix& p : guarded(root, path, ctx))
        root = updates(OpList(std::move(p)), std::move(root), v, UpdateArgs(), ctx);
    return root;
}

// (concrete path, value) pairs of every match, first seen order.
template<typename Fn>
void
eachConcrete(const Value& root, const Path& path, const Options& opts, Fn fn)
{
    requireResolved(path);
    walk(path.opList(), root, contextFor(root, path, opts), true, [&](Result& res) {
        if (!path.guardMatches(res.value))
            return true;
        return fn(Path(std::move(res.path), path.transforms()), res.value);
    });
}

} // namespace

bool
isNotNull(const Value& value)
{
    return !value.isNull();
}

// ---- reads ----------------------------------------------------------------

Values
getAll(const Value& root, const Path& path, const Options& opts)
{
    Values vals = reached(root, path, opts, false);
    if (opts.applyTransforms && !path.transforms().empty())
        for (Value& v : vals)
            v = path.apply(v, registryOf(opts));
    return vals;
}

Value
get(const Value& root,
    const Path& path,
    const Value& dflt,
    const std::optional<Value>& patternDefault,
    const Options& opts)
{
    Values vals = getAll(root, path, opts);
    if (!path.isPattern())
        return vals.empty() ? dflt : vals.front();
    if (vals.empty())
        return patternDefault ? *patternDefault : Value::tuple();
    return Value::sequence(std::move(vals), Value::CopyOnWrite);
}

Values
getMulti(const Value& root, const std::vector<Path>& paths, const Options& opts)
{
    Values out;
    for (const Path& path : paths) {
        Values vals = getAll(root, path, opts);
        if (vals.empty())
            continue;
        if (path.isPattern())
            out.push_back(Value::sequence(std::move(vals), Value::CopyOnWrite));
        else
            out.push_back(std::move(vals.front()));
    }
    return out;
}

bool
has(const Value& root, const Path& path, const Options& opts)
{
    return !reached(root, path, opts, true).empty();
}

// ---- writes ---------------------------------------------------------------

Value
update(Value root, const Path& path, const Value& val, const Options& opts)
{
    return updateWith(std::move(root), path, val, opts);
}

Value
update(Value root, const Path& path, const Payload& val, const Options& opts)
{
    return updateWith(std::move(root), path, val, opts);
}

Value
updateIf(Value root,
         const Path& path,
         const Value& val,
         const ValuePred& pred,
         const Options& opts)
{
    if (!opts.mutate)
        root = root.deepCopy();
    if (pred && !pred(val))
        return root;
    Options in = opts;
    in.mutate = true;
    return updateWith(std::move(root), path, val, in);
}

Value
updateMulti(Value root, const PathValues& items, const Options& opts)
{
    if (!opts.mutate)
        root = root.deepCopy();
    Options in = opts;
    in.mutate = true;
    for (const PathValue& item : items)
        root = updateWith(std::move(root), item.first, item.second, in);
    return root;
}

Value
remove(Value root, const Path& path, const Payload& val, const Options& opts)
{
    requireResolved(path);
    if (!opts.mutate)
        root = root.deepCopy();
    Context ctx = contextFor(root, path, opts);
    if (!path.guard())
        return removes(path.opList(), std::move(root), val, false, ctx);
    std::vector<Prefix> found = guarded(root, path, ctx);
    // Later positions first so earlier indices stay valid.
    for (auto it = found.rbegin(); it != found.rend(); ++it)
        root = removes(OpList(std::move(*it)), std::move(root), val, false, ctx);
    return root;
}

Value
removeIf(Value root,
         const Path& path,
         const PathPred& pred,
         const Payload& val,
         const Options& opts)
{
    if (!opts.mutate)
        root = root.deepCopy();
    if (pred && !pred(path))
        return root;
    Options in = opts;
    in.mutate = true;
    return remove(std::move(root), path, val, in);
}

Value
removeMulti(Value root, const std::vector<Path>& paths, const Options& opts)
{
    if (!opts.mutate)
        root = root.deepCopy();
    Options in = opts;
    in.mutate = true;
    for (const Path& path : paths)
        root = remove(std::move(root), path, std::nullopt, in);
    return root;
}

Value
setdefault(Value& root, const Path& path, const Value& val, const Options& opts)
{
    if (has(root, path, opts))
        return get(root, path, Value(), std::nullopt, opts);
    root = update(std::move(root), path, val, opts);
    Options raw = opts;
    raw.applyTransforms = false;
    return get(root, path, Value(), std::nullopt, raw);
}

// ---- paths ----------------------------------------------------------------

std::vector<std::string>
expandMulti(const Value& root, const std::vector<Path>& paths, const Options& opts)
{
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const Path& path : paths) {
        eachConcrete(root, path, opts, [&](const Path& found, const Value&) {
            std::string s = found.assemble();
            if (seen.insert(s).second)
                out.push_back(std::move(s));
            return true;
        });
    }
    return out;
}

std::vector<std::string>
expand(const Value& root, const Path& path, const Options& opts)
{
    return expandMulti(root, { path }, opts);
}

Plucked
pluckMulti(const Value& root, const std::vector<Path>& paths, const Options& opts)
{
    Plucked out;
    std::unordered_set<std::string> seen;
    for (const Path& path : paths) {
        eachConcrete(root, path, opts, [&](const Path& found, const Value& value) {
            std::string s = found.assemble();
            if (seen.insert(s).second)
                out.emplace_back(std::move(s), value);
            return true;
        });
    }
    return out;
}

Plucked
pluck(const Value& root, const Path& path, const Options& opts)
{
    return pluckMulti(root, { path }, opts);
}

void
walk(const Value& root,
     const Path& path,
     const std::function<bool(const Path&, const Value&)>& visit,
     const Options& opts)
{
    eachConcrete(root, path, opts, visit);
}

Value
buildMulti(Value root, const std::vector<Path>& paths, const Options& opts)
{
    if (!opts.mutate)
        root = root.deepCopy();
    for (const Path& path : paths) {
        requireResolved(path);
        Value built = build(path.opList(), root, contextFor(root, path, opts));
        PathValues found;
        walk(path.opList(), built, contextFor(built, path, opts), true, [&](Result& res) {
            found.emplace_back(Path(std::move(res.path)), std::move(res.value));
            return true;
        });
        for (PathValue& item : found) {
            Context ctx = contextFor(root, item.first, opts);
            root = updates(item.first.opList(), std::move(root), item.second, UpdateArgs(), ctx);
        }
    }
    return root;
}

Value
build(Value root, const Path& path, const Options& opts)
{
    return buildMulti(std::move(root), { path }, opts);
}

Value
applyMulti(Value root, const std::vector<Path>& paths, const Options& opts)
{
    if (!opts.mutate)
        root = root.deepCopy();
    std::unordered_set<std::string> seen;
    for (const Path& path : paths) {
        std::vector<Path> found;
        eachConcrete(root, path, opts, [&](const Path& p, const Value&) {
            if (seen.insert(p.assemble()).second)
                found.push_back(p);
            return true;
        });
        for (const Path& p : found) {
            Context ctx = contextFor(root, p, opts);
            Value cur;
            if (!first(p.opList(), root, ctx, cur))
                continue;
            Payload v = p.apply(cur, registryOf(opts));
            root = updates(p.opList(), std::move(root), v, UpdateArgs(), ctx);
        }
    }
    return root;
}

Value
apply(Value root, const Path& path, const Options& opts)
{
    return applyMulti(std::move(root), { path }, opts);
}

// Leaf containers are reached by recursing through mapping keys (or, on
// anything else that is not text, sequence slots) down to the parents of
// leaves, whose items are then taken whole. Whatever those paths do not
// cover is taken from the first level.
static const Path&
unpackPath()
{
    static const Path kUnpack = [] {
        using namespace ops;
        Branches accessors{ branch({ key(wild()) }, Cut::Hard),
                            branch({ typed(slot(wild()), { "str", "bytes" }, true) }) };
        auto leaves = [] {
            return anyOf({ branch({ key(wild()) }), branch({ slice() }) });
        };
        DepthRange parents;
        parents.start = -2;
        return Path({ anyOf({ branch({ recursive(accessors, parents), leaves() }, Cut::Soft),
                              branch({ leaves() }) }) });
    }();
    return kUnpack;
}

Plucked
unpack(const Value& root, const Options& opts)
{
    return pluck(root, unpackPath(), opts);
}

// ---- matching -------------------------------------------------------------

static std::optional<Values>
matchOps(const std::vector<SegmentPtr>& pats,
         size_t pi,
         const std::vector<SegmentPtr>& keys,
         size_t ki,
         bool partial)
{
    if (pi == pats.size()) {
        if (ki == keys.size() || partial)
            return Values();
        return std::nullopt;
    }
    auto rec = dynamic_cast<const RecursiveSegment*>(pats[pi]->unwrap());
    if (!rec) {
        if (ki == keys.size())
            return std::nullopt;
        std::optional<Values> m = pats[pi]->match(*keys[ki], true);
        if (!m)
            return std::nullopt;
        std::optional<Values> rest = matchOps(pats, pi + 1, keys, ki + 1, partial);
        if (!rest)
            return std::nullopt;
        m->insert(m->end(), rest->begin(), rest->end());
        return m;
    }
    // A recursive segment takes one or more key segments, as few as
    // possible, and stops extending at the first one it would not follow.
    for (size_t n = 1; ki + n <= keys.size(); ++n) {
        if (!rec->consumes(*keys[ki + n - 1]))
            break;
        std::optional<Values> rest = matchOps(pats, pi + 1, keys, ki + n, partial);
        if (!rest)
            continue;
        Values res;
        for (size_t j = ki; j < ki + n; ++j)
            res.push_back(Value(keys[j]->render(true)));
        res.insert(res.end(), rest->begin(), rest->end());
        return res;
    }
    return std::nullopt;
}

std::optional<std::pair<std::string, Values>>
matchGroups(const Path& pattern, const Path& path, bool partial)
{
    const std::vector<SegmentPtr>& pats = pattern.ops();
    const std::vector<SegmentPtr>& keys = path.ops();
    std::string key = path.assemble();

    bool recursive = std::any_of(pats.begin(), pats.end(), [](const SegmentPtr& op) {
        return op->isRecursive();
    });
    if (recursive) {
        std::optional<Values> groups = matchOps(pats, 0, keys, 0, partial);
        if (!groups)
            return std::nullopt;
        return std::make_pair(key, std::move(*groups));
    }

    size_t n = std::min(pats.size(), keys.size());
    if (n == 0) {
        if (pats.size() == keys.size())
            return std::make_pair(key, Values());
        return std::nullopt;
    }
    Values groups;
    for (size_t i = 0; i < n; ++i) {
        std::optional<Values> m = pats[i]->match(*keys[i], true);
        if (!m)
            return std::nullopt;
        groups.insert(groups.end(), m->begin(), m->end());
    }
    if (pats.size() == keys.size())
        return std::make_pair(key, std::move(groups));
    if (!partial || pats.size() > keys.size())
        return std::nullopt;
    // The last group takes the rest of the path.
    Value rest(assemble(keys, n - 1));
    if (groups.empty())
        groups.push_back(std::move(rest));
    else
        groups.back() = std::move(rest);
    return std::make_pair(key, std::move(groups));
}

std::optional<std::string>
match(const Path& pattern, const Path& path, bool partial)
{
    auto res = matchGroups(pattern, path, partial);
    if (!res)
        return std::nullopt;
    return res->first;
}

bool
overlaps(const Path& a, const Path& b)
{
    return pathOverlaps({ a.ops() }, b.ops());
}

// ---- cache ----------------------------------------------------------------

const Path&
PathCache::get(const std::string& source, const Compiler& compile)
{
    const uint64_t now = ++clock_;
    auto it = cache_.find(source);
    if (it != cache_.end()) {
        it->second.lastUsedTick = now;
        return it->second.path;
    }
    CacheEntry entry;
    entry.path = compile(source);
    entry.lastUsedTick = now;
    auto [insertedIt, inserted] = cache_.emplace(source, std::move(entry));
    if (cache_.size() > kMaxEntries)
        evictOldest();
    return insertedIt->second.path;
}

void
PathCache::evictOldest()
{
    auto oldestIt = cache_.end();
    for (auto it = cache_.begin(); it != cache_.end(); ++it) {
        if (oldestIt == cache_.end() ||
            it->second.lastUsedTick < oldestIt->second.lastUsedTick)
            oldestIt = it;
    }
    if (oldestIt != cache_.end())
        cache_.erase(oldestIt);
}

PathCache&
getThreadLocalCache()
{
    thread_local PathCache cache;
    return cache;
}

} // namespace dt
