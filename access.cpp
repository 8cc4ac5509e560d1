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

#include "access.h"
#include "engine.h"
#include "error.h"
#include "path.h"

#include <algorithm>

namespace dt {

static bool
isIndexable(const Value& node)
{
    return node.isSequence() || node.isString() || node.isBytes();
}

static bool
indexOf(const Value& key, size_t size, size_t& out)
{
    if (!key.isInt())
        return false;
    long long i = key.getInt();
    if (i < 0)
        i += static_cast<long long>(size);
    if (i < 0 || i >= static_cast<long long>(size))
        return false;
    out = static_cast<size_t>(i);
    return true;
}

static Value
elementAt(const Value& node, size_t i)
{
    if (node.isSequence())
        return node.getItems()[i];
    if (node.isBytes())
        return Value(static_cast<long long>(static_cast<unsigned char>(node.getString()[i])));
    return Value(node.getString().substr(i, 1));
}

static Value
sameKind(const Value& like, Value::Items items)
{
    if (like.isSet())
        return Value::set(std::move(items), like.getMutability());
    return Value::sequence(std::move(items), like.getMutability());
}

static Value
sameText(const Value& like, const std::string& text)
{
    return like.isBytes() ? Value::bytes(text) : Value(text);
}

static Value
appendItem(Value node, const Value& val)
{
    if (node.isString() || node.isBytes()) {
        if (val.getType() != node.getType())
            throw TypeError("Cannot append " + kindName(val) + " to " +
                            kindName(node));
        return sameText(node, node.getString() + val.getString());
    }
    if (node.isSet() && node.containsItem(val))
        return node;
    if (!node.isSequence() && !node.isSet())
        throw TypeError("Cannot append to " + kindName(node));
    if (node.isMutable()) {
        node.getItems().push_back(val);
        return node;
    }
    Value::Items items = node.getItems();
    items.push_back(val);
    return sameKind(node, std::move(items));
}

// Sets position `key`, appending when it lies past the end.
static Value
setIndex(Value node, const Value& key, const Value& val)
{
    if (!isIndexable(node))
        throw TypeError("Cannot set index " + key.toString() + " on " +
                        kindName(node));
    if (!key.isInt())
        throw TypeError(kindName(node) + " indices must be integers, not " +
                        kindName(key));
    size_t size = node.size();
    if (key.getInt() >= static_cast<long long>(size))
        return appendItem(node, val);
    size_t i;
    if (!indexOf(key, size, i))
        return node;
    if (!node.isSequence()) {
        if (val.getType() != node.getType())
            throw TypeError("Cannot store " + kindName(val) + " in " +
                            kindName(node));
        std::string s = node.getString();
        s.replace(i, 1, val.getString());
        return sameText(node, s);
    }
    if (node.isMutable()) {
        node.getItems()[i] = val;
        return node;
    }
    Value::Items items = node.getItems();
    items[i] = val;
    return sameKind(node, std::move(items));
}

// Drops the positions in `idx`, which must be sorted and unique.
static Value
eraseIndices(Value node, const std::vector<size_t>& idx)
{
    if (idx.empty())
        return node;
    if (node.isString() || node.isBytes()) {
        std::string s;
        const std::string& src = node.getString();
        for (size_t i = 0, j = 0; i < src.size(); ++i) {
            if (j < idx.size() && idx[j] == i) {
                ++j;
                continue;
            }
            s += src[i];
        }
        return sameText(node, s);
    }
    if (!node.isSequence() && !node.isSet())
        return node;
    if (node.isMutable()) {
        Value::Items& items = node.getItems();
        for (auto it = idx.rbegin(); it != idx.rend(); ++it)
            if (*it < items.size())
                items.erase(items.begin() + *it);
        return node;
    }
    Value::Items items;
    const Value::Items& src = node.getItems();
    for (size_t i = 0, j = 0; i < src.size(); ++i) {
        if (j < idx.size() && idx[j] == i) {
            ++j;
            continue;
        }
        items.push_back(src[i]);
    }
    return sameKind(node, std::move(items));
}

static Value
setEntry(Value node, const Value& key, const Value& val)
{
    Value::Entries copy;
    Value::Entries& entries = node.isMutable() ? node.getEntries() : copy;
    if (!node.isMutable())
        copy = node.getEntries();
    bool found = false;
    for (Value::Entry& e : entries) {
        if (e.first == key) {
            e.second = val;
            found = true;
            break;
        }
    }
    if (!found)
        entries.emplace_back(key, val);
    if (node.isMutable())
        return node;
    return Value::mapping(std::move(copy), Value::CopyOnWrite);
}

static Value
eraseEntry(Value node, const Value& key)
{
    if (!node.contains(key))
        return node;
    if (node.isMutable()) {
        Value::Entries& entries = node.getEntries();
        for (auto it = entries.begin(); it != entries.end(); ++it) {
            if (it->first == key) {
                entries.erase(it);
                break;
            }
        }
        return node;
    }
    Value::Entries entries;
    for (const Value::Entry& e : node.getEntries())
        if (!(e.first == key))
            entries.push_back(e);
    return Value::mapping(std::move(entries), Value::CopyOnWrite);
}

static Value
setField(Value node, const std::string& name, const Value& val)
{
    std::vector<Value::Field> copy;
    std::vector<Value::Field>& fields =
      node.isMutable() ? node.getRecord().fields : copy;
    if (!node.isMutable())
        copy = node.getRecord().fields;
    bool found = false;
    for (Value::Field& f : fields) {
        if (f.first == name) {
            f.second = val;
            found = true;
            break;
        }
    }
    if (!found)
        fields.emplace_back(name, val);
    if (node.isMutable())
        return node;
    return Value::record(node.getRecord().name, std::move(copy), Value::CopyOnWrite);
}

static Value
eraseField(Value node, const std::string& name)
{
    if (!node.findField(name))
        return node;
    std::vector<Value::Field> fields;
    for (const Value::Field& f : node.getRecord().fields)
        if (f.first != name)
            fields.push_back(f);
    if (node.isMutable()) {
        node.getRecord().fields = std::move(fields);
        return node;
    }
    return Value::record(node.getRecord().name, std::move(fields), Value::CopyOnWrite);
}

static Children
indexChildren(const Value& node)
{
    Children all;
    for (size_t i = 0; i < node.size(); ++i)
        all.push_back(Child{ Value(static_cast<long long>(i)), elementAt(node, i) });
    return all;
}

static Children
entryChildren(const Value& node)
{
    Children all;
    for (const Value::Entry& e : node.getEntries())
        all.push_back(Child{ e.first, e.second });
    return all;
}

static MatcherPtr
numeric(const Value& key, Matcher::Kind kind = Matcher::Kind::Numeric)
{
    return std::make_shared<ConstMatcher>(kind, key);
}

// ---- Empty ----------------------------------------------------------------

Children
EmptySegment::items(const Value& node, const Context& ctx, bool filtered) const
{
    if (filtered && !passesFilters(filters_, node, ctx.transforms()))
        return {};
    return Children{ Child{ Value(""), node } };
}

SegmentPtr
EmptySegment::concrete(const Value&) const
{
    static const SegmentPtr kEmpty = std::make_shared<EmptySegment>();
    return kEmpty;
}

Value
EmptySegment::update(Value, const Value&, const Payload& val) const
{
    return val ? *val : Value();
}

Value
EmptySegment::upsert(Value, const Payload& val, const Context&) const
{
    return val ? *val : Value();
}

Value
EmptySegment::pop(Value, const Value&) const
{
    return Value();
}

Value
EmptySegment::remove(Value node, const Payload& val, const Context&) const
{
    if (!val || node == *val)
        return Value();
    return node;
}

std::optional<Values>
EmptySegment::match(const Segment& other, bool) const
{
    if (other.kind() != Kind::Empty)
        return std::nullopt;
    const EmptySegment& o = static_cast<const EmptySegment&>(other);
    Values res{ Value("") };
    for (size_t i = 0; i < filters_.size() && i < o.filters_.size(); ++i) {
        std::optional<std::string> m;
        if (filters_[i]->matchable(*o.filters_[i]))
            m = filters_[i]->match(*o.filters_[i]);
        if (!m)
            return std::nullopt;
        res.push_back(Value(*m));
    }
    return res;
}

std::string
EmptySegment::render(bool) const
{
    return renderFilters(filters_);
}

// ---- Key ------------------------------------------------------------------

Children
KeySegment::selectChildren(Children children,
                           const Context& ctx,
                           bool filtered) const
{
    if (!filtered || filters_.empty() || children.empty())
        return children;
    Values vals;
    for (const Child& c : children)
        vals.push_back(c.value);
    Children res;
    for (size_t i : selectFiltered(filters_, vals, ctx.transforms()))
        res.push_back(children[i]);
    return res;
}

Children
KeySegment::matchChildren(Children all,
                          const Value& node,
                          const Context& ctx,
                          bool filtered) const
{
    if (!filtered)
        return all;
    Children res;
    if (matcher_->isReference()) {
        Value key;
        if (matcher_->resolveRef(ctx, node, key))
            for (Child& c : all)
                if (c.key == key)
                    res.push_back(std::move(c));
    } else if (matcher_->isConst()) {
        Value key = matcher_->value();
        for (Child& c : all) {
            if (c.key == key) {
                res.push_back(std::move(c));
                break;
            }
        }
    } else {
        Values keys;
        for (const Child& c : all)
            keys.push_back(c.key);
        Values matched = matcher_->matches(keys);
        size_t j = 0;
        for (Child& c : all) {
            if (j < matched.size() && matched[j] == c.key) {
                res.push_back(std::move(c));
                ++j;
            }
        }
    }
    return selectChildren(std::move(res), ctx, true);
}

Children
KeySegment::items(const Value& node, const Context& ctx, bool filtered) const
{
    if (node.isMapping())
        return matchChildren(entryChildren(node), node, ctx, filtered);
    if (ctx.strict || !isIndexable(node) || !matcher_->isConst())
        return {};
    Value key = matcher_->value();
    if (!key.isInt())
        return {};
    if (!filtered)
        return indexChildren(node);
    size_t i;
    if (!indexOf(key, node.size(), i))
        return {};
    return Children{ Child{ key, elementAt(node, i) } };
}

SegmentPtr
KeySegment::concrete(const Value& key) const
{
    if (key.isInt() || key.isFloat())
        return std::make_shared<KeySegment>(
          numeric(key, Matcher::Kind::NumericQuoted));
    return std::make_shared<KeySegment>(
      std::make_shared<ConstMatcher>(Matcher::Kind::Word, key));
}

Value
KeySegment::defaultValue() const
{
    if (isPattern())
        return Value::mapping();
    Value child = filters_.empty() ? Value() : Value::mapping();
    return Value::mapping({ Value::Entry(matcher_->value(), child) });
}

Value
KeySegment::update(Value node, const Value& key, const Payload& val) const
{
    Value v = val ? *val : defaultValue();
    if (node.isMapping())
        return setEntry(node, key, v);
    if (isIndexable(node))
        return setIndex(node, key, v);
    throw TypeError("Cannot set key " + quote(key) + " on " + kindName(node));
}

bool
KeySegment::upsertKeys(const Value& node, const Context& ctx, Values& keys) const
{
    if (matcher_->isReference()) {
        Value key;
        if (!matcher_->resolveRef(ctx, node, key))
            return false;
        keys.push_back(key);
        return true;
    }
    if (!isPattern()) {
        keys.push_back(matcher_->value());
        return true;
    }
    for (Child& c : items(node, ctx))
        keys.push_back(std::move(c.key));
    return true;
}

Value
KeySegment::upsert(Value node, const Payload& val, const Context& ctx) const
{
    Values keys;
    if (!upsertKeys(node, ctx, keys))
        return node;
    for (const Value& key : keys)
        node = update(node, key, val);
    return node;
}

Value
KeySegment::pop(Value node, const Value& key) const
{
    if (node.isMapping())
        return eraseEntry(node, key);
    size_t i;
    if (isIndexable(node) && indexOf(key, node.size(), i))
        return eraseIndices(node, { i });
    return node;
}

std::optional<Values>
KeySegment::match(const Segment& other, bool specials) const
{
    if (other.kind() != kind_)
        return std::nullopt;
    const KeySegment& o = static_cast<const KeySegment&>(other);
    if (!matcher_->matchable(*o.matcher_, specials))
        return std::nullopt;
    Values res;
    for (size_t i = 0; i < filters_.size() && i < o.filters_.size(); ++i) {
        if (!filters_[i]->matchable(*o.filters_[i]))
            return std::nullopt;
        std::optional<std::string> m = filters_[i]->match(*o.filters_[i]);
        if (!m)
            return std::nullopt;
        res.push_back(Value(*m));
    }
    Values found = matcher_->matches(Values{ o.matcher_->value() });
    if (found.empty())
        return std::nullopt;
    res.push_back(found.front());
    return res;
}

std::string
KeySegment::renderKey(bool slot) const
{
    std::string q;
    Matcher::Kind kind = matcher_->kind();
    if (kind == Matcher::Kind::Word || kind == Matcher::Kind::String)
        q = normalize(matcher_->value(), !slot);
    else
        q = matcher_->render();
    if (!filters_.empty())
        q += "&" + renderFilters(filters_);
    return q;
}

std::string
KeySegment::render(bool top) const
{
    std::string q = renderKey(false);
    return top ? q : "." + q;
}

SegmentPtr
KeySegment::resolve(const Value& bindings, bool partial) const
{
    MatcherPtr m = matcher_->resolve(bindings, partial);
    return m ? rebind(std::move(m)) : nullptr;
}

SegmentPtr
KeySegment::rebind(MatcherPtr matcher) const
{
    return std::make_shared<KeySegment>(std::move(matcher), filters_);
}

// ---- Attr -----------------------------------------------------------------

Children
AttrSegment::items(const Value& node, const Context& ctx, bool filtered) const
{
    if (!node.isRecord())
        return {};
    Children all;
    for (const Value::Field& f : node.getRecord().fields)
        all.push_back(Child{ Value(f.first), f.second });
    return matchChildren(std::move(all), node, ctx, filtered);
}

SegmentPtr
AttrSegment::concrete(const Value& key) const
{
    return std::make_shared<AttrSegment>(
      std::make_shared<ConstMatcher>(Matcher::Kind::Word, key));
}

Value
AttrSegment::defaultValue() const
{
    Value res = Value::record("Namespace");
    if (isPattern())
        return res;
    Value child = filters_.empty() ? Value() : Value::record("Namespace");
    res.getRecord().fields.emplace_back(matcher_->value().str(), child);
    return res;
}

Value
AttrSegment::update(Value node, const Value& key, const Payload& val) const
{
    if (!node.isRecord())
        throw TypeError("Cannot set attribute " + quote(key) + " on " +
                        kindName(node));
    return setField(node, key.str(), val ? *val : defaultValue());
}

Value
AttrSegment::pop(Value node, const Value& key) const
{
    if (!node.isRecord())
        return node;
    return eraseField(node, key.str());
}

std::string
AttrSegment::render(bool) const
{
    return "@" + renderKey(false);
}

SegmentPtr
AttrSegment::rebind(MatcherPtr matcher) const
{
    return std::make_shared<AttrSegment>(std::move(matcher), filters_);
}

// ---- Slot -----------------------------------------------------------------

bool
SlotSegment::isIndex() const
{
    Matcher::Kind kind = matcher_->kind();
    return (kind == Matcher::Kind::Numeric ||
            kind == Matcher::Kind::NumericQuoted) &&
           matcher_->value().isInt();
}

Children
SlotSegment::items(const Value& node, const Context& ctx, bool filtered) const
{
    if (node.isMapping()) {
        if (ctx.strict)
            return {};
        return matchChildren(entryChildren(node), node, ctx, filtered);
    }
    if (!isIndexable(node))
        return {};
    if (!filtered)
        return indexChildren(node);
    size_t size = node.size();
    size_t i;
    Children res;
    if (matcher_->isReference()) {
        Value key;
        if (matcher_->resolveRef(ctx, node, key) && indexOf(key, size, i))
            res.push_back(Child{ key, elementAt(node, i) });
    } else if (isPattern()) {
        Values idx;
        for (size_t k = 0; k < size; ++k)
            idx.push_back(Value(static_cast<long long>(k)));
        for (const Value& key : matcher_->matches(idx))
            if (indexOf(key, size, i))
                res.push_back(Child{ key, elementAt(node, i) });
    } else {
        Value key = matcher_->value();
        if (indexOf(key, size, i))
            res.push_back(Child{ key, elementAt(node, i) });
    }
    return selectChildren(std::move(res), ctx, true);
}

SegmentPtr
SlotSegment::concrete(const Value& key) const
{
    if (key.isInt() || key.isFloat())
        return std::make_shared<SlotSegment>(numeric(key));
    return std::make_shared<SlotSegment>(
      std::make_shared<ConstMatcher>(Matcher::Kind::String, key));
}

Value
SlotSegment::defaultValue() const
{
    if (isIndex())
        return Value::sequence();
    return KeySegment::defaultValue();
}

Value
SlotSegment::update(Value node, const Value& key, const Payload& val) const
{
    if (node.isMapping())
        return KeySegment::update(node, key, val);
    return setIndex(node, key, val ? *val : defaultValue());
}

Value
SlotSegment::upsert(Value node, const Payload& val, const Context& ctx) const
{
    if (node.isMapping())
        return KeySegment::upsert(node, val, ctx);
    if (!isIndexable(node))
        throw TypeError("Cannot index " + kindName(node));
    Values keys;
    if (!upsertKeys(node, ctx, keys))
        return node;
    Value v = val ? *val : defaultValue();
    size_t size = node.size();
    size_t appends = 0;
    for (const Value& key : keys) {
        if (!key.isInt())
            continue;
        size_t i;
        if (key.getInt() >= static_cast<long long>(size))
            ++appends;
        else if (indexOf(key, size, i))
            node = setIndex(node, Value(static_cast<long long>(i)), v);
    }
    for (; appends; --appends)
        node = appendItem(node, v);
    return node;
}

Value
SlotSegment::pop(Value node, const Value& key) const
{
    if (node.isMapping())
        return KeySegment::pop(node, key);
    size_t i;
    if (isIndexable(node) && indexOf(key, node.size(), i))
        return eraseIndices(node, { i });
    return node;
}

Value
SlotSegment::remove(Value node, const Payload& val, const Context& ctx) const
{
    if (node.isMapping())
        return Segment::remove(node, val, ctx);
    std::vector<size_t> idx;
    size_t size = node.size();
    for (const Child& c : items(node, ctx)) {
        size_t i;
        if ((!val || c.value == *val) && indexOf(c.key, size, i))
            idx.push_back(i);
    }
    std::sort(idx.begin(), idx.end());
    idx.erase(std::unique(idx.begin(), idx.end()), idx.end());
    return eraseIndices(node, idx);
}

std::string
SlotSegment::render(bool) const
{
    return "[" + renderKey(true) + "]";
}

SegmentPtr
SlotSegment::rebind(MatcherPtr matcher) const
{
    return std::make_shared<SlotSegment>(std::move(matcher), filters_);
}

// ---- Slice ----------------------------------------------------------------

namespace {

struct Bounds
{
    std::optional<long long> start;
    std::optional<long long> stop;
    std::optional<long long> step;
};

Bounds
decode(const Value& key)
{
    Bounds b;
    if (!key.isSequence() || key.size() != 3)
        return b;
    const Value::Items& k = key.getItems();
    if (k[0].isInt())
        b.start = k[0].getInt();
    if (k[1].isInt())
        b.stop = k[1].getInt();
    if (k[2].isInt())
        b.step = k[2].getInt();
    return b;
}

long long
adjust(std::optional<long long> v, long long n, long long step, bool start)
{
    if (!v) {
        if (step > 0)
            return start ? 0 : n;
        return start ? n - 1 : -1;
    }
    long long i = *v;
    if (i < 0) {
        i += n;
        if (i < 0)
            i = step < 0 ? -1 : 0;
    } else if (i >= n) {
        i = step < 0 ? n - 1 : n;
    }
    return i;
}

// Positions selected by the bounds on a sequence of `size` elements.
std::vector<size_t>
indices(const Bounds& b, size_t size)
{
    std::vector<size_t> res;
    long long step = b.step ? *b.step : 1;
    if (step == 0)
        return res;
    long long n = static_cast<long long>(size);
    long long lo = adjust(b.start, n, step, true);
    long long hi = adjust(b.stop, n, step, false);
    if (step > 0) {
        for (long long i = lo; i < hi; i += step) {
            res.push_back(static_cast<size_t>(i));
            if (hi - i <= step)
                break;
        }
    } else {
        for (long long i = lo; i > hi; i += step) {
            res.push_back(static_cast<size_t>(i));
            if (hi - i >= step)
                break;
        }
    }
    return res;
}

Value::Items
elements(const Value& node)
{
    if (node.isSequence() || node.isSet())
        return node.getItems();
    Value::Items res;
    for (size_t i = 0; i < node.size(); ++i)
        res.push_back(elementAt(node, i));
    return res;
}

Value
rebuild(const Value& like, const Value::Items& items)
{
    if (!like.isString() && !like.isBytes())
        return sameKind(like, items);
    std::string s;
    for (const Value& v : items)
        s += v.isInt() ? std::string(1, static_cast<char>(v.getInt())) : v.str();
    return sameText(like, s);
}

Value
sliceOf(const Value& node, const std::vector<size_t>& idx)
{
    Value::Items all = elements(node);
    Value::Items picked;
    for (size_t i : idx)
        picked.push_back(all[i]);
    return rebuild(node, picked);
}

} // namespace

Value
SliceSegment::key(size_t size) const
{
    auto bound = [size](const std::optional<long long>& v) {
        if (!v)
            return Value();
        if (*v == kSliceEnd)
            return Value(static_cast<long long>(size));
        return Value(*v);
    };
    return Value::tuple({ bound(start_), bound(stop_), bound(step_) });
}

Children
SliceSegment::items(const Value& node, const Context&, bool) const
{
    if (!isIndexable(node))
        return {};
    Value k = key(node.size());
    return Children{ Child{ k, sliceOf(node, indices(decode(k), node.size())) } };
}

SegmentPtr
SliceSegment::concrete(const Value& key) const
{
    Bounds b = decode(key);
    return std::make_shared<SliceSegment>(b.start, b.stop, b.step);
}

bool
SliceSegment::isEmpty(const Value& node, const Context&) const
{
    if (!isIndexable(node))
        return true;
    return indices(decode(key(node.size())), node.size()).empty();
}

Value
SliceSegment::update(Value node, const Value& key, const Payload& val) const
{
    if (!isIndexable(node))
        throw TypeError("Cannot slice " + kindName(node));
    Bounds b = decode(key);
    std::vector<size_t> idx = indices(b, node.size());
    if (val && sliceOf(node, idx) == *val)
        return node;
    Value v = val ? *val : defaultValue();
    if (node.isSequence() ? !(v.isSequence() || v.isSet())
                          : v.getType() != node.getType())
        throw TypeError("Cannot assign " + kindName(v) + " to a slice of " +
                        kindName(node));
    Value::Items src = elements(node);
    Value::Items repl = elements(v);
    Value::Items out;
    long long step = b.step ? *b.step : 1;
    if (step == 1) {
        long long n = static_cast<long long>(src.size());
        long long lo = adjust(b.start, n, 1, true);
        long long hi = std::max(lo, adjust(b.stop, n, 1, false));
        out.assign(src.begin(), src.begin() + lo);
        out.insert(out.end(), repl.begin(), repl.end());
        out.insert(out.end(), src.begin() + hi, src.end());
    } else {
        if (repl.size() != idx.size())
            throw Error("Cannot assign a sequence of size " +
                        std::to_string(repl.size()) +
                        " to an extended slice of size " +
                        std::to_string(idx.size()));
        out = src;
        for (size_t k = 0; k < idx.size(); ++k)
            out[idx[k]] = repl[k];
    }
    if (node.isMutable()) {
        node.getItems() = std::move(out);
        return node;
    }
    return rebuild(node, out);
}

Value
SliceSegment::upsert(Value node, const Payload& val, const Context&) const
{
    if (!isIndexable(node))
        throw TypeError("Cannot slice " + kindName(node));
    return update(node, key(node.size()), val);
}

Value
SliceSegment::pop(Value node, const Value& key) const
{
    if (!isIndexable(node))
        return node;
    std::vector<size_t> idx = indices(decode(key), node.size());
    std::sort(idx.begin(), idx.end());
    return eraseIndices(node, idx);
}

Value
SliceSegment::remove(Value node, const Payload& val, const Context&) const
{
    if (!isIndexable(node))
        return node;
    Value k = key(node.size());
    if (val && !(sliceOf(node, indices(decode(k), node.size())) == *val))
        return node;
    return pop(node, k);
}

unsigned long long
SliceSegment::cardinality() const
{
    if ((start_ && *start_ == kSliceEnd) || (step_ && *step_ == kSliceEnd))
        return 0;
    if (!stop_ || *stop_ == kSliceEnd)
        return ULLONG_MAX;
    double start = start_ ? static_cast<double>(*start_) : 0;
    double step = step_ && *step_ ? static_cast<double>(*step_) : 1;
    double n = (static_cast<double>(*stop_) - start) / step;
    return n > 0 ? static_cast<unsigned long long>(n) : 0;
}

std::optional<Values>
SliceSegment::match(const Segment& other, bool) const
{
    if (other.kind() != Kind::Slice)
        return std::nullopt;
    const SliceSegment& o = static_cast<const SliceSegment&>(other);
    if (cardinality() < o.cardinality())
        return std::nullopt;
    return Values{ Value(o.render(true)) };
}

std::string
SliceSegment::render(bool) const
{
    if (!start_ && !stop_ && !step_)
        return "[]";
    auto bound = [](const std::optional<long long>& v) {
        if (!v)
            return std::string();
        return *v == kSliceEnd ? std::string("+") : std::to_string(*v);
    };
    std::string s = "[" + bound(start_) + ":" + bound(stop_);
    if (step_)
        s += ":" + bound(step_);
    return s + "]";
}

// ---- SliceFilter ----------------------------------------------------------

static std::vector<size_t>
selected(const Filters& filters, const Value& node, const Context& ctx)
{
    if (!node.isSequence() && !node.isSet())
        return {};
    return selectFiltered(filters, node.getItems(), ctx.transforms());
}

Children
SliceFilterSegment::items(const Value& node, const Context& ctx, bool) const
{
    Children res;
    for (size_t i : selected(filters_, node, ctx))
        res.push_back(Child{ Value(static_cast<long long>(i)), node.getItems()[i] });
    return res;
}

SegmentPtr
SliceFilterSegment::concrete(const Value& key) const
{
    return std::make_shared<SlotSegment>(numeric(key));
}

Value
SliceFilterSegment::update(Value, const Value&, const Payload&) const
{
    throw UnsupportedError("Updates not supported for slice filtering");
}

Value
SliceFilterSegment::upsert(Value, const Payload&, const Context&) const
{
    throw UnsupportedError("Updates not supported for slice filtering");
}

Value
SliceFilterSegment::pop(Value node, const Value&) const
{
    return remove(node, std::nullopt, Context());
}

Value
SliceFilterSegment::remove(Value node, const Payload& val, const Context& ctx) const
{
    std::vector<size_t> idx = selected(filters_, node, ctx);
    if (idx.empty())
        return node;
    std::sort(idx.begin(), idx.end());
    if (val) {
        Value rest = eraseIndices(sameKind(node, node.getItems()), idx);
        if (!(rest == *val))
            return node;
        if (!node.isMutable())
            return rest;
    }
    return eraseIndices(node, idx);
}

bool
SliceFilterSegment::pushChildren(DepthStack& stack,
                                 Frame& frame,
                                 bool paths,
                                 const Sink&) const
{
    const Value& node = frame.node;
    if (!node.isSequence() && !node.isSet())
        return true;
    Value::Items picked;
    for (size_t i : selected(filters_, node, frame.ctx))
        picked.push_back(node.getItems()[i]);
    Prefix prefix = frame.prefix;
    if (paths)
        prefix.push_back(std::make_shared<SliceSegment>());
    stack.push(Frame{ frame.ops,
                      sameKind(node, std::move(picked)),
                      std::move(prefix),
                      frame.ctx.descend(node) });
    return true;
}

std::optional<Values>
SliceFilterSegment::match(const Segment& other, bool) const
{
    if (other.kind() != Kind::SliceFilter)
        return std::nullopt;
    const SliceFilterSegment& o = static_cast<const SliceFilterSegment&>(other);
    Values res;
    for (size_t i = 0; i < filters_.size() && i < o.filters_.size(); ++i) {
        if (!filters_[i]->matchable(*o.filters_[i]))
            return std::nullopt;
        std::optional<std::string> m = filters_[i]->match(*o.filters_[i]);
        if (!m)
            return std::nullopt;
        res.push_back(Value(*m));
    }
    return res;
}

std::string
SliceFilterSegment::render(bool) const
{
    return "[" + renderFilters(filters_) + "]";
}

// ---- Appender -------------------------------------------------------------

AppenderSegment::AppenderSegment(bool unique)
  : Segment(Kind::Appender),
    unique_(unique),
    matcher_(std::make_shared<SpecialMatcher>(unique ? "+?" : "+"))
{
}

Children
AppenderSegment::items(const Value& node, const Context&, bool) const
{
    if (!isIndexable(node) || !node.size())
        return {};
    return Children{ Child{ Value(-1), elementAt(node, node.size() - 1) } };
}

SegmentPtr
AppenderSegment::concrete(const Value& key) const
{
    return std::make_shared<SlotSegment>(numeric(key));
}

Value
AppenderSegment::update(Value node, const Value& key, const Payload& val) const
{
    Value v = val ? *val : Value();
    if (!key.isString())
        return setIndex(node, key, v);
    if (key.getString() == "+" ||
        (key.getString() == "+?" && !node.containsItem(v)))
        return appendItem(node, v);
    return node;
}

Value
AppenderSegment::upsert(Value node, const Payload& val, const Context&) const
{
    return update(node, matcher_->value(), val);
}

std::optional<Values>
AppenderSegment::match(const Segment& other, bool) const
{
    if (other.kind() != Kind::Appender)
        return std::nullopt;
    if (static_cast<const AppenderSegment&>(other).unique_ != unique_)
        return std::nullopt;
    return Values{ matcher_->value() };
}

std::string
AppenderSegment::render(bool) const
{
    return "[" + matcher_->render() + "]";
}

// ---- Invert ---------------------------------------------------------------

Children
InvertSegment::items(const Value& node, const Context&, bool) const
{
    return Children{ Child{ Value("-"), node } };
}

SegmentPtr
InvertSegment::concrete(const Value&) const
{
    static const SegmentPtr kInvert = std::make_shared<InvertSegment>();
    return kInvert;
}

Value
InvertSegment::doUpdate(const OpList& ops,
                        Value node,
                        const Payload& val,
                        const UpdateArgs&,
                        const Context& ctx) const
{
    if (ops.empty())
        return node;
    return removes(ops, node, val, false, ctx);
}

Value
InvertSegment::doRemove(const OpList& ops,
                        Value node,
                        const Payload& val,
                        bool,
                        const Context& ctx) const
{
    if (!val)
        throw Error("Value required to remove through an inverted path");
    if (ops.empty())
        return node;
    return updates(ops, node, val, UpdateArgs(), ctx);
}

std::optional<Values>
InvertSegment::match(const Segment& other, bool) const
{
    if (other.kind() != Kind::Invert)
        return std::nullopt;
    return Values{ Value("-") };
}

} // namespace dt
