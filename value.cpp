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

#include "value.h"

#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

#include "double-conversion/double-to-string.h"
#include "double-conversion/string-to-double.h"

#if defined(__cpp_exceptions) || defined(__EXCEPTIONS) || defined(_CPPUNWIND)
#define ON_LOGIC_ERROR(s) throw std::logic_error(s)
#else
#define ON_LOGIC_ERROR(s) abort()
#endif

namespace dt {

// Renders floats the way path notation spells them: 7.0 keeps its
// trailing zero so it can never be confused with the int 7.
static const double_conversion::DoubleToStringConverter kDoubleToText(
  double_conversion::DoubleToStringConverter::UNIQUE_ZERO |
    double_conversion::DoubleToStringConverter::EMIT_POSITIVE_EXPONENT_SIGN |
    double_conversion::DoubleToStringConverter::EMIT_TRAILING_DECIMAL_POINT |
    double_conversion::DoubleToStringConverter::EMIT_TRAILING_ZERO_AFTER_POINT,
  "inf",
  "nan",
  'e',
  -4,
  16,
  6,
  0);

static const double_conversion::StringToDoubleConverter kTextToDouble(
  double_conversion::StringToDoubleConverter::ALLOW_CASE_INSENSITIVITY |
    double_conversion::StringToDoubleConverter::ALLOW_LEADING_SPACES |
    double_conversion::StringToDoubleConverter::ALLOW_TRAILING_SPACES,
  0.0,
  std::nan(""),
  "inf",
  "nan");

static const char kHex[] = "0123456789abcdef";

std::string
formatFloat(double value)
{
    char buf[128];
    double_conversion::StringBuilder db(buf, 128);
    kDoubleToText.ToShortest(value, &db);
    db.Finalize();
    return buf;
}

bool
parseFloat(const std::string& text, double& out)
{
    if (text.empty())
        return false;
    int processed = 0;
    double res = kTextToDouble.StringToDouble(
      text.data(), static_cast<int>(text.size()), &processed);
    if (processed != static_cast<int>(text.size()))
        return false;
    if (std::isnan(res) && text.find_first_of("nN") == std::string::npos)
        return false;
    out = res;
    return true;
}

Value::Value(unsigned long value)
{
    if (value <= LLONG_MAX) {
        type_ = Int;
        int_value = value;
    } else {
        type_ = Float;
        float_value = value;
    }
}

Value::Value(unsigned long long value)
{
    if (value <= LLONG_MAX) {
        type_ = Int;
        int_value = value;
    } else {
        type_ = Float;
        float_value = value;
    }
}

Value::Value(const char* value)
{
    if (value) {
        type_ = String;
        new (&string_value) std::string(value);
    } else {
        type_ = Null;
    }
}

Value::Value(const std::string& value) : type_(String), string_value(value)
{
}

Value::Value(std::string&& value)
  : type_(String), string_value(std::move(value))
{
}

Value::~Value()
{
    if (type_ >= String)
        clear();
}

void
Value::clear()
{
    switch (type_) {
        case String:
        case Bytes:
            string_value.~basic_string();
            break;
        case Sequence:
        case Set:
            items_value.~shared_ptr();
            break;
        case Mapping:
            entries_value.~shared_ptr();
            break;
        case Record:
            record_value.~shared_ptr();
            break;
        default:
            break;
    }
    type_ = Null;
    mut_ = InPlace;
}

void
Value::assign(const Value& other)
{
    type_ = other.type_;
    mut_ = other.mut_;
    switch (type_) {
        case Null:
            break;
        case Bool:
            bool_value = other.bool_value;
            break;
        case Int:
            int_value = other.int_value;
            break;
        case Float:
            float_value = other.float_value;
            break;
        case String:
        case Bytes:
            new (&string_value) std::string(other.string_value);
            break;
        case Sequence:
        case Set:
            new (&items_value) std::shared_ptr<Items>(other.items_value);
            break;
        case Mapping:
            new (&entries_value) std::shared_ptr<Entries>(other.entries_value);
            break;
        case Record:
            new (&record_value)
              std::shared_ptr<RecordData>(other.record_value);
            break;
        default:
            ON_LOGIC_ERROR("Unhandled value type.");
    }
}

void
Value::steal(Value& other)
{
    type_ = other.type_;
    mut_ = other.mut_;
    switch (type_) {
        case Null:
            break;
        case Bool:
            bool_value = other.bool_value;
            break;
        case Int:
            int_value = other.int_value;
            break;
        case Float:
            float_value = other.float_value;
            break;
        case String:
        case Bytes:
            new (&string_value) std::string(std::move(other.string_value));
            break;
        case Sequence:
        case Set:
            new (&items_value)
              std::shared_ptr<Items>(std::move(other.items_value));
            break;
        case Mapping:
            new (&entries_value)
              std::shared_ptr<Entries>(std::move(other.entries_value));
            break;
        case Record:
            new (&record_value)
              std::shared_ptr<RecordData>(std::move(other.record_value));
            break;
        default:
            ON_LOGIC_ERROR("Unhandled value type.");
    }
    other.clear();
}

Value::Value(const Value& other)
{
    assign(other);
}

Value&
Value::operator=(const Value& other)
{
    if (this != &other) {
        // other may live inside the container we are about to release
        Value keep(other);
        if (type_ >= String)
            clear();
        steal(keep);
    }
    return *this;
}

Value::Value(Value&& other) noexcept
{
    steal(other);
}

Value&
Value::operator=(Value&& other) noexcept
{
    if (this != &other) {
        Value keep(std::move(other));
        if (type_ >= String)
            clear();
        steal(keep);
    }
    return *this;
}

Value
Value::bytes(const std::string& value)
{
    Value res(value);
    res.type_ = Bytes;
    return res;
}

Value
Value::sequence(std::initializer_list<Value> items, Mutability mut)
{
    return sequence(Items(items), mut);
}

Value
Value::sequence(Items items, Mutability mut)
{
    Value res;
    res.type_ = Sequence;
    res.mut_ = mut;
    new (&res.items_value)
      std::shared_ptr<Items>(std::make_shared<Items>(std::move(items)));
    return res;
}

Value
Value::tuple(std::initializer_list<Value> items)
{
    return sequence(Items(items), CopyOnWrite);
}

Value
Value::mapping(std::initializer_list<Entry> entries, Mutability mut)
{
    Entries unique;
    for (const Entry& e : entries) {
        auto it = std::find_if(unique.begin(),
                               unique.end(),
                               [&](const Entry& u) { return u.first == e.first; });
        if (it != unique.end())
            it->second = e.second;
        else
            unique.push_back(e);
    }
    return mapping(std::move(unique), mut);
}

Value
Value::mapping(Entries entries, Mutability mut)
{
    Value res;
    res.type_ = Mapping;
    res.mut_ = mut;
    new (&res.entries_value)
      std::shared_ptr<Entries>(std::make_shared<Entries>(std::move(entries)));
    return res;
}

Value
Value::set(std::initializer_list<Value> items, Mutability mut)
{
    return set(Items(items), mut);
}

Value
Value::set(Items items, Mutability mut)
{
    Items unique;
    for (Value& v : items)
        if (std::find(unique.begin(), unique.end(), v) == unique.end())
            unique.push_back(std::move(v));
    Value res;
    res.type_ = Set;
    res.mut_ = mut;
    new (&res.items_value)
      std::shared_ptr<Items>(std::make_shared<Items>(std::move(unique)));
    return res;
}

Value
Value::frozenset(std::initializer_list<Value> items)
{
    return set(Items(items), CopyOnWrite);
}

Value
Value::record(const std::string& name,
              std::initializer_list<Field> fields,
              Mutability mut)
{
    return record(name, std::vector<Field>(fields), mut);
}

Value
Value::record(const std::string& name,
              std::vector<Field> fields,
              Mutability mut)
{
    auto data = std::make_shared<RecordData>();
    data->name = name;
    data->fields = std::move(fields);
    Value res;
    res.type_ = Record;
    res.mut_ = mut;
    new (&res.record_value) std::shared_ptr<RecordData>(std::move(data));
    return res;
}

bool
Value::getBool() const
{
    switch (type_) {
        case Bool:
            return bool_value;
        default:
            ON_LOGIC_ERROR("Value is not a bool.");
    }
}

long long
Value::getInt() const
{
    switch (type_) {
        case Bool:
            return bool_value;
        case Int:
            return int_value;
        default:
            ON_LOGIC_ERROR("Value is not an int.");
    }
}

double
Value::getFloat() const
{
    switch (type_) {
        case Float:
            return float_value;
        default:
            ON_LOGIC_ERROR("Value is not a float.");
    }
}

double
Value::getNumber() const
{
    switch (type_) {
        case Bool:
            return bool_value;
        case Int:
            return int_value;
        case Float:
            return float_value;
        default:
            ON_LOGIC_ERROR("Value is not a number.");
    }
}

std::string&
Value::getString()
{
    switch (type_) {
        case String:
        case Bytes:
            return string_value;
        default:
            ON_LOGIC_ERROR("Value is not a string.");
    }
}

const std::string&
Value::getString() const
{
    switch (type_) {
        case String:
        case Bytes:
            return string_value;
        default:
            ON_LOGIC_ERROR("Value is not a string.");
    }
}

Value::Items&
Value::getItems()
{
    switch (type_) {
        case Sequence:
        case Set:
            return *items_value;
        default:
            ON_LOGIC_ERROR("Value is not a sequence or set.");
    }
}

const Value::Items&
Value::getItems() const
{
    switch (type_) {
        case Sequence:
        case Set:
            return *items_value;
        default:
            ON_LOGIC_ERROR("Value is not a sequence or set.");
    }
}

Value::Entries&
Value::getEntries()
{
    switch (type_) {
        case Mapping:
            return *entries_value;
        default:
            ON_LOGIC_ERROR("Value is not a mapping.");
    }
}

const Value::Entries&
Value::getEntries() const
{
    switch (type_) {
        case Mapping:
            return *entries_value;
        default:
            ON_LOGIC_ERROR("Value is not a mapping.");
    }
}

RecordData&
Value::getRecord()
{
    switch (type_) {
        case Record:
            return *record_value;
        default:
            ON_LOGIC_ERROR("Value is not a record.");
    }
}

const RecordData&
Value::getRecord() const
{
    switch (type_) {
        case Record:
            return *record_value;
        default:
            ON_LOGIC_ERROR("Value is not a record.");
    }
}

const void*
Value::identity() const
{
    switch (type_) {
        case Sequence:
        case Set:
            return items_value.get();
        case Mapping:
            return entries_value.get();
        case Record:
            return record_value.get();
        default:
            return nullptr;
    }
}

size_t
Value::size() const
{
    switch (type_) {
        case String:
        case Bytes:
            return string_value.size();
        case Sequence:
        case Set:
            return items_value->size();
        case Mapping:
            return entries_value->size();
        case Record:
            return record_value->fields.size();
        default:
            return 0;
    }
}

bool
Value::truthy() const
{
    switch (type_) {
        case Null:
            return false;
        case Bool:
            return bool_value;
        case Int:
            return int_value != 0;
        case Float:
            return float_value != 0;
        case Record:
            return true;
        default:
            return size() != 0;
    }
}

const Value*
Value::find(const Value& key) const
{
    if (type_ != Mapping)
        return nullptr;
    for (const Entry& e : *entries_value)
        if (e.first == key)
            return &e.second;
    return nullptr;
}

const Value*
Value::findField(const std::string& name) const
{
    if (type_ != Record)
        return nullptr;
    for (const Field& f : record_value->fields)
        if (f.first == name)
            return &f.second;
    return nullptr;
}

bool
Value::contains(const Value& key) const
{
    return find(key) != nullptr;
}

bool
Value::containsItem(const Value& item) const
{
    switch (type_) {
        case Sequence:
        case Set:
            return std::find(items_value->begin(), items_value->end(), item) !=
                   items_value->end();
        case Mapping:
            return contains(item);
        case String:
        case Bytes:
            return item.type_ == type_ &&
                   string_value.find(item.string_value) != std::string::npos;
        default:
            return false;
    }
}

void
Value::setSequence()
{
    if (type_ >= String)
        clear();
    type_ = Sequence;
    mut_ = InPlace;
    new (&items_value) std::shared_ptr<Items>(std::make_shared<Items>());
}

void
Value::setMapping()
{
    if (type_ >= String)
        clear();
    type_ = Mapping;
    mut_ = InPlace;
    new (&entries_value) std::shared_ptr<Entries>(std::make_shared<Entries>());
}

Value&
Value::operator[](size_t index)
{
    if (!isSequence())
        setSequence();
    if (index >= items_value->size())
        items_value->resize(index + 1);
    return (*items_value)[index];
}

Value&
Value::operator[](const std::string& key)
{
    if (!isMapping())
        setMapping();
    for (Entry& e : *entries_value)
        if (e.first.isString() && e.first.string_value == key)
            return e.second;
    entries_value->emplace_back(Value(key), Value());
    return entries_value->back().second;
}

Value
Value::deepCopy() const
{
    std::vector<std::pair<const void*, Value>> memo;
    return copyInto(memo);
}

Value
Value::copyInto(std::vector<std::pair<const void*, Value>>& memo) const
{
    const void* id = identity();
    if (!id)
        return *this;
    for (const auto& seen : memo)
        if (seen.first == id)
            return seen.second;
    Value res;
    switch (type_) {
        case Sequence:
        case Set:
            res = Value::sequence(Items(), mut_);
            res.type_ = type_;
            memo.emplace_back(id, res);
            for (const Value& v : *items_value)
                res.items_value->push_back(v.copyInto(memo));
            break;
        case Mapping:
            res = Value::mapping(Entries(), mut_);
            memo.emplace_back(id, res);
            for (const Entry& e : *entries_value)
                res.entries_value->emplace_back(e.first.copyInto(memo),
                                                e.second.copyInto(memo));
            break;
        case Record:
            res = Value::record(record_value->name, std::vector<Field>(), mut_);
            memo.emplace_back(id, res);
            for (const Field& f : record_value->fields)
                res.record_value->fields.emplace_back(f.first,
                                                      f.second.copyInto(memo));
            break;
        default:
            ON_LOGIC_ERROR("Unhandled value type.");
    }
    return res;
}

static void
serialize(std::string& sb, const std::string& s, char quote)
{
    sb += quote;
    for (unsigned char c : s) {
        switch (c) {
            case '\t':
                sb += "\\t";
                break;
            case '\n':
                sb += "\\n";
                break;
            case '\r':
                sb += "\\r";
                break;
            case '\\':
                sb += "\\\\";
                break;
            default:
                if (c == quote) {
                    sb += '\\';
                    sb += c;
                } else if (c < 0x20 || c == 0x7f) {
                    sb += "\\x";
                    sb += kHex[c >> 4];
                    sb += kHex[c & 15];
                } else {
                    sb += c;
                }
                break;
        }
    }
    sb += quote;
}

void
Value::marshal(std::string& b,
               bool quoted,
               std::vector<const void*>& visiting) const
{
    const void* id = identity();
    if (id) {
        if (std::find(visiting.begin(), visiting.end(), id) != visiting.end()) {
            b += type_ == Sequence ? "[...]" : "{...}";
            return;
        }
        visiting.push_back(id);
    }
    switch (type_) {
        case Null:
            b += quoted ? "null" : "None";
            break;
        case Bool:
            if (quoted)
                b += bool_value ? "true" : "false";
            else
                b += bool_value ? "True" : "False";
            break;
        case Int:
            b += std::to_string(int_value);
            break;
        case Float:
            b += formatFloat(float_value);
            break;
        case String:
            if (quoted)
                serialize(b, string_value, '"');
            else
                b += string_value;
            break;
        case Bytes:
            if (quoted) {
                b += 'b';
                serialize(b, string_value, '"');
            } else {
                b += string_value;
            }
            break;
        case Sequence: {
            bool tuple = mut_ == CopyOnWrite;
            b += tuple ? '(' : '[';
            for (size_t i = 0; i < items_value->size(); ++i) {
                if (i)
                    b += ',';
                (*items_value)[i].marshal(b, true, visiting);
            }
            if (tuple && items_value->size() == 1)
                b += ',';
            b += tuple ? ')' : ']';
            break;
        }
        case Set: {
            const char* name = mut_ == CopyOnWrite ? "frozenset" : "set";
            if (items_value->empty()) {
                b += name;
                b += "()";
                break;
            }
            if (mut_ == CopyOnWrite)
                b += "frozenset(";
            b += '{';
            for (size_t i = 0; i < items_value->size(); ++i) {
                if (i)
                    b += ',';
                (*items_value)[i].marshal(b, true, visiting);
            }
            b += '}';
            if (mut_ == CopyOnWrite)
                b += ')';
            break;
        }
        case Mapping: {
            bool once = false;
            b += '{';
            for (const Entry& e : *entries_value) {
                if (once)
                    b += ',';
                else
                    once = true;
                e.first.marshal(b, true, visiting);
                b += ':';
                e.second.marshal(b, true, visiting);
            }
            b += '}';
            break;
        }
        case Record: {
            bool once = false;
            b += record_value->name;
            b += '(';
            for (const Field& f : record_value->fields) {
                if (once)
                    b += ',';
                else
                    once = true;
                b += f.first;
                b += '=';
                f.second.marshal(b, true, visiting);
            }
            b += ')';
            break;
        }
        default:
            ON_LOGIC_ERROR("Unhandled value type.");
    }
    if (id)
        visiting.pop_back();
}

std::string
Value::toString() const
{
    std::string b;
    std::vector<const void*> visiting;
    marshal(b, true, visiting);
    return b;
}

std::string
Value::str() const
{
    std::string b;
    std::vector<const void*> visiting;
    marshal(b, false, visiting);
    return b;
}

const char*
Value::TypeToString(Type type)
{
    switch (type) {
        case Null:
            return "null";
        case Bool:
            return "bool";
        case Int:
            return "int";
        case Float:
            return "float";
        case String:
            return "str";
        case Bytes:
            return "bytes";
        case Sequence:
            return "sequence";
        case Mapping:
            return "mapping";
        case Set:
            return "set";
        case Record:
            return "record";
        default:
            return "unknown";
    }
}

static bool
sameMembers(const Value::Items& lhs, const Value::Items& rhs)
{
    if (lhs.size() != rhs.size())
        return false;
    for (const Value& v : lhs)
        if (std::find(rhs.begin(), rhs.end(), v) == rhs.end())
            return false;
    return true;
}

bool
operator==(const Value& lhs, const Value& rhs)
{
    if (lhs.isNumber() && rhs.isNumber()) {
        if (!lhs.isFloat() && !rhs.isFloat())
            return lhs.getInt() == rhs.getInt();
        return lhs.getNumber() == rhs.getNumber();
    }
    if (lhs.type_ != rhs.type_)
        return false;
    const void* id = lhs.identity();
    if (id && id == rhs.identity())
        return true;
    switch (lhs.type_) {
        case Value::Null:
            return true;
        case Value::String:
        case Value::Bytes:
            return lhs.string_value == rhs.string_value;
        case Value::Sequence:
            return lhs.mut_ == rhs.mut_ && *lhs.items_value == *rhs.items_value;
        case Value::Set:
            return sameMembers(*lhs.items_value, *rhs.items_value);
        case Value::Mapping: {
            if (lhs.entries_value->size() != rhs.entries_value->size())
                return false;
            for (const Value::Entry& e : *lhs.entries_value) {
                const Value* other = rhs.find(e.first);
                if (!other || !(*other == e.second))
                    return false;
            }
            return true;
        }
        case Value::Record: {
            const RecordData& a = *lhs.record_value;
            const RecordData& b = *rhs.record_value;
            if (a.name != b.name || a.fields.size() != b.fields.size())
                return false;
            for (const Value::Field& f : a.fields) {
                const Value* other = rhs.findField(f.first);
                if (!other || !(*other == f.second))
                    return false;
            }
            return true;
        }
        default:
            return false;
    }
}

bool
compare(const Value& lhs, const Value& rhs, int& out)
{
    if (lhs.isNumber() && rhs.isNumber()) {
        if (!lhs.isFloat() && !rhs.isFloat()) {
            long long a = lhs.getInt();
            long long b = rhs.getInt();
            out = a < b ? -1 : a > b ? 1 : 0;
            return true;
        }
        double a = lhs.getNumber();
        double b = rhs.getNumber();
        if (std::isnan(a) || std::isnan(b))
            return false;
        out = a < b ? -1 : a > b ? 1 : 0;
        return true;
    }
    if (lhs.getType() != rhs.getType())
        return false;
    switch (lhs.getType()) {
        case Value::String:
        case Value::Bytes: {
            int c = lhs.getString().compare(rhs.getString());
            out = c < 0 ? -1 : c > 0 ? 1 : 0;
            return true;
        }
        case Value::Sequence: {
            if (lhs.getMutability() != rhs.getMutability())
                return false;
            const Value::Items& a = lhs.getItems();
            const Value::Items& b = rhs.getItems();
            size_t n = std::min(a.size(), b.size());
            for (size_t i = 0; i < n; ++i) {
                if (a[i] == b[i])
                    continue;
                return compare(a[i], b[i], out);
            }
            out = a.size() < b.size() ? -1 : a.size() > b.size() ? 1 : 0;
            return true;
        }
        default:
            return false;
    }
}

} // namespace dt
