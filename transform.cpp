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

#include "transform.h"
#include "error.h"
#include "path.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace dt {

std::string
Transform::render() const
{
    std::string s = name;
    for (const Value& arg : args) {
        s += ':';
        if (arg.isNull())
            continue;
        if (arg.isString())
            s += quoteString(arg.getString());
        else
            s += arg.str();
    }
    return s;
}

namespace {

bool
hasMode(const std::vector<Value>& args, size_t from, const char* mode)
{
    for (size_t i = from; i < args.size(); ++i)
        if (args[i].isString() && args[i].getString() == mode)
            return true;
    return false;
}

// Result of a conversion that could not be performed: either the input,
// untouched, or an exception when the caller asked for one.
Value
failed(const Value& value,
       const std::vector<Value>& args,
       size_t modes,
       const std::string& what)
{
    if (hasMode(args, modes, "raises"))
        throw TransformError(what);
    return value;
}

const Value&
arg(const std::vector<Value>& args, size_t i)
{
    static const Value kNone;
    return i < args.size() ? args[i] : kNone;
}

std::string
trim(const std::string& s, const std::string* chars = nullptr)
{
    auto strip = [chars](unsigned char c) {
        if (chars)
            return chars->find(static_cast<char>(c)) != std::string::npos;
        return std::isspace(c) != 0;
    };
    size_t b = 0;
    size_t e = s.size();
    while (b < e && strip(s[b]))
        ++b;
    while (e > b && strip(s[e - 1]))
        --e;
    return s.substr(b, e - b);
}

bool
parseInt(const std::string& input, int base, long long& out)
{
    std::string s = trim(input);
    if (s.empty())
        return false;
    std::string digits;
    size_t i = 0;
    bool neg = false;
    if (s[i] == '+' || s[i] == '-')
        neg = s[i++] == '-';
    if (i + 1 < s.size() && s[i] == '0') {
        char p = static_cast<char>(std::tolower(static_cast<unsigned char>(s[i + 1])));
        int prefixed = p == 'x' ? 16 : p == 'o' ? 8 : p == 'b' ? 2 : 0;
        if (prefixed && (base == 0 || base == prefixed)) {
            base = prefixed;
            i += 2;
            if (i < s.size() && s[i] == '_')
                ++i;
        }
    }
    if (base == 0)
        base = 10;
    bool prev_digit = false;
    for (; i < s.size(); ++i) {
        char c = s[i];
        if (c == '_') {
            if (!prev_digit)
                return false;
            prev_digit = false;
            continue;
        }
        int d;
        if (c >= '0' && c <= '9')
            d = c - '0';
        else if (std::isalpha(static_cast<unsigned char>(c)))
            d = std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
        else
            return false;
        if (d >= base)
            return false;
        digits += c;
        prev_digit = true;
    }
    if (digits.empty() || !prev_digit)
        return false;
    errno = 0;
    long long res = std::strtoll(digits.c_str(), nullptr, base);
    if (errno == ERANGE)
        return false;
    out = neg ? -res : res;
    return true;
}

// printf style formatting of one value through a single directive.
bool
formatPercent(const std::string& fmt, const Value& value, std::string& out)
{
    bool used = false;
    for (size_t i = 0; i < fmt.size(); ++i) {
        if (fmt[i] != '%') {
            out += fmt[i];
            continue;
        }
        if (i + 1 < fmt.size() && fmt[i + 1] == '%') {
            out += '%';
            ++i;
            continue;
        }
        size_t j = i + 1;
        while (j < fmt.size() && std::strchr("-+ #0", fmt[j]))
            ++j;
        while (j < fmt.size() && std::isdigit(static_cast<unsigned char>(fmt[j])))
            ++j;
        if (j < fmt.size() && fmt[j] == '.') {
            ++j;
            while (j < fmt.size() &&
                   std::isdigit(static_cast<unsigned char>(fmt[j])))
                ++j;
        }
        if (j >= fmt.size() || used)
            return false;
        std::string spec = fmt.substr(i, j - i);
        char conv = fmt[j];
        char buf[512];
        int rc;
        switch (conv) {
            case 's':
            case 'r': {
                std::string text = conv == 's' ? value.str() : value.toString();
                rc = snprintf(buf, sizeof(buf), (spec + 's').c_str(), text.c_str());
                break;
            }
            case 'd':
            case 'i':
                if (!value.isNumber())
                    return false;
                if (value.isFloat() && !std::isfinite(value.getFloat()))
                    return false;
                rc = snprintf(buf,
                              sizeof(buf),
                              (spec + "lld").c_str(),
                              static_cast<long long>(value.getNumber()));
                break;
            case 'x':
            case 'X':
            case 'o':
                if (!value.isInt() && !value.isBool())
                    return false;
                rc = snprintf(buf,
                              sizeof(buf),
                              (spec + "ll" + conv).c_str(),
                              static_cast<long long>(value.getNumber()));
                break;
            case 'e':
            case 'E':
            case 'f':
            case 'F':
            case 'g':
            case 'G':
                if (!value.isNumber())
                    return false;
                rc = snprintf(
                  buf, sizeof(buf), (spec + conv).c_str(), value.getNumber());
                break;
            default:
                return false;
        }
        if (rc < 0)
            return false;
        out.append(buf, std::min(static_cast<size_t>(rc), sizeof(buf) - 1));
        used = true;
        i = j;
    }
    return used;
}

Value::Items
iterate(const Value& value, bool& ok)
{
    Value::Items items;
    ok = true;
    switch (value.getType()) {
        case Value::Sequence:
        case Value::Set:
            items = value.getItems();
            break;
        case Value::Mapping:
            for (const Value::Entry& e : value.getEntries())
                items.push_back(e.first);
            break;
        case Value::Record:
            for (const Value::Field& f : value.getRecord().fields)
                items.push_back(f.second);
            break;
        case Value::String:
            for (char c : value.getString())
                items.emplace_back(std::string(1, c));
            break;
        case Value::Bytes:
            for (char c : value.getString())
                items.emplace_back(static_cast<long long>(static_cast<unsigned char>(c)));
            break;
        default:
            ok = false;
    }
    return items;
}

Value
transformStr(const Value& value, const std::vector<Value>& args)
{
    const Value& fmt = arg(args, 0);
    if (!fmt.truthy())
        return Value(value.str());
    std::string out;
    if (fmt.isString() && formatPercent(fmt.getString(), value, out))
        return Value(std::move(out));
    return failed(value, args, 1, "str: cannot format " + value.toString());
}

Value
transformInt(const Value& value, const std::vector<Value>& args)
{
    const Value& base = arg(args, 0);
    long long res;
    if (base.isNull()) {
        switch (value.getType()) {
            case Value::Bool:
            case Value::Int:
                return Value(static_cast<long long>(value.getNumber()));
            case Value::Float:
                if (std::isfinite(value.getFloat()))
                    return Value(static_cast<long long>(value.getFloat()));
                break;
            case Value::String:
            case Value::Bytes:
                if (parseInt(value.getString(), 10, res))
                    return Value(res);
                break;
            default:
                break;
        }
        return failed(value, args, 1, "int: invalid literal " + value.toString());
    }
    int b = base.isInt() && base.getInt() ? static_cast<int>(base.getInt()) : 10;
    if (b >= 2 && b <= 36 && parseInt(value.str(), b, res))
        return Value(res);
    return failed(value, args, 1, "int: invalid literal " + value.toString());
}

Value
transformFloat(const Value& value, const std::vector<Value>& args)
{
    if (value.isNumber())
        return Value(value.getNumber());
    double res;
    if ((value.isString() || value.isBytes()) &&
        value.getString().find('_') == std::string::npos &&
        parseFloat(trim(value.getString()), res))
        return Value(res);
    return failed(value, args, 0, "float: cannot convert " + value.toString());
}

Value
transformNone(const Value& value, const std::vector<Value>& args)
{
    if (args.empty())
        return value.truthy() ? value : Value();
    for (const Value& v : args)
        if (v == value)
            return Value();
    return value;
}

Value
transformStrip(const Value& value, const std::vector<Value>& args)
{
    if (!value.isString() && !value.isBytes())
        return failed(value, args, 1, "strip: not a string " + value.toString());
    const Value& chars = arg(args, 0);
    std::string stripped;
    if (chars.isString() && !chars.getString().empty())
        stripped = trim(value.getString(), &chars.getString());
    else
        stripped = trim(value.getString());
    return value.isBytes() ? Value::bytes(stripped) : Value(std::move(stripped));
}

Value
transformLen(const Value& value, const std::vector<Value>& args)
{
    if (value.isContainer() || value.isString() || value.isBytes())
        return Value(static_cast<long long>(value.size()));
    const Value& def = arg(args, 0);
    if (!def.isNull())
        return def;
    throw TransformError(std::string("len: object of type '") +
                         Value::TypeToString(value.getType()) +
                         "' has no len()");
}

Value
changeCase(const Value& value, const std::vector<Value>& args, bool upper)
{
    if (!value.isString() && !value.isBytes())
        return failed(value, args, 0, "case: not a string " + value.toString());
    std::string s = value.getString();
    for (char& c : s)
        c = static_cast<char>(upper ? std::toupper(static_cast<unsigned char>(c))
                                    : std::tolower(static_cast<unsigned char>(c)));
    return value.isBytes() ? Value::bytes(s) : Value(std::move(s));
}

Value
transformAdd(const Value& value, const std::vector<Value>& args)
{
    if (args.empty())
        throw TransformError("add: missing operand");
    return addValues(value, args[0]);
}

Value
transformList(const Value& value, const std::vector<Value>& args)
{
    bool ok;
    Value::Items items = iterate(value, ok);
    if (!ok)
        return failed(value, args, 0, "list: not iterable " + value.toString());
    return Value::sequence(std::move(items));
}

Value
transformTuple(const Value& value, const std::vector<Value>& args)
{
    bool ok;
    Value::Items items = iterate(value, ok);
    if (!ok)
        return failed(value, args, 0, "tuple: not iterable " + value.toString());
    return Value::sequence(std::move(items), Value::CopyOnWrite);
}

Value
transformSet(const Value& value, const std::vector<Value>& args)
{
    bool ok;
    Value::Items items = iterate(value, ok);
    if (!ok)
        return failed(value, args, 0, "set: not iterable " + value.toString());
    return Value::set(std::move(items));
}

void
registerBuiltins(TransformRegistry& reg)
{
    reg.registerTransform("str", transformStr);
    reg.registerTransform("int", transformInt);
    reg.registerTransform("float", transformFloat);
    reg.registerTransform("none", transformNone);
    reg.registerTransform("strip", transformStrip);
    reg.registerTransform("len", transformLen);
    reg.registerTransform("lowercase",
                          [](const Value& v, const std::vector<Value>& a) {
                              return changeCase(v, a, false);
                          });
    reg.registerTransform("uppercase",
                          [](const Value& v, const std::vector<Value>& a) {
                              return changeCase(v, a, true);
                          });
    reg.registerTransform("add", transformAdd);
    reg.registerTransform("list", transformList);
    reg.registerTransform("tuple", transformTuple);
    reg.registerTransform("set", transformSet);
}

} // namespace

Value
addValues(const Value& lhs, const Value& rhs)
{
    if (lhs.isNumber() && rhs.isNumber()) {
        if (lhs.isFloat() || rhs.isFloat())
            return Value(lhs.getNumber() + rhs.getNumber());
        return Value(static_cast<long long>(lhs.getNumber()) +
                     static_cast<long long>(rhs.getNumber()));
    }
    if (lhs.getType() == rhs.getType()) {
        if (lhs.isString())
            return Value(lhs.getString() + rhs.getString());
        if (lhs.isBytes())
            return Value::bytes(lhs.getString() + rhs.getString());
        if (lhs.isSequence() && lhs.getMutability() == rhs.getMutability()) {
            Value::Items items = lhs.getItems();
            items.insert(items.end(), rhs.getItems().begin(), rhs.getItems().end());
            return Value::sequence(std::move(items), lhs.getMutability());
        }
    }
    throw TransformError(std::string("add: unsupported operands '") +
                         Value::TypeToString(lhs.getType()) + "' and '" +
                         Value::TypeToString(rhs.getType()) + "'");
}

TransformRegistry::TransformRegistry() = default;

TransformRegistry&
TransformRegistry::global()
{
    static TransformRegistry registry = [] {
        TransformRegistry reg;
        registerBuiltins(reg);
        return reg;
    }();
    return registry;
}

void
TransformRegistry::registerTransform(const std::string& name, TransformFn fn)
{
    fns_[name] = std::move(fn);
}

const TransformFn*
TransformRegistry::find(const std::string& name) const
{
    auto it = fns_.find(name);
    return it == fns_.end() ? nullptr : &it->second;
}

std::vector<std::string>
TransformRegistry::names() const
{
    std::vector<std::string> res;
    for (const auto& [name, fn] : fns_)
        res.push_back(name);
    return res;
}

Value
TransformRegistry::apply(const Value& value, const Transforms& transforms) const
{
    Value res = value;
    for (const Transform& t : transforms) {
        const TransformFn* fn = find(t.name);
        if (!fn)
            throw Error("Unknown transform '" + t.name + "'");
        res = (*fn)(res, t.args);
    }
    return res;
}

} // namespace dt
