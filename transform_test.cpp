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
#include <cstdio>
#include <cstdlib>
#include <string>

using dt::Path;
using dt::Transform;
using dt::Value;
using namespace dt::ops;

static Value
run(const Value& v, const dt::Transforms& transforms)
{
    return dt::TransformRegistry::global().apply(v, transforms);
}

void
conversion_test()
{
    if (run(Value("42"), { Transform{ "int", {} } }) != Value(42))
        exit(1);
    if (run(Value("ff"), { Transform{ "int", { Value(16) } } }) != Value(255))
        exit(2);
    // unparseable input passes through unchanged
    if (run(Value("x"), { Transform{ "int", {} } }) != Value("x"))
        exit(3);
    try {
        run(Value("x"), { Transform{ "int", { Value(), Value("raises") } } });
        exit(4);
    } catch (const dt::TransformError&) {
    }
    if (run(Value("2.5"), { Transform{ "float", {} } }) != Value(2.5))
        exit(5);
    if (run(Value(7), { Transform{ "str", {} } }) != Value("7"))
        exit(6);
    if (run(Value(7), { Transform{ "str", { Value("%03d") } } }) != Value("007"))
        exit(7);
}

void
string_test()
{
    if (run(Value("  hi "), { Transform{ "strip", {} } }) != Value("hi"))
        exit(10);
    if (run(Value("--hi-"), { Transform{ "strip", { Value("-") } } }) != Value("hi"))
        exit(11);
    if (run(Value("Hi"), { Transform{ "lowercase", {} }, Transform{ "len", {} } }) != Value(2))
        exit(12);
    if (run(Value("Hi"), { Transform{ "uppercase", {} } }) != Value("HI"))
        exit(13);
    try {
        run(Value(3), { Transform{ "len", {} } });
        exit(14);
    } catch (const dt::TransformError&) {
    }
    if (run(Value(3), { Transform{ "len", { Value(-1) } } }) != Value(-1))
        exit(15);
}

void
container_test()
{
    if (run(Value::sequence({ 1 }), { Transform{ "add", { Value::sequence({ 2 }) } } })
          .toString() != "[1,2]")
        exit(20);
    if (run(Value(1), { Transform{ "add", { Value(0.5) } } }) != Value(1.5))
        exit(21);
    try {
        run(Value("a"), { Transform{ "add", { Value(1) } } });
        exit(22);
    } catch (const dt::TransformError&) {
    }
    if (run(Value::sequence({ 1, 2 }), { Transform{ "tuple", {} } }).toString() != "(1,2)")
        exit(23);
    if (run(Value::mapping({ { "a", 1 } }), { Transform{ "list", {} } }).toString() != R"(["a"])")
        exit(24);
    if (!run(Value(""), { Transform{ "none", {} } }).isNull())
        exit(25);
    if (run(Value(5), { Transform{ "none", { Value(0) } } }) != Value(5))
        exit(26);
}

void
registry_test()
{
    try {
        run(Value(1), { Transform{ "no_such_transform", {} } });
        exit(30);
    } catch (const dt::Error&) {
    }

    dt::TransformRegistry local;
    local.registerTransform("neg", [](const Value& v, const std::vector<Value>&) {
        return Value(-v.getNumber());
    });
    if (local.find("int") || !local.find("neg"))
        exit(31);

    Value d = Value::mapping({ { "a", 4 } });
    dt::Options opts;
    opts.registry = &local;
    Path neg({ key("a") }, { Transform{ "neg", {} } });
    if (dt::get(d, neg, Value(), std::nullopt, opts) != Value(-4.0))
        exit(32);
    opts.applyTransforms = false;
    if (dt::get(d, neg, Value(), std::nullopt, opts) != Value(4))
        exit(33);
}

void
path_transform_test()
{
    Value d = Value::mapping({ { "n", "12" }, { "m", "x" } });
    Path asInt({ key("n") }, { Transform{ "int", {} } });
    if (dt::get(d, asInt) != Value(12))
        exit(40);
    Value u = dt::update(Value::mapping(), asInt, Value("7"));
    if (u.toString() != R"({"n":7})")
        exit(41);
    Path adds({ key(wild()) }, { Transform{ "add", { Value("!") } } });
    if (dt::get(d, adds).toString() != R"(("12!","x!"))")
        exit(42);
    if (Transform{ "str", { Value("%d") } }.render() != "str:'%d'")
        exit(43);
}

int
main()
{
    conversion_test();
    string_test();
    container_test();
    registry_test();
    path_transform_test();
    return 0;
}
