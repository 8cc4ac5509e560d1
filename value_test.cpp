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
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

using dt::Value;

void
scalar_test()
{
    if (Value().toString() != "null" || Value().str() != "None")
        exit(1);
    if (Value(true).toString() != "true" || Value(false).str() != "False")
        exit(2);
    if (Value(7.0).toString() != "7.0")
        exit(3);
    if (Value(7).toString() != "7")
        exit(4);
    if (Value("a\"b").toString() != R"("a\"b")" || Value("a\"b").str() != "a\"b")
        exit(5);
    if (Value::bytes("xy").toString() != R"(b"xy")")
        exit(6);
    if (Value(1) != Value(1.0) || Value(true) != Value(1))
        exit(7);
    if (Value("1") == Value(1))
        exit(8);
}

void
container_test()
{
    Value list = Value::sequence({ 1, 2 });
    Value tuple = Value::tuple({ 1, 2 });
    if (list.toString() != "[1,2]" || tuple.toString() != "(1,2)")
        exit(10);
    if (list == tuple)
        exit(11);
    if (Value::tuple({ 1 }).toString() != "(1,)")
        exit(12);
    if (Value::set({ 1, 2 }) != Value::set({ 2, 1 }))
        exit(13);
    if (Value::frozenset().toString() != "frozenset()")
        exit(14);
    Value rec = Value::record("Point", { { "x", 1 }, { "y", 2 } });
    if (rec.toString() != "Point(x=1,y=2)")
        exit(15);
    if (!rec.findField("y") || *rec.findField("y") != Value(2))
        exit(16);
    Value m = Value::mapping({ { "a", 1 }, { "b", 2 } });
    Value n = Value::mapping({ { "b", 2 }, { "a", 1 } });
    if (m != n)
        exit(17);
    if (!m.contains(Value("a")) || m.contains(Value("z")))
        exit(18);
}

void
sharing_test()
{
    Value inner = Value::mapping({ { "x", 1 } });
    Value outer = Value::mapping({ { "inner", inner } });
    inner["y"] = 2;
    if (outer.toString() != R"({"inner":{"x":1,"y":2}})")
        exit(20);
    Value copy = outer.deepCopy();
    inner["z"] = 3;
    if (copy.toString() != R"({"inner":{"x":1,"y":2}})")
        exit(21);
    if (copy.identity() == outer.identity())
        exit(22);
}

void
cycle_test()
{
    Value loop = Value::mapping({ { "x", 1 } });
    loop["self"] = loop;
    if (loop.toString() != R"({"x":1,"self":{...}})")
        exit(30);
    Value copy = loop.deepCopy();
    const Value* self = copy.find(Value("self"));
    if (!self || self->identity() != copy.identity())
        exit(31);
    if (copy.identity() == loop.identity())
        exit(32);
    // break the cycles so the containers are released
    loop["self"] = Value();
    copy["self"] = Value();
}

void
compare_test()
{
    int out = 0;
    if (!dt::compare(Value(1), Value(2.5), out) || out != -1)
        exit(40);
    if (!dt::compare(Value("b"), Value("a"), out) || out != 1)
        exit(41);
    if (dt::compare(Value("a"), Value(1), out))
        exit(42);
    if (!dt::compare(Value::sequence({ 1, 2 }), Value::sequence({ 1, 3 }), out) || out != -1)
        exit(43);
    if (dt::compare(Value::sequence({ 1 }), Value::tuple({ 1 }), out))
        exit(44);
}

void
float_test()
{
    double d = 0;
    if (!dt::parseFloat("1.5", d) || d != 1.5)
        exit(50);
    if (dt::parseFloat("abc", d) || dt::parseFloat("", d))
        exit(51);
    if (!dt::parseFloat("nan", d) || !std::isnan(d))
        exit(52);
    if (dt::formatFloat(0.1) != "0.1" || dt::formatFloat(2.5) != "2.5")
        exit(53);
}

void
truthy_test()
{
    if (Value().truthy() || Value(0).truthy() || Value("").truthy())
        exit(60);
    if (!Value(0.5).truthy() || !Value::sequence({ 0 }).truthy())
        exit(61);
    if (Value::mapping().truthy() || !Value::record("R").truthy())
        exit(62);
}

int
main()
{
    scalar_test();
    container_test();
    sharing_test();
    cycle_test();
    compare_test();
    float_test();
    truthy_test();
    return 0;
}
