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
using dt::Pred;
using dt::Value;
using namespace dt::ops;

static Value
user(long long id, const char* name, const char* city)
{
    return Value::mapping({ { "id", id },
                            { "name", name },
                            { "address", Value::mapping({ { "city", city } }) } });
}

static Value
users()
{
    return Value::mapping({ { "users",
                              Value::sequence({ user(1, "alice", "paris"),
                                                user(2, "bob", "rome"),
                                                user(3, "carol", "paris") }) } });
}

static Path
names(dt::FilterPtr filter)
{
    return Path({ key("users"), slot(wild(), { filter }), key("name") });
}

void
key_value_test()
{
    Value d = users();
    if (dt::get(d, names(where("id", Pred::Eq, num(2LL)))).toString() != R"(("bob",))")
        exit(1);
    if (dt::get(d, names(where(field({ "address", "city" }), Pred::Eq, text("paris"))))
          .toString() != R"(("alice","carol"))")
        exit(2);
    if (dt::get(d, names(where("name", Pred::Ne, text("bob")))).toString() !=
        R"(("alice","carol"))")
        exit(3);
    if (dt::get(d, names(where("id", Pred::Gt, num(1LL)))).toString() != R"(("bob","carol"))")
        exit(4);
    if (dt::get(d, names(where("id", Pred::Le, num(1LL)))).toString() != R"(("alice",))")
        exit(5);
    if (dt::get(d, names(where("name", Pred::Eq, regex("[ab].*")))).toString() !=
        R"(("alice","bob"))")
        exit(6);
    // a missing field never satisfies the filter
    if (dt::get(d, names(where("age", Pred::Eq, wild()))).toString() != "()")
        exit(7);
}

void
compound_test()
{
    Value d = users();
    auto paris = where(field({ "address", "city" }), Pred::Eq, text("paris"));
    auto notAlice = where("name", Pred::Ne, text("alice"));
    if (dt::get(d, names(filterAnd({ paris, notAlice }))).toString() != R"(("carol",))")
        exit(10);
    if (dt::get(d, names(filterOr({ where("id", Pred::Eq, num(1LL)), where("id", Pred::Eq, num(3LL)) })))
          .toString() != R"(("alice","carol"))")
        exit(11);
    if (dt::get(d, names(filterNot(paris))).toString() != R"(("bob",))")
        exit(12);
    if (dt::get(d, names(filterFirst(paris))).toString() != R"(("alice",))")
        exit(13);
}

void
slice_filter_test()
{
    Value d = users();
    Path parisians({ key("users"),
                     sliceFilter({ where(field({ "address", "city" }), Pred::Eq, text("paris")) }) });
    Value picked = dt::get(d, parisians);
    if (!picked.isSequence() || picked.size() != 2)
        exit(20);
    try {
        dt::update(d, parisians, Value::sequence());
        exit(21);
    } catch (const dt::UnsupportedError&) {
    }
    Value rest = dt::remove(d, parisians);
    if (dt::get(rest, Path({ key("users"), slot(wild()), key("name") })).toString() !=
        R"(("bob",))")
        exit(22);
}

void
key_filter_test()
{
    Value d = Value::mapping({ { "a", Value::mapping({ { "x", 1 } }) },
                               { "b", Value::mapping({ { "x", 2 } }) },
                               { "c", 5 } });
    Path two({ key(wild(), { where("x", Pred::Eq, num(2LL)) }) });
    if (dt::get(d, two).toString() != R"(({"x":2},))")
        exit(30);
    if (dt::expand(d, two) != std::vector<std::string>{ "b" })
        exit(31);
    Path asText({ key(wild(), { where(field({ "x" }), Pred::Eq, text("1"), { dt::Transform{ "str", {} } }) }) });
    if (dt::expand(d, asText) != std::vector<std::string>{ "a" })
        exit(32);
}

void
filtered_update_test()
{
    Value d = users();
    d = dt::update(d, names(where("id", Pred::Eq, num(2LL))), Value("robert"));
    if (dt::get(d, Path({ key("users"), slot(1), key("name") })) != Value("robert"))
        exit(40);
    d = dt::remove(d, Path({ key("users"), slot(wild(), { where("id", Pred::Eq, num(3LL)) }) }));
    if (dt::get(d, Path({ key("users") })).size() != 2)
        exit(41);
}

void
render_test()
{
    if (where("id", Pred::Eq, num(1LL))->render() != "id=1")
        exit(50);
    if (where("id", Pred::Ge, num(2LL))->render() != "id>=2")
        exit(51);
    if (where(field({ "address", "city" }), Pred::Eq, text("paris"))->render() !=
        "address.city='paris'")
        exit(52);
}

int
main()
{
    key_value_test();
    compound_test();
    slice_filter_test();
    key_filter_test();
    filtered_update_test();
    render_test();
    return 0;
}
