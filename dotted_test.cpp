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
#include <atomic>
#include <chrono>
#include <climits>
#include <cstdio>
#include <cstdlib>

using dt::Path;
using dt::Value;
using namespace dt::ops;

#define BENCH(ITERATIONS, WORK_PER_RUN, CODE) \
    do { \
        auto start = std::chrono::high_resolution_clock::now(); \
        for (int __i = 0; __i < ITERATIONS; ++__i) { \
            std::atomic_signal_fence(std::memory_order_acq_rel); \
            CODE; \
        } \
        auto end = std::chrono::high_resolution_clock::now(); \
        auto duration = \
          std::chrono::duration_cast<std::chrono::nanoseconds>(end - start); \
        long long work = (WORK_PER_RUN) * (ITERATIONS); \
        double nanos = (duration.count() + work - 1) / (double)work; \
        printf("%10g ns %2dx %s\n", nanos, (ITERATIONS), #CODE); \
    } while (0)

static Value
hello()
{
    return Value::mapping(
      { { "hello", Value::mapping({ { "there", Value::sequence({ 1, 2, 3 }) } }) } });
}

void
get_test()
{
    Value d = hello();
    if (dt::get(d, Path({ key("hello"), key("there"), slot(1) })) != Value(2))
        exit(1);
    if (!dt::get(d, Path({ key("hello"), key("bye") })).isNull())
        exit(2);
    if (dt::get(d, Path({ key("nope") }), Value("x")) != Value("x"))
        exit(3);
    Value all = dt::get(d, Path({ key("hello"), key("there"), slot(wild()) }));
    if (all.toString() != "(1,2,3)")
        exit(4);
    Value none = dt::get(d, Path({ key("hello"), key(wild()), key("x") }));
    if (none.toString() != "()")
        exit(5);
    Value tail = dt::get(d, Path({ key("hello"), key("there"), slice(1) }));
    if (tail.toString() != "[2,3]")
        exit(6);
    if (!dt::has(d, Path({ key("hello"), key(wild()) })))
        exit(7);
    if (dt::has(d, Path({ key("hello"), key("bye") })))
        exit(8);
    Value first = dt::get(d, Path({ key("hello"), key("there"), slot(wild(true)) }));
    if (first.toString() != "(1,)")
        exit(9);
}

void
update_test()
{
    Value d = hello();
    Value r = dt::update(d, Path({ key("hello"), key("there"), slot(1) }), Value(9));
    if (r.toString() != R"({"hello":{"there":[1,9,3]}})")
        exit(10);
    if (d.toString() != r.toString())
        exit(11);

    Value built = dt::update(Value::mapping(),
                             Path({ key("a"), key("b"), key("c"), slot(2) }),
                             Value("x"));
    if (built.toString() != R"({"a":{"b":{"c":[null,null,"x"]}}})")
        exit(12);

    Value q = Value::mapping();
    q = dt::update(q, Path({ key("queries"), append(), key("name") }), Value("hello"));
    if (q.toString() != R"({"queries":[{"name":"hello"}]})")
        exit(13);
    q = dt::update(q, Path({ key("queries"), append() }), Value("bye"));
    if (q.toString() != R"({"queries":[{"name":"hello"},"bye"]})")
        exit(14);

    Value n = dt::update(Value::mapping(), Path({ key("hello"), key(7), key("me") }), Value("bye"));
    if (n.toString() != R"({"hello":{7:{"me":"bye"}}})")
        exit(15);

    Value s = dt::update(Value::mapping(), Path({ key("a") }), Value("x"));
    if (dt::get(s, Path({ key("a") })) != Value("x"))
        exit(16);
}

void
update_error_test()
{
    Value d = Value::mapping({ { "a", 1 } });
    try {
        dt::update(d, Path({ key("a"), key("b") }), Value(2));
        exit(20);
    } catch (const dt::TypeError& e) {
        if (std::string(e.what()).find("Cannot update int at 'a'") != 0)
            exit(21);
    }
    try {
        dt::get(d, Path({ key(subst(Value(0))) }));
        exit(22);
    } catch (const dt::TemplateError&) {
    }
    Path bound = Path({ key(subst(Value(0))) }).resolve(Value::sequence({ "a" }));
    if (dt::get(d, bound) != Value(1))
        exit(23);
}

void
remove_test()
{
    Value d = hello();
    d = dt::remove(d, Path({ key("hello"), key("there"), slot(-1) }));
    if (d.toString() != R"({"hello":{"there":[1,2]}})")
        exit(30);
    d = dt::remove(d, Path({ key("hello"), key("there"), slot(wild()) }), Value(1));
    if (d.toString() != R"({"hello":{"there":[2]}})")
        exit(31);
    d = dt::remove(d, Path({ key("hello"), key("there") }), Value::sequence({ 2 }));
    if (d.toString() != R"({"hello":{}})")
        exit(32);

    Path p({ key("a"), key("b") });
    Value once = dt::remove(Value::mapping({ { "a", Value::mapping({ { "b", 1 }, { "c", 2 } }) } }), p);
    Value twice = dt::remove(once.deepCopy(), p);
    if (once != twice || once.toString() != R"({"a":{"c":2}})")
        exit(33);
    if (dt::remove(Value::mapping(), p).toString() != "{}")
        exit(34);
}

void
invert_test()
{
    Value d = Value::mapping(
      { { "hello", Value::mapping({ { "there", Value::mapping({ { "me", "bye" } }) } }) } });
    Value r = dt::update(d, Path({ invert(), key("hello"), key("there") }), dt::Payload());
    if (r.toString() != R"({"hello":{}})")
        exit(40);
    Value back = dt::remove(Value::mapping(),
                            Path({ invert(), key("hello"), key("there") }),
                            Value::sequence({ 2 }));
    if (back.toString() != R"({"hello":{"there":[2]}})")
        exit(41);
}

void
mutate_test()
{
    Value d = Value::mapping({ { "a", 1 } });
    dt::Options opts;
    opts.mutate = false;
    Value r = dt::update(d, Path({ key("a") }), Value(2), opts);
    if (d.toString() != R"({"a":1})" || r.toString() != R"({"a":2})")
        exit(50);
    Value t = Value::tuple({ 1, 2 });
    Value u = dt::update(t, Path({ slot(0) }), Value("x"));
    if (t.toString() != "(1,2)" || u.toString() != R"(("x",2))")
        exit(51);
    Value nested = Value::mapping({ { "a", Value::tuple({ 1, 2 }) } });
    dt::update(nested, Path({ key("a"), slot(1) }), Value(5));
    if (nested.toString() != R"({"a":(1,5)})")
        exit(52);
}

void
cut_test()
{
    Path p({ anyOf({ branch({ key("a") }, dt::Cut::Hard), branch({ key("b") }) }) });
    if (dt::get(Value::mapping({ { "a", 1 }, { "b", 2 } }), p).toString() != "(1,)")
        exit(60);
    if (dt::get(Value::mapping({ { "b", 2 } }), p).toString() != "(2,)")
        exit(61);
    Path both({ anyOf({ branch({ key("a") }), branch({ key("b") }) }) });
    if (dt::get(Value::mapping({ { "a", 1 }, { "b", 2 } }), both).toString() != "(1,2)")
        exit(62);

    // a hard cut inside a nested group ends that group, not the outer one
    Path nested({ anyOf({ branch({ anyOf({ branch({ key("x") }, dt::Cut::Hard),
                                           branch({ key("y") }) }) }),
                          branch({ key("z") }) }) });
    Value xyz = Value::mapping({ { "x", 1 }, { "y", 5 }, { "z", 2 } });
    if (dt::get(xyz, nested).toString() != "(1,2)")
        exit(63);
}

static Value
softcutData()
{
    return Value::mapping(
      { { "a", Value::mapping({ { "b", 1 }, { "c", 2 } }) }, { "x", 3 } });
}

void
softcut_test()
{
    // later branches skip paths an earlier soft-cut branch already covered
    Path deeper({ anyOf({ branch({ key("a"), key("b") }, dt::Cut::Soft),
                          branch({ key("a"), key(wild()) }) }) });
    if (dt::get(softcutData(), deeper).toString() != "(1,2)")
        exit(64);
    Path shallower({ anyOf({ branch({ key("a") }, dt::Cut::Soft),
                             branch({ key("a"), key("c") }),
                             branch({ key("x") }) }) });
    if (dt::get(softcutData(), shallower).toString() != R"(({"b":1,"c":2},3))")
        exit(65);
    Value up = dt::update(softcutData(), deeper, Value(9));
    if (up.toString() != R"({"a":{"b":9,"c":9},"x":3})")
        exit(66);
    Value rm = dt::remove(softcutData(), deeper);
    if (rm.toString() != R"({"a":{},"x":3})")
        exit(67);
}

void
slice_test()
{
    Value d = Value::sequence({ 0, 1, 2, 3, 4 });
    if (dt::get(d, Path({ slice(1, std::nullopt, LLONG_MAX) })).toString() != "[1]")
        exit(150);
    if (dt::get(d, Path({ slice(std::nullopt, std::nullopt, -2) })).toString() != "[4,2,0]")
        exit(151);
    Value every = dt::update(d.deepCopy(),
                             Path({ slice(std::nullopt, std::nullopt, 2) }),
                             Value::sequence({ 7, 8, 9 }));
    if (every.toString() != "[7,1,8,3,9]")
        exit(152);
    Value back = dt::update(d.deepCopy(),
                            Path({ slice(std::nullopt, std::nullopt, -2) }),
                            Value::sequence({ 7, 8, 9 }));
    if (back.toString() != "[9,1,8,3,7]")
        exit(153);
    try {
        dt::update(d.deepCopy(), Path({ slice(std::nullopt, std::nullopt, 2) }), Value::sequence({ 7 }));
        exit(154);
    } catch (const dt::Error&) {
    }
    if (d.toString() != "[0,1,2,3,4]")
        exit(155);
}

void
recursive_test()
{
    Value d = Value::mapping({ { "a", Value::mapping({ { "b", 1 } }) }, { "c", 2 } });
    dt::DepthRange leaves;
    leaves.start = -1;
    if (dt::get(d, Path({ recursive(wild(), leaves) })).toString() != "(1,2)")
        exit(70);

    Value e = Value::mapping({ { "a", Value::mapping({ { "b", Value::mapping({ { "c", 1 } }) } }) },
                               { "x", Value::mapping({ { "b", Value::mapping({ { "c", 2 } }) } }) } });
    if (dt::get(e, Path({ recursive(wild()), key("c") })).toString() != "(1,2)")
        exit(71);

    Value f = Value::mapping({ { "b", Value::mapping({ { "b", Value::mapping({ { "c", 1 } }) } }) } });
    if (dt::get(f, Path({ recursive(word("b")), key("c") })).toString() != "(1,)")
        exit(72);

    Value g = Value::mapping({ { "a", Value::mapping({ { "b", 7 }, { "c", 3 } }) }, { "d", 7 } });
    Path sevens({ guard(recursive(wild()), dt::Pred::Eq, num(7LL)) });
    if (dt::get(g, sevens).toString() != "(7,7)")
        exit(73);
    Value up = dt::update(g.deepCopy(), sevens, Value(99));
    if (up.toString() != R"({"a":{"b":99,"c":3},"d":99})")
        exit(74);
    Value rm = dt::remove(g.deepCopy(), sevens);
    if (rm.toString() != R"({"a":{"c":3}})")
        exit(75);

    // a mapping holding itself
    Value loop = Value::mapping({ { "x", 1 } });
    loop["self"] = loop;
    Value found = dt::get(loop, Path({ recursive(wild()) }));
    if (!found.isSequence() || found.size() != 2)
        exit(76);
    loop["self"] = Value();
}

void
pattern_test()
{
    auto p = seqOf({ lit(1), glob(), lit(3) });
    if (!p->test(Value::sequence({ 1, 3 })))
        exit(80);
    if (!p->test(Value::sequence({ 1, 2, 3 })))
        exit(81);
    if (!p->test(Value::sequence({ 1, 2, 2, 3 })))
        exit(82);
    if (p->test(Value::sequence({ 1, 2, 4 })))
        exit(83);
    Value rows = Value::sequence({ Value::sequence({ 1, 3 }), Value::sequence({ 2 }) });
    Value hits = dt::get(rows, Path({ guard(slot(wild()), dt::Pred::Eq, p) }));
    if (hits.toString() != "([1,3],)")
        exit(84);
}

void
groups_test()
{
    Path first({ firstOf({ branch({ key("name"), nop(key("first")) }),
                           branch({ key("name"), key("first") }) }) });
    Value kept = Value::mapping({ { "name", Value::mapping({ { "first", "alice" } }) } });
    kept = dt::update(kept, first, Value("bob"));
    if (kept.toString() != R"({"name":{"first":"alice"}})")
        exit(90);
    Value filled = Value::mapping({ { "name", Value::mapping() } });
    filled = dt::update(filled, first, Value("bob"));
    if (filled.toString() != R"({"name":{"first":"bob"}})")
        exit(91);

    Path both({ allOf({ branch({ key("a") }), branch({ key("b") }) }) });
    if (dt::get(Value::mapping({ { "a", 1 } }), both).toString() != "()")
        exit(92);
    if (dt::get(Value::mapping({ { "a", 1 }, { "b", 2 } }), both).toString() != "(1,2)")
        exit(93);

    Path others({ noneOf(branch({ key("a") })) });
    if (dt::get(Value::mapping({ { "a", 1 }, { "b", 2 }, { "c", 3 } }), others).toString() != "(2,3)")
        exit(94);

    Path fallback({ anyOf({ branch({ key("x") }), branch({ key("y") }) }) });
    Value made = dt::update(Value::mapping(), fallback, Value(1));
    if (made.toString() != R"({"x":1})")
        exit(95);
}

void
expand_test()
{
    Value d = hello();
    d["bye"] = 7;
    d.getEntries().emplace_back(Value(9), Value("nine"));
    d.getEntries().emplace_back(Value("9"), Value("not nine"));
    std::vector<std::string> keys = dt::expand(d, Path({ key(wild()) }));
    if (keys != std::vector<std::string>{ "hello", "bye", "9", "'9'" })
        exit(100);
    keys = dt::expand(d, Path({ key(wild()), key(wild()), slot(wild()) }));
    if (keys != std::vector<std::string>{ "hello.there[0]", "hello.there[1]", "hello.there[2]" })
        exit(101);

    Value e = Value::mapping({ { "hello", 7 },
                               { "there", 9 },
                               { "a", Value::mapping({ { "b", "seven" }, { "c", "nine" } }) } });
    dt::Plucked got = dt::pluck(e, Path({ key("a"), key(wild()) }));
    if (got.size() != 2 || got[0].first != "a.b" || got[1].second != Value("nine"))
        exit(102);

    // values found by a pattern are found again through their concrete paths
    Path pat({ key(wild()), key(wild()), slot(wild()) });
    Value values = dt::get(d, pat);
    std::vector<std::string> paths = dt::expand(d, pat);
    size_t i = 0;
    dt::walk(d, pat, [&](const Path& concrete, const Value& v) {
        if (concrete.assemble() != paths[i] || v != values.getItems()[i])
            exit(103);
        if (dt::get(d, concrete) != v)
            exit(104);
        ++i;
        return true;
    });
    if (i != 3)
        exit(105);
}

void
unpack_test()
{
    Value d = Value::mapping(
      { { "a", Value::mapping({ { "b", Value::sequence({ 1, 2, 3 }) } }) },
        { "x", Value::mapping({ { "y", Value::mapping({ { "z", Value::sequence({ 4, 5 }) } }) } }) },
        { "extra", "stuff" } });
    dt::Plucked r = dt::unpack(d);
    if (r.size() != 3)
        exit(110);
    if (r[0].first != "a.b" || r[0].second.toString() != "[1,2,3]")
        exit(111);
    if (r[1].first != "x.y.z" || r[1].second.toString() != "[4,5]")
        exit(112);
    if (r[2].first != "extra" || r[2].second != Value("stuff"))
        exit(113);
}

void
build_apply_test()
{
    Value built = dt::build(Value::mapping(), Path({ key("hello"), key("there") }));
    if (built.toString() != R"({"hello":{"there":null}})")
        exit(120);

    Value d = Value::mapping({ { "hello", 7 } });
    d = dt::apply(d, Path({ key("hello") }, { dt::Transform{ "str", {} } }));
    if (d.toString() != R"({"hello":"7"})")
        exit(121);

    Value s = Value::mapping({ { "hello", "there" } });
    if (dt::setdefault(s, Path({ key("hello") }), Value("world")) != Value("there"))
        exit(122);
    if (dt::setdefault(s, Path({ key("bye") }), Value("world")) != Value("world"))
        exit(123);
    if (s.toString() != R"({"hello":"there","bye":"world"})")
        exit(124);

    Value m = dt::updateIf(Value::mapping(), Path({ key("a") }), Value());
    if (m.toString() != "{}")
        exit(125);
    m = dt::updateMulti(m, { { Path({ key("a") }), Value(1) }, { Path({ key("b"), key("c") }), Value(2) } });
    if (m.toString() != R"({"a":1,"b":{"c":2}})")
        exit(126);
    m = dt::removeMulti(m, { Path({ key("a") }), Path({ key("b"), key("c") }) });
    if (m.toString() != R"({"b":{}})")
        exit(127);
}

void
match_test()
{
    Path there({ key("hello"), key("there") });
    if (dt::match(Path({ key(wild()), key("there") }), there) != std::string("hello.there"))
        exit(130);
    if (dt::match(Path({ key(wild()), key(wild()) }), Path({ key("hello") })))
        exit(131);
    if (dt::match(Path({ key(wild()) }), there, false))
        exit(132);
    auto g = dt::matchGroups(Path({ key("hello"), key(wild()) }),
                             Path({ key("hello"), key("there"), key("bye") }));
    if (!g || g->second.size() != 2 || g->second[1] != Value("there.bye"))
        exit(133);
    if (!dt::match(Path({ recursive(wild()), key("c") }), Path({ key("a"), key("b"), key("c") })))
        exit(134);
    if (dt::match(Path({ recursive(word("b")) }), Path({ key("a"), key("b"), key("c") })))
        exit(135);
    if (!dt::overlaps(Path({ key("a") }), Path({ key("a"), key("b") })))
        exit(136);
    if (dt::overlaps(Path({ key("a"), key("b") }), Path({ key("a"), key("c") })))
        exit(137);
}

void
cache_test()
{
    dt::PathCache cache;
    int compiled = 0;
    auto compile = [&compiled](const std::string& source) {
        ++compiled;
        return Path({ key(source) });
    };
    cache.get("a", compile);
    cache.get("a", compile);
    if (compiled != 1)
        exit(140);
    for (size_t i = 0; i < dt::PathCache::kMaxEntries + 10; ++i)
        cache.get("k" + std::to_string(i), compile);
    if (cache.size() != dt::PathCache::kMaxEntries)
        exit(141);
    const Path& p = dt::getThreadLocalCache().get("hello", compile);
    if (p.assemble() != "hello")
        exit(142);
}

int
main()
{
    get_test();
    update_test();
    update_error_test();
    remove_test();
    invert_test();
    mutate_test();
    cut_test();
    softcut_test();
    slice_test();
    recursive_test();
    pattern_test();
    groups_test();
    expand_test();
    unpack_test();
    build_apply_test();
    match_test();
    cache_test();

    BENCH(2000, 1, get_test());
    BENCH(2000, 1, update_test());
    BENCH(2000, 1, recursive_test());
    BENCH(2000, 1, groups_test());
}
