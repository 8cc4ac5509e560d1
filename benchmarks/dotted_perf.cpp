#include "dotted.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>
#include <vector>

namespace bench
{

using Clock = std::chrono::high_resolution_clock;

struct BenchCase
{
    std::string name;
    std::size_t iterations;
    std::function<void()> prepare;
    std::function<void()> body;
};

static volatile std::uint64_t g_sink = 0;

// Median ns/op over `runs` timed passes; `prepare` runs untimed before each.
inline double
Measure(const BenchCase& c, int runs)
{
    std::vector<double> samples;
    for (int run = 0; run < runs; ++run) {
        if (c.prepare)
            c.prepare();
        Clock::time_point start = Clock::now();
        for (std::size_t i = 0; i < c.iterations; ++i)
            c.body();
        Clock::time_point end = Clock::now();
        samples.push_back(
          std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count() /
          static_cast<double>(c.iterations));
    }
    std::sort(samples.begin(), samples.end());
    return samples[samples.size() / 2];
}

} // namespace bench

// Orders with nested customers and line items, `count` of them.
static dt::Value
makeOrders(int count)
{
    dt::Values orders;
    for (int i = 0; i < count; ++i) {
        dt::Values items;
        for (int j = 0; j < 4; ++j)
            items.push_back(dt::Value::mapping({ { "sku", "sku-" + std::to_string(j) },
                                                 { "qty", j + 1 },
                                                 { "price", 1.5 * (j + i % 7) } }));
        dt::Value order;
        order["id"] = i;
        order["customer"] = dt::Value::mapping({ { "name", "customer-" + std::to_string(i % 50) },
                                                 { "vip", i % 10 == 0 } });
        order["items"] = dt::Value::sequence(items);
        orders.push_back(order);
    }
    return dt::Value::mapping({ { "orders", dt::Value::sequence(orders) } });
}

int
main(int argc, char** argv)
{
    using namespace bench;
    using namespace dt::ops;
    using dt::Path;
    using dt::Value;

    // dotted_perf [RUNS] [FILTER]
    int runs = argc > 1 ? std::atoi(argv[1]) : 5;
    const char* filter = argc > 2 ? argv[2] : nullptr;
    if (runs < 1)
        runs = 1;

    const Value small = makeOrders(10);
    const Value large = makeOrders(1000);
    Value scratch;

    const Path concrete({ key("orders"), slot(5), key("customer"), key("name") });
    const Path everyQty({ key("orders"), slot(wild()), key("items"), slot(wild()), key("qty") });
    const Path vipIds({ key("orders"),
                        slot(wild(), { where(field({ "customer", "vip" }), dt::Pred::Eq, boolean(true)) }),
                        key("id") });
    const Path deepPrices({ recursive(word("price")) });
    const Path names({ key("orders"),
                       slot(wild()),
                       anyOf({ branch({ key("customer"), key("name") }),
                               branch({ key("nickname") }) }) });

    std::vector<BenchCase> cases;

    cases.push_back({ "get.concrete", 20000, std::function<void()>(), [&]() {
                          g_sink += dt::get(small, concrete).isString();
                      } });

    cases.push_back({ "get.wildcard_small", 2000, std::function<void()>(), [&]() {
                          g_sink += dt::get(small, everyQty).size();
                      } });

    cases.push_back({ "get.wildcard_large", 20, std::function<void()>(), [&]() {
                          g_sink += dt::get(large, everyQty).size();
                      } });

    cases.push_back({ "get.filtered_large", 20, std::function<void()>(), [&]() {
                          g_sink += dt::get(large, vipIds).size();
                      } });

    cases.push_back({ "get.recursive_large", 5, std::function<void()>(), [&]() {
                          g_sink += dt::get(large, deepPrices).size();
                      } });

    cases.push_back({ "get.group_large", 20, std::function<void()>(), [&]() {
                          g_sink += dt::get(large, names).size();
                      } });

    cases.push_back({ "expand.wildcard_small", 500, std::function<void()>(), [&]() {
                          g_sink += dt::expand(small, everyQty).size();
                      } });

    cases.push_back({ "update.concrete", 20000,
                      [&]() { scratch = small.deepCopy(); },
                      [&]() {
                          scratch = dt::update(scratch, concrete, Value("x"));
                          g_sink += scratch.size();
                      } });

    cases.push_back({ "update.build_missing", 20000, std::function<void()>(), [&]() {
                          Value made = dt::update(Value::mapping(),
                                                  Path({ key("a"), key("b"), slot(3), key("c") }),
                                                  Value(1));
                          g_sink += made.size();
                      } });

    cases.push_back({ "update.wildcard_large", 5,
                      [&]() { scratch = large.deepCopy(); },
                      [&]() {
                          scratch = dt::update(scratch, everyQty, Value(0));
                          g_sink += scratch.size();
                      } });

    cases.push_back({ "remove.wildcard_large", 1,
                      [&]() { scratch = large.deepCopy(); },
                      [&]() {
                          scratch = dt::remove(scratch, everyQty);
                          g_sink += scratch.size();
                      } });

    cases.push_back({ "unpack.small", 200, std::function<void()>(), [&]() {
                          g_sink += dt::unpack(small).size();
                      } });

    cases.push_back({ "match.recursive", 20000, std::function<void()>(), [&]() {
                          g_sink += static_cast<bool>(dt::match(deepPrices, concrete));
                      } });

    for (const BenchCase& c : cases) {
        if (filter && c.name.find(filter) == std::string::npos)
            continue;
        std::printf("%-28s %12.2f ns/op  iter=%zu\n", c.name.c_str(), Measure(c, runs), c.iterations);
    }
    std::printf("sink=%llu\n", static_cast<unsigned long long>(g_sink));
    return 0;
}
