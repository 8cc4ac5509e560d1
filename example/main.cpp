// -*- mode:c++;indent-tabs-mode:nil;c-basic-offset:4;coding:utf-8 -*-
// vi: set et ft=cpp ts=4 sts=4 sw=4 fenc=utf-8 :vi
//
// Example usage of the dt path library
//
// This example demonstrates basic usage of operator chains:
// - Reading concrete paths and patterns
// - Updating and building missing containers
// - Removing values
// - Filters, groups and recursive descent
// - Custom transforms
// - Error handling

#include "../dotted.h"
#include <iostream>
#include <string>

using dt::Path;
using dt::Value;
using namespace dt::ops;

static Value
makeStore()
{
    Value book1;
    book1["author"] = "Nigel Rees";
    book1["title"] = "Sayings of the Century";
    book1["price"] = 8.95;

    Value book2;
    book2["author"] = "Herman Melville";
    book2["title"] = "Moby Dick";
    book2["price"] = 8.99;

    Value book3;
    book3["author"] = "J. R. R. Tolkien";
    book3["title"] = "The Lord of the Rings";
    book3["price"] = 22.99;

    Value store;
    store["book"] = Value::sequence({ book1, book2, book3 });
    store["bicycle"] = Value::mapping({ { "color", "red" }, { "price", 19.95 } });
    return Value::mapping({ { "store", store } });
}

// Example 1: Read a concrete path and a pattern
void example_get()
{
    std::cout << "\n=== Example 1: Reading ===" << std::endl;

    Value d = makeStore();
    Path title({ key("store"), key("book"), slot(1), key("title") });
    std::cout << title.assemble() << " = " << dt::get(d, title).toString() << std::endl;

    Path titles({ key("store"), key("book"), slot(wild()), key("title") });
    std::cout << titles.assemble() << " = " << dt::get(d, titles).toString() << std::endl;

    Path missing({ key("store"), key("magazine") });
    std::cout << missing.assemble() << " = "
              << dt::get(d, missing, Value("none")).toString() << std::endl;
}

// Example 2: Update, creating the structure on the way
void example_update()
{
    std::cout << "\n=== Example 2: Updating ===" << std::endl;

    Value d = Value::mapping();
    d = dt::update(d, Path({ key("server"), key("ports"), slot(1) }), Value(8080));
    d = dt::update(d, Path({ key("server"), key("tags"), append() }), Value("web"));
    d = dt::update(d, Path({ key("server"), key("tags"), append() }), Value("api"));
    std::cout << d.toString() << std::endl;

    dt::Options copy;
    copy.mutate = false;
    Value other = dt::update(d, Path({ key("server"), key("host") }), Value("0.0.0.0"), copy);
    std::cout << "original: " << d.toString() << std::endl;
    std::cout << "copy:     " << other.toString() << std::endl;
}

// Example 3: Remove values
void example_remove()
{
    std::cout << "\n=== Example 3: Removing ===" << std::endl;

    Value d = makeStore();
    d = dt::remove(d, Path({ key("store"), key("book"), slot(wild()), key("price") }));
    d = dt::remove(d, Path({ key("store"), key("bicycle") }));
    std::cout << d.toString() << std::endl;
}

// Example 4: Filters and groups
void example_filters()
{
    std::cout << "\n=== Example 4: Filters and Groups ===" << std::endl;

    Value d = makeStore();
    Path cheap({ key("store"),
                 key("book"),
                 slot(wild(), { where("price", dt::Pred::Lt, num(10LL)) }),
                 key("title") });
    std::cout << "cheap: " << dt::get(d, cheap).toString() << std::endl;

    Path prices({ key("store"),
                  anyOf({ branch({ key("bicycle"), key("price") }),
                          branch({ key("book"), slot(0), key("price") }) }) });
    std::cout << "prices: " << dt::get(d, prices).toString() << std::endl;

    for (const std::string& p : dt::expand(d, prices))
        std::cout << "  " << p << std::endl;
}

// Example 5: Recursive descent
void example_recursive()
{
    std::cout << "\n=== Example 5: Recursive Descent ===" << std::endl;

    Value d = makeStore();
    Path everyPrice({ recursive(word("price")) });
    std::cout << "prices: " << dt::get(d, everyPrice).toString() << std::endl;

    dt::walk(d, everyPrice, [](const Path& p, const Value& v) {
        std::cout << "  " << p.assemble() << " -> " << v.toString() << std::endl;
        return true;
    });

    for (const auto& item : dt::unpack(Value::mapping({ { "a", Value::mapping({ { "b", 1 } }) }, { "c", 2 } })))
        std::cout << "  unpack " << item.first << " = " << item.second.toString() << std::endl;
}

// Example 6: Transforms
void example_transforms()
{
    std::cout << "\n=== Example 6: Transforms ===" << std::endl;

    dt::TransformRegistry::global().registerTransform(
      "double", [](const Value& v, const std::vector<Value>&) {
          if (v.isInt())
              return Value(v.getInt() * 2);
          return v;
      });

    Value d = Value::mapping({ { "count", 21 } });
    Path doubled({ key("count") }, { dt::Transform{ "double", {} } });
    std::cout << "read:  " << dt::get(d, doubled).toString() << std::endl;
    d = dt::apply(d, doubled);
    std::cout << "apply: " << d.toString() << std::endl;
}

// Example 7: Error handling
void example_error_handling()
{
    std::cout << "\n=== Example 7: Error Handling ===" << std::endl;

    Value d = Value::mapping({ { "a", 1 } });
    try {
        dt::update(d, Path({ key("a"), key("b") }), Value(2));
    } catch (const dt::TypeError& e) {
        std::cout << "TypeError (expected): " << e.what() << std::endl;
    }

    Path tmpl({ key("users"), key(subst(Value("name"))) });
    try {
        dt::get(d, tmpl);
    } catch (const dt::TemplateError& e) {
        std::cout << "TemplateError (expected): " << e.what() << std::endl;
    }
    Path bound = tmpl.resolve(Value::mapping({ { "name", "alice" } }));
    std::cout << "resolved: " << bound.assemble() << std::endl;
}

int main()
{
    std::cout << "Dotted Path Example Program" << std::endl;
    std::cout << "===========================" << std::endl;

    try {
        example_get();
        example_update();
        example_remove();
        example_filters();
        example_recursive();
        example_transforms();
        example_error_handling();
    } catch (const dt::Error& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nAll examples completed!" << std::endl;
    return 0;
}
