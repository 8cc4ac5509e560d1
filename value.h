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

#pragma once
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dt {

class Value;

struct RecordData
{
    std::string name;
    std::vector<std::pair<std::string, Value>> fields;
};

// Generic value tree. Containers are reference counted and shared between
// copies of a Value, so that in-place mutation is visible to every holder
// and so that a container may (indirectly) contain itself.
class Value
{
  public:
    enum Type : char
    {
        Null,
        Bool,
        Int,
        Float,
        String,
        Bytes,
        Sequence,
        Mapping,
        Set,
        Record
    };

    enum Mutability : char
    {
        InPlace,
        CopyOnWrite
    };

    using Items = std::vector<Value>;
    using Entry = std::pair<Value, Value>;
    using Entries = std::vector<Entry>;
    using Field = std::pair<std::string, Value>;

    Value() : type_(Null)
    {
    }

    Value(std::nullptr_t) : type_(Null)
    {
    }

    Value(bool value) : type_(Bool), bool_value(value)
    {
    }

    Value(int value) : type_(Int), int_value(value)
    {
    }

    Value(long value) : type_(Int), int_value(value)
    {
    }

    Value(long long value) : type_(Int), int_value(value)
    {
    }

    Value(unsigned value) : type_(Int), int_value(value)
    {
    }

    Value(unsigned long value);
    Value(unsigned long long value);

    Value(double value) : type_(Float), float_value(value)
    {
    }

    Value(const char* value);
    Value(const std::string& value);
    Value(std::string&& value);

    ~Value();

    Value(const Value& other);
    Value& operator=(const Value& other);
    Value(Value&& other) noexcept;
    Value& operator=(Value&& other) noexcept;

    static Value bytes(const std::string& value);
    static Value sequence(std::initializer_list<Value> items = {},
                          Mutability mut = InPlace);
    static Value sequence(Items items, Mutability mut = InPlace);
    static Value tuple(std::initializer_list<Value> items = {});
    static Value mapping(std::initializer_list<Entry> entries = {},
                         Mutability mut = InPlace);
    static Value mapping(Entries entries, Mutability mut = InPlace);
    static Value set(std::initializer_list<Value> items = {},
                     Mutability mut = InPlace);
    static Value set(Items items, Mutability mut = InPlace);
    static Value frozenset(std::initializer_list<Value> items = {});
    static Value record(const std::string& name,
                        std::initializer_list<Field> fields = {},
                        Mutability mut = InPlace);
    static Value record(const std::string& name,
                        std::vector<Field> fields,
                        Mutability mut = InPlace);

    Type getType() const
    {
        return type_;
    }

    Mutability getMutability() const
    {
        return mut_;
    }

    bool isNull() const
    {
        return type_ == Null;
    }

    bool isBool() const
    {
        return type_ == Bool;
    }

    bool isInt() const
    {
        return type_ == Int;
    }

    bool isFloat() const
    {
        return type_ == Float;
    }

    bool isNumber() const
    {
        return type_ == Bool || type_ == Int || type_ == Float;
    }

    bool isString() const
    {
        return type_ == String;
    }

    bool isBytes() const
    {
        return type_ == Bytes;
    }

    bool isSequence() const
    {
        return type_ == Sequence;
    }

    bool isMapping() const
    {
        return type_ == Mapping;
    }

    bool isSet() const
    {
        return type_ == Set;
    }

    bool isRecord() const
    {
        return type_ == Record;
    }

    bool isContainer() const
    {
        return type_ >= Sequence;
    }

    bool isMutable() const
    {
        return isContainer() && mut_ == InPlace;
    }

    bool getBool() const;
    long long getInt() const;
    double getFloat() const;
    double getNumber() const;
    std::string& getString();
    const std::string& getString() const;
    Items& getItems();
    const Items& getItems() const;
    Entries& getEntries();
    const Entries& getEntries() const;
    RecordData& getRecord();
    const RecordData& getRecord() const;

    // Container address, or nullptr for scalars.
    const void* identity() const;

    size_t size() const;
    bool truthy() const;

    const Value* find(const Value& key) const;
    const Value* findField(const std::string& name) const;
    bool contains(const Value& key) const;
    bool containsItem(const Value& item) const;

    Value& operator[](size_t index);
    Value& operator[](const std::string& key);

    // Copy that shares nothing with the original. Shared and cyclic
    // structure is reproduced, not expanded.
    Value deepCopy() const;

    std::string toString() const;
    std::string str() const;

    friend bool operator==(const Value& lhs, const Value& rhs);
    friend bool operator!=(const Value& lhs, const Value& rhs)
    {
        return !(lhs == rhs);
    }

    static const char* TypeToString(Type type);

  private:
    Type type_;
    Mutability mut_ = InPlace;
    union
    {
        bool bool_value;
        long long int_value;
        double float_value;
        std::string string_value;
        std::shared_ptr<Items> items_value;
        std::shared_ptr<Entries> entries_value;
        std::shared_ptr<RecordData> record_value;
    };

    void clear();
    void assign(const Value& other);
    void steal(Value& other);
    void setMapping();
    void setSequence();
    void marshal(std::string& b,
                 bool quoted,
                 std::vector<const void*>& visiting) const;
    Value copyInto(std::vector<std::pair<const void*, Value>>& memo) const;
};

// Three way ordering for the relational predicates. Returns false when the
// two values have no ordering (e.g. a string against an int).
bool
compare(const Value& lhs, const Value& rhs, int& out);

std::string
formatFloat(double value);

bool
parseFloat(const std::string& text, double& out);

} // namespace dt
