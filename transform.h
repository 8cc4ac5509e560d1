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
#include "value.h"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace dt {

// One step of a transform pipeline: a registered name and its arguments,
// as written after a '|' in a path.
struct Transform
{
    std::string name;
    std::vector<Value> args;

    std::string render() const;
};

using Transforms = std::vector<Transform>;

using TransformFn =
  std::function<Value(const Value& value, const std::vector<Value>& args)>;

// Name to conversion function table. The global registry is seeded with
// the built-in conversions; callers may register more, or overwrite them,
// but nothing is ever removed. Registration is not synchronized.
class TransformRegistry
{
  public:
    TransformRegistry();

    static TransformRegistry& global();

    void registerTransform(const std::string& name, TransformFn fn);
    const TransformFn* find(const std::string& name) const;
    std::vector<std::string> names() const;

    // Runs the pipeline left to right. An unknown name is an error.
    Value apply(const Value& value, const Transforms& transforms) const;

  private:
    std::map<std::string, TransformFn> fns_;
};

// The `add` transform: numbers sum, strings, bytes and sequences of one
// kind concatenate. Anything else throws TransformError.
Value
addValues(const Value& lhs, const Value& rhs);

} // namespace dt
