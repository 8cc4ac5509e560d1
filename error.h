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
#include <stdexcept>
#include <string>

namespace dt {

// Base of everything the path engine throws on purpose. Absence is never
// an error; these report a structure that cannot be traversed the way the
// chain demands.
class Error : public std::runtime_error
{
  public:
    explicit Error(const std::string& what) : std::runtime_error(what)
    {
    }
};

// A mutation reached a scalar with no keyed, indexed or field access.
class TypeError : public Error
{
  public:
    explicit TypeError(const std::string& what) : Error(what)
    {
    }
};

// A mutation was routed through a derived view (e.g. a filtered slice).
class UnsupportedError : public Error
{
  public:
    explicit UnsupportedError(const std::string& what) : Error(what)
    {
    }
};

// A substitution was left unbound outside partial resolution.
class TemplateError : public Error
{
  public:
    explicit TemplateError(const std::string& what) : Error(what)
    {
    }
};

// A transform given the trailing "raises" mode could not convert its input.
class TransformError : public Error
{
  public:
    explicit TransformError(const std::string& what) : Error(what)
    {
    }
};

} // namespace dt
