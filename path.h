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
#include "match.h"
#include "segment.h"
#include "transform.h"
#include "value.h"
#include <memory>
#include <string>
#include <vector>

namespace dt {

// A compiled operator chain: the segments to walk, the transforms applied
// to every value found, and an optional guard those values must pass.
// Paths are immutable and cheap to copy.
class Path
{
  public:
    Path();
    Path(std::vector<SegmentPtr> ops, Transforms transforms = {});

    const std::vector<SegmentPtr>& ops() const
    {
        return *ops_;
    }

    OpList opList() const
    {
        return OpList(ops_);
    }

    const Transforms& transforms() const
    {
        return transforms_;
    }

    const MatcherPtr& guard() const
    {
        return guard_;
    }

    Pred guardPred() const
    {
        return guardPred_;
    }

    size_t size() const
    {
        return ops_->size();
    }

    bool empty() const
    {
        return ops_->empty();
    }

    Path withTransforms(Transforms transforms) const;
    Path withGuard(Pred pred, MatcherPtr guard) const;

    bool isPattern() const;
    bool isInverted() const;
    bool isTemplate() const;

    Value apply(const Value& value, const TransformRegistry& registry) const;
    bool guardMatches(const Value& value) const;

    // Binds $N and $(name) substitutions. With `partial`, unbound ones are
    // kept; otherwise they throw TemplateError.
    Path resolve(const Value& bindings, bool partial = false) const;

    // Dotted notation for the chain, transforms included.
    std::string assemble(size_t start = 0, bool pedantic = false) const;

  private:
    std::shared_ptr<const std::vector<SegmentPtr>> ops_;
    Transforms transforms_;
    Pred guardPred_ = Pred::Eq;
    MatcherPtr guard_;
};

// Dotted notation for a segment list. A trailing "[]" is dropped unless
// `pedantic` is set or it follows another "[]".
std::string
assemble(const std::vector<SegmentPtr>& ops,
         size_t start = 0,
         bool pedantic = false);

bool
needsQuoting(const std::string& key);

bool
isNumericString(const std::string& key);

std::string
quoteString(const std::string& key);

// Renders a raw key for use inside a path. Floats used as keys keep their
// float identity with the #'..' form.
std::string
quote(const Value& key, bool asKey = true);

// Like quote(), but also quotes strings that would read back as integers.
std::string
normalize(const Value& key, bool asKey = true);

} // namespace dt
