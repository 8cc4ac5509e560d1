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
#include "filter.h"
#include "match.h"
#include "segment.h"
#include "value.h"
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dt {

// Depth window of a recursive segment, `:start:stop:step`. Depth 0 is the
// first level of children. Negative bounds count from the leaf: -1 is a
// leaf, -2 its parent, and so on.
struct DepthRange
{
    std::optional<long long> start;
    std::optional<long long> stop;
    std::optional<long long> step;

    bool unbounded() const
    {
        return !start && !stop && !step;
    }

    bool fromLeaf() const
    {
        return (start && *start < 0) || (stop && *stop < 0);
    }

    // `toLeaf` is the longest distance from the node down to a leaf.
    bool contains(long long depth, long long toLeaf) const;

    std::string render() const;
};

using ValueTest = std::function<bool(const Value&)>;

// `**`, `*key` and `*(accessor, ...)`: descent through any number of
// levels. Matches are produced parent before children. Each path keeps its
// own set of visited containers, so self-referential data terminates.
class RecursiveSegment : public Segment
{
  public:
    RecursiveSegment(MatcherPtr inner,
                     DepthRange depth = {},
                     Filters filters = {},
                     bool first = false);
    RecursiveSegment(Branches accessors,
                     DepthRange depth = {},
                     Filters filters = {},
                     bool first = false);

    bool isPattern() const override
    {
        return true;
    }

    bool isRecursive() const override
    {
        return true;
    }

    bool isTemplate() const override;
    int referenceDepth() const override;

    const Matcher* matcher() const override
    {
        return inner_.get();
    }

    const DepthRange& depth() const
    {
        return depth_;
    }

    // True if a concrete segment of another path is one this segment
    // would step through.
    bool consumes(const Segment& seg) const;

    Children items(const Value& node,
                   const Context& ctx,
                   bool filtered = true) const override;
    SegmentPtr concrete(const Value& key) const override;
    Value update(Value node, const Value& key, const Payload& val) const override;
    Value pop(Value node, const Value& key) const override;
    bool pushChildren(DepthStack& stack,
                      Frame& frame,
                      bool paths,
                      const Sink& sink) const override;
    Value doUpdate(const OpList& ops,
                   Value node,
                   const Payload& val,
                   const UpdateArgs& args,
                   const Context& ctx) const override;
    Value doRemove(const OpList& ops,
                   Value node,
                   const Payload& val,
                   bool nop,
                   const Context& ctx) const override;
    std::optional<Values> match(const Segment& other,
                                bool specials) const override;
    std::string render(bool top) const override;
    SegmentPtr resolve(const Value& bindings, bool partial) const override;

    using Matches = std::vector<std::pair<Prefix, Value>>;

    // Appends the matches under `node` to `out`, keeping only values that
    // `guard` accepts when it is set. Stops after one match for the first
    // match variant.
    void collectMatches(const Value& node,
                        const Context& ctx,
                        bool paths,
                        const Prefix& prefix,
                        const ValueTest& guard,
                        Matches& out) const;

    // Bottom-up mutation: children are rewritten and stored back before
    // the node holding them is tested.
    Value updateRecursive(const OpList& ops,
                          Value node,
                          const Payload& val,
                          const UpdateArgs& args,
                          const Context& ctx,
                          const ValueTest& guard) const;
    Value removeRecursive(const OpList& ops,
                          Value node,
                          const Payload& val,
                          bool nop,
                          const Context& ctx,
                          const ValueTest& guard) const;

  private:
    struct Hit
    {
        const Segment* accessor;
        Child child;
    };

    using Seen = std::vector<const void*>;

    std::vector<Hit> children(const Value& node, const Context& ctx) const;
    long long toLeaf(const Value& node, const Context& ctx, Seen& seen) const;
    bool selects(const Value& value, long long depth, const Context& ctx) const;
    bool collect(const Value& node,
                 const Context& ctx,
                 bool paths,
                 long long depth,
                 const Prefix& prefix,
                 const ValueTest& guard,
                 Seen& seen,
                 Matches& out) const;
    Value updateAt(const OpList& ops,
                   Value node,
                   const Payload& val,
                   const UpdateArgs& args,
                   const Context& ctx,
                   const ValueTest& guard,
                   long long depth,
                   Seen& seen) const;
    Value removeAt(const OpList& ops,
                   Value node,
                   const Payload& val,
                   bool nop,
                   const Context& ctx,
                   const ValueTest& guard,
                   long long depth,
                   Seen& seen) const;

    MatcherPtr inner_;
    Branches accessors_;
    DepthRange depth_;
    Filters filters_;
    bool first_;
};

} // namespace dt
