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
#include "segment.h"
#include "value.h"
#include <string>
#include <vector>

namespace dt {

// True when some segment resolves a reference against an ancestor, which
// makes the traversal keep the parent chain.
bool
needsParents(const std::vector<SegmentPtr>& ops);

Context
makeContext(const Value& root,
            const std::vector<SegmentPtr>& ops,
            bool strict,
            const TransformRegistry* registry);

// Structure implied by a chain when nothing exists yet. A numeric slot at
// the leaf is padded with nulls up to its index.
Value
buildDefault(const OpList& ops, const Context& ctx);

// Fresh structure holding deep copies of everything the chain matches.
Value
build(const OpList& ops, const Value& node, const Context& ctx);

// Empty container of the same kind as `node`.
Value
emptyLike(const Value& node);

// Runs frames at the current stack level, and every level opened while
// doing so, until the level is drained. Returns false if the sink stopped.
bool
process(DepthStack& stack, bool paths, const Sink& sink);

// Enumerates matches of `ops` under `node`, stopping at a cut.
void
walk(const OpList& ops,
     const Value& node,
     const Context& ctx,
     bool paths,
     const Sink& sink);

Results
collect(const OpList& ops, const Value& node, const Context& ctx, bool paths);

bool
hasAny(const OpList& ops, const Value& node, const Context& ctx);

bool
first(const OpList& ops, const Value& node, const Context& ctx, Value& out);

Value
updates(const OpList& ops,
        Value node,
        const Payload& val,
        const UpdateArgs& args,
        const Context& ctx);

Value
removes(const OpList& ops,
        Value node,
        const Payload& val,
        bool nop,
        const Context& ctx);

// True if `path` and any of `cuts` agree segment by segment over their
// common length, i.e. one is a prefix of the other.
bool
pathOverlaps(const std::vector<Prefix>& cuts, const Prefix& path);

// True if no segment (under its wrappers) is a pattern.
bool
isConcretePath(const OpList& ops);

std::string
formatTrail(const Trail& trail);

// Name of a value's kind as used in messages and type restrictions:
// list, tuple, dict, set, frozenset, str, int, ... or a record's name.
std::string
kindName(const Value& value);

} // namespace dt
