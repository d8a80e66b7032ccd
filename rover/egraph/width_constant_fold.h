// Copyright 2026 The Rover Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// Constant folding of widths and signs over e-classes. Every class carries an
// optional constant: the literal width or sign it is known to equal. The width
// helpers `max+1` and `wlsh` fold when both operands are known, which lets
// rewrite conditions read concrete widths from derived terms.

#ifndef ROVER_EGRAPH_WIDTH_CONSTANT_FOLD_H_
#define ROVER_EGRAPH_WIDTH_CONSTANT_FOLD_H_

#include <functional>
#include <optional>
#include <string>
#include <variant>

#include "absl/status/statusor.h"
#include "rover/arith/width.h"
#include "rover/egraph/arith_graph.h"
#include "rover/egraph/enode.h"

namespace rover {

using WidthOrSign = std::variant<WidthInt, Sign>;

// Per-class analysis data.
using WidthConstant = std::optional<WidthOrSign>;

// Returns the constant denoted by `node` given the constants of the classes
// of its children, which `child_constant` looks up.
WidthConstant MakeWidthConstant(
    const ENode& node,
    const std::function<const WidthConstant&(EClassId)>& child_constant);

// Merges `from` into `into` and returns whether `into` changed. Two different
// known constants cannot describe one class; that is reported as an internal
// error since it means an unsound rewrite was applied.
absl::StatusOr<bool> MergeWidthConstant(WidthConstant& into,
                                        const WidthConstant& from);

// Returns the leaf node that represents `value` in the graph.
ENode WidthOrSignToLeaf(const WidthOrSign& value);

// Widths are returned as is, signs as 0 (unsigned) or 1 (signed).
WidthInt WidthOrSignAsWidthInt(const WidthOrSign& value);

std::string WidthOrSignToString(const WidthOrSign& value);

// Returns the constant width or sign of `id`'s class in the WidthInt encoding
// used by rewrite conditions, or nullopt if the class is not constant.
std::optional<WidthInt> GetConstWidthOrSign(const ArithGraph& graph,
                                            EClassId id);

}  // namespace rover

#endif  // ROVER_EGRAPH_WIDTH_CONSTANT_FOLD_H_
