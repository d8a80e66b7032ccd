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

#include "rover/egraph/width_constant_fold.h"

#include <functional>
#include <optional>
#include <string>
#include <variant>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "rover/arith/arith_op.h"
#include "rover/arith/width.h"
#include "rover/arith/width_predicates.h"
#include "rover/egraph/arith_graph.h"
#include "rover/egraph/enode.h"

namespace rover {
namespace {

std::optional<WidthInt> AsWidth(const WidthConstant& constant) {
  if (!constant.has_value()) {
    return std::nullopt;
  }
  if (const WidthInt* width = std::get_if<WidthInt>(&*constant)) {
    return *width;
  }
  return std::nullopt;
}

}  // namespace

WidthConstant MakeWidthConstant(
    const ENode& node,
    const std::function<const WidthConstant&(EClassId)>& child_constant) {
  switch (node.op()) {
    case ArithOp::kLiteral:
      return WidthOrSign(node.literal());
    case ArithOp::kSign:
      return WidthOrSign(node.sign());
    case ArithOp::kMaxPlus1:
    case ArithOp::kLeftShiftWidth: {
      std::optional<WidthInt> a = AsWidth(child_constant(node.children()[0]));
      std::optional<WidthInt> b = AsWidth(child_constant(node.children()[1]));
      if (!a.has_value() || !b.has_value()) {
        return std::nullopt;
      }
      std::optional<WidthInt> folded = node.op() == ArithOp::kMaxPlus1
                                           ? MaxPlus1Width(*a, *b)
                                           : LeftShiftWidth(*a, *b);
      if (!folded.has_value()) {
        return std::nullopt;
      }
      return WidthOrSign(*folded);
    }
    default:
      return std::nullopt;
  }
}

absl::StatusOr<bool> MergeWidthConstant(WidthConstant& into,
                                        const WidthConstant& from) {
  if (!from.has_value()) {
    return false;
  }
  if (!into.has_value()) {
    into = from;
    return true;
  }
  if (*into != *from) {
    return absl::InternalError(absl::StrFormat(
        "Conflicting constants %s and %s in one equivalence class",
        WidthOrSignToString(*into), WidthOrSignToString(*from)));
  }
  return false;
}

ENode WidthOrSignToLeaf(const WidthOrSign& value) {
  if (const Sign* sign = std::get_if<Sign>(&value)) {
    return ENode::SignLiteral(*sign);
  }
  return ENode::Literal(std::get<WidthInt>(value));
}

WidthInt WidthOrSignAsWidthInt(const WidthOrSign& value) {
  if (const Sign* sign = std::get_if<Sign>(&value)) {
    return SignAsWidthInt(*sign);
  }
  return std::get<WidthInt>(value);
}

std::string WidthOrSignToString(const WidthOrSign& value) {
  if (const Sign* sign = std::get_if<Sign>(&value)) {
    return SignToString(*sign);
  }
  return absl::StrCat(std::get<WidthInt>(value));
}

std::optional<WidthInt> GetConstWidthOrSign(const ArithGraph& graph,
                                            EClassId id) {
  return graph.ResolveConstant(id);
}

}  // namespace rover
