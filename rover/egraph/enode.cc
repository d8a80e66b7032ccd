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

#include "rover/egraph/enode.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "absl/log/check.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "rover/arith/arith_op.h"
#include "rover/arith/width.h"

namespace rover {

ENode ENode::Literal(WidthInt value) {
  return ENode(ArithOp::kLiteral, value, {});
}

ENode ENode::SignLiteral(Sign sign) { return ENode(ArithOp::kSign, sign, {}); }

ENode ENode::Symbol(std::string_view name) {
  return ENode(ArithOp::kSymbol, std::string(name), {});
}

ENode ENode::Operator(ArithOp op, std::vector<EClassId> children) {
  CHECK(!IsLeafOp(op)) << op;
  CHECK_EQ(static_cast<int64_t>(children.size()), ArithOpArity(op)) << op;
  return ENode(op, std::monostate(), std::move(children));
}

WidthInt ENode::literal() const {
  CHECK_EQ(op_, ArithOp::kLiteral);
  return std::get<WidthInt>(payload_);
}

Sign ENode::sign() const {
  CHECK_EQ(op_, ArithOp::kSign);
  return std::get<Sign>(payload_);
}

const std::string& ENode::symbol() const {
  CHECK_EQ(op_, ArithOp::kSymbol);
  return std::get<std::string>(payload_);
}

std::string ENode::ToString() const {
  switch (op_) {
    case ArithOp::kLiteral:
      return absl::StrCat(literal());
    case ArithOp::kSign:
      return SignToString(sign());
    case ArithOp::kSymbol:
      return symbol();
    default:
      break;
  }
  return absl::StrFormat(
      "(%s %s)", ArithOpToString(op_),
      absl::StrJoin(children_, " ", [](std::string* out, EClassId child) {
        absl::StrAppend(out, "#", child);
      }));
}

}  // namespace rover
