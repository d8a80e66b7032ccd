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

#include "rover/arith/pattern.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/types/span.h"
#include "rover/arith/arith_op.h"
#include "rover/arith/width.h"

namespace rover {
namespace {

enum class SlotKind { kWidth, kSign, kExpr };

SlotKind GetSlotKind(int64_t slot) {
  switch (slot) {
    case binary_arith_slot::kSignA:
    case binary_arith_slot::kSignB:
      return SlotKind::kSign;
    case binary_arith_slot::kExprA:
    case binary_arith_slot::kExprB:
      return SlotKind::kExpr;
    default:
      return SlotKind::kWidth;
  }
}

bool FitsSlot(const Pattern& pattern, SlotKind kind) {
  if (pattern.IsVar()) {
    return true;
  }
  switch (kind) {
    case SlotKind::kWidth:
      return pattern.Is<PatternLiteral>() || pattern.Is<WidthArithNode>();
    case SlotKind::kSign:
      return pattern.Is<PatternSign>();
    case SlotKind::kExpr:
      return pattern.Is<PatternLiteral>() || pattern.Is<PatternSymbol>() ||
             pattern.Is<BinaryArithNode>();
  }
  return false;
}

std::string_view SlotKindToString(SlotKind kind) {
  switch (kind) {
    case SlotKind::kWidth:
      return "a width (variable, literal or width operator)";
    case SlotKind::kSign:
      return "a sign (variable, `sign` or `unsign`)";
    case SlotKind::kExpr:
      return "an expression (variable, literal, symbol or arithmetic node)";
  }
  return "?";
}

void CollectVars(const Pattern& pattern, absl::flat_hash_set<PatternVar>& seen,
                 std::vector<PatternVar>& vars) {
  if (pattern.IsVar()) {
    const PatternVar& var = pattern.As<PatternVar>();
    if (seen.insert(var).second) {
      vars.push_back(var);
    }
    return;
  }
  for (const Pattern& child : pattern.children()) {
    CollectVars(child, seen, vars);
  }
}

}  // namespace

bool operator==(const BinaryArithNode& a, const BinaryArithNode& b) {
  return a.op == b.op && a.slots == b.slots;
}

bool operator==(const WidthArithNode& a, const WidthArithNode& b) {
  return a.op == b.op && a.operands == b.operands;
}

Pattern Pattern::MakeVar(std::string_view name) {
  return Pattern(PatternVar{std::string(name)});
}

Pattern Pattern::MakeLiteral(WidthInt value) {
  return Pattern(PatternLiteral{value});
}

Pattern Pattern::MakeSign(Sign sign) { return Pattern(PatternSign{sign}); }

Pattern Pattern::MakeSymbol(std::string_view name) {
  return Pattern(PatternSymbol{std::string(name)});
}

absl::StatusOr<Pattern> Pattern::MakeBinaryArith(ArithOp op,
                                                 std::vector<Pattern> slots) {
  if (!IsBinaryArithOp(op)) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "`%s` is not a binary arithmetic operator", ArithOpToString(op)));
  }
  if (slots.size() != binary_arith_slot::kCount) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "`%s` takes %d slots (output_width width_a sign_a a width_b sign_b "
        "b), got %d",
        ArithOpToString(op), binary_arith_slot::kCount, slots.size()));
  }
  for (int64_t i = 0; i < binary_arith_slot::kCount; ++i) {
    SlotKind kind = GetSlotKind(i);
    if (!FitsSlot(slots[i], kind)) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Slot %d of `%s` must be %s, got `%s`", i, ArithOpToString(op),
          SlotKindToString(kind), slots[i].ToString()));
    }
  }
  return Pattern(BinaryArithNode{op, std::move(slots)});
}

absl::StatusOr<Pattern> Pattern::MakeWidthArith(ArithOp op,
                                                std::vector<Pattern> operands) {
  if (!IsWidthArithOp(op)) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "`%s` is not a width operator", ArithOpToString(op)));
  }
  if (static_cast<int64_t>(operands.size()) != ArithOpArity(op)) {
    return absl::InvalidArgumentError(
        absl::StrFormat("`%s` takes %d operands, got %d", ArithOpToString(op),
                        ArithOpArity(op), operands.size()));
  }
  for (const Pattern& operand : operands) {
    if (!FitsSlot(operand, SlotKind::kWidth)) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Operand of `%s` must be %s, got `%s`", ArithOpToString(op),
          SlotKindToString(SlotKind::kWidth), operand.ToString()));
    }
  }
  return Pattern(WidthArithNode{op, std::move(operands)});
}

ArithOp Pattern::op() const {
  if (const auto* binary = std::get_if<BinaryArithNode>(&node_)) {
    return binary->op;
  }
  if (const auto* width = std::get_if<WidthArithNode>(&node_)) {
    return width->op;
  }
  if (Is<PatternLiteral>()) {
    return ArithOp::kLiteral;
  }
  if (Is<PatternSign>()) {
    return ArithOp::kSign;
  }
  if (Is<PatternSymbol>()) {
    return ArithOp::kSymbol;
  }
  LOG(FATAL) << "Pattern variable has no operator: " << ToString();
}

const Pattern* Pattern::GetOutputWidth() const {
  if (const auto* binary = std::get_if<BinaryArithNode>(&node_)) {
    return &binary->slots[binary_arith_slot::kOutputWidth];
  }
  return nullptr;
}

absl::Span<const Pattern> Pattern::children() const {
  if (const auto* binary = std::get_if<BinaryArithNode>(&node_)) {
    return binary->slots;
  }
  if (const auto* width = std::get_if<WidthArithNode>(&node_)) {
    return width->operands;
  }
  return {};
}

std::vector<PatternVar> Pattern::Vars() const {
  absl::flat_hash_set<PatternVar> seen;
  std::vector<PatternVar> vars;
  CollectVars(*this, seen, vars);
  return vars;
}

bool Pattern::IsGround() const {
  if (IsVar()) {
    return false;
  }
  for (const Pattern& child : children()) {
    if (!child.IsGround()) {
      return false;
    }
  }
  return true;
}

int64_t Pattern::size() const {
  int64_t result = 1;
  for (const Pattern& child : children()) {
    result += child.size();
  }
  return result;
}

std::string Pattern::ToString() const {
  if (const auto* var = std::get_if<PatternVar>(&node_)) {
    return var->ToString();
  }
  if (const auto* literal = std::get_if<PatternLiteral>(&node_)) {
    return absl::StrCat(literal->value);
  }
  if (const auto* sign = std::get_if<PatternSign>(&node_)) {
    return SignToString(sign->sign);
  }
  if (const auto* symbol = std::get_if<PatternSymbol>(&node_)) {
    return symbol->name;
  }
  std::vector<std::string> parts = {ArithOpToString(op())};
  for (const Pattern& child : children()) {
    parts.push_back(child.ToString());
  }
  return absl::StrCat("(", absl::StrJoin(parts, " "), ")");
}

}  // namespace rover
