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

#ifndef ROVER_ARITH_ARITH_OP_LIST_H_
#define ROVER_ARITH_ARITH_OP_LIST_H_

#include <cstdint>

namespace rover {
namespace arith_op_kinds {

// Seven-slot arithmetic operator:
// (op output_width width_a sign_a a width_b sign_b b).
inline constexpr int8_t kBinaryArith = 1;
// Two-operand operator computing a width from other widths.
inline constexpr int8_t kWidthArith = 2;
// Node without operands.
inline constexpr int8_t kLeaf = 3;

}  // namespace arith_op_kinds
}  // namespace rover

// Each entry: X(enum name, textual form, operand count, kind).
#define ROVER_FOR_EACH_ARITH_OP(X)                                    \
  X(kAdd, "+", 7, ::rover::arith_op_kinds::kBinaryArith)              \
  X(kMul, "*", 7, ::rover::arith_op_kinds::kBinaryArith)              \
  X(kShl, "<<", 7, ::rover::arith_op_kinds::kBinaryArith)             \
  X(kMaxPlus1, "max+1", 2, ::rover::arith_op_kinds::kWidthArith)      \
  X(kLeftShiftWidth, "wlsh", 2, ::rover::arith_op_kinds::kWidthArith) \
  X(kLiteral, "literal", 0, ::rover::arith_op_kinds::kLeaf)           \
  X(kSign, "sign_literal", 0, ::rover::arith_op_kinds::kLeaf)         \
  X(kSymbol, "symbol", 0, ::rover::arith_op_kinds::kLeaf)

#endif  // ROVER_ARITH_ARITH_OP_LIST_H_
