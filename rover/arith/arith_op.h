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

#ifndef ROVER_ARITH_ARITH_OP_H_
#define ROVER_ARITH_ARITH_OP_H_

#include <array>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

#include "absl/status/statusor.h"
#include "rover/arith/arith_op_list.h"

namespace rover {

// Enumerates the operators of the width-annotated arithmetic language.
enum class ArithOp : int8_t {
#define MAKE_ENUM(name, a, b, c) name,
  ROVER_FOR_EACH_ARITH_OP(MAKE_ENUM)
#undef MAKE_ENUM
};

inline constexpr auto kAllArithOps = std::to_array<ArithOp>({
#define MAKE_ENUM_REF(name, a, b, c) ArithOp::name,
    ROVER_FOR_EACH_ARITH_OP(MAKE_ENUM_REF)
#undef MAKE_ENUM_REF
});

// Slot positions of a binary arithmetic node:
//   (op output_width width_a sign_a a width_b sign_b b)
namespace binary_arith_slot {
inline constexpr int64_t kOutputWidth = 0;
inline constexpr int64_t kWidthA = 1;
inline constexpr int64_t kSignA = 2;
inline constexpr int64_t kExprA = 3;
inline constexpr int64_t kWidthB = 4;
inline constexpr int64_t kSignB = 5;
inline constexpr int64_t kExprB = 6;
inline constexpr int64_t kCount = 7;
}  // namespace binary_arith_slot

std::string ArithOpToString(ArithOp op);

// Converts an operator token ("+", "<<", "max+1", ...) into an ArithOp. Leaf
// kinds have no textual operator form and are rejected.
absl::StatusOr<ArithOp> StringToArithOp(std::string_view op_str);

// Returns the fixed number of operands of `op`.
int64_t ArithOpArity(ArithOp op);

// Returns whether `op` is `+`, `*` or `<<`.
bool IsBinaryArithOp(ArithOp op);

// Returns whether `op` is one of the width helper operators.
bool IsWidthArithOp(ArithOp op);

bool IsLeafOp(ArithOp op);

std::ostream& operator<<(std::ostream& os, ArithOp op);

}  // namespace rover

#endif  // ROVER_ARITH_ARITH_OP_H_
