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

#include "rover/rewrites/width_consistency.h"

#include <cstdint>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "rover/arith/arith_op.h"
#include "rover/arith/pattern.h"
#include "rover/common/status/status_macros.h"

namespace rover {

absl::Status CheckWidthConsistency(const Pattern& pattern) {
  if (pattern.IsBinaryArith()) {
    const BinaryArithNode& node = pattern.As<BinaryArithNode>();
    constexpr std::pair<int64_t, int64_t> kOperandSlots[] = {
        {binary_arith_slot::kWidthA, binary_arith_slot::kExprA},
        {binary_arith_slot::kWidthB, binary_arith_slot::kExprB},
    };
    for (const auto& [width_slot, expr_slot] : kOperandSlots) {
      const Pattern& declared = node.slots[width_slot];
      const Pattern& operand = node.slots[expr_slot];
      const Pattern* actual = operand.GetOutputWidth();
      if (actual != nullptr && *actual != declared) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "In `%s`, subexpression `%s` has inconsistent width: %s != %s",
            pattern.ToString(), operand.ToString(), declared.ToString(),
            actual->ToString()));
      }
    }
  }
  for (const Pattern& child : pattern.children()) {
    ROVER_RETURN_IF_ERROR(CheckWidthConsistency(child));
  }
  return absl::OkStatus();
}

}  // namespace rover
