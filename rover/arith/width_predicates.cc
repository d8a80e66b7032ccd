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

#include "rover/arith/width_predicates.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>

#include "rover/arith/width.h"

namespace rover {
namespace {

// Beyond this many amount bits the maximum shift exceeds any WidthInt.
constexpr uint64_t kMaxShiftAmountWidth = 33;

std::optional<uint64_t> MaxShift(WidthInt amount_width) {
  if (amount_width >= kMaxShiftAmountWidth) {
    return std::nullopt;
  }
  return (uint64_t{1} << amount_width) - 1;
}

std::optional<WidthInt> ToWidthInt(uint64_t value) {
  if (value > std::numeric_limits<WidthInt>::max()) {
    return std::nullopt;
  }
  return static_cast<WidthInt>(value);
}

}  // namespace

bool AddNoOverflow(WidthInt output_width, WidthInt width_a, WidthInt width_b) {
  return uint64_t{output_width} >= uint64_t{std::max(width_a, width_b)} + 1;
}

bool MulNoOverflow(WidthInt output_width, WidthInt width_a, WidthInt width_b) {
  return uint64_t{output_width} >= uint64_t{width_a} + uint64_t{width_b};
}

bool ShiftNoOverflow(WidthInt output_width, WidthInt value_width,
                     WidthInt amount_width) {
  std::optional<uint64_t> max_shift = MaxShift(amount_width);
  if (!max_shift.has_value()) {
    return false;
  }
  return uint64_t{output_width} >= uint64_t{value_width} + *max_shift;
}

std::optional<WidthInt> MaxPlus1Width(WidthInt width_a, WidthInt width_b) {
  return ToWidthInt(uint64_t{std::max(width_a, width_b)} + 1);
}

std::optional<WidthInt> LeftShiftWidth(WidthInt value_width,
                                       WidthInt amount_width) {
  std::optional<uint64_t> max_shift = MaxShift(amount_width);
  if (!max_shift.has_value()) {
    return std::nullopt;
  }
  return ToWidthInt(uint64_t{value_width} + *max_shift);
}

}  // namespace rover
