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

#ifndef ROVER_ARITH_WIDTH_H_
#define ROVER_ARITH_WIDTH_H_

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

#include "absl/status/statusor.h"

namespace rover {

// Bit count of a bit-vector value. Valid programs never contain zero widths.
using WidthInt = uint32_t;

// Signedness of a bit-vector operand. Every operand in the arithmetic language
// carries one explicitly. The enumerator values are the encoding used when a
// sign is resolved as a width-like constant: unsigned is 0, signed is 1.
enum class Sign : int8_t {
  kUnsigned = 0,
  kSigned = 1,
};

// Returns the textual form used in patterns: "unsign" or "sign".
std::string SignToString(Sign sign);

absl::StatusOr<Sign> StringToSign(std::string_view sign_str);

// Returns the sign encoded as a WidthInt (0 for unsigned, 1 for signed).
inline WidthInt SignAsWidthInt(Sign sign) {
  return static_cast<WidthInt>(sign);
}

std::ostream& operator<<(std::ostream& os, Sign sign);

}  // namespace rover

#endif  // ROVER_ARITH_WIDTH_H_
