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

#include "rover/arith/width.h"

#include <ostream>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"

namespace rover {

std::string SignToString(Sign sign) {
  switch (sign) {
    case Sign::kUnsigned:
      return "unsign";
    case Sign::kSigned:
      return "sign";
  }
  return absl::StrCat("Sign(", static_cast<int>(sign), ")");
}

absl::StatusOr<Sign> StringToSign(std::string_view sign_str) {
  if (sign_str == "unsign") {
    return Sign::kUnsigned;
  }
  if (sign_str == "sign") {
    return Sign::kSigned;
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Invalid sign: \"", sign_str, "\""));
}

std::ostream& operator<<(std::ostream& os, Sign sign) {
  os << SignToString(sign);
  return os;
}

}  // namespace rover
