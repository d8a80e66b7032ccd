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

#include "rover/arith/arith_op.h"

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

#include "absl/base/no_destructor.h"
#include "absl/container/flat_hash_map.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "rover/arith/arith_op_list.h"

namespace rover {

std::string ArithOpToString(ArithOp op) {
  switch (op) {
#define TO_OP_STRING(name, str, a, b) \
  case ArithOp::name:                 \
    return str;
    ROVER_FOR_EACH_ARITH_OP(TO_OP_STRING)
#undef TO_OP_STRING
  }
  LOG(FATAL) << "Invalid ArithOp: " << static_cast<int64_t>(op);
}

absl::StatusOr<ArithOp> StringToArithOp(std::string_view op_str) {
  static const absl::NoDestructor<absl::flat_hash_map<std::string, ArithOp>>
      string_map({
#define FROM_OP_STRING(name, str, a, kind) \
  {str, ArithOp::name},
          ROVER_FOR_EACH_ARITH_OP(FROM_OP_STRING)
#undef FROM_OP_STRING
      });
  auto found = string_map->find(op_str);
  if (found == string_map->end() || IsLeafOp(found->second)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Unknown arithmetic operator: ", op_str));
  }
  return found->second;
}

namespace {
constexpr int8_t GetOpKind(ArithOp op) {
  switch (op) {
#define TO_OP_KIND(name, a, b, kind) \
  case ArithOp::name:                \
    return kind;
    ROVER_FOR_EACH_ARITH_OP(TO_OP_KIND)
#undef TO_OP_KIND
  }
  return 0;
}
}  // namespace

int64_t ArithOpArity(ArithOp op) {
  switch (op) {
#define TO_OP_ARITY(name, a, arity, b) \
  case ArithOp::name:                  \
    return arity;
    ROVER_FOR_EACH_ARITH_OP(TO_OP_ARITY)
#undef TO_OP_ARITY
  }
  LOG(FATAL) << "Invalid ArithOp: " << static_cast<int64_t>(op);
}

bool IsBinaryArithOp(ArithOp op) {
  return GetOpKind(op) == arith_op_kinds::kBinaryArith;
}

bool IsWidthArithOp(ArithOp op) {
  return GetOpKind(op) == arith_op_kinds::kWidthArith;
}

bool IsLeafOp(ArithOp op) { return GetOpKind(op) == arith_op_kinds::kLeaf; }

std::ostream& operator<<(std::ostream& os, ArithOp op) {
  os << ArithOpToString(op);
  return os;
}

}  // namespace rover
