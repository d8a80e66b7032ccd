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

#ifndef ROVER_COMMON_STATUS_STATUS_MACROS_H_
#define ROVER_COMMON_STATUS_STATUS_MACROS_H_

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"

// Evaluates an expression that produces an `absl::Status`. If the status is
// not ok, returns it from the current function.
//
// Example:
//   absl::Status MultiStepFunction() {
//     ROVER_RETURN_IF_ERROR(Function(args...));
//     ROVER_RETURN_IF_ERROR(foo.Method(args...));
//     return absl::OkStatus();
//   }
#define ROVER_RETURN_IF_ERROR(expr)                                     \
  do {                                                                  \
    const ::absl::Status _rover_status_to_return = (expr);              \
    if (ABSL_PREDICT_FALSE(!_rover_status_to_return.ok())) {            \
      return _rover_status_to_return;                                   \
    }                                                                   \
  } while (false)

// Executes an expression `rexpr` that returns an `absl::StatusOr<T>`. On OK,
// moves its value into the variable defined by `lhs`, otherwise returns the
// error status from the current function.
//
// Example: Declaring and initializing a new variable (ValueType can be
// anything that can be initialized with assignment, including references):
//   ROVER_ASSIGN_OR_RETURN(ValueType value, MaybeGetValue(arg));
//
// Example: Assigning to an existing variable:
//   ValueType value;
//   ROVER_ASSIGN_OR_RETURN(value, MaybeGetValue(arg));
//
// WARNING: ROVER_ASSIGN_OR_RETURN expands into multiple statements; it cannot
// be used in a single statement (e.g. as the body of an if statement without
// {})!
#define ROVER_ASSIGN_OR_RETURN(lhs, rexpr) \
  ROVER_ASSIGN_OR_RETURN_IMPL_(            \
      ROVER_STATUS_MACROS_CONCAT_NAME_(_rover_statusor, __LINE__), lhs, rexpr)

// Internal helpers.
#define ROVER_ASSIGN_OR_RETURN_IMPL_(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                 \
  if (ABSL_PREDICT_FALSE(!statusor.ok())) {                \
    return std::move(statusor).status();                   \
  }                                                        \
  lhs = std::move(statusor).value()

#define ROVER_STATUS_MACROS_CONCAT_NAME_(x, y) \
  ROVER_STATUS_MACROS_CONCAT_IMPL_(x, y)
#define ROVER_STATUS_MACROS_CONCAT_IMPL_(x, y) x##y

#endif  // ROVER_COMMON_STATUS_STATUS_MACROS_H_
