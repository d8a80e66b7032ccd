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

// GoogleTest matchers and assertion macros for absl::Status and
// absl::StatusOr<T>.
//
//   EXPECT_THAT(DoThing(), IsOk());
//   EXPECT_THAT(ParsePattern("("), StatusIs(absl::StatusCode::kInvalidArgument,
//                                           HasSubstr("Unexpected end")));
//   EXPECT_THAT(ComputeWidth(), IsOkAndHolds(17));
//   ROVER_ASSERT_OK_AND_ASSIGN(Pattern p, ParsePattern("?x"));

#ifndef ROVER_COMMON_STATUS_MATCHERS_H_
#define ROVER_COMMON_STATUS_MATCHERS_H_

#include <string>
#include <utility>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "rover/common/status/status_macros.h"

namespace rover {
namespace status_testing {
namespace internal_status {

inline const absl::Status& GetStatus(const absl::Status& status) {
  return status;
}

template <typename T>
inline const absl::Status& GetStatus(const absl::StatusOr<T>& status) {
  return status.status();
}

}  // namespace internal_status

MATCHER(IsOk, negation ? "is not OK" : "is OK") {
  const absl::Status& status =
      ::rover::status_testing::internal_status::GetStatus(arg);
  if (!status.ok()) {
    *result_listener << "which has status " << status;
  }
  return status.ok();
}

MATCHER_P(StatusIs, code,
          negation ? "does not have the expected status code"
                   : "has the expected status code") {
  const absl::Status& status =
      ::rover::status_testing::internal_status::GetStatus(arg);
  *result_listener << "which has status " << status;
  return status.code() == code;
}

MATCHER_P2(StatusIs, code, message_matcher,
           negation ? "does not have the expected status"
                    : "has the expected status") {
  const absl::Status& status =
      ::rover::status_testing::internal_status::GetStatus(arg);
  if (status.code() != code) {
    *result_listener << "which has status " << status;
    return false;
  }
  return ::testing::ExplainMatchResult(
      message_matcher, std::string(status.message()), result_listener);
}

MATCHER_P(IsOkAndHolds, value_matcher,
          negation ? "is not OK or holds a value that does not match"
                   : "is OK and holds a matching value") {
  if (!arg.ok()) {
    *result_listener << "which has status " << arg.status();
    return false;
  }
  return ::testing::ExplainMatchResult(value_matcher, *arg, result_listener);
}

}  // namespace status_testing
}  // namespace rover

#define ROVER_EXPECT_OK(expr) \
  EXPECT_THAT(expr, ::rover::status_testing::IsOk())
#define ROVER_ASSERT_OK(expr) \
  ASSERT_THAT(expr, ::rover::status_testing::IsOk())

// Executes an expression that returns an absl::StatusOr<T>, and assigns the
// contained value to the variable defined by `lhs` if the error code is OK.
// If the status is non-OK, generates a test failure and returns from the
// current function.
#define ROVER_ASSERT_OK_AND_ASSIGN(lhs, rexpr)                       \
  ROVER_ASSERT_OK_AND_ASSIGN_IMPL_(                                  \
      ROVER_STATUS_MACROS_CONCAT_NAME_(_rover_assert_statusor,       \
                                       __LINE__),                    \
      lhs, rexpr)

#define ROVER_ASSERT_OK_AND_ASSIGN_IMPL_(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                     \
  ASSERT_TRUE(statusor.ok()) << statusor.status();             \
  lhs = std::move(statusor).value()

#endif  // ROVER_COMMON_STATUS_MATCHERS_H_
