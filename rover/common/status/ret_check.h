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

#ifndef ROVER_COMMON_STATUS_RET_CHECK_H_
#define ROVER_COMMON_STATUS_RET_CHECK_H_

#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace rover {
namespace internal_status {

// Accumulates a message for an error status. Converts implicitly to
// absl::Status and absl::StatusOr<T> so it can be returned directly from
// functions returning either.
class StatusBuilder {
 public:
  StatusBuilder(absl::StatusCode code, std::string_view prefix)
      : code_(code) {
    stream_ << prefix;
  }

  StatusBuilder(const StatusBuilder& other)
      : code_(other.code_) {
    stream_ << other.stream_.str();
  }

  template <typename T>
  StatusBuilder& operator<<(const T& value) & {
    stream_ << value;
    return *this;
  }
  template <typename T>
  StatusBuilder&& operator<<(const T& value) && {
    stream_ << value;
    return std::move(*this);
  }

  operator absl::Status() const {  // NOLINT(google-explicit-constructor)
    return absl::Status(code_, stream_.str());
  }

  template <typename T>
  operator absl::StatusOr<T>() const {  // NOLINT(google-explicit-constructor)
    return absl::StatusOr<T>(absl::Status(*this));
  }

 private:
  absl::StatusCode code_;
  std::ostringstream stream_;
};

StatusBuilder RetCheckFailSlowPath(const char* file, int line,
                                   const char* condition);

}  // namespace internal_status
}  // namespace rover

// Returns an internal error from the enclosing function if `condition` is
// false. Additional context may be streamed:
//
//   ROVER_RET_CHECK(node.children().size() == 2) << node.ToString();
#define ROVER_RET_CHECK(condition)                                       \
  while (ABSL_PREDICT_FALSE(!(condition)))                               \
  return ::rover::internal_status::RetCheckFailSlowPath(__FILE__, __LINE__, \
                                                        #condition)

#endif  // ROVER_COMMON_STATUS_RET_CHECK_H_
