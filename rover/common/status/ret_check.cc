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

#include "rover/common/status/ret_check.h"

#include <string>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"

namespace rover {
namespace internal_status {

StatusBuilder RetCheckFailSlowPath(const char* file, int line,
                                   const char* condition) {
  std::string prefix =
      absl::StrFormat("ROVER_RET_CHECK failure (%s:%d) %s ", file, line,
                      condition);
  VLOG(1) << prefix;
  return StatusBuilder(absl::StatusCode::kInternal, prefix);
}

}  // namespace internal_status
}  // namespace rover
