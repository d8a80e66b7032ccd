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

#ifndef ROVER_REWRITES_WIDTH_CONSISTENCY_H_
#define ROVER_REWRITES_WIDTH_CONSISTENCY_H_

#include "absl/status/status.h"
#include "rover/arith/pattern.h"

namespace rover {

// Checks that wherever an operand of a binary arithmetic node is itself a
// binary arithmetic node, the operand's output-width slot is structurally
// equal to the width slot the parent declares for it. Returns an
// InvalidArgument error naming the parent, the operand and both widths for
// the first violation in pre-order.
absl::Status CheckWidthConsistency(const Pattern& pattern);

}  // namespace rover

#endif  // ROVER_REWRITES_WIDTH_CONSISTENCY_H_
