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

#ifndef ROVER_REWRITES_REWRITE_CONDITION_H_
#define ROVER_REWRITES_REWRITE_CONDITION_H_

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "rover/arith/pattern.h"
#include "rover/arith/width.h"

namespace rover {

// The known constant values of the variables of one match, in the order the
// variables first appear in the matched pattern. Variables without a known
// constant are absent.
using Assignment = std::vector<std::pair<PatternVar, WidthInt>>;

std::optional<WidthInt> LookupAssignment(const Assignment& assignment,
                                         const PatternVar& var);

// Renders e.g. "{?wo: 17, ?wab: 17}".
std::string AssignmentToString(const Assignment& assignment);

// A side condition of a rewrite: a predicate over the constant values of an
// ordered list of pattern variables. Signs are passed in their width
// encoding, 0 for unsigned and 1 for signed.
class RewriteCondition {
 public:
  using Predicate = std::function<bool(absl::Span<const WidthInt>)>;

  // `var_names` are written with their leading `?`; the predicate receives
  // their values in this order.
  static absl::StatusOr<RewriteCondition> Create(
      std::string description, absl::Span<const std::string_view> var_names,
      Predicate predicate);

  const std::string& description() const { return description_; }
  absl::Span<const PatternVar> vars() const { return vars_; }

  // `values` must hold one value per condition variable.
  bool Evaluate(absl::Span<const WidthInt> values) const;

  // Resolves the variables by name. If any is missing the condition is
  // considered false.
  bool Evaluate(const Assignment& assignment) const;

 private:
  RewriteCondition(std::string description, std::vector<PatternVar> vars,
                   Predicate predicate)
      : description_(std::move(description)),
        vars_(std::move(vars)),
        predicate_(std::move(predicate)) {}

  std::string description_;
  std::vector<PatternVar> vars_;
  Predicate predicate_;
};

}  // namespace rover

#endif  // ROVER_REWRITES_REWRITE_CONDITION_H_
