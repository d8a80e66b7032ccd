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

#include "rover/rewrites/rewrite_condition.h"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/types/span.h"
#include "rover/arith/pattern.h"
#include "rover/arith/pattern_parser.h"
#include "rover/arith/width.h"
#include "rover/common/status/status_macros.h"

namespace rover {

std::optional<WidthInt> LookupAssignment(const Assignment& assignment,
                                         const PatternVar& var) {
  for (const auto& [assigned, value] : assignment) {
    if (assigned == var) {
      return value;
    }
  }
  return std::nullopt;
}

std::string AssignmentToString(const Assignment& assignment) {
  return absl::StrCat(
      "{",
      absl::StrJoin(assignment, ", ",
                    [](std::string* out,
                       const std::pair<PatternVar, WidthInt>& entry) {
                      absl::StrAppend(out, entry.first.ToString(), ": ",
                                      entry.second);
                    }),
      "}");
}

absl::StatusOr<RewriteCondition> RewriteCondition::Create(
    std::string description, absl::Span<const std::string_view> var_names,
    Predicate predicate) {
  if (predicate == nullptr) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Condition `%s` has no predicate", description));
  }
  std::vector<PatternVar> vars;
  absl::flat_hash_set<PatternVar> seen;
  for (std::string_view name : var_names) {
    ROVER_ASSIGN_OR_RETURN(Pattern parsed, ParsePattern(name));
    if (!parsed.IsVar()) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Condition `%s`: `%s` is not a pattern variable", description,
          name));
    }
    const PatternVar& var = parsed.As<PatternVar>();
    if (!seen.insert(var).second) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Condition `%s` lists %s twice", description, var.ToString()));
    }
    vars.push_back(var);
  }
  return RewriteCondition(std::move(description), std::move(vars),
                          std::move(predicate));
}

bool RewriteCondition::Evaluate(absl::Span<const WidthInt> values) const {
  CHECK_EQ(values.size(), vars_.size())
      << "Condition `" << description_ << "` takes " << vars_.size()
      << " values";
  return predicate_(values);
}

bool RewriteCondition::Evaluate(const Assignment& assignment) const {
  std::vector<WidthInt> values;
  values.reserve(vars_.size());
  for (const PatternVar& var : vars_) {
    std::optional<WidthInt> value = LookupAssignment(assignment, var);
    if (!value.has_value()) {
      VLOG(3) << "Condition `" << description_ << "` is false: "
              << var.ToString() << " is not constant in "
              << AssignmentToString(assignment);
      return false;
    }
    values.push_back(*value);
  }
  return Evaluate(values);
}

}  // namespace rover
