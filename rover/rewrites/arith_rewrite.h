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

#ifndef ROVER_REWRITES_ARITH_REWRITE_H_
#define ROVER_REWRITES_ARITH_REWRITE_H_

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "rover/arith/pattern.h"
#include "rover/arith/width.h"
#include "rover/egraph/arith_graph.h"
#include "rover/egraph/rewrite.h"
#include "rover/rewrites/rewrite_condition.h"

namespace rover {

// One match of a rule's left-hand side, for inspecting why a rule did or did
// not fire.
struct ArithMatch {
  EClassId eclass;
  Assignment assign;
  bool cond_res;

  std::string ToString() const;
};

// A width-aware rewrite rule: a left-hand side, a derived right-hand side
// whose width and sign slots are computed from left-hand side variables, and
// an optional side condition over the matched widths.
//
// Rules are immutable once created.
class ArithRewrite {
 public:
  // Parses and validates a rule. Both sides must be width consistent (see
  // CheckWidthConsistency), and every variable of the right-hand side and of
  // the condition must be bound by the left-hand side.
  static absl::StatusOr<ArithRewrite> Create(
      std::string_view name, std::string_view lhs, std::string_view rhs,
      std::optional<RewriteCondition> condition = std::nullopt);

  const std::string& name() const { return name_; }
  const Pattern& lhs() const { return lhs_; }
  const Pattern& rhs() const { return rhs_; }
  std::pair<const Pattern&, const Pattern&> patterns() const {
    return {lhs_, rhs_};
  }
  const std::optional<RewriteCondition>& condition() const {
    return condition_;
  }

  // True if the rule has no condition, otherwise the condition applied to
  // `values` given in condition-variable order.
  bool EvalCondition(absl::Span<const WidthInt> values) const;

  // As above, reading the condition variables from `assignment`. A condition
  // variable missing from the assignment makes the result false.
  bool EvalCondition(const Assignment& assignment) const;

  // Returns the rewrites that implement this rule in the e-graph engine.
  std::vector<Rewrite> ToRewrites() const;

  // Searches `graph` for the left-hand side and reports every match together
  // with its assignment and whether the condition holds. Does not apply the
  // rule.
  std::vector<ArithMatch> FindLhsMatches(const ArithGraph& graph) const;

  std::string ToString() const;

 private:
  ArithRewrite(std::string name, Pattern lhs, Pattern rhs,
               std::optional<RewriteCondition> condition)
      : name_(std::move(name)),
        lhs_(std::move(lhs)),
        rhs_(std::move(rhs)),
        condition_(std::move(condition)) {}

  std::string name_;
  Pattern lhs_;
  Pattern rhs_;
  std::optional<RewriteCondition> condition_;
};

// Resolves the variables of `pattern` bound in `subst` to constants through
// `graph`. Variables whose class is not constant are left out.
Assignment SubstitutionToAssignment(const ArithGraph& graph,
                                    const Subst& subst,
                                    const Pattern& pattern);

}  // namespace rover

#endif  // ROVER_REWRITES_ARITH_REWRITE_H_
