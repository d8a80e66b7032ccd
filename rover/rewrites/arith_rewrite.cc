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

#include "rover/rewrites/arith_rewrite.h"

#include <memory>
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
#include "absl/strings/str_format.h"
#include "absl/types/span.h"
#include "rover/arith/pattern.h"
#include "rover/arith/pattern_parser.h"
#include "rover/arith/width.h"
#include "rover/egraph/arith_graph.h"
#include "rover/egraph/egraph.h"
#include "rover/egraph/rewrite.h"
#include "rover/egraph/width_constant_fold.h"
#include "rover/rewrites/rewrite_condition.h"
#include "rover/rewrites/width_consistency.h"

namespace rover {
namespace {

absl::Status AnnotateRuleError(std::string_view name, std::string_view side,
                               const absl::Status& status) {
  return absl::Status(status.code(),
                      absl::StrFormat("Rule `%s`, %s: %s", name, side,
                                      status.message()));
}

absl::StatusOr<Pattern> ParseRuleSide(std::string_view name,
                                      std::string_view side,
                                      std::string_view text) {
  absl::StatusOr<Pattern> pattern = ParsePattern(text);
  if (!pattern.ok()) {
    return AnnotateRuleError(name, side, pattern.status());
  }
  if (absl::Status status = CheckWidthConsistency(*pattern); !status.ok()) {
    return AnnotateRuleError(name, side, status);
  }
  return pattern;
}

}  // namespace

std::string ArithMatch::ToString() const {
  return absl::StrFormat("#%d %s -> %s", eclass, AssignmentToString(assign),
                         cond_res ? "true" : "false");
}

absl::StatusOr<ArithRewrite> ArithRewrite::Create(
    std::string_view name, std::string_view lhs, std::string_view rhs,
    std::optional<RewriteCondition> condition) {
  absl::StatusOr<Pattern> lhs_pattern = ParseRuleSide(name, "lhs", lhs);
  if (!lhs_pattern.ok()) {
    return lhs_pattern.status();
  }
  absl::StatusOr<Pattern> rhs_pattern = ParseRuleSide(name, "rhs", rhs);
  if (!rhs_pattern.ok()) {
    return rhs_pattern.status();
  }
  if (lhs_pattern->IsVar()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Rule `%s`: left-hand side must not be a bare variable", name));
  }

  std::vector<PatternVar> lhs_vars = lhs_pattern->Vars();
  absl::flat_hash_set<PatternVar> bound(lhs_vars.begin(), lhs_vars.end());
  for (const PatternVar& var : rhs_pattern->Vars()) {
    if (!bound.contains(var)) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Rule `%s`: right-hand side variable %s is not bound by the "
          "left-hand side",
          name, var.ToString()));
    }
  }
  if (condition.has_value()) {
    for (const PatternVar& var : condition->vars()) {
      if (!bound.contains(var)) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "Rule `%s`: condition variable %s is not bound by the left-hand "
            "side",
            name, var.ToString()));
      }
    }
  }
  return ArithRewrite(std::string(name), *std::move(lhs_pattern),
                      *std::move(rhs_pattern), std::move(condition));
}

bool ArithRewrite::EvalCondition(absl::Span<const WidthInt> values) const {
  if (!condition_.has_value()) {
    return true;
  }
  return condition_->Evaluate(values);
}

bool ArithRewrite::EvalCondition(const Assignment& assignment) const {
  if (!condition_.has_value()) {
    return true;
  }
  return condition_->Evaluate(assignment);
}

std::vector<Rewrite> ArithRewrite::ToRewrites() const {
  std::shared_ptr<const Applier> applier;
  if (!condition_.has_value()) {
    applier = std::make_shared<PatternApplier>(rhs_);
  } else {
    auto guard = [name = name_, condition = *condition_](
                     const EGraph& egraph, EClassId eclass,
                     const Subst& subst) {
      std::vector<WidthInt> values;
      values.reserve(condition.vars().size());
      for (const PatternVar& var : condition.vars()) {
        std::optional<EClassId> id = subst.Get(var);
        std::optional<WidthInt> value =
            id.has_value() ? GetConstWidthOrSign(egraph, *id) : std::nullopt;
        if (!value.has_value()) {
          VLOG(3) << name << " not applied to #" << eclass << ": "
                  << var.ToString() << " is not constant";
          return false;
        }
        values.push_back(*value);
      }
      if (!condition.Evaluate(values)) {
        VLOG(3) << name << " not applied to #" << eclass << ": "
                << condition.description() << " does not hold for "
                << subst.ToString();
        return false;
      }
      return true;
    };
    applier = std::make_shared<ConditionalApplier>(
        std::move(guard), std::make_unique<PatternApplier>(rhs_));
  }
  absl::StatusOr<Rewrite> rewrite = Rewrite::Create(name_, lhs_, applier);
  // Create already checked that the right-hand side is bound.
  CHECK_OK(rewrite.status());
  std::vector<Rewrite> rewrites;
  rewrites.push_back(*std::move(rewrite));
  return rewrites;
}

std::vector<ArithMatch> ArithRewrite::FindLhsMatches(
    const ArithGraph& graph) const {
  std::vector<ArithMatch> matches;
  for (const SearchMatches& found : graph.Search(lhs_)) {
    for (const Subst& subst : found.substs) {
      Assignment assign = SubstitutionToAssignment(graph, subst, lhs_);
      bool cond_res = EvalCondition(assign);
      matches.push_back(ArithMatch{found.eclass, std::move(assign), cond_res});
    }
  }
  return matches;
}

std::string ArithRewrite::ToString() const {
  std::string condition =
      condition_.has_value()
          ? absl::StrFormat(" if %s", condition_->description())
          : "";
  return absl::StrFormat("%s: %s => %s%s", name_, lhs_.ToString(),
                         rhs_.ToString(), condition);
}

Assignment SubstitutionToAssignment(const ArithGraph& graph,
                                    const Subst& subst,
                                    const Pattern& pattern) {
  Assignment assignment;
  for (const PatternVar& var : pattern.Vars()) {
    std::optional<EClassId> id = subst.Get(var);
    if (!id.has_value()) {
      continue;
    }
    if (std::optional<WidthInt> value = GetConstWidthOrSign(graph, *id)) {
      assignment.push_back({var, *value});
    }
  }
  return assignment;
}

}  // namespace rover
