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

#include "rover/rewrites/rewrite_catalog.h"

#include <algorithm>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "rover/arith/width.h"
#include "rover/arith/width_predicates.h"
#include "rover/egraph/rewrite.h"
#include "rover/rewrites/arith_rewrite.h"
#include "rover/rewrites/rewrite_condition.h"

namespace rover {
namespace {

RewriteCondition MakeCondition(std::string_view description,
                               absl::Span<const std::string_view> var_names,
                               RewriteCondition::Predicate predicate) {
  absl::StatusOr<RewriteCondition> condition =
      RewriteCondition::Create(std::string(description), var_names,
                               std::move(predicate));
  CHECK_OK(condition.status());
  return *std::move(condition);
}

void AddRule(std::vector<ArithRewrite>& rules, std::string_view name,
             std::string_view lhs, std::string_view rhs,
             std::optional<RewriteCondition> condition = std::nullopt) {
  absl::StatusOr<ArithRewrite> rule =
      ArithRewrite::Create(name, lhs, rhs, std::move(condition));
  CHECK_OK(rule.status());
  rules.push_back(*std::move(rule));
}

}  // namespace

std::vector<ArithRewrite> CreateRewrites() {
  std::vector<ArithRewrite> rules;

  AddRule(rules, "commute-add", "(+ ?wo ?wa ?sa ?a ?wb ?sb ?b)",
          "(+ ?wo ?wb ?sb ?b ?wa ?sa ?a)");
  AddRule(rules, "commute-mul", "(* ?wo ?wa ?sa ?a ?wb ?sb ?b)",
          "(* ?wo ?wb ?sb ?b ?wa ?sa ?a)");

  // (a << b) << c  =>  a << (b + c), if the inner shift does not truncate.
  AddRule(rules, "merge-left-shift",
          "(<< ?wo ?wab ?sa (<< ?wab ?wa ?sa ?a ?wb unsign ?b) ?wc unsign ?c)",
          "(<< ?wo ?wa ?sa ?a (max+1 ?wb ?wc) unsign "
          "(+ (max+1 ?wb ?wc) ?wb unsign ?b ?wc unsign ?c))",
          MakeCondition("wab >= wo", {"?wo", "?wab"},
                        [](absl::Span<const WidthInt> w) {
                          return w[1] >= w[0];
                        }));

  // a << (b + c)  =>  (a << b) << c, if the sum b + c cannot overflow.
  AddRule(rules, "unmerge-left-shift",
          "(<< ?wo ?wa ?sa ?a ?wbc unsign (+ ?wbc ?wb unsign ?b ?wc unsign ?c))",
          "(<< ?wo (wlsh ?wa ?wb) ?sa (<< (wlsh ?wa ?wb) ?wa ?sa ?a ?wb unsign "
          "?b) ?wc unsign ?c)",
          MakeCondition("wbc >= max(wb, wc) + 1", {"?wbc", "?wb", "?wc"},
                        [](absl::Span<const WidthInt> w) {
                          return AddNoOverflow(w[0], w[1], w[2]);
                        }));

  // Multiplying by two is only the same as doubling if the literal 2 is read
  // as two: an unsigned literal needs at least 2 bits, a signed one 3 bits.
  // Otherwise the output must be at most as wide as the literal.
  AddRule(rules, "mult-to-add", "(* ?wo ?wa ?sa ?a ?wb ?sb 2)",
          "(+ ?wo ?wa ?sa ?a ?wa ?sa ?a)",
          MakeCondition(
              "(!sb && wb > 1) || (sb && wb > 2) || wo <= wb",
              {"?wb", "?sb", "?wo"}, [](absl::Span<const WidthInt> w) {
                WidthInt wb = w[0];
                WidthInt sb = w[1];
                WidthInt wo = w[2];
                return (sb == 0 && wb > 1) || (sb == 1 && wb > 2) || wo <= wb;
              }));

  // (a * b) << c  =>  (a << c) * b, if neither order of evaluation can
  // overflow its intermediate result.
  AddRule(rules, "left-shift-mult",
          "(<< ?wo ?wab unsign (* ?wab ?wa unsign ?a ?wb unsign ?b) ?wc "
          "unsign ?c)",
          "(* ?wo (wlsh ?wa ?wc) unsign (<< (wlsh ?wa ?wc) ?wa unsign ?a ?wc "
          "unsign ?c) ?wb unsign ?b)",
          MakeCondition(
              "product and shift of both orders fit",
              {"?wab", "?wa", "?wb", "?wo", "?wc"},
              [](absl::Span<const WidthInt> w) {
                WidthInt wab = w[0];
                WidthInt wa = w[1];
                WidthInt wb = w[2];
                WidthInt wo = w[3];
                WidthInt wc = w[4];
                if (!MulNoOverflow(wab, wa, wb) ||
                    !ShiftNoOverflow(wo, wab, wc)) {
                  return false;
                }
                std::optional<WidthInt> wac = LeftShiftWidth(wa, wc);
                return wac.has_value() && ShiftNoOverflow(*wac, wa, wc) &&
                       MulNoOverflow(wo, *wac, wb);
              }));

  return rules;
}

std::vector<Rewrite> CreateSolverRewrites(
    absl::Span<const ArithRewrite> rules) {
  std::vector<Rewrite> rewrites;
  for (const ArithRewrite& rule : rules) {
    std::vector<Rewrite> converted = rule.ToRewrites();
    std::move(converted.begin(), converted.end(),
              std::back_inserter(rewrites));
  }
  return rewrites;
}

}  // namespace rover
