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

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "rover/arith/pattern.h"
#include "rover/arith/pattern_parser.h"
#include "rover/arith/width.h"
#include "rover/common/status/matchers.h"
#include "rover/common/status/status_macros.h"
#include "rover/egraph/arith_graph.h"
#include "rover/egraph/egraph.h"
#include "rover/egraph/rewrite.h"
#include "rover/egraph/runner.h"
#include "rover/rewrites/arith_rewrite.h"
#include "rover/rewrites/width_consistency.h"

namespace rover {
namespace {

using status_testing::IsOkAndHolds;
using ::testing::ElementsAre;
using ::testing::SizeIs;

absl::StatusOr<EClassId> AddText(Runner& runner, std::string_view text) {
  ROVER_ASSIGN_OR_RETURN(Pattern expr, ParseGroundExpression(text));
  return runner.AddExpr(expr);
}

class RewriteCatalogTest : public ::testing::Test {
 protected:
  RewriteCatalogTest()
      : rules_(CreateRewrites()), rewrites_(CreateSolverRewrites(rules_)) {}

  const ArithRewrite& GetRule(std::string_view name) const {
    for (const ArithRewrite& rule : rules_) {
      if (rule.name() == name) {
        return rule;
      }
    }
    LOG(FATAL) << "No rule named " << name;
  }

  // Saturates with the whole catalog and returns whether `lhs` and `rhs`
  // ended up in one class.
  absl::StatusOr<bool> ProvesEqual(std::string_view lhs, std::string_view rhs,
                                   Runner& runner) {
    ROVER_ASSIGN_OR_RETURN(EClassId lhs_id, AddText(runner, lhs));
    ROVER_ASSIGN_OR_RETURN(EClassId rhs_id, AddText(runner, rhs));
    ROVER_ASSIGN_OR_RETURN(StopReason reason, runner.Run(rewrites_));
    VLOG(1) << "Stopped: " << reason;
    return runner.egraph().AreEquivalent(lhs_id, rhs_id);
  }

  std::vector<ArithRewrite> rules_;
  std::vector<Rewrite> rewrites_;
};

TEST_F(RewriteCatalogTest, RulesInOrder) {
  std::vector<std::string> names;
  for (const ArithRewrite& rule : rules_) {
    names.push_back(rule.name());
  }
  EXPECT_THAT(names, ElementsAre("commute-add", "commute-mul",
                                 "merge-left-shift", "unmerge-left-shift",
                                 "mult-to-add", "left-shift-mult"));
  ASSERT_THAT(rewrites_, SizeIs(rules_.size()));
  for (int64_t i = 0; i < static_cast<int64_t>(rules_.size()); ++i) {
    EXPECT_EQ(rewrites_[i].name(), rules_[i].name());
    EXPECT_EQ(rewrites_[i].searcher(), rules_[i].lhs());
  }
}

TEST_F(RewriteCatalogTest, EveryRuleIsWidthConsistent) {
  for (const ArithRewrite& rule : rules_) {
    auto [lhs, rhs] = rule.patterns();
    ROVER_EXPECT_OK(CheckWidthConsistency(lhs)) << rule.name();
    ROVER_EXPECT_OK(CheckWidthConsistency(rhs)) << rule.name();
  }
}

TEST_F(RewriteCatalogTest, AdditionCommutes) {
  Runner runner;
  EXPECT_THAT(ProvesEqual("(+ 17 16 unsign A 16 unsign B)",
                          "(+ 17 16 unsign B 16 unsign A)", runner),
              IsOkAndHolds(true));
  EXPECT_EQ(runner.stop_reason(), StopReason::kSaturated);
}

TEST_F(RewriteCatalogTest, MultiplicationCommutes) {
  Runner runner;
  EXPECT_THAT(ProvesEqual("(* 32 16 unsign A 16 unsign B)",
                          "(* 32 16 unsign B 16 unsign A)", runner),
              IsOkAndHolds(true));
}

TEST_F(RewriteCatalogTest, MergesConsecutiveShifts) {
  Runner runner;
  EXPECT_THAT(
      ProvesEqual("(<< 17 17 unsign (<< 17 8 unsign A 3 unsign B) 3 unsign C)",
                  "(<< 17 8 unsign A 4 unsign (+ 4 3 unsign B 3 unsign C))",
                  runner),
      IsOkAndHolds(true));
  EXPECT_EQ(runner.stop_reason(), StopReason::kSaturated);
}

TEST_F(RewriteCatalogTest, OverflowingShiftAmountIsNotEquivalent) {
  // B + C needs 4 bits; computed in 3 it may wrap around.
  Runner runner;
  EXPECT_THAT(
      ProvesEqual("(<< 17 17 unsign (<< 17 8 unsign A 3 unsign B) 3 unsign C)",
                  "(<< 17 8 unsign A 3 unsign (+ 3 3 unsign B 3 unsign C))",
                  runner),
      IsOkAndHolds(false));
  EXPECT_EQ(runner.stop_reason(), StopReason::kSaturated);
}

TEST_F(RewriteCatalogTest, MergeAndUnmergeAreInverses) {
  Runner runner;
  ROVER_ASSERT_OK_AND_ASSIGN(
      EClassId merged,
      AddText(runner, "(<< 17 8 unsign A 4 unsign (+ 4 3 unsign B 3 unsign C))"));
  EXPECT_THAT(runner.Run(rewrites_), IsOkAndHolds(StopReason::kSaturated));

  // Unmerging introduces the nested shift with the inner width given by wlsh,
  // 8 + (2^3 - 1).
  ROVER_ASSERT_OK_AND_ASSIGN(
      EClassId unmerged,
      AddText(runner,
              "(<< 17 15 unsign (<< 15 8 unsign A 3 unsign B) 3 unsign C)"));
  EXPECT_TRUE(runner.egraph().AreEquivalent(merged, unmerged));
  EXPECT_TRUE(runner.egraph().IsClean());

  // Merging the nested shift back is blocked since its inner result is
  // narrower than the output; the merged form is only reachable through
  // the class it was unmerged from.
  const ArithRewrite& merge = GetRule("merge-left-shift");
  std::vector<ArithMatch> matches = merge.FindLhsMatches(runner.egraph());
  ASSERT_THAT(matches, SizeIs(2));
  for (const ArithMatch& match : matches) {
    EXPECT_FALSE(match.cond_res) << match.ToString();
  }
}

TEST_F(RewriteCatalogTest, MergeThenUnmergeRoundTrips) {
  Runner runner;
  ROVER_ASSERT_OK_AND_ASSIGN(
      EClassId nested,
      AddText(runner,
              "(<< 17 17 unsign (<< 17 8 unsign A 3 unsign B) 3 unsign C)"));
  EXPECT_THAT(runner.Run(rewrites_), IsOkAndHolds(StopReason::kSaturated));
  ROVER_ASSERT_OK_AND_ASSIGN(
      EClassId renested,
      AddText(runner,
              "(<< 17 15 unsign (<< 15 8 unsign A 3 unsign B) 3 unsign C)"));
  EXPECT_TRUE(runner.egraph().AreEquivalent(nested, renested));
}

TEST_F(RewriteCatalogTest, MultToAddCondition) {
  const ArithRewrite& rule = GetRule("mult-to-add");
  // Values are (wb, sb, wo).
  EXPECT_TRUE(rule.EvalCondition(std::vector<WidthInt>{2, 0, 8}));
  EXPECT_FALSE(rule.EvalCondition(std::vector<WidthInt>{1, 0, 8}));
  EXPECT_TRUE(rule.EvalCondition(std::vector<WidthInt>{3, 1, 8}));
  EXPECT_FALSE(rule.EvalCondition(std::vector<WidthInt>{2, 1, 8}));
  // Outputs no wider than the literal.
  EXPECT_TRUE(rule.EvalCondition(std::vector<WidthInt>{1, 0, 1}));
  EXPECT_TRUE(rule.EvalCondition(std::vector<WidthInt>{2, 1, 2}));
}

TEST_F(RewriteCatalogTest, MultToAddRewritesDoubling) {
  Runner runner;
  EXPECT_THAT(ProvesEqual("(* 9 8 unsign A 8 unsign 2)",
                          "(+ 9 8 unsign A 8 unsign A)", runner),
              IsOkAndHolds(true));

  Runner narrow_literal;
  EXPECT_THAT(ProvesEqual("(* 9 8 unsign A 1 unsign 2)",
                          "(+ 9 8 unsign A 8 unsign A)", narrow_literal),
              IsOkAndHolds(false));
}

TEST_F(RewriteCatalogTest, LeftShiftMultCondition) {
  const ArithRewrite& rule = GetRule("left-shift-mult");
  // Values are (wab, wa, wb, wo, wc).
  EXPECT_TRUE(rule.EvalCondition(std::vector<WidthInt>{32, 16, 16, 47, 4}));
  // The product does not fit its declared width.
  EXPECT_FALSE(rule.EvalCondition(std::vector<WidthInt>{8, 4, 5, 20, 2}));
  // The shift of the product overflows the output.
  EXPECT_FALSE(rule.EvalCondition(std::vector<WidthInt>{8, 4, 4, 10, 2}));
  // Shift amounts that make any width overflow are rejected.
  EXPECT_FALSE(rule.EvalCondition(std::vector<WidthInt>{8, 4, 4, 100, 40}));
}

TEST_F(RewriteCatalogTest, ShiftedMultiplicationDatapath) {
  // (A << M) * (B << N) computed at full width equals (A * B) << (M + N).
  Runner runner;
  EXPECT_THAT(
      ProvesEqual("(* 62 31 unsign (<< 31 16 unsign A 4 unsign M) 31 unsign "
                  "(<< 31 16 unsign B 4 unsign N))",
                  "(<< 62 32 unsign (* 32 16 unsign A 16 unsign B) 5 unsign "
                  "(+ 5 4 unsign M 4 unsign N))",
                  runner),
      IsOkAndHolds(true));
}

TEST_F(RewriteCatalogTest, FindLhsMatchesDoesNotChangeTheGraph) {
  Runner runner;
  ROVER_ASSERT_OK(
      AddText(runner,
              "(<< 17 17 unsign (<< 17 8 unsign A 3 unsign B) 3 unsign C)")
          .status());
  ROVER_ASSERT_OK(runner.Run(rewrites_).status());
  std::string before = runner.egraph().ToString();
  int64_t nodes_before = runner.egraph().num_nodes();
  for (const ArithRewrite& rule : rules_) {
    rule.FindLhsMatches(runner.egraph());
  }
  EXPECT_EQ(runner.egraph().ToString(), before);
  EXPECT_EQ(runner.egraph().num_nodes(), nodes_before);
}

}  // namespace
}  // namespace rover
