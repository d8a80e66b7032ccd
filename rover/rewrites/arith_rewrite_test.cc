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

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "rover/arith/pattern.h"
#include "rover/arith/pattern_parser.h"
#include "rover/arith/width.h"
#include "rover/common/status/matchers.h"
#include "rover/common/status/status_macros.h"
#include "rover/egraph/arith_graph.h"
#include "rover/egraph/egraph.h"
#include "rover/egraph/ematch.h"
#include "rover/egraph/rewrite.h"
#include "rover/egraph/runner.h"
#include "rover/rewrites/rewrite_condition.h"

namespace rover {
namespace {

using status_testing::StatusIs;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Pair;
using ::testing::SizeIs;

constexpr std::string_view kMergeLhs =
    "(<< ?wo ?wab ?sa (<< ?wab ?wa ?sa ?a ?wb unsign ?b) ?wc unsign ?c)";
constexpr std::string_view kMergeRhs =
    "(<< ?wo ?wa ?sa ?a (max+1 ?wb ?wc) unsign "
    "(+ (max+1 ?wb ?wc) ?wb unsign ?b ?wc unsign ?c))";

absl::StatusOr<EClassId> AddText(EGraph& egraph, std::string_view text) {
  ROVER_ASSIGN_OR_RETURN(Pattern expr, ParseGroundExpression(text));
  return egraph.AddExpr(expr);
}

absl::StatusOr<ArithRewrite> MakeMergeLeftShift() {
  ROVER_ASSIGN_OR_RETURN(
      RewriteCondition condition,
      RewriteCondition::Create("wab >= wo", {"?wo", "?wab"},
                               [](absl::Span<const WidthInt> w) {
                                 return w[1] >= w[0];
                               }));
  return ArithRewrite::Create("merge-left-shift", kMergeLhs, kMergeRhs,
                              std::move(condition));
}

TEST(ArithRewriteTest, CreateKeepsPatternsAndCondition) {
  ROVER_ASSERT_OK_AND_ASSIGN(ArithRewrite rule, MakeMergeLeftShift());
  EXPECT_EQ(rule.name(), "merge-left-shift");
  auto [lhs, rhs] = rule.patterns();
  EXPECT_EQ(lhs.ToString(), kMergeLhs);
  EXPECT_EQ(rhs.ToString(), kMergeRhs);
  ASSERT_TRUE(rule.condition().has_value());
  EXPECT_EQ(rule.condition()->description(), "wab >= wo");
  EXPECT_EQ(rule.ToString(), absl::StrCat("merge-left-shift: ", kMergeLhs,
                                          " => ", kMergeRhs,
                                          " if wab >= wo"));
}

TEST(ArithRewriteTest, CreateReportsMalformedText) {
  EXPECT_THAT(ArithRewrite::Create("broken", "(+ ?wo ?wa ?sa ?a", "?a"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Rule `broken`, lhs: Unterminated")));
  EXPECT_THAT(ArithRewrite::Create("broken", "(+ ?wo ?wa ?sa ?a ?wb ?sb ?b)",
                                   "(- ?a ?b)"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Rule `broken`, rhs: Unknown arithmetic")));
}

TEST(ArithRewriteTest, CreateRejectsInconsistentWidths) {
  EXPECT_THAT(
      ArithRewrite::Create(
          "corrupt",
          "(<< ?wo ?wx ?sa (<< ?wab ?wa ?sa ?a ?wb unsign ?b) ?wc unsign ?c)",
          kMergeRhs),
      StatusIs(absl::StatusCode::kInvalidArgument,
               HasSubstr("has inconsistent width: ?wx != ?wab")));
}

TEST(ArithRewriteTest, CreateRejectsUnboundVariables) {
  EXPECT_THAT(ArithRewrite::Create("unbound", "(+ ?wo ?wa ?sa ?a ?wb ?sb ?b)",
                                   "(+ ?wo ?wb ?sb ?b ?wa ?sa ?c)"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("right-hand side variable ?c")));

  ROVER_ASSERT_OK_AND_ASSIGN(
      RewriteCondition condition,
      RewriteCondition::Create("wz > 0", {"?wz"},
                               [](absl::Span<const WidthInt> w) {
                                 return w[0] > 0;
                               }));
  EXPECT_THAT(ArithRewrite::Create("unbound", "(+ ?wo ?wa ?sa ?a ?wb ?sb ?b)",
                                   "(+ ?wo ?wb ?sb ?b ?wa ?sa ?a)", condition),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("condition variable ?wz")));

  EXPECT_THAT(ArithRewrite::Create("everything", "?a", "?a"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("bare variable")));
}

TEST(ArithRewriteTest, EvalCondition) {
  ROVER_ASSERT_OK_AND_ASSIGN(
      ArithRewrite unconditional,
      ArithRewrite::Create("commute-add", "(+ ?wo ?wa ?sa ?a ?wb ?sb ?b)",
                           "(+ ?wo ?wb ?sb ?b ?wa ?sa ?a)"));
  EXPECT_TRUE(unconditional.EvalCondition(std::vector<WidthInt>{}));
  EXPECT_TRUE(unconditional.EvalCondition(Assignment{}));

  ROVER_ASSERT_OK_AND_ASSIGN(ArithRewrite merge, MakeMergeLeftShift());
  EXPECT_TRUE(merge.EvalCondition(std::vector<WidthInt>{17, 17}));
  EXPECT_FALSE(merge.EvalCondition(std::vector<WidthInt>{17, 15}));
  EXPECT_FALSE(merge.EvalCondition(Assignment{{PatternVar{"wo"}, 17}}));
}

TEST(ArithRewriteTest, FindLhsMatchesReportsAssignmentsWithoutApplying) {
  EGraph egraph;
  ROVER_ASSERT_OK_AND_ASSIGN(
      EClassId wide,
      AddText(egraph, "(<< 17 17 unsign (<< 17 8 unsign A 3 unsign B) 3 "
                      "unsign C)"));
  ROVER_ASSERT_OK_AND_ASSIGN(
      EClassId narrow,
      AddText(egraph, "(<< 17 15 unsign (<< 15 8 unsign A 3 unsign B) 3 "
                      "unsign C)"));
  std::string before = egraph.ToString();
  int64_t classes_before = egraph.num_classes();

  ROVER_ASSERT_OK_AND_ASSIGN(ArithRewrite merge, MakeMergeLeftShift());
  std::vector<ArithMatch> matches = merge.FindLhsMatches(egraph);
  ASSERT_THAT(matches, SizeIs(2));
  EXPECT_EQ(matches[0].eclass, wide);
  EXPECT_TRUE(matches[0].cond_res);
  EXPECT_THAT(matches[0].assign,
              ElementsAre(Pair(PatternVar{"wo"}, 17), Pair(PatternVar{"wab"}, 17),
                          Pair(PatternVar{"sa"}, 0), Pair(PatternVar{"wa"}, 8),
                          Pair(PatternVar{"wb"}, 3), Pair(PatternVar{"wc"}, 3)));
  EXPECT_EQ(matches[1].eclass, narrow);
  EXPECT_FALSE(matches[1].cond_res);

  EXPECT_EQ(egraph.ToString(), before);
  EXPECT_EQ(egraph.num_classes(), classes_before);
  EXPECT_TRUE(egraph.IsClean());
}

TEST(ArithRewriteTest, SubstitutionToAssignmentSkipsNonConstants) {
  EGraph egraph;
  ROVER_ASSERT_OK_AND_ASSIGN(EClassId sum,
                             AddText(egraph, "(+ 9 8 unsign A 8 sign B)"));
  ROVER_ASSERT_OK_AND_ASSIGN(Pattern pattern,
                             ParsePattern("(+ ?wo ?wa ?sa ?a ?wb ?sb ?b)"));
  std::vector<Subst> substs = MatchClass(egraph, pattern, sum);
  ASSERT_THAT(substs, SizeIs(1));
  EXPECT_THAT(SubstitutionToAssignment(egraph, substs[0], pattern),
              ElementsAre(Pair(PatternVar{"wo"}, 9), Pair(PatternVar{"wa"}, 8),
                          Pair(PatternVar{"sa"}, 0), Pair(PatternVar{"wb"}, 8),
                          Pair(PatternVar{"sb"}, 1)));
}

TEST(ArithRewriteTest, ConditionalRewriteOnlyFiresWhenConditionHolds) {
  ROVER_ASSERT_OK_AND_ASSIGN(ArithRewrite merge, MakeMergeLeftShift());
  std::vector<Rewrite> rewrites = merge.ToRewrites();
  ASSERT_THAT(rewrites, SizeIs(1));
  EXPECT_EQ(rewrites[0].name(), "merge-left-shift");

  Runner runner;
  ROVER_ASSERT_OK_AND_ASSIGN(
      Pattern narrow,
      ParseGroundExpression(
          "(<< 17 15 unsign (<< 15 8 unsign A 3 unsign B) 3 unsign C)"));
  ROVER_ASSERT_OK(runner.AddExpr(narrow).status());
  ROVER_ASSERT_OK(runner.Run(rewrites).status());
  EXPECT_THAT(runner.iterations(), SizeIs(1));
  EXPECT_THAT(runner.iterations()[0].applied, IsEmpty());
  EXPECT_THAT(merge.FindLhsMatches(runner.egraph()), SizeIs(1));
}

TEST(ArithRewriteTest, ConditionalRewriteSkipsUnresolvedWidths) {
  // A 40-bit shift amount makes (wlsh 8 40) too wide to fold, so ?wab has no
  // constant and the guard must reject the match.
  constexpr std::string_view kUnfoldable =
      "(<< 40 (wlsh 8 40) unsign (<< (wlsh 8 40) 8 unsign A 40 unsign B) 3 "
      "unsign C)";
  ROVER_ASSERT_OK_AND_ASSIGN(ArithRewrite merge, MakeMergeLeftShift());

  Runner runner;
  ROVER_ASSERT_OK_AND_ASSIGN(Pattern expr, ParseGroundExpression(kUnfoldable));
  ROVER_ASSERT_OK(runner.AddExpr(expr).status());
  ROVER_ASSERT_OK(runner.Run(merge.ToRewrites()).status());
  EXPECT_EQ(runner.stop_reason(), StopReason::kSaturated);
  ASSERT_THAT(runner.iterations(), SizeIs(1));
  EXPECT_THAT(runner.iterations()[0].applied, IsEmpty());

  std::vector<ArithMatch> matches = merge.FindLhsMatches(runner.egraph());
  ASSERT_THAT(matches, SizeIs(1));
  EXPECT_FALSE(matches[0].cond_res);
  EXPECT_THAT(matches[0].assign,
              ElementsAre(Pair(PatternVar{"wo"}, 40), Pair(PatternVar{"sa"}, 0),
                          Pair(PatternVar{"wa"}, 8), Pair(PatternVar{"wb"}, 40),
                          Pair(PatternVar{"wc"}, 3)));
  EXPECT_FALSE(LookupAssignment(matches[0].assign, PatternVar{"wab"})
                   .has_value());
}

}  // namespace
}  // namespace rover
