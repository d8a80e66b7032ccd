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

#include "rover/arith/pattern.h"

#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "rover/arith/arith_op.h"
#include "rover/arith/pattern_parser.h"
#include "rover/arith/width.h"
#include "rover/common/status/matchers.h"

namespace rover {
namespace {

using status_testing::StatusIs;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

std::vector<Pattern> AddSlots(Pattern a, Pattern b) {
  std::vector<Pattern> slots;
  slots.push_back(Pattern::MakeLiteral(17));
  slots.push_back(Pattern::MakeLiteral(16));
  slots.push_back(Pattern::MakeSign(Sign::kUnsigned));
  slots.push_back(std::move(a));
  slots.push_back(Pattern::MakeLiteral(16));
  slots.push_back(Pattern::MakeSign(Sign::kUnsigned));
  slots.push_back(std::move(b));
  return slots;
}

TEST(PatternTest, BuildBinaryArith) {
  ROVER_ASSERT_OK_AND_ASSIGN(
      Pattern add,
      Pattern::MakeBinaryArith(
          ArithOp::kAdd,
          AddSlots(Pattern::MakeSymbol("A"), Pattern::MakeSymbol("B"))));
  EXPECT_EQ(add.ToString(), "(+ 17 16 unsign A 16 unsign B)");
  EXPECT_TRUE(add.IsBinaryArith());
  EXPECT_EQ(add.op(), ArithOp::kAdd);
  EXPECT_EQ(add.size(), 8);
  EXPECT_TRUE(add.IsGround());
  ASSERT_NE(add.GetOutputWidth(), nullptr);
  EXPECT_EQ(*add.GetOutputWidth(), Pattern::MakeLiteral(17));
}

TEST(PatternTest, BinaryArithRejectsWrongSlotCount) {
  std::vector<Pattern> slots;
  slots.push_back(Pattern::MakeVar("wo"));
  EXPECT_THAT(Pattern::MakeBinaryArith(ArithOp::kMul, std::move(slots)),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("takes 7 slots")));
}

TEST(PatternTest, BinaryArithRejectsSignInWidthSlot) {
  std::vector<Pattern> slots =
      AddSlots(Pattern::MakeSymbol("A"), Pattern::MakeSymbol("B"));
  slots[1] = Pattern::MakeSign(Sign::kSigned);
  EXPECT_THAT(Pattern::MakeBinaryArith(ArithOp::kAdd, std::move(slots)),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Slot 1 of `+` must be a width")));
}

TEST(PatternTest, BinaryArithRejectsLiteralInSignSlot) {
  std::vector<Pattern> slots =
      AddSlots(Pattern::MakeSymbol("A"), Pattern::MakeSymbol("B"));
  slots[5] = Pattern::MakeLiteral(0);
  EXPECT_THAT(Pattern::MakeBinaryArith(ArithOp::kAdd, std::move(slots)),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Slot 5 of `+` must be a sign")));
}

TEST(PatternTest, WidthArithRejectsNonBinaryOperator) {
  std::vector<Pattern> operands;
  operands.push_back(Pattern::MakeVar("wa"));
  operands.push_back(Pattern::MakeVar("wb"));
  EXPECT_THAT(Pattern::MakeWidthArith(ArithOp::kAdd, std::move(operands)),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("not a width operator")));
}

TEST(PatternTest, VarsInFirstAppearanceOrder) {
  ROVER_ASSERT_OK_AND_ASSIGN(
      Pattern p,
      ParsePattern("(<< ?wo ?wab ?sa (<< ?wab ?wa ?sa ?a ?wb unsign ?b) "
                   "?wc unsign ?c)"));
  std::vector<std::string> names;
  for (const PatternVar& var : p.Vars()) {
    names.push_back(var.ToString());
  }
  EXPECT_THAT(names, ElementsAre("?wo", "?wab", "?sa", "?wa", "?a", "?wb",
                                 "?b", "?wc", "?c"));
  EXPECT_FALSE(p.IsGround());
}

TEST(PatternTest, StructuralEquality) {
  ROVER_ASSERT_OK_AND_ASSIGN(Pattern a, ParsePattern("(max+1 ?wb ?wc)"));
  ROVER_ASSERT_OK_AND_ASSIGN(Pattern b, ParsePattern("(max+1 ?wb ?wc)"));
  ROVER_ASSERT_OK_AND_ASSIGN(Pattern c, ParsePattern("(max+1 ?wc ?wb)"));
  ROVER_ASSERT_OK_AND_ASSIGN(Pattern d, ParsePattern("(wlsh ?wb ?wc)"));
  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
  EXPECT_NE(a, d);
  EXPECT_EQ(a.GetOutputWidth(), nullptr);
  EXPECT_EQ(a.children().size(), 2);
}

TEST(PatternTest, CopiesAreDeep) {
  ROVER_ASSERT_OK_AND_ASSIGN(Pattern original,
                             ParsePattern("(* ?wo ?wa ?sa ?a ?wb ?sb 2)"));
  Pattern copy = original;
  EXPECT_EQ(copy, original);
  EXPECT_NE(&copy.children()[0], &original.children()[0]);
}

}  // namespace
}  // namespace rover
