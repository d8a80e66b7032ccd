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

#include "rover/egraph/width_constant_fold.h"

#include <optional>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "rover/arith/arith_op.h"
#include "rover/arith/width.h"
#include "rover/common/status/matchers.h"
#include "rover/egraph/arith_graph.h"
#include "rover/egraph/enode.h"

namespace rover {
namespace {

using status_testing::IsOkAndHolds;
using status_testing::StatusIs;
using ::testing::HasSubstr;

class WidthConstantFoldTest : public ::testing::Test {
 protected:
  WidthConstant Make(const ENode& node) {
    return MakeWidthConstant(node, [this](EClassId id) -> const WidthConstant& {
      return constants_[id];
    });
  }

  absl::flat_hash_map<EClassId, WidthConstant> constants_ = {
      {0, WidthOrSign(3u)},
      {1, WidthOrSign(4u)},
      {2, std::nullopt},
      {3, WidthOrSign(Sign::kSigned)},
      {4, WidthOrSign(40u)},
  };
};

TEST_F(WidthConstantFoldTest, Leaves) {
  EXPECT_EQ(Make(ENode::Literal(7)), WidthConstant(WidthOrSign(7u)));
  EXPECT_EQ(Make(ENode::SignLiteral(Sign::kUnsigned)),
            WidthConstant(WidthOrSign(Sign::kUnsigned)));
  EXPECT_EQ(Make(ENode::Symbol("A")), std::nullopt);
}

TEST_F(WidthConstantFoldTest, WidthHelpers) {
  EXPECT_EQ(Make(ENode::Operator(ArithOp::kMaxPlus1, {0, 1})),
            WidthConstant(WidthOrSign(5u)));
  EXPECT_EQ(Make(ENode::Operator(ArithOp::kLeftShiftWidth, {1, 0})),
            WidthConstant(WidthOrSign(11u)));
}

TEST_F(WidthConstantFoldTest, UnknownOrNonWidthOperandsDoNotFold) {
  EXPECT_EQ(Make(ENode::Operator(ArithOp::kMaxPlus1, {0, 2})), std::nullopt);
  EXPECT_EQ(Make(ENode::Operator(ArithOp::kMaxPlus1, {0, 3})), std::nullopt);
  // 2^40 does not fit a width.
  EXPECT_EQ(Make(ENode::Operator(ArithOp::kLeftShiftWidth, {0, 4})),
            std::nullopt);
}

TEST_F(WidthConstantFoldTest, ArithmeticIsNotFolded) {
  EXPECT_EQ(Make(ENode::Operator(ArithOp::kAdd, {1, 0, 3, 0, 0, 3, 1})),
            std::nullopt);
}

TEST(WidthConstantMergeTest, Merge) {
  WidthConstant into;
  EXPECT_THAT(MergeWidthConstant(into, std::nullopt), IsOkAndHolds(false));
  EXPECT_THAT(MergeWidthConstant(into, WidthOrSign(8u)), IsOkAndHolds(true));
  EXPECT_EQ(into, WidthConstant(WidthOrSign(8u)));
  EXPECT_THAT(MergeWidthConstant(into, WidthOrSign(8u)), IsOkAndHolds(false));
  EXPECT_THAT(MergeWidthConstant(into, std::nullopt), IsOkAndHolds(false));
  EXPECT_THAT(MergeWidthConstant(into, WidthOrSign(Sign::kUnsigned)),
              StatusIs(absl::StatusCode::kInternal,
                       HasSubstr("Conflicting constants 8 and unsign")));
}

TEST(WidthOrSignTest, Conversions) {
  EXPECT_EQ(WidthOrSignAsWidthInt(WidthOrSign(Sign::kUnsigned)), 0);
  EXPECT_EQ(WidthOrSignAsWidthInt(WidthOrSign(Sign::kSigned)), 1);
  EXPECT_EQ(WidthOrSignAsWidthInt(WidthOrSign(17u)), 17);
  EXPECT_EQ(WidthOrSignToString(WidthOrSign(Sign::kSigned)), "sign");
  EXPECT_EQ(WidthOrSignToLeaf(WidthOrSign(17u)), ENode::Literal(17));
  EXPECT_EQ(WidthOrSignToLeaf(WidthOrSign(Sign::kSigned)),
            ENode::SignLiteral(Sign::kSigned));
}

}  // namespace
}  // namespace rover
