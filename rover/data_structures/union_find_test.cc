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

#include "rover/data_structures/union_find.h"

#include <cstdint>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace rover {
namespace {

using ::testing::AnyOf;
using ::testing::ElementsAre;

TEST(UnionFindTest, UnionFind) {
  UnionFind<uint32_t> uf;
  uint32_t a = uf.Insert();
  uint32_t b = uf.Insert();
  uint32_t c = uf.Insert();
  uint32_t d = uf.Insert();
  EXPECT_EQ(uf.size(), 4);

  EXPECT_EQ(uf.Find(a), a);
  EXPECT_EQ(uf.Find(b), b);
  EXPECT_EQ(uf.Find(c), c);
  EXPECT_EQ(uf.Find(d), d);

  // Unioning an element with itself should have no effect.
  EXPECT_EQ(uf.Union(a, a), a);
  EXPECT_THAT(uf.GetRepresentatives(), ElementsAre(a, b, c, d));

  uf.Union(a, b);
  EXPECT_EQ(uf.Find(a), uf.Find(b));
  EXPECT_THAT(uf.Find(a), AnyOf(a, b));
  EXPECT_EQ(uf.Find(c), c);
  EXPECT_EQ(uf.Find(d), d);

  uf.Union(b, c);
  EXPECT_EQ(uf.Find(a), uf.Find(b));
  EXPECT_EQ(uf.Find(a), uf.Find(c));
  EXPECT_EQ(uf.Find(d), d);

  uf.Union(a, d);
  EXPECT_EQ(uf.Find(a), uf.Find(b));
  EXPECT_EQ(uf.Find(a), uf.Find(c));
  EXPECT_EQ(uf.Find(a), uf.Find(d));
  EXPECT_EQ(uf.GetRepresentatives().size(), 1);
}

TEST(UnionFindTest, UnionKeepsLargerClassRepresentative) {
  UnionFind<uint32_t> uf;
  uint32_t a = uf.Insert();
  uint32_t b = uf.Insert();
  uint32_t c = uf.Insert();
  EXPECT_EQ(uf.Union(b, c), b);
  // {b, c} is larger than {a}, so b stays the representative.
  EXPECT_EQ(uf.Union(a, b), b);
  EXPECT_FALSE(uf.IsRepresentative(a));
  EXPECT_TRUE(uf.IsRepresentative(b));
}

TEST(UnionFindTest, UnionIntoKeepsRequestedRoot) {
  UnionFind<uint32_t> uf;
  uint32_t a = uf.Insert();
  uint32_t b = uf.Insert();
  uint32_t c = uf.Insert();
  uf.Union(b, c);
  EXPECT_EQ(uf.UnionInto(a, b), a);
  EXPECT_EQ(uf.Find(c), a);
  EXPECT_THAT(uf.GetRepresentatives(), ElementsAre(a));
}

}  // namespace
}  // namespace rover
