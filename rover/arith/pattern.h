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

#ifndef ROVER_ARITH_PATTERN_H_
#define ROVER_ARITH_PATTERN_H_

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "absl/log/check.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "rover/arith/arith_op.h"
#include "rover/arith/width.h"

namespace rover {

// A pattern variable, written `?name`. Within one rule, equal names denote the
// same matched value.
struct PatternVar {
  std::string name;

  std::string ToString() const { return "?" + name; }

  friend bool operator==(const PatternVar& a, const PatternVar& b) {
    return a.name == b.name;
  }
  friend bool operator!=(const PatternVar& a, const PatternVar& b) {
    return !(a == b);
  }
  friend bool operator<(const PatternVar& a, const PatternVar& b) {
    return a.name < b.name;
  }
  template <typename H>
  friend H AbslHashValue(H h, const PatternVar& v) {
    return H::combine(std::move(h), v.name);
  }
};

// A numeral. Used for widths and for literal operands such as the `2` of
// `a * 2`.
struct PatternLiteral {
  WidthInt value;

  friend bool operator==(const PatternLiteral& a, const PatternLiteral& b) {
    return a.value == b.value;
  }
};

struct PatternSign {
  Sign sign;

  friend bool operator==(const PatternSign& a, const PatternSign& b) {
    return a.sign == b.sign;
  }
};

// A named bit-vector input. Only appears in ground expressions.
struct PatternSymbol {
  std::string name;

  friend bool operator==(const PatternSymbol& a, const PatternSymbol& b) {
    return a.name == b.name;
  }
};

class Pattern;

// A `+`, `*` or `<<` node. `slots` always holds binary_arith_slot::kCount
// entries laid out as (output_width width_a sign_a a width_b sign_b b).
struct BinaryArithNode {
  ArithOp op;
  std::vector<Pattern> slots;
};

// A `max+1` or `wlsh` node with its two width operands.
struct WidthArithNode {
  ArithOp op;
  std::vector<Pattern> operands;
};

bool operator==(const BinaryArithNode& a, const BinaryArithNode& b);
bool operator==(const WidthArithNode& a, const WidthArithNode& b);

// An expression template over the width-annotated arithmetic language. Each
// Pattern owns its subtree; copies are deep. A pattern without variables is a
// ground expression.
class Pattern {
 public:
  using Node = std::variant<PatternVar, PatternLiteral, PatternSign,
                            PatternSymbol, BinaryArithNode, WidthArithNode>;

  static Pattern MakeVar(std::string_view name);
  static Pattern MakeLiteral(WidthInt value);
  static Pattern MakeSign(Sign sign);
  static Pattern MakeSymbol(std::string_view name);

  // Builds a binary arithmetic node. Returns an error if `op` is not `+`, `*`
  // or `<<`, if the slot count is wrong, or if a slot holds the wrong kind of
  // pattern (e.g. a sign literal in a width slot).
  static absl::StatusOr<Pattern> MakeBinaryArith(ArithOp op,
                                                 std::vector<Pattern> slots);

  // Builds a width helper node; `operands` must be two width patterns.
  static absl::StatusOr<Pattern> MakeWidthArith(ArithOp op,
                                                std::vector<Pattern> operands);

  const Node& node() const { return node_; }

  template <typename T>
  bool Is() const {
    return std::holds_alternative<T>(node_);
  }

  template <typename T>
  const T& As() const {
    CHECK(Is<T>()) << "Unexpected pattern kind: " << ToString();
    return std::get<T>(node_);
  }

  bool IsVar() const { return Is<PatternVar>(); }
  bool IsBinaryArith() const { return Is<BinaryArithNode>(); }

  // Returns the operator of an operator node or the leaf kind of a leaf.
  // Variables have no operator and must not be passed.
  ArithOp op() const;

  // For binary arithmetic nodes returns the declared output width slot,
  // otherwise nullptr.
  const Pattern* GetOutputWidth() const;

  // Returns the operand patterns in slot order; empty for leaves.
  absl::Span<const Pattern> children() const;

  // Returns the distinct variables in order of first appearance (pre-order).
  std::vector<PatternVar> Vars() const;

  bool IsGround() const;

  // Number of nodes in the tree.
  int64_t size() const;

  std::string ToString() const;

  friend bool operator==(const Pattern& a, const Pattern& b) {
    return a.node_ == b.node_;
  }
  friend bool operator!=(const Pattern& a, const Pattern& b) {
    return !(a == b);
  }

 private:
  explicit Pattern(Node node) : node_(std::move(node)) {}

  Node node_;
};

inline std::ostream& operator<<(std::ostream& os, const Pattern& pattern) {
  os << pattern.ToString();
  return os;
}

}  // namespace rover

#endif  // ROVER_ARITH_PATTERN_H_
