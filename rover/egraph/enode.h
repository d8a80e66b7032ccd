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

#ifndef ROVER_EGRAPH_ENODE_H_
#define ROVER_EGRAPH_ENODE_H_

#include <ostream>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

#include "absl/types/span.h"
#include "rover/arith/arith_op.h"
#include "rover/arith/width.h"
#include "rover/egraph/arith_graph.h"

namespace rover {

// A single operator application inside an e-graph. Operands refer to e-classes
// rather than to other nodes. Leaves (literals, signs and symbols) carry their
// value as a payload and have no children.
class ENode {
 public:
  using Payload = std::variant<std::monostate, WidthInt, Sign, std::string>;

  static ENode Literal(WidthInt value);
  static ENode SignLiteral(Sign sign);
  static ENode Symbol(std::string_view name);

  // `children` must have ArithOpArity(op) entries; `op` must not be a leaf.
  static ENode Operator(ArithOp op, std::vector<EClassId> children);

  ArithOp op() const { return op_; }
  absl::Span<const EClassId> children() const { return children_; }
  bool IsLeaf() const { return children_.empty(); }

  // Payload accessors; only valid on the matching leaf kind.
  WidthInt literal() const;
  Sign sign() const;
  const std::string& symbol() const;

  // Returns a copy with every child replaced by `f(child)`.
  template <typename F>
  ENode MapChildren(F f) const {
    ENode result = *this;
    for (EClassId& child : result.children_) {
      child = f(child);
    }
    return result;
  }

  // Leaves print as their value; operators as `(op #c0 #c1 ...)`.
  std::string ToString() const;

  friend bool operator==(const ENode& a, const ENode& b) {
    return a.op_ == b.op_ && a.payload_ == b.payload_ &&
           a.children_ == b.children_;
  }
  friend bool operator!=(const ENode& a, const ENode& b) { return !(a == b); }
  friend bool operator<(const ENode& a, const ENode& b) {
    return std::tie(a.op_, a.payload_, a.children_) <
           std::tie(b.op_, b.payload_, b.children_);
  }
  template <typename H>
  friend H AbslHashValue(H h, const ENode& n) {
    return H::combine(std::move(h), n.op_, n.payload_, n.children_);
  }

 private:
  ENode(ArithOp op, Payload payload, std::vector<EClassId> children)
      : op_(op), payload_(std::move(payload)), children_(std::move(children)) {}

  ArithOp op_;
  Payload payload_;
  std::vector<EClassId> children_;
};

inline std::ostream& operator<<(std::ostream& os, const ENode& node) {
  os << node.ToString();
  return os;
}

}  // namespace rover

#endif  // ROVER_EGRAPH_ENODE_H_
