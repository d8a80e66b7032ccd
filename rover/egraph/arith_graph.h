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

#ifndef ROVER_EGRAPH_ARITH_GRAPH_H_
#define ROVER_EGRAPH_ARITH_GRAPH_H_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "rover/arith/pattern.h"
#include "rover/arith/width.h"

namespace rover {

// Identifies an equivalence class of an e-graph. Ids are dense; a class that
// has been merged into another is referred to through its representative.
using EClassId = uint32_t;

// A binding of pattern variables to e-classes, produced by a successful
// search. Bindings are kept in the order the search made them.
class Subst {
 public:
  Subst() = default;

  // Binds `var` to `id`. `var` must not already be bound.
  void Insert(const PatternVar& var, EClassId id);

  std::optional<EClassId> Get(const PatternVar& var) const;

  bool Contains(const PatternVar& var) const { return Get(var).has_value(); }

  const std::vector<std::pair<PatternVar, EClassId>>& bindings() const {
    return bindings_;
  }

  int64_t size() const { return bindings_.size(); }

  // Returns e.g. "{?a: 3, ?wa: 7}".
  std::string ToString() const;

  friend bool operator==(const Subst& a, const Subst& b) {
    return a.bindings_ == b.bindings_;
  }
  template <typename H>
  friend H AbslHashValue(H h, const Subst& s) {
    return H::combine(std::move(h), s.bindings_);
  }

 private:
  std::vector<std::pair<PatternVar, EClassId>> bindings_;
};

// All substitutions under which a pattern matches one e-class.
struct SearchMatches {
  EClassId eclass;
  std::vector<Subst> substs;
};

// The two capabilities the rewrite rules need from an equality-saturation
// engine: pattern search, and resolution of a class to a known constant width
// or sign. Implementations must not mutate the graph in either call.
class ArithGraph {
 public:
  virtual ~ArithGraph() = default;

  // Returns every class matching `pattern` together with all distinct
  // substitutions, in ascending class order.
  virtual std::vector<SearchMatches> Search(const Pattern& pattern) const = 0;

  // Returns the constant width held by class `id`, if one is known. Signs are
  // returned in their width encoding (0 unsigned, 1 signed).
  virtual std::optional<WidthInt> ResolveConstant(EClassId id) const = 0;
};

}  // namespace rover

#endif  // ROVER_EGRAPH_ARITH_GRAPH_H_
