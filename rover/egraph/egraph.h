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

#ifndef ROVER_EGRAPH_EGRAPH_H_
#define ROVER_EGRAPH_EGRAPH_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "rover/arith/pattern.h"
#include "rover/arith/width.h"
#include "rover/data_structures/union_find.h"
#include "rover/egraph/arith_graph.h"
#include "rover/egraph/enode.h"
#include "rover/egraph/width_constant_fold.h"

namespace rover {

// An e-graph over the width-annotated arithmetic language with width constant
// folding (see width_constant_fold.h) as its analysis.
//
// Nodes are hash-consed: adding a node that already exists returns its class.
// `Union` defers restoring congruence; call `Rebuild` before searching again.
// A class whose constant is known always contains the matching literal or
// sign leaf, so patterns that spell out a width match folded widths too.
class EGraph final : public ArithGraph {
 public:
  EGraph() = default;

  EGraph(const EGraph&) = delete;
  EGraph& operator=(const EGraph&) = delete;
  EGraph(EGraph&&) = default;
  EGraph& operator=(EGraph&&) = default;

  // Adds `node` and returns the id of its class. Children are canonicalized
  // first and must refer to existing classes.
  EClassId Add(const ENode& node);

  // Adds a ground expression bottom-up and returns the class of its root.
  absl::StatusOr<EClassId> AddExpr(const Pattern& expr);

  // Adds `pattern` with its variables replaced by the classes `subst` binds
  // them to. Returns an error if a variable is unbound.
  absl::StatusOr<EClassId> AddInstantiation(const Pattern& pattern,
                                            const Subst& subst);

  // Asserts that `a` and `b` are equivalent. Returns true if they were in
  // different classes before the call.
  bool Union(EClassId a, EClassId b);

  // Restores the congruence and hash-consing invariants after unions and
  // propagates constants to a fixed point. Fails if two different constants
  // end up in one class.
  absl::Status Rebuild();

  // True if no union happened since the last successful Rebuild.
  bool IsClean() const { return !dirty_; }

  EClassId Find(EClassId id) const { return union_find_.Find(id); }

  bool AreEquivalent(EClassId a, EClassId b) const {
    return Find(a) == Find(b);
  }

  // Returns the ids of all classes (representatives) in ascending order.
  std::vector<EClassId> GetClassIds() const;

  // Returns the nodes of `id`'s class.
  absl::Span<const ENode> GetNodes(EClassId id) const;

  // Returns the analysis data of `id`'s class.
  const WidthConstant& GetClassData(EClassId id) const;

  // Returns the class containing `node`, if the node is in the graph.
  std::optional<EClassId> Lookup(const ENode& node) const;

  std::vector<SearchMatches> Search(const Pattern& pattern) const override;
  std::optional<WidthInt> ResolveConstant(EClassId id) const override;

  int64_t num_classes() const;
  int64_t num_nodes() const;

  // Returns a one-line description of `id`'s class: id, constant and nodes.
  std::string DumpClass(EClassId id) const;

  // Returns a description of every class, one per line.
  std::string ToString() const;

 private:
  struct EClass {
    EClassId id;
    std::vector<ENode> nodes;
    WidthConstant data;
  };

  const EClass& GetClass(EClassId id) const;
  EClass& GetClass(EClassId id);

  ENode Canonicalize(const ENode& node) const;

  // Unions the classes of `a` and `b` without marking the graph dirty.
  // Returns false if they were already equivalent.
  bool Merge(EClassId a, EClassId b);

  // Moves the nodes and data of `other` into `root` after the union-find has
  // made `root` the representative of both.
  void MoveClassContents(EClassId root, EClassId other);

  // Rebuild steps. Each returns whether it changed the graph.
  bool RestoreCongruence();
  absl::StatusOr<bool> PropagateConstants();
  bool MaterializeConstants();

  UnionFind<EClassId> union_find_;

  // Indexed by EClassId. Entries of classes merged into another are null.
  std::vector<std::unique_ptr<EClass>> classes_;

  // Maps every node, with canonical children as of its insertion or the last
  // Rebuild, to a class that contains it.
  absl::flat_hash_map<ENode, EClassId> memo_;

  bool dirty_ = false;

  // First constant conflict seen by a Union; reported by the next Rebuild.
  absl::Status analysis_status_;
};

}  // namespace rover

#endif  // ROVER_EGRAPH_EGRAPH_H_
