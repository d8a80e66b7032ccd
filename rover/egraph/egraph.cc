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

#include "rover/egraph/egraph.h"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/algorithm/container.h"
#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/types/span.h"
#include "rover/arith/pattern.h"
#include "rover/arith/width.h"
#include "rover/common/status/status_macros.h"
#include "rover/egraph/arith_graph.h"
#include "rover/egraph/ematch.h"
#include "rover/egraph/enode.h"
#include "rover/egraph/width_constant_fold.h"

namespace rover {

EClassId EGraph::Add(const ENode& node) {
  ENode canonical = Canonicalize(node);
  if (auto it = memo_.find(canonical); it != memo_.end()) {
    return Find(it->second);
  }

  EClassId id = union_find_.Insert();
  CHECK_EQ(id, classes_.size());
  auto eclass = std::make_unique<EClass>();
  eclass->id = id;
  eclass->data = MakeWidthConstant(
      canonical,
      [this](EClassId child) -> const WidthConstant& {
        return GetClass(child).data;
      });
  eclass->nodes.push_back(canonical);
  WidthConstant data = eclass->data;
  classes_.push_back(std::move(eclass));
  memo_.emplace(std::move(canonical), id);
  VLOG(4) << "Added " << DumpClass(id);

  if (data.has_value() && !node.IsLeaf()) {
    // The new class has no parents yet, so folding it into the class of its
    // constant keeps the graph congruent. The leaf's class stays the
    // representative because other nodes may already refer to it.
    EClassId leaf_id = Add(WidthOrSignToLeaf(*data));
    union_find_.UnionInto(leaf_id, id);
    MoveClassContents(leaf_id, id);
    return leaf_id;
  }
  return id;
}

absl::StatusOr<EClassId> EGraph::AddExpr(const Pattern& expr) {
  if (!expr.IsGround()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Expression must not contain pattern variables: %s", expr.ToString()));
  }
  return AddInstantiation(expr, Subst());
}

absl::StatusOr<EClassId> EGraph::AddInstantiation(const Pattern& pattern,
                                                  const Subst& subst) {
  const Pattern::Node& node = pattern.node();
  if (const auto* var = std::get_if<PatternVar>(&node)) {
    std::optional<EClassId> id = subst.Get(*var);
    if (!id.has_value()) {
      return absl::InvalidArgumentError(
          absl::StrFormat("Unbound pattern variable %s in `%s`",
                          var->ToString(), pattern.ToString()));
    }
    return Find(*id);
  }
  if (const auto* literal = std::get_if<PatternLiteral>(&node)) {
    return Add(ENode::Literal(literal->value));
  }
  if (const auto* sign = std::get_if<PatternSign>(&node)) {
    return Add(ENode::SignLiteral(sign->sign));
  }
  if (const auto* symbol = std::get_if<PatternSymbol>(&node)) {
    return Add(ENode::Symbol(symbol->name));
  }
  std::vector<EClassId> children;
  children.reserve(pattern.children().size());
  for (const Pattern& child : pattern.children()) {
    ROVER_ASSIGN_OR_RETURN(EClassId child_id, AddInstantiation(child, subst));
    children.push_back(child_id);
  }
  return Add(ENode::Operator(pattern.op(), std::move(children)));
}

bool EGraph::Union(EClassId a, EClassId b) {
  if (!Merge(a, b)) {
    return false;
  }
  dirty_ = true;
  return true;
}

bool EGraph::Merge(EClassId a, EClassId b) {
  EClassId a_root = Find(a);
  EClassId b_root = Find(b);
  if (a_root == b_root) {
    return false;
  }
  EClassId root = union_find_.Union(a_root, b_root);
  MoveClassContents(root, root == a_root ? b_root : a_root);
  VLOG(4) << "Merged #" << a_root << " and #" << b_root << " into #" << root;
  return true;
}

void EGraph::MoveClassContents(EClassId root, EClassId other) {
  CHECK_NE(root, other);
  std::unique_ptr<EClass> absorbed = std::move(classes_[other]);
  CHECK(absorbed != nullptr) << "#" << other << " is not a representative";
  EClass& target = *classes_[root];
  target.nodes.insert(target.nodes.end(),
                      std::make_move_iterator(absorbed->nodes.begin()),
                      std::make_move_iterator(absorbed->nodes.end()));
  absl::StatusOr<bool> merged = MergeWidthConstant(target.data, absorbed->data);
  if (!merged.ok() && analysis_status_.ok()) {
    analysis_status_ = merged.status();
  }
}

absl::Status EGraph::Rebuild() {
  int64_t rounds = 0;
  while (true) {
    ++rounds;
    bool merged = RestoreCongruence();
    ROVER_RETURN_IF_ERROR(analysis_status_);
    ROVER_ASSIGN_OR_RETURN(bool constants_changed, PropagateConstants());
    bool materialized = MaterializeConstants();
    ROVER_RETURN_IF_ERROR(analysis_status_);
    if (!merged && !constants_changed && !materialized) {
      break;
    }
  }
  dirty_ = false;
  VLOG(3) << "Rebuild took " << rounds << " round(s); " << num_classes()
          << " classes, " << num_nodes() << " nodes";
  return absl::OkStatus();
}

bool EGraph::RestoreCongruence() {
  memo_.clear();
  std::vector<std::pair<EClassId, EClassId>> congruent;
  for (EClassId id : GetClassIds()) {
    EClass& eclass = *classes_[id];
    for (ENode& node : eclass.nodes) {
      node = Canonicalize(node);
    }
    absl::c_sort(eclass.nodes);
    eclass.nodes.erase(std::unique(eclass.nodes.begin(), eclass.nodes.end()),
                       eclass.nodes.end());
    for (const ENode& node : eclass.nodes) {
      auto [it, inserted] = memo_.try_emplace(node, id);
      if (!inserted) {
        congruent.push_back({it->second, id});
      }
    }
  }
  bool changed = false;
  for (const auto& [a, b] : congruent) {
    changed |= Merge(a, b);
  }
  return changed;
}

absl::StatusOr<bool> EGraph::PropagateConstants() {
  auto child_constant = [this](EClassId child) -> const WidthConstant& {
    return GetClass(child).data;
  };
  bool changed = false;
  for (EClassId id : GetClassIds()) {
    EClass& eclass = GetClass(id);
    for (const ENode& node : eclass.nodes) {
      WidthConstant made = MakeWidthConstant(node, child_constant);
      ROVER_ASSIGN_OR_RETURN(bool merged,
                             MergeWidthConstant(eclass.data, made));
      changed |= merged;
    }
  }
  return changed;
}

bool EGraph::MaterializeConstants() {
  bool changed = false;
  for (EClassId id : GetClassIds()) {
    if (classes_[id] == nullptr) {
      // Merged earlier in this pass.
      continue;
    }
    const WidthConstant& data = classes_[id]->data;
    if (!data.has_value()) {
      continue;
    }
    ENode leaf = WidthOrSignToLeaf(*data);
    if (absl::c_linear_search(classes_[id]->nodes, leaf)) {
      continue;
    }
    EClassId leaf_id = Add(leaf);
    Merge(id, leaf_id);
    changed = true;
  }
  return changed;
}

std::vector<EClassId> EGraph::GetClassIds() const {
  std::vector<EClassId> ids;
  for (EClassId id = 0; id < classes_.size(); ++id) {
    if (classes_[id] != nullptr) {
      ids.push_back(id);
    }
  }
  return ids;
}

absl::Span<const ENode> EGraph::GetNodes(EClassId id) const {
  return GetClass(id).nodes;
}

const WidthConstant& EGraph::GetClassData(EClassId id) const {
  return GetClass(id).data;
}

std::optional<EClassId> EGraph::Lookup(const ENode& node) const {
  auto it = memo_.find(Canonicalize(node));
  if (it == memo_.end()) {
    return std::nullopt;
  }
  return Find(it->second);
}

std::vector<SearchMatches> EGraph::Search(const Pattern& pattern) const {
  return SearchPattern(*this, pattern);
}

std::optional<WidthInt> EGraph::ResolveConstant(EClassId id) const {
  const WidthConstant& data = GetClassData(id);
  if (!data.has_value()) {
    return std::nullopt;
  }
  return WidthOrSignAsWidthInt(*data);
}

int64_t EGraph::num_classes() const {
  return absl::c_count_if(
      classes_, [](const std::unique_ptr<EClass>& c) { return c != nullptr; });
}

int64_t EGraph::num_nodes() const {
  int64_t count = 0;
  for (const std::unique_ptr<EClass>& eclass : classes_) {
    if (eclass != nullptr) {
      count += eclass->nodes.size();
    }
  }
  return count;
}

std::string EGraph::DumpClass(EClassId id) const {
  const EClass& eclass = GetClass(id);
  std::vector<ENode> nodes = eclass.nodes;
  absl::c_sort(nodes);
  std::string constant =
      eclass.data.has_value()
          ? absl::StrCat(" = ", WidthOrSignToString(*eclass.data))
          : "";
  return absl::StrFormat(
      "#%d%s: %s", eclass.id, constant,
      absl::StrJoin(nodes, ", ", [](std::string* out, const ENode& node) {
        absl::StrAppend(out, node.ToString());
      }));
}

std::string EGraph::ToString() const {
  std::vector<std::string> lines;
  for (EClassId id : GetClassIds()) {
    lines.push_back(DumpClass(id));
  }
  return absl::StrJoin(lines, "\n");
}

const EGraph::EClass& EGraph::GetClass(EClassId id) const {
  CHECK_LT(id, classes_.size()) << "Unknown e-class #" << id;
  return *classes_[Find(id)];
}

EGraph::EClass& EGraph::GetClass(EClassId id) {
  CHECK_LT(id, classes_.size()) << "Unknown e-class #" << id;
  return *classes_[Find(id)];
}

ENode EGraph::Canonicalize(const ENode& node) const {
  return node.MapChildren([this](EClassId child) { return Find(child); });
}

}  // namespace rover
