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

#include "rover/egraph/ematch.h"

#include <cstdint>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include "absl/algorithm/container.h"
#include "absl/container/flat_hash_set.h"
#include "absl/log/log.h"
#include "absl/types/span.h"
#include "rover/arith/pattern.h"
#include "rover/egraph/arith_graph.h"
#include "rover/egraph/egraph.h"
#include "rover/egraph/enode.h"

namespace rover {
namespace {

// Returns the node a leaf pattern denotes, or nullopt for non-leaves.
std::optional<ENode> LeafPatternToNode(const Pattern& pattern) {
  const Pattern::Node& node = pattern.node();
  if (const auto* literal = std::get_if<PatternLiteral>(&node)) {
    return ENode::Literal(literal->value);
  }
  if (const auto* sign = std::get_if<PatternSign>(&node)) {
    return ENode::SignLiteral(sign->sign);
  }
  if (const auto* symbol = std::get_if<PatternSymbol>(&node)) {
    return ENode::Symbol(symbol->name);
  }
  return std::nullopt;
}

void MatchInClass(const EGraph& egraph, const Pattern& pattern, EClassId id,
                  const Subst& subst, std::vector<Subst>& out);

// Extends `subst` by matching patterns[index..] against the classes at the
// same positions of `ids`.
void MatchChildren(const EGraph& egraph, absl::Span<const Pattern> patterns,
                   absl::Span<const EClassId> ids, int64_t index,
                   const Subst& subst, std::vector<Subst>& out) {
  if (index == static_cast<int64_t>(patterns.size())) {
    out.push_back(subst);
    return;
  }
  std::vector<Subst> partial;
  MatchInClass(egraph, patterns[index], ids[index], subst, partial);
  for (const Subst& extended : partial) {
    MatchChildren(egraph, patterns, ids, index + 1, extended, out);
  }
}

void MatchInClass(const EGraph& egraph, const Pattern& pattern, EClassId id,
                  const Subst& subst, std::vector<Subst>& out) {
  id = egraph.Find(id);
  if (const auto* var = std::get_if<PatternVar>(&pattern.node())) {
    std::optional<EClassId> bound = subst.Get(*var);
    if (!bound.has_value()) {
      Subst extended = subst;
      extended.Insert(*var, id);
      out.push_back(std::move(extended));
    } else if (egraph.Find(*bound) == id) {
      out.push_back(subst);
    }
    return;
  }

  absl::Span<const ENode> nodes = egraph.GetNodes(id);
  if (std::optional<ENode> leaf = LeafPatternToNode(pattern)) {
    if (absl::c_linear_search(nodes, *leaf)) {
      out.push_back(subst);
    }
    return;
  }

  absl::Span<const Pattern> children = pattern.children();
  for (const ENode& node : nodes) {
    if (node.op() != pattern.op() ||
        node.children().size() != children.size()) {
      continue;
    }
    MatchChildren(egraph, children, node.children(), 0, subst, out);
  }
}

}  // namespace

std::vector<Subst> MatchClass(const EGraph& egraph, const Pattern& pattern,
                              EClassId id) {
  std::vector<Subst> matches;
  MatchInClass(egraph, pattern, id, Subst(), matches);
  std::vector<Subst> unique;
  absl::flat_hash_set<Subst> seen;
  for (Subst& subst : matches) {
    if (seen.insert(subst).second) {
      unique.push_back(std::move(subst));
    }
  }
  return unique;
}

std::vector<SearchMatches> SearchPattern(const EGraph& egraph,
                                         const Pattern& pattern) {
  std::vector<SearchMatches> result;
  for (EClassId id : egraph.GetClassIds()) {
    std::vector<Subst> substs = MatchClass(egraph, pattern, id);
    if (!substs.empty()) {
      result.push_back(SearchMatches{id, std::move(substs)});
    }
  }
  VLOG(3) << "Pattern " << pattern << " matched " << result.size()
          << " class(es)";
  return result;
}

}  // namespace rover
