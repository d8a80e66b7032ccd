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

#include "rover/egraph/rewrite.h"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/types/span.h"
#include "rover/arith/pattern.h"
#include "rover/common/status/ret_check.h"
#include "rover/common/status/status_macros.h"
#include "rover/egraph/arith_graph.h"
#include "rover/egraph/egraph.h"

namespace rover {

absl::StatusOr<bool> PatternApplier::ApplyOne(EGraph& egraph, EClassId eclass,
                                              const Subst& subst) const {
  for (const PatternVar& var : pattern_.Vars()) {
    ROVER_RET_CHECK(subst.Contains(var))
        << var.ToString() << " is unbound in " << subst.ToString();
  }
  ROVER_ASSIGN_OR_RETURN(EClassId instantiated,
                         egraph.AddInstantiation(pattern_, subst));
  return egraph.Union(eclass, instantiated);
}

absl::StatusOr<bool> ConditionalApplier::ApplyOne(EGraph& egraph,
                                                  EClassId eclass,
                                                  const Subst& subst) const {
  if (!condition_(egraph, eclass, subst)) {
    return false;
  }
  return applier_->ApplyOne(egraph, eclass, subst);
}

std::string ConditionalApplier::ToString() const {
  return absl::StrFormat("%s if <condition>", applier_->ToString());
}

absl::StatusOr<Rewrite> Rewrite::Create(
    std::string name, Pattern searcher,
    std::shared_ptr<const Applier> applier) {
  ROVER_RET_CHECK(applier != nullptr);
  std::vector<PatternVar> bound = searcher.Vars();
  absl::flat_hash_set<PatternVar> bound_set(bound.begin(), bound.end());
  for (const PatternVar& var : applier->Vars()) {
    if (!bound_set.contains(var)) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Rewrite `%s` uses %s, which `%s` does not bind", name,
          var.ToString(), searcher.ToString()));
    }
  }
  return Rewrite(std::move(name), std::move(searcher), std::move(applier));
}

std::vector<SearchMatches> Rewrite::Search(const EGraph& egraph) const {
  return egraph.Search(searcher_);
}

absl::StatusOr<int64_t> Rewrite::Apply(
    EGraph& egraph, absl::Span<const SearchMatches> matches) const {
  int64_t changed = 0;
  for (const SearchMatches& match : matches) {
    for (const Subst& subst : match.substs) {
      ROVER_ASSIGN_OR_RETURN(bool applied,
                             applier_->ApplyOne(egraph, match.eclass, subst));
      if (applied) {
        VLOG(2) << name_ << " applied to #" << match.eclass << " with "
                << subst.ToString();
        ++changed;
      }
    }
  }
  return changed;
}

std::string Rewrite::ToString() const {
  return absl::StrFormat("%s: %s => %s", name_, searcher_.ToString(),
                         applier_->ToString());
}

}  // namespace rover
