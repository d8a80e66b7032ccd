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

#include "rover/egraph/arith_graph.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "rover/arith/pattern.h"

namespace rover {

void Subst::Insert(const PatternVar& var, EClassId id) {
  CHECK(!Contains(var)) << var.ToString() << " is already bound";
  bindings_.push_back({var, id});
}

std::optional<EClassId> Subst::Get(const PatternVar& var) const {
  for (const auto& [bound, id] : bindings_) {
    if (bound == var) {
      return id;
    }
  }
  return std::nullopt;
}

std::string Subst::ToString() const {
  return absl::StrCat(
      "{",
      absl::StrJoin(bindings_, ", ",
                    [](std::string* out,
                       const std::pair<PatternVar, EClassId>& binding) {
                      absl::StrAppend(out, binding.first.ToString(), ": ",
                                      binding.second);
                    }),
      "}");
}

}  // namespace rover
