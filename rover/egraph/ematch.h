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

#ifndef ROVER_EGRAPH_EMATCH_H_
#define ROVER_EGRAPH_EMATCH_H_

#include <vector>

#include "rover/arith/pattern.h"
#include "rover/egraph/arith_graph.h"

namespace rover {

class EGraph;

// Returns every substitution under which `pattern` matches class `id`. Each
// variable is bound to a representative; repeated variables must bind to the
// same class. Duplicates are removed, first occurrence first.
std::vector<Subst> MatchClass(const EGraph& egraph, const Pattern& pattern,
                              EClassId id);

// Matches `pattern` against every class of `egraph`, in ascending class order.
// Classes without a match are omitted.
std::vector<SearchMatches> SearchPattern(const EGraph& egraph,
                                         const Pattern& pattern);

}  // namespace rover

#endif  // ROVER_EGRAPH_EMATCH_H_
