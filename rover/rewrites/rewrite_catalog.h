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

// The catalog of width-aware arithmetic rewrite rules.
//
// Each binary arithmetic node carries its output width and the width and sign
// of both operands, `(op wo wa sa a wb sb b)`. Rules that change the shape of
// a computation compute the widths of new intermediate results with the
// `max+1` and `wlsh` helpers, and guard on the matched widths so that no
// intermediate result can overflow.

#ifndef ROVER_REWRITES_REWRITE_CATALOG_H_
#define ROVER_REWRITES_REWRITE_CATALOG_H_

#include <vector>

#include "absl/types/span.h"
#include "rover/egraph/rewrite.h"
#include "rover/rewrites/arith_rewrite.h"

namespace rover {

// Returns the rule catalog:
//
//   commute-add         a + b  =>  b + a
//   commute-mul         a * b  =>  b * a
//   merge-left-shift    (a << b) << c  =>  a << (b + c)
//   unmerge-left-shift  a << (b + c)  =>  (a << b) << c
//   mult-to-add         a * 2  =>  a + a
//   left-shift-mult     (a * b) << c  =>  (a << c) * b
//
// A malformed rule is a programming error and crashes.
std::vector<ArithRewrite> CreateRewrites();

// Flattens the rules into rewrites for the e-graph runner, in catalog order.
std::vector<Rewrite> CreateSolverRewrites(absl::Span<const ArithRewrite> rules);

}  // namespace rover

#endif  // ROVER_REWRITES_REWRITE_CATALOG_H_
