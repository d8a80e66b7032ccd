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

#include "rover/egraph/runner.h"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "rover/arith/pattern.h"
#include "rover/common/status/status_macros.h"
#include "rover/egraph/arith_graph.h"
#include "rover/egraph/egraph.h"
#include "rover/egraph/rewrite.h"

namespace rover {

std::string StopReasonToString(StopReason reason) {
  switch (reason) {
    case StopReason::kSaturated:
      return "saturated";
    case StopReason::kIterationLimit:
      return "iteration limit";
    case StopReason::kNodeLimit:
      return "node limit";
    case StopReason::kTimeLimit:
      return "time limit";
  }
  LOG(FATAL) << "Invalid StopReason: " << static_cast<int64_t>(reason);
}

std::ostream& operator<<(std::ostream& os, StopReason reason) {
  os << StopReasonToString(reason);
  return os;
}

absl::StatusOr<EClassId> Runner::AddExpr(const Pattern& expr) {
  ROVER_ASSIGN_OR_RETURN(EClassId id, egraph_.AddExpr(expr));
  roots_.push_back(id);
  return id;
}

std::optional<StopReason> Runner::CheckLimits(absl::Time start) const {
  if (static_cast<int64_t>(iterations_.size()) >= options_.iteration_limit) {
    return StopReason::kIterationLimit;
  }
  if (egraph_.num_nodes() > options_.node_limit) {
    return StopReason::kNodeLimit;
  }
  if (absl::Now() - start > options_.time_limit) {
    return StopReason::kTimeLimit;
  }
  return std::nullopt;
}

absl::StatusOr<StopReason> Runner::Run(absl::Span<const Rewrite> rewrites) {
  absl::Time start = absl::Now();
  ROVER_RETURN_IF_ERROR(egraph_.Rebuild());
  while (true) {
    if (std::optional<StopReason> limit = CheckLimits(start)) {
      stop_reason_ = *limit;
      break;
    }

    IterationReport report;
    report.iteration = iterations_.size();
    int64_t nodes_before = egraph_.num_nodes();
    int64_t classes_before = egraph_.num_classes();

    // Search everything against the same graph before applying anything.
    absl::Time phase_start = absl::Now();
    std::vector<std::vector<SearchMatches>> matches;
    matches.reserve(rewrites.size());
    for (const Rewrite& rewrite : rewrites) {
      matches.push_back(rewrite.Search(egraph_));
    }
    report.search_time = absl::Now() - phase_start;

    phase_start = absl::Now();
    int64_t total_applied = 0;
    for (int64_t i = 0; i < static_cast<int64_t>(rewrites.size()); ++i) {
      ROVER_ASSIGN_OR_RETURN(int64_t applied,
                             rewrites[i].Apply(egraph_, matches[i]));
      if (applied > 0) {
        report.applied[rewrites[i].name()] += applied;
        total_applied += applied;
      }
    }
    report.apply_time = absl::Now() - phase_start;

    phase_start = absl::Now();
    ROVER_RETURN_IF_ERROR(egraph_.Rebuild());
    report.rebuild_time = absl::Now() - phase_start;

    report.egraph_nodes = egraph_.num_nodes();
    report.egraph_classes = egraph_.num_classes();
    VLOG(1) << absl::StrFormat(
        "Iteration %d: %d application(s), %d nodes, %d classes (search %s, "
        "apply %s, rebuild %s)",
        report.iteration, total_applied, report.egraph_nodes,
        report.egraph_classes, absl::FormatDuration(report.search_time),
        absl::FormatDuration(report.apply_time),
        absl::FormatDuration(report.rebuild_time));
    bool saturated = total_applied == 0 &&
                     report.egraph_nodes == nodes_before &&
                     report.egraph_classes == classes_before;
    iterations_.push_back(std::move(report));
    if (saturated) {
      stop_reason_ = StopReason::kSaturated;
      break;
    }
  }
  VLOG(1) << "Stopped after " << iterations_.size()
          << " iteration(s): " << *stop_reason_;
  return *stop_reason_;
}

}  // namespace rover
