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

#ifndef ROVER_EGRAPH_RUNNER_H_
#define ROVER_EGRAPH_RUNNER_H_

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "rover/arith/pattern.h"
#include "rover/egraph/arith_graph.h"
#include "rover/egraph/egraph.h"
#include "rover/egraph/rewrite.h"

namespace rover {

struct RunnerOptions {
  // Maximum number of search/apply/rebuild iterations, counted across all
  // calls to Runner::Run.
  int64_t iteration_limit = 30;

  // Saturation stops before an iteration once the e-graph holds more nodes.
  int64_t node_limit = 10'000;

  absl::Duration time_limit = absl::Seconds(5);
};

enum class StopReason : int8_t {
  kSaturated,
  kIterationLimit,
  kNodeLimit,
  kTimeLimit,
};

std::string StopReasonToString(StopReason reason);
std::ostream& operator<<(std::ostream& os, StopReason reason);

// What happened during one iteration of Runner::Run.
struct IterationReport {
  int64_t iteration = 0;
  int64_t egraph_nodes = 0;
  int64_t egraph_classes = 0;
  // Number of changing applications per rewrite name.
  absl::flat_hash_map<std::string, int64_t> applied;
  absl::Duration search_time;
  absl::Duration apply_time;
  absl::Duration rebuild_time;
};

// Runs rewrites over an e-graph until saturation or until a limit is hit.
//
//   Runner runner(RunnerOptions{.iteration_limit = 10});
//   ROVER_ASSIGN_OR_RETURN(EClassId lhs, runner.AddExpr(lhs_expr));
//   ROVER_ASSIGN_OR_RETURN(StopReason reason, runner.Run(rewrites));
class Runner {
 public:
  explicit Runner(RunnerOptions options = RunnerOptions())
      : options_(options) {}

  // Adds a ground expression and records its class as a root.
  absl::StatusOr<EClassId> AddExpr(const Pattern& expr);

  absl::StatusOr<StopReason> Run(absl::Span<const Rewrite> rewrites);

  EGraph& egraph() { return egraph_; }
  const EGraph& egraph() const { return egraph_; }

  const RunnerOptions& options() const { return options_; }

  // Classes of the expressions added by AddExpr, as returned at the time.
  // Pass them through EGraph::Find to get current representatives.
  absl::Span<const EClassId> roots() const { return roots_; }

  absl::Span<const IterationReport> iterations() const { return iterations_; }

  std::optional<StopReason> stop_reason() const { return stop_reason_; }

 private:
  // Returns the limit that stops the run before the next iteration, if any.
  std::optional<StopReason> CheckLimits(absl::Time start) const;

  RunnerOptions options_;
  EGraph egraph_;
  std::vector<EClassId> roots_;
  std::vector<IterationReport> iterations_;
  std::optional<StopReason> stop_reason_;
};

}  // namespace rover

#endif  // ROVER_EGRAPH_RUNNER_H_
