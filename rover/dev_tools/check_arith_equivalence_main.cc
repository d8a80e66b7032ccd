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

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/time/time.h"
#include "rover/arith/pattern.h"
#include "rover/arith/pattern_parser.h"
#include "rover/common/init_rover.h"
#include "rover/common/status/status_macros.h"
#include "rover/egraph/arith_graph.h"
#include "rover/egraph/rewrite.h"
#include "rover/egraph/runner.h"
#include "rover/rewrites/arith_rewrite.h"
#include "rover/rewrites/rewrite_catalog.h"

static constexpr std::string_view kUsage = R"(
Tries to prove that two width-annotated arithmetic expressions compute the same
value by saturating an e-graph with the width-aware rewrite catalog.

Example invocation:
  check_arith_equivalence_main \
    '(<< 17 17 unsign (<< 17 8 unsign A 3 unsign B) 3 unsign C)' \
    '(<< 17 8 unsign A 4 unsign (+ 4 3 unsign B 3 unsign C))'

A failure to prove equivalence does not mean the expressions differ; the
search may have stopped at a limit or the catalog may lack a needed rule.

Exits with code --mismatch_exit_code if equivalence is not proven.
)";

ABSL_FLAG(int64_t, iteration_limit, 30,
          "Maximum number of saturation iterations.");
ABSL_FLAG(int64_t, node_limit, 10'000,
          "Stop saturating once the e-graph holds more e-nodes than this.");
ABSL_FLAG(absl::Duration, time_limit, absl::Seconds(5),
          "Stop saturating after this much time.");
ABSL_FLAG(std::string, explain_rule, "",
          "If set, print every match of this rule's left-hand side after "
          "saturation, with the matched widths and whether the rule's "
          "condition holds.");
ABSL_FLAG(bool, dump_egraph, false, "Print the saturated e-graph.");
ABSL_FLAG(int, mismatch_exit_code, 255,
          "Value to exit with if equivalence is not proven.");
ABSL_FLAG(int, match_exit_code, 0,
          "Value to exit with if equivalence is proven.");

namespace rover {
namespace {

absl::Status ExplainRule(const std::vector<ArithRewrite>& rules,
                         std::string_view name, const ArithGraph& graph) {
  for (const ArithRewrite& rule : rules) {
    if (rule.name() != name) {
      continue;
    }
    std::cout << rule.ToString() << "\n";
    std::vector<ArithMatch> matches = rule.FindLhsMatches(graph);
    if (matches.empty()) {
      std::cout << "  no matches\n";
    }
    for (const ArithMatch& match : matches) {
      std::cout << "  " << match.ToString() << "\n";
    }
    return absl::OkStatus();
  }
  return absl::InvalidArgumentError(
      absl::StrFormat("No rewrite rule named `%s`", name));
}

absl::StatusOr<bool> RealMain(std::string_view lhs_text,
                              std::string_view rhs_text) {
  ROVER_ASSIGN_OR_RETURN(Pattern lhs, ParseGroundExpression(lhs_text));
  ROVER_ASSIGN_OR_RETURN(Pattern rhs, ParseGroundExpression(rhs_text));

  std::vector<ArithRewrite> rules = CreateRewrites();
  std::vector<Rewrite> rewrites = CreateSolverRewrites(rules);

  Runner runner(RunnerOptions{
      .iteration_limit = absl::GetFlag(FLAGS_iteration_limit),
      .node_limit = absl::GetFlag(FLAGS_node_limit),
      .time_limit = absl::GetFlag(FLAGS_time_limit),
  });
  ROVER_ASSIGN_OR_RETURN(EClassId lhs_id, runner.AddExpr(lhs));
  ROVER_ASSIGN_OR_RETURN(EClassId rhs_id, runner.AddExpr(rhs));
  ROVER_ASSIGN_OR_RETURN(StopReason reason, runner.Run(rewrites));
  LOG(INFO) << absl::StrFormat(
      "Stopped (%s) after %d iteration(s) with %d e-classes and %d e-nodes",
      StopReasonToString(reason), runner.iterations().size(),
      runner.egraph().num_classes(), runner.egraph().num_nodes());

  if (absl::GetFlag(FLAGS_dump_egraph)) {
    std::cout << runner.egraph().ToString() << "\n";
  }
  if (std::string rule = absl::GetFlag(FLAGS_explain_rule); !rule.empty()) {
    ROVER_RETURN_IF_ERROR(ExplainRule(rules, rule, runner.egraph()));
  }

  if (runner.egraph().AreEquivalent(lhs_id, rhs_id)) {
    std::cout << "Verified equivalent\n";
    return true;
  }
  std::cout << "Equivalence NOT proven (" << reason << ")\n";
  return false;
}

}  // namespace
}  // namespace rover

int main(int argc, char** argv) {
  std::vector<std::string_view> positional_args =
      rover::InitRover(kUsage, argc, argv);
  QCHECK_EQ(positional_args.size(), 2) << "Two expressions must be specified!";
  absl::StatusOr<bool> result =
      rover::RealMain(positional_args[0], positional_args[1]);
  if (!result.ok()) {
    LOG(ERROR) << result.status();
    return EXIT_FAILURE;
  }
  return *result ? absl::GetFlag(FLAGS_match_exit_code)
                 : absl::GetFlag(FLAGS_mismatch_exit_code);
}
