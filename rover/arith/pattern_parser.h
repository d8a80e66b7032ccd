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

// Parser for the textual form of the width-annotated arithmetic language:
//
//   (<< ?wo ?wab ?sa (<< ?wab ?wa ?sa ?a ?wb unsign ?b) ?wc unsign ?c)
//   (+ 17 16 unsign A 16 unsign B)
//
// Operator nodes are parenthesized with the operator first. `?name` is a
// pattern variable, a decimal numeral is a literal, `sign` and `unsign` are
// sign literals and any other identifier is a bit-vector symbol. `//` starts
// a comment running to the end of the line.

#ifndef ROVER_ARITH_PATTERN_PARSER_H_
#define ROVER_ARITH_PATTERN_PARSER_H_

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"
#include "rover/arith/pattern.h"

namespace rover {

enum class PatternTokenType {
  kParenOpen,
  kParenClose,
  kAtom,
};

struct PatternToken {
  PatternTokenType type;
  std::string value;
  int64_t lineno;
  int64_t colno;

  // Position in "line:column" form, both starting at 1.
  std::string PosToHumanString() const;
};

// Splits `text` into parentheses and atoms.
absl::StatusOr<std::vector<PatternToken>> TokenizePattern(
    std::string_view text);

// Parses exactly one pattern from `text`; trailing tokens are an error.
absl::StatusOr<Pattern> ParsePattern(std::string_view text);

// As ParsePattern, but additionally requires the result to contain no
// pattern variables.
absl::StatusOr<Pattern> ParseGroundExpression(std::string_view text);

}  // namespace rover

#endif  // ROVER_ARITH_PATTERN_PARSER_H_
