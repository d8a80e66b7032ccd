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

#include "rover/arith/pattern_parser.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "rover/arith/arith_op.h"
#include "rover/arith/pattern.h"
#include "rover/arith/width.h"
#include "rover/common/status/status_macros.h"

namespace rover {

std::string PatternToken::PosToHumanString() const {
  return absl::StrFormat("%d:%d", lineno + 1, colno + 1);
}

namespace {

// Helper class for tokenizing a pattern string.
class Tokenizer {
 public:
  explicit Tokenizer(std::string_view str) : str_(str) {}

  absl::StatusOr<std::vector<PatternToken>> Tokenize() {
    std::vector<PatternToken> tokens;
    while (true) {
      DropWhiteSpaceAndComments();
      if (EndOfString()) {
        break;
      }
      int64_t start_lineno = lineno_;
      int64_t start_colno = colno_;
      char c = current();
      if (c == '(' || c == ')') {
        tokens.push_back(PatternToken{
            c == '(' ? PatternTokenType::kParenOpen
                     : PatternTokenType::kParenClose,
            std::string(1, c), start_lineno, start_colno});
        Advance();
        continue;
      }
      size_t start = index_;
      while (!EndOfString() && !absl::ascii_isspace(current()) &&
             current() != '(' && current() != ')') {
        Advance();
      }
      tokens.push_back(PatternToken{PatternTokenType::kAtom,
                                    std::string(str_.substr(start,
                                                            index_ - start)),
                                    start_lineno, start_colno});
    }
    return tokens;
  }

 private:
  void DropWhiteSpaceAndComments() {
    while (!EndOfString()) {
      if (absl::ascii_isspace(current())) {
        Advance();
      } else if (str_.substr(index_, 2) == "//") {
        while (!EndOfString() && current() != '\n') {
          Advance();
        }
      } else {
        return;
      }
    }
  }

  bool EndOfString() const { return index_ >= str_.size(); }
  char current() const { return str_.at(index_); }

  void Advance() {
    if (current() == '\n') {
      ++lineno_;
      colno_ = 0;
    } else {
      ++colno_;
    }
    ++index_;
  }

  std::string_view str_;
  size_t index_ = 0;
  int64_t lineno_ = 0;
  int64_t colno_ = 0;
};

class PatternParser {
 public:
  explicit PatternParser(std::vector<PatternToken> tokens)
      : tokens_(std::move(tokens)) {}

  absl::StatusOr<Pattern> ParseTop() {
    ROVER_ASSIGN_OR_RETURN(Pattern pattern, ParseNext());
    if (!AtEof()) {
      const PatternToken& extra = tokens_[index_];
      return absl::InvalidArgumentError(
          absl::StrFormat("Unexpected token `%s` after end of pattern @ %s",
                          extra.value, extra.PosToHumanString()));
    }
    return pattern;
  }

 private:
  bool AtEof() const { return index_ >= tokens_.size(); }

  bool PeekTokenIs(PatternTokenType type) const {
    return !AtEof() && tokens_[index_].type == type;
  }

  absl::StatusOr<PatternToken> PopTokenOrError(std::string_view context) {
    if (AtEof()) {
      return absl::InvalidArgumentError(
          absl::StrFormat("Unexpected end of pattern; expected %s", context));
    }
    return tokens_[index_++];
  }

  absl::StatusOr<Pattern> ParseNext() {
    ROVER_ASSIGN_OR_RETURN(PatternToken token, PopTokenOrError("a pattern"));
    switch (token.type) {
      case PatternTokenType::kParenClose:
        return absl::InvalidArgumentError(absl::StrFormat(
            "Unexpected `)` @ %s", token.PosToHumanString()));
      case PatternTokenType::kParenOpen:
        return ParseOperatorNode(token);
      case PatternTokenType::kAtom:
        return ParseAtom(token);
    }
    return absl::InternalError("Unhandled token type");
  }

  absl::StatusOr<Pattern> ParseOperatorNode(const PatternToken& open_paren) {
    ROVER_ASSIGN_OR_RETURN(PatternToken op_token,
                           PopTokenOrError("an operator"));
    if (op_token.type != PatternTokenType::kAtom) {
      return absl::InvalidArgumentError(
          absl::StrFormat("Expected an operator after `(` @ %s",
                          op_token.PosToHumanString()));
    }
    absl::StatusOr<ArithOp> op = StringToArithOp(op_token.value);
    if (!op.ok()) {
      return absl::InvalidArgumentError(
          absl::StrFormat("%s @ %s", op.status().message(),
                          op_token.PosToHumanString()));
    }
    std::vector<Pattern> operands;
    while (!PeekTokenIs(PatternTokenType::kParenClose)) {
      if (AtEof()) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "Unterminated `(%s` starting @ %s", op_token.value,
            open_paren.PosToHumanString()));
      }
      ROVER_ASSIGN_OR_RETURN(Pattern operand, ParseNext());
      operands.push_back(std::move(operand));
    }
    ++index_;  // `)`

    absl::StatusOr<Pattern> result =
        IsBinaryArithOp(*op)
            ? Pattern::MakeBinaryArith(*op, std::move(operands))
            : Pattern::MakeWidthArith(*op, std::move(operands));
    if (!result.ok()) {
      return absl::InvalidArgumentError(
          absl::StrFormat("%s @ %s", result.status().message(),
                          open_paren.PosToHumanString()));
    }
    return result;
  }

  absl::StatusOr<Pattern> ParseAtom(const PatternToken& token) {
    std::string_view value = token.value;
    if (value.front() == '?') {
      std::string_view name = value.substr(1);
      if (name.empty() || name.find('?') != std::string_view::npos) {
        return absl::InvalidArgumentError(
            absl::StrFormat("Invalid pattern variable `%s` @ %s", value,
                            token.PosToHumanString()));
      }
      return Pattern::MakeVar(name);
    }
    if (absl::ascii_isdigit(value.front())) {
      WidthInt literal;
      if (!absl::SimpleAtoi(value, &literal)) {
        return absl::InvalidArgumentError(
            absl::StrFormat("Invalid numeral `%s` @ %s", value,
                            token.PosToHumanString()));
      }
      return Pattern::MakeLiteral(literal);
    }
    absl::StatusOr<Sign> sign = StringToSign(value);
    if (sign.ok()) {
      return Pattern::MakeSign(*sign);
    }
    if (StringToArithOp(value).ok()) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Operator `%s` must follow `(` @ %s", value,
          token.PosToHumanString()));
    }
    if (!absl::ascii_isalpha(value.front()) && value.front() != '_') {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Invalid symbol `%s` @ %s", value, token.PosToHumanString()));
    }
    return Pattern::MakeSymbol(value);
  }

  std::vector<PatternToken> tokens_;
  size_t index_ = 0;
};

}  // namespace

absl::StatusOr<std::vector<PatternToken>> TokenizePattern(
    std::string_view text) {
  return Tokenizer(text).Tokenize();
}

absl::StatusOr<Pattern> ParsePattern(std::string_view text) {
  ROVER_ASSIGN_OR_RETURN(std::vector<PatternToken> tokens,
                         TokenizePattern(text));
  VLOG(5) << "Parsing pattern of " << tokens.size() << " tokens: " << text;
  return PatternParser(std::move(tokens)).ParseTop();
}

absl::StatusOr<Pattern> ParseGroundExpression(std::string_view text) {
  ROVER_ASSIGN_OR_RETURN(Pattern pattern, ParsePattern(text));
  if (!pattern.IsGround()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Expression must not contain pattern variables: %s", text));
  }
  return pattern;
}

}  // namespace rover
