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

#ifndef ROVER_EGRAPH_REWRITE_H_
#define ROVER_EGRAPH_REWRITE_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "rover/arith/pattern.h"
#include "rover/egraph/arith_graph.h"
#include "rover/egraph/egraph.h"

namespace rover {

// Acts on one match of a rewrite's searcher.
class Applier {
 public:
  virtual ~Applier() = default;

  // Applies to the match of `subst` in class `eclass`. Returns true if the
  // e-graph changed.
  virtual absl::StatusOr<bool> ApplyOne(EGraph& egraph, EClassId eclass,
                                        const Subst& subst) const = 0;

  // The variables the applier reads from a substitution.
  virtual std::vector<PatternVar> Vars() const = 0;

  virtual std::string ToString() const = 0;
};

// Instantiates a pattern and unions it with the matched class.
class PatternApplier final : public Applier {
 public:
  explicit PatternApplier(Pattern pattern) : pattern_(std::move(pattern)) {}

  absl::StatusOr<bool> ApplyOne(EGraph& egraph, EClassId eclass,
                                const Subst& subst) const override;
  std::vector<PatternVar> Vars() const override { return pattern_.Vars(); }
  std::string ToString() const override { return pattern_.ToString(); }

  const Pattern& pattern() const { return pattern_; }

 private:
  Pattern pattern_;
};

// Runs a wrapped applier only for matches that satisfy a condition.
class ConditionalApplier final : public Applier {
 public:
  using Condition =
      std::function<bool(const EGraph&, EClassId, const Subst&)>;

  ConditionalApplier(Condition condition, std::unique_ptr<Applier> applier)
      : condition_(std::move(condition)), applier_(std::move(applier)) {}

  absl::StatusOr<bool> ApplyOne(EGraph& egraph, EClassId eclass,
                                const Subst& subst) const override;
  std::vector<PatternVar> Vars() const override { return applier_->Vars(); }
  std::string ToString() const override;

 private:
  Condition condition_;
  std::unique_ptr<Applier> applier_;
};

// A named searcher/applier pair as run by the Runner.
class Rewrite {
 public:
  // Fails if the applier reads a variable the searcher does not bind.
  static absl::StatusOr<Rewrite> Create(std::string name, Pattern searcher,
                                        std::shared_ptr<const Applier> applier);

  const std::string& name() const { return name_; }
  const Pattern& searcher() const { return searcher_; }
  const Applier& applier() const { return *applier_; }

  std::vector<SearchMatches> Search(const EGraph& egraph) const;

  // Applies to every substitution of `matches`. Returns the number of
  // applications that changed the e-graph.
  absl::StatusOr<int64_t> Apply(EGraph& egraph,
                                absl::Span<const SearchMatches> matches) const;

  std::string ToString() const;

 private:
  Rewrite(std::string name, Pattern searcher,
          std::shared_ptr<const Applier> applier)
      : name_(std::move(name)),
        searcher_(std::move(searcher)),
        applier_(std::move(applier)) {}

  std::string name_;
  Pattern searcher_;
  std::shared_ptr<const Applier> applier_;
};

}  // namespace rover

#endif  // ROVER_EGRAPH_REWRITE_H_
