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

#ifndef ROVER_DATA_STRUCTURES_UNION_FIND_H_
#define ROVER_DATA_STRUCTURES_UNION_FIND_H_

#include <cstdint>
#include <utility>
#include <vector>

#include "absl/log/check.h"

namespace rover {

// A union-find data structure over dense integer ids. Elements are created by
// `Insert`, which hands out the ids 0, 1, 2, ... in order.
//
// Union is by size, which keeps trees logarithmically shallow, so `Find` does
// not need path compression and can be used on const instances.
template <typename Id = uint32_t>
class UnionFind {
 public:
  UnionFind() = default;

  // Creates a new singleton equivalence class and returns its id.
  Id Insert() {
    Id id = static_cast<Id>(nodes_.size());
    nodes_.push_back({id, 1});
    return id;
  }

  // Returns the representative element of `id`'s equivalence class.
  Id Find(Id id) const {
    CHECK_LT(id, nodes_.size()) << "Element passed to Find was not inserted.";
    while (nodes_[id].parent != id) {
      id = nodes_[id].parent;
    }
    return id;
  }

  // Unions the classes of `x` and `y` and returns the new representative. The
  // representative of the larger class is kept; ties keep `x`'s.
  Id Union(Id x, Id y) {
    Id x_root = Find(x);
    Id y_root = Find(y);
    if (x_root == y_root) {
      return x_root;
    }
    if (nodes_[x_root].size < nodes_[y_root].size) {
      std::swap(x_root, y_root);
    }
    nodes_[y_root].parent = x_root;
    nodes_[x_root].size += nodes_[y_root].size;
    return x_root;
  }

  // As Union, but `root` is always kept as the representative.
  Id UnionInto(Id root, Id other) {
    Id root_rep = Find(root);
    Id other_rep = Find(other);
    if (root_rep != other_rep) {
      nodes_[other_rep].parent = root_rep;
      nodes_[root_rep].size += nodes_[other_rep].size;
    }
    return root_rep;
  }

  bool IsRepresentative(Id id) const { return Find(id) == id; }

  // Returns the representatives of all equivalence classes in ascending order.
  std::vector<Id> GetRepresentatives() const {
    std::vector<Id> result;
    for (Id id = 0; id < nodes_.size(); ++id) {
      if (nodes_[id].parent == id) {
        result.push_back(id);
      }
    }
    return result;
  }

  // Returns the number of elements ever inserted.
  int64_t size() const { return nodes_.size(); }

 private:
  // A root node has itself as its parent; `size` is only meaningful at roots.
  struct Node {
    Id parent;
    uint32_t size;
  };

  std::vector<Node> nodes_;
};

}  // namespace rover

#endif  // ROVER_DATA_STRUCTURES_UNION_FIND_H_
