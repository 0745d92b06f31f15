// Copyright 2025 The Restrack Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "restrack/tracker/resource_unlinker.h"

namespace restrack {
namespace tracker {

// Fake unlinker over an in-memory namespace. Objects are "created" with Create()
// and unlinking an object that does not exist fails the way the OS does (ENOENT).
class FakeResourceUnlinker : public ResourceUnlinkerInterface {
 public:
  FakeResourceUnlinker() = default;

  void Create(const ResourceKey &key) { existing_.insert(key); }

  bool Exists(const ResourceKey &key) const { return existing_.contains(key); }

  Status Unlink(const ResourceKey &key) override {
    unlinked_.push_back(key);
    unlink_calls_[key]++;
    if (key.kind == ResourceKind::kNoop) {
      return Status::OK();
    }
    if (existing_.erase(key) == 0) {
      return Status::UnlinkFailed(
          absl::StrCat("unlink ", key.ToString(), ": No such file or directory"));
    }
    return Status::OK();
  }

  int UnlinkCalls(const ResourceKey &key) const {
    auto it = unlink_calls_.find(key);
    return it == unlink_calls_.end() ? 0 : it->second;
  }

  // Every Unlink() call in order.
  std::vector<ResourceKey> unlinked_;

 private:
  absl::flat_hash_set<ResourceKey> existing_;
  absl::flat_hash_map<ResourceKey, int> unlink_calls_;
};

}  // namespace tracker
}  // namespace restrack
