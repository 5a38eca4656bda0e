// Copyright 2025 Xiaochen Cui
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

// =====================================================================
// c++ std
// =====================================================================

#include <cstdint>
#include <memory>
#include <mutex>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/statusor.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/id/clock.h"
#include "src/id/generator.h"

namespace snowflake::id {

class MutexGenerator final : public IdGenerator {
   public:
    // Use create_generator() instead, it validates the node identity.
    MutexGenerator(int64_t datacenter_id, int64_t worker_id,
                   std::shared_ptr<Clock> clock);

    absl::StatusOr<uint64_t> next_id() override;

    Strategy strategy() const override { return Strategy::Mutex; }

   private:
    std::mutex mutex_;

    // Both guarded by mutex_. -1 means no id was issued yet.
    int64_t last_timestamp_ = -1;
    int64_t sequence_ = 0;
};

}  // namespace snowflake::id
