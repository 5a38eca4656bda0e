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

#include <atomic>
#include <cstdint>
#include <memory>

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

// Lock-free generator. The (last_timestamp, sequence) pair lives in one
// atomic word:
//
//   | unused (11) | last_timestamp (41) | sequence (12) |
//
// and is advanced with a compare-and-swap loop. A failed CAS re-reads both
// the state and the clock, so every decision is made on a consistent pair.
class AtomicGenerator final : public IdGenerator {
   public:
    // Use create_generator() instead, it validates the node identity.
    AtomicGenerator(int64_t datacenter_id, int64_t worker_id,
                    std::shared_ptr<Clock> clock);

    absl::StatusOr<uint64_t> next_id() override;

    Strategy strategy() const override { return Strategy::Atomic; }

   private:
    // No id was issued yet. Not a valid packed state since the unused bits
    // are set.
    static constexpr uint64_t kUnset = ~uint64_t{0};

    static uint64_t pack(int64_t timestamp, int64_t sequence);

    std::atomic<uint64_t> state_{kUnset};
};

}  // namespace snowflake::id
