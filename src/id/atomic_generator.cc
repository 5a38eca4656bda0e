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

// =====================================================================
// c++ std
// =====================================================================

#include <atomic>
#include <cstdint>
#include <memory>
#include <utility>

// =====================================================================
// local libraries
// =====================================================================

#include "src/id/errors.h"
#include "src/id/layout.h"

// =====================================================================
// self header
// =====================================================================

#include "src/id/atomic_generator.h"

namespace snowflake::id {

AtomicGenerator::AtomicGenerator(int64_t datacenter_id, int64_t worker_id,
                                 std::shared_ptr<Clock> clock)
    : IdGenerator(datacenter_id, worker_id, std::move(clock)) {}

uint64_t AtomicGenerator::pack(int64_t timestamp, int64_t sequence) {
    return (static_cast<uint64_t>(timestamp) << kSequenceBits) |
           static_cast<uint64_t>(sequence);
}

absl::StatusOr<uint64_t> AtomicGenerator::next_id() {
    uint64_t current = this->state_.load(std::memory_order_acquire);

    while (true) {
        // The clock is read after the state it is compared against, so a
        // concurrent winner can't make a correct clock look like it went
        // backwards.
        auto now = read_clock();
        if (!now.ok()) {
            return now.status();
        }
        int64_t timestamp = now.value();
        int64_t sequence = 0;

        if (current != kUnset) {
            int64_t last_timestamp =
                static_cast<int64_t>(current >> kSequenceBits);
            int64_t last_sequence =
                static_cast<int64_t>(current & kMaxSequence);

            if (timestamp < last_timestamp) {
                return clock_backward_error(last_timestamp - timestamp);
            }

            if (timestamp == last_timestamp) {
                if (last_sequence < kMaxSequence) {
                    sequence = last_sequence + 1;
                } else {
                    // sequence of this millisecond is used up
                    auto next = wait_next_millis(last_timestamp);
                    if (!next.ok()) {
                        return next.status();
                    }
                    timestamp = next.value();
                }
            }
        }

        if (timestamp > kMaxTimestamp) {
            return timestamp_exhausted_error(timestamp);
        }

        uint64_t desired = pack(timestamp, sequence);
        if (this->state_.compare_exchange_weak(current, desired,
                                               std::memory_order_acq_rel,
                                               std::memory_order_acquire)) {
            return assemble(timestamp, sequence);
        }
        // lost the race, `current` holds the winner's state
    }
}

}  // namespace snowflake::id
