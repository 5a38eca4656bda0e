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

#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>

// =====================================================================
// local libraries
// =====================================================================

#include "src/id/errors.h"
#include "src/id/layout.h"

// =====================================================================
// self header
// =====================================================================

#include "src/id/mutex_generator.h"

namespace snowflake::id {

MutexGenerator::MutexGenerator(int64_t datacenter_id, int64_t worker_id,
                               std::shared_ptr<Clock> clock)
    : IdGenerator(datacenter_id, worker_id, std::move(clock)) {}

absl::StatusOr<uint64_t> MutexGenerator::next_id() {
    std::lock_guard<std::mutex> lock(this->mutex_);

    auto now = read_clock();
    if (!now.ok()) {
        return now.status();
    }
    int64_t timestamp = now.value();

    if (timestamp < this->last_timestamp_) {
        return clock_backward_error(this->last_timestamp_ - timestamp);
    }

    int64_t sequence = 0;
    if (timestamp == this->last_timestamp_) {
        if (this->sequence_ < kMaxSequence) {
            sequence = this->sequence_ + 1;
        } else {
            // sequence of this millisecond is used up
            auto next = wait_next_millis(this->last_timestamp_);
            if (!next.ok()) {
                return next.status();
            }
            timestamp = next.value();
        }
    }

    if (timestamp > kMaxTimestamp) {
        return timestamp_exhausted_error(timestamp);
    }

    this->last_timestamp_ = timestamp;
    this->sequence_ = sequence;
    return assemble(timestamp, sequence);
}

}  // namespace snowflake::id
