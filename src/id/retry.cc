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

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <thread>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"
#include "absl/status/statusor.h"

// spdlog
#include "spdlog/spdlog.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/id/errors.h"

// =====================================================================
// self header
// =====================================================================

#include "src/id/retry.h"

namespace snowflake::id {

absl::StatusOr<uint64_t> next_id_with_retry(IdGenerator& generator,
                                            const RetryPolicy& policy) {
    if (policy.max_attempts < 1) {
        return absl::InvalidArgumentError("max_attempts must be at least 1");
    }

    absl::Status last_error;
    for (int attempt = 1; attempt <= policy.max_attempts; ++attempt) {
        auto id = generator.next_id();
        if (id.ok() || !is_clock_backward(id.status())) {
            return id;
        }

        int64_t delta = backward_delta_ms(id.status()).value_or(0);
        if (delta > policy.max_tolerated_delta_ms) {
            SPDLOG_ERROR(
                "clock moved backwards by {}ms, over the tolerated {}ms, "
                "datacenter_id: {}, worker_id: {}",
                delta, policy.max_tolerated_delta_ms,
                generator.datacenter_id(), generator.worker_id());
            return id.status();
        }

        last_error = id.status();
        if (attempt == policy.max_attempts) {
            break;
        }

        auto sleep = std::max(policy.backoff, std::chrono::milliseconds(delta));
        SPDLOG_WARN(
            "clock moved backwards by {}ms, retrying in {}ms (attempt {}/{})",
            delta, sleep.count(), attempt, policy.max_attempts);
        std::this_thread::sleep_for(sleep);
    }

    SPDLOG_ERROR("clock still behind after {} attempts: {}",
                 policy.max_attempts, last_error.ToString());
    return last_error;
}

}  // namespace snowflake::id
