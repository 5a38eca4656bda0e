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

#include <chrono>
#include <cstdint>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/statusor.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/id/generator.h"

namespace snowflake::id {

// Caller-side policy for riding out small clock regressions.
class RetryPolicy {
   public:
    // Total number of next_id() calls, including the first one.
    int max_attempts = 5;

    // Minimum sleep between attempts. The sleep is stretched to the reported
    // regression when that is longer.
    std::chrono::milliseconds backoff{1};

    // Regressions larger than this are returned at once, they need an
    // operator rather than a retry.
    int64_t max_tolerated_delta_ms = 1000;
};

// Call generator.next_id(), retrying ClockBackward errors per `policy`. Any
// other error is returned at once. When attempts run out the last
// ClockBackward error is returned.
absl::StatusOr<uint64_t> next_id_with_retry(IdGenerator& generator,
                                            const RetryPolicy& policy = {});

}  // namespace snowflake::id
