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
#include <optional>
#include <string_view>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"

namespace snowflake::id {

// Kind of a failure reported by this library. Attached to the absl::Status as
// a payload so callers can branch without parsing messages.
enum class ErrorKind {
    // datacenter_id / worker_id (or another id field) outside its range.
    ConfigOutOfRange = 1,

    // The clock reads earlier than the last issued id. Transient.
    ClockBackward = 2,

    // The timestamp no longer fits in 41 bits. The epoch must be redefined.
    TimestampExhausted = 3,

    // The clock reads earlier than kEpochMs.
    EpochInFuture = 4,
};

constexpr std::string_view kErrorKindUrl = "snowflake.id/error_kind";
constexpr std::string_view kBackwardDeltaUrl = "snowflake.id/backward_delta_ms";

// `field` value `value` outside [0, max]. Code kOutOfRange.
absl::Status out_of_range_error(std::string_view field, int64_t value,
                                int64_t max);

// Clock regressed by `delta_ms`. Code kUnavailable.
absl::Status clock_backward_error(int64_t delta_ms);

// `timestamp` (ms since epoch) exceeds the 41-bit field. Code
// kResourceExhausted.
absl::Status timestamp_exhausted_error(int64_t timestamp);

// Clock reads `now_ms` (unix ms), before the epoch. Code kFailedPrecondition.
absl::Status epoch_in_future_error(int64_t now_ms);

std::optional<ErrorKind> error_kind(const absl::Status& status);

bool is_config_out_of_range(const absl::Status& status);

bool is_clock_backward(const absl::Status& status);

bool is_timestamp_exhausted(const absl::Status& status);

// Magnitude of the clock regression carried by a ClockBackward error.
std::optional<int64_t> backward_delta_ms(const absl::Status& status);

}  // namespace snowflake::id
