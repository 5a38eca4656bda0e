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
#include <optional>
#include <string>
#include <string_view>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"

// magic_enum
#include "magic_enum/magic_enum.hpp"

// =====================================================================
// self header
// =====================================================================

#include "src/id/errors.h"

namespace snowflake::id {

namespace {

absl::Status with_kind(absl::Status status, ErrorKind kind) {
    status.SetPayload(kErrorKindUrl,
                      absl::Cord(magic_enum::enum_name(kind)));
    return status;
}

}  // namespace

absl::Status out_of_range_error(std::string_view field, int64_t value,
                                int64_t max) {
    return with_kind(absl::OutOfRangeError(absl::StrFormat(
                         "%s %d out of range [0, %d]", field, value, max)),
                     ErrorKind::ConfigOutOfRange);
}

absl::Status clock_backward_error(int64_t delta_ms) {
    auto status = with_kind(
        absl::UnavailableError(absl::StrFormat(
            "clock moved backwards by %dms, refusing to generate id",
            delta_ms)),
        ErrorKind::ClockBackward);
    status.SetPayload(kBackwardDeltaUrl, absl::Cord(std::to_string(delta_ms)));
    return status;
}

absl::Status timestamp_exhausted_error(int64_t timestamp) {
    return with_kind(
        absl::ResourceExhaustedError(absl::StrFormat(
            "timestamp %dms since epoch exceeds the 41-bit field", timestamp)),
        ErrorKind::TimestampExhausted);
}

absl::Status epoch_in_future_error(int64_t now_ms) {
    return with_kind(absl::FailedPreconditionError(absl::StrFormat(
                         "clock reads %dms, before the epoch", now_ms)),
                     ErrorKind::EpochInFuture);
}

std::optional<ErrorKind> error_kind(const absl::Status& status) {
    if (status.ok()) {
        return std::nullopt;
    }
    auto payload = status.GetPayload(kErrorKindUrl);
    if (!payload.has_value()) {
        return std::nullopt;
    }
    return magic_enum::enum_cast<ErrorKind>(std::string(*payload));
}

bool is_config_out_of_range(const absl::Status& status) {
    return error_kind(status) == ErrorKind::ConfigOutOfRange;
}

bool is_clock_backward(const absl::Status& status) {
    return error_kind(status) == ErrorKind::ClockBackward;
}

bool is_timestamp_exhausted(const absl::Status& status) {
    return error_kind(status) == ErrorKind::TimestampExhausted;
}

std::optional<int64_t> backward_delta_ms(const absl::Status& status) {
    if (!is_clock_backward(status)) {
        return std::nullopt;
    }
    auto payload = status.GetPayload(kBackwardDeltaUrl);
    if (!payload.has_value()) {
        return std::nullopt;
    }
    int64_t delta = 0;
    if (!absl::SimpleAtoi(std::string(*payload), &delta)) {
        return std::nullopt;
    }
    return delta;
}

}  // namespace snowflake::id
