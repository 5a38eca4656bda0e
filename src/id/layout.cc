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
#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
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

#include "src/id/layout.h"

namespace snowflake::id {

absl::StatusOr<uint64_t> compose(const Parts& parts) {
    if (parts.timestamp < 0 || parts.timestamp > kMaxTimestamp) {
        return timestamp_exhausted_error(parts.timestamp);
    }
    if (parts.datacenter_id < 0 || parts.datacenter_id > kMaxDatacenterId) {
        return out_of_range_error("datacenter_id", parts.datacenter_id,
                                  kMaxDatacenterId);
    }
    if (parts.worker_id < 0 || parts.worker_id > kMaxWorkerId) {
        return out_of_range_error("worker_id", parts.worker_id, kMaxWorkerId);
    }
    if (parts.sequence < 0 || parts.sequence > kMaxSequence) {
        return out_of_range_error("sequence", parts.sequence, kMaxSequence);
    }

    return (static_cast<uint64_t>(parts.timestamp) << kTimestampShift) |
           (static_cast<uint64_t>(parts.datacenter_id) << kDatacenterIdShift) |
           (static_cast<uint64_t>(parts.worker_id) << kWorkerIdShift) |
           static_cast<uint64_t>(parts.sequence);
}

Parts decompose(uint64_t id) {
    Parts parts;
    parts.timestamp =
        static_cast<int64_t>((id >> kTimestampShift) & kMaxTimestamp);
    parts.datacenter_id =
        static_cast<int64_t>((id >> kDatacenterIdShift) & kMaxDatacenterId);
    parts.worker_id =
        static_cast<int64_t>((id >> kWorkerIdShift) & kMaxWorkerId);
    parts.sequence = static_cast<int64_t>(id & kMaxSequence);
    return parts;
}

int64_t to_unix_ms(const Parts& parts) { return parts.timestamp + kEpochMs; }

std::string to_string(const Parts& parts) {
    return fmt::format("ts={} dc={} worker={} seq={}", parts.timestamp,
                       parts.datacenter_id, parts.worker_id, parts.sequence);
}

}  // namespace snowflake::id
