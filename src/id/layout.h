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
#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/statusor.h"

namespace snowflake::id {

// Layout of an id, most-significant bit first:
//
//   | sign (1) | timestamp (41) | datacenter (5) | worker (5) | sequence (12) |
//
// The sign bit is always 0, so every id is a non-negative int64 as well.
constexpr int kSignBits = 1;
constexpr int kTimestampBits = 41;
constexpr int kDatacenterIdBits = 5;
constexpr int kWorkerIdBits = 5;
constexpr int kSequenceBits = 12;

static_assert(kSignBits + kTimestampBits + kDatacenterIdBits + kWorkerIdBits +
                      kSequenceBits ==
                  64,
              "id layout must fill 64 bits");

constexpr int64_t kMaxTimestamp = (int64_t{1} << kTimestampBits) - 1;
constexpr int64_t kMaxDatacenterId = (int64_t{1} << kDatacenterIdBits) - 1;
constexpr int64_t kMaxWorkerId = (int64_t{1} << kWorkerIdBits) - 1;
constexpr int64_t kMaxSequence = (int64_t{1} << kSequenceBits) - 1;

constexpr int kWorkerIdShift = kSequenceBits;
constexpr int kDatacenterIdShift = kSequenceBits + kWorkerIdBits;
constexpr int kTimestampShift =
    kSequenceBits + kWorkerIdBits + kDatacenterIdBits;

// 2021-01-01 00:00:00 UTC, in unix milliseconds.
//
// Every node that must produce comparable ids shares this value. Changing it
// after ids have been issued breaks both uniqueness and ordering.
constexpr int64_t kEpochMs = 1609459200000;

// Fields of an id. `timestamp` is in milliseconds since kEpochMs.
struct Parts {
    int64_t timestamp = 0;
    int64_t datacenter_id = 0;
    int64_t worker_id = 0;
    int64_t sequence = 0;

    bool operator==(const Parts& other) const = default;
};

// Pack the fields into an id. Fails with OutOfRange naming the first field
// that doesn't fit its width.
absl::StatusOr<uint64_t> compose(const Parts& parts);

// Split an id into its fields. The sign bit is ignored.
Parts decompose(uint64_t id);

// Unix milliseconds of the id's timestamp field.
int64_t to_unix_ms(const Parts& parts);

std::string to_string(const Parts& parts);

}  // namespace snowflake::id
