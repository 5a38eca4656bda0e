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

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"
#include "absl/status/statusor.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/id/clock.h"

namespace snowflake::id {

// How a generator serializes updates of its (last_timestamp, sequence) pair.
enum class Strategy {
    // One std::mutex around the whole read-compare-mutate step.
    Mutex = 1,

    // The pair packed in one atomic word, advanced by compare-and-swap.
    Atomic = 2,
};

// Produces time-ordered 64-bit ids for one node identity.
//
// next_id() may be called from any number of threads. For one generator, ids
// returned by calls that don't overlap are increasing.
//
// Errors are returned, never logged or retried here:
// - ClockBackward (kUnavailable): the clock reads earlier than the last
//   issued id. The state is left untouched; the caller decides whether to
//   retry (see retry.h).
// - TimestampExhausted (kResourceExhausted): the 41-bit timestamp field
//   overflowed for this epoch.
// - EpochInFuture (kFailedPrecondition): the clock reads before kEpochMs.
class IdGenerator {
   public:
    virtual ~IdGenerator() = default;

    // copy blocker
    IdGenerator(const IdGenerator&) = delete;

    // assignment blocker
    void operator=(const IdGenerator&) = delete;

    virtual absl::StatusOr<uint64_t> next_id() = 0;

    virtual Strategy strategy() const = 0;

    int64_t datacenter_id() const { return datacenter_id_; }

    int64_t worker_id() const { return worker_id_; }

   protected:
    IdGenerator(int64_t datacenter_id, int64_t worker_id,
                std::shared_ptr<Clock> clock);

    // Current time in milliseconds since kEpochMs.
    absl::StatusOr<int64_t> read_clock();

    // Spin until the clock passes `last_timestamp`, then return the new
    // reading. Used when the sequence of `last_timestamp` is used up.
    absl::StatusOr<int64_t> wait_next_millis(int64_t last_timestamp);

    absl::StatusOr<uint64_t> assemble(int64_t timestamp,
                                      int64_t sequence) const;

    const int64_t datacenter_id_;
    const int64_t worker_id_;

    std::shared_ptr<Clock> clock_;
};

// Check a node identity against the layout. OutOfRange names the field.
absl::Status validate_node(int64_t datacenter_id, int64_t worker_id);

// Create a generator for the node (datacenter_id, worker_id).
//
// The caller owns the returned handle and may share it between threads.
// Create one generator per node identity: two generators with the same
// identity in one fleet will issue duplicates.
absl::StatusOr<std::shared_ptr<IdGenerator>> create_generator(
    int64_t datacenter_id, int64_t worker_id,
    Strategy strategy = Strategy::Mutex,
    std::shared_ptr<Clock> clock = system_clock());

}  // namespace snowflake::id
