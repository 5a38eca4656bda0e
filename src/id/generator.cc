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
#include <string>
#include <thread>
#include <utility>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"
#include "absl/status/statusor.h"

// magic_enum
#include "magic_enum/magic_enum.hpp"

// spdlog
#include "spdlog/spdlog.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/id/atomic_generator.h"
#include "src/id/errors.h"
#include "src/id/layout.h"
#include "src/id/mutex_generator.h"

// =====================================================================
// self header
// =====================================================================

#include "src/id/generator.h"

namespace snowflake::id {

IdGenerator::IdGenerator(int64_t datacenter_id, int64_t worker_id,
                         std::shared_ptr<Clock> clock)
    : datacenter_id_(datacenter_id),
      worker_id_(worker_id),
      clock_(std::move(clock)) {}

absl::StatusOr<int64_t> IdGenerator::read_clock() {
    int64_t now_ms = this->clock_->now_ms();
    if (now_ms < kEpochMs) {
        return epoch_in_future_error(now_ms);
    }
    return now_ms - kEpochMs;
}

absl::StatusOr<int64_t> IdGenerator::wait_next_millis(int64_t last_timestamp) {
    while (true) {
        auto now = read_clock();
        if (!now.ok()) {
            return now.status();
        }
        if (now.value() > last_timestamp) {
            return now.value();
        }
        if (now.value() < last_timestamp) {
            return clock_backward_error(last_timestamp - now.value());
        }
        std::this_thread::yield();
    }
}

absl::StatusOr<uint64_t> IdGenerator::assemble(int64_t timestamp,
                                               int64_t sequence) const {
    return compose(Parts{
        .timestamp = timestamp,
        .datacenter_id = this->datacenter_id_,
        .worker_id = this->worker_id_,
        .sequence = sequence,
    });
}

absl::Status validate_node(int64_t datacenter_id, int64_t worker_id) {
    if (datacenter_id < 0 || datacenter_id > kMaxDatacenterId) {
        return out_of_range_error("datacenter_id", datacenter_id,
                                  kMaxDatacenterId);
    }
    if (worker_id < 0 || worker_id > kMaxWorkerId) {
        return out_of_range_error("worker_id", worker_id, kMaxWorkerId);
    }
    return absl::OkStatus();
}

absl::StatusOr<std::shared_ptr<IdGenerator>> create_generator(
    int64_t datacenter_id, int64_t worker_id, Strategy strategy,
    std::shared_ptr<Clock> clock) {
    auto status = validate_node(datacenter_id, worker_id);
    if (!status.ok()) {
        return status;
    }
    if (clock == nullptr) {
        return absl::InvalidArgumentError("clock must not be null");
    }

    std::shared_ptr<IdGenerator> generator;
    switch (strategy) {
        case Strategy::Mutex:
            generator = std::make_shared<MutexGenerator>(
                datacenter_id, worker_id, std::move(clock));
            break;
        case Strategy::Atomic:
            generator = std::make_shared<AtomicGenerator>(
                datacenter_id, worker_id, std::move(clock));
            break;
        default:
            return absl::InvalidArgumentError(
                "unknown strategy: " +
                std::to_string(static_cast<int>(strategy)));
    }

    SPDLOG_DEBUG("generator created: datacenter_id: {}, worker_id: {}, "
                 "strategy: {}",
                 datacenter_id, worker_id, magic_enum::enum_name(strategy));
    return generator;
}

}  // namespace snowflake::id
