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

#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <vector>

// =====================================================================
// local libraries
// =====================================================================

#include "src/id/clock.h"

namespace test_util {

// Clock that only moves when told to.
class ManualClock : public snowflake::id::Clock {
   public:
    explicit ManualClock(int64_t now_ms) : now_ms_(now_ms) {}

    int64_t now_ms() override {
        return this->now_ms_.load(std::memory_order_acquire);
    }

    void set(int64_t now_ms) {
        this->now_ms_.store(now_ms, std::memory_order_release);
    }

    void advance(int64_t delta_ms) {
        this->now_ms_.fetch_add(delta_ms, std::memory_order_acq_rel);
    }

   private:
    std::atomic<int64_t> now_ms_;
};

// Clock that replays a fixed list of readings, then keeps returning the
// last one. The list must not be empty.
class ScriptedClock : public snowflake::id::Clock {
   public:
    explicit ScriptedClock(std::vector<int64_t> readings)
        : readings_(readings.begin(), readings.end()) {
        if (this->readings_.empty()) {
            throw std::invalid_argument("ScriptedClock needs a reading");
        }
    }

    int64_t now_ms() override {
        std::lock_guard<std::mutex> lock(this->mutex_);
        ++this->reads_;
        int64_t reading = this->readings_.front();
        if (this->readings_.size() > 1) {
            this->readings_.pop_front();
        }
        return reading;
    }

    int reads() {
        std::lock_guard<std::mutex> lock(this->mutex_);
        return this->reads_;
    }

   private:
    std::mutex mutex_;
    std::deque<int64_t> readings_;
    int reads_ = 0;
};

}  // namespace test_util
