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

namespace snowflake::id {

// Source of wall-clock time for a generator.
//
// Implementations must be safe to call from any thread.
class Clock {
   public:
    virtual ~Clock() = default;

    // Unix time in milliseconds.
    virtual int64_t now_ms() = 0;
};

class SystemClock final : public Clock {
   public:
    int64_t now_ms() override;
};

// Shared SystemClock used when the caller doesn't supply one.
std::shared_ptr<Clock> system_clock();

}  // namespace snowflake::id
