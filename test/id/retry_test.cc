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

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"

// gtest
#include "gtest/gtest.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/id/errors.h"
#include "src/id/generator.h"
#include "src/id/layout.h"
#include "src/id/retry.h"
#include "test/util/manual_clock.h"

namespace snowflake::id {

namespace {

constexpr int64_t kNow = kEpochMs + 60000;

std::shared_ptr<IdGenerator> make_generator(
    std::shared_ptr<test_util::ScriptedClock> clock) {
    auto generator = create_generator(1, 2, Strategy::Mutex, clock);
    EXPECT_TRUE(generator.ok()) << generator.status();
    return generator.value();
}

}  // namespace

TEST(RetryTest, ScriptedClockNeedsReadings) {
    EXPECT_THROW(test_util::ScriptedClock(std::vector<int64_t>{}),
                 std::invalid_argument);
}

TEST(RetryTest, ReturnsIdWhenClockIsFine) {
    auto clock =
        std::make_shared<test_util::ScriptedClock>(std::vector<int64_t>{kNow});
    auto generator = make_generator(clock);

    auto id = next_id_with_retry(*generator);
    ASSERT_TRUE(id.ok()) << id.status();
    EXPECT_EQ(decompose(id.value()).timestamp, kNow - kEpochMs);
    EXPECT_EQ(clock->reads(), 1);
}

TEST(RetryTest, RidesOutSmallRegression) {
    auto clock = std::make_shared<test_util::ScriptedClock>(
        std::vector<int64_t>{kNow, kNow - 2, kNow - 1, kNow + 1});
    auto generator = make_generator(clock);
    ASSERT_TRUE(generator->next_id().ok());

    RetryPolicy policy;
    policy.backoff = std::chrono::milliseconds(1);

    auto id = next_id_with_retry(*generator, policy);
    ASSERT_TRUE(id.ok()) << id.status();
    auto parts = decompose(id.value());
    EXPECT_EQ(parts.timestamp, kNow + 1 - kEpochMs);
    EXPECT_EQ(parts.sequence, 0);
    EXPECT_EQ(clock->reads(), 4);
}

TEST(RetryTest, GivesUpAfterMaxAttempts) {
    auto clock = std::make_shared<test_util::ScriptedClock>(
        std::vector<int64_t>{kNow, kNow - 1});
    auto generator = make_generator(clock);
    ASSERT_TRUE(generator->next_id().ok());

    RetryPolicy policy;
    policy.max_attempts = 3;
    policy.backoff = std::chrono::milliseconds(1);

    auto id = next_id_with_retry(*generator, policy);
    ASSERT_FALSE(id.ok());
    EXPECT_TRUE(is_clock_backward(id.status()));
    EXPECT_EQ(backward_delta_ms(id.status()), 1);
    EXPECT_EQ(clock->reads(), 1 + 3);
}

TEST(RetryTest, LargeRegressionIsNotRetried) {
    auto clock = std::make_shared<test_util::ScriptedClock>(
        std::vector<int64_t>{kNow, kNow - 5000});
    auto generator = make_generator(clock);
    ASSERT_TRUE(generator->next_id().ok());

    RetryPolicy policy;
    policy.max_tolerated_delta_ms = 1000;

    auto id = next_id_with_retry(*generator, policy);
    ASSERT_FALSE(id.ok());
    EXPECT_EQ(backward_delta_ms(id.status()), 5000);
    EXPECT_EQ(clock->reads(), 2);
}

TEST(RetryTest, OtherErrorsAreNotRetried) {
    auto clock = std::make_shared<test_util::ScriptedClock>(
        std::vector<int64_t>{kEpochMs - 10});
    auto generator = make_generator(clock);

    auto id = next_id_with_retry(*generator);
    ASSERT_FALSE(id.ok());
    EXPECT_EQ(id.status().code(), absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(clock->reads(), 1);
}

TEST(RetryTest, RejectsPolicyWithoutAttempts) {
    auto clock =
        std::make_shared<test_util::ScriptedClock>(std::vector<int64_t>{kNow});
    auto generator = make_generator(clock);

    RetryPolicy policy;
    policy.max_attempts = 0;

    auto id = next_id_with_retry(*generator, policy);
    EXPECT_EQ(id.status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(clock->reads(), 0);
}

}  // namespace snowflake::id
