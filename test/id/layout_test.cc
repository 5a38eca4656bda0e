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
#include "src/id/layout.h"

namespace snowflake::id {

TEST(LayoutTest, ShiftsMatchFieldWidths) {
    EXPECT_EQ(kWorkerIdShift, 12);
    EXPECT_EQ(kDatacenterIdShift, 17);
    EXPECT_EQ(kTimestampShift, 22);
    EXPECT_EQ(kMaxSequence, 4095);
    EXPECT_EQ(kMaxDatacenterId, 31);
    EXPECT_EQ(kMaxWorkerId, 31);
}

TEST(LayoutTest, ComposePlacesFieldsMostSignificantFirst) {
    auto id = compose(
        Parts{.timestamp = 1, .datacenter_id = 1, .worker_id = 1, .sequence = 1});
    ASSERT_TRUE(id.ok()) << id.status();
    EXPECT_EQ(id.value(), (uint64_t{1} << 22) | (uint64_t{1} << 17) |
                              (uint64_t{1} << 12) | uint64_t{1});
}

TEST(LayoutTest, DecomposeReproducesFields) {
    std::vector<Parts> cases = {
        {0, 0, 0, 0},
        {1000, 5, 10, 0},
        {123456789, 31, 0, 4095},
        {kMaxTimestamp, kMaxDatacenterId, kMaxWorkerId, kMaxSequence},
    };

    for (const auto& parts : cases) {
        auto id = compose(parts);
        ASSERT_TRUE(id.ok()) << to_string(parts);
        EXPECT_EQ(decompose(id.value()), parts) << to_string(parts);
        EXPECT_EQ(id.value() >> 63, 0u) << to_string(parts);
    }
}

TEST(LayoutTest, LargestIdKeepsSignBitClear) {
    auto id = compose(Parts{kMaxTimestamp, kMaxDatacenterId, kMaxWorkerId,
                            kMaxSequence});
    ASSERT_TRUE(id.ok());
    EXPECT_EQ(id.value(), uint64_t{0x7fffffffffffffff});
    EXPECT_GT(static_cast<int64_t>(id.value()), 0);
}

TEST(LayoutTest, ComposeRejectsFieldsOutOfRange) {
    auto status = compose(Parts{0, kMaxDatacenterId + 1, 0, 0}).status();
    EXPECT_EQ(status.code(), absl::StatusCode::kOutOfRange);
    EXPECT_TRUE(is_config_out_of_range(status));
    EXPECT_NE(status.message().find("datacenter_id"), std::string::npos);

    status = compose(Parts{0, 0, -1, 0}).status();
    EXPECT_EQ(status.code(), absl::StatusCode::kOutOfRange);
    EXPECT_NE(status.message().find("worker_id"), std::string::npos);

    status = compose(Parts{0, 0, 0, kMaxSequence + 1}).status();
    EXPECT_EQ(status.code(), absl::StatusCode::kOutOfRange);
    EXPECT_NE(status.message().find("sequence"), std::string::npos);

    status = compose(Parts{kMaxTimestamp + 1, 0, 0, 0}).status();
    EXPECT_EQ(status.code(), absl::StatusCode::kResourceExhausted);
    EXPECT_TRUE(is_timestamp_exhausted(status));
}

TEST(LayoutTest, DecomposeIgnoresSignBit) {
    auto id = compose(Parts{42, 3, 4, 5});
    ASSERT_TRUE(id.ok());
    EXPECT_EQ(decompose(id.value() | (uint64_t{1} << 63)),
              (Parts{42, 3, 4, 5}));
}

TEST(LayoutTest, UnixMillisAddsEpoch) {
    EXPECT_EQ(to_unix_ms(Parts{0, 0, 0, 0}), kEpochMs);
    EXPECT_EQ(to_unix_ms(Parts{1500, 0, 0, 0}), kEpochMs + 1500);
}

TEST(LayoutTest, ToString) {
    EXPECT_EQ(to_string(Parts{7, 1, 2, 3}), "ts=7 dc=1 worker=2 seq=3");
}

}  // namespace snowflake::id
