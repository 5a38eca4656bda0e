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
#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/statusor.h"

// json
#include "nlohmann/json.hpp"

// =====================================================================
// local libraries
// =====================================================================

#include "src/id/clock.h"
#include "src/id/generator.h"

namespace snowflake::config {

// Identity of a node and how its generator is built.
//
// The identity is assigned from outside (static config, a coordination
// service). Every (datacenter_id, worker_id) pair must be unique in the
// fleet.
class NodeConfig {
   public:
    int64_t datacenter_id = 0;
    int64_t worker_id = 0;
    snowflake::id::Strategy strategy = snowflake::id::Strategy::Mutex;
};

// Json form:
//
//   {"datacenter_id": 1, "worker_id": 1, "strategy": "mutex"}
//
// "strategy" is optional. from_json throws nlohmann::json::exception on
// missing or ill-typed fields and std::invalid_argument on non-integer ids
// (floats, booleans, values past int64) or an unknown strategy. It doesn't
// check ranges.
void to_json(nlohmann::json& j, const NodeConfig& config);
void from_json(const nlohmann::json& j, NodeConfig& config);

// Parse a strategy name, case-insensitive ("mutex", "atomic").
absl::StatusOr<snowflake::id::Strategy> parse_strategy(
    const std::string& name);

std::string strategy_name(snowflake::id::Strategy strategy);

// Parse and validate a json config.
//
// InvalidArgument for malformed json, missing fields or an unknown strategy.
// OutOfRange for ids that don't fit the layout.
absl::StatusOr<NodeConfig> parse_config(const std::string& json_text);

// Same as parse_config, reading from `path`. NotFound if the file can't be
// read.
absl::StatusOr<NodeConfig> load_config(const std::string& path);

absl::StatusOr<std::shared_ptr<snowflake::id::IdGenerator>> create_generator(
    const NodeConfig& config,
    std::shared_ptr<snowflake::id::Clock> clock = snowflake::id::system_clock());

}  // namespace snowflake::config
