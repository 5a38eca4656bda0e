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
#include <fstream>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"

// magic_enum
#include "magic_enum/magic_enum.hpp"

// spdlog
#include "spdlog/spdlog.h"

// json
#include "nlohmann/json.hpp"

// =====================================================================
// self header
// =====================================================================

#include "src/config/config.h"

namespace snowflake::config {

void to_json(nlohmann::json& j, const NodeConfig& config) {
    j = nlohmann::json{
        {"datacenter_id", config.datacenter_id},
        {"worker_id", config.worker_id},
        {"strategy", strategy_name(config.strategy)},
    };
}

namespace {

// nlohmann converts floats and booleans to integers with a static_cast, so
// the type is checked here before reading.
int64_t get_node_field(const nlohmann::json& j, const std::string& field) {
    const auto& value = j.at(field);
    if (!value.is_number_integer()) {
        throw std::invalid_argument(
            fmt::format("{} must be an integer, got {}", field, value.dump()));
    }
    if (value.is_number_unsigned() &&
        value.get<uint64_t>() >
            static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw std::invalid_argument(
            fmt::format("{} is too large: {}", field, value.dump()));
    }
    return value.get<int64_t>();
}

}  // namespace

void from_json(const nlohmann::json& j, NodeConfig& config) {
    config.datacenter_id = get_node_field(j, "datacenter_id");
    config.worker_id = get_node_field(j, "worker_id");

    if (j.contains("strategy")) {
        auto name = j.at("strategy").get<std::string>();
        auto strategy = parse_strategy(name);
        if (!strategy.ok()) {
            throw std::invalid_argument(
                std::string(strategy.status().message()));
        }
        config.strategy = strategy.value();
    }
}

absl::StatusOr<snowflake::id::Strategy> parse_strategy(
    const std::string& name) {
    auto strategy = magic_enum::enum_cast<snowflake::id::Strategy>(
        name, magic_enum::case_insensitive);
    if (!strategy.has_value()) {
        return absl::InvalidArgumentError("unknown strategy: " + name);
    }
    return strategy.value();
}

std::string strategy_name(snowflake::id::Strategy strategy) {
    return absl::AsciiStrToLower(magic_enum::enum_name(strategy));
}

absl::StatusOr<NodeConfig> parse_config(const std::string& json_text) {
    NodeConfig config;
    try {
        nlohmann::json::parse(json_text).get_to(config);
    } catch (const nlohmann::json::exception& e) {
        SPDLOG_ERROR("invalid config: {}", e.what());
        return absl::InvalidArgumentError(
            std::string("invalid config: ") + e.what());
    } catch (const std::invalid_argument& e) {
        SPDLOG_ERROR("invalid config: {}", e.what());
        return absl::InvalidArgumentError(
            std::string("invalid config: ") + e.what());
    }

    auto status =
        snowflake::id::validate_node(config.datacenter_id, config.worker_id);
    if (!status.ok()) {
        SPDLOG_ERROR("invalid config: {}", status.ToString());
        return status;
    }
    return config;
}

absl::StatusOr<NodeConfig> load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SPDLOG_ERROR("failed to open config file: {}", path);
        return absl::NotFoundError("failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_config(buffer.str());
}

absl::StatusOr<std::shared_ptr<snowflake::id::IdGenerator>> create_generator(
    const NodeConfig& config, std::shared_ptr<snowflake::id::Clock> clock) {
    return snowflake::id::create_generator(config.datacenter_id,
                                           config.worker_id, config.strategy,
                                           std::move(clock));
}

}  // namespace snowflake::config
