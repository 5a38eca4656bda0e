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
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/statusor.h"

// spdlog
#include "spdlog/spdlog.h"

// CLI11
#include "CLI/CLI.hpp"

// json
#include "nlohmann/json.hpp"

// =====================================================================
// local libraries
// =====================================================================

#include "src/config/config.h"
#include "src/id/generator.h"
#include "src/id/layout.h"
#include "src/id/retry.h"

namespace {

int decode(uint64_t id, bool as_json) {
    auto parts = snowflake::id::decompose(id);
    if (as_json) {
        nlohmann::json j = {
            {"id", id},
            {"timestamp", parts.timestamp},
            {"unix_ms", snowflake::id::to_unix_ms(parts)},
            {"datacenter_id", parts.datacenter_id},
            {"worker_id", parts.worker_id},
            {"sequence", parts.sequence},
        };
        std::cout << j.dump(4) << std::endl;
    } else {
        std::cout << fmt::format("{}: {} unix_ms={}", id,
                                 snowflake::id::to_string(parts),
                                 snowflake::id::to_unix_ms(parts))
                  << std::endl;
    }
    return 0;
}

// Produce `count` ids, stop at the first error.
absl::StatusOr<std::vector<uint64_t>> produce(
    snowflake::id::IdGenerator& generator, int count) {
    std::vector<uint64_t> ids;
    ids.reserve(count);
    for (int i = 0; i < count; ++i) {
        auto id = snowflake::id::next_id_with_retry(generator);
        if (!id.ok()) {
            return id.status();
        }
        ids.push_back(id.value());
    }
    return ids;
}

}  // namespace

int main(int argc, char *argv[]) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");

    CLI::App app{"snowflake"};

    std::string config_path;
    auto config_opt =
        app.add_option("--config", config_path, "Node config file (json)")
            ->check(CLI::ExistingFile);

    int64_t datacenter_id = 0;
    auto datacenter_opt =
        app.add_option("--datacenter-id", datacenter_id, "Datacenter id")
            ->check(CLI::Range(int64_t{0}, snowflake::id::kMaxDatacenterId));

    int64_t worker_id = 0;
    auto worker_opt =
        app.add_option("--worker-id", worker_id, "Worker id")
            ->check(CLI::Range(int64_t{0}, snowflake::id::kMaxWorkerId));

    datacenter_opt->needs(worker_opt)->excludes(config_opt);
    worker_opt->needs(datacenter_opt)->excludes(config_opt);

    std::string strategy = "mutex";
    auto strategy_opt =
        app.add_option("--strategy", strategy, "Concurrency strategy")
            ->check(CLI::IsMember({"mutex", "atomic"}, CLI::ignore_case));

    int count = 5;
    app.add_option("--count", count, "Ids per thread")
        ->check(CLI::NonNegativeNumber);

    int threads = 0;
    app.add_option("--threads", threads, "Extra threads producing ids")
        ->check(CLI::NonNegativeNumber);

    uint64_t decode_id = 0;
    auto decode_opt =
        app.add_option("--decode", decode_id, "Print the fields of an id");

    bool as_json = false;
    app.add_flag("--json", as_json, "Print decoded ids as json");

    std::string log_level = "info";
    app.add_option("--log-level", log_level, "Log level")
        ->check(CLI::IsMember(
            {"trace", "debug", "info", "warn", "error", "critical", "off"}));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    spdlog::set_level(spdlog::level::from_str(log_level));

    if (*decode_opt) {
        return decode(decode_id, as_json);
    }

    snowflake::config::NodeConfig config;
    if (*config_opt) {
        auto loaded = snowflake::config::load_config(config_path);
        if (!loaded.ok()) {
            SPDLOG_ERROR("failed to load config: {}",
                         loaded.status().ToString());
            return 1;
        }
        config = loaded.value();
    } else if (*datacenter_opt) {
        config.datacenter_id = datacenter_id;
        config.worker_id = worker_id;
    } else {
        SPDLOG_ERROR("either --config or --datacenter-id and --worker-id "
                     "is required");
        return 1;
    }

    if (*strategy_opt || !*config_opt) {
        auto parsed = snowflake::config::parse_strategy(strategy);
        if (!parsed.ok()) {
            SPDLOG_ERROR("{}", parsed.status().ToString());
            return 1;
        }
        config.strategy = parsed.value();
    }

    SPDLOG_INFO("node config: {}", nlohmann::json(config).dump());

    auto generator = snowflake::config::create_generator(config);
    if (!generator.ok()) {
        SPDLOG_ERROR("failed to create generator: {}",
                     generator.status().ToString());
        return 1;
    }

    auto main_ids = produce(*generator.value(), count);
    if (!main_ids.ok()) {
        SPDLOG_ERROR("failed to generate id: {}",
                     main_ids.status().ToString());
        return 1;
    }
    for (size_t i = 0; i < main_ids->size(); ++i) {
        std::cout << fmt::format("[main - {}] {}", i + 1, (*main_ids)[i])
                  << std::endl;
    }

    // one result slot per thread, printed after join to keep lines whole
    std::vector<absl::StatusOr<std::vector<uint64_t>>> results(
        threads, std::vector<uint64_t>{});
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t, shared = generator.value()]() {
            results[t] = produce(*shared, count);
        });
    }
    for (auto &worker : workers) {
        worker.join();
    }

    int exit_code = 0;
    for (int t = 0; t < threads; ++t) {
        if (!results[t].ok()) {
            SPDLOG_ERROR("[thread {}] failed to generate id: {}", t,
                         results[t].status().ToString());
            exit_code = 1;
            continue;
        }
        for (size_t i = 0; i < results[t]->size(); ++i) {
            std::cout << fmt::format("[thread {} - {}] {}", t, i + 1,
                                     (*results[t])[i])
                      << std::endl;
        }
    }
    return exit_code;
}
