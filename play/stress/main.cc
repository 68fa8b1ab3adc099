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
#include <string>
#include <thread>
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/container/flat_hash_set.h"

// spdlog
#include "spdlog/spdlog.h"

// CLI11
#include "CLI/CLI.hpp"

// =====================================================================
// local libraries
// =====================================================================

#include "src/runtime_id/runtime_id.h"

int main(int argc, char *argv[]) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%@] %v");

    CLI::App app{"runtime id stress"};

    int threads = 16;
    app.add_option("--threads", threads, "Number of allocating threads")
        ->check(CLI::Range(1, 1024));

    int batch = 100000;
    app.add_option("--batch", batch, "Ids allocated per thread")
        ->check(CLI::Range(1, 100000000));

    std::string log_level = "info";
    app.add_option("--log-level", log_level, "Log level")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    spdlog::set_level(spdlog::level::from_str(log_level));

    std::vector<std::vector<runid::RuntimeId>> batches(threads);
    std::vector<std::thread> workers;
    workers.reserve(threads);

    auto start = std::chrono::steady_clock::now();
    for (int t = 0; t < threads; t++) {
        workers.emplace_back([&ids = batches[t], batch]() {
            ids.reserve(batch);
            for (int i = 0; i < batch; i++) {
                ids.push_back(runid::RuntimeId::New());
            }
        });
    }
    for (auto &worker : workers) {
        worker.join();
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);

    absl::flat_hash_set<runid::RuntimeId> distinct;
    size_t total = 0;
    for (const auto &ids : batches) {
        SPDLOG_DEBUG("batch size: {}, first: {}", ids.size(),
                     ids.front().DebugString());
        total += ids.size();
        distinct.insert(ids.begin(), ids.end());
    }

    SPDLOG_INFO("threads: {}, allocated: {}, distinct: {}, elapsed: {}us",
                threads, total, distinct.size(), elapsed.count());

    if (distinct.size() != total) {
        SPDLOG_ERROR("duplicate ids detected: {}", total - distinct.size());
        return 1;
    }
    return 0;
}
