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

#include <atomic>
#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"

// spdlog
#include "spdlog/spdlog.h"

// =====================================================================
// self header
// =====================================================================

#include "src/runtime_id/runtime_id.h"

namespace runid {

namespace {

// Process-wide counter, only touched by internal::allocate().
std::atomic<std::size_t> id_counter{0};

}  // namespace

namespace internal {

absl::StatusOr<RuntimeId> allocate(std::atomic<std::size_t>& counter) {
    // Uniqueness only needs the increment to be atomic, the id doesn't
    // publish any other memory, so relaxed is enough.
    std::size_t raw = counter.fetch_add(1, std::memory_order_relaxed);
    if (is_exhausted(raw)) {
        SPDLOG_CRITICAL("runtime id space exhausted, raw counter: {}", raw);
        return absl::ResourceExhaustedError("runtime id space exhausted");
    }
    return RuntimeId(raw);
}

RuntimeId allocate_or_throw(std::atomic<std::size_t>& counter) {
    auto id = allocate(counter);
    if (!id.ok()) {
        throw std::overflow_error(std::string(id.status().message()));
    }
    return *id;
}

}  // namespace internal

RuntimeId RuntimeId::New() { return internal::allocate_or_throw(id_counter); }

absl::StatusOr<RuntimeId> RuntimeId::TryNew() {
    return internal::allocate(id_counter);
}

std::string RuntimeId::DebugString() const {
    return absl::StrFormat("RuntimeId(%d)", value_);
}

std::ostream& operator<<(std::ostream& os, const RuntimeId& id) {
    return os << id.DebugString();
}

}  // namespace runid
