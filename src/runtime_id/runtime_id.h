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
#include <cstddef>
#include <functional>
#include <limits>
#include <ostream>
#include <string>
#include <utility>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/hash/hash.h"
#include "absl/status/statusor.h"

namespace runid {

class RuntimeId;

namespace internal {

// Allocation against an explicit counter. RuntimeId::New() and TryNew() run
// these on the process-wide counter; tests run them on a local one.
absl::StatusOr<RuntimeId> allocate(std::atomic<std::size_t>& counter);

// Throws std::overflow_error where allocate() returns an error.
RuntimeId allocate_or_throw(std::atomic<std::size_t>& counter);

}  // namespace internal

// Opaque id that is unique per run of a program.
//
// Internally it is a counter value handed out by a process-wide atomic, so
// creating, copying and comparing ids is cheap. The value is never exposed
// and no ordering is defined: callers can ask "same id?" and hash an id, but
// can't learn allocation order or count from it. Ids are meaningless outside
// the process that allocated them, so there is no serialization either.
class RuntimeId {
   public:
    // Allocates a new id, distinct from every id allocated before it in this
    // process. Lock-free, safe to call from any thread.
    //
    // Throws std::overflow_error once the id space is exhausted, see
    // TryNew().
    static RuntimeId New();

    // Same as New(), but reports exhaustion of the id space as
    // ResourceExhaustedError instead of throwing.
    static absl::StatusOr<RuntimeId> TryNew();

    RuntimeId() = delete;

    RuntimeId(const RuntimeId&) = default;
    RuntimeId& operator=(const RuntimeId&) = default;

    bool operator==(const RuntimeId& other) const = default;

    // For logs and diagnostics only, the format is not stable.
    std::string DebugString() const;

    template <typename H>
    friend H AbslHashValue(H h, const RuntimeId& id) {
        return H::combine(std::move(h), id.value_);
    }

    friend std::ostream& operator<<(std::ostream& os, const RuntimeId& id);

   private:
    friend absl::StatusOr<RuntimeId> internal::allocate(
        std::atomic<std::size_t>& counter);

    explicit RuntimeId(std::size_t value) : value_(value) {}

    std::size_t value_;
};

namespace internal {

// Ids are only handed out from the lower half of the counter range. A raw
// counter value with the top bit set means the id space is exhausted; since
// the counter only grows, every later value is rejected as well.
constexpr std::size_t kExhaustedBit =
    std::size_t{1} << (std::numeric_limits<std::size_t>::digits - 1);

constexpr bool is_exhausted(std::size_t raw) {
    return (raw & kExhaustedBit) != 0;
}

}  // namespace internal

}  // namespace runid

template <>
struct std::hash<runid::RuntimeId> {
    std::size_t operator()(const runid::RuntimeId& id) const noexcept {
        return absl::Hash<runid::RuntimeId>{}(id);
    }
};
