#pragma once
#include <atomic>
#include <cstdint>
#include <string>

namespace frontier {

using WorldId      = std::uint64_t;
using SettlementId = std::uint64_t;
using StructureId  = std::uint64_t;
using QueueItemId  = std::uint64_t;
using DisasterId   = std::uint64_t;
using TransferId   = std::uint64_t;
using TileId       = std::uint64_t;
using PlayerId     = std::string;

// Monotonic id source shared by everything inside one World.
// 0 is never handed out.
class IdAllocator {
public:
    [[nodiscard]] std::uint64_t next() noexcept { return next_.fetch_add(1, std::memory_order_relaxed); }

    // After restoring persisted state: never hand out an id <= `used`.
    void observe(std::uint64_t used) noexcept {
        std::uint64_t cur = next_.load(std::memory_order_relaxed);
        while (cur <= used && !next_.compare_exchange_weak(cur, used + 1, std::memory_order_relaxed)) {}
    }

private:
    std::atomic<std::uint64_t> next_{1};
};

} // namespace frontier
