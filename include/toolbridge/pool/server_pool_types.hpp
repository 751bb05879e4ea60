#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace toolbridge {

    /// @brief Lifecycle of a server pool. Shutdown is terminal.
    enum class PoolState {
        Uninitialized,  ///< Constructed, no servers yet
        Initializing,   ///< initialize() is creating servers
        Ready,          ///< acquire/release allowed
        Shutdown        ///< All servers disposed, pool unusable
    };

    inline const char* to_string(PoolState state) {
        switch (state) {
            case PoolState::Uninitialized:
                return "Uninitialized";
            case PoolState::Initializing:
                return "Initializing";
            case PoolState::Ready:
                return "Ready";
            case PoolState::Shutdown:
                return "Shutdown";
        }
        return "Unknown";
    }

    /// @brief Metrics for monitoring server pool behavior
    struct ServerPoolMetrics {
        // Gauges (current state)
        std::atomic<std::size_t> available{0};  ///< Idle in the queue
        std::atomic<std::size_t> tracked{0};    ///< Owned, idle or lent
        std::atomic<std::size_t> waiters{0};    ///< Parked in acquire()

        // Counters (cumulative)
        std::atomic<std::uint64_t> servers_created{0};
        std::atomic<std::uint64_t> servers_disposed{0};
        std::atomic<std::uint64_t> dispose_failures{0};
        std::atomic<std::uint64_t> acquire_success{0};
        std::atomic<std::uint64_t> acquire_timeout{0};
        std::atomic<std::uint64_t> acquire_rejected{0};  ///< Not Ready
        std::atomic<std::uint64_t> acquire_cancelled{0};
        std::atomic<std::uint64_t> release_healthy{0};
        std::atomic<std::uint64_t> release_unhealthy{0};
        std::atomic<std::uint64_t> release_anomaly{
            0};  ///< Double, foreign or overflowing release
    };

}  // namespace toolbridge
