#pragma once

#include <utility>  // needed before boost/asio/awaitable.hpp (Boost 1.74 omits it)

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <string>

#include "toolbridge/agent.hpp"
#include "toolbridge/pool_registry.hpp"
#include "toolbridge/result.hpp"

namespace toolbridge {

    struct DispatcherConfiguration {
        /** @brief Pool for messages that name none. */
        std::string default_pool{"stdio"};

        /** @brief Acquire timeout for pools without an entry below. */
        std::chrono::milliseconds acquire_timeout{30000};

        std::map<std::string, std::chrono::milliseconds> pool_acquire_timeouts;
    };

    /**
     * @brief Routes each message to the agent of its pool, lending the
     * agent one tool server for the duration of the message.
     */
    class AgentDispatcher {
       public:
        AgentDispatcher(PoolRegistry& registry, DispatcherConfiguration cfg);

        /// @throws ConfigurationError on a null agent or an unregistered
        /// pool.
        void register_agent(const std::string& pool_key,
                            std::shared_ptr<Agent> agent);

        /**
         * @brief Serve one message.
         *
         * The server is released exactly once; it is discarded when the
         * agent throws or fails with an error that indicates an unhealthy
         * server.
         * @return The agent's reply, or PoolNotFound, Timeout, Shutdown,
         * InvalidState, or the agent's error.
         */
        boost::asio::awaitable<Result<std::string>> process_message(
            MessageContext context);

        /// @brief Messages currently being processed.
        std::size_t in_flight() const noexcept {
            return m_in_flight.load(std::memory_order_relaxed);
        }

       private:
        std::chrono::milliseconds timeout_for(const std::string& pool) const;

        PoolRegistry& m_registry;
        DispatcherConfiguration m_cfg;
        std::map<std::string, std::shared_ptr<Agent>> m_agents;
        std::atomic<std::size_t> m_in_flight{0};
    };

}  // namespace toolbridge
