#pragma once

#include <utility>  // needed before boost/asio/awaitable.hpp (Boost 1.74 omits it)

#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "toolbridge/tool_server.hpp"

namespace toolbridge {

    /**
     * @brief Named set of tool server pools, owned by main and passed by
     * reference.
     *
     * Pools are kept in registration order: initialized in that order and
     * shut down in reverse.
     */
    class PoolRegistry {
       public:
        using pool_ptr = std::shared_ptr<ToolServerPool>;

        PoolRegistry() = default;
        PoolRegistry(const PoolRegistry&) = delete;
        PoolRegistry& operator=(const PoolRegistry&) = delete;

        /// @throws ConfigurationError on a null pool or a duplicate name.
        void add(pool_ptr pool);

        /// @return The pool registered under name, or nullptr.
        pool_ptr find(const std::string& name) const;

        bool contains(const std::string& name) const {
            return find(name) != nullptr;
        }

        /// @brief Names in registration order.
        std::vector<std::string> names() const;

        std::size_t size() const noexcept { return m_pools.size(); }

        /**
         * @brief Initialize every pool in registration order.
         *
         * On the first failure every pool is shut down, including those
         * already Ready, and the PoolInitializationError is rethrown.
         */
        boost::asio::awaitable<void> initialize_all();

        /// @brief End every parked acquire() in every pool with Cancelled.
        /// @return Total number of waiters cancelled.
        std::size_t cancel_waiters();

        /// @brief Shut every pool down in reverse registration order.
        /// Never throws.
        boost::asio::awaitable<void> shutdown_all();

       private:
        std::vector<pool_ptr> m_pools;
    };

}  // namespace toolbridge
