#include "toolbridge/pool_registry.hpp"

#include <algorithm>
#include <exception>

#include "toolbridge/error.hpp"
#include "toolbridge/logging.hpp"

namespace toolbridge {

    void PoolRegistry::add(pool_ptr pool) {
        if (!pool) {
            throw ConfigurationError("Cannot register a null pool");
        }
        if (contains(pool->name())) {
            throw ConfigurationError("Pool '" + pool->name() +
                                     "' is already registered");
        }
        logger()->debug("Registered pool '{}'", pool->name());
        m_pools.push_back(std::move(pool));
    }

    PoolRegistry::pool_ptr PoolRegistry::find(const std::string& name) const {
        auto it = std::find_if(m_pools.begin(), m_pools.end(),
                               [&](const pool_ptr& p) { return p->name() == name; });
        return it == m_pools.end() ? nullptr : *it;
    }

    std::vector<std::string> PoolRegistry::names() const {
        std::vector<std::string> out;
        out.reserve(m_pools.size());
        for (const auto& p : m_pools) out.push_back(p->name());
        return out;
    }

    boost::asio::awaitable<void> PoolRegistry::initialize_all() {
        std::exception_ptr failure;
        for (const auto& pool : m_pools) {
            try {
                co_await pool->initialize();
            } catch (const PoolError& e) {
                logger()->critical("Failed to initialize pool '{}': {}",
                                   pool->name(), e.what());
                failure = std::current_exception();
            }
            if (failure) break;
        }

        if (!failure) {
            logger()->info("All {} pools initialized", m_pools.size());
            co_return;
        }

        co_await shutdown_all();
        std::rethrow_exception(failure);
    }

    std::size_t PoolRegistry::cancel_waiters() {
        std::size_t n = 0;
        for (const auto& pool : m_pools) n += pool->cancel_waiters();
        if (n > 0) logger()->info("Cancelled {} pending acquires", n);
        return n;
    }

    boost::asio::awaitable<void> PoolRegistry::shutdown_all() {
        logger()->info("Shutting down {} pools", m_pools.size());
        for (auto it = m_pools.rbegin(); it != m_pools.rend(); ++it) {
            co_await (*it)->shutdown();
        }
        logger()->info("All pools shut down");
    }

}  // namespace toolbridge
