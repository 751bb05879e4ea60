#include "toolbridge/dispatcher.hpp"

#include <optional>
#include <utility>

#include "toolbridge/error.hpp"
#include "toolbridge/logging.hpp"

namespace toolbridge {

    namespace {

        /// Counts a message for as long as it is being processed.
        class InFlight {
           public:
            explicit InFlight(std::atomic<std::size_t>& n) : m_n(n) {
                m_n.fetch_add(1, std::memory_order_relaxed);
            }
            ~InFlight() { m_n.fetch_sub(1, std::memory_order_relaxed); }

            InFlight(const InFlight&) = delete;
            InFlight& operator=(const InFlight&) = delete;

           private:
            std::atomic<std::size_t>& m_n;
        };

    }  // namespace

    AgentDispatcher::AgentDispatcher(PoolRegistry& registry,
                                     DispatcherConfiguration cfg)
        : m_registry(registry), m_cfg(std::move(cfg)) {}

    void AgentDispatcher::register_agent(const std::string& pool_key,
                                         std::shared_ptr<Agent> agent) {
        if (!agent) {
            throw ConfigurationError("Null agent for pool '" + pool_key + "'");
        }
        if (!m_registry.contains(pool_key)) {
            throw ConfigurationError("Cannot register an agent for unknown "
                                     "pool '" +
                                     pool_key + "'");
        }
        m_agents[pool_key] = std::move(agent);
    }

    std::chrono::milliseconds AgentDispatcher::timeout_for(
        const std::string& pool) const {
        auto it = m_cfg.pool_acquire_timeouts.find(pool);
        return it == m_cfg.pool_acquire_timeouts.end() ? m_cfg.acquire_timeout
                                                       : it->second;
    }

    boost::asio::awaitable<Result<std::string>> AgentDispatcher::process_message(
        MessageContext context) {
        InFlight guard(m_in_flight);

        const std::string key =
            context.pool_key.empty() ? m_cfg.default_pool : context.pool_key;

        auto pool = m_registry.find(key);
        auto agent_it = m_agents.find(key);
        if (!pool || agent_it == m_agents.end()) {
            logger()->warn("Message {} from {}: no pool '{}'",
                           context.conversation_id, context.sender, key);
            co_return Result<std::string>::err(
                Error::Code::PoolNotFound,
                "No MCP server pool named '" + key + "'");
        }
        auto agent = agent_it->second;

        logger()->info("Processing message {} from {} on pool '{}'",
                       context.conversation_id, context.sender, key);

        auto leased = co_await pool->lease(timeout_for(key));
        if (leased.has_error()) {
            auto e = std::move(leased).error();
            logger()->warn("Message {}: pool '{}' unavailable: {}",
                           context.conversation_id, key, e.message);
            e.message = "MCP server pool '" + key + "' unavailable: " +
                        e.message;
            co_return Result<std::string>::err(std::move(e));
        }
        auto lease = std::move(leased).value();

        std::optional<Result<std::string>> reply;
        try {
            reply.emplace(co_await agent->run(*lease, context));
        } catch (const std::exception& e) {
            logger()->error("Message {}: agent failed on '{}': {}",
                            context.conversation_id, lease->name(), e.what());
            lease.mark_unhealthy();
            reply.emplace(Result<std::string>::err(
                Error::Code::Unknown, std::string("Agent failed: ") + e.what()));
        }

        if (reply->has_error() &&
            indicates_unhealthy_server(reply->error().code)) {
            logger()->warn("Message {}: server '{}' failed with {}, "
                           "discarding it",
                           context.conversation_id, lease->name(),
                           to_string(reply->error().code));
            lease.mark_unhealthy();
        }

        co_await lease.release();

        if (reply->has_value()) {
            logger()->debug("Message {} processed", context.conversation_id);
        }
        co_return std::move(*reply);
    }

}  // namespace toolbridge
