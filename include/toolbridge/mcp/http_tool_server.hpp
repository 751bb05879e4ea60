#pragma once

#include <utility>  // needed before boost/asio/awaitable.hpp (Boost 1.74 omits it)

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "toolbridge/config.hpp"
#include "toolbridge/server.hpp"
#include "toolbridge/tool_server.hpp"
#include "toolbridge/transport/http_channel.hpp"

namespace toolbridge {

    /**
     * @brief MCP client session over the streamable HTTP transport.
     *
     * One instance owns one keep-alive connection and one MCP session.
     * Calls must not overlap; the pool guarantees exclusive use.
     */
    class HttpToolServer : public ToolServer {
       public:
        /**
         * @brief Open a session: `initialize` followed by the
         * `notifications/initialized` notification.
         * @throws ToolServerError on an invalid URL, transport failure,
         * non-2xx status or JSON-RPC error.
         */
        static boost::asio::awaitable<std::shared_ptr<HttpToolServer>> connect(
            boost::asio::any_io_executor ex,
            std::shared_ptr<boost::asio::ssl::context> tls,
            ToolServerConfiguration cfg, std::string name);

        HttpToolServer(const HttpToolServer&) = delete;
        HttpToolServer& operator=(const HttpToolServer&) = delete;

        std::string name() const override { return m_name; }

        /// @brief End the session (DELETE) and close the connection.
        /// Idempotent.
        /// @throws ToolServerError if the DELETE cannot be sent.
        boost::asio::awaitable<void> dispose() override;

        /// @brief All tools, following `nextCursor` pages.
        boost::asio::awaitable<Result<std::vector<ToolDescriptor>>> list_tools()
            override;

        boost::asio::awaitable<Result<ToolCallResult>> call_tool(
            const std::string& name, nlohmann::json arguments) override;

        /// @brief Session id assigned by the server, if it uses sessions.
        const std::optional<std::string>& session_id() const noexcept {
            return m_session_id;
        }

        /// @brief Protocol revision the server answered with.
        const std::string& protocol_version() const noexcept {
            return m_protocol_version;
        }

        /// @brief `serverInfo` from the initialize result.
        const nlohmann::json& server_info() const noexcept {
            return m_server_info;
        }

        bool disposed() const noexcept { return m_disposed; }

       private:
        HttpToolServer(boost::asio::any_io_executor ex,
                       std::shared_ptr<boost::asio::ssl::context> tls,
                       UrlComponents url, ToolServerConfiguration cfg,
                       std::string name);

        /// @brief Send a request and return its `result` member.
        boost::asio::awaitable<Result<nlohmann::json>> rpc(
            const std::string& method, nlohmann::json params);

        boost::asio::awaitable<Result<void>> notify(const std::string& method,
                                                    nlohmann::json params);

        std::map<std::string, std::string> request_headers(
            bool with_body) const;

        std::shared_ptr<boost::asio::ssl::context> m_tls;  ///< Kept alive
        ToolServerConfiguration m_cfg;
        std::string m_name;
        HttpChannel m_channel;

        std::int64_t m_next_id{1};
        std::optional<std::string> m_session_id;
        std::string m_protocol_version;
        nlohmann::json m_server_info = nlohmann::json::object();
        bool m_disposed{false};
    };

    /**
     * @brief Factory for a ToolServerPool: every call connects a new
     * HttpToolServer to cfg.url.
     *
     * Servers share one TLS context and are named `<server_name>#<n>`.
     * @throws ConfigurationError if cfg.url is malformed.
     */
    ServerFactory<ToolServer> make_http_tool_server_factory(
        boost::asio::any_io_executor ex, ToolServerConfiguration cfg);

}  // namespace toolbridge
