#include "toolbridge/mcp/http_tool_server.hpp"

#include <atomic>
#include <boost/beast/http/verb.hpp>
#include <cstddef>
#include <set>
#include <utility>

#include "toolbridge/error.hpp"
#include "toolbridge/logging.hpp"
#include "toolbridge/mcp/json_rpc.hpp"
#include "toolbridge/transport/tls.hpp"

namespace toolbridge {

    namespace http = boost::beast::http;
    using nlohmann::json;

    namespace {

        constexpr std::size_t kMaxToolPages = 1000;

        /// Ends the session a failed handshake may have opened.
        boost::asio::awaitable<void> abandon(HttpToolServer& server) {
            try {
                co_await server.dispose();
            } catch (const ToolServerError& e) {
                logger()->warn("MCP server '{}': {}", server.name(), e.what());
            }
        }

        boost::asio::awaitable<std::shared_ptr<ToolServer>> connect_numbered(
            boost::asio::any_io_executor ex,
            std::shared_ptr<boost::asio::ssl::context> tls,
            ToolServerConfiguration cfg, std::size_t n) {
            auto name = cfg.server_name + "#" + std::to_string(n);
            co_return co_await HttpToolServer::connect(
                std::move(ex), std::move(tls), std::move(cfg), std::move(name));
        }

    }  // namespace

    HttpToolServer::HttpToolServer(
        boost::asio::any_io_executor ex,
        std::shared_ptr<boost::asio::ssl::context> tls, UrlComponents url,
        ToolServerConfiguration cfg, std::string name)
        : m_tls(tls),
          m_cfg(std::move(cfg)),
          m_name(std::move(name)),
          m_channel(std::move(ex), std::move(tls), std::move(url),
                    m_cfg.request_timeout) {}

    boost::asio::awaitable<std::shared_ptr<HttpToolServer>>
    HttpToolServer::connect(boost::asio::any_io_executor ex,
                            std::shared_ptr<boost::asio::ssl::context> tls,
                            ToolServerConfiguration cfg, std::string name) {
        auto url = parse_url(cfg.url);
        if (url.has_error()) throw ToolServerError(std::move(url).error());

        std::shared_ptr<HttpToolServer> server(
            new HttpToolServer(std::move(ex), std::move(tls),
                               std::move(url).value(), std::move(cfg),
                               std::move(name)));

        logger()->debug("MCP server '{}': connecting to {}", server->m_name,
                        server->m_cfg.url);

        auto init = co_await server->rpc("initialize", mcp::initialize_params());
        if (init.has_error()) {
            co_await abandon(*server);
            auto e = std::move(init).error();
            e.message = "initialize failed for " + server->m_cfg.url + ": " +
                        e.message;
            throw ToolServerError(std::move(e));
        }

        const auto& result = init.value();
        if (auto v = result.find("protocolVersion");
            v != result.end() && v->is_string())
            server->m_protocol_version = v->get<std::string>();
        if (auto info = result.find("serverInfo");
            info != result.end() && info->is_object())
            server->m_server_info = *info;

        auto ack = co_await server->notify("notifications/initialized", json());
        if (ack.has_error()) {
            co_await abandon(*server);
            auto e = std::move(ack).error();
            e.message = "initialized notification failed for " +
                        server->m_cfg.url + ": " + e.message;
            throw ToolServerError(std::move(e));
        }

        logger()->info("MCP server '{}': connected to {} (protocol {}, "
                       "session {})",
                       server->m_name, server->m_cfg.url,
                       server->m_protocol_version.empty()
                           ? std::string("unknown")
                           : server->m_protocol_version,
                       server->m_session_id.value_or("none"));
        co_return server;
    }

    std::map<std::string, std::string> HttpToolServer::request_headers(
        bool with_body) const {
        std::map<std::string, std::string> h = m_cfg.headers;
        h["Accept"] = "application/json, text/event-stream";
        h["User-Agent"] = m_cfg.user_agent;
        if (with_body) h["Content-Type"] = "application/json";
        if (m_session_id) h[mcp::kSessionHeader] = *m_session_id;
        return h;
    }

    boost::asio::awaitable<Result<json>> HttpToolServer::rpc(
        const std::string& method, json params) {
        if (m_disposed) {
            co_return Result<json>::err(
                Error::Code::InvalidState,
                "MCP server '" + m_name + "' is disposed");
        }

        const std::int64_t id = m_next_id++;
        auto body = mcp::make_request(id, method, std::move(params)).dump();
        logger()->trace("MCP server '{}': -> {}", m_name, body);

        auto res = co_await m_channel.send(http::verb::post,
                                           request_headers(true),
                                           std::move(body));
        if (res.has_error()) co_return Result<json>::err(std::move(res).error());

        const auto& response = res.value();
        if (auto sid = response.header(mcp::kSessionHeader)) {
            m_session_id = *sid;
        }

        if (!response.ok()) {
            std::string msg = "HTTP " + std::to_string(response.status_code) +
                              " for " + method;
            if (response.status_code == 404 && m_session_id) {
                msg += " (session expired)";
            }
            co_return Result<json>::err(Error::Code::ProtocolError,
                                        std::move(msg));
        }

        const std::string* ct = response.header("Content-Type");
        logger()->trace("MCP server '{}': <- {}", m_name, response.body);
        co_return mcp::parse_response(ct ? *ct : std::string(), response.body,
                                      id);
    }

    boost::asio::awaitable<Result<void>> HttpToolServer::notify(
        const std::string& method, json params) {
        auto body = mcp::make_notification(method, std::move(params)).dump();
        auto res = co_await m_channel.send(http::verb::post,
                                           request_headers(true),
                                           std::move(body));
        if (res.has_error()) co_return Result<void>::err(std::move(res).error());
        if (!res.value().ok()) {
            co_return Result<void>::err(
                Error::Code::ProtocolError,
                "HTTP " + std::to_string(res.value().status_code) + " for " +
                    method);
        }
        co_return Result<void>::ok();
    }

    boost::asio::awaitable<Result<std::vector<ToolDescriptor>>>
    HttpToolServer::list_tools() {
        using R = Result<std::vector<ToolDescriptor>>;
        std::vector<ToolDescriptor> tools;
        std::string cursor;
        std::set<std::string> seen;

        do {
            json params = json::object();
            if (!cursor.empty()) params["cursor"] = cursor;

            auto page = co_await rpc("tools/list", std::move(params));
            if (page.has_error()) co_return R::err(std::move(page).error());

            auto decoded = mcp::parse_tool_list(page.value(), cursor);
            if (decoded.has_error()) co_return R::err(std::move(decoded).error());

            for (auto& t : decoded.value()) tools.push_back(std::move(t));

            if (cursor.empty()) continue;
            if (!seen.insert(cursor).second || seen.size() >= kMaxToolPages) {
                co_return R::err(Error::Code::ProtocolError,
                                 "tools/list from '" + m_name +
                                     "' does not end: cursor '" + cursor +
                                     "' after " + std::to_string(seen.size()) +
                                     " pages");
            }
        } while (!cursor.empty());

        logger()->debug("MCP server '{}': {} tools listed", m_name,
                        tools.size());
        co_return R::ok(std::move(tools));
    }

    boost::asio::awaitable<Result<ToolCallResult>> HttpToolServer::call_tool(
        const std::string& name, json arguments) {
        if (arguments.is_null()) arguments = json::object();

        logger()->debug("MCP server '{}': calling tool '{}'", m_name, name);
        // Built outside the co_await: GCC 12 rejects a braced
        // initializer_list temporary inside a co_await expression.
        json params{{"name", name}, {"arguments", std::move(arguments)}};
        auto res = co_await rpc("tools/call", std::move(params));
        if (res.has_error()) {
            co_return Result<ToolCallResult>::err(std::move(res).error());
        }
        co_return mcp::parse_tool_call(res.value());
    }

    boost::asio::awaitable<void> HttpToolServer::dispose() {
        if (m_disposed) co_return;
        m_disposed = true;

        if (!m_session_id) {
            m_channel.close();
            co_return;
        }

        auto res = co_await m_channel.send(http::verb::delete_,
                                           request_headers(false), {});
        m_channel.close();

        if (res.has_error()) {
            auto e = std::move(res).error();
            e.message = "session termination failed: " + e.message;
            throw ToolServerError(std::move(e));
        }

        // 405: the server does not let clients end sessions.
        const int status = res.value().status_code;
        if (!res.value().ok() && status != 405 && status != 404) {
            logger()->warn("MCP server '{}': DELETE of session {} returned "
                           "HTTP {}",
                           m_name, *m_session_id, status);
        }
        logger()->debug("MCP server '{}': session {} closed", m_name,
                        *m_session_id);
    }

    ServerFactory<ToolServer> make_http_tool_server_factory(
        boost::asio::any_io_executor ex, ToolServerConfiguration cfg) {
        auto url = parse_url(cfg.url);
        if (url.has_error()) throw ConfigurationError(url.error().message);

        std::shared_ptr<boost::asio::ssl::context> tls;
        if (url.value().https) {
            try {
                tls = make_tls_context(cfg.verify_tls);
            } catch (const std::exception& e) {
                throw ConfigurationError(e.what());
            }
        }

        auto counter = std::make_shared<std::atomic<std::size_t>>(0);
        return [ex = std::move(ex), tls = std::move(tls), cfg = std::move(cfg),
                counter]() {
            return connect_numbered(ex, tls, cfg, ++*counter);
        };
    }

}  // namespace toolbridge
