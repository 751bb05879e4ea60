#include <gtest/gtest.h>
#include <httplib.h>

#include <algorithm>
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

#include "test_support.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/mcp/http_tool_server.hpp"

using namespace toolbridge;
using namespace toolbridge::test;
using nlohmann::json;

namespace {

    // ---------------------
    // In-process MCP endpoint
    // ---------------------
    struct McpTestServer {
        McpTestServer() {
            svr_.set_keep_alive_max_count(100);
            svr_.set_keep_alive_timeout(5);

            svr_.Post("/mcp", [this](const httplib::Request& req,
                                     httplib::Response& res) {
                handle_post(req, res);
            });
            svr_.Delete("/mcp", [this](const httplib::Request& req,
                                       httplib::Response& res) {
                std::lock_guard lk(mu_);
                deletes++;
                delete_session = req.get_header_value("Mcp-Session-Id");
                res.status = delete_status;
            });

            port_ = svr_.bind_to_any_port("127.0.0.1");
            thread_ = std::thread([this] { svr_.listen_after_bind(); });
        }

        ~McpTestServer() {
            svr_.stop();
            if (thread_.joinable()) thread_.join();
        }

        std::string url(const std::string& path = "/mcp") const {
            return "http://127.0.0.1:" + std::to_string(port_) + path;
        }

        std::vector<std::string> methods_seen() {
            std::lock_guard lk(mu_);
            return methods;
        }

        std::vector<std::string> sessions_seen() {
            std::lock_guard lk(mu_);
            return sessions;
        }

        std::mutex mu_;
        std::vector<std::string> methods;
        std::vector<std::string> sessions;  ///< Mcp-Session-Id per POST
        int deletes{0};
        int delete_status{200};
        std::string delete_session;
        int notify_status{202};     ///< Answer to notifications
        bool repeat_cursor{false};  ///< Last tools/list page loops back

       private:
        static void reply(httplib::Response& res, const json& id,
                          json result) {
            json msg = {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
            res.set_content(msg.dump(), "application/json");
        }

        void handle_post(const httplib::Request& req, httplib::Response& res) {
            auto msg = json::parse(req.body, nullptr, false);
            if (msg.is_discarded() || !msg.is_object()) {
                res.status = 400;
                return;
            }
            const std::string method = msg.value("method", "");
            const std::string session = req.get_header_value("Mcp-Session-Id");
            {
                std::lock_guard lk(mu_);
                methods.push_back(method);
                sessions.push_back(session);
            }

            if (!msg.contains("id")) {
                std::lock_guard lk(mu_);
                res.status = notify_status;
                return;
            }
            const json id = msg["id"];

            if (method == "initialize") {
                res.set_header("Mcp-Session-Id", "sess-42");
                reply(res, id,
                      {{"protocolVersion", "2025-03-26"},
                       {"capabilities", {{"tools", json::object()}}},
                       {"serverInfo", {{"name", "test-mcp"}, {"version", "0.1"}}}});
                return;
            }

            if (session != "sess-42") {
                res.status = 400;
                res.set_content("missing session", "text/plain");
                return;
            }

            const json params = msg.value("params", json::object());
            if (method == "tools/list") {
                if (params.value("cursor", "") == "page-2") {
                    json page = {{"tools",
                                  {{{"name", "fail"},
                                    {"description", "Always fails"}}}}};
                    {
                        std::lock_guard lk(mu_);
                        if (repeat_cursor) page["nextCursor"] = "page-2";
                    }
                    reply(res, id, std::move(page));
                } else {
                    reply(res, id,
                          {{"tools",
                            {{{"name", "echo"},
                              {"description", "Echo arguments"},
                              {"inputSchema", {{"type", "object"}}}}}},
                           {"nextCursor", "page-2"}});
                }
                return;
            }

            if (method == "tools/call") {
                const std::string tool = params.value("name", "");
                const json args = params.value("arguments", json::object());
                if (tool == "echo") {
                    // Streamed answer: a progress notification, then the
                    // response.
                    json note = {{"jsonrpc", "2.0"},
                                 {"method", "notifications/progress"},
                                 {"params", {{"progress", 1}}}};
                    json done = {
                        {"jsonrpc", "2.0"},
                        {"id", id},
                        {"result",
                         {{"content",
                           {{{"type", "text"}, {"text", args.dump()}}}}}}};
                    res.set_content("event: message\ndata: " + note.dump() +
                                        "\n\nevent: message\ndata: " +
                                        done.dump() + "\n\n",
                                    "text/event-stream");
                    return;
                }
                if (tool == "fail") {
                    reply(res, id,
                          {{"content",
                            {{{"type", "text"}, {"text", "disk full"}}}},
                           {"isError", true}});
                    return;
                }
                json err = {{"jsonrpc", "2.0"},
                            {"id", id},
                            {"error",
                             {{"code", -32602},
                              {"message", "Unknown tool: " + tool}}}};
                res.set_content(err.dump(), "application/json");
                return;
            }

            res.status = 404;
        }

        httplib::Server svr_;
        std::thread thread_;
        int port_{0};
    };

    struct HttpToolServerFixture {
        boost::asio::io_context io;
        McpTestServer mcp;

        ToolServerConfiguration config(const std::string& path = "/mcp") {
            ToolServerConfiguration cfg;
            cfg.url = mcp.url(path);
            cfg.server_name = "test";
            cfg.request_timeout = std::chrono::milliseconds(5000);
            return cfg;
        }

        std::shared_ptr<HttpToolServer> connect() {
            return run_sync(io, HttpToolServer::connect(io.get_executor(),
                                                        nullptr, config(),
                                                        "test#1"));
        }
    };

    /// Port that nothing listens on.
    std::uint16_t closed_port(boost::asio::io_context& io) {
        boost::asio::ip::tcp::acceptor acceptor(
            io, {boost::asio::ip::make_address("127.0.0.1"), 0});
        return acceptor.local_endpoint().port();
    }

    TEST(HttpToolServerTest, ConnectOpensSession) {
        HttpToolServerFixture f;
        auto server = f.connect();

        ASSERT_NE(server, nullptr);
        EXPECT_EQ(server->name(), "test#1");
        ASSERT_TRUE(server->session_id().has_value());
        EXPECT_EQ(*server->session_id(), "sess-42");
        EXPECT_EQ(server->protocol_version(), "2025-03-26");
        EXPECT_EQ(server->server_info()["name"], "test-mcp");

        EXPECT_EQ(f.mcp.methods_seen(),
                  (std::vector<std::string>{"initialize",
                                            "notifications/initialized"}));
        EXPECT_EQ(f.mcp.sessions_seen(),
                  (std::vector<std::string>{"", "sess-42"}));

        run_sync(f.io, server->dispose());
    }

    TEST(HttpToolServerTest, ListToolsFollowsCursor) {
        HttpToolServerFixture f;
        auto server = f.connect();

        auto tools = run_sync(f.io, server->list_tools());
        ASSERT_TRUE(tools.has_value()) << tools.error().message;
        ASSERT_EQ(tools.value().size(), 2u);
        EXPECT_EQ(tools.value()[0].name, "echo");
        EXPECT_EQ(tools.value()[0].input_schema["type"], "object");
        EXPECT_EQ(tools.value()[1].name, "fail");
        EXPECT_EQ(tools.value()[1].description, "Always fails");

        run_sync(f.io, server->dispose());
    }

    TEST(HttpToolServerTest, ListToolsStopsOnRepeatedCursor) {
        HttpToolServerFixture f;
        f.mcp.repeat_cursor = true;
        auto server = f.connect();

        auto tools = run_sync(f.io, server->list_tools());
        ASSERT_TRUE(tools.has_error());
        EXPECT_EQ(tools.error().code, Error::Code::ProtocolError);
        EXPECT_NE(tools.error().message.find("page-2"), std::string::npos);

        // The first page, then page-2 pointing back at itself.
        auto methods = f.mcp.methods_seen();
        EXPECT_EQ(std::count(methods.begin(), methods.end(), "tools/list"), 2);

        run_sync(f.io, server->dispose());
    }

    TEST(HttpToolServerTest, CallToolReadsStreamedResponse) {
        HttpToolServerFixture f;
        auto server = f.connect();

        auto r = run_sync(f.io, server->call_tool("echo", json{{"x", 1}}));
        ASSERT_TRUE(r.has_value()) << r.error().message;
        EXPECT_FALSE(r.value().is_error);
        EXPECT_EQ(r.value().text(), R"({"x":1})");

        run_sync(f.io, server->dispose());
    }

    TEST(HttpToolServerTest, ToolFailureIsReportedInResult) {
        HttpToolServerFixture f;
        auto server = f.connect();

        auto r = run_sync(f.io, server->call_tool("fail", json()));
        ASSERT_TRUE(r.has_value());
        EXPECT_TRUE(r.value().is_error);
        EXPECT_EQ(r.value().text(), "disk full");

        run_sync(f.io, server->dispose());
    }

    TEST(HttpToolServerTest, JsonRpcErrorKeepsSessionUsable) {
        HttpToolServerFixture f;
        auto server = f.connect();

        auto r = run_sync(f.io, server->call_tool("nope", json::object()));
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::RpcError);
        EXPECT_FALSE(indicates_unhealthy_server(r.error().code));
        EXPECT_NE(r.error().message.find("Unknown tool: nope"),
                  std::string::npos);

        // The session is still usable.
        auto again = run_sync(f.io, server->call_tool("echo", json::object()));
        EXPECT_TRUE(again.has_value());

        run_sync(f.io, server->dispose());
    }

    TEST(HttpToolServerTest, DisposeEndsSessionOnce) {
        HttpToolServerFixture f;
        auto server = f.connect();

        run_sync(f.io, server->dispose());
        EXPECT_TRUE(server->disposed());
        {
            std::lock_guard lk(f.mcp.mu_);
            EXPECT_EQ(f.mcp.deletes, 1);
            EXPECT_EQ(f.mcp.delete_session, "sess-42");
        }

        run_sync(f.io, server->dispose());
        {
            std::lock_guard lk(f.mcp.mu_);
            EXPECT_EQ(f.mcp.deletes, 1);
        }

        auto r = run_sync(f.io, server->list_tools());
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::InvalidState);
    }

    TEST(HttpToolServerTest, DisposeAcceptsMethodNotAllowed) {
        HttpToolServerFixture f;
        f.mcp.delete_status = 405;
        auto server = f.connect();

        EXPECT_NO_THROW(run_sync(f.io, server->dispose()));
        EXPECT_TRUE(server->disposed());
    }

    TEST(HttpToolServerTest, ConnectFailsOnHttpError) {
        HttpToolServerFixture f;
        try {
            run_sync(f.io,
                     HttpToolServer::connect(f.io.get_executor(), nullptr,
                                             f.config("/not-mcp"), "bad#1"));
            FAIL() << "connect() should have thrown";
        } catch (const ToolServerError& e) {
            EXPECT_EQ(e.error().code, Error::Code::ProtocolError);
            EXPECT_NE(e.error().message.find("404"), std::string::npos);
        }
    }

    TEST(HttpToolServerTest, FailedNotificationEndsSession) {
        HttpToolServerFixture f;
        f.mcp.notify_status = 500;
        try {
            f.connect();
            FAIL() << "connect() should have thrown";
        } catch (const ToolServerError& e) {
            EXPECT_EQ(e.error().code, Error::Code::ProtocolError);
            EXPECT_NE(e.error().message.find("500"), std::string::npos);
        }

        std::lock_guard lk(f.mcp.mu_);
        EXPECT_EQ(f.mcp.deletes, 1);
        EXPECT_EQ(f.mcp.delete_session, "sess-42");
    }

    TEST(HttpToolServerTest, ConnectFailsWhenNothingListens) {
        boost::asio::io_context io;
        ToolServerConfiguration cfg;
        cfg.url = "http://127.0.0.1:" + std::to_string(closed_port(io)) + "/mcp";
        cfg.request_timeout = std::chrono::milliseconds(2000);

        try {
            run_sync(io, HttpToolServer::connect(io.get_executor(), nullptr,
                                                 cfg, "down#1"));
            FAIL() << "connect() should have thrown";
        } catch (const ToolServerError& e) {
            EXPECT_EQ(e.error().code, Error::Code::ConnectionFailed);
            EXPECT_TRUE(indicates_unhealthy_server(e.error().code));
        }
    }

    TEST(HttpToolServerTest, InvalidUrlIsRejected) {
        boost::asio::io_context io;
        ToolServerConfiguration cfg;
        cfg.url = "localhost:8000/mcp";

        try {
            run_sync(io, HttpToolServer::connect(io.get_executor(), nullptr,
                                                 cfg, "bad#1"));
            FAIL() << "connect() should have thrown";
        } catch (const ToolServerError& e) {
            EXPECT_EQ(e.error().code, Error::Code::InvalidUrl);
        }

        EXPECT_THROW(make_http_tool_server_factory(io.get_executor(), cfg),
                     ConfigurationError);
    }

    TEST(HttpToolServerTest, FactoryNumbersServers) {
        HttpToolServerFixture f;
        auto factory =
            make_http_tool_server_factory(f.io.get_executor(), f.config());

        auto first = run_sync(f.io, factory());
        auto second = run_sync(f.io, factory());
        EXPECT_EQ(first->name(), "test#1");
        EXPECT_EQ(second->name(), "test#2");

        run_sync(f.io, first->dispose());
        run_sync(f.io, second->dispose());
    }

    TEST(HttpToolServerTest, PoolOfHttpServers) {
        HttpToolServerFixture f;
        auto pool = std::make_shared<ToolServerPool>(
            f.io.get_executor(), "code_analysis", 2,
            make_http_tool_server_factory(f.io.get_executor(), f.config()));

        run_sync(f.io, pool->initialize());
        EXPECT_EQ(pool->available_count(), 2u);

        auto lease = run_sync(f.io, pool->lease(std::chrono::seconds(1)));
        ASSERT_TRUE(lease.has_value());
        auto r = run_sync(f.io, lease.value()->call_tool("echo", json{{"q", 1}}));
        ASSERT_TRUE(r.has_value());
        EXPECT_EQ(r.value().text(), R"({"q":1})");
        run_sync(f.io, lease.value().release());

        run_sync(f.io, pool->shutdown());
        std::lock_guard lk(f.mcp.mu_);
        EXPECT_EQ(f.mcp.deletes, 2);
    }

}  // namespace
