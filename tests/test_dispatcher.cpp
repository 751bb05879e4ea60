#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "fake_tool_server.hpp"
#include "toolbridge/agent.hpp"
#include "toolbridge/dispatcher.hpp"
#include "toolbridge/error.hpp"

using namespace toolbridge;
using namespace toolbridge::test;
using namespace std::chrono_literals;

namespace {

    /// Agent whose outcome is chosen by the test.
    class ScriptedAgent : public Agent {
       public:
        enum class Mode { Echo, Fail, Throw };

        boost::asio::awaitable<Result<std::string>> run(
            ToolServer& server, const MessageContext& context) override {
            seen.push_back(server.name());
            switch (mode) {
                case Mode::Fail:
                    co_return Result<std::string>::err(fail_code,
                                                       "scripted failure");
                case Mode::Throw:
                    throw std::runtime_error("agent exploded");
                case Mode::Echo:
                    break;
            }
            co_return Result<std::string>::ok(server.name() + ": " +
                                              context.content);
        }

        Mode mode{Mode::Echo};
        Error::Code fail_code{Error::Code::ToolError};
        std::vector<std::string> seen;
    };

    struct DispatcherFixture {
        boost::asio::io_context io;
        std::shared_ptr<DisposeLog> log = std::make_shared<DisposeLog>();
        PoolRegistry registry;
        std::shared_ptr<ScriptedAgent> stdio_agent =
            std::make_shared<ScriptedAgent>();
        std::shared_ptr<ScriptedAgent> code_agent =
            std::make_shared<ScriptedAgent>();
        std::map<std::string, std::shared_ptr<ToolFactoryScript>> scripts;

        DispatcherFixture() {
            registry.add(make_pool("stdio", 1));
            registry.add(make_pool("code_analysis", 2));
            run_sync(io, registry.initialize_all());
        }

        ~DispatcherFixture() { run_sync(io, registry.shutdown_all()); }

        std::shared_ptr<ToolServerPool> make_pool(const std::string& name,
                                                  std::size_t capacity) {
            auto script = std::make_shared<ToolFactoryScript>();
            script->prefix = name;
            script->log = log;
            scripts[name] = script;
            return std::make_shared<ToolServerPool>(
                io.get_executor(), name, capacity,
                make_fake_tool_factory(script));
        }

        std::unique_ptr<AgentDispatcher> make_dispatcher(
            std::chrono::milliseconds timeout = 1000ms) {
            DispatcherConfiguration cfg;
            cfg.default_pool = "stdio";
            cfg.acquire_timeout = timeout;
            auto d = std::make_unique<AgentDispatcher>(registry, cfg);
            d->register_agent("stdio", stdio_agent);
            d->register_agent("code_analysis", code_agent);
            return d;
        }

        Result<std::string> send(AgentDispatcher& d, std::string content,
                                 std::string pool_key = {}) {
            MessageContext ctx{"conv-1", "alice", std::move(content),
                               std::move(pool_key)};
            return run_sync(io, d.process_message(std::move(ctx)));
        }
    };

    TEST(AgentDispatcherTest, EmptyPoolKeyUsesDefaultPool) {
        DispatcherFixture f;
        auto d = f.make_dispatcher();

        auto r = f.send(*d, "hello");
        ASSERT_TRUE(r.has_value()) << r.error().message;
        EXPECT_EQ(r.value(), "stdio-1: hello");
        EXPECT_EQ(f.stdio_agent->seen.size(), 1u);
        EXPECT_TRUE(f.code_agent->seen.empty());
        EXPECT_EQ(f.registry.find("stdio")->available_count(), 1u);
        EXPECT_EQ(d->in_flight(), 0u);
    }

    TEST(AgentDispatcherTest, PoolKeySelectsPool) {
        DispatcherFixture f;
        auto d = f.make_dispatcher();

        auto r = f.send(*d, "analyse", "code_analysis");
        ASSERT_TRUE(r.has_value());
        EXPECT_EQ(r.value(), "code_analysis-1: analyse");
        EXPECT_EQ(f.code_agent->seen.size(), 1u);
        EXPECT_EQ(f.registry.find("code_analysis")->available_count(), 2u);
    }

    TEST(AgentDispatcherTest, UnknownPoolIsPoolNotFound) {
        DispatcherFixture f;
        auto d = f.make_dispatcher();

        auto r = f.send(*d, "hi", "nope");
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::PoolNotFound);
        EXPECT_NE(r.error().message.find("nope"), std::string::npos);
        EXPECT_TRUE(is_fatal(r.error().code));
    }

    TEST(AgentDispatcherTest, PoolWithoutAgentIsPoolNotFound) {
        DispatcherFixture f;
        DispatcherConfiguration cfg;
        AgentDispatcher d(f.registry, cfg);
        d.register_agent("stdio", f.stdio_agent);

        auto r = f.send(d, "hi", "code_analysis");
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::PoolNotFound);
    }

    TEST(AgentDispatcherTest, RegisterAgentValidatesArguments) {
        DispatcherFixture f;
        AgentDispatcher d(f.registry, DispatcherConfiguration{});
        EXPECT_THROW(d.register_agent("stdio", nullptr), ConfigurationError);
        EXPECT_THROW(d.register_agent("missing", f.stdio_agent),
                     ConfigurationError);
    }

    TEST(AgentDispatcherTest, ToolErrorKeepsServer) {
        DispatcherFixture f;
        f.stdio_agent->mode = ScriptedAgent::Mode::Fail;
        f.stdio_agent->fail_code = Error::Code::ToolError;
        auto d = f.make_dispatcher();

        auto r = f.send(*d, "x");
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::ToolError);
        EXPECT_EQ(f.registry.find("stdio")->tracked_count(), 1u);
        EXPECT_EQ(f.registry.find("stdio")->available_count(), 1u);
        EXPECT_EQ(f.log->total(), 0);
    }

    TEST(AgentDispatcherTest, RpcErrorFromServerKeepsServer) {
        DispatcherFixture f;
        auto d = f.make_dispatcher();
        d->register_agent("stdio", std::make_shared<CommandAgent>("search"));

        auto& created = f.scripts["stdio"]->created;
        ASSERT_EQ(created.size(), 1u);
        created[0]->failure =
            Error{Error::Code::RpcError, "JSON-RPC error -32602: Unknown tool"};

        auto r = f.send(*d, "/call nope");
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::RpcError);
        EXPECT_EQ(f.registry.find("stdio")->tracked_count(), 1u);
        EXPECT_EQ(f.registry.find("stdio")->available_count(), 1u);
        EXPECT_EQ(f.log->total(), 0);

        // The same server answers the next message.
        created[0]->failure.reset();
        auto ok = f.send(*d, "/call echo");
        ASSERT_TRUE(ok.has_value()) << ok.error().message;
        EXPECT_EQ(created.size(), 1u);
        EXPECT_EQ(created[0]->calls.size(), 2u);
    }

    TEST(AgentDispatcherTest, NetworkErrorDiscardsServer) {
        DispatcherFixture f;
        f.code_agent->mode = ScriptedAgent::Mode::Fail;
        f.code_agent->fail_code = Error::Code::NetworkError;
        auto d = f.make_dispatcher();

        auto r = f.send(*d, "x", "code_analysis");
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::NetworkError);

        auto pool = f.registry.find("code_analysis");
        EXPECT_EQ(pool->tracked_count(), 1u);
        EXPECT_EQ(f.log->count("code_analysis-1"), 1);

        // The remaining server still serves messages.
        f.code_agent->mode = ScriptedAgent::Mode::Echo;
        auto ok = f.send(*d, "again", "code_analysis");
        ASSERT_TRUE(ok.has_value());
        EXPECT_EQ(ok.value(), "code_analysis-2: again");
    }

    TEST(AgentDispatcherTest, AgentExceptionDiscardsServerAndReportsError) {
        DispatcherFixture f;
        f.stdio_agent->mode = ScriptedAgent::Mode::Throw;
        auto d = f.make_dispatcher();

        auto r = f.send(*d, "boom");
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::Unknown);
        EXPECT_NE(r.error().message.find("agent exploded"), std::string::npos);
        EXPECT_EQ(f.registry.find("stdio")->tracked_count(), 0u);
        EXPECT_EQ(f.log->count("stdio-1"), 1);
        EXPECT_EQ(d->in_flight(), 0u);
    }

    TEST(AgentDispatcherTest, BusyPoolTimesOutWithDescriptiveError) {
        DispatcherFixture f;
        auto d = f.make_dispatcher(20ms);

        auto pool = f.registry.find("stdio");
        auto held = run_sync(f.io, pool->acquire());
        ASSERT_TRUE(held.has_value());

        auto r = f.send(*d, "waiting");
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::Timeout);
        EXPECT_NE(r.error().message.find("stdio"), std::string::npos);
        EXPECT_TRUE(f.stdio_agent->seen.empty());

        run_sync(f.io, pool->release(held.value()));
    }

    TEST(AgentDispatcherTest, PerPoolTimeoutOverridesDefault) {
        DispatcherFixture f;
        DispatcherConfiguration cfg;
        cfg.acquire_timeout = 60s;
        cfg.pool_acquire_timeouts["stdio"] = 10ms;
        AgentDispatcher d(f.registry, cfg);
        d.register_agent("stdio", f.stdio_agent);

        auto pool = f.registry.find("stdio");
        auto held = run_sync(f.io, pool->acquire());
        ASSERT_TRUE(held.has_value());

        auto r = f.send(d, "waiting");
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::Timeout);

        run_sync(f.io, pool->release(held.value()));
    }

    TEST(AgentDispatcherTest, ShutDownPoolReportsShutdown) {
        DispatcherFixture f;
        auto d = f.make_dispatcher();
        run_sync(f.io, f.registry.find("stdio")->shutdown());

        auto r = f.send(*d, "late");
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::Shutdown);
    }

    TEST(AgentDispatcherTest, ConcurrentMessagesShareTheSinglePoolServer) {
        DispatcherFixture f;
        auto d = f.make_dispatcher();

        std::vector<std::string> replies;
        for (int i = 0; i < 4; ++i) {
            spawn(f.io, [&, i]() -> boost::asio::awaitable<void> {
                MessageContext ctx{"conv-" + std::to_string(i), "bob",
                                   "m" + std::to_string(i), ""};
                auto r = co_await d->process_message(std::move(ctx));
                if (r) replies.push_back(r.value());
            });
        }
        f.io.restart();
        f.io.run();

        EXPECT_EQ(replies, (std::vector<std::string>{"stdio-1: m0", "stdio-1: m1",
                                                     "stdio-1: m2",
                                                     "stdio-1: m3"}));
        EXPECT_EQ(d->in_flight(), 0u);
        EXPECT_EQ(f.registry.find("stdio")->available_count(), 1u);
    }

}  // namespace
