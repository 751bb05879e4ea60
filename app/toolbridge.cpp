#include <unistd.h>

#include <utility>  // needed before boost/asio/awaitable.hpp (Boost 1.74 omits it)

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/this_coro.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "toolbridge/agent.hpp"
#include "toolbridge/config.hpp"
#include "toolbridge/console_transport.hpp"
#include "toolbridge/dispatcher.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/logging.hpp"
#include "toolbridge/mcp/http_tool_server.hpp"
#include "toolbridge/pool_registry.hpp"
#include "toolbridge/shutdown_signals.hpp"

using namespace toolbridge;

namespace {

    BridgeConfiguration load(int argc, char** argv) {
        BridgeConfiguration cfg;
        if (argc > 1) {
            cfg = load_configuration(argv[1]);
        } else if (const char* path = std::getenv("TOOLBRIDGE_CONFIG");
                   path && *path) {
            cfg = load_configuration(path);
        } else {
            cfg = default_configuration();
        }
        apply_environment_overrides(cfg);
        validate(cfg);
        return cfg;
    }

    boost::asio::awaitable<void> run_bridge(boost::asio::io_context& io,
                                            PoolRegistry& registry,
                                            AgentDispatcher& dispatcher,
                                            int& exit_code) {
        auto ex = co_await boost::asio::this_coro::executor;

        try {
            co_await registry.initialize_all();
        } catch (const PoolError& e) {
            logger()->critical("Startup failed: {}", e.what());
            exit_code = 1;
            co_return;
        }

        ConsoleTransport console(ex, dispatcher, std::cout, STDIN_FILENO);

        ShutdownSignals signals(io, [&console, &registry] {
            console.stop();
            registry.cancel_waiters();
        });

        co_await console.run();

        // Stays armed until the pools are down.
        co_await registry.shutdown_all();
        signals.cancel();
    }

}  // namespace

int main(int argc, char** argv) {
    BridgeConfiguration cfg;
    try {
        cfg = load(argc, argv);
        configure_logging(cfg.logging);
    } catch (const ConfigurationError& e) {
        std::cerr << "toolbridge: " << e.what() << std::endl;
        return 1;
    }

    try {
        boost::asio::io_context io;
        PoolRegistry registry;

        DispatcherConfiguration dispatch_cfg;
        dispatch_cfg.default_pool = cfg.default_pool;

        for (const auto& pc : cfg.pools) {
            auto pool = std::make_shared<ToolServerPool>(
                io.get_executor(), pc.name, pc.capacity,
                make_http_tool_server_factory(io.get_executor(), pc.server));
            registry.add(std::move(pool));
            dispatch_cfg.pool_acquire_timeouts[pc.name] = pc.acquire_timeout;
        }

        AgentDispatcher dispatcher(registry, dispatch_cfg);
        for (const auto& pc : cfg.pools) {
            dispatcher.register_agent(
                pc.name, std::make_shared<CommandAgent>(pc.default_tool,
                                                        pc.default_argument));
        }

        logger()->info("Starting toolbridge with {} pools: default '{}'",
                       registry.size(), cfg.default_pool);

        int exit_code = 0;
        bool finished = false;
        boost::asio::co_spawn(
            io, run_bridge(io, registry, dispatcher, exit_code),
            [&finished](std::exception_ptr p) {
                finished = true;
                if (p) std::rethrow_exception(p);
            });
        io.run();

        if (!finished) {
            logger()->warn("Stopped before the pools were shut down");
            exit_code = 1;
        }

        logger()->info("toolbridge stopped");
        return exit_code;
    } catch (const std::exception& e) {
        logger()->critical("Fatal error: {}", e.what());
        return 1;
    }
}
