#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

#include "toolbridge/config.hpp"
#include "toolbridge/error.hpp"

using namespace toolbridge;
using namespace std::chrono_literals;

namespace {

    /// Sets an environment variable for the lifetime of the object.
    class ScopedEnv {
       public:
        ScopedEnv(const char* name, const char* value) : m_name(name) {
            ::setenv(name, value, 1);
        }
        ~ScopedEnv() { ::unsetenv(m_name); }

       private:
        const char* m_name;
    };

    const char* kTwoPools = R"({
        "default_pool": "code_analysis",
        "pools": [
            {"name": "stdio"},
            {
                "name": "code_analysis",
                "capacity": 3,
                "acquire_timeout_ms": 5000,
                "default_tool": "analyze",
                "default_argument": "code",
                "server": {
                    "url": "https://tools.internal:9443/mcp",
                    "server_name": "analyzer",
                    "request_timeout_ms": 120000,
                    "headers": {"Authorization": "Bearer abc"},
                    "verify_tls": false
                }
            }
        ],
        "logging": {"level": "debug", "directory": "", "file_level": "trace"}
    })";

    TEST(ConfigTest, DefaultConfigurationHasOneStdioPool) {
        auto cfg = default_configuration();
        ASSERT_EQ(cfg.pools.size(), 1u);
        EXPECT_EQ(cfg.pools[0].name, "stdio");
        EXPECT_EQ(cfg.pools[0].server.url, "http://127.0.0.1:8000/mcp");
        EXPECT_EQ(cfg.pools[0].capacity, 1u);
        EXPECT_EQ(cfg.default_pool, "stdio");
        EXPECT_NO_THROW(validate(cfg));
    }

    TEST(ConfigTest, ParsesPoolsAndServers) {
        auto cfg = parse_configuration(kTwoPools);
        ASSERT_EQ(cfg.pools.size(), 2u);
        EXPECT_EQ(cfg.default_pool, "code_analysis");

        const auto& stdio = cfg.pools[0];
        EXPECT_EQ(stdio.capacity, 1u);
        EXPECT_EQ(stdio.acquire_timeout, 30000ms);
        EXPECT_EQ(stdio.server.server_name, "stdio");
        EXPECT_EQ(stdio.default_argument, "query");

        const auto& code = cfg.pools[1];
        EXPECT_EQ(code.capacity, 3u);
        EXPECT_EQ(code.acquire_timeout, 5000ms);
        EXPECT_EQ(code.default_tool, "analyze");
        EXPECT_EQ(code.default_argument, "code");
        EXPECT_EQ(code.server.url, "https://tools.internal:9443/mcp");
        EXPECT_EQ(code.server.server_name, "analyzer");
        EXPECT_EQ(code.server.request_timeout, 120000ms);
        EXPECT_EQ(code.server.headers.at("Authorization"), "Bearer abc");
        EXPECT_FALSE(code.server.verify_tls);

        EXPECT_EQ(cfg.logging.level, "debug");
        EXPECT_EQ(cfg.logging.directory, "");
        EXPECT_EQ(cfg.logging.file_level, "trace");
        EXPECT_NO_THROW(validate(cfg));
    }

    TEST(ConfigTest, MalformedDocumentsAreConfigurationErrors) {
        EXPECT_THROW(parse_configuration("{not json"), ConfigurationError);
        EXPECT_THROW(parse_configuration("[]"), ConfigurationError);
        EXPECT_THROW(parse_configuration(R"({"pools": {}})"),
                     ConfigurationError);
        EXPECT_THROW(parse_configuration(R"({"pools": [{"capacity": "two"}]})"),
                     ConfigurationError);
        EXPECT_THROW(
            parse_configuration(R"({"pools": [{"name": "a", "capacity": 0}]})"),
            ConfigurationError);
        EXPECT_THROW(parse_configuration(
                         R"({"pools": [{"name": "a", "acquire_timeout_ms": -1}]})"),
                     ConfigurationError);
    }

    TEST(ConfigTest, LoadConfigurationReadsFile) {
        const std::string path = ::testing::TempDir() + "toolbridge_config.json";
        {
            std::ofstream file(path);
            file << kTwoPools;
        }
        auto cfg = load_configuration(path);
        EXPECT_EQ(cfg.pools.size(), 2u);
        std::remove(path.c_str());

        EXPECT_THROW(load_configuration(path), ConfigurationError);
    }

    TEST(ConfigTest, PoolSizeEnvironmentOverride) {
        auto cfg = parse_configuration(kTwoPools);
        ScopedEnv stdio("STDIO_MCP_POOL_SIZE", "4");
        ScopedEnv code("CODE_ANALYSIS_MCP_POOL_SIZE", "2");

        apply_environment_overrides(cfg);
        EXPECT_EQ(cfg.pools[0].capacity, 4u);
        EXPECT_EQ(cfg.pools[1].capacity, 2u);
    }

    TEST(ConfigTest, PoolNameIsMappedToEnvironmentKey) {
        auto cfg = parse_configuration(
            R"({"default_pool": "web-search.v2",
                "pools": [{"name": "web-search.v2"}]})");
        ScopedEnv size("WEB_SEARCH_V2_MCP_POOL_SIZE", "6");

        apply_environment_overrides(cfg);
        EXPECT_EQ(cfg.pools[0].capacity, 6u);
    }

    TEST(ConfigTest, InvalidPoolSizeOverrideThrows) {
        {
            auto cfg = default_configuration();
            ScopedEnv size("STDIO_MCP_POOL_SIZE", "lots");
            EXPECT_THROW(apply_environment_overrides(cfg), ConfigurationError);
        }
        {
            auto cfg = default_configuration();
            ScopedEnv size("STDIO_MCP_POOL_SIZE", "0");
            EXPECT_THROW(apply_environment_overrides(cfg), ConfigurationError);
        }
        {
            auto cfg = default_configuration();
            ScopedEnv size("STDIO_MCP_POOL_SIZE", "3x");
            EXPECT_THROW(apply_environment_overrides(cfg), ConfigurationError);
        }
    }

    TEST(ConfigTest, BridgeEnvironmentOverrides) {
        auto cfg = default_configuration();
        ScopedEnv pool("TOOLBRIDGE_DEFAULT_POOL", "other");
        ScopedEnv level("TOOLBRIDGE_LOG_LEVEL", "warn");
        ScopedEnv dir("TOOLBRIDGE_LOG_DIR", "");

        apply_environment_overrides(cfg);
        EXPECT_EQ(cfg.default_pool, "other");
        EXPECT_EQ(cfg.logging.level, "warn");
        EXPECT_EQ(cfg.logging.directory, "");
    }

    TEST(ConfigTest, ValidateRejectsUnusableConfigurations) {
        BridgeConfiguration empty;
        EXPECT_THROW(validate(empty), ConfigurationError);

        auto dup = default_configuration();
        dup.pools.push_back(dup.pools[0]);
        EXPECT_THROW(validate(dup), ConfigurationError);

        auto unnamed = default_configuration();
        unnamed.pools[0].name.clear();
        EXPECT_THROW(validate(unnamed), ConfigurationError);

        auto bad_url = default_configuration();
        bad_url.pools[0].server.url = "ftp://host/mcp";
        EXPECT_THROW(validate(bad_url), ConfigurationError);

        auto missing_default = default_configuration();
        missing_default.default_pool = "code_analysis";
        EXPECT_THROW(validate(missing_default), ConfigurationError);
    }

}  // namespace
