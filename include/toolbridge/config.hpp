#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace toolbridge {

    /**
     * @brief Connection settings for one MCP tool server endpoint.
     */
    struct ToolServerConfiguration {
        /** @brief MCP endpoint, http:// or https://. */
        std::string url{"http://127.0.0.1:8000/mcp"};

        /** @brief Diagnostic name of servers created from this config. */
        std::string server_name{"mcp"};

        /** @brief Timeout applied to each HTTP exchange. */
        std::chrono::milliseconds request_timeout{600000};

        /** @brief Extra headers sent with every request. */
        std::map<std::string, std::string> headers;

        /** @brief Whether to verify TLS certificates. */
        bool verify_tls{true};

        /** @brief User-Agent string sent with each request. */
        std::string user_agent{"toolbridge/1.0"};
    };

    /**
     * @brief One named pool of tool servers.
     */
    struct PoolConfiguration {
        /** @brief Registry key and diagnostic name. */
        std::string name;

        /** @brief Number of servers created at startup. */
        std::size_t capacity{1};

        /** @brief How long a message waits for a free server. */
        std::chrono::milliseconds acquire_timeout{30000};

        ToolServerConfiguration server;

        /** @brief Tool called for plain (non-command) messages, if any. */
        std::string default_tool;

        /** @brief Argument name the message text is passed under. */
        std::string default_argument{"query"};
    };

    struct LoggingConfiguration {
        /** @brief Console level (trace, debug, info, warn, error, ...). */
        std::string level{"info"};

        /** @brief Directory for rotating log files; empty disables files. */
        std::string directory{"logs"};

        /** @brief File sink level. */
        std::string file_level{"debug"};
    };

    struct BridgeConfiguration {
        std::vector<PoolConfiguration> pools;

        /** @brief Pool used when a message names none. */
        std::string default_pool{"stdio"};

        LoggingConfiguration logging;
    };

    /// @brief Configuration used when no file is given: one "stdio" pool of
    /// size 1 against a local endpoint.
    BridgeConfiguration default_configuration();

    /// @brief Parse a configuration document (JSON text).
    /// @throws ConfigurationError on malformed JSON or wrongly typed fields.
    BridgeConfiguration parse_configuration(const std::string& json_text);

    /// @brief Read and parse a configuration file.
    /// @throws ConfigurationError if the file cannot be read or parsed.
    BridgeConfiguration load_configuration(const std::string& path);

    /**
     * @brief Apply environment overrides in place.
     *
     * - `<NAME>_MCP_POOL_SIZE` sets the capacity of pool `name` (upper-cased,
     *   '-' and '.' mapped to '_'), e.g. STDIO_MCP_POOL_SIZE
     * - `TOOLBRIDGE_DEFAULT_POOL`, `TOOLBRIDGE_LOG_LEVEL`, `TOOLBRIDGE_LOG_DIR`
     *
     * @throws ConfigurationError on a non-numeric or non-positive size.
     */
    void apply_environment_overrides(BridgeConfiguration& cfg);

    /// @brief Reject configurations the bridge cannot start with.
    /// @throws ConfigurationError describing the first problem found.
    void validate(const BridgeConfiguration& cfg);

}  // namespace toolbridge
