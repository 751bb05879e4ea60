#include "toolbridge/config.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>

#include "toolbridge/error.hpp"
#include "toolbridge/url.hpp"

namespace toolbridge {

    namespace {

        using json = nlohmann::json;

        template <typename T>
        void read_field(const json& j, const char* key, T& out) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) return;
            it->get_to(out);
        }

        void read_millis(const json& j, const char* key,
                         std::chrono::milliseconds& out) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) return;
            auto v = it->get<std::int64_t>();
            if (v <= 0) {
                throw ConfigurationError(std::string("'") + key +
                                         "' must be a positive number of "
                                         "milliseconds");
            }
            out = std::chrono::milliseconds(v);
        }

        ToolServerConfiguration parse_server(const json& j) {
            ToolServerConfiguration s;
            read_field(j, "url", s.url);
            read_field(j, "server_name", s.server_name);
            read_millis(j, "request_timeout_ms", s.request_timeout);
            read_field(j, "headers", s.headers);
            read_field(j, "verify_tls", s.verify_tls);
            read_field(j, "user_agent", s.user_agent);
            return s;
        }

        PoolConfiguration parse_pool(const json& j) {
            PoolConfiguration p;
            read_field(j, "name", p.name);

            auto cap = j.find("capacity");
            if (cap != j.end() && !cap->is_null()) {
                auto v = cap->get<std::int64_t>();
                if (v <= 0) {
                    throw ConfigurationError("Pool '" + p.name +
                                             "': capacity must be positive");
                }
                p.capacity = static_cast<std::size_t>(v);
            }

            read_millis(j, "acquire_timeout_ms", p.acquire_timeout);
            if (auto s = j.find("server"); s != j.end()) {
                p.server = parse_server(*s);
            }
            if (p.server.server_name == ToolServerConfiguration{}.server_name) {
                p.server.server_name = p.name;
            }
            read_field(j, "default_tool", p.default_tool);
            read_field(j, "default_argument", p.default_argument);
            return p;
        }

        std::string env_key_for_pool(const std::string& name) {
            std::string key;
            key.reserve(name.size() + 14);
            for (unsigned char c : name) {
                if (c == '-' || c == '.')
                    key.push_back('_');
                else
                    key.push_back(static_cast<char>(std::toupper(c)));
            }
            key += "_MCP_POOL_SIZE";
            return key;
        }

        const char* getenv_nonempty(const char* name) {
            const char* v = std::getenv(name);
            return (v && *v) ? v : nullptr;
        }

        std::size_t parse_positive(const std::string& key,
                                   const std::string& text) {
            std::size_t pos = 0;
            long long v = 0;
            try {
                v = std::stoll(text, &pos);
            } catch (const std::exception&) {
                throw ConfigurationError(key + " is not a number: '" + text +
                                         "'");
            }
            if (pos != text.size()) {
                throw ConfigurationError(key + " is not a number: '" + text +
                                         "'");
            }
            if (v <= 0) {
                throw ConfigurationError(key + " must be positive, got " +
                                         text);
            }
            return static_cast<std::size_t>(v);
        }

    }  // namespace

    BridgeConfiguration default_configuration() {
        BridgeConfiguration cfg;
        PoolConfiguration p;
        // Named "stdio" so existing STDIO_MCP_POOL_SIZE settings and "@stdio"
        // prefixes keep working; the server itself is reached over HTTP.
        p.name = "stdio";
        p.server.server_name = "stdio";
        cfg.pools.push_back(std::move(p));
        return cfg;
    }

    BridgeConfiguration parse_configuration(const std::string& json_text) {
        BridgeConfiguration cfg;
        try {
            auto j = json::parse(json_text);
            if (!j.is_object()) {
                throw ConfigurationError(
                    "Configuration root must be a JSON object");
            }

            if (auto pools = j.find("pools"); pools != j.end()) {
                if (!pools->is_array()) {
                    throw ConfigurationError("'pools' must be an array");
                }
                for (const auto& p : *pools) {
                    cfg.pools.push_back(parse_pool(p));
                }
            }

            read_field(j, "default_pool", cfg.default_pool);

            if (auto lg = j.find("logging"); lg != j.end()) {
                read_field(*lg, "level", cfg.logging.level);
                read_field(*lg, "directory", cfg.logging.directory);
                read_field(*lg, "file_level", cfg.logging.file_level);
            }
        } catch (const json::exception& e) {
            throw ConfigurationError(std::string("Invalid configuration: ") +
                                     e.what());
        }
        return cfg;
    }

    BridgeConfiguration load_configuration(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            throw ConfigurationError("Cannot open configuration file '" +
                                     path + "'");
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        return parse_configuration(ss.str());
    }

    void apply_environment_overrides(BridgeConfiguration& cfg) {
        for (auto& p : cfg.pools) {
            const auto key = env_key_for_pool(p.name);
            if (const char* v = getenv_nonempty(key.c_str())) {
                p.capacity = parse_positive(key, v);
            }
        }

        if (const char* v = getenv_nonempty("TOOLBRIDGE_DEFAULT_POOL")) {
            cfg.default_pool = v;
        }
        if (const char* v = getenv_nonempty("TOOLBRIDGE_LOG_LEVEL")) {
            cfg.logging.level = v;
        }
        // Set but empty disables the file sink.
        if (const char* v = std::getenv("TOOLBRIDGE_LOG_DIR")) {
            cfg.logging.directory = v;
        }
    }

    void validate(const BridgeConfiguration& cfg) {
        if (cfg.pools.empty()) {
            throw ConfigurationError("No pools configured");
        }

        std::set<std::string> seen;
        for (const auto& p : cfg.pools) {
            if (p.name.empty()) {
                throw ConfigurationError("Pool with empty name");
            }
            if (!seen.insert(p.name).second) {
                throw ConfigurationError("Duplicate pool name '" + p.name +
                                         "'");
            }
            if (p.capacity == 0) {
                throw ConfigurationError("Pool '" + p.name +
                                         "': capacity must be positive");
            }
            auto url = parse_url(p.server.url);
            if (url.has_error()) {
                throw ConfigurationError("Pool '" + p.name +
                                         "': " + url.error().message);
            }
        }

        if (seen.count(cfg.default_pool) == 0) {
            throw ConfigurationError("Default pool '" + cfg.default_pool +
                                     "' is not configured");
        }
    }

}  // namespace toolbridge
