#pragma once

#include <utility>  // needed before boost/asio/awaitable.hpp (Boost 1.74 omits it)

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "toolbridge/pool/server_pool.hpp"
#include "toolbridge/result.hpp"
#include "toolbridge/server.hpp"

namespace toolbridge {

    /// @brief A tool advertised by an MCP server (`tools/list`).
    struct ToolDescriptor {
        std::string name;
        std::string description;
        nlohmann::json input_schema = nlohmann::json::object();
    };

    /// @brief Outcome of one `tools/call`.
    struct ToolCallResult {
        /** @brief MCP content items ({"type": "text", "text": ...}, ...). */
        nlohmann::json content = nlohmann::json::array();
        /** @brief The tool reported a failure in its content. */
        bool is_error{false};

        /// @brief Text items of content joined by newlines; other item
        /// types are skipped.
        std::string text() const {
            std::string out;
            if (!content.is_array()) return out;
            for (const auto& item : content) {
                if (!item.is_object()) continue;
                auto type = item.find("type");
                auto txt = item.find("text");
                if (type == item.end() || *type != "text" || txt == item.end() ||
                    !txt->is_string())
                    continue;
                if (!out.empty()) out += '\n';
                out += txt->get<std::string>();
            }
            return out;
        }
    };

    /**
     * @brief A connected MCP tool server.
     *
     * Operational failures come back as Result errors; use
     * indicates_unhealthy_server() to decide whether the server may be
     * reused.
     */
    class ToolServer : public Server {
       public:
        virtual boost::asio::awaitable<Result<std::vector<ToolDescriptor>>>
        list_tools() = 0;

        virtual boost::asio::awaitable<Result<ToolCallResult>> call_tool(
            const std::string& name, nlohmann::json arguments) = 0;
    };

    using ToolServerPool = BasicServerPool<ToolServer>;

}  // namespace toolbridge
