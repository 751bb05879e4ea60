#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

#include "toolbridge/result.hpp"
#include "toolbridge/tool_server.hpp"

namespace toolbridge::mcp {

    /// MCP revision announced in `initialize`.
    inline constexpr const char* kProtocolVersion = "2025-03-26";

    inline constexpr const char* kClientName = "toolbridge";
    inline constexpr const char* kClientVersion = "1.0";

    /// Header carrying the session id assigned by the server.
    inline constexpr const char* kSessionHeader = "Mcp-Session-Id";

    /// @brief JSON-RPC 2.0 request object.
    nlohmann::json make_request(std::int64_t id, std::string_view method,
                                nlohmann::json params);

    /// @brief JSON-RPC 2.0 notification (no id, no response expected).
    nlohmann::json make_notification(std::string_view method,
                                     nlohmann::json params);

    /// @brief Params of the `initialize` request.
    nlohmann::json initialize_params();

    /**
     * @brief Split a text/event-stream body into event payloads.
     *
     * Consecutive `data:` lines of one event are joined with '\n'. Comment
     * lines and other fields are ignored; events without data are dropped.
     */
    std::vector<std::string> parse_sse_data(std::string_view body);

    /**
     * @brief Extract the `result` of the response to request `id`.
     *
     * Accepts a plain JSON body (object or batch array) or an SSE stream,
     * chosen by content_type. Messages with other ids (server requests,
     * notifications) are skipped.
     * @return RpcError for a JSON-RPC error object, ProtocolError on
     * malformed bodies or a missing response.
     */
    Result<nlohmann::json> parse_response(std::string_view content_type,
                                          std::string_view body,
                                          std::int64_t id);

    /// @brief Decode a `tools/list` result page.
    /// @param next_cursor Set to the pagination cursor, empty on the last
    /// page.
    Result<std::vector<ToolDescriptor>> parse_tool_list(
        const nlohmann::json& result, std::string& next_cursor);

    /// @brief Decode a `tools/call` result.
    Result<ToolCallResult> parse_tool_call(const nlohmann::json& result);

}  // namespace toolbridge::mcp
