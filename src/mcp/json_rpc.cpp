#include "toolbridge/mcp/json_rpc.hpp"

#include <algorithm>
#include <cctype>

namespace toolbridge::mcp {

    using nlohmann::json;

    namespace {

        bool is_event_stream(std::string_view content_type) {
            constexpr std::string_view kSse = "text/event-stream";
            if (content_type.size() < kSse.size()) return false;
            return std::equal(kSse.begin(), kSse.end(), content_type.begin(),
                              [](char a, char b) {
                                  return a == std::tolower(
                                                  static_cast<unsigned char>(b));
                              });
        }

        void collect_messages(json&& doc, std::vector<json>& out) {
            if (doc.is_array()) {
                for (auto& m : doc) {
                    if (m.is_object()) out.push_back(std::move(m));
                }
            } else if (doc.is_object()) {
                out.push_back(std::move(doc));
            }
        }

        bool has_id(const json& msg, std::int64_t id) {
            auto it = msg.find("id");
            return it != msg.end() && it->is_number_integer() &&
                   it->get<std::int64_t>() == id;
        }

        Error rpc_error(const json& msg) {
            const auto& e = msg.at("error");
            std::string code = "?";
            std::string text = "unknown error";
            if (e.is_object()) {
                if (auto c = e.find("code");
                    c != e.end() && c->is_number_integer())
                    code = std::to_string(c->get<std::int64_t>());
                if (auto m = e.find("message");
                    m != e.end() && m->is_string())
                    text = m->get<std::string>();
            }
            return Error{Error::Code::RpcError,
                         "JSON-RPC error " + code + ": " + text};
        }

    }  // namespace

    json make_request(std::int64_t id, std::string_view method, json params) {
        json req = {{"jsonrpc", "2.0"},
                    {"id", id},
                    {"method", std::string(method)}};
        if (!params.is_null()) req["params"] = std::move(params);
        return req;
    }

    json make_notification(std::string_view method, json params) {
        json n = {{"jsonrpc", "2.0"}, {"method", std::string(method)}};
        if (!params.is_null()) n["params"] = std::move(params);
        return n;
    }

    json initialize_params() {
        return json{
            {"protocolVersion", kProtocolVersion},
            {"capabilities", json::object()},
            {"clientInfo", {{"name", kClientName}, {"version", kClientVersion}}}};
    }

    std::vector<std::string> parse_sse_data(std::string_view body) {
        std::vector<std::string> events;
        std::string data;
        bool has_data = false;

        auto dispatch = [&] {
            if (has_data) events.push_back(std::move(data));
            data.clear();
            has_data = false;
        };

        while (!body.empty()) {
            auto eol = body.find('\n');
            std::string_view line = body.substr(0, eol);
            body.remove_prefix(eol == std::string_view::npos ? body.size()
                                                             : eol + 1);
            if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

            if (line.empty()) {
                dispatch();
                continue;
            }
            if (line.front() == ':') continue;

            auto colon = line.find(':');
            std::string_view field = line.substr(0, colon);
            if (field != "data") continue;

            std::string_view value;
            if (colon != std::string_view::npos) {
                value = line.substr(colon + 1);
                if (!value.empty() && value.front() == ' ')
                    value.remove_prefix(1);
            }
            if (has_data) data += '\n';
            data.append(value.data(), value.size());
            has_data = true;
        }
        dispatch();
        return events;
    }

    Result<json> parse_response(std::string_view content_type,
                                std::string_view body, std::int64_t id) {
        std::vector<json> messages;

        if (is_event_stream(content_type)) {
            for (auto& payload : parse_sse_data(body)) {
                auto doc = json::parse(payload, nullptr, false);
                if (doc.is_discarded()) continue;
                collect_messages(std::move(doc), messages);
            }
        } else {
            auto doc = json::parse(std::string(body), nullptr, false);
            if (doc.is_discarded()) {
                return Result<json>::err(Error::Code::ProtocolError,
                                         "Response body is not valid JSON");
            }
            collect_messages(std::move(doc), messages);
        }

        const json* orphan_error = nullptr;
        for (auto& msg : messages) {
            if (has_id(msg, id)) {
                if (msg.contains("error")) {
                    return Result<json>::err(rpc_error(msg));
                }
                auto it = msg.find("result");
                if (it == msg.end()) {
                    return Result<json>::err(
                        Error::Code::ProtocolError,
                        "Response " + std::to_string(id) +
                            " has neither result nor error");
                }
                return Result<json>::ok(std::move(*it));
            }
            // Servers answer unparseable requests with a null id.
            if (!orphan_error && msg.contains("error") &&
                msg.contains("id") && msg["id"].is_null()) {
                orphan_error = &msg;
            }
        }

        if (orphan_error) return Result<json>::err(rpc_error(*orphan_error));

        return Result<json>::err(
            Error::Code::ProtocolError,
            "No JSON-RPC response with id " + std::to_string(id));
    }

    Result<std::vector<ToolDescriptor>> parse_tool_list(const json& result,
                                                        std::string& next_cursor) {
        using R = Result<std::vector<ToolDescriptor>>;
        next_cursor.clear();

        if (!result.is_object()) {
            return R::err(Error::Code::ProtocolError,
                          "tools/list result is not an object");
        }
        auto tools = result.find("tools");
        if (tools == result.end() || !tools->is_array()) {
            return R::err(Error::Code::ProtocolError,
                          "tools/list result has no tools array");
        }

        std::vector<ToolDescriptor> out;
        out.reserve(tools->size());
        for (const auto& t : *tools) {
            auto name = t.find("name");
            if (!t.is_object() || name == t.end() || !name->is_string()) {
                return R::err(Error::Code::ProtocolError,
                              "tools/list entry without a name");
            }
            ToolDescriptor d;
            d.name = name->get<std::string>();
            if (auto desc = t.find("description");
                desc != t.end() && desc->is_string())
                d.description = desc->get<std::string>();
            if (auto schema = t.find("inputSchema");
                schema != t.end() && schema->is_object())
                d.input_schema = *schema;
            out.push_back(std::move(d));
        }

        if (auto cur = result.find("nextCursor");
            cur != result.end() && cur->is_string())
            next_cursor = cur->get<std::string>();

        return R::ok(std::move(out));
    }

    Result<ToolCallResult> parse_tool_call(const json& result) {
        if (!result.is_object()) {
            return Result<ToolCallResult>::err(
                Error::Code::ProtocolError,
                "tools/call result is not an object");
        }

        ToolCallResult out;
        if (auto content = result.find("content"); content != result.end()) {
            if (!content->is_array()) {
                return Result<ToolCallResult>::err(
                    Error::Code::ProtocolError,
                    "tools/call content is not an array");
            }
            out.content = *content;
        }
        if (auto err = result.find("isError");
            err != result.end() && err->is_boolean())
            out.is_error = err->get<bool>();

        return Result<ToolCallResult>::ok(std::move(out));
    }

}  // namespace toolbridge::mcp
