#include "toolbridge/agent.hpp"

#include <string_view>
#include <utility>

#include "toolbridge/logging.hpp"

namespace toolbridge {

    using nlohmann::json;

    namespace {

        constexpr const char* kUsage =
            "Usage: /tools | /call <tool> [json-object]";

        std::string_view trim(std::string_view s) {
            constexpr std::string_view ws = " \t\r\n";
            auto b = s.find_first_not_of(ws);
            if (b == std::string_view::npos) return {};
            auto e = s.find_last_not_of(ws);
            return s.substr(b, e - b + 1);
        }

        /// True if s is cmd alone or cmd followed by whitespace.
        bool is_command(std::string_view s, std::string_view cmd) {
            if (s.rfind(cmd, 0) != 0) return false;
            return s.size() == cmd.size() || s[cmd.size()] == ' ' ||
                   s[cmd.size()] == '\t';
        }

    }  // namespace

    CommandAgent::CommandAgent(std::string default_tool,
                               std::string default_argument)
        : m_default_tool(std::move(default_tool)),
          m_default_argument(std::move(default_argument)) {}

    boost::asio::awaitable<Result<std::string>> CommandAgent::run(
        ToolServer& server, const MessageContext& context) {
        const std::string_view text = trim(context.content);

        if (is_command(text, "/tools")) {
            co_return co_await list(server);
        }

        if (is_command(text, "/call")) {
            std::string_view rest = trim(text.substr(5));
            auto cut = rest.find_first_of(" \t");
            std::string tool(rest.substr(0, cut));
            if (tool.empty()) {
                co_return Result<std::string>::err(
                    Error::Code::ToolError,
                    std::string("Missing tool name. ") + kUsage);
            }

            json args = json::object();
            if (cut != std::string_view::npos) {
                auto raw = trim(rest.substr(cut));
                if (!raw.empty()) {
                    args = json::parse(std::string(raw), nullptr, false);
                    if (args.is_discarded() || !args.is_object()) {
                        co_return Result<std::string>::err(
                            Error::Code::ToolError,
                            "Tool arguments must be a JSON object");
                    }
                }
            }
            co_return co_await call(server, tool, std::move(args));
        }

        if (m_default_tool.empty()) {
            co_return Result<std::string>::err(
                Error::Code::ToolError,
                std::string("No default tool configured. ") + kUsage);
        }

        // Built outside the co_await: GCC 12 rejects a braced
        // initializer_list temporary inside a co_await expression.
        json default_args{{m_default_argument, std::string(text)}};
        co_return co_await call(server, m_default_tool,
                                std::move(default_args));
    }

    boost::asio::awaitable<Result<std::string>> CommandAgent::list(
        ToolServer& server) {
        auto tools = co_await server.list_tools();
        if (tools.has_error()) {
            co_return Result<std::string>::err(std::move(tools).error());
        }

        if (tools.value().empty()) {
            co_return Result<std::string>::ok("(no tools)");
        }

        std::string out;
        for (const auto& t : tools.value()) {
            if (!out.empty()) out += '\n';
            out += t.name;
            if (!t.description.empty()) out += ": " + t.description;
        }
        co_return Result<std::string>::ok(std::move(out));
    }

    boost::asio::awaitable<Result<std::string>> CommandAgent::call(
        ToolServer& server, const std::string& tool, json arguments) {
        auto res = co_await server.call_tool(tool, std::move(arguments));
        if (res.has_error()) {
            co_return Result<std::string>::err(std::move(res).error());
        }
        if (res.value().is_error) {
            logger()->info("Tool '{}' on '{}' reported an error", tool,
                           server.name());
            co_return Result<std::string>::err(
                Error::Code::ToolError,
                "Tool '" + tool + "' failed: " + res.value().text());
        }
        co_return Result<std::string>::ok(res.value().text());
    }

}  // namespace toolbridge
