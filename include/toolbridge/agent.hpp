#pragma once

#include <utility>  // needed before boost/asio/awaitable.hpp (Boost 1.74 omits it)

#include <boost/asio/awaitable.hpp>
#include <string>

#include "toolbridge/result.hpp"
#include "toolbridge/tool_server.hpp"

namespace toolbridge {

    /// @brief One inbound chat message.
    struct MessageContext {
        std::string conversation_id;
        std::string sender;
        std::string content;
        /** @brief Pool to serve the message from; empty selects the default. */
        std::string pool_key;
    };

    /**
     * @brief Turns one message into a reply using a borrowed tool server.
     *
     * Errors for which indicates_unhealthy_server() holds, and exceptions,
     * make the dispatcher discard the server.
     */
    class Agent {
       public:
        virtual ~Agent() = default;

        virtual boost::asio::awaitable<Result<std::string>> run(
            ToolServer& server, const MessageContext& context) = 0;
    };

    /**
     * @brief Agent driven by slash commands.
     *
     * - `/tools` lists the server's tools
     * - `/call <tool> [json-object]` calls a tool
     * - anything else goes to the default tool as
     *   `{"<default_argument>": <content>}`
     */
    class CommandAgent : public Agent {
       public:
        explicit CommandAgent(std::string default_tool = {},
                              std::string default_argument = "query");

        boost::asio::awaitable<Result<std::string>> run(
            ToolServer& server, const MessageContext& context) override;

       private:
        boost::asio::awaitable<Result<std::string>> list(ToolServer& server);

        boost::asio::awaitable<Result<std::string>> call(
            ToolServer& server, const std::string& tool,
            nlohmann::json arguments);

        std::string m_default_tool;
        std::string m_default_argument;
    };

}  // namespace toolbridge
