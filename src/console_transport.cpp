#include "toolbridge/console_transport.hpp"

#include <unistd.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>
#include <cerrno>

#include "toolbridge/logging.hpp"

namespace toolbridge {

    MessageContext parse_console_line(std::string_view line,
                                      std::string conversation_id) {
        MessageContext ctx;
        ctx.conversation_id = std::move(conversation_id);
        ctx.sender = "console";

        auto start = line.find_first_not_of(" \t");
        line = start == std::string_view::npos ? std::string_view{}
                                               : line.substr(start);
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ' ||
                                 line.back() == '\t'))
            line.remove_suffix(1);

        if (!line.empty() && line.front() == '@') {
            auto sp = line.find_first_of(" \t");
            ctx.pool_key = std::string(line.substr(1, sp == std::string_view::npos
                                                          ? std::string_view::npos
                                                          : sp - 1));
            line = sp == std::string_view::npos ? std::string_view{}
                                                : line.substr(sp + 1);
            auto rest = line.find_first_not_of(" \t");
            line = rest == std::string_view::npos ? std::string_view{}
                                                  : line.substr(rest);
        }

        ctx.content = std::string(line);
        return ctx;
    }

    ConsoleTransport::ConsoleTransport(boost::asio::any_io_executor ex,
                                       AgentDispatcher& dispatcher,
                                       std::ostream& out, int fd)
        : m_ex(std::move(ex)),
          m_dispatcher(dispatcher),
          m_out(out),
          m_input(m_ex),
          m_idle(m_ex) {
        const int copy = ::dup(fd);
        if (copy < 0) {
            throw boost::system::system_error(
                errno, boost::system::system_category(),
                "Failed to duplicate input descriptor");
        }
        m_input.assign(copy);
    }

    void ConsoleTransport::stop() noexcept {
        if (m_stopping) return;
        m_stopping = true;
        boost::system::error_code ec;
        m_input.cancel(ec);
    }

    boost::asio::awaitable<void> ConsoleTransport::run() {
        logger()->info("Console transport ready; one message per line, "
                       "'@<pool> ' selects a pool");

        std::string buffer;
        boost::system::error_code ec;

        while (!m_stopping) {
            std::size_t n = co_await boost::asio::async_read_until(
                m_input, boost::asio::dynamic_buffer(buffer), '\n',
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));

            std::string line;
            if (ec == boost::asio::error::eof) {
                line = std::move(buffer);  // last line without newline
                buffer.clear();
            } else if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    logger()->error("Console input failed: {}", ec.message());
                }
                break;
            } else {
                line = buffer.substr(0, n - 1);
                buffer.erase(0, n);
            }

            auto ctx = parse_console_line(
                line, "console-" + std::to_string(m_next_id++));
            if (!ctx.content.empty()) {
                ++m_pending;
                boost::asio::co_spawn(m_ex, handle(std::move(ctx)),
                                      boost::asio::detached);
            }

            if (ec) {
                logger()->info("End of console input");
                break;
            }
        }

        m_stopping = true;
        m_input.close(ec);

        if (m_pending > 0) {
            logger()->info("Waiting for {} in-flight messages", m_pending);
        }
        while (m_pending > 0) {
            m_idle.expires_at(boost::asio::steady_timer::time_point::max());
            co_await m_idle.async_wait(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
    }

    boost::asio::awaitable<void> ConsoleTransport::handle(
        MessageContext context) {
        const std::string id = context.conversation_id;
        try {
            auto reply = co_await m_dispatcher.process_message(std::move(context));
            if (reply) {
                m_out << "[" << id << "] " << reply.value() << std::endl;
            } else {
                m_out << "[" << id << "] error ("
                      << to_string(reply.error().code)
                      << "): " << reply.error().message << std::endl;
            }
        } catch (const std::exception& e) {
            logger()->error("Message {} failed: {}", id, e.what());
        }

        if (--m_pending == 0) {
            m_idle.expires_at(boost::asio::steady_timer::time_point::min());
        }
    }

}  // namespace toolbridge
