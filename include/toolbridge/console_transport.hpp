#pragma once

#include <utility>  // needed before boost/asio/awaitable.hpp (Boost 1.74 omits it)

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

#include "toolbridge/dispatcher.hpp"

namespace toolbridge {

    /// @brief Build a message from one console line. A leading
    /// `@<pool> ` selects the pool; the rest is the content.
    MessageContext parse_console_line(std::string_view line,
                                      std::string conversation_id);

    /**
     * @brief Line-oriented chat transport on a file descriptor (stdin by
     * default).
     *
     * Every non-empty line becomes one message; messages are processed
     * concurrently and replies are written to `out` as they complete.
     */
    class ConsoleTransport {
       public:
        /// @param fd Descriptor to read from; it is duplicated, the caller
        /// keeps ownership of the original.
        ConsoleTransport(boost::asio::any_io_executor ex,
                         AgentDispatcher& dispatcher, std::ostream& out,
                         int fd);

        ConsoleTransport(const ConsoleTransport&) = delete;
        ConsoleTransport& operator=(const ConsoleTransport&) = delete;

        /// @brief Read until end of input or stop(), then wait for every
        /// message still being processed.
        boost::asio::awaitable<void> run();

        /// @brief Stop reading; run() returns once in-flight messages are
        /// done.
        void stop() noexcept;

        std::size_t pending() const noexcept { return m_pending; }

       private:
        boost::asio::awaitable<void> handle(MessageContext context);

        boost::asio::any_io_executor m_ex;
        AgentDispatcher& m_dispatcher;
        std::ostream& m_out;
        boost::asio::posix::stream_descriptor m_input;
        boost::asio::steady_timer m_idle;  ///< Woken when m_pending hits 0

        std::size_t m_pending{0};
        std::uint64_t m_next_id{1};
        bool m_stopping{false};
    };

}  // namespace toolbridge
