#include "toolbridge/shutdown_signals.hpp"

#include <csignal>
#include <utility>

#include "toolbridge/logging.hpp"

namespace toolbridge {

    ShutdownSignals::ShutdownSignals(boost::asio::io_context& io,
                                     std::function<void()> on_first)
        : m_io(io),
          m_signals(io, SIGINT, SIGTERM),
          m_on_first(std::move(on_first)) {
        arm();
    }

    void ShutdownSignals::cancel() noexcept {
        boost::system::error_code ignored;
        m_signals.cancel(ignored);
    }

    void ShutdownSignals::arm() {
        m_signals.async_wait(
            [this](const boost::system::error_code& ec, int signo) {
                if (ec) return;
                on_signal(signo);
            });
    }

    void ShutdownSignals::on_signal(int signo) {
        if (++m_received > 1) {
            logger()->warn("Received signal {} again, stopping now", signo);
            m_io.stop();
            return;
        }

        logger()->info("Received signal {}, shutting down", signo);
        if (m_on_first) m_on_first();
        arm();
    }

}  // namespace toolbridge
