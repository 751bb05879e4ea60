#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <functional>

namespace toolbridge {

    /**
     * @brief SIGINT/SIGTERM handling for a graceful stop.
     *
     * The first signal runs `on_first` (stop accepting work, cancel
     * waits); the handler re-arms, and a second signal stops the
     * io_context without waiting for the graceful path.
     */
    class ShutdownSignals {
       public:
        ShutdownSignals(boost::asio::io_context& io,
                        std::function<void()> on_first);

        ShutdownSignals(const ShutdownSignals&) = delete;
        ShutdownSignals& operator=(const ShutdownSignals&) = delete;

        /// @brief Stop listening; pending waits complete as aborted.
        void cancel() noexcept;

        int received() const noexcept { return m_received; }

        /// @brief True once a second signal stopped the io_context.
        bool forced() const noexcept { return m_received > 1; }

       private:
        void arm();
        void on_signal(int signo);

        boost::asio::io_context& m_io;
        boost::asio::signal_set m_signals;
        std::function<void()> m_on_first;
        int m_received{0};
    };

}  // namespace toolbridge
