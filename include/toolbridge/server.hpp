#pragma once

#include <utility>  // needed before boost/asio/awaitable.hpp (Boost 1.74 omits it)

#include <boost/asio/awaitable.hpp>
#include <functional>
#include <memory>
#include <string>

namespace toolbridge {

    /**
     * @brief An already-connected remote resource managed by a pool.
     *
     * Pools never look past this interface. Implementations must make
     * dispose() safe to call on a degraded server; failures are reported
     * by throwing an exception derived from std::exception.
     */
    class Server {
       public:
        virtual ~Server() = default;

        /// @brief Identity used in diagnostics.
        virtual std::string name() const = 0;

        /// @brief Release every resource the server holds.
        virtual boost::asio::awaitable<void> dispose() = 0;
    };

    /// @brief Asynchronous constructor of one ready-to-use server.
    /// @note Must yield a fully connected server or throw.
    template <typename ServerT>
    using ServerFactory =
        std::function<boost::asio::awaitable<std::shared_ptr<ServerT>>()>;

}  // namespace toolbridge
