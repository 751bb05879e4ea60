#pragma once

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace toolbridge {

    /**
     * @brief Operational error carried by Result<T>.
     *
     * Fatal setup failures (bad configuration, a pool that failed to start)
     * are thrown as exceptions instead, see the classes below.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            InvalidUrl,         /**< The configured URL is malformed. */
            ConnectionFailed,   /**< Failed to establish a TCP connection. */
            TlsHandshakeFailed, /**< Failed to perform TLS handshake. */
            Timeout,            /**< The operation timed out. */
            NetworkError,       /**< Transport failure mid-request. */
            ProtocolError,      /**< Malformed JSON-RPC exchange or framing. */
            RpcError,           /**< JSON-RPC error object from the server. */
            ToolError,          /**< The tool ran but reported a failure. */
            PoolNotFound,       /**< No pool registered under that key. */
            InvalidState,       /**< Pool is not (yet) Ready. */
            Shutdown,           /**< Pool permanently closed. */
            Cancelled,          /**< The wait was cancelled by the caller. */
            Unknown,            /**< An unknown error occurred. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
    };

    /// @brief Convert an error code to string for logging or diagnostics
    inline const char* to_string(Error::Code code) {
        switch (code) {
            case Error::Code::InvalidUrl:
                return "InvalidUrl";
            case Error::Code::ConnectionFailed:
                return "ConnectionFailed";
            case Error::Code::TlsHandshakeFailed:
                return "TlsHandshakeFailed";
            case Error::Code::Timeout:
                return "Timeout";
            case Error::Code::NetworkError:
                return "NetworkError";
            case Error::Code::ProtocolError:
                return "ProtocolError";
            case Error::Code::RpcError:
                return "RpcError";
            case Error::Code::ToolError:
                return "ToolError";
            case Error::Code::PoolNotFound:
                return "PoolNotFound";
            case Error::Code::InvalidState:
                return "InvalidState";
            case Error::Code::Shutdown:
                return "Shutdown";
            case Error::Code::Cancelled:
                return "Cancelled";
            case Error::Code::Unknown:
                return "Unknown";
        }
        return "Unknown";
    }

    /// @brief True if retrying against the same pool can never succeed.
    inline bool is_fatal(Error::Code code) noexcept {
        return code == Error::Code::Shutdown ||
               code == Error::Code::InvalidState ||
               code == Error::Code::PoolNotFound;
    }

    /// @brief True if a server that produced this error should not be
    /// reused.
    /// @note ToolError and RpcError mean the server answered; the request
    /// itself failed.
    inline bool indicates_unhealthy_server(Error::Code code) noexcept {
        switch (code) {
            case Error::Code::NetworkError:
            case Error::Code::ConnectionFailed:
            case Error::Code::TlsHandshakeFailed:
            case Error::Code::ProtocolError:
            case Error::Code::Timeout:
                return true;
            default:
                return false;
        }
    }

    /// @brief Base class for the fatal errors thrown by pools and their
    /// owners.
    class PoolError : public std::runtime_error {
       public:
        using std::runtime_error::runtime_error;
    };

    /// @brief Invalid construction parameters or configuration.
    class ConfigurationError : public PoolError {
       public:
        using PoolError::PoolError;
    };

    /// @brief An operation was invoked in a lifecycle state that forbids it.
    class PoolStateError : public PoolError {
       public:
        using PoolError::PoolError;
    };

    /**
     * @brief A factory call failed while a pool was starting.
     *
     * The pool that threw this is already Shutdown and holds no servers.
     * cause() rethrows the original factory error.
     */
    class PoolInitializationError : public PoolError {
       public:
        PoolInitializationError(std::string pool_name, std::size_t attempt,
                                const std::string& reason,
                                std::exception_ptr cause)
            : PoolError("Pool '" + pool_name +
                        "' failed to initialize at server " +
                        std::to_string(attempt) + ": " + reason),
              pool_name_(std::move(pool_name)),
              attempt_(attempt),
              cause_(std::move(cause)) {}

        /// @brief Name of the pool that failed.
        const std::string& pool_name() const noexcept { return pool_name_; }

        /// @brief 1-based index of the factory call that failed.
        std::size_t attempt() const noexcept { return attempt_; }

        /// @brief The original factory error, may be null.
        std::exception_ptr cause() const noexcept { return cause_; }

       private:
        std::string pool_name_;
        std::size_t attempt_;
        std::exception_ptr cause_;
    };

    /// @brief Thrown where an API must fail by exception (server factories)
    /// but the failure is described by an Error.
    class ToolServerError : public std::runtime_error {
       public:
        explicit ToolServerError(Error error)
            : std::runtime_error(std::string(to_string(error.code)) + ": " +
                                 error.message),
              error_(std::move(error)) {}

        const Error& error() const noexcept { return error_; }

       private:
        Error error_;
    };

}  // namespace toolbridge
