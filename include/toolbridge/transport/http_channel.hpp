#pragma once

#include <utility>  // needed before boost/asio/awaitable.hpp (Boost 1.74 omits it)

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/verb.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

#include "toolbridge/result.hpp"
#include "toolbridge/transport/tls.hpp"
#include "toolbridge/url.hpp"

namespace toolbridge {

    /**
     * @brief Represents an HTTP response.
     */
    struct HttpResponse {
        /** @brief HTTP status code (e.g., 200, 404). */
        int status_code{0};
        /** @brief Response headers, keys lower-cased. */
        std::unordered_map<std::string, std::string> headers;
        /** @brief Response body as a string. */
        std::string body;

        /// @brief Case-insensitive header lookup.
        /// @return nullptr if the header is absent.
        const std::string* header(std::string_view name) const;

        bool ok() const noexcept {
            return status_code >= 200 && status_code < 300;
        }
    };

    /**
     * @brief One keep-alive HTTP/1.1 connection to a single endpoint.
     *
     * Connects lazily and reconnects after the peer closes. Every
     * operation is bounded by the configured timeout. Not thread-safe; one
     * request at a time.
     */
    class HttpChannel {
       private:
        using tcp = boost::asio::ip::tcp;
        using PlainStream = boost::beast::tcp_stream;
        using Stream = std::variant<std::monostate,  // "not connected yet"
                                    PlainStream, TlsStream>;

       public:
        /// Upper bound on a response body; tool output can be large.
        static constexpr std::uint64_t kMaxBodyBytes = 64ull * 1024 * 1024;

        /**
         * @brief Constructs a channel; no I/O happens until send().
         * @param ex Executor for socket operations.
         * @param tls Context for https endpoints, may be null for http.
         * @param url Target endpoint.
         * @param timeout Limit applied to every connect, write and read.
         */
        HttpChannel(boost::asio::any_io_executor ex,
                    std::shared_ptr<boost::asio::ssl::context> tls,
                    UrlComponents url, std::chrono::milliseconds timeout);

        HttpChannel(const HttpChannel&) = delete;
        HttpChannel& operator=(const HttpChannel&) = delete;

        ~HttpChannel() noexcept { close(); }

        /**
         * @brief Perform one request against the endpoint's target.
         * @param method HTTP verb.
         * @param headers Extra request headers; Host is always set.
         * @param body Request body, sent when non-empty.
         * @return The response, or ConnectionFailed, TlsHandshakeFailed,
         * NetworkError, Timeout. The connection is closed on any error.
         */
        boost::asio::awaitable<Result<HttpResponse>> send(
            boost::beast::http::verb method,
            const std::map<std::string, std::string>& headers,
            std::string body);

        /// @brief Close the socket if open (best-effort, no TLS shutdown).
        void close() noexcept;

        /// @brief Checks if the socket is currently open.
        bool is_open() const noexcept;

        const UrlComponents& url() const noexcept { return m_url; }

       private:
        boost::asio::awaitable<Result<void>> ensure_connected();

        static Error error_from_ec(const boost::system::error_code& ec,
                                   Error::Code fallback,
                                   std::string_view what);

        boost::asio::any_io_executor m_ex;
        std::shared_ptr<boost::asio::ssl::context> m_tls;
        UrlComponents m_url;
        std::chrono::milliseconds m_timeout;

        boost::beast::flat_buffer m_buffer{};
        Stream m_stream;
    };

}  // namespace toolbridge
