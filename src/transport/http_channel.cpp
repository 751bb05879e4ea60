#include "toolbridge/transport/http_channel.hpp"

#include <algorithm>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <cctype>

namespace toolbridge {

    namespace {

        std::string to_lower(std::string_view s) {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return out;
        }

        HttpResponse parse_beast_response(
            boost::beast::http::response<boost::beast::http::string_body>&&
                beast_res) {
            HttpResponse out;
            out.status_code = static_cast<int>(beast_res.result_int());

            // If duplicate header keys occur, the last one wins.
            for (const auto& field : beast_res.base()) {
                const auto name = field.name_string();
                out.headers[to_lower(std::string_view(name.data(), name.size()))] =
                    std::string(field.value());
            }

            out.body = std::move(beast_res.body());
            return out;
        }

    }  // namespace

    const std::string* HttpResponse::header(std::string_view name) const {
        auto it = headers.find(to_lower(name));
        return it == headers.end() ? nullptr : &it->second;
    }

    HttpChannel::HttpChannel(boost::asio::any_io_executor ex,
                             std::shared_ptr<boost::asio::ssl::context> tls,
                             UrlComponents url,
                             std::chrono::milliseconds timeout)
        : m_ex(std::move(ex)),
          m_tls(std::move(tls)),
          m_url(std::move(url)),
          m_timeout(timeout) {}

    void HttpChannel::close() noexcept {
        boost::system::error_code ec;

        if (auto* s = std::get_if<PlainStream>(&m_stream)) {
            s->socket().shutdown(tcp::socket::shutdown_both, ec);
            s->socket().close(ec);
        } else if (auto* s = std::get_if<TlsStream>(&m_stream)) {
            // No TLS shutdown. Just close the underlying TCP socket.
            boost::beast::get_lowest_layer(*s).socket().shutdown(
                tcp::socket::shutdown_both, ec);
            boost::beast::get_lowest_layer(*s).socket().close(ec);
        }

        m_stream.emplace<std::monostate>();
        m_buffer.clear();
    }

    bool HttpChannel::is_open() const noexcept {
        return std::visit(
            [](auto const& s) -> bool {
                using T = std::decay_t<decltype(s)>;

                if constexpr (std::is_same_v<T, std::monostate>) {
                    return false;
                } else if constexpr (std::is_same_v<T, PlainStream>) {
                    return s.socket().is_open();
                } else {
                    return boost::beast::get_lowest_layer(s).socket().is_open();
                }
            },
            m_stream);
    }

    Error HttpChannel::error_from_ec(const boost::system::error_code& ec,
                                     Error::Code fallback,
                                     std::string_view what) {
        Error e{};
        e.code = ec == boost::beast::error::timeout ? Error::Code::Timeout
                                                    : fallback;
        e.message = std::string(what) + ": " + ec.message();
        return e;
    }

    boost::asio::awaitable<Result<void>> HttpChannel::ensure_connected() {
        if (is_open()) co_return Result<void>::ok();
        close();

        boost::system::error_code ec;
        tcp::resolver resolver(m_ex);
        auto results = co_await resolver.async_resolve(
            m_url.host, m_url.port,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return Result<void>::err(error_from_ec(
                ec, Error::Code::ConnectionFailed,
                "Failed to resolve " + m_url.host));
        }

        if (!m_url.https) {
            auto& s = m_stream.emplace<PlainStream>(m_ex);
            s.expires_after(m_timeout);
            co_await s.async_connect(
                results,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) {
                close();
                co_return Result<void>::err(error_from_ec(
                    ec, Error::Code::ConnectionFailed,
                    "Failed to connect to " + m_url.host + ":" + m_url.port));
            }
            co_return Result<void>::ok();
        }

        if (!m_tls) {
            co_return Result<void>::err(
                Error::Code::TlsHandshakeFailed,
                "No TLS context for https endpoint " + m_url.host);
        }

        auto& s = m_stream.emplace<TlsStream>(m_ex, *m_tls);
        boost::beast::get_lowest_layer(s).expires_after(m_timeout);
        co_await boost::beast::get_lowest_layer(s).async_connect(
            results, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            close();
            co_return Result<void>::err(error_from_ec(
                ec, Error::Code::ConnectionFailed,
                "Failed to connect to " + m_url.host + ":" + m_url.port));
        }

        if (!set_sni(s, m_url.host, ec)) {
            close();
            co_return Result<void>::err(error_from_ec(
                ec, Error::Code::TlsHandshakeFailed, "Failed to set SNI"));
        }

        co_await s.async_handshake(
            boost::asio::ssl::stream_base::client,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            close();
            co_return Result<void>::err(error_from_ec(
                ec, Error::Code::TlsHandshakeFailed,
                "TLS handshake with " + m_url.host + " failed"));
        }

        co_return Result<void>::ok();
    }

    boost::asio::awaitable<Result<HttpResponse>> HttpChannel::send(
        boost::beast::http::verb method,
        const std::map<std::string, std::string>& headers, std::string body) {
        namespace http = boost::beast::http;

        auto connected = co_await ensure_connected();
        if (connected.has_error()) {
            co_return Result<HttpResponse>::err(std::move(connected).error());
        }

        http::request<http::string_body> req;
        req.version(11);
        req.method(method);
        req.target(m_url.target);
        req.set(http::field::host, m_url.host);
        req.keep_alive(true);
        for (const auto& [k, v] : headers) {
            req.set(k, v);
        }
        if (!body.empty()) {
            req.body() = std::move(body);
        }
        req.prepare_payload();

        http::response_parser<http::string_body> parser;
        parser.body_limit(kMaxBodyBytes);

        boost::system::error_code ec;
        auto exchange = [&](auto& stream) -> boost::asio::awaitable<void> {
            boost::beast::get_lowest_layer(stream).expires_after(m_timeout);
            co_await http::async_write(
                stream, req,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) co_return;

            boost::beast::get_lowest_layer(stream).expires_after(m_timeout);
            co_await http::async_read(
                stream, m_buffer, parser,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        };

        if (auto* s = std::get_if<PlainStream>(&m_stream)) {
            co_await exchange(*s);
        } else {
            co_await exchange(std::get<TlsStream>(m_stream));
        }

        if (ec) {
            close();
            co_return Result<HttpResponse>::err(error_from_ec(
                ec, Error::Code::NetworkError,
                "HTTP exchange with " + m_url.host + " failed"));
        }

        auto beast_res = parser.release();
        const bool keep_alive = beast_res.keep_alive();
        auto response = parse_beast_response(std::move(beast_res));
        if (!keep_alive) close();

        co_return Result<HttpResponse>::ok(std::move(response));
    }

}  // namespace toolbridge
