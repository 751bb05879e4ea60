#pragma once

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <memory>
#include <stdexcept>
#include <string>

namespace toolbridge {

    using TlsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;

    /// @brief Set the SNI host name and the expected peer name for
    /// certificate verification.
    /// @return false with ec set if OpenSSL rejects the host name.
    inline bool set_sni(TlsStream& stream, const std::string& host,
                        boost::system::error_code& ec) {
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        if (!SSL_set1_host(stream.native_handle(), host.c_str())) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

    /// @brief Client TLS context shared by every server of one pool.
    /// @param verify_peer Load the system CA store and verify peers.
    /// @throws std::runtime_error if the CA store cannot be loaded.
    inline std::shared_ptr<boost::asio::ssl::context> make_tls_context(
        bool verify_peer) {
        auto ctx = std::make_shared<boost::asio::ssl::context>(
            boost::asio::ssl::context::tls_client);

        if (!verify_peer) {
            ctx->set_verify_mode(boost::asio::ssl::verify_none);
            return ctx;
        }

        try {
            ctx->set_default_verify_paths();
        } catch (const boost::system::system_error& e) {
            throw std::runtime_error(
                std::string("Failed to set default verify paths: ") + e.what());
        }

        ctx->set_verify_mode(boost::asio::ssl::verify_peer);
        return ctx;
    }

}  // namespace toolbridge
