#pragma once

#include <string>
#include <string_view>

#include "result.hpp"

namespace toolbridge {

    struct UrlComponents {
        bool https{false};
        std::string host;
        std::string port;
        /// Request target: path plus optional query, never empty.
        std::string target;
    };

    /// @brief Parse an absolute http:// or https:// URL into its components.
    /// @return UrlComponents on success, Error::Code::InvalidUrl otherwise.
    /// @note Default ports are filled in (80/443). IPv6 literals are not
    /// supported.
    inline Result<UrlComponents> parse_url(std::string_view url) {
        auto make_err = [&](std::string msg) -> Result<UrlComponents> {
            return Result<UrlComponents>::err(Error::Code::InvalidUrl,
                                              std::move(msg) + ": '" +
                                                  std::string(url) + "'");
        };

        std::string_view s(url);

        bool https = false;
        if (s.rfind("https://", 0) == 0) {
            https = true;
            s.remove_prefix(std::string_view("https://").size());
        } else if (s.rfind("http://", 0) == 0) {
            s.remove_prefix(std::string_view("http://").size());
        } else {
            return make_err("URL must start with http:// or https://");
        }

        // Split host[:port] from the target
        std::string_view hostport = s;
        std::string_view target = "/";
        if (auto cut = s.find_first_of("/?"); cut != std::string_view::npos) {
            hostport = s.substr(0, cut);
            target = s.substr(cut);
        }

        if (hostport.empty()) {
            return make_err("URL missing host");
        }

        UrlComponents out;
        out.https = https;

        if (auto colon = hostport.rfind(':'); colon != std::string_view::npos) {
            out.host = std::string(hostport.substr(0, colon));
            out.port = std::string(hostport.substr(colon + 1));
            if (out.port.empty()) {
                return make_err("URL has empty port");
            }
            for (char c : out.port) {
                if (c < '0' || c > '9') return make_err("URL has invalid port");
            }
        } else {
            out.host = std::string(hostport);
            out.port = https ? "443" : "80";
        }

        if (out.host.empty()) {
            return make_err("URL has empty host");
        }

        out.target = std::string(target);
        if (out.target.front() == '?') out.target.insert(out.target.begin(), '/');
        return Result<UrlComponents>::ok(std::move(out));
    }

}  // namespace toolbridge
