// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "http/HttpClient.hxx"
#include "system/Logging.hxx"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace blynkCtl
{
    namespace beast = boost::beast;
    namespace http = beast::http;
    using tcp = boost::asio::ip::tcp;

    static constexpr char TAG[] = "HttpClient";
    static constexpr std::string_view HTTP_SCHEME = "http://";
    static constexpr int HTTP_VERSION_1_1 = 11;

    std::optional<HttpUrl> parseHttpUrl(std::string_view url) {
        if (url.size() < HTTP_SCHEME.size()) return std::nullopt;
        const bool scheme_ok = std::ranges::equal(url.substr(0, HTTP_SCHEME.size()), HTTP_SCHEME,
            [](const char a, const char b) { return std::tolower(static_cast<unsigned char>(a)) == b; });
        if (!scheme_ok) return std::nullopt;
        url.remove_prefix(HTTP_SCHEME.size());

        HttpUrl result;
        const auto path_pos = url.find_first_of("/?");
        std::string_view authority = url.substr(0, path_pos);
        if (path_pos != std::string_view::npos) {
            result.target = std::string(url.substr(path_pos));
            if (result.target.front() == '?') result.target.insert(0, "/");
        }
        if (authority.empty() || authority.find('@') != std::string_view::npos) return std::nullopt;
        result.host_header = std::string(authority);

        std::string_view port;
        if (authority.front() == '[') {
            const auto close = authority.find(']');
            if (close == std::string_view::npos) return std::nullopt;
            result.host = std::string(authority.substr(1, close - 1));
            const auto rest = authority.substr(close + 1);
            if (!rest.empty()) {
                if (rest.front() != ':') return std::nullopt;
                port = rest.substr(1);
            }
        } else if (const auto colon = authority.find(':'); colon != std::string_view::npos) {
            result.host = std::string(authority.substr(0, colon));
            port = authority.substr(colon + 1);
        } else {
            result.host = std::string(authority);
        }
        if (result.host.empty()) return std::nullopt;

        if (!port.empty()) {
            unsigned port_num = 0;
            const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), port_num);
            if (ec != std::errc() || ptr != port.data() + port.size() || port_num == 0 || port_num > 65535) {
                return std::nullopt;
            }
            result.port = std::string(port);
        }
        return result;
    }

    BlynkErr BeastHttpTransport::get(const std::string& url, HttpResponse& out) {
        const auto log = logging::get(TAG);

        const auto parsed = parseHttpUrl(url);
        if (!parsed) {
            log->error("Unsupported URL '{}' (expected http://host[:port]/path)", url);
            return BlynkErr::InvalidConfig;
        }

        boost::system::error_code ec;
        tcp::resolver resolver(m_ioc);
        const auto endpoints = resolver.resolve(parsed->host, parsed->port, ec);
        if (ec) {
            log->error("DNS lookup failed for '{}': {}", parsed->host, ec.message());
            return BlynkErr::Transport;
        }

        beast::tcp_stream stream(m_ioc);
        stream.connect(endpoints, ec);
        if (ec) {
            log->error("Failed to connect to {}:{}: {}", parsed->host, parsed->port, ec.message());
            return BlynkErr::Transport;
        }

        http::request<http::empty_body> req{http::verb::get, parsed->target, HTTP_VERSION_1_1};
        req.set(http::field::host, parsed->host_header);
        req.set(http::field::user_agent, "blynkctl/" BLYNKCTL_VERSION);

        log->debug("GET http://{}{}", parsed->host_header, parsed->target);
        http::write(stream, req, ec);
        if (ec) {
            log->error("Failed to send request to {}: {}", parsed->host_header, ec.message());
            return BlynkErr::Transport;
        }

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(stream, buffer, res, ec);
        if (ec) {
            log->error("Failed to read response from {}: {}", parsed->host_header, ec.message());
            return BlynkErr::Transport;
        }

        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != beast::errc::not_connected) {
            log->debug("Socket shutdown: {}", ec.message());
        }

        out.status = res.result_int();
        out.body = std::move(res.body());
        log->debug("HTTP {} ({} bytes)", out.status, out.body.size());
        return BlynkErr::Ok;
    }
}
