// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef BLYNKCTL_HTTPCLIENT_HXX
#define BLYNKCTL_HTTPCLIENT_HXX

#include <boost/asio/io_context.hpp>

#include "system/BlynkErr.hxx"

namespace blynkCtl
{
    struct HttpUrl {
        std::string host;           // brackets stripped for IPv6 literals
        std::string port{"80"};
        std::string target{"/"};    // path + query
        std::string host_header;    // value for the Host field
    };

    /** Splits "http://host[:port][/path][?query]". Only plain http is accepted. */
    [[nodiscard]] std::optional<HttpUrl> parseHttpUrl(std::string_view url);

    struct HttpResponse {
        unsigned status{0};
        std::string body;
    };

    class HttpTransport {
    public:
        virtual ~HttpTransport() = default;

        /**
         * @brief Blocking GET, one connection per call.
         * A received response is Ok whatever its status; callers judge the status.
         */
        virtual BlynkErr get(const std::string& url, HttpResponse& out) = 0;
    };

    // Boost.Beast client
    class BeastHttpTransport final : public HttpTransport {
    public:
        BeastHttpTransport() = default;
        BeastHttpTransport(const BeastHttpTransport&) = delete;
        BeastHttpTransport& operator=(const BeastHttpTransport&) = delete;

        BlynkErr get(const std::string& url, HttpResponse& out) override;

    private:
        boost::asio::io_context m_ioc;
    };

} // namespace blynkCtl

#endif //BLYNKCTL_HTTPCLIENT_HXX
