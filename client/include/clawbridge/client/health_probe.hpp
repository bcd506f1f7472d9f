#pragma once

#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace clawbridge::client
{

    struct ProbeResult
    {
        bool ok{false};
        unsigned status{0};
        std::string detail{};
    };

    // GET {base}/health over HTTP or HTTPS. Runs its own event loop and returns once the response
    // arrives, the request fails, or the timeout passes. ok is set for a 2xx status.
    ProbeResult probe_health(std::string_view base_url, boost::asio::ssl::context &tls_context,
                             std::chrono::seconds timeout = std::chrono::seconds(5));

} // namespace clawbridge::client
