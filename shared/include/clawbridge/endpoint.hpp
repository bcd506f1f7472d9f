/**
 * ClawBridge - Derivation of the WebSocket endpoint from the app's base address.
 */
#pragma once

#include <string>
#include <string_view>

namespace clawbridge
{

    struct BaseAddress
    {
        bool secure{};
        std::string authority; // host[:port] as written in the base address
        std::string host;
        std::string port;
        std::string path_prefix; // "" or "/prefix" without trailing slash
    };

    struct Endpoint
    {
        bool secure{};
        std::string authority;
        std::string host;
        std::string port;
        std::string target; // path and query sent in the upgrade request

        std::string url() const;
        // url() with the token query value masked, for logging.
        std::string redacted_url() const;
    };

    // Accepts http://, https://, ws://, wss:// or a bare host. Throws BridgeError(InvalidConfig) when no host is present.
    BaseAddress parse_base_address(std::string_view base_url);

    // {ws|wss}://{host[:port]}{prefix}/ws?token={urlencoded token}
    Endpoint derive_endpoint(std::string_view base_url, std::string_view token);

    // encodeURIComponent semantics: unreserved characters are A-Z a-z 0-9 - _ . ! ~ * ' ( )
    std::string url_encode_component(std::string_view value);

} // namespace clawbridge
