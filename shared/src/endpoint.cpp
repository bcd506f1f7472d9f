#include "clawbridge/endpoint.hpp"

#include <cctype>

#include "clawbridge/error_codes.hpp"

namespace clawbridge
{

    namespace
    {

        bool starts_with_ignore_case(std::string_view value, std::string_view prefix)
        {
            if (value.size() < prefix.size())
            {
                return false;
            }
            for (std::size_t i = 0; i < prefix.size(); ++i)
            {
                if (std::tolower(static_cast<unsigned char>(value[i])) != prefix[i])
                {
                    return false;
                }
            }
            return true;
        }

        bool is_unreserved(unsigned char ch)
        {
            if (std::isalnum(ch))
            {
                return true;
            }
            switch (ch)
            {
            case '-':
            case '_':
            case '.':
            case '!':
            case '~':
            case '*':
            case '\'':
            case '(':
            case ')':
                return true;
            default:
                return false;
            }
        }

    } // namespace

    std::string Endpoint::url() const
    {
        return std::string(secure ? "wss" : "ws") + "://" + authority + target;
    }

    std::string Endpoint::redacted_url() const
    {
        const auto query = target.find("?token=");
        if (query == std::string::npos)
        {
            return url();
        }
        return std::string(secure ? "wss" : "ws") + "://" + authority + target.substr(0, query) + "?token=***";
    }

    BaseAddress parse_base_address(std::string_view base_url)
    {
        std::string_view rest = base_url;
        while (!rest.empty() && std::isspace(static_cast<unsigned char>(rest.back())))
        {
            rest.remove_suffix(1);
        }
        while (!rest.empty() && std::isspace(static_cast<unsigned char>(rest.front())))
        {
            rest.remove_prefix(1);
        }

        BaseAddress address;
        if (starts_with_ignore_case(rest, "https://"))
        {
            address.secure = true;
            rest.remove_prefix(8);
        }
        else if (starts_with_ignore_case(rest, "http://"))
        {
            rest.remove_prefix(7);
        }
        else if (starts_with_ignore_case(rest, "wss://"))
        {
            address.secure = true;
            rest.remove_prefix(6);
        }
        else if (starts_with_ignore_case(rest, "ws://"))
        {
            rest.remove_prefix(5);
        }

        while (!rest.empty() && rest.back() == '/')
        {
            rest.remove_suffix(1);
        }

        const auto slash = rest.find('/');
        address.authority = std::string(rest.substr(0, slash));
        if (slash != std::string_view::npos)
        {
            address.path_prefix = std::string(rest.substr(slash));
        }
        if (address.authority.empty())
        {
            throw BridgeError(ErrorCode::InvalidConfig, "Base address has no host: " + std::string(base_url));
        }

        std::string_view authority = address.authority;
        std::size_t port_separator = std::string_view::npos;
        if (authority.front() == '[')
        {
            const auto close = authority.find(']');
            if (close == std::string_view::npos)
            {
                throw BridgeError(ErrorCode::InvalidConfig, "Malformed IPv6 host: " + address.authority);
            }
            address.host = std::string(authority.substr(1, close - 1));
            if (close + 1 < authority.size() && authority[close + 1] == ':')
            {
                port_separator = close + 1;
            }
        }
        else
        {
            port_separator = authority.rfind(':');
            address.host = std::string(authority.substr(0, port_separator));
        }
        if (address.host.empty())
        {
            throw BridgeError(ErrorCode::InvalidConfig, "Base address has no host: " + std::string(base_url));
        }

        if (port_separator != std::string_view::npos && port_separator + 1 < authority.size())
        {
            address.port = std::string(authority.substr(port_separator + 1));
        }
        else
        {
            address.port = address.secure ? "443" : "80";
        }
        return address;
    }

    Endpoint derive_endpoint(std::string_view base_url, std::string_view token)
    {
        const auto address = parse_base_address(base_url);
        Endpoint endpoint;
        endpoint.secure = address.secure;
        endpoint.authority = address.authority;
        endpoint.host = address.host;
        endpoint.port = address.port;
        endpoint.target = address.path_prefix + "/ws?token=" + url_encode_component(token);
        return endpoint;
    }

    std::string url_encode_component(std::string_view value)
    {
        static constexpr char kHexDigits[] = "0123456789ABCDEF";
        std::string encoded;
        encoded.reserve(value.size());
        for (const char ch : value)
        {
            const auto byte = static_cast<unsigned char>(ch);
            if (is_unreserved(byte))
            {
                encoded.push_back(ch);
                continue;
            }
            encoded.push_back('%');
            encoded.push_back(kHexDigits[(byte >> 4) & 0x0F]);
            encoded.push_back(kHexDigits[byte & 0x0F]);
        }
        return encoded;
    }

} // namespace clawbridge
