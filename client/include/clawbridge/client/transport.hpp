#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "clawbridge/client/connection_state.hpp"
#include "clawbridge/endpoint.hpp"

namespace clawbridge::client
{

    struct CloseInfo
    {
        std::uint16_t code{kCloseAbnormal};
        std::string reason{};
        // Set when the upgrade request itself was refused with HTTP 401 or 403.
        bool authentication_rejected{false};
    };

    // One WebSocket connection attempt. Every open() is followed by exactly one on_close, whether the
    // attempt succeeded or not, and on_error is always followed by on_close.
    class Transport
    {
    public:
        struct Handlers
        {
            std::function<void()> on_open;
            std::function<void(std::string)> on_message;
            std::function<void(const CloseInfo &)> on_close;
            std::function<void(const std::string &)> on_error;
        };

        virtual ~Transport() = default;

        virtual void open(const Endpoint &endpoint) = 0;
        virtual void send(std::string text) = 0;
        virtual void close() = 0;

        // Drops the handlers; no callback fires afterwards.
        virtual void detach() noexcept = 0;
    };

    using TransportFactory = std::function<std::shared_ptr<Transport>(const Endpoint &, Transport::Handlers)>;

} // namespace clawbridge::client
