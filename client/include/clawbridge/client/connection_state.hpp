#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace clawbridge::client
{

    enum class ConnectionState : std::uint8_t
    {
        Disconnected,
        Connecting,
        Connected,
        ClosingIntentional
    };

    std::string_view to_string(ConnectionState state) noexcept;

    // Close codes with special meaning to the session.
    inline constexpr std::uint16_t kCloseSuperseded = 4000;
    inline constexpr std::uint16_t kCloseAbnormal = 1006;

    enum class SessionEventKind : std::uint8_t
    {
        ConnectRequested,
        ReconnectDue,
        TransportOpened,
        TransportClosed,
        TransportError,
        AuthenticationRejected,
        DisconnectRequested
    };

    std::string_view to_string(SessionEventKind kind) noexcept;

    struct SessionEvent
    {
        SessionEventKind kind{SessionEventKind::ConnectRequested};
        std::optional<std::uint16_t> close_code{};
    };

    enum class SessionEffect : std::uint8_t
    {
        OpenTransport,
        SendHandshake,
        ScheduleReconnect,
        CancelReconnect,
        CloseTransport,
        Retire,
        ReportAuthenticationFailure,
        LogError
    };

    std::string_view to_string(SessionEffect effect) noexcept;

    struct Transition
    {
        ConnectionState next{ConnectionState::Disconnected};
        std::vector<SessionEffect> effects;

        bool has(SessionEffect effect) const noexcept;
    };

    // Pure transition function of the connection session. Retirement after a superseded close is
    // reported as an effect; refusing later connect requests is up to the caller.
    Transition next_transition(ConnectionState current, const SessionEvent &event);

} // namespace clawbridge::client
