#include "clawbridge/client/connection_state.hpp"

#include <algorithm>
#include <array>

namespace clawbridge::client
{

    namespace
    {

        struct StateMapping
        {
            ConnectionState state;
            std::string_view label;
        };

        constexpr std::array<StateMapping, 4> kStateMappings{{
            {ConnectionState::Disconnected, "disconnected"},
            {ConnectionState::Connecting, "connecting"},
            {ConnectionState::Connected, "connected"},
            {ConnectionState::ClosingIntentional, "closing"},
        }};

        struct EventMapping
        {
            SessionEventKind kind;
            std::string_view label;
        };

        constexpr std::array<EventMapping, 7> kEventMappings{{
            {SessionEventKind::ConnectRequested, "connect_requested"},
            {SessionEventKind::ReconnectDue, "reconnect_due"},
            {SessionEventKind::TransportOpened, "transport_opened"},
            {SessionEventKind::TransportClosed, "transport_closed"},
            {SessionEventKind::TransportError, "transport_error"},
            {SessionEventKind::AuthenticationRejected, "authentication_rejected"},
            {SessionEventKind::DisconnectRequested, "disconnect_requested"},
        }};

        struct EffectMapping
        {
            SessionEffect effect;
            std::string_view label;
        };

        constexpr std::array<EffectMapping, 8> kEffectMappings{{
            {SessionEffect::OpenTransport, "open_transport"},
            {SessionEffect::SendHandshake, "send_handshake"},
            {SessionEffect::ScheduleReconnect, "schedule_reconnect"},
            {SessionEffect::CancelReconnect, "cancel_reconnect"},
            {SessionEffect::CloseTransport, "close_transport"},
            {SessionEffect::Retire, "retire"},
            {SessionEffect::ReportAuthenticationFailure, "report_authentication_failure"},
            {SessionEffect::LogError, "log_error"},
        }};

        bool is_live(ConnectionState state)
        {
            return state == ConnectionState::Connecting || state == ConnectionState::Connected;
        }

        Transition on_close(ConnectionState current, std::optional<std::uint16_t> code)
        {
            if (current == ConnectionState::ClosingIntentional)
            {
                return {ConnectionState::Disconnected, {}};
            }
            if (!is_live(current))
            {
                return {current, {}};
            }
            if (code == kCloseSuperseded)
            {
                return {ConnectionState::Disconnected, {SessionEffect::Retire}};
            }
            return {ConnectionState::Disconnected, {SessionEffect::ScheduleReconnect}};
        }

    } // namespace

    std::string_view to_string(ConnectionState state) noexcept
    {
        for (const auto &mapping : kStateMappings)
        {
            if (mapping.state == state)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::string_view to_string(SessionEventKind kind) noexcept
    {
        for (const auto &mapping : kEventMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::string_view to_string(SessionEffect effect) noexcept
    {
        for (const auto &mapping : kEffectMappings)
        {
            if (mapping.effect == effect)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    bool Transition::has(SessionEffect effect) const noexcept
    {
        return std::find(effects.begin(), effects.end(), effect) != effects.end();
    }

    Transition next_transition(ConnectionState current, const SessionEvent &event)
    {
        switch (event.kind)
        {
        case SessionEventKind::ConnectRequested:
            if (current == ConnectionState::Disconnected)
            {
                return {ConnectionState::Connecting, {SessionEffect::CancelReconnect, SessionEffect::OpenTransport}};
            }
            if (current == ConnectionState::ClosingIntentional)
            {
                return {ConnectionState::Connecting, {SessionEffect::OpenTransport}};
            }
            return {current, {}};

        case SessionEventKind::ReconnectDue:
            if (current == ConnectionState::Disconnected)
            {
                return {ConnectionState::Connecting, {SessionEffect::OpenTransport}};
            }
            return {current, {}};

        case SessionEventKind::TransportOpened:
            if (current == ConnectionState::Connecting)
            {
                return {ConnectionState::Connected, {SessionEffect::SendHandshake}};
            }
            if (current == ConnectionState::ClosingIntentional)
            {
                return {current, {SessionEffect::CloseTransport}};
            }
            return {current, {}};

        case SessionEventKind::TransportClosed:
            return on_close(current, event.close_code);

        case SessionEventKind::TransportError:
            return {current, {SessionEffect::LogError}};

        case SessionEventKind::AuthenticationRejected:
            if (is_live(current))
            {
                return {ConnectionState::Disconnected, {SessionEffect::ReportAuthenticationFailure}};
            }
            return on_close(current, event.close_code);

        case SessionEventKind::DisconnectRequested:
            if (is_live(current))
            {
                return {ConnectionState::ClosingIntentional,
                        {SessionEffect::CancelReconnect, SessionEffect::CloseTransport}};
            }
            if (current == ConnectionState::Disconnected)
            {
                return {current, {SessionEffect::CancelReconnect}};
            }
            return {current, {}};
        }
        return {current, {}};
    }

} // namespace clawbridge::client
