#include "clawbridge/error_codes.hpp"

#include <array>
#include <utility>

namespace clawbridge
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 12> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::TransportError, "transport_error"},
            {ErrorCode::ProtocolError, "protocol_error"},
            {ErrorCode::RequestTimeout, "request_timeout"},
            {ErrorCode::RequestFailed, "request_failed"},
            {ErrorCode::FilesystemError, "filesystem_error"},
            {ErrorCode::InvalidPath, "invalid_path"},
            {ErrorCode::NotConnected, "not_connected"},
            {ErrorCode::AuthenticationFailed, "authentication_failed"},
            {ErrorCode::Superseded, "superseded"},
            {ErrorCode::InvalidConfig, "invalid_config"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    BridgeError::BridgeError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    ProtocolError::ProtocolError(std::string message)
        : BridgeError(ErrorCode::ProtocolError, std::move(message)) {}

    FilesystemError::FilesystemError(ErrorCode code, std::string message)
        : BridgeError(code, std::move(message)) {}

} // namespace clawbridge
