/**
 * ClawBridge - Shared error codes used across the session and sync layers.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace clawbridge
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        TransportError = 1,
        ProtocolError = 2,
        RequestTimeout = 3,
        RequestFailed = 4,
        FilesystemError = 5,
        InvalidPath = 6,
        NotConnected = 7,
        AuthenticationFailed = 8,
        Superseded = 9,
        InvalidConfig = 10,
        InternalError = 11
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    class BridgeError : public std::runtime_error
    {
    public:
        BridgeError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    class ProtocolError : public BridgeError
    {
    public:
        explicit ProtocolError(std::string message);
    };

    class FilesystemError : public BridgeError
    {
    public:
        FilesystemError(ErrorCode code, std::string message);
    };

} // namespace clawbridge
