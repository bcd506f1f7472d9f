/**
 * ClawBridge - JSON text frame encoding and validation.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "clawbridge/protocol.hpp"

namespace clawbridge::protocol
{

    struct DecodedFrame
    {
        nlohmann::json message;
        std::string type;
        std::optional<FrameType> known_type{};
    };

    std::string encode_frame(const nlohmann::json &message);

    // Throws ProtocolError when the text is not a JSON object carrying a string "type".
    DecodedFrame decode_frame(std::string_view text);

} // namespace clawbridge::protocol
