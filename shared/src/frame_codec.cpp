#include "clawbridge/frame_codec.hpp"

#include <utility>

#include "clawbridge/error_codes.hpp"

namespace clawbridge::protocol
{

    std::string encode_frame(const nlohmann::json &message)
    {
        if (!message.is_object() || !message.contains("type"))
        {
            throw ProtocolError("Outbound frame must be an object with a type");
        }
        return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    DecodedFrame decode_frame(std::string_view text)
    {
        nlohmann::json message = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
        if (message.is_discarded())
        {
            throw ProtocolError("Frame is not valid JSON");
        }
        if (!message.is_object())
        {
            throw ProtocolError("Frame is not a JSON object");
        }
        const auto it = message.find("type");
        if (it == message.end() || !it->is_string())
        {
            throw ProtocolError("Frame has no type discriminant");
        }
        DecodedFrame frame;
        frame.type = it->get<std::string>();
        frame.known_type = frame_type_from_string(frame.type);
        frame.message = std::move(message);
        return frame;
    }

} // namespace clawbridge::protocol
