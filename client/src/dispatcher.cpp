#include "clawbridge/client/dispatcher.hpp"

namespace clawbridge::client
{

    void UnavailableDispatcher::dispatch(const DispatchRequest & /*request*/, std::shared_ptr<ReplySink> reply)
    {
        reply->fail("Agent dispatch not available");
    }

    std::string compose_agent_input(const protocol::InboundMessage &message)
    {
        if (!message.note_context || message.note_context->empty())
        {
            return message.content;
        }
        return "[Note context]\n" + *message.note_context + "\n\n[User message]\n" + message.content;
    }

} // namespace clawbridge::client
