#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "clawbridge/protocol.hpp"

namespace clawbridge::client
{

    // Reply channel for one inbound message; every call emits a frame scoped to that message. A sink
    // may be kept past dispatch() and used later; once the connection is gone its frames are dropped.
    class ReplySink
    {
    public:
        virtual ~ReplySink() = default;

        // Long text is split into several agent_text frames.
        virtual void deliver(std::string_view text) = 0;
        virtual void typing() = 0;
        virtual void done() = 0;
        virtual void fail(std::string_view error) = 0;
    };

    struct DispatchRequest
    {
        protocol::InboundMessage message;
        // Message content with the note context, if any, prepended.
        std::string body;
    };

    class MessageDispatcher
    {
    public:
        virtual ~MessageDispatcher() = default;

        // Exceptions escaping dispatch are reported back to the app as an error frame.
        virtual void dispatch(const DispatchRequest &request, std::shared_ptr<ReplySink> reply) = 0;
    };

    // Answers every message with an error; installed when no agent runtime is wired in.
    class UnavailableDispatcher final : public MessageDispatcher
    {
    public:
        void dispatch(const DispatchRequest &request, std::shared_ptr<ReplySink> reply) override;
    };

    // "[Note context]\n<noteContext>\n\n[User message]\n<content>", or the content alone.
    std::string compose_agent_input(const protocol::InboundMessage &message);

} // namespace clawbridge::client
