#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "clawbridge/client/connection_state.hpp"
#include "clawbridge/client/logger.hpp"
#include "clawbridge/client/pending_requests.hpp"
#include "clawbridge/client/transport.hpp"
#include "clawbridge/endpoint.hpp"
#include "clawbridge/frame_codec.hpp"
#include "clawbridge/protocol.hpp"

namespace clawbridge::client
{

    struct SessionOptions
    {
        std::string url;
        std::string token;
        std::chrono::milliseconds reconnect_delay{3000};
        std::chrono::milliseconds request_timeout{10000};
    };

    // Owns the single WebSocket to the desktop app. Must be created through std::make_shared: timer and
    // transport callbacks hold weak references to the session.
    class ConnectionSession : public std::enable_shared_from_this<ConnectionSession>
    {
    public:
        using MessageHandler = std::function<void(const protocol::InboundMessage &)>;
        using ThreadListHandler = std::function<void(const std::vector<protocol::ThreadInfo> &)>;
        using StateHandler = std::function<void(ConnectionState)>;
        using FileSyncPushHandler = std::function<void(const protocol::FileSyncPush &)>;
        using SnapshotAckHandler = std::function<void(const protocol::FileSnapshotAck &)>;
        using ThreadListResultHandler =
            std::function<void(const RequestResult &, const std::vector<protocol::ThreadInfo> &)>;
        using ThreadInfoResultHandler =
            std::function<void(const RequestResult &, const std::optional<protocol::ThreadInfo> &)>;

        // Throws BridgeError(InvalidConfig) when the url cannot be turned into an endpoint.
        ConnectionSession(boost::asio::io_context &io_context, SessionOptions options, TransportFactory factory,
                          Logger logger);
        ~ConnectionSession();

        ConnectionSession(const ConnectionSession &) = delete;
        ConnectionSession &operator=(const ConnectionSession &) = delete;

        void connect();
        void disconnect();

        // Drops the frame with a warning unless connected.
        void send(const nlohmann::json &frame);

        // Sends {type: kind, requestId, ...params}; the handler runs once, with the response, a timeout,
        // or NotConnected. Returns the correlation id, empty when not connected.
        std::string send_request(const std::string &kind, const nlohmann::json &params, RequestHandler handler,
                                 std::optional<std::chrono::milliseconds> timeout = std::nullopt);

        void send_text(std::string_view content, const protocol::ConversationScope &scope = {});
        void send_typing(const protocol::ConversationScope &scope = {});
        void send_done(const protocol::ConversationScope &scope = {});
        void send_error(std::string_view error, const protocol::ConversationScope &scope = {});
        void send_pulse(std::string_view content);

        void request_thread_list(ThreadListResultHandler handler);
        void request_thread_info(const std::string &thread_id, ThreadInfoResultHandler handler);

        bool is_connected() const noexcept { return state_ == ConnectionState::Connected; }
        ConnectionState state() const noexcept { return state_; }
        bool retired() const noexcept { return retired_; }
        bool authentication_rejected() const noexcept { return authentication_rejected_; }
        bool reconnect_pending() const noexcept { return reconnect_pending_; }
        std::size_t pending_request_count() const noexcept { return pending_.size(); }
        const Endpoint &endpoint() const noexcept { return endpoint_; }

        const std::vector<protocol::ThreadInfo> &threads() const noexcept { return threads_; }
        std::optional<protocol::ThreadInfo> find_thread(const std::string &thread_id) const;
        std::optional<protocol::ThreadInfo> find_thread_by_path(const std::string &relative_path) const;

        void set_message_handler(MessageHandler handler) { on_message_ = std::move(handler); }
        void set_thread_list_handler(ThreadListHandler handler) { on_thread_list_ = std::move(handler); }
        void set_state_handler(StateHandler handler) { on_state_ = std::move(handler); }
        void set_file_sync_handlers(FileSyncPushHandler on_push, SnapshotAckHandler on_ack);

    private:
        void apply(const SessionEvent &event);
        void run_effect(SessionEffect effect);
        void open_transport();
        void schedule_reconnect();
        void cancel_reconnect();

        void on_transport_open(std::uint64_t generation);
        void on_transport_message(std::uint64_t generation, const std::string &text);
        void on_transport_close(std::uint64_t generation, const CloseInfo &info);
        void on_transport_error(std::uint64_t generation, const std::string &message);

        void handle_frame(const std::string &text);
        void dispatch_frame(const protocol::DecodedFrame &frame);
        void handle_response(const nlohmann::json &message);
        void handle_thread_list(const nlohmann::json &message);

        boost::asio::io_context &io_context_;
        SessionOptions options_;
        TransportFactory factory_;
        Logger logger_;
        Endpoint endpoint_;

        ConnectionState state_{ConnectionState::Disconnected};
        std::shared_ptr<Transport> transport_;
        std::uint64_t generation_{0};

        boost::asio::steady_timer reconnect_timer_;
        std::uint64_t reconnect_token_{0};
        bool reconnect_pending_{false};
        bool retired_{false};
        bool authentication_rejected_{false};

        PendingRequestTable pending_;
        std::vector<protocol::ThreadInfo> threads_;

        MessageHandler on_message_;
        ThreadListHandler on_thread_list_;
        StateHandler on_state_;
        FileSyncPushHandler on_file_sync_push_;
        SnapshotAckHandler on_snapshot_ack_;
    };

} // namespace clawbridge::client
