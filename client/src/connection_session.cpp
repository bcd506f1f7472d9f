#include "clawbridge/client/connection_session.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <exception>
#include <utility>

#include "clawbridge/error_codes.hpp"

namespace clawbridge::client
{

    namespace
    {

        std::string string_field(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && it->is_string())
            {
                return it->get<std::string>();
            }
            return {};
        }

        std::string describe_frame_type(const nlohmann::json &frame)
        {
            const auto type = string_field(frame, "type");
            return type.empty() ? std::string("<untyped>") : type;
        }

    } // namespace

    ConnectionSession::ConnectionSession(boost::asio::io_context &io_context, SessionOptions options,
                                         TransportFactory factory, Logger logger)
        : io_context_(io_context),
          options_(std::move(options)),
          factory_(std::move(factory)),
          logger_(std::move(logger)),
          endpoint_(derive_endpoint(options_.url, options_.token)),
          reconnect_timer_(io_context) {}

    ConnectionSession::~ConnectionSession()
    {
        ++reconnect_token_;
        reconnect_timer_.cancel();
        if (transport_)
        {
            transport_->detach();
            transport_->close();
            transport_.reset();
        }
        pending_.cancel_all();
    }

    void ConnectionSession::connect()
    {
        if (retired_)
        {
            logger_.warn("session", "connect refused: this session was superseded by a newer connection");
            return;
        }
        authentication_rejected_ = false;
        apply(SessionEvent{.kind = SessionEventKind::ConnectRequested});
    }

    void ConnectionSession::disconnect()
    {
        apply(SessionEvent{.kind = SessionEventKind::DisconnectRequested});
    }

    void ConnectionSession::send(const nlohmann::json &frame)
    {
        if (state_ != ConnectionState::Connected || !transport_)
        {
            logger_.warn("session", "cannot send ", describe_frame_type(frame), ": not connected");
            return;
        }
        try
        {
            transport_->send(protocol::encode_frame(frame));
        }
        catch (const BridgeError &ex)
        {
            logger_.error("session", "dropping outbound frame: ", ex.what());
        }
    }

    std::string ConnectionSession::send_request(const std::string &kind, const nlohmann::json &params,
                                                RequestHandler handler,
                                                std::optional<std::chrono::milliseconds> timeout)
    {
        if (state_ != ConnectionState::Connected || !transport_)
        {
            logger_.warn("rpc", kind, " not sent: not connected");
            if (handler)
            {
                boost::asio::post(io_context_, [handler = std::move(handler)]()
                                  { handler(RequestResult{.error = ErrorCode::NotConnected,
                                                          .message = "Not connected",
                                                          .payload = nlohmann::json::object()}); });
            }
            return {};
        }

        const auto deadline_after = timeout.value_or(options_.request_timeout);
        const auto now = PendingRequestTable::Clock::now();
        auto id = pending_.next_correlation_id();
        auto timer = std::make_shared<boost::asio::steady_timer>(io_context_, deadline_after);

        pending_.add(PendingRequestTable::Entry{
            .correlation_id = id,
            .kind = kind,
            .created_at = now,
            .deadline = now + deadline_after,
            .handler = std::move(handler),
            .cancel_timeout = [timer]()
            { timer->cancel(); },
        });

        std::weak_ptr<ConnectionSession> weak = weak_from_this();
        timer->async_wait([weak, id, timer](const boost::system::error_code &ec)
                          {
                              if (ec)
                              {
                                  return;
                              }
                              if (auto self = weak.lock())
                              {
                                  self->logger_.warn("rpc", "request ", id, " timed out");
                                  self->pending_.expire(id);
                              } });

        logger_.debug("rpc", "request ", kind, " id=", id);
        send(protocol::make_request_frame(kind, id, params));
        return id;
    }

    void ConnectionSession::send_text(std::string_view content, const protocol::ConversationScope &scope)
    {
        send(protocol::make_agent_text_frame(scope, content));
    }

    void ConnectionSession::send_typing(const protocol::ConversationScope &scope)
    {
        send(protocol::make_agent_typing_frame(scope));
    }

    void ConnectionSession::send_done(const protocol::ConversationScope &scope)
    {
        send(protocol::make_agent_done_frame(scope));
    }

    void ConnectionSession::send_error(std::string_view error, const protocol::ConversationScope &scope)
    {
        send(protocol::make_error_frame(scope, error));
    }

    void ConnectionSession::send_pulse(std::string_view content)
    {
        send(protocol::make_pulse_frame(content));
    }

    void ConnectionSession::request_thread_list(ThreadListResultHandler handler)
    {
        std::weak_ptr<ConnectionSession> weak = weak_from_this();
        send_request(std::string(protocol::to_string(protocol::FrameType::ThreadListRequest)),
                     nlohmann::json::object(),
                     [weak, handler = std::move(handler)](RequestResult result)
                     {
                         std::vector<protocol::ThreadInfo> threads;
                         const auto it = result.payload.find("threads");
                         if (result.ok() && it != result.payload.end() && it->is_array())
                         {
                             try
                             {
                                 threads = it->get<std::vector<protocol::ThreadInfo>>();
                                 if (auto self = weak.lock())
                                 {
                                     self->threads_ = threads;
                                 }
                             }
                             catch (const std::exception &ex)
                             {
                                 result.error = ErrorCode::ProtocolError;
                                 result.message = std::string("Malformed thread list: ") + ex.what();
                             }
                         }
                         else if (result.ok() || result.error == ErrorCode::RequestFailed)
                         {
                             result.error = ErrorCode::RequestFailed;
                             if (result.message.empty())
                             {
                                 result.message = "Failed to get thread list";
                             }
                         }
                         if (handler)
                         {
                             handler(result, threads);
                         }
                     });
    }

    void ConnectionSession::request_thread_info(const std::string &thread_id, ThreadInfoResultHandler handler)
    {
        send_request(std::string(protocol::to_string(protocol::FrameType::ThreadInfoRequest)),
                     nlohmann::json{{"threadId", thread_id}},
                     [handler = std::move(handler)](RequestResult result)
                     {
                         std::optional<protocol::ThreadInfo> thread;
                         const auto it = result.payload.find("thread");
                         if (result.ok() && it != result.payload.end() && it->is_object())
                         {
                             try
                             {
                                 thread = it->get<protocol::ThreadInfo>();
                             }
                             catch (const std::exception &ex)
                             {
                                 result.error = ErrorCode::ProtocolError;
                                 result.message = std::string("Malformed thread info: ") + ex.what();
                             }
                         }
                         else if (result.ok() || result.error == ErrorCode::RequestFailed)
                         {
                             result.error = ErrorCode::RequestFailed;
                             if (result.message.empty())
                             {
                                 result.message = "Thread not found";
                             }
                         }
                         if (handler)
                         {
                             handler(result, thread);
                         }
                     });
    }

    std::optional<protocol::ThreadInfo> ConnectionSession::find_thread(const std::string &thread_id) const
    {
        const auto it = std::find_if(threads_.begin(), threads_.end(),
                                     [&](const protocol::ThreadInfo &thread)
                                     { return thread.id == thread_id; });
        if (it == threads_.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    std::optional<protocol::ThreadInfo> ConnectionSession::find_thread_by_path(const std::string &relative_path) const
    {
        const auto it = std::find_if(threads_.begin(), threads_.end(),
                                     [&](const protocol::ThreadInfo &thread)
                                     { return thread.path == relative_path; });
        if (it == threads_.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    void ConnectionSession::set_file_sync_handlers(FileSyncPushHandler on_push, SnapshotAckHandler on_ack)
    {
        on_file_sync_push_ = std::move(on_push);
        on_snapshot_ack_ = std::move(on_ack);
    }

    void ConnectionSession::apply(const SessionEvent &event)
    {
        const auto previous = state_;
        const auto transition = next_transition(state_, event);
        state_ = transition.next;
        logger_.debug("session", to_string(event.kind), ": ", to_string(previous), " -> ", to_string(state_));
        for (const auto effect : transition.effects)
        {
            run_effect(effect);
        }
        if (previous != state_ && on_state_)
        {
            on_state_(state_);
        }
    }

    void ConnectionSession::run_effect(SessionEffect effect)
    {
        switch (effect)
        {
        case SessionEffect::OpenTransport:
            open_transport();
            break;
        case SessionEffect::SendHandshake:
            logger_.info("session", "connected to ", endpoint_.redacted_url());
            send(protocol::make_connected_frame());
            break;
        case SessionEffect::ScheduleReconnect:
            schedule_reconnect();
            break;
        case SessionEffect::CancelReconnect:
            cancel_reconnect();
            break;
        case SessionEffect::CloseTransport:
            if (transport_)
            {
                transport_->close();
            }
            break;
        case SessionEffect::Retire:
            retired_ = true;
            logger_.info("session", "closed: replaced by a newer connection, not reconnecting");
            break;
        case SessionEffect::ReportAuthenticationFailure:
            authentication_rejected_ = true;
            logger_.error("session", "authentication rejected by ", endpoint_.authority,
                          "; not reconnecting until the next explicit connect");
            break;
        case SessionEffect::LogError:
            break;
        }
    }

    void ConnectionSession::open_transport()
    {
        if (transport_)
        {
            transport_->detach();
            transport_->close();
            transport_.reset();
        }

        const auto generation = ++generation_;
        std::weak_ptr<ConnectionSession> weak = weak_from_this();
        Transport::Handlers handlers{
            .on_open = [weak, generation]()
            {
                if (auto self = weak.lock())
                {
                    self->on_transport_open(generation);
                }
            },
            .on_message = [weak, generation](std::string text)
            {
                if (auto self = weak.lock())
                {
                    self->on_transport_message(generation, text);
                }
            },
            .on_close = [weak, generation](const CloseInfo &info)
            {
                if (auto self = weak.lock())
                {
                    self->on_transport_close(generation, info);
                }
            },
            .on_error = [weak, generation](const std::string &message)
            {
                if (auto self = weak.lock())
                {
                    self->on_transport_error(generation, message);
                }
            },
        };

        logger_.info("session", "connecting to ", endpoint_.redacted_url());
        try
        {
            transport_ = factory_(endpoint_, std::move(handlers));
            transport_->open(endpoint_);
        }
        catch (const std::exception &ex)
        {
            // Keep the single close trigger: report the failed attempt as an abnormal close.
            logger_.error("session", "unable to open transport: ", ex.what());
            boost::asio::post(io_context_, [weak, generation, reason = std::string(ex.what())]()
                              {
                                  if (auto self = weak.lock())
                                  {
                                      self->on_transport_close(generation, CloseInfo{.code = kCloseAbnormal,
                                                                                     .reason = reason});
                                  } });
        }
    }

    void ConnectionSession::schedule_reconnect()
    {
        const auto token = ++reconnect_token_;
        reconnect_pending_ = true;
        logger_.info("session", "reconnecting in ", options_.reconnect_delay.count(), "ms");
        reconnect_timer_.expires_after(options_.reconnect_delay);
        std::weak_ptr<ConnectionSession> weak = weak_from_this();
        reconnect_timer_.async_wait([weak, token](const boost::system::error_code &ec)
                                    {
                                        if (ec)
                                        {
                                            return;
                                        }
                                        auto self = weak.lock();
                                        if (!self || self->reconnect_token_ != token)
                                        {
                                            return;
                                        }
                                        self->reconnect_pending_ = false;
                                        self->apply(SessionEvent{.kind = SessionEventKind::ReconnectDue}); });
    }

    void ConnectionSession::cancel_reconnect()
    {
        ++reconnect_token_;
        reconnect_pending_ = false;
        reconnect_timer_.cancel();
    }

    void ConnectionSession::on_transport_open(std::uint64_t generation)
    {
        if (generation != generation_)
        {
            return;
        }
        apply(SessionEvent{.kind = SessionEventKind::TransportOpened});
    }

    void ConnectionSession::on_transport_message(std::uint64_t generation, const std::string &text)
    {
        if (generation != generation_)
        {
            return;
        }
        handle_frame(text);
    }

    void ConnectionSession::on_transport_close(std::uint64_t generation, const CloseInfo &info)
    {
        if (generation != generation_)
        {
            return;
        }
        transport_.reset();
        if (state_ != ConnectionState::ClosingIntentional)
        {
            logger_.warn("session", "disconnected (code: ", info.code, ", reason: ", info.reason, ")");
        }
        else
        {
            logger_.info("session", "closed");
        }
        apply(SessionEvent{
            .kind = info.authentication_rejected ? SessionEventKind::AuthenticationRejected
                                                 : SessionEventKind::TransportClosed,
            .close_code = info.code,
        });
    }

    void ConnectionSession::on_transport_error(std::uint64_t generation, const std::string &message)
    {
        if (generation != generation_)
        {
            return;
        }
        logger_.error("session", "transport error: ", message);
        apply(SessionEvent{.kind = SessionEventKind::TransportError});
    }

    void ConnectionSession::handle_frame(const std::string &text)
    {
        protocol::DecodedFrame frame;
        try
        {
            frame = protocol::decode_frame(text);
        }
        catch (const ProtocolError &ex)
        {
            logger_.warn("session", "protocol error: ", ex.what());
            return;
        }

        try
        {
            dispatch_frame(frame);
        }
        catch (const nlohmann::json::exception &ex)
        {
            logger_.warn("session", "protocol error: malformed ", frame.type, " frame: ", ex.what());
        }
        catch (const std::exception &ex)
        {
            logger_.error("session", "handling ", frame.type, " failed: ", ex.what());
        }
    }

    void ConnectionSession::dispatch_frame(const protocol::DecodedFrame &frame)
    {
        using protocol::FrameType;

        if (!frame.known_type)
        {
            logger_.warn("session", "protocol error: unknown frame type ", frame.type);
            return;
        }

        switch (*frame.known_type)
        {
        case FrameType::Response:
            handle_response(frame.message);
            return;
        case FrameType::ThreadList:
            handle_thread_list(frame.message);
            return;
        case FrameType::UserMessage:
        {
            const auto it = frame.message.find("content");
            if (it == frame.message.end() || !it->is_string() || it->get_ref<const std::string &>().empty())
            {
                logger_.debug("session", "user_message without content dropped");
                return;
            }
            const auto message = frame.message.get<protocol::InboundMessage>();
            if (on_message_)
            {
                on_message_(message);
            }
            return;
        }
        case FrameType::FileSyncPush:
            if (!on_file_sync_push_)
            {
                logger_.debug("session", "file_sync_push dropped: sync not running");
                return;
            }
            on_file_sync_push_(frame.message.get<protocol::FileSyncPush>());
            return;
        case FrameType::FileSnapshotAck:
            if (!on_snapshot_ack_)
            {
                logger_.debug("session", "file_snapshot_ack dropped: sync not running");
                return;
            }
            on_snapshot_ack_(frame.message.get<protocol::FileSnapshotAck>());
            return;
        default:
            logger_.warn("session", "protocol error: unexpected inbound frame ", frame.type);
            return;
        }
    }

    void ConnectionSession::handle_response(const nlohmann::json &message)
    {
        const auto request_id = string_field(message, "requestId");
        if (request_id.empty())
        {
            logger_.warn("session", "protocol error: response without requestId");
            return;
        }

        RequestResult result;
        result.payload = message;
        if (!message.value("ok", false))
        {
            result.error = ErrorCode::RequestFailed;
            result.message = string_field(message, "error");
        }
        if (!pending_.complete(request_id, std::move(result)))
        {
            logger_.debug("rpc", "response for unknown or expired request ", request_id, " dropped");
        }
    }

    void ConnectionSession::handle_thread_list(const nlohmann::json &message)
    {
        const auto it = message.find("threads");
        if (it == message.end() || !it->is_array())
        {
            logger_.warn("session", "protocol error: thread_list without threads");
            return;
        }
        threads_ = it->get<std::vector<protocol::ThreadInfo>>();
        logger_.info("session", "received thread_list: ", threads_.size(), " threads");
        if (on_thread_list_)
        {
            on_thread_list_(threads_);
        }
    }

} // namespace clawbridge::client
