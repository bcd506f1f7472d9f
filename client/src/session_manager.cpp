#include "clawbridge/client/session_manager.hpp"

#include <exception>
#include <string>
#include <utility>

namespace clawbridge::client
{

    namespace
    {

        class SessionReplySink final : public ReplySink
        {
        public:
            SessionReplySink(std::weak_ptr<ConnectionSession> session, protocol::ConversationScope scope,
                             std::size_t chunk_limit)
                : session_(std::move(session)), scope_(std::move(scope)), chunk_limit_(chunk_limit) {}

            void deliver(std::string_view text) override
            {
                if (auto session = session_.lock())
                {
                    for (const auto &chunk : chunk_text(text, chunk_limit_))
                    {
                        session->send_text(chunk, scope_);
                    }
                }
            }

            void typing() override
            {
                if (auto session = session_.lock())
                {
                    session->send_typing(scope_);
                }
            }

            void done() override
            {
                if (auto session = session_.lock())
                {
                    session->send_done(scope_);
                }
            }

            void fail(std::string_view error) override
            {
                if (auto session = session_.lock())
                {
                    session->send_error(error, scope_);
                }
            }

        private:
            std::weak_ptr<ConnectionSession> session_;
            protocol::ConversationScope scope_;
            std::size_t chunk_limit_;
        };

    } // namespace

    SessionManager::SessionManager(boost::asio::io_context &io_context, ManagerOptions options, Logger logger,
                                   std::shared_ptr<MessageDispatcher> dispatcher, TransportFactory transport_factory,
                                   WatcherFactory watcher_factory)
        : options_(std::move(options)),
          logger_(std::move(logger)),
          dispatcher_(dispatcher ? std::move(dispatcher) : std::make_shared<UnavailableDispatcher>())
    {
        session_ = std::make_shared<ConnectionSession>(io_context, options_.session, std::move(transport_factory),
                                                       logger_);

        if (!options_.notes_path)
        {
            logger_.info("manager", "no notes directory configured; file sync disabled");
        }
        else
        {
            auto watcher = watcher_factory ? watcher_factory() : make_inotify_watcher(io_context, logger_);
            std::weak_ptr<ConnectionSession> weak = session_;
            synchronizer_ = std::make_unique<FileSynchronizer>(
                io_context, *options_.notes_path,
                [weak](const nlohmann::json &frame)
                {
                    if (auto session = weak.lock())
                    {
                        session->send(frame);
                    }
                },
                logger_, std::move(watcher), options_.sync);
        }

        session_->set_state_handler([this](ConnectionState state)
                                    { on_state_changed(state); });
        session_->set_message_handler([this](const protocol::InboundMessage &message)
                                      { on_message(message); });
        session_->set_thread_list_handler([this](const std::vector<protocol::ThreadInfo> &threads)
                                          { logger_.info("manager", "thread list updated: ", threads.size(), " threads"); });

        if (synchronizer_)
        {
            session_->set_file_sync_handlers(
                [this](const protocol::FileSyncPush &push)
                {
                    try
                    {
                        synchronizer_->handle_server_push(push);
                    }
                    catch (const std::exception &ex)
                    {
                        logger_.error("sync", "error handling push: ", ex.what());
                    }
                },
                [this](const protocol::FileSnapshotAck &ack)
                {
                    try
                    {
                        synchronizer_->handle_snapshot_ack(ack);
                    }
                    catch (const std::exception &ex)
                    {
                        logger_.error("sync", "error handling snapshot ack: ", ex.what());
                    }
                });
        }
    }

    SessionManager::~SessionManager()
    {
        session_->set_state_handler(nullptr);
        session_->set_message_handler(nullptr);
        session_->set_thread_list_handler(nullptr);
        session_->set_file_sync_handlers(nullptr, nullptr);
        if (synchronizer_)
        {
            synchronizer_->stop();
        }
        session_->disconnect();
    }

    void SessionManager::start()
    {
        logger_.info("manager", "starting bridge to ", session_->endpoint().redacted_url());
        session_->connect();
    }

    void SessionManager::stop()
    {
        if (synchronizer_)
        {
            synchronizer_->stop();
        }
        session_->disconnect();
    }

    void SessionManager::on_state_changed(ConnectionState state)
    {
        if (state != ConnectionState::Connected || !synchronizer_)
        {
            return;
        }
        try
        {
            if (synchronizer_->running())
            {
                synchronizer_->resync();
            }
            else
            {
                synchronizer_->start();
            }
        }
        catch (const std::exception &ex)
        {
            logger_.error("sync", "failed to start: ", ex.what());
        }
    }

    void SessionManager::on_message(const protocol::InboundMessage &message)
    {
        logger_.info("manager", "user_message ", message.id, message.thread_id ? " thread=" + *message.thread_id : "");

        protocol::ConversationScope scope;
        if (!message.id.empty())
        {
            scope.id = message.id;
        }
        scope.thread_id = message.thread_id;

        auto reply = std::make_shared<SessionReplySink>(session_, scope, options_.reply_chunk_limit);
        try
        {
            dispatcher_->dispatch(DispatchRequest{.message = message, .body = compose_agent_input(message)}, reply);
        }
        catch (const std::exception &ex)
        {
            logger_.error("manager", "dispatch of ", message.id, " failed: ", ex.what());
            reply->fail(ex.what());
        }
    }

} // namespace clawbridge::client
