#pragma once

#include <boost/asio/io_context.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>

#include "clawbridge/client/connection_session.hpp"
#include "clawbridge/client/dispatcher.hpp"
#include "clawbridge/client/file_synchronizer.hpp"
#include "clawbridge/client/file_watcher.hpp"
#include "clawbridge/client/logger.hpp"
#include "clawbridge/client/transport.hpp"
#include "clawbridge/text_chunker.hpp"

namespace clawbridge::client
{

    struct ManagerOptions
    {
        SessionOptions session;
        std::optional<std::filesystem::path> notes_path;
        SyncOptions sync;
        std::size_t reply_chunk_limit{kDefaultTextChunkLimit};
    };

    using WatcherFactory = std::function<std::unique_ptr<FileWatcher>()>;

    // Owns the connection session and, when a notes directory is configured, the file synchronizer.
    // Inbound messages go to the dispatcher; sync frames go to the synchronizer.
    class SessionManager
    {
    public:
        // A null dispatcher installs UnavailableDispatcher; an empty watcher factory uses inotify.
        SessionManager(boost::asio::io_context &io_context, ManagerOptions options, Logger logger,
                       std::shared_ptr<MessageDispatcher> dispatcher, TransportFactory transport_factory,
                       WatcherFactory watcher_factory = {});
        ~SessionManager();

        SessionManager(const SessionManager &) = delete;
        SessionManager &operator=(const SessionManager &) = delete;

        void start();
        void stop();

        ConnectionSession &session() noexcept { return *session_; }
        const ConnectionSession &session() const noexcept { return *session_; }
        FileSynchronizer *synchronizer() noexcept { return synchronizer_.get(); }

    private:
        void on_state_changed(ConnectionState state);
        void on_message(const protocol::InboundMessage &message);

        ManagerOptions options_;
        Logger logger_;
        std::shared_ptr<MessageDispatcher> dispatcher_;
        std::shared_ptr<ConnectionSession> session_;
        std::unique_ptr<FileSynchronizer> synchronizer_;
    };

} // namespace clawbridge::client
