#pragma once

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "clawbridge/client/debouncer.hpp"
#include "clawbridge/client/file_watcher.hpp"
#include "clawbridge/client/filesystem.hpp"
#include "clawbridge/client/logger.hpp"
#include "clawbridge/client/suppression_filter.hpp"
#include "clawbridge/protocol.hpp"

namespace clawbridge::client
{

    struct SyncOptions
    {
        std::chrono::milliseconds debounce_delay{300};
        std::chrono::milliseconds suppression_window{1000};
    };

    // Keeps the notes directory and the app's copy in step. Local changes flow
    // watcher -> document filter -> debouncer -> suppression check -> send; remote changes are written
    // after their paths are suppressed so the resulting watcher events are not sent back.
    class FileSynchronizer
    {
    public:
        using SendFn = std::function<void(const nlohmann::json &)>;

        FileSynchronizer(boost::asio::io_context &io_context, std::filesystem::path root, SendFn send, Logger logger,
                         std::unique_ptr<FileWatcher> watcher, SyncOptions options = {},
                         SuppressionFilter::NowFn now = [] { return SuppressionFilter::Clock::now(); });
        ~FileSynchronizer();

        FileSynchronizer(const FileSynchronizer &) = delete;
        FileSynchronizer &operator=(const FileSynchronizer &) = delete;

        // Sends the initial snapshot and starts watching. A watcher that cannot start is logged; the
        // snapshot has been sent regardless.
        void start();
        void stop();

        // Sends a fresh snapshot without touching the watch. No-op unless started.
        void resync();

        // Throws FilesystemError for rejected paths and for write failures other than a missing
        // rename source.
        void handle_server_push(const protocol::FileSyncPush &push);
        void handle_snapshot_ack(const protocol::FileSnapshotAck &ack);

        bool running() const noexcept { return running_; }
        std::size_t pending_changes() const noexcept { return debouncer_.pending(); }
        const Filesystem &filesystem() const noexcept { return filesystem_; }

    private:
        void send_snapshot();
        void on_watch_event(const std::string &relative_path);
        void evaluate(const std::string &relative_path);

        Filesystem filesystem_;
        SendFn send_;
        Logger logger_;
        std::unique_ptr<FileWatcher> watcher_;
        SuppressionFilter suppression_;
        Debouncer debouncer_;
        bool running_{false};
    };

} // namespace clawbridge::client
