#include "clawbridge/client/file_synchronizer.hpp"

#include <exception>
#include <system_error>
#include <utility>

#include "clawbridge/client/file_scanner.hpp"
#include "clawbridge/error_codes.hpp"

namespace clawbridge::client
{

    FileSynchronizer::FileSynchronizer(boost::asio::io_context &io_context, std::filesystem::path root, SendFn send,
                                       Logger logger, std::unique_ptr<FileWatcher> watcher, SyncOptions options,
                                       SuppressionFilter::NowFn now)
        : filesystem_(std::move(root)),
          send_(std::move(send)),
          logger_(std::move(logger)),
          watcher_(std::move(watcher)),
          suppression_(options.suppression_window, std::move(now)),
          debouncer_(io_context, options.debounce_delay,
                     [this](const std::string &relative_path)
                     { evaluate(relative_path); }) {}

    FileSynchronizer::~FileSynchronizer()
    {
        if (watcher_)
        {
            watcher_->stop();
        }
        debouncer_.cancel_all();
    }

    void FileSynchronizer::start()
    {
        if (running_)
        {
            return;
        }
        running_ = true;
        send_snapshot();

        if (!watcher_)
        {
            return;
        }
        try
        {
            watcher_->start(filesystem_.root(), [this](const std::string &relative_path)
                            { on_watch_event(relative_path); });
            logger_.info("sync", "watching: ", filesystem_.root().string());
        }
        catch (const std::exception &ex)
        {
            logger_.error("sync", "failed to start watcher: ", ex.what());
        }
    }

    void FileSynchronizer::stop()
    {
        if (watcher_)
        {
            watcher_->stop();
        }
        debouncer_.cancel_all();
        suppression_.clear();
        if (running_)
        {
            running_ = false;
            logger_.info("sync", "stopped");
        }
    }

    void FileSynchronizer::resync()
    {
        if (!running_)
        {
            return;
        }
        send_snapshot();
    }

    void FileSynchronizer::handle_server_push(const protocol::FileSyncPush &push)
    {
        switch (push.action)
        {
        case protocol::SyncAction::Upsert:
        {
            if (!push.content)
            {
                logger_.debug("sync", "upsert without content ignored: ", push.path);
                return;
            }
            const auto path = filesystem_.normalize(push.path);
            suppression_.suppress(path);
            filesystem_.write_file(path, *push.content);
            logger_.info("sync", "wrote: ", path);
            return;
        }
        case protocol::SyncAction::Delete:
        {
            const auto path = filesystem_.normalize(push.path);
            suppression_.suppress(path);
            if (filesystem_.remove_file(path))
            {
                logger_.info("sync", "deleted: ", path);
            }
            return;
        }
        case protocol::SyncAction::Rename:
        {
            if (!push.old_path)
            {
                logger_.debug("sync", "rename without oldPath ignored: ", push.path);
                return;
            }
            const auto from = filesystem_.normalize(*push.old_path);
            const auto to = filesystem_.normalize(push.path);
            suppression_.suppress(from);
            suppression_.suppress(to);
            if (filesystem_.move_path(from, to))
            {
                logger_.info("sync", "renamed: ", from, " -> ", to);
            }
            else
            {
                logger_.warn("sync", "rename source missing: ", from);
            }
            return;
        }
        }
    }

    void FileSynchronizer::handle_snapshot_ack(const protocol::FileSnapshotAck &ack)
    {
        for (const auto &update : ack.updates)
        {
            if (update.action != protocol::SyncAction::Upsert)
            {
                continue;
            }
            try
            {
                const auto path = filesystem_.normalize(update.path);
                suppression_.suppress(path);
                filesystem_.write_file(path, update.content);
                logger_.info("sync", "wrote server-only file: ", path);
            }
            catch (const FilesystemError &ex)
            {
                logger_.error("sync", "snapshot update ", update.path, " failed: ", ex.what());
            }
        }
    }

    void FileSynchronizer::send_snapshot()
    {
        const auto files = scan_documents(filesystem_.root());
        send_(protocol::make_file_snapshot_frame(files));
        logger_.info("sync", "sent snapshot: ", files.size(), " files");
    }

    void FileSynchronizer::on_watch_event(const std::string &relative_path)
    {
        if (!is_document_path(relative_path))
        {
            return;
        }
        if (suppression_.is_suppressed(relative_path))
        {
            return;
        }
        debouncer_.trigger(relative_path);
    }

    void FileSynchronizer::evaluate(const std::string &relative_path)
    {
        if (suppression_.is_suppressed(relative_path))
        {
            logger_.debug("sync", "suppressed echo: ", relative_path);
            return;
        }
        try
        {
            if (filesystem_.is_regular_file(relative_path))
            {
                auto content = filesystem_.read_file(relative_path);
                send_(protocol::make_file_sync_frame(protocol::SyncAction::Upsert, relative_path, std::move(content)));
                logger_.info("sync", "pushed change: ", relative_path);
                return;
            }
            std::error_code ec;
            if (!std::filesystem::exists(filesystem_.resolve(relative_path), ec) && !ec)
            {
                send_(protocol::make_file_sync_frame(protocol::SyncAction::Delete, relative_path, std::nullopt));
                logger_.info("sync", "pushed delete: ", relative_path);
            }
        }
        catch (const std::exception &ex)
        {
            logger_.warn("sync", "local change ", relative_path, " not sent: ", ex.what());
        }
    }

} // namespace clawbridge::client
