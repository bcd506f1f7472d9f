#pragma once

#include <boost/asio/io_context.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "clawbridge/client/logger.hpp"

namespace clawbridge::client
{

    // Source of raw change notifications under a root directory. Paths are relative, forward-slash,
    // and unfiltered: callers decide which ones matter.
    class FileWatcher
    {
    public:
        using ChangeHandler = std::function<void(const std::string &relative_path)>;

        virtual ~FileWatcher() = default;

        // Throws FilesystemError when the root cannot be watched.
        virtual void start(const std::filesystem::path &root, ChangeHandler handler) = 0;
        virtual void stop() = 0;
        virtual bool running() const noexcept = 0;
    };

    // inotify backed watcher reading on the given io_context. Directories created after start() are
    // picked up; dot-prefixed directories are never watched.
    std::unique_ptr<FileWatcher> make_inotify_watcher(boost::asio::io_context &io_context, Logger logger);

} // namespace clawbridge::client
