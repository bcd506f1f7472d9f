#include "clawbridge/client/file_watcher.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <sys/inotify.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <memory>
#include <system_error>
#include <unordered_map>

#include "clawbridge/error_codes.hpp"

namespace clawbridge::client
{

    namespace
    {

        constexpr std::uint32_t kWatchMask = IN_CLOSE_WRITE | IN_MODIFY | IN_CREATE | IN_DELETE | IN_MOVED_FROM |
                                             IN_MOVED_TO | IN_DELETE_SELF | IN_ONLYDIR;

        bool is_hidden_name(const std::string &name)
        {
            return !name.empty() && name.front() == '.';
        }

        std::string join_relative(const std::string &directory, const std::string &name)
        {
            return directory.empty() ? name : directory + "/" + name;
        }

        class InotifyWatcher final : public FileWatcher
        {
        public:
            InotifyWatcher(boost::asio::io_context &io_context, Logger logger)
                : io_context_(io_context), logger_(std::move(logger)) {}

            ~InotifyWatcher() override
            {
                stop();
            }

            void start(const std::filesystem::path &root, ChangeHandler handler) override
            {
                stop();
                const int fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
                if (fd < 0)
                {
                    throw FilesystemError(ErrorCode::FilesystemError,
                                          std::string("inotify_init1: ") + std::strerror(errno));
                }
                root_ = root;
                handler_ = std::move(handler);
                state_ = std::make_shared<ReadState>(io_context_, fd);
                try
                {
                    add_tree("");
                }
                catch (...)
                {
                    stop();
                    throw;
                }
                read_next(state_);
            }

            void stop() override
            {
                if (!state_)
                {
                    return;
                }
                state_->stopped = true;
                boost::system::error_code ignored;
                state_->descriptor.cancel(ignored);
                state_->descriptor.close(ignored);
                state_.reset();
                directories_.clear();
                handler_ = nullptr;
            }

            bool running() const noexcept override { return state_ != nullptr; }

        private:
            // Kept alive by pending reads so a read completing after stop() finds a valid buffer.
            struct ReadState
            {
                ReadState(boost::asio::io_context &io_context, int fd) : descriptor(io_context, fd) {}

                boost::asio::posix::stream_descriptor descriptor;
                alignas(inotify_event) std::array<char, 64 * 1024> buffer{};
                bool stopped{false};
            };

            void add_watch(const std::string &relative_dir)
            {
                const auto absolute = relative_dir.empty() ? root_ : root_ / relative_dir;
                const int wd = ::inotify_add_watch(state_->descriptor.native_handle(), absolute.c_str(), kWatchMask);
                if (wd < 0)
                {
                    if (relative_dir.empty())
                    {
                        throw FilesystemError(ErrorCode::FilesystemError,
                                              "Unable to watch " + absolute.string() + ": " + std::strerror(errno));
                    }
                    logger_.warn("sync", "unable to watch ", absolute.string(), ": ", std::strerror(errno));
                    return;
                }
                directories_[wd] = relative_dir;
            }

            // Watches `relative_dir` and every non-hidden directory below it.
            void add_tree(const std::string &relative_dir)
            {
                add_watch(relative_dir);
                const auto absolute = relative_dir.empty() ? root_ : root_ / relative_dir;
                std::error_code ec;
                for (std::filesystem::directory_iterator it(absolute, ec), end; !ec && it != end; it.increment(ec))
                {
                    std::error_code entry_ec;
                    const auto name = it->path().filename().string();
                    if (!is_hidden_name(name) && std::filesystem::is_directory(it->symlink_status(entry_ec)))
                    {
                        add_tree(join_relative(relative_dir, name));
                    }
                }
            }

            // Reports the documents already present in a directory that appeared after start().
            void report_existing(const std::string &relative_dir)
            {
                std::error_code ec;
                for (std::filesystem::recursive_directory_iterator it(root_ / relative_dir, ec), end;
                     !ec && it != end; it.increment(ec))
                {
                    std::error_code entry_ec;
                    const auto status = it->symlink_status(entry_ec);
                    if (is_hidden_name(it->path().filename().string()))
                    {
                        if (std::filesystem::is_directory(status))
                        {
                            it.disable_recursion_pending();
                        }
                        continue;
                    }
                    if (std::filesystem::is_regular_file(status) && handler_)
                    {
                        handler_(it->path().lexically_relative(root_).generic_string());
                    }
                }
            }

            void read_next(const std::shared_ptr<ReadState> &state)
            {
                state->descriptor.async_read_some(
                    boost::asio::buffer(state->buffer),
                    [this, state](const boost::system::error_code &ec, std::size_t bytes)
                    {
                        if (state->stopped)
                        {
                            return;
                        }
                        if (ec)
                        {
                            logger_.error("sync", "watcher read failed: ", ec.message());
                            return;
                        }
                        handle_events(state->buffer.data(), bytes);
                        if (!state->stopped)
                        {
                            read_next(state);
                        }
                    });
            }

            void handle_events(const char *data, std::size_t bytes)
            {
                std::size_t offset = 0;
                while (offset + sizeof(inotify_event) <= bytes)
                {
                    inotify_event event{};
                    std::memcpy(&event, data + offset, sizeof(inotify_event));
                    const std::string name = event.len > 0 ? std::string(data + offset + sizeof(inotify_event)) : "";
                    offset += sizeof(inotify_event) + event.len;

                    if (event.mask & IN_Q_OVERFLOW)
                    {
                        logger_.warn("sync", "watcher queue overflow; some changes may be missed");
                        continue;
                    }
                    if (event.mask & IN_IGNORED)
                    {
                        directories_.erase(event.wd);
                        continue;
                    }
                    const auto dir_it = directories_.find(event.wd);
                    if (dir_it == directories_.end() || name.empty() || is_hidden_name(name))
                    {
                        continue;
                    }
                    const auto relative = join_relative(dir_it->second, name);
                    if (event.mask & IN_ISDIR)
                    {
                        if (event.mask & (IN_CREATE | IN_MOVED_TO))
                        {
                            add_tree(relative);
                            report_existing(relative);
                        }
                        continue;
                    }
                    if (handler_)
                    {
                        handler_(relative);
                    }
                    if (!state_)
                    {
                        return;
                    }
                }
            }

            boost::asio::io_context &io_context_;
            Logger logger_;
            std::filesystem::path root_;
            ChangeHandler handler_;
            std::shared_ptr<ReadState> state_;
            std::unordered_map<int, std::string> directories_;
        };

    } // namespace

    std::unique_ptr<FileWatcher> make_inotify_watcher(boost::asio::io_context &io_context, Logger logger)
    {
        return std::make_unique<InotifyWatcher>(io_context, std::move(logger));
    }

} // namespace clawbridge::client
