#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace clawbridge::client
{

    // One pending timer per key. A newer trigger for the same key cancels the older timer, so a burst
    // of triggers produces a single callback `delay` after the last one.
    class Debouncer
    {
    public:
        using Callback = std::function<void(const std::string &key)>;

        Debouncer(boost::asio::io_context &io_context, std::chrono::milliseconds delay, Callback callback);
        ~Debouncer();

        Debouncer(const Debouncer &) = delete;
        Debouncer &operator=(const Debouncer &) = delete;

        void trigger(const std::string &key);
        void cancel_all();

        std::size_t pending() const noexcept { return timers_.size(); }
        bool is_pending(const std::string &key) const { return timers_.count(key) > 0; }

    private:
        struct Slot
        {
            std::shared_ptr<boost::asio::steady_timer> timer;
            std::uint64_t sequence{0};
        };

        void fire(const std::string &key, std::uint64_t sequence);

        boost::asio::io_context &io_context_;
        std::chrono::milliseconds delay_;
        Callback callback_;
        std::unordered_map<std::string, Slot> timers_;
        std::uint64_t sequence_{0};
        std::shared_ptr<bool> alive_;
    };

} // namespace clawbridge::client
