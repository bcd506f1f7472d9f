#include "clawbridge/client/debouncer.hpp"

#include <utility>

namespace clawbridge::client
{

    Debouncer::Debouncer(boost::asio::io_context &io_context, std::chrono::milliseconds delay, Callback callback)
        : io_context_(io_context),
          delay_(delay),
          callback_(std::move(callback)),
          alive_(std::make_shared<bool>(true)) {}

    Debouncer::~Debouncer()
    {
        *alive_ = false;
        cancel_all();
    }

    void Debouncer::trigger(const std::string &key)
    {
        auto &slot = timers_[key];
        if (slot.timer)
        {
            slot.timer->cancel();
        }
        slot.timer = std::make_shared<boost::asio::steady_timer>(io_context_, delay_);
        slot.sequence = ++sequence_;

        std::weak_ptr<bool> alive = alive_;
        const auto sequence = slot.sequence;
        slot.timer->async_wait([this, alive, key, sequence](const boost::system::error_code &ec)
                               {
                                   auto guard = alive.lock();
                                   if (ec || !guard || !*guard)
                                   {
                                       return;
                                   }
                                   fire(key, sequence); });
    }

    void Debouncer::cancel_all()
    {
        auto timers = std::move(timers_);
        timers_.clear();
        for (auto &[key, slot] : timers)
        {
            slot.timer->cancel();
        }
    }

    void Debouncer::fire(const std::string &key, std::uint64_t sequence)
    {
        const auto it = timers_.find(key);
        // A superseded timer whose cancellation raced its expiry.
        if (it == timers_.end() || it->second.sequence != sequence)
        {
            return;
        }
        timers_.erase(it);
        if (callback_)
        {
            callback_(key);
        }
    }

} // namespace clawbridge::client
