#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <unordered_map>

namespace clawbridge::client
{

    // Paths this process is about to write, remembered for a short window so the watcher events those
    // writes cause are not echoed back. Expired entries are pruned when looked up.
    class SuppressionFilter
    {
    public:
        using Clock = std::chrono::steady_clock;
        using NowFn = std::function<Clock::time_point()>;

        explicit SuppressionFilter(std::chrono::milliseconds window = std::chrono::milliseconds(1000),
                                   NowFn now = [] { return Clock::now(); });

        void suppress(const std::string &relative_path);
        bool is_suppressed(const std::string &relative_path);
        void clear() noexcept { entries_.clear(); }

        std::size_t size() const noexcept { return entries_.size(); }

    private:
        std::chrono::milliseconds window_;
        NowFn now_;
        std::unordered_map<std::string, Clock::time_point> entries_;
    };

} // namespace clawbridge::client
