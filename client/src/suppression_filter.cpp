#include "clawbridge/client/suppression_filter.hpp"

#include <utility>

namespace clawbridge::client
{

    SuppressionFilter::SuppressionFilter(std::chrono::milliseconds window, NowFn now)
        : window_(window), now_(std::move(now)) {}

    void SuppressionFilter::suppress(const std::string &relative_path)
    {
        entries_[relative_path] = now_();
    }

    bool SuppressionFilter::is_suppressed(const std::string &relative_path)
    {
        const auto it = entries_.find(relative_path);
        if (it == entries_.end())
        {
            return false;
        }
        if (now_() - it->second < window_)
        {
            return true;
        }
        entries_.erase(it);
        return false;
    }

} // namespace clawbridge::client
