#include "clawbridge/client/pending_requests.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace clawbridge::client
{

    std::string PendingRequestTable::next_correlation_id(std::chrono::system_clock::time_point now)
    {
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
        std::ostringstream oss;
        oss << "req-" << millis << '-' << (++counter_);
        return oss.str();
    }

    void PendingRequestTable::add(Entry entry)
    {
        auto id = entry.correlation_id;
        const auto [it, inserted] = entries_.emplace(std::move(id), std::move(entry));
        if (!inserted)
        {
            throw std::logic_error("Duplicate correlation id: " + it->first);
        }
    }

    bool PendingRequestTable::complete(const std::string &correlation_id, RequestResult result)
    {
        auto it = entries_.find(correlation_id);
        if (it == entries_.end())
        {
            return false;
        }
        auto entry = std::move(it->second);
        entries_.erase(it);
        if (entry.cancel_timeout)
        {
            entry.cancel_timeout();
        }
        if (entry.handler)
        {
            entry.handler(std::move(result));
        }
        return true;
    }

    bool PendingRequestTable::expire(const std::string &correlation_id)
    {
        auto it = entries_.find(correlation_id);
        if (it == entries_.end())
        {
            return false;
        }
        auto entry = std::move(it->second);
        entries_.erase(it);
        const auto timeout =
            std::chrono::duration_cast<std::chrono::milliseconds>(entry.deadline - entry.created_at).count();
        if (entry.handler)
        {
            entry.handler(RequestResult{
                .error = ErrorCode::RequestTimeout,
                .message = "Request " + entry.kind + " timed out after " + std::to_string(timeout) + "ms",
                .payload = nlohmann::json::object(),
            });
        }
        return true;
    }

    void PendingRequestTable::cancel_all()
    {
        auto entries = std::move(entries_);
        entries_.clear();
        for (auto &[id, entry] : entries)
        {
            if (entry.cancel_timeout)
            {
                entry.cancel_timeout();
            }
        }
    }

    bool PendingRequestTable::contains(const std::string &correlation_id) const
    {
        return entries_.find(correlation_id) != entries_.end();
    }

} // namespace clawbridge::client
