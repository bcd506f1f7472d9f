#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "clawbridge/error_codes.hpp"

namespace clawbridge::client
{

    struct RequestResult
    {
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};

        bool ok() const noexcept { return error == ErrorCode::Ok; }
    };

    using RequestHandler = std::function<void(RequestResult)>;

    // Requests awaiting a response, keyed by correlation id. The table owns no timers; each entry
    // carries the cancellation handle of the timeout its creator armed.
    class PendingRequestTable
    {
    public:
        using Clock = std::chrono::steady_clock;

        struct Entry
        {
            std::string correlation_id;
            std::string kind;
            Clock::time_point created_at{};
            Clock::time_point deadline{};
            RequestHandler handler;
            std::function<void()> cancel_timeout;
        };

        // "req-<unix millis>-<counter>"; the counter never repeats within one table.
        std::string next_correlation_id(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

        void add(Entry entry);

        // Removes the entry, cancels its timeout and invokes its handler. Unknown ids return false.
        bool complete(const std::string &correlation_id, RequestResult result);

        // Removes the entry and fails it with RequestTimeout.
        bool expire(const std::string &correlation_id);

        // Cancels every timeout and drops the entries without invoking their handlers.
        void cancel_all();

        bool contains(const std::string &correlation_id) const;
        std::size_t size() const noexcept { return entries_.size(); }

    private:
        std::uint64_t counter_{0};
        std::unordered_map<std::string, Entry> entries_;
    };

} // namespace clawbridge::client
