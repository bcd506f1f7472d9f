#include "clawbridge/protocol.hpp"

#include <array>
#include <stdexcept>

namespace clawbridge::protocol
{

    namespace
    {

        struct FrameTypeMapping
        {
            FrameType type;
            std::string_view label;
        };

        constexpr std::array<FrameTypeMapping, 15> kFrameTypeMappings{{
            {FrameType::Connected, "connected"},
            {FrameType::AgentText, "agent_text"},
            {FrameType::AgentTyping, "agent_typing"},
            {FrameType::AgentDone, "agent_done"},
            {FrameType::Error, "error"},
            {FrameType::Pulse, "pulse"},
            {FrameType::ThreadListRequest, "thread_list_request"},
            {FrameType::ThreadInfoRequest, "thread_info_request"},
            {FrameType::FileSync, "file_sync"},
            {FrameType::FileSnapshot, "file_snapshot"},
            {FrameType::UserMessage, "user_message"},
            {FrameType::ThreadList, "thread_list"},
            {FrameType::Response, "response"},
            {FrameType::FileSyncPush, "file_sync_push"},
            {FrameType::FileSnapshotAck, "file_snapshot_ack"},
        }};

        struct ThreadKindMapping
        {
            ThreadKind kind;
            std::string_view label;
        };

        constexpr std::array<ThreadKindMapping, 2> kThreadKindMappings{{
            {ThreadKind::File, "file"},
            {ThreadKind::Folder, "folder"},
        }};

        struct SyncActionMapping
        {
            SyncAction action;
            std::string_view label;
        };

        constexpr std::array<SyncActionMapping, 3> kSyncActionMappings{{
            {SyncAction::Upsert, "upsert"},
            {SyncAction::Delete, "delete"},
            {SyncAction::Rename, "rename"},
        }};

        nlohmann::json make_scoped_frame(FrameType type, const ConversationScope &scope)
        {
            nlohmann::json frame = {{"type", to_string(type)}};
            if (scope.id)
            {
                frame["id"] = *scope.id;
            }
            if (scope.thread_id)
            {
                frame["threadId"] = *scope.thread_id;
            }
            return frame;
        }

        std::optional<std::string> optional_string(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && it->is_string())
            {
                return it->get<std::string>();
            }
            return std::nullopt;
        }

        SyncAction parse_action(const nlohmann::json &json)
        {
            const auto label = json.at("action").get<std::string>();
            auto action = sync_action_from_string(label);
            if (!action)
            {
                throw std::runtime_error("Unknown sync action: " + label);
            }
            return *action;
        }

    } // namespace

    std::string_view to_string(FrameType type) noexcept
    {
        for (const auto &mapping : kFrameTypeMappings)
        {
            if (mapping.type == type)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<FrameType> frame_type_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kFrameTypeMappings)
        {
            if (mapping.label == value)
            {
                return mapping.type;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ThreadKind kind) noexcept
    {
        for (const auto &mapping : kThreadKindMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<ThreadKind> thread_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kThreadKindMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(SyncAction action) noexcept
    {
        for (const auto &mapping : kSyncActionMappings)
        {
            if (mapping.action == action)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<SyncAction> sync_action_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kSyncActionMappings)
        {
            if (mapping.label == value)
            {
                return mapping.action;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const ThreadInfo &thread)
    {
        json = {
            {"id", thread.id},
            {"type", to_string(thread.kind)},
            {"name", thread.name},
            {"path", thread.path},
        };
    }

    void from_json(const nlohmann::json &json, ThreadInfo &thread)
    {
        thread.id = json.at("id").get<std::string>();
        const auto kind_label = json.value("type", std::string{"file"});
        auto kind = thread_kind_from_string(kind_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown thread type: " + kind_label);
        }
        thread.kind = *kind;
        thread.name = json.value("name", std::string{});
        thread.path = json.value("path", std::string{});
    }

    void to_json(nlohmann::json &json, const InboundMessage &message)
    {
        json = {
            {"type", to_string(FrameType::UserMessage)},
            {"id", message.id},
            {"sessionId", message.session_id},
            {"content", message.content},
        };
        if (message.thread_id)
        {
            json["threadId"] = *message.thread_id;
        }
        if (message.note_context)
        {
            json["noteContext"] = *message.note_context;
        }
        if (!message.history.is_null())
        {
            json["history"] = message.history;
        }
    }

    void from_json(const nlohmann::json &json, InboundMessage &message)
    {
        message.id = json.value("id", std::string{});
        message.session_id = json.value("sessionId", std::string{});
        message.thread_id = optional_string(json, "threadId");
        message.content = json.at("content").get<std::string>();
        message.note_context = optional_string(json, "noteContext");
        message.history = json.value("history", nlohmann::json{});
    }

    void to_json(nlohmann::json &json, const FileRecord &record)
    {
        json = {
            {"path", record.path},
            {"content", record.content},
        };
    }

    void from_json(const nlohmann::json &json, FileRecord &record)
    {
        record.path = json.at("path").get<std::string>();
        record.content = json.value("content", std::string{});
    }

    void to_json(nlohmann::json &json, const FileSyncPush &push)
    {
        json = {
            {"type", to_string(FrameType::FileSyncPush)},
            {"action", to_string(push.action)},
            {"path", push.path},
            {"version", push.version},
        };
        if (push.content)
        {
            json["content"] = *push.content;
        }
        if (push.old_path)
        {
            json["oldPath"] = *push.old_path;
        }
    }

    void from_json(const nlohmann::json &json, FileSyncPush &push)
    {
        push.action = parse_action(json);
        push.path = json.at("path").get<std::string>();
        push.content = optional_string(json, "content");
        push.old_path = optional_string(json, "oldPath");
        push.version = json.value("version", std::int64_t{0});
    }

    void to_json(nlohmann::json &json, const SnapshotUpdate &update)
    {
        json = {
            {"path", update.path},
            {"content", update.content},
            {"version", update.version},
            {"action", to_string(update.action)},
        };
    }

    void from_json(const nlohmann::json &json, SnapshotUpdate &update)
    {
        update.path = json.at("path").get<std::string>();
        update.content = json.value("content", std::string{});
        update.version = json.value("version", std::int64_t{0});
        update.action = parse_action(json);
    }

    void to_json(nlohmann::json &json, const FileSnapshotAck &ack)
    {
        json = {
            {"type", to_string(FrameType::FileSnapshotAck)},
            {"updates", ack.updates},
        };
    }

    void from_json(const nlohmann::json &json, FileSnapshotAck &ack)
    {
        ack.updates = json.value("updates", std::vector<SnapshotUpdate>{});
    }

    nlohmann::json make_connected_frame()
    {
        return {{"type", to_string(FrameType::Connected)}};
    }

    nlohmann::json make_agent_text_frame(const ConversationScope &scope, std::string_view content)
    {
        auto frame = make_scoped_frame(FrameType::AgentText, scope);
        frame["content"] = content;
        return frame;
    }

    nlohmann::json make_agent_typing_frame(const ConversationScope &scope)
    {
        return make_scoped_frame(FrameType::AgentTyping, scope);
    }

    nlohmann::json make_agent_done_frame(const ConversationScope &scope)
    {
        return make_scoped_frame(FrameType::AgentDone, scope);
    }

    nlohmann::json make_error_frame(const ConversationScope &scope, std::string_view error)
    {
        auto frame = make_scoped_frame(FrameType::Error, scope);
        frame["error"] = error;
        return frame;
    }

    nlohmann::json make_pulse_frame(std::string_view content)
    {
        return {
            {"type", to_string(FrameType::Pulse)},
            {"content", content},
        };
    }

    nlohmann::json make_request_frame(std::string_view type, std::string_view request_id,
                                      const nlohmann::json &params)
    {
        nlohmann::json frame = nlohmann::json::object();
        if (params.is_object())
        {
            frame = params;
        }
        frame["type"] = type;
        frame["requestId"] = request_id;
        return frame;
    }

    nlohmann::json make_file_sync_frame(SyncAction action, std::string_view path,
                                        const std::optional<std::string> &content)
    {
        if (action == SyncAction::Rename)
        {
            throw std::invalid_argument("file_sync frames carry upsert or delete only");
        }
        nlohmann::json frame = {
            {"type", to_string(FrameType::FileSync)},
            {"action", to_string(action)},
            {"path", path},
        };
        if (content)
        {
            frame["content"] = *content;
        }
        return frame;
    }

    nlohmann::json make_file_snapshot_frame(const std::vector<FileRecord> &files)
    {
        return {
            {"type", to_string(FrameType::FileSnapshot)},
            {"files", files},
        };
    }

} // namespace clawbridge::protocol
