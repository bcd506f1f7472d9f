/**
 * ClawBridge - Frame schema exchanged with the desktop app and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace clawbridge::protocol
{

    enum class FrameType : std::uint8_t
    {
        // bridge -> app
        Connected,
        AgentText,
        AgentTyping,
        AgentDone,
        Error,
        Pulse,
        ThreadListRequest,
        ThreadInfoRequest,
        FileSync,
        FileSnapshot,
        // app -> bridge
        UserMessage,
        ThreadList,
        Response,
        FileSyncPush,
        FileSnapshotAck
    };

    std::string_view to_string(FrameType type) noexcept;
    std::optional<FrameType> frame_type_from_string(std::string_view value) noexcept;

    enum class ThreadKind : std::uint8_t
    {
        File,
        Folder
    };

    std::string_view to_string(ThreadKind kind) noexcept;
    std::optional<ThreadKind> thread_kind_from_string(std::string_view value) noexcept;

    enum class SyncAction : std::uint8_t
    {
        Upsert,
        Delete,
        Rename
    };

    std::string_view to_string(SyncAction action) noexcept;
    std::optional<SyncAction> sync_action_from_string(std::string_view value) noexcept;

    struct ThreadInfo
    {
        std::string id;
        ThreadKind kind{ThreadKind::File};
        std::string name;
        std::string path;
    };

    void to_json(nlohmann::json &json, const ThreadInfo &thread);
    void from_json(const nlohmann::json &json, ThreadInfo &thread);

    struct InboundMessage
    {
        std::string id;
        std::string session_id;
        std::optional<std::string> thread_id{};
        std::string content;
        std::optional<std::string> note_context{};
        nlohmann::json history{};
    };

    void to_json(nlohmann::json &json, const InboundMessage &message);
    void from_json(const nlohmann::json &json, InboundMessage &message);

    struct FileRecord
    {
        std::string path;
        std::string content;
    };

    void to_json(nlohmann::json &json, const FileRecord &record);
    void from_json(const nlohmann::json &json, FileRecord &record);

    struct FileSyncPush
    {
        SyncAction action{SyncAction::Upsert};
        std::string path;
        std::optional<std::string> content{};
        std::optional<std::string> old_path{};
        std::int64_t version{};
    };

    void to_json(nlohmann::json &json, const FileSyncPush &push);
    void from_json(const nlohmann::json &json, FileSyncPush &push);

    struct SnapshotUpdate
    {
        std::string path;
        std::string content;
        std::int64_t version{};
        SyncAction action{SyncAction::Upsert};
    };

    void to_json(nlohmann::json &json, const SnapshotUpdate &update);
    void from_json(const nlohmann::json &json, SnapshotUpdate &update);

    struct FileSnapshotAck
    {
        std::vector<SnapshotUpdate> updates;
    };

    void to_json(nlohmann::json &json, const FileSnapshotAck &ack);
    void from_json(const nlohmann::json &json, FileSnapshotAck &ack);

    // Conversation id and thread id an outbound agent frame is scoped to. Absent fields are omitted.
    struct ConversationScope
    {
        std::optional<std::string> id{};
        std::optional<std::string> thread_id{};
    };

    nlohmann::json make_connected_frame();
    nlohmann::json make_agent_text_frame(const ConversationScope &scope, std::string_view content);
    nlohmann::json make_agent_typing_frame(const ConversationScope &scope);
    nlohmann::json make_agent_done_frame(const ConversationScope &scope);
    nlohmann::json make_error_frame(const ConversationScope &scope, std::string_view error);
    nlohmann::json make_pulse_frame(std::string_view content);

    // Builds {type, requestId, ...params}. Keys in params never override type or requestId.
    nlohmann::json make_request_frame(std::string_view type, std::string_view request_id,
                                      const nlohmann::json &params = nlohmann::json::object());

    nlohmann::json make_file_sync_frame(SyncAction action, std::string_view path,
                                        const std::optional<std::string> &content = std::nullopt);
    nlohmann::json make_file_snapshot_frame(const std::vector<FileRecord> &files);

} // namespace clawbridge::protocol
