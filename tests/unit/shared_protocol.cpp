#include <cassert>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "clawbridge/endpoint.hpp"
#include "clawbridge/error_codes.hpp"
#include "clawbridge/frame_codec.hpp"
#include "clawbridge/protocol.hpp"
#include "clawbridge/text_chunker.hpp"

using namespace clawbridge;
using namespace clawbridge::protocol;

void run_connection_component_tests();
void run_sync_component_tests();
void run_manager_component_tests();
void run_transport_component_tests();

namespace
{

    void test_scoped_agent_frames()
    {
        const auto unscoped = make_agent_text_frame({}, "hello");
        assert(unscoped.at("type") == "agent_text");
        assert(unscoped.at("content") == "hello");
        assert(!unscoped.contains("id"));
        assert(!unscoped.contains("threadId"));

        const ConversationScope scope{.id = std::string("msg-1"), .thread_id = std::string("t-9")};
        const auto typing = make_agent_typing_frame(scope);
        assert(typing.at("type") == "agent_typing");
        assert(typing.at("id") == "msg-1");
        assert(typing.at("threadId") == "t-9");

        const auto error = make_error_frame(ConversationScope{.id = std::string("msg-2")}, "boom");
        assert(error.at("type") == "error");
        assert(error.at("error") == "boom");
        assert(!error.contains("threadId"));

        const auto pulse = make_pulse_frame("alive");
        assert(pulse.at("type") == "pulse");
        assert(pulse.at("content") == "alive");
    }

    void test_request_frame_keeps_type_and_id()
    {
        const auto frame = make_request_frame("thread_info_request", "req-1-1",
                                              nlohmann::json{{"threadId", "t-1"}, {"type", "spoofed"}});
        assert(frame.at("type") == "thread_info_request");
        assert(frame.at("requestId") == "req-1-1");
        assert(frame.at("threadId") == "t-1");
    }

    void test_file_sync_frames()
    {
        const auto upsert = make_file_sync_frame(SyncAction::Upsert, "a/b.md", std::string("X"));
        assert(upsert.at("type") == "file_sync");
        assert(upsert.at("action") == "upsert");
        assert(upsert.at("content") == "X");

        const auto removal = make_file_sync_frame(SyncAction::Delete, "a/b.md", std::nullopt);
        assert(removal.at("action") == "delete");
        assert(!removal.contains("content"));

        bool rejected = false;
        try
        {
            (void)make_file_sync_frame(SyncAction::Rename, "a.md", std::nullopt);
        }
        catch (const std::invalid_argument &)
        {
            rejected = true;
        }
        assert(rejected);

        const auto snapshot = make_file_snapshot_frame({FileRecord{.path = "a.md", .content = "1"}});
        assert(snapshot.at("type") == "file_snapshot");
        assert(snapshot.at("files").size() == 1);
        assert(snapshot.at("files")[0].at("path") == "a.md");
    }

    void test_inbound_parsing()
    {
        const auto message = nlohmann::json::parse(
                                 R"({"type":"user_message","id":"m1","sessionId":"s1","threadId":"t1",)"
                                 R"("content":"hi","noteContext":"# Note"})")
                                 .get<InboundMessage>();
        assert(message.id == "m1");
        assert(message.session_id == "s1");
        assert(message.thread_id == std::optional<std::string>("t1"));
        assert(message.note_context == std::optional<std::string>("# Note"));
        assert(message.history.is_null());

        const auto push = nlohmann::json::parse(
                              R"({"type":"file_sync_push","action":"rename","path":"y.md","oldPath":"x.md","version":4})")
                              .get<FileSyncPush>();
        assert(push.action == SyncAction::Rename);
        assert(push.old_path == std::optional<std::string>("x.md"));
        assert(!push.content);
        assert(push.version == 4);

        const auto ack = nlohmann::json::parse(
                             R"({"type":"file_snapshot_ack","updates":[)"
                             R"({"path":"s.md","content":"S","version":2,"action":"upsert"},)"
                             R"({"path":"d.md","content":"","version":3,"action":"delete"}]})")
                             .get<FileSnapshotAck>();
        assert(ack.updates.size() == 2);
        assert(ack.updates[1].action == SyncAction::Delete);

        const auto threads = nlohmann::json::parse(
                                 R"([{"id":"t1","type":"folder","name":"Inbox","path":"inbox"}])")
                                 .get<std::vector<ThreadInfo>>();
        assert(threads.size() == 1);
        assert(threads[0].kind == ThreadKind::Folder);
        assert(nlohmann::json(threads[0]).at("type") == "folder");
    }

    void test_decode_frame()
    {
        const auto frame = decode_frame(R"({"type":"response","requestId":"r","ok":true})");
        assert(frame.type == "response");
        assert(frame.known_type == FrameType::Response);

        const auto unknown = decode_frame(R"({"type":"something_new"})");
        assert(unknown.type == "something_new");
        assert(!unknown.known_type);

        for (const std::string bad : {"not json", "[1,2]", R"({"kind":"x"})", R"({"type":7})"})
        {
            bool rejected = false;
            try
            {
                (void)decode_frame(bad);
            }
            catch (const ProtocolError &error)
            {
                rejected = error.code() == ErrorCode::ProtocolError;
            }
            assert(rejected);
        }

        const auto text = encode_frame(make_connected_frame());
        assert(text == R"({"type":"connected"})");

        bool rejected = false;
        try
        {
            (void)encode_frame(nlohmann::json::array());
        }
        catch (const ProtocolError &)
        {
            rejected = true;
        }
        assert(rejected);
    }

    void test_endpoint_derivation()
    {
        assert(derive_endpoint("http://192.168.1.50:3777", "abc123").url() ==
               "ws://192.168.1.50:3777/ws?token=abc123");
        assert(derive_endpoint("https://example.com", "a b").url() == "wss://example.com/ws?token=a%20b");

        const auto trailing = derive_endpoint("http://localhost:3777/", "t");
        assert(trailing.url() == "ws://localhost:3777/ws?token=t");
        assert(trailing.host == "localhost");
        assert(trailing.port == "3777");

        const auto prefixed = derive_endpoint("https://notes.example.org/bridge/", "x");
        assert(prefixed.target == "/bridge/ws?token=x");
        assert(prefixed.port == "443");
        assert(prefixed.secure);

        const auto ipv6 = derive_endpoint("http://[::1]:9000", "t");
        assert(ipv6.host == "::1");
        assert(ipv6.authority == "[::1]:9000");

        assert(url_encode_component("a+b/c?d=é") == "a%2Bb%2Fc%3Fd%3D%C3%A9");
        assert(url_encode_component("-_.!~*'()") == "-_.!~*'()");

        assert(derive_endpoint("http://host", "secret").redacted_url() == "ws://host/ws?token=***");

        bool rejected = false;
        try
        {
            (void)derive_endpoint("http://", "t");
        }
        catch (const BridgeError &error)
        {
            rejected = error.code() == ErrorCode::InvalidConfig;
        }
        assert(rejected);
    }

    void test_chunk_text()
    {
        assert(chunk_text("short", 8000) == std::vector<std::string>{"short"});

        const std::string ascii(20, 'a');
        const auto pieces = chunk_text(ascii, 8);
        assert(pieces.size() == 3);
        assert(pieces[0].size() == 8);
        assert(pieces[2].size() == 4);

        // "é" is two bytes; a limit of 3 must not cut one in half.
        const std::string accented = "ééé";
        const auto utf8 = chunk_text(accented, 3);
        std::string joined;
        for (const auto &piece : utf8)
        {
            assert(piece.size() == 2);
            joined += piece;
        }
        assert(joined == accented);
    }

    void test_error_code_names()
    {
        assert(to_string(ErrorCode::RequestTimeout) == "request_timeout");
        assert(to_string(ErrorCode::NotConnected) == "not_connected");
        assert(error_code_from_int(to_int(ErrorCode::InvalidPath)) == ErrorCode::InvalidPath);
    }

} // namespace

int main()
{
    try
    {
        test_scoped_agent_frames();
        test_request_frame_keeps_type_and_id();
        test_file_sync_frames();
        test_inbound_parsing();
        test_decode_frame();
        test_endpoint_derivation();
        test_chunk_text();
        test_error_code_names();
        run_connection_component_tests();
        run_sync_component_tests();
        run_manager_component_tests();
        run_transport_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
