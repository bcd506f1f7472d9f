#include <boost/asio/io_context.hpp>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "clawbridge/client/config.hpp"
#include "clawbridge/client/dispatcher.hpp"
#include "clawbridge/client/session_manager.hpp"
#include "clawbridge/error_codes.hpp"
#include "test_support.hpp"

using namespace clawbridge;
using namespace clawbridge::client;
using clawbridge::testing::FakeTransportFactory;
using clawbridge::testing::FakeWatcher;
using clawbridge::testing::TempDir;

namespace
{

    using namespace std::chrono_literals;

    class ScriptedDispatcher final : public MessageDispatcher
    {
    public:
        void dispatch(const DispatchRequest &request, std::shared_ptr<ReplySink> reply) override
        {
            requests.push_back(request);
            if (request.message.content == "explode")
            {
                throw std::runtime_error("agent crashed");
            }
            reply->typing();
            reply->deliver(answer);
            reply->done();
        }

        std::string answer{"ok"};
        std::vector<DispatchRequest> requests;
    };

    ManagerOptions options_for(const std::optional<std::filesystem::path> &notes_path)
    {
        ManagerOptions options;
        options.session = SessionOptions{.url = "http://127.0.0.1:3777", .token = "secret", .reconnect_delay = 10ms};
        options.notes_path = notes_path;
        options.sync = SyncOptions{.debounce_delay = 10ms};
        return options;
    }

    nlohmann::json user_message(const std::string &id, const std::string &content)
    {
        return {{"type", "user_message"}, {"id", id}, {"sessionId", "s1"}, {"threadId", "t1"}, {"content", content}};
    }

    std::vector<nlohmann::json> frames_since(const testing::FakeTransport &transport, std::size_t offset)
    {
        const auto frames = transport.sent_frames();
        return std::vector<nlohmann::json>(frames.begin() + static_cast<std::ptrdiff_t>(offset), frames.end());
    }

    ClientConfig parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "clawbridge");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    void test_config_file_and_flags()
    {
        TempDir dir("config");
        dir.write("bridge.json", R"({"url":"http://h:1","token":"from-file","notes_path":"/srv/notes","enabled":false})");
        const auto file = (dir.path() / "bridge.json").string();

        const auto loaded = parse({"--config", file});
        assert(loaded.url == "http://h:1");
        assert(loaded.token == "from-file");
        assert(loaded.notes_path == std::optional<std::filesystem::path>("/srv/notes"));
        assert(!loaded.enabled);

        const auto overridden = parse({"--config", file, "--token", "from-cli", "http://other:2"});
        assert(overridden.token == "from-cli");
        assert(overridden.url == "http://other:2");

        for (const std::string body : {R"({"url":"http://h:1","token":"t","enabled":"yes"})", R"({"url":5})",
                                       R"({"token":null})", R"({"notes_path":["a"]})", R"([1,2])", "{not json"})
        {
            dir.write("bad.json", body);
            bool rejected = false;
            try
            {
                (void)parse({"--config", (dir.path() / "bad.json").string()});
            }
            catch (const BridgeError &error)
            {
                rejected = error.code() == ErrorCode::InvalidConfig;
            }
            assert(rejected);
        }
    }

    void test_compose_agent_input()
    {
        protocol::InboundMessage message;
        message.content = "What next?";
        assert(compose_agent_input(message) == "What next?");

        message.note_context = "# Plan\n- ship";
        assert(compose_agent_input(message) == "[Note context]\n# Plan\n- ship\n\n[User message]\nWhat next?");
    }

    void test_sync_lifecycle_follows_connection()
    {
        boost::asio::io_context io_context;
        TempDir notes("manager_sync");
        notes.write("hello.md", "hi");
        FakeTransportFactory factory;
        auto hooks = std::make_shared<FakeWatcher::Hooks>();

        SessionManager manager(io_context, options_for(notes.path()), Logger{}, std::make_shared<ScriptedDispatcher>(),
                               factory.make(), [hooks]()
                               { return std::make_unique<FakeWatcher>(hooks); });
        assert(manager.synchronizer());
        assert(!manager.synchronizer()->running());

        manager.start();
        assert(factory.created.size() == 1);
        factory.last()->fire_open();
        assert(manager.synchronizer()->running());
        assert(hooks->running);

        const auto frames = factory.last()->sent_frames();
        assert(frames.size() == 2);
        assert(frames[0].at("type") == "connected");
        assert(frames[1].at("type") == "file_snapshot");
        assert(frames[1].at("files")[0].at("path") == "hello.md");

        factory.last()->fire_frame({{"type", "file_sync_push"}, {"action", "upsert"}, {"path", "inbox/new.md"},
                                    {"content", "from app"}, {"version", 7}});
        assert(notes.read("inbox/new.md") == "from app");

        factory.last()->fire_frame({{"type", "file_sync_push"}, {"action", "upsert"}, {"path", "../evil.md"},
                                    {"content", "x"}, {"version", 8}});
        assert(manager.session().is_connected());

        factory.last()->fire_close(kCloseAbnormal);
        io_context.run();
        assert(factory.created.size() == 2);
        factory.last()->fire_open();
        const auto resent = factory.last()->sent_frames();
        assert(resent.size() == 2);
        assert(resent[1].at("type") == "file_snapshot");
        assert(resent[1].at("files").size() == 2);
        assert(hooks->starts == 1);

        manager.stop();
        assert(!hooks->running);
        assert(!manager.synchronizer()->running());
        assert(factory.last()->close_requested);
    }

    void test_messages_reach_dispatcher_with_scoped_replies()
    {
        boost::asio::io_context io_context;
        FakeTransportFactory factory;
        auto dispatcher = std::make_shared<ScriptedDispatcher>();
        ManagerOptions options = options_for(std::nullopt);
        options.reply_chunk_limit = 4;

        SessionManager manager(io_context, std::move(options), Logger{}, dispatcher, factory.make());
        assert(!manager.synchronizer());
        manager.start();
        factory.last()->fire_open();
        const auto offset = factory.last()->sent.size();

        dispatcher->answer = "abcdefghij";
        auto message = user_message("m1", "summarize");
        message["noteContext"] = "ctx";
        factory.last()->fire_frame(message);

        assert(dispatcher->requests.size() == 1);
        assert(dispatcher->requests[0].message.id == "m1");
        assert(dispatcher->requests[0].body == "[Note context]\nctx\n\n[User message]\nsummarize");

        const auto replies = frames_since(*factory.last(), offset);
        assert(replies.size() == 5);
        assert(replies.front().at("type") == "agent_typing");
        assert(replies.back().at("type") == "agent_done");
        std::string joined;
        for (std::size_t i = 1; i + 1 < replies.size(); ++i)
        {
            assert(replies[i].at("type") == "agent_text");
            assert(replies[i].at("id") == "m1");
            assert(replies[i].at("threadId") == "t1");
            joined += replies[i].at("content").get<std::string>();
        }
        assert(joined == "abcdefghij");

        const auto before_failure = factory.last()->sent.size();
        factory.last()->fire_frame(user_message("m2", "explode"));
        const auto failure = frames_since(*factory.last(), before_failure);
        assert(failure.size() == 1);
        assert(failure[0].at("type") == "error");
        assert(failure[0].at("id") == "m2");
        assert(failure[0].at("error") == "agent crashed");
        assert(manager.session().is_connected());
    }

    void test_default_dispatcher_reports_unavailable()
    {
        boost::asio::io_context io_context;
        FakeTransportFactory factory;
        SessionManager manager(io_context, options_for(std::nullopt), Logger{}, nullptr, factory.make());
        manager.start();
        factory.last()->fire_open();
        const auto offset = factory.last()->sent.size();

        factory.last()->fire_frame(user_message("m9", "hello?"));
        const auto replies = frames_since(*factory.last(), offset);
        assert(replies.size() == 1);
        assert(replies[0].at("type") == "error");
        assert(replies[0].at("id") == "m9");
        assert(replies[0].at("threadId") == "t1");
        assert(replies[0].at("error") == "Agent dispatch not available");
    }

    void test_long_reply_uses_default_chunk_limit()
    {
        boost::asio::io_context io_context;
        FakeTransportFactory factory;
        auto dispatcher = std::make_shared<ScriptedDispatcher>();
        dispatcher->answer = std::string(2 * kDefaultTextChunkLimit + 5, 'z');
        SessionManager manager(io_context, options_for(std::nullopt), Logger{}, dispatcher, factory.make());
        manager.start();
        factory.last()->fire_open();
        const auto offset = factory.last()->sent.size();

        factory.last()->fire_frame(user_message("m3", "long please"));
        std::string joined;
        std::size_t text_frames = 0;
        for (const auto &frame : frames_since(*factory.last(), offset))
        {
            if (frame.at("type") == "agent_text")
            {
                ++text_frames;
                joined += frame.at("content").get<std::string>();
            }
        }
        assert(text_frames == 3);
        assert(joined == dispatcher->answer);
    }

} // namespace

void run_manager_component_tests()
{
    test_config_file_and_flags();
    test_compose_agent_input();
    test_sync_lifecycle_follows_connection();
    test_messages_reach_dispatcher_with_scoped_replies();
    test_default_dispatcher_reports_unavailable();
    test_long_reply_uses_default_chunk_limit();
}
