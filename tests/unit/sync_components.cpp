#include <boost/asio/io_context.hpp>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "clawbridge/client/debouncer.hpp"
#include "clawbridge/client/file_scanner.hpp"
#include "clawbridge/client/file_synchronizer.hpp"
#include "clawbridge/client/file_watcher.hpp"
#include "clawbridge/client/filesystem.hpp"
#include "clawbridge/client/suppression_filter.hpp"
#include "clawbridge/error_codes.hpp"
#include "test_support.hpp"

using namespace clawbridge;
using namespace clawbridge::client;
using clawbridge::testing::FakeWatcher;
using clawbridge::testing::ManualClock;
using clawbridge::testing::run_until;
using clawbridge::testing::TempDir;

namespace
{

    using namespace std::chrono_literals;

    // Synchronizer over a temp directory with a synthetic watcher and a manual suppression clock.
    struct SyncFixture
    {
        explicit SyncFixture(const std::string &name, SyncOptions options = {})
            : dir(name),
              hooks(std::make_shared<FakeWatcher::Hooks>()),
              sync(io_context, dir.path(), [this](const nlohmann::json &frame)
                   { frames.push_back(frame); },
                   Logger{}, std::make_unique<FakeWatcher>(hooks), options, clock.fn()) {}

        std::vector<nlohmann::json> frames_of_type(const std::string &type) const
        {
            std::vector<nlohmann::json> matching;
            for (const auto &frame : frames)
            {
                if (frame.at("type") == type)
                {
                    matching.push_back(frame);
                }
            }
            return matching;
        }

        void settle()
        {
            io_context.restart();
            io_context.run();
        }

        boost::asio::io_context io_context;
        TempDir dir;
        ManualClock clock;
        std::shared_ptr<FakeWatcher::Hooks> hooks;
        std::vector<nlohmann::json> frames;
        FileSynchronizer sync;
    };

    bool has_upsert(const std::vector<nlohmann::json> &frames, const std::string &path, const std::string &content)
    {
        for (const auto &frame : frames)
        {
            if (frame.at("type") == "file_sync" && frame.at("action") == "upsert" && frame.at("path") == path &&
                frame.at("content") == content)
            {
                return true;
            }
        }
        return false;
    }

    bool mentions_path(const std::vector<nlohmann::json> &frames, const std::string &path)
    {
        for (const auto &frame : frames)
        {
            if (frame.at("type") == "file_sync" && frame.at("path") == path)
            {
                return true;
            }
        }
        return false;
    }

    template <typename Fn>
    bool throws_invalid_path(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const FilesystemError &error)
        {
            return error.code() == ErrorCode::InvalidPath;
        }
        return false;
    }

    void test_filesystem_sandbox()
    {
        TempDir dir("sandbox");
        Filesystem fs(dir.path());
        assert(fs.normalize("a/./b.md") == "a/b.md");
        assert(fs.resolve("notes/x.md") == dir.path() / "notes" / "x.md");
        assert(throws_invalid_path([&]
                                   { (void)fs.normalize("../escape.md"); }));
        assert(throws_invalid_path([&]
                                   { (void)fs.normalize("a/../../escape.md"); }));
        assert(throws_invalid_path([&]
                                   { (void)fs.normalize("/etc/passwd"); }));
        assert(throws_invalid_path([&]
                                   { (void)fs.normalize("./"); }));

        fs.write_file("deep/er/file.md", "body");
        assert(dir.read("deep/er/file.md") == "body");
        assert(fs.is_regular_file("deep/er/file.md"));
        assert(fs.move_path("deep/er/file.md", "moved/file.md"));
        assert(!fs.move_path("deep/er/file.md", "moved/other.md"));
        assert(fs.remove_file("moved/file.md"));
        assert(!fs.remove_file("moved/file.md"));
    }

    void test_document_filter()
    {
        assert(is_document_path("a.md"));
        assert(is_document_path("sub/dir/b.md"));
        assert(!is_document_path("c.txt"));
        assert(!is_document_path(".hidden/b.md"));
        assert(!is_document_path("sub/.draft.md"));
        assert(!is_document_path(".md"));
        assert(!is_document_path(""));
    }

    void test_scan_filters_documents()
    {
        TempDir dir("scan");
        dir.write("a.md", "A");
        dir.write(".hidden/b.md", "B");
        dir.write("c.txt", "C");
        dir.write("sub/d.md", "D");
        dir.write("sub/.e.md", "E");

        const auto files = scan_documents(dir.path());
        assert(files.size() == 2);
        assert(files[0].path == "a.md");
        assert(files[0].content == "A");
        assert(files[1].path == "sub/d.md");
        assert(files[1].content == "D");

        assert(scan_documents(dir.path() / "missing").empty());

        std::filesystem::create_symlink(dir.path() / "a.md", dir.path() / "alias.md");
        std::filesystem::create_directory_symlink(dir.path() / "sub", dir.path() / "linked");
        const auto without_links = scan_documents(dir.path());
        assert(without_links.size() == 2);
        assert(without_links[0].path == "a.md");
        assert(without_links[1].path == "sub/d.md");
    }

    void test_suppression_window()
    {
        ManualClock clock;
        SuppressionFilter filter(1000ms, clock.fn());
        assert(!filter.is_suppressed("a.md"));

        filter.suppress("a.md");
        clock.advance(999ms);
        assert(filter.is_suppressed("a.md"));
        assert(!filter.is_suppressed("b.md"));

        clock.advance(1ms);
        assert(!filter.is_suppressed("a.md"));
        assert(filter.size() == 0);

        filter.suppress("a.md");
        filter.clear();
        assert(!filter.is_suppressed("a.md"));
    }

    void test_debouncer_collapses_bursts()
    {
        boost::asio::io_context io_context;
        std::map<std::string, int> fired;
        Debouncer debouncer(io_context, 20ms, [&](const std::string &key)
                            { ++fired[key]; });

        debouncer.trigger("a.md");
        debouncer.trigger("a.md");
        debouncer.trigger("b.md");
        debouncer.trigger("a.md");
        assert(debouncer.pending() == 2);
        io_context.run();
        assert(fired["a.md"] == 1);
        assert(fired["b.md"] == 1);
        assert(debouncer.pending() == 0);

        debouncer.trigger("c.md");
        assert(debouncer.is_pending("c.md"));
        debouncer.cancel_all();
        io_context.restart();
        io_context.run();
        assert(fired.count("c.md") == 0);
    }

    void test_start_sends_snapshot_and_watches()
    {
        SyncFixture fixture("start");
        fixture.dir.write("one.md", "1");
        fixture.dir.write("notes.txt", "skip");

        fixture.sync.start();
        assert(fixture.sync.running());
        assert(fixture.hooks->running);
        const auto snapshots = fixture.frames_of_type("file_snapshot");
        assert(snapshots.size() == 1);
        assert(snapshots[0].at("files").size() == 1);
        assert(snapshots[0].at("files")[0].at("path") == "one.md");

        fixture.sync.start();
        assert(fixture.hooks->starts == 1);

        fixture.dir.write("two.md", "2");
        fixture.sync.resync();
        assert(fixture.frames_of_type("file_snapshot").size() == 2);
        assert(fixture.frames.back().at("files").size() == 2);
        assert(fixture.hooks->starts == 1);

        fixture.sync.stop();
        assert(!fixture.sync.running());
        assert(!fixture.hooks->running);
        fixture.sync.resync();
        assert(fixture.frames_of_type("file_snapshot").size() == 2);
    }

    void test_remote_write_is_not_echoed()
    {
        SyncFixture fixture("echo");
        fixture.sync.start();

        protocol::FileSyncPush push;
        push.action = protocol::SyncAction::Upsert;
        push.path = "a/b.md";
        push.content = "X";
        fixture.sync.handle_server_push(push);
        assert(fixture.dir.read("a/b.md") == "X");

        clawbridge::testing::emit(fixture.hooks, "a/b.md");
        fixture.clock.advance(400ms);
        clawbridge::testing::emit(fixture.hooks, "a/b.md");
        fixture.settle();
        assert(fixture.frames_of_type("file_sync").empty());

        fixture.clock.advance(1100ms);
        clawbridge::testing::emit(fixture.hooks, "a/b.md");
        fixture.settle();
        const auto syncs = fixture.frames_of_type("file_sync");
        assert(syncs.size() == 1);
        assert(syncs[0].at("action") == "upsert");
        assert(syncs[0].at("path") == "a/b.md");
        assert(syncs[0].at("content") == "X");
    }

    void test_local_burst_sends_final_content()
    {
        SyncFixture fixture("burst");
        fixture.sync.start();

        for (const std::string content : {"1", "2", "3"})
        {
            fixture.dir.write("draft.md", content);
            clawbridge::testing::emit(fixture.hooks, "draft.md");
        }
        assert(fixture.sync.pending_changes() == 1);
        fixture.dir.write("draft.md", "final");
        fixture.settle();

        const auto syncs = fixture.frames_of_type("file_sync");
        assert(syncs.size() == 1);
        assert(syncs[0].at("content") == "final");
    }

    void test_local_delete_and_filtering()
    {
        SyncFixture fixture("local_delete", SyncOptions{.debounce_delay = 10ms});
        fixture.sync.start();

        clawbridge::testing::emit(fixture.hooks, "notes.txt");
        clawbridge::testing::emit(fixture.hooks, ".obsidian/workspace.md");
        assert(fixture.sync.pending_changes() == 0);

        clawbridge::testing::emit(fixture.hooks, "gone.md");
        fixture.settle();
        const auto syncs = fixture.frames_of_type("file_sync");
        assert(syncs.size() == 1);
        assert(syncs[0].at("action") == "delete");
        assert(syncs[0].at("path") == "gone.md");
        assert(!syncs[0].contains("content"));
    }

    void test_rename_with_missing_source()
    {
        SyncFixture fixture("rename_missing", SyncOptions{.debounce_delay = 10ms});
        fixture.sync.start();

        protocol::FileSyncPush push;
        push.action = protocol::SyncAction::Rename;
        push.old_path = "x.md";
        push.path = "y.md";
        fixture.sync.handle_server_push(push);
        assert(!fixture.dir.exists("y.md"));

        clawbridge::testing::emit(fixture.hooks, "x.md");
        clawbridge::testing::emit(fixture.hooks, "y.md");
        assert(fixture.sync.pending_changes() == 0);
    }

    void test_remote_rename_and_delete()
    {
        SyncFixture fixture("rename");
        fixture.dir.write("x.md", "moving");
        fixture.dir.write("old.md", "bye");
        fixture.sync.start();

        protocol::FileSyncPush rename;
        rename.action = protocol::SyncAction::Rename;
        rename.old_path = "x.md";
        rename.path = "archive/y.md";
        fixture.sync.handle_server_push(rename);
        assert(!fixture.dir.exists("x.md"));
        assert(fixture.dir.read("archive/y.md") == "moving");

        protocol::FileSyncPush removal;
        removal.action = protocol::SyncAction::Delete;
        removal.path = "old.md";
        fixture.sync.handle_server_push(removal);
        assert(!fixture.dir.exists("old.md"));
        fixture.sync.handle_server_push(removal);

        protocol::FileSyncPush empty_upsert;
        empty_upsert.path = "empty.md";
        fixture.sync.handle_server_push(empty_upsert);
        assert(!fixture.dir.exists("empty.md"));

        protocol::FileSyncPush rename_without_source;
        rename_without_source.action = protocol::SyncAction::Rename;
        rename_without_source.path = "z.md";
        fixture.sync.handle_server_push(rename_without_source);
        assert(!fixture.dir.exists("z.md"));
    }

    void test_push_outside_root_is_rejected()
    {
        SyncFixture fixture("escape");
        fixture.sync.start();
        const auto outside = fixture.dir.path().parent_path() / "escape.md";
        std::error_code ec;
        std::filesystem::remove(outside, ec);

        protocol::FileSyncPush push;
        push.action = protocol::SyncAction::Upsert;
        push.path = "../escape.md";
        push.content = "nope";
        assert(throws_invalid_path([&]
                                   { fixture.sync.handle_server_push(push); }));
        assert(!std::filesystem::exists(outside));

        protocol::FileSyncPush rename;
        rename.action = protocol::SyncAction::Rename;
        rename.old_path = "/etc/hostname";
        rename.path = "stolen.md";
        assert(throws_invalid_path([&]
                                   { fixture.sync.handle_server_push(rename); }));
        assert(!fixture.dir.exists("stolen.md"));
    }

    void test_snapshot_ack_materializes_upserts()
    {
        SyncFixture fixture("ack", SyncOptions{.debounce_delay = 10ms});
        fixture.dir.write("keep.md", "local");
        fixture.sync.start();

        protocol::FileSnapshotAck ack;
        ack.updates.push_back(protocol::SnapshotUpdate{.path = "server/only.md", .content = "S", .version = 3});
        ack.updates.push_back(protocol::SnapshotUpdate{
            .path = "keep.md", .content = "", .version = 4, .action = protocol::SyncAction::Delete});
        ack.updates.push_back(protocol::SnapshotUpdate{.path = "../outside.md", .content = "O", .version = 5});
        fixture.sync.handle_snapshot_ack(ack);

        assert(fixture.dir.read("server/only.md") == "S");
        assert(fixture.dir.read("keep.md") == "local");
        assert(!std::filesystem::exists(fixture.dir.path().parent_path() / "outside.md"));

        clawbridge::testing::emit(fixture.hooks, "server/only.md");
        assert(fixture.sync.pending_changes() == 0);
    }

    void test_stop_cancels_pending_changes()
    {
        SyncFixture fixture("stop", SyncOptions{.debounce_delay = 10ms});
        fixture.sync.start();
        fixture.dir.write("a.md", "A");
        clawbridge::testing::emit(fixture.hooks, "a.md");
        assert(fixture.sync.pending_changes() == 1);

        fixture.sync.stop();
        assert(fixture.sync.pending_changes() == 0);
        fixture.settle();
        assert(fixture.frames_of_type("file_sync").empty());
    }

    void test_inotify_watch_feeds_pipeline()
    {
        boost::asio::io_context io_context;
        TempDir dir("inotify");
        dir.write("existing.md", "0");
        std::vector<nlohmann::json> frames;
        FileSynchronizer sync(io_context, dir.path(), [&frames](const nlohmann::json &frame)
                              { frames.push_back(frame); },
                              Logger{}, make_inotify_watcher(io_context, Logger{}), SyncOptions{.debounce_delay = 20ms});
        sync.start();
        assert(frames.size() == 1);
        assert(frames[0].at("type") == "file_snapshot");

        dir.write("local.md", "typed here");
        assert(run_until(io_context, [&]
                         { return has_upsert(frames, "local.md", "typed here"); }));

        // The directory is created before the loop runs, so its file is only found by the scan of the
        // new directory.
        dir.write("fresh/deep/inner.md", "nested");
        assert(run_until(io_context, [&]
                         { return has_upsert(frames, "fresh/deep/inner.md", "nested"); }));

        std::filesystem::rename(dir.path() / "fresh", dir.path() / "moved");
        assert(run_until(io_context, [&]
                         { return has_upsert(frames, "moved/deep/inner.md", "nested"); }));

        dir.write("moved/deep/later.md", "after move");
        assert(run_until(io_context, [&]
                         { return has_upsert(frames, "moved/deep/later.md", "after move"); }));

        protocol::FileSyncPush push;
        push.action = protocol::SyncAction::Upsert;
        push.path = "remote.md";
        push.content = "from app";
        sync.handle_server_push(push);
        assert(dir.read("remote.md") == "from app");
        run_until(io_context, []
                  { return false; },
                  300ms);
        assert(!mentions_path(frames, "remote.md"));

        std::filesystem::remove(dir.path() / "local.md");
        assert(run_until(io_context, [&]
                         {
                             for (const auto &frame : frames)
                             {
                                 if (frame.at("type") == "file_sync" && frame.at("action") == "delete" &&
                                     frame.at("path") == "local.md")
                                 {
                                     return true;
                                 }
                             }
                             return false;
                         }));

        sync.stop();
        assert(!sync.running());
        const auto sent = frames.size();
        dir.write("ignored.md", "stopped");
        run_until(io_context, []
                  { return false; },
                  100ms);
        assert(frames.size() == sent);
    }

} // namespace

void run_sync_component_tests()
{
    test_filesystem_sandbox();
    test_document_filter();
    test_scan_filters_documents();
    test_suppression_window();
    test_debouncer_collapses_bursts();
    test_start_sends_snapshot_and_watches();
    test_remote_write_is_not_echoed();
    test_local_burst_sends_final_content();
    test_local_delete_and_filtering();
    test_rename_with_missing_source();
    test_remote_rename_and_delete();
    test_push_outside_root_is_rejected();
    test_snapshot_ack_materializes_upserts();
    test_stop_cancels_pending_changes();
    test_inotify_watch_feeds_pipeline();
}
