#include <gtest/gtest.h>
#include <deploy/deploy_session.hpp>
#include <deploy/session_lock.hpp>
#include <deploy/inventory_builder.hpp>
#include <transport/local_transport.hpp>
#include <core/utils.hpp>
#include "fake_transport.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <algorithm>

namespace fs = std::filesystem;
using namespace std::string_literals;

class DeploySessionTest : public ::testing::Test {
protected:
    fs::path site;
    fs::path target;
    SessionPaths paths;

    void SetUp() override {
        site = fs::temp_directory_path() / "sitedeploy_session_test";
        fs::remove_all(site);
        target = site / "target";

        paths.input_dir = site / "output";
        paths.config_dir = site / "input" / "config";
        paths.app_dir = site / "app";
        paths.output_dir = "public_html";

        write_output("index.html", "<h1>home</h1>");
        write_output("css/site.css", "body { margin: 0; }");
        write_output("img/logo.png", "\x89PNG\r\n\x1a\n\0\0\0\rIHDR"s);
    }

    void TearDown() override {
        fs::remove_all(site);
    }

    void write_output(const std::string& rel, const std::string& content) {
        auto full = paths.input_dir / rel;
        fs::create_directories(full.parent_path());
        std::ofstream(full, std::ios::binary) << content;
    }

    std::string target_file(const std::string& rel) {
        auto content = read_file(target / rel);
        return content.is_ok() ? content.value : "";
    }

    Result<void> deploy(ProgressSink& sink, SessionState* out = nullptr,
                        SnapshotVerdict* verdict = nullptr) {
        DeploySession session(paths, std::make_unique<LocalTransport>(target), sink);
        auto r = session.run();
        if (out) *out = session.state();
        if (verdict) *verdict = session.snapshot().verdict;
        return r;
    }

    Result<void> deploy() {
        NullProgressSink sink;
        return deploy(sink);
    }
};

TEST_F(DeploySessionTest, FirstRunUploadsEverything) {
    RecordingSink sink;
    SessionState state;
    SnapshotVerdict verdict;
    auto r = deploy(sink, &state, &verdict);
    ASSERT_TRUE(r.is_ok()) << r.error;

    EXPECT_EQ(verdict, SnapshotVerdict::Missing);
    EXPECT_EQ(state.state, PumpState::Done);
    EXPECT_EQ(state.operation_count, 6);
    EXPECT_EQ(target_file("index.html"), "<h1>home</h1>");
    EXPECT_EQ(target_file("css/site.css"), "body { margin: 0; }");
    EXPECT_TRUE(fs::exists(target / "img" / "logo.png"));

    auto updates = sink.updates();
    ASSERT_GE(updates.size(), 4u);
    EXPECT_EQ(updates[0].progress, 0);
    EXPECT_EQ(updates[1].progress, 4);
    EXPECT_EQ(updates[2].progress, 8);
    EXPECT_EQ(updates.back(), (ProgressUpdate{100, std::make_pair(6, 6)}));
}

TEST_F(DeploySessionTest, RevisionFilesWrittenOnSuccess) {
    SessionState state;
    NullProgressSink sink;
    ASSERT_TRUE(deploy(sink, &state).is_ok());

    std::string descriptor = make_revision_descriptor(state.revision);
    EXPECT_EQ(target_file("files.sitedeploy.json"), descriptor);

    auto revision = read_file(paths.config_dir / "sync-revision.json");
    ASSERT_TRUE(revision.is_ok());
    EXPECT_EQ(revision.value, descriptor);

    auto local_manifest = read_file(paths.input_dir / "files.sitedeploy.json");
    ASSERT_TRUE(local_manifest.is_ok());
    EXPECT_EQ(local_manifest.value, descriptor);

    auto cached = load_inventory(paths.config_dir / "files-remote.json");
    ASSERT_TRUE(cached.is_ok()) << cached.error;
    EXPECT_EQ(cached.value.size(), 5u);

    EXPECT_FALSE(fs::exists(paths.config_dir / ".sitedeploy.lock"));
}

TEST_F(DeploySessionTest, SecondRunIsEmpty) {
    ASSERT_TRUE(deploy().is_ok());

    NullProgressSink sink;
    DeploySession session(paths, std::make_unique<LocalTransport>(target), sink);
    auto schedule = session.plan();
    ASSERT_TRUE(schedule.is_ok()) << schedule.error;
    EXPECT_EQ(session.snapshot().verdict, SnapshotVerdict::RevisionMatch);
    EXPECT_TRUE(schedule.value.removals.empty());
    EXPECT_TRUE(schedule.value.uploads.empty());

    SessionState state;
    ASSERT_TRUE(deploy(sink, &state).is_ok());
    EXPECT_EQ(state.operation_count, 1);
}

TEST_F(DeploySessionTest, LocalChangesMirrored) {
    ASSERT_TRUE(deploy().is_ok());

    write_output("index.html", "<h1>home v2</h1>");
    write_output("about.html", "<h1>about</h1>");
    fs::remove_all(paths.input_dir / "css");

    SessionState state;
    NullProgressSink sink;
    ASSERT_TRUE(deploy(sink, &state).is_ok());

    EXPECT_EQ(target_file("index.html"), "<h1>home v2</h1>");
    EXPECT_EQ(target_file("about.html"), "<h1>about</h1>");
    EXPECT_FALSE(fs::exists(target / "css"));
    EXPECT_TRUE(fs::exists(target / "img" / "logo.png"));
    // remove css/site.css, remove css, upload index.html, upload about.html, publish
    EXPECT_EQ(state.operation_count, 5);
}

TEST_F(DeploySessionTest, RevisionMismatchForcesFullUpload) {
    ASSERT_TRUE(deploy().is_ok());
    ASSERT_TRUE(write_file_atomic(paths.config_dir / "sync-revision.json",
                                  make_revision_descriptor("someone-else")).is_ok());

    SessionState state;
    SnapshotVerdict verdict;
    NullProgressSink sink;
    ASSERT_TRUE(deploy(sink, &state, &verdict).is_ok());
    EXPECT_EQ(verdict, SnapshotVerdict::Mismatch);
    EXPECT_EQ(state.operation_count, 6);
}

TEST_F(DeploySessionTest, LegacyManifestAdopted) {
    auto md5 = InventoryBuilder::fingerprint(paths.input_dir / "index.html");
    ASSERT_TRUE(md5.is_ok());
    fs::create_directories(target);
    std::ofstream(target / "files.sitedeploy.json")
        << R"([{"path": "/index.html", "type": "file", "md5": ")" << md5.value << R"("},)"
        << R"( {"path": "/gone.html", "type": "file", "md5": "x"}])";

    NullProgressSink sink;
    DeploySession session(paths, std::make_unique<LocalTransport>(target), sink);
    auto schedule = session.plan();
    ASSERT_TRUE(schedule.is_ok()) << schedule.error;
    EXPECT_EQ(session.snapshot().verdict, SnapshotVerdict::LegacyInventory);

    ASSERT_EQ(schedule.value.removals.size(), 1u);
    EXPECT_EQ(schedule.value.removals[0].path, "gone.html");
    for (const auto& e : schedule.value.uploads) {
        EXPECT_NE(e.path, "index.html");
    }
    EXPECT_EQ(schedule.value.uploads.size(), 4u);
}

TEST_F(DeploySessionTest, PlanDoesNotTouchTarget) {
    NullProgressSink sink;
    DeploySession session(paths, std::make_unique<LocalTransport>(target), sink);
    auto schedule = session.plan();
    ASSERT_TRUE(schedule.is_ok());
    EXPECT_EQ(schedule.value.uploads.size(), 5u);

    EXPECT_FALSE(fs::exists(target / "index.html"));
    EXPECT_FALSE(fs::exists(target / "files.sitedeploy.json"));
    EXPECT_FALSE(fs::exists(paths.config_dir / "sync-revision.json"));
    EXPECT_TRUE(fs::exists(paths.app_dir / "connection-files-log-to-upload.txt"));
}

TEST_F(DeploySessionTest, ConcurrentSessionRejected) {
    SessionLock other(paths.config_dir / ".sitedeploy.lock");
    ASSERT_TRUE(other.acquire().is_ok());

    auto r = deploy();
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("already running"), std::string::npos);
    EXPECT_TRUE(fs::exists(paths.config_dir / ".sitedeploy.lock"));
    EXPECT_FALSE(fs::exists(target / "index.html"));
}

TEST_F(DeploySessionTest, CancelBeforeDrain) {
    NullProgressSink sink;
    DeploySession session(paths, std::make_unique<LocalTransport>(target), sink);
    session.request_cancel();

    auto r = session.run();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "canceled");
    EXPECT_EQ(session.state().state, PumpState::Failed);
    EXPECT_FALSE(fs::exists(target / "files.sitedeploy.json"));
    EXPECT_FALSE(fs::exists(paths.config_dir / ".sitedeploy.lock"));
}

TEST_F(DeploySessionTest, MissingInputDirectory) {
    fs::remove_all(paths.input_dir);
    auto r = deploy();
    EXPECT_TRUE(r.is_err());
}

TEST_F(DeploySessionTest, OutputDirectoryUsedByRemoteTransports) {
    auto fake = std::make_unique<FakeTransport>(TransportKind::Sftp);
    FakeTransport* transport = fake.get();

    NullProgressSink sink;
    DeploySession session(paths, std::move(fake), sink);
    ASSERT_TRUE(session.run().is_ok());

    auto calls = transport->calls();
    EXPECT_EQ(calls.front(), "init_connection");
    EXPECT_EQ(calls[1], "fetch_manifest public_html/files.sitedeploy.json");
    EXPECT_NE(std::find(calls.begin(), calls.end(), "upload_file public_html/index.html"), calls.end());
    EXPECT_EQ(calls.back(), "close");

    session.set_output(true);
    EXPECT_EQ(session.state().remote_manifest_path(), "files.sitedeploy.json");
}

TEST_F(DeploySessionTest, TransportFailureLeavesRevisionUnpublished) {
    auto fake = std::make_unique<FakeTransport>(TransportKind::Sftp);
    fake->fail_on = {"upload_file public_html/index.html"};

    NullProgressSink sink;
    DeploySession session(paths, std::move(fake), sink);
    auto r = session.run();
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("public_html/index.html"), std::string::npos);
    EXPECT_FALSE(fs::exists(paths.config_dir / "sync-revision.json"));
}
