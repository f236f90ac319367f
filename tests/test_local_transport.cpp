#include <gtest/gtest.h>
#include <transport/local_transport.hpp>
#include <transport/transport_factory.hpp>
#include <core/utils.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class LocalTransportTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path root;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "sitedeploy_local_transport_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir / "src");
        root = test_dir / "target";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    static Result<void> await_op(const std::function<void(CompletionCallback)>& op) {
        Result<void> out = Result<void>::Err("not completed");
        op([&](Result<void> r) { out = r; });
        return out;
    }
};

TEST_F(LocalTransportTest, TestConnectionNeedsExistingDirectory) {
    LocalTransport transport(root);
    EXPECT_TRUE(transport.test_connection().is_err());

    fs::create_directories(root);
    EXPECT_TRUE(transport.test_connection().is_ok());
    EXPECT_TRUE(fs::is_empty(root));
}

TEST_F(LocalTransportTest, UploadsAndRemoves) {
    LocalTransport transport(root);
    ASSERT_TRUE(transport.init_connection().is_ok());
    std::ofstream(test_dir / "src" / "page.html") << "<p>v1</p>";

    ASSERT_TRUE(await_op([&](CompletionCallback done) {
        transport.upload_directory(test_dir / "src", "blog", done);
    }).is_ok());
    ASSERT_TRUE(await_op([&](CompletionCallback done) {
        transport.upload_file(test_dir / "src" / "page.html", "blog/page.html", done);
    }).is_ok());

    auto copied = read_file(root / "blog" / "page.html");
    ASSERT_TRUE(copied.is_ok());
    EXPECT_EQ(copied.value, "<p>v1</p>");

    // Existing directory is fine
    EXPECT_TRUE(await_op([&](CompletionCallback done) {
        transport.upload_directory(test_dir / "src", "blog", done);
    }).is_ok());

    // Non-empty directories are not removed
    EXPECT_TRUE(await_op([&](CompletionCallback done) {
        transport.remove_directory("blog", done);
    }).is_err());

    EXPECT_TRUE(await_op([&](CompletionCallback done) {
        transport.remove_file("blog/page.html", done);
    }).is_ok());
    EXPECT_TRUE(await_op([&](CompletionCallback done) {
        transport.remove_directory("blog", done);
    }).is_ok());
    EXPECT_FALSE(fs::exists(root / "blog"));
}

TEST_F(LocalTransportTest, UploadIntoMissingParentFails) {
    LocalTransport transport(root);
    ASSERT_TRUE(transport.init_connection().is_ok());
    std::ofstream(test_dir / "src" / "a.txt") << "a";

    EXPECT_TRUE(await_op([&](CompletionCallback done) {
        transport.upload_file(test_dir / "src" / "a.txt", "no/such/dir/a.txt", done);
    }).is_err());
}

TEST_F(LocalTransportTest, ManifestFetch) {
    LocalTransport transport(root);
    ASSERT_TRUE(transport.init_connection().is_ok());

    auto none = transport.fetch_manifest("files.sitedeploy.json");
    ASSERT_TRUE(none.is_ok());
    EXPECT_FALSE(none.value.has_value());

    std::ofstream(test_dir / "src" / "manifest.json") << R"({"revision":"R1"})";
    ASSERT_TRUE(await_op([&](CompletionCallback done) {
        transport.upload_new_file_list(test_dir / "src" / "manifest.json", "/files.sitedeploy.json", done);
    }).is_ok());

    auto some = transport.fetch_manifest("files.sitedeploy.json");
    ASSERT_TRUE(some.is_ok());
    ASSERT_TRUE(some.value.has_value());
    EXPECT_EQ(*some.value, R"({"revision":"R1"})");
}

TEST(TransportFactoryTest, SelectsByProtocol) {
    DeploymentConfig local;
    local.protocol = TransportKind::Local;
    local.protocol_name = "local";
    local.path = "/srv/www";
    auto t = create_transport(local);
    ASSERT_TRUE(t.is_ok()) << t.error;
    EXPECT_EQ(t.value->kind(), TransportKind::Local);
    EXPECT_TRUE(t.value->addresses_from_root());

    DeploymentConfig sftp;
    sftp.protocol = TransportKind::Sftp;
    sftp.protocol_name = "sftp";
    sftp.server = "example.com";
    auto s = create_transport(sftp);
    ASSERT_TRUE(s.is_ok()) << s.error;
    EXPECT_EQ(s.value->kind(), TransportKind::Sftp);
    EXPECT_FALSE(s.value->addresses_from_root());
}

TEST(TransportFactoryTest, UnavailableProtocols) {
    DeploymentConfig netlify;
    netlify.protocol = TransportKind::Netlify;
    netlify.protocol_name = "netlify";
    auto t = create_transport(netlify);
    ASSERT_TRUE(t.is_err());
    EXPECT_EQ(t.error, "protocol 'netlify' is not available in this build");

    DeploymentConfig no_server;
    no_server.protocol = TransportKind::Sftp;
    no_server.protocol_name = "sftp";
    EXPECT_TRUE(create_transport(no_server).is_err());
}
