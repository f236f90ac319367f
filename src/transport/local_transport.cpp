#include "local_transport.hpp"
#include <core/utils.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

LocalTransport::LocalTransport(const std::filesystem::path& target_root, TransportKind kind)
    : root_(target_root), kind_(kind) {
}

fs::path LocalTransport::resolve(const std::string& remote_path) const {
    std::string rel = normalize_path(remote_path);
    while (!rel.empty() && rel[0] == '/') rel.erase(0, 1);
    return rel.empty() ? root_ : root_ / rel;
}

Result<void> LocalTransport::test_connection(StatusCallback callback) {
    if (callback) callback("Checking " + root_.string() + "...");
    if (!fs::is_directory(root_)) {
        return Result<void>::Err("Target directory does not exist: " + root_.string());
    }

    // Check write access
    fs::path marker = root_ / ".sitedeploy-write-test";
    auto written = write_file_atomic(marker, "");
    if (written.is_err()) {
        return Result<void>::Err("Target directory is not writable: " + written.error);
    }
    std::error_code ec;
    fs::remove(marker, ec);
    return Result<void>::Ok();
}

Result<void> LocalTransport::init_connection(StatusCallback callback) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        return Result<void>::Err(fmt::format("Cannot create {}: {}", root_.string(), ec.message()));
    }
    if (callback) callback("Target " + root_.string());
    return Result<void>::Ok();
}

Result<std::optional<std::string>> LocalTransport::fetch_manifest(const std::string& remote_path) {
    fs::path p = resolve(remote_path);
    if (!fs::exists(p)) {
        return Result<std::optional<std::string>>::Ok(std::nullopt);
    }
    auto content = read_file(p);
    if (content.is_err()) {
        return Result<std::optional<std::string>>::Err(content.error);
    }
    return Result<std::optional<std::string>>::Ok(content.value);
}

void LocalTransport::remove_file(const std::string& remote_path, CompletionCallback done) {
    std::error_code ec;
    fs::remove(resolve(remote_path), ec);
    done(ec ? Result<void>::Err(ec.message()) : Result<void>::Ok());
}

void LocalTransport::remove_directory(const std::string& remote_path, CompletionCallback done) {
    // Non-recursive: children must already be gone
    std::error_code ec;
    fs::remove(resolve(remote_path), ec);
    done(ec ? Result<void>::Err(ec.message()) : Result<void>::Ok());
}

Result<void> LocalTransport::copy_into(const fs::path& local_path, const std::string& remote_path) {
    fs::path dest = resolve(remote_path);
    std::error_code ec;
    fs::copy_file(local_path, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Result<void>::Err(ec.message());
    }
    return Result<void>::Ok();
}

void LocalTransport::upload_file(const fs::path& local_path, const std::string& remote_path,
                                 CompletionCallback done) {
    done(copy_into(local_path, remote_path));
}

void LocalTransport::upload_directory(const fs::path& /*local_path*/, const std::string& remote_path,
                                      CompletionCallback done) {
    fs::path dest = resolve(remote_path);
    std::error_code ec;
    if (fs::is_directory(dest)) {
        done(Result<void>::Ok());
        return;
    }
    fs::create_directory(dest, ec);
    done(ec ? Result<void>::Err(ec.message()) : Result<void>::Ok());
}

void LocalTransport::upload_new_file_list(const fs::path& local_manifest, const std::string& remote_path,
                                          CompletionCallback done) {
    deploy_log("LocalTransport: publishing manifest to " + resolve(remote_path).string());
    done(copy_into(local_manifest, remote_path));
}
