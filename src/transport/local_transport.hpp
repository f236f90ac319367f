#pragma once

#include <filesystem>
#include <core/types.hpp>
#include "transport.hpp"

// Deploys into a directory on this machine (or a mounted share). Remote
// paths are resolved under the target root. Completes synchronously.
class LocalTransport : public Transport {
public:
    explicit LocalTransport(const std::filesystem::path& target_root,
                            TransportKind kind = TransportKind::Local);

    TransportKind kind() const override { return kind_; }

    Result<void> test_connection(StatusCallback callback = nullptr) override;
    Result<void> init_connection(StatusCallback callback = nullptr) override;
    Result<std::optional<std::string>> fetch_manifest(const std::string& remote_path) override;

    void remove_file(const std::string& remote_path, CompletionCallback done) override;
    void remove_directory(const std::string& remote_path, CompletionCallback done) override;
    void upload_file(const fs::path& local_path, const std::string& remote_path,
                     CompletionCallback done) override;
    void upload_directory(const fs::path& local_path, const std::string& remote_path,
                          CompletionCallback done) override;
    void upload_new_file_list(const fs::path& local_manifest, const std::string& remote_path,
                              CompletionCallback done) override;

    // The target root already is the output directory.
    bool addresses_from_root() const override { return true; }

    const std::filesystem::path& target_root() const { return root_; }

private:
    std::filesystem::path root_;
    TransportKind kind_;

    std::filesystem::path resolve(const std::string& remote_path) const;
    Result<void> copy_into(const fs::path& local_path, const std::string& remote_path);
};
