#pragma once

#include <string>
#include <optional>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;

// SFTP over libssh2. Password auth for "sftp", public key auth for
// "sftp+key". Every operation blocks until the server answered and then
// reports completion.
class SftpTransport : public Transport {
public:
    explicit SftpTransport(const DeploymentConfig& config);
    ~SftpTransport() override;

    TransportKind kind() const override { return config_.protocol; }

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

    void close() override;

private:
    DeploymentConfig config_;
    socket_t sock_;
    LIBSSH2_SESSION* session_;
    LIBSSH2_SFTP* sftp_;

    Result<void> connect(StatusCallback callback);
    Result<void> authenticate(StatusCallback callback);
    Result<void> put(const fs::path& local_path, const std::string& remote_path);
    bool remote_is_directory(const std::string& remote_path);

    // libssh2 session error text plus the SFTP status code when relevant
    std::string last_error() const;
};
