#include "sftp_transport.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <core/log.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <fstream>
#include <vector>

SftpTransport::SftpTransport(const DeploymentConfig& config)
    : config_(config), sock_(SITEDEPLOY_INVALID_SOCKET), session_(nullptr), sftp_(nullptr) {
}

SftpTransport::~SftpTransport() {
    close();
}

std::string SftpTransport::last_error() const {
    if (!session_) return "not connected";

    char* msg = nullptr;
    int len = 0;
    int rc = libssh2_session_last_error(session_, &msg, &len, 0);
    std::string text = (msg && len > 0) ? std::string(msg, static_cast<size_t>(len)) : "unknown error";

    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp_) {
        unsigned long code = libssh2_sftp_last_error(sftp_);
        switch (code) {
            case LIBSSH2_FX_NO_SUCH_FILE:     return "No such file";
            case LIBSSH2_FX_PERMISSION_DENIED: return "Permission denied";
            case LIBSSH2_FX_FAILURE:          return "Operation failed (directory not empty?)";
            default:                          return fmt::format("SFTP status {}", code);
        }
    }
    return text;
}

// ── Connection ─────────────────────────────────────────────

Result<void> SftpTransport::connect(StatusCallback callback) {
    if (sftp_) return Result<void>::Ok();

    if (callback) {
        callback("Connecting to " + config_.server + "...");
    }

    if (libssh2_init(0) != 0) {
        return Result<void>::Err("Failed to initialize libssh2");
    }

    auto sock = platform::connect_tcp(config_.server, config_.port, config_.timeout * 1000);
    if (sock.is_err()) {
        return Result<void>::Err(sock.error);
    }
    sock_ = sock.value;
    platform::set_blocking(sock_);

    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init();
    if (!session_) {
        close();
        return Result<void>::Err("Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, static_cast<long>(config_.timeout) * 1000);

    if (libssh2_session_handshake(session_, sock_) != 0) {
        std::string err = "SSH handshake failed: " + last_error();
        close();
        return Result<void>::Err(err);
    }

    auto auth = authenticate(callback);
    if (auth.is_err()) {
        close();
        return auth;
    }

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        std::string err = "Failed to start SFTP subsystem: " + last_error();
        close();
        return Result<void>::Err(err);
    }

    deploy_log(fmt::format("SftpTransport: connected to {}@{}:{}",
                           config_.username, config_.server, config_.port));
    if (callback) callback("Connected to " + config_.server);
    return Result<void>::Ok();
}

Result<void> SftpTransport::authenticate(StatusCallback callback) {
    int ret;

    if (config_.protocol == TransportKind::SftpKey) {
        if (!config_.key_path) {
            return Result<void>::Err("sftp+key requires deployment.key");
        }
        std::string key = expand_home(*config_.key_path).string();
        if (callback) callback("Using public key auth...");

        ret = libssh2_userauth_publickey_fromfile(
            session_, config_.username.c_str(), nullptr, key.c_str(),
            config_.passphrase.empty() ? nullptr : config_.passphrase.c_str());
        if (ret != 0) {
            return Result<void>::Err("Public key authentication failed: " + last_error());
        }
        return Result<void>::Ok();
    }

    if (callback) callback("Using password auth...");
    ret = libssh2_userauth_password(session_, config_.username.c_str(), config_.password.c_str());
    if (ret != 0) {
        return Result<void>::Err("Authentication failed (check username/password)");
    }
    if (callback) callback("Authentication successful");
    return Result<void>::Ok();
}

void SftpTransport::close() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "Normal shutdown");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != SITEDEPLOY_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = SITEDEPLOY_INVALID_SOCKET;
    }
}

Result<void> SftpTransport::test_connection(StatusCallback callback) {
    auto connected = connect(callback);
    if (connected.is_err()) {
        return connected;
    }

    std::string dir = config_.path.empty() ? "." : config_.path;
    bool ok = remote_is_directory(dir);
    std::string err = ok ? "" : fmt::format("Output directory {} is not accessible: {}", dir, last_error());
    close();

    if (!ok) return Result<void>::Err(err);
    return Result<void>::Ok();
}

Result<void> SftpTransport::init_connection(StatusCallback callback) {
    return connect(callback);
}

// ── Operations ─────────────────────────────────────────────

bool SftpTransport::remote_is_directory(const std::string& remote_path) {
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    if (libssh2_sftp_stat(sftp_, remote_path.c_str(), &attrs) != 0) {
        return false;
    }
    return (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) && LIBSSH2_SFTP_S_ISDIR(attrs.permissions);
}

Result<std::optional<std::string>> SftpTransport::fetch_manifest(const std::string& remote_path) {
    using R = Result<std::optional<std::string>>;
    if (!sftp_) return R::Err("not connected");

    LIBSSH2_SFTP_HANDLE* fh = libssh2_sftp_open(sftp_, remote_path.c_str(), LIBSSH2_FXF_READ, 0);
    if (!fh) {
        if (libssh2_sftp_last_error(sftp_) == LIBSSH2_FX_NO_SUCH_FILE) {
            return R::Ok(std::nullopt);
        }
        return R::Err(fmt::format("open {}: {}", remote_path, last_error()));
    }

    std::string content;
    std::vector<char> buf(SFTP_CHUNK_SIZE);
    for (;;) {
        ssize_t n = libssh2_sftp_read(fh, buf.data(), buf.size());
        if (n > 0) {
            content.append(buf.data(), static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else {
            libssh2_sftp_close(fh);
            return R::Err(fmt::format("read {}: {}", remote_path, last_error()));
        }
    }
    libssh2_sftp_close(fh);
    return R::Ok(std::move(content));
}

void SftpTransport::remove_file(const std::string& remote_path, CompletionCallback done) {
    if (!sftp_) { done(Result<void>::Err("not connected")); return; }

    if (libssh2_sftp_unlink(sftp_, remote_path.c_str()) != 0) {
        // Already gone is fine: the goal state is reached
        if (libssh2_sftp_last_error(sftp_) == LIBSSH2_FX_NO_SUCH_FILE) {
            done(Result<void>::Ok());
            return;
        }
        done(Result<void>::Err(last_error()));
        return;
    }
    done(Result<void>::Ok());
}

void SftpTransport::remove_directory(const std::string& remote_path, CompletionCallback done) {
    if (!sftp_) { done(Result<void>::Err("not connected")); return; }

    if (libssh2_sftp_rmdir(sftp_, remote_path.c_str()) != 0) {
        if (libssh2_sftp_last_error(sftp_) == LIBSSH2_FX_NO_SUCH_FILE) {
            done(Result<void>::Ok());
            return;
        }
        done(Result<void>::Err(last_error()));
        return;
    }
    done(Result<void>::Ok());
}

Result<void> SftpTransport::put(const fs::path& local_path, const std::string& remote_path) {
    if (!sftp_) return Result<void>::Err("not connected");

    std::ifstream in(local_path, std::ios::binary);
    if (!in) {
        return Result<void>::Err("Cannot read file: " + local_path.string());
    }

    LIBSSH2_SFTP_HANDLE* fh = libssh2_sftp_open(
        sftp_, remote_path.c_str(),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC, SFTP_FILE_MODE);
    if (!fh) {
        return Result<void>::Err(last_error());
    }

    std::vector<char> buf(SFTP_CHUNK_SIZE);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        size_t n = static_cast<size_t>(in.gcount());
        size_t sent = 0;
        while (sent < n) {
            ssize_t w = libssh2_sftp_write(fh, buf.data() + sent, n - sent);
            if (w < 0) {
                std::string err = last_error();
                libssh2_sftp_close(fh);
                return Result<void>::Err(err);
            }
            sent += static_cast<size_t>(w);
        }
    }
    if (in.bad()) {
        libssh2_sftp_close(fh);
        return Result<void>::Err("Cannot read file: " + local_path.string());
    }

    libssh2_sftp_close(fh);
    return Result<void>::Ok();
}

void SftpTransport::upload_file(const fs::path& local_path, const std::string& remote_path,
                                CompletionCallback done) {
    done(put(local_path, remote_path));
}

void SftpTransport::upload_directory(const fs::path& /*local_path*/, const std::string& remote_path,
                                     CompletionCallback done) {
    if (!sftp_) { done(Result<void>::Err("not connected")); return; }

    if (libssh2_sftp_mkdir(sftp_, remote_path.c_str(), SFTP_DIR_MODE) != 0) {
        std::string err = last_error();
        if (remote_is_directory(remote_path)) {
            done(Result<void>::Ok());
            return;
        }
        done(Result<void>::Err(err));
        return;
    }
    done(Result<void>::Ok());
}

void SftpTransport::upload_new_file_list(const fs::path& local_manifest, const std::string& remote_path,
                                         CompletionCallback done) {
    deploy_log("SftpTransport: publishing manifest to " + remote_path);
    done(put(local_manifest, remote_path));
}
