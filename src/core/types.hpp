#pragma once

#include <string>
#include <optional>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Deployment backends. Every protocol is known for policy purposes
// (inventory and diff rules), only some have a transport in this build.
enum class TransportKind {
    Ftp,
    Sftp,
    SftpKey,
    S3,
    Git,
    GithubPages,
    GitlabPages,
    Netlify,
    GoogleCloud,
    Manual,
    Local,
};

// Configuration structures
struct DeploymentConfig {
    TransportKind protocol = TransportKind::Local;
    std::string protocol_name = "local";
    std::string path;                            // remote output directory
    std::string server;
    int port = 22;
    std::string username;
    std::string password;
    std::optional<std::string> key_path;         // private key for sftp+key
    std::string passphrase;
    int timeout = 30;
};

struct SiteConfig {
    std::string name;
    DeploymentConfig deployment;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
