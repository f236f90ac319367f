#include "session_lock.hpp"
#include <platform/platform.hpp>
#include <core/utils.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <string>
#include <cerrno>
#include <cstring>

#ifdef _WIN32
#  include <windows.h>
#  include <io.h>
#  include <fcntl.h>
#else
#  include <sys/file.h>
#  include <sys/stat.h>
#  include <unistd.h>
#  include <fcntl.h>
#endif

namespace fs = std::filesystem;

namespace {

constexpr int LOCK_ATTEMPTS = 5;

void close_fd(int fd) {
#ifdef _WIN32
    _close(fd);
#else
    close(fd);
#endif
}

} // namespace

SessionLock::SessionLock(const fs::path& lock_path)
    : lock_path_(lock_path) {
}

SessionLock::~SessionLock() {
    release();
}

int SessionLock::try_lock() {
#ifdef _WIN32
    int fd = _open(lock_path_.string().c_str(), _O_CREAT | _O_RDWR | _O_BINARY, 0644);
    if (fd < 0) return -1;
    HANDLE h = (HANDLE)_get_osfhandle(fd);
    OVERLAPPED ov = {};
    if (!LockFileEx(h, LOCKFILE_EXCLUSIVE_LOCK | LOCKFILE_FAIL_IMMEDIATELY,
                    0, 1, 0, &ov)) {
        _close(fd);
        return 0;
    }
    fd_ = fd;
    return 1;
#else
    int fd = open(lock_path_.c_str(), O_CREAT | O_RDWR, 0644);
    if (fd < 0) return -1;
    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        close(fd);
        if (err == EWOULDBLOCK) return 0;
        errno = err;
        return -1;
    }

    // A previous holder may have unlinked the file between our open() and
    // flock(). Only the inode still at the path counts.
    struct stat locked {};
    struct stat current {};
    if (fstat(fd, &locked) != 0 || stat(lock_path_.c_str(), &current) != 0 ||
        locked.st_dev != current.st_dev || locked.st_ino != current.st_ino) {
        close(fd);
        return 2;
    }
    fd_ = fd;
    return 1;
#endif
}

void SessionLock::write_owner() {
    std::string pid = std::to_string(platform::process_id());
#ifdef _WIN32
    bool ok = _chsize(fd_, 0) == 0 &&
              _write(fd_, pid.data(), static_cast<unsigned>(pid.size())) == static_cast<int>(pid.size());
#else
    bool ok = ftruncate(fd_, 0) == 0 &&
              pwrite(fd_, pid.data(), pid.size(), 0) == static_cast<ssize_t>(pid.size());
#endif
    if (!ok) {
        deploy_log("SessionLock: cannot record pid in " + lock_path_.string());
    }
}

Result<void> SessionLock::acquire() {
    if (held()) return Result<void>::Ok();

    std::error_code ec;
    fs::create_directories(lock_path_.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(fmt::format("Cannot create {}: {}",
                                             lock_path_.parent_path().string(), ec.message()));
    }

    for (int attempt = 0; attempt < LOCK_ATTEMPTS; attempt++) {
        int r = try_lock();
        if (r == 1) {
            write_owner();
            return Result<void>::Ok();
        }
        if (r < 0) {
            return Result<void>::Err(fmt::format("Cannot open lock {}: {}",
                                                 lock_path_.string(), std::strerror(errno)));
        }
        if (r == 0) break;
    }

    std::string owner;
    auto content = read_file(lock_path_);
    if (content.is_ok()) {
        owner = content.value;
        trim(owner);
    }
    deploy_log(fmt::format("SessionLock: {} held by pid {}", lock_path_.string(),
                           owner.empty() ? "?" : owner));
    if (owner.empty()) {
        return Result<void>::Err("Another deployment is already running for this site");
    }
    return Result<void>::Err(fmt::format(
        "Another deployment is already running for this site (pid {})", owner));
}

void SessionLock::release() {
    if (!held()) return;

#ifdef _WIN32
    // An open file cannot be deleted here; close first
    close_fd(fd_);
    fd_ = -1;
    std::error_code ec;
    fs::remove(lock_path_, ec);
    if (ec) {
        deploy_log("SessionLock: cannot remove " + lock_path_.string() + ": " + ec.message());
    }
#else
    // Unlink before unlocking; try_lock() rejects a detached inode
    std::error_code ec;
    fs::remove(lock_path_, ec);
    if (ec) {
        deploy_log("SessionLock: cannot remove " + lock_path_.string() + ": " + ec.message());
    }
    close_fd(fd_);
    fd_ = -1;
#endif
}
