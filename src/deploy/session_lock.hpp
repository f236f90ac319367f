#pragma once

#include <filesystem>
#include <core/types.hpp>

// Exclusive lock on one site's config directory. Uses flock() on Unix,
// LockFileEx() on Windows, so the kernel drops the lock if the holder dies.
// The file carries the holder's pid for messages only.
class SessionLock {
public:
    explicit SessionLock(const std::filesystem::path& lock_path);
    ~SessionLock();

    SessionLock(const SessionLock&) = delete;
    SessionLock& operator=(const SessionLock&) = delete;

    Result<void> acquire();
    void release();
    bool held() const { return fd_ >= 0; }

private:
    std::filesystem::path lock_path_;
    int fd_ = -1;

    // 1 = locked, 0 = held elsewhere, 2 = lock file replaced (retry),
    // -1 = error (errno set)
    int try_lock();
    void write_owner();
};
