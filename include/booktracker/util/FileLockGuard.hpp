#pragma once
/// @file FileLockGuard.hpp
/// @brief Whole-file fcntl record lock held for the lifetime of a scope (internal)

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <system_error>

namespace BookTracker {
namespace detail {

/// @brief Scoped fcntl lock over an entire file
///
/// Readers take a Shared lock and writers an Exclusive one. Acquisition blocks
/// (F_SETLKW) until the lock is granted or the call fails.
///
/// @note fcntl locks belong to the process, so a nested guard on the same fd
///       converts the existing lock instead of deadlocking. Releasing the inner
///       guard releases the whole lock.
class FileLockGuard {
  public:
    enum class Mode {
        Shared,   ///< Read lock
        Exclusive ///< Write lock
    };

    FileLockGuard(int fd, Mode mode, std::error_code& ec) { acquire(fd, mode, ec); }
    ~FileLockGuard() { release(); }

    FileLockGuard(const FileLockGuard&) = delete;
    FileLockGuard& operator=(const FileLockGuard&) = delete;

    bool locked() const noexcept { return fd_ >= 0; }

  private:
    bool acquire(int fd, Mode mode, std::error_code& ec) {
        ec.clear();
        if (fd < 0) {
            ec = std::make_error_code(std::errc::bad_file_descriptor);
            return false;
        }

        struct flock fl{};
        fl.l_type = (mode == Mode::Shared) ? F_RDLCK : F_WRLCK;
        fl.l_whence = SEEK_SET;
        fl.l_start = 0;
        fl.l_len = 0; // through end of file, including future growth
        while (::fcntl(fd, F_SETLKW, &fl) < 0) {
            if (errno == EINTR)
                continue;
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        fd_ = fd;
        return true;
    }

    void release() noexcept {
        if (fd_ < 0)
            return;
        struct flock fl{};
        fl.l_type = F_UNLCK;
        fl.l_whence = SEEK_SET;
        (void)::fcntl(fd_, F_SETLK, &fl);
        fd_ = -1;
    }

    int fd_ = -1;
};

} // namespace detail
} // namespace BookTracker
