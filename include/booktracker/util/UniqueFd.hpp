#pragma once
/// @file UniqueFd.hpp
/// @brief RAII owner for POSIX file descriptors (internal)

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <string>
#include <system_error>

namespace BookTracker {
namespace detail {

/// @brief Owns a file descriptor and closes it on destruction
///
/// Move-only, with the same semantics as std::unique_ptr.
class UniqueFd {
  public:
    UniqueFd() noexcept = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other)
            reset(other.release());
        return *this;
    }

    /// @brief Opens (creating if needed) a file for read/write access
    /// @param path File path
    /// @param ec Set to the errno of a failed open()
    /// @return Owning descriptor, invalid on failure
    static UniqueFd openReadWrite(const std::string& path, std::error_code& ec) {
        ec.clear();
        int flags = O_CREAT | O_RDWR;
#ifdef O_CLOEXEC
        flags |= O_CLOEXEC;
#endif
        UniqueFd fd(::open(path.c_str(), flags, 0644));
        if (!fd)
            ec = std::error_code(errno, std::generic_category());
        return fd;
    }

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
    explicit operator bool() const noexcept { return valid(); }

    /// @brief Gives up ownership without closing
    int release() noexcept {
        int old = fd_;
        fd_ = -1;
        return old;
    }

    /// @brief Closes the current descriptor and adopts @p fd
    void reset(int fd = -1) noexcept {
        if (fd_ >= 0 && fd_ != fd)
            ::close(fd_);
        fd_ = fd;
    }

  private:
    int fd_ = -1;
};

} // namespace detail
} // namespace BookTracker
