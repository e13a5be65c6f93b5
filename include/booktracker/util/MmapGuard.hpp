#pragma once
/// @file MmapGuard.hpp
/// @brief RAII owner for a shared read/write file mapping (internal)

#include <errno.h>
#include <sys/mman.h>

#include <cstddef>
#include <system_error>

namespace BookTracker {
namespace detail {

/// @brief Owns an mmap'ed region and unmaps it on destruction
class MmapGuard {
  public:
    MmapGuard() = default;
    ~MmapGuard() { reset(); }

    MmapGuard(const MmapGuard&) = delete;
    MmapGuard& operator=(const MmapGuard&) = delete;

    MmapGuard(MmapGuard&& other) noexcept : ptr_(other.ptr_), size_(other.size_) {
        other.ptr_ = nullptr;
        other.size_ = 0;
    }

    MmapGuard& operator=(MmapGuard&& other) noexcept {
        if (this != &other) {
            reset();
            ptr_ = other.ptr_;
            size_ = other.size_;
            other.ptr_ = nullptr;
            other.size_ = 0;
        }
        return *this;
    }

    /// @brief Maps the first @p size bytes of @p fd as MAP_SHARED
    /// @return false with @p ec set if mmap fails; a zero size unmaps and succeeds
    bool map(int fd, size_t size, std::error_code& ec) {
        ec.clear();
        reset();
        if (size == 0)
            return true;
        void* ptr = ::mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
        if (ptr == MAP_FAILED) {
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        ptr_ = ptr;
        size_ = size;
        return true;
    }

    char* data() const noexcept { return static_cast<char*>(ptr_); }
    size_t size() const noexcept { return size_; }
    bool valid() const noexcept { return ptr_ != nullptr; }
    explicit operator bool() const noexcept { return valid(); }

    void reset() noexcept {
        if (ptr_) {
            ::munmap(ptr_, size_);
            ptr_ = nullptr;
            size_ = 0;
        }
    }

    /// @brief Flushes the mapping to disk with MS_SYNC
    bool sync(std::error_code& ec) noexcept {
        ec.clear();
        if (!ptr_)
            return true;
        if (::msync(ptr_, size_, MS_SYNC) != 0) {
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        return true;
    }

  private:
    void* ptr_ = nullptr;
    size_t size_ = 0;
};

} // namespace detail
} // namespace BookTracker
