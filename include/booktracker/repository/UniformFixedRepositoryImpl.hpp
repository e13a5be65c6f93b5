#pragma once
/// @file UniformFixedRepositoryImpl.hpp
/// @brief mmap-backed repository of same-size fixed-length records

#include "../util/FileLockGuard.hpp"
#include "../util/MmapGuard.hpp"
#include "../util/UniqueFd.hpp"
#include "RecordRepository.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cstring>
#include <optional>
#include <unordered_map>
#include <vector>

namespace BookTracker {

/// @brief Fixed-length record repository
/// @tparam T Concrete record type deriving from FixedRecordBase<T>
///
/// - The file is an array of recordSize() slots, mapped with MAP_SHARED.
/// - An id -> slot map gives O(1) lookups. It is rebuilt when the file's
///   mtime or size changes behind our back.
/// - Reads take a shared fcntl lock, writes an exclusive one.
template <typename T> class UniformFixedRepositoryImpl : public RecordRepository<T> {
  public:
    /// @param path Repository file, created if missing
    /// @param ec Set if the file cannot be opened or its size is not a multiple of the record size
    UniformFixedRepositoryImpl(const std::string& path, std::error_code& ec) : path_(path) {
        ec.clear();
        recordSize_ = T().recordSize();
        if (recordSize_ == 0) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return;
        }

        fd_ = detail::UniqueFd::openReadWrite(path_, ec);
        if (ec)
            return;

        detail::FileLockGuard lock(fd_.get(), detail::FileLockGuard::Mode::Shared, ec);
        if (ec)
            return;
        refresh(ec);
    }

    ~UniformFixedRepositoryImpl() override = default;

    UniformFixedRepositoryImpl(const UniformFixedRepositoryImpl&) = delete;
    UniformFixedRepositoryImpl& operator=(const UniformFixedRepositoryImpl&) = delete;

    bool save(const T& record, std::error_code& ec) override {
        detail::FileLockGuard lock(fd_.get(), detail::FileLockGuard::Mode::Exclusive, ec);
        if (ec)
            return false;
        if (record.recordSize() != recordSize_) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }
        if (!checkAndRefresh(ec))
            return false;

        // A record that cannot be serialized never touches the file.
        std::vector<char> buf(recordSize_);
        if (!record.serialize(buf.data(), ec))
            return false;

        size_t slot = 0;
        bool grown = false;
        if (auto idx = findSlot(record.getId())) {
            slot = *idx;
        } else {
            // Grow by one slot and remap before writing into it.
            slot = slotCount();
            if (::ftruncate(fd_.get(), static_cast<off_t>((slot + 1) * recordSize_)) != 0) {
                ec = std::error_code(errno, std::generic_category());
                return false;
            }
            grown = true;
            if (!mmap_.map(fd_.get(), (slot + 1) * recordSize_, ec)) {
                shrinkTo(slot);
                return false;
            }
        }

        std::memcpy(mmap_.data() + slot * recordSize_, buf.data(), recordSize_);
        if (!mmap_.sync(ec)) {
            if (grown)
                shrinkTo(slot);
            return false;
        }
        slots_[record.getId()] = slot;
        updateFileStats();
        return true;
    }

    std::vector<std::unique_ptr<T>> findAll(std::error_code& ec) override {
        std::vector<std::unique_ptr<T>> result;
        detail::FileLockGuard lock(fd_.get(), detail::FileLockGuard::Mode::Shared, ec);
        if (ec)
            return result;
        if (!checkAndRefresh(ec))
            return result;

        for (size_t i = 0; i < slotCount(); ++i) {
            auto rec = std::make_unique<T>();
            if (!rec->deserialize(mmap_.data() + i * recordSize_, ec)) {
                result.clear();
                return result;
            }
            result.push_back(std::move(rec));
        }
        return result;
    }

    std::unique_ptr<T> findById(const std::string& id, std::error_code& ec) override {
        detail::FileLockGuard lock(fd_.get(), detail::FileLockGuard::Mode::Shared, ec);
        if (ec)
            return nullptr;
        if (!checkAndRefresh(ec))
            return nullptr;

        auto idx = findSlot(id);
        if (!idx)
            return nullptr;
        auto rec = std::make_unique<T>();
        if (!rec->deserialize(mmap_.data() + *idx * recordSize_, ec))
            return nullptr;
        return rec;
    }

    bool deleteById(const std::string& id, std::error_code& ec) override {
        detail::FileLockGuard lock(fd_.get(), detail::FileLockGuard::Mode::Exclusive, ec);
        if (ec)
            return false;
        if (!checkAndRefresh(ec))
            return false;

        auto idx = findSlot(id);
        if (!idx)
            return true;

        // Shift the tail down one slot, then drop the last slot.
        size_t cnt = slotCount();
        char* dst = mmap_.data() + *idx * recordSize_;
        size_t tail = (cnt - 1 - *idx) * recordSize_;
        if (tail > 0)
            std::memmove(dst, dst + recordSize_, tail);
        if (!mmap_.sync(ec))
            return false;

        mmap_.reset();
        if (::ftruncate(fd_.get(), static_cast<off_t>((cnt - 1) * recordSize_)) != 0) {
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        return refresh(ec);
    }

    size_t count(std::error_code& ec) override {
        detail::FileLockGuard lock(fd_.get(), detail::FileLockGuard::Mode::Shared, ec);
        if (ec)
            return 0;
        if (!checkAndRefresh(ec))
            return 0;
        return slotCount();
    }

    bool existsById(const std::string& id, std::error_code& ec) override {
        detail::FileLockGuard lock(fd_.get(), detail::FileLockGuard::Mode::Shared, ec);
        if (ec)
            return false;
        if (!checkAndRefresh(ec))
            return false;
        return findSlot(id).has_value();
    }

  private:
    /// @brief Refreshes the mapping and slot map if the file changed since the last look
    bool checkAndRefresh(std::error_code& ec) {
        struct stat st{};
        if (::fstat(fd_.get(), &st) < 0) {
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        if (st.st_mtim.tv_sec == lastMtime_.tv_sec && st.st_mtim.tv_nsec == lastMtime_.tv_nsec &&
            static_cast<size_t>(st.st_size) == lastSize_)
            return true;
        return refresh(ec);
    }

    /// @brief Remaps the whole file and rebuilds the id -> slot map
    bool refresh(std::error_code& ec) {
        ec.clear();
        slots_.clear();
        struct stat st{};
        if (::fstat(fd_.get(), &st) < 0) {
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        size_t size = static_cast<size_t>(st.st_size);
        if (size % recordSize_ != 0) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }
        if (!mmap_.map(fd_.get(), size, ec))
            return false;

        T temp;
        for (size_t i = 0; i < slotCount(); ++i) {
            if (!temp.deserialize(mmap_.data() + i * recordSize_, ec)) {
                slots_.clear();
                return false;
            }
            slots_[temp.getId()] = i;
        }
        lastMtime_ = st.st_mtim;
        lastSize_ = size;
        return true;
    }

    /// @brief Drops the slot added by a failed append
    ///
    /// The caller reports its own error. If the truncate fails as well, the
    /// next checkAndRefresh sees the size change and rejects the file.
    void shrinkTo(size_t slots) {
        mmap_.reset();
        if (::ftruncate(fd_.get(), static_cast<off_t>(slots * recordSize_)) != 0)
            return;
        std::error_code remapEc;
        if (!refresh(remapEc))
            lastSize_ = static_cast<size_t>(-1);
    }

    void updateFileStats() {
        struct stat st{};
        if (::fstat(fd_.get(), &st) == 0) {
            lastMtime_ = st.st_mtim;
            lastSize_ = static_cast<size_t>(st.st_size);
        }
    }

    std::optional<size_t> findSlot(const std::string& id) const {
        auto it = slots_.find(id);
        if (it == slots_.end())
            return std::nullopt;
        return it->second;
    }

    size_t slotCount() const { return mmap_ ? mmap_.size() / recordSize_ : 0; }

    std::string path_;
    detail::UniqueFd fd_;
    detail::MmapGuard mmap_;
    size_t recordSize_ = 0;
    std::unordered_map<std::string, size_t> slots_;
    struct timespec lastMtime_{};
    size_t lastSize_ = 0;
};

} // namespace BookTracker
