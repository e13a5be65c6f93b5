#pragma once
/// @file VariableFileRepositoryImpl.hpp
/// @brief Line-per-record text repository for variable-length records

#include "../record/VariableRecordBase.hpp"
#include "../util/UniqueFd.hpp"
#include "RecordRepository.hpp"

#include <cstdint>
#include <ctime>
#include <unordered_map>

namespace BookTracker {

/// @brief Repository of VariableRecordBase records, one `Type { ... }` line each
///
/// - Records are restored through a prototype per typeName().
/// - The parsed file is cached and reloaded when its mtime or size changes,
///   which also picks up writes from other processes.
/// - Inserts append; updates and deletes rewrite the file in its current order,
///   so file order is insertion order.
/// - Reads take a shared fcntl lock, writes an exclusive one.
class VariableFileRepositoryImpl : public RecordRepository<VariableRecordBase> {
  public:
    /// @param path Repository file; missing parent directories are created
    /// @param prototypes One instance per record type the file may contain
    /// @param ec Set if the directory or the file cannot be created
    VariableFileRepositoryImpl(const std::string& path,
                               std::vector<std::unique_ptr<VariableRecordBase>> prototypes,
                               std::error_code& ec);
    ~VariableFileRepositoryImpl() override = default;

    bool save(const VariableRecordBase& record, std::error_code& ec) override;
    /// @brief Returns clones; callers may modify them freely
    std::vector<std::unique_ptr<VariableRecordBase>> findAll(std::error_code& ec) override;
    std::unique_ptr<VariableRecordBase> findById(const std::string& id,
                                                 std::error_code& ec) override;
    bool deleteById(const std::string& id, std::error_code& ec) override;
    size_t count(std::error_code& ec) override;
    bool existsById(const std::string& id, std::error_code& ec) override;

    /// @brief Incremented every time the cache is rebuilt from disk
    /// @details Lets callers keep derived indexes and rebuild them only when this changes.
    uint64_t generation(std::error_code& ec);

    /// @brief Lines skipped during the last reload because they failed to parse
    size_t skippedLines() const { return skippedLines_; }

  private:
    bool appendRecord(const VariableRecordBase& record, std::error_code& ec);
    bool rewriteAll(const std::vector<std::unique_ptr<VariableRecordBase>>& records,
                    std::error_code& ec);
    bool writeAll(const std::string& data, std::error_code& ec);
    bool sync(std::error_code& ec);

    bool checkAndRefreshCache(std::error_code& ec);
    void updateFileStats();
    bool loadAllToCache(std::error_code& ec);
    void invalidateCache();
    const VariableRecordBase* findCached(const std::string& id) const;

    std::string path_;
    detail::UniqueFd fd_;
    std::unordered_map<std::string, std::unique_ptr<VariableRecordBase>> prototypes_;

    std::vector<std::unique_ptr<VariableRecordBase>> cache_;
    bool cacheValid_ = false;
    uint64_t generation_ = 0;
    size_t skippedLines_ = 0;
    struct timespec lastMtime_{};
    size_t lastSize_ = 0;
};

} // namespace BookTracker
