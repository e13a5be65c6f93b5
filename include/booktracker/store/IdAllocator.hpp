#pragma once
/// @file IdAllocator.hpp
/// @brief Persistent monotonic id sequence

#include "../record/SequenceRecord.hpp"
#include "../repository/UniformFixedRepositoryImpl.hpp"

#include <cstdint>
#include <string>
#include <system_error>

namespace BookTracker {

/// @brief Issues "1", "2", "3", ... from a counter stored in a SequenceRecord file
///
/// Issued values are never reused: deleting a record does not move the counter back,
/// and nothing rolls it back if the caller fails after next() returned.
class IdAllocator {
  public:
    /// @param path Sequence file
    /// @param name Counter name, i.e. the record id inside the file
    IdAllocator(const std::string& path, const std::string& name, std::error_code& ec);

    /// @brief Advances the counter and returns the new value in decimal
    /// @return Empty string with @p ec set if the counter cannot be read or persisted
    std::string next(std::error_code& ec);

    /// @brief Last issued value, 0 before the first next()
    uint64_t current(std::error_code& ec);

    /// @brief Raises the counter to at least @p floor; never lowers it
    /// @details Used when records exist whose ids the counter has not seen, e.g.
    ///          after the sequence file was lost.
    bool advanceTo(uint64_t floor, std::error_code& ec);

  private:
    std::string name_;
    UniformFixedRepositoryImpl<SequenceRecord> repo_;
};

} // namespace BookTracker
