#pragma once
/// @file IdWatermark.hpp
/// @brief Highest id ever removed from a record file

#include "VariableRecordBase.hpp"

#include <cstdint>
#include <string>

namespace BookTracker {

/// @brief Removal high-water mark kept beside the books it covers
///
/// Line format: `IdWatermark { "sequence": "books", "last_id": 3 }`
///
/// The record id is the sequence name, which never parses as a book id.
/// Together with the stored books it bounds every id that was ever issued,
/// so the counter can be restored without the sequence file.
class IdWatermark : public VariableRecordBase {
  public:
    std::string sequenceName;
    uint64_t lastId = 0;

    IdWatermark() = default;
    IdWatermark(std::string name, uint64_t last) : sequenceName(std::move(name)), lastId(last) {}

    std::string id() const override { return sequenceName; }
    const char* typeName() const override { return "IdWatermark"; }

    std::unique_ptr<VariableRecordBase> clone() const override {
        return std::make_unique<IdWatermark>(*this);
    }

    void toKv(util::FieldList& out) const override;
    bool fromKv(const util::FieldMap& kv, std::error_code& ec) override;
};

} // namespace BookTracker
