#pragma once
/// @file SequenceRecord.hpp
/// @brief Fixed-length record holding one named monotonic counter

#include "FieldMeta.hpp"
#include "FixedRecordBase.hpp"

#include <string>

namespace BookTracker {

/// @brief Named counter persisted by IdAllocator
///
/// On disk: `Sequence,id:"books..."{value:+0000000000000000003}`
class SequenceRecord : public FixedRecordBase<SequenceRecord> {
  public:
    int64_t value; ///< Last issued value, 0 before the first allocation

  private:
    auto fields() const { return std::make_tuple(BT_NUM(value)); }

    void initMembers() { value = 0; }

    BT_RECORD_IMPL(SequenceRecord, "Sequence", 8, 16)

  public:
    SequenceRecord(const std::string& name, int64_t v) {
        initMembers();
        value = v;
        setId(name);
        defineLayout();
    }
};

} // namespace BookTracker
