#pragma once
/// @file VariableRecordBase.hpp
/// @brief Base for records stored as one text line of key/value members

#include "../util/textFormatUtil.hpp"
#include "RecordBase.hpp"

#include <memory>
#include <system_error>

namespace BookTracker {

/// @brief Variable-length record serialized through util::formatLine / util::parseLine
class VariableRecordBase : public RecordBase {
  public:
    ~VariableRecordBase() override = default;

    /// @brief Writes the members in file order
    virtual void toKv(util::FieldList& out) const = 0;

    /// @brief Restores the members from a parsed line
    /// @return false with @p ec set when a key is missing, unknown or mistyped
    virtual bool fromKv(const util::FieldMap& kv, std::error_code& ec) = 0;

    /// @brief Deep copy. Also used to instantiate records from a prototype.
    virtual std::unique_ptr<VariableRecordBase> clone() const = 0;
};

} // namespace BookTracker
