#pragma once
/// @file RecordBase.hpp
/// @brief Common interface of records kept in a repository file

#include <string>

namespace BookTracker {

/// @brief Identity shared by every polymorphic record type
class RecordBase {
  public:
    virtual ~RecordBase() = default;

    /// @brief Repository key. Unique within one file.
    virtual std::string id() const = 0;

    /// @brief Type tag written in front of every serialized record
    virtual const char* typeName() const = 0;
};

} // namespace BookTracker
