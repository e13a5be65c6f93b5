#pragma once
/// @file Book.hpp
/// @brief Book record, its status set and the inputs that create or modify it

#include "VariableRecordBase.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

namespace BookTracker {

/// @brief Reading status. Closed set, validated on input.
enum class BookStatus { List, Reading, Read };

const char* toString(BookStatus status) noexcept;

/// @brief Parses "List", "Reading" or "Read" (exact case)
/// @return false with StoreErrc::InvalidInput for anything else
bool parseBookStatus(const std::string& text, BookStatus& out, std::error_code& ec);

/// @brief User-supplied content of a book
struct BookFields {
    std::string title;
    std::string description;
    BookStatus status = BookStatus::List;
    std::string image; ///< Cover URL

    /// @brief A book needs a non-empty title
    bool validate(std::error_code& ec) const;

    bool operator==(const BookFields& other) const {
        return title == other.title && description == other.description &&
               status == other.status && image == other.image;
    }
    bool operator!=(const BookFields& other) const { return !(*this == other); }
};

/// @brief Partial update. Absent members are left unchanged.
struct BookPatch {
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<BookStatus> status;
    std::optional<std::string> image;

    bool empty() const { return !title && !description && !status && !image; }

    /// @brief Rejects an empty patch and an empty title
    bool validate(std::error_code& ec) const;
};

/// @brief Stored book
///
/// Line format: `Book { "book_id": "1", "account_id": "alice.near", "title": ..., "description": ...,
/// "status": "List", "image": ... }`
class Book : public VariableRecordBase {
  public:
    std::string bookId; ///< Decimal id issued by IdAllocator
    std::string owner;  ///< Caller identity of the creator
    BookFields fields;

    Book() = default;
    Book(std::string id, std::string ownerId, BookFields content)
        : bookId(std::move(id)), owner(std::move(ownerId)), fields(std::move(content)) {}

    std::string id() const override { return bookId; }
    const char* typeName() const override { return "Book"; }

    std::unique_ptr<VariableRecordBase> clone() const override {
        return std::make_unique<Book>(*this);
    }

    void toKv(util::FieldList& out) const override;
    bool fromKv(const util::FieldMap& kv, std::error_code& ec) override;

    /// @brief Numeric value of bookId, used for ordering
    uint64_t sequence() const;

    /// @brief Overwrites the members present in @p patch
    void apply(const BookPatch& patch);
};

} // namespace BookTracker
