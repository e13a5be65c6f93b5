#pragma once
/// @file BookStore.hpp
/// @brief Owner-scoped CRUD store for books

#include "../record/Book.hpp"
#include "../repository/VariableFileRepositoryImpl.hpp"
#include "../util/StoreConfig.hpp"
#include "IdAllocator.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace BookTracker {

/// @brief Record store over `books.db` with ids from `sequence.db`
///
/// Every operation either completes or fails with @p ec set and leaves the
/// stored state untouched. Arguments are validated before anything is written.
/// Errors: StoreErrc::NotFound, StoreErrc::Unauthorized, StoreErrc::InvalidInput, or
/// a generic_category errno for I/O failures.
///
/// Not thread-safe. Calls are expected to be serialized by the host.
class BookStore {
  public:
    /// @brief Opens (creating if needed) the data directory of @p config
    BookStore(const StoreConfig& config, std::error_code& ec);

    BookStore(const BookStore&) = delete;
    BookStore& operator=(const BookStore&) = delete;

    /// @brief Creates a book owned by @p caller
    /// @return The new id, or an empty string on failure
    std::string add(const std::string& caller, const BookFields& fields, std::error_code& ec);

    /// @brief Applies @p patch to a book owned by @p caller
    /// @return The updated book, or nullptr on failure
    std::unique_ptr<Book> update(const std::string& caller, const std::string& id,
                                 const BookPatch& patch, std::error_code& ec);

    /// @brief Deletes a book owned by @p caller
    /// @return The removed book, or nullptr on failure
    std::unique_ptr<Book> remove(const std::string& caller, const std::string& id,
                                 std::error_code& ec);

    std::unique_ptr<Book> get(const std::string& id, std::error_code& ec);

    /// @brief One page of books in ascending id order
    /// @param owner Restricts the listing to this owner before paging
    /// @param skip Books to pass over; past the end gives an empty page
    /// @param limit Page size; absent means maxPageSize, larger values are capped, 0 is invalid
    std::vector<std::unique_ptr<Book>> list(const std::optional<std::string>& owner, uint64_t skip,
                                            std::optional<uint64_t> limit, std::error_code& ec);

    size_t count(std::error_code& ec);

    /// @brief Ids owned by @p owner, ascending
    std::vector<uint64_t> idsOwnedBy(const std::string& owner, std::error_code& ec);

    const StoreConfig& config() const { return config_; }

  private:
    /// @brief Loads @p id and checks that @p caller owns it
    std::unique_ptr<Book> loadOwned(const std::string& caller, const std::string& id,
                                    std::error_code& ec);
    /// @brief Records @p removedId in the IdWatermark of books.db if it is the highest removed so far
    bool raiseWatermark(uint64_t removedId, std::error_code& ec);
    /// @brief Rebuilds ownerIndex_ if the books file was reloaded since the last build
    bool refreshOwnerIndex(std::error_code& ec);

    StoreConfig config_;
    std::unique_ptr<VariableFileRepositoryImpl> books_;
    std::unique_ptr<IdAllocator> ids_;

    std::map<std::string, std::set<uint64_t>> ownerIndex_;
    uint64_t indexedGeneration_ = 0;
};

} // namespace BookTracker
