#pragma once
/// @file BookContract.hpp
/// @brief Request/reply binding of BookStore

#include "../store/BookStore.hpp"
#include "../util/textFormatUtil.hpp"

#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace BookTracker {

/// @brief Exposes BookStore as five named operations taking key/value arguments
///
/// Requests are lines in the text format, e.g.
///
///     add_book { "book": { "title": "Dune", "description": "", "status": "List", "image": "" } }
///     update_book { "book_id": "1", "status": "Reading" }
///     delete_book { "book_id": "1" }
///     get_book { "book_id": "1" }
///     get_books { "account_id": "alice.near", "skip": 0, "limit": 10 }
///
/// The caller identity comes from the host and is never read from the arguments.
/// Unknown argument keys are rejected with StoreErrc::InvalidInput.
class BookContract {
  public:
    explicit BookContract(BookStore& store) : store_(store) {}

    /// @brief `add_book`: requires book.title, book.description, book.status, book.image
    std::string addBook(const std::string& caller, const util::FieldMap& args,
                        std::error_code& ec);
    /// @brief `update_book`: book_id plus at least one of status, title, description, image
    std::unique_ptr<Book> updateBook(const std::string& caller, const util::FieldMap& args,
                                     std::error_code& ec);
    /// @brief `delete_book`: book_id
    std::unique_ptr<Book> deleteBook(const std::string& caller, const util::FieldMap& args,
                                     std::error_code& ec);
    /// @brief `get_book`: book_id
    std::unique_ptr<Book> getBook(const util::FieldMap& args, std::error_code& ec);
    /// @brief `get_books`: optional account_id, skip (default 0) and limit
    std::vector<std::unique_ptr<Book>> getBooks(const util::FieldMap& args, std::error_code& ec);

    /// @brief Parses @p request, runs it as @p caller and renders the reply
    /// @return One `Ok { ... }` line (followed by `Book { ... }` lines for get_books),
    ///         or one `Error { "code": ..., "message": ... }` line with @p ec set
    std::string call(const std::string& caller, const std::string& request, std::error_code& ec);

    static std::string formatError(const std::error_code& ec);
    static std::string formatBook(const char* type, const Book& book);

  private:
    BookStore& store_;
};

} // namespace BookTracker
