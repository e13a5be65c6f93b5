#include <booktracker/contract/BookContract.hpp>
#include <booktracker/error.hpp>
#include <booktracker/util/Logger.hpp>

#include <initializer_list>
#include <optional>

namespace BookTracker {

namespace {

constexpr const char* LOG_MODULE = "contract";

bool rejectInput(std::error_code& ec, const std::string& why) {
    BT_LOG_WARN(LOG_MODULE, "invalid arguments: " << why);
    ec = StoreErrc::InvalidInput;
    return false;
}

bool onlyKeys(const util::FieldMap& args, std::initializer_list<const char*> allowed,
              std::error_code& ec) {
    for (const auto& entry : args) {
        bool known = false;
        for (const char* key : allowed)
            known = known || entry.first == key;
        if (!known)
            return rejectInput(ec, "unexpected key '" + entry.first + "'");
    }
    return true;
}

bool optionalText(const util::FieldMap& args, const char* key, std::optional<std::string>& out,
                  std::error_code& ec) {
    auto it = args.find(key);
    if (it == args.end())
        return true;
    if (!it->second.first)
        return rejectInput(ec, std::string(key) + " must be a string");
    out = it->second.second;
    return true;
}

bool requireText(const util::FieldMap& args, const char* key, std::string& out,
                 std::error_code& ec) {
    std::optional<std::string> value;
    if (!optionalText(args, key, value, ec))
        return false;
    if (!value)
        return rejectInput(ec, std::string("missing ") + key);
    out = std::move(*value);
    return true;
}

bool optionalStatus(const util::FieldMap& args, const char* key,
                    std::optional<BookStatus>& out, std::error_code& ec) {
    std::optional<std::string> text;
    if (!optionalText(args, key, text, ec))
        return false;
    if (!text)
        return true;
    BookStatus status;
    if (!parseBookStatus(*text, status, ec))
        return rejectInput(ec, "unknown status '" + *text + "'");
    out = status;
    return true;
}

bool optionalCount(const util::FieldMap& args, const char* key, std::optional<uint64_t>& out,
                   std::error_code& ec) {
    auto it = args.find(key);
    if (it == args.end())
        return true;
    uint64_t value = 0;
    std::error_code numEc;
    if (it->second.first || !util::parseUnsignedStrict(it->second.second, value, numEc))
        return rejectInput(ec, std::string(key) + " must be a non-negative integer");
    out = value;
    return true;
}

/// @brief book_id may be sent as a string ("3") or as a bare integer (3)
bool requireBookId(const util::FieldMap& args, std::string& out, std::error_code& ec) {
    auto it = args.find("book_id");
    if (it == args.end() || it->second.second.empty())
        return rejectInput(ec, "missing book_id");
    out = it->second.second;
    return true;
}

} // namespace

std::string BookContract::addBook(const std::string& caller, const util::FieldMap& args,
                                  std::error_code& ec) {
    ec.clear();
    if (!onlyKeys(args, {"book.title", "book.description", "book.status", "book.image"}, ec))
        return {};

    BookFields fields;
    std::optional<BookStatus> status;
    if (!requireText(args, "book.title", fields.title, ec) ||
        !requireText(args, "book.description", fields.description, ec) ||
        !optionalStatus(args, "book.status", status, ec) ||
        !requireText(args, "book.image", fields.image, ec))
        return {};
    if (!status) {
        rejectInput(ec, "missing book.status");
        return {};
    }
    fields.status = *status;
    return store_.add(caller, fields, ec);
}

std::unique_ptr<Book> BookContract::updateBook(const std::string& caller,
                                               const util::FieldMap& args, std::error_code& ec) {
    ec.clear();
    if (!onlyKeys(args, {"book_id", "status", "title", "description", "image"}, ec))
        return nullptr;

    std::string id;
    BookPatch patch;
    if (!requireBookId(args, id, ec) || !optionalStatus(args, "status", patch.status, ec) ||
        !optionalText(args, "title", patch.title, ec) ||
        !optionalText(args, "description", patch.description, ec) ||
        !optionalText(args, "image", patch.image, ec))
        return nullptr;
    return store_.update(caller, id, patch, ec);
}

std::unique_ptr<Book> BookContract::deleteBook(const std::string& caller,
                                               const util::FieldMap& args, std::error_code& ec) {
    ec.clear();
    std::string id;
    if (!onlyKeys(args, {"book_id"}, ec) || !requireBookId(args, id, ec))
        return nullptr;
    return store_.remove(caller, id, ec);
}

std::unique_ptr<Book> BookContract::getBook(const util::FieldMap& args, std::error_code& ec) {
    ec.clear();
    std::string id;
    if (!onlyKeys(args, {"book_id"}, ec) || !requireBookId(args, id, ec))
        return nullptr;
    return store_.get(id, ec);
}

std::vector<std::unique_ptr<Book>> BookContract::getBooks(const util::FieldMap& args,
                                                          std::error_code& ec) {
    ec.clear();
    std::optional<std::string> owner;
    std::optional<uint64_t> skip;
    std::optional<uint64_t> limit;
    if (!onlyKeys(args, {"account_id", "skip", "limit"}, ec) ||
        !optionalText(args, "account_id", owner, ec) || !optionalCount(args, "skip", skip, ec) ||
        !optionalCount(args, "limit", limit, ec))
        return {};
    return store_.list(owner, skip.value_or(0), limit, ec);
}

std::string BookContract::call(const std::string& caller, const std::string& request,
                               std::error_code& ec) {
    ec.clear();
    std::string op;
    util::FieldMap args;
    if (!util::parseLine(request, op, args, ec)) {
        rejectInput(ec, "malformed request line");
        return formatError(ec);
    }
    BT_LOG_DEBUG(LOG_MODULE, caller << " calls " << op);

    std::string reply;
    if (op == "add_book") {
        std::string id = addBook(caller, args, ec);
        if (!ec)
            reply = util::formatLine("Ok", {{"book_id", {true, id}}});
    } else if (op == "update_book" || op == "delete_book" || op == "get_book") {
        std::unique_ptr<Book> book;
        if (op == "update_book")
            book = updateBook(caller, args, ec);
        else if (op == "delete_book")
            book = deleteBook(caller, args, ec);
        else
            book = getBook(args, ec);
        if (!ec)
            reply = formatBook("Ok", *book);
    } else if (op == "get_books") {
        auto books = getBooks(args, ec);
        if (!ec) {
            reply = util::formatLine("Ok", {{"count", {false, std::to_string(books.size())}}});
            for (const auto& b : books)
                reply += formatBook("Book", *b);
        }
    } else {
        rejectInput(ec, "unknown operation '" + op + "'");
    }

    return ec ? formatError(ec) : reply;
}

std::string BookContract::formatError(const std::error_code& ec) {
    return util::formatLine("Error",
                            {{"code", {true, errorCodeName(ec)}}, {"message", {true, ec.message()}}});
}

std::string BookContract::formatBook(const char* type, const Book& book) {
    util::FieldList fields;
    book.toKv(fields);
    return util::formatLine(type, fields);
}

} // namespace BookTracker
