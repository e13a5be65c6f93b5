#include <booktracker/error.hpp>
#include <booktracker/record/Book.hpp>

namespace BookTracker {

namespace {

constexpr const char* KEY_ID = "book_id";
constexpr const char* KEY_OWNER = "account_id";
constexpr const char* KEY_TITLE = "title";
constexpr const char* KEY_DESCRIPTION = "description";
constexpr const char* KEY_STATUS = "status";
constexpr const char* KEY_IMAGE = "image";

/// @brief Looks up a required string member
bool requireString(const util::FieldMap& kv, const char* key, std::string& out) {
    auto it = kv.find(key);
    if (it == kv.end() || !it->second.first)
        return false;
    out = it->second.second;
    return true;
}

} // namespace

const char* toString(BookStatus status) noexcept {
    switch (status) {
    case BookStatus::List:
        return "List";
    case BookStatus::Reading:
        return "Reading";
    case BookStatus::Read:
        return "Read";
    }
    return "List";
}

bool parseBookStatus(const std::string& text, BookStatus& out, std::error_code& ec) {
    ec.clear();
    for (BookStatus s : {BookStatus::List, BookStatus::Reading, BookStatus::Read}) {
        if (text == toString(s)) {
            out = s;
            return true;
        }
    }
    ec = StoreErrc::InvalidInput;
    return false;
}

bool BookFields::validate(std::error_code& ec) const {
    ec.clear();
    if (title.empty()) {
        ec = StoreErrc::InvalidInput;
        return false;
    }
    return true;
}

bool BookPatch::validate(std::error_code& ec) const {
    ec.clear();
    if (empty() || (title && title->empty())) {
        ec = StoreErrc::InvalidInput;
        return false;
    }
    return true;
}

void Book::toKv(util::FieldList& out) const {
    out.clear();
    out.push_back({KEY_ID, {true, bookId}});
    out.push_back({KEY_OWNER, {true, owner}});
    out.push_back({KEY_TITLE, {true, fields.title}});
    out.push_back({KEY_DESCRIPTION, {true, fields.description}});
    out.push_back({KEY_STATUS, {true, toString(fields.status)}});
    out.push_back({KEY_IMAGE, {true, fields.image}});
}

bool Book::fromKv(const util::FieldMap& kv, std::error_code& ec) {
    ec.clear();
    if (kv.size() != 6) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    Book parsed;
    std::string status;
    if (!requireString(kv, KEY_ID, parsed.bookId) || !requireString(kv, KEY_OWNER, parsed.owner) ||
        !requireString(kv, KEY_TITLE, parsed.fields.title) ||
        !requireString(kv, KEY_DESCRIPTION, parsed.fields.description) ||
        !requireString(kv, KEY_STATUS, status) || !requireString(kv, KEY_IMAGE, parsed.fields.image)) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    // Ids order the store, so a stored id must be a positive decimal.
    uint64_t seq = 0;
    if (!util::parseUnsignedStrict(parsed.bookId, seq, ec) || seq == 0 || parsed.owner.empty()) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    if (!parseBookStatus(status, parsed.fields.status, ec)) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    *this = std::move(parsed);
    return true;
}

uint64_t Book::sequence() const {
    uint64_t seq = 0;
    std::error_code ec;
    if (!util::parseUnsignedStrict(bookId, seq, ec))
        return 0;
    return seq;
}

void Book::apply(const BookPatch& patch) {
    if (patch.title)
        fields.title = *patch.title;
    if (patch.description)
        fields.description = *patch.description;
    if (patch.status)
        fields.status = *patch.status;
    if (patch.image)
        fields.image = *patch.image;
}

} // namespace BookTracker
