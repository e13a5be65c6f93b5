#include <booktracker/error.hpp>

namespace BookTracker {

namespace {

class StoreCategory : public std::error_category {
  public:
    const char* name() const noexcept override { return "booktracker"; }

    std::string message(int ev) const override {
        switch (static_cast<StoreErrc>(ev)) {
        case StoreErrc::NotFound:
            return "Book does not exist";
        case StoreErrc::Unauthorized:
            return "Caller does not own the book";
        case StoreErrc::InvalidInput:
            return "Invalid input";
        }
        return "Unknown booktracker error";
    }
};

} // namespace

const std::error_category& storeCategory() noexcept {
    static StoreCategory category;
    return category;
}

std::error_code make_error_code(StoreErrc e) noexcept {
    return std::error_code(static_cast<int>(e), storeCategory());
}

std::string errorCodeName(const std::error_code& ec) {
    if (ec.category() != storeCategory())
        return "IoError";
    switch (static_cast<StoreErrc>(ec.value())) {
    case StoreErrc::NotFound:
        return "NotFound";
    case StoreErrc::Unauthorized:
        return "Unauthorized";
    case StoreErrc::InvalidInput:
        return "InvalidInput";
    }
    return "Unknown";
}

} // namespace BookTracker
