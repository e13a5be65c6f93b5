#pragma once
/// @file error.hpp
/// @brief Domain error codes reported through std::error_code

#include <string>
#include <system_error>
#include <type_traits>

namespace BookTracker {

/// @brief Failures of a store operation that are not I/O errors
enum class StoreErrc {
    NotFound = 1, ///< No record with the requested id
    Unauthorized, ///< Caller does not own the record, or has no identity
    InvalidInput, ///< Missing or malformed argument
};

/// @brief Category for StoreErrc, named "booktracker"
const std::error_category& storeCategory() noexcept;

/// @brief Enables `ec = StoreErrc::NotFound` and `ec == StoreErrc::NotFound`
std::error_code make_error_code(StoreErrc e) noexcept;

/// @brief Short code name for replies: the StoreErrc name, or "IoError" for any other category
std::string errorCodeName(const std::error_code& ec);

} // namespace BookTracker

namespace std {
template <> struct is_error_code_enum<BookTracker::StoreErrc> : true_type {};
} // namespace std
