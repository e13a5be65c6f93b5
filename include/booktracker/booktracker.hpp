#pragma once

/**
 * @file booktracker.hpp
 * @brief Convenience header for the BookTracker library
 *
 * @code
 * #include <booktracker/booktracker.hpp>
 *
 * int main() {
 *     std::error_code ec;
 *     BookTracker::StoreConfig config;
 *     config.dataDir = "./books";
 *     BookTracker::BookStore store(config, ec);
 *     if (ec)
 *         return 1;
 *
 *     BookTracker::BookFields dune{"Dune", "Arrakis", BookTracker::BookStatus::List, ""};
 *     std::string id = store.add("alice.near", dune, ec);
 *     auto mine = store.list(std::string("alice.near"), 0, 10, ec);
 * }
 * @endcode
 */

// Errors, logging, configuration
#include "error.hpp"
#include "util/Logger.hpp"
#include "util/StoreConfig.hpp"

// Records
#include "record/Book.hpp"
#include "record/IdWatermark.hpp"
#include "record/SequenceRecord.hpp"

// Storage
#include "repository/UniformFixedRepositoryImpl.hpp"
#include "repository/VariableFileRepositoryImpl.hpp"

// Store and request binding
#include "contract/BookContract.hpp"
#include "store/BookStore.hpp"
#include "store/IdAllocator.hpp"

namespace BookTracker {

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "1.0.0";

} // namespace BookTracker
