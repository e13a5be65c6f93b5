#pragma once
/// @file StoreConfig.hpp
/// @brief Store settings: defaults, config file, environment

#include "Logger.hpp"
#include "textFormatUtil.hpp"

#include <cstdint>
#include <string>
#include <system_error>

namespace BookTracker {

/// @brief Settings of one BookStore
///
/// Sources, lowest precedence first: defaults, a config file, environment
/// variables, then whatever the caller (the CLI) sets explicitly.
///
/// Config file: a single line
/// `Config { "data_dir": "/var/lib/books", "max_page_size": 50, "log_level": "debug" }`.
/// Every key is optional.
struct StoreConfig {
    std::string dataDir = "./booktracker-data";
    uint64_t maxPageSize = 100; ///< Cap applied to get_books limits
    LogLevel logLevel = LogLevel::Info;

    std::string booksPath() const { return dataDir + "/books.db"; }
    std::string sequencePath() const { return dataDir + "/sequence.db"; }

    /// @brief Applies parsed `Config` members on top of the current values
    /// @return false with StoreErrc::InvalidInput on an unknown key or bad value
    bool apply(const util::FieldMap& kv, std::error_code& ec);

    /// @brief Reads and applies a config file
    bool loadFile(const std::string& path, std::error_code& ec);

    /// @brief Applies BOOKTRACKER_DATA_DIR, BOOKTRACKER_MAX_PAGE_SIZE, BOOKTRACKER_LOG_LEVEL
    bool loadEnvironment(std::error_code& ec);

    /// @brief Checks the combined result (non-empty dir, page size > 0)
    bool validate(std::error_code& ec) const;
};

} // namespace BookTracker
