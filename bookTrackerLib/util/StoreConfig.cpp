#include <booktracker/error.hpp>
#include <booktracker/util/StoreConfig.hpp>

#include <cstdlib>
#include <fstream>

namespace BookTracker {

namespace {

constexpr const char* LOG_MODULE = "config";

bool invalid(std::error_code& ec, const std::string& what) {
    BT_LOG_ERROR(LOG_MODULE, what);
    ec = StoreErrc::InvalidInput;
    return false;
}

} // namespace

bool StoreConfig::apply(const util::FieldMap& kv, std::error_code& ec) {
    ec.clear();
    StoreConfig next = *this;

    for (const auto& [key, value] : kv) {
        const bool isString = value.first;
        const std::string& text = value.second;

        if (key == "data_dir") {
            if (!isString)
                return invalid(ec, "data_dir must be a string");
            next.dataDir = text;
        } else if (key == "max_page_size") {
            std::error_code numEc;
            if (isString || !util::parseUnsignedStrict(text, next.maxPageSize, numEc))
                return invalid(ec, "max_page_size must be a non-negative integer");
        } else if (key == "log_level") {
            std::error_code levelEc;
            if (!isString || !parseLogLevel(text, next.logLevel, levelEc))
                return invalid(ec, "unknown log_level '" + text + "'");
        } else {
            return invalid(ec, "unknown config key '" + key + "'");
        }
    }

    *this = std::move(next);
    return true;
}

bool StoreConfig::loadFile(const std::string& path, std::error_code& ec) {
    ec.clear();
    std::ifstream in(path);
    if (!in) {
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
        BT_LOG_ERROR(LOG_MODULE, "cannot read " << path);
        return false;
    }

    // Lines apply to a copy so a bad line leaves the whole file unapplied.
    StoreConfig loaded = *this;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#')
            continue;

        std::string type;
        util::FieldMap kv;
        if (!util::parseLine(line, type, kv, ec) || type != "Config")
            return invalid(ec, path + ":" + std::to_string(lineNo) + ": expected Config { ... }");
        if (!loaded.apply(kv, ec))
            return false;
    }
    *this = std::move(loaded);
    BT_LOG_DEBUG(LOG_MODULE, "loaded " << path);
    return true;
}

bool StoreConfig::loadEnvironment(std::error_code& ec) {
    ec.clear();
    util::FieldMap kv;
    if (const char* dir = std::getenv("BOOKTRACKER_DATA_DIR"))
        kv["data_dir"] = {true, dir};
    if (const char* size = std::getenv("BOOKTRACKER_MAX_PAGE_SIZE"))
        kv["max_page_size"] = {false, size};
    if (const char* level = std::getenv("BOOKTRACKER_LOG_LEVEL"))
        kv["log_level"] = {true, level};
    return apply(kv, ec);
}

bool StoreConfig::validate(std::error_code& ec) const {
    ec.clear();
    if (dataDir.empty())
        return invalid(ec, "data_dir is empty");
    if (maxPageSize == 0)
        return invalid(ec, "max_page_size must be greater than 0");
    return true;
}

} // namespace BookTracker
