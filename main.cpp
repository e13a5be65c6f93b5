#include <iostream>
#include <string>
#include <vector>

#include <cxxopts.hpp>

#include <booktracker/booktracker.hpp>

using namespace BookTracker;

namespace {

/// @brief Runs one request and prints the reply; false if the request failed
bool runRequest(BookContract& contract, const std::string& caller, const std::string& request) {
    std::error_code ec;
    std::cout << contract.call(caller, request, ec);
    return !ec;
}

} // namespace

int main(int argc, char* argv[]) {
    bool help = false;
    std::string caller, dataDir, configFile, logLevel;
    uint64_t maxPageSize = 0;
    std::vector<std::string> requests;

    cxxopts::Options cmd_args(argv[0], "Book tracker: persistent per-owner book records");
    cmd_args.add_options()("h,help", "print help message",
                           cxxopts::value<bool>(help)->default_value("false"))(
        "c,caller", "caller identity used for every request",
        cxxopts::value<std::string>(caller)->default_value(""))(
        "d,data-dir", "data directory (overrides config and environment)",
        cxxopts::value<std::string>(dataDir)->default_value(""))(
        "config", "config file with a Config { ... } line",
        cxxopts::value<std::string>(configFile)->default_value(""))(
        "log-level", "debug, info, warn, error or off",
        cxxopts::value<std::string>(logLevel)->default_value(""))(
        "max-page-size", "largest page get_books may return",
        cxxopts::value<uint64_t>(maxPageSize)->default_value("0"))(
        "request", "request lines; read from stdin when absent",
        cxxopts::value<std::vector<std::string>>(requests));
    cmd_args.parse_positional({"request"});
    cmd_args.positional_help("[request...]");

    try {
        cmd_args.parse(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n" << cmd_args.help();
        return 2;
    }

    if (help) {
        std::cout << cmd_args.help();
        return 0;
    }

    std::error_code ec;
    StoreConfig config;
    if (!configFile.empty() && !config.loadFile(configFile, ec)) {
        std::cerr << "config: " << ec.message() << "\n";
        return 2;
    }
    if (!config.loadEnvironment(ec)) {
        std::cerr << "environment: " << ec.message() << "\n";
        return 2;
    }
    if (!dataDir.empty())
        config.dataDir = dataDir;
    if (maxPageSize > 0)
        config.maxPageSize = maxPageSize;
    if (!logLevel.empty() && !parseLogLevel(logLevel, config.logLevel, ec)) {
        std::cerr << "Error: unknown log level '" << logLevel << "'\n";
        return 2;
    }
    Logger::instance().setMinimumLevel(config.logLevel);

    BookStore store(config, ec);
    if (ec) {
        std::cerr << "open " << config.dataDir << ": " << ec.message() << "\n";
        return 1;
    }
    BookContract contract(store);

    bool allOk = true;
    if (!requests.empty()) {
        for (const auto& request : requests)
            allOk = runRequest(contract, caller, request) && allOk;
        return allOk ? 0 : 1;
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#')
            continue;
        allOk = runRequest(contract, caller, line) && allOk;
    }
    return allOk ? 0 : 1;
}
