#include <booktracker/store/IdAllocator.hpp>
#include <booktracker/util/Logger.hpp>

#include <limits>

namespace BookTracker {

IdAllocator::IdAllocator(const std::string& path, const std::string& name, std::error_code& ec)
    : name_(name), repo_(path, ec) {
    if (ec)
        BT_LOG_ERROR("sequence", "cannot open " << path << ": " << ec.message());
}

std::string IdAllocator::next(std::error_code& ec) {
    uint64_t last = current(ec);
    if (ec)
        return {};
    if (last >= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        ec = std::make_error_code(std::errc::value_too_large);
        return {};
    }

    SequenceRecord rec(name_, static_cast<int64_t>(last + 1));
    if (!repo_.save(rec, ec)) {
        BT_LOG_ERROR("sequence", "cannot persist " << name_ << ": " << ec.message());
        return {};
    }
    return std::to_string(last + 1);
}

uint64_t IdAllocator::current(std::error_code& ec) {
    auto rec = repo_.findById(name_, ec);
    if (ec)
        return 0;
    if (!rec)
        return 0;
    if (rec->value < 0) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return 0;
    }
    return static_cast<uint64_t>(rec->value);
}

bool IdAllocator::advanceTo(uint64_t floor, std::error_code& ec) {
    uint64_t last = current(ec);
    if (ec)
        return false;
    if (floor <= last)
        return true;
    if (floor > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        ec = std::make_error_code(std::errc::value_too_large);
        return false;
    }

    BT_LOG_WARN("sequence", name_ << " counter behind stored records, advancing " << last << " -> "
                                  << floor);
    SequenceRecord rec(name_, static_cast<int64_t>(floor));
    return repo_.save(rec, ec);
}

} // namespace BookTracker
