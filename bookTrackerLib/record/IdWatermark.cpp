#include <booktracker/record/IdWatermark.hpp>

namespace BookTracker {

void IdWatermark::toKv(util::FieldList& out) const {
    out.clear();
    out.push_back({"sequence", {true, sequenceName}});
    out.push_back({"last_id", {false, std::to_string(lastId)}});
}

bool IdWatermark::fromKv(const util::FieldMap& kv, std::error_code& ec) {
    ec.clear();
    auto name = kv.find("sequence");
    auto last = kv.find("last_id");
    if (kv.size() != 2 || name == kv.end() || last == kv.end() || !name->second.first ||
        last->second.first || name->second.second.empty()) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    uint64_t value = 0;
    if (!util::parseUnsignedStrict(last->second.second, value, ec))
        return false;
    sequenceName = name->second.second;
    lastId = value;
    return true;
}

} // namespace BookTracker
