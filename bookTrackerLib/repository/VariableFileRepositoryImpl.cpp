#include <booktracker/repository/VariableFileRepositoryImpl.hpp>
#include <booktracker/util/FileLockGuard.hpp>
#include <booktracker/util/Logger.hpp>

#include <errno.h>
#include <sys/stat.h>
#include <unistd.h>

#include <filesystem>
#include <unordered_set>

namespace BookTracker {

namespace fs = std::filesystem;

namespace {

constexpr const char* LOG_MODULE = "repository";

using LockMode = detail::FileLockGuard::Mode;

std::string formatRecord(const VariableRecordBase& record) {
    util::FieldList out;
    record.toKv(out);
    return util::formatLine(record.typeName(), out);
}

} // namespace

VariableFileRepositoryImpl::VariableFileRepositoryImpl(
    const std::string& path, std::vector<std::unique_ptr<VariableRecordBase>> prototypes,
    std::error_code& ec)
    : path_(path) {
    ec.clear();

    // First prototype wins for a given type name.
    for (auto& p : prototypes) {
        if (!p)
            continue;
        std::string type = p->typeName();
        if (prototypes_.find(type) == prototypes_.end())
            prototypes_.emplace(std::move(type), std::move(p));
    }

    fs::path dir = fs::path(path_).parent_path();
    if (!dir.empty()) {
        fs::create_directories(dir, ec);
        if (ec) {
            BT_LOG_ERROR(LOG_MODULE, "cannot create " << dir.string() << ": " << ec.message());
            return;
        }
    }

    fd_ = detail::UniqueFd::openReadWrite(path_, ec);
    if (ec) {
        BT_LOG_ERROR(LOG_MODULE, "cannot open " << path_ << ": " << ec.message());
        return;
    }
    updateFileStats();
}

bool VariableFileRepositoryImpl::save(const VariableRecordBase& record, std::error_code& ec) {
    detail::FileLockGuard lock(fd_.get(), LockMode::Exclusive, ec);
    if (ec)
        return false;
    if (!checkAndRefreshCache(ec))
        return false;

    if (!findCached(record.id()))
        return appendRecord(record, ec);

    // Line format has no in-place update: rebuild the snapshot with the record replaced.
    std::vector<std::unique_ptr<VariableRecordBase>> all;
    all.reserve(cache_.size());
    for (const auto& r : cache_)
        all.push_back(r->id() == record.id() ? record.clone() : r->clone());
    return rewriteAll(all, ec);
}

std::vector<std::unique_ptr<VariableRecordBase>>
VariableFileRepositoryImpl::findAll(std::error_code& ec) {
    std::vector<std::unique_ptr<VariableRecordBase>> result;

    detail::FileLockGuard lock(fd_.get(), LockMode::Shared, ec);
    if (ec)
        return result;
    if (!checkAndRefreshCache(ec))
        return result;

    result.reserve(cache_.size());
    for (const auto& r : cache_)
        result.push_back(r->clone());
    return result;
}

std::unique_ptr<VariableRecordBase> VariableFileRepositoryImpl::findById(const std::string& id,
                                                                         std::error_code& ec) {
    detail::FileLockGuard lock(fd_.get(), LockMode::Shared, ec);
    if (ec)
        return nullptr;
    if (!checkAndRefreshCache(ec))
        return nullptr;

    const VariableRecordBase* found = findCached(id);
    return found ? found->clone() : nullptr;
}

bool VariableFileRepositoryImpl::deleteById(const std::string& id, std::error_code& ec) {
    detail::FileLockGuard lock(fd_.get(), LockMode::Exclusive, ec);
    if (ec)
        return false;
    if (!checkAndRefreshCache(ec))
        return false;
    if (!findCached(id))
        return true;

    std::vector<std::unique_ptr<VariableRecordBase>> kept;
    kept.reserve(cache_.size());
    for (const auto& r : cache_) {
        if (r->id() != id)
            kept.push_back(r->clone());
    }
    return rewriteAll(kept, ec);
}

size_t VariableFileRepositoryImpl::count(std::error_code& ec) {
    detail::FileLockGuard lock(fd_.get(), LockMode::Shared, ec);
    if (ec)
        return 0;
    if (!checkAndRefreshCache(ec))
        return 0;
    return cache_.size();
}

bool VariableFileRepositoryImpl::existsById(const std::string& id, std::error_code& ec) {
    detail::FileLockGuard lock(fd_.get(), LockMode::Shared, ec);
    if (ec)
        return false;
    if (!checkAndRefreshCache(ec))
        return false;
    return findCached(id) != nullptr;
}

uint64_t VariableFileRepositoryImpl::generation(std::error_code& ec) {
    detail::FileLockGuard lock(fd_.get(), LockMode::Shared, ec);
    if (ec)
        return 0;
    if (!checkAndRefreshCache(ec))
        return 0;
    return generation_;
}

// Private helpers below run with the caller's lock held. Taking a second guard on
// the same fd would drop the caller's lock when the inner guard is released.

bool VariableFileRepositoryImpl::appendRecord(const VariableRecordBase& record,
                                              std::error_code& ec) {
    if (::lseek(fd_.get(), 0, SEEK_END) < 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    invalidateCache();
    if (!writeAll(formatRecord(record), ec))
        return false;
    return sync(ec);
}

bool VariableFileRepositoryImpl::rewriteAll(
    const std::vector<std::unique_ptr<VariableRecordBase>>& records, std::error_code& ec) {
    std::string data;
    for (const auto& r : records)
        data += formatRecord(*r);

    invalidateCache();
    if (::ftruncate(fd_.get(), 0) < 0 || ::lseek(fd_.get(), 0, SEEK_SET) < 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    if (!writeAll(data, ec))
        return false;
    return sync(ec);
}

bool VariableFileRepositoryImpl::writeAll(const std::string& data, std::error_code& ec) {
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd_.get(), p, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            ec = std::error_code(errno, std::generic_category());
            BT_LOG_ERROR(LOG_MODULE, "write to " << path_ << " failed: " << ec.message());
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

bool VariableFileRepositoryImpl::sync(std::error_code& ec) {
    if (::fsync(fd_.get()) < 0) {
        ec = std::error_code(errno, std::generic_category());
        BT_LOG_ERROR(LOG_MODULE, "fsync of " << path_ << " failed: " << ec.message());
        return false;
    }
    updateFileStats();
    return true;
}

bool VariableFileRepositoryImpl::checkAndRefreshCache(std::error_code& ec) {
    ec.clear();
    struct stat st{};
    if (::fstat(fd_.get(), &st) < 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }

    if (st.st_mtim.tv_sec != lastMtime_.tv_sec || st.st_mtim.tv_nsec != lastMtime_.tv_nsec ||
        static_cast<size_t>(st.st_size) != lastSize_) {
        invalidateCache();
        lastMtime_ = st.st_mtim;
        lastSize_ = static_cast<size_t>(st.st_size);
    }

    if (!cacheValid_)
        return loadAllToCache(ec);
    return true;
}

void VariableFileRepositoryImpl::updateFileStats() {
    struct stat st{};
    if (::fstat(fd_.get(), &st) == 0) {
        lastMtime_ = st.st_mtim;
        lastSize_ = static_cast<size_t>(st.st_size);
    }
}

bool VariableFileRepositoryImpl::loadAllToCache(std::error_code& ec) {
    cache_.clear();
    skippedLines_ = 0;

    std::string content;
    char buf[4096];
    off_t offset = 0;
    while (true) {
        ssize_t n = ::pread(fd_.get(), buf, sizeof(buf), offset);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        if (n == 0)
            break;
        content.append(buf, static_cast<size_t>(n));
        offset += n;
    }

    std::unordered_set<std::string> seen;
    size_t lineNo = 0;
    size_t pos = 0;
    while (pos < content.size()) {
        size_t nl = content.find('\n', pos);
        if (nl == std::string::npos)
            nl = content.size();
        std::string line = content.substr(pos, nl - pos);
        pos = nl + 1;
        ++lineNo;
        if (line.empty())
            continue;

        // Bad lines are skipped and counted, never fatal.
        std::error_code lineEc;
        std::string type;
        util::FieldMap kv;
        if (!util::parseLine(line, type, kv, lineEc)) {
            BT_LOG_WARN(LOG_MODULE, path_ << ":" << lineNo << ": unparsable line skipped");
            ++skippedLines_;
            continue;
        }
        auto proto = prototypes_.find(type);
        if (proto == prototypes_.end()) {
            BT_LOG_WARN(LOG_MODULE, path_ << ":" << lineNo << ": unknown type '" << type << "'");
            ++skippedLines_;
            continue;
        }
        auto rec = proto->second->clone();
        if (!rec->fromKv(kv, lineEc)) {
            BT_LOG_WARN(LOG_MODULE, path_ << ":" << lineNo << ": invalid " << type << " record: "
                                          << lineEc.message());
            ++skippedLines_;
            continue;
        }
        if (!seen.insert(rec->id()).second) {
            BT_LOG_WARN(LOG_MODULE, path_ << ":" << lineNo << ": duplicate id " << rec->id());
            ++skippedLines_;
            continue;
        }
        cache_.push_back(std::move(rec));
    }

    cacheValid_ = true;
    ++generation_;
    BT_LOG_DEBUG(LOG_MODULE, "loaded " << cache_.size() << " records from " << path_);
    return true;
}

void VariableFileRepositoryImpl::invalidateCache() {
    cache_.clear();
    cacheValid_ = false;
}

const VariableRecordBase* VariableFileRepositoryImpl::findCached(const std::string& id) const {
    for (const auto& r : cache_) {
        if (r->id() == id)
            return r.get();
    }
    return nullptr;
}

} // namespace BookTracker
