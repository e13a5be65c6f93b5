#include <booktracker/error.hpp>
#include <booktracker/record/IdWatermark.hpp>
#include <booktracker/store/BookStore.hpp>
#include <booktracker/util/Logger.hpp>

#include <algorithm>
#include <iterator>

namespace BookTracker {

namespace {

constexpr const char* LOG_MODULE = "store";
constexpr const char* SEQUENCE_NAME = "books";

std::vector<std::unique_ptr<VariableRecordBase>> bookPrototypes() {
    std::vector<std::unique_ptr<VariableRecordBase>> protos;
    protos.push_back(std::make_unique<Book>());
    protos.push_back(std::make_unique<IdWatermark>());
    return protos;
}

} // namespace

BookStore::BookStore(const StoreConfig& config, std::error_code& ec) : config_(config) {
    if (!config_.validate(ec))
        return;

    auto books =
        std::make_unique<VariableFileRepositoryImpl>(config_.booksPath(), bookPrototypes(), ec);
    if (ec)
        return;
    auto ids = std::make_unique<IdAllocator>(config_.sequencePath(), SEQUENCE_NAME, ec);
    if (ec)
        return;

    // Every issued id is either stored or at most the removal watermark, so a
    // lost sequence file cannot cause reuse.
    auto all = books->findAllByType<Book>(ec);
    if (ec)
        return;
    uint64_t maxId = 0;
    for (const auto& b : all)
        maxId = std::max(maxId, b->sequence());
    auto mark = books->findByIdAndType<IdWatermark>(SEQUENCE_NAME, ec);
    if (ec)
        return;
    if (mark)
        maxId = std::max(maxId, mark->lastId);
    if (!ids->advanceTo(maxId, ec))
        return;

    books_ = std::move(books);
    ids_ = std::move(ids);
    BT_LOG_INFO(LOG_MODULE, "opened " << config_.dataDir << " with " << all.size() << " books");
}

std::string BookStore::add(const std::string& caller, const BookFields& fields,
                           std::error_code& ec) {
    ec.clear();
    if (!books_ || !ids_) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return {};
    }
    if (caller.empty()) {
        BT_LOG_WARN(LOG_MODULE, "add rejected: no caller identity");
        ec = StoreErrc::InvalidInput;
        return {};
    }
    if (!fields.validate(ec)) {
        BT_LOG_WARN(LOG_MODULE, "add rejected for " << caller << ": " << ec.message());
        return {};
    }

    std::string id = ids_->next(ec);
    if (ec)
        return {};

    Book book(id, caller, fields);
    if (!books_->save(book, ec)) {
        BT_LOG_ERROR(LOG_MODULE, "storing book " << id << " failed: " << ec.message());
        return {};
    }
    BT_LOG_INFO(LOG_MODULE, caller << " added book " << id);
    return id;
}

std::unique_ptr<Book> BookStore::update(const std::string& caller, const std::string& id,
                                        const BookPatch& patch, std::error_code& ec) {
    ec.clear();
    if (!patch.validate(ec)) {
        BT_LOG_WARN(LOG_MODULE, "update of " << id << " rejected: " << ec.message());
        return nullptr;
    }
    auto book = loadOwned(caller, id, ec);
    if (!book)
        return nullptr;

    book->apply(patch);
    if (!books_->save(*book, ec)) {
        BT_LOG_ERROR(LOG_MODULE, "updating book " << id << " failed: " << ec.message());
        return nullptr;
    }
    BT_LOG_INFO(LOG_MODULE, caller << " updated book " << id);
    return book;
}

std::unique_ptr<Book> BookStore::remove(const std::string& caller, const std::string& id,
                                        std::error_code& ec) {
    ec.clear();
    auto book = loadOwned(caller, id, ec);
    if (!book)
        return nullptr;

    // Raised before the delete; a failed delete only leaves the mark high.
    if (!raiseWatermark(book->sequence(), ec)) {
        BT_LOG_ERROR(LOG_MODULE, "recording removal of " << id << " failed: " << ec.message());
        return nullptr;
    }
    if (!books_->deleteById(id, ec)) {
        BT_LOG_ERROR(LOG_MODULE, "deleting book " << id << " failed: " << ec.message());
        return nullptr;
    }
    BT_LOG_INFO(LOG_MODULE, caller << " deleted book " << id);
    return book;
}

std::unique_ptr<Book> BookStore::get(const std::string& id, std::error_code& ec) {
    ec.clear();
    if (!books_) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return nullptr;
    }
    auto book = books_->findByIdAndType<Book>(id, ec);
    if (ec)
        return nullptr;
    if (!book) {
        ec = StoreErrc::NotFound;
        return nullptr;
    }
    return book;
}

std::vector<std::unique_ptr<Book>> BookStore::list(const std::optional<std::string>& owner,
                                                   uint64_t skip, std::optional<uint64_t> limit,
                                                   std::error_code& ec) {
    ec.clear();
    std::vector<std::unique_ptr<Book>> page;
    if (!books_) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return page;
    }
    if (limit && *limit == 0) {
        ec = StoreErrc::InvalidInput;
        return page;
    }
    const uint64_t pageSize = std::min(limit.value_or(config_.maxPageSize), config_.maxPageSize);

    if (!owner) {
        auto all = books_->findAllByType<Book>(ec);
        if (ec)
            return page;
        std::sort(all.begin(), all.end(),
                  [](const auto& a, const auto& b) { return a->sequence() < b->sequence(); });
        if (skip >= all.size())
            return page;
        auto first = all.begin() + static_cast<std::ptrdiff_t>(skip);
        auto last = first + static_cast<std::ptrdiff_t>(
                                std::min<uint64_t>(pageSize, all.size() - skip));
        std::move(first, last, std::back_inserter(page));
        return page;
    }

    if (!refreshOwnerIndex(ec))
        return page;
    auto it = ownerIndex_.find(*owner);
    if (it == ownerIndex_.end() || skip >= it->second.size())
        return page;

    auto pos = it->second.begin();
    std::advance(pos, static_cast<std::ptrdiff_t>(skip));
    for (; pos != it->second.end() && page.size() < pageSize; ++pos) {
        auto book = books_->findByIdAndType<Book>(std::to_string(*pos), ec);
        if (ec) {
            page.clear();
            return page;
        }
        if (book)
            page.push_back(std::move(book));
    }
    return page;
}

size_t BookStore::count(std::error_code& ec) {
    ec.clear();
    if (!books_) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return 0;
    }
    auto all = books_->findAllByType<Book>(ec);
    if (ec)
        return 0;
    return all.size();
}

std::vector<uint64_t> BookStore::idsOwnedBy(const std::string& owner, std::error_code& ec) {
    ec.clear();
    if (!books_) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return {};
    }
    if (!refreshOwnerIndex(ec))
        return {};
    auto it = ownerIndex_.find(owner);
    if (it == ownerIndex_.end())
        return {};
    return std::vector<uint64_t>(it->second.begin(), it->second.end());
}

std::unique_ptr<Book> BookStore::loadOwned(const std::string& caller, const std::string& id,
                                           std::error_code& ec) {
    if (!books_) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return nullptr;
    }
    auto book = get(id, ec);
    if (!book) {
        if (ec == StoreErrc::NotFound)
            BT_LOG_WARN(LOG_MODULE, "book " << id << " does not exist");
        return nullptr;
    }
    if (caller.empty() || book->owner != caller) {
        BT_LOG_WARN(LOG_MODULE, "'" << caller << "' may not modify book " << id << " owned by "
                                    << book->owner);
        ec = StoreErrc::Unauthorized;
        return nullptr;
    }
    return book;
}

bool BookStore::raiseWatermark(uint64_t removedId, std::error_code& ec) {
    auto mark = books_->findByIdAndType<IdWatermark>(SEQUENCE_NAME, ec);
    if (ec)
        return false;
    if (mark && mark->lastId >= removedId)
        return true;
    return books_->save(IdWatermark(SEQUENCE_NAME, removedId), ec);
}

bool BookStore::refreshOwnerIndex(std::error_code& ec) {
    uint64_t gen = books_->generation(ec);
    if (ec)
        return false;
    if (gen == indexedGeneration_)
        return true;

    auto all = books_->findAllByType<Book>(ec);
    if (ec)
        return false;
    ownerIndex_.clear();
    for (const auto& b : all)
        ownerIndex_[b->owner].insert(b->sequence());
    indexedGeneration_ = gen;
    BT_LOG_DEBUG(LOG_MODULE, "owner index rebuilt: " << ownerIndex_.size() << " owners");
    return true;
}

} // namespace BookTracker
