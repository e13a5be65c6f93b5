#pragma once
/// @file RecordRepository.hpp
/// @brief Repository interface shared by the file-backed record stores

#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace BookTracker {

/// @brief Keyed collection of records persisted in one file
/// @tparam T Record type; must provide an id
///
/// Every operation reports failure through @p ec. Lookups return nullptr or an
/// empty vector both on a miss and on an error, so callers check @p ec to tell them apart.
template <typename T> class RecordRepository {
  public:
    virtual ~RecordRepository() = default;

    /// @brief Inserts the record, or replaces the one with the same id
    virtual bool save(const T& record, std::error_code& ec) = 0;

    /// @brief All records in file order
    virtual std::vector<std::unique_ptr<T>> findAll(std::error_code& ec) = 0;

    virtual std::unique_ptr<T> findById(const std::string& id, std::error_code& ec) = 0;

    /// @brief Removes the record; a missing id is not an error
    virtual bool deleteById(const std::string& id, std::error_code& ec) = 0;

    virtual size_t count(std::error_code& ec) = 0;

    virtual bool existsById(const std::string& id, std::error_code& ec) = 0;

    /// @brief findAll() narrowed to one concrete subtype
    template <typename SubT> std::vector<std::unique_ptr<SubT>> findAllByType(std::error_code& ec) {
        std::vector<std::unique_ptr<SubT>> result;
        auto all = findAll(ec);
        if (ec)
            return result;

        for (auto& rec : all) {
            if (auto* casted = dynamic_cast<SubT*>(rec.get())) {
                (void)rec.release();
                result.push_back(std::unique_ptr<SubT>(casted));
            }
        }
        return result;
    }

    /// @brief findById() narrowed to one concrete subtype; nullptr if the type differs
    template <typename SubT>
    std::unique_ptr<SubT> findByIdAndType(const std::string& id, std::error_code& ec) {
        auto found = findById(id, ec);
        if (auto* casted = dynamic_cast<SubT*>(found.get())) {
            (void)found.release();
            return std::unique_ptr<SubT>(casted);
        }
        return nullptr;
    }
};

} // namespace BookTracker
