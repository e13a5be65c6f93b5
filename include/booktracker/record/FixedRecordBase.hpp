#pragma once
/// @file FixedRecordBase.hpp
/// @brief CRTP base with a layout engine for fixed-length records

#include <algorithm>
#include <cstring>
#include <string>
#include <system_error>
#include <type_traits>
#include <vector>

namespace BookTracker {

/// @brief Fixed-length text record without a vtable
///
/// The concrete class declares its fields with BT_RECORD_IMPL, which builds this layout:
///
///     <type, TypeLen bytes>,id:"<id, IdLen bytes>"{name:<20 digits>,name:<20 digits>}
///
/// Unused type/id bytes are NUL. Every record of a type has the same size, so
/// slot i of a file starts at byte i * recordSize().
///
/// @tparam Derived Concrete record type
template <typename Derived> class FixedRecordBase {
    template <typename Base, typename Tuple>
    friend void defineFieldsFromTuple(Base* base, const Tuple& fields);

  protected:
    FixedRecordBase() {
        static_assert(std::is_base_of_v<FixedRecordBase<Derived>, Derived>,
                      "CRTP: Derived must inherit from FixedRecordBase<Derived>");
    }

  public:
    size_t recordSize() const { return totalSize_; }

    /// @brief Writes recordSize() bytes to @p buf
    /// @return false with invalid_argument if the layout is undefined or the id is too long
    bool serialize(char* buf, std::error_code& ec) const {
        ec.clear();
        const auto* self = static_cast<const Derived*>(this);
        std::string id = self->getId();
        if (!layoutDefined_ || id.size() > idLen_) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }

        std::memcpy(buf, template_.data(), totalSize_);
        const char* type = self->typeName();
        std::memcpy(buf + typeOffset_, type, std::min(std::strlen(type), typeLen_));
        std::memcpy(buf + idOffset_, id.data(), id.size());
        for (size_t i = 0; i < fields_.size(); ++i)
            self->fieldValueAt(i, buf + fields_[i].offset);
        return true;
    }

    /// @brief Reads recordSize() bytes from @p buf
    /// @return false with invalid_argument if the type tag, delimiters or a field are corrupt
    bool deserialize(const char* buf, std::error_code& ec) {
        ec.clear();
        auto* self = static_cast<Derived*>(this);
        if (!layoutDefined_ || !matchesTemplate(buf, self->typeName())) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }

        const char* idBegin = buf + idOffset_;
        self->setId(std::string(idBegin, strnlen(idBegin, idLen_)));
        for (size_t i = 0; i < fields_.size(); ++i) {
            if (!self->setFieldValueAt(i, buf + fields_[i].offset, ec))
                return false;
        }
        return true;
    }

  protected:
    struct FieldInfo {
        std::string key;
        size_t offset;
        size_t length;
    };

    void defineStart() {
        fields_.clear();
        template_.clear();
        totalSize_ = 0;
        layoutDefined_ = false;
    }

    void defineType(size_t len) {
        typeOffset_ = totalSize_;
        typeLen_ = len;
        appendSlot(len);
    }

    void defineId(size_t len) {
        appendLiteral(",id:\"");
        idOffset_ = totalSize_;
        idLen_ = len;
        appendSlot(len);
        appendLiteral("\"{");
    }

    void defineField(const char* key, size_t len) {
        if (!fields_.empty())
            appendLiteral(",");
        appendLiteral(std::string(key) + ":");
        fields_.push_back(FieldInfo{key, totalSize_, len});
        appendSlot(len);
    }

    void defineEnd() {
        appendLiteral("}");
        layoutDefined_ = true;
    }

  private:
    void appendLiteral(const std::string& text) {
        template_ += text;
        totalSize_ += text.size();
    }

    void appendSlot(size_t len) {
        template_.append(len, '\0');
        totalSize_ += len;
    }

    /// @brief Checks the type tag and every literal delimiter of the template
    bool matchesTemplate(const char* buf, const char* type) const {
        std::string expectedType(type, std::min(std::strlen(type), typeLen_));
        expectedType.resize(typeLen_, '\0');
        if (std::memcmp(buf + typeOffset_, expectedType.data(), typeLen_) != 0)
            return false;

        size_t pos = 0;
        auto literalUpTo = [&](size_t slotBegin) {
            bool same = std::memcmp(buf + pos, template_.data() + pos, slotBegin - pos) == 0;
            return same;
        };
        pos = typeOffset_ + typeLen_;
        if (!literalUpTo(idOffset_))
            return false;
        pos = idOffset_ + idLen_;
        for (const auto& f : fields_) {
            if (!literalUpTo(f.offset))
                return false;
            pos = f.offset + f.length;
        }
        return literalUpTo(totalSize_);
    }

    std::string template_;          ///< Record with literals filled in and NUL slots
    std::vector<FieldInfo> fields_;
    size_t typeOffset_ = 0;
    size_t typeLen_ = 0;
    size_t idOffset_ = 0;
    size_t idLen_ = 0;
    size_t totalSize_ = 0;
    bool layoutDefined_ = false;
};

} // namespace BookTracker
