#pragma once
/// @file FieldMeta.hpp
/// @brief Tuple-based field descriptors for fixed-length records

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <system_error>
#include <tuple>
#include <type_traits>

namespace BookTracker {

/// @brief Width of a serialized int64: sign + 19 digits
constexpr size_t INT64_FIELD_LEN = 20;

/// @brief Descriptor binding a field name to an int64_t member
///
/// Serialized as a sign followed by 19 zero-padded digits, e.g. `+0000000000000000042`.
struct NumField {
    const char* name;
    int64_t* ptr;

    static constexpr size_t length = INT64_FIELD_LEN;

    /// @brief Writes exactly `length` bytes to @p buf
    void write(char* buf) const {
        int64_t val = *ptr;
        // Magnitude via unsigned math so INT64_MIN does not overflow.
        uint64_t mag = (val >= 0) ? static_cast<uint64_t>(val)
                                  : static_cast<uint64_t>(-(val + 1)) + 1;
        char tmp[length + 1];
        std::snprintf(tmp, sizeof(tmp), "%c%019llu", val >= 0 ? '+' : '-',
                      static_cast<unsigned long long>(mag));
        std::memcpy(buf, tmp, length);
    }

    /// @brief Reads `length` bytes from @p buf
    /// @return false with invalid_argument if the sign or a digit is malformed
    bool read(const char* buf, std::error_code& ec) const {
        ec.clear();
        if (buf[0] != '+' && buf[0] != '-') {
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }
        uint64_t mag = 0;
        for (size_t i = 1; i < length; ++i) {
            if (buf[i] < '0' || buf[i] > '9') {
                ec = std::make_error_code(std::errc::invalid_argument);
                return false;
            }
            mag = mag * 10 + static_cast<uint64_t>(buf[i] - '0');
        }
        if (buf[0] == '-')
            *ptr = static_cast<int64_t>(~mag + 1);
        else
            *ptr = static_cast<int64_t>(mag);
        return true;
    }
};

/// @brief Creates a NumField, rejecting anything but int64_t at compile time
template <typename T> NumField makeNumField(const char* name, T& member) {
    static_assert(std::is_same_v<std::remove_cv_t<T>, int64_t>, "BT_NUM: member must be int64_t");
    return NumField{name, const_cast<int64_t*>(&member)};
}

/// @brief Registers every field of @p fields with the layout engine of @p base
template <typename Base, typename Tuple> void defineFieldsFromTuple(Base* base, const Tuple& fields) {
    std::apply([base](const auto&... f) { (base->defineField(f.name, f.length), ...); }, fields);
}

/// @brief Serializes field @p idx of the tuple into @p buf
template <typename Tuple> void writeFieldAt(const Tuple& fields, size_t idx, char* buf) {
    size_t i = 0;
    std::apply([&](const auto&... f) { ((i++ == idx ? (f.write(buf), void()) : void()), ...); },
               fields);
}

/// @brief Deserializes field @p idx of the tuple from @p buf
template <typename Tuple>
bool readFieldAt(const Tuple& fields, size_t idx, const char* buf, std::error_code& ec) {
    size_t i = 0;
    bool ok = false;
    std::apply([&](const auto&... f) { ((i++ == idx ? (ok = f.read(buf, ec), void()) : void()), ...); },
               fields);
    return ok;
}

} // namespace BookTracker

/// @brief Declares an int64_t field
#define BT_NUM(member) BookTracker::makeNumField(#member, member)

/// @brief Generates the glue FixedRecordBase expects from a concrete record
/// @param ClassName Concrete class
/// @param TypeNameStr Type tag stored in every record
/// @param TypeLen Bytes reserved for the type tag
/// @param IdLen Bytes reserved for the id
#define BT_RECORD_IMPL(ClassName, TypeNameStr, TypeLen, IdLen)                                     \
  public:                                                                                          \
    ClassName() {                                                                                  \
        this->initMembers();                                                                       \
        this->defineLayout();                                                                      \
    }                                                                                              \
    void fieldValueAt(size_t idx, char* buf) const {                                               \
        BookTracker::writeFieldAt(fields(), idx, buf);                                             \
    }                                                                                              \
    bool setFieldValueAt(size_t idx, const char* buf, std::error_code& ec) {                       \
        return BookTracker::readFieldAt(fields(), idx, buf, ec);                                   \
    }                                                                                              \
    const char* typeName() const {                                                                 \
        return TypeNameStr;                                                                        \
    }                                                                                              \
    std::string getId() const {                                                                    \
        return id_;                                                                                \
    }                                                                                              \
    void setId(const std::string& id) {                                                            \
        id_ = id;                                                                                  \
    }                                                                                              \
                                                                                                   \
  private:                                                                                         \
    std::string id_;                                                                               \
    void defineLayout() {                                                                          \
        this->defineStart();                                                                       \
        this->defineType(TypeLen);                                                                 \
        this->defineId(IdLen);                                                                     \
        BookTracker::defineFieldsFromTuple(this, fields());                                        \
        this->defineEnd();                                                                         \
    }
