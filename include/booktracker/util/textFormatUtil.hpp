#pragma once
/// @file textFormatUtil.hpp
/// @brief Line-oriented `Type { "key": value, ... }` text format
///
/// The same grammar is used for persisted book records, request lines, replies
/// and the configuration file:
///
///     line   := ident '{' [ member { ',' member } ] '}'
///     member := string ':' ( string | integer | '{' [ member { ',' member } ] '}' )
///
/// Nested objects are flattened into dotted keys, so
/// `add_book { "book": { "title": "x" } }` yields the key `book.title`.

#include <cctype>
#include <charconv>
#include <cstdint>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace BookTracker::util {

/// @brief {isString, text}. Integers keep their textual form.
using FieldValue = std::pair<bool, std::string>;
/// @brief Ordered key/value list used for output
using FieldList = std::vector<std::pair<std::string, FieldValue>>;
/// @brief Parsed key/value lookup
using FieldMap = std::unordered_map<std::string, FieldValue>;

/// @brief Nesting limit for objects inside a line
constexpr int MAX_OBJECT_DEPTH = 4;

/// @brief Parses a non-negative decimal integer, consuming the whole string
/// @return false with invalid_argument or result_out_of_range in @p ec
inline bool parseUnsignedStrict(const std::string& s, uint64_t& out, std::error_code& ec) {
    ec.clear();
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s.front()))) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    uint64_t v = 0;
    auto [ptr, err] = std::from_chars(s.data(), s.data() + s.size(), v, 10);
    if (err == std::errc::result_out_of_range) {
        ec = std::make_error_code(std::errc::result_out_of_range);
        return false;
    }
    if (err != std::errc() || ptr != s.data() + s.size()) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    out = v;
    return true;
}

inline void skipWs(const char*& p, const char* end) {
    while (p < end && std::isspace(static_cast<unsigned char>(*p)))
        ++p;
}

/// @brief Identifier token: [A-Za-z_][A-Za-z0-9_]*
inline bool parseIdent(const char*& p, const char* end, std::string& out) {
    skipWs(p, end);
    if (p >= end || !(std::isalpha(static_cast<unsigned char>(*p)) || *p == '_'))
        return false;
    const char* s = p++;
    while (p < end && (std::isalnum(static_cast<unsigned char>(*p)) || *p == '_'))
        ++p;
    out.assign(s, p);
    return true;
}

/// @brief Double-quoted string with \" \\ \n \t \r escapes
inline bool parseQuotedString(const char*& p, const char* end, std::string& out) {
    skipWs(p, end);
    if (p >= end || *p != '"')
        return false;
    ++p;

    std::string s;
    while (p < end) {
        char c = *p++;
        if (c == '"') {
            out = std::move(s);
            return true;
        }
        if (c != '\\') {
            s.push_back(c);
            continue;
        }
        if (p >= end)
            return false;
        switch (*p++) {
        case '"':
            s.push_back('"');
            break;
        case '\\':
            s.push_back('\\');
            break;
        case 'n':
            s.push_back('\n');
            break;
        case 't':
            s.push_back('\t');
            break;
        case 'r':
            s.push_back('\r');
            break;
        default:
            return false;
        }
    }
    return false;
}

/// @brief Optional sign followed by at least one digit. Range is checked by the caller.
inline bool parseIntToken(const char*& p, const char* end, std::string& out) {
    skipWs(p, end);
    const char* s = p;
    if (p < end && (*p == '-' || *p == '+'))
        ++p;
    const char* digits = p;
    while (p < end && std::isdigit(static_cast<unsigned char>(*p)))
        ++p;
    if (p == digits)
        return false;
    out.assign(s, p);
    return true;
}

inline std::string escapeString(const std::string& in) {
    std::string o;
    o.reserve(in.size() + 4);
    for (char c : in) {
        switch (c) {
        case '"':
        case '\\':
            o.push_back('\\');
            o.push_back(c);
            break;
        case '\n':
            o += "\\n";
            break;
        case '\t':
            o += "\\t";
            break;
        case '\r':
            o += "\\r";
            break;
        default:
            o.push_back(c);
        }
    }
    return o;
}

/// @brief Parses the members of an object whose '{' has already been consumed
/// @param prefix Dotted key prefix for nested members ("" at top level)
inline bool parseObjectBody(const char*& p, const char* end, const std::string& prefix,
                            int depth, FieldMap& kv) {
    if (depth > MAX_OBJECT_DEPTH)
        return false;

    skipWs(p, end);
    if (p < end && *p == '}') {
        ++p;
        return true;
    }

    while (true) {
        std::string key;
        if (!parseQuotedString(p, end, key) || key.empty())
            return false;
        key = prefix.empty() ? key : prefix + "." + key;

        skipWs(p, end);
        if (p >= end || *p != ':')
            return false;
        ++p;
        skipWs(p, end);

        if (p < end && *p == '{') {
            ++p;
            // An object and a scalar under the same key is a duplicate.
            if (kv.count(key))
                return false;
            if (!parseObjectBody(p, end, key, depth + 1, kv))
                return false;
        } else {
            bool isStr = (p < end && *p == '"');
            std::string val;
            if (isStr ? !parseQuotedString(p, end, val) : !parseIntToken(p, end, val))
                return false;
            if (!kv.emplace(key, FieldValue{isStr, std::move(val)}).second)
                return false;
        }

        skipWs(p, end);
        if (p >= end)
            return false;
        if (*p == ',') {
            ++p;
            continue;
        }
        if (*p == '}') {
            ++p;
            return true;
        }
        return false;
    }
}

/// @brief Parses one line (without the trailing newline)
/// @param[out] type Leading identifier
/// @param[out] kv Members, nested objects flattened to dotted keys
/// @return false with invalid_argument in @p ec on any syntax error or duplicate key
inline bool parseLine(const std::string& line, std::string& type, FieldMap& kv,
                      std::error_code& ec) {
    ec.clear();
    kv.clear();

    const char* p = line.data();
    const char* end = p + line.size();

    bool ok = parseIdent(p, end, type);
    if (ok) {
        skipWs(p, end);
        ok = (p < end && *p == '{');
    }
    if (ok) {
        ++p;
        ok = parseObjectBody(p, end, "", 1, kv);
    }
    if (ok) {
        skipWs(p, end);
        ok = (p == end);
    }
    if (!ok) {
        kv.clear();
        ec = std::make_error_code(std::errc::invalid_argument);
    }
    return ok;
}

/// @brief Renders a flat member list as one newline-terminated line
inline std::string formatLine(const char* type, const FieldList& fields) {
    std::string out = type;
    out += " { ";
    for (size_t i = 0; i < fields.size(); ++i) {
        const auto& [key, value] = fields[i];
        out += '"';
        out += escapeString(key);
        out += "\": ";
        if (value.first) {
            out += '"';
            out += escapeString(value.second);
            out += '"';
        } else {
            out += value.second;
        }
        if (i + 1 < fields.size())
            out += ", ";
    }
    out += " }\n";
    return out;
}

} // namespace BookTracker::util
