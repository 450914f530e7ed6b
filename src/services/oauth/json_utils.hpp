#pragma once

/// @file json_utils.hpp
/// @brief Minimal JSON writer and flat-object reader for JWT payloads and
/// endpoint responses.
///
/// The reader accepts a single object whose values are strings, integers,
/// booleans or arrays of strings. That is everything the server emits, and
/// anything else is rejected.

#include <charconv>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ocs::service::detail {

/// Quote and escape a string for JSON output.
inline std::string jsonQuote(std::string_view s) {
    static constexpr char hexChars[] = "0123456789abcdef";
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out.push_back(hexChars[(c >> 4) & 0x0F]);
                    out.push_back(hexChars[c & 0x0F]);
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
    return out;
}

/// Builds a single JSON object, preserving insertion order.
class JsonObjectWriter {
public:
    JsonObjectWriter& field(std::string_view key, std::string_view value) {
        return raw(key, jsonQuote(value));
    }

    JsonObjectWriter& field(std::string_view key, const char* value) {
        return raw(key, jsonQuote(value));
    }

    JsonObjectWriter& field(std::string_view key, int64_t value) {
        return raw(key, std::to_string(value));
    }

    JsonObjectWriter& field(std::string_view key, bool value) {
        return raw(key, value ? "true" : "false");
    }

    JsonObjectWriter& field(std::string_view key, const std::vector<std::string>& values) {
        std::string arr = "[";
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (i > 0) {
                arr.push_back(',');
            }
            arr += jsonQuote(values[i]);
        }
        arr.push_back(']');
        return raw(key, arr);
    }

    template <typename T>
    JsonObjectWriter& optionalField(std::string_view key, const std::optional<T>& value) {
        if (value) {
            field(key, *value);
        }
        return *this;
    }

    [[nodiscard]] std::string str() const { return body_ + "}"; }

private:
    JsonObjectWriter& raw(std::string_view key, std::string_view encoded) {
        if (body_.size() > 1) {
            body_.push_back(',');
        }
        body_ += jsonQuote(key);
        body_.push_back(':');
        body_ += encoded;
        return *this;
    }

    std::string body_ = "{";
};

using JsonValue = std::variant<std::string, int64_t, bool, std::vector<std::string>>;
using FlatJson = std::map<std::string, JsonValue, std::less<>>;

namespace json_parse {

inline void skipWs(std::string_view s, std::size_t& pos) {
    while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t' || s[pos] == '\n' || s[pos] == '\r')) {
        ++pos;
    }
}

inline bool parseString(std::string_view s, std::size_t& pos, std::string& out) {
    if (pos >= s.size() || s[pos] != '"') {
        return false;
    }
    ++pos;
    out.clear();
    while (pos < s.size()) {
        char c = s[pos++];
        if (c == '"') {
            return true;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            return false;
        }
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (pos >= s.size()) {
            return false;
        }
        char e = s[pos++];
        switch (e) {
            case '"':  out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/':  out.push_back('/'); break;
            case 'n':  out.push_back('\n'); break;
            case 'r':  out.push_back('\r'); break;
            case 't':  out.push_back('\t'); break;
            case 'b':  out.push_back('\b'); break;
            case 'f':  out.push_back('\f'); break;
            case 'u': {
                if (pos + 4 > s.size()) {
                    return false;
                }
                unsigned int code = 0;
                auto [ptr, ec] = std::from_chars(s.data() + pos, s.data() + pos + 4, code, 16);
                if (ec != std::errc{} || ptr != s.data() + pos + 4) {
                    return false;
                }
                // Only the control-character escapes the writer produces.
                if (code >= 0x80) {
                    return false;
                }
                out.push_back(static_cast<char>(code));
                pos += 4;
                break;
            }
            default:
                return false;
        }
    }
    return false;
}

}  // namespace json_parse

/// Parse a flat JSON object. Returns nullopt on any syntax error or
/// unsupported value type.
inline std::optional<FlatJson> parseFlatJson(std::string_view s) {
    using namespace json_parse;
    FlatJson result;
    std::size_t pos = 0;
    skipWs(s, pos);
    if (pos >= s.size() || s[pos] != '{') {
        return std::nullopt;
    }
    ++pos;
    skipWs(s, pos);
    if (pos < s.size() && s[pos] == '}') {
        ++pos;
        skipWs(s, pos);
        return pos == s.size() ? std::optional<FlatJson>(std::move(result)) : std::nullopt;
    }

    while (pos < s.size()) {
        std::string key;
        skipWs(s, pos);
        if (!parseString(s, pos, key)) {
            return std::nullopt;
        }
        skipWs(s, pos);
        if (pos >= s.size() || s[pos] != ':') {
            return std::nullopt;
        }
        ++pos;
        skipWs(s, pos);
        if (pos >= s.size()) {
            return std::nullopt;
        }

        char c = s[pos];
        if (c == '"') {
            std::string value;
            if (!parseString(s, pos, value)) {
                return std::nullopt;
            }
            result[key] = std::move(value);
        } else if (c == '[') {
            ++pos;
            std::vector<std::string> values;
            skipWs(s, pos);
            if (pos < s.size() && s[pos] == ']') {
                ++pos;
            } else {
                while (true) {
                    std::string item;
                    skipWs(s, pos);
                    if (!parseString(s, pos, item)) {
                        return std::nullopt;
                    }
                    values.push_back(std::move(item));
                    skipWs(s, pos);
                    if (pos < s.size() && s[pos] == ',') {
                        ++pos;
                        continue;
                    }
                    if (pos < s.size() && s[pos] == ']') {
                        ++pos;
                        break;
                    }
                    return std::nullopt;
                }
            }
            result[key] = std::move(values);
        } else if (s.substr(pos, 4) == "true") {
            result[key] = true;
            pos += 4;
        } else if (s.substr(pos, 5) == "false") {
            result[key] = false;
            pos += 5;
        } else {
            int64_t number = 0;
            auto [ptr, ec] = std::from_chars(s.data() + pos, s.data() + s.size(), number);
            if (ec != std::errc{}) {
                return std::nullopt;
            }
            pos = static_cast<std::size_t>(ptr - s.data());
            result[key] = number;
        }

        skipWs(s, pos);
        if (pos < s.size() && s[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < s.size() && s[pos] == '}') {
            ++pos;
            skipWs(s, pos);
            if (pos != s.size()) {
                return std::nullopt;
            }
            return result;
        }
        return std::nullopt;
    }
    return std::nullopt;
}

template <typename T>
const T* jsonGet(const FlatJson& obj, std::string_view key) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return nullptr;
    }
    return std::get_if<T>(&it->second);
}

}  // namespace ocs::service::detail
