#include "Value.hpp"
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <type_traits>

namespace sqlbridge {

std::string valueToString(const SqlValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream out;
            out << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
            return out.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, DateTime>) {
            return v.text;
        } else {
            static const char* digits = "0123456789abcdef";
            std::string hex = "\\x";
            hex.reserve(2 + v.size() * 2);
            for (uint8_t byte : v) {
                hex += digits[byte >> 4];
                hex += digits[byte & 0x0f];
            }
            return hex;
        }
    }, value);
}

const char* valueTypeName(const SqlValue& value) {
    switch (value.index()) {
        case 0: return "null";
        case 1: return "integer";
        case 2: return "double";
        case 3: return "string";
        case 4: return "boolean";
        case 5: return "datetime";
        case 6: return "bytes";
        default: return "unknown";
    }
}

std::optional<std::string> asString(const SqlValue& value) {
    if (isNull(value)) return std::nullopt;
    return valueToString(value);
}

std::optional<int64_t> asInt(const SqlValue& value) {
    if (auto i = std::get_if<int64_t>(&value)) return *i;
    if (auto b = std::get_if<bool>(&value)) return *b ? 1 : 0;
    if (auto d = std::get_if<double>(&value)) {
        // [-2^63, 2^63) is exactly the range that converts without overflow
        if (!std::isfinite(*d) || *d < -9223372036854775808.0 || *d >= 9223372036854775808.0) {
            return std::nullopt;
        }
        return static_cast<int64_t>(*d);
    }
    if (auto s = std::get_if<std::string>(&value)) {
        try {
            size_t pos = 0;
            int64_t parsed = std::stoll(*s, &pos);
            if (pos == s->size()) return parsed;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

bool asBool(const SqlValue& value) {
    if (auto b = std::get_if<bool>(&value)) return *b;
    if (auto i = std::get_if<int64_t>(&value)) return *i != 0;
    if (auto s = std::get_if<std::string>(&value)) {
        return *s == "t" || *s == "true" || *s == "YES" || *s == "1";
    }
    return false;
}

const SqlValue* findColumn(const Row& row, const std::string& name) {
    for (const auto& [column, value] : row) {
        if (column == name) return &value;
    }
    return nullptr;
}

}  // namespace sqlbridge
