#pragma once

#ifdef __cplusplus

#include <nlohmann/json.hpp>
#include <any>
#include <array>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <vector>

namespace chronicle {

// Commit timestamps (nanosecond resolution with libstdc++ on Linux)
using timestamp_t = std::chrono::system_clock::time_point;

// Calendar date without a time of day
using date_t = std::chrono::year_month_day;

// Structured values (sequences and mappings)
using json = nlohmann::json;

// Row id inside the audit store
using primary_key_t = int64_t;

/// Nanoseconds since the Unix epoch, as stored in ChronicleLog.timestamp.
inline int64_t to_unix_nanos(timestamp_t t) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
}

inline timestamp_t from_unix_nanos(int64_t nanos) {
    return timestamp_t(std::chrono::duration_cast<timestamp_t::duration>(std::chrono::nanoseconds(nanos)));
}

// UUID type (stored as TEXT, lowercase hyphenated)
struct uuid_t {
    std::array<uint8_t, 16> bytes{};

    uuid_t() = default;

    explicit uuid_t(const std::array<uint8_t, 16>& b) : bytes(b) {}

    // Convert to lowercase hyphenated string (e.g., "550e8400-e29b-41d4-a716-446655440000")
    std::string to_string() const {
        std::stringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

    /// Strict parse: 32 hex digits, either bare or in 8-4-4-4-12 groups.
    static std::optional<uuid_t> parse(std::string_view s) {
        std::string hex;
        if (s.size() == 36) {
            for (size_t i = 0; i < s.size(); ++i) {
                bool dash_pos = (i == 8 || i == 13 || i == 18 || i == 23);
                if (dash_pos != (s[i] == '-')) return std::nullopt;
                if (!dash_pos) hex += s[i];
            }
        } else if (s.size() == 32) {
            hex.assign(s);
        } else {
            return std::nullopt;
        }

        auto nibble = [](char c) -> int {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        };

        uuid_t result;
        for (size_t i = 0; i < 16; ++i) {
            int hi = nibble(hex[i * 2]);
            int lo = nibble(hex[i * 2 + 1]);
            if (hi < 0 || lo < 0) return std::nullopt;
            result.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
        }
        return result;
    }

    // Generate a random UUID (v4)
    static uuid_t generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dis;

        uuid_t result;
        uint64_t a = dis(gen);
        uint64_t b = dis(gen);

        for (int i = 0; i < 8; ++i) {
            result.bytes[i] = static_cast<uint8_t>((a >> (56 - i * 8)) & 0xFF);
            result.bytes[8 + i] = static_cast<uint8_t>((b >> (56 - i * 8)) & 0xFF);
        }

        result.bytes[6] = (result.bytes[6] & 0x0F) | 0x40;  // Version 4
        result.bytes[8] = (result.bytes[8] & 0x3F) | 0x80;  // Variant 1

        return result;
    }

    bool operator==(const uuid_t& other) const { return bytes == other.bytes; }
    bool operator!=(const uuid_t& other) const { return bytes != other.bytes; }
};

// ============================================================================
// value - a field value of any C++ type, identified by its exact type
// ============================================================================

class value {
public:
    value() = default;

    template<typename T,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, value> &&
                                         !std::is_array_v<std::remove_reference_t<T>>>>
    value(T&& v) : data_(std::forward<T>(v)) {}

    // String literals are text, not pointers
    value(const char* s) : data_(std::string(s)) {}

    bool has_value() const { return data_.has_value(); }

    /// Exact runtime type of the held value (typeid(void) when empty).
    std::type_index type() const { return std::type_index(data_.type()); }

    template<typename T>
    bool is() const { return data_.type() == typeid(T); }

    template<typename T>
    const T* get_if() const { return std::any_cast<T>(&data_); }

    /// Throws std::bad_any_cast when the held type is not exactly T.
    template<typename T>
    const T& get() const {
        const T* p = std::any_cast<T>(&data_);
        if (!p) throw std::bad_any_cast();
        return *p;
    }

    const std::any& any() const { return data_; }

private:
    std::any data_;
};

// A field value that may be absent (NULL / not set)
using optional_value = std::optional<value>;

// Stored form of a value; nullopt is SQL NULL
using stored_form = std::optional<std::string>;

namespace detail {
    template<typename T> struct is_optional : std::false_type {};
    template<typename T> struct is_optional<std::optional<T>> : std::true_type {};

    template<typename T>
    struct unwrap_optional { using type = T; };
    template<typename T>
    struct unwrap_optional<std::optional<T>> { using type = T; };

    // Lift a struct member into an optional_value; std::optional members map nullopt to absent
    template<typename T>
    optional_value to_optional_value(const T& v) {
        return value(v);
    }

    template<typename T>
    optional_value to_optional_value(const std::optional<T>& v) {
        if (!v.has_value()) return std::nullopt;
        return value(*v);
    }
} // namespace detail

} // namespace chronicle

#endif // __cplusplus
