#include "chronicle/type_registry.hpp"
#include "chronicle/log.hpp"
#include <charconv>
#include <cmath>
#include <cstdio>
#include <limits>
#include <map>
#include <mutex>

namespace chronicle {

namespace {

constexpr int64_t k_nanos_per_second = 1000000000LL;
constexpr int64_t k_seconds_per_day = 86400;

[[noreturn]] void malformed(const char* type, std::string_view text, const std::string& why = {}) {
    std::string msg = "Malformed stored ";
    msg += type;
    msg += " value '";
    msg += text;
    msg += "'";
    if (!why.empty()) {
        msg += ": " + why;
    }
    throw deserialization_error(msg);
}

// ----------------------------------------------------------------------------
// Numbers: std::to_chars / std::from_chars give exact, locale-free round trips
// ----------------------------------------------------------------------------

template<typename T>
std::string number_to_text(T v) {
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    return std::string(buf, res.ptr);
}

template<typename T>
T text_to_number(std::string_view text, const char* type) {
    T out{};
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto res = std::from_chars(first, last, out);
    if (res.ec != std::errc() || res.ptr != last || text.empty()) {
        malformed(type, text);
    }
    return out;
}

// ----------------------------------------------------------------------------
// Fixed-width decimal fields for date and time parsing
// ----------------------------------------------------------------------------

bool read_digits(std::string_view text, size_t& pos, size_t count, int64_t& out) {
    if (pos + count > text.size()) return false;
    int64_t v = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    pos += count;
    out = v;
    return true;
}

bool expect(std::string_view text, size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) return false;
    ++pos;
    return true;
}

// Parses [-]YYYY-MM-DD starting at pos. Years may have more than four digits.
bool read_date(std::string_view text, size_t& pos, date_t& out) {
    bool negative = false;
    if (pos < text.size() && text[pos] == '-') {
        negative = true;
        ++pos;
    }
    size_t year_digits = 0;
    while (pos + year_digits < text.size() && text[pos + year_digits] >= '0' && text[pos + year_digits] <= '9') {
        ++year_digits;
    }
    if (year_digits < 4 || year_digits > 5) return false;

    int64_t year = 0, month = 0, day = 0;
    if (!read_digits(text, pos, year_digits, year)) return false;
    if (!expect(text, pos, '-') || !read_digits(text, pos, 2, month)) return false;
    if (!expect(text, pos, '-') || !read_digits(text, pos, 2, day)) return false;

    if (negative) year = -year;
    if (year < -32767 || year > 32767) return false;

    out = date_t{std::chrono::year{static_cast<int>(year)},
                 std::chrono::month{static_cast<unsigned>(month)},
                 std::chrono::day{static_cast<unsigned>(day)}};
    return out.ok();
}

std::string date_to_text(const date_t& d) {
    char buf[32];
    int year = static_cast<int>(d.year());
    std::snprintf(buf, sizeof(buf), "%s%04d-%02u-%02u",
                  year < 0 ? "-" : "", year < 0 ? -year : year,
                  static_cast<unsigned>(d.month()), static_cast<unsigned>(d.day()));
    return buf;
}

date_t text_to_date(std::string_view text) {
    size_t pos = 0;
    date_t d;
    if (!read_date(text, pos, d) || pos != text.size()) {
        malformed("date", text);
    }
    return d;
}

// ----------------------------------------------------------------------------
// Timestamps: YYYY-MM-DDTHH:MM:SS.nnnnnnnnnZ (UTC, always nine fraction digits)
// ----------------------------------------------------------------------------

std::string timestamp_to_text(timestamp_t t) {
    int64_t nanos = to_unix_nanos(t);
    int64_t secs = nanos / k_nanos_per_second;
    int64_t frac = nanos % k_nanos_per_second;
    if (frac < 0) {
        frac += k_nanos_per_second;
        secs -= 1;
    }
    int64_t days = secs / k_seconds_per_day;
    int64_t sod = secs % k_seconds_per_day;
    if (sod < 0) {
        sod += k_seconds_per_day;
        days -= 1;
    }

    date_t ymd{std::chrono::sys_days{std::chrono::days{days}}};
    char time_buf[48];
    std::snprintf(time_buf, sizeof(time_buf), "T%02lld:%02lld:%02lld.%09lldZ",
                  static_cast<long long>(sod / 3600),
                  static_cast<long long>((sod % 3600) / 60),
                  static_cast<long long>(sod % 60),
                  static_cast<long long>(frac));
    return date_to_text(ymd) + time_buf;
}

timestamp_t text_to_timestamp(std::string_view text) {
    size_t pos = 0;
    date_t d;
    int64_t hour = 0, minute = 0, second = 0, frac = 0;

    if (!read_date(text, pos, d) || !expect(text, pos, 'T') ||
        !read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, minute) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, second)) {
        malformed("timestamp", text);
    }

    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits == 9) malformed("timestamp", text, "more than nine fraction digits");
            frac = frac * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) malformed("timestamp", text);
        for (; digits < 9; ++digits) frac *= 10;
    }

    if (!expect(text, pos, 'Z') || pos != text.size()) {
        malformed("timestamp", text, "expected UTC 'Z' suffix");
    }
    if (hour > 23 || minute > 59 || second > 59) {
        malformed("timestamp", text, "time of day out of range");
    }

    int64_t days = std::chrono::sys_days{d}.time_since_epoch().count();
    int64_t secs = days * k_seconds_per_day + hour * 3600 + minute * 60 + second;

    // Range of a 64-bit nanosecond clock, checked without overflowing
    constexpr int64_t max_secs = std::numeric_limits<int64_t>::max() / k_nanos_per_second;
    constexpr int64_t max_frac = std::numeric_limits<int64_t>::max() % k_nanos_per_second;
    constexpr int64_t min_secs = std::numeric_limits<int64_t>::min() / k_nanos_per_second - 1;
    constexpr int64_t min_frac = k_nanos_per_second + std::numeric_limits<int64_t>::min() % k_nanos_per_second;
    if (secs > max_secs || (secs == max_secs && frac > max_frac) ||
        secs < min_secs || (secs == min_secs && frac < min_frac)) {
        malformed("timestamp", text, "outside the representable range");
    }

    int64_t nanos = secs < 0
        ? (secs + 1) * k_nanos_per_second - (k_nanos_per_second - frac)
        : secs * k_nanos_per_second + frac;
    return from_unix_nanos(nanos);
}

// ----------------------------------------------------------------------------
// Structured values go through nlohmann::json
// ----------------------------------------------------------------------------

json text_to_json(std::string_view text, const char* type) {
    try {
        return json::parse(text);
    } catch (const json::exception& e) {
        malformed(type, text, e.what());
    }
}

template<typename T>
type_handler json_backed_handler(const char* name) {
    type_handler h;
    h.name = name;
    h.serialize = [](const value& v) { return json(v.get<T>()).dump(); };
    h.deserialize = [name](std::string_view text) -> value {
        json j = text_to_json(text, name);
        try {
            return value(j.get<T>());
        } catch (const json::exception& e) {
            malformed(name, text, e.what());
        }
    };
    return h;
}

// Elements are written as number text so inf and nan survive the round trip
type_handler double_vector_handler() {
    type_handler h;
    h.name = "double[]";
    h.serialize = [](const value& v) {
        json elements = json::array();
        for (double d : v.get<std::vector<double>>()) {
            elements.push_back(number_to_text(d));
        }
        return elements.dump();
    };
    h.deserialize = [](std::string_view text) -> value {
        json j = text_to_json(text, "double[]");
        if (!j.is_array()) malformed("double[]", text, "expected an array");
        std::vector<double> out;
        out.reserve(j.size());
        for (const auto& element : j) {
            if (!element.is_string()) malformed("double[]", text, "elements must be number text");
            out.push_back(text_to_number<double>(element.get_ref<const std::string&>(), "double[]"));
        }
        return value(std::move(out));
    };
    return h;
}

// json::dump() writes non-finite numbers as null, which would not read back
bool has_non_finite(const json& j) {
    if (j.is_number_float()) {
        return !std::isfinite(j.get<double>());
    }
    if (j.is_structured()) {
        for (const auto& element : j) {
            if (has_non_finite(element)) return true;
        }
    }
    return false;
}

template<typename T>
type_handler number_handler(const char* name) {
    type_handler h;
    h.name = name;
    h.serialize = [](const value& v) { return number_to_text(v.get<T>()); };
    h.deserialize = [name](std::string_view text) -> value { return value(text_to_number<T>(text, name)); };
    return h;
}

} // namespace

std::string format_timestamp(timestamp_t t) {
    return timestamp_to_text(t);
}

timestamp_t parse_timestamp(std::string_view text) {
    return text_to_timestamp(text);
}

type_registry::type_registry() {
    install_builtins();
}

std::shared_ptr<type_registry> type_registry::shared() {
    static std::shared_ptr<type_registry> registry = std::make_shared<type_registry>();
    return registry;
}

void type_registry::install_builtins() {
    builtins_[typeid(int64_t)] = number_handler<int64_t>("int64");
    builtins_[typeid(int32_t)] = number_handler<int32_t>("int32");
    builtins_[typeid(double)] = number_handler<double>("double");
    builtins_[typeid(float)] = number_handler<float>("float");

    builtins_[typeid(std::string)] = type_handler{
        "string",
        [](const value& v) { return v.get<std::string>(); },
        [](std::string_view text) -> value { return value(std::string(text)); }
    };

    builtins_[typeid(bool)] = type_handler{
        "bool",
        [](const value& v) { return std::string(v.get<bool>() ? "1" : "0"); },
        [](std::string_view text) -> value {
            if (text == "1") return value(true);
            if (text == "0") return value(false);
            malformed("bool", text);
        }
    };

    builtins_[typeid(json)] = type_handler{
        "json",
        [](const value& v) {
            const auto& j = v.get<json>();
            if (has_non_finite(j)) {
                throw unsupported_type_error("json value holding inf or nan cannot be stored");
            }
            return j.dump();
        },
        [](std::string_view text) -> value { return value(text_to_json(text, "json")); }
    };

    builtins_[typeid(std::vector<int64_t>)] = json_backed_handler<std::vector<int64_t>>("int64[]");
    builtins_[typeid(std::vector<double>)] = double_vector_handler();
    builtins_[typeid(std::vector<std::string>)] = json_backed_handler<std::vector<std::string>>("string[]");
    builtins_[typeid(std::map<std::string, std::string>)] =
        json_backed_handler<std::map<std::string, std::string>>("string map");

    builtins_[typeid(timestamp_t)] = type_handler{
        "timestamp",
        [](const value& v) { return timestamp_to_text(v.get<timestamp_t>()); },
        [](std::string_view text) -> value { return value(text_to_timestamp(text)); }
    };

    builtins_[typeid(date_t)] = type_handler{
        "date",
        [](const value& v) {
            const auto& d = v.get<date_t>();
            if (!d.ok()) throw unsupported_type_error("Invalid calendar date cannot be stored");
            return date_to_text(d);
        },
        [](std::string_view text) -> value { return value(text_to_date(text)); }
    };

    builtins_[typeid(uuid_t)] = type_handler{
        "uuid",
        [](const value& v) { return v.get<uuid_t>().to_string(); },
        [](std::string_view text) -> value {
            auto parsed = uuid_t::parse(text);
            if (!parsed) malformed("uuid", text);
            return value(*parsed);
        }
    };
}

void type_registry::register_handler(std::type_index type, type_handler handler) {
    if (!handler.serialize || !handler.deserialize) {
        throw configuration_error("Type handler '" + handler.name + "' must provide serialize and deserialize");
    }
    std::unique_lock lock(mutex_);
    LOG_DEBUG("types", "Registering handler '%s' for %s", handler.name.c_str(), type.name());
    custom_[type] = std::move(handler);
}

bool type_registry::remove_handler(std::type_index type) {
    std::unique_lock lock(mutex_);
    return custom_.erase(type) > 0;
}

std::optional<type_handler> type_registry::find(std::type_index type) const {
    std::shared_lock lock(mutex_);
    if (auto it = custom_.find(type); it != custom_.end()) {
        return it->second;
    }
    if (auto it = builtins_.find(type); it != builtins_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool type_registry::has_handler(std::type_index type) const {
    std::shared_lock lock(mutex_);
    return custom_.count(type) > 0 || builtins_.count(type) > 0;
}

bool type_registry::is_serializable(const optional_value& v) const {
    if (!v.has_value() || !v->has_value()) return true;
    return has_handler(v->type());
}

std::string type_registry::type_name(std::type_index type) const {
    auto handler = find(type);
    return handler ? handler->name : std::string(type.name());
}

std::string type_registry::serialize(const value& v) const {
    if (!v.has_value()) {
        throw unsupported_type_error("Cannot serialize an empty value; use an absent optional for NULL");
    }
    auto handler = find(v.type());
    if (!handler) {
        throw unsupported_type_error(std::string("Value of type ") + v.type().name() + " is not serializable");
    }
    return handler->serialize(v);
}

stored_form type_registry::serialize(const optional_value& v) const {
    if (!v.has_value()) return std::nullopt;
    return serialize(*v);
}

value type_registry::deserialize(std::string_view text, std::type_index type) const {
    auto handler = find(type);
    if (!handler) {
        throw unsupported_type_error(std::string("Type ") + type.name() + " is not deserializable");
    }

    value result;
    try {
        result = handler->deserialize(text);
    } catch (const chronicle_error&) {
        throw;
    } catch (const std::exception& e) {
        throw deserialization_error("Handler '" + handler->name + "' failed on '" + std::string(text) + "': " + e.what());
    }

    if (result.type() != type) {
        throw deserialization_error("Handler '" + handler->name + "' returned a value of type " +
                                    result.type().name() + " instead of " + type.name());
    }
    return result;
}

} // namespace chronicle
