#pragma once

#ifdef __cplusplus

#include "errors.hpp"
#include "types.hpp"
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>

namespace chronicle {

/// Converts one exact C++ type to its stored text form and back.
/// Handlers must satisfy deserialize(serialize(v)) == v.
struct type_handler {
    std::string name;
    std::function<std::string(const value&)> serialize;
    std::function<value(std::string_view)> deserialize;
};

/// ISO-8601 UTC with nine fraction digits, the stored form of timestamp_t.
std::string format_timestamp(timestamp_t t);

/// Inverse of format_timestamp. Throws deserialization_error.
timestamp_t parse_timestamp(std::string_view text);

// ============================================================================
// type_registry - exact-type dispatch between values and stored forms
//
// Lookup order: custom handlers, then built-ins. There is no subtype or
// conversion matching; an int32_t is not serialized by the int64_t handler.
//
// Reads take a shared lock and may run concurrently. Registration takes an
// exclusive lock and is expected to happen during startup.
// ============================================================================

class type_registry {
public:
    /// A registry with only the built-in handlers.
    type_registry();

    /// Process-wide default instance.
    static std::shared_ptr<type_registry> shared();

    /// Install or replace the custom handler for an exact type. Last one wins.
    void register_handler(std::type_index type, type_handler handler);

    /// Typed registration: ser is T -> std::string, de is std::string_view -> T.
    template<typename T, typename Ser, typename De>
    void register_handler(std::string name, Ser&& ser, De&& de) {
        type_handler handler;
        handler.name = std::move(name);
        handler.serialize = [s = std::forward<Ser>(ser)](const value& v) -> std::string {
            return s(v.get<T>());
        };
        handler.deserialize = [d = std::forward<De>(de)](std::string_view text) -> value {
            return value(T(d(text)));
        };
        register_handler(std::type_index(typeid(T)), std::move(handler));
    }

    /// Drop a custom handler. Built-ins for the same type become visible again.
    /// Returns false when no custom handler was registered.
    bool remove_handler(std::type_index type);

    template<typename T>
    bool remove_handler() { return remove_handler(std::type_index(typeid(T))); }

    bool has_handler(std::type_index type) const;

    template<typename T>
    bool has_handler() const { return has_handler(std::type_index(typeid(T))); }

    /// Absent values are always serializable (to NULL).
    bool is_serializable(const optional_value& v) const;

    /// Throws unsupported_type_error when no handler matches v.type().
    std::string serialize(const value& v) const;

    stored_form serialize(const optional_value& v) const;

    /// Throws unsupported_type_error for an unknown target type and
    /// deserialization_error for malformed text.
    value deserialize(std::string_view text, std::type_index type) const;

    template<typename T>
    T deserialize(std::string_view text) const {
        return deserialize(text, std::type_index(typeid(T))).template get<T>();
    }

    /// Handler name for diagnostics, or the mangled type name when unknown.
    std::string type_name(std::type_index type) const;

private:
    std::optional<type_handler> find(std::type_index type) const;
    void install_builtins();

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, type_handler> builtins_;
    std::unordered_map<std::type_index, type_handler> custom_;
};

} // namespace chronicle

#endif // __cplusplus
