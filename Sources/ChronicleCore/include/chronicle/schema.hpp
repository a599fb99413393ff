#pragma once

#ifdef __cplusplus

#include "errors.hpp"
#include "type_registry.hpp"
#include "types.hpp"
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace chronicle {

// Type trait to detect if a type is a relation (pointer to another record)
template<typename T>
struct is_link_type : std::false_type {};

template<typename T>
struct is_link_type<T*> : std::true_type {};

template<typename T>
struct is_link_type<std::vector<T*>> : std::true_type {};

// Property kind - only scalars can be audited
enum class property_kind {
    scalar,  // stored directly on the record (string, int, double, bool, json, ...)
    link,    // single object reference
    list     // collection of object references
};

// Property descriptor (runtime info about a record field)
struct property_descriptor {
    std::string name;
    std::type_index value_type = typeid(void);  // exact type, std::optional unwrapped
    property_kind kind = property_kind::scalar;
    bool nullable = false;
};

// Description of a persisted record type, as the mapping layer sees it
struct record_type {
    std::string name;
    std::type_index type = typeid(void);
    std::vector<property_descriptor> properties;

    const property_descriptor* find(std::string_view field) const {
        for (const auto& p : properties) {
            if (p.name == field) return &p;
        }
        return nullptr;
    }

    /// The primary identifying field is the first declared property.
    const std::string& primary_key() const {
        if (properties.empty()) {
            throw configuration_error("Record type '" + name + "' declares no properties");
        }
        return properties.front().name;
    }
};

/// Specialized by CHRONICLE_RECORD. Provides describe() and get(obj, field).
template<typename T>
struct record_traits;

// ============================================================================
// tracked_schema - immutable audit metadata for one record type
// ============================================================================

struct tracked_schema {
    record_type record;
    std::vector<std::string> tracked_fields;   // declaration order, non-empty
    std::string resource_id_field;
    std::optional<std::string> user_id_field;
    std::string label;

    const std::string& table_name() const { return record.name; }

    bool is_tracked(std::string_view field) const {
        for (const auto& f : tracked_fields) {
            if (f == field) return true;
        }
        return false;
    }

    /// Declared value type of a field. Throws configuration_error for unknown fields.
    std::type_index field_type(std::string_view field) const {
        const auto* p = record.find(field);
        if (!p) {
            throw configuration_error("Record type '" + record.name + "' has no field '" + std::string(field) + "'");
        }
        return p->value_type;
    }
};

/// Optional overrides for schema_registry::declare().
struct track_options {
    std::optional<std::string> resource_id_field;  // defaults to the primary key
    std::optional<std::string> user_id_field;      // defaults to the configured default, if present on the type
    std::optional<std::string> label;              // defaults to the type name
};

// ============================================================================
// schema_registry - declared record types, consulted read-only by the diff path
// ============================================================================

class schema_registry {
public:
    explicit schema_registry(std::shared_ptr<type_registry> types = type_registry::shared(),
                             std::optional<std::string> default_user_id_field = std::nullopt);

    /// Declare a record type for auditing. Throws configuration_error on invalid
    /// fields or on a conflicting re-declaration; an identical re-declaration
    /// returns the existing schema.
    const tracked_schema& declare(const record_type& type,
                                  const std::vector<std::string>& tracked_fields,
                                  const track_options& options = {});

    template<typename T>
    const tracked_schema& declare(const std::vector<std::string>& tracked_fields,
                                  const track_options& options = {}) {
        return declare(record_traits<T>::describe(), tracked_fields, options);
    }

    const tracked_schema* lookup(std::string_view record_name) const;
    const tracked_schema* lookup(std::type_index type) const;

    template<typename T>
    const tracked_schema* lookup() const { return lookup(std::type_index(typeid(T))); }

    std::vector<const tracked_schema*> all() const;

    const type_registry& types() const { return *types_; }

private:
    tracked_schema build(const record_type& type,
                         const std::vector<std::string>& tracked_fields,
                         const track_options& options) const;

    std::shared_ptr<type_registry> types_;
    std::optional<std::string> default_user_id_field_;

    mutable std::shared_mutex mutex_;
    // unique_ptr keeps schema addresses stable for callers holding pointers
    std::map<std::string, std::unique_ptr<tracked_schema>, std::less<>> schemas_by_name_;
    std::unordered_map<std::type_index, std::string> type_to_name_;
};

} // namespace chronicle

// ============================================================================
// CHRONICLE_RECORD Macro System
//
// Describes a plain struct to the audit engine: field names, exact value
// types and accessors.
//
// Usage:
//   struct Customer {
//       int64_t id;
//       std::string name;
//       std::optional<std::string> email;
//   };
//   CHRONICLE_RECORD(Customer, id, name, email);
//
// The first listed field is the record's primary identifying field.
// ============================================================================

// FOR_EACH variadic macro helpers (recursive concatenation)
#define CFE_0(WHAT, cls)
#define CFE_1(WHAT, cls, X) WHAT(cls, X)
#define CFE_2(WHAT, cls, X, ...) WHAT(cls, X) CFE_1(WHAT, cls, __VA_ARGS__)
#define CFE_3(WHAT, cls, X, ...) WHAT(cls, X) CFE_2(WHAT, cls, __VA_ARGS__)
#define CFE_4(WHAT, cls, X, ...) WHAT(cls, X) CFE_3(WHAT, cls, __VA_ARGS__)
#define CFE_5(WHAT, cls, X, ...) WHAT(cls, X) CFE_4(WHAT, cls, __VA_ARGS__)
#define CFE_6(WHAT, cls, X, ...) WHAT(cls, X) CFE_5(WHAT, cls, __VA_ARGS__)
#define CFE_7(WHAT, cls, X, ...) WHAT(cls, X) CFE_6(WHAT, cls, __VA_ARGS__)
#define CFE_8(WHAT, cls, X, ...) WHAT(cls, X) CFE_7(WHAT, cls, __VA_ARGS__)
#define CFE_9(WHAT, cls, X, ...) WHAT(cls, X) CFE_8(WHAT, cls, __VA_ARGS__)
#define CFE_10(WHAT, cls, X, ...) WHAT(cls, X) CFE_9(WHAT, cls, __VA_ARGS__)
#define CFE_11(WHAT, cls, X, ...) WHAT(cls, X) CFE_10(WHAT, cls, __VA_ARGS__)
#define CFE_12(WHAT, cls, X, ...) WHAT(cls, X) CFE_11(WHAT, cls, __VA_ARGS__)
#define CFE_13(WHAT, cls, X, ...) WHAT(cls, X) CFE_12(WHAT, cls, __VA_ARGS__)
#define CFE_14(WHAT, cls, X, ...) WHAT(cls, X) CFE_13(WHAT, cls, __VA_ARGS__)
#define CFE_15(WHAT, cls, X, ...) WHAT(cls, X) CFE_14(WHAT, cls, __VA_ARGS__)
#define CFE_16(WHAT, cls, X, ...) WHAT(cls, X) CFE_15(WHAT, cls, __VA_ARGS__)

#define C_GET_MACRO(_0, _1, _2, _3, _4, _5, _6, _7, _8, _9, _10, _11, _12, _13, _14, _15, _16, NAME, ...) NAME

#define C_FOR_EACH(action, cls, ...) \
    C_GET_MACRO(_0, __VA_ARGS__, \
        CFE_16, CFE_15, CFE_14, CFE_13, CFE_12, CFE_11, CFE_10, CFE_9, \
        CFE_8, CFE_7, CFE_6, CFE_5, CFE_4, CFE_3, CFE_2, CFE_1, CFE_0)(action, cls, __VA_ARGS__)

namespace chronicle { namespace detail {
    template<typename PropType>
    void add_property_descriptor(std::vector<property_descriptor>& out, const char* name) {
        property_descriptor desc;
        desc.name = name;

        if constexpr (is_link_type<PropType>::value) {
            if constexpr (std::is_pointer_v<PropType>) {
                desc.kind = property_kind::link;
            } else {
                desc.kind = property_kind::list;
            }
            desc.value_type = typeid(PropType);
            desc.nullable = true;
        } else {
            desc.kind = property_kind::scalar;
            desc.value_type = typeid(typename unwrap_optional<PropType>::type);
            desc.nullable = is_optional<PropType>::value;
        }

        out.push_back(std::move(desc));
    }

    // Relations are never audited, so they read as absent
    template<typename PropType>
    optional_value read_property(const PropType& prop) {
        if constexpr (is_link_type<PropType>::value) {
            return std::nullopt;
        } else {
            return to_optional_value(prop);
        }
    }
}}

#define CHRONICLE_PROP_DESC(cls, prop) \
    ::chronicle::detail::add_property_descriptor<decltype(cls::prop)>(props, #prop);

#define CHRONICLE_READ_PROP(cls, prop) \
    if (field == #prop) return ::chronicle::detail::read_property<decltype(cls::prop)>(obj.prop);

#define CHRONICLE_RECORD(cls, ...) \
    template<> \
    struct chronicle::record_traits<cls> { \
        static const ::chronicle::record_type& describe() { \
            static ::chronicle::record_type t = []() { \
                std::vector<::chronicle::property_descriptor> props; \
                C_FOR_EACH(CHRONICLE_PROP_DESC, cls, __VA_ARGS__) \
                return ::chronicle::record_type{#cls, typeid(cls), std::move(props)}; \
            }(); \
            return t; \
        } \
        \
        static ::chronicle::optional_value get(const cls& obj, std::string_view field) { \
            C_FOR_EACH(CHRONICLE_READ_PROP, cls, __VA_ARGS__) \
            throw ::chronicle::configuration_error( \
                std::string("Record type '" #cls "' has no field '") + std::string(field) + "'"); \
        } \
    }

#endif // __cplusplus
