#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include "schema.hpp"
#include "type_registry.hpp"
#include "types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace chronicle {

enum class sort_order {
    ascending,
    descending
};

/// Criteria for change_retriever::query. All present criteria must match.
struct change_filter {
    std::vector<std::string> resource_ids;             // required, stored form of the resource id
    std::optional<std::vector<std::string>> fields;    // tracked field names
    std::optional<std::vector<std::string>> user_ids;  // acting users
    std::optional<timestamp_t> from;                   // inclusive
    std::optional<timestamp_t> to;                     // inclusive
    std::optional<size_t> limit;
    std::optional<size_t> offset;
    sort_order order = sort_order::ascending;

    /// Throws invalid_argument_error for an empty resource id list or from > to.
    void validate() const;
};

/// One change log entry with its values restored to the field's declared type.
struct change_record {
    int64_t id = 0;
    std::string table;        // schema label
    std::string field;
    std::string resource_id;
    optional_value old_value;
    optional_value new_value;
    stored_form old_stored;   // raw text as persisted
    stored_form new_stored;
    timestamp_t timestamp{};
    std::optional<std::string> changed_by;
    std::optional<std::string> reason;
    std::optional<std::string> impersonated_by;

    /// Set when a stored value could not be restored. old_value and new_value
    /// are then left empty and the raw forms are kept.
    std::optional<std::string> error;

    bool ok() const { return !error.has_value(); }

    template<typename T>
    std::optional<T> old_as() const {
        if (!old_value) return std::nullopt;
        return old_value->get<T>();
    }

    template<typename T>
    std::optional<T> new_as() const {
        if (!new_value) return std::nullopt;
        return new_value->get<T>();
    }

    /// Values are rendered in their stored form.
    json to_json() const;
};

// ============================================================================
// change_retriever - filtered, ordered reads of the change log
// ============================================================================

class change_retriever {
public:
    change_retriever(database& db, const type_registry& types) : db_(db), types_(types) {}

    /// Ordered by timestamp then insertion id, both in filter.order.
    /// A declared table without any written changes yields an empty result.
    std::vector<change_record> query(const tracked_schema& schema, const change_filter& filter) const;

private:
    database& db_;
    const type_registry& types_;
};

} // namespace chronicle

#endif // __cplusplus
