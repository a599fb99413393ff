#include "chronicle/schema.hpp"
#include "chronicle/log.hpp"
#include <mutex>
#include <unordered_set>

namespace chronicle {

namespace {

bool same_declaration(const tracked_schema& a, const tracked_schema& b) {
    return a.record.type == b.record.type &&
           a.tracked_fields == b.tracked_fields &&
           a.resource_id_field == b.resource_id_field &&
           a.user_id_field == b.user_id_field &&
           a.label == b.label;
}

} // namespace

schema_registry::schema_registry(std::shared_ptr<type_registry> types,
                                 std::optional<std::string> default_user_id_field)
    : types_(types ? std::move(types) : type_registry::shared())
    , default_user_id_field_(std::move(default_user_id_field)) {}

tracked_schema schema_registry::build(const record_type& type,
                                      const std::vector<std::string>& tracked_fields,
                                      const track_options& options) const {
    if (type.name.empty()) {
        throw configuration_error("Record type must have a name");
    }
    if (tracked_fields.empty()) {
        throw configuration_error("Record type '" + type.name + "' must track at least one field");
    }

    std::unordered_set<std::string> seen;
    for (const auto& field : tracked_fields) {
        LOG_DEBUG("schema", "Validating tracked field '%s' for %s", field.c_str(), type.name.c_str());

        if (!seen.insert(field).second) {
            throw configuration_error("Field '" + field + "' is tracked twice on '" + type.name + "'");
        }
        const auto* prop = type.find(field);
        if (!prop) {
            throw configuration_error("Field '" + field + "' is not a valid field in the record type " +
                                      type.name + ". Is it a valid column name?");
        }
        if (prop->kind != property_kind::scalar) {
            throw configuration_error("Field '" + field + "' on " + type.name +
                                      " is a relationship and cannot be tracked");
        }
        if (!types_->has_handler(prop->value_type)) {
            throw configuration_error("Field '" + field + "' on " + type.name + " has type " +
                                      prop->value_type.name() + " with no registered type handler");
        }
    }

    tracked_schema schema;
    schema.record = type;
    schema.tracked_fields = tracked_fields;

    if (options.resource_id_field) {
        const auto* prop = type.find(*options.resource_id_field);
        if (!prop) {
            throw configuration_error("The resource_id_field '" + *options.resource_id_field +
                                      "' does not exist in the record type " + type.name);
        }
        if (prop->kind != property_kind::scalar) {
            throw configuration_error("The resource_id_field '" + *options.resource_id_field +
                                      "' on " + type.name + " is a relationship");
        }
        schema.resource_id_field = *options.resource_id_field;
    } else {
        schema.resource_id_field = type.primary_key();
        LOG_DEBUG("schema", "No resource_id_field for '%s', using primary key '%s'",
                  type.name.c_str(), schema.resource_id_field.c_str());
    }
    if (!types_->has_handler(type.find(schema.resource_id_field)->value_type)) {
        throw configuration_error("The resource_id_field '" + schema.resource_id_field + "' on " + type.name +
                                  " has no registered type handler");
    }

    if (options.user_id_field) {
        if (!type.find(*options.user_id_field)) {
            throw configuration_error("The user_id_field '" + *options.user_id_field +
                                      "' does not exist in the record type " + type.name);
        }
        schema.user_id_field = options.user_id_field;
    } else if (default_user_id_field_ && type.find(*default_user_id_field_)) {
        schema.user_id_field = default_user_id_field_;
    }

    schema.label = options.label.value_or(type.name);
    return schema;
}

const tracked_schema& schema_registry::declare(const record_type& type,
                                               const std::vector<std::string>& tracked_fields,
                                               const track_options& options) {
    tracked_schema schema = build(type, tracked_fields, options);

    std::unique_lock lock(mutex_);
    if (auto it = schemas_by_name_.find(type.name); it != schemas_by_name_.end()) {
        if (!same_declaration(*it->second, schema)) {
            throw configuration_error("Record type '" + type.name +
                                      "' is already declared with a different configuration");
        }
        return *it->second;
    }
    bool has_native_type = type.type != std::type_index(typeid(void));
    if (has_native_type && type_to_name_.count(type.type) > 0) {
        throw configuration_error("Record type '" + type.name + "' is already declared under the name '" +
                                  type_to_name_[type.type] + "'");
    }

    LOG_INFO("schema", "Tracking %zu field(s) on '%s' (resource id: %s)",
             schema.tracked_fields.size(), type.name.c_str(), schema.resource_id_field.c_str());

    if (has_native_type) {
        type_to_name_[type.type] = type.name;
    }
    auto owned = std::make_unique<tracked_schema>(std::move(schema));
    const tracked_schema& ref = *owned;
    schemas_by_name_.emplace(type.name, std::move(owned));
    return ref;
}

const tracked_schema* schema_registry::lookup(std::string_view record_name) const {
    std::shared_lock lock(mutex_);
    auto it = schemas_by_name_.find(record_name);
    if (it == schemas_by_name_.end()) {
        return nullptr;
    }
    return it->second.get();
}

const tracked_schema* schema_registry::lookup(std::type_index type) const {
    std::shared_lock lock(mutex_);
    auto it = type_to_name_.find(type);
    if (it == type_to_name_.end()) {
        return nullptr;
    }
    auto sit = schemas_by_name_.find(it->second);
    return sit == schemas_by_name_.end() ? nullptr : sit->second.get();
}

std::vector<const tracked_schema*> schema_registry::all() const {
    std::shared_lock lock(mutex_);
    std::vector<const tracked_schema*> result;
    result.reserve(schemas_by_name_.size());
    for (const auto& [_, schema] : schemas_by_name_) {
        result.push_back(schema.get());
    }
    return result;
}

} // namespace chronicle
