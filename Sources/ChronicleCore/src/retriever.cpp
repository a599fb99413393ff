#include "chronicle/retriever.hpp"
#include "chronicle/log.hpp"
#include <sstream>
#include <stdexcept>

namespace chronicle {

namespace {

json optional_text(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

void append_in_clause(std::ostringstream& sql,
                      std::vector<column_value_t>& params,
                      const char* column,
                      const std::vector<std::string>& values) {
    sql << " AND " << column << " IN (";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) sql << ", ";
        sql << "?";
        params.emplace_back(values[i]);
    }
    sql << ")";
}

} // namespace

void change_filter::validate() const {
    if (resource_ids.empty()) {
        throw invalid_argument_error("change_filter requires at least one resource id");
    }
    if (from && to && *from > *to) {
        throw invalid_argument_error("change_filter range starts after it ends");
    }
}

json change_record::to_json() const {
    return json{
        {"id", id},
        {"table", table},
        {"field", field},
        {"resource_id", resource_id},
        {"old_value", optional_text(old_stored)},
        {"new_value", optional_text(new_stored)},
        {"timestamp", format_timestamp(timestamp)},
        {"changed_by", optional_text(changed_by)},
        {"reason", optional_text(reason)},
        {"impersonated_by", optional_text(impersonated_by)},
        {"error", optional_text(error)}
    };
}

std::vector<change_record> change_retriever::query(const tracked_schema& schema,
                                                   const change_filter& filter) const {
    filter.validate();

    std::ostringstream sql;
    std::vector<column_value_t> params;

    sql << "SELECT l.id AS id, f.fieldName AS fieldName, r.resourceId AS resourceId, "
        << "l.oldValue AS oldValue, l.newValue AS newValue, l.timestamp AS timestamp, "
        << "l.changedBy AS changedBy, l.reason AS reason, l.impersonatedBy AS impersonatedBy "
        << "FROM ChronicleLog l "
        << "JOIN ChronicleFields f ON f.id = l.fieldId "
        << "JOIN ChronicleResources r ON r.id = l.resourceRowId "
        << "JOIN ChronicleTables t ON t.id = r.tableId "
        << "WHERE t.tableName = ?";
    params.emplace_back(schema.table_name());

    append_in_clause(sql, params, "r.resourceId", filter.resource_ids);
    if (filter.fields) {
        append_in_clause(sql, params, "f.fieldName", *filter.fields);
    }
    if (filter.user_ids) {
        append_in_clause(sql, params, "l.changedBy", *filter.user_ids);
    }
    if (filter.from) {
        sql << " AND l.timestamp >= ?";
        params.emplace_back(to_unix_nanos(*filter.from));
    }
    if (filter.to) {
        sql << " AND l.timestamp <= ?";
        params.emplace_back(to_unix_nanos(*filter.to));
    }

    const char* direction = filter.order == sort_order::descending ? "DESC" : "ASC";
    sql << " ORDER BY l.timestamp " << direction << ", l.id " << direction;

    if (filter.limit || filter.offset) {
        // SQLite requires LIMIT before OFFSET; -1 means unbounded
        sql << " LIMIT ? OFFSET ?";
        params.emplace_back(filter.limit ? static_cast<int64_t>(*filter.limit) : int64_t{-1});
        params.emplace_back(static_cast<int64_t>(filter.offset.value_or(0)));
    }

    auto rows = db_.query(sql.str(), params);

    std::vector<change_record> records;
    records.reserve(rows.size());
    for (const auto& row : rows) {
        change_record rec;
        rec.id = detail::column_int(row, "id");
        rec.table = schema.label;
        rec.field = detail::column_text(row, "fieldName").value_or("");
        rec.resource_id = detail::column_text(row, "resourceId").value_or("");
        rec.old_stored = detail::column_text(row, "oldValue");
        rec.new_stored = detail::column_text(row, "newValue");
        rec.timestamp = from_unix_nanos(detail::column_int(row, "timestamp"));
        rec.changed_by = detail::column_text(row, "changedBy");
        rec.reason = detail::column_text(row, "reason");
        rec.impersonated_by = detail::column_text(row, "impersonatedBy");

        try {
            auto type = schema.field_type(rec.field);
            if (rec.old_stored) rec.old_value = types_.deserialize(*rec.old_stored, type);
            if (rec.new_stored) rec.new_value = types_.deserialize(*rec.new_stored, type);
        } catch (const chronicle_error& e) {
            LOG_WARN("retriever", "Change %lld on %s.%s cannot be restored: %s",
                     static_cast<long long>(rec.id), schema.table_name().c_str(), rec.field.c_str(), e.what());
            rec.old_value.reset();
            rec.new_value.reset();
            rec.error = e.what();
        }

        records.push_back(std::move(rec));
    }

    LOG_DEBUG("retriever", "%s: %zu change(s)", schema.table_name().c_str(), records.size());
    return records;
}

} // namespace chronicle
