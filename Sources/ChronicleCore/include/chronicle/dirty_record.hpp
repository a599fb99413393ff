#pragma once

#ifdef __cplusplus

#include "schema.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace chronicle {

enum class record_state {
    created,
    updated,
    deleted
};

inline const char* to_string(record_state state) {
    switch (state) {
        case record_state::created: return "created";
        case record_state::updated: return "updated";
        case record_state::deleted: return "deleted";
    }
    return "unknown";
}

// ============================================================================
// dirty_record - what the persistence layer knows about one flushed instance
//
// previous_value() is the value before the transaction (absent for created
// records), pending_value() the value about to be committed (absent for
// deleted records).
// ============================================================================

class dirty_record {
public:
    virtual ~dirty_record() = default;

    virtual const std::string& record_name() const = 0;
    virtual record_state state() const = 0;
    virtual optional_value previous_value(std::string_view field) const = 0;
    virtual optional_value pending_value(std::string_view field) const = 0;
};

// dirty_record over two snapshots of a CHRONICLE_RECORD struct
template<typename T>
class record_change : public dirty_record {
public:
    static record_change created(T after) {
        return record_change(record_state::created, std::nullopt, std::move(after));
    }

    static record_change updated(T before, T after) {
        return record_change(record_state::updated, std::move(before), std::move(after));
    }

    static record_change deleted(T before) {
        return record_change(record_state::deleted, std::move(before), std::nullopt);
    }

    const std::string& record_name() const override {
        return record_traits<T>::describe().name;
    }

    record_state state() const override { return state_; }

    optional_value previous_value(std::string_view field) const override {
        if (!before_) return std::nullopt;
        return record_traits<T>::get(*before_, field);
    }

    optional_value pending_value(std::string_view field) const override {
        if (!after_) return std::nullopt;
        return record_traits<T>::get(*after_, field);
    }

private:
    record_change(record_state state, std::optional<T> before, std::optional<T> after)
        : state_(state), before_(std::move(before)), after_(std::move(after)) {}

    record_state state_;
    std::optional<T> before_;
    std::optional<T> after_;
};

} // namespace chronicle

#endif // __cplusplus
