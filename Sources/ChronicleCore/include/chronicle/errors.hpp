#pragma once

#ifdef __cplusplus

#include <stdexcept>
#include <string>

namespace chronicle {

/// Base for every error raised by the audit engine.
class chronicle_error : public std::runtime_error {
public:
    explicit chronicle_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// Invalid tracked-record declaration. Raised at declaration time.
class configuration_error : public chronicle_error {
public:
    explicit configuration_error(const std::string& msg) : chronicle_error(msg) {}
};

/// No handler is registered for a value's exact type.
class unsupported_type_error : public chronicle_error {
public:
    explicit unsupported_type_error(const std::string& msg) : chronicle_error(msg) {}
};

/// A stored form could not be turned back into a value.
class deserialization_error : public chronicle_error {
public:
    explicit deserialization_error(const std::string& msg) : chronicle_error(msg) {}
};

/// A context frame or change filter outside its allowed values.
class invalid_argument_error : public chronicle_error {
public:
    explicit invalid_argument_error(const std::string& msg) : chronicle_error(msg) {}
};

/// pop() without a matching push(). Indicates corrupted scoping in the host.
class context_stack_error : public chronicle_error {
public:
    explicit context_stack_error(const std::string& msg) : chronicle_error(msg) {}
};

/// A dirty record has no value for its resource-id field.
class resource_id_error : public chronicle_error {
public:
    explicit resource_id_error(const std::string& msg) : chronicle_error(msg) {}
};

} // namespace chronicle

#endif // __cplusplus
