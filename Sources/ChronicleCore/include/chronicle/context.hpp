#pragma once

#ifdef __cplusplus

#include "errors.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace chronicle {

/// One scoped override of who is acting and why.
struct context_frame {
    std::optional<std::string> acting_user_id;
    std::optional<std::string> reason;
    std::optional<std::string> impersonated_by;

    static constexpr size_t max_user_id_length = 256;
    static constexpr size_t max_reason_length = 512;

    /// Throws invalid_argument_error on empty or over-long values.
    void validate() const;
};

/// The context a commit is stamped with.
struct effective_context {
    std::optional<std::string> acting_user_id;
    std::optional<std::string> reason;
    std::optional<std::string> impersonated_by;
};

/// Supplies the acting user when no frame names one.
using identity_callback_t = std::function<std::optional<std::string>()>;

// ============================================================================
// context_stack - per unit of work, never shared between concurrent units
// ============================================================================

class context_stack {
public:
    context_stack() = default;

    context_stack(const context_stack&) = delete;
    context_stack& operator=(const context_stack&) = delete;
    context_stack(context_stack&&) = default;
    context_stack& operator=(context_stack&&) = default;

    void push(context_frame frame);

    /// Throws context_stack_error when the stack is empty.
    void pop();

    size_t depth() const { return frames_.size(); }
    bool empty() const { return frames_.empty(); }

    /// Top frame, or nullptr when empty.
    const context_frame* top() const { return frames_.empty() ? nullptr : &frames_.back(); }

    /// Top frame only; lower frames are not merged in. acting_user_id falls
    /// back to the identity callback when the top frame has none.
    effective_context current(const identity_callback_t& identity = {}) const;

    /// Stack owned by the calling thread, for hosts that keep context ambient.
    static context_stack& this_thread();

private:
    friend class scoped_context;
    std::vector<context_frame> frames_;
};

// RAII frame: pushes on construction, restores the parent frame on every exit path
class scoped_context {
public:
    scoped_context(context_stack& stack, context_frame frame);
    ~scoped_context();

    scoped_context(const scoped_context&) = delete;
    scoped_context& operator=(const scoped_context&) = delete;

    const context_frame& frame() const { return stack_.frames_[depth_ - 1]; }

private:
    context_stack& stack_;
    size_t depth_;
};

} // namespace chronicle

#endif // __cplusplus
