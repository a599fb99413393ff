#include "chronicle/context.hpp"
#include "chronicle/log.hpp"
#include <stdexcept>

namespace chronicle {

namespace {

void check_field(const std::optional<std::string>& v, const char* name, size_t max_length) {
    if (!v) return;
    if (v->empty()) {
        throw invalid_argument_error(std::string(name) + " must not be empty");
    }
    if (v->size() > max_length) {
        throw invalid_argument_error(std::string(name) + " exceeds " + std::to_string(max_length) + " characters");
    }
}

} // namespace

void context_frame::validate() const {
    check_field(acting_user_id, "acting_user_id", max_user_id_length);
    check_field(reason, "reason", max_reason_length);
    check_field(impersonated_by, "impersonated_by", max_user_id_length);
}

void context_stack::push(context_frame frame) {
    frame.validate();
    frames_.push_back(std::move(frame));
}

void context_stack::pop() {
    if (frames_.empty()) {
        LOG_ERROR("context", "pop() on an empty context stack");
        throw context_stack_error("pop() without a matching push()");
    }
    frames_.pop_back();
}

effective_context context_stack::current(const identity_callback_t& identity) const {
    effective_context ctx;
    if (const auto* frame = top()) {
        ctx.acting_user_id = frame->acting_user_id;
        ctx.reason = frame->reason;
        ctx.impersonated_by = frame->impersonated_by;
    }
    if (!ctx.acting_user_id && identity) {
        auto resolved = identity();
        if (resolved && !resolved->empty()) {
            ctx.acting_user_id = std::move(resolved);
        }
    }
    return ctx;
}

context_stack& context_stack::this_thread() {
    static thread_local context_stack stack;
    return stack;
}

scoped_context::scoped_context(context_stack& stack, context_frame frame)
    : stack_(stack) {
    stack_.push(std::move(frame));
    depth_ = stack_.depth();
}

scoped_context::~scoped_context() {
    if (stack_.depth() < depth_) {
        LOG_ERROR("context", "Scoped frame at depth %zu was already popped (depth now %zu)",
                  depth_, stack_.depth());
        return;
    }
    if (stack_.depth() > depth_) {
        // Frames pushed inside this scope without a matching pop
        LOG_ERROR("context", "Discarding %zu unbalanced frame(s) above depth %zu",
                  stack_.depth() - depth_, depth_);
    }
    stack_.frames_.resize(depth_ - 1);
}

} // namespace chronicle
