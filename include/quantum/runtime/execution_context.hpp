#pragma once

#include <quantum/runtime/expression.hpp>
#include <quantum/runtime/scope.hpp>

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace quantum::runtime {

enum class FrameKind {
    Component, // first frame of a component invocation; a boundary
    Function,  // q:function call; a boundary
    Block,     // loop iteration and other nested statement lists
};

// Variable scopes of one request. Reads of unprefixed names walk the local
// frames innermost first up to the nearest boundary, then the invocation's
// component frame, then the request scope. Session and application are only
// reachable through their prefixes.
class ExecutionContext : public ExpressionEnvironment {
public:
    using FunctionHandler = std::function<std::optional<Value>(const std::string&, const std::vector<Value>&)>;

    // Null shared scopes are replaced by private empty ones.
    ExecutionContext(SharedScopePtr application, SharedScopePtr session, Value request = Value::object());

    std::optional<Value> resolve(const std::string& name) const;

    // Updates the visible binding of the root name when there is one,
    // otherwise creates it in the innermost frame. Prefixed names write to
    // that scope directly.
    void assign(const std::string& name, Value value);

    // Binds in the innermost frame, shadowing any outer binding.
    void declare(const std::string& name, Value value);

    // Removes a visible binding (or a prefixed entry). False when absent.
    bool remove(const std::string& name);

    void push_frame(FrameKind kind);
    void pop_frame();
    std::size_t frame_count() const { return frames_.size(); }

    class FrameGuard {
    public:
        FrameGuard(ExecutionContext& context, FrameKind kind) : context_(context) { context_.push_frame(kind); }
        ~FrameGuard() { context_.pop_frame(); }
        FrameGuard(const FrameGuard&) = delete;
        FrameGuard& operator=(const FrameGuard&) = delete;

    private:
        ExecutionContext& context_;
    };

    // Holds both shared scopes for a read-modify-write. std::scoped_lock
    // orders the two acquisitions, so concurrent requests cannot deadlock.
    [[nodiscard]] std::scoped_lock<std::recursive_mutex, std::recursive_mutex> lock_shared_scopes() const
    {
        return std::scoped_lock(application_->mutex(), session_->mutex());
    }

    SharedScope& application() { return *application_; }
    SharedScope& session() { return *session_; }
    Value& request() { return request_; }
    const Value& request() const { return request_; }

    void set_function_handler(FunctionHandler handler) { functions_ = std::move(handler); }

    // ExpressionEnvironment
    std::optional<Value> lookup(const std::string& name) const override { return resolve(name); }
    std::optional<Value> call_function(const std::string& name, const std::vector<Value>& args) override;

private:
    struct Frame {
        FrameKind kind;
        Value vars = Value::object();
    };

    enum class Target { Local, Request, Session, Application };

    // Splits off an application./session./request. prefix.
    static Target target_of(const std::vector<std::string>& path);

    // Frames visible to unprefixed names, innermost first.
    std::vector<const Frame*> visible_frames() const;
    Frame* find_binding(const std::string& root);

    SharedScopePtr application_;
    SharedScopePtr session_;
    Value request_;
    std::vector<Frame> frames_;
    FunctionHandler functions_;
};

} // namespace quantum::runtime
