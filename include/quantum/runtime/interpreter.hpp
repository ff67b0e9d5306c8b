#pragma once

#include <quantum/ast/source_unit.hpp>
#include <quantum/core/container.hpp>
#include <quantum/runtime/component_resolver.hpp>
#include <quantum/runtime/execution_context.hpp>
#include <quantum/runtime/executor_registry.hpp>
#include <quantum/runtime/expression_cache.hpp>
#include <quantum/runtime/interpolator.hpp>
#include <quantum/runtime/rendered_output.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace quantum::runtime {

// Cooperative abort budget, checked between statements and on every loop
// iteration. Zero means unlimited.
struct ExecutionLimits {
    std::size_t max_steps = 0;
    std::chrono::milliseconds max_duration{0};
    std::size_t max_call_depth = 64;
    const std::atomic<bool>* cancel = nullptr;
};

// Walks one request's statements. Owns the output buffers, the invocation
// stack and the step/time/depth accounting; variables live in the
// ExecutionContext it is given.
class Interpreter {
public:
    Interpreter(const ExecutorRegistry& executors,
                ExpressionCache& expressions,
                ComponentResolver& components,
                core::ServiceContainer& services,
                ExecutionContext& context,
                ExecutionLimits limits = {});

    ~Interpreter();

    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    // Runs a component (or application) unit as the request's entry point.
    // Error results are rethrown to the caller.
    RenderedOutput run(const ast::SourceUnitPtr& unit, const Value& params);

    // Statement lists. Stop at the first non-Continue result.
    ExecResult execute_statements(const ast::NodeList& statements);
    // Same, inside a fresh Block frame.
    ExecResult execute_block(const ast::NodeList& statements);

    // Component invocation behind a Component frame: binds params, hoists
    // functions, runs the body. `slot` is the caller's pre-rendered content.
    ExecResult invoke_component(const ast::SourceUnitPtr& unit, const Value& args, std::optional<std::string> slot = std::nullopt);

    // User function of the current component; nullopt when none has that name.
    std::optional<Value> call_function(const std::string& name, const std::vector<Value>& args);

    // --- expressions ---
    Value evaluate(const std::string& expression);
    // Exactly one {expr} gives the raw value; other text is interpolated.
    Value evaluate_text(const std::string& text);
    std::string interpolate(const std::string& text);
    bool condition(const std::string& expression);

    // --- output ---
    void emit(std::string fragment);

    struct Captured {
        ExecResult result;
        std::string text;
    };
    // Runs `statements` in a Block frame with output diverted into `text`.
    Captured capture(const ast::NodeList& statements);
    // capture() for content used as a value: errors are rethrown, a Redirect
    // becomes an ExecutionError and Return ends the content.
    std::string render(const ast::NodeList& statements);

    void add_flash(FlashMessage flash) { flashes_.push_back(std::move(flash)); }
    void set_status(int status) { status_ = status; }

    // --- current invocation ---
    const ast::SourceUnit& current_unit() const;
    std::filesystem::path current_directory() const;
    void bind_import(const std::string& name, ast::SourceUnitPtr unit);
    void define_function(const ast::FunctionNode& function);
    ast::SourceUnitPtr find_component(const std::string& name);
    const std::optional<std::string>& slot_content() const;

    // Binds declared params from `args` (an object by name, or an array by
    // position) into the innermost frame. Throws core::ParamError.
    void bind_params(const ast::ParamList& params, const Value& args, const core::SourceLocation& location);

    // Counts one step; throws core::ExecutionError when a limit is exceeded.
    void tick(const ast::Node& node);

    ExecutionContext& context() { return context_; }
    core::ServiceContainer& services() { return services_; }
    ComponentResolver& components() { return components_; }
    const ExecutionLimits& limits() const { return limits_; }
    std::size_t steps() const { return steps_; }
    std::size_t call_depth() const { return call_depth_; }

private:
    struct Invocation {
        ast::SourceUnitPtr unit;
        std::unordered_map<std::string, const ast::FunctionNode*> functions;
        std::unordered_map<std::string, ast::SourceUnitPtr> imports;
        std::optional<std::string> slot;
    };

    class DepthGuard {
    public:
        DepthGuard(Interpreter& interpreter, const core::SourceLocation& location);
        ~DepthGuard() { --interpreter_.call_depth_; }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        Interpreter& interpreter_;
    };

    void hoist_functions(Invocation& invocation, const ast::NodeList& body);
    Value param_value(const ast::ParamNode& param, const Value* supplied, const core::SourceLocation& location);

    const ExecutorRegistry& executors_;
    ExpressionCache& expressions_;
    Interpolator interpolator_;
    ComponentResolver& components_;
    core::ServiceContainer& services_;
    ExecutionContext& context_;
    ExecutionLimits limits_;

    std::vector<std::vector<std::string>> outputs_;
    std::vector<FlashMessage> flashes_;
    int status_ = 200;
    std::vector<Invocation> invocations_;
    std::size_t call_depth_ = 0;
    std::size_t steps_ = 0;
    std::chrono::steady_clock::time_point started_;
};

} // namespace quantum::runtime
