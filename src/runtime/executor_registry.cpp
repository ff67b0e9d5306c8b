#include <quantum/runtime/executor_registry.hpp>
#include <quantum/core/logger.hpp>

#include <string>

namespace quantum::runtime {

void ExecutorRegistry::register_executor(ast::NodeKind kind, NodeExecutor executor)
{
    if (executors_.count(kind) > 0) {
        core::logger().warning("executor", "Overwriting executor for " + std::string(ast::kind_name(kind)));
    }
    executors_[kind] = std::move(executor);
}

ExecResult ExecutorRegistry::execute(const ast::Node& node, Interpreter& interpreter) const
{
    try {
        auto it = executors_.find(node.kind);
        if (it != executors_.end()) return it->second(node, interpreter);
        if (fallback_) return fallback_(node, interpreter);
        throw core::ExecutionError("No executor for " + std::string(ast::kind_name(node.kind)) + " node", node.location);
    } catch (const core::EvaluationError& e) {
        if (e.location().known()) return ExecResult::failure(std::current_exception());
        return ExecResult::failure(std::make_exception_ptr(e.at(node.location)));
    } catch (const core::ParamError& e) {
        if (e.location().known()) return ExecResult::failure(std::current_exception());
        return ExecResult::failure(std::make_exception_ptr(core::ParamError(e.parameter(), e.message(), node.location)));
    } catch (const core::Error& e) {
        // already located (a nested node failed) or a ParseError from a loaded file
        if (e.location().known()) return ExecResult::failure(std::current_exception());
        return ExecResult::failure(std::make_exception_ptr(core::ExecutionError(e.message(), node.location)));
    } catch (const std::exception& e) {
        return ExecResult::failure(std::make_exception_ptr(core::ExecutionError(e.what(), node.location)));
    }
}

ExecutorRegistry ExecutorRegistry::with_builtin_executors()
{
    ExecutorRegistry registry;
    register_builtin_executors(registry);
    return registry;
}

} // namespace quantum::runtime
