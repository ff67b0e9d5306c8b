#pragma once

#include <quantum/ast/nodes.hpp>
#include <quantum/runtime/exec_result.hpp>

#include <functional>
#include <unordered_map>

namespace quantum::runtime {

class Interpreter;

using NodeExecutor = std::function<ExecResult(const ast::Node&, Interpreter&)>;

// Maps each node kind to the executor that runs it. Built once per runtime
// and shared by every request.
class ExecutorRegistry {
public:
    // Replacing an existing executor is allowed but logged.
    void register_executor(ast::NodeKind kind, NodeExecutor executor);

    // Used for kinds with no executor of their own.
    void set_fallback(NodeExecutor executor) { fallback_ = std::move(executor); }

    [[nodiscard]] bool contains(ast::NodeKind kind) const { return executors_.count(kind) > 0; }

    // Never throws: an exception escaping the executor becomes an Error
    // result. ParamError and EvaluationError pass through (pinned to the node
    // when they have no location); anything else is wrapped in an
    // ExecutionError carrying the node location.
    ExecResult execute(const ast::Node& node, Interpreter& interpreter) const;

    static ExecutorRegistry with_builtin_executors();

private:
    std::unordered_map<ast::NodeKind, NodeExecutor> executors_;
    NodeExecutor fallback_;
};

// Defined in src/runtime/executors/*.cpp.
void register_builtin_executors(ExecutorRegistry& registry);

} // namespace quantum::runtime
