#pragma once

#include <quantum/core/container.hpp>
#include <quantum/parser/parser.hpp>
#include <quantum/runtime/ast_cache.hpp>
#include <quantum/runtime/component_resolver.hpp>
#include <quantum/runtime/executor_registry.hpp>
#include <quantum/runtime/expression_cache.hpp>
#include <quantum/runtime/options.hpp>
#include <quantum/runtime/rendered_output.hpp>
#include <quantum/runtime/scope.hpp>

#include <atomic>
#include <filesystem>
#include <string_view>

namespace quantum::runtime {

// Host-owned variable scopes for one execution. Null shared scopes get a
// private empty scope that dies with the request.
struct Scopes {
    SharedScopePtr application;
    SharedScopePtr session;
    Value request = Value::object();
};

// Everything that outlives a single request: parser, caches, resolver and
// executors. One instance serves any number of concurrent executions.
class ComponentRuntime {
public:
    explicit ComponentRuntime(core::ServiceContainer& services, RuntimeOptions options = {});

    ComponentRuntime(const ComponentRuntime&) = delete;
    ComponentRuntime& operator=(const ComponentRuntime&) = delete;

    // Through the AST cache. Throws core::ParseError.
    ast::SourceUnitPtr parse_file(const std::filesystem::path& path);

    // Uncached; `origin` is used for error locations and component lookups.
    ast::SourceUnitPtr parse_source(std::string_view source, const std::filesystem::path& origin = {}) const;

    // Runs `unit` with `params` bound to its declared q:params. Errors
    // (ParseError, ParamError, EvaluationError, ExecutionError) are thrown.
    RenderedOutput execute_component(const ast::SourceUnitPtr& unit,
                                     const Value& params,
                                     Scopes scopes = {},
                                     const std::atomic<bool>* cancel = nullptr);

    RenderedOutput render_file(const std::filesystem::path& path, const Value& params, Scopes scopes = {});

    // Switches both caches; disabling also empties them.
    void set_cache_enabled(bool enabled);

    AstCache& ast_cache() { return ast_cache_; }
    ExpressionCache& expression_cache() { return expression_cache_; }
    ComponentResolver& resolver() { return resolver_; }
    ExecutorRegistry& executors() { return executors_; }
    core::ServiceContainer& services() { return services_; }
    const parser::Parser& parser() const { return parser_; }
    const RuntimeOptions& options() const { return options_; }

private:
    core::ServiceContainer& services_;
    RuntimeOptions options_;
    parser::Parser parser_;
    AstCache ast_cache_;
    ExpressionCache expression_cache_;
    ComponentResolver resolver_;
    ExecutorRegistry executors_;
};

} // namespace quantum::runtime
