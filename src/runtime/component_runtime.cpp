#include <quantum/core/logger.hpp>
#include <quantum/runtime/component_runtime.hpp>
#include <quantum/runtime/execution_context.hpp>
#include <quantum/runtime/interpreter.hpp>

#include <chrono>

namespace quantum::runtime {

ComponentRuntime::ComponentRuntime(core::ServiceContainer& services, RuntimeOptions options)
    : services_(services),
      options_(std::move(options)),
      ast_cache_([this](std::string_view source, const std::filesystem::path& origin) { return parser_.parse(source, origin); },
                 options_.cache.ast_max_items,
                 options_.cache.ast_ttl,
                 options_.cache.ast_enabled),
      expression_cache_(options_.cache.expression_max_items, options_.cache.expression_enabled),
      resolver_(ast_cache_, options_.component_paths),
      executors_(ExecutorRegistry::with_builtin_executors())
{
}

ast::SourceUnitPtr ComponentRuntime::parse_file(const std::filesystem::path& path)
{
    return ast_cache_.load(path);
}

ast::SourceUnitPtr ComponentRuntime::parse_source(std::string_view source, const std::filesystem::path& origin) const
{
    return parser_.parse(source, origin);
}

RenderedOutput ComponentRuntime::execute_component(const ast::SourceUnitPtr& unit,
                                                   const Value& params,
                                                   Scopes scopes,
                                                   const std::atomic<bool>* cancel)
{
    if (!unit) throw core::ExecutionError("No component to execute");

    ExecutionContext context(std::move(scopes.application), std::move(scopes.session), std::move(scopes.request));
    auto limits = options_.limits;
    limits.cancel = cancel;

    Interpreter interpreter(executors_, expression_cache_, resolver_, services_, context, limits);

    auto started = std::chrono::steady_clock::now();
    auto output = interpreter.run(unit, params.is_null() ? Value::object() : params);
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);

    core::logger().debug("runtime", "Executed " + unit->name() + " in " + std::to_string(elapsed.count()) + "us (" +
                                    std::to_string(interpreter.steps()) + " steps)");
    return output;
}

RenderedOutput ComponentRuntime::render_file(const std::filesystem::path& path, const Value& params, Scopes scopes)
{
    return execute_component(parse_file(path), params, std::move(scopes));
}

void ComponentRuntime::set_cache_enabled(bool enabled)
{
    ast_cache_.set_enabled(enabled);
    expression_cache_.set_enabled(enabled);
}

} // namespace quantum::runtime
