#include <quantum/runtime/options.hpp>
#include <quantum/support/env.hpp>

#include <string>

namespace quantum::runtime {

RuntimeOptions RuntimeOptions::from_config(const core::Config& config)
{
    RuntimeOptions options;

    auto& cache = options.cache;
    cache.ast_enabled = config.get_as<bool>("runtime.cache.ast.enabled", true);
    cache.ast_max_items = config.get_as<std::size_t>("runtime.cache.ast.max_items", 128);
    cache.ast_ttl = std::chrono::seconds(config.get_as<long long>("runtime.cache.ast.ttl_seconds", 300));
    cache.expression_enabled = config.get_as<bool>("runtime.cache.expression.enabled", true);
    cache.expression_max_items = config.get_as<std::size_t>("runtime.cache.expression.max_items", 1024);

    auto& limits = options.limits;
    limits.max_call_depth = config.get_as<std::size_t>("runtime.limits.max_call_depth", 64);
    limits.max_steps = config.get_as<std::size_t>("runtime.limits.max_steps", 0);
    limits.max_duration = std::chrono::milliseconds(config.get_as<long long>("runtime.limits.max_duration_ms", 0));

    for (const auto& path : config.get_as<std::vector<std::string>>("runtime.components.paths")) {
        options.component_paths.emplace_back(path);
    }

    cache.ast_enabled = support::Env::flag("QUANTUM_AST_CACHE", cache.ast_enabled);
    cache.expression_enabled = support::Env::flag("QUANTUM_EXPRESSION_CACHE", cache.expression_enabled);
    return options;
}

} // namespace quantum::runtime
