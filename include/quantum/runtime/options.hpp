#pragma once

#include <quantum/core/config.hpp>
#include <quantum/runtime/interpreter.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <vector>

namespace quantum::runtime {

struct CacheOptions {
    bool ast_enabled = true;
    std::size_t ast_max_items = 128;
    std::chrono::seconds ast_ttl{300};
    bool expression_enabled = true;
    std::size_t expression_max_items = 1024;
};

struct RuntimeOptions {
    CacheOptions cache;
    ExecutionLimits limits;
    std::vector<std::filesystem::path> component_paths;

    // Reads the runtime.* keys, then applies the QUANTUM_AST_CACHE and
    // QUANTUM_EXPRESSION_CACHE environment switches.
    static RuntimeOptions from_config(const core::Config& config);
};

} // namespace quantum::runtime
