#pragma once

#include <quantum/runtime/expression.hpp>

#include <cstddef>
#include <list>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace quantum::runtime {

struct ExpressionCacheStats {
    std::size_t hits = 0;
    std::size_t misses = 0;
    std::size_t compilations = 0;
    std::size_t evictions = 0;
    std::size_t entries = 0;
};

// LRU of compiled expressions keyed by normalized text. Only compiled forms
// are stored, never results. Thread-safe; two threads missing on the same
// text may both compile and the last insert wins.
class ExpressionCache {
public:
    explicit ExpressionCache(std::size_t max_items = 1024, bool enabled = true);

    CompiledExpressionPtr compile(std::string_view text);

    // compile + evaluate in one step
    Value evaluate(std::string_view text, ExpressionEnvironment& env);

    void clear();
    void set_enabled(bool enabled);
    bool enabled() const;
    void set_max_items(std::size_t max_items);

    [[nodiscard]] ExpressionCacheStats stats() const;

private:
    void evict_locked();

    struct Entry {
        CompiledExpressionPtr expression;
        std::list<std::string>::iterator position;
    };

    mutable std::mutex mutex_;
    std::list<std::string> lru_; // front = most recently used
    std::unordered_map<std::string, Entry> entries_;
    std::size_t max_items_;
    bool enabled_;
    ExpressionCacheStats stats_;
};

} // namespace quantum::runtime
