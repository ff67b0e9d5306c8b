#include <quantum/runtime/expression_cache.hpp>

namespace quantum::runtime {

ExpressionCache::ExpressionCache(std::size_t max_items, bool enabled)
    : max_items_(max_items == 0 ? 1 : max_items), enabled_(enabled)
{
}

CompiledExpressionPtr ExpressionCache::compile(std::string_view text)
{
    auto key = CompiledExpression::normalize(text);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (enabled_) {
            auto it = entries_.find(key);
            if (it != entries_.end()) {
                ++stats_.hits;
                lru_.splice(lru_.begin(), lru_, it->second.position);
                return it->second.expression;
            }
        }
        ++stats_.misses;
        ++stats_.compilations;
    }

    // compile outside the lock; syntax errors propagate and nothing is stored
    auto compiled = CompiledExpression::compile(text);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!enabled_) return compiled;

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.expression = compiled;
        lru_.splice(lru_.begin(), lru_, it->second.position);
        return compiled;
    }
    lru_.push_front(key);
    entries_.emplace(key, Entry{compiled, lru_.begin()});
    evict_locked();
    stats_.entries = entries_.size();
    return compiled;
}

Value ExpressionCache::evaluate(std::string_view text, ExpressionEnvironment& env)
{
    return compile(text)->evaluate(env);
}

void ExpressionCache::evict_locked()
{
    while (entries_.size() > max_items_ && !lru_.empty()) {
        entries_.erase(lru_.back());
        lru_.pop_back();
        ++stats_.evictions;
    }
}

void ExpressionCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lru_.clear();
    stats_.entries = 0;
}

void ExpressionCache::set_enabled(bool enabled)
{
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_ = enabled;
    if (!enabled_) {
        entries_.clear();
        lru_.clear();
        stats_.entries = 0;
    }
}

bool ExpressionCache::enabled() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_;
}

void ExpressionCache::set_max_items(std::size_t max_items)
{
    std::lock_guard<std::mutex> lock(mutex_);
    max_items_ = max_items == 0 ? 1 : max_items;
    evict_locked();
    stats_.entries = entries_.size();
}

ExpressionCacheStats ExpressionCache::stats() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto out = stats_;
    out.entries = entries_.size();
    return out;
}

} // namespace quantum::runtime
