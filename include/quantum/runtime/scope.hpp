#pragma once

#include <quantum/runtime/value.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace quantum::runtime {

// Application- or session-wide variables. Owned by the host and shared by
// every request that runs against it, so every access takes the lock. The
// mutex is recursive: a q:set holding the scope lock still reads and writes
// through the ordinary accessors.
class SharedScope {
public:
    SharedScope() : values_(Value::object()) {}
    explicit SharedScope(Value initial);

    // `path` may be nested ("cart.items"). Missing paths return nullopt.
    std::optional<Value> get(const std::string& path) const;
    // Creates intermediate objects as needed.
    void set(const std::string& path, Value value);
    bool erase(const std::string& path);
    bool contains(const std::string& path) const;

    Value snapshot() const;
    void clear();

    std::recursive_mutex& mutex() const { return mutex_; }

private:
    mutable std::recursive_mutex mutex_;
    Value values_;
};

using SharedScopePtr = std::shared_ptr<SharedScope>;

// "a.b.c" -> {"a","b","c"}
std::vector<std::string> split_path(const std::string& path);

// Walks `path` below `root`; nullopt when a segment is missing.
std::optional<Value> read_path(const Value& root, const std::vector<std::string>& path, std::size_t first = 0);

// Writes `value` at `path` below `root`, turning null or scalar segments into objects.
void write_path(Value& root, const std::vector<std::string>& path, Value value, std::size_t first = 0);

} // namespace quantum::runtime
