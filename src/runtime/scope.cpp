#include <quantum/runtime/scope.hpp>
#include <quantum/support/str.hpp>

#include <utility>

namespace quantum::runtime {

std::vector<std::string> split_path(const std::string& path)
{
    return support::str::split(path, ".");
}

std::optional<Value> read_path(const Value& root, const std::vector<std::string>& path, std::size_t first)
{
    const Value* current = &root;
    Value holder;
    for (std::size_t i = first; i < path.size(); ++i) {
        auto next = member(*current, path[i]);
        if (!next) return std::nullopt;
        holder = std::move(*next);
        current = &holder;
    }
    return *current;
}

void write_path(Value& root, const std::vector<std::string>& path, Value value, std::size_t first)
{
    if (first >= path.size()) {
        root = std::move(value);
        return;
    }
    Value* current = &root;
    for (std::size_t i = first; i + 1 < path.size(); ++i) {
        if (current->is_array()) {
            auto index = numeric_value(Value(path[i]));
            if (index && index->is_number_integer() && index->get<std::int64_t>() >= 0) {
                auto pos = static_cast<std::size_t>(index->get<std::int64_t>());
                while (current->size() <= pos) current->push_back(nullptr);
                current = &(*current)[pos];
                continue;
            }
        }
        if (!current->is_object()) *current = Value::object();
        current = &(*current)[path[i]];
    }
    const auto& leaf = path.back();
    if (current->is_array()) {
        auto index = numeric_value(Value(leaf));
        if (index && index->is_number_integer() && index->get<std::int64_t>() >= 0) {
            auto pos = static_cast<std::size_t>(index->get<std::int64_t>());
            while (current->size() <= pos) current->push_back(nullptr);
            (*current)[pos] = std::move(value);
            return;
        }
    }
    if (!current->is_object()) *current = Value::object();
    (*current)[leaf] = std::move(value);
}

SharedScope::SharedScope(Value initial) : values_(initial.is_object() ? std::move(initial) : Value::object()) {}

std::optional<Value> SharedScope::get(const std::string& path) const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return read_path(values_, split_path(path));
}

void SharedScope::set(const std::string& path, Value value)
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    write_path(values_, split_path(path), std::move(value));
}

bool SharedScope::erase(const std::string& path)
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto parts = split_path(path);
    Value* current = &values_;
    for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!current->is_object() || !current->contains(parts[i])) return false;
        current = &(*current)[parts[i]];
    }
    if (!current->is_object()) return false;
    return current->erase(parts.back()) > 0;
}

bool SharedScope::contains(const std::string& path) const
{
    return get(path).has_value();
}

Value SharedScope::snapshot() const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return values_;
}

void SharedScope::clear()
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    values_ = Value::object();
}

} // namespace quantum::runtime
