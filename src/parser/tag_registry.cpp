#include <quantum/parser/tag_registry.hpp>
#include <quantum/core/logger.hpp>

#include <algorithm>

namespace quantum::parser {

void TagRegistry::register_handler(std::string tag, Handler handler)
{
    if (handlers_.contains(tag)) {
        core::logger().warning("parser", "Overwriting handler for <" + tag + ">");
    }
    handlers_[std::move(tag)] = std::move(handler);
}

const TagRegistry::Handler* TagRegistry::find(std::string_view tag) const
{
    auto it = handlers_.find(std::string(tag));
    return it == handlers_.end() ? nullptr : &it->second;
}

bool TagRegistry::contains(std::string_view tag) const
{
    return find(tag) != nullptr;
}

std::vector<std::string> TagRegistry::tags() const
{
    std::vector<std::string> out;
    out.reserve(handlers_.size());
    for (const auto& [tag, handler] : handlers_) out.push_back(tag);
    std::sort(out.begin(), out.end());
    return out;
}

TagRegistry TagRegistry::with_builtin_tags()
{
    TagRegistry registry;
    register_builtin_tags(registry);
    return registry;
}

} // namespace quantum::parser
