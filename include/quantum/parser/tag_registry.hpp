#pragma once

#include <quantum/ast/nodes.hpp>
#include <quantum/markup/reader.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace quantum::parser {

class ElementParser;

// Maps a tag name ("q:loop") to the handler that turns the element into a
// node. Built once; lookups are read-only afterwards.
class TagRegistry {
public:
    using Handler = std::function<ast::NodePtr(const markup::Element&, ElementParser&)>;

    // Replacing an existing handler is allowed but logged.
    void register_handler(std::string tag, Handler handler);

    [[nodiscard]] const Handler* find(std::string_view tag) const;
    [[nodiscard]] bool contains(std::string_view tag) const;
    [[nodiscard]] std::vector<std::string> tags() const;

    // Registry preloaded with every q: tag the runtime understands.
    static TagRegistry with_builtin_tags();

private:
    std::unordered_map<std::string, Handler> handlers_;
};

// Defined alongside the handlers in src/parser/tags.cpp.
void register_builtin_tags(TagRegistry& registry);

} // namespace quantum::parser
