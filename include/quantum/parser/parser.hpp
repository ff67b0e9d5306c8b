#pragma once

#include <quantum/ast/source_unit.hpp>
#include <quantum/markup/reader.hpp>
#include <quantum/parser/tag_registry.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace quantum::parser {

// Per-parse helper handed to tag handlers: recursive child parsing, attribute
// checks and located errors for the file being parsed.
class ElementParser {
public:
    ElementParser(const TagRegistry& registry, std::string file, std::string default_name);

    ast::NodePtr parse_element(const markup::Element& element);

    // Statement context: whitespace-only text between elements is dropped,
    // any other text becomes a Text node in document order.
    ast::NodeList parse_children(const markup::Element& element);
    ast::NodeList parse_nodes(const std::vector<markup::XmlNode>& nodes, bool keep_whitespace);

    std::shared_ptr<const ast::ParamNode> parse_param(const markup::Element& element);

    std::string require(const markup::Element& element, std::string_view attr);
    [[noreturn]] void fail(const markup::Element& element, const std::string& message) const;
    core::SourceLocation location(const markup::Element& element) const;

    template<typename T>
    std::shared_ptr<T> make(const markup::Element& element) const {
        auto node = std::make_shared<T>();
        node->location = location(element);
        return node;
    }

    const std::string& file() const { return file_; }
    const std::string& default_name() const { return default_name_; }
    // Number of elements currently being parsed, the current one included.
    std::size_t depth() const { return depth_; }

private:
    ast::NodePtr parse_fallback(const markup::Element& element);

    const TagRegistry& registry_;
    std::string file_;
    std::string default_name_;
    std::size_t depth_ = 0;
};

// DSL source -> SourceUnit. Stateless after construction; safe to share
// between threads.
class Parser {
public:
    Parser();
    explicit Parser(std::shared_ptr<const TagRegistry> registry);

    // `origin` names the file in error locations and provides the default
    // component name (its stem).
    [[nodiscard]] ast::SourceUnitPtr parse(std::string_view source, const std::filesystem::path& origin = {}) const;
    [[nodiscard]] ast::SourceUnitPtr parse_file(const std::filesystem::path& path) const;

    const TagRegistry& registry() const { return *registry_; }

private:
    std::shared_ptr<const TagRegistry> registry_;
};

bool parse_bool(const std::string& value, bool fallback = false);

} // namespace quantum::parser
