#include <quantum/parser/parser.hpp>
#include <quantum/support/str.hpp>

#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>

namespace quantum::parser {

bool parse_bool(const std::string& value, bool fallback)
{
    auto lower = support::str::to_lower(support::str::trim(value));
    if (lower == "true" || lower == "1" || lower == "yes") return true;
    if (lower == "false" || lower == "0" || lower == "no") return false;
    return fallback;
}

// --- ElementParser ---

ElementParser::ElementParser(const TagRegistry& registry, std::string file, std::string default_name)
    : registry_(registry), file_(std::move(file)), default_name_(std::move(default_name))
{
}

core::SourceLocation ElementParser::location(const markup::Element& element) const
{
    return core::SourceLocation{file_, element.line, element.column};
}

void ElementParser::fail(const markup::Element& element, const std::string& message) const
{
    throw core::ParseError(message, location(element));
}

std::string ElementParser::require(const markup::Element& element, std::string_view attr)
{
    if (!element.has(attr)) {
        fail(element, "<" + element.name + "> requires '" + std::string(attr) + "' attribute");
    }
    auto value = element.attr(attr);
    if (support::str::is_blank(value)) {
        fail(element, "<" + element.name + "> attribute '" + std::string(attr) + "' must not be empty");
    }
    return value;
}

ast::NodePtr ElementParser::parse_element(const markup::Element& element)
{
    struct DepthGuard {
        std::size_t& depth;
        explicit DepthGuard(std::size_t& d) : depth(d) { ++depth; }
        ~DepthGuard() { --depth; }
    } guard(depth_);

    if (const auto* handler = registry_.find(element.name)) {
        return (*handler)(element, *this);
    }
    return parse_fallback(element);
}

ast::NodePtr ElementParser::parse_fallback(const markup::Element& element)
{
    // <UserCard .../> invokes a component; everything else is passthrough HTML
    if (element.prefix().empty() && !element.name.empty() && std::isupper(static_cast<unsigned char>(element.name[0]))) {
        auto node = make<ast::ComponentCallNode>(element);
        node->component = element.name;
        for (const auto& attr : element.attributes) {
            node->attributes.push_back(ast::AttributeSpec{attr.name, attr.value, attr.value.find('{') != std::string::npos});
        }
        node->children = parse_children(element);
        return node;
    }

    auto node = make<ast::HtmlNode>(element);
    node->tag = element.name;
    node->void_element = markup::is_void_element(element.name);
    for (const auto& attr : element.attributes) {
        node->attributes.push_back(ast::AttributeSpec{attr.name, attr.value, attr.value.find('{') != std::string::npos});
    }

    auto lower = support::str::to_lower(element.name);
    if (lower == "style" || lower == "script") {
        for (const auto& child : element.children) {
            auto text = std::make_shared<ast::TextNode>();
            text->location = core::SourceLocation{file_, child.line, child.column};
            text->raw = true;
            text->text = child.type == markup::XmlNode::TEXT ? child.text : std::string{};
            if (!text->text.empty()) node->children.push_back(std::move(text));
        }
    } else {
        node->children = parse_nodes(element.children, true);
    }
    return node;
}

ast::NodeList ElementParser::parse_children(const markup::Element& element)
{
    return parse_nodes(element.children, false);
}

ast::NodeList ElementParser::parse_nodes(const std::vector<markup::XmlNode>& nodes, bool keep_whitespace)
{
    ast::NodeList out;
    for (const auto& child : nodes) {
        if (child.type == markup::XmlNode::ELEMENT) {
            if (auto node = parse_element(*child.element)) out.push_back(std::move(node));
            continue;
        }
        if (!child.cdata && !keep_whitespace && support::str::is_blank(child.text)) continue;

        auto text = std::make_shared<ast::TextNode>();
        text->location = core::SourceLocation{file_, child.line, child.column};
        text->text = child.text;
        text->raw = child.cdata;
        out.push_back(std::move(text));
    }
    return out;
}

std::shared_ptr<const ast::ParamNode> ElementParser::parse_param(const markup::Element& element)
{
    auto param = make<ast::ParamNode>(element);
    param->name = require(element, "name");
    param->type = support::str::to_lower(element.attr("type", "any"));
    param->required = parse_bool(element.attr("required"), false);
    if (element.has("default")) param->default_value = element.attr("default");
    param->validate = element.attr("validate");
    param->min = element.attr("min");
    param->max = element.attr("max");
    param->description = element.attr("description");
    if (element.has("enum")) {
        for (auto& item : support::str::split(element.attr("enum"), ",")) {
            auto trimmed = support::str::trim(item);
            if (!trimmed.empty()) param->enum_values.push_back(trimmed);
        }
    }
    return param;
}

// --- Parser ---

Parser::Parser() : registry_(std::make_shared<const TagRegistry>(TagRegistry::with_builtin_tags())) {}

Parser::Parser(std::shared_ptr<const TagRegistry> registry) : registry_(std::move(registry)) {}

ast::SourceUnitPtr Parser::parse(std::string_view source, const std::filesystem::path& origin) const
{
    std::string file = origin.string();
    std::string default_name = origin.empty() ? std::string("anonymous") : origin.stem().string();

    markup::Reader reader(source, file);
    auto document = reader.read_document();

    ElementParser elements(*registry_, file, default_name);

    // A single q:component / q:application root is the normal form.
    const markup::Element* root = nullptr;
    bool stray_content = false;
    for (const auto& child : document->children) {
        if (child.type == markup::XmlNode::ELEMENT) {
            if (root) stray_content = true;
            root = child.element.get();
        } else if (child.cdata || !support::str::is_blank(child.text)) {
            stray_content = true;
        }
    }

    if (root && !stray_content && (root->name == "q:component" || root->name == "q:application")) {
        auto node = elements.parse_element(*root);
        return std::make_shared<const ast::SourceUnit>(origin, std::move(node));
    }

    // Bare fragment: wrap it in an anonymous component named after the file.
    auto component = std::make_shared<ast::ComponentNode>();
    component->location = core::SourceLocation{file, 1, 1};
    component->name = default_name;
    for (const auto& child : document->children) {
        if (child.type == markup::XmlNode::ELEMENT) {
            const auto& element = *child.element;
            if (element.name == "q:component" || element.name == "q:application") {
                elements.fail(element, "<" + element.name + "> must be the only root element");
            }
            if (element.name == "q:param") {
                component->params.push_back(elements.parse_param(element));
                continue;
            }
        }
        auto nodes = elements.parse_nodes(std::vector<markup::XmlNode>{child}, false);
        for (auto& node : nodes) component->body.push_back(std::move(node));
    }
    return std::make_shared<const ast::SourceUnit>(origin, std::move(component));
}

ast::SourceUnitPtr Parser::parse_file(const std::filesystem::path& path) const
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw core::ParseError("Cannot read component file '" + path.string() + "'", core::SourceLocation{path.string(), 0, 0});
    }
    std::ostringstream content;
    content << file.rdbuf();
    return parse(content.str(), path);
}

} // namespace quantum::parser
