#include "executors.hpp"

#include <quantum/support/str.hpp>

namespace quantum::runtime::executors {

namespace {

namespace str = support::str;

std::string render_attributes(Interpreter& in, const ast::HtmlNode& html)
{
    std::string out;
    for (const auto& attribute : html.attributes) {
        if (!attribute.dynamic) {
            out += " " + attribute.name + "=\"" + str::html_escape(attribute.value) + "\"";
            continue;
        }
        if (Interpolator::sole_expression(attribute.value)) {
            auto value = in.evaluate_text(attribute.value);
            // disabled="{locked}": false and null drop the attribute, true keeps it bare
            if (value.is_null() || (value.is_boolean() && !value.get<bool>())) continue;
            if (value.is_boolean()) {
                out += " " + attribute.name;
                continue;
            }
            out += " " + attribute.name + "=\"" + str::html_escape(to_display(value)) + "\"";
            continue;
        }
        out += " " + attribute.name + "=\"" + str::html_escape(in.interpolate(attribute.value)) + "\"";
    }
    return out;
}

ExecResult execute_html(const ast::Node& node, Interpreter& in)
{
    const auto& html = ast::node_cast<ast::HtmlNode>(node);
    auto attributes = render_attributes(in, html);

    if (html.void_element && html.children.empty()) {
        in.emit("<" + html.tag + attributes + " />");
        return ExecResult::next();
    }

    in.emit("<" + html.tag + attributes + ">");
    auto result = in.execute_statements(html.children);
    // a Return or Redirect from inside still leaves the element closed
    if (!result.is_error()) in.emit("</" + html.tag + ">");
    return result;
}

ExecResult execute_text(const ast::Node& node, Interpreter& in)
{
    const auto& text = ast::node_cast<ast::TextNode>(node);
    if (text.raw) {
        in.emit(text.text);
    } else {
        in.emit(str::html_escape(in.interpolate(text.text)));
    }
    return ExecResult::next();
}

} // namespace

void register_markup(ExecutorRegistry& registry)
{
    registry.register_executor(ast::NodeKind::Html, execute_html);
    registry.register_executor(ast::NodeKind::Text, execute_text);
}

} // namespace quantum::runtime::executors
