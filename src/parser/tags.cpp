#include <quantum/parser/parser.hpp>
#include <quantum/parser/tag_registry.hpp>
#include <quantum/support/str.hpp>

#include <algorithm>
#include <cctype>
#include <set>

namespace quantum::parser {

using markup::Element;
namespace str = support::str;

namespace {

std::vector<std::string> split_list(const std::string& value)
{
    std::vector<std::string> out;
    for (auto& item : str::split(value, ",")) {
        auto trimmed = str::trim(item);
        if (!trimmed.empty()) out.push_back(trimmed);
    }
    return out;
}

// Named :placeholders in SQL text, skipping quoted literals and "::" casts.
std::vector<std::string> sql_placeholders(const std::string& sql)
{
    std::vector<std::string> names;
    char quote = 0;
    for (std::size_t i = 0; i < sql.size(); ++i) {
        char c = sql[i];
        if (quote) {
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            continue;
        }
        if (c != ':' || i + 1 >= sql.size()) continue;
        if (sql[i + 1] == ':') {
            ++i;
            continue;
        }
        if (i > 0 && sql[i - 1] == ':') continue;
        if (!std::isalpha(static_cast<unsigned char>(sql[i + 1])) && sql[i + 1] != '_') continue;

        std::size_t end = i + 1;
        while (end < sql.size() && (std::isalnum(static_cast<unsigned char>(sql[end])) || sql[end] == '_')) ++end;
        auto name = sql.substr(i + 1, end - i - 1);
        if (std::find(names.begin(), names.end(), name) == names.end()) names.push_back(name);
        i = end - 1;
    }
    return names;
}

// Tags that only make sense inside a parent handler.
TagRegistry::Handler misplaced(std::string parent)
{
    return [parent = std::move(parent)](const Element& element, ElementParser& parser) -> ast::NodePtr {
        parser.fail(element, "<" + element.name + "> is only valid inside <" + parent + ">");
    };
}

void require_root(const Element& element, ElementParser& parser)
{
    if (parser.depth() > 1) parser.fail(element, "<" + element.name + "> must be the root element");
}

ast::NodePtr parse_component(const Element& element, ElementParser& parser)
{
    require_root(element, parser);
    auto node = parser.make<ast::ComponentNode>(element);
    node->name = element.attr("name", parser.default_name());
    node->type = str::to_lower(element.attr("type", "html"));
    node->require_auth = parse_bool(element.attr("require_auth"), false);
    node->require_role = element.attr("require_role");
    node->interactive = parse_bool(element.attr("interactive"), false);

    std::set<std::string> seen;
    std::vector<markup::XmlNode> statements;
    for (const auto& child : element.children) {
        if (child.type == markup::XmlNode::ELEMENT && child.element->name == "q:param") {
            auto param = parser.parse_param(*child.element);
            if (!seen.insert(param->name).second) {
                parser.fail(*child.element, "Duplicate parameter '" + param->name + "'");
            }
            node->params.push_back(std::move(param));
            continue;
        }
        statements.push_back(child);
    }
    node->body = parser.parse_nodes(statements, false);
    return node;
}

ast::NodePtr parse_application(const Element& element, ElementParser& parser)
{
    require_root(element, parser);
    auto node = parser.make<ast::ApplicationNode>(element);
    node->id = parser.require(element, "id");
    node->type = str::to_lower(element.attr("type", "html"));

    std::vector<markup::XmlNode> statements;
    for (const auto& child : element.children) {
        if (child.type == markup::XmlNode::ELEMENT && child.element->name == "q:route") {
            const auto& route_el = *child.element;
            ast::RouteSpec route;
            route.path = parser.require(route_el, "path");
            route.component = parser.require(route_el, "component");
            route.method = str::to_upper(route_el.attr("method", "GET"));
            route.location = parser.location(route_el);
            node->routes.push_back(std::move(route));
            continue;
        }
        statements.push_back(child);
    }
    node->body = parser.parse_nodes(statements, false);
    return node;
}

ast::NodePtr parse_set(const Element& element, ElementParser& parser)
{
    auto node = parser.make<ast::SetNode>(element);
    node->name = parser.require(element, "name");
    if (element.has("value")) node->value = element.attr("value");
    node->type = str::to_lower(element.attr("type"));
    node->operation = element.attr("operation", "assign");
    node->scope = str::to_lower(element.attr("scope"));
    node->index = element.attr("index");
    node->key = element.attr("key");
    node->step = element.attr("step");
    node->source = element.attr("source");

    static const std::set<std::string> operations = {
        "assign", "increment", "decrement", "add", "multiply", "append", "prepend", "remove",
        "removeAt", "clear", "sort", "reverse", "unique", "merge", "setProperty", "deleteProperty",
        "clone", "uppercase", "lowercase", "trim"};
    if (!operations.contains(node->operation)) {
        parser.fail(element, "Unknown q:set operation '" + node->operation + "'");
    }
    static const std::set<std::string> scopes = {"", "local", "request", "session", "application", "component"};
    if (!scopes.contains(node->scope)) {
        parser.fail(element, "Unknown q:set scope '" + node->scope + "'");
    }

    auto& v = node->validation;
    v.required = parse_bool(element.attr("required"), false);
    v.nullable = parse_bool(element.attr("nullable"), true);
    v.pattern = element.attr("pattern");
    v.range = element.attr("range");
    v.enum_values = split_list(element.attr("enum"));
    v.min = element.attr("min");
    v.max = element.attr("max");
    v.minlength = element.attr("minlength");
    v.maxlength = element.attr("maxlength");
    return node;
}

ast::NodePtr parse_loop(const Element& element, ElementParser& parser)
{
    auto node = parser.make<ast::LoopNode>(element);

    if (element.has("query")) {
        node->type = ast::LoopType::Query;
        node->query = parser.require(element, "query");
        node->var = element.attr("var", node->query);
    } else {
        if (!element.has("var") || str::is_blank(element.attr("var"))) {
            parser.fail(element, "Loop requires 'var' attribute");
        }
        node->var = str::trim(element.attr("var"));
        auto type = str::to_lower(element.attr("type", "range"));
        if (type == "range") node->type = ast::LoopType::Range;
        else if (type == "array") node->type = ast::LoopType::Array;
        else if (type == "list") node->type = ast::LoopType::List;
        else if (type == "query") node->type = ast::LoopType::Query;
        else parser.fail(element, "Unknown loop type '" + type + "'");
    }

    node->from = element.attr("from");
    node->to = element.attr("to");
    node->step = element.attr("step", "1");
    node->items = element.attr("items");
    node->index = str::trim(element.attr("index"));
    node->delimiter = element.attr("delimiter", ",");

    switch (node->type) {
        case ast::LoopType::Range:
            parser.require(element, "from");
            parser.require(element, "to");
            break;
        case ast::LoopType::Array:
        case ast::LoopType::List:
            if (!element.has("items")) parser.fail(element, "Loop of type '" + element.attr("type") + "' requires 'items' attribute");
            break;
        case ast::LoopType::Query:
            if (node->query.empty()) {
                node->query = element.has("items") ? element.attr("items") : parser.require(element, "query");
            }
            break;
    }

    node->body = parser.parse_children(element);
    return node;
}

ast::NodePtr parse_if(const Element& element, ElementParser& parser)
{
    auto node = parser.make<ast::IfNode>(element);
    node->branches.push_back(ast::IfBranch{parser.require(element, "condition"), {}, parser.location(element)});

    // q:elseif / q:else open a new branch; their own children come first,
    // siblings that follow them belong to the same branch.
    ast::NodeList* current = &node->branches.back().body;
    for (const auto& child : element.children) {
        if (child.type == markup::XmlNode::ELEMENT) {
            const auto& el = *child.element;
            if (el.name == "q:elseif") {
                if (node->has_else) parser.fail(el, "<q:elseif> cannot follow <q:else>");
                node->branches.push_back(ast::IfBranch{parser.require(el, "condition"), parser.parse_children(el), parser.location(el)});
                current = &node->branches.back().body;
                continue;
            }
            if (el.name == "q:else") {
                if (node->has_else) parser.fail(el, "Duplicate <q:else>");
                node->has_else = true;
                node->else_body = parser.parse_children(el);
                current = &node->else_body;
                continue;
            }
        }
        for (auto& stmt : parser.parse_nodes(std::vector<markup::XmlNode>{child}, false)) {
            current->push_back(std::move(stmt));
        }
    }
    return node;
}

ast::NodePtr parse_function(const Element& element, ElementParser& parser)
{
    auto node = parser.make<ast::FunctionNode>(element);
    node->name = parser.require(element, "name");
    node->return_type = element.attr("returnType", "any");
    node->scope = element.attr("scope", "component");
    node->description = element.attr("description");

    std::set<std::string> seen;
    std::vector<markup::XmlNode> statements;
    for (const auto& child : element.children) {
        if (child.type == markup::XmlNode::ELEMENT && child.element->name == "q:param") {
            auto param = parser.parse_param(*child.element);
            if (!seen.insert(param->name).second) {
                parser.fail(*child.element, "Duplicate parameter '" + param->name + "' in function '" + node->name + "'");
            }
            node->params.push_back(std::move(param));
            continue;
        }
        if (child.type == markup::XmlNode::ELEMENT && child.element->name == "q:function") {
            parser.fail(*child.element, "Functions cannot be nested");
        }
        statements.push_back(child);
    }
    node->body = parser.parse_nodes(statements, false);
    return node;
}

ast::NodePtr parse_return(const Element& element, ElementParser& parser)
{
    auto node = parser.make<ast::ReturnNode>(element);
    if (element.has("value")) node->value = element.attr("value");
    return node;
}

ast::NodePtr parse_import(const Element& element, ElementParser& parser)
{
    auto node = parser.make<ast::ImportNode>(element);
    node->component = parser.require(element, "component");
    node->from = element.attr("from");
    node->alias = element.attr("as");
    return node;
}

ast::NodePtr parse_slot(const Element& element, ElementParser& parser)
{
    auto node = parser.make<ast::SlotNode>(element);
    node->name = element.attr("name", "default");
    node->fallback = parser.parse_children(element);
    return node;
}

ast::NodePtr parse_query(const Element& element, ElementParser& parser)
{
    auto node = parser.make<ast::QueryNode>(element);
    node->name = parser.require(element, "name");
    node->datasource = parser.require(element, "datasource");

    std::string sql;
    std::set<std::string> declared;
    for (const auto& child : element.children) {
        if (child.type == markup::XmlNode::TEXT) {
            sql += child.text;
            continue;
        }
        const auto& el = *child.element;
        if (el.name != "q:param") parser.fail(el, "<q:query> may only contain SQL text and <q:param>");

        ast::QueryParamSpec param;
        param.name = parser.require(el, "name");
        param.value = el.attr("value");
        param.type = str::to_lower(el.attr("type", "string"));
        param.null_when = el.attr("null");
        param.max_length = el.attr("maxLength");
        param.scale = el.attr("scale");
        param.location = parser.location(el);
        if (!declared.insert(param.name).second) parser.fail(el, "Duplicate query parameter '" + param.name + "'");
        node->params.push_back(std::move(param));
    }

    node->sql = str::trim(sql);
    if (node->sql.empty()) parser.fail(element, "Query '" + node->name + "' has no SQL");
    if (node->sql.find('{') != std::string::npos) {
        parser.fail(element, "Query '" + node->name + "' embeds {databinding} in SQL; bind values with <q:param>");
    }
    for (const auto& placeholder : sql_placeholders(node->sql)) {
        if (!declared.contains(placeholder)) {
            parser.fail(element, "Query '" + node->name + "' uses :" + placeholder + " but declares no <q:param name=\"" + placeholder + "\">");
        }
    }
    return node;
}

ast::NodePtr parse_redirect(const Element& element, ElementParser& parser)
{
    auto node = parser.make<ast::RedirectNode>(element);
    node->url = parser.require(element, "url");
    node->status = element.attr("status", "302");
    node->flash = element.attr("flash");
    return node;
}

ast::NodePtr parse_flash(const Element& element, ElementParser& parser)
{
    auto node = parser.make<ast::FlashNode>(element);
    node->type = element.attr("type", "info");
    node->message = element.attr("message", element.attr("text"));
    node->body = parser.parse_children(element);
    if (node->message.empty() && node->body.empty()) parser.fail(element, "<q:flash> needs a message");
    return node;
}

ast::NodePtr parse_log(const Element& element, ElementParser& parser)
{
    auto node = parser.make<ast::LogNode>(element);
    node->level = str::to_lower(element.attr("level", "info"));
    node->message = parser.require(element, "message");
    node->when = element.attr("when");
    node->context = element.attr("context");
    node->correlation_id = element.attr("correlationId");

    static const std::set<std::string> levels = {"trace", "debug", "info", "warning", "warn", "error", "critical"};
    if (!levels.contains(node->level)) parser.fail(element, "Unknown log level '" + node->level + "'");
    return node;
}

ast::NodePtr parse_dump(const Element& element, ElementParser& parser)
{
    auto node = parser.make<ast::DumpNode>(element);
    node->var = parser.require(element, "var");
    node->label = element.attr("label");
    node->when = element.attr("when");
    node->format = str::to_lower(element.attr("format", "json"));
    node->depth = element.attr("depth");
    return node;
}

ast::NodePtr parse_mail(const Element& element, ElementParser& parser)
{
    auto node = parser.make<ast::MailNode>(element);
    node->to = parser.require(element, "to");
    node->subject = parser.require(element, "subject");
    node->from = element.attr("from");
    node->cc = element.attr("cc");
    node->bcc = element.attr("bcc");
    node->reply_to = element.attr("replyTo");
    node->type = str::to_lower(element.attr("type", "html"));
    node->charset = element.attr("charset", "UTF-8");
    node->result = element.attr("result");
    node->body = parser.parse_nodes(element.children, true);
    return node;
}

ast::NodePtr parse_file(const Element& element, ElementParser& parser)
{
    auto node = parser.make<ast::FileNode>(element);
    node->action = str::to_lower(parser.require(element, "action"));
    node->file = parser.require(element, "file");
    node->variable = element.attr("variable", element.attr("result"));

    static const std::set<std::string> actions = {"read", "write", "append", "delete", "exists"};
    if (!actions.contains(node->action)) parser.fail(element, "Unknown q:file action '" + node->action + "'");
    if ((node->action == "read" || node->action == "exists") && node->variable.empty()) {
        parser.fail(element, "<q:file action=\"" + node->action + "\"> requires 'variable' attribute");
    }
    node->body = parser.parse_nodes(element.children, true);
    return node;
}

ast::NodePtr parse_llm(const Element& element, ElementParser& parser)
{
    auto node = parser.make<ast::LlmNode>(element);
    node->name = parser.require(element, "name");
    node->model = element.attr("model");
    node->endpoint = element.attr("endpoint");
    node->system = element.attr("system");
    node->temperature = element.attr("temperature");
    node->max_tokens = element.attr("maxTokens");
    node->response_format = str::to_lower(element.attr("responseFormat", "text"));
    node->prompt = parser.parse_nodes(element.children, true);
    if (node->prompt.empty() && element.has("prompt")) {
        auto text = parser.make<ast::TextNode>(element);
        text->text = element.attr("prompt");
        node->prompt.push_back(std::move(text));
    }
    if (node->prompt.empty()) parser.fail(element, "<q:llm> needs a prompt");
    return node;
}

ast::NodePtr parse_agent(const Element& element, ElementParser& parser)
{
    auto node = parser.make<ast::AgentNode>(element);
    node->name = parser.require(element, "name");
    node->model = element.attr("model");
    node->max_iterations = element.attr("maxIterations", "5");

    for (const auto* child : element.child_elements()) {
        if (child->name == "q:instruction") {
            node->instruction = parser.parse_nodes(child->children, true);
        } else if (child->name == "q:task") {
            node->task = parser.parse_nodes(child->children, true);
        } else if (child->name == "q:tool") {
            ast::AgentToolSpec tool;
            tool.name = parser.require(*child, "name");
            tool.description = child->attr("description");
            tool.location = parser.location(*child);
            std::vector<markup::XmlNode> statements;
            for (const auto& part : child->children) {
                if (part.type == markup::XmlNode::ELEMENT && part.element->name == "q:param") {
                    tool.params.push_back(parser.parse_param(*part.element));
                } else {
                    statements.push_back(part);
                }
            }
            tool.body = parser.parse_nodes(statements, false);
            node->tools.push_back(std::move(tool));
        } else {
            parser.fail(*child, "<q:agent> may only contain <q:instruction>, <q:task> and <q:tool>");
        }
    }
    if (node->task.empty()) parser.fail(element, "<q:agent> requires a <q:task>");
    return node;
}

ast::NodePtr parse_message(const Element& element, ElementParser& parser)
{
    auto node = parser.make<ast::MessageNode>(element);
    node->name = element.attr("name");
    node->topic = element.attr("topic");
    node->queue = element.attr("queue");
    node->type = str::to_lower(element.attr("type", "publish"));

    if (node->type != "publish" && node->type != "send") {
        parser.fail(element, "Unknown q:message type '" + node->type + "'");
    }
    if (node->type == "publish" && node->topic.empty()) parser.fail(element, "Publishing requires 'topic' attribute");
    if (node->type == "send" && node->queue.empty()) parser.fail(element, "Sending requires 'queue' attribute");

    bool explicit_body = false;
    std::vector<markup::XmlNode> loose;
    for (const auto& child : element.children) {
        if (child.type == markup::XmlNode::ELEMENT && child.element->name == "q:header") {
            node->headers.push_back(ast::MessageHeaderSpec{parser.require(*child.element, "name"), child.element->attr("value")});
        } else if (child.type == markup::XmlNode::ELEMENT && child.element->name == "q:body") {
            node->body = parser.parse_nodes(child.element->children, true);
            explicit_body = true;
        } else {
            loose.push_back(child);
        }
    }
    if (!explicit_body) node->body = parser.parse_nodes(loose, false);
    return node;
}

} // namespace

void register_builtin_tags(TagRegistry& registry)
{
    registry.register_handler("q:component", parse_component);
    registry.register_handler("q:application", parse_application);
    registry.register_handler("q:set", parse_set);
    registry.register_handler("q:loop", parse_loop);
    registry.register_handler("q:if", parse_if);
    registry.register_handler("q:function", parse_function);
    registry.register_handler("q:return", parse_return);
    registry.register_handler("q:import", parse_import);
    registry.register_handler("q:slot", parse_slot);
    registry.register_handler("q:query", parse_query);
    registry.register_handler("q:redirect", parse_redirect);
    registry.register_handler("q:flash", parse_flash);
    registry.register_handler("q:log", parse_log);
    registry.register_handler("q:dump", parse_dump);
    registry.register_handler("q:mail", parse_mail);
    registry.register_handler("q:file", parse_file);
    registry.register_handler("q:llm", parse_llm);
    registry.register_handler("q:agent", parse_agent);
    registry.register_handler("q:message", parse_message);

    registry.register_handler("q:elseif", misplaced("q:if"));
    registry.register_handler("q:else", misplaced("q:if"));
    registry.register_handler("q:param", misplaced("q:component, q:function or q:query"));
    registry.register_handler("q:route", misplaced("q:application"));
    registry.register_handler("q:header", misplaced("q:message"));
    registry.register_handler("q:body", misplaced("q:message"));
    registry.register_handler("q:tool", misplaced("q:agent"));
    registry.register_handler("q:instruction", misplaced("q:agent"));
    registry.register_handler("q:task", misplaced("q:agent"));
}

} // namespace quantum::parser
