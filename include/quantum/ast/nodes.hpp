// include/quantum/ast/nodes.hpp
#pragma once
#include <quantum/core/errors.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quantum::ast {

using core::SourceLocation;

// Closed set of node variants. A new tag means a new kind, a new node struct
// and a new executor; existing variants do not change.
enum class NodeKind {
    Component,
    Application,
    Param,
    Set,
    Loop,
    If,
    Function,
    Return,
    Import,
    Slot,
    ComponentCall,
    Html,
    Text,
    Query,
    Redirect,
    Flash,
    Log,
    Dump,
    Mail,
    File,
    Llm,
    Agent,
    Message,
};

std::string_view kind_name(NodeKind kind);

struct Node;
using NodePtr = std::shared_ptr<const Node>;
using NodeList = std::vector<NodePtr>;

struct Node {
    explicit Node(NodeKind k) : kind(k) {}
    virtual ~Node() = default;

    // Statement lists owned by this node, in document order. Leaves own none.
    virtual std::vector<const NodeList*> bodies() const { return {}; }

    const NodeKind kind;
    SourceLocation location;
};

template<NodeKind K>
struct NodeOf : Node {
    static constexpr NodeKind node_kind = K;
    NodeOf() : Node(K) {}
};

// Checked downcast; executors use it after dispatch on kind.
template<typename T>
const T& node_cast(const Node& node)
{
    if (node.kind != T::node_kind) {
        throw core::ExecutionError("Expected " + std::string(kind_name(T::node_kind)) + " node, got " +
                                   std::string(kind_name(node.kind)), node.location);
    }
    return static_cast<const T&>(node);
}

// Attribute of a passthrough element or a component call. `dynamic` is set
// when the value contains a {...} binding.
struct AttributeSpec {
    std::string name;
    std::string value;
    bool dynamic = false;
};

struct ParamNode : NodeOf<NodeKind::Param> {
    std::string name;
    std::string type = "any";
    bool required = false;
    std::optional<std::string> default_value;
    std::string validate;
    std::string min;
    std::string max;
    std::vector<std::string> enum_values;
    std::string description;
};

using ParamList = std::vector<std::shared_ptr<const ParamNode>>;

struct ComponentNode : NodeOf<NodeKind::Component> {
    std::string name;
    std::string type = "html";
    bool require_auth = false;
    std::string require_role;
    bool interactive = false;
    ParamList params;
    NodeList body;

    std::vector<const NodeList*> bodies() const override { return {&body}; }
};

struct RouteSpec {
    std::string path;
    std::string component;
    std::string method = "GET";
    SourceLocation location;
};

struct ApplicationNode : NodeOf<NodeKind::Application> {
    std::string id;
    std::string type = "html";
    std::vector<RouteSpec> routes;
    NodeList body;

    std::vector<const NodeList*> bodies() const override { return {&body}; }
};

struct TextNode : NodeOf<NodeKind::Text> {
    std::string text;
    // CDATA and <style>/<script> bodies are emitted without databinding.
    bool raw = false;
};

struct HtmlNode : NodeOf<NodeKind::Html> {
    std::string tag;
    std::vector<AttributeSpec> attributes;
    NodeList children;
    bool void_element = false;

    std::vector<const NodeList*> bodies() const override { return {&children}; }
};

struct SetValidation {
    bool required = false;
    bool nullable = true;
    std::string pattern;
    std::string range;
    std::vector<std::string> enum_values;
    std::string min;
    std::string max;
    std::string minlength;
    std::string maxlength;

    bool empty() const
    {
        return !required && nullable && pattern.empty() && range.empty() && enum_values.empty() &&
               min.empty() && max.empty() && minlength.empty() && maxlength.empty();
    }
};

struct SetNode : NodeOf<NodeKind::Set> {
    std::string name;
    std::optional<std::string> value;
    std::string type;
    std::string operation = "assign";
    std::string scope;
    std::string index;
    std::string key;
    std::string step;
    std::string source;
    SetValidation validation;
};

enum class LoopType { Range, Array, List, Query };

struct LoopNode : NodeOf<NodeKind::Loop> {
    LoopType type = LoopType::Range;
    std::string var;
    std::string from;
    std::string to;
    std::string step = "1";
    std::string items;
    std::string index;
    std::string delimiter = ",";
    std::string query;
    NodeList body;

    std::vector<const NodeList*> bodies() const override { return {&body}; }
};

struct IfBranch {
    std::string condition;
    NodeList body;
    SourceLocation location;
};

struct IfNode : NodeOf<NodeKind::If> {
    // branches[0] is the q:if itself, the rest are q:elseif in order
    std::vector<IfBranch> branches;
    bool has_else = false;
    NodeList else_body;

    std::vector<const NodeList*> bodies() const override
    {
        std::vector<const NodeList*> out;
        for (const auto& branch : branches) out.push_back(&branch.body);
        if (has_else) out.push_back(&else_body);
        return out;
    }
};

struct FunctionNode : NodeOf<NodeKind::Function> {
    std::string name;
    std::string return_type = "any";
    std::string scope = "component";
    std::string description;
    ParamList params;
    NodeList body;

    std::vector<const NodeList*> bodies() const override { return {&body}; }
};

struct ReturnNode : NodeOf<NodeKind::Return> {
    std::optional<std::string> value;
};

struct ImportNode : NodeOf<NodeKind::Import> {
    std::string component;
    std::string from;
    std::string alias;

    const std::string& binding() const { return alias.empty() ? component : alias; }
};

struct SlotNode : NodeOf<NodeKind::Slot> {
    std::string name = "default";
    NodeList fallback;

    std::vector<const NodeList*> bodies() const override { return {&fallback}; }
};

struct ComponentCallNode : NodeOf<NodeKind::ComponentCall> {
    std::string component;
    std::vector<AttributeSpec> attributes;
    NodeList children;

    std::vector<const NodeList*> bodies() const override { return {&children}; }
};

struct QueryParamSpec {
    std::string name;
    std::string value;
    std::string type = "string";
    std::string null_when;
    std::string max_length;
    std::string scale;
    SourceLocation location;
};

struct QueryNode : NodeOf<NodeKind::Query> {
    std::string name;
    std::string datasource;
    std::string sql;
    std::vector<QueryParamSpec> params;
};

struct RedirectNode : NodeOf<NodeKind::Redirect> {
    std::string url;
    std::string status = "302";
    std::string flash;
};

struct FlashNode : NodeOf<NodeKind::Flash> {
    std::string type = "info";
    std::string message;
    NodeList body;

    std::vector<const NodeList*> bodies() const override { return {&body}; }
};

struct LogNode : NodeOf<NodeKind::Log> {
    std::string level = "info";
    std::string message;
    std::string when;
    std::string context;
    std::string correlation_id;
};

struct DumpNode : NodeOf<NodeKind::Dump> {
    std::string var;
    std::string label;
    std::string when;
    std::string format = "json";
    std::string depth;
};

struct MailNode : NodeOf<NodeKind::Mail> {
    std::string to;
    std::string subject;
    std::string from;
    std::string cc;
    std::string bcc;
    std::string reply_to;
    std::string type = "html";
    std::string charset = "UTF-8";
    std::string result;
    NodeList body;

    std::vector<const NodeList*> bodies() const override { return {&body}; }
};

struct FileNode : NodeOf<NodeKind::File> {
    std::string action;
    std::string file;
    std::string variable;
    NodeList body;

    std::vector<const NodeList*> bodies() const override { return {&body}; }
};

struct LlmNode : NodeOf<NodeKind::Llm> {
    std::string name;
    std::string model;
    std::string endpoint;
    std::string system;
    std::string temperature;
    std::string max_tokens;
    std::string response_format;
    NodeList prompt;

    std::vector<const NodeList*> bodies() const override { return {&prompt}; }
};

struct AgentToolSpec {
    std::string name;
    std::string description;
    ParamList params;
    NodeList body;
    SourceLocation location;
};

struct AgentNode : NodeOf<NodeKind::Agent> {
    std::string name;
    std::string model;
    std::string max_iterations = "5";
    NodeList instruction;
    NodeList task;
    std::vector<AgentToolSpec> tools;

    std::vector<const NodeList*> bodies() const override
    {
        std::vector<const NodeList*> out{&instruction, &task};
        for (const auto& tool : tools) out.push_back(&tool.body);
        return out;
    }
};

struct MessageHeaderSpec {
    std::string name;
    std::string value;
};

struct MessageNode : NodeOf<NodeKind::Message> {
    std::string name;
    std::string topic;
    std::string queue;
    std::string type = "publish";
    std::vector<MessageHeaderSpec> headers;
    NodeList body;

    std::vector<const NodeList*> bodies() const override { return {&body}; }
};

} // namespace quantum::ast
