#include <quantum/ast/nodes.hpp>
#include <quantum/ast/source_unit.hpp>

#include <utility>

namespace quantum::ast {

std::string_view kind_name(NodeKind kind)
{
    switch (kind) {
        case NodeKind::Component: return "component";
        case NodeKind::Application: return "application";
        case NodeKind::Param: return "param";
        case NodeKind::Set: return "set";
        case NodeKind::Loop: return "loop";
        case NodeKind::If: return "if";
        case NodeKind::Function: return "function";
        case NodeKind::Return: return "return";
        case NodeKind::Import: return "import";
        case NodeKind::Slot: return "slot";
        case NodeKind::ComponentCall: return "component-call";
        case NodeKind::Html: return "html";
        case NodeKind::Text: return "text";
        case NodeKind::Query: return "query";
        case NodeKind::Redirect: return "redirect";
        case NodeKind::Flash: return "flash";
        case NodeKind::Log: return "log";
        case NodeKind::Dump: return "dump";
        case NodeKind::Mail: return "mail";
        case NodeKind::File: return "file";
        case NodeKind::Llm: return "llm";
        case NodeKind::Agent: return "agent";
        case NodeKind::Message: return "message";
    }
    return "unknown";
}

SourceUnit::SourceUnit(std::filesystem::path origin, std::shared_ptr<const Node> root)
    : origin_(std::move(origin)), root_(std::move(root))
{
    if (!root_ || (root_->kind != NodeKind::Component && root_->kind != NodeKind::Application)) {
        throw core::ParseError("A source unit must be rooted at a component or an application",
                               core::SourceLocation{origin_.string(), 1, 1});
    }
}

const ComponentNode& SourceUnit::component() const
{
    return node_cast<ComponentNode>(*root_);
}

const ApplicationNode& SourceUnit::application() const
{
    return node_cast<ApplicationNode>(*root_);
}

const std::string& SourceUnit::name() const
{
    return is_component() ? component().name : application().id;
}

const NodeList& SourceUnit::body() const
{
    return is_component() ? component().body : application().body;
}

} // namespace quantum::ast
