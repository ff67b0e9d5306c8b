// include/quantum/ast/source_unit.hpp
#pragma once
#include <quantum/ast/nodes.hpp>

#include <filesystem>
#include <memory>
#include <string>

namespace quantum::ast {

// One parsed file: a component or an application definition. Immutable once
// built, so a single instance is shared by every request through the cache.
class SourceUnit {
public:
    SourceUnit(std::filesystem::path origin, std::shared_ptr<const Node> root);

    const std::filesystem::path& origin() const { return origin_; }
    const Node& root() const { return *root_; }

    bool is_component() const { return root_->kind == NodeKind::Component; }
    bool is_application() const { return root_->kind == NodeKind::Application; }

    // Throws core::ExecutionError when the unit is of the other kind.
    const ComponentNode& component() const;
    const ApplicationNode& application() const;

    const std::string& name() const;
    const NodeList& body() const;

private:
    std::filesystem::path origin_;
    std::shared_ptr<const Node> root_;
};

using SourceUnitPtr = std::shared_ptr<const SourceUnit>;

} // namespace quantum::ast
