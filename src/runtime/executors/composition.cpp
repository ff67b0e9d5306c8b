#include "executors.hpp"

#include <filesystem>

namespace quantum::runtime::executors {

namespace {

ExecResult execute_function(const ast::Node& node, Interpreter& in)
{
    in.define_function(ast::node_cast<ast::FunctionNode>(node));
    return ExecResult::next();
}

ExecResult execute_import(const ast::Node& node, Interpreter& in)
{
    const auto& import = ast::node_cast<ast::ImportNode>(node);

    std::filesystem::path file = in.current_directory();
    if (!import.from.empty()) file /= import.from;
    file /= import.component;
    if (file.extension().string() != ComponentResolver::extension) file += ComponentResolver::extension;

    if (!std::filesystem::exists(file)) {
        throw core::ExecutionError("Cannot import component '" + import.component + "' from '" + file.string() + "'",
                                   import.location);
    }
    in.bind_import(import.binding(), in.components().load(file));
    return ExecResult::next();
}

// Caller attributes: a sole {expr} passes its raw value, mixed text passes
// the interpolated string, plain text passes as-is.
Value call_arguments(Interpreter& in, const ast::ComponentCallNode& call)
{
    Value args = Value::object();
    for (const auto& attribute : call.attributes) {
        if (!attribute.dynamic) {
            args[attribute.name] = attribute.value;
        } else if (Interpolator::sole_expression(attribute.value)) {
            args[attribute.name] = in.evaluate_text(attribute.value);
        } else {
            args[attribute.name] = in.interpolate(attribute.value);
        }
    }
    return args;
}

ExecResult execute_component_call(const ast::Node& node, Interpreter& in)
{
    const auto& call = ast::node_cast<ast::ComponentCallNode>(node);

    auto unit = in.find_component(call.component);
    if (!unit) throw core::ExecutionError("Component '" + call.component + "' not found", call.location);

    auto args = call_arguments(in, call);

    // slot content is rendered eagerly, in the caller's scope; a redirect or
    // return in it ends the caller before the callee runs
    std::optional<std::string> slot;
    if (!call.children.empty()) {
        auto captured = in.capture(call.children);
        if (captured.result.is_error()) captured.result.rethrow();
        if (!captured.result.is_continue()) {
            in.emit(std::move(captured.text));
            return captured.result;
        }
        slot = std::move(captured.text);
    }

    auto result = in.invoke_component(unit, args, std::move(slot));
    if (result.is_return()) return ExecResult::next();
    return result;
}

ExecResult execute_slot(const ast::Node& node, Interpreter& in)
{
    const auto& slot = ast::node_cast<ast::SlotNode>(node);
    const auto& content = in.slot_content();
    if (content) {
        in.emit(*content);
        return ExecResult::next();
    }
    return in.execute_block(slot.fallback);
}

} // namespace

void register_composition(ExecutorRegistry& registry)
{
    registry.register_executor(ast::NodeKind::Function, execute_function);
    registry.register_executor(ast::NodeKind::Import, execute_import);
    registry.register_executor(ast::NodeKind::ComponentCall, execute_component_call);
    registry.register_executor(ast::NodeKind::Slot, execute_slot);
}

} // namespace quantum::runtime::executors
