#include "executors.hpp"

namespace quantum::runtime {

namespace executors {

Value evaluate_attribute(Interpreter& interpreter, const std::string& text)
{
    if (Interpolator::has_bindings(text)) return interpreter.evaluate_text(text);
    return interpreter.evaluate(text);
}

std::int64_t integer_attribute(Interpreter& interpreter, const std::string& text, const std::string& what)
{
    auto value = interpreter.evaluate_text(text);
    auto n = numeric_value(value);
    if (!n) throw core::ExecutionError(what + " must be a number, got '" + to_display(value) + "'");
    if (n->is_number_integer()) return n->get<std::int64_t>();
    auto exact = exact_integer(n->get<double>());
    if (!exact) throw core::ExecutionError(what + " must be an integer, got '" + to_display(value) + "'");
    return *exact;
}

} // namespace executors

void register_builtin_executors(ExecutorRegistry& registry)
{
    executors::register_control_flow(registry);
    executors::register_set(registry);
    executors::register_composition(registry);
    executors::register_markup(registry);
    executors::register_data(registry);
    executors::register_signals(registry);
    executors::register_integrations(registry);

    // q:component / q:application / q:param never appear as statements
    registry.set_fallback([](const ast::Node& node, Interpreter&) -> ExecResult {
        throw core::ExecutionError("Unexpected " + std::string(ast::kind_name(node.kind)) + " node in statement position",
                                   node.location);
    });
}

} // namespace quantum::runtime
