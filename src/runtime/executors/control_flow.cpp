#include "executors.hpp"

#include <quantum/support/str.hpp>

#include <vector>

namespace quantum::runtime::executors {

namespace {

namespace str = support::str;

// One pass of the loop body in its own frame, with `<var>`, `<var>_count`
// and the optional index bound.
ExecResult iteration(Interpreter& in, const ast::LoopNode& loop, const Value& item, std::size_t position,
                     const Value* row = nullptr)
{
    in.tick(loop);
    auto& context = in.context();
    ExecutionContext::FrameGuard frame(context, FrameKind::Block);

    if (row && row->is_object()) {
        for (auto it = row->begin(); it != row->end(); ++it) context.declare(it.key(), *it);
        context.declare("currentRow", static_cast<std::int64_t>(position + 1));
    }
    context.declare(loop.var, item);
    context.declare(loop.var + "_count", static_cast<std::int64_t>(position + 1));
    if (!loop.index.empty()) context.declare(loop.index, static_cast<std::int64_t>(position));
    return in.execute_statements(loop.body);
}

ExecResult run_range(Interpreter& in, const ast::LoopNode& loop)
{
    auto from = integer_attribute(in, loop.from, "Loop 'from'");
    auto to = integer_attribute(in, loop.to, "Loop 'to'");
    auto step = integer_attribute(in, loop.step, "Loop 'step'");
    if (step == 0) throw core::ExecutionError("Loop step cannot be zero", loop.location);

    std::size_t position = 0;
    for (auto i = from; step > 0 ? i <= to : i >= to;) {
        auto result = iteration(in, loop, Value(i), position++);
        if (!result.is_continue()) return result;
        // the next value would leave the int64 range, so it is past `to` too
        if (__builtin_add_overflow(i, step, &i)) break;
    }
    return ExecResult::next();
}

std::vector<Value> sequence_of(const Value& items, const ast::LoopNode& loop)
{
    std::vector<Value> out;
    if (items.is_null()) return out;
    if (items.is_array() || items.is_object()) {
        for (const auto& item : items) out.push_back(item);
        return out;
    }
    if (items.is_string()) {
        const auto& text = items.get_ref<const std::string&>();
        if (str::is_blank(text)) return out;
        auto parsed = Value::parse(text, nullptr, false);
        if (!parsed.is_discarded() && (parsed.is_array() || parsed.is_object())) return sequence_of(parsed, loop);
    }
    throw core::ExecutionError("Loop items must be an array, got " + type_name(items), loop.location);
}

ExecResult run_sequence(Interpreter& in, const ast::LoopNode& loop, const std::vector<Value>& items)
{
    for (std::size_t i = 0; i < items.size(); ++i) {
        auto result = iteration(in, loop, items[i], i);
        if (!result.is_continue()) return result;
    }
    return ExecResult::next();
}

ExecResult run_list(Interpreter& in, const ast::LoopNode& loop)
{
    auto text = to_display(in.evaluate_text(loop.items));
    std::vector<Value> items;
    if (!str::is_blank(text)) {
        auto delimiter = loop.delimiter.empty() ? std::string(",") : loop.delimiter;
        for (auto& piece : str::split(text, delimiter)) {
            auto trimmed = str::trim(piece);
            if (!trimmed.empty()) items.emplace_back(trimmed);
        }
    }
    return run_sequence(in, loop, items);
}

ExecResult run_query(Interpreter& in, const ast::LoopNode& loop)
{
    auto rows = evaluate_attribute(in, loop.query);
    if (rows.is_null()) return ExecResult::next();
    if (!rows.is_array()) {
        throw core::ExecutionError("Loop query '" + loop.query + "' is not a result set", loop.location);
    }
    for (std::size_t i = 0; i < rows.size(); ++i) {
        auto result = iteration(in, loop, rows[i], i, &rows[i]);
        if (!result.is_continue()) return result;
    }
    return ExecResult::next();
}

ExecResult execute_loop(const ast::Node& node, Interpreter& in)
{
    const auto& loop = ast::node_cast<ast::LoopNode>(node);
    switch (loop.type) {
        case ast::LoopType::Range: return run_range(in, loop);
        case ast::LoopType::Array: return run_sequence(in, loop, sequence_of(evaluate_attribute(in, loop.items), loop));
        case ast::LoopType::List: return run_list(in, loop);
        case ast::LoopType::Query: return run_query(in, loop);
    }
    return ExecResult::next();
}

// Branch bodies share the enclosing frame, so names set inside a branch
// stay visible after the q:if.
ExecResult execute_if(const ast::Node& node, Interpreter& in)
{
    const auto& branch_node = ast::node_cast<ast::IfNode>(node);
    for (const auto& branch : branch_node.branches) {
        bool taken = false;
        try {
            taken = in.condition(branch.condition);
        } catch (const core::EvaluationError& e) {
            throw e.at(branch.location);
        }
        if (taken) return in.execute_statements(branch.body);
    }
    if (branch_node.has_else) return in.execute_statements(branch_node.else_body);
    return ExecResult::next();
}

ExecResult execute_return(const ast::Node& node, Interpreter& in)
{
    const auto& ret = ast::node_cast<ast::ReturnNode>(node);
    if (!ret.value) return ExecResult::returned(Value());
    return ExecResult::returned(in.evaluate_text(*ret.value));
}

} // namespace

void register_control_flow(ExecutorRegistry& registry)
{
    registry.register_executor(ast::NodeKind::Loop, execute_loop);
    registry.register_executor(ast::NodeKind::If, execute_if);
    registry.register_executor(ast::NodeKind::Return, execute_return);
}

} // namespace quantum::runtime::executors
