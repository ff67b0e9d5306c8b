#include "executors.hpp"

#include <quantum/core/logger.hpp>
#include <quantum/runtime/services.hpp>
#include <quantum/support/str.hpp>

namespace quantum::runtime::executors {

namespace {

namespace str = support::str;

bool gate_open(Interpreter& in, const std::string& when)
{
    return when.empty() || is_truthy(evaluate_attribute(in, when));
}

ExecResult execute_redirect(const ast::Node& node, Interpreter& in)
{
    const auto& redirect = ast::node_cast<ast::RedirectNode>(node);

    auto url = in.interpolate(redirect.url);
    if (str::is_blank(url)) throw core::ExecutionError("Redirect URL is empty", redirect.location);

    auto status = integer_attribute(in, redirect.status, "Redirect status");
    if (status < 300 || status > 399) {
        throw core::ExecutionError("Redirect status " + std::to_string(status) + " is not a 3xx code", redirect.location);
    }

    if (!redirect.flash.empty()) in.add_flash(FlashMessage{"info", in.interpolate(redirect.flash)});
    return ExecResult::redirect(url, static_cast<int>(status));
}

ExecResult execute_flash(const ast::Node& node, Interpreter& in)
{
    const auto& flash = ast::node_cast<ast::FlashNode>(node);
    auto message = flash.message.empty() ? str::trim(in.render(flash.body)) : in.interpolate(flash.message);
    auto type = in.interpolate(flash.type);
    in.add_flash(FlashMessage{type.empty() ? std::string("info") : type, message});
    return ExecResult::next();
}

ExecResult execute_log(const ast::Node& node, Interpreter& in)
{
    const auto& log = ast::node_cast<ast::LogNode>(node);
    if (!gate_open(in, log.when)) return ExecResult::next();

    auto message = in.interpolate(log.message);
    Value context = log.context.empty() ? Value() : evaluate_attribute(in, log.context);
    auto correlation_id = in.interpolate(log.correlation_id);

    auto service = in.services().find<LogService>();
    if (!service) service = std::make_shared<ConsoleLogService>();
    service->log(log.level, message, context, correlation_id);
    return ExecResult::next();
}

// Containers nested deeper than `depth` collapse to a marker.
Value truncate(const Value& value, std::int64_t depth)
{
    if (!value.is_array() && !value.is_object()) return value;
    if (depth <= 0) return value.is_array() ? Value("[...]") : Value("{...}");

    Value out = value.is_array() ? Value::array() : Value::object();
    if (value.is_array()) {
        for (const auto& item : value) out.push_back(truncate(item, depth - 1));
    } else {
        for (auto it = value.begin(); it != value.end(); ++it) out[it.key()] = truncate(*it, depth - 1);
    }
    return out;
}

ExecResult execute_dump(const ast::Node& node, Interpreter& in)
{
    const auto& dump = ast::node_cast<ast::DumpNode>(node);
    if (!gate_open(in, dump.when)) return ExecResult::next();

    auto value = evaluate_attribute(in, dump.var);
    if (!dump.depth.empty()) value = truncate(value, integer_attribute(in, dump.depth, "Dump depth"));

    auto text = str::to_lower(dump.format) == "text" ? to_display(value) : value.dump(2);
    auto label = dump.label.empty() ? dump.var : in.interpolate(dump.label);

    in.emit("<pre class=\"q-dump\"><strong>" + str::html_escape(label) + "</strong>\n" + str::html_escape(text) + "</pre>");
    core::logger().debug("dump", label + " = " + text);
    return ExecResult::next();
}

} // namespace

void register_signals(ExecutorRegistry& registry)
{
    registry.register_executor(ast::NodeKind::Redirect, execute_redirect);
    registry.register_executor(ast::NodeKind::Flash, execute_flash);
    registry.register_executor(ast::NodeKind::Log, execute_log);
    registry.register_executor(ast::NodeKind::Dump, execute_dump);
}

} // namespace quantum::runtime::executors
