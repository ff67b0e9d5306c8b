#include "executors.hpp"

#include <quantum/runtime/services.hpp>
#include <quantum/support/str.hpp>

namespace quantum::runtime::executors {

namespace {

namespace str = support::str;

// Body text handed to a collaborator: text nodes are interpolated without
// HTML escaping, anything else renders as markup.
std::string plain_text(Interpreter& in, const ast::NodeList& nodes)
{
    std::string out;
    for (const auto& node : nodes) {
        if (node->kind == ast::NodeKind::Text) {
            const auto& text = ast::node_cast<ast::TextNode>(*node);
            out += text.raw ? text.text : in.interpolate(text.text);
        } else {
            out += in.render(ast::NodeList{node});
        }
    }
    return str::trim(out);
}

ExecResult execute_mail(const ast::Node& node, Interpreter& in)
{
    const auto& mail = ast::node_cast<ast::MailNode>(node);
    auto service = require_service<MailService>(in, "MailService");

    MailMessage message;
    message.to = in.interpolate(mail.to);
    message.subject = in.interpolate(mail.subject);
    message.from = in.interpolate(mail.from);
    message.cc = in.interpolate(mail.cc);
    message.bcc = in.interpolate(mail.bcc);
    message.reply_to = in.interpolate(mail.reply_to);
    message.type = mail.type;
    message.charset = mail.charset;
    message.body = mail.type == "html" ? str::trim(in.render(mail.body)) : plain_text(in, mail.body);

    if (str::is_blank(message.to)) throw core::ExecutionError("Mail recipient is empty", mail.location);
    service->send(message);

    if (!mail.result.empty()) in.context().assign(mail.result, true);
    return ExecResult::next();
}

ExecResult execute_file(const ast::Node& node, Interpreter& in)
{
    const auto& file = ast::node_cast<ast::FileNode>(node);
    auto service = require_service<FileService>(in, "FileService");
    auto path = in.interpolate(file.file);
    auto& context = in.context();

    if (file.action == "read") {
        context.assign(file.variable, service->read(path));
    } else if (file.action == "write" || file.action == "append") {
        auto content = plain_text(in, file.body);
        if (file.action == "write") service->write(path, content);
        else service->append(path, content);
        if (!file.variable.empty()) context.assign(file.variable, true);
    } else if (file.action == "delete") {
        auto removed = service->remove(path);
        if (!file.variable.empty()) context.assign(file.variable, removed);
    } else if (file.action == "exists") {
        context.assign(file.variable, service->exists(path));
    } else {
        throw core::ExecutionError("Unknown q:file action '" + file.action + "'", file.location);
    }
    return ExecResult::next();
}

ModelConfig model_config(Interpreter& in, const ast::LlmNode& llm)
{
    ModelConfig config;
    config.model = in.interpolate(llm.model);
    config.endpoint = in.interpolate(llm.endpoint);
    config.system = in.interpolate(llm.system);
    config.response_format = llm.response_format;
    if (!llm.temperature.empty()) {
        auto value = in.evaluate_text(llm.temperature);
        auto temperature = numeric(value);
        if (!temperature) throw core::ExecutionError("LLM temperature must be a number, got '" + to_display(value) + "'", llm.location);
        config.temperature = *temperature;
    }
    if (!llm.max_tokens.empty()) {
        config.max_tokens = static_cast<int>(integer_attribute(in, llm.max_tokens, "LLM maxTokens"));
    }
    return config;
}

ExecResult execute_llm(const ast::Node& node, Interpreter& in)
{
    const auto& llm = ast::node_cast<ast::LlmNode>(node);
    auto service = require_service<LlmService>(in, "LlmService");

    auto config = model_config(in, llm);
    auto reply = service->generate(plain_text(in, llm.prompt), config);

    Value result = reply;
    if (config.response_format == "json") {
        result = Value::parse(reply, nullptr, false);
        if (result.is_discarded()) {
            throw core::ExecutionError("LLM '" + llm.name + "' did not return valid JSON", llm.location);
        }
    }
    in.context().assign(llm.name, std::move(result));
    return ExecResult::next();
}

std::vector<AgentTool> describe_tools(const ast::AgentNode& agent)
{
    std::vector<AgentTool> tools;
    for (const auto& spec : agent.tools) {
        AgentTool tool{spec.name, spec.description, {}};
        for (const auto& param : spec.params) {
            tool.params.push_back(ToolParameter{param->name, param->type, param->required, param->description});
        }
        tools.push_back(std::move(tool));
    }
    return tools;
}

// Tool bodies run like functions: a boundary frame seeded with the agent's
// arguments; the result is the q:return value or the rendered text.
Value invoke_tool(Interpreter& in, const ast::AgentNode& agent, const std::string& name, const Value& args)
{
    const ast::AgentToolSpec* spec = nullptr;
    for (const auto& tool : agent.tools) {
        if (tool.name == name) spec = &tool;
    }
    if (!spec) throw core::ExecutionError("Agent '" + agent.name + "' has no tool '" + name + "'", agent.location);

    ExecutionContext::FrameGuard frame(in.context(), FrameKind::Function);
    in.bind_params(spec->params, args.is_null() ? Value::object() : args, spec->location);

    auto captured = in.capture(spec->body);
    if (captured.result.is_error()) captured.result.rethrow();
    if (captured.result.is_return()) return captured.result.value;
    return str::trim(captured.text);
}

ExecResult execute_agent(const ast::Node& node, Interpreter& in)
{
    const auto& agent = ast::node_cast<ast::AgentNode>(node);
    auto service = require_service<LlmService>(in, "LlmService");

    ModelConfig config;
    config.model = in.interpolate(agent.model);
    auto max_iterations = integer_attribute(in, agent.max_iterations, "Agent maxIterations");
    if (max_iterations < 1) throw core::ExecutionError("Agent maxIterations must be at least 1", agent.location);

    ToolInvoker invoke = [&in, &agent](const std::string& tool, const Value& args) {
        return invoke_tool(in, agent, tool, args);
    };

    auto outcome = service->run_agent(plain_text(in, agent.instruction), describe_tools(agent),
                                      plain_text(in, agent.task), config, static_cast<int>(max_iterations), invoke);

    Value actions = Value::array();
    for (const auto& action : outcome.actions) {
        actions.push_back(Value{{"tool", action.tool}, {"args", action.args}, {"result", action.result}});
    }
    in.context().assign(agent.name, Value{{"result", outcome.result}, {"actions", actions}, {"iterations", outcome.iterations}});
    return ExecResult::next();
}

ExecResult execute_message(const ast::Node& node, Interpreter& in)
{
    const auto& message_node = ast::node_cast<ast::MessageNode>(node);
    auto transport = require_service<MessageTransport>(in, "MessageTransport");

    Message message;
    auto text = plain_text(in, message_node.body);
    message.body = Value::parse(text, nullptr, false);
    if (message.body.is_discarded()) message.body = text;
    for (const auto& header : message_node.headers) {
        message.headers[header.name] = in.interpolate(header.value);
    }

    Value receipt = Value::object();
    if (message_node.type == "send") {
        auto queue = in.interpolate(message_node.queue);
        receipt["id"] = transport->send(queue, message);
        receipt["queue"] = queue;
        receipt["status"] = "sent";
    } else {
        auto topic = in.interpolate(message_node.topic);
        receipt["id"] = transport->publish(topic, message);
        receipt["topic"] = topic;
        receipt["status"] = "published";
    }

    if (!message_node.name.empty()) in.context().assign(message_node.name, std::move(receipt));
    return ExecResult::next();
}

} // namespace

void register_integrations(ExecutorRegistry& registry)
{
    registry.register_executor(ast::NodeKind::Mail, execute_mail);
    registry.register_executor(ast::NodeKind::File, execute_file);
    registry.register_executor(ast::NodeKind::Llm, execute_llm);
    registry.register_executor(ast::NodeKind::Agent, execute_agent);
    registry.register_executor(ast::NodeKind::Message, execute_message);
}

} // namespace quantum::runtime::executors
