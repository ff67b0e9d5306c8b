#include <quantum/runtime/interpreter.hpp>
#include <quantum/support/str.hpp>

#include <algorithm>
#include <regex>
#include <stdexcept>
#include <utility>

namespace quantum::runtime {

namespace str = support::str;

Interpreter::DepthGuard::DepthGuard(Interpreter& interpreter, const core::SourceLocation& location)
    : interpreter_(interpreter)
{
    auto max = interpreter_.limits_.max_call_depth;
    if (max > 0 && interpreter_.call_depth_ >= max) {
        throw core::ExecutionError("Maximum call depth of " + std::to_string(max) + " exceeded", location);
    }
    ++interpreter_.call_depth_;
}

Interpreter::Interpreter(const ExecutorRegistry& executors,
                         ExpressionCache& expressions,
                         ComponentResolver& components,
                         core::ServiceContainer& services,
                         ExecutionContext& context,
                         ExecutionLimits limits)
    : executors_(executors), expressions_(expressions), interpolator_(expressions), components_(components),
      services_(services), context_(context), limits_(limits), started_(std::chrono::steady_clock::now())
{
    outputs_.emplace_back();
    context_.set_function_handler([this](const std::string& name, const std::vector<Value>& args) {
        return call_function(name, args);
    });
}

Interpreter::~Interpreter()
{
    context_.set_function_handler(nullptr);
}

RenderedOutput Interpreter::run(const ast::SourceUnitPtr& unit, const Value& params)
{
    started_ = std::chrono::steady_clock::now();
    steps_ = 0;
    outputs_.clear();
    outputs_.emplace_back();
    flashes_.clear();
    status_ = 200;

    ExecResult result;
    try {
        result = invoke_component(unit, params);
    } catch (const core::ParamError& e) {
        if (e.location().known()) throw;
        throw core::ParamError(e.parameter(), e.message(), unit->root().location);
    }
    if (result.is_error()) result.rethrow();

    RenderedOutput out;
    out.fragments = std::move(outputs_.front());
    out.flashes = std::move(flashes_);
    out.status = status_;
    if (result.is_redirect()) {
        out.redirect = RedirectTarget{result.url, result.status};
        out.status = result.status;
    } else if (result.is_return()) {
        out.return_value = result.value;
    }
    return out;
}

ExecResult Interpreter::execute_statements(const ast::NodeList& statements)
{
    for (const auto& node : statements) {
        try {
            tick(*node);
        } catch (const core::ExecutionError&) {
            return ExecResult::failure(std::current_exception());
        }
        auto result = executors_.execute(*node, *this);
        if (!result.is_continue()) return result;
    }
    return ExecResult::next();
}

ExecResult Interpreter::execute_block(const ast::NodeList& statements)
{
    ExecutionContext::FrameGuard frame(context_, FrameKind::Block);
    return execute_statements(statements);
}

void Interpreter::tick(const ast::Node& node)
{
    ++steps_;
    if (limits_.max_steps > 0 && steps_ > limits_.max_steps) {
        throw core::ExecutionError("Step budget of " + std::to_string(limits_.max_steps) + " exceeded", node.location);
    }
    if (limits_.max_duration.count() > 0 && std::chrono::steady_clock::now() - started_ > limits_.max_duration) {
        throw core::ExecutionError("Time budget of " + std::to_string(limits_.max_duration.count()) + "ms exceeded",
                                   node.location);
    }
    if (limits_.cancel && limits_.cancel->load()) {
        throw core::ExecutionError("Execution cancelled", node.location);
    }
}

ExecResult Interpreter::invoke_component(const ast::SourceUnitPtr& unit, const Value& args, std::optional<std::string> slot)
{
    DepthGuard depth(*this, unit->root().location);
    ExecutionContext::FrameGuard frame(context_, FrameKind::Component);

    invocations_.push_back(Invocation{unit, {}, {}, std::move(slot)});
    struct InvocationPop {
        std::vector<Invocation>& stack;
        ~InvocationPop() { stack.pop_back(); }
    } pop{invocations_};

    if (unit->is_component()) {
        // the caller's error location is attached by whoever invoked us
        bind_params(unit->component().params, args, core::SourceLocation{});
    }
    hoist_functions(invocations_.back(), unit->body());
    return execute_statements(unit->body());
}

void Interpreter::hoist_functions(Invocation& invocation, const ast::NodeList& body)
{
    for (const auto& node : body) {
        if (node->kind == ast::NodeKind::Function) {
            const auto& function = ast::node_cast<ast::FunctionNode>(*node);
            invocation.functions[function.name] = &function;
        }
    }
}

void Interpreter::define_function(const ast::FunctionNode& function)
{
    if (invocations_.empty()) return;
    invocations_.back().functions[function.name] = &function;
}

std::optional<Value> Interpreter::call_function(const std::string& name, const std::vector<Value>& args)
{
    if (invocations_.empty()) return std::nullopt;
    const auto& functions = invocations_.back().functions;
    auto it = functions.find(name);
    if (it == functions.end()) return std::nullopt;
    const ast::FunctionNode& function = *it->second;

    DepthGuard depth(*this, function.location);
    ExecutionContext::FrameGuard frame(context_, FrameKind::Function);

    Value positional = Value::array();
    for (const auto& arg : args) positional.push_back(arg);
    try {
        bind_params(function.params, positional, function.location);
    } catch (const core::ParamError& e) {
        throw core::ParamError(e.parameter(), "In call to " + name + "(): " + e.message(), e.location());
    }

    auto result = execute_statements(function.body);
    if (result.is_error()) result.rethrow();
    if (result.is_redirect()) {
        throw core::ExecutionError("<q:redirect> is not allowed inside function '" + name + "'", function.location);
    }

    Value out = result.is_return() ? result.value : Value();
    if (function.return_type == "void") return Value();
    try {
        return coerce(out, function.return_type);
    } catch (const std::invalid_argument& e) {
        throw core::ExecutionError("Function '" + name + "' returned a bad value: " + e.what(), function.location);
    }
}

Value Interpreter::param_value(const ast::ParamNode& param, const Value* supplied, const core::SourceLocation& location)
{
    Value value;
    if (supplied) {
        value = *supplied;
    } else if (param.default_value) {
        const auto& fallback = *param.default_value;
        value = Interpolator::has_bindings(fallback) ? evaluate_text(fallback) : literal(fallback);
    } else if (param.required) {
        throw core::ParamError(param.name, "Missing required parameter '" + param.name + "'", location);
    }

    if (value.is_null()) return value;

    try {
        value = coerce(value, param.type);
    } catch (const std::invalid_argument& e) {
        throw core::ParamError(param.name, "Parameter '" + param.name + "': " + e.what(), location);
    }

    if (!param.enum_values.empty()) {
        auto text = to_display(value);
        if (std::find(param.enum_values.begin(), param.enum_values.end(), text) == param.enum_values.end()) {
            throw core::ParamError(param.name, "Parameter '" + param.name + "' must be one of: " + str::join(param.enum_values, ", "),
                                   location);
        }
    }

    // min/max bound numbers by value and strings/arrays by length
    auto measure = [&]() -> std::optional<double> {
        if (value.is_string() || value.is_array() || value.is_object()) {
            auto n = member(value, "length");
            return n ? numeric(*n) : std::nullopt;
        }
        return numeric(value);
    };
    if (!param.min.empty()) {
        auto bound = numeric(literal(param.min));
        auto actual = measure();
        if (bound && actual && *actual < *bound) {
            throw core::ParamError(param.name, "Parameter '" + param.name + "' is below the minimum of " + param.min, location);
        }
    }
    if (!param.max.empty()) {
        auto bound = numeric(literal(param.max));
        auto actual = measure();
        if (bound && actual && *actual > *bound) {
            throw core::ParamError(param.name, "Parameter '" + param.name + "' is above the maximum of " + param.max, location);
        }
    }

    if (!param.validate.empty()) {
        auto text = to_display(value);
        auto rule = str::to_lower(param.validate);
        bool ok = true;
        if (rule == "email") {
            static const std::regex email(R"(^[^@\s]+@[^@\s]+\.[^@\s]+$)");
            ok = std::regex_match(text, email);
        } else if (rule == "url") {
            ok = text.rfind("http://", 0) == 0 || text.rfind("https://", 0) == 0;
        } else {
            try {
                ok = std::regex_match(text, std::regex(param.validate));
            } catch (const std::regex_error& e) {
                throw core::ParamError(param.name, "Parameter '" + param.name + "' has an invalid pattern: " + e.what(), location);
            }
        }
        if (!ok) {
            throw core::ParamError(param.name, "Parameter '" + param.name + "' failed validation '" + param.validate + "'", location);
        }
    }
    return value;
}

void Interpreter::bind_params(const ast::ParamList& params, const Value& args, const core::SourceLocation& location)
{
    for (std::size_t i = 0; i < params.size(); ++i) {
        const auto& param = *params[i];
        const Value* supplied = nullptr;
        if (args.is_object()) {
            auto it = args.find(param.name);
            if (it != args.end()) supplied = &*it;
        } else if (args.is_array() && i < args.size()) {
            supplied = &args[i];
        }
        context_.declare(param.name, param_value(param, supplied, location));
    }
}

Value Interpreter::evaluate(const std::string& expression)
{
    return expressions_.evaluate(expression, context_);
}

Value Interpreter::evaluate_text(const std::string& text)
{
    return interpolator_.evaluate(text, context_);
}

std::string Interpreter::interpolate(const std::string& text)
{
    return interpolator_.interpolate(text, context_);
}

bool Interpreter::condition(const std::string& expression)
{
    return is_truthy(evaluate(expression));
}

void Interpreter::emit(std::string fragment)
{
    if (fragment.empty()) return;
    outputs_.back().push_back(std::move(fragment));
}

Interpreter::Captured Interpreter::capture(const ast::NodeList& statements)
{
    outputs_.emplace_back();
    struct OutputPop {
        std::vector<std::vector<std::string>>& stack;
        ~OutputPop() { stack.pop_back(); }
    } pop{outputs_};

    Captured captured;
    {
        ExecutionContext::FrameGuard frame(context_, FrameKind::Block);
        captured.result = execute_statements(statements);
    }
    for (const auto& part : outputs_.back()) captured.text += part;
    return captured;
}

std::string Interpreter::render(const ast::NodeList& statements)
{
    auto captured = capture(statements);
    if (captured.result.is_error()) captured.result.rethrow();
    if (captured.result.is_redirect()) {
        throw core::ExecutionError("Redirect to '" + captured.result.url + "' inside content that is rendered as text");
    }
    return captured.text;
}

const ast::SourceUnit& Interpreter::current_unit() const
{
    if (invocations_.empty()) throw core::ExecutionError("No component is executing");
    return *invocations_.back().unit;
}

std::filesystem::path Interpreter::current_directory() const
{
    if (invocations_.empty()) return {};
    return invocations_.back().unit->origin().parent_path();
}

void Interpreter::bind_import(const std::string& name, ast::SourceUnitPtr unit)
{
    if (invocations_.empty()) throw core::ExecutionError("No component is executing");
    invocations_.back().imports[name] = std::move(unit);
}

ast::SourceUnitPtr Interpreter::find_component(const std::string& name)
{
    if (!invocations_.empty()) {
        const auto& imports = invocations_.back().imports;
        auto it = imports.find(name);
        if (it != imports.end()) return it->second;
    }
    return components_.resolve(name, current_directory());
}

const std::optional<std::string>& Interpreter::slot_content() const
{
    static const std::optional<std::string> none;
    if (invocations_.empty()) return none;
    return invocations_.back().slot;
}

} // namespace quantum::runtime
