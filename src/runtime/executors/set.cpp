#include "executors.hpp"

#include <quantum/support/str.hpp>

#include <algorithm>
#include <regex>
#include <stdexcept>

namespace quantum::runtime::executors {

namespace {

namespace str = support::str;

[[noreturn]] void fail(const ast::SetNode& node, const std::string& message)
{
    throw core::ExecutionError("Variable '" + node.name + "': " + message, node.location);
}

Value number_of(const ast::SetNode& node, const Value& v, const char* role)
{
    auto n = numeric_value(v);
    if (!n) fail(node, std::string(role) + " is not numeric ('" + to_display(v) + "')");
    return *n;
}

Value add_numbers(const Value& a, const Value& b, bool subtract)
{
    if (a.is_number_integer() && b.is_number_integer()) {
        return integer_arithmetic(subtract ? '-' : '+', a.get<std::int64_t>(), b.get<std::int64_t>());
    }
    double x = a.get<double>();
    double y = b.get<double>();
    return subtract ? x - y : x + y;
}

Value multiply_numbers(const Value& a, const Value& b)
{
    if (a.is_number_integer() && b.is_number_integer()) {
        return integer_arithmetic('*', a.get<std::int64_t>(), b.get<std::int64_t>());
    }
    return a.get<double>() * b.get<double>();
}

std::int64_t index_of(Interpreter& in, const ast::SetNode& node, const Value& value)
{
    auto index = node.index.empty() ? numeric_value(value) : numeric_value(in.evaluate_text(node.index));
    if (!index || !index->is_number_integer()) fail(node, "removeAt needs an integer index");
    return index->get<std::int64_t>();
}

Value apply_operation(Interpreter& in, const ast::SetNode& node, const Value& current, const Value& value)
{
    const auto& op = node.operation;

    if (op == "assign") return value;

    if (op == "increment" || op == "decrement") {
        Value step = node.step.empty() ? Value(std::int64_t{1}) : number_of(node, in.evaluate_text(node.step), "step");
        return add_numbers(number_of(node, current, "current value"), step, op == "decrement");
    }
    if (op == "add") return add_numbers(number_of(node, current, "current value"), number_of(node, value, "value"), false);
    if (op == "multiply") return multiply_numbers(number_of(node, current, "current value"), number_of(node, value, "value"));

    if (op == "append" || op == "prepend") {
        if (current.is_null() || current.is_array()) {
            Value out = current.is_null() ? Value::array() : current;
            if (op == "append") out.push_back(value);
            else out.insert(out.begin(), value);
            return out;
        }
        if (current.is_string()) {
            return op == "append" ? current.get<std::string>() + to_display(value) : to_display(value) + current.get<std::string>();
        }
        fail(node, "cannot " + op + " to " + type_name(current));
    }

    if (op == "remove") {
        if (current.is_array()) {
            Value out = Value::array();
            for (const auto& item : current) {
                if (!loosely_equal(item, value)) out.push_back(item);
            }
            return out;
        }
        if (current.is_object()) {
            Value out = current;
            out.erase(to_display(value));
            return out;
        }
        if (current.is_string()) return str::replace_all(current.get<std::string>(), to_display(value), "");
        if (current.is_null()) return current;
        fail(node, "cannot remove from " + type_name(current));
    }

    if (op == "removeAt") {
        if (!current.is_array()) fail(node, "removeAt needs an array");
        auto index = index_of(in, node, value);
        if (index < 0 || static_cast<std::size_t>(index) >= current.size()) {
            fail(node, "index " + std::to_string(index) + " is out of bounds");
        }
        Value out = current;
        out.erase(static_cast<std::size_t>(index));
        return out;
    }

    if (op == "clear") {
        if (current.is_array()) return Value::array();
        if (current.is_object()) return Value::object();
        if (current.is_string()) return std::string{};
        return Value();
    }

    if (op == "sort") {
        if (current.is_null()) return Value::array();
        if (!current.is_array()) fail(node, "sort needs an array");
        std::vector<Value> items(current.begin(), current.end());
        const auto& field = node.key;
        std::stable_sort(items.begin(), items.end(), [&](const Value& a, const Value& b) {
            if (!field.empty()) {
                auto x = member(a, field);
                auto y = member(b, field);
                return compare(x ? *x : Value(), y ? *y : Value()) < 0;
            }
            return compare(a, b) < 0;
        });
        if (str::to_lower(to_display(value)) == "desc") std::reverse(items.begin(), items.end());
        return Value(items);
    }

    if (op == "reverse") {
        if (current.is_array()) {
            std::vector<Value> items(current.begin(), current.end());
            std::reverse(items.begin(), items.end());
            return Value(items);
        }
        if (current.is_string()) {
            auto text = current.get<std::string>();
            std::reverse(text.begin(), text.end());
            return text;
        }
        if (current.is_null()) return current;
        fail(node, "cannot reverse " + type_name(current));
    }

    if (op == "unique") {
        if (current.is_null()) return Value::array();
        if (!current.is_array()) fail(node, "unique needs an array");
        Value out = Value::array();
        for (const auto& item : current) {
            bool seen = std::any_of(out.begin(), out.end(), [&](const Value& kept) { return loosely_equal(kept, item); });
            if (!seen) out.push_back(item);
        }
        return out;
    }

    if (op == "merge") {
        if ((current.is_null() || current.is_object()) && value.is_object()) {
            Value out = current.is_null() ? Value::object() : current;
            out.update(value);
            return out;
        }
        if ((current.is_null() || current.is_array()) && value.is_array()) {
            Value out = current.is_null() ? Value::array() : current;
            for (const auto& item : value) out.push_back(item);
            return out;
        }
        fail(node, "cannot merge " + type_name(value) + " into " + type_name(current));
    }

    if (op == "setProperty" || op == "deleteProperty") {
        if (node.key.empty()) fail(node, op + " requires 'key' attribute");
        auto key = in.interpolate(node.key);
        if (!current.is_null() && !current.is_object()) fail(node, op + " needs an object");
        Value out = current.is_null() ? Value::object() : current;
        if (op == "setProperty") out[key] = value;
        else out.erase(key);
        return out;
    }

    if (op == "clone") {
        if (!node.source.empty()) {
            auto source = in.context().resolve(str::trim(node.source));
            return source ? *source : Value();
        }
        return node.value ? value : current;
    }

    if (op == "uppercase" || op == "lowercase" || op == "trim") {
        auto text = to_display(node.value ? value : current);
        if (op == "uppercase") return str::to_upper(text);
        if (op == "lowercase") return str::to_lower(text);
        return str::trim(text);
    }

    fail(node, "unknown operation '" + op + "'");
}

std::optional<double> length_of(const Value& v)
{
    if (v.is_string()) return static_cast<double>(v.get_ref<const std::string&>().size());
    if (v.is_array() || v.is_object()) return static_cast<double>(v.size());
    return std::nullopt;
}

void validate(const ast::SetNode& node, const Value& value)
{
    const auto& rules = node.validation;
    if (rules.empty()) return;

    bool blank = value.is_null() || (value.is_string() && value.get_ref<const std::string&>().empty());
    if (rules.required && blank) fail(node, "a value is required");
    if (!rules.nullable && value.is_null()) fail(node, "null is not allowed");
    if (value.is_null()) return;

    auto text = to_display(value);
    if (!rules.pattern.empty()) {
        bool matched = false;
        try {
            matched = std::regex_match(text, std::regex(rules.pattern));
        } catch (const std::regex_error& e) {
            fail(node, "invalid pattern '" + rules.pattern + "': " + e.what());
        }
        if (!matched) fail(node, "'" + text + "' does not match pattern '" + rules.pattern + "'");
    }

    if (!rules.enum_values.empty() &&
        std::find(rules.enum_values.begin(), rules.enum_values.end(), text) == rules.enum_values.end()) {
        fail(node, "'" + text + "' is not one of: " + str::join(rules.enum_values, ", "));
    }

    auto check_bound = [&](const std::string& bound, bool lower, const std::optional<double>& actual, const char* what) {
        if (bound.empty() || !actual) return;
        auto limit = numeric(literal(bound));
        if (!limit) fail(node, std::string(what) + " '" + bound + "' is not numeric");
        if (lower ? *actual < *limit : *actual > *limit) {
            fail(node, std::string(what) + " of " + bound + " violated by '" + text + "'");
        }
    };

    check_bound(rules.min, true, numeric(value), "minimum");
    check_bound(rules.max, false, numeric(value), "maximum");
    check_bound(rules.minlength, true, length_of(value), "minimum length");
    check_bound(rules.maxlength, false, length_of(value), "maximum length");

    if (!rules.range.empty()) {
        // "1..10" or "1,10"
        auto separator = rules.range.find("..") != std::string::npos ? std::string("..") : std::string(",");
        auto parts = str::split(rules.range, separator);
        if (parts.size() != 2) fail(node, "range '" + rules.range + "' must look like 'min..max'");
        check_bound(str::trim(parts[0]), true, numeric(value), "range minimum");
        check_bound(str::trim(parts[1]), false, numeric(value), "range maximum");
    }
}

std::string target_name(const ast::SetNode& node)
{
    const auto& scope = node.scope;
    if (scope == "session" || scope == "application" || scope == "request") {
        if (node.name.rfind(scope + ".", 0) != 0) return scope + "." + node.name;
    }
    return node.name;
}

ExecResult apply_set(const ast::SetNode& node, Interpreter& in, const std::string& target)
{
    auto& context = in.context();
    auto current = context.resolve(target).value_or(Value());
    Value value = node.value ? in.evaluate_text(*node.value) : Value();

    auto result = apply_operation(in, node, current, value);

    if (!node.type.empty()) {
        try {
            result = coerce(result, node.type);
        } catch (const std::invalid_argument& e) {
            fail(node, e.what());
        }
    }
    validate(node, result);
    context.assign(target, std::move(result));
    return ExecResult::next();
}

ExecResult execute_set(const ast::Node& n, Interpreter& in)
{
    const auto& node = ast::node_cast<ast::SetNode>(n);
    auto target = target_name(node);

    // read-modify-write on shared state happens under both scope locks
    if (target.rfind("session.", 0) == 0 || target.rfind("application.", 0) == 0) {
        auto guard = in.context().lock_shared_scopes();
        return apply_set(node, in, target);
    }
    return apply_set(node, in, target);
}

} // namespace

void register_set(ExecutorRegistry& registry)
{
    registry.register_executor(ast::NodeKind::Set, execute_set);
}

} // namespace quantum::runtime::executors
