#include "executors.hpp"

#include <quantum/runtime/services.hpp>
#include <quantum/support/str.hpp>

#include <cmath>
#include <stdexcept>
#include <unordered_map>

namespace quantum::runtime::executors {

namespace {

namespace str = support::str;

// SQL-ish parameter types onto value coercions. "cf_sql_" prefixes are accepted.
std::optional<std::string> coercion_for(std::string type)
{
    static const std::unordered_map<std::string, std::string> types = {
        {"string", "string"},   {"varchar", "string"},  {"char", "string"},       {"text", "string"},
        {"date", "string"},     {"time", "string"},     {"timestamp", "string"},  {"datetime", "string"},
        {"integer", "integer"}, {"int", "integer"},     {"bigint", "integer"},    {"smallint", "integer"},
        {"tinyint", "integer"}, {"decimal", "decimal"}, {"numeric", "decimal"},   {"float", "decimal"},
        {"double", "decimal"},  {"money", "decimal"},   {"number", "number"},     {"boolean", "boolean"},
        {"bool", "boolean"},    {"bit", "boolean"},     {"json", "json"},         {"array", "array"},
    };
    if (type.rfind("cf_sql_", 0) == 0) type = type.substr(7);
    auto it = types.find(type);
    if (it == types.end()) return std::nullopt;
    return it->second;
}

Value bind_parameter(Interpreter& in, const ast::QueryNode& query, const ast::QueryParamSpec& param)
{
    if (!param.null_when.empty() && is_truthy(evaluate_attribute(in, param.null_when))) return Value();

    auto value = in.evaluate_text(param.value);
    if (value.is_null()) return value;

    auto type = coercion_for(param.type);
    if (!type) {
        throw core::ParamError(param.name, "Query '" + query.name + "': unknown parameter type '" + param.type + "'",
                               param.location);
    }
    try {
        value = coerce(value, *type);
    } catch (const std::invalid_argument& e) {
        throw core::ParamError(param.name, "Query '" + query.name + "' parameter '" + param.name + "': " + e.what(),
                               param.location);
    }

    if (!param.max_length.empty() && value.is_string()) {
        auto limit = numeric(literal(param.max_length));
        if (limit && static_cast<double>(value.get_ref<const std::string&>().size()) > *limit) {
            throw core::ParamError(param.name, "Query '" + query.name + "' parameter '" + param.name +
                                   "' exceeds maxLength " + param.max_length, param.location);
        }
    }

    if (!param.scale.empty() && value.is_number_float()) {
        auto digits = numeric(literal(param.scale));
        if (digits) {
            double factor = std::pow(10.0, *digits);
            value = std::round(value.get<double>() * factor) / factor;
        }
    }
    return value;
}

ExecResult execute_query(const ast::Node& node, Interpreter& in)
{
    const auto& query = ast::node_cast<ast::QueryNode>(node);

    auto source = in.services().datasource(query.datasource);
    if (!source) {
        throw core::ExecutionError("Data source '" + query.datasource + "' is not registered", query.location);
    }

    Value params = Value::object();
    for (const auto& param : query.params) params[param.name] = bind_parameter(in, query, param);

    auto rows = source->execute(query.sql, params);
    if (!rows.rows.is_array()) {
        throw core::ExecutionError("Data source '" + query.datasource + "' returned a non-array result", query.location);
    }

    Value meta = Value::object();
    meta["recordCount"] = rows.rows.size();
    meta["columns"] = rows.columns;

    auto& context = in.context();
    context.assign(query.name, std::move(rows.rows));
    context.assign(query.name + "_meta", std::move(meta));
    return ExecResult::next();
}

} // namespace

void register_data(ExecutorRegistry& registry)
{
    registry.register_executor(ast::NodeKind::Query, execute_query);
}

} // namespace quantum::runtime::executors
