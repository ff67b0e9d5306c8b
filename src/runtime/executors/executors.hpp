// src/runtime/executors/executors.hpp
#pragma once
#include <quantum/runtime/executor_registry.hpp>
#include <quantum/runtime/interpreter.hpp>

#include <cstdint>
#include <string>

namespace quantum::runtime::executors {

void register_control_flow(ExecutorRegistry& registry);
void register_set(ExecutorRegistry& registry);
void register_composition(ExecutorRegistry& registry);
void register_markup(ExecutorRegistry& registry);
void register_data(ExecutorRegistry& registry);
void register_signals(ExecutorRegistry& registry);
void register_integrations(ExecutorRegistry& registry);

// Attribute text that is either an {expr} binding or a bare expression.
Value evaluate_attribute(Interpreter& interpreter, const std::string& text);

// Integral value of an attribute; throws core::ExecutionError naming `what`.
std::int64_t integer_attribute(Interpreter& interpreter, const std::string& text, const std::string& what);

// Service of type T from the container, or an ExecutionError naming it.
template <class T>
std::shared_ptr<T> require_service(Interpreter& interpreter, const char* name)
{
    auto service = interpreter.services().find<T>();
    if (!service) throw core::ExecutionError(std::string("No ") + name + " is registered");
    return service;
}

} // namespace quantum::runtime::executors
