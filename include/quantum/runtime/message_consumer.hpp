#pragma once

#include <quantum/runtime/component_runtime.hpp>
#include <quantum/runtime/services.hpp>

#include <atomic>
#include <cstddef>
#include <string>

namespace quantum::runtime {

// Runs a component for every delivery on a queue. The component receives the
// decoded body as `message` and the headers as `headers`, both as params and
// as request variables. Success acks; any error nacks without requeue.
class MessageConsumer {
public:
    MessageConsumer(ComponentRuntime& runtime, MessageTransport& transport);

    void consume(const std::string& queue, ast::SourceUnitPtr unit, Scopes scopes = {});

    // One delivery; true when it was acked.
    bool handle(const Delivery& delivery, const ast::SourceUnitPtr& unit, const Scopes& scopes);

    std::size_t processed() const { return processed_.load(); }
    std::size_t failed() const { return failed_.load(); }

private:
    ComponentRuntime& runtime_;
    MessageTransport& transport_;
    std::atomic<std::size_t> processed_{0};
    std::atomic<std::size_t> failed_{0};
};

} // namespace quantum::runtime
