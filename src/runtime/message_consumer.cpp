#include <quantum/core/logger.hpp>
#include <quantum/runtime/message_consumer.hpp>

#include <exception>

namespace quantum::runtime {

MessageConsumer::MessageConsumer(ComponentRuntime& runtime, MessageTransport& transport)
    : runtime_(runtime), transport_(transport)
{
}

void MessageConsumer::consume(const std::string& queue, ast::SourceUnitPtr unit, Scopes scopes)
{
    if (!unit) throw core::ExecutionError("No component to consume '" + queue + "' with");

    core::logger().info("consumer", "Consuming '" + queue + "' with " + unit->name());
    transport_.subscribe(queue, [this, unit = std::move(unit), scopes = std::move(scopes)](const Delivery& delivery) {
        handle(delivery, unit, scopes);
    });
}

bool MessageConsumer::handle(const Delivery& delivery, const ast::SourceUnitPtr& unit, const Scopes& scopes)
{
    Value headers = Value::object();
    for (const auto& [name, value] : delivery.message.headers) headers[name] = value;

    Value params = {{"message", delivery.message.body}, {"headers", headers}};

    // fresh request variables per delivery; shared scopes are the consumer's
    Scopes request_scopes{scopes.application, scopes.session, scopes.request.is_object() ? scopes.request : Value::object()};
    request_scopes.request["message"] = delivery.message.body;
    request_scopes.request["headers"] = headers;
    request_scopes.request["deliveryTag"] = delivery.delivery_tag;

    try {
        runtime_.execute_component(unit, params, std::move(request_scopes));
    } catch (const std::exception& e) {
        ++failed_;
        core::logger().error("consumer", "Message " + delivery.delivery_tag + " on '" + delivery.queue + "' failed: " + e.what());
        transport_.nack(delivery.delivery_tag, false);
        return false;
    }

    ++processed_;
    transport_.ack(delivery.delivery_tag);
    return true;
}

} // namespace quantum::runtime
