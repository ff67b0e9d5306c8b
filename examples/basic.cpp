#include <quantum/quantum.hpp>

#include <iostream>

int main()
{
    quantum::core::Engine engine;

    auto& runtime = engine.runtime();
    auto unit = runtime.parse_source(R"(
<q:component name="Greeting">
  <q:param name="name" type="string" default="world"/>
  <q:param name="count" type="integer" default="3"/>
  <h1>Hello, {name}!</h1>
  <ul><q:loop var="i" from="1" to="{count}"><li>Item {i}</li></q:loop></ul>
  <q:set name="visits" value="{session.visits}" operation="assign"/>
  <q:set name="session.visits" operation="increment"/>
</q:component>
)", "examples/greeting.q");

    auto session = engine.new_session();
    for (int request = 0; request < 2; ++request) {
        quantum::runtime::Scopes scopes{engine.application_scope(), session, quantum::runtime::Value::object()};
        auto output = runtime.execute_component(unit, {{"name", "Quantum"}}, scopes);
        std::cout << output.html() << "\n";
    }
    std::cout << "session.visits = " << session->get("visits").value_or(0).dump() << "\n";
    return 0;
}
