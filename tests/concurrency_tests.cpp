#include "test_support.hpp"

#include <thread>

using quantum::core::ServiceContainer;
using quantum::runtime::ComponentRuntime;
using quantum::runtime::Scopes;
using quantum::runtime::SharedScope;
using quantum::runtime::Value;
using quantum::testing::TempDir;

namespace {

constexpr int threads = 8;
constexpr int requests_per_thread = 50;

void shared_counters_lose_no_updates() {
    ServiceContainer services;
    ComponentRuntime rt(services);
    auto unit = rt.parse_source(R"(<q:component name="Counter">
  <q:set name="application.counter" operation="increment"/>
  <q:set name="hits" scope="session" operation="add" value="{2}"/>
  <q:set name="application.log" operation="append" value="x"/>
</q:component>)", "counter.q");

    auto application = std::make_shared<SharedScope>();
    std::vector<std::shared_ptr<SharedScope>> sessions;
    for (int t = 0; t < threads; ++t) sessions.push_back(std::make_shared<SharedScope>());

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < requests_per_thread; ++i) {
                rt.execute_component(unit, Value::object(), Scopes{application, sessions[t]});
            }
        });
    }
    for (auto& worker : workers) worker.join();

    assert(application->get("counter").value() == threads * requests_per_thread);
    assert(application->get("log").value().size() == static_cast<std::size_t>(threads * requests_per_thread));
    // each session only saw its own requests
    for (const auto& session : sessions) {
        assert(session->get("hits").value() == 2 * requests_per_thread);
    }
}

void read_modify_write_sets_are_atomic() {
    ServiceContainer services;
    ComponentRuntime rt(services);
    auto unit = rt.parse_source(R"(<q:component name="Counter">
  <q:set name="application.counter" value="{application.counter + 1}"/>
</q:component>)", "counter_value.q");

    auto application = std::make_shared<SharedScope>();
    application->set("counter", 0);

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < requests_per_thread; ++i) {
                rt.execute_component(unit, Value::object(), Scopes{application, std::make_shared<SharedScope>()});
            }
        });
    }
    for (auto& worker : workers) worker.join();

    assert(application->get("counter").value() == threads * requests_per_thread);
}

void requests_do_not_see_each_other() {
    ServiceContainer services;
    ComponentRuntime rt(services);
    auto unit = rt.parse_source(R"(<q:component name="Echo">
  <q:param name="id" type="integer"/>
  <q:set name="mine" value="{id * 10}"/>
  <q:loop var="i" from="1" to="3"><q:set name="mine" value="{mine + 1}"/></q:loop>
  <p>{id}:{mine}:{request.tag}</p>
</q:component>)", "echo.q");

    std::atomic<int> mismatches{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < requests_per_thread; ++i) {
                Scopes scopes;
                scopes.request = Value{{"tag", "t" + std::to_string(t)}};
                auto html = rt.execute_component(unit, Value{{"id", t}}, scopes).html();
                auto expected = "<p>" + std::to_string(t) + ":" + std::to_string(t * 10 + 3) + ":t" + std::to_string(t) + "</p>";
                if (html != expected) ++mismatches;
            }
        });
    }
    for (auto& worker : workers) worker.join();
    assert(mismatches == 0);
}

void cached_files_render_concurrently() {
    TempDir dir;
    auto path = dir.write("card.q", R"(<q:param name="n" type="integer"/><b>{n * n}</b>)");
    ServiceContainer services;
    ComponentRuntime rt(services);

    std::atomic<int> mismatches{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < requests_per_thread; ++i) {
                auto html = rt.render_file(path, Value{{"n", t + i}}).html();
                if (html != "<b>" + std::to_string((t + i) * (t + i)) + "</b>") ++mismatches;
            }
        });
    }
    for (auto& worker : workers) worker.join();

    assert(mismatches == 0);
    auto stats = rt.ast_cache().stats();
    assert(stats.entries == 1);
    assert(stats.hits + stats.misses == static_cast<std::size_t>(threads * requests_per_thread));
    // racing first loads may each parse, later ones never do
    assert(stats.parses <= static_cast<std::size_t>(threads));
}

} // namespace

int main()
{
    shared_counters_lose_no_updates();
    read_modify_write_sets_are_atomic();
    requests_do_not_see_each_other();
    cached_files_render_concurrently();
    return 0;
}
