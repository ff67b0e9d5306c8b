#include "test_support.hpp"

#include <cstdlib>
#include <sstream>

using quantum::core::Config;
using quantum::core::Engine;
using quantum::core::LogLevel;
using quantum::core::Logger;
using quantum::core::ServiceProvider;
using quantum::runtime::RuntimeOptions;
using quantum::runtime::Value;
using quantum::testing::MemoryLog;
using quantum::testing::TempDir;

namespace str = quantum::support::str;

namespace {

void config_flattens_json() {
    Config config;
    config.merge("runtime", nlohmann::json::parse(R"({
        "cache": {"ast": {"enabled": false, "max_items": 16}},
        "components": {"paths": ["a", "b "]},
        "limits": {"max_steps": "lots"}
    })"));

    assert(config.has("runtime.cache.ast.enabled"));
    assert(config.get("runtime.cache.ast.max_items") == "16");
    assert(config.get_as<int>("runtime.cache.ast.max_items") == 16);
    assert(!config.get_as<bool>("runtime.cache.ast.enabled", true));
    assert(config.get_as<int>("runtime.limits.max_steps", 7) == 7);
    assert(config.get("missing.key", "fallback") == "fallback");

    auto paths = config.get_as<std::vector<std::string>>("runtime.components.paths");
    assert(paths.size() == 2);
    assert(paths[1] == "b");

    config.set("app.debug", true);
    assert(config.get("app.debug") == "true");
    config.set("app.port", 8080);
    assert(config.get_as<long long>("app.port") == 8080);
}

void config_loads_a_directory() {
    TempDir dir;
    dir.write("config/runtime.json", R"({"limits": {"max_call_depth": 12}})");
    dir.write("config/broken.json", "{not json");
    dir.write("config/notes.txt", "ignored");

    Config config(dir.path() / "config");
    assert(config.get_as<int>("runtime.limits.max_call_depth") == 12);
    assert(!config.has("notes"));

    Config empty(dir.path() / "nowhere");
    assert(!empty.has("runtime.limits.max_call_depth"));
}

void runtime_options_from_config() {
    unsetenv("QUANTUM_AST_CACHE");
    unsetenv("QUANTUM_EXPRESSION_CACHE");

    auto defaults = RuntimeOptions::from_config(Config());
    assert(defaults.cache.ast_enabled);
    assert(defaults.cache.ast_max_items == 128);
    assert(defaults.cache.ast_ttl == std::chrono::seconds(300));
    assert(defaults.cache.expression_max_items == 1024);
    assert(defaults.limits.max_call_depth == 64);
    assert(defaults.limits.max_steps == 0);
    assert(defaults.component_paths.empty());

    Config config;
    config.merge("runtime", nlohmann::json::parse(R"({
        "cache": {"ast": {"max_items": 8, "ttl_seconds": 5}, "expression": {"enabled": false}},
        "limits": {"max_call_depth": 10, "max_steps": 500, "max_duration_ms": 250},
        "components": {"paths": ["components", "shared/components"]}
    })"));
    auto options = RuntimeOptions::from_config(config);
    assert(options.cache.ast_max_items == 8);
    assert(options.cache.ast_ttl == std::chrono::seconds(5));
    assert(!options.cache.expression_enabled);
    assert(options.limits.max_call_depth == 10);
    assert(options.limits.max_steps == 500);
    assert(options.limits.max_duration == std::chrono::milliseconds(250));
    assert(options.component_paths.size() == 2);
    assert(options.component_paths[1] == "shared/components");

    // the environment switches win over the file
    setenv("QUANTUM_AST_CACHE", "off", 1);
    setenv("QUANTUM_EXPRESSION_CACHE", "1", 1);
    auto switched = RuntimeOptions::from_config(config);
    assert(!switched.cache.ast_enabled);
    assert(switched.cache.expression_enabled);
    unsetenv("QUANTUM_AST_CACHE");
    unsetenv("QUANTUM_EXPRESSION_CACHE");
}

void env_files() {
    TempDir dir;
    auto file = dir.write(".env", "# comment\nexport QUANTUM_TEST_A=\"quoted value\"\nQUANTUM_TEST_B = 'yes' # trailing\nnot a pair\n");
    assert(quantum::support::Env::load(file));
    assert(quantum::support::Env::get("QUANTUM_TEST_A") == "quoted value");
    assert(quantum::support::Env::flag("QUANTUM_TEST_B", false));
    assert(quantum::support::Env::get("QUANTUM_TEST_MISSING", "x") == "x");
    assert(!quantum::support::Env::load(dir.path() / "absent.env"));
    unsetenv("QUANTUM_TEST_A");
    unsetenv("QUANTUM_TEST_B");
}

void logger_levels_and_format() {
    assert(Logger::parse_level("WARN") == LogLevel::Warning);
    assert(Logger::parse_level(" debug ") == LogLevel::Debug);
    assert(Logger::parse_level("critical") == LogLevel::Error);
    assert(Logger::parse_level("whatever") == LogLevel::Info);

    auto& logger = quantum::core::logger();
    auto previous = logger.level();
    std::ostringstream out;
    logger.set_stream(&out);
    logger.set_level(LogLevel::Warning);
    logger.info("chan", "hidden");
    logger.warning("chan", "msg");
    logger.log(LogLevel::Error, "", "bare");
    logger.set_stream(nullptr);
    logger.set_level(previous);

    assert(out.str() == "[Warning] [chan] msg\n[Error] bare\n");
}

void string_helpers() {
    assert(str::trim("  a b \n") == "a b");
    assert(str::trim("   ").empty());
    assert(str::to_lower("AbC") == "abc");
    assert(str::to_upper("AbC") == "ABC");

    auto parts = str::split("a,,b,", ",");
    assert(parts.size() == 4);
    assert(parts[1].empty());
    assert(parts[3].empty());
    assert(str::join(parts, "|") == "a||b|");
    assert(str::split("a::b", "::").size() == 2);

    assert(str::replace_all("a-b-c", "-", "+") == "a+b+c");
    assert(str::replace_all("aaa", "a", "aa") == "aaaaaa");
    assert(str::is_blank(" \t\n"));
    assert(!str::is_blank(" x "));

    assert(str::to_snake_case("UserCard") == "user_card");
    assert(str::to_snake_case("ui/Button") == "ui/button");
    assert(str::to_snake_case("already_snake") == "already_snake");

    assert(str::html_escape("<a href=\"x\">Tom & 'Jerry'</a>") ==
           "&lt;a href=&quot;x&quot;&gt;Tom &amp; &#39;Jerry&#39;&lt;/a&gt;");
}

class MemoryServices : public ServiceProvider {
public:
    using ServiceProvider::ServiceProvider;

    void register_services() override {
        engine_.container().singleton<quantum::runtime::LogService>(
            std::shared_ptr<quantum::runtime::LogService>(std::make_shared<MemoryLog>()));
    }
};

void engine_boots_from_a_config_directory() {
    unsetenv("APP_ENV");
    unsetenv("QUANTUM_LOG_LEVEL");
    unsetenv("QUANTUM_AST_CACHE");
    unsetenv("QUANTUM_EXPRESSION_CACHE");
    auto previous = quantum::core::logger().level();

    TempDir dir;
    auto components = (dir.path() / "components").string();
    auto storage = (dir.path() / "storage").string();
    dir.write("config/app.json", R"({"env": "production"})");
    dir.write("config/log.json", R"({"level": "error"})");
    dir.write("config/runtime.json", nlohmann::json{
        {"cache", {{"ast", {{"max_items", 4}}}}},
        {"components", {{"paths", nlohmann::json::array({components})}}},
        {"files", {{"root", storage}}},
    }.dump());
    dir.write("components/greeting.q", R"(<q:param name="who"/><p>Hello {who}</p>)");
    auto page = dir.write("pages/home.q", R"(<q:component name="Home">
  <q:set name="application.visits" operation="increment"/>
  <q:log level="info" message="visit {application.visits}"/>
  <q:file action="write" file="last.txt">{application.visits}</q:file>
  <Greeting who="Ada"/>
</q:component>)");

    Engine engine(dir.path() / "config");
    engine.register_provider<MemoryServices>();
    assert(engine.is_production());
    assert(quantum::core::logger().level() == LogLevel::Error);
    assert(!engine.booted());

    assert(engine.render(page).html() == "<p>Hello Ada</p>");
    assert(engine.booted());
    assert(engine.render(page).html() == "<p>Hello Ada</p>");
    assert(engine.runtime().options().cache.ast_max_items == 4);

    assert(engine.application_scope()->get("visits").value() == 2);
    auto log = std::dynamic_pointer_cast<MemoryLog>(engine.container().find<quantum::runtime::LogService>());
    assert(log);
    assert(log->lines.size() == 2);
    assert(log->lines[1] == "info:visit 2");

    std::ifstream last(dir.path() / "storage" / "last.txt");
    std::string content;
    std::getline(last, content);
    assert(content == "2");

    quantum::core::logger().set_level(previous);
}

} // namespace

int main()
{
    config_flattens_json();
    config_loads_a_directory();
    runtime_options_from_config();
    env_files();
    logger_levels_and_format();
    string_helpers();
    engine_boots_from_a_config_directory();
    return 0;
}
