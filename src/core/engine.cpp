#include <quantum/core/engine.hpp>
#include <quantum/core/logger.hpp>
#include <quantum/runtime/services.hpp>
#include <quantum/support/env.hpp>

namespace quantum::core {

Engine::Engine(std::filesystem::path config_dir)
    : application_(std::make_shared<runtime::SharedScope>())
{
    support::Env::load(".env");
    load_configuration(config_dir);
}

void Engine::load_configuration(const std::filesystem::path& config_dir)
{
    config_.load_from_path(config_dir);

    if (!config_.has("app.env") || !support::Env::get("APP_ENV").empty())
        config_.set("app.env", support::Env::get("APP_ENV", config_.get("app.env", "local")));

    auto level = support::Env::get("QUANTUM_LOG_LEVEL", config_.get("log.level", "info"));
    config_.set("log.level", level);
    logger().set_level(Logger::parse_level(level));
}

void Engine::register_default_services()
{
    if (!container_.has<runtime::LogService>()) {
        container_.singleton<runtime::LogService>(std::make_shared<runtime::ConsoleLogService>());
    }
    if (!container_.has<runtime::FileService>()) {
        auto root = config_.get("runtime.files.root", "storage");
        container_.singleton<runtime::FileService>(std::make_shared<runtime::LocalFileService>(root));
    }
}

void Engine::boot()
{
    if (runtime_) return;

    for (auto& provider : service_providers_) {
        provider->boot();
    }
    register_default_services();

    auto options = runtime::RuntimeOptions::from_config(config_);
    runtime_ = std::make_unique<runtime::ComponentRuntime>(container_, options);

    logger().info("engine", std::string("Runtime ready (") + (is_production() ? "production" : "development") +
                            ", ast cache " + (options.cache.ast_enabled ? "on" : "off") +
                            ", expression cache " + (options.cache.expression_enabled ? "on" : "off") + ")");
}

runtime::ComponentRuntime& Engine::runtime()
{
    boot();
    return *runtime_;
}

runtime::RenderedOutput Engine::render(const std::filesystem::path& file,
                                       const runtime::Value& params,
                                       runtime::SharedScopePtr session,
                                       runtime::Value request)
{
    runtime::Scopes scopes{application_, session ? std::move(session) : new_session(), std::move(request)};
    return runtime().render_file(file, params, std::move(scopes));
}

} // namespace quantum::core
