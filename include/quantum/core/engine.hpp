// include/quantum/core/engine.hpp
#pragma once
#include <quantum/core/config.hpp>
#include <quantum/core/container.hpp>
#include <quantum/runtime/component_runtime.hpp>
#include <quantum/runtime/scope.hpp>

#include <filesystem>
#include <memory>
#include <vector>

namespace quantum::core {

class Engine;

// Registers collaborators (data sources, LLM, mail, transports) with the
// engine's container before the runtime is built.
class ServiceProvider {
public:
    explicit ServiceProvider(Engine& engine) : engine_(engine) {}
    virtual ~ServiceProvider() = default;

    virtual void register_services() = 0;
    virtual void boot() {}

protected:
    Engine& engine_;
};

// Embedding entry point: configuration, the service container, the
// process-wide application scope and the component runtime built from them.
class Engine {
public:
    explicit Engine(std::filesystem::path config_dir = "config");

    static std::shared_ptr<Engine> create(std::filesystem::path config_dir = "config") {
        return std::make_shared<Engine>(std::move(config_dir));
    }

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    Config& config() { return config_; }
    const Config& config() const { return config_; }

    ServiceContainer& container() { return container_; }

    template<typename Provider>
    void register_provider() {
        auto provider = std::make_shared<Provider>(*this);
        provider->register_services();
        service_providers_.push_back(provider);
    }

    // Boots providers and builds the runtime from the current config. Later
    // calls are no-ops.
    void boot();
    bool booted() const { return runtime_ != nullptr; }

    // Boots on first use.
    runtime::ComponentRuntime& runtime();

    runtime::SharedScopePtr application_scope() const { return application_; }
    runtime::SharedScopePtr new_session() const { return std::make_shared<runtime::SharedScope>(); }

    runtime::RenderedOutput render(const std::filesystem::path& file,
                                   const runtime::Value& params = runtime::Value::object(),
                                   runtime::SharedScopePtr session = nullptr,
                                   runtime::Value request = runtime::Value::object());

    bool is_production() const { return config_.get("app.env") == "production"; }

private:
    void load_configuration(const std::filesystem::path& config_dir);
    void register_default_services();

    Config config_;
    ServiceContainer container_;
    runtime::SharedScopePtr application_;
    std::vector<std::shared_ptr<ServiceProvider>> service_providers_;
    std::unique_ptr<runtime::ComponentRuntime> runtime_;
};

} // namespace quantum::core
