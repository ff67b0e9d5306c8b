// include/quantum/core/container.hpp
#pragma once
#include <quantum/core/errors.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace quantum::runtime {
class DataSource;
}

namespace quantum::core {

// Holds one instance per collaborator type (LlmService, MailService, ...)
// plus data sources by name. Filled by service providers at startup and read
// by executors on every request.
class ServiceContainer {
public:
    // Factory binding: a fresh instance per make().
    template <class T>
    void bind(std::function<std::shared_ptr<T>()> factory) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto key = std::type_index(typeid(T));
        bindings_[key] = [factory]() -> std::shared_ptr<void> {
            return std::static_pointer_cast<void>(factory());
        };
    }

    // Lazy singleton: the factory runs on first make().
    template <class T>
    void singleton(std::function<std::shared_ptr<T>()> factory) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto key = std::type_index(typeid(T));
        singletons_.erase(key);
        singleton_factories_[key] = [factory]() -> std::shared_ptr<void> {
            return std::static_pointer_cast<void>(factory());
        };
    }

    template <class T>
    void singleton(std::shared_ptr<T> instance) {
        std::lock_guard<std::mutex> lock(mutex_);
        singletons_[std::type_index(typeid(T))] = std::static_pointer_cast<void>(std::move(instance));
    }

    // nullptr when nothing is registered for T.
    template <class T>
    std::shared_ptr<T> find() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto key = std::type_index(typeid(T));

        auto singleton_it = singletons_.find(key);
        if (singleton_it != singletons_.end()) {
            return std::static_pointer_cast<T>(singleton_it->second);
        }

        auto singleton_factory_it = singleton_factories_.find(key);
        if (singleton_factory_it != singleton_factories_.end()) {
            auto instance = singleton_factory_it->second();
            singletons_[key] = instance;
            return std::static_pointer_cast<T>(instance);
        }

        auto factory_it = bindings_.find(key);
        if (factory_it != bindings_.end()) {
            return std::static_pointer_cast<T>(factory_it->second());
        }
        return nullptr;
    }

    // Like find(), but default-constructs concrete types and throws for
    // unregistered abstract ones.
    template <class T>
    std::shared_ptr<T> make() {
        if (auto instance = find<T>()) {
            return instance;
        }
        if constexpr (std::is_constructible_v<T> && !std::is_abstract_v<T>) {
            return std::make_shared<T>();
        } else {
            throw ExecutionError(std::string("No service registered for ") + typeid(T).name());
        }
    }

    template <class T>
    bool has() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto key = std::type_index(typeid(T));
        return singletons_.count(key) > 0 || singleton_factories_.count(key) > 0 || bindings_.count(key) > 0;
    }

    void add_datasource(const std::string& name, std::shared_ptr<runtime::DataSource> source) {
        std::lock_guard<std::mutex> lock(mutex_);
        datasources_[name] = std::move(source);
        if (default_datasource_.empty()) default_datasource_ = name;
    }

    void set_default_datasource(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        default_datasource_ = name;
    }

    // Empty name selects the default. nullptr when unknown.
    std::shared_ptr<runtime::DataSource> datasource(const std::string& name = {}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = datasources_.find(name.empty() ? default_datasource_ : name);
        return it == datasources_.end() ? nullptr : it->second;
    }

    std::vector<std::string> datasource_names() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> names;
        for (const auto& [name, source] : datasources_) names.push_back(name);
        return names;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, std::function<std::shared_ptr<void>()>> bindings_;
    std::unordered_map<std::type_index, std::function<std::shared_ptr<void>()>> singleton_factories_;
    std::unordered_map<std::type_index, std::shared_ptr<void>> singletons_;
    std::unordered_map<std::string, std::shared_ptr<runtime::DataSource>> datasources_;
    std::string default_datasource_;
};

} // namespace quantum::core
