#pragma once
#include <quantum/core/command.hpp>
#include <quantum/core/engine.hpp>
#include <quantum/runtime/value.hpp>

#include <iostream>

namespace quantum::commands {

// quantum render <file> [--param.name=value ...] [--config=dir]
class RenderCommand : public quantum::core::Command {
public:
    std::string name() const override { return "render"; }
    std::string description() const override { return "Render a component file and print the HTML"; }

    std::vector<Option> options() const override {
        return {
            {"param.<name>", "Value for the component parameter <name>", ""},
            {"config", "Configuration directory", "config"},
            {"no-cache", "Disable the AST and expression caches", "false"}
        };
    }

    int handle(const std::vector<std::string>& arguments, const Options& options) override {
        if (arguments.empty()) {
            std::cerr << "Usage: quantum render <file> [--param.name=value ...]\n";
            return 1;
        }

        auto config_dir = options.count("config") ? options.at("config") : "config";
        auto engine = quantum::core::Engine::create(config_dir);
        if (options.count("no-cache")) engine->runtime().set_cache_enabled(false);

        // command-line values are literals: "3" binds as a number, "true" as a bool
        runtime::Value params = runtime::Value::object();
        for (const auto& [key, value] : options) {
            if (key.rfind("param.", 0) == 0) params[key.substr(6)] = runtime::literal(value);
        }

        auto output = engine->render(arguments.front(), params);
        std::cout << output.html() << "\n";
        for (const auto& flash : output.flashes) {
            std::cout << "[Flash] " << flash.type << ": " << flash.message << "\n";
        }
        if (output.redirect) {
            std::cout << "[Redirect] " << output.redirect->status << " " << output.redirect->url << "\n";
        }
        if (!output.return_value.is_null()) {
            std::cout << "[Return] " << output.return_value.dump() << "\n";
        }
        return 0;
    }
};

} // namespace quantum::commands
