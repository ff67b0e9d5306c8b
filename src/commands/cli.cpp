#include <iostream>
#include <vector>
#include <string>
#include <unordered_map>
#include <quantum/core/command.hpp>
#include <quantum/core/errors.hpp>
#include <quantum/commands/check_command.hpp>
#include <quantum/commands/render_command.hpp>

int main(int argc, char** argv) {
    quantum::core::CommandRegistry registry;
    registry.register_command(std::make_shared<quantum::commands::RenderCommand>());
    registry.register_command(std::make_shared<quantum::commands::CheckCommand>());

    if (argc < 2) {
        std::cout << "Quantum component runtime\n\n";
        std::cout << "Usage:\n  quantum <command> [arguments] [--option=value]\n\n";
        std::cout << "Available commands:\n";
        for (const auto& [name, cmd] : registry.all()) {
            std::cout << "  " << name << "    " << cmd->description() << "\n";
            for (const auto& option : cmd->options()) {
                std::cout << "      --" << option.name << "    " << option.description << "\n";
            }
        }
        return 0;
    }

    std::string command_name = argv[1];
    auto command = registry.get(command_name);

    if (!command) {
        std::cerr << "Command \"" << command_name << "\" not found.\n";
        return 1;
    }

    std::vector<std::string> arguments;
    quantum::core::Command::Options options;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.substr(0, 2) == "--") {
            auto eq_pos = arg.find('=');
            if (eq_pos != std::string::npos) {
                options[arg.substr(2, eq_pos - 2)] = arg.substr(eq_pos + 1);
            } else {
                options[arg.substr(2)] = "true";
            }
        } else {
            arguments.push_back(arg);
        }
    }

    try {
        return command->handle(arguments, options);
    } catch (const quantum::core::Error& e) {
        // what() already leads with file:line:column when the location is known
        std::cerr << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
}
