#pragma once
#include <quantum/core/command.hpp>
#include <quantum/core/errors.hpp>
#include <quantum/parser/parser.hpp>

#include <iostream>

namespace quantum::commands {

// quantum check <file>... : parses each file and reports the first error in it.
class CheckCommand : public quantum::core::Command {
public:
    std::string name() const override { return "check"; }
    std::string description() const override { return "Parse component files and report syntax errors"; }

    int handle(const std::vector<std::string>& arguments, const Options&) override {
        if (arguments.empty()) {
            std::cerr << "Usage: quantum check <file>...\n";
            return 1;
        }

        quantum::parser::Parser parser;
        int failures = 0;
        for (const auto& file : arguments) {
            try {
                auto unit = parser.parse_file(file);
                std::cout << "OK    " << file << " (" << unit->name() << ")\n";
            } catch (const quantum::core::ParseError& e) {
                ++failures;
                std::cout << "FAIL  " << e.location().to_string() << ": " << e.message() << "\n";
            }
        }
        return failures == 0 ? 0 : 1;
    }
};

} // namespace quantum::commands
