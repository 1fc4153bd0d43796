#pragma once

#include <functional>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cth {

// ============================================================================
// Options and Parsed Arguments
// ============================================================================

// Every option takes exactly one value: --name <value>, --name=<value> or -n <value>
struct Option {
    std::string name;
    std::string short_name;
    std::string description;
    bool required = false;
};

class Args {
public:
    void set(const std::string& name, const std::string& value) { values_[name] = value; }

    bool has(const std::string& name) const { return values_.count(name) > 0; }

    std::string value(const std::string& name, const std::string& fallback = "") const {
        auto it = values_.find(name);
        return it == values_.end() ? fallback : it->second;
    }

    std::string require(const std::string& name) const {
        auto it = values_.find(name);
        if (it == values_.end()) {
            throw std::runtime_error("Missing required argument: --" + name);
        }
        return it->second;
    }

    /**
     * @throws std::runtime_error unless the whole value is a decimal integer
     */
    int int_value(const std::string& name) const {
        const std::string text = require(name);
        size_t consumed = 0;
        int parsed = 0;
        try {
            parsed = std::stoi(text, &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (consumed == 0 || consumed != text.size()) {
            throw std::runtime_error("--" + name + " expects an integer, got '" + text + "'");
        }
        return parsed;
    }

private:
    std::map<std::string, std::string> values_;
};

struct Command {
    std::string name;
    std::string description;
    std::vector<Option> options;
    std::function<int(const Args&)> handler;
};

// ============================================================================
// Command Dispatcher
// ============================================================================

/**
 * @brief Subcommand dispatcher: `cth <command> [options]`
 *
 * Handlers report failure by throwing; run() prints "Error: <what>" to
 * stderr and returns 1.
 */
class CLI {
public:
    CLI(std::string program_name, std::string version)
        : program_name_(std::move(program_name)), version_(std::move(version)) {}

    void register_command(Command command) {
        const std::string name = command.name;
        commands_[name] = std::move(command);
    }

    int run(int argc, char** argv) const {
        if (argc < 2) {
            print_usage(std::cerr);
            return 1;
        }

        const std::string name = argv[1];
        if (name == "--help" || name == "-h") {
            print_usage(std::cout);
            return 0;
        }
        if (name == "--version" || name == "-v") {
            std::cout << program_name_ << " " << version_ << "\n";
            return 0;
        }

        auto it = commands_.find(name);
        if (it == commands_.end()) {
            std::cerr << "Error: Unknown command: " << name << "\n";
            std::cerr << "Run '" << program_name_ << " --help' for available commands.\n";
            return 1;
        }
        const Command& command = it->second;

        for (int i = 2; i < argc; ++i) {
            const std::string token = argv[i];
            if (token == "--help" || token == "-h") {
                print_command_help(command);
                return 0;
            }
        }

        try {
            Args args = parse(command, argc - 2, argv + 2);
            return command.handler(args);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

private:
    std::string program_name_;
    std::string version_;
    std::map<std::string, Command> commands_;

    static Args parse(const Command& command, int argc, char** argv) {
        auto find_option = [&command](const std::string& token) -> const Option* {
            for (const auto& option : command.options) {
                if (token == "--" + option.name) return &option;
                if (!option.short_name.empty() && token == "-" + option.short_name) return &option;
            }
            return nullptr;
        };

        Args args;
        for (int i = 0; i < argc; ++i) {
            std::string token = argv[i];
            std::string inline_value;
            bool has_inline_value = false;

            auto eq = token.find('=');
            if (token.rfind("--", 0) == 0 && eq != std::string::npos) {
                inline_value = token.substr(eq + 1);
                token = token.substr(0, eq);
                has_inline_value = true;
            }

            const Option* option = find_option(token);
            if (!option) {
                throw std::runtime_error("Unknown argument: " + std::string(argv[i]));
            }

            if (has_inline_value) {
                args.set(option->name, inline_value);
            } else if (i + 1 < argc) {
                args.set(option->name, argv[++i]);
            } else {
                throw std::runtime_error("Argument " + token + " requires a value");
            }
        }

        for (const auto& option : command.options) {
            if (option.required && !args.has(option.name)) {
                throw std::runtime_error("Missing required argument: --" + option.name);
            }
        }
        return args;
    }

    void print_usage(std::ostream& out) const {
        out << program_name_ << " " << version_ << ": causal-temporal hypergraph engine\n\n";
        out << "Usage: " << program_name_ << " <command> [options]\n\nCommands:\n";
        for (const auto& [name, command] : commands_) {
            out << "  " << name << std::string(name.size() < 12 ? 12 - name.size() : 1, ' ')
                << command.description << "\n";
        }
        out << "\nRun '" << program_name_ << " <command> --help' for command options.\n";
    }

    void print_command_help(const Command& command) const {
        std::cout << "Usage: " << program_name_ << " " << command.name;
        for (const auto& option : command.options) {
            if (option.required) std::cout << " --" << option.name << " <value>";
        }
        std::cout << " [options]\n\n" << command.description << "\n\nOptions:\n";
        for (const auto& option : command.options) {
            std::cout << "  --" << option.name;
            if (!option.short_name.empty()) std::cout << ", -" << option.short_name;
            std::cout << " <value>\n      " << option.description
                      << (option.required ? " [required]" : "") << "\n";
        }
    }
};

} // namespace cth
