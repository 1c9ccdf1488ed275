#include "cli/cli.hpp"
#include <iostream>
#include <stdexcept>

namespace dbx {

// ============================================================================
// Args
// ============================================================================

const std::string& Args::get(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        throw std::runtime_error("Missing argument: --" + name);
    }
    return it->second;
}

long long Args::get_integer(const std::string& name) const {
    const std::string& text = get(name);
    try {
        size_t used = 0;
        long long parsed = std::stoll(text, &used);
        if (used == text.size()) return parsed;
    } catch (const std::logic_error&) {
        // invalid_argument / out_of_range, reported below
    }
    throw std::runtime_error("--" + name + " expects an integer, got '" + text + "'");
}

// ============================================================================
// Command
// ============================================================================

void Command::print_help(const std::string& program_name) const {
    std::cout << "\nUsage: " << program_name << " " << name << " [options]\n\n";
    std::cout << description << "\n\n";
    std::cout << "Options:\n";
    for (const auto& option : options) {
        std::cout << "  --" << option.name;
        if (!option.short_name.empty()) {
            std::cout << ", -" << option.short_name;
        }
        if (!option.is_flag) {
            std::cout << " <value>";
        }
        std::cout << "\n      " << option.description << "\n";
    }
    std::cout << "\n";
}

Args parse_args(const Command& command, const std::vector<std::string>& arguments) {
    std::map<std::string, const OptionDef*> by_name;
    for (const auto& option : command.options) {
        by_name["--" + option.name] = &option;
        if (!option.short_name.empty()) {
            by_name["-" + option.short_name] = &option;
        }
    }

    Args args;
    for (size_t i = 0; i < arguments.size(); ++i) {
        std::string arg = arguments[i];

        // --name=value
        auto eq_pos = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq_pos != std::string::npos) {
            auto it = by_name.find(arg.substr(0, eq_pos));
            if (it != by_name.end() && !it->second->is_flag) {
                args.set(it->second->name, arg.substr(eq_pos + 1));
                continue;
            }
        }

        auto it = by_name.find(arg);
        if (it == by_name.end()) {
            throw std::runtime_error("Unknown argument: " + arg);
        }

        const OptionDef& option = *it->second;
        if (option.is_flag) {
            args.set(option.name, "true");
        } else {
            if (i + 1 >= arguments.size()) {
                throw std::runtime_error("Argument " + arg + " requires a value");
            }
            args.set(option.name, arguments[++i]);
        }
    }
    return args;
}

// ============================================================================
// CLI
// ============================================================================

void CLI::register_command(Command command) {
    std::string name = command.name;
    commands_[name] = std::move(command);
}

int CLI::run(int argc, char** argv) const {
    if (argc < 2) {
        print_help();
        return 1;
    }

    std::string command_name = argv[1];
    if (command_name == "--help" || command_name == "-h") {
        print_help();
        return 0;
    }
    if (command_name == "--version" || command_name == "-v") {
        std::cout << program_name_ << " version " << version_ << "\n";
        return 0;
    }

    auto it = commands_.find(command_name);
    if (it == commands_.end()) {
        std::cerr << "Unknown command: " << command_name << "\n";
        std::cerr << "Run '" << program_name_ << " --help' for available commands.\n";
        return 1;
    }
    const Command& command = it->second;

    std::vector<std::string> arguments(argv + 2, argv + argc);
    for (const auto& arg : arguments) {
        if (arg == "--help" || arg == "-h") {
            command.print_help(program_name_);
            return 0;
        }
    }

    Args args;
    try {
        args = parse_args(command, arguments);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        command.print_help(program_name_);
        return 1;
    }

    try {
        return command.handler(args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

void CLI::print_help() const {
    std::cout << program_name_ << " - DBpedia subgraph extractor\n\n";
    std::cout << "Usage: " << program_name_ << " <dataset> [options]\n\n";
    std::cout << "Datasets:\n";
    for (const auto& [name, command] : commands_) {
        std::cout << "  " << name;
        for (size_t i = name.length(); i < 16; ++i) std::cout << " ";
        std::cout << command.description << "\n";
    }
    std::cout << "\nRun '" << program_name_ << " <dataset> --help' for the options.\n";
}

} // namespace dbx
