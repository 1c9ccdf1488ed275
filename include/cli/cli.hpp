#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace dbx {

// ============================================================================
// Options
// ============================================================================

/**
 * @brief One `--name <value>` (or `-s <value>`) option of a command
 */
struct OptionDef {
    std::string name;
    std::string short_name;
    std::string description;
    bool is_flag = false;       ///< Takes no value; presence means set
};

/**
 * @brief Options given on the command line, by long name
 */
class Args {
public:
    void set(const std::string& name, const std::string& value) { values_[name] = value; }

    bool has(const std::string& name) const { return values_.count(name) > 0; }

    /**
     * @brief Value of an option
     *
     * @throws std::runtime_error if the option was not given
     */
    const std::string& get(const std::string& name) const;

    /**
     * @brief Value of an option parsed as a whole integer
     *
     * @throws std::runtime_error if the option is missing or not an integer
     */
    long long get_integer(const std::string& name) const;

private:
    std::map<std::string, std::string> values_;
};

// ============================================================================
// Commands
// ============================================================================

struct Command {
    std::string name;
    std::string description;
    std::vector<OptionDef> options;
    std::function<int(const Args&)> handler;

    void print_help(const std::string& program_name) const;
};

/**
 * @brief Parse the arguments that follow the command name
 *
 * Accepts `--name value`, `--name=value` and `-s value`; flags take no
 * value. Anything else, positional words included, is rejected.
 *
 * @throws std::runtime_error on an unknown argument or a missing value
 */
Args parse_args(const Command& command, const std::vector<std::string>& arguments);

/**
 * @brief Dispatches `<program> <command> [options]` to registered commands
 */
class CLI {
public:
    CLI(const std::string& program_name, const std::string& version)
        : program_name_(program_name), version_(version) {}

    void register_command(Command command);

    /**
     * @brief Run the command named by argv[1]
     *
     * @return Exit code: the handler's result, or 1 on any error
     */
    int run(int argc, char** argv) const;

    void print_help() const;

private:
    std::string program_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

} // namespace dbx
