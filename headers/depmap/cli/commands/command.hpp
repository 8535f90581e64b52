//
// Created by gregorian-rayne on 1/22/26.
//

#ifndef DEPMAP_COMMAND_HPP
#define DEPMAP_COMMAND_HPP

/**
 * @file command.hpp
 * @brief Subcommand interface, registry and option parsing for the depmap CLI.
 *
 * Every subcommand (scan, tree, circular, ...) derives from Command and
 * registers itself with CommandRegistry from a static registrar in its
 * own translation unit. main() looks the command up, runs
 * parse_arguments() against its option table, validates, then executes.
 */

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace depmap::cli
{
    /**
     * One option of a command's option table.
     */
    struct ArgDef {
        std::string name;           // --name
        char short_name = 0;        // -n, 0 for none
        std::string description;
        bool required = false;
        bool takes_value = true;    // false for flags
        std::string default_value;
        std::string value_name = "VALUE";
    };

    /**
     * Option values, flags and positional arguments of one invocation.
     */
    class ParsedArgs {
    public:
        void set(const std::string& name, const std::string& value);
        void set_flag(const std::string& name);
        void add_positional(const std::string& value);

        /**
         * True when the option was given a value or set as a flag.
         */
        [[nodiscard]] bool has(const std::string& name) const;
        [[nodiscard]] std::optional<std::string> get(const std::string& name) const;
        [[nodiscard]] std::string get_or(const std::string& name, const std::string& fallback) const;

        /**
         * The value as a base-10 int; nullopt when absent or when any
         * character is left over ("3x").
         */
        [[nodiscard]] std::optional<int> get_int(const std::string& name) const;
        [[nodiscard]] bool get_flag(const std::string& name) const;
        [[nodiscard]] const std::vector<std::string>& positional() const { return positional_; }

    private:
        std::map<std::string, std::string> values_;
        std::set<std::string> flags_;
        std::vector<std::string> positional_;
    };

    enum class Verbosity {
        Quiet,      // errors only
        Normal,
        Verbose,    // per-file warnings, effective settings
        Debug       // configuration and scan internals
    };

    /**
     * Parses "quiet", "normal", "verbose" or "debug".
     */
    [[nodiscard]] std::optional<Verbosity> verbosity_from_string(std::string_view str) noexcept;

    class Command {
    public:
        virtual ~Command() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;
        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        /**
         * Usage line plus optional examples, shown by --help and after
         * validation errors.
         */
        [[nodiscard]] virtual std::string usage() const;

        [[nodiscard]] virtual std::vector<ArgDef> arguments() const { return {}; }

        /**
         * @return Process exit code.
         */
        [[nodiscard]] virtual int execute(const ParsedArgs& args) = 0;

        /**
         * @return An error message, empty when the arguments are usable.
         */
        [[nodiscard]] virtual std::string validate(const ParsedArgs& args) const;

        void print_help() const;

        /**
         * "error: <msg>" on stderr, whatever the verbosity.
         */
        static void print_error(std::string_view msg);

    protected:
        void set_verbosity(const Verbosity v) { verbosity_ = v; }

        void print(std::string_view msg) const;
        void print_warning(std::string_view msg) const;
        void print_verbose(std::string_view msg) const;
        void print_debug(std::string_view msg) const;

        [[nodiscard]] Verbosity verbosity() const { return verbosity_; }
        [[nodiscard]] bool is_quiet() const { return verbosity_ == Verbosity::Quiet; }
        [[nodiscard]] bool is_verbose() const { return verbosity_ >= Verbosity::Verbose; }

    private:
        Verbosity verbosity_ = Verbosity::Normal;
    };

    /**
     * Process-wide table of subcommands, keyed by name.
     */
    class CommandRegistry {
    public:
        static CommandRegistry& instance();

        /**
         * Adds a command; a second command with the same name is ignored.
         */
        void register_command(std::unique_ptr<Command> cmd);

        [[nodiscard]] Command* find(std::string_view name) const;

        /**
         * Registered commands in name order.
         */
        [[nodiscard]] std::vector<Command*> list() const;

    private:
        CommandRegistry() = default;
        std::map<std::string, std::unique_ptr<Command>, std::less<>> commands_;
    };

    struct ParseResult {
        ParsedArgs args;
        std::string error;
        bool success = true;
    };

    /**
     * Parses the arguments that follow the command name.
     *
     * Accepts --name VALUE, --name=VALUE, -n VALUE, -nVALUE and bundled
     * short flags (-vq). "--" ends option parsing. --help, --verbose,
     * --quiet, --json and --no-color (and -h, -v, -q) are flags of every
     * command even when the table does not list them. Defaults from the
     * table are applied first.
     */
    [[nodiscard]] ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    );
}  // namespace depmap::cli

#endif //DEPMAP_COMMAND_HPP
