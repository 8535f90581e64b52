//
// Created by gregorian-rayne on 1/22/26.
//

#include "depmap/cli/commands/command.hpp"
#include "depmap/version.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace depmap::cli
{
    // ============================================================================
    // ParsedArgs
    // ============================================================================

    void ParsedArgs::set(const std::string& name, const std::string& value) {
        values_[name] = value;
    }

    void ParsedArgs::set_flag(const std::string& name) {
        flags_.insert(name);
    }

    void ParsedArgs::add_positional(const std::string& value) {
        positional_.push_back(value);
    }

    bool ParsedArgs::has(const std::string& name) const {
        return values_.contains(name) || flags_.contains(name);
    }

    std::optional<std::string> ParsedArgs::get(const std::string& name) const {
        if (const auto it = values_.find(name); it != values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::string ParsedArgs::get_or(const std::string& name, const std::string& fallback) const {
        return get(name).value_or(fallback);
    }

    std::optional<int> ParsedArgs::get_int(const std::string& name) const {
        const auto it = values_.find(name);
        if (it == values_.end()) {
            return std::nullopt;
        }

        const std::string& text = it->second;
        int parsed = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
        if (ec != std::errc{} || ptr != text.data() + text.size()) {
            return std::nullopt;
        }
        return parsed;
    }

    bool ParsedArgs::get_flag(const std::string& name) const {
        return flags_.contains(name);
    }

    std::optional<Verbosity> verbosity_from_string(const std::string_view str) noexcept {
        if (str == "quiet") return Verbosity::Quiet;
        if (str == "normal") return Verbosity::Normal;
        if (str == "verbose") return Verbosity::Verbose;
        if (str == "debug") return Verbosity::Debug;
        return std::nullopt;
    }

    // ============================================================================
    // Command
    // ============================================================================

    std::string Command::usage() const {
        std::ostringstream ss;
        ss << "Usage: " << PROJECT_SHORT_NAME << " " << name();
        for (const auto& def : arguments()) {
            if (def.required) {
                ss << " --" << def.name << " " << def.value_name;
            }
        }
        ss << " [OPTIONS]";
        return ss.str();
    }

    std::string Command::validate(const ParsedArgs& args) const {
        for (const auto& def : arguments()) {
            if (def.required && !args.has(def.name)) {
                return "Missing required option --" + def.name;
            }
        }
        return "";
    }

    void Command::print_help() const {
        const auto defs = arguments();

        // "--name VALUE" spellings, padded to the widest one
        std::vector<std::string> spellings;
        std::size_t width = std::string_view("--no-color").size();
        for (const auto& def : defs) {
            std::string spelling = "--" + def.name;
            if (def.takes_value) {
                spelling += " " + def.value_name;
            }
            width = std::max(width, spelling.size());
            spellings.push_back(std::move(spelling));
        }

        auto option_line = [&](const char short_name, const std::string& spelling, const std::string_view text) {
            std::cout << "  " << (short_name ? std::string{'-', short_name, ','} : std::string("   "))
                      << " " << std::left << std::setw(static_cast<int>(width + 2)) << spelling << text;
        };

        std::cout << description() << "\n\n" << usage() << "\n\n";

        if (!defs.empty()) {
            std::cout << "Options:\n";
            for (std::size_t i = 0; i < defs.size(); ++i) {
                const auto& def = defs[i];
                option_line(def.short_name, spellings[i], def.description);
                if (!def.default_value.empty()) {
                    std::cout << " (default: " << def.default_value << ")";
                }
                if (def.required) {
                    std::cout << " [required]";
                }
                std::cout << "\n";
            }
            std::cout << "\n";
        }

        std::cout << "Common options:\n";
        option_line('h', "--help", "Show this help\n");
        option_line('v', "--verbose", "List parse failures and effective settings\n");
        option_line('q', "--quiet", "Print results and errors only\n");
        option_line(0, "--no-color", "Disable ANSI colors\n");
    }

    void Command::print(const std::string_view msg) const {
        if (!is_quiet()) {
            std::cout << msg << "\n";
        }
    }

    void Command::print_error(const std::string_view msg) {
        std::cerr << "error: " << msg << "\n";
    }

    void Command::print_warning(const std::string_view msg) const {
        if (!is_quiet()) {
            std::cerr << "warning: " << msg << "\n";
        }
    }

    void Command::print_verbose(const std::string_view msg) const {
        if (is_verbose()) {
            std::cout << msg << "\n";
        }
    }

    void Command::print_debug(const std::string_view msg) const {
        if (verbosity_ >= Verbosity::Debug) {
            std::cout << "[DEBUG] " << msg << "\n";
        }
    }

    // ============================================================================
    // CommandRegistry
    // ============================================================================

    CommandRegistry& CommandRegistry::instance() {
        static CommandRegistry registry;
        return registry;
    }

    void CommandRegistry::register_command(std::unique_ptr<Command> cmd) {
        std::string key(cmd->name());
        commands_.try_emplace(std::move(key), std::move(cmd));
    }

    Command* CommandRegistry::find(const std::string_view name) const {
        const auto it = commands_.find(name);
        return it == commands_.end() ? nullptr : it->second.get();
    }

    std::vector<Command*> CommandRegistry::list() const {
        std::vector<Command*> result;
        result.reserve(commands_.size());
        for (const auto& [name, cmd] : commands_) {
            result.push_back(cmd.get());
        }
        return result;
    }

    // ============================================================================
    // Argument parsing
    // ============================================================================

    namespace {

        constexpr std::array<std::string_view, 5> COMMON_FLAGS{"help", "verbose", "quiet", "json", "no-color"};

        std::optional<std::string> common_short_flag(const char c) {
            switch (c) {
                case 'h': return "help";
                case 'v': return "verbose";
                case 'q': return "quiet";
                default:  return std::nullopt;
            }
        }

        class ArgumentParser {
        public:
            ArgumentParser(const std::vector<std::string>& args, const std::vector<ArgDef>& defs)
                : args_(args) {
                for (const auto& def : defs) {
                    by_name_[def.name] = &def;
                    if (def.short_name) {
                        by_short_[def.short_name] = &def;
                    }
                    if (!def.default_value.empty()) {
                        result_.args.set(def.name, def.default_value);
                    }
                }
            }

            ParseResult run() {
                bool options_ended = false;
                for (pos_ = 0; pos_ < args_.size() && result_.success; ++pos_) {
                    const std::string& arg = args_[pos_];
                    if (arg.empty()) {
                        continue;
                    }
                    if (options_ended || arg.size() == 1 || arg[0] != '-') {
                        result_.args.add_positional(arg);
                    } else if (arg == "--") {
                        options_ended = true;
                    } else if (arg[1] == '-') {
                        parse_long(arg.substr(2));
                    } else {
                        parse_short(arg);
                    }
                }
                return std::move(result_);
            }

        private:
            void parse_long(std::string name) {
                std::optional<std::string> inline_value;
                if (const auto eq = name.find('='); eq != std::string::npos) {
                    inline_value = name.substr(eq + 1);
                    name.resize(eq);
                }

                const auto it = by_name_.find(name);
                if (it == by_name_.end()) {
                    if (std::ranges::find(COMMON_FLAGS, name) != COMMON_FLAGS.end()) {
                        result_.args.set_flag(name);
                    } else {
                        fail("Unknown option: --" + name);
                    }
                    return;
                }

                if (!it->second->takes_value) {
                    result_.args.set_flag(name);
                    return;
                }

                std::string value = inline_value.value_or("");
                if (!inline_value && pos_ + 1 < args_.size()) {
                    value = args_[++pos_];
                }
                if (value.empty()) {
                    fail("Option --" + name + " requires a value");
                    return;
                }
                result_.args.set(name, value);
            }

            void parse_short(const std::string& arg) {
                for (std::size_t j = 1; j < arg.size(); ++j) {
                    const char c = arg[j];

                    const auto it = by_short_.find(c);
                    if (it == by_short_.end()) {
                        if (const auto common = common_short_flag(c)) {
                            result_.args.set_flag(*common);
                        } else {
                            fail(std::string("Unknown option: -") + c);
                        }
                        if (!result_.success) {
                            return;
                        }
                        continue;
                    }

                    const ArgDef& def = *it->second;
                    if (!def.takes_value) {
                        result_.args.set_flag(def.name);
                        continue;
                    }

                    // -d3 or -d 3; the value ends the bundle
                    std::string value = arg.substr(j + 1);
                    if (value.empty() && pos_ + 1 < args_.size()) {
                        value = args_[++pos_];
                    }
                    if (value.empty()) {
                        fail(std::string("Option -") + c + " requires a value");
                        return;
                    }
                    result_.args.set(def.name, value);
                    return;
                }
            }

            void fail(std::string message) {
                result_.error = std::move(message);
                result_.success = false;
            }

            const std::vector<std::string>& args_;
            std::map<std::string, const ArgDef*> by_name_;
            std::map<char, const ArgDef*> by_short_;
            ParseResult result_;
            std::size_t pos_ = 0;
        };

    }  // namespace

    ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    ) {
        return ArgumentParser(args, defs).run();
    }
}  // namespace depmap::cli
