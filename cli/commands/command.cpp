//
// Created by gregorian-rayne on 10/13/26.
//

#include "cta/cli/commands/command.hpp"

#include <iostream>
#include <iomanip>
#include <sstream>
#include <algorithm>

namespace cta::cli
{
    namespace {

        /**
         * Options every command accepts without declaring them.
         */
        bool is_common_flag(const std::string_view name) {
            return name == "help" || name == "verbose" || name == "quiet" ||
                   name == "json" || name == "debug";
        }

    }  // namespace

    // ============================================================================
    // ParsedArgs Implementation
    // ============================================================================

    void ParsedArgs::set(const std::string& name, const std::string& value) {
        args_[name] = value;
    }

    void ParsedArgs::set_flag(const std::string& name) {
        flags_[name] = true;
    }

    void ParsedArgs::add_positional(const std::string& value) {
        positional_.push_back(value);
    }

    bool ParsedArgs::has(const std::string& name) const {
        return args_.contains(name) || flags_.contains(name);
    }

    std::optional<std::string> ParsedArgs::get(const std::string& name) const {
        if (const auto it = args_.find(name); it != args_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::string ParsedArgs::get_or(const std::string& name, const std::string& default_val) const {
        const auto val = get(name);
        return val.value_or(default_val);
    }

    bool ParsedArgs::get_flag(const std::string& name) const {
        const auto it = flags_.find(name);
        return it != flags_.end() && it->second;
    }

    // ============================================================================
    // Command Implementation
    // ============================================================================

    std::string Command::usage() const {
        std::ostringstream ss;
        ss << "Usage: cta " << name();

        for (const auto args = arguments(); const auto& arg : args) {
            if (arg.required) {
                ss << " --" << arg.name << " <" << arg.value_name << ">";
            }
        }

        ss << " [OPTIONS]";
        return ss.str();
    }

    std::string Command::validate(const ParsedArgs& args) const {
        for (const auto& def : arguments()) {
            if (def.required && !args.has(def.name)) {
                return "Missing required argument: --" + def.name;
            }
        }
        return "";
    }

    void Command::print_help() const {
        std::cout << description() << "\n\n";
        std::cout << usage() << "\n\n";

        if (const auto args = arguments(); !args.empty()) {
            std::cout << "Options:\n";
            for (const auto& arg : args) {
                std::cout << "  ";
                if (arg.short_name) {
                    std::cout << "-" << arg.short_name << ", ";
                } else {
                    std::cout << "    ";
                }
                std::string flag = arg.name;
                if (arg.takes_value) {
                    flag += " <" + arg.value_name + ">";
                }
                std::cout << "--" << std::left << std::setw(22) << flag;
                std::cout << arg.description;
                if (!arg.default_value.empty()) {
                    std::cout << " (default: " << arg.default_value << ")";
                }
                if (arg.required) {
                    std::cout << " [required]";
                }
                std::cout << "\n";
            }
        }

        std::cout << "\n";
        std::cout << "Common options:\n";
        std::cout << "  -h, --help                  Show this help message\n";
        std::cout << "  -v, --verbose               Enable verbose output\n";
        std::cout << "  -q, --quiet                 Only show errors\n";
        std::cout << "      --debug                 Show debug output\n";
        std::cout << "      --json                  Output in JSON format\n";
    }

    void Command::apply_common_options(const ParsedArgs& args) {
        if (args.get_flag("quiet")) {
            set_verbosity(Verbosity::Quiet);
        } else if (args.get_flag("debug")) {
            set_verbosity(Verbosity::Debug);
        } else if (args.get_flag("verbose")) {
            set_verbosity(Verbosity::Verbose);
        } else {
            set_verbosity(Verbosity::Normal);
        }

        set_output_format(args.get_flag("json") ? OutputFormat::JSON : OutputFormat::Text);
    }

    // Progress and diagnostics go to stderr so that --json output on stdout
    // stays machine readable.

    void Command::print(const std::string_view msg) const {
        if (verbosity_ != Verbosity::Quiet) {
            (is_json() ? std::cerr : std::cout) << msg << "\n";
        }
    }

    void Command::print_error(const std::string_view msg)
    {
        std::cerr << "error: " << msg << "\n";
    }

    void Command::print_warning(const std::string_view msg) const {
        if (verbosity_ != Verbosity::Quiet) {
            std::cerr << "warning: " << msg << "\n";
        }
    }

    void Command::print_verbose(const std::string_view msg) const {
        if (verbosity_ >= Verbosity::Verbose) {
            (is_json() ? std::cerr : std::cout) << msg << "\n";
        }
    }

    void Command::print_debug(const std::string_view msg) const {
        if (verbosity_ >= Verbosity::Debug) {
            std::cerr << "[DEBUG] " << msg << "\n";
        }
    }

    // ============================================================================
    // CommandRegistry Implementation
    // ============================================================================

    CommandRegistry& CommandRegistry::instance() {
        static CommandRegistry instance;
        return instance;
    }

    void CommandRegistry::register_command(std::unique_ptr<Command> cmd) {
        commands_.push_back(std::move(cmd));
    }

    Command* CommandRegistry::find(const std::string_view name) const {
        for (const auto& cmd : commands_) {
            if (cmd->name() == name) {
                return cmd.get();
            }
        }
        return nullptr;
    }

    std::vector<Command*> CommandRegistry::list() const {
        std::vector<Command*> result;
        result.reserve(commands_.size());
        for (const auto& cmd : commands_) {
            result.push_back(cmd.get());
        }
        std::ranges::sort(result, [](const Command* a, const Command* b) {
            return a->name() < b->name();
        });
        return result;
    }

    // ============================================================================
    // Argument Parser
    // ============================================================================

    ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    ) {
        ParseResult result;
        result.success = true;

        // Build lookup maps
        std::unordered_map<std::string, const ArgDef*> long_map;
        std::unordered_map<char, const ArgDef*> short_map;

        for (const auto& def : defs) {
            long_map[def.name] = &def;
            if (def.short_name) {
                short_map[def.short_name] = &def;
            }
            if (!def.default_value.empty()) {
                result.args.set(def.name, def.default_value);
            }
        }

        bool options_ended = false;  // Set to true after seeing "--"

        for (std::size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            if (arg.empty()) continue;

            if (arg == "--" && !options_ended) {
                options_ended = true;
                continue;
            }

            if (arg[0] == '-' && arg.size() > 1 && !options_ended) {
                if (arg[1] == '-') {
                    // Long option
                    std::string name = arg.substr(2);
                    std::optional<std::string> value;

                    // Check for --name=value format
                    if (auto eq_pos = name.find('='); eq_pos != std::string::npos) {
                        value = name.substr(eq_pos + 1);
                        name = name.substr(0, eq_pos);
                    }

                    auto it = long_map.find(name);
                    if (it == long_map.end()) {
                        if (is_common_flag(name) && !value) {
                            result.args.set_flag(name);
                            continue;
                        }
                        result.error = "Unknown option: --" + name;
                        result.success = false;
                        return result;
                    }

                    if (const ArgDef* def = it->second; def->takes_value) {
                        if (!value && i + 1 < args.size()) {
                            value = args[++i];
                        }
                        if (!value || value->empty()) {
                            result.error = "Option --" + name + " requires a value";
                            result.success = false;
                            return result;
                        }
                        result.args.set(name, *value);
                    } else {
                        if (value) {
                            result.error = "Option --" + name + " does not take a value";
                            result.success = false;
                            return result;
                        }
                        result.args.set_flag(name);
                    }
                } else {
                    // Short option(s)
                    for (std::size_t j = 1; j < arg.size(); ++j) {
                        char c = arg[j];

                        // Common options
                        if (c == 'h') {
                            result.args.set_flag("help");
                            continue;
                        }
                        if (c == 'v') {
                            result.args.set_flag("verbose");
                            continue;
                        }
                        if (c == 'q') {
                            result.args.set_flag("quiet");
                            continue;
                        }

                        auto it = short_map.find(c);
                        if (it == short_map.end()) {
                            result.error = std::string("Unknown option: -") + c;
                            result.success = false;
                            return result;
                        }

                        if (const ArgDef* def = it->second; def->takes_value) {
                            std::string value;
                            if (j + 1 < arg.size()) {
                                value = arg.substr(j + 1);
                            } else if (i + 1 < args.size()) {
                                value = args[++i];
                            }
                            if (value.empty()) {
                                result.error = std::string("Option -") + c + " requires a value";
                                result.success = false;
                                return result;
                            }
                            result.args.set(def->name, value);
                            break;  // Rest of short options consumed as value
                        } else {
                            result.args.set_flag(def->name);
                        }
                    }
                }
            } else {
                result.args.add_positional(arg);
            }
        }

        return result;
    }

    int run_command(Command& cmd, const std::vector<std::string>& args) {
        auto parsed = parse_arguments(args, cmd.arguments());
        if (!parsed.success) {
            Command::print_error(parsed.error);
            std::cerr << "Run 'cta " << cmd.name() << " --help' for usage.\n";
            return EXIT_USAGE;
        }

        if (parsed.args.get_flag("help")) {
            cmd.print_help();
            return EXIT_OK;
        }

        if (const std::string problem = cmd.validate(parsed.args); !problem.empty()) {
            Command::print_error(problem);
            std::cerr << "Run 'cta " << cmd.name() << " --help' for usage.\n";
            return EXIT_USAGE;
        }

        return cmd.execute(parsed.args);
    }

}  // namespace cta::cli
