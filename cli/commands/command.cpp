//
// Created by gregorian-rayne on 1/20/26.
//

#include "sdkir/cli/commands/command.hpp"
#include "sdkir/cli/formatter.hpp"
#include "sdkir/version.hpp"

#include <charconv>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace sdkir::cli {

    namespace {
        bool is_common_flag(const std::string_view name) {
            return name == "help" || name == "verbose" || name == "quiet" || name == "json" || name == "debug";
        }

        const char* common_short_flag(const char c) {
            switch (c) {
                case 'h': return "help";
                case 'v': return "verbose";
                case 'q': return "quiet";
                default: return nullptr;
            }
        }
    }

    // ============================================================================
    // ParsedArgs
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
        return get(name).value_or(default_val);
    }

    std::optional<int> ParsedArgs::get_int(const std::string& name) const {
        const auto val = get(name);
        if (!val) return std::nullopt;

        int parsed = 0;
        const char* end = val->data() + val->size();
        if (auto [ptr, ec] = std::from_chars(val->data(), end, parsed); ec != std::errc{} || ptr != end) {
            return std::nullopt;
        }
        return parsed;
    }

    bool ParsedArgs::get_flag(const std::string& name) const {
        const auto it = flags_.find(name);
        return it != flags_.end() && it->second;
    }

    // ============================================================================
    // Command
    // ============================================================================

    std::string Command::usage() const {
        std::ostringstream ss;
        ss << "Usage: " << PROJECT_SHORT_NAME << " " << name();

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
                std::cout << "--" << std::left << std::setw(20) << arg.name;
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
        std::cout << "  -h, --help                Show this help message\n";
        std::cout << "  -v, --verbose             Enable verbose output\n";
        std::cout << "  -q, --quiet               Only show errors\n";
        std::cout << "  --debug                   Print debug details\n";
        std::cout << "  --json                    Output in JSON format\n";
    }

    void Command::apply_common_flags(const ParsedArgs& args) {
        if (args.get_flag("quiet")) {
            set_verbosity(Verbosity::Quiet);
        } else if (args.get_flag("debug")) {
            set_verbosity(Verbosity::Debug);
        } else if (args.get_flag("verbose")) {
            set_verbosity(Verbosity::Verbose);
        }
        if (args.get_flag("json")) {
            set_output_format(OutputFormat::JSON);
        }
    }

    void Command::print(const std::string_view msg) const {
        if (verbosity_ != Verbosity::Quiet) {
            std::cout << msg << "\n";
        }
    }

    void Command::print_error(const std::string_view msg) {
        if (colors::enabled()) {
            std::cerr << colors::RED << "error: " << colors::RESET << msg << "\n";
        } else {
            std::cerr << "error: " << msg << "\n";
        }
    }

    void Command::print_warning(const std::string_view msg) const {
        if (verbosity_ == Verbosity::Quiet) {
            return;
        }
        if (colors::enabled()) {
            std::cerr << colors::YELLOW << "warning: " << colors::RESET << msg << "\n";
        } else {
            std::cerr << "warning: " << msg << "\n";
        }
    }

    void Command::print_info(const std::string_view msg) const {
        if (verbosity_ != Verbosity::Quiet) {
            std::cerr << "info: " << msg << "\n";
        }
    }

    void Command::print_verbose(const std::string_view msg) const {
        if (verbosity_ >= Verbosity::Verbose) {
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

        const auto fail = [&result](std::string message) {
            result.error = std::move(message);
            result.success = false;
            return result;
        };

        bool options_ended = false;  // after "--"

        for (std::size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg.empty()) continue;

            if (arg == "--" && !options_ended) {
                options_ended = true;
                continue;
            }

            if (arg[0] != '-' || options_ended || arg == "-") {
                result.args.add_positional(arg);
                continue;
            }

            if (arg[1] == '-') {
                std::string name = arg.substr(2);
                std::string value;

                // --name=value
                if (const auto eq_pos = name.find('='); eq_pos != std::string::npos) {
                    value = name.substr(eq_pos + 1);
                    name = name.substr(0, eq_pos);
                }

                const auto it = long_map.find(name);
                if (it == long_map.end()) {
                    if (is_common_flag(name)) {
                        result.args.set_flag(name);
                        continue;
                    }
                    return fail("Unknown option: --" + name);
                }

                if (!it->second->takes_value) {
                    result.args.set_flag(name);
                    continue;
                }
                if (value.empty() && i + 1 < args.size()) {
                    value = args[++i];
                }
                if (value.empty()) {
                    return fail("Option --" + name + " requires a value");
                }
                result.args.set(name, value);
                continue;
            }

            for (std::size_t j = 1; j < arg.size(); ++j) {
                const char c = arg[j];

                if (const char* common = common_short_flag(c)) {
                    result.args.set_flag(common);
                    continue;
                }

                const auto it = short_map.find(c);
                if (it == short_map.end()) {
                    return fail(std::string("Unknown option: -") + c);
                }

                const ArgDef* def = it->second;
                if (!def->takes_value) {
                    result.args.set_flag(def->name);
                    continue;
                }

                std::string value;
                if (j + 1 < arg.size()) {
                    value = arg.substr(j + 1);
                } else if (i + 1 < args.size()) {
                    value = args[++i];
                }
                if (value.empty()) {
                    return fail(std::string("Option -") + c + " requires a value");
                }
                result.args.set(def->name, value);
                break;  // rest of the cluster was the value
            }
        }

        return result;
    }

    Result<config::Config, Error> load_config(const ParsedArgs& args) {
        if (const auto path = args.get("config")) {
            return config::Config::load_from_file(*path);
        }
        std::error_code ec;
        const auto cwd = std::filesystem::current_path(ec);
        if (ec) {
            return Result<config::Config, Error>::failure(
                Error::io_error("Cannot determine working directory: " + ec.message())
            );
        }
        return config::Config::load_default(cwd);
    }

}  // namespace sdkir::cli
