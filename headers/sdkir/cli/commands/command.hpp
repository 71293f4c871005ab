//
// Created by gregorian-rayne on 1/20/26.
//

#ifndef SDKIR_COMMAND_HPP
#define SDKIR_COMMAND_HPP

/**
 * @file command.hpp
 * @brief Base class for CLI commands.
 *
 * Commands register themselves with the CommandRegistry at static
 * initialization and receive their arguments already parsed against the
 * ArgDef list they declare.
 */

#include "sdkir/config/config.hpp"
#include "sdkir/error.hpp"
#include "sdkir/result.hpp"

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <memory>
#include <unordered_map>

namespace sdkir::cli {

    /**
     * Command-line argument definition.
     */
    struct ArgDef {
        std::string name;           // Long name (--name)
        char short_name = 0;        // Short name (-n)
        std::string description;
        bool required = false;
        bool takes_value = true;    // false for flags
        std::string default_value;
        std::string value_name = "VALUE";
    };

    /**
     * Parsed command-line arguments.
     */
    class ParsedArgs {
    public:
        void set(const std::string& name, const std::string& value);
        void set_flag(const std::string& name);
        void add_positional(const std::string& value);

        [[nodiscard]] bool has(const std::string& name) const;
        [[nodiscard]] std::optional<std::string> get(const std::string& name) const;
        [[nodiscard]] std::string get_or(const std::string& name, const std::string& default_val) const;
        [[nodiscard]] std::optional<int> get_int(const std::string& name) const;
        [[nodiscard]] bool get_flag(const std::string& name) const;
        [[nodiscard]] const std::vector<std::string>& positional() const { return positional_; }

    private:
        std::unordered_map<std::string, std::string> args_;
        std::unordered_map<std::string, bool> flags_;
        std::vector<std::string> positional_;
    };

    enum class Verbosity {
        Quiet,      // Only errors
        Normal,
        Verbose,
        Debug
    };

    enum class OutputFormat {
        Text,
        JSON
    };

    /**
     * Base class for all CLI commands.
     */
    class Command {
    public:
        virtual ~Command() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        /**
         * One-line usage; commands taking positionals override it.
         */
        [[nodiscard]] virtual std::string usage() const;

        [[nodiscard]] virtual std::vector<ArgDef> arguments() const { return {}; }

        /**
         * @return Exit code (0 = success).
         */
        [[nodiscard]] virtual int execute(const ParsedArgs& args) = 0;

        /**
         * @return Error message if invalid, empty if valid.
         */
        [[nodiscard]] virtual std::string validate(const ParsedArgs& args) const;

        void print_help() const;

    protected:
        void set_verbosity(Verbosity v) { verbosity_ = v; }
        void set_output_format(OutputFormat f) { output_format_ = f; }

        /**
         * Applies the common verbosity and --json flags.
         */
        void apply_common_flags(const ParsedArgs& args);

        void print(std::string_view msg) const;
        static void print_error(std::string_view msg);
        void print_warning(std::string_view msg) const;
        void print_info(std::string_view msg) const;
        void print_verbose(std::string_view msg) const;
        void print_debug(std::string_view msg) const;

        [[nodiscard]] bool is_quiet() const { return verbosity_ == Verbosity::Quiet; }
        [[nodiscard]] bool is_verbose() const { return verbosity_ >= Verbosity::Verbose; }
        [[nodiscard]] bool is_json() const { return output_format_ == OutputFormat::JSON; }

    private:
        Verbosity verbosity_ = Verbosity::Normal;
        OutputFormat output_format_ = OutputFormat::Text;
    };

    class CommandRegistry {
    public:
        static CommandRegistry& instance();

        void register_command(std::unique_ptr<Command> cmd);

        [[nodiscard]] Command* find(std::string_view name) const;
        [[nodiscard]] std::vector<Command*> list() const;

    private:
        CommandRegistry() = default;
        std::vector<std::unique_ptr<Command>> commands_;
    };

    struct ParseResult {
        ParsedArgs args;
        std::string error;
        bool success = true;
    };

    /**
     * Parses command-line arguments for a command.
     *
     * @param args Command-line arguments (after command name).
     * @param defs Argument definitions.
     */
    [[nodiscard]] ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    );

    /**
     * Config named by --config, else .sdkir.toml in the working directory,
     * else the defaults.
     */
    [[nodiscard]] Result<config::Config, Error> load_config(const ParsedArgs& args);

}  // namespace sdkir::cli

#endif //SDKIR_COMMAND_HPP
