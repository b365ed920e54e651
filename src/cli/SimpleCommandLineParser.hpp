/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser for media-relay subcommands
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <sstream>
#include <iostream>
#include <utility>

namespace relay {

/**
 * @brief Simple command-line argument parser
 *
 * Long options (--name VALUE, --name=VALUE), short aliases, flags and
 * positional arguments. The first positional argument is the subcommand.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool has_value;
        std::string default_value;

        // Default constructor for std::map
        Option() : has_value(true) {}

        Option(const std::string& long_name, const std::string& short_name,
               const std::string& description, bool has_value = true,
               const std::string& default_value = "")
            : long_name(long_name), short_name(short_name), description(description),
              has_value(has_value), default_value(default_value) {}
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    void add_option(const std::string& long_name, const std::string& short_name,
                    const std::string& description, const std::string& default_value = "") {
        options_[long_name] = Option(long_name, short_name, description, true, default_value);
        order_.push_back(long_name);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        options_[long_name] = Option(long_name, short_name, description, false);
        order_.push_back(long_name);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }

    void add_command(const std::string& name, const std::string& description) {
        commands_.emplace_back(name, description);
    }

    /**
     * @brief Parse arguments; false on error or when help was requested
     */
    bool parse(int argc, char* argv[]) {
        args_.clear();
        parsed_values_.clear();
        positional_args_.clear();
        help_requested_ = false;

        for (int i = 1; i < argc; ++i) {
            args_.push_back(argv[i]);
        }

        for (const auto& arg : args_) {
            if (arg == "--help" || arg == "-h") {
                help_requested_ = true;
                show_help();
                return false;
            }
        }

        for (size_t i = 0; i < args_.size(); ++i) {
            const std::string& arg = args_[i];

            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);

                // Handle --option=value format
                size_t eq_pos = option_name.find('=');
                std::string value;
                bool inline_value = false;
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                    inline_value = true;
                }

                auto it = options_.find(option_name);
                if (it == options_.end()) {
                    std::cerr << "Unknown option: --" << option_name << std::endl;
                    return false;
                }

                if (it->second.has_value) {
                    if (!inline_value) {
                        if (i + 1 >= args_.size() || args_[i + 1].starts_with("--")) {
                            std::cerr << "Option --" << option_name << " requires a value" << std::endl;
                            return false;
                        }
                        value = args_[++i];
                    }
                    parsed_values_[option_name] = value;
                } else {
                    parsed_values_[option_name] = "true";
                }

            } else if (arg.starts_with("-") && arg.size() > 1) {
                std::string short_name = arg.substr(1);

                auto it = short_to_long_.find(short_name);
                if (it == short_to_long_.end()) {
                    std::cerr << "Unknown option: -" << short_name << std::endl;
                    return false;
                }

                const std::string& option_name = it->second;
                if (options_[option_name].has_value) {
                    if (i + 1 >= args_.size() || args_[i + 1].starts_with("--")) {
                        std::cerr << "Option -" << short_name << " requires a value" << std::endl;
                        return false;
                    }
                    parsed_values_[option_name] = args_[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
            } else {
                positional_args_.push_back(arg);
            }
        }

        // Set default values
        for (const auto& [name, option] : options_) {
            if (parsed_values_.find(name) == parsed_values_.end() && !option.default_value.empty()) {
                parsed_values_[name] = option.default_value;
            }
        }

        return true;
    }

    bool help_requested() const { return help_requested_; }

    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }

        std::istringstream iss(value.value());
        T result;
        if (iss >> result && iss.eof()) {
            return result;
        }
        return std::nullopt;
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    void show_help() const {
        std::cout << description_ << "\n\n";

        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " COMMAND [OPTIONS]\n\n";

        std::cout << "COMMANDS:\n";
        for (const auto& [name, description] : commands_) {
            std::cout << "    " << name << std::string(name.size() < 12 ? 12 - name.size() : 1, ' ')
                      << description << "\n";
        }
        std::cout << "\n";

        std::cout << "OPTIONS:\n";
        for (const auto& name : order_) {
            print_help_section(options_.at(name));
        }
        std::cout << "    -h, --help                Show this help\n\n";

        std::cout << "EXAMPLES:\n";
        std::cout << "    " << program_name_ << " download --url https://host/media/big.mkv --output big.mkv\n";
        std::cout << "    " << program_name_ << " upload --input big.mkv --url https://host/upload --workers 4\n";
        std::cout << "    " << program_name_ << " copy --input /data/in.bin --output /data/out.bin --chunk-size 1048576\n";
        std::cout << "    " << program_name_ << " status --diagnostic-log /var/log/memory_debug.log\n";
        std::cout << "    MEDIA_RELAY_LOG=\"3,MemoryMonitor=5\" " << program_name_ << " monitor --interval 60\n";
    }

private:
    void print_help_section(const Option& option) const {
        std::string left = "    ";
        if (!option.short_name.empty()) {
            left += "-" + option.short_name + ", ";
        }
        left += "--" + option.long_name;
        if (option.has_value) {
            left += " VALUE";
        }
        if (left.size() < 30) {
            left.append(30 - left.size(), ' ');
        } else {
            left += "  ";
        }
        std::cout << left << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }

    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::vector<std::string> order_;
    std::vector<std::pair<std::string, std::string>> commands_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
    bool help_requested_ = false;
};

} // namespace relay
