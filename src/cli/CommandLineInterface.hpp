/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for media-relay
 */

#pragma once

#include "media_relay.hpp"
#include "SimpleCommandLineParser.hpp"
#include "../core/Logger.hpp"
#include "../core/TransferInterfaces.hpp"
#include <memory>
#include <string>

namespace relay {

class MemoryMonitor;
class CrashHandler;

/// Process exit codes
enum ExitCode : int {
    kExitSuccess = 0,
    kExitFailure = 1,
    kExitUsage = 2
};

/**
 * @brief Parses arguments, builds the configuration and runs one subcommand
 */
class CommandLineInterface {
public:
    CommandLineInterface();
    ~CommandLineInterface();

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument vector
     * @return true if a command should run; false after help or a usage error
     */
    bool parse_arguments(int argc, char* argv[]);

    /**
     * @brief Run the parsed command
     * @return Process exit code
     */
    int execute();

    /**
     * @brief parse_arguments followed by execute
     */
    int run(int argc, char* argv[]);

    const RelayConfig& get_config() const { return config_; }
    const std::string& command() const { return command_; }

    /// Exit code to use when parse_arguments returned false
    int parse_exit_code() const { return parse_exit_code_; }

    void print_config() const;

private:
    RelayConfig config_;
    std::string command_;
    std::string url_;
    std::string input_;
    std::string output_;
    std::string dest_dir_;
    std::string write_config_path_;
    bool once_ = false;
    bool print_config_ = false;
    int parse_exit_code_ = kExitSuccess;

    std::unique_ptr<MemoryMonitor> monitor_;
    std::unique_ptr<CrashHandler> crash_handler_;
    Logger logger_{"CLI"};

    bool apply_overrides(const SimpleCommandLineParser& parser);
    bool validate_command_arguments() const;
    bool setup_runtime();

    int run_download();
    int run_upload();
    int run_copy();
    int run_status();
    int run_monitor();
    int run_write_config();

    ProgressCallback make_progress_logger(const std::string& label) const;
};

} // namespace relay
