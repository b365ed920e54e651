/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation for media-relay
 */

#include "CommandLineInterface.hpp"
#include "ConfigurationManager.hpp"
#include "../core/CacheAdvisor.hpp"
#include "../core/CrashHandler.hpp"
#include "../core/HttpTransfer.hpp"
#include "../core/LocalTransfer.hpp"
#include "../core/MemoryMonitor.hpp"
#include "../core/PeriodicMonitor.hpp"
#include "../core/PooledPartUploader.hpp"
#include "../core/TransferEngine.hpp"
#include <nlohmann/json.hpp>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <pthread.h>
#include <system_error>

using json = nlohmann::json;

namespace relay {

CommandLineInterface::CommandLineInterface() = default;
CommandLineInterface::~CommandLineInterface() = default;

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("media-relay",
        "Stream large media objects between a remote peer and local storage\n"
        "with bounded memory, page-cache eviction and container-aware memory\n"
        "monitoring.");

    parser.add_command("download", "Download --url into --output, one chunk at a time");
    parser.add_command("upload", "Upload --input to --url (HTTP PUT) or --dest-dir");
    parser.add_command("copy", "Copy --input to --output through the transfer engine");
    parser.add_command("status", "Print a diagnostic memory snapshot as JSON");
    parser.add_command("monitor", "Run the periodic memory monitor in the foreground");
    parser.add_command("init-config", "Write the effective configuration to --write-config");

    parser.add_option("config", "c", "Path to JSON configuration file");
    parser.add_option("url", "u", "Remote URL (download source or upload base)");
    parser.add_option("input", "i", "Local input file");
    parser.add_option("output", "o", "Local output file");
    parser.add_option("dest-dir", "d", "Upload into this directory instead of over HTTP");
    parser.add_option("chunk-size", "", "Bytes per chunk and per eviction window");
    parser.add_option("workers", "w", "Parallel upload workers");
    parser.add_option("interval", "", "Periodic monitor interval in seconds");
    parser.add_option("log-level", "l", "Log level 1-6 (1=errors only, 6=trace)");
    parser.add_option("log-file", "", "Append log output to this file");
    parser.add_option("diagnostic-log", "", "Durable memory diagnostic log path");
    parser.add_option("write-config", "", "Destination for init-config");
    parser.add_flag("no-parallel", "", "Upload sequentially through the part sink");
    parser.add_flag("no-evict", "", "Do not drop transferred ranges from the page cache");
    parser.add_flag("no-crash-handler", "", "Do not install fatal signal handlers");
    parser.add_flag("once", "", "monitor: take a single sample and exit");
    parser.add_flag("print-config", "", "Print the effective configuration before running");
    parser.add_flag("version", "V", "Print the version and exit");

    if (!parser.parse(argc, argv)) {
        parse_exit_code_ = parser.help_requested() ? kExitSuccess : kExitUsage;
        return false;
    }

    if (parser.get_flag("version")) {
        std::cout << "media-relay " << kVersion << "\n";
        parse_exit_code_ = kExitSuccess;
        return false;
    }

    const auto& positional = parser.get_positional();
    if (positional.empty()) {
        std::cerr << "Error: no command given (try --help)" << std::endl;
        parse_exit_code_ = kExitUsage;
        return false;
    }
    if (positional.size() > 1) {
        std::cerr << "Error: unexpected argument: " << positional[1] << std::endl;
        parse_exit_code_ = kExitUsage;
        return false;
    }
    command_ = positional.front();

    if (auto config_file = parser.get("config")) {
        ConfigurationManager manager(config_);
        if (!manager.load_from_file(*config_file)) {
            std::cerr << "Error: could not load configuration from " << *config_file << std::endl;
            parse_exit_code_ = kExitUsage;
            return false;
        }
        config_ = manager.config();
    }

    if (!apply_overrides(parser)) {
        parse_exit_code_ = kExitUsage;
        return false;
    }

    auto problems = ConfigurationManager(config_).validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            std::cerr << "Error: " << problem << std::endl;
        }
        parse_exit_code_ = kExitUsage;
        return false;
    }

    if (!validate_command_arguments()) {
        parse_exit_code_ = kExitUsage;
        return false;
    }
    return true;
}

bool CommandLineInterface::apply_overrides(const SimpleCommandLineParser& parser) {
    if (parser.get("chunk-size")) {
        auto value = parser.get_as<unsigned long long>("chunk-size");
        if (!value || *value == 0) {
            std::cerr << "Error: --chunk-size must be a positive integer" << std::endl;
            return false;
        }
        config_.transfer.chunk_size = static_cast<std::size_t>(*value);
    }
    if (parser.get("workers")) {
        auto value = parser.get_as<unsigned>("workers");
        if (!value || *value == 0) {
            std::cerr << "Error: --workers must be a positive integer" << std::endl;
            return false;
        }
        config_.upload.workers = *value;
    }
    if (parser.get("interval")) {
        auto value = parser.get_as<long>("interval");
        if (!value || *value <= 0) {
            std::cerr << "Error: --interval must be a positive number of seconds" << std::endl;
            return false;
        }
        config_.monitor.interval = std::chrono::seconds(*value);
    }
    if (parser.get("log-level")) {
        auto value = parser.get_as<int>("log-level");
        if (!value || *value < 1 || *value > 6) {
            std::cerr << "Error: --log-level must be between 1 and 6" << std::endl;
            return false;
        }
        config_.log.level = *value;
    }
    if (auto value = parser.get("log-file")) {
        config_.log.log_file = *value;
    }
    if (auto value = parser.get("diagnostic-log")) {
        config_.monitor.diagnostic_log_path = *value;
    }
    if (parser.get_flag("no-parallel")) {
        config_.upload.parallel_enabled = false;
    }
    if (parser.get_flag("no-evict")) {
        config_.transfer.evict_page_cache = false;
    }
    if (parser.get_flag("no-crash-handler")) {
        config_.monitor.install_crash_handler = false;
    }

    url_ = parser.get("url").value_or("");
    input_ = parser.get("input").value_or("");
    output_ = parser.get("output").value_or("");
    dest_dir_ = parser.get("dest-dir").value_or("");
    write_config_path_ = parser.get("write-config").value_or("");
    once_ = parser.get_flag("once");
    print_config_ = parser.get_flag("print-config");
    return true;
}

bool CommandLineInterface::validate_command_arguments() const {
    auto require = [](const std::string& value, const char* option) {
        if (value.empty()) {
            std::cerr << "Error: " << option << " is required" << std::endl;
            return false;
        }
        return true;
    };

    if (command_ == "download") {
        return require(url_, "--url") && require(output_, "--output");
    }
    if (command_ == "upload") {
        if (!require(input_, "--input")) return false;
        if (url_.empty() == dest_dir_.empty()) {
            std::cerr << "Error: upload needs exactly one of --url or --dest-dir" << std::endl;
            return false;
        }
        const std::filesystem::path input(input_);
        if (!dest_dir_.empty() && is_same_file(std::filesystem::path(dest_dir_) / input.filename(), input)) {
            std::cerr << "Error: --dest-dir would overwrite --input" << std::endl;
            return false;
        }
        return true;
    }
    if (command_ == "copy") {
        if (!require(input_, "--input") || !require(output_, "--output")) return false;
        if (is_same_file(input_, output_)) {
            std::cerr << "Error: --output is the same file as --input" << std::endl;
            return false;
        }
        return true;
    }
    if (command_ == "init-config") {
        return require(write_config_path_, "--write-config");
    }
    if (command_ == "status" || command_ == "monitor") {
        return true;
    }

    std::cerr << "Error: unknown command: " << command_ << std::endl;
    return false;
}

bool CommandLineInterface::setup_runtime() {
    if (!Logger::configure(config_.log)) {
        std::cerr << "Warning: could not open log file "
                  << config_.log.log_file.value_or("") << std::endl;
    }

    monitor_ = std::make_unique<MemoryMonitor>(config_.monitor);
    if (monitor_->initialize() == DiagnosticLog::StartState::Failed) {
        logger_.warning("Diagnostic log " + config_.monitor.diagnostic_log_path
                        + " is not writable; durable records are disabled");
    }

    if (config_.monitor.install_crash_handler) {
        crash_handler_ = std::make_unique<CrashHandler>(*monitor_);
        crash_handler_->add_debug_info("command", command_);
        crash_handler_->add_debug_info("version", kVersion);
        crash_handler_->install_handlers();
    }
    return true;
}

int CommandLineInterface::execute() {
    if (command_ == "init-config") {
        return run_write_config();
    }

    if (print_config_) {
        print_config();
    }

    if (!setup_runtime()) {
        return kExitFailure;
    }

    try {
        if (command_ == "download") return run_download();
        if (command_ == "upload") return run_upload();
        if (command_ == "copy") return run_copy();
        if (command_ == "status") return run_status();
        if (command_ == "monitor") return run_monitor();
    } catch (const TransferInputError& e) {
        logger_.error(std::string("Invalid input: ") + e.what());
        return kExitUsage;
    } catch (const std::system_error& e) {
        logger_.error(std::string("I/O error: ") + e.what());
        return kExitFailure;
    } catch (const std::exception& e) {
        logger_.error(std::string("Command failed: ") + e.what());
        return kExitFailure;
    }

    logger_.error("Unknown command: " + command_);
    return kExitUsage;
}

int CommandLineInterface::run(int argc, char* argv[]) {
    if (!parse_arguments(argc, argv)) {
        return parse_exit_code_;
    }
    return execute();
}

ProgressCallback CommandLineInterface::make_progress_logger(const std::string& label) const {
    // Log at each 10% step; the callback is invoked serially with a growing count
    auto next_step = std::make_shared<int>(1);
    return [label, next_step, this](std::uint64_t done, std::uint64_t total) {
        if (total == 0) return;
        int percent = static_cast<int>((done * 100) / total);
        if (percent >= *next_step * 10) {
            logger_.info(label + ": " + std::to_string(percent) + "% ("
                         + std::to_string(done) + " / " + std::to_string(total) + " bytes)");
            *next_step = percent / 10 + 1;
        }
    };
}

int CommandLineInterface::run_download() {
    HttpChunkSource source(url_, config_.transfer);
    TransferEngine engine(*monitor_, nullptr, UploaderCapability::Unavailable("download only"),
                          config_.transfer);

    auto written = engine.download(source, output_, config_.transfer.chunk_size,
                                   make_progress_logger("download " + source.name()));
    std::cout << written.string() << std::endl;
    return kExitSuccess;
}

int CommandLineInterface::run_upload() {
    auto advisor = make_cache_advisor(config_.transfer);

    std::shared_ptr<PartSink> sink;
    if (!dest_dir_.empty()) {
        auto directory_sink = std::make_shared<DirectoryPartSink>(dest_dir_, advisor);
        directory_sink->protect_source(input_);
        sink = directory_sink;
    } else {
        sink = std::make_shared<HttpPartSink>(url_, config_.transfer);
    }

    UploaderCapability capability = UploaderCapability::Unavailable("disabled by configuration");
    if (config_.upload.parallel_enabled) {
        capability = UploaderCapability::Available(std::make_shared<PooledPartUploader>(
            sink, config_.upload.workers, config_.upload.part_size, advisor));
    }

    TransferEngine engine(*monitor_, sink, std::move(capability), config_.transfer, advisor);
    UploadHandle handle = engine.upload(input_, config_.transfer.chunk_size,
                                        make_progress_logger("upload " + std::filesystem::path(input_).filename().string()));

    json result = {
        {"name", handle.name},
        {"size", handle.size},
        {"parts", handle.parts},
        {"location", handle.location}
    };
    std::cout << result.dump(2) << std::endl;
    return kExitSuccess;
}

int CommandLineInterface::run_copy() {
    auto advisor = make_cache_advisor(config_.transfer);
    FileChunkSource source(input_, advisor, config_.transfer.chunk_size);
    TransferEngine engine(*monitor_, nullptr, UploaderCapability::Unavailable("copy"),
                          config_.transfer, advisor);

    auto written = engine.download(source, output_, config_.transfer.chunk_size,
                                   make_progress_logger("copy " + source.name()));
    std::cout << written.string() << std::endl;
    return kExitSuccess;
}

int CommandLineInterface::run_status() {
    DiagnosticSnapshot snapshot = monitor_->get_diagnostic_snapshot();
    json j = snapshot;
    std::cout << j.dump(2) << std::endl;
    return kExitSuccess;
}

int CommandLineInterface::run_monitor() {
    PeriodicMonitor periodic(*monitor_, config_.monitor.interval);

    if (once_) {
        Evaluation evaluation = periodic.run_once();
        json result = {
            {"level", alert_level_name(evaluation.level)},
            {"memory_to_check_mb", to_mb(evaluation.memory_to_check)},
            {"status", MemoryMonitor::status_label(evaluation.memory_to_check, config_.monitor.thresholds)},
            {"durable_written", evaluation.durable_written}
        };
        if (auto reclaim = periodic.last_reclaim()) {
            result["reclaim"] = {
                {"released", reclaim->released},
                {"freed_mb", static_cast<double>(reclaim->freed_bytes()) / (1024.0 * 1024.0)}
            };
        }
        std::cout << result.dump(2) << std::endl;
        return kExitSuccess;
    }

    // Block the shutdown signals before the worker thread exists so only sigwait sees them
    sigset_t shutdown_signals;
    sigemptyset(&shutdown_signals);
    sigaddset(&shutdown_signals, SIGINT);
    sigaddset(&shutdown_signals, SIGTERM);
    int rc = pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr);
    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(), "pthread_sigmask");
    }

    periodic.start();
    logger_.info("Monitoring every " + std::to_string(config_.monitor.interval.count())
                 + "s; press Ctrl-C to stop");

    int received = 0;
    rc = sigwait(&shutdown_signals, &received);
    if (rc != 0) {
        periodic.stop();
        throw std::system_error(rc, std::generic_category(), "sigwait");
    }

    logger_.info("Received " + std::string(received == SIGINT ? "SIGINT" : "SIGTERM") + ", stopping");
    periodic.stop();
    logger_.info("Monitor ran " + std::to_string(periodic.iterations()) + " iterations ("
                 + std::to_string(periodic.failed_iterations()) + " failed)");
    return kExitSuccess;
}

int CommandLineInterface::run_write_config() {
    ConfigurationManager manager(config_);
    if (!manager.save_to_file(write_config_path_)) {
        std::cerr << "Error: could not write " << write_config_path_ << std::endl;
        return kExitFailure;
    }
    std::cout << "Configuration written to " << write_config_path_ << std::endl;
    return kExitSuccess;
}

void CommandLineInterface::print_config() const {
    const MemoryThresholds& t = config_.monitor.thresholds;
    std::cout << "\n=== media-relay Configuration ===\n";
    std::cout << "Command: " << command_ << "\n";
    std::cout << "Chunk size: " << config_.transfer.chunk_size << " bytes\n";
    std::cout << "Page-cache eviction: " << (config_.transfer.evict_page_cache ? "enabled" : "disabled") << "\n";
    std::cout << "Parallel upload: "
              << (config_.upload.parallel_enabled ? std::to_string(config_.upload.workers) + " workers" : "disabled")
              << "\n";
    std::cout << "Thresholds (MB): high " << t.high_watermark_mb << ", critical " << t.critical_mb
              << ", spike " << t.spike_mb << ", record floor " << t.record_floor_mb << "\n";
    std::cout << "Monitor interval: " << config_.monitor.interval.count() << "s\n";
    std::cout << "Diagnostic log: " << config_.monitor.diagnostic_log_path << "\n";
    std::cout << "Log level: " << config_.log.level;
    if (config_.log.log_file) {
        std::cout << " (file " << *config_.log.log_file << ")";
    }
    std::cout << "\n=================================\n\n";
}

} // namespace relay
