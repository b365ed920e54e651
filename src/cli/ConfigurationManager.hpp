/**
 * @file ConfigurationManager.hpp
 * @brief JSON configuration file management for media-relay
 */

#pragma once

#include "media_relay.hpp"
#include "../core/Logger.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <utility>
#include <vector>

namespace relay {

/**
 * @brief Loads, validates and saves RelayConfig as JSON
 *
 * Missing keys keep their defaults. A key with the wrong type is reported
 * as a warning and also keeps its default.
 */
class ConfigurationManager {
public:
    ConfigurationManager() = default;
    explicit ConfigurationManager(RelayConfig config) : config_(std::move(config)) {}

    /**
     * @brief Load configuration from file
     * @param filename Path to configuration file
     * @return true if the file parsed and the result is valid
     */
    bool load_from_file(const std::string& filename);

    /**
     * @brief Apply a parsed JSON document on top of the current values
     * @return true if the result is valid
     */
    bool load_from_json(const nlohmann::json& document);

    /**
     * @brief Save configuration to file
     * @param filename Path to configuration file
     * @return true if successful, false otherwise
     */
    bool save_to_file(const std::string& filename) const;

    /**
     * @brief Problems that make the configuration unusable; empty when valid
     */
    std::vector<std::string> validate() const;

    const RelayConfig& config() const { return config_; }
    RelayConfig& config() { return config_; }

    static nlohmann::json to_json(const RelayConfig& config);

private:
    RelayConfig config_;
    Logger logger_{"ConfigurationManager"};
};

} // namespace relay
