/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file config.hpp
 * @brief JSON configuration of the audit layer.
 *
 * @details
 * Example file:
 * @code{.json}
 * {
 *   "log_level": "info",
 *   "data_path": "./audex_data",
 *   "audit": { "save_changed_fields": true, "save_changed_data": false,
 *              "save_removed_data": true },
 *   "event_logger": { "minimum_level": "info", "blacklist": [],
 *                     "whitelist": ["element_created"] }
 * }
 * @endcode
 * Every key is optional. A key that is present must have the right JSON type.
 */

#pragma once

#include "audex/audit/change_capture.hpp"
#include "audex/audit/event_logger.hpp"
#include "audex/infra/logger.hpp"

#include <string>

namespace audex::config {

/**
 * @struct Config
 * @brief Settings for diagnostics, storage location and the capture pipeline.
 */
struct Config {
    infra::LogLevel log_level = infra::LogLevel::INFO;
    std::string data_path = "./audex_data";
    audit::AuditConfig audit;
    audit::EventLoggerConfig event_logger;

    /**
     * @brief Reads and parses a configuration file.
     *
     * @throws audit::ConfigurationError If the file cannot be read or is invalid.
     */
    static Config load_file(const std::string& path);

    /// @throws audit::ConfigurationError On malformed JSON, wrong types or unknown names.
    static Config from_string(const std::string& json);

    /// @brief Applies `log_level` to the diagnostics logger.
    void apply_logging() const;
};

} // namespace audex::config
