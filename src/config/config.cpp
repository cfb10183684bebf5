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
 * @file config.cpp
 * @brief cJSON-backed configuration parsing.
 */

#include "audex/config/config.hpp"

#include "audex/audit/errors.hpp"

#include <cJSON.h>
#include <fstream>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>

namespace audex::config {

using audit::ConfigurationError;
using infra::Logger;
using infra::LogLevel;

namespace {

using Document = std::unique_ptr<cJSON, void (*)(cJSON*)>;

const cJSON* member(const cJSON* obj, const char* key)
{
    return cJSON_GetObjectItemCaseSensitive(obj, key);
}

void read_bool(const cJSON* obj, const char* key, bool& out)
{
    const cJSON* item = member(obj, key);
    if (item == nullptr)
        return;
    if (!cJSON_IsBool(item))
        throw ConfigurationError(std::string("'") + key + "' must be a boolean");
    out = cJSON_IsTrue(item);
}

bool read_string(const cJSON* obj, const char* key, std::string& out)
{
    const cJSON* item = member(obj, key);
    if (item == nullptr)
        return false;
    if (!cJSON_IsString(item))
        throw ConfigurationError(std::string("'") + key + "' must be a string");
    out = item->valuestring;
    return true;
}

const cJSON* read_object(const cJSON* obj, const char* key)
{
    const cJSON* item = member(obj, key);
    if (item != nullptr && !cJSON_IsObject(item))
        throw ConfigurationError(std::string("'") + key + "' must be an object");
    return item;
}

void read_types(const cJSON* obj, const char* key, std::set<audit::LogEntryType>& out)
{
    const cJSON* item = member(obj, key);
    if (item == nullptr)
        return;
    if (!cJSON_IsArray(item))
        throw ConfigurationError(std::string("'") + key + "' must be an array of entry types");

    const cJSON* name = nullptr;
    cJSON_ArrayForEach(name, item)
    {
        if (!cJSON_IsString(name))
            throw ConfigurationError(std::string("'") + key + "' must contain strings");
        auto type = audit::type_from_name(name->valuestring);
        if (!type)
            throw ConfigurationError(std::string("Unknown entry type '") + name->valuestring +
                                     "' in '" + key + "'");
        out.insert(*type);
    }
}

} // namespace

Config Config::load_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open())
        throw ConfigurationError("Cannot open configuration file " + path);

    std::stringstream buffer;
    buffer << in.rdbuf();

    Config config = from_string(buffer.str());
    Logger::log(LogLevel::INFO, "Config: Loaded " + path);
    return config;
}

Config Config::from_string(const std::string& json)
{
    Document root(cJSON_Parse(json.c_str()), cJSON_Delete);
    if (!root || !cJSON_IsObject(root.get()))
        throw ConfigurationError("Configuration is not a JSON object");

    Config config;

    std::string level;
    if (read_string(root.get(), "log_level", level)) {
        try {
            config.log_level = Logger::parse_level(level);
        } catch (const std::invalid_argument& e) {
            throw ConfigurationError(e.what());
        }
    }
    read_string(root.get(), "data_path", config.data_path);

    if (const cJSON* audit = read_object(root.get(), "audit")) {
        read_bool(audit, "save_changed_fields", config.audit.save_changed_fields);
        read_bool(audit, "save_changed_data", config.audit.save_changed_data);
        read_bool(audit, "save_removed_data", config.audit.save_removed_data);
    }

    if (const cJSON* sink = read_object(root.get(), "event_logger")) {
        std::string minimum;
        if (read_string(sink, "minimum_level", minimum))
            config.event_logger.minimum_level = audit::level_from_name(minimum);
        read_types(sink, "blacklist", config.event_logger.blacklist);
        read_types(sink, "whitelist", config.event_logger.whitelist);
    }

    return config;
}

void Config::apply_logging() const
{
    Logger::set_level(log_level);
}

} // namespace audex::config
