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
 * @file engine.hpp
 * @brief Append-only document log, one file per entity collection.
 *
 * @details
 * Every committed insert, update and delete of an entity becomes one frame in
 * the collection's `.aud` file. Audit log entries are written the same way to
 * the `LogEntry` collection, so they are exactly as durable as the changes they
 * describe.
 */

#pragma once

#include <string>
#include <vector>

namespace audex::storage {

/**
 * @class Engine
 * @brief Physical persistence through length-prefixed frames.
 *
 * Frame layout: `[4-byte little endian length][N bytes UTF-8 JSON]`.
 */
class Engine {
  public:
    /**
     * @param base_path Directory holding the collection files.
     */
    explicit Engine(std::string base_path);

    /**
     * @brief Creates the base directory if missing.
     *
     * @throws std::filesystem::filesystem_error If the directory cannot be created.
     */
    void init();

    /**
     * @brief Reads every complete frame of a collection, oldest first.
     *
     * A truncated trailing frame (torn write) ends the scan.
     *
     * @return Raw JSON documents; empty if the collection file does not exist.
     */
    std::vector<std::string> load_log(const std::string& collection) const;

    /**
     * @brief Appends a batch of documents to a collection with a single open.
     *
     * @return false If the file could not be opened or a write failed.
     */
    bool append(const std::string& collection, const std::vector<std::string>& raw_docs);

    /// @brief Names of the collections present on disk.
    std::vector<std::string> list_collections() const;

    /// @brief Full path of a collection file.
    std::string get_path(const std::string& collection) const;

  private:
    std::string base_path_;
};

} // namespace audex::storage
