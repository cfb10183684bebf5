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
 * @file engine.cpp
 * @brief Implementation of the append-only collection files.
 */

#include "audex/storage/engine.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace audex::storage {

Engine::Engine(std::string base_path) : base_path_(std::move(base_path)) {}

void Engine::init()
{
    if (!fs::exists(base_path_)) {
        fs::create_directories(base_path_);
    }
}

std::string Engine::get_path(const std::string& collection) const
{
    return base_path_ + "/" + collection + ".aud";
}

std::vector<std::string> Engine::list_collections() const
{
    std::vector<std::string> collections;
    if (fs::exists(base_path_)) {
        for (const auto& entry : fs::directory_iterator(base_path_)) {
            if (entry.is_regular_file() && entry.path().extension() == ".aud") {
                collections.push_back(entry.path().stem().string());
            }
        }
    }
    return collections;
}

/**
 * @brief Frame reader loop.
 *
 * 1. Read the 4-byte length header; a short header ends the scan.
 * 2. Read exactly that many payload bytes; a short payload ends the scan.
 */
std::vector<std::string> Engine::load_log(const std::string& collection) const
{
    std::vector<std::string> docs;
    std::ifstream file(get_path(collection), std::ios::binary);
    if (!file.is_open()) {
        return docs;
    }

    while (file.peek() != EOF) {
        uint32_t payload_length = 0;
        file.read(reinterpret_cast<char*>(&payload_length), sizeof(payload_length));
        if (file.gcount() < static_cast<std::streamsize>(sizeof(payload_length))) {
            break;
        }

        std::string buffer;
        buffer.resize(payload_length);
        file.read(&buffer[0], payload_length);

        if (file.gcount() != static_cast<std::streamsize>(payload_length)) {
            break;
        }
        docs.push_back(std::move(buffer));
    }
    return docs;
}

bool Engine::append(const std::string& collection, const std::vector<std::string>& raw_docs)
{
    if (raw_docs.empty())
        return true;

    std::ofstream file(get_path(collection), std::ios::binary | std::ios::app);
    if (!file.is_open()) {
        return false;
    }

    for (const auto& doc : raw_docs) {
        uint32_t length = static_cast<uint32_t>(doc.size());
        file.write(reinterpret_cast<const char*>(&length), sizeof(length));
        file.write(doc.data(), length);
    }

    file.flush();
    return file.good();
}

} // namespace audex::storage
