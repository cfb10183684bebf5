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
 * @file fixtures.hpp
 * @brief Shared helpers for tests that touch the filesystem.
 */

#pragma once

#include <filesystem>
#include <string>

namespace audex::test {

/**
 * @class TestWorkspace
 * @brief RAII data directory for storage-backed tests.
 *
 * @details
 * - **Setup**: purges the directory so each test starts from an empty store.
 * - **Teardown**: removes it again when the test scope ends.
 */
class TestWorkspace {
  public:
    explicit TestWorkspace(std::string dir) : path(std::move(dir)) { reset(); }
    ~TestWorkspace() { std::filesystem::remove_all(path); }

    TestWorkspace(const TestWorkspace&) = delete;
    TestWorkspace& operator=(const TestWorkspace&) = delete;

    void reset() { std::filesystem::remove_all(path); }

    const std::string path;
};

} // namespace audex::test
