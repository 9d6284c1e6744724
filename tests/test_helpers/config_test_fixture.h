// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include "config.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace gridsnake {

// ConfigTestFixture must be in namespace gridsnake to match friend declaration in Config
class ConfigTestFixture {
  public:
    ConfigTestFixture() {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        temp_dir = std::filesystem::temp_directory_path() /
                   ("gridsnake_test_" + std::to_string(stamp));
    }

    ~ConfigTestFixture() {
        std::error_code ec;
        std::filesystem::remove_all(temp_dir, ec);
    }

  protected:
    Config config;
    std::filesystem::path temp_dir;

    std::string config_path(const std::string& name = "gridsnake.json") const {
        return (temp_dir / name).string();
    }

    void write_file(const std::string& path, const std::string& contents) {
        std::filesystem::create_directories(std::filesystem::path(path).parent_path());
        std::ofstream out(path);
        out << contents;
    }

    json read_file(const std::string& path) const {
        std::ifstream in(path);
        return json::parse(in);
    }

    json& data() {
        return config.data;
    }

    void set_data(const json& value) {
        config.data = value;
    }
};

} // namespace gridsnake
