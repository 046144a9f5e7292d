// Shaderlay - Configuration Implementation

#include <shaderlay/config.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace shaderlay {

ConfigStore::ConfigStore(fs::path path, fs::path defaultsPath)
    : m_path(std::move(path))
    , m_defaultsPath(std::move(defaultsPath)) {
}

json ConfigStore::toJson(const AppConfig& config) {
    json data = json::object();
    data["opacityPercent"] = config.opacityPercent;
    data["timeScale"] = config.timeScale;
    data["frameRate"] = config.frameRate ? json(*config.frameRate) : json(nullptr);
    data["showWindowInTaskbar"] = config.showWindowInTaskbar;
    data["showSettingsOnWindowFocused"] = config.showSettingsOnWindowFocused;
    return data;
}

AppConfig ConfigStore::fromJson(const json& data, bool& migrated) {
    AppConfig config;
    migrated = false;

    if (data.contains("opacityPercent") && data["opacityPercent"].is_number()) {
        double value = data["opacityPercent"].get<double>();
        config.opacityPercent = std::clamp(static_cast<int>(std::lround(value)), 0, 100);
    }
    if (data.contains("timeScale") && data["timeScale"].is_number()) {
        config.timeScale = data["timeScale"].get<double>();
    }
    if (data.contains("frameRate") && data["frameRate"].is_number()) {
        double fps = data["frameRate"].get<double>();
        if (fps > 0.0) config.frameRate = fps;
    }
    if (data.contains("showWindowInTaskbar") && data["showWindowInTaskbar"].is_boolean()) {
        config.showWindowInTaskbar = data["showWindowInTaskbar"].get<bool>();
    } else if (data.contains("showInTaskbar") && data["showInTaskbar"].is_boolean()) {
        // Older configs used showInTaskbar
        config.showWindowInTaskbar = data["showInTaskbar"].get<bool>();
        migrated = true;
    }
    if (data.contains("showSettingsOnWindowFocused") && data["showSettingsOnWindowFocused"].is_boolean()) {
        config.showSettingsOnWindowFocused = data["showSettingsOnWindowFocused"].get<bool>();
    }
    return config;
}

bool ConfigStore::load() {
    m_error.clear();
    std::error_code ec;

    if (!fs::exists(m_path, ec)) {
        if (m_path.has_parent_path()) {
            fs::create_directories(m_path.parent_path(), ec);
        }
        if (!m_defaultsPath.empty() && fs::exists(m_defaultsPath, ec)) {
            fs::copy_file(m_defaultsPath, m_path, fs::copy_options::overwrite_existing, ec);
            if (ec) {
                std::cerr << "[Config] Failed to copy " << m_defaultsPath << ": " << ec.message() << std::endl;
            } else {
                std::cout << "[Config] Created " << m_path << " from defaults" << std::endl;
            }
        }
        if (!fs::exists(m_path, ec)) {
            m_config = AppConfig{};
            save();
            return true;
        }
    }

    std::ifstream file(m_path);
    if (!file.is_open()) {
        m_error = "Failed to open " + m_path.string();
        std::cerr << "[Config] " << m_error << ", using defaults" << std::endl;
        m_config = AppConfig{};
        return false;
    }

    try {
        json data;
        file >> data;
        if (!data.is_object()) {
            throw std::runtime_error("expected a JSON object");
        }

        bool migrated = false;
        m_config = fromJson(data, migrated);
        file.close();
        if (migrated) {
            std::cout << "[Config] Migrated showInTaskbar to showWindowInTaskbar" << std::endl;
            save();
        }
        std::cout << "[Config] Loaded " << m_path << std::endl;
        return true;
    } catch (const std::exception& e) {
        m_error = std::string("Malformed config: ") + e.what();
        std::cerr << "[Config] " << m_error << ", resetting " << m_path << " to defaults" << std::endl;
        file.close();
        m_config = AppConfig{};
        save();
        return false;
    }
}

bool ConfigStore::save() {
    std::error_code ec;
    if (m_path.has_parent_path()) {
        fs::create_directories(m_path.parent_path(), ec);
    }

    std::ofstream file(m_path);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to write: " << m_path << std::endl;
        return false;
    }

    try {
        file << std::setw(2) << toJson(m_config) << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[Config] Write error: " << e.what() << std::endl;
        return false;
    }
}

bool ConfigStore::save(const ConfigUpdate& update) {
    if (update.opacityPercent) m_config.opacityPercent = std::clamp(*update.opacityPercent, 0, 100);
    if (update.timeScale) m_config.timeScale = *update.timeScale;
    if (update.frameRate) m_config.frameRate = *update.frameRate;
    if (update.showWindowInTaskbar) m_config.showWindowInTaskbar = *update.showWindowInTaskbar;
    if (update.showSettingsOnWindowFocused) {
        m_config.showSettingsOnWindowFocused = *update.showSettingsOnWindowFocused;
    }
    return save();
}

} // namespace shaderlay
