#pragma once

// Shaderlay - Configuration
// Persisted user settings (config.json)

#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace shaderlay {

struct AppConfig {
    int opacityPercent = 10;                 // 0..100
    double timeScale = 1.0;
    std::optional<double> frameRate;         // nullopt: one tick per refresh
    bool showWindowInTaskbar = false;
    bool showSettingsOnWindowFocused = false;
};

// Fields left unset keep their current value on save
struct ConfigUpdate {
    std::optional<int> opacityPercent;
    std::optional<double> timeScale;
    std::optional<std::optional<double>> frameRate;
    std::optional<bool> showWindowInTaskbar;
    std::optional<bool> showSettingsOnWindowFocused;
};

/**
 * @brief JSON-backed application configuration.
 *
 * A missing file is seeded from the default config (if one is given and
 * exists), otherwise from built-in defaults. A malformed file falls back
 * to the defaults and is overwritten with them.
 */
class ConfigStore {
public:
    /**
     * @param path Path to config.json.
     * @param defaultsPath Optional config.default.json to seed a missing file.
     */
    explicit ConfigStore(std::filesystem::path path, std::filesystem::path defaultsPath = {});

    // Non-copyable
    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    /**
     * @brief Load the file, creating or repairing it as needed.
     * @return false if the file was malformed and had to be replaced.
     */
    bool load();

    /**
     * @brief Write the current configuration.
     * @return true if the file was written.
     */
    bool save();

    /**
     * @brief Merge `update` into the configuration and write it.
     * @return true if the file was written.
     */
    bool save(const ConfigUpdate& update);

    const AppConfig& config() const { return m_config; }
    const std::filesystem::path& path() const { return m_path; }

    const std::string& lastError() const { return m_error; }
    bool hasError() const { return !m_error.empty(); }

    static nlohmann::json toJson(const AppConfig& config);

    // Reads known keys over the defaults. Sets `migrated` when a legacy
    // key had to be translated.
    static AppConfig fromJson(const nlohmann::json& json, bool& migrated);

private:
    std::filesystem::path m_path;
    std::filesystem::path m_defaultsPath;
    AppConfig m_config;
    std::string m_error;
};

} // namespace shaderlay
