#pragma once

#include <expected>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace Nearby {

/**
 * @brief Configuration load/save failures
 */
enum class ConfigError {
    FileNotFound,
    ParseError,
    WriteError
};

[[nodiscard]] constexpr std::string_view ToString(ConfigError error) noexcept {
    switch (error) {
        case ConfigError::FileNotFound: return "FileNotFound";
        case ConfigError::ParseError: return "ParseError";
        case ConfigError::WriteError: return "WriteError";
    }
    return "Unknown";
}

/**
 * @brief JSON-based configuration for search and logging settings
 *
 * Values are addressed by dot-separated keys ("search.geohash_length").
 * Thread-safe; reads take a shared lock.
 */
class Config {
public:
    static Config& Instance();

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * @brief Load configuration from JSON file
     *
     * A missing file is created with default contents first.
     */
    std::expected<void, ConfigError> Load(const std::filesystem::path& filepath);

    /**
     * @brief Replace the configuration with an in-memory document
     */
    void LoadFromJson(nlohmann::json data);

    /**
     * @brief Save current configuration to JSON file
     * @param filepath Path to save to (uses loaded path if empty)
     */
    std::expected<void, ConfigError> Save(const std::filesystem::path& filepath = "");

    /**
     * @brief Reload configuration from the last loaded path
     */
    std::expected<void, ConfigError> Reload();

    /**
     * @brief Get a configuration value with type safety
     * @param key Dot-separated key path (e.g., "search.radius_buffer")
     * @param defaultValue Value to return if the key is missing or has the wrong type
     */
    template<typename T>
    T Get(std::string_view key, const T& defaultValue = T{}) const;

    template<typename T>
    void Set(std::string_view key, const T& value);

    [[nodiscard]] bool Has(std::string_view key) const;

    /**
     * @brief Copy of the underlying JSON document
     */
    [[nodiscard]] nlohmann::json GetJson() const;

    /**
     * @brief Drop all values
     */
    void Clear();

    /**
     * @brief Default configuration document
     */
    [[nodiscard]] static nlohmann::json DefaultJson();

    /**
     * @brief Write the default configuration file
     */
    static std::expected<void, ConfigError> CreateDefault(const std::filesystem::path& filepath);

private:
    Config() = default;
    ~Config() = default;

    nlohmann::json m_data = nlohmann::json::object();
    std::filesystem::path m_filepath;
    mutable std::shared_mutex m_mutex;

    nlohmann::json* NavigateToKey(std::string_view key, bool create = false);
    const nlohmann::json* NavigateToKey(std::string_view key) const;
};

template<typename T>
T Config::Get(std::string_view key, const T& defaultValue) const {
    std::shared_lock lock(m_mutex);
    const auto* node = NavigateToKey(key);
    if (!node || node->is_null()) {
        return defaultValue;
    }

    try {
        return node->get<T>();
    } catch (const nlohmann::json::exception&) {
        return defaultValue;
    }
}

template<typename T>
void Config::Set(std::string_view key, const T& value) {
    std::unique_lock lock(m_mutex);
    auto* node = NavigateToKey(key, true);
    if (node) {
        *node = value;
    }
}

/**
 * @brief Search defaults
 */
struct SearchConfig {
    int geohashLength = 9;
    double radiusBuffer = 1.01;       // Radius inflation for cell-edge effects
    std::string fieldPath = "location";

    [[nodiscard]] static SearchConfig FromConfig(const Config& config);
};

/**
 * @brief Logging defaults
 */
struct LoggingConfig {
    std::string level = "info";
    std::string file;                 // Empty = no file sink
    bool console = true;

    [[nodiscard]] static LoggingConfig FromConfig(const Config& config);

    /**
     * @brief Reinitialize the Logger with these settings
     */
    void Apply() const;
};

} // namespace Nearby
