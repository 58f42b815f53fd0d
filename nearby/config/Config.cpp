#include "config/Config.hpp"
#include "core/Logger.hpp"
#include "geo/Geohash.hpp"
#include "utils/StringUtils.hpp"

#include <iomanip>

namespace Nearby {

Config& Config::Instance() {
    static Config instance;
    return instance;
}

std::expected<void, ConfigError> Config::Load(const std::filesystem::path& filepath) {
    std::unique_lock lock(m_mutex);
    m_filepath = filepath;

    if (!std::filesystem::exists(filepath)) {
        NEARBY_LOG_WARN("Config file not found: {}. Creating default.", filepath.string());
        auto created = CreateDefault(filepath);
        if (!created) {
            return created;
        }
    }

    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            NEARBY_LOG_ERROR("Failed to open config file: {}", filepath.string());
            return std::unexpected(ConfigError::FileNotFound);
        }

        m_data = nlohmann::json::parse(file);
        NEARBY_LOG_INFO("Loaded configuration from: {}", filepath.string());
        return {};
    } catch (const nlohmann::json::exception& e) {
        NEARBY_LOG_ERROR("Failed to parse config file: {}", e.what());
        return std::unexpected(ConfigError::ParseError);
    }
}

void Config::LoadFromJson(nlohmann::json data) {
    std::unique_lock lock(m_mutex);
    m_data = std::move(data);
}

std::expected<void, ConfigError> Config::Save(const std::filesystem::path& filepath) {
    std::shared_lock lock(m_mutex);
    const auto& path = filepath.empty() ? m_filepath : filepath;
    if (path.empty()) {
        NEARBY_LOG_ERROR("No config file path set, cannot save");
        return std::unexpected(ConfigError::WriteError);
    }

    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            NEARBY_LOG_ERROR("Failed to open config file for writing: {}", path.string());
            return std::unexpected(ConfigError::WriteError);
        }

        file << std::setw(4) << m_data << std::endl;
        NEARBY_LOG_INFO("Saved configuration to: {}", path.string());
        return {};
    } catch (const std::exception& e) {
        NEARBY_LOG_ERROR("Failed to save config file: {}", e.what());
        return std::unexpected(ConfigError::WriteError);
    }
}

std::expected<void, ConfigError> Config::Reload() {
    std::filesystem::path path;
    {
        std::shared_lock lock(m_mutex);
        path = m_filepath;
    }
    if (path.empty()) {
        NEARBY_LOG_WARN("No config file path set, cannot reload");
        return std::unexpected(ConfigError::FileNotFound);
    }
    return Load(path);
}

bool Config::Has(std::string_view key) const {
    std::shared_lock lock(m_mutex);
    return NavigateToKey(key) != nullptr;
}

nlohmann::json Config::GetJson() const {
    std::shared_lock lock(m_mutex);
    return m_data;
}

void Config::Clear() {
    std::unique_lock lock(m_mutex);
    m_data = nlohmann::json::object();
    m_filepath.clear();
}

nlohmann::json* Config::NavigateToKey(std::string_view key, bool create) {
    nlohmann::json* current = &m_data;
    for (const auto& p : StringUtils::Split(key, '.')) {
        if (!current->is_object()) {
            if (!create || !current->is_null()) {
                return nullptr;
            }
            *current = nlohmann::json::object();
        }
        if (!current->contains(p)) {
            if (!create) {
                return nullptr;
            }
            (*current)[p] = nlohmann::json::object();
        }
        current = &(*current)[p];
    }
    return current;
}

const nlohmann::json* Config::NavigateToKey(std::string_view key) const {
    const nlohmann::json* current = &m_data;
    for (const auto& p : StringUtils::Split(key, '.')) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(p);
        if (it == current->end()) {
            return nullptr;
        }
        current = &*it;
    }
    return current;
}

nlohmann::json Config::DefaultJson() {
    nlohmann::json config;

    // Search settings
    config["search"]["geohash_length"] = Geo::kDefaultHashLength;
    config["search"]["radius_buffer"] = 1.01;
    config["search"]["field_path"] = "location";

    // Logging settings
    config["logging"]["level"] = "info";
    config["logging"]["file"] = "";
    config["logging"]["console"] = true;

    return config;
}

std::expected<void, ConfigError> Config::CreateDefault(const std::filesystem::path& filepath) {
    try {
        if (filepath.has_parent_path()) {
            std::filesystem::create_directories(filepath.parent_path());
        }

        std::ofstream file(filepath);
        if (!file.is_open()) {
            NEARBY_LOG_ERROR("Failed to create default config file: {}", filepath.string());
            return std::unexpected(ConfigError::WriteError);
        }
        file << std::setw(4) << DefaultJson() << std::endl;
        NEARBY_LOG_INFO("Created default configuration file: {}", filepath.string());
        return {};
    } catch (const std::filesystem::filesystem_error& e) {
        NEARBY_LOG_ERROR("Failed to create default config file: {}", e.what());
        return std::unexpected(ConfigError::WriteError);
    }
}

SearchConfig SearchConfig::FromConfig(const Config& config) {
    SearchConfig defaults;
    SearchConfig result;
    result.geohashLength = config.Get<int>("search.geohash_length", defaults.geohashLength);
    result.radiusBuffer = config.Get<double>("search.radius_buffer", defaults.radiusBuffer);
    result.fieldPath = config.Get<std::string>("search.field_path", defaults.fieldPath);

    // Stored hashes must be at least as long as the longest query cell
    if (result.geohashLength < Geo::kDefaultHashLength || result.geohashLength > Geo::kMaxHashLength) {
        NEARBY_LOG_WARN("search.geohash_length {} outside [{}, {}], using {}",
                        result.geohashLength, Geo::kDefaultHashLength, Geo::kMaxHashLength,
                        defaults.geohashLength);
        result.geohashLength = defaults.geohashLength;
    }
    if (!(result.radiusBuffer >= 1.0)) {
        NEARBY_LOG_WARN("search.radius_buffer {} below 1.0, using {}",
                        result.radiusBuffer, defaults.radiusBuffer);
        result.radiusBuffer = defaults.radiusBuffer;
    }
    return result;
}

LoggingConfig LoggingConfig::FromConfig(const Config& config) {
    LoggingConfig defaults;
    LoggingConfig result;
    result.level = config.Get<std::string>("logging.level", defaults.level);
    result.file = config.Get<std::string>("logging.file", defaults.file);
    result.console = config.Get<bool>("logging.console", defaults.console);
    return result;
}

void LoggingConfig::Apply() const {
    Logger::Shutdown();
    Logger::Initialize(file, console);
    Logger::SetLevel(spdlog::level::from_str(level));
}

} // namespace Nearby
