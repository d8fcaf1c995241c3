#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace corpusdb::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

// Integer and boolean parsing; empty on malformed input
std::optional<long long> parse_integer(std::string_view s);
std::optional<bool> parse_bool(std::string_view s);

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Get standard config path ($CORPUSDB_CONFIG, then $XDG_CONFIG_HOME/corpusdb/config.toml)
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user config directory
/// $XDG_CONFIG_HOME/corpusdb or ~/.config/corpusdb
std::filesystem::path get_config_dir();

/// Returns the user data directory (corpus databases)
/// $XDG_DATA_HOME/corpusdb or ~/.local/share/corpusdb
std::filesystem::path get_data_dir();

/**
 * @brief Settings for opening a corpus store
 */
struct StoreConfig {
    std::filesystem::path dbPath;                ///< Corpus file, or ":memory:"
    std::chrono::milliseconds busyTimeout{5000}; ///< SQLite busy timeout
    bool enableWAL = true;                       ///< WAL journal for file stores
    std::size_t maxConnections = 4;              ///< Pooled reader connections
    std::string logLevel = "info";               ///< spdlog level name
};

/**
 * @brief Resolve store settings (defaults -> config file -> environment)
 *
 * Reads [storage] path, busy_timeout_ms, enable_wal, max_connections and
 * [logging] level from the config file, then applies CORPUSDB_DB_PATH and
 * CORPUSDB_LOG_LEVEL. Malformed values keep the previous setting.
 */
StoreConfig load_store_config(const std::filesystem::path& config_path = get_config_path());

/**
 * @brief Set the spdlog default logger level from a level name
 * @return false if the name is not a known level
 */
bool apply_log_level(const std::string& level);

} // namespace corpusdb::config
