#include <spdlog/spdlog.h>
#include <charconv>
#include <fstream>
#include <corpusdb/config/config_helpers.h>

namespace corpusdb::config {

std::optional<long long> parse_integer(std::string_view s) {
    std::string text(s);
    trim(text);
    long long value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> parse_bool(std::string_view s) {
    std::string text(s);
    trim(text);
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "true" || text == "1" || text == "yes" || text == "on") {
        return true;
    }
    if (text == "false" || text == "0" || text == "no" || text == "off") {
        return false;
    }
    return std::nullopt;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside quotes
        if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos) {
                v.erase(close + 1);
            }
        } else {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // Support both "storage.path" at top level and "[storage] path"
        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }
    if (const char* env = std::getenv("CORPUSDB_CONFIG"); env && *env) {
        return std::filesystem::path(env);
    }
    return get_config_dir() / "config.toml";
}

std::filesystem::path get_config_dir() {
    if (const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME"); xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "corpusdb";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".config" / "corpusdb";
    }
    return std::filesystem::path("~/.config") / "corpusdb";
}

std::filesystem::path get_data_dir() {
    if (const char* xdgData = std::getenv("XDG_DATA_HOME"); xdgData && *xdgData) {
        return std::filesystem::path(xdgData) / "corpusdb";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".local" / "share" / "corpusdb";
    }
    return std::filesystem::current_path() / "corpusdb_data";
}

StoreConfig load_store_config(const std::filesystem::path& config_path) {
    StoreConfig config;
    config.dbPath = get_data_dir() / "corpus.db";

    if (!config_path.empty() && std::filesystem::exists(config_path)) {
        spdlog::debug("Reading store settings from {}", config_path.string());

        if (auto path = parse_config_value(config_path, "storage", "path"); !path.empty()) {
            config.dbPath = path == ":memory:" ? std::filesystem::path(path) : expand_tilde(path);
        }

        auto raw = parse_config_value(config_path, "storage", "busy_timeout_ms");
        if (!raw.empty()) {
            if (auto ms = parse_integer(raw); ms && *ms >= 0) {
                config.busyTimeout = std::chrono::milliseconds(*ms);
            } else {
                spdlog::warn("Ignoring invalid storage.busy_timeout_ms '{}'", raw);
            }
        }

        raw = parse_config_value(config_path, "storage", "enable_wal");
        if (!raw.empty()) {
            if (auto wal = parse_bool(raw)) {
                config.enableWAL = *wal;
            } else {
                spdlog::warn("Ignoring invalid storage.enable_wal '{}'", raw);
            }
        }

        raw = parse_config_value(config_path, "storage", "max_connections");
        if (!raw.empty()) {
            if (auto n = parse_integer(raw); n && *n > 0) {
                config.maxConnections = static_cast<std::size_t>(*n);
            } else {
                spdlog::warn("Ignoring invalid storage.max_connections '{}'", raw);
            }
        }

        if (auto level = parse_config_value(config_path, "logging", "level"); !level.empty()) {
            config.logLevel = level;
        }
    }

    if (const char* env = std::getenv("CORPUSDB_DB_PATH"); env && *env) {
        config.dbPath = env;
    }
    if (const char* env = std::getenv("CORPUSDB_LOG_LEVEL"); env && *env) {
        config.logLevel = env;
    }

    return config;
}

bool apply_log_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str falls back to "off" for names it does not know
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::warn("Unknown log level '{}'", level);
        return false;
    }
    spdlog::set_level(parsed);
    return true;
}

} // namespace corpusdb::config
