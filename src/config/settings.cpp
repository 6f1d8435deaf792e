#include <daemux/config/config_helpers.h>
#include <daemux/config/settings.h>

#include <spdlog/spdlog.h>

#include <array>
#include <charconv>

namespace daemux::config {

namespace {

void applyDuration(const ConfigMap& values, const std::string& key, Duration& target) {
    auto it = values.find(key);
    if (it == values.end()) {
        return;
    }
    if (auto ms = parse_ms(it->second)) {
        target = *ms;
    } else {
        spdlog::warn("Ignoring invalid value for {}: '{}'", key, it->second);
    }
}

void applyCount(const ConfigMap& values, const std::string& key, std::size_t& target) {
    auto it = values.find(key);
    if (it == values.end()) {
        return;
    }
    const auto& raw = it->second;
    std::size_t n = 0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), n);
    if (ec != std::errc{} || ptr != raw.data() + raw.size() || n == 0) {
        spdlog::warn("Ignoring invalid value for {}: '{}'", key, raw);
        return;
    }
    target = n;
}

} // namespace

bool is_valid_log_level(const std::string& level) {
    static constexpr std::array<const char*, 8> kLevels = {"trace", "debug", "info",  "warn",
                                                           "warning", "error", "err", "off"};
    for (const char* l : kLevels) {
        if (level == l) {
            return true;
        }
    }
    return false;
}

Settings load_settings(const std::string& configOverride) {
    Settings s;

    auto path = get_config_path(configOverride);
    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec)) {
        auto values = parse_config_file(path);
        s.configFile = path;
        spdlog::debug("Loaded config from {}", path.string());

        if (auto it = values.find("daemon.runtime_dir"); it != values.end() && !it->second.empty()) {
            s.runtimeDir = expand_tilde(it->second);
        }
        applyDuration(values, "daemon.spawn_grace_ms", s.spawnGrace);
        applyDuration(values, "daemon.restart_delay_ms", s.restartDelay);
        applyCount(values, "daemon.max_spawn_attempts", s.maxSpawnAttempts);
        applyDuration(values, "daemon.connect_timeout_ms", s.connectTimeout);
        applyDuration(values, "daemon.kill_grace_ms", s.killGrace);
        applyDuration(values, "daemon.drain_timeout_ms", s.drainTimeout);
        applyDuration(values, "daemon.first_client_timeout_ms", s.firstClientTimeout);
        applyDuration(values, "daemon.exit_linger_ms", s.exitLinger);

        if (auto it = values.find("logging.level"); it != values.end()) {
            if (is_valid_log_level(it->second)) {
                s.logLevel = it->second;
            } else {
                spdlog::warn("Ignoring unknown log level in config: '{}'", it->second);
            }
        }
        if (auto it = values.find("logging.file"); it != values.end() && !it->second.empty()) {
            s.logFile = expand_tilde(it->second).string();
        }
    } else if (!configOverride.empty()) {
        spdlog::warn("Config file not found: {}", path.string());
    }

    if (auto env = env_value("DAEMUX_RUNTIME_DIR")) {
        s.runtimeDir = *env;
    }
    if (auto env = env_value("DAEMUX_LOG_LEVEL")) {
        if (is_valid_log_level(*env)) {
            s.logLevel = *env;
        } else {
            spdlog::warn("Ignoring unknown DAEMUX_LOG_LEVEL '{}'", *env);
        }
    }
    if (auto env = env_value("DAEMUX_LOG_FILE")) {
        s.logFile = *env;
    }

    return s;
}

} // namespace daemux::config
