#pragma once

#include <daemux/core/types.h>

#include <cstddef>
#include <filesystem>
#include <string>

namespace daemux::config {

// Resolved runtime settings shared by the client and daemon halves
struct Settings {
    std::filesystem::path runtimeDir;
    Duration spawnGrace{200};
    Duration restartDelay{500};
    std::size_t maxSpawnAttempts = 3;
    Duration connectTimeout{2000};
    Duration killGrace{3000};
    Duration drainTimeout{2000};
    Duration firstClientTimeout{5000};
    Duration exitLinger{1000};
    std::string logLevel = "warn";
    std::string logFile;

    std::filesystem::path configFile; // file the values were read from, empty if none
};

/// Defaults, then the config file, then DAEMUX_* environment variables.
/// Command-line overrides are applied by the caller on top of the result.
/// A missing config file is not an error; an unreadable runtime_dir is left empty so the
/// identity resolver picks its own default.
Settings load_settings(const std::string& configOverride = "");

// Accepts trace|debug|info|warn|error|off (and "warning"/"err" spellings)
bool is_valid_log_level(const std::string& level);

} // namespace daemux::config
