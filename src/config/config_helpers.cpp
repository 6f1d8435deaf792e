#include <daemux/config/config_helpers.h>

#include <charconv>
#include <fstream>

namespace daemux::config {

std::optional<std::chrono::milliseconds> parse_ms(std::string_view s) {
    std::string value(s);
    trim(value);
    if (value.empty()) {
        return std::nullopt;
    }
    long long ms = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), ms);
    if (ec != std::errc{} || ptr != value.data() + value.size() || ms < 0) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(ms);
}

ConfigMap parse_config_file(const std::filesystem::path& config_path) {
    ConfigMap out;
    std::ifstream file(config_path);
    if (!file) {
        return out;
    }

    std::string line;
    std::string currentSection;

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

        // Remove inline comments outside of quotes
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        out[currentSection.empty() ? k : currentSection + "." + k] = unquote(v);
    }

    return out;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (auto env = env_value("DAEMUX_CONFIG")) {
        return expand_tilde(*env);
    }

    std::filesystem::path configHome;
    if (auto xdg = env_value("XDG_CONFIG_HOME")) {
        configHome = std::filesystem::path(*xdg);
    } else if (auto home = env_value("HOME")) {
        configHome = std::filesystem::path(*home) / ".config";
    } else {
        return {};
    }

    return configHome / "daemux" / "config.toml";
}

} // namespace daemux::config
