#pragma once

#include <daemux/client/control_plane.h>
#include <daemux/config/settings.h>
#include <daemux/ipc/channel_identity.h>

#include <optional>
#include <string>
#include <vector>

namespace daemux::cli {

enum class Mode { Stream, Daemon, Kill, Restart, Status };

const char* modeName(Mode mode);

struct Options {
    bool daemon = false;
    bool kill = false;
    bool restart = false;
    bool status = false;
    std::string logLevel;
    std::string logFile;
    std::string configFile;
    std::string runtimeDir;

    ipc::CommandIdentity command;
    // Unrecognized "--" tokens seen before the command path
    std::vector<std::string> ignoredFlags;

    // --daemon > --kill > --restart > --status > stream
    Mode mode() const;
};

struct ParseResult {
    Options options;
    // Set when the process should exit without running (help, usage errors)
    std::optional<int> exitCode;
};

// Parses PROGRAM [options] COMMAND_PATH [ARGS...]. Everything from the first token that does
// not start with "--" on is the command, passed verbatim.
ParseResult parse_options(int argc, char* argv[]);

// Applies CLI overrides on top of file and environment settings
void apply_overrides(config::Settings& settings, const Options& options);

// stderr sink (plus a rotating file when logFile is set); daemon mode tags lines with the pid
void configure_logging(const std::string& level, const std::string& logFile, bool daemonMode);

// Writes to this process's stdout and flushes after every chunk
client::OutputSink stdout_sink();

/**
 * Main CLI application class
 */
class DaemuxCLI {
public:
    DaemuxCLI() = default;

    /**
     * Run the CLI with given arguments; returns the process exit code
     */
    int run(int argc, char* argv[]);

private:
    int runDaemon(const Options& options, const config::Settings& settings,
                  const std::filesystem::path& channel);
    int runClient(const Options& options, const config::Settings& settings,
                  const std::filesystem::path& runtimeDir, const std::filesystem::path& channel);

    std::string argv0_;
};

} // namespace daemux::cli
