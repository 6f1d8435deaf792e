#include <daemux/cli/daemux_cli.h>
#include <daemux/client/client_connector.h>
#include <daemux/client/daemon_launcher.h>
#include <daemux/daemon/daemon_server.h>
#include <daemux/ipc/endpoint_transport.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <CLI/CLI.hpp>

#include <algorithm>
#include <csignal>
#include <cstdio>
#include <iostream>

namespace daemux::cli {

using boost::asio::awaitable;

namespace {
constexpr std::size_t kLogFileMaxSize = 10 * 1024 * 1024;
constexpr std::size_t kLogFileMaxFiles = 5;
constexpr int kExitInterrupted = 130;
} // namespace

const char* modeName(Mode mode) {
    switch (mode) {
        case Mode::Stream: return "stream";
        case Mode::Daemon: return "daemon";
        case Mode::Kill: return "kill";
        case Mode::Restart: return "restart";
        case Mode::Status: return "status";
    }
    return "stream";
}

Mode Options::mode() const {
    if (daemon)
        return Mode::Daemon;
    if (kill)
        return Mode::Kill;
    if (restart)
        return Mode::Restart;
    if (status)
        return Mode::Status;
    return Mode::Stream;
}

ParseResult parse_options(int argc, char* argv[]) {
    ParseResult result;
    auto& o = result.options;

    CLI::App app{"daemux - share one long-running process between invocations", "daemux"};
    // Stop at the command path; it and everything after it land in remaining()
    app.prefix_command();
    app.add_flag("--daemon", o.daemon, "Run this invocation as the daemon for COMMAND");
    app.add_flag("--kill", o.kill, "Tell the daemon for COMMAND to kill its child");
    app.add_flag("--restart", o.restart,
                 "Kill the daemon for COMMAND, then start a fresh one and stream it");
    app.add_flag("--status", o.status, "Report whether a daemon for COMMAND is running");
    app.add_option("--log-level", o.logLevel, "Log level (trace, debug, info, warn, error, off)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "warning", "error", "err", "off"}));
    app.add_option("--log-file", o.logFile, "Also write logs to this file (rotated)");
    app.add_option("--config", o.configFile,
                   "Config file (default: $XDG_CONFIG_HOME/daemux/config.toml)");
    app.add_option("--runtime-dir", o.runtimeDir, "Directory holding channel sockets");
    app.footer("COMMAND_PATH [ARGS...]  command to run; every token after the path is passed "
               "through unchanged");

    try {
        app.parse(argc, argv);
    } catch (const CLI::CallForHelp& e) {
        result.exitCode = app.exit(e);
        return result;
    } catch (const CLI::ParseError& e) {
        app.exit(e);
        result.exitCode = 1;
        return result;
    }

    auto rest = app.remaining();
    auto cmd = std::find_if(rest.begin(), rest.end(),
                            [](const std::string& tok) { return tok.rfind("--", 0) != 0; });
    o.ignoredFlags.assign(rest.begin(), cmd);
    if (cmd == rest.end()) {
        std::cerr << "daemux: missing command path\n\n" << app.help();
        result.exitCode = 1;
        return result;
    }
    o.command.path = *cmd;
    o.command.args.assign(std::next(cmd), rest.end());
    return result;
}

void apply_overrides(config::Settings& settings, const Options& options) {
    if (!options.runtimeDir.empty()) {
        settings.runtimeDir = options.runtimeDir;
    }
    if (!options.logLevel.empty()) {
        settings.logLevel = options.logLevel;
    }
    if (!options.logFile.empty()) {
        settings.logFile = options.logFile;
    }
    if (!options.configFile.empty() && settings.configFile.empty()) {
        settings.configFile = options.configFile;
    }
}

void configure_logging(const std::string& level, const std::string& logFile, bool daemonMode) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!logFile.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile, kLogFileMaxSize, kLogFileMaxFiles));
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "daemux: cannot open log file '" << logFile << "': " << e.what()
                      << std::endl;
        }
    }

    auto logger = std::make_shared<spdlog::logger>("daemux", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(level.empty() ? spdlog::level::warn : spdlog::level::from_str(level));
    spdlog::set_pattern(daemonMode ? "[%H:%M:%S] [daemon %P] [%l] %v" : "[%H:%M:%S] [%l] %v");
}

client::OutputSink stdout_sink() {
    return [](std::string_view bytes) {
        std::fwrite(bytes.data(), 1, bytes.size(), stdout);
        std::fflush(stdout);
    };
}

int DaemuxCLI::run(int argc, char* argv[]) {
    argv0_ = argc > 0 ? argv[0] : "daemux";

    auto parsed = parse_options(argc, argv);
    if (parsed.exitCode) {
        return *parsed.exitCode;
    }
    const auto& options = parsed.options;
    const Mode mode = options.mode();

    // Logging goes to stderr from the first message on: stdout carries only the child's bytes
    configure_logging(options.logLevel, "", mode == Mode::Daemon);
    auto settings = config::load_settings(options.configFile);
    apply_overrides(settings, options);
    configure_logging(settings.logLevel, settings.logFile, mode == Mode::Daemon);

    for (const auto& flag : options.ignoredFlags) {
        spdlog::warn("Ignoring unknown option '{}'", flag);
    }

    auto runtimeDir = ipc::resolve_runtime_dir(settings.runtimeDir);
    auto channel = ipc::channel_path(ipc::resolve_endpoint_id(options.command), runtimeDir);
    spdlog::debug("mode={} command={} channel={}", modeName(mode), options.command.path,
                  channel.string());

    if (mode == Mode::Daemon) {
        return runDaemon(options, settings, channel);
    }
    return runClient(options, settings, runtimeDir, channel);
}

int DaemuxCLI::runDaemon(const Options& options, const config::Settings& settings,
                         const std::filesystem::path& channel) {
    boost::asio::io_context io;

    daemon::DaemonServer::Config cfg;
    cfg.command = options.command;
    cfg.channelPath = channel;
    cfg.killGrace = settings.killGrace;
    cfg.drainTimeout = settings.drainTimeout;
    cfg.firstClientTimeout = settings.firstClientTimeout;
    cfg.exitLinger = settings.exitLinger;

    std::shared_ptr<ipc::IEndpointTransport> transport =
        ipc::make_platform_transport(settings.connectTimeout);
    daemon::DaemonServer server(io, std::move(cfg), transport);
    server.on_terminated([&io] { io.stop(); });

    auto started = server.start();
    if (!started) {
        if (started.error().code == ErrorCode::AddressInUse) {
            spdlog::info("Another daemon already serves {}; exiting", channel.string());
            return 0;
        }
        spdlog::error("daemux: {}", started.error().message);
        return 1;
    }

    io.run();
    if (auto code = server.child_exit_code()) {
        spdlog::debug("Child exit status {}", *code);
    }
    return 0;
}

int DaemuxCLI::runClient(const Options& options, const config::Settings& settings,
                         const std::filesystem::path& runtimeDir,
                         const std::filesystem::path& channel) {
    boost::asio::io_context io;

    std::shared_ptr<ipc::IEndpointTransport> transport =
        ipc::make_platform_transport(settings.connectTimeout);
    auto launcher = std::make_shared<client::DetachedDaemonLauncher>(
        client::DetachedDaemonLauncher::self_executable(argv0_.c_str()));
    client::ClientConnector connector(transport, launcher,
                                      client::ConnectorConfig{settings.spawnGrace,
                                                              settings.maxSpawnAttempts});

    client::LaunchRequest request;
    request.command = options.command;
    request.runtimeDir = runtimeDir;
    request.configFile = settings.configFile;
    request.logLevel = settings.logLevel;
    request.logFile = settings.logFile;

    client::ControlConfig controlCfg;
    controlCfg.restartDelay = settings.restartDelay;
    controlCfg.shutdownWait =
        settings.killGrace + settings.drainTimeout * 2 + settings.exitLinger;
    client::ControlPlane control(connector, std::move(request), channel, controlCfg);

    // An interrupt closes our connection; the daemon simply detaches us
    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&control](const boost::system::error_code& ec, int sig) {
        if (!ec) {
            spdlog::debug("Received signal {}; closing connection", sig);
            control.interrupt();
        }
    });

    const Mode mode = options.mode();
    Result<void> result;
    boost::asio::co_spawn(
        io,
        [&]() -> awaitable<void> {
            switch (mode) {
                case Mode::Kill:
                    result = co_await control.kill();
                    break;
                case Mode::Restart:
                    result = co_await control.restart(stdout_sink());
                    break;
                case Mode::Status: {
                    auto running = co_await control.status();
                    if (!running) {
                        result = running.error();
                    } else if (running.value()) {
                        std::cout << "running " << channel.string() << std::endl;
                    } else {
                        std::cout << "stopped" << std::endl;
                    }
                    break;
                }
                default:
                    result = co_await control.stream(stdout_sink());
                    break;
            }
            boost::system::error_code ignored;
            signals.cancel(ignored);
        },
        boost::asio::detached);

    io.run();

    if (control.interrupted()) {
        return kExitInterrupted;
    }
    if (!result) {
        spdlog::error("daemux: {}", result.error().message);
        return 1;
    }
    return 0;
}

} // namespace daemux::cli
