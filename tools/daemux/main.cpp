#include <daemux/cli/daemux_cli.h>

#include <spdlog/spdlog.h>

#include <exception>

int main(int argc, char* argv[]) {
    try {
        daemux::cli::DaemuxCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("daemux: {}", e.what());
        return 1;
    }
}
