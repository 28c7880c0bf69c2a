#include "http_server.hpp"  // for HttpServer
#include "routes.hpp"       // for Router
#include "settings.hpp"     // for load_settings

// import autoiso
#include "autoiso/artifact_store.hpp"
#include "autoiso/image_tool.hpp"
#include "autoiso/installer_data.hpp"
#include "autoiso/job_orchestrator.hpp"
#include "autoiso/logger.hpp"

#include <getopt.h>  // for getopt_long

#include <chrono>    // for seconds, days
#include <cstdio>    // for fprintf
#include <memory>    // for make_unique
#include <optional>  // for optional

#include <spdlog/async.h>                    // for create_async
#include <spdlog/common.h>                   // for debug
#include <spdlog/sinks/basic_file_sink.h>    // for basic_file_sink_mt
#include <spdlog/sinks/stdout_color_sinks.h>  // for stdout_color_sink_mt
#include <spdlog/spdlog.h>                   // for set_default_logger, set_level

namespace {

void print_usage(const char* program) noexcept {
    std::fprintf(stderr,
        "Usage: %s [--config <path>]\n"
        "  -c, --config <path>  settings file (default: $AUTOISO_CONFIG or /etc/autoiso/server.toml)\n"
        "  -h, --help           show this help\n",
        program);
}

}  // namespace

int main(int argc, char** argv) {
    std::optional<std::string_view> config_path{};

    static constexpr option long_options[] = {
        {"config", required_argument, nullptr, 'c'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };
    int opt{};
    while ((opt = getopt_long(argc, argv, "c:h", long_options, nullptr)) != -1) {
        switch (opt) {
        case 'c':
            config_path = optarg;
            break;
        case 'h':
            print_usage(argv[0]);
            return 0;
        default:
            print_usage(argv[0]);
            return 1;
        }
    }

    auto settings = server::load_settings(config_path);
    if (!settings) {
        spdlog::error("Failed to load settings");
        return 1;
    }

    // Initialize logger.
    auto logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("autoiso_logger", settings->log_file);
    logger->sinks().push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%r][%^---%L---%$] %v");
    spdlog::set_level(settings->log_level);
    spdlog::flush_every(std::chrono::seconds(5));

    // Set autoiso logger.
    autoiso::logger::set_logger(logger);

    autoiso::store::ArtifactStore store{settings->data_dir};
    if (!store.init()) {
        spdlog::error("Failed to initialize artifact store at '{}'", settings->data_dir);
        spdlog::shutdown();
        return 1;
    }
    if (settings->retention_days > 0) {
        const auto pruned = store.prune_older_than(std::chrono::days{settings->retention_days});
        spdlog::info("Pruned {} expired artifact(s)", pruned);
    }

    int exit_code{0};
    {
        autoiso::job::JobOrchestrator orchestrator{store,
            std::make_unique<autoiso::iso::XorrisoImageTool>(settings->image_tool),
            server::make_orchestrator_settings(*settings)};

        server::Router router{orchestrator, autoiso::installer_data::collect_installer_data()};
        server::HttpServer http_server{router};
        if (http_server.listen(settings->address, settings->port)) {
            http_server.run();
        } else {
            exit_code = 1;
        }
    }

    spdlog::shutdown();
    return exit_code;
}
