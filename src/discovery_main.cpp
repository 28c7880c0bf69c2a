// import autoiso
#include "autoiso/answer_patch.hpp"
#include "autoiso/discovery_report.hpp"
#include "autoiso/hw_discovery.hpp"
#include "autoiso/logger.hpp"

#include <getopt.h>  // for getopt_long

#include <cstdint>      // for uint8_t
#include <cstdio>       // for fprintf
#include <string>       // for string
#include <string_view>  // for string_view

#include <spdlog/sinks/stdout_color_sinks.h>  // for stderr_color_mt
#include <spdlog/spdlog.h>                     // for set_default_logger

using namespace std::string_view_literals;

namespace {

enum class Mode : std::uint8_t {
    Patch,
    Report
};

struct Options final {
    Mode mode{Mode::Patch};
    std::string sysfs_root{"/sys"};
    std::string answer_file{"/tmp/answer.toml"};
    std::string callback_url{"http://10.0.4.2:5000/api/device_discovery"};
    autoiso::discovery::BootstrapNetwork network{};
    autoiso::discovery::DiskTieBreak tie_break{autoiso::discovery::DiskTieBreak::Smallest};
    bool verbose{};
};

void print_usage(const char* program) noexcept {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "  -m, --mode <patch|report>     patch the answer file or report to the config server (default: patch)\n"
        "  -s, --sysfs-root <path>       sysfs mount point (default: /sys)\n"
        "  -a, --answer-file <path>      answer file to patch (default: /tmp/answer.toml)\n"
        "  -u, --callback-url <url>      discovery endpoint of the config server\n"
        "      --address <cidr>          bootstrap address of the management NIC (default: 10.0.4.254/24)\n"
        "      --gateway <ip>            bootstrap gateway (default: 10.0.4.1)\n"
        "      --dns <ip>                bootstrap resolver (default: 10.0.4.1)\n"
        "  -t, --tie-break <smallest|first>  choice among equally ranked disks (default: smallest)\n"
        "  -v, --verbose                 debug output\n"
        "  -h, --help                    show this help\n",
        program);
}

auto fail(autoiso::discovery::DiscoveryError error) noexcept -> int {
    spdlog::error("{}", autoiso::discovery::discovery_error_message(error));
    return 1;
}

auto run_patch(const Options& options, const autoiso::discovery::DiscoveredHardware& hardware) noexcept -> int {
    using autoiso::discovery::PatchResult;

    if (hardware.nic_mac.empty()) {
        return fail(autoiso::discovery::DiscoveryError::NoMac);
    }
    switch (autoiso::discovery::patch_answer_file(options.answer_file, hardware.nic_mac, hardware.disk_path)) {
    case PatchResult::Patched:
        spdlog::info("Patched {}: disk {}, management NIC {}", options.answer_file, hardware.disk_path, hardware.nic_mac);
        return 0;
    case PatchResult::FileMissing:
        // installer continues with the answer file it has
        return 0;
    case PatchResult::Failed:
        break;
    }
    spdlog::error("Failed to patch {}", options.answer_file);
    return 1;
}

auto run_report(const Options& options, const autoiso::discovery::DiscoveredHardware& hardware) noexcept -> int {
    if (!autoiso::discovery::bring_up_network(hardware.nic_name, options.network)) {
        return fail(autoiso::discovery::DiscoveryError::NetworkBringUp);
    }
    const autoiso::discovery::DiscoveryReport report{.disk = hardware.disk_path, .mgmt_nic = hardware.nic_name};
    if (auto sent = autoiso::discovery::send_discovery_report(options.callback_url, report); !sent) {
        return fail(sent.error());
    }
    spdlog::info("Reported disk {} and management NIC {} to {}", report.disk, report.mgmt_nic, options.callback_url);
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    // Every message, errors included, goes to standard error.
    auto logger = spdlog::stderr_color_mt("autoiso_discovery");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("%^%v%$");
    autoiso::logger::set_logger(logger);

    enum LongOnly : int {
        OptAddress = 256,
        OptGateway,
        OptDns
    };
    static constexpr option long_options[] = {
        {"mode", required_argument, nullptr, 'm'},
        {"sysfs-root", required_argument, nullptr, 's'},
        {"answer-file", required_argument, nullptr, 'a'},
        {"callback-url", required_argument, nullptr, 'u'},
        {"address", required_argument, nullptr, OptAddress},
        {"gateway", required_argument, nullptr, OptGateway},
        {"dns", required_argument, nullptr, OptDns},
        {"tie-break", required_argument, nullptr, 't'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    Options options{};
    int opt{};
    while ((opt = getopt_long(argc, argv, "m:s:a:u:t:vh", long_options, nullptr)) != -1) {
        const std::string_view arg = (optarg != nullptr) ? optarg : "";
        switch (opt) {
        case 'm':
            if (arg == "patch"sv) {
                options.mode = Mode::Patch;
            } else if (arg == "report"sv) {
                options.mode = Mode::Report;
            } else {
                spdlog::error("Unknown mode '{}'", arg);
                return 1;
            }
            break;
        case 's':
            options.sysfs_root = arg;
            break;
        case 'a':
            options.answer_file = arg;
            break;
        case 'u':
            options.callback_url = arg;
            break;
        case OptAddress:
            options.network.address = arg;
            break;
        case OptGateway:
            options.network.gateway = arg;
            break;
        case OptDns:
            options.network.dns = arg;
            break;
        case 't':
            if (arg == "smallest"sv) {
                options.tie_break = autoiso::discovery::DiskTieBreak::Smallest;
            } else if (arg == "first"sv) {
                options.tie_break = autoiso::discovery::DiskTieBreak::FirstEnumerated;
            } else {
                spdlog::error("Unknown tie-break '{}'", arg);
                return 1;
            }
            break;
        case 'v':
            options.verbose = true;
            break;
        case 'h':
            print_usage(argv[0]);
            return 0;
        default:
            print_usage(argv[0]);
            return 1;
        }
    }
    if (options.verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    auto hardware = autoiso::discovery::discover_hardware(options.sysfs_root, options.tie_break);
    if (!hardware) {
        return fail(hardware.error());
    }

    if (options.mode == Mode::Report) {
        return run_report(options, *hardware);
    }
    return run_patch(options, *hardware);
}
