#include "autoiso/io_utils.hpp"

#include <sys/wait.h>  // for WIFEXITED, WEXITSTATUS

#include <cstdio>   // for feof, fgets, pclose, popen
#include <cstdlib>  // for getenv, system

#include <array>   // for array
#include <memory>  // for unique_ptr

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

auto should_log_exec() noexcept -> bool {
    return autoiso::utils::safe_getenv("LOG_EXEC_CMDS") == "1"sv && spdlog::default_logger_raw() != nullptr;
}

auto is_dirty_run() noexcept -> bool {
    return autoiso::utils::safe_getenv("DIRTY_CMD_RUN") == "1"sv;
}

}  // namespace

namespace autoiso::utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view {
    const char* const raw_val = std::getenv(env_name);
    return raw_val != nullptr ? std::string_view{raw_val} : std::string_view{};
}

auto exec(std::string_view command) noexcept -> std::string {
    if (should_log_exec()) {
        spdlog::debug("[exec] cmd := '{}'", command);
    }
    if (is_dirty_run()) {
        return {};
    }

    const std::string cmd{command};
    const std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(cmd.c_str(), "r"), pclose);
    if (!pipe) {
        spdlog::error("popen failed! '{}'", command);
        return "-1";
    }

    std::string result{};
    std::array<char, 128> buffer{};
    while (!feof(pipe.get())) {
        if (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr) {
            result += buffer.data();
        }
    }

    if (result.ends_with('\n')) {
        result.pop_back();
    }

    return result;
}

auto exec_checked(std::string_view command) noexcept -> bool {
    if (should_log_exec()) {
        spdlog::debug("[exec_checked] cmd := '{}'", command);
    }
    if (is_dirty_run()) {
        return true;
    }

    const std::string cmd{command};
    const auto status = std::system(cmd.c_str());
    if (status == -1) {
        spdlog::error("failed to spawn shell for '{}'", command);
        return false;
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

auto shell_quote(std::string_view arg) noexcept -> std::string {
    std::string quoted{"'"};
    for (const char ch : arg) {
        if (ch == '\'') {
            quoted += R"('\'')";
        } else {
            quoted += ch;
        }
    }
    quoted += '\'';
    return quoted;
}

}  // namespace autoiso::utils
