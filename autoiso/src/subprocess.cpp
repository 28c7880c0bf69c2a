#include "autoiso/subprocess.hpp"
#include "autoiso/io_utils.hpp"
#include "autoiso/string_utils.hpp"

#include <subprocess.h>

#include <algorithm>    // for transform
#include <array>        // for array
#include <bit>          // for bit_cast
#include <cstdio>       // for fread, fwrite, fclose
#include <mutex>        // for scoped_lock, lock_guard
#include <string_view>  // for string_view_literals
#include <vector>       // for vector

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace autoiso::utils {

struct SubProcess::Impl {
    subprocess_s proc{};
};

SubProcess::SubProcess() : m_impl(std::make_unique<Impl>()) { }
SubProcess::~SubProcess() = default;

SubProcess::SubProcess(SubProcess&& other) noexcept
  : m_impl(std::move(other.m_impl)),
    m_process_log([&] {
        const std::lock_guard<std::mutex> lock(other.m_log_mutex);
        return std::move(other.m_process_log);
    }()) {
    running.store(other.running.load());
}

auto SubProcess::operator=(SubProcess&& other) noexcept -> SubProcess& {
    if (this != &other) {
        m_impl = std::move(other.m_impl);
        running.store(other.running.load());
        const std::scoped_lock lock(m_log_mutex, other.m_log_mutex);
        m_process_log = std::move(other.m_process_log);
    }
    return *this;
}

auto SubProcess::terminate() noexcept -> bool {
    const std::lock_guard<std::mutex> lock(m_proc_mutex);
    // pid 0 would signal our own process group
    if (!m_impl || m_impl->proc.child == 0 || !running) {
        return false;
    }
    return subprocess_terminate(&m_impl->proc) == 0;
}

auto SubProcess::get_log() const noexcept -> std::string {
    const std::lock_guard<std::mutex> lock(m_log_mutex);
    return m_process_log;
}

auto SubProcess::get_log_tail(std::size_t max_lines) const noexcept -> std::string {
    const auto log   = get_log();
    const auto lines = utils::make_multiline_view(log, true);
    std::vector<std::string> tail{};
    for (std::size_t i = 0; i < lines.size() && tail.size() < max_lines; ++i) {
        tail.emplace(tail.begin(), lines[i]);
    }
    return utils::join(tail);
}

void SubProcess::append_log(std::string_view text) noexcept {
    const std::lock_guard<std::mutex> lock(m_log_mutex);
    m_process_log += text;
}

auto exec_follow(const std::vector<std::string>& vec, SubProcess& child,
    const std::function<void(std::string_view)>& on_line, std::stop_token stop_token) noexcept
    -> std::optional<std::int32_t> {
    const bool log_exec_cmds = utils::safe_getenv("LOG_EXEC_CMDS") == "1"sv;
    const bool dirty_cmd_run = utils::safe_getenv("DIRTY_CMD_RUN") == "1"sv;

    if (log_exec_cmds && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[exec_follow] cmd := {}", vec);
    }
    if (dirty_cmd_run) {
        return 0;
    }
    if (stop_token.stop_requested()) {
        return std::nullopt;
    }

    std::vector<char*> args;
    std::transform(vec.cbegin(), vec.cend(), std::back_inserter(args),
        [=](const std::string& arg) -> char* { return std::bit_cast<char*>(arg.data()); });
    args.push_back(nullptr);

    std::int32_t ret{0};
    subprocess_s process{};
    char** command    = args.data();
    const int options = subprocess_option_enable_async | subprocess_option_combined_stdout_stderr
        | subprocess_option_inherit_environment | subprocess_option_search_user_path;
    if ((ret = subprocess_create_ex(command, options, nullptr, &process)) != 0) {
        spdlog::error("[exec_follow] Failed to spawn '{}'", vec.front());
        child.running = false;
        return std::nullopt;
    }

    {
        const std::lock_guard<std::mutex> lock(child.m_proc_mutex);
        child.m_impl->proc = process;
    }
    child.running = true;

    {
        const std::stop_callback on_stop(stop_token, [&child] {
            spdlog::info("[exec_follow] stop requested, terminating child");
            child.terminate();
        });

        std::string pending{};
        std::array<char, 8192> buf{};
        std::uint32_t bytes_read{};
        do {
            bytes_read = subprocess_read_stdout(&process, buf.data(), static_cast<std::uint32_t>(buf.size()));
            if (bytes_read == 0) {
                break;
            }
            const std::string_view chunk{buf.data(), bytes_read};
            child.append_log(chunk);
            pending += chunk;

            std::size_t pos{};
            while ((pos = pending.find_first_of("\r\n")) != std::string::npos) {
                if (pos > 0 && on_line) {
                    on_line(std::string_view{pending}.substr(0, pos));
                }
                pending.erase(0, pos + 1);
            }
        } while (true);
        if (!pending.empty() && on_line) {
            on_line(pending);
        }
    }

    if (subprocess_join(&process, &ret) != 0) {
        spdlog::error("[exec_follow] Failed to join process: return code {}", ret);
        child.running = false;
        return std::nullopt;
    }
    child.running = false;
    if (subprocess_destroy(&process) != 0) {
        spdlog::error("[exec_follow] Failed to destroy process");
    }
    {
        const std::lock_guard<std::mutex> lock(child.m_proc_mutex);
        child.m_impl->proc = process;
    }
    return ret;
}

auto exec_with_input(const std::vector<std::string>& vec, std::string_view input) noexcept
    -> std::optional<std::string> {
    if (vec.empty()) {
        return std::nullopt;
    }
    if (utils::safe_getenv("LOG_EXEC_CMDS") == "1"sv && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[exec_with_input] cmd := {}", vec);
    }

    std::vector<char*> args;
    std::transform(vec.cbegin(), vec.cend(), std::back_inserter(args),
        [=](const std::string& arg) -> char* { return std::bit_cast<char*>(arg.data()); });
    args.push_back(nullptr);

    subprocess_s process{};
    const int options = subprocess_option_inherit_environment | subprocess_option_search_user_path;
    if (subprocess_create_ex(args.data(), options, nullptr, &process) != 0) {
        spdlog::error("[exec_with_input] Failed to spawn '{}'", vec.front());
        return std::nullopt;
    }

    std::FILE* stdin_file = subprocess_stdin(&process);
    const bool written    = std::fwrite(input.data(), 1, input.size(), stdin_file) == input.size();
    // EOF for the child, join must not close it again
    std::fclose(stdin_file);
    process.stdin_file = nullptr;

    std::string output{};
    std::array<char, 4096> buf{};
    std::FILE* stdout_file = subprocess_stdout(&process);
    std::size_t bytes_read{};
    while ((bytes_read = std::fread(buf.data(), 1, buf.size(), stdout_file)) > 0) {
        output.append(buf.data(), bytes_read);
    }

    std::int32_t ret{};
    if (subprocess_join(&process, &ret) != 0) {
        spdlog::error("[exec_with_input] Failed to join '{}'", vec.front());
        subprocess_destroy(&process);
        return std::nullopt;
    }
    if (subprocess_destroy(&process) != 0) {
        spdlog::error("[exec_with_input] Failed to destroy process");
    }
    if (!written || ret != 0) {
        spdlog::error("[exec_with_input] '{}' exited with code {}", vec.front(), ret);
        return std::nullopt;
    }
    return output;
}

}  // namespace autoiso::utils
