#ifndef SUBPROCESS_HPP
#define SUBPROCESS_HPP

#include <atomic>       // for atomic_bool
#include <cstdint>      // for int32_t
#include <functional>   // for function
#include <memory>       // for unique_ptr
#include <mutex>        // for mutex
#include <optional>     // for optional
#include <stop_token>   // for stop_token
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace autoiso::utils {

// Wrapper around thirdparty subprocess handle
class SubProcess final {
 public:
    SubProcess();
    ~SubProcess();

    // explicitly deleted (move-only)
    SubProcess(const SubProcess&)     = delete;
    auto operator=(const SubProcess&) = delete;

    SubProcess(SubProcess&& other) noexcept;
    auto operator=(SubProcess&& other) noexcept -> SubProcess&;

    /// @brief Send SIGTERM/TerminateProcess.
    /// @return true on success.
    auto terminate() noexcept -> bool;

    /// @brief Get a snapshot of the accumulated log.
    [[nodiscard]] auto get_log() const noexcept -> std::string;

    /// @brief Last lines of the accumulated log.
    [[nodiscard]] auto get_log_tail(std::size_t max_lines) const noexcept -> std::string;

    /// @brief Append text to the accumulated log.
    void append_log(std::string_view text) noexcept;

    /// @brief Whether the subprocess is still running.
    std::atomic_bool running{false};

 private:
    friend auto exec_follow(const std::vector<std::string>& vec, SubProcess& child,
        const std::function<void(std::string_view)>& on_line, std::stop_token stop_token) noexcept
        -> std::optional<std::int32_t>;
    struct Impl;
    std::unique_ptr<Impl> m_impl;

    mutable std::mutex m_proc_mutex;
    mutable std::mutex m_log_mutex;
    std::string m_process_log;
};

/// @brief Execute command args via subprocess, following combined stdout+stderr line by line.
/// A stop request terminates the child.
/// @param vec The arguments to launch, looked up in PATH.
/// @param child Subprocess handle.
/// @param on_line Called for every output line, carriage returns also end a line.
/// @param stop_token Cancellation.
/// @return Exit code, or std::nullopt when the process could not be spawned or joined.
auto exec_follow(const std::vector<std::string>& vec, SubProcess& child,
    const std::function<void(std::string_view)>& on_line, std::stop_token stop_token = {}) noexcept
    -> std::optional<std::int32_t>;

/// @brief Runs command args with input written to its stdin.
/// Keeps secrets off every command line, unlike exec() through the shell.
/// @return Captured stdout, or std::nullopt when the process failed to run or exited non-zero.
auto exec_with_input(const std::vector<std::string>& vec, std::string_view input) noexcept
    -> std::optional<std::string>;

}  // namespace autoiso::utils

#endif  // SUBPROCESS_HPP
