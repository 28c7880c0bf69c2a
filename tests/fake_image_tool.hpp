#ifndef FAKE_IMAGE_TOOL_HPP
#define FAKE_IMAGE_TOOL_HPP

#include "autoiso/file_utils.hpp"
#include "autoiso/image_tool.hpp"
#include "autoiso/installer_config.hpp"
#include "autoiso/job_orchestrator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

namespace test {

enum class ToolBehavior : std::uint8_t {
    Succeed,
    Fail,
    // blocks until the build is stopped
    Block
};

// ImageTool writing a tiny image without touching xorriso
class FakeImageTool final : public autoiso::iso::ImageTool {
 public:
    explicit FakeImageTool(ToolBehavior behavior = ToolBehavior::Succeed) noexcept : m_behavior(behavior) { }

    [[nodiscard]] auto name() const noexcept -> std::string_view override { return "fake"; }

    auto build(const autoiso::iso::ImageBuildRequest& request, const autoiso::iso::ProgressCallback& on_progress,
        std::stop_token stop_token) noexcept -> std::expected<void, autoiso::job::BuildError> override {
        {
            const std::lock_guard<std::mutex> lock(m_mutex);
            m_last_request = request;
        }
        m_started = true;
        on_progress(0, "Remastering installer image");

        if (m_behavior == ToolBehavior::Fail) {
            return std::unexpected(autoiso::job::BuildError{"build", "boom"});
        }
        if (m_behavior == ToolBehavior::Block) {
            std::mutex block_mutex;
            std::condition_variable_any block_cv;
            std::unique_lock<std::mutex> lock(block_mutex);
            block_cv.wait(lock, stop_token, [] { return false; });
            return std::unexpected(autoiso::job::BuildError{"build", "cancelled"});
        }

        on_progress(50, "Writing image");
        if (!autoiso::file_utils::create_file_for_overwrite(request.output_iso.string(), "ISO")) {
            return std::unexpected(autoiso::job::BuildError{"build", "cannot write image"});
        }
        on_progress(100, "Image written");
        return {};
    }

    [[nodiscard]] auto started() const noexcept -> bool { return m_started; }

    [[nodiscard]] auto last_request() const noexcept -> std::optional<autoiso::iso::ImageBuildRequest> {
        const std::lock_guard<std::mutex> lock(m_mutex);
        return m_last_request;
    }

 private:
    const ToolBehavior m_behavior;
    std::atomic_bool m_started{};
    mutable std::mutex m_mutex;
    std::optional<autoiso::iso::ImageBuildRequest> m_last_request{};
};

inline auto make_root_hash() -> std::string {
    return "$6$saltsalt$" + std::string(86, 'x');
}

inline auto make_dhcp_config(std::string_view fqdn = "host.example.com") -> autoiso::InstallerConfig {
    autoiso::InstallerConfig config{};
    config.identity.fqdn               = fqdn;
    config.identity.root_password_hash = make_root_hash();
    return config;
}

// Polls until the job satisfies pred, gives up after timeout
template <typename Pred>
auto wait_for_job(const autoiso::job::JobOrchestrator& orchestrator, std::string_view job_id, Pred&& pred,
    std::chrono::milliseconds timeout = std::chrono::seconds{10}) -> std::optional<autoiso::job::JobSnapshot> {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        auto snapshot = orchestrator.get_job(job_id);
        if (snapshot && pred(*snapshot)) {
            return snapshot;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
    return std::nullopt;
}

inline auto wait_until_terminal(const autoiso::job::JobOrchestrator& orchestrator, std::string_view job_id)
    -> std::optional<autoiso::job::JobSnapshot> {
    return wait_for_job(orchestrator, job_id, [](const autoiso::job::JobSnapshot& snapshot) {
        return autoiso::job::is_terminal(snapshot.status);
    });
}

}  // namespace test

#endif  // FAKE_IMAGE_TOOL_HPP
