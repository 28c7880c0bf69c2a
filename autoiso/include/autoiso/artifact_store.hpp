#ifndef ARTIFACT_STORE_HPP
#define ARTIFACT_STORE_HPP

#include <chrono>       // for seconds
#include <filesystem>   // for path
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace autoiso::store {

/// @brief Filesystem store of build artifacts.
/// Each job owns <root>/<jobId>/ holding answer.toml and autoiso-<jobId>.iso.
/// Job ids must be canonical UUID text, anything else is rejected before the filesystem is touched.
class ArtifactStore final {
 public:
    explicit ArtifactStore(std::filesystem::path root) noexcept;

    /// Creates the root directory.
    auto init() noexcept -> bool;

    [[nodiscard]] auto root() const noexcept -> const std::filesystem::path& { return m_root; }

    /// Directory of the job, std::nullopt for malformed ids.
    [[nodiscard]] auto job_dir(std::string_view job_id) const noexcept -> std::optional<std::filesystem::path>;

    auto put_answer(std::string_view job_id, std::string_view content) noexcept -> bool;

    /// @brief Moves built image into the store, copies when rename crosses filesystems.
    /// @return Final image path.
    auto put_image(std::string_view job_id, const std::filesystem::path& built_image) noexcept
        -> std::optional<std::filesystem::path>;

    [[nodiscard]] auto read_answer(std::string_view job_id) const noexcept -> std::optional<std::string>;

    /// Path of stored image if it exists.
    [[nodiscard]] auto image_path(std::string_view job_id) const noexcept -> std::optional<std::filesystem::path>;

    [[nodiscard]] auto contains(std::string_view job_id) const noexcept -> bool;

    /// Removes every artifact of the job.
    /// @return false when nothing was stored for it.
    auto remove(std::string_view job_id) noexcept -> bool;

    [[nodiscard]] auto list_job_ids() const noexcept -> std::vector<std::string>;

    /// Removes jobs whose directory was last modified more than age ago.
    /// @return Number of removed jobs.
    auto prune_older_than(std::chrono::seconds age) noexcept -> std::size_t;

    [[nodiscard]] static auto image_file_name(std::string_view job_id) noexcept -> std::string;

 private:
    std::filesystem::path m_root;
};

}  // namespace autoiso::store

#endif  // ARTIFACT_STORE_HPP
