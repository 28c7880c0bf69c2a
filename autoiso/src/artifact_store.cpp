#include "autoiso/artifact_store.hpp"
#include "autoiso/file_utils.hpp"
#include "autoiso/job.hpp"

#include <algorithm>    // for sort
#include <string_view>  // for string_view

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace fs = std::filesystem;

namespace {

constexpr auto ANSWER_FILE_NAME = "answer.toml"sv;

}  // namespace

namespace autoiso::store {

ArtifactStore::ArtifactStore(fs::path root) noexcept : m_root(std::move(root)) { }

auto ArtifactStore::init() noexcept -> bool {
    std::error_code err{};
    fs::create_directories(m_root, err);
    if (err) {
        spdlog::error("Failed to create artifact store '{}': {}", m_root.string(), err.message());
        return false;
    }
    return true;
}

auto ArtifactStore::image_file_name(std::string_view job_id) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("autoiso-{}.iso"), job_id);
}

auto ArtifactStore::job_dir(std::string_view job_id) const noexcept -> std::optional<fs::path> {
    if (!job::is_valid_job_id(job_id)) {
        spdlog::warn("Rejected malformed job id '{}'", job_id);
        return std::nullopt;
    }
    return m_root / job_id;
}

auto ArtifactStore::put_answer(std::string_view job_id, std::string_view content) noexcept -> bool {
    const auto dir = job_dir(job_id);
    if (!dir) {
        return false;
    }
    std::error_code err{};
    fs::create_directories(*dir, err);
    if (err) {
        spdlog::error("Failed to create '{}': {}", dir->string(), err.message());
        return false;
    }
    return file_utils::write_file_atomic((*dir / ANSWER_FILE_NAME).string(), content);
}

auto ArtifactStore::put_image(std::string_view job_id, const fs::path& built_image) noexcept -> std::optional<fs::path> {
    const auto dir = job_dir(job_id);
    if (!dir) {
        return std::nullopt;
    }
    std::error_code err{};
    fs::create_directories(*dir, err);
    if (err) {
        spdlog::error("Failed to create '{}': {}", dir->string(), err.message());
        return std::nullopt;
    }

    const auto target = *dir / image_file_name(job_id);
    fs::rename(built_image, target, err);
    if (!err) {
        return target;
    }

    // rename fails across filesystems, fall back to copy
    spdlog::debug("rename '{}' failed ({}), copying instead", built_image.string(), err.message());
    err.clear();
    fs::copy_file(built_image, target, fs::copy_options::overwrite_existing, err);
    if (err) {
        spdlog::error("Failed to store image '{}': {}", built_image.string(), err.message());
        return std::nullopt;
    }
    fs::remove(built_image, err);
    return target;
}

auto ArtifactStore::read_answer(std::string_view job_id) const noexcept -> std::optional<std::string> {
    const auto dir = job_dir(job_id);
    if (!dir) {
        return std::nullopt;
    }
    const auto answer_path = *dir / ANSWER_FILE_NAME;
    std::error_code err{};
    if (!fs::is_regular_file(answer_path, err)) {
        return std::nullopt;
    }
    return file_utils::read_whole_file(answer_path.string());
}

auto ArtifactStore::image_path(std::string_view job_id) const noexcept -> std::optional<fs::path> {
    const auto dir = job_dir(job_id);
    if (!dir) {
        return std::nullopt;
    }
    auto path = *dir / image_file_name(job_id);
    std::error_code err{};
    if (!fs::is_regular_file(path, err)) {
        return std::nullopt;
    }
    return path;
}

auto ArtifactStore::contains(std::string_view job_id) const noexcept -> bool {
    const auto dir = job_dir(job_id);
    if (!dir) {
        return false;
    }
    std::error_code err{};
    return fs::is_directory(*dir, err);
}

auto ArtifactStore::remove(std::string_view job_id) noexcept -> bool {
    if (!contains(job_id)) {
        return false;
    }
    std::error_code err{};
    fs::remove_all(m_root / job_id, err);
    if (err) {
        spdlog::error("Failed to remove artifacts of job {}: {}", job_id, err.message());
        return false;
    }
    spdlog::info("Removed artifacts of job {}", job_id);
    return true;
}

auto ArtifactStore::list_job_ids() const noexcept -> std::vector<std::string> {
    std::vector<std::string> job_ids{};
    std::error_code err{};
    for (const auto& entry : fs::directory_iterator{m_root, err}) {
        auto name = entry.path().filename().string();
        if (entry.is_directory(err) && job::is_valid_job_id(name)) {
            job_ids.emplace_back(std::move(name));
        }
    }
    std::ranges::sort(job_ids);
    return job_ids;
}

auto ArtifactStore::prune_older_than(std::chrono::seconds age) noexcept -> std::size_t {
    const auto cutoff = fs::file_time_type::clock::now() - age;
    std::size_t removed{};
    for (const auto& job_id : list_job_ids()) {
        std::error_code err{};
        const auto mtime = fs::last_write_time(m_root / job_id, err);
        if (err || mtime >= cutoff) {
            continue;
        }
        if (remove(job_id)) {
            ++removed;
        }
    }
    if (removed > 0) {
        spdlog::info("Pruned {} expired jobs from artifact store", removed);
    }
    return removed;
}

}  // namespace autoiso::store
