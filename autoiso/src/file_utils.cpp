#include "autoiso/file_utils.hpp"

#include <cerrno>   // for errno
#include <cstdio>   // for fopen, fread, fclose
#include <cstring>  // for strerror

#include <filesystem>  // for rename
#include <fstream>     // for ofstream, ifstream

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace autoiso::file_utils {

auto read_whole_file(std::string_view filepath) noexcept -> std::string {
    const std::string path{filepath};
    // Use std::fopen because it's faster than std::ifstream
    auto* file = std::fopen(path.c_str(), "rb");
    if (file == nullptr) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return {};
    }

    std::fseek(file, 0, SEEK_END);
    const auto size = static_cast<std::size_t>(std::ftell(file));
    std::fseek(file, 0, SEEK_SET);

    std::string buf;
    buf.resize(size);

    const std::size_t read = std::fread(buf.data(), sizeof(char), size, file);
    std::fclose(file);
    if (read != size) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return {};
    }

    return buf;
}

auto create_file_for_overwrite(std::string_view filepath, std::string_view data) noexcept -> bool {
    std::ofstream file{std::string{filepath}, std::ios::out | std::ios::trunc | std::ios::binary};
    if (!file.is_open()) {
        spdlog::error("[WRITE_TO_FILE] '{}' open failed: {}", filepath, std::strerror(errno));
        return false;
    }
    file << data;
    file.flush();
    return file.good();
}

auto write_file_atomic(std::string_view filepath, std::string_view data) noexcept -> bool {
    const auto target   = fs::path{filepath};
    const auto tmp_path = fs::path{target}.concat(".tmp");
    if (!create_file_for_overwrite(tmp_path.native(), data)) {
        return false;
    }

    std::error_code ec{};
    fs::rename(tmp_path, target, ec);
    if (ec) {
        spdlog::error("[WRITE_ATOMIC] failed to move '{}' into place: {}", tmp_path.native(), ec.message());
        fs::remove(tmp_path, ec);
        return false;
    }
    return true;
}

auto read_sysfs_value(std::string_view filepath) noexcept -> std::optional<std::string> {
    std::ifstream file{std::string{filepath}};
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string line{};
    std::getline(file, line);
    while (!line.empty() && (line.back() == '\n' || line.back() == ' ' || line.back() == '\r')) {
        line.pop_back();
    }
    return line;
}

}  // namespace autoiso::file_utils
