#include "doctest_compatibility.h"

#include "autoiso/file_utils.hpp"
#include "autoiso/image_tool.hpp"
#include "autoiso/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

namespace {

// Stand-in for xorriso: reports progress and writes the -outdev file
constexpr auto FAKE_XORRISO = R"(#!/bin/sh
out=""
while [ $# -gt 0 ]; do
    if [ "$1" = "-outdev" ]; then
        out="$2"
    fi
    shift
done
echo "xorriso 1.5.6 : RockRidge filesystem manipulator"
echo "xorriso : UPDATE :  25.00% done"
echo "xorriso : UPDATE :  75.50% done, estimate finish Thu May 02 12:00:00 2024"
printf 'ISO' > "$out"
)"sv;

constexpr auto FAILING_XORRISO = R"(#!/bin/sh
echo "xorriso : FAILURE : Cannot open base image" >&2
exit 5
)"sv;

void write_script(const fs::path& path, std::string_view content) {
    REQUIRE(autoiso::file_utils::create_file_for_overwrite(path.string(), content));
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
}

}  // namespace

TEST_CASE("xorriso progress parse test")
{
    using autoiso::iso::parse_xorriso_progress;

    REQUIRE_EQ(parse_xorriso_progress("xorriso : UPDATE :  42.17% done"sv), std::optional<std::uint8_t>{42});
    REQUIRE_EQ(parse_xorriso_progress("xorriso : UPDATE : 100% done"sv), std::optional<std::uint8_t>{100});
    REQUIRE_EQ(parse_xorriso_progress("xorriso : UPDATE :  3.0% done, estimate finish"sv), std::optional<std::uint8_t>{3});
    REQUIRE_FALSE(parse_xorriso_progress("xorriso : NOTE : 42% done"sv).has_value());
    REQUIRE_FALSE(parse_xorriso_progress("xorriso : UPDATE : 1234 files added"sv).has_value());
    REQUIRE_FALSE(parse_xorriso_progress(""sv).has_value());
}

TEST_CASE("xorriso image tool test")
{
    autoiso::logger::set_logger(autoiso::logger::make_noop_logger());

    const auto dir = fs::temp_directory_path() / "autoiso-unit-image_tool";
    fs::remove_all(dir);
    fs::create_directories(dir);
    REQUIRE(autoiso::file_utils::create_file_for_overwrite((dir / "base.iso").string(), "BASE"sv));

    const autoiso::iso::ImageBuildRequest request{
        .job_id              = "123e4567-e89b-42d3-a456-426614174000",
        .base_iso            = dir / "base.iso",
        .work_dir            = dir / "work",
        .output_iso          = dir / "out.iso",
        .answer_file         = "[global]\nfqdn = \"host.example.com\"\n",
        .auto_installer_mode = "mode = \"iso\"\n",
    };

    std::vector<std::uint8_t> reported{};
    const auto on_progress = [&reported](std::uint8_t percent, std::string_view) { reported.push_back(percent); };

    SECTION("successful remaster")
    {
        write_script(dir / "xorriso", FAKE_XORRISO);
        autoiso::iso::XorrisoImageTool tool{(dir / "xorriso").string()};

        const auto built = tool.build(request, on_progress, {});
        REQUIRE(built.has_value());
        REQUIRE_EQ(autoiso::file_utils::read_whole_file((dir / "out.iso").string()), "ISO");
        REQUIRE_EQ(reported, std::vector<std::uint8_t>{0, 25, 75, 100});

        // staged files
        REQUIRE_EQ(autoiso::file_utils::read_whole_file((dir / "work" / "staging" / "answer.toml").string()), request.answer_file);
        REQUIRE_EQ(autoiso::file_utils::read_whole_file((dir / "work" / "staging" / "auto-installer-mode.toml").string()), request.auto_installer_mode);
        REQUIRE(fs::exists(dir / "work" / "staging" / "auto-installer-capable"));
    }

    SECTION("tool failure")
    {
        write_script(dir / "xorriso", FAILING_XORRISO);
        autoiso::iso::XorrisoImageTool tool{(dir / "xorriso").string()};

        const auto built = tool.build(request, on_progress, {});
        REQUIRE_FALSE(built.has_value());
        REQUIRE_EQ(built.error().stage, "build");
        REQUIRE(built.error().message.contains("exited with code 5"));
    }

    SECTION("missing base image")
    {
        autoiso::iso::XorrisoImageTool tool{(dir / "xorriso").string()};
        auto missing_base     = request;
        missing_base.base_iso = dir / "missing.iso";

        const auto built = tool.build(missing_base, on_progress, {});
        REQUIRE_FALSE(built.has_value());
        REQUIRE(built.error().message.contains("not found"));
        REQUIRE(reported.empty());
    }

    fs::remove_all(dir);
}
