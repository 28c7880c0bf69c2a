#include "doctest_compatibility.h"

#include "autoiso/answer_file.hpp"
#include "autoiso/installer_config.hpp"
#include "autoiso/logger.hpp"

#include <string>
#include <string_view>

using namespace std::string_view_literals;

namespace {

const std::string ROOT_HASH = "$6$saltsalt$" + std::string(86, 'x');

auto make_dhcp_config() -> autoiso::InstallerConfig {
    autoiso::InstallerConfig config{};
    config.identity.fqdn               = "host.example.com";
    config.identity.root_password_hash = ROOT_HASH;
    return config;
}

}  // namespace

TEST_CASE("answer file render test")
{
    autoiso::logger::set_logger(autoiso::logger::make_noop_logger());

    SECTION("dhcp configuration")
    {
        const auto expected = "[global]\n"
                              "keyboard = \"en-us\"\n"
                              "country = \"us\"\n"
                              "fqdn = \"host.example.com\"\n"
                              "mailto = \"root@localhost\"\n"
                              "timezone = \"America/New_York\"\n"
                              "root-password-hashed = \"" + ROOT_HASH + "\"\n"
                              "\n[network]\n"
                              "source = \"from-dhcp\"\n"
                              "filter.ID_NET_NAME_MAC = \"*00:11:22:33:44:55\"\n"
                              "\n[disk-setup]\n"
                              "filesystem = \"zfs\"\n"
                              "zfs.raid = \"raid0\"\n"
                              "disk-list = [\"/dev/sda\"]\n";
        REQUIRE_EQ(autoiso::answer::render_answer_file(make_dhcp_config()), expected);
    }

    SECTION("static network and btrfs")
    {
        auto config                  = make_dhcp_config();
        config.network.source        = autoiso::NetworkSource::StaticFromAnswer;
        config.network.cidr          = "192.168.10.20/24";
        config.network.gateway       = "192.168.10.1";
        config.network.dns           = {"1.1.1.1", "8.8.8.8"};
        config.disk_setup.filesystem = autoiso::Filesystem::Btrfs;
        config.disk_setup.btrfs_raid = "raid1";
        config.disk_setup.disk_list  = {"/dev/sda", "/dev/sdb"};

        const auto content = autoiso::answer::render_answer_file(config);
        REQUIRE(content.contains("source = \"from-answer\"\ncidr = \"192.168.10.20/24\"\ngateway = \"192.168.10.1\"\ndns = \"1.1.1.1,8.8.8.8\"\n"));
        REQUIRE(content.contains("filesystem = \"btrfs\"\nbtrfs.raid = \"raid1\"\ndisk-list = [\"/dev/sda\", \"/dev/sdb\"]\n"));
        REQUIRE_FALSE(content.contains("zfs.raid"));
    }

    SECTION("deterministic apart from generated-at")
    {
        const auto config = make_dhcp_config();
        REQUIRE_EQ(autoiso::answer::render_answer_file(config), autoiso::answer::render_answer_file(config));

        const auto stamped = autoiso::answer::render_answer_file(config, {.generated_at = "2024-05-01T12:00:00Z"});
        const auto prefix  = "# generated-at: 2024-05-01T12:00:00Z\n"sv;
        REQUIRE(stamped.starts_with(prefix));
        REQUIRE_EQ(stamped.substr(prefix.size()), autoiso::answer::render_answer_file(config));
    }

    SECTION("values are escaped")
    {
        REQUIRE_EQ(autoiso::answer::toml_quote("plain"sv), "\"plain\"");
        REQUIRE_EQ(autoiso::answer::toml_quote(R"(a"b\c)"sv), R"("a\"b\\c")");
        REQUIRE_EQ(autoiso::answer::toml_quote("line\nbreak"sv), R"("line\nbreak")");
    }
}

TEST_CASE("auto installer mode test")
{
    REQUIRE_EQ(autoiso::answer::render_auto_installer_mode(std::nullopt), "mode = \"iso\"\n");
    REQUIRE_EQ(autoiso::answer::render_auto_installer_mode("http://10.0.4.2:33008/api/answer-file/abc"sv),
        "mode = \"http\"\n\n[http]\nurl = \"http://10.0.4.2:33008/api/answer-file/abc\"\n");
}

TEST_CASE("answer file parse test")
{
    autoiso::logger::set_logger(autoiso::logger::make_noop_logger());

    SECTION("rendered file reads back")
    {
        auto config                  = make_dhcp_config();
        config.network.source        = autoiso::NetworkSource::StaticFromAnswer;
        config.network.cidr          = "10.0.0.5/24";
        config.network.gateway       = "10.0.0.1";
        config.network.dns           = {"10.0.0.1", "10.0.0.2"};
        config.disk_setup.zfs_raid   = "raid1";
        config.disk_setup.disk_list  = {"/dev/nvme0n1", "/dev/nvme1n1"};

        const auto parsed = autoiso::answer::parse_answer_file(autoiso::answer::render_answer_file(config, {.generated_at = "2024-05-01T12:00:00Z"}));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == config);
    }

    SECTION("invalid toml")
    {
        REQUIRE_FALSE(autoiso::answer::parse_answer_file("[global\nfqdn = "sv).has_value());
    }

    SECTION("missing global table")
    {
        REQUIRE_FALSE(autoiso::answer::parse_answer_file("[network]\nsource = \"from-dhcp\"\n"sv).has_value());
    }
}
