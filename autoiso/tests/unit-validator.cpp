#include "doctest_compatibility.h"

#include "autoiso/logger.hpp"
#include "autoiso/validator.hpp"

#include <string>
#include <string_view>

using namespace std::string_view_literals;

namespace {

auto make_hash() -> std::string {
    return "$6$saltsalt$" + std::string(86, 'a');
}

}  // namespace

TEST_CASE("ipv4 and cidr parsing test")
{
    using namespace autoiso::validator;

    REQUIRE_EQ(parse_ipv4("192.168.1.10"sv), std::optional<std::uint32_t>{0xC0A8010AU});
    REQUIRE_EQ(parse_ipv4("0.0.0.0"sv), std::optional<std::uint32_t>{0U});
    REQUIRE_FALSE(parse_ipv4("256.1.1.1"sv).has_value());
    REQUIRE_FALSE(parse_ipv4("1.2.3"sv).has_value());
    REQUIRE_FALSE(parse_ipv4("1.2.3.4.5"sv).has_value());
    REQUIRE_FALSE(parse_ipv4("1.2.3.a"sv).has_value());
    REQUIRE_FALSE(parse_ipv4(""sv).has_value());
    REQUIRE_FALSE(parse_ipv4("10.0.0.1.999"sv).has_value());
    REQUIRE_FALSE(parse_ipv4("10.0.0.1."sv).has_value());
    REQUIRE_FALSE(parse_ipv4(".10.0.0.1"sv).has_value());
    REQUIRE_FALSE(parse_ipv4("10..0.1"sv).has_value());
    REQUIRE_FALSE(parse_ipv4("10.0. 0.1"sv).has_value());
    REQUIRE_FALSE(parse_ipv4("8.8.8.8.8"sv).has_value());
    REQUIRE_FALSE(parse_cidr("10.0.0.5./24"sv).has_value());

    SECTION("prefix defaults to 24")
    {
        const auto cidr = parse_cidr("10.0.0.5"sv);
        REQUIRE(cidr.has_value());
        REQUIRE_EQ(cidr->prefix, 24);
    }
    SECTION("explicit prefix")
    {
        const auto cidr = parse_cidr("10.0.0.5/16"sv);
        REQUIRE(cidr.has_value());
        REQUIRE_EQ(cidr->prefix, 16);
        REQUIRE_EQ(cidr->address, 0x0A000005U);
    }
    SECTION("invalid prefix")
    {
        REQUIRE_FALSE(parse_cidr("10.0.0.5/33"sv).has_value());
        REQUIRE_FALSE(parse_cidr("10.0.0.5/"sv).has_value());
        REQUIRE_FALSE(parse_cidr("10.0.0.5/x"sv).has_value());
    }

    static_assert(prefix_mask(0) == 0U);
    static_assert(prefix_mask(24) == 0xFFFFFF00U);
    static_assert(prefix_mask(32) == 0xFFFFFFFFU);
}

TEST_CASE("password strength test")
{
    using namespace autoiso::validator;

    SECTION("entropy pools")
    {
        REQUIRE_EQ(password_entropy(""sv), 0.0);
        // 4 chars * log2(10)
        CHECK(password_entropy("1234"sv) == doctest::Approx(13.2877).epsilon(0.001));
        // digits + lowercase + uppercase + special = 82
        CHECK(password_entropy("aA1!"sv) == doctest::Approx(25.4284).epsilon(0.001));
    }
    SECTION("too short")
    {
        const auto result = validate_password("Ab1!Ab1!Ab1"sv);
        REQUIRE_FALSE(result.has_value());
        REQUIRE_EQ(result.error(), "Password must be at least 12 characters long");
    }
    SECTION("low entropy")
    {
        const auto result = validate_password("abcdefghijkl"sv);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().starts_with("Password has low entropy"));
    }
    SECTION("strong password")
    {
        REQUIRE(validate_password("Abcdefgh1234!@"sv).has_value());
    }
}

TEST_CASE("fqdn validation test")
{
    using autoiso::validator::validate_fqdn;

    REQUIRE(validate_fqdn("host.example.com"sv).has_value());
    REQUIRE(validate_fqdn("pve-01.lab.example.org"sv).has_value());

    REQUIRE_FALSE(validate_fqdn(""sv).has_value());
    REQUIRE_FALSE(validate_fqdn("localhost"sv).has_value());
    REQUIRE_FALSE(validate_fqdn("-host.example.com"sv).has_value());
    REQUIRE_FALSE(validate_fqdn("host-.example.com"sv).has_value());
    REQUIRE_FALSE(validate_fqdn("host..example.com"sv).has_value());
    REQUIRE_FALSE(validate_fqdn("host.example.c0m"sv).has_value());
    REQUIRE_FALSE(validate_fqdn("host.example.c"sv).has_value());
    REQUIRE_FALSE(validate_fqdn("host_name.example.com"sv).has_value());

    const std::string long_label(64, 'a');
    REQUIRE_FALSE(validate_fqdn(long_label + ".example.com").has_value());

    std::string too_long{};
    for (int i = 0; i < 51; ++i) {
        too_long += "abcd.";
    }
    too_long += "com";
    REQUIRE(too_long.size() > 253);
    REQUIRE_FALSE(validate_fqdn(too_long).has_value());
}

TEST_CASE("identity field validation test")
{
    using namespace autoiso::validator;

    REQUIRE(validate_email("admin@example.com"sv).has_value());
    REQUIRE(validate_email("root@localhost"sv).has_value());
    REQUIRE_FALSE(validate_email("admin@example"sv).has_value());
    REQUIRE_FALSE(validate_email("admin example@x.com"sv).has_value());

    REQUIRE(validate_country("de"sv).has_value());
    REQUIRE_FALSE(validate_country("DE"sv).has_value());
    REQUIRE_FALSE(validate_country("deu"sv).has_value());

    REQUIRE(validate_timezone("Europe/Berlin"sv).has_value());
    REQUIRE(validate_timezone("America/Argentina/Buenos_Aires"sv).has_value());
    REQUIRE(validate_timezone("UTC"sv).has_value());
    REQUIRE_FALSE(validate_timezone("Berlin"sv).has_value());

    REQUIRE(validate_keyboard("de"sv).has_value());
    REQUIRE(validate_keyboard("en-us"sv).has_value());
    REQUIRE_FALSE(validate_keyboard("klingon"sv).has_value());
    REQUIRE_EQ(available_keyboards().size(), 25);

    REQUIRE(validate_root_password_hash(make_hash()).has_value());
    REQUIRE_FALSE(validate_root_password_hash(""sv).has_value());
    REQUIRE_FALSE(validate_root_password_hash("$1$salt$abcdef"sv).has_value());
    REQUIRE_FALSE(validate_root_password_hash("hunter2hunter2"sv).has_value());

    REQUIRE(validate_mac_filter("*00:11:22:33:44:55"sv).has_value());
    REQUIRE(validate_mac_filter("aa:bb:cc:dd:ee:ff"sv).has_value());
    REQUIRE_FALSE(validate_mac_filter("*00:11:22:33:44"sv).has_value());
}

TEST_CASE("network validation test")
{
    using namespace autoiso::validator;
    using autoiso::NetworkConfig;
    using autoiso::NetworkSource;

    SECTION("dhcp clears static fields")
    {
        const NetworkConfig network{
            .source  = NetworkSource::Dhcp,
            .cidr    = "10.0.0.5/24",
            .gateway = "10.0.0.1",
            .dns     = {"10.0.0.1"},
        };
        const auto result = validate_network(network);
        REQUIRE(result.has_value());
        REQUIRE_FALSE(result->cidr.has_value());
        REQUIRE_FALSE(result->gateway.has_value());
        REQUIRE(result->dns.empty());
    }
    SECTION("static requires every field")
    {
        const NetworkConfig network{.source = NetworkSource::StaticFromAnswer};
        const auto result = validate_network(network);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().contains("network.cidr"));
        REQUIRE(result.error().contains("network.gateway"));
        REQUIRE(result.error().contains("network.dns"));
    }
    SECTION("valid static network is trimmed")
    {
        const NetworkConfig network{
            .source  = NetworkSource::StaticFromAnswer,
            .cidr    = " 192.168.10.20/24 ",
            .gateway = "192.168.10.1 ",
            .dns     = {" 1.1.1.1", "8.8.8.8"},
        };
        const auto result = validate_network(network);
        REQUIRE(result.has_value());
        REQUIRE_EQ(*result->cidr, "192.168.10.20/24");
        REQUIRE_EQ(*result->gateway, "192.168.10.1");
        REQUIRE_EQ(result->dns, std::vector<std::string>{"1.1.1.1", "8.8.8.8"});
    }
    SECTION("gateway outside network")
    {
        const NetworkConfig network{
            .source  = NetworkSource::StaticFromAnswer,
            .cidr    = "192.168.10.20/24",
            .gateway = "192.168.11.1",
            .dns     = {"1.1.1.1"},
        };
        const auto result = validate_network(network);
        REQUIRE_FALSE(result.has_value());
        REQUIRE_EQ(result.error().size(), 1);
        REQUIRE(result.error().contains("network.gateway"));
    }
    SECTION("malformed gateway")
    {
        for (const auto* gateway : {"192.168.10.1.999", "192.168.10.1.", "192.168. 10.1"}) {
            const NetworkConfig network{
                .source  = NetworkSource::StaticFromAnswer,
                .cidr    = "192.168.10.20/24",
                .gateway = gateway,
                .dns     = {"1.1.1.1"},
            };
            const auto result = validate_network(network);
            REQUIRE_FALSE(result.has_value());
            REQUIRE(result.error().at("network.gateway").starts_with("Invalid gateway address"));
        }
    }
    SECTION("duplicate dns")
    {
        const NetworkConfig network{
            .source  = NetworkSource::StaticFromAnswer,
            .cidr    = "192.168.10.20/24",
            .gateway = "192.168.10.1",
            .dns     = {"1.1.1.1", "1.1.1.1"},
        };
        const auto result = validate_network(network);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().at("network.dns").starts_with("Duplicate DNS server"));
    }
    SECTION("invalid dns")
    {
        const NetworkConfig network{
            .source  = NetworkSource::StaticFromAnswer,
            .cidr    = "192.168.10.20/24",
            .gateway = "192.168.10.1",
            .dns     = {"dns.example.com"},
        };
        REQUIRE_FALSE(validate_network(network).has_value());

        for (const auto* dns : {"8.8.8.8.8", "1.1.1.1.", "1.1 .1.1"}) {
            const NetworkConfig malformed{
                .source  = NetworkSource::StaticFromAnswer,
                .cidr    = "192.168.10.20/24",
                .gateway = "192.168.10.1",
                .dns     = {"1.1.1.1", dns},
            };
            const auto result = validate_network(malformed);
            REQUIRE_FALSE(result.has_value());
            REQUIRE(result.error().at("network.dns").starts_with("Invalid DNS server"));
        }
    }
}

TEST_CASE("disk setup validation test")
{
    using namespace autoiso::validator;
    using autoiso::DiskSetupConfig;
    using autoiso::Filesystem;

    SECTION("defaults are valid")
    {
        const auto result = validate_disk_setup(DiskSetupConfig{});
        REQUIRE(result.has_value());
        REQUIRE_EQ(*result->zfs_raid, "raid0");
    }
    SECTION("zfs raid minimums")
    {
        DiskSetupConfig disk_setup{.filesystem = Filesystem::Zfs, .zfs_raid = "raidz-1", .btrfs_raid = {}, .disk_list = {"/dev/sda", "/dev/sdb"}};
        auto result = validate_disk_setup(disk_setup);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().contains("disk-setup.zfs.raid"));

        disk_setup.disk_list.emplace_back("/dev/sdc");
        REQUIRE(validate_disk_setup(disk_setup).has_value());
    }
    SECTION("unknown raid level")
    {
        const DiskSetupConfig disk_setup{.filesystem = Filesystem::Zfs, .zfs_raid = "raid5", .btrfs_raid = {}, .disk_list = {"/dev/sda"}};
        REQUIRE_FALSE(validate_disk_setup(disk_setup).has_value());
    }
    SECTION("btrfs raid1 needs two disks")
    {
        const DiskSetupConfig disk_setup{.filesystem = Filesystem::Btrfs, .zfs_raid = "raid0", .btrfs_raid = "raid1", .disk_list = {"/dev/sda"}};
        const auto result = validate_disk_setup(disk_setup);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().contains("disk-setup.btrfs.raid"));
    }
    SECTION("raid of other filesystem is dropped")
    {
        const DiskSetupConfig disk_setup{.filesystem = Filesystem::Ext4, .zfs_raid = "raid1", .btrfs_raid = "raid1", .disk_list = {"/dev/nvme0n1"}};
        const auto result = validate_disk_setup(disk_setup);
        REQUIRE(result.has_value());
        REQUIRE_FALSE(result->zfs_raid.has_value());
        REQUIRE_FALSE(result->btrfs_raid.has_value());
    }
    SECTION("disk list checks")
    {
        DiskSetupConfig disk_setup{.filesystem = Filesystem::Xfs, .zfs_raid = {}, .btrfs_raid = {}, .disk_list = {}};
        REQUIRE_FALSE(validate_disk_setup(disk_setup).has_value());

        disk_setup.disk_list = {"/dev/sda", "/dev/sda"};
        REQUIRE_FALSE(validate_disk_setup(disk_setup).has_value());

        disk_setup.disk_list = {"/dev/../etc/passwd"};
        REQUIRE_FALSE(validate_disk_setup(disk_setup).has_value());

        disk_setup.disk_list.clear();
        for (int i = 0; i < 11; ++i) {
            disk_setup.disk_list.emplace_back("/dev/sd" + std::string(1, static_cast<char>('a' + i)));
        }
        REQUIRE_FALSE(validate_disk_setup(disk_setup).has_value());
    }
}

TEST_CASE("installer config validation test")
{
    autoiso::logger::set_logger(autoiso::logger::make_noop_logger());

    autoiso::InstallerConfig config{};
    config.identity.fqdn               = "host.example.com";
    config.identity.root_password_hash = make_hash();
    REQUIRE(autoiso::validator::validate_installer_config(config).has_value());

    SECTION("errors of every group are collected")
    {
        config.identity.fqdn         = "invalid";
        config.network.source        = autoiso::NetworkSource::StaticFromAnswer;
        config.disk_setup.disk_list  = {};
        const auto result            = autoiso::validator::validate_installer_config(config);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().contains("global.fqdn"));
        REQUIRE(result.error().contains("network.cidr"));
        REQUIRE(result.error().contains("disk-setup.disk-list"));
    }
}
