#ifndef INSTALLER_DATA_HPP
#define INSTALLER_DATA_HPP

#include <map>          // for map
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace autoiso::installer_data {

/// Choices offered to the configuration form.
struct InstallerData final {
    /// Lowercase two-letter code -> country name.
    std::map<std::string, std::string> countries{};
    std::vector<std::string> keyboards{};
    std::vector<std::string> timezones{};
    std::string current_country{"us"};
    std::string current_timezone{"America/New_York"};
};

/// Top-level zoneinfo entry holding timezones (Europe, America), not posix/right/Etc.
constexpr auto is_timezone_region(std::string_view name) noexcept -> bool {
    using namespace std::string_view_literals;
    // ASCII only, zoneinfo may carry stray non-ASCII names
    return !name.empty()
        && name != "posix"sv && name != "right"sv && name != "Etc"sv
        && name[0] >= 'A' && name[0] <= 'Z';
}

// Get list of available timezones
auto get_available_timezones() noexcept -> std::vector<std::string>;

// Get the timezone of this host, falls back to America/New_York
auto get_current_timezone(const std::vector<std::string>& timezones) noexcept -> std::string;

/// Parses iso-codes' iso_3166-1.json into code -> name.
auto parse_iso_country_codes(std::string_view json_content) noexcept -> std::map<std::string, std::string>;

// Get known country codes, from iso-codes when installed
auto get_country_codes() noexcept -> std::map<std::string, std::string>;

/// Country of the locale in LC_ALL or LANG (en_GB.UTF-8 -> gb), falls back to us.
auto get_current_country(const std::map<std::string, std::string>& countries) noexcept -> std::string;

auto collect_installer_data() noexcept -> InstallerData;

/// Serializes as {"installerSettings":{...}}.
auto installer_data_to_json(const InstallerData& data) noexcept -> std::string;

}  // namespace autoiso::installer_data

#endif  // INSTALLER_DATA_HPP
