#include "autoiso/installer_data.hpp"
#include "autoiso/file_utils.hpp"
#include "autoiso/io_utils.hpp"
#include "autoiso/string_utils.hpp"
#include "autoiso/validator.hpp"

#include <algorithm>   // for sort, find
#include <filesystem>  // for exists, directory_iterator

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

static constexpr auto ZONEINFO_PATH    = "/usr/share/zoneinfo"sv;
static constexpr auto ISO_CODES_PATH   = "/usr/share/iso-codes/json/iso_3166-1.json"sv;
static constexpr auto DEFAULT_TIMEZONE = "America/New_York"sv;

namespace {

auto is_known_timezone(const std::vector<std::string>& timezones, std::string_view timezone) noexcept -> bool {
    return !timezone.empty() && std::ranges::find(timezones, timezone) != timezones.end();
}

// used when iso-codes is not installed
auto builtin_country_codes() noexcept -> std::map<std::string, std::string> {
    return {
        {"at", "Austria"}, {"au", "Australia"}, {"be", "Belgium"}, {"br", "Brazil"},
        {"ca", "Canada"}, {"ch", "Switzerland"}, {"cz", "Czechia"}, {"de", "Germany"},
        {"dk", "Denmark"}, {"es", "Spain"}, {"fi", "Finland"}, {"fr", "France"},
        {"gb", "United Kingdom"}, {"hu", "Hungary"}, {"ie", "Ireland"}, {"is", "Iceland"},
        {"it", "Italy"}, {"jp", "Japan"}, {"lt", "Lithuania"}, {"mk", "North Macedonia"},
        {"nl", "Netherlands"}, {"no", "Norway"}, {"nz", "New Zealand"}, {"pl", "Poland"},
        {"pt", "Portugal"}, {"se", "Sweden"}, {"si", "Slovenia"}, {"tr", "Turkey"},
        {"us", "United States"},
    };
}

}  // namespace

namespace autoiso::installer_data {

auto get_available_timezones() noexcept -> std::vector<std::string> {
    const auto& timezones = utils::exec("timedatectl list-timezones 2>/dev/null");
    if (!timezones.empty()) {
        return utils::make_multiline(timezones);
    }

    // for whatever reason timedatectl didn't work or doesn't exist
    std::vector<std::string> result{"UTC"};
    std::error_code err{};
    for (const auto& region_entry : fs::directory_iterator(ZONEINFO_PATH, err)) {
        const auto region = region_entry.path().filename().string();
        if (!region_entry.is_directory() || !is_timezone_region(region)) {
            continue;
        }
        for (const auto& zone_entry : fs::recursive_directory_iterator(region_entry.path(), err)) {
            if (!zone_entry.is_regular_file()) {
                continue;
            }
            result.push_back(fs::relative(zone_entry.path(), ZONEINFO_PATH).string());
        }
    }

    std::ranges::sort(result);
    return result;
}

auto get_current_timezone(const std::vector<std::string>& timezones) noexcept -> std::string {
    auto timezone = utils::exec("timedatectl show -p Timezone --value 2>/dev/null");
    if (is_known_timezone(timezones, utils::trim(timezone))) {
        return std::string{utils::trim(timezone)};
    }

    std::error_code err{};
    if (fs::exists("/etc/timezone", err)) {
        timezone = file_utils::read_whole_file("/etc/timezone");
        if (is_known_timezone(timezones, utils::trim(timezone))) {
            return std::string{utils::trim(timezone)};
        }
    }

    // /etc/localtime -> /usr/share/zoneinfo/Region/City
    if (fs::is_symlink("/etc/localtime", err)) {
        const auto target = fs::read_symlink("/etc/localtime", err).string();
        const auto pos    = target.find("zoneinfo/"sv);
        if (pos != std::string::npos && is_known_timezone(timezones, std::string_view{target}.substr(pos + 9))) {
            return target.substr(pos + 9);
        }
    }
    return std::string{DEFAULT_TIMEZONE};
}

auto parse_iso_country_codes(std::string_view json_content) noexcept -> std::map<std::string, std::string> {
    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError()) {
        spdlog::error("Failed to parse country codes: {}", rapidjson::GetParseError_En(doc.GetParseError()));
        return {};
    }
    if (!doc.IsObject() || !doc.HasMember("3166-1") || !doc["3166-1"].IsArray()) {
        spdlog::error("Country codes file has unexpected layout");
        return {};
    }

    std::map<std::string, std::string> countries{};
    for (const auto& entry : doc["3166-1"].GetArray()) {
        if (!entry.IsObject() || !entry.HasMember("alpha_2") || !entry.HasMember("name")) {
            continue;
        }
        if (!entry["alpha_2"].IsString() || !entry["name"].IsString()) {
            continue;
        }
        countries.emplace(utils::to_lower(entry["alpha_2"].GetString()), entry["name"].GetString());
    }
    return countries;
}

auto get_country_codes() noexcept -> std::map<std::string, std::string> {
    std::error_code err{};
    if (fs::exists(ISO_CODES_PATH, err)) {
        auto countries = parse_iso_country_codes(file_utils::read_whole_file(ISO_CODES_PATH));
        if (!countries.empty()) {
            return countries;
        }
    }
    spdlog::warn("{} unavailable, using builtin country list", ISO_CODES_PATH);
    return builtin_country_codes();
}

auto get_current_country(const std::map<std::string, std::string>& countries) noexcept -> std::string {
    auto locale = utils::safe_getenv("LC_ALL");
    if (locale.empty()) {
        locale = utils::safe_getenv("LANG");
    }
    // en_GB.UTF-8 -> gb
    const auto underscore = locale.find('_');
    if (underscore != std::string_view::npos) {
        auto country = locale.substr(underscore + 1, 2);
        auto code    = utils::to_lower(country);
        if (countries.contains(code)) {
            return code;
        }
    }
    return "us";
}

auto collect_installer_data() noexcept -> InstallerData {
    InstallerData data{};
    data.countries = get_country_codes();
    for (const auto keyboard : validator::available_keyboards()) {
        data.keyboards.emplace_back(keyboard);
    }
    data.timezones        = get_available_timezones();
    data.current_country  = get_current_country(data.countries);
    data.current_timezone = get_current_timezone(data.timezones);
    return data;
}

auto installer_data_to_json(const InstallerData& data) noexcept -> std::string {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    const auto write_string = [&writer](std::string_view str) {
        writer.String(str.data(), static_cast<rapidjson::SizeType>(str.size()));
    };
    const auto write_list = [&](std::string_view key, const std::vector<std::string>& values) {
        writer.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
        writer.StartArray();
        for (const auto& value : values) {
            write_string(value);
        }
        writer.EndArray();
    };

    writer.StartObject();
    writer.Key("installerSettings");
    writer.StartObject();
    writer.Key("countries");
    writer.StartObject();
    for (const auto& [code, name] : data.countries) {
        writer.Key(code.c_str(), static_cast<rapidjson::SizeType>(code.size()));
        write_string(name);
    }
    writer.EndObject();
    write_list("keyboards"sv, data.keyboards);
    write_list("timezones"sv, data.timezones);
    writer.Key("currentCountry");
    write_string(data.current_country);
    writer.Key("currentTimezone");
    write_string(data.current_timezone);
    writer.EndObject();
    writer.EndObject();
    return {buffer.GetString(), buffer.GetSize()};
}

}  // namespace autoiso::installer_data
