#include "batchdl/settings.hpp"
#include "batchdl/failure.hpp"
#include "batchdl/detail/string_utils.hpp"

#include <fstream>
#include <limits>
#include <string>
#include <system_error>

#include <fmt/format.h>

namespace batchdl {

namespace {

const std::string& requireValue(const IniSections& ini, const std::string& section, const std::string& key) {
    const auto section_it = ini.find(section);
    if (section_it == ini.end()) {
        throw ConfigError(fmt::format("Missing section [{}] in configuration", section));
    }
    const auto key_it = section_it->second.find(key);
    if (key_it == section_it->second.end() || key_it->second.empty()) {
        throw ConfigError(fmt::format("Missing value {}.{} in configuration", section, key));
    }
    return key_it->second;
}

int requireInt(const IniSections& ini, const std::string& section, const std::string& key) {
    const std::string& text = requireValue(ini, section, key);
    long value = 0;
    std::size_t consumed = 0;
    try {
        value = std::stol(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(fmt::format("Invalid integer for {}.{}: '{}'", section, key, text));
    }
    if (consumed != text.size() || value < std::numeric_limits<int>::min() ||
        value > std::numeric_limits<int>::max()) {
        throw ConfigError(fmt::format("Invalid integer for {}.{}: '{}'", section, key, text));
    }
    return static_cast<int>(value);
}

} // namespace

IniSections parseIni(std::istream& in) {
    IniSections sections;
    std::string current;
    std::string raw;
    int line_number = 0;

    while (std::getline(in, raw)) {
        ++line_number;
        const std::string line = detail::trim(raw);
        if (line.empty() || line.front() == ';' || line.front() == '#') {
            continue;
        }

        if (line.front() == '[') {
            if (line.back() != ']' || line.size() < 3) {
                throw ConfigError(fmt::format("Malformed section header on line {}: {}", line_number, line));
            }
            current = detail::toLower(detail::trim(line.substr(1, line.size() - 2)));
            sections[current];
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw ConfigError(fmt::format("Expected 'key = value' on line {}: {}", line_number, line));
        }
        if (current.empty()) {
            throw ConfigError(fmt::format("Key outside of any section on line {}", line_number));
        }
        sections[current][detail::toLower(detail::trim(line.substr(0, eq)))] = detail::trim(line.substr(eq + 1));
    }
    return sections;
}

Settings settingsFromIni(const IniSections& ini) {
    Settings settings;
    settings.downloads_folder = requireValue(ini, "folders", "downloads");
    settings.input_file = requireValue(ini, "files", "input");
    settings.connect_timeout = std::chrono::seconds{requireInt(ini, "network", "connect_timeout")};
    settings.read_timeout = std::chrono::seconds{requireInt(ini, "network", "read_timeout")};
    settings.max_workers = requireInt(ini, "settings", "max_workers");
    settings.retry_count = requireInt(ini, "settings", "retry_count");
    settings.retry_delay = std::chrono::seconds{requireInt(ini, "settings", "retry_delay")};
    return settings;
}

void validateSettings(const Settings& settings) {
    if (settings.connect_timeout.count() <= 0) {
        throw ConfigError(fmt::format("Invalid connect timeout: {}. Must be positive.", settings.connect_timeout.count()));
    }
    if (settings.read_timeout.count() <= 0) {
        throw ConfigError(fmt::format("Invalid read timeout: {}. Must be positive.", settings.read_timeout.count()));
    }
    if (settings.max_workers < 1) {
        throw ConfigError(fmt::format("Invalid max workers: {}. Must be a positive integer.", settings.max_workers));
    }
    if (settings.retry_count < 0) {
        throw ConfigError(fmt::format("Invalid retry count: {}. Must be a non-negative integer.", settings.retry_count));
    }
    if (settings.retry_delay.count() < 0) {
        throw ConfigError(fmt::format("Invalid retry delay: {}. Must be a non-negative integer.", settings.retry_delay.count()));
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(settings.input_file, ec)) {
        throw ConfigError("Input file does not exist or is not a file: " + settings.input_file.string());
    }

    std::filesystem::create_directories(settings.downloads_folder, ec);
    if (ec || !std::filesystem::is_directory(settings.downloads_folder)) {
        throw ConfigError("Invalid downloads folder: " + settings.downloads_folder.string() +
                          (ec ? " - " + ec.message() : std::string{}));
    }
}

Settings loadSettings(const std::filesystem::path& config_file) {
    std::ifstream in(config_file);
    if (!in) {
        throw ConfigError("Cannot open configuration file: " + config_file.string());
    }
    Settings settings = settingsFromIni(parseIni(in));
    validateSettings(settings);
    return settings;
}

} // namespace batchdl
