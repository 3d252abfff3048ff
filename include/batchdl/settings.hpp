#pragma once

#include <chrono>
#include <filesystem>
#include <istream>
#include <map>
#include <string>

namespace batchdl {

struct Settings {
    std::filesystem::path downloads_folder;
    std::filesystem::path input_file;
    std::chrono::seconds connect_timeout{0};
    std::chrono::seconds read_timeout{0};
    int max_workers{0};
    int retry_count{0};
    std::chrono::seconds retry_delay{0};
};

using IniSections = std::map<std::string, std::map<std::string, std::string>>;

// Throws ConfigError with the offending line number on malformed input.
[[nodiscard]] IniSections parseIni(std::istream& in);

// Reads every required key; throws ConfigError for missing or non-integer values.
[[nodiscard]] Settings settingsFromIni(const IniSections& ini);

// Range checks plus input-file existence; creates the downloads folder.
void validateSettings(const Settings& settings);

[[nodiscard]] Settings loadSettings(const std::filesystem::path& config_file);

} // namespace batchdl
