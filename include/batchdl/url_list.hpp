#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace batchdl {

// One URL per line; blank lines and '#' comments are skipped. Throws ConfigError if unreadable.
[[nodiscard]] std::vector<std::string> readUrlList(const std::filesystem::path& input_file);

// Requires "<scheme>://<host>...".
[[nodiscard]] bool isValidUrl(const std::string& url);

// Final path segment without query or fragment, percent-decoded. Falls back to "download".
[[nodiscard]] std::string fileNameFromUrl(const std::string& url);

// "DM", "DO" or "DA" for names starting with that prefix and an underscore, empty otherwise.
[[nodiscard]] std::string subfolderFor(const std::string& file_name);

} // namespace batchdl
