#include "batchdl/url_list.hpp"
#include "batchdl/failure.hpp"
#include "batchdl/detail/string_utils.hpp"

#include <cctype>
#include <fstream>

namespace batchdl {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

std::string percentDecode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int hi = hexValue(text[i + 1]);
            const int lo = hexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return out;
}

} // namespace

std::vector<std::string> readUrlList(const std::filesystem::path& input_file) {
    std::ifstream in(input_file);
    if (!in) {
        throw ConfigError("Cannot read input file: " + input_file.string());
    }

    std::vector<std::string> urls;
    std::string line;
    while (std::getline(in, line)) {
        line = detail::trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        urls.push_back(line);
    }
    return urls;
}

bool isValidUrl(const std::string& url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return false;
    }
    for (std::size_t i = 0; i < scheme_end; ++i) {
        const auto c = static_cast<unsigned char>(url[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    const auto host_begin = scheme_end + 3;
    const auto host_end = url.find_first_of("/?#", host_begin);
    const std::string authority = url.substr(host_begin, host_end == std::string::npos ? std::string::npos
                                                                                       : host_end - host_begin);
    return !authority.empty() && authority.find_first_of(" \t") == std::string::npos;
}

std::string fileNameFromUrl(const std::string& url) {
    std::string path = url;
    const auto scheme_end = path.find("://");
    if (scheme_end != std::string::npos) {
        const auto path_begin = path.find('/', scheme_end + 3);
        path = path_begin == std::string::npos ? std::string{} : path.substr(path_begin);
    }
    const auto cut = path.find_first_of("?#");
    if (cut != std::string::npos) {
        path.erase(cut);
    }

    const auto slash = path.find_last_of('/');
    std::string name = percentDecode(slash == std::string::npos ? path : path.substr(slash + 1));
    for (auto& c : name) {
        if (c == '/' || c == '\\' || c == '\0') {
            c = '_';
        }
    }
    if (name.empty() || name == "." || name == "..") {
        return "download";
    }
    return name;
}

std::string subfolderFor(const std::string& file_name) {
    for (const char* prefix : {"DM", "DO", "DA"}) {
        if (file_name.rfind(std::string{prefix} + "_", 0) == 0) {
            return prefix;
        }
    }
    return {};
}

} // namespace batchdl
