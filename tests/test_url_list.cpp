#include <catch2/catch.hpp>

#include "batchdl/failure.hpp"
#include "batchdl/url_list.hpp"
#include "test_helpers.hpp"

using namespace batchdl;
using namespace batchdl::testing;

TEST_CASE("URL list skips blank lines and comments", "[urls]") {
    TempDir dir;
    const auto input = dir.path() / "urls.txt";
    writeFile(input, "https://host/a.bin\n\n   \n# mirror list\n  https://host/b.bin  \r\nhttps://host/c.bin");

    const auto urls = readUrlList(input);

    CHECK(urls == std::vector<std::string>{"https://host/a.bin", "https://host/b.bin", "https://host/c.bin"});
}

TEST_CASE("unreadable URL list is a configuration error", "[urls]") {
    TempDir dir;
    CHECK_THROWS_AS(readUrlList(dir.path() / "missing.txt"), ConfigError);
}

TEST_CASE("URL validation requires scheme and host", "[urls]") {
    CHECK(isValidUrl("https://host/a.bin"));
    CHECK(isValidUrl("http://example.com:8080/path?q=1"));
    CHECK(isValidUrl("ftp://mirror"));
    CHECK_FALSE(isValidUrl("host/a.bin"));
    CHECK_FALSE(isValidUrl("https:///a.bin"));
    CHECK_FALSE(isValidUrl("://host/a.bin"));
    CHECK_FALSE(isValidUrl("ht tp://host/a.bin"));
    CHECK_FALSE(isValidUrl(""));
}

TEST_CASE("file name comes from the final path segment", "[urls]") {
    CHECK(fileNameFromUrl("https://host/dir/archive.tar.gz") == "archive.tar.gz");
    CHECK(fileNameFromUrl("https://host/dir/file.bin?token=abc#frag") == "file.bin");
    CHECK(fileNameFromUrl("https://host/dir/my%20report.pdf") == "my report.pdf");
    CHECK(fileNameFromUrl("https://host/dir/a%2Fb.txt") == "a_b.txt");
    CHECK(fileNameFromUrl("https://host/dir/") == "download");
    CHECK(fileNameFromUrl("https://host") == "download");
    CHECK(fileNameFromUrl("https://host/..") == "download");
    CHECK(fileNameFromUrl("https://host/100%") == "100%");
}

TEST_CASE("DM, DO and DA prefixes pick a subfolder", "[urls]") {
    CHECK(subfolderFor("DM_2024_report.csv") == "DM");
    CHECK(subfolderFor("DO_orders.zip") == "DO");
    CHECK(subfolderFor("DA_archive") == "DA");
    CHECK(subfolderFor("DMX_file.bin").empty());
    CHECK(subfolderFor("dm_file.bin").empty());
    CHECK(subfolderFor("file.bin").empty());
}
