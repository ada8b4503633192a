#include "splitter/errors.hpp"
#include "splitter/manifest.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace {

bool parse_fails(const std::string &text) {
    try {
        splitter::Manifest::parse(text);
    } catch (const splitter::ManifestError &) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    namespace fs = std::filesystem;
    const fs::path source = "/var/crash/vmdump.0";
    std::vector<splitter::Part> parts{
        {0, "/var/crash/vmdump.0.partaa", 512},
        {1, "/var/crash/vmdump.0.partab", 512},
        {2, "/var/crash/vmdump.0.partac", 76},
    };
    std::vector<splitter::Digest> digests{
        {"/var/crash/vmdump.0.partab", "22222222222222222222222222222222"},
        {source, "00000000000000000000000000000000"},
        {"/var/crash/vmdump.0.partaa", "11111111111111111111111111111111"},
        {"/var/crash/vmdump.0.partac", "33333333333333333333333333333333"},
    };

    auto manifest = splitter::ManifestBuilder::build(source, 1100, parts, digests);
    assert(manifest.number_of_parts() == 3);
    assert(manifest.source().name == "vmdump.0");
    assert(manifest.source().size == 1100);

    const std::string expected = "NUMBER_OF_PARTS: 3\n"
                                 "### FILESIZE BEGIN ###\n"
                                 "vmdump.0 1100\n"
                                 "vmdump.0.partaa 512\n"
                                 "vmdump.0.partab 512\n"
                                 "vmdump.0.partac 76\n"
                                 "### FILESIZE END ###\n"
                                 "### MD5 FINGERPRINT BEGIN ###\n"
                                 "00000000000000000000000000000000  vmdump.0\n"
                                 "11111111111111111111111111111111  vmdump.0.partaa\n"
                                 "22222222222222222222222222222222  vmdump.0.partab\n"
                                 "33333333333333333333333333333333  vmdump.0.partac\n"
                                 "### MD5 FINGERPRINT END ###\n";
    assert(manifest.render() == expected);

    auto parsed = splitter::Manifest::parse(expected);
    assert(parsed.number_of_parts() == 3);
    assert(parsed.entries[2].name == "vmdump.0.partab");
    assert(parsed.entries[2].size == 512);
    assert(parsed.entries[2].md5_hex == "22222222222222222222222222222222");

    // Sections are located by their markers, not by position.
    const std::string reordered = "### MD5 FINGERPRINT BEGIN ###\r\n"
                                  "aa  dump\r\n"
                                  "### MD5 FINGERPRINT END ###\r\n"
                                  "NUMBER_OF_PARTS: 0\r\n"
                                  "### FILESIZE BEGIN ###\r\n"
                                  "dump 0\r\n"
                                  "### FILESIZE END ###\r\n";
    assert(splitter::Manifest::parse(reordered).source().md5_hex == "aa");

    auto empty = splitter::ManifestBuilder::build("dump", 0, {}, {{"dump", "d41d8cd98f00b204e9800998ecf8427e"}});
    assert(empty.number_of_parts() == 0);
    assert(empty.render().compare(0, 19, "NUMBER_OF_PARTS: 0\n") == 0);

    bool threw = false;
    try {
        splitter::ManifestBuilder::build(source, 1100, parts, {digests.begin(), digests.begin() + 3});
    } catch (const splitter::ManifestError &) {
        threw = true;
    }
    assert(threw);

    threw = false;
    auto wrong = digests;
    wrong[0].artifact = "/var/crash/vmdump.0.partzz";
    try {
        splitter::ManifestBuilder::build(source, 1100, parts, wrong);
    } catch (const splitter::ManifestError &) {
        threw = true;
    }
    assert(threw);

    assert(parse_fails(""));
    assert(parse_fails("NUMBER_OF_PARTS: 1\n### FILESIZE BEGIN ###\ndump 5\n### FILESIZE END ###\n"
                       "### MD5 FINGERPRINT BEGIN ###\naa  dump\n### MD5 FINGERPRINT END ###\n"));
    assert(parse_fails("NUMBER_OF_PARTS: 0\n### FILESIZE BEGIN ###\ndump 5\n### FILESIZE END ###\n"
                       "### MD5 FINGERPRINT BEGIN ###\n### MD5 FINGERPRINT END ###\n"));
    assert(parse_fails("NUMBER_OF_PARTS: 0\n### FILESIZE BEGIN ###\ndump five\n### FILESIZE END ###\n"
                       "### MD5 FINGERPRINT BEGIN ###\naa  dump\n### MD5 FINGERPRINT END ###\n"));
    assert(parse_fails("NUMBER_OF_PARTS: 0\n### FILESIZE BEGIN ###\ndump 5\n"
                       "### MD5 FINGERPRINT BEGIN ###\naa  dump\n### MD5 FINGERPRINT END ###\n"));

    auto temp_dir = fs::temp_directory_path() / "splitter_manifest_test";
    fs::remove_all(temp_dir);
    fs::create_directories(temp_dir);
    auto meta = splitter::Manifest::path_for(temp_dir / "vmdump.0");
    assert(meta.filename() == "vmdump.0.meta");
    splitter::ManifestBuilder::write(manifest, meta);
    std::ifstream in(meta);
    std::string written((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    assert(written == expected);
    fs::remove_all(temp_dir);
    return 0;
}
