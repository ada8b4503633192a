#include "splitter/checksum.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace {

std::string read_all(const std::filesystem::path &path) {
    std::ifstream in(path);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace

int main() {
    namespace fs = std::filesystem;

    assert(splitter::Checksum::md5_hex({}) == "d41d8cd98f00b204e9800998ecf8427e");
    std::vector<char> data{'a', 'b', 'c'};
    auto hex = splitter::Checksum::md5_hex(data);
    assert(hex == "900150983cd24fb0d6963f7d28e17f72");
    splitter::Checksum::Md5Accumulator accumulator;
    accumulator.update(data.data(), 2);
    accumulator.update(data.data() + 2, data.size() - 2);
    assert(accumulator.hex() == hex);

    auto temp_dir = fs::temp_directory_path() / "splitter_checksum_test";
    fs::remove_all(temp_dir);
    fs::create_directories(temp_dir);
    auto file_path = temp_dir / "vmdump.0";
    std::vector<char> contents(10000);
    for (std::size_t i = 0; i < contents.size(); ++i) {
        contents[i] = static_cast<char>(i * 31 % 251);
    }
    {
        std::ofstream file(file_path, std::ios::binary);
        file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    }

    // A small read buffer forces many updates; the result must not depend on it.
    splitter::Fingerprinter small(7);
    splitter::Fingerprinter large;
    auto first = small.digest(file_path);
    auto second = large.digest(file_path);
    assert(first.hex == second.hex);
    assert(first.hex == splitter::Checksum::md5_hex(contents));
    assert(first.artifact == file_path);

    auto digest_file = small.persist(first);
    assert(digest_file == temp_dir / "vmdump.0.md5");
    assert(read_all(digest_file) == first.hex + "  vmdump.0\n");

    contents[5000] = static_cast<char>(contents[5000] ^ 0x01);
    {
        std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
        file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    }
    auto mutated = large.fingerprint(file_path);
    assert(mutated.hex != first.hex);
    assert(read_all(digest_file) == mutated.hex + "  vmdump.0\n");

    bool threw = false;
    try {
        large.digest(temp_dir / "absent");
    } catch (const std::exception &) {
        threw = true;
    }
    assert(threw);

    fs::remove_all(temp_dir);
    return 0;
}
