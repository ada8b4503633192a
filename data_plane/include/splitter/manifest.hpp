#pragma once

#include "splitter/checksum.hpp"
#include "splitter/file_chunker.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace splitter {

struct ManifestEntry {
    std::string name;
    std::uint64_t size;
    std::string md5_hex;
};

// Entry 0 describes the source file, the rest are the parts in sequence order.
struct Manifest {
    std::vector<ManifestEntry> entries;

    std::size_t number_of_parts() const noexcept { return entries.empty() ? 0 : entries.size() - 1; }

    const ManifestEntry &source() const;

    std::string render() const;

    static Manifest parse(const std::string &text);

    static std::filesystem::path path_for(const std::filesystem::path &source);
};

class ManifestBuilder {
  public:
    // `digests` must hold exactly one digest for the source and one per part.
    static Manifest build(const std::filesystem::path &source, std::uint64_t source_size,
                          const std::vector<Part> &parts, const std::vector<Digest> &digests);

    static std::filesystem::path write(const Manifest &manifest, const std::filesystem::path &path);
};

} // namespace splitter
