#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace splitter {

struct FileChunk {
    std::size_t index;
    std::uint64_t offset;
    std::uint64_t size;
};

struct Part {
    std::size_t index;
    std::filesystem::path path;
    std::uint64_t size;
};

class FileChunker {
  public:
    explicit FileChunker(std::uint64_t chunk_size_bytes, std::size_t copy_buffer_bytes = 1u << 20);

    // Byte ranges for a file of the given size. An empty file has no chunks.
    std::vector<FileChunk> plan(std::uint64_t file_size) const;

    std::vector<FileChunk> chunk_file(const std::filesystem::path &path) const;

    // Writes every chunk of `source` to its own part file beside it. Part files
    // left by an earlier split of the same source are removed first.
    std::vector<Part> split(const std::filesystem::path &source) const;

    // "<source>.part*" entries (parts and their digests) in the source directory.
    static std::vector<std::filesystem::path> existing_parts(const std::filesystem::path &source);

    // Deletes existing_parts(source) and returns what was removed.
    static std::vector<std::filesystem::path> remove_existing_parts(const std::filesystem::path &source);

    std::uint64_t chunk_size_bytes() const noexcept;

    static std::size_t suffix_width(std::size_t part_count);

    static std::string part_suffix(std::size_t index, std::size_t width);

    static std::filesystem::path part_path(const std::filesystem::path &source, std::size_t index,
                                           std::size_t width);

  private:
    void write_part(std::ifstream &in, const std::filesystem::path &source, const FileChunk &chunk,
                    const std::filesystem::path &target, std::vector<char> &buffer) const;

    std::uint64_t chunk_size_bytes_;
    std::size_t copy_buffer_bytes_;
};

} // namespace splitter
