#include "splitter/file_chunker.hpp"

#include "splitter/errors.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace splitter {

namespace {

constexpr std::size_t min_suffix_width = 2;
constexpr std::size_t alphabet = 26;

} // namespace

FileChunker::FileChunker(std::uint64_t chunk_size_bytes, std::size_t copy_buffer_bytes)
    : chunk_size_bytes_(chunk_size_bytes), copy_buffer_bytes_(copy_buffer_bytes) {
    if (chunk_size_bytes_ == 0) {
        throw std::invalid_argument("chunk size must be > 0");
    }
    if (copy_buffer_bytes_ == 0) {
        throw std::invalid_argument("copy buffer size must be > 0");
    }
}

std::vector<FileChunk> FileChunker::plan(std::uint64_t file_size) const {
    std::vector<FileChunk> chunks;
    chunks.reserve(static_cast<std::size_t>(file_size / chunk_size_bytes_) + 1);
    std::size_t index = 0;
    for (std::uint64_t offset = 0; offset < file_size; offset += chunk_size_bytes_) {
        const auto remaining = file_size - offset;
        const auto size = std::min<std::uint64_t>(remaining, chunk_size_bytes_);
        chunks.push_back(FileChunk{index++, offset, size});
        if (remaining <= chunk_size_bytes_) {
            break;
        }
    }
    return chunks;
}

std::vector<FileChunk> FileChunker::chunk_file(const std::filesystem::path &path) const {
    if (!std::filesystem::is_regular_file(path)) {
        throw std::invalid_argument("path must be a regular file: " + path.string());
    }
    return plan(std::filesystem::file_size(path));
}

std::vector<Part> FileChunker::split(const std::filesystem::path &source) const {
    const auto chunks = chunk_file(source);
    const auto width = suffix_width(chunks.size());
    remove_existing_parts(source);

    std::ifstream in(source, std::ios::binary);
    if (!in) {
        throw IoError("failed to open source file", source, last_os_error());
    }
    std::vector<char> buffer(static_cast<std::size_t>(
        std::min<std::uint64_t>(copy_buffer_bytes_, chunk_size_bytes_)));

    std::vector<Part> parts;
    parts.reserve(chunks.size());
    for (const auto &chunk : chunks) {
        auto target = part_path(source, chunk.index, width);
        write_part(in, source, chunk, target, buffer);
        parts.push_back(Part{chunk.index, std::move(target), chunk.size});
    }
    return parts;
}

void FileChunker::write_part(std::ifstream &in, const std::filesystem::path &source, const FileChunk &chunk,
                             const std::filesystem::path &target, std::vector<char> &buffer) const {
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IoError("failed to create part file", target, last_os_error());
    }
    std::uint64_t remaining = chunk.size;
    while (remaining > 0) {
        const auto to_read = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
        in.read(buffer.data(), static_cast<std::streamsize>(to_read));
        const auto read = in.gcount();
        if (read <= 0) {
            throw IoError("unexpected end of file while splitting", source);
        }
        out.write(buffer.data(), read);
        if (!out) {
            throw IoError("write failed", target);
        }
        remaining -= static_cast<std::uint64_t>(read);
    }
    out.close();
    if (!out) {
        throw IoError("failed to close part file", target);
    }
}

std::vector<std::filesystem::path> FileChunker::existing_parts(const std::filesystem::path &source) {
    auto dir = source.parent_path();
    if (dir.empty()) {
        dir = ".";
    }
    const auto prefix = source.filename().string() + ".part";
    std::vector<std::filesystem::path> found;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (name.size() > prefix.size() && name.compare(0, prefix.size(), prefix) == 0) {
            found.push_back(it->path());
        }
    }
    if (ec) {
        throw IoError("failed to list directory", dir, ec);
    }
    std::sort(found.begin(), found.end());
    return found;
}

std::vector<std::filesystem::path> FileChunker::remove_existing_parts(const std::filesystem::path &source) {
    auto stale = existing_parts(source);
    for (const auto &path : stale) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            throw IoError("failed to remove part from an earlier split", path, ec);
        }
    }
    return stale;
}

std::uint64_t FileChunker::chunk_size_bytes() const noexcept { return chunk_size_bytes_; }

std::size_t FileChunker::suffix_width(std::size_t part_count) {
    std::size_t width = min_suffix_width;
    std::size_t capacity = alphabet * alphabet;
    while (part_count > capacity) {
        ++width;
        capacity *= alphabet;
    }
    return width;
}

std::string FileChunker::part_suffix(std::size_t index, std::size_t width) {
    std::string suffix(width, 'a');
    for (std::size_t pos = width; pos > 0; --pos) {
        suffix[pos - 1] = static_cast<char>('a' + index % alphabet);
        index /= alphabet;
    }
    if (index != 0) {
        throw std::out_of_range("part index does not fit in suffix width");
    }
    return suffix;
}

std::filesystem::path FileChunker::part_path(const std::filesystem::path &source, std::size_t index,
                                             std::size_t width) {
    auto path = source;
    path += ".part" + part_suffix(index, width);
    return path;
}

} // namespace splitter
