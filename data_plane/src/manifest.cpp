#include "splitter/manifest.hpp"

#include "splitter/errors.hpp"

#include <fstream>
#include <map>
#include <sstream>

namespace splitter {

namespace {

const std::string parts_label = "NUMBER_OF_PARTS:";
const std::string size_begin = "### FILESIZE BEGIN ###";
const std::string size_end = "### FILESIZE END ###";
const std::string md5_begin = "### MD5 FINGERPRINT BEGIN ###";
const std::string md5_end = "### MD5 FINGERPRINT END ###";

std::vector<std::string> section(const std::vector<std::string> &lines, const std::string &begin,
                                 const std::string &end) {
    std::vector<std::string> body;
    bool inside = false;
    bool closed = false;
    for (const auto &line : lines) {
        if (line == begin) {
            if (inside || closed) {
                throw ManifestError("duplicate section marker: " + begin);
            }
            inside = true;
        } else if (line == end) {
            if (!inside) {
                throw ManifestError("section end without begin: " + end);
            }
            inside = false;
            closed = true;
        } else if (inside && !line.empty()) {
            body.push_back(line);
        }
    }
    if (!closed) {
        throw ManifestError("missing section: " + begin);
    }
    return body;
}

std::uint64_t parse_size(const std::string &text, const std::string &line) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw ManifestError("malformed size line: " + line);
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range &) {
        throw ManifestError("size out of range: " + line);
    }
}

} // namespace

const ManifestEntry &Manifest::source() const {
    if (entries.empty()) {
        throw ManifestError("manifest has no source entry");
    }
    return entries.front();
}

std::string Manifest::render() const {
    std::ostringstream oss;
    oss << parts_label << ' ' << number_of_parts() << '\n';
    oss << size_begin << '\n';
    for (const auto &entry : entries) {
        oss << entry.name << ' ' << entry.size << '\n';
    }
    oss << size_end << '\n';
    oss << md5_begin << '\n';
    for (const auto &entry : entries) {
        oss << entry.md5_hex << "  " << entry.name << '\n';
    }
    oss << md5_end << '\n';
    return oss.str();
}

Manifest Manifest::parse(const std::string &text) {
    std::vector<std::string> lines;
    {
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            lines.push_back(line);
        }
    }

    std::size_t declared = 0;
    bool have_count = false;
    for (const auto &line : lines) {
        if (line.compare(0, parts_label.size(), parts_label) == 0) {
            auto value = line.substr(parts_label.size());
            value.erase(0, value.find_first_not_of(" \t"));
            declared = static_cast<std::size_t>(parse_size(value, line));
            have_count = true;
            break;
        }
    }
    if (!have_count) {
        throw ManifestError("missing " + parts_label + " line");
    }

    Manifest manifest;
    std::map<std::string, std::size_t> by_name;
    for (const auto &line : section(lines, size_begin, size_end)) {
        const auto space = line.find_last_of(' ');
        if (space == std::string::npos || space == 0) {
            throw ManifestError("malformed size line: " + line);
        }
        ManifestEntry entry{line.substr(0, space), parse_size(line.substr(space + 1), line), {}};
        if (!by_name.emplace(entry.name, manifest.entries.size()).second) {
            throw ManifestError("duplicate size entry: " + entry.name);
        }
        manifest.entries.push_back(std::move(entry));
    }

    for (const auto &line : section(lines, md5_begin, md5_end)) {
        const auto separator = line.find("  ");
        if (separator == std::string::npos) {
            throw ManifestError("malformed fingerprint line: " + line);
        }
        const auto name = line.substr(separator + 2);
        auto found = by_name.find(name);
        if (found == by_name.end()) {
            throw ManifestError("fingerprint for unlisted artifact: " + name);
        }
        auto &entry = manifest.entries[found->second];
        if (!entry.md5_hex.empty()) {
            throw ManifestError("duplicate fingerprint entry: " + name);
        }
        entry.md5_hex = line.substr(0, separator);
    }

    for (const auto &entry : manifest.entries) {
        if (entry.md5_hex.empty()) {
            throw ManifestError("missing fingerprint for " + entry.name);
        }
    }
    if (manifest.entries.empty()) {
        throw ManifestError("manifest lists no source file");
    }
    if (manifest.number_of_parts() != declared) {
        throw ManifestError("declared part count " + std::to_string(declared) + " does not match " +
                            std::to_string(manifest.number_of_parts()) + " listed parts");
    }
    return manifest;
}

std::filesystem::path Manifest::path_for(const std::filesystem::path &source) {
    auto path = source;
    path += ".meta";
    return path;
}

Manifest ManifestBuilder::build(const std::filesystem::path &source, std::uint64_t source_size,
                                const std::vector<Part> &parts, const std::vector<Digest> &digests) {
    if (digests.size() != parts.size() + 1) {
        throw ManifestError("expected " + std::to_string(parts.size() + 1) + " digests, got " +
                            std::to_string(digests.size()));
    }
    auto digest_for = [&](const std::filesystem::path &artifact) -> const std::string & {
        for (const auto &digest : digests) {
            if (digest.artifact == artifact) {
                return digest.hex;
            }
        }
        throw ManifestError("no digest recorded for " + artifact.string());
    };

    Manifest manifest;
    manifest.entries.reserve(parts.size() + 1);
    manifest.entries.push_back(ManifestEntry{source.filename().string(), source_size, digest_for(source)});
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const auto &part = parts[i];
        if (part.index != i) {
            throw ManifestError("parts out of sequence at " + part.path.string());
        }
        manifest.entries.push_back(ManifestEntry{part.path.filename().string(), part.size, digest_for(part.path)});
    }
    return manifest;
}

std::filesystem::path ManifestBuilder::write(const Manifest &manifest, const std::filesystem::path &path) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw IoError("failed to create manifest", path, last_os_error());
    }
    out << manifest.render();
    out.flush();
    if (!out) {
        throw IoError("failed to write manifest", path);
    }
    return path;
}

} // namespace splitter
