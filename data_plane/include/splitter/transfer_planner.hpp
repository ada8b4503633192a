#pragma once

#include "splitter/config.hpp"
#include "splitter/file_chunker.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace splitter {

// Everything a split run leaves on disk.
struct SplitOutput {
    std::filesystem::path source;
    std::uint64_t source_size{0};
    std::filesystem::path source_digest;
    std::filesystem::path manifest;
    std::vector<Part> parts;
    std::vector<std::filesystem::path> part_digests;

    // Files the operator may remove once the upload has been confirmed.
    std::vector<std::filesystem::path> cleanup_candidates() const;
};

struct TransferPlan {
    TransferMode mode{TransferMode::Full};
    // Upload order; empty for a dry run.
    std::vector<std::filesystem::path> artifacts;
    // Selective re-uploads land under a "missing" sub-path at the destination.
    bool under_missing{false};
    // What the operator has to move by hand when nothing is uploaded.
    std::vector<std::filesystem::path> manual;
};

class TransferPlanner {
  public:
    explicit TransferPlanner(std::string missing_hint = {});

    // Full: manifest, source digest, then every part. DryRun: nothing to upload.
    TransferPlan plan(TransferMode mode, const SplitOutput &output) const;

    // All-or-nothing: throws MissingArtifactError for the first name that
    // cannot be read, before anything is planned.
    TransferPlan plan_selective(const std::vector<std::string> &names,
                                const std::filesystem::path &base_dir = std::filesystem::current_path()) const;

    static bool is_readable(const std::filesystem::path &path);

  private:
    std::string missing_hint_;
};

} // namespace splitter
