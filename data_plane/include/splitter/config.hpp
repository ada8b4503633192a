#pragma once

#include "splitter/network.hpp"
#include "splitter/space_estimator.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace splitter {

class ApplianceProbe;

enum class TransferMode { Full, Selective, DryRun };

enum class FailurePolicy { Abort, Continue };

constexpr const char *unknown_identity = "unknown";
constexpr std::uint64_t default_chunk_size_bytes = 512ull * 1024 * 1024;

struct Config {
    UploadEndpoint endpoint{UploadEndpoint::for_region(Region::Amer)};
    std::string uuid{unknown_identity};
    std::string case_ref{unknown_identity};
    TransferMode mode{TransferMode::Full};
    std::uint64_t chunk_size_bytes{default_chunk_size_bytes};
    double space_multiplier{SpaceEstimator::default_multiplier};
    FailurePolicy on_failure{FailurePolicy::Abort};
    bool verbose{false};
    std::filesystem::path source;
    std::vector<std::string> named_parts;
    std::optional<std::filesystem::path> savecore_dir;

    UploadDestination destination() const;

    // Operator hint appended to "file not found" diagnostics.
    std::string location_hint(bool kernel_dump_parts) const;
};

struct CommandLine {
    bool help{false};
    Config config;
};

// Parses "512m", "1024M", "4k", "1g", "100" into bytes. Rejects zero, negative
// and malformed sizes.
std::uint64_t parse_size(const std::string &text);

double parse_multiplier(const std::string &text);

// Splits a -m argument on commas, spaces and tabs, dropping empty entries.
std::vector<std::string> split_names(const std::string &list);

CommandLine parse_command_line(int argc, const char *const *argv, const ApplianceProbe &probe);

std::string usage(const std::string &program);

std::string help_text(const std::string &program);

const char *mode_name(TransferMode mode) noexcept;

} // namespace splitter
