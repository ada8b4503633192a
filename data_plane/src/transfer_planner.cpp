#include "splitter/transfer_planner.hpp"

#include "splitter/errors.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace splitter {

std::vector<std::filesystem::path> SplitOutput::cleanup_candidates() const {
    std::vector<std::filesystem::path> files;
    files.reserve(parts.size() + part_digests.size() + 2);
    files.push_back(source_digest);
    for (const auto &part : parts) {
        files.push_back(part.path);
    }
    files.insert(files.end(), part_digests.begin(), part_digests.end());
    files.push_back(manifest);
    return files;
}

TransferPlanner::TransferPlanner(std::string missing_hint) : missing_hint_(std::move(missing_hint)) {}

TransferPlan TransferPlanner::plan(TransferMode mode, const SplitOutput &output) const {
    TransferPlan plan;
    plan.mode = mode;
    switch (mode) {
    case TransferMode::Full:
        plan.artifacts.reserve(output.parts.size() + 2);
        plan.artifacts.push_back(output.manifest);
        plan.artifacts.push_back(output.source_digest);
        for (const auto &part : output.parts) {
            plan.artifacts.push_back(part.path);
        }
        break;
    case TransferMode::DryRun:
        plan.manual.reserve(output.parts.size() + 2);
        plan.manual.push_back(output.source_digest);
        for (const auto &part : output.parts) {
            plan.manual.push_back(part.path);
        }
        plan.manual.push_back(output.manifest);
        break;
    case TransferMode::Selective:
        throw std::invalid_argument("selective transfers are planned from part names");
    }
    return plan;
}

TransferPlan TransferPlanner::plan_selective(const std::vector<std::string> &names,
                                             const std::filesystem::path &base_dir) const {
    if (names.empty()) {
        throw std::invalid_argument("no part names given for selective upload");
    }
    TransferPlan plan;
    plan.mode = TransferMode::Selective;
    plan.under_missing = true;
    plan.artifacts.reserve(names.size());
    for (const auto &name : names) {
        std::filesystem::path path(name);
        if (path.is_relative()) {
            path = base_dir / path;
        }
        if (!is_readable(path)) {
            throw MissingArtifactError(name, missing_hint_);
        }
        plan.artifacts.push_back(path);
    }
    return plan;
}

bool TransferPlanner::is_readable(const std::filesystem::path &path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
    std::ifstream in(path, std::ios::binary);
    return static_cast<bool>(in);
}

} // namespace splitter
