#pragma once

#include "splitter/checksum.hpp"
#include "splitter/config.hpp"
#include "splitter/file_chunker.hpp"
#include "splitter/network.hpp"
#include "splitter/space_estimator.hpp"
#include "splitter/transfer_manager.hpp"
#include "splitter/transfer_planner.hpp"

#include <iostream>
#include <optional>
#include <vector>

namespace splitter {

enum class PipelineState {
    Idle,
    Fingerprinting,
    Splitting,
    FingerprintingParts,
    ManifestBuilt,
    ValidatingNamedParts,
    TransferPlanned,
    Done,
};

enum class PipelineOutcome { Completed, InsufficientSpace, UploadFailed };

struct PipelineResult {
    PipelineOutcome outcome{PipelineOutcome::Completed};
    std::optional<SpaceEstimate> space;
    std::optional<SplitOutput> output;
    TransferPlan plan;
    std::vector<TransferReport> reports;
};

class SplitPipeline {
  public:
    SplitPipeline(const Config &config, const CapacityProvider &capacity, NetworkTransport &transport,
                  std::ostream &out = std::cout, std::ostream &err = std::cerr);

    // Runs from Idle to Done. Precondition and I/O failures throw; nothing is
    // resumable, a new run starts from Idle again.
    PipelineResult run();

    PipelineState state() const noexcept { return state_; }

  private:
    PipelineResult run_split();
    PipelineResult run_selective();
    SplitOutput split_and_fingerprint(const std::filesystem::path &source, std::uint64_t size,
                                      const FileChunker &chunker);
    void transfer(PipelineResult &result);
    void enter(PipelineState state);

    const Config &config_;
    const CapacityProvider &capacity_;
    NetworkTransport &transport_;
    std::ostream &out_;
    std::ostream &err_;
    Fingerprinter fingerprinter_;
    PipelineState state_{PipelineState::Idle};
};

const char *state_name(PipelineState state) noexcept;

} // namespace splitter
