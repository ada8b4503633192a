#include "splitter/pipeline.hpp"

#include "splitter/errors.hpp"
#include "splitter/file_chunker.hpp"
#include "splitter/manifest.hpp"

#include <system_error>

namespace splitter {

namespace {

std::filesystem::path directory_of(const std::filesystem::path &file) {
    auto dir = file.parent_path();
    return dir.empty() ? std::filesystem::path(".") : dir;
}

void print_list(std::ostream &out, const std::vector<std::filesystem::path> &files) {
    for (const auto &file : files) {
        out << "  " << file.string() << '\n';
    }
    out.flush();
}

} // namespace

SplitPipeline::SplitPipeline(const Config &config, const CapacityProvider &capacity, NetworkTransport &transport,
                             std::ostream &out, std::ostream &err)
    : config_(config), capacity_(capacity), transport_(transport), out_(out), err_(err) {}

PipelineResult SplitPipeline::run() {
    state_ = PipelineState::Idle;
    if (config_.verbose) {
        out_ << "Mode: " << mode_name(config_.mode) << std::endl;
    }
    if (config_.mode == TransferMode::Selective) {
        return run_selective();
    }
    return run_split();
}

PipelineResult SplitPipeline::run_selective() {
    enter(PipelineState::ValidatingNamedParts);
    out_ << "Re-uploading missing files:";
    for (const auto &name : config_.named_parts) {
        out_ << ' ' << name;
    }
    out_ << std::endl;

    TransferPlanner planner(config_.location_hint(true));
    PipelineResult result;
    result.plan = planner.plan_selective(config_.named_parts);
    enter(PipelineState::TransferPlanned);
    transfer(result);
    enter(PipelineState::Done);
    return result;
}

PipelineResult SplitPipeline::run_split() {
    const auto &source = config_.source;
    if (!TransferPlanner::is_readable(source)) {
        throw MissingArtifactError(source, config_.location_hint(false));
    }
    const FileChunker chunker(config_.chunk_size_bytes);
    const SpaceEstimator estimator(capacity_, config_.space_multiplier);

    std::error_code ec;
    const auto size = std::filesystem::file_size(source, ec);
    if (ec) {
        throw IoError("failed to read size of", source, ec);
    }

    PipelineResult result;
    out_ << "Checking for enough free space to split " << source.string() << " : ";
    result.space = estimator.estimate(size, directory_of(source));
    if (!result.space->sufficient) {
        out_ << "Failed\n\n";
        out_ << "Insufficient free space in " << directory_of(source).string() << " to allow splitting "
             << source.string() << '\n';
        out_ << "File size is      : " << size << " bytes\n";
        out_ << "Required space is : " << result.space->required_bytes << " bytes\n";
        if (result.space->available_bytes) {
            out_ << "Available space is: " << *result.space->available_bytes << " bytes\n";
        } else {
            out_ << "Available space could not be determined\n";
        }
        out_ << std::endl;
        result.outcome = PipelineOutcome::InsufficientSpace;
        enter(PipelineState::Done);
        return result;
    }
    out_ << "Pass" << std::endl;

    result.output = split_and_fingerprint(source, size, chunker);

    TransferPlanner planner;
    result.plan = planner.plan(config_.mode, *result.output);
    enter(PipelineState::TransferPlanned);

    if (config_.mode == TransferMode::DryRun) {
        out_ << "\nParts have been split but not uploaded.\n\n";
        out_ << "Please manually upload these to the support portal:\n";
        print_list(out_, result.plan.manual);
    } else {
        out_ << "Uploading all parts and md5 fingerprint files" << std::endl;
        transfer(result);
        if (result.outcome == PipelineOutcome::Completed) {
            out_ << "\nParts have been uploaded, please consider deleting the following:\n";
            print_list(out_, result.output->cleanup_candidates());
        }
    }
    enter(PipelineState::Done);
    out_ << "Finished" << std::endl;
    return result;
}

SplitOutput SplitPipeline::split_and_fingerprint(const std::filesystem::path &source, std::uint64_t size,
                                                 const FileChunker &chunker) {
    SplitOutput output;
    output.source = source;
    output.source_size = size;

    enter(PipelineState::Fingerprinting);
    out_ << "\nGenerating md5 fingerprint for " << source.string()
         << ", this may take a while on large files ..." << std::endl;
    std::vector<Digest> digests;
    digests.reserve(1);
    digests.push_back(fingerprinter_.fingerprint(source));
    output.source_digest = Fingerprinter::digest_path(source);
    if (config_.verbose) {
        out_ << Fingerprinter::digest_line(digests.back()) << std::endl;
    }

    enter(PipelineState::Splitting);
    const auto stale = FileChunker::remove_existing_parts(source);
    if (!stale.empty()) {
        out_ << "Removed " << stale.size() << " part files left by an earlier split of " << source.string()
             << std::endl;
        if (config_.verbose) {
            print_list(out_, stale);
        }
    }
    out_ << "Splitting " << source.string() << " into parts ..." << std::endl;
    output.parts = chunker.split(source);
    if (output.parts.empty()) {
        out_ << source.string() << " is empty, no parts were created" << std::endl;
    }

    enter(PipelineState::FingerprintingParts);
    out_ << "Generating md5 fingerprint for all parts: ";
    digests.reserve(output.parts.size() + 1);
    output.part_digests.reserve(output.parts.size());
    for (const auto &part : output.parts) {
        out_ << part.path.filename().string() << ' ' << std::flush;
        digests.push_back(fingerprinter_.fingerprint(part.path));
        output.part_digests.push_back(Fingerprinter::digest_path(part.path));
    }
    out_ << std::endl;
    if (config_.verbose) {
        for (std::size_t i = 1; i < digests.size(); ++i) {
            out_ << Fingerprinter::digest_line(digests[i]) << std::endl;
        }
    }

    const auto manifest = ManifestBuilder::build(source, size, output.parts, digests);
    output.manifest = ManifestBuilder::write(manifest, Manifest::path_for(source));
    enter(PipelineState::ManifestBuilt);
    out_ << "Wrote " << output.manifest.string() << " describing " << manifest.number_of_parts() << " parts"
         << std::endl;
    return output;
}

void SplitPipeline::enter(PipelineState state) {
    state_ = state;
    if (config_.verbose) {
        out_ << "[" << state_name(state) << "]" << std::endl;
    }
}

void SplitPipeline::transfer(PipelineResult &result) {
    const auto destination = config_.destination();
    if (config_.verbose) {
        out_ << "Destination: " << region_name(destination.endpoint.region) << ' '
             << destination.url_for("") << std::endl;
    }
    TransferManager manager(transport_, config_.on_failure, out_, err_);
    result.reports = manager.execute(result.plan, destination);
    if (TransferManager::all_uploaded(result.reports)) {
        return;
    }
    result.outcome = PipelineOutcome::UploadFailed;
    std::vector<std::string> retry;
    for (const auto &report : result.reports) {
        if (report.status != TransferStatus::Uploaded) {
            retry.push_back(report.artifact.filename().string());
        }
    }
    err_ << "\n" << retry.size() << " of " << result.reports.size() << " files were not uploaded.\n"
         << "Re-run with -m to upload just these:\n  -m ";
    for (std::size_t i = 0; i < retry.size(); ++i) {
        err_ << (i == 0 ? "" : ",") << retry[i];
    }
    err_ << std::endl;
}

const char *state_name(PipelineState state) noexcept {
    switch (state) {
    case PipelineState::Idle:
        return "idle";
    case PipelineState::Fingerprinting:
        return "fingerprinting";
    case PipelineState::Splitting:
        return "splitting";
    case PipelineState::FingerprintingParts:
        return "fingerprinting parts";
    case PipelineState::ManifestBuilt:
        return "manifest built";
    case PipelineState::ValidatingNamedParts:
        return "validating named parts";
    case PipelineState::TransferPlanned:
        return "transfer planned";
    case PipelineState::Done:
        return "done";
    }
    return "unknown";
}

} // namespace splitter
