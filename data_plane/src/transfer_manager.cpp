#include "splitter/transfer_manager.hpp"

#include <algorithm>
#include <utility>

namespace splitter {

TransferManager::TransferManager(NetworkTransport &transport, FailurePolicy policy, std::ostream &out,
                                 std::ostream &err)
    : transport_(transport), policy_(policy), out_(out), err_(err) {}

std::vector<TransferReport> TransferManager::execute(const TransferPlan &plan, const UploadDestination &destination) {
    UploadDestination target = destination;
    target.missing = plan.under_missing;

    std::vector<TransferReport> reports;
    reports.reserve(plan.artifacts.size());
    bool stopped = false;
    for (const auto &artifact : plan.artifacts) {
        TransferReport report{artifact, target.url_for(artifact), TransferStatus::NotAttempted, {}};
        if (stopped) {
            reports.push_back(std::move(report));
            continue;
        }
        out_ << "Uploading " << artifact.filename().string() << std::endl;
        auto result = transport_.upload(artifact, target);
        if (result.ok) {
            report.status = TransferStatus::Uploaded;
        } else {
            report.status = TransferStatus::Failed;
            report.error = result.error;
            err_ << "Failed to upload " << artifact.string() << " to " << report.url << ": " << result.error
                 << std::endl;
            if (policy_ == FailurePolicy::Abort) {
                stopped = true;
            }
        }
        reports.push_back(std::move(report));
    }
    return reports;
}

bool TransferManager::all_uploaded(const std::vector<TransferReport> &reports) {
    return std::all_of(reports.begin(), reports.end(),
                       [](const TransferReport &report) { return report.status == TransferStatus::Uploaded; });
}

} // namespace splitter
