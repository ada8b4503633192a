#pragma once

#include "splitter/config.hpp"
#include "splitter/network.hpp"
#include "splitter/transfer_planner.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace splitter {

enum class TransferStatus { Uploaded, Failed, NotAttempted };

struct TransferReport {
    std::filesystem::path artifact;
    std::string url;
    TransferStatus status;
    std::string error;
};

// Uploads a plan one artifact at a time, in plan order.
class TransferManager {
  public:
    TransferManager(NetworkTransport &transport, FailurePolicy policy, std::ostream &out = std::cout,
                    std::ostream &err = std::cerr);

    std::vector<TransferReport> execute(const TransferPlan &plan, const UploadDestination &destination);

    static bool all_uploaded(const std::vector<TransferReport> &reports);

  private:
    NetworkTransport &transport_;
    FailurePolicy policy_;
    std::ostream &out_;
    std::ostream &err_;
};

} // namespace splitter
