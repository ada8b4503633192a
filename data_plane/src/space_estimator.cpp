#include "splitter/space_estimator.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace splitter {

std::optional<std::uint64_t> FilesystemCapacityProvider::available_bytes(
    const std::filesystem::path &location) const {
    std::error_code ec;
    auto info = std::filesystem::space(location, ec);
    if (ec || info.available == static_cast<std::uintmax_t>(-1)) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(info.available);
}

SpaceEstimator::SpaceEstimator(const CapacityProvider &capacity, double multiplier)
    : capacity_(capacity), multiplier_(multiplier) {
    if (!(multiplier_ > 0.0) || !std::isfinite(multiplier_)) {
        throw std::invalid_argument("space multiplier must be a positive number");
    }
}

SpaceEstimate SpaceEstimator::estimate(std::uint64_t source_bytes, const std::filesystem::path &location) const {
    SpaceEstimate result{source_bytes, required_bytes(source_bytes, multiplier_), std::nullopt, false};
    result.available_bytes = capacity_.available_bytes(location);
    result.sufficient = result.available_bytes && *result.available_bytes >= result.required_bytes;
    return result;
}

std::uint64_t SpaceEstimator::required_bytes(std::uint64_t source_bytes, double multiplier) {
    const long double required = std::ceil(static_cast<long double>(source_bytes) * multiplier);
    const auto limit = static_cast<long double>(std::numeric_limits<std::uint64_t>::max());
    if (required >= limit) {
        return std::numeric_limits<std::uint64_t>::max();
    }
    return static_cast<std::uint64_t>(required);
}

} // namespace splitter
