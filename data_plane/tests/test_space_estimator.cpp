#include "splitter/space_estimator.hpp"

#include <cassert>
#include <filesystem>
#include <limits>
#include <optional>
#include <stdexcept>

namespace {

class FixedCapacity : public splitter::CapacityProvider {
  public:
    explicit FixedCapacity(std::optional<std::uint64_t> available) : available_(available) {}

    std::optional<std::uint64_t> available_bytes(const std::filesystem::path &) const override {
        return available_;
    }

  private:
    std::optional<std::uint64_t> available_;
};

} // namespace

int main() {
    const std::filesystem::path here(".");

    FixedCapacity plenty(3000);
    splitter::SpaceEstimator estimator(plenty);
    assert(estimator.multiplier() == 3.0);
    auto exact = estimator.estimate(1000, here);
    assert(exact.required_bytes == 3000);
    assert(exact.available_bytes && *exact.available_bytes == 3000);
    assert(exact.sufficient);

    auto short_by_one = estimator.estimate(1001, here);
    assert(short_by_one.required_bytes == 3003);
    assert(!short_by_one.sufficient);

    FixedCapacity unknown(std::nullopt);
    splitter::SpaceEstimator blind(unknown);
    auto guess = blind.estimate(0, here);
    assert(!guess.available_bytes);
    assert(!guess.sufficient);

    FixedCapacity some(2500);
    splitter::SpaceEstimator tighter(some, 2.5);
    assert(tighter.estimate(1000, here).sufficient);
    assert(!tighter.estimate(1001, here).sufficient);
    assert(splitter::SpaceEstimator::required_bytes(3, 1.5) == 5);

    const auto max = std::numeric_limits<std::uint64_t>::max();
    assert(splitter::SpaceEstimator::required_bytes(max / 2, 3.0) == max);
    FixedCapacity everything(max);
    assert(splitter::SpaceEstimator(everything).estimate(max / 2, here).sufficient);

    for (double bad : {0.0, -1.0, std::numeric_limits<double>::infinity()}) {
        bool threw = false;
        try {
            splitter::SpaceEstimator invalid(plenty, bad);
        } catch (const std::invalid_argument &) {
            threw = true;
        }
        assert(threw);
    }

    splitter::FilesystemCapacityProvider filesystem;
    auto temp_free = filesystem.available_bytes(std::filesystem::temp_directory_path());
    assert(temp_free.has_value());
    assert(!filesystem.available_bytes("/nonexistent/splitter/location").has_value());
    return 0;
}
