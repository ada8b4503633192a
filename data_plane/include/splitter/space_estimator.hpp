#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

namespace splitter {

class CapacityProvider {
  public:
    virtual ~CapacityProvider() = default;

    // Free bytes usable by an unprivileged writer, or nullopt when unknown.
    virtual std::optional<std::uint64_t> available_bytes(const std::filesystem::path &location) const = 0;
};

class FilesystemCapacityProvider : public CapacityProvider {
  public:
    std::optional<std::uint64_t> available_bytes(const std::filesystem::path &location) const override;
};

struct SpaceEstimate {
    std::uint64_t source_bytes;
    std::uint64_t required_bytes;
    std::optional<std::uint64_t> available_bytes;
    bool sufficient;
};

class SpaceEstimator {
  public:
    static constexpr double default_multiplier = 3.0;

    explicit SpaceEstimator(const CapacityProvider &capacity, double multiplier = default_multiplier);

    SpaceEstimate estimate(std::uint64_t source_bytes, const std::filesystem::path &location) const;

    static std::uint64_t required_bytes(std::uint64_t source_bytes, double multiplier);

    double multiplier() const noexcept { return multiplier_; }

  private:
    const CapacityProvider &capacity_;
    double multiplier_;
};

} // namespace splitter
