#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace splitter {

// Local appliance state consulted when the operator leaves things out.
class ApplianceProbe {
  public:
    virtual ~ApplianceProbe() = default;

    virtual std::optional<std::string> uuid() const = 0;

    // Where savecore writes kernel dumps; used in "wrong directory" hints.
    virtual std::optional<std::filesystem::path> savecore_directory() const = 0;
};

class LocalApplianceProbe : public ApplianceProbe {
  public:
    LocalApplianceProbe();
    LocalApplianceProbe(std::filesystem::path nef_config_cli, std::filesystem::path license_key,
                        std::filesystem::path dumpadm_conf);

    std::optional<std::string> uuid() const override;

    std::optional<std::filesystem::path> savecore_directory() const override;

    static std::optional<std::string> uuid_from_config_output(const std::string &output);

    static std::optional<std::string> uuid_from_license_key(const std::string &contents);

    static std::optional<std::filesystem::path> savecore_from_dumpadm_conf(const std::string &contents);

  private:
    std::optional<std::string> query_config_cli() const;

    std::filesystem::path nef_config_cli_;
    std::filesystem::path license_key_;
    std::filesystem::path dumpadm_conf_;
};

} // namespace splitter
