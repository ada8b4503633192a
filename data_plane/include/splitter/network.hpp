#pragma once

#include <filesystem>
#include <string>

namespace splitter {

enum class Region { Amer, Emea };

struct UploadEndpoint {
    Region region;
    std::string base_url;

    static UploadEndpoint for_region(Region region);
};

struct UploadDestination {
    UploadEndpoint endpoint;
    std::string uuid;
    std::string case_ref;
    bool missing{false};

    // <base>/nstor/<uuid>/<case>[/missing]/<name>
    std::string url_for(const std::filesystem::path &artifact) const;
};

struct UploadResult {
    bool ok;
    std::string error;
};

class NetworkTransport {
  public:
    virtual ~NetworkTransport() = default;

    virtual UploadResult upload(const std::filesystem::path &artifact, const UploadDestination &destination) = 0;
};

class CurlFtpTransport : public NetworkTransport {
  public:
    explicit CurlFtpTransport(bool verbose = false);
    ~CurlFtpTransport() override;

    CurlFtpTransport(const CurlFtpTransport &) = delete;
    CurlFtpTransport &operator=(const CurlFtpTransport &) = delete;

    UploadResult upload(const std::filesystem::path &artifact, const UploadDestination &destination) override;

  private:
    bool verbose_;
};

const char *region_name(Region region) noexcept;

} // namespace splitter
