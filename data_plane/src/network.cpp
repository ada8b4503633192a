#include "splitter/network.hpp"

#include <curl/curl.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <system_error>

namespace splitter {

namespace {

constexpr const char *amer_url = "ftp://logcollector.nexenta.com";
constexpr const char *emea_url = "ftp://logcollector04.nexenta.com";

struct CurlDeleter {
    void operator()(CURL *curl) const { curl_easy_cleanup(curl); }
};

struct FileCloser {
    void operator()(std::FILE *file) const { std::fclose(file); }
};

std::size_t read_callback(char *buffer, std::size_t size, std::size_t nitems, void *userdata) {
    auto *file = static_cast<std::FILE *>(userdata);
    const auto read = std::fread(buffer, size, nitems, file);
    if (read == 0 && std::ferror(file)) {
        return CURL_READFUNC_ABORT;
    }
    return read * size;
}

// curl ignores the handle argument of curl_easy_escape since 7.82.
std::string escape_segment(const std::string &segment) {
    char *escaped = curl_easy_escape(nullptr, segment.c_str(), static_cast<int>(segment.size()));
    if (escaped == nullptr) {
        throw std::runtime_error("failed to escape URL segment: " + segment);
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

} // namespace

UploadEndpoint UploadEndpoint::for_region(Region region) {
    return UploadEndpoint{region, region == Region::Emea ? emea_url : amer_url};
}

std::string UploadDestination::url_for(const std::filesystem::path &artifact) const {
    std::string url = endpoint.base_url;
    if (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    url += "/nstor/" + escape_segment(uuid) + "/" + escape_segment(case_ref);
    if (missing) {
        url += "/missing";
    }
    url += "/" + escape_segment(artifact.filename().string());
    return url;
}

const char *region_name(Region region) noexcept { return region == Region::Emea ? "EMEA" : "AMER"; }

CurlFtpTransport::CurlFtpTransport(bool verbose) : verbose_(verbose) {
    if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

CurlFtpTransport::~CurlFtpTransport() { curl_global_cleanup(); }

UploadResult CurlFtpTransport::upload(const std::filesystem::path &artifact, const UploadDestination &destination) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(artifact, ec);
    if (ec) {
        return UploadResult{false, "cannot stat " + artifact.string() + ": " + ec.message()};
    }
    std::unique_ptr<std::FILE, FileCloser> file(std::fopen(artifact.c_str(), "rb"));
    if (!file) {
        return UploadResult{false, "cannot open " + artifact.string() + ": " + std::strerror(errno)};
    }
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        return UploadResult{false, "Failed to initialize CURL handle"};
    }

    const auto url = destination.url_for(artifact);

    char error_buffer[CURL_ERROR_SIZE];
    error_buffer[0] = '\0';
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, read_callback);
    curl_easy_setopt(curl.get(), CURLOPT_READDATA, file.get());
    curl_easy_setopt(curl.get(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
    curl_easy_setopt(curl.get(), CURLOPT_FTP_CREATE_MISSING_DIRS, static_cast<long>(CURLFTP_CREATE_DIR_RETRY));
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, verbose_ ? 0L : 1L);
    curl_easy_setopt(curl.get(), CURLOPT_VERBOSE, verbose_ ? 1L : 0L);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        std::string message = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res);
        return UploadResult{false, message};
    }
    long reply = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &reply);
    if (reply >= 400) {
        return UploadResult{false, "server replied " + std::to_string(reply)};
    }
    return UploadResult{true, {}};
}

} // namespace splitter
