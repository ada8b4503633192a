#include "splitter/checksum.hpp"

#include "splitter/errors.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace splitter {

namespace {

std::string to_hex(const unsigned char *bytes, unsigned int size) {
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setfill('0');
    for (unsigned int i = 0; i < size; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(bytes[i]);
    }
    return oss.str();
}

} // namespace

std::string Checksum::md5_hex(const std::vector<char> &data) {
    Md5Accumulator accumulator;
    accumulator.update(data.data(), data.size());
    return accumulator.hex();
}

void Checksum::Md5Accumulator::CtxDeleter::operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }

Checksum::Md5Accumulator::Md5Accumulator() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("failed to initialise MD5 context");
    }
}

Checksum::Md5Accumulator::~Md5Accumulator() = default;

void Checksum::Md5Accumulator::update(const char *data, std::size_t size) {
    if (finished_) {
        throw std::logic_error("MD5 accumulator already finished");
    }
    if (data == nullptr || size == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
        throw std::runtime_error("MD5 update failed");
    }
}

std::string Checksum::Md5Accumulator::hex() {
    if (finished_) {
        throw std::logic_error("MD5 accumulator already finished");
    }
    unsigned char value[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), value, &length) != 1) {
        throw std::runtime_error("MD5 finalisation failed");
    }
    finished_ = true;
    return to_hex(value, length);
}

Fingerprinter::Fingerprinter(std::size_t buffer_size_bytes) : buffer_size_bytes_(buffer_size_bytes) {
    if (buffer_size_bytes_ == 0) {
        throw std::invalid_argument("digest buffer size must be > 0");
    }
}

Digest Fingerprinter::digest(const std::filesystem::path &artifact) const {
    std::ifstream file(artifact, std::ios::binary);
    if (!file) {
        throw IoError("failed to open file for checksum", artifact, last_os_error());
    }
    Checksum::Md5Accumulator accumulator;
    std::vector<char> buffer(buffer_size_bytes_);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto read = file.gcount();
        if (read <= 0) {
            break;
        }
        accumulator.update(buffer.data(), static_cast<std::size_t>(read));
    }
    if (file.bad()) {
        throw IoError("read failed while computing checksum", artifact);
    }
    return Digest{artifact, accumulator.hex()};
}

std::filesystem::path Fingerprinter::persist(const Digest &digest) const {
    auto path = digest_path(digest.artifact);
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw IoError("failed to create digest file", path, last_os_error());
    }
    out << digest_line(digest) << '\n';
    out.flush();
    if (!out) {
        throw IoError("failed to write digest file", path);
    }
    return path;
}

Digest Fingerprinter::fingerprint(const std::filesystem::path &artifact) const {
    auto result = digest(artifact);
    persist(result);
    return result;
}

std::filesystem::path Fingerprinter::digest_path(const std::filesystem::path &artifact) {
    auto path = artifact;
    path += ".md5";
    return path;
}

std::string Fingerprinter::digest_line(const Digest &digest) {
    return digest.hex + "  " + digest.artifact.filename().string();
}

} // namespace splitter
