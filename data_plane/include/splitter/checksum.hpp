#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace splitter {

struct Digest {
    std::filesystem::path artifact;
    std::string hex;
};

class Checksum {
  public:
    static std::string md5_hex(const std::vector<char> &data);

    class Md5Accumulator {
      public:
        Md5Accumulator();
        ~Md5Accumulator();

        Md5Accumulator(const Md5Accumulator &) = delete;
        Md5Accumulator &operator=(const Md5Accumulator &) = delete;

        void update(const char *data, std::size_t size);

        // Finishes the digest; the accumulator cannot be updated afterwards.
        std::string hex();

      private:
        struct CtxDeleter {
            void operator()(EVP_MD_CTX *ctx) const;
        };
        std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
        bool finished_{false};
    };
};

// Computes the MD5 of a file on disk and records it in a sibling "<artifact>.md5"
// file using the md5sum line format.
class Fingerprinter {
  public:
    explicit Fingerprinter(std::size_t buffer_size_bytes = 1u << 20);

    Digest digest(const std::filesystem::path &artifact) const;

    std::filesystem::path persist(const Digest &digest) const;

    Digest fingerprint(const std::filesystem::path &artifact) const;

    static std::filesystem::path digest_path(const std::filesystem::path &artifact);

    static std::string digest_line(const Digest &digest);

  private:
    std::size_t buffer_size_bytes_;
};

} // namespace splitter
