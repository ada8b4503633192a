#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace splitter {

class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &msg) : std::runtime_error(msg) {}
};

// Bad command line: the caller prints usage and exits 1.
class UsageError : public Error {
  public:
    explicit UsageError(const std::string &msg) : Error(msg) {}
};

// File system failure on `path`. Only the second form names an OS error.
class IoError : public Error {
  public:
    IoError(const std::string &what, const std::filesystem::path &path);
    IoError(const std::string &what, const std::filesystem::path &path, const std::error_code &ec);
};

// errno of the call that just failed.
std::error_code last_os_error() noexcept;

class ManifestError : public Error {
  public:
    explicit ManifestError(const std::string &msg) : Error(msg) {}
};

class MissingArtifactError : public Error {
  public:
    MissingArtifactError(const std::filesystem::path &artifact, const std::string &hint);

    const std::filesystem::path &artifact() const noexcept { return artifact_; }

  private:
    std::filesystem::path artifact_;
};

} // namespace splitter
