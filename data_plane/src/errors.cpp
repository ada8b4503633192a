#include "splitter/errors.hpp"

#include <cerrno>
#include <sstream>

namespace splitter {

namespace {

std::string io_message(const std::string &what, const std::filesystem::path &path) {
    return what + " '" + path.string() + "'";
}

std::string missing_message(const std::filesystem::path &artifact, const std::string &hint) {
    std::ostringstream oss;
    oss << "Could not find " << artifact.string() << " to upload";
    if (!hint.empty()) {
        oss << '\n' << hint;
    }
    return oss.str();
}

} // namespace

IoError::IoError(const std::string &what, const std::filesystem::path &path) : Error(io_message(what, path)) {}

IoError::IoError(const std::string &what, const std::filesystem::path &path, const std::error_code &ec)
    : Error(io_message(what, path) + ": " + ec.message()) {}

std::error_code last_os_error() noexcept { return std::error_code(errno, std::generic_category()); }

MissingArtifactError::MissingArtifactError(const std::filesystem::path &artifact, const std::string &hint)
    : Error(missing_message(artifact, hint)), artifact_(artifact) {}

} // namespace splitter
