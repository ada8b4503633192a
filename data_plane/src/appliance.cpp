#include "splitter/appliance.hpp"

#include <unistd.h>

#include <array>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

namespace splitter {

namespace {

std::string trim(const std::string &value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::optional<std::string> read_file(const std::filesystem::path &path) {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

std::optional<std::string> usable(std::string value) {
    value = trim(value);
    if (value.empty() || value == "unknown") {
        return std::nullopt;
    }
    return value;
}

} // namespace

LocalApplianceProbe::LocalApplianceProbe()
    : LocalApplianceProbe("/usr/nef/cli/sbin/config", "/var/lib/nza/nlm.key", "/etc/dumpadm.conf") {}

LocalApplianceProbe::LocalApplianceProbe(std::filesystem::path nef_config_cli, std::filesystem::path license_key,
                                         std::filesystem::path dumpadm_conf)
    : nef_config_cli_(std::move(nef_config_cli)), license_key_(std::move(license_key)),
      dumpadm_conf_(std::move(dumpadm_conf)) {}

std::optional<std::string> LocalApplianceProbe::uuid() const {
    // NexentaStor 3.x/4.x keep the GUID in the licence key and win over the 5.x CLI.
    if (auto key = read_file(license_key_)) {
        if (auto value = uuid_from_license_key(*key)) {
            return value;
        }
    }
    return query_config_cli();
}

std::optional<std::filesystem::path> LocalApplianceProbe::savecore_directory() const {
    auto contents = read_file(dumpadm_conf_);
    if (!contents) {
        return std::nullopt;
    }
    return savecore_from_dumpadm_conf(*contents);
}

std::optional<std::string> LocalApplianceProbe::query_config_cli() const {
    if (::access(nef_config_cli_.c_str(), X_OK) != 0) {
        return std::nullopt;
    }
    const std::string command = nef_config_cli_.string() + " get -O basic value system.guid 2>/dev/null";
    std::FILE *pipe = ::popen(command.c_str(), "r");
    if (pipe == nullptr) {
        return std::nullopt;
    }
    std::string output;
    std::array<char, 256> buffer{};
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
        output += buffer.data();
    }
    if (::pclose(pipe) != 0) {
        return std::nullopt;
    }
    return uuid_from_config_output(output);
}

std::optional<std::string> LocalApplianceProbe::uuid_from_config_output(const std::string &output) {
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream fields(line);
        std::string first;
        std::string second;
        std::string third;
        if (fields >> first >> second >> third) {
            return usable(third);
        }
    }
    return std::nullopt;
}

std::optional<std::string> LocalApplianceProbe::uuid_from_license_key(const std::string &contents) {
    std::istringstream lines(contents);
    std::string line;
    while (std::getline(lines, line)) {
        if (trim(line).empty()) {
            continue;
        }
        std::istringstream fields(line);
        std::string field;
        for (int i = 0; i < 3; ++i) {
            if (!std::getline(fields, field, '-')) {
                return std::nullopt;
            }
        }
        return usable(field);
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> LocalApplianceProbe::savecore_from_dumpadm_conf(const std::string &contents) {
    const std::string key = "DUMPADM_SAVDIR=";
    std::istringstream lines(contents);
    std::string line;
    while (std::getline(lines, line)) {
        line = trim(line);
        if (line.compare(0, key.size(), key) != 0) {
            continue;
        }
        auto value = trim(line.substr(key.size()));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        if (value.empty()) {
            return std::nullopt;
        }
        return std::filesystem::path(value);
    }
    return std::nullopt;
}

} // namespace splitter
