#include "splitter/config.hpp"

#include "splitter/appliance.hpp"
#include "splitter/errors.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <sstream>

namespace splitter {

namespace {

bool is_digits(const std::string &text) {
    return !text.empty() && text.find_first_not_of("0123456789") == std::string::npos;
}

// getopt-style: "-s 512m", "-s512m" and grouped flags such as "-nE".
class OptionReader {
  public:
    OptionReader(int argc, const char *const *argv) : argc_(argc), argv_(argv) {}

    bool next_token(std::string &token) {
        if (index_ >= argc_) {
            return false;
        }
        token = argv_[index_++];
        return true;
    }

    std::string value_for(char flag, const std::string &token, std::size_t &pos) {
        if (pos + 1 < token.size()) {
            auto value = token.substr(pos + 1);
            pos = token.size();
            return value;
        }
        pos = token.size();
        if (index_ >= argc_) {
            throw UsageError(std::string("option requires an argument -- '") + flag + "'");
        }
        return argv_[index_++];
    }

  private:
    int argc_;
    const char *const *argv_;
    int index_{1};
};

} // namespace

UploadDestination Config::destination() const {
    return UploadDestination{endpoint, uuid, case_ref, mode == TransferMode::Selective};
}

std::string Config::location_hint(bool kernel_dump_parts) const {
    std::ostringstream oss;
    oss << "If this is for a kernel dump, have you changed directory to ";
    if (kernel_dump_parts) {
        oss << "where the parts have been split";
        if (savecore_dir) {
            oss << ", for example " << savecore_dir->string();
        }
    } else if (savecore_dir) {
        oss << savecore_dir->string();
    } else {
        oss << "the savecore directory";
    }
    oss << " ?";
    return oss.str();
}

std::uint64_t parse_size(const std::string &text) {
    if (text.empty()) {
        throw UsageError("empty size");
    }
    std::string digits = text;
    unsigned shift = 0;
    const char unit = digits.back();
    if (unit < '0' || unit > '9') {
        digits.pop_back();
        switch (unit) {
        case 'b':
        case 'B':
            break;
        case 'k':
        case 'K':
            shift = 10;
            break;
        case 'm':
        case 'M':
            shift = 20;
            break;
        case 'g':
        case 'G':
            shift = 30;
            break;
        default:
            throw UsageError("unexpected size unit in '" + text + "'");
        }
    }
    if (!is_digits(digits)) {
        throw UsageError("size must be a positive integer with optional unit (b, k, m, g): '" + text + "'");
    }
    errno = 0;
    const unsigned long long value = std::strtoull(digits.c_str(), nullptr, 10);
    if (errno == ERANGE || value > (std::numeric_limits<std::uint64_t>::max() >> shift)) {
        throw UsageError("size is too large: '" + text + "'");
    }
    if (value == 0) {
        throw UsageError("size must be greater than zero: '" + text + "'");
    }
    return static_cast<std::uint64_t>(value) << shift;
}

double parse_multiplier(const std::string &text) {
    char *end = nullptr;
    errno = 0;
    const double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end == nullptr || *end != '\0' || errno == ERANGE || !std::isfinite(value) || value <= 0.0) {
        throw UsageError("space multiplier must be a positive number: '" + text + "'");
    }
    return value;
}

std::vector<std::string> split_names(const std::string &list) {
    std::vector<std::string> names;
    std::string current;
    for (char c : list) {
        if (c == ',' || c == ' ' || c == '\t') {
            if (!current.empty()) {
                names.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        names.push_back(current);
    }
    return names;
}

CommandLine parse_command_line(int argc, const char *const *argv, const ApplianceProbe &probe) {
    CommandLine result;
    Config &config = result.config;
    bool uuid_given = false;
    bool missing_given = false;
    bool no_upload = false;
    std::vector<std::string> positional;

    OptionReader reader(argc, argv);
    std::string token;
    bool options_done = false;
    while (reader.next_token(token)) {
        if (options_done || token.size() < 2 || token[0] != '-') {
            positional.push_back(token);
            continue;
        }
        if (token == "--") {
            options_done = true;
            continue;
        }
        for (std::size_t pos = 1; pos < token.size(); ++pos) {
            const char flag = token[pos];
            switch (flag) {
            case 'h':
                result.help = true;
                return result;
            case 'A':
                config.endpoint = UploadEndpoint::for_region(Region::Amer);
                break;
            case 'E':
                config.endpoint = UploadEndpoint::for_region(Region::Emea);
                break;
            case 'c':
                config.case_ref = reader.value_for(flag, token, pos);
                break;
            case 'm':
                missing_given = true;
                config.named_parts = split_names(reader.value_for(flag, token, pos));
                break;
            case 'n':
                no_upload = true;
                break;
            case 's':
                config.chunk_size_bytes = parse_size(reader.value_for(flag, token, pos));
                break;
            case 'u':
                uuid_given = true;
                config.uuid = reader.value_for(flag, token, pos);
                break;
            case 'x':
                config.space_multiplier = parse_multiplier(reader.value_for(flag, token, pos));
                break;
            case 'k':
                config.on_failure = FailurePolicy::Continue;
                break;
            case 'v':
                config.verbose = true;
                break;
            default:
                throw UsageError(std::string("invalid option -- '") + flag + "'");
            }
        }
    }

    if (!uuid_given) {
        if (auto detected = probe.uuid()) {
            config.uuid = *detected;
            std::cout << "Automatically determined UUID = " << config.uuid << std::endl;
        }
    }
    config.savecore_dir = probe.savecore_directory();

    if (config.uuid.empty() || config.uuid == unknown_identity || config.case_ref.empty() ||
        config.case_ref == unknown_identity) {
        throw UsageError("Unrecognised UUID or Case Reference number, must exit");
    }

    if (missing_given) {
        if (config.named_parts.empty()) {
            throw UsageError("-m needs at least one part name");
        }
        config.mode = TransferMode::Selective;
        return result;
    }

    if (positional.empty()) {
        throw UsageError("no input file given");
    }
    if (positional.size() > 1) {
        throw UsageError("unexpected argument: " + positional[1]);
    }
    config.source = positional.front();
    config.mode = no_upload ? TransferMode::DryRun : TransferMode::Full;
    return result;
}

std::string usage(const std::string &program) {
    std::ostringstream oss;
    oss << "Usage: " << program
        << " [-h] [-A | -E] [ -n ] [ -k ] [ -v ] [ -u <uuid> ] [ -s <size> ] [ -x <factor> ] -c <case_sr> <filename>\n"
        << "Usage: " << program << " [-A | -E] [ -k ] [ -v ] -c <case_sr> -m missing_part1,missing_part2\n";
    return oss.str();
}

std::string help_text(const std::string &program) {
    std::ostringstream oss;
    oss << usage(program) << '\n'
        << "Splits a file into a number of parts of the given size, generates an md5\n"
        << "fingerprint of the original file and every part, writes a metadata file\n"
        << "describing them and uploads everything to the AMER or EMEA ftp server.\n\n"
        << "Switches explained:\n\n"
        << "  -h           : Show this help menu\n"
        << "  -A           : Use the AMER ftp server (default)\n"
        << "  -E           : Use the EMEA ftp server\n"
        << "  -m <missing> : Upload just the missing parts (comma separated list)\n"
        << "  -n           : Do NOT attempt to upload\n"
        << "  -s <size>    : Size to split the parts into, eg:\n"
        << "                   512m == 512 megabytes (default)\n"
        << "                  1024m == 1024 megabytes or 1 gigabyte\n"
        << "  -u <uuid>    : The UUID of the Nexenta Appliance\n"
        << "  -x <factor>  : Free space needed, as a multiple of the file size (default 3)\n"
        << "  -k           : Keep uploading the remaining files after a failed upload\n"
        << "  -v           : Verbose output\n\n"
        << "Mandatory switches:\n\n"
        << "  -c <case_sr> : The Nexenta Case Reference / Service Request number\n\n"
        << "Special case:\n\n"
        << "If one or more files went missing, got corrupt or truncated during transfer\n"
        << "then you can upload just those parts, using:\n\n"
        << "  -m missing_part1,missing_part2\n\n"
        << "Example:\n\n"
        << "This will attempt to split the file into 512MB chunks, to the EMEA server\n"
        << "using the UUID of 5F7J2FABC and a case (SR) number of 00555010\n\n"
        << program << " -E -s 512m -u 5F7J2FABC -c 00555010 vmdump.0\n";
    return oss.str();
}

const char *mode_name(TransferMode mode) noexcept {
    switch (mode) {
    case TransferMode::Full:
        return "full";
    case TransferMode::Selective:
        return "selective";
    case TransferMode::DryRun:
        return "dry-run";
    }
    return "unknown";
}

} // namespace splitter
