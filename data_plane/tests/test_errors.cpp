#include "splitter/errors.hpp"

#include <cassert>
#include <cerrno>
#include <string>
#include <system_error>

int main() {
    // Stream failures carry no OS error, whatever errno was left behind.
    errno = ENOSPC;
    splitter::IoError short_read("unexpected end of file while splitting", "/var/crash/vmdump.0");
    assert(std::string(short_read.what()) == "unexpected end of file while splitting '/var/crash/vmdump.0'");

    const std::error_code denied(EACCES, std::generic_category());
    splitter::IoError open_failed("failed to create part file", "vmdump.0.partaa", denied);
    assert(std::string(open_failed.what()) == "failed to create part file 'vmdump.0.partaa': " + denied.message());

    errno = ENOENT;
    auto last = splitter::last_os_error();
    assert(last.value() == ENOENT);
    assert(last.category() == std::generic_category());

    splitter::MissingArtifactError missing("dump.part09", "check the directory");
    assert(missing.artifact() == "dump.part09");
    assert(std::string(missing.what()) == "Could not find dump.part09 to upload\ncheck the directory");
    return 0;
}
