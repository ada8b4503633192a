#include "splitter/appliance.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

int main() {
    namespace fs = std::filesystem;
    using splitter::LocalApplianceProbe;

    assert(LocalApplianceProbe::uuid_from_license_key("NZA-45-5F7J2FABC-1234\n") == std::string("5F7J2FABC"));
    assert(LocalApplianceProbe::uuid_from_license_key("\nA-B-C\n") == std::string("C"));
    assert(!LocalApplianceProbe::uuid_from_license_key("no-dashes"));
    assert(!LocalApplianceProbe::uuid_from_license_key(""));

    assert(LocalApplianceProbe::uuid_from_config_output("system.guid  basic  44454c4c-3000\n") ==
           std::string("44454c4c-3000"));
    assert(!LocalApplianceProbe::uuid_from_config_output("system.guid basic\n"));
    assert(!LocalApplianceProbe::uuid_from_config_output("a b unknown\n"));

    assert(LocalApplianceProbe::savecore_from_dumpadm_conf("DUMPADM_DEVICE=/dev/zvol/dsk/rpool/dump\n"
                                                           "DUMPADM_SAVDIR=/var/crash/myhost\n") ==
           fs::path("/var/crash/myhost"));
    assert(LocalApplianceProbe::savecore_from_dumpadm_conf("DUMPADM_SAVDIR=\"/var/crash\"\n") == fs::path("/var/crash"));
    assert(!LocalApplianceProbe::savecore_from_dumpadm_conf("DUMPADM_SAVDIR=\n"));
    assert(!LocalApplianceProbe::savecore_from_dumpadm_conf("# nothing\n"));

    auto temp_dir = fs::temp_directory_path() / "splitter_appliance_test";
    fs::remove_all(temp_dir);
    fs::create_directories(temp_dir);
    {
        std::ofstream key(temp_dir / "nlm.key");
        key << "NZA-45-ABCDEF123-9\n";
        std::ofstream conf(temp_dir / "dumpadm.conf");
        conf << "DUMPADM_SAVDIR=/var/crash/box\n";
    }

    LocalApplianceProbe probe(temp_dir / "no-config-cli", temp_dir / "nlm.key", temp_dir / "dumpadm.conf");
    assert(probe.uuid() == std::string("ABCDEF123"));
    assert(probe.savecore_directory() == fs::path("/var/crash/box"));

    LocalApplianceProbe bare(temp_dir / "no-config-cli", temp_dir / "absent.key", temp_dir / "absent.conf");
    assert(!bare.uuid());
    assert(!bare.savecore_directory());

    fs::remove_all(temp_dir);
    return 0;
}
