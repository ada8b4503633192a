#include "splitter/appliance.hpp"
#include "splitter/config.hpp"
#include "splitter/errors.hpp"
#include "splitter/network.hpp"
#include "splitter/pipeline.hpp"
#include "splitter/space_estimator.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

std::string program_name(const char *argv0) {
    if (argv0 == nullptr) {
        return "dump_splitter";
    }
    return std::filesystem::path(argv0).filename().string();
}

int run(const splitter::Config &config) {
    splitter::FilesystemCapacityProvider capacity;
    splitter::CurlFtpTransport transport(config.verbose);
    splitter::SplitPipeline pipeline(config, capacity, transport);
    const auto result = pipeline.run();
    switch (result.outcome) {
    case splitter::PipelineOutcome::Completed:
    case splitter::PipelineOutcome::InsufficientSpace:
        return EXIT_SUCCESS;
    case splitter::PipelineOutcome::UploadFailed:
        return EXIT_FAILURE;
    }
    return EXIT_FAILURE;
}

} // namespace

int main(int argc, char **argv) {
    const std::string program = program_name(argc > 0 ? argv[0] : nullptr);

    splitter::CommandLine command_line;
    try {
        splitter::LocalApplianceProbe probe;
        command_line = splitter::parse_command_line(argc, argv, probe);
    } catch (const splitter::UsageError &err) {
        std::cerr << err.what() << '\n' << splitter::usage(program);
        return EXIT_FAILURE;
    }
    if (command_line.help) {
        std::cout << splitter::help_text(program);
        return EXIT_SUCCESS;
    }

    try {
        return run(command_line.config);
    } catch (const splitter::MissingArtifactError &err) {
        std::cerr << err.what() << "\nExiting now ..." << std::endl;
    } catch (const std::exception &err) {
        std::cerr << "error: " << err.what() << std::endl;
    }
    return EXIT_FAILURE;
}
