//
//  CLI front-end for the SnapMatch library
//

#include <argparse/argparse.hpp>

#include "arguments.hpp"
#include "hash_command.hpp"
#include "logger.hpp"
#include "match_command.hpp"

#include <iostream>
#include <optional>

using namespace snapmatch_app;

int main(int argc, char* argv[])
{
    argparse::ArgumentParser program("snapmatch", "1.0");
    program.add_description("Find the raw originals of edited photos by perceptual fingerprint");
    program.add_epilog("Examples:\n  snapmatch match --raw ./raw --edited ./edited --out ./matched\n"
                       "  snapmatch hash -d ./photos -o fingerprints.csv\n\n"
                       "For detailed options: snapmatch <command> --help");

    RawArguments raw;

    // Add subcommands
    argparse::ArgumentParser match_command("match");
    match_command.add_description("Match edited images to raw originals and collect the originals");

    argparse::ArgumentParser hash_command("hash");
    hash_command.add_description("Compute the dHash fingerprints of images");

    // Common arguments for both commands
    auto addCommonArgs = [&](argparse::ArgumentParser& cmd) {
        cmd.add_argument("-e", "--extensions")
            .default_value(std::string(defaults::DEFAULT_EXTENSIONS))
            .store_into(raw.extensions)
            .help("Image file extensions to include (comma-separated)");

        cmd.add_argument("--no-recursive")
            .implicit_value(true)
            .default_value(defaults::NO_RECURSIVE)
            .store_into(raw.noRecursive)
            .help("Only scan the top level of each folder");

        cmd.add_argument("-w", "--workers")
            .default_value(defaults::WORKERS)
            .scan<'i', int>()
            .store_into(raw.workers)
            .help("Number of fingerprinting threads (0 = one per CPU core)");

        cmd.add_argument("--cache")
            .default_value(std::string(defaults::DEFAULT_CACHE))
            .store_into(raw.cachePath)
            .help("Fingerprint cache file");

        cmd.add_argument("--no-cache")
            .implicit_value(true)
            .default_value(defaults::NO_CACHE)
            .store_into(raw.noCache)
            .help("Neither read nor write the fingerprint cache");

        cmd.add_argument("-l", "--log-level")
            .default_value(defaults::LOG_LEVEL)
            .scan<'i', int>()
            .store_into(raw.logLevel)
            .help("Internal logging verbosity (4=warnings and errors, 3=info, 2=debug, 1=trace)");
        };

    addCommonArgs(match_command);
    addCommonArgs(hash_command);

    // Match-specific arguments
    match_command.add_argument("--raw")
        .required()
        .store_into(raw.rawDirectory)
        .help("Folder containing the raw originals");

    match_command.add_argument("--edited")
        .required()
        .store_into(raw.editedDirectory)
        .help("Folder containing the edited images");

    match_command.add_argument("--out")
        .required()
        .store_into(raw.outDirectory)
        .help("Output folder for matched originals, mapping.csv and the default cache");

    match_command.add_argument("-t", "--max-distance")
        .default_value(defaults::MAX_DISTANCE)
        .scan<'i', int>()
        .store_into(raw.maxDistance)
        .help("Largest Hamming distance still accepted as a match (0-64)");

    match_command.add_argument("-m", "--mode")
        .default_value(std::string(defaults::DEFAULT_MODE))
        .store_into(raw.mode)
        .help("How matched originals are placed in the output folder");

    match_command.add_argument("--preserve-raw-subdirs")
        .implicit_value(true)
        .default_value(defaults::PRESERVE_RAW_SUBDIRS)
        .store_into(raw.preserveRawSubdirs)
        .help("Keep the raw folder's sub-directory layout in the output folder");

    match_command.add_argument("--dry-run")
        .implicit_value(true)
        .default_value(defaults::DRY_RUN)
        .store_into(raw.dryRun)
        .help("Write the report without copying or linking any file");

    // Hash-specific arguments
    hash_command.add_argument("-d", "--directory")
        .required()
        .store_into(raw.directory)
        .help("Directory containing images to process");

    hash_command.add_argument("-o", "--output")
        .default_value(std::string(defaults::DEFAULT_OUTPUT))
        .store_into(raw.outputPath)
        .help("Save computed fingerprints to CSV file");

    // Add subparsers
    program.add_subparser(match_command);
    program.add_subparser(hash_command);

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << '\n';
        std::cerr << program;
        return 1;
    }

    std::optional<Arguments::Command> command;
    const argparse::ArgumentParser* usedParser = nullptr;
    if (program.is_subcommand_used("match")) {
        command = Arguments::Command::Match;
        usedParser = &match_command;
    }
    else if (program.is_subcommand_used("hash")) {
        command = Arguments::Command::Hash;
        usedParser = &hash_command;
    }
    else {
        std::cerr << "No command specified. Use 'match' or 'hash'\n";
        std::cerr << program;
        return 1;
    }

    std::optional<Arguments> args;
    try {
        args.emplace(raw, *command);
    }
    catch (const std::invalid_argument& err) {
        std::cerr << "Error: " << err.what() << '\n';
        std::cerr << *usedParser;
        return 1;
    }

    snapmatch::logger::init(snapmatch::logger::levelFromVerbosity(args->logLevel));

    const int rc = *command == Arguments::Command::Match ? handleMatchCommand(*args) : handleHashCommand(*args);

    snapmatch::logger::shutdown();
    return rc;
}
