#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "arguments.hpp"
#include "errors.hpp"
#include "test_utils.hpp"

namespace fs = std::filesystem;
using namespace snapmatch_app;

class ArgumentsTest : public ::testing::Test {
protected:
    snapmatch_test::TempDir tempDir{ "snapmatch_args" };
    fs::path rawDir;
    fs::path editedDir;
    fs::path outDir;

    void SetUp() override {
        rawDir = tempDir / "raw";
        editedDir = tempDir / "edited";
        outDir = tempDir / "out";
        fs::create_directories(rawDir);
        fs::create_directories(editedDir);
    }

    RawArguments createValidMatchArgs() {
        RawArguments raw;
        raw.rawDirectory = rawDir.string();
        raw.editedDirectory = editedDir.string();
        raw.outDirectory = outDir.string();
        return raw;
    }

    RawArguments createValidHashArgs() {
        RawArguments raw;
        raw.directory = rawDir.string();
        return raw;
    }
};

// Tests for valid construction
TEST_F(ArgumentsTest, ConstructorWithValidMatchCommand) {
    Arguments args(createValidMatchArgs(), Arguments::Command::Match);

    EXPECT_EQ(args.command, Arguments::Command::Match);
    EXPECT_EQ(args.rawDirectory, fs::weakly_canonical(rawDir));
    EXPECT_EQ(args.editedDirectory, fs::weakly_canonical(editedDir));
    EXPECT_EQ(args.outDirectory, fs::weakly_canonical(outDir));
    EXPECT_TRUE(args.recursive);
    EXPECT_EQ(args.maxDistance, defaults::MAX_DISTANCE);
    EXPECT_EQ(args.workers, defaults::WORKERS);
    EXPECT_EQ(args.mode, PlacementMode::Copy);
    EXPECT_FALSE(args.preserveRawSubdirs);
    EXPECT_FALSE(args.dryRun);
    EXPECT_EQ(args.logLevel, defaults::LOG_LEVEL);
}

TEST_F(ArgumentsTest, OutputDirectoryMayNotExistYet) {
    ASSERT_FALSE(fs::exists(outDir));
    EXPECT_NO_THROW(Arguments(createValidMatchArgs(), Arguments::Command::Match));
}

TEST_F(ArgumentsTest, ReportLivesInOutputDirectory) {
    Arguments args(createValidMatchArgs(), Arguments::Command::Match);
    EXPECT_EQ(args.reportPath(), fs::weakly_canonical(outDir) / "mapping.csv");
}

TEST_F(ArgumentsTest, ConstructorWithCustomValues) {
    RawArguments raw = createValidMatchArgs();
    raw.noRecursive = true;
    raw.maxDistance = 10;
    raw.workers = 4;
    raw.mode = "Symlink";
    raw.preserveRawSubdirs = true;
    raw.dryRun = true;
    raw.logLevel = 2;

    Arguments args(raw, Arguments::Command::Match);

    EXPECT_FALSE(args.recursive);
    EXPECT_EQ(args.maxDistance, 10);
    EXPECT_EQ(args.workers, 4);
    EXPECT_EQ(args.mode, PlacementMode::Symlink);
    EXPECT_TRUE(args.preserveRawSubdirs);
    EXPECT_TRUE(args.dryRun);
    EXPECT_EQ(args.logLevel, 2);
}

TEST_F(ArgumentsTest, ConstructorWithValidHashCommand) {
    RawArguments raw = createValidHashArgs();
    raw.outputPath = "fingerprints.csv";

    Arguments args(raw, Arguments::Command::Hash);

    EXPECT_EQ(args.directory, fs::weakly_canonical(rawDir));
    EXPECT_EQ(args.outputPath, "fingerprints.csv");
    EXPECT_TRUE(args.rawDirectory.empty());
    EXPECT_TRUE(args.outDirectory.empty());
}

// Directory validation tests
TEST_F(ArgumentsTest, DirectoryValidation_MissingRaw) {
    RawArguments raw = createValidMatchArgs();
    raw.rawDirectory = "";

    EXPECT_THROW(Arguments(raw, Arguments::Command::Match), std::invalid_argument);
}

TEST_F(ArgumentsTest, DirectoryValidation_NonExistentEdited) {
    RawArguments raw = createValidMatchArgs();
    raw.editedDirectory = (tempDir / "non_existent_dir").string();

    EXPECT_THROW(Arguments(raw, Arguments::Command::Match), snapmatch::ConfigurationError);
}

TEST_F(ArgumentsTest, DirectoryValidation_FileInsteadOfDirectory) {
    fs::path filePath = tempDir / "test_file.txt";
    std::ofstream(filePath) << "test";

    RawArguments raw = createValidHashArgs();
    raw.directory = filePath.string();

    EXPECT_THROW(Arguments(raw, Arguments::Command::Hash), std::invalid_argument);
}

TEST_F(ArgumentsTest, DirectoryValidation_OutputIsAFile) {
    std::ofstream(tempDir / "out_file") << "x";

    RawArguments raw = createValidMatchArgs();
    raw.outDirectory = (tempDir / "out_file").string();

    EXPECT_THROW(Arguments(raw, Arguments::Command::Match), std::invalid_argument);
}

TEST_F(ArgumentsTest, DirectoryValidation_HashIgnoresMatchFolders) {
    RawArguments raw = createValidHashArgs();
    raw.rawDirectory = "does-not-matter";

    EXPECT_NO_THROW(Arguments(raw, Arguments::Command::Hash));
}

// Extension parsing tests
TEST_F(ArgumentsTest, ExtensionParsing_DefaultExtensions) {
    Arguments args(createValidHashArgs(), Arguments::Command::Hash);

    EXPECT_EQ(args.extensions,
              (std::vector<std::string>{ "jpg", "jpeg", "png", "bmp", "tiff", "tif", "webp", "jfif" }));
}

TEST_F(ArgumentsTest, ExtensionParsing_NormalizesAndDeduplicates) {
    RawArguments raw = createValidHashArgs();
    raw.extensions = " .JPG, png;jpg ,, .Png ";

    Arguments args(raw, Arguments::Command::Hash);

    EXPECT_EQ(args.extensions, (std::vector<std::string>{ "jpg", "png" }));
}

// Range validation tests
TEST_F(ArgumentsTest, MaxDistanceBounds) {
    RawArguments raw = createValidMatchArgs();

    raw.maxDistance = 0;
    EXPECT_NO_THROW(Arguments(raw, Arguments::Command::Match));
    raw.maxDistance = 64;
    EXPECT_NO_THROW(Arguments(raw, Arguments::Command::Match));

    raw.maxDistance = -1;
    EXPECT_THROW(Arguments(raw, Arguments::Command::Match), snapmatch::ConfigurationError);
    raw.maxDistance = 65;
    EXPECT_THROW(Arguments(raw, Arguments::Command::Match), snapmatch::ConfigurationError);
}

TEST_F(ArgumentsTest, NegativeWorkersRejected) {
    RawArguments raw = createValidMatchArgs();
    raw.workers = -1;

    EXPECT_THROW(Arguments(raw, Arguments::Command::Match), snapmatch::ConfigurationError);
}

TEST_F(ArgumentsTest, LogLevelBounds) {
    RawArguments raw = createValidHashArgs();

    raw.logLevel = 0;
    EXPECT_THROW(Arguments(raw, Arguments::Command::Hash), std::invalid_argument);
    raw.logLevel = 5;
    EXPECT_THROW(Arguments(raw, Arguments::Command::Hash), std::invalid_argument);
    raw.logLevel = 1;
    EXPECT_NO_THROW(Arguments(raw, Arguments::Command::Hash));
}

TEST_F(ArgumentsTest, UnknownModeRejected) {
    RawArguments raw = createValidMatchArgs();
    raw.mode = "move";

    try {
        Arguments args(raw, Arguments::Command::Match);
        FAIL() << "expected ConfigurationError";
    }
    catch (const snapmatch::ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("move"), std::string::npos);
    }
}

// Cache path resolution tests
TEST_F(ArgumentsTest, MatchCacheDefaultsToOutputDirectory) {
    Arguments args(createValidMatchArgs(), Arguments::Command::Match);

    EXPECT_EQ(args.cachePath, fs::weakly_canonical(outDir) / defaults::CACHE_FILENAME);
}

TEST_F(ArgumentsTest, ExplicitCachePathWins) {
    RawArguments raw = createValidMatchArgs();
    raw.cachePath = (tempDir / "shared.csv").string();

    Arguments args(raw, Arguments::Command::Match);

    EXPECT_EQ(args.cachePath, fs::weakly_canonical(tempDir / "shared.csv"));
}

TEST_F(ArgumentsTest, NoCacheDisablesCaching) {
    RawArguments raw = createValidMatchArgs();
    raw.cachePath = (tempDir / "shared.csv").string();
    raw.noCache = true;

    Arguments args(raw, Arguments::Command::Match);

    EXPECT_TRUE(args.cachePath.empty());
}

TEST_F(ArgumentsTest, HashCachesOnlyWhenAsked) {
    Arguments plain(createValidHashArgs(), Arguments::Command::Hash);
    EXPECT_TRUE(plain.cachePath.empty());

    RawArguments raw = createValidHashArgs();
    raw.cachePath = (tempDir / "hash_cache.csv").string();
    Arguments cached(raw, Arguments::Command::Hash);
    EXPECT_FALSE(cached.cachePath.empty());
}

TEST_F(ArgumentsTest, CachePathThatIsADirectoryRejected) {
    RawArguments raw = createValidMatchArgs();
    raw.cachePath = rawDir.string();

    EXPECT_THROW(Arguments(raw, Arguments::Command::Match), std::invalid_argument);
}
