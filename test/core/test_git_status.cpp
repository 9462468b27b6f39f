#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>

#include "gstree/git_status.h"
#include "test_utils.hpp"

namespace fs = std::filesystem;

using namespace gstree;
using namespace gstree::test;

class GitStatusTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = fs::temp_directory_path() / ("gstree_test_" + std::to_string(std::random_device{}()));
        fs::create_directories(tempDir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(tempDir, ec);
    }

    fs::path tempDir;
};

// Test: Plain command without extra arguments
TEST_F(GitStatusTest, CommandLineDefaults) {
    GitStatusReader reader;
    EXPECT_EQ(reader.command_line({}), "git status --porcelain=v2 -z");
}

// Test: Passthrough arguments are quoted one by one
TEST_F(GitStatusTest, CommandLineQuotesPassthrough) {
    GitStatusReader reader;
    EXPECT_EQ(reader.command_line({"--ignored", "--", "dir with space"}),
              "git status --porcelain=v2 -z '--ignored' '--' 'dir with space'");
}

// Test: -C directory goes before the subcommand
TEST_F(GitStatusTest, CommandLineWithRepository) {
    GitStatusReader reader{fs::path{"/tmp/my repo"}};
    EXPECT_EQ(reader.command_line({"-uall"}), "git -C '/tmp/my repo' status --porcelain=v2 -z '-uall'");
}

// Test: Embedded single quotes cannot break out of the quoting
TEST_F(GitStatusTest, ShellQuoteEscapesSingleQuote) {
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote("$(rm -rf /)"), "'$(rm -rf /)'");
    EXPECT_EQ(shell_quote(""), "''");
}

// Test: Stream input keeps NUL bytes
TEST_F(GitStatusTest, ReadStreamKeepsNulBytes) {
    const std::string data = records::untracked("a.txt") + records::ignored("b/");
    std::istringstream in{data};
    EXPECT_EQ(read_stream(in), data);
}

// Test: File input is read verbatim
TEST_F(GitStatusTest, ReadInputFromFile) {
    const std::string data = records::ordinary("M.", "a.txt");
    const fs::path file = tempDir / "status.bin";
    std::ofstream(file, std::ios::binary) << data;

    EXPECT_EQ(read_input(file), data);
}

// Test: Missing input file is an InputError
TEST_F(GitStatusTest, MissingInputFileThrows) {
    EXPECT_THROW(read_input(tempDir / "missing.bin"), InputError);
}

// Test: Upstream errors keep git's exit status
TEST_F(GitStatusTest, UpstreamErrorCarriesExitCode) {
    UpstreamProducerError error{"git status exited with status 128", 128};
    EXPECT_EQ(error.exit_code(), 128);
    EXPECT_STREQ(error.what(), "git status exited with status 128");
}
