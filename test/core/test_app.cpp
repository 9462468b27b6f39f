#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>

#include "gstree/app.h"
#include "test_utils.hpp"

namespace fs = std::filesystem;

using namespace gstree;
using namespace gstree::test;

class AppTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = fs::temp_directory_path() / ("gstree_app_" + std::to_string(std::random_device{}()));
        fs::create_directories(tempDir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(tempDir, ec);
    }

    fs::path write_input(const std::string& name, const std::string& data) {
        const fs::path path = tempDir / name;
        std::ofstream file{path, std::ios::binary};
        file.write(data.data(), static_cast<std::streamsize>(data.size()));
        return path;
    }

    int run_with_input(const fs::path& input) {
        Arguments args{"gstree", "--color", "never", "--input", input.string()};
        App app{output};
        return app.run(args.argc(), args.argv());
    }

    fs::path tempDir;
    std::ostringstream output;
};

// Test: Valid input renders the tree and exits 0
TEST_F(AppTest, RendersInputFile) {
    const auto path = write_input("ok.bin", records::ordinary(".M", "src/main.cpp") + records::untracked("a.txt"));

    EXPECT_EQ(run_with_input(path), 0);
    EXPECT_EQ(output.str(), "src/\n└── .M main.cpp\n?? a.txt\n");
}

// Test: Empty status prints nothing and succeeds
TEST_F(AppTest, EmptyInputSucceeds) {
    const auto path = write_input("empty.bin", "");
    EXPECT_EQ(run_with_input(path), 0);
    EXPECT_TRUE(output.str().empty());
}

// Test: Malformed data exits 1 without printing part of the tree
TEST_F(AppTest, MalformedInputPrintsNothing) {
    std::string data = records::untracked("fine.txt") + "X garbage";
    data.push_back('\0');
    const auto path = write_input("bad.bin", data);

    EXPECT_EQ(run_with_input(path), 1);
    EXPECT_TRUE(output.str().empty());
}

// Test: Truncated record exits 1
TEST_F(AppTest, TruncatedInputFails) {
    std::string data = records::ordinary("M.", "a.txt");
    data.pop_back();
    const auto path = write_input("short.bin", data);

    EXPECT_EQ(run_with_input(path), 1);
    EXPECT_TRUE(output.str().empty());
}

// Test: Missing input file exits 1
TEST_F(AppTest, MissingInputFileFails) {
    EXPECT_EQ(run_with_input(tempDir / "does-not-exist.bin"), 1);
    EXPECT_TRUE(output.str().empty());
}

// Test: Command-line errors come back as a non-zero exit code
TEST_F(AppTest, BadOptionFails) {
    Arguments args{"gstree", "--log-level", "bogus"};
    App app{output};
    EXPECT_NE(app.run(args.argc(), args.argv()), 0);
    EXPECT_TRUE(output.str().empty());
}

// Test: --dump-markdown writes the option table and exits 0
TEST_F(AppTest, DumpMarkdown) {
    Arguments args{"gstree", "--dump-markdown"};
    App app{output};
    EXPECT_EQ(app.run(args.argc(), args.argv()), 0);
    EXPECT_NE(output.str().find("| `--color"), std::string::npos);
}
