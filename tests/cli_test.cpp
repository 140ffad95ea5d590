//! # CLI Tests
//!
//! Drives `jcodec_main` with an argv and captured standard streams, checking
//! each command's output and exit code.

#include "cli/driver.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// ============================================================================
// Fixture
// ============================================================================

class CliTest : public ::testing::Test {
protected:
    fs::path doc_file;
    fs::path bad_file;
    std::string out;
    std::string err;

    void SetUp() override {
        doc_file = fs::temp_directory_path() / "jcodec_cli_test.json";
        bad_file = fs::temp_directory_path() / "jcodec_cli_test_bad.json";
        std::ofstream(doc_file) << R"({"id": 8500, "user": {"name": "Twitter API"}, "tags": [1, 2]})";
        std::ofstream(bad_file) << R"({"id": [1, tru]})";
    }

    void TearDown() override {
        fs::remove(doc_file);
        fs::remove(bad_file);
    }

    /// Runs the CLI, capturing stdout into `out` and stderr into `err`.
    int run(std::vector<std::string> args) {
        args.insert(args.begin(), "jcodec");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }

        std::ostringstream captured_out;
        std::ostringstream captured_err;
        auto* saved_out = std::cout.rdbuf(captured_out.rdbuf());
        auto* saved_err = std::cerr.rdbuf(captured_err.rdbuf());
        int rc = jcodec_main(static_cast<int>(argv.size()), argv.data());
        std::cout.rdbuf(saved_out);
        std::cerr.rdbuf(saved_err);

        out = captured_out.str();
        err = captured_err.str();
        return rc;
    }
};

// ============================================================================
// fmt
// ============================================================================

TEST_F(CliTest, FmtPrettyByDefault) {
    EXPECT_EQ(run({"fmt", doc_file.string()}), 0);
    EXPECT_EQ(out, "{\n"
                   "  \"id\" : 8500,\n"
                   "  \"user\" : {\n"
                   "    \"name\" : \"Twitter API\"\n"
                   "  },\n"
                   "  \"tags\" : [1, 2]\n"
                   "}\n");
}

TEST_F(CliTest, FmtCompact) {
    EXPECT_EQ(run({"fmt", "--compact", doc_file.string()}), 0);
    EXPECT_EQ(out, "{\"id\":8500,\"user\":{\"name\":\"Twitter API\"},\"tags\":[1,2]}\n");
}

TEST_F(CliTest, LogOptionsAreIgnoredByCommands) {
    EXPECT_EQ(run({"-q", "fmt", "--compact", doc_file.string()}), 0);
    EXPECT_EQ(out, "{\"id\":8500,\"user\":{\"name\":\"Twitter API\"},\"tags\":[1,2]}\n");
}

// ============================================================================
// get
// ============================================================================

TEST_F(CliTest, GetPrintsTheValue) {
    EXPECT_EQ(run({"get", ".user.name", doc_file.string()}), 0);
    EXPECT_EQ(out, "\"Twitter API\"\n");

    EXPECT_EQ(run({"get", ".tags{arr}[1]", doc_file.string()}), 0);
    EXPECT_EQ(out, "2\n");
}

TEST_F(CliTest, GetMissingFieldFails) {
    EXPECT_EQ(run({"get", ".user.email", doc_file.string()}), 1);
    EXPECT_TRUE(out.empty());
    EXPECT_NE(err.find("No such field"), std::string::npos) << err;
}

TEST_F(CliTest, GetWithBadCursorIsUsageError) {
    EXPECT_EQ(run({"get", "[x]", doc_file.string()}), 2);
    EXPECT_NE(err.find("invalid cursor '[x]'"), std::string::npos) << err;
}

TEST_F(CliTest, GetNeedsTwoArguments) {
    EXPECT_EQ(run({"get", ".id"}), 2);
    EXPECT_NE(err.find("Usage: jcodec get"), std::string::npos);
}

// ============================================================================
// delete
// ============================================================================

TEST_F(CliTest, DeleteRemovesTheValue) {
    EXPECT_EQ(run({"delete", ".user", doc_file.string()}), 0);
    EXPECT_EQ(out, "{\n"
                   "  \"id\" : 8500,\n"
                   "  \"tags\" : [1, 2]\n"
                   "}\n");
}

TEST_F(CliTest, DeleteMissingIndexFails) {
    EXPECT_EQ(run({"delete", ".tags[5]", doc_file.string()}), 1);
    EXPECT_NE(err.find("Index out of bounds"), std::string::npos) << err;
}

// ============================================================================
// check
// ============================================================================

TEST_F(CliTest, CheckAcceptsValidInput) {
    EXPECT_EQ(run({"check", doc_file.string()}), 0);
    EXPECT_EQ(out, doc_file.string() + ": ok\n");
}

TEST_F(CliTest, CheckReportsTheDecodeTrace) {
    EXPECT_EQ(run({"check", bad_file.string()}), 1);
    EXPECT_NE(err.find(".id[1](expected 'true')"), std::string::npos) << err;
}

TEST_F(CliTest, UnreadableInputIsUsageError) {
    EXPECT_EQ(run({"check", (fs::temp_directory_path() / "jcodec_no_such_file.json").string()}),
              2);
    EXPECT_NE(err.find("Cannot open file"), std::string::npos);
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_F(CliTest, HelpAndVersion) {
    EXPECT_EQ(run({"--help"}), 0);
    EXPECT_NE(out.find("Usage: jcodec"), std::string::npos);

    EXPECT_EQ(run({"--version"}), 0);
    EXPECT_EQ(out.rfind("jcodec ", 0), 0u);
}

TEST_F(CliTest, UnknownCommand) {
    EXPECT_EQ(run({"frobnicate"}), 2);
    EXPECT_NE(err.find("Unknown command: frobnicate"), std::string::npos);
}
