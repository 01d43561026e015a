// =============================================================================
// genome-cleaner - Command Guard Tests
// =============================================================================
// Option checks that run before any input is read: output collisions, refusal
// to overwrite, and stdout outputs that would mix with the console summary.
// =============================================================================

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "commands/check_command.h"
#include "commands/clean_command.h"

namespace gcl::commands {
namespace {

namespace fs = std::filesystem;

class CommandGuardTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / "gcl_command_guard_test";
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        input_ = writeFile("in.fa", ">a\nacgtacgtacgtacgtacgtacgt\n>b\nTTGGCCAATTGGCCAATTGGCC\n");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path writeFile(const std::string& name, const std::string& bytes) {
        const fs::path path = dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << bytes;
        return path;
    }

    static std::string readFile(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    CleanOptions cleanOptions(const fs::path& output) const {
        CleanOptions options;
        options.inputPath = input_;
        options.outputPath = output;
        options.validation.minLength = 1;
        return options;
    }

    CheckOptions checkOptions() const {
        CheckOptions options;
        options.inputPath = input_;
        options.validation.minLength = 1;
        options.quiet = true;
        return options;
    }

    fs::path dir_;
    fs::path input_;
};

// =============================================================================
// Clean Command
// =============================================================================

TEST_F(CommandGuardTest, CleanRefusesExistingOutputWithoutForce) {
    const fs::path output = writeFile("out.fa", "keep me\n");

    CleanCommand command(cleanOptions(output));
    EXPECT_EQ(command.execute(), 2);
    EXPECT_EQ(readFile(output), "keep me\n");
}

TEST_F(CommandGuardTest, CleanOverwritesExistingOutputWithForce) {
    const fs::path output = writeFile("out.fa", "stale\n");

    CleanOptions options = cleanOptions(output);
    options.forceOverwrite = true;
    CleanCommand command(std::move(options));

    EXPECT_EQ(command.execute(), 0);
    EXPECT_EQ(readFile(output),
              ">a\nACGTACGTACGTACGTACGTACGT\n>b\nTTGGCCAATTGGCCAATTGGCC\n");
}

TEST_F(CommandGuardTest, CleanRejectsOutputEqualToInput) {
    const std::string before = readFile(input_);

    CleanOptions options = cleanOptions(input_);
    options.forceOverwrite = true;
    CleanCommand command(std::move(options));

    EXPECT_EQ(command.execute(), 1);
    EXPECT_EQ(readFile(input_), before);
}

TEST_F(CommandGuardTest, CleanRequiresOutputPath) {
    CleanCommand command(cleanOptions(fs::path{}));
    EXPECT_EQ(command.execute(), 1);
}

// =============================================================================
// Check Command
// =============================================================================

TEST_F(CommandGuardTest, CheckRejectsIdenticalOutputs) {
    CheckOptions options = checkOptions();
    options.cleanOutputPath = dir_ / "same.out";
    options.reportPath = dir_ / "same.out";
    CheckCommand command(std::move(options));

    EXPECT_EQ(command.execute(), 1);
    EXPECT_FALSE(fs::exists(dir_ / "same.out"));
}

TEST_F(CommandGuardTest, CheckStdoutFastaRequiresQuiet) {
    CheckOptions options = checkOptions();
    options.quiet = false;
    options.cleanOutputPath = fs::path("-");
    CheckCommand command(std::move(options));

    EXPECT_EQ(command.execute(), 1);
}

TEST_F(CommandGuardTest, CheckStdoutReportRequiresQuiet) {
    CheckOptions options = checkOptions();
    options.quiet = false;
    options.reportPath = fs::path("-");
    CheckCommand command(std::move(options));

    EXPECT_EQ(command.execute(), 1);
}

TEST_F(CommandGuardTest, CheckWritesBothOutputsWhenDistinct) {
    CheckOptions options = checkOptions();
    options.cleanOutputPath = dir_ / "clean.fa";
    options.reportPath = dir_ / "report.csv";
    options.reportFormat = report::ReportFormat::kCsv;
    CheckCommand command(std::move(options));

    EXPECT_EQ(command.execute(), 0);
    EXPECT_TRUE(fs::exists(dir_ / "clean.fa"));
    EXPECT_EQ(readFile(dir_ / "report.csv").rfind("index,header,", 0), 0u);
}

}  // namespace
}  // namespace gcl::commands
