// =============================================================================
// genome-cleaner - FASTA/FASTQ Validation and Cleaning Tool
// =============================================================================
// Main entry point for the genome-cleaner command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: check, clean, report
// - Global options: threads, verbosity, log file
// - Exit codes from gcl::ErrorCode (0 ok, 1 usage, 2 I/O, 3 format)
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "gcl/common/error.h"
#include "gcl/common/logger.h"
#include "gcl/common/types.h"

// Command implementations
#include "commands/check_command.h"
#include "commands/clean_command.h"
#include "commands/report_command.h"

// Forward declarations for command handlers
namespace gcl::commands {
int runCheck();
int runClean();
int runReport();
}  // namespace gcl::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kDescription =
    "genome-cleaner: FASTA/FASTQ validation, sanitization and statistics\n"
    "Checks every record against a fixed rule set (empty, invalid characters,\n"
    "minimum length, duplicate headers, low complexity) and reports dataset\n"
    "statistics. Compressed inputs (gzip, bzip2, xz, zstd) are read transparently.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int threads = 0;    // 0 = auto-detect
    int verbosity = 0;  // 0 = normal, 1 = debug, 2 = trace
    bool quiet = false;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Check Command Options
// =============================================================================

struct CliCheckOptions {
    std::string input;
    bool sanitize = false;
    std::size_t minLength = gcl::kDefaultMinLength;
    std::string output;  // Cleaned FASTA
    std::string report;
    std::string format = "json";
    double lcDominant = gcl::algo::kDefaultDominantFraction;
    double lcRepeat = gcl::algo::kDefaultRepeatCoverage;
    std::size_t lineWidth = 0;
    bool validOnly = false;
};

CliCheckOptions gCheckOpts;

// =============================================================================
// Clean Command Options
// =============================================================================

struct CliCleanOptions {
    std::string input;
    std::string output;
    std::size_t minLength = gcl::kDefaultMinLength;
    std::size_t lineWidth = 0;
    bool validOnly = false;
    bool force = false;
};

CliCleanOptions gCleanOpts;

// =============================================================================
// Report Command Options
// =============================================================================

struct CliReportOptions {
    std::string input;
    std::string output = "-";
    std::string format = "json";
    std::size_t minLength = gcl::kDefaultMinLength;
    bool sanitize = false;
};

CliReportOptions gReportOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupCheckCommand(CLI::App& app) {
    auto* check = app.add_subcommand("check", "Validate sequences and print a summary");

    check->add_option("-i,--input", gCheckOpts.input, "Input FASTA/FASTQ file (or '-' for stdin)")
        ->required()
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    check->add_flag("-s,--sanitize", gCheckOpts.sanitize,
                    "Uppercase sequences and replace illegal characters with N");

    check->add_option("-m,--min-length", gCheckOpts.minLength, "Minimum sequence length")
        ->default_val(gcl::kDefaultMinLength);

    check->add_option("-o,--output", gCheckOpts.output, "Write cleaned sequences as FASTA");

    check->add_option("--line-width", gCheckOpts.lineWidth,
                      "Wrap FASTA sequence lines (0 = no wrapping)")
        ->default_val(0);

    check->add_flag("--valid-only", gCheckOpts.validOnly,
                    "Only write valid sequences to the cleaned FASTA");

    check->add_option("--report", gCheckOpts.report, "Write a report file");

    check->add_option("--format", gCheckOpts.format, "Report format: json, csv")
        ->default_val("json")
        ->check(CLI::IsMember({"json", "csv"}, CLI::ignore_case));

    check->add_option("--lc-dominant", gCheckOpts.lcDominant,
                      "Low-complexity: dominant base fraction threshold")
        ->default_val(gcl::algo::kDefaultDominantFraction)
        ->check(CLI::Range(0.0, 1.0));

    check->add_option("--lc-repeat", gCheckOpts.lcRepeat,
                      "Low-complexity: tandem repeat coverage threshold")
        ->default_val(gcl::algo::kDefaultRepeatCoverage)
        ->check(CLI::Range(0.0, 1.0));
}

void setupCleanCommand(CLI::App& app) {
    auto* clean = app.add_subcommand("clean", "Sanitize sequences and write cleaned FASTA");

    clean->add_option("-i,--input", gCleanOpts.input, "Input FASTA/FASTQ file (or '-' for stdin)")
        ->required()
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    clean->add_option("-o,--output", gCleanOpts.output, "Output FASTA file (or '-' for stdout)")
        ->required();

    clean->add_option("-m,--min-length", gCleanOpts.minLength, "Minimum sequence length")
        ->default_val(gcl::kDefaultMinLength);

    clean->add_option("--line-width", gCleanOpts.lineWidth,
                      "Wrap FASTA sequence lines (0 = no wrapping)")
        ->default_val(0);

    clean->add_flag("--valid-only", gCleanOpts.validOnly, "Only write valid sequences");

    clean->add_flag("-f,--force", gCleanOpts.force, "Overwrite existing output file");
}

void setupReportCommand(CLI::App& app) {
    auto* report = app.add_subcommand("report", "Write a JSON or CSV validation report");

    report->add_option("-i,--input", gReportOpts.input, "Input FASTA/FASTQ file (or '-' for stdin)")
        ->required()
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    report->add_option("-o,--output", gReportOpts.output, "Report file (or '-' for stdout)")
        ->default_val("-");

    report->add_option("--format", gReportOpts.format, "Report format: json, csv")
        ->default_val("json")
        ->check(CLI::IsMember({"json", "csv"}, CLI::ignore_case));

    report->add_option("-m,--min-length", gReportOpts.minLength, "Minimum sequence length")
        ->default_val(gcl::kDefaultMinLength);

    report->add_flag("-s,--sanitize", gReportOpts.sanitize,
                     "Uppercase sequences and replace illegal characters with N");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", std::string(gcl::kToolVersion));

    // Global options
    app.add_option("-t,--threads", gOptions.threads, "Number of threads (0 = auto-detect)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v debug, -vv trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    // Setup subcommands
    setupCheckCommand(app);
    setupCleanCommand(app);
    setupReportCommand(app);

    app.require_subcommand(1);

    // Parse arguments; CLI11's own error codes are folded into the usage code.
    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int rc = app.exit(e);
        return rc == 0 ? EXIT_SUCCESS : gcl::toExitCode(gcl::ErrorCode::kUsageError);
    }

    // Initialize logger
    try {
        gcl::log::init(
            gcl::log::Config::fromFlags(gOptions.verbosity, gOptions.quiet, gOptions.logFile));
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return gcl::toExitCode(gcl::ErrorCode::kIOError);
    }

    int exitCode = EXIT_SUCCESS;
    if (app.got_subcommand("check")) {
        exitCode = gcl::commands::runCheck();
    } else if (app.got_subcommand("clean")) {
        exitCode = gcl::commands::runClean();
    } else if (app.got_subcommand("report")) {
        exitCode = gcl::commands::runReport();
    }

    gcl::log::flush();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace gcl::commands {

namespace {

algo::ValidationConfig baseValidationConfig(std::size_t minLength, bool sanitize) {
    algo::ValidationConfig config;
    config.minLength = minLength;
    config.sanitize = sanitize;
    config.threads = gOptions.threads;
    return config;
}

}  // namespace

int runCheck() {
    try {
        CheckOptions opts;
        opts.inputPath = gCheckOpts.input;
        opts.validation = baseValidationConfig(gCheckOpts.minLength, gCheckOpts.sanitize);
        opts.validation.lowComplexity.dominantFraction = gCheckOpts.lcDominant;
        opts.validation.lowComplexity.repeatCoverage = gCheckOpts.lcRepeat;
        opts.fastaOptions.lineWidth = gCheckOpts.lineWidth;
        opts.fastaOptions.validOnly = gCheckOpts.validOnly;
        opts.reportFormat = unwrapOrThrow(report::parseReportFormat(gCheckOpts.format));
        opts.quiet = gOptions.quiet;

        if (!gCheckOpts.output.empty()) {
            opts.cleanOutputPath = gCheckOpts.output;
        }
        if (!gCheckOpts.report.empty()) {
            opts.reportPath = gCheckOpts.report;
        }

        CheckCommand cmd(std::move(opts));
        return cmd.execute();
    } catch (const GCLException& e) {
        GCL_LOG_ERROR("Check failed: {}", e.what());
        return e.exitCode();
    }
}

int runClean() {
    try {
        CleanOptions opts;
        opts.inputPath = gCleanOpts.input;
        opts.outputPath = gCleanOpts.output;
        opts.validation = baseValidationConfig(gCleanOpts.minLength, true);
        opts.fastaOptions.lineWidth = gCleanOpts.lineWidth;
        opts.fastaOptions.validOnly = gCleanOpts.validOnly;
        opts.forceOverwrite = gCleanOpts.force;

        CleanCommand cmd(std::move(opts));
        return cmd.execute();
    } catch (const GCLException& e) {
        GCL_LOG_ERROR("Clean failed: {}", e.what());
        return e.exitCode();
    }
}

int runReport() {
    try {
        ReportOptions opts;
        opts.inputPath = gReportOpts.input;
        opts.outputPath = gReportOpts.output;
        opts.format = unwrapOrThrow(report::parseReportFormat(gReportOpts.format));
        opts.validation = baseValidationConfig(gReportOpts.minLength, gReportOpts.sanitize);

        ReportCommand cmd(std::move(opts));
        return cmd.execute();
    } catch (const GCLException& e) {
        GCL_LOG_ERROR("Report failed: {}", e.what());
        return e.exitCode();
    }
}

}  // namespace gcl::commands
