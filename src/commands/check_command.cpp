// =============================================================================
// genome-cleaner - Check Command Implementation
// =============================================================================

#include "check_command.h"

#include <iostream>

#include "gcl/common/logger.h"
#include "gcl/pipeline/cleaning_pipeline.h"

namespace gcl::commands {

CheckCommand::CheckCommand(CheckOptions options) : options_(std::move(options)) {}

CheckCommand::~CheckCommand() = default;

CheckCommand::CheckCommand(CheckCommand&&) noexcept = default;
CheckCommand& CheckCommand::operator=(CheckCommand&&) noexcept = default;

int CheckCommand::execute() {
    try {
        validateOptions();

        pipeline::CleaningPipeline pipeline(options_.validation);
        pipeline::PipelineResult result = pipeline.run(options_.inputPath);

        if (!options_.quiet) {
            report::writeTextSummary(result.summary, std::cout);
            std::cout.flush();
        }

        if (options_.cleanOutputPath) {
            const std::size_t written =
                io::writeFastaFile(result.records, *options_.cleanOutputPath, options_.fastaOptions);
            GCL_LOG_INFO("Wrote {} cleaned sequences to {}", written,
                         options_.cleanOutputPath->string());
        }

        if (options_.reportPath) {
            auto metadata = pipeline::makeReportMetadata(result, options_.validation);
            const report::Report report = report::buildReport(
                std::move(result.summary), std::move(result.records), std::move(metadata));
            report::writeReportFile(report, options_.reportFormat, *options_.reportPath);
        }

        GCL_LOG_DEBUG("Check finished in {} ms ({:.2f} MB/s)", result.stats.totalTimeMs(),
                      result.stats.throughputMBps());
        return 0;

    } catch (const GCLException& e) {
        GCL_LOG_ERROR("Check failed: {}", e.what());
        return e.exitCode();
    }
}

void CheckCommand::validateOptions() const {
    if (options_.cleanOutputPath && options_.reportPath &&
        *options_.cleanOutputPath == *options_.reportPath) {
        throw UsageError("Cleaned FASTA and report outputs must be different files");
    }
    if (options_.cleanOutputPath && *options_.cleanOutputPath == "-" && !options_.quiet) {
        throw UsageError("Writing cleaned FASTA to stdout requires --quiet");
    }
    if (options_.reportPath && *options_.reportPath == "-" && !options_.quiet) {
        throw UsageError("Writing the report to stdout requires --quiet");
    }
}

}  // namespace gcl::commands
