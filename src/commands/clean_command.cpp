// =============================================================================
// genome-cleaner - Clean Command Implementation
// =============================================================================

#include "clean_command.h"

#include "gcl/common/logger.h"
#include "gcl/pipeline/cleaning_pipeline.h"

namespace gcl::commands {

CleanCommand::CleanCommand(CleanOptions options) : options_(std::move(options)) {
    options_.validation.sanitize = true;
}

CleanCommand::~CleanCommand() = default;

CleanCommand::CleanCommand(CleanCommand&&) noexcept = default;
CleanCommand& CleanCommand::operator=(CleanCommand&&) noexcept = default;

int CleanCommand::execute() {
    try {
        validateOptions();

        pipeline::CleaningPipeline pipeline(options_.validation);
        const pipeline::PipelineResult result = pipeline.run(options_.inputPath);

        const std::size_t written =
            io::writeFastaFile(result.records, options_.outputPath, options_.fastaOptions);

        GCL_LOG_INFO("Cleaned {} sequences ({} modified by sanitization), wrote {} to {}",
                     result.summary.totalCount, result.summary.sanitizedCount, written,
                     options_.outputPath.string());
        if (options_.fastaOptions.validOnly && written < result.summary.totalCount) {
            GCL_LOG_INFO("Skipped {} invalid sequences", result.summary.totalCount - written);
        }
        return 0;

    } catch (const GCLException& e) {
        GCL_LOG_ERROR("Clean failed: {}", e.what());
        return e.exitCode();
    }
}

void CleanCommand::validateOptions() const {
    if (options_.outputPath.empty()) {
        throw UsageError("Output path is required");
    }
    if (options_.outputPath != "-" && options_.inputPath == options_.outputPath) {
        throw UsageError("Output path must differ from input path");
    }
    if (options_.outputPath != "-" && !options_.forceOverwrite &&
        std::filesystem::exists(options_.outputPath)) {
        throw IOError("Output file already exists (use --force to overwrite)",
                      ErrorContext(options_.outputPath.string()));
    }
}

}  // namespace gcl::commands
