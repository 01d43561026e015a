// =============================================================================
// genome-cleaner - Report Command Implementation
// =============================================================================

#include "report_command.h"

#include "gcl/common/logger.h"
#include "gcl/pipeline/cleaning_pipeline.h"

namespace gcl::commands {

ReportCommand::ReportCommand(ReportOptions options) : options_(std::move(options)) {}

ReportCommand::~ReportCommand() = default;

ReportCommand::ReportCommand(ReportCommand&&) noexcept = default;
ReportCommand& ReportCommand::operator=(ReportCommand&&) noexcept = default;

int ReportCommand::execute() {
    try {
        if (options_.outputPath.empty()) {
            options_.outputPath = "-";
        }

        pipeline::CleaningPipeline pipeline(options_.validation);
        pipeline::PipelineResult result = pipeline.run(options_.inputPath);

        auto metadata = pipeline::makeReportMetadata(result, options_.validation);
        const report::Report report = report::buildReport(
            std::move(result.summary), std::move(result.records), std::move(metadata));
        report::writeReportFile(report, options_.format, options_.outputPath);
        return 0;

    } catch (const GCLException& e) {
        GCL_LOG_ERROR("Report failed: {}", e.what());
        return e.exitCode();
    }
}

}  // namespace gcl::commands
