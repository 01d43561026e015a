// =============================================================================
// genome-cleaner - Report Model Implementation
// =============================================================================

#include "gcl/report/report_model.h"

#include <xxhash.h>

#include <chrono>
#include <format>
#include <utility>

namespace gcl::report {

Report buildReport(algo::DatasetSummary summary, std::vector<ValidatedRecord> records,
                   ReportMetadata metadata) {
    Report report;
    report.metadata = std::move(metadata);
    report.summary = std::move(summary);
    report.records = std::move(records);
    return report;
}

std::uint64_t computeInputChecksum(std::string_view text) noexcept {
    return XXH64(text.data(), text.size(), 0);
}

std::string currentTimestamp() {
    const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    return std::format("{:%Y-%m-%dT%H:%M:%SZ}", now);
}

}  // namespace gcl::report
