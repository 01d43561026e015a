// =============================================================================
// genome-cleaner - Report Writers Implementation
// =============================================================================

#include "gcl/report/report_writer.h"

#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <ostream>

#include "gcl/common/logger.h"

namespace gcl::report {

namespace {

std::string quoted(std::string_view text) {
    return "\"" + escapeJson(text) + "\"";
}

std::string joinErrors(const std::vector<RecordError>& errors, std::string_view separator) {
    std::string joined;
    for (std::size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) {
            joined.append(separator);
        }
        joined.append(recordErrorToString(errors[i]));
    }
    return joined;
}

std::string jsonOptionalString(const std::optional<std::string>& value) {
    return value.has_value() ? quoted(*value) : std::string("null");
}

void checkStream(const std::ostream& out, std::string_view what) {
    if (!out) {
        throw IOError(fmt::format("Failed to write {} report", what));
    }
}

// -----------------------------------------------------------------------------
// JSON sections
// -----------------------------------------------------------------------------

void writeJsonMetadata(const ReportMetadata& meta, std::ostream& out) {
    std::optional<std::string> format;
    if (meta.sourceFormat.has_value()) {
        format = std::string(sequenceFormatToString(*meta.sourceFormat));
    }
    std::optional<std::string> checksum;
    if (meta.inputChecksum.has_value()) {
        checksum = fmt::format("{:016x}", *meta.inputChecksum);
    }

    out << "  \"metadata\": {\n";
    out << "    \"generated_at\": " << quoted(meta.generatedAt) << ",\n";
    out << "    \"tool_version\": " << quoted(meta.toolVersion) << ",\n";
    out << "    \"source\": " << quoted(meta.sourceName) << ",\n";
    out << "    \"source_format\": " << jsonOptionalString(format) << ",\n";
    out << "    \"input_xxh64\": " << jsonOptionalString(checksum) << ",\n";
    out << "    \"min_length\": " << meta.minLength << ",\n";
    out << "    \"sanitize\": " << (meta.sanitize ? "true" : "false") << "\n";
    out << "  },\n";
}

void writeJsonSummary(const algo::DatasetSummary& s, std::ostream& out) {
    std::optional<std::string> mostCommon;
    if (s.mostCommonError.has_value()) {
        mostCommon = std::string(recordErrorToString(*s.mostCommonError));
    }

    out << "  \"summary\": {\n";
    out << "    \"total_count\": " << s.totalCount << ",\n";
    out << "    \"valid_count\": " << s.validCount << ",\n";
    out << "    \"invalid_count\": " << s.invalidCount << ",\n";
    out << "    \"validity_percentage\": " << fmt::format("{:.2f}", s.validityPercentage())
        << ",\n";
    out << "    \"avg_gc_content\": " << fmt::format("{:.6f}", s.avgGcContent) << ",\n";
    out << "    \"min_gc_content\": " << fmt::format("{:.6f}", s.minGcContent) << ",\n";
    out << "    \"max_gc_content\": " << fmt::format("{:.6f}", s.maxGcContent) << ",\n";
    out << "    \"median_gc_content\": " << fmt::format("{:.6f}", s.medianGcContent) << ",\n";
    out << "    \"min_length\": " << s.minLength << ",\n";
    out << "    \"max_length\": " << s.maxLength << ",\n";
    out << "    \"avg_length\": " << fmt::format("{:.2f}", s.avgLength) << ",\n";
    out << "    \"median_length\": " << s.medianLength << ",\n";
    out << "    \"length_quartiles\": { \"q1\": " << s.lengthQuartiles.q1
        << ", \"q2\": " << s.lengthQuartiles.q2 << ", \"q3\": " << s.lengthQuartiles.q3
        << " },\n";
    out << "    \"total_bases\": " << s.totalBases << ",\n";
    out << "    \"sanitized_count\": " << s.sanitizedCount << ",\n";
    out << "    \"total_errors\": " << s.totalErrors << ",\n";
    out << "    \"quality_distribution\": {";
    for (std::size_t i = 0; i < algo::kQualityTierCount; ++i) {
        const algo::QualityTier tier = algo::kAllQualityTiers[i];
        out << (i == 0 ? " " : ", ") << quoted(algo::qualityTierToString(tier)) << ": "
            << s.qualityCount(tier);
    }
    out << " },\n";
    out << "    \"most_common_error\": " << jsonOptionalString(mostCommon) << "\n";
    out << "  },\n";
}

void writeJsonHistogram(const algo::DatasetSummary& s, std::ostream& out) {
    out << "  \"error_histogram\": {";
    bool first = true;
    for (const auto& [code, count] : s.errorHistogram) {
        out << (first ? "\n" : ",\n");
        out << "    " << quoted(recordErrorToString(code)) << ": " << count;
        first = false;
    }
    out << (first ? "},\n" : "\n  },\n");
}

void writeJsonTopLongest(const algo::DatasetSummary& s, std::ostream& out) {
    out << "  \"top_longest\": [";
    for (std::size_t i = 0; i < s.topLongest.size(); ++i) {
        const auto& rank = s.topLongest[i];
        out << (i == 0 ? "\n" : ",\n");
        out << "    { \"index\": " << rank.index << ", \"header\": " << quoted(rank.header)
            << ", \"length\": " << rank.length << " }";
    }
    out << (s.topLongest.empty() ? "],\n" : "\n  ],\n");
}

void writeJsonRecords(const std::vector<ValidatedRecord>& records, std::ostream& out) {
    out << "  \"records\": [";
    for (std::size_t i = 0; i < records.size(); ++i) {
        const auto& r = records[i];
        out << (i == 0 ? "\n" : ",\n");
        out << "    {\n";
        out << "      \"index\": " << r.index << ",\n";
        out << "      \"header\": " << quoted(r.header) << ",\n";
        out << "      \"is_valid\": " << (r.isValid ? "true" : "false") << ",\n";
        out << "      \"errors\": [";
        for (std::size_t e = 0; e < r.errors.size(); ++e) {
            out << (e == 0 ? "" : ", ") << quoted(recordErrorToString(r.errors[e]));
        }
        out << "],\n";
        out << "      \"length\": " << r.length << ",\n";
        out << "      \"gc_content\": " << fmt::format("{:.6f}", r.gcContent) << ",\n";
        out << "      \"invalid_char_count\": " << r.invalidCharCount << ",\n";
        out << "      \"composition\": { \"a\": " << r.composition.a
            << ", \"c\": " << r.composition.c << ", \"g\": " << r.composition.g
            << ", \"t\": " << r.composition.t << ", \"n\": " << r.composition.n
            << ", \"valid_bases\": " << r.composition.validBases() << " },\n";
        out << "      \"sanitized\": " << (r.wasSanitized() ? "true" : "false") << "\n";
        out << "    }";
    }
    out << (records.empty() ? "]\n" : "\n  ]\n");
}

}  // namespace

// =============================================================================
// Format Selection
// =============================================================================

std::string_view reportFormatToString(ReportFormat format) noexcept {
    switch (format) {
        case ReportFormat::kJson:
            return "json";
        case ReportFormat::kCsv:
            return "csv";
    }
    return "unknown";
}

Result<ReportFormat> parseReportFormat(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    });

    if (lower == "json") {
        return ReportFormat::kJson;
    }
    if (lower == "csv") {
        return ReportFormat::kCsv;
    }
    return makeError<ReportFormat>(ErrorCode::kUsageError,
                                   "Unknown report format '" + std::string(name) +
                                       "' (expected json or csv)");
}

// =============================================================================
// Escaping
// =============================================================================

std::string escapeJson(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':
                escaped += "\\\"";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\b':
                escaped += "\\b";
                break;
            case '\f':
                escaped += "\\f";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\r':
                escaped += "\\r";
                break;
            case '\t':
                escaped += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    escaped += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    escaped += c;
                }
        }
    }
    return escaped;
}

std::string quoteCsvField(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }
    std::string result = "\"";
    for (char c : field) {
        if (c == '"') {
            result += '"';
        }
        result += c;
    }
    result += '"';
    return result;
}

// =============================================================================
// Writers
// =============================================================================

void writeJsonReport(const Report& report, std::ostream& out) {
    out << "{\n";
    writeJsonMetadata(report.metadata, out);
    writeJsonSummary(report.summary, out);
    writeJsonHistogram(report.summary, out);
    writeJsonTopLongest(report.summary, out);
    writeJsonRecords(report.records, out);
    out << "}\n";
    checkStream(out, "JSON");
}

void writeCsvReport(const Report& report, std::ostream& out) {
    const auto& s = report.summary;

    out << "index,header,is_valid,length,gc_content,invalid_char_count,"
           "a_count,c_count,g_count,t_count,n_count,errors\n";
    for (const auto& r : report.records) {
        out << r.index << ',' << quoteCsvField(r.header) << ',' << (r.isValid ? "true" : "false")
            << ',' << r.length << ',' << fmt::format("{:.6f}", r.gcContent) << ','
            << r.invalidCharCount << ',' << r.composition.a << ',' << r.composition.c << ','
            << r.composition.g << ',' << r.composition.t << ',' << r.composition.n << ','
            << quoteCsvField(joinErrors(r.errors, ";")) << '\n';
    }

    out << '\n';
    out << "SUMMARY\n";
    out << "metric,value\n";
    out << "total_count," << s.totalCount << '\n';
    out << "valid_count," << s.validCount << '\n';
    out << "invalid_count," << s.invalidCount << '\n';
    out << "validity_percentage," << fmt::format("{:.2f}", s.validityPercentage()) << '\n';
    out << "avg_gc_content," << fmt::format("{:.6f}", s.avgGcContent) << '\n';
    out << "median_gc_content," << fmt::format("{:.6f}", s.medianGcContent) << '\n';
    out << "min_length," << s.minLength << '\n';
    out << "max_length," << s.maxLength << '\n';
    out << "avg_length," << fmt::format("{:.2f}", s.avgLength) << '\n';
    out << "median_length," << s.medianLength << '\n';
    out << "total_bases," << s.totalBases << '\n';
    out << "sanitized_count," << s.sanitizedCount << '\n';
    out << "total_errors," << s.totalErrors << '\n';
    out << "most_common_error,"
        << (s.mostCommonError.has_value() ? recordErrorToString(*s.mostCommonError)
                                          : std::string_view("None"))
        << '\n';
    for (const auto& [code, count] : s.errorHistogram) {
        out << "error:" << recordErrorToString(code) << ',' << count << '\n';
    }
    for (algo::QualityTier tier : algo::kAllQualityTiers) {
        out << "quality:" << algo::qualityTierToString(tier) << ',' << s.qualityCount(tier)
            << '\n';
    }

    out << '\n';
    out << "TOP LONGEST\n";
    out << "rank,index,header,length\n";
    for (std::size_t i = 0; i < s.topLongest.size(); ++i) {
        const auto& rank = s.topLongest[i];
        out << (i + 1) << ',' << rank.index << ',' << quoteCsvField(rank.header) << ','
            << rank.length << '\n';
    }

    checkStream(out, "CSV");
}

void writeTextSummary(const algo::DatasetSummary& s, std::ostream& out) {
    out << "=== Sequence Validation Summary ===\n\n";
    out << fmt::format("Total sequences:   {}\n", s.totalCount);
    out << fmt::format("Valid:             {}\n", s.validCount);
    out << fmt::format("Invalid:           {}\n", s.invalidCount);
    out << fmt::format("Validity:          {:.1f}%\n", s.validityPercentage());
    out << fmt::format("Total bases:       {}\n", s.totalBases);
    out << fmt::format("Length min/avg/max: {} / {:.1f} / {}\n", s.minLength, s.avgLength,
                       s.maxLength);
    out << fmt::format("Median length:     {}\n", s.medianLength);
    out << fmt::format("Average GC:        {:.2f}%\n", s.avgGcContent * 100.0);
    out << fmt::format("Median GC:         {:.2f}%\n", s.medianGcContent * 100.0);
    out << fmt::format("Sanitized:         {}\n", s.sanitizedCount);

    out << "\n--- Quality ---\n";
    for (algo::QualityTier tier : algo::kAllQualityTiers) {
        out << fmt::format("{:<18} {}\n", algo::qualityTierToString(tier), s.qualityCount(tier));
    }

    if (!s.errorHistogram.empty()) {
        out << "\n--- Errors ---\n";
        for (const auto& [code, count] : s.errorHistogram) {
            out << fmt::format("{:<18} {}\n", recordErrorToString(code), count);
        }
    }

    if (!s.topLongest.empty()) {
        out << "\n--- Longest Sequences ---\n";
        for (std::size_t i = 0; i < s.topLongest.size(); ++i) {
            out << fmt::format("{:>2}. {} ({} bp)\n", i + 1, s.topLongest[i].header,
                               s.topLongest[i].length);
        }
    }
}

void writeReport(const Report& report, ReportFormat format, std::ostream& out) {
    switch (format) {
        case ReportFormat::kJson:
            writeJsonReport(report, out);
            return;
        case ReportFormat::kCsv:
            writeCsvReport(report, out);
            return;
    }
}

void writeReportFile(const Report& report, ReportFormat format, const std::filesystem::path& path) {
    if (path == "-") {
        writeReport(report, format, std::cout);
        std::cout.flush();
        return;
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw IOError("Failed to create report file", ErrorContext(path.string()));
    }
    writeReport(report, format, file);
    file.close();
    if (file.fail()) {
        throw IOError("Failed to finalize report file", ErrorContext(path.string()));
    }

    GCL_LOG_INFO("Wrote {} report to {}", reportFormatToString(format), path.string());
}

}  // namespace gcl::report
