#include "fqcheck/output/OutputFormatter.h"

#include <iterator>
#include <sstream>

namespace fqcheck {

namespace {

constexpr Severity kAllSeverities[] = {
    Severity::Critical, Severity::High, Severity::Medium, Severity::Informational,
};

constexpr FileStatus kAllStatuses[] = {
    FileStatus::Pass, FileStatus::Fail, FileStatus::NotGraded,
};

void writeFinding(std::ostringstream &os, const Finding &f,
                  const std::string &indent) {
    os << indent << "{\n";
    os << indent << "  \"ruleID\": \"" << escapeJSON(f.ruleID) << "\",\n";
    os << indent << "  \"title\": \"" << escapeJSON(f.title) << "\",\n";
    os << indent << "  \"severity\": \"" << severityToString(f.severity) << "\",\n";
    if (f.location) {
        os << indent << "  \"line\": " << f.location->line << ",\n";
        os << indent << "  \"byteOffset\": " << f.location->byteOffset << ",\n";
    }
    os << indent << "  \"message\": \"" << escapeJSON(f.message) << "\"\n";
    os << indent << "}";
}

} // anonymous namespace

std::string JSONOutputFormatter::format(const RunReport &report,
                                        const ExecutionMetadata &meta,
                                        const RenderOptions &options) {
    std::ostringstream os;
    os << "{\n";
    os << "  \"tool\": \"fqcheck\",\n";
    os << "  \"version\": \"" << escapeJSON(meta.toolVersion) << "\",\n";
    os << "  \"timestamp\": " << report.timestamp() << ",\n";
    os << "  \"root\": \"" << escapeJSON(report.root()) << "\",\n";
    os << "  \"ruleSetVersion\": \"" << escapeJSON(report.ruleSetVersion()) << "\",\n";
    os << "  \"incomplete\": " << (report.incomplete() ? "true" : "false") << ",\n";

    // Summary always describes the whole report, independent of filters.
    os << "  \"summary\": {\n";
    os << "    \"filesDiscovered\": " << report.filesDiscovered() << ",\n";
    os << "    \"filesAnalyzed\": " << report.files().size() << ",\n";
    os << "    \"flaggedFiles\": " << report.flaggedFiles() << ",\n";
    os << "    \"aggregateScore\": " << formatScore(report.aggregateScore()) << ",\n";
    os << "    \"passRate\": " << formatScore(report.passRate() * 100.0) << ",\n";

    os << "    \"severityCounts\": {";
    for (size_t i = 0; i < std::size(kAllSeverities); ++i) {
        Severity s = kAllSeverities[i];
        os << "\"" << severityToString(s) << "\": " << report.severityCount(s);
        if (i + 1 < std::size(kAllSeverities)) os << ", ";
    }
    os << "},\n";

    os << "    \"statusCounts\": {";
    for (size_t i = 0; i < std::size(kAllStatuses); ++i) {
        FileStatus s = kAllStatuses[i];
        os << "\"" << fileStatusName(s) << "\": " << report.statusCount(s);
        if (i + 1 < std::size(kAllStatuses)) os << ", ";
    }
    os << "},\n";

    os << "    \"extensionCounts\": {";
    size_t n = 0;
    for (const auto &[ext, count] : report.extensionCounts()) {
        os << "\"" << escapeJSON(ext) << "\": " << count;
        if (++n < report.extensionCounts().size()) os << ", ";
    }
    os << "}\n";
    os << "  },\n";

    os << "  \"discoveryFindings\": [";
    const auto &skipped = report.discoveryFindings();
    for (size_t i = 0; i < skipped.size(); ++i) {
        os << "\n    {\n";
        os << "      \"path\": \"" << escapeJSON(skipped[i].path) << "\",\n";
        os << "      \"finding\":\n";
        writeFinding(os, skipped[i].finding, "      ");
        os << "\n    }";
        if (i + 1 < skipped.size()) os << ",";
    }
    os << (skipped.empty() ? "],\n" : "\n  ],\n");

    auto files = selectFiles(report, options);
    os << "  \"files\": [";
    for (size_t i = 0; i < files.size(); ++i) {
        const FileResult &r = *files[i];
        os << "\n    {\n";
        os << "      \"path\": \"" << escapeJSON(r.path) << "\",\n";
        os << "      \"relativePath\": \"" << escapeJSON(r.relativePath) << "\",\n";
        os << "      \"sizeBytes\": " << r.sizeBytes << ",\n";
        os << "      \"fingerprint\": \"" << escapeJSON(r.fingerprint) << "\",\n";
        os << "      \"rulesApplied\": " << r.rulesApplied << ",\n";
        os << "      \"score\": " << formatScore(r.score) << ",\n";
        os << "      \"status\": \"" << fileStatusName(r.status) << "\",\n";
        os << "      \"findings\": [";
        auto findings = visibleFindings(r, options);
        for (size_t j = 0; j < findings.size(); ++j) {
            os << "\n";
            writeFinding(os, *findings[j], "        ");
            if (j + 1 < findings.size()) os << ",";
        }
        os << (findings.empty() ? "]\n" : "\n      ]\n");
        os << "    }";
        if (i + 1 < files.size()) os << ",";
    }
    os << (files.empty() ? "]\n" : "\n  ]\n");
    os << "}\n";
    return os.str();
}

} // namespace fqcheck
