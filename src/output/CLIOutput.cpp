#include "fqcheck/output/OutputFormatter.h"

#include <cstdio>
#include <sstream>

namespace fqcheck {

namespace {

std::string percent(double fraction) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%.1f%%", fraction * 100.0);
    return buf;
}

} // anonymous namespace

std::string CLIOutputFormatter::format(const RunReport &report,
                                       const ExecutionMetadata &meta,
                                       const RenderOptions &options) {
    std::ostringstream os;

    for (const auto &d : report.discoveryFindings()) {
        if (!(d.finding.severity >= options.minSeverity))
            continue;
        os << d.path << ": [" << severityToString(d.finding.severity) << "] "
           << d.finding.ruleID << " " << d.finding.title << ": "
           << d.finding.message << "\n";
    }

    size_t shown = 0;
    for (const FileResult *r : selectFiles(report, options)) {
        auto findings = visibleFindings(*r, options);
        if (findings.empty() && !options.status && options.worst == 0)
            continue;

        os << r->relativePath << ": score " << formatScore(r->score)
           << " [" << fileStatusName(r->status) << "]\n";
        for (const Finding *f : findings) {
            os << "  ";
            if (f->location)
                os << "line " << f->location->line << ": ";
            os << "[" << severityToString(f->severity) << "] " << f->ruleID
               << " " << f->title << ": " << f->message << "\n";
        }
        ++shown;
    }
    if (shown > 0)
        os << "\n";

    os << "fqcheck: analyzed " << report.files().size() << " of "
       << report.filesDiscovered() << " file(s) under " << report.root() << "\n";

    if (report.totalFindings() == 0) {
        os << "fqcheck: no issues detected.\n";
    } else {
        os << "fqcheck: " << report.totalFindings() << " finding(s) in "
           << report.flaggedFiles() << " file(s): "
           << report.severityCount(Severity::Critical) << " critical, "
           << report.severityCount(Severity::High) << " high, "
           << report.severityCount(Severity::Medium) << " medium, "
           << report.severityCount(Severity::Informational) << " informational\n";
    }

    os << "fqcheck: aggregate score " << formatScore(report.aggregateScore())
       << ", pass rate " << percent(report.passRate())
       << " (" << report.statusCount(FileStatus::Pass) << " pass, "
       << report.statusCount(FileStatus::Fail) << " fail, "
       << report.statusCount(FileStatus::NotGraded) << " na)\n";

    if (!report.extensionCounts().empty()) {
        os << "fqcheck: file types:";
        for (const auto &[ext, count] : report.extensionCounts())
            os << " " << ext << "=" << count;
        os << "\n";
    }

    if (meta.cacheEnabled) {
        os << "fqcheck: cache: " << meta.cache.hits << " hit(s), "
           << meta.cache.misses << " miss(es)";
        if (meta.cache.corrupt > 0)
            os << ", " << meta.cache.corrupt << " corrupt";
        if (meta.cache.writeFailures > 0)
            os << ", " << meta.cache.writeFailures << " write failure(s)";
        os << "\n";
    }
    os << "fqcheck: " << meta.workers << " worker(s), " << meta.elapsedMs
       << " ms\n";

    if (report.incomplete())
        os << "fqcheck: warning: run was cancelled; report is incomplete\n";

    return os.str();
}

} // namespace fqcheck
