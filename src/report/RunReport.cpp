#include "fqcheck/report/RunReport.h"

#include <llvm/Support/Path.h>

#include <algorithm>

namespace fqcheck {

RunReport::RunReport(RunReportData data) : data_(std::move(data)) {}

std::string RunReport::extensionKey(llvm::StringRef relativePath) {
    std::string ext = llvm::sys::path::extension(
        relativePath, llvm::sys::path::Style::posix).lower();
    return ext.empty() ? "(none)" : ext;
}

uint64_t RunReport::totalFindings() const {
    uint64_t n = 0;
    for (uint64_t c : data_.severityCounts)
        n += c;
    return n;
}

uint64_t RunReport::flaggedFiles() const {
    return static_cast<uint64_t>(std::count_if(
        data_.files.begin(), data_.files.end(),
        [](const FileResult &r) { return !r.findings.empty(); }));
}

double RunReport::passRate() const {
    uint64_t pass = statusCount(FileStatus::Pass);
    uint64_t graded = pass + statusCount(FileStatus::Fail);
    return graded == 0 ? 0.0 : static_cast<double>(pass) / static_cast<double>(graded);
}

const FileResult *RunReport::find(llvm::StringRef path) const {
    auto it = std::lower_bound(
        data_.files.begin(), data_.files.end(), path,
        [](const FileResult &r, llvm::StringRef p) { return llvm::StringRef(r.path) < p; });
    if (it != data_.files.end() && it->path == path)
        return &*it;

    for (const auto &r : data_.files)
        if (r.relativePath == path)
            return &r;
    return nullptr;
}

std::vector<const FileResult *> RunReport::withSeverity(Severity atLeast) const {
    std::vector<const FileResult *> out;
    for (const auto &r : data_.files) {
        bool hit = std::any_of(r.findings.begin(), r.findings.end(),
                               [atLeast](const Finding &f) { return f.severity >= atLeast; });
        if (hit)
            out.push_back(&r);
    }
    return out;
}

std::vector<const FileResult *> RunReport::withStatus(FileStatus status) const {
    std::vector<const FileResult *> out;
    for (const auto &r : data_.files)
        if (r.status == status)
            out.push_back(&r);
    return out;
}

std::vector<const FileResult *>
RunReport::withExtension(llvm::StringRef ext) const {
    std::string key = ext.lower();
    if (!key.empty() && key != "(none)" && key.front() != '.')
        key.insert(key.begin(), '.');
    if (key.empty())
        key = "(none)";

    std::vector<const FileResult *> out;
    for (const auto &r : data_.files)
        if (extensionKey(r.relativePath) == key)
            out.push_back(&r);
    return out;
}

std::vector<const FileResult *> RunReport::sortedByScore() const {
    std::vector<const FileResult *> out;
    out.reserve(data_.files.size());
    for (const auto &r : data_.files)
        out.push_back(&r);
    std::stable_sort(out.begin(), out.end(),
                     [](const FileResult *a, const FileResult *b) {
                         return a->score < b->score;
                     });
    return out;
}

std::vector<const FileResult *> RunReport::worstOffenders(size_t n) const {
    std::vector<const FileResult *> out;
    for (const FileResult *r : sortedByScore()) {
        if (out.size() >= n)
            break;
        if (!r->findings.empty())
            out.push_back(r);
    }
    return out;
}

} // namespace fqcheck
