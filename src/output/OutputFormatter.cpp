#include "fqcheck/output/OutputFormatter.h"

#include <llvm/Support/JSON.h>

#include <cstdio>

namespace fqcheck {

std::unique_ptr<OutputFormatter> makeOutputFormatter(llvm::StringRef name) {
    if (name == "cli")
        return std::make_unique<CLIOutputFormatter>();
    if (name == "json")
        return std::make_unique<JSONOutputFormatter>();
    if (name == "sarif")
        return std::make_unique<SARIFOutputFormatter>();
    return nullptr;
}

std::vector<const FileResult *> selectFiles(const RunReport &report,
                                            const RenderOptions &options) {
    std::vector<const FileResult *> candidates;
    if (options.worst > 0) {
        candidates = report.worstOffenders(options.worst);
    } else {
        for (const auto &r : report.files())
            candidates.push_back(&r);
    }

    if (!options.status)
        return candidates;

    std::vector<const FileResult *> out;
    for (const FileResult *r : candidates)
        if (r->status == *options.status)
            out.push_back(r);
    return out;
}

std::vector<const Finding *> visibleFindings(const FileResult &result,
                                             const RenderOptions &options) {
    std::vector<const Finding *> out;
    for (const auto &f : result.findings)
        if (f.severity >= options.minSeverity)
            out.push_back(&f);
    return out;
}

std::string escapeJSON(llvm::StringRef s) {
    // File names need not be UTF-8; the documents must be.
    std::string fixed;
    if (!llvm::json::isUTF8(s)) {
        fixed = llvm::json::fixUTF8(s);
        s = fixed;
    }

    std::string out;
    out.reserve(s.size() + 16);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x",
                             static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string formatScore(double score) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%.2f", score);
    return buf;
}

} // namespace fqcheck
