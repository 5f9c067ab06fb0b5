#include "fqcheck/core/Config.h"
#include "fqcheck/core/Rule.h"
#include "fqcheck/core/RuleRegistry.h"

#include <cstdio>
#include <memory>
#include <sstream>

namespace fqcheck {

class FQ001_FileSize : public Rule {
public:
    static constexpr std::string_view kID    = ruleid::FileSize;
    static constexpr std::string_view kTitle = "File Size";

    explicit FQ001_FileSize(const FileSizeRuleConfig &cfg)
        : maxBytes_(cfg.maxFileSizeBytes) {
        applicability_.extensions = cfg.extensions;
    }

    static std::unique_ptr<Rule> create(const Config &cfg) {
        if (!cfg.rules.fileSize.enabled)
            return nullptr;
        return std::make_unique<FQ001_FileSize>(cfg.rules.fileSize);
    }

    std::string_view getID() const override { return kID; }
    std::string_view getTitle() const override { return kTitle; }
    Severity getBaseSeverity() const override { return Severity::Informational; }

    std::string describeConfig() const override {
        return "maxFileSizeBytes=" + std::to_string(maxBytes_) +
               ";applies=" + applicability_.describe();
    }

    bool appliesTo(const FileInput &file) const override {
        return applicability_.matches(file);
    }

    llvm::Error evaluate(const FileInput &file,
                         std::vector<Finding> &out) const override {
        // Exactly at the threshold is acceptable.
        if (file.sizeBytes <= maxBytes_)
            return llvm::Error::success();

        double ratio = maxBytes_ == 0
            ? static_cast<double>(file.sizeBytes)
            : static_cast<double>(file.sizeBytes) / static_cast<double>(maxBytes_);

        std::ostringstream msg;
        msg << "file is " << file.sizeBytes << " bytes, limit is "
            << maxBytes_ << " bytes (" << formatRatio(ratio) << "x)";
        out.push_back(makeFinding(severityForRatio(ratio), msg.str()));
        return llvm::Error::success();
    }

    // Severity grows with how far the file is over the limit.
    static Severity severityForRatio(double ratio) {
        if (ratio >= 10.0) return Severity::Critical;
        if (ratio >= 3.0)  return Severity::High;
        if (ratio >= 1.5)  return Severity::Medium;
        return Severity::Informational;
    }

private:
    static std::string formatRatio(double ratio) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.2f", ratio);
        return buf;
    }

    uint64_t maxBytes_;
    RuleApplicability applicability_;
};

FQCHECK_REGISTER_RULE(FQ001_FileSize)

} // namespace fqcheck
