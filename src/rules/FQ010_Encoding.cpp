#include "fqcheck/analysis/ContentProbe.h"
#include "fqcheck/core/Config.h"
#include "fqcheck/core/Errors.h"
#include "fqcheck/core/Rule.h"
#include "fqcheck/core/RuleRegistry.h"

#include <llvm/ADT/StringExtras.h>
#include <llvm/Support/ConvertUTF.h>

#include <memory>
#include <optional>
#include <sstream>

namespace fqcheck {

class FQ010_Encoding : public Rule {
public:
    static constexpr std::string_view kID    = ruleid::Encoding;
    static constexpr std::string_view kTitle = "Invalid Encoding";

    explicit FQ010_Encoding(const EncodingRuleConfig &cfg)
        : encoding_(llvm::StringRef(cfg.expectedEncoding).lower()) {
        applicability_.extensions = cfg.extensions;
        applicability_.textOnly = true;
    }

    static std::unique_ptr<Rule> create(const Config &cfg) {
        if (!cfg.rules.encoding.enabled)
            return nullptr;
        return std::make_unique<FQ010_Encoding>(cfg.rules.encoding);
    }

    std::string_view getID() const override { return kID; }
    std::string_view getTitle() const override { return kTitle; }

    // Malformed bytes are a hard correctness problem.
    Severity getBaseSeverity() const override { return Severity::Critical; }

    std::string describeConfig() const override {
        return "expectedEncoding=" + encoding_ +
               ";applies=" + applicability_.describe();
    }

    bool appliesTo(const FileInput &file) const override {
        return applicability_.matches(file);
    }

    llvm::Error evaluate(const FileInput &file,
                         std::vector<Finding> &out) const override {
        std::optional<uint64_t> firstBad;
        uint64_t badCount = 0;

        if (encoding_ == "utf-8" || encoding_ == "utf8") {
            scanUTF8(file.content, firstBad, badCount);
        } else if (encoding_ == "ascii" || encoding_ == "us-ascii") {
            scanASCII(file.content, firstBad, badCount);
        } else {
            return llvm::make_error<RuleEvaluationError>(
                "unsupported expectedEncoding '" + encoding_ + "'");
        }

        if (!firstBad)
            return llvm::Error::success();

        std::ostringstream msg;
        msg << "content is not valid " << encoding_ << ": " << badCount
            << " malformed byte sequence(s), first at byte " << *firstBad;
        out.push_back(makeFinding(getBaseSeverity(), msg.str(),
                                  lineNumberAt(file.content, *firstBad),
                                  *firstBad));
        return llvm::Error::success();
    }

private:
    static void scanUTF8(llvm::StringRef content,
                         std::optional<uint64_t> &firstBad,
                         uint64_t &badCount) {
        const auto *begin = reinterpret_cast<const llvm::UTF8 *>(content.data());
        const auto *end = begin + content.size();
        const llvm::UTF8 *cur = begin;

        // isLegalUTF8String stops at the first malformed sequence; skip one
        // byte and resume to count the rest.
        while (cur != end) {
            if (llvm::isLegalUTF8String(&cur, end))
                break;
            if (!firstBad)
                firstBad = static_cast<uint64_t>(cur - begin);
            ++badCount;
            ++cur;
        }
    }

    static void scanASCII(llvm::StringRef content,
                          std::optional<uint64_t> &firstBad,
                          uint64_t &badCount) {
        for (size_t i = 0; i < content.size(); ++i) {
            if (static_cast<unsigned char>(content[i]) < 0x80)
                continue;
            if (!firstBad)
                firstBad = i;
            ++badCount;
        }
    }

    std::string encoding_;
    RuleApplicability applicability_;
};

FQCHECK_REGISTER_RULE(FQ010_Encoding)

} // namespace fqcheck
