#include "fqcheck/analysis/ContentProbe.h"
#include "fqcheck/core/Config.h"
#include "fqcheck/core/Errors.h"
#include "fqcheck/core/Rule.h"
#include "fqcheck/core/RuleRegistry.h"

#include <llvm/ADT/StringExtras.h>

#include <array>
#include <memory>
#include <optional>
#include <sstream>

namespace fqcheck {

namespace {

std::optional<LineEnding> parseEnding(llvm::StringRef s) {
    std::string lower = s.lower();
    if (lower == "lf")   return LineEnding::LF;
    if (lower == "crlf") return LineEnding::CRLF;
    if (lower == "cr")   return LineEnding::CR;
    return std::nullopt;
}

size_t endingIndex(LineEnding e) {
    return static_cast<size_t>(e);
}

// Bounded collector: once the cap is reached the last slot is reserved for
// a summary of what was dropped.
class CappedFindings {
public:
    CappedFindings(std::vector<Finding> &out, unsigned cap)
        : out_(out), cap_(cap) {}

    void add(Finding f) {
        if (cap_ == 0 || kept_.size() < cap_)
            kept_.push_back(std::move(f));
        else
            ++dropped_;
    }

    void flush(const Finding &summaryTemplate) {
        if (dropped_ > 0) {
            // Make room for the summary.
            kept_.pop_back();
            ++dropped_;
            Finding summary = summaryTemplate;
            summary.message = std::to_string(dropped_) +
                              " further finding(s) suppressed (limit " +
                              std::to_string(cap_) + " per file)";
            kept_.push_back(std::move(summary));
        }
        for (auto &f : kept_)
            out_.push_back(std::move(f));
    }

private:
    std::vector<Finding> &out_;
    std::vector<Finding> kept_;
    unsigned cap_;
    uint64_t dropped_ = 0;
};

} // anonymous namespace

class FQ020_LineEndings : public Rule {
public:
    static constexpr std::string_view kID    = ruleid::LineEndings;
    static constexpr std::string_view kTitle = "Line Endings and Whitespace";

    explicit FQ020_LineEndings(const LineEndingRuleConfig &cfg)
        : checkTrailing_(cfg.checkTrailingWhitespace),
          requireFinalNewline_(cfg.requireFinalNewline),
          maxFindings_(cfg.maxFindingsPerFile) {
        applicability_.extensions = cfg.extensions;
        applicability_.textOnly = true;

        for (const auto &name : cfg.allowedLineEndings) {
            if (auto e = parseEnding(name))
                allowed_[endingIndex(*e)] = true;
            else
                invalidEndings_.push_back(name);
            hasAllowList_ = true;
        }
    }

    static std::unique_ptr<Rule> create(const Config &cfg) {
        if (!cfg.rules.lineEndings.enabled)
            return nullptr;
        return std::make_unique<FQ020_LineEndings>(cfg.rules.lineEndings);
    }

    std::string_view getID() const override { return kID; }
    std::string_view getTitle() const override { return kTitle; }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    std::string describeConfig() const override {
        std::ostringstream os;
        os << "allowed=";
        for (LineEnding e : {LineEnding::LF, LineEnding::CRLF, LineEnding::CR})
            if (allowed_[endingIndex(e)])
                os << lineEndingName(e) << ",";
        for (const auto &bad : invalidEndings_)
            os << "?" << bad << ",";
        os << ";trailing=" << checkTrailing_
           << ";finalNewline=" << requireFinalNewline_
           << ";max=" << maxFindings_
           << ";applies=" << applicability_.describe();
        return os.str();
    }

    bool appliesTo(const FileInput &file) const override {
        return applicability_.matches(file);
    }

    llvm::Error evaluate(const FileInput &file,
                         std::vector<Finding> &out) const override {
        if (!invalidEndings_.empty())
            return llvm::make_error<RuleEvaluationError>(
                "unknown line ending '" + invalidEndings_.front() +
                "' in allowedLineEndings (expected lf, crlf or cr)");

        // First pass: how many lines use each style.
        std::array<uint64_t, 4> counts{};
        {
            LineCursor cursor(file.content);
            LineView line;
            while (cursor.next(line))
                ++counts[endingIndex(line.ending)];
        }

        unsigned stylesUsed = 0;
        LineEnding dominant = LineEnding::LF;
        uint64_t dominantCount = 0;
        for (LineEnding e : {LineEnding::LF, LineEnding::CRLF, LineEnding::CR}) {
            uint64_t c = counts[endingIndex(e)];
            if (c == 0)
                continue;
            ++stylesUsed;
            if (c > dominantCount) {
                dominant = e;
                dominantCount = c;
            }
        }
        bool mixed = stylesUsed > 1;

        CappedFindings findings(out, maxFindings_);
        LineCursor cursor(file.content);
        LineView line;
        LineView last;
        while (cursor.next(line)) {
            last = line;
            uint64_t endOffset = line.offset + line.text.size();

            if (line.ending != LineEnding::None) {
                if (hasAllowList_ && !allowed_[endingIndex(line.ending)]) {
                    findings.add(makeFinding(
                        Severity::Medium,
                        "line ending '" + std::string(lineEndingName(line.ending)) +
                            "' is not allowed",
                        line.number, endOffset));
                } else if (mixed && line.ending != dominant) {
                    findings.add(makeFinding(
                        Severity::Medium,
                        "mixed line endings: '" +
                            std::string(lineEndingName(line.ending)) +
                            "' in a file that mostly uses '" +
                            std::string(lineEndingName(dominant)) + "'",
                        line.number, endOffset));
                }
            }

            if (checkTrailing_) {
                llvm::StringRef trimmed = line.text.rtrim(" \t");
                if (trimmed.size() != line.text.size()) {
                    findings.add(makeFinding(
                        Severity::Informational,
                        std::to_string(line.text.size() - trimmed.size()) +
                            " trailing whitespace character(s)",
                        line.number, line.offset + trimmed.size()));
                }
            }
        }

        if (requireFinalNewline_ && !file.content.empty() &&
            last.ending == LineEnding::None) {
            findings.add(makeFinding(Severity::Informational,
                                     "missing newline at end of file",
                                     last.number, file.content.size()));
        }

        findings.flush(makeFinding(Severity::Informational, {}));
        return llvm::Error::success();
    }

private:
    std::array<bool, 4> allowed_{};
    bool hasAllowList_ = false;
    std::vector<std::string> invalidEndings_;
    bool checkTrailing_;
    bool requireFinalNewline_;
    unsigned maxFindings_;
    RuleApplicability applicability_;
};

FQCHECK_REGISTER_RULE(FQ020_LineEndings)

} // namespace fqcheck
