#include "fqcheck/core/Config.h"
#include "fqcheck/core/Errors.h"
#include "fqcheck/core/Rule.h"
#include "fqcheck/core/RuleRegistry.h"

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Regex.h>

#include <memory>
#include <string>

namespace fqcheck {

class FQ040_NamingConvention : public Rule {
public:
    static constexpr std::string_view kID    = ruleid::Naming;
    static constexpr std::string_view kTitle = "Naming Convention";

    explicit FQ040_NamingConvention(const NamingRuleConfig &cfg)
        : patternText_(cfg.namingPattern),
          pattern_(cfg.namingPattern),
          disallowed_(cfg.disallowedCharacters),
          checkDirectories_(cfg.checkDirectories) {
        applicability_.extensions = cfg.extensions;
    }

    static std::unique_ptr<Rule> create(const Config &cfg) {
        if (!cfg.rules.naming.enabled)
            return nullptr;
        return std::make_unique<FQ040_NamingConvention>(cfg.rules.naming);
    }

    std::string_view getID() const override { return kID; }
    std::string_view getTitle() const override { return kTitle; }
    Severity getBaseSeverity() const override { return Severity::Informational; }

    std::string describeConfig() const override {
        return "pattern=" + patternText_ + ";disallowed=" + disallowed_ +
               ";dirs=" + (checkDirectories_ ? "1" : "0") +
               ";applies=" + applicability_.describe();
    }

    bool appliesTo(const FileInput &file) const override {
        return applicability_.matches(file);
    }

    llvm::Error evaluate(const FileInput &file,
                         std::vector<Finding> &out) const override {
        std::string regexError;
        if (!patternText_.empty() && !pattern_.isValid(regexError))
            return llvm::make_error<RuleEvaluationError>(
                "invalid namingPattern '" + patternText_ + "': " + regexError);

        llvm::SmallVector<llvm::StringRef, 8> components;
        llvm::StringRef(file.relativePath).split(components, '/', -1, false);
        if (components.empty())
            return llvm::Error::success();

        size_t first = checkDirectories_ ? 0 : components.size() - 1;
        for (size_t i = first; i < components.size(); ++i) {
            bool isFile = i + 1 == components.size();
            checkComponent(components[i], isFile, out);
        }
        return llvm::Error::success();
    }

private:
    void checkComponent(llvm::StringRef name, bool isFile,
                        std::vector<Finding> &out) const {
        const char *kind = isFile ? "file" : "directory";

        if (!patternText_.empty() && !pattern_.match(name)) {
            out.push_back(makeFinding(
                Severity::Informational,
                std::string(kind) + " name '" + name.str() +
                    "' does not match pattern '" + patternText_ + "'"));
        }

        size_t bad = name.find_first_of(disallowed_);
        if (!disallowed_.empty() && bad != llvm::StringRef::npos) {
            out.push_back(makeFinding(
                Severity::Medium,
                std::string(kind) + " name '" + name.str() +
                    "' contains disallowed character '" +
                    std::string(1, name[bad]) + "'"));
        }
    }

    std::string patternText_;
    llvm::Regex pattern_;
    std::string disallowed_;
    bool checkDirectories_;
    RuleApplicability applicability_;
};

FQCHECK_REGISTER_RULE(FQ040_NamingConvention)

} // namespace fqcheck
