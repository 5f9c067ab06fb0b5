#include "fqcheck/analysis/Analyzer.h"
#include "fqcheck/analysis/ContentProbe.h"
#include "fqcheck/cache/ResultCache.h"
#include "fqcheck/core/Fingerprint.h"
#include "fqcheck/core/Scoring.h"

#include <llvm/Support/MemoryBuffer.h>

#include <exception>

namespace fqcheck {

namespace {

Finding ruleFailureFinding(const Rule &rule, const std::string &why) {
    Finding f;
    f.ruleID   = std::string(ruleid::RuleFailure);
    f.title    = "Rule Evaluation Failure";
    f.severity = Severity::Informational;
    f.message  = "rule " + std::string(rule.getID()) + " (" +
                 std::string(rule.getTitle()) + ") failed: " + why;
    return f;
}

Finding unreadableFinding(const std::string &why) {
    Finding f;
    f.ruleID   = std::string(ruleid::Unreadable);
    f.title    = "Unreadable File";
    f.severity = Severity::Critical;
    f.message  = "cannot read file: " + why;
    return f;
}

} // anonymous namespace

Analyzer::Analyzer(const Config &cfg, const RuleRegistry &registry,
                   ResultCache *cache)
    : config_(cfg), registry_(registry), cache_(cache) {}

FileResult Analyzer::analyze(const std::string &path,
                             const std::string &relativePath) const {
    auto bufOrErr = llvm::MemoryBuffer::getFile(path, /*IsText=*/false,
                                                /*RequiresNullTerminator=*/false);
    if (!bufOrErr) {
        FileResult r;
        r.path = path;
        r.relativePath = relativePath;
        r.findings.push_back(unreadableFinding(bufOrErr.getError().message()));
        rescore(r, config_.scoring);
        return r;
    }

    llvm::StringRef content = (*bufOrErr)->getBuffer();
    std::string fingerprint = fingerprintBytes(content);

    if (cache_) {
        if (auto cached = cache_->get(path, relativePath, fingerprint,
                                      registry_.version()))
            return std::move(*cached);
    }

    FileInput input;
    input.path         = path;
    input.relativePath = relativePath;
    input.content      = content;
    input.sizeBytes    = content.size();
    input.isBinary     = looksBinary(content);

    FileResult result = evaluate(input, fingerprint);

    if (cache_)
        cache_->put(path, relativePath, result.fingerprint, registry_.version(),
                    result);
    return result;
}

FileResult Analyzer::analyzeContent(const std::string &path,
                                    const std::string &relativePath,
                                    llvm::StringRef content) const {
    FileInput input;
    input.path         = path;
    input.relativePath = relativePath;
    input.content      = content;
    input.sizeBytes    = content.size();
    input.isBinary     = looksBinary(content);
    return evaluate(input, fingerprintBytes(content));
}

FileResult Analyzer::evaluate(const FileInput &input,
                              std::string fingerprint) const {
    FileResult r;
    r.path         = input.path;
    r.relativePath = input.relativePath;
    r.sizeBytes    = input.sizeBytes;
    r.fingerprint  = std::move(fingerprint);

    const auto &dup = config_.rules.duplication;
    if (dup.enabled && dup.normalizeWhitespace)
        r.normalizedFingerprint = normalizedFingerprint(input.content);

    auto rules = registry_.applicableRules(input);
    r.rulesApplied = static_cast<unsigned>(rules.size());
    for (const Rule *rule : rules)
        runRule(*rule, input, r.findings);

    rescore(r, config_.scoring);
    return r;
}

void Analyzer::runRule(const Rule &rule, const FileInput &input,
                       std::vector<Finding> &out) const {
    std::vector<Finding> local;
    try {
        if (llvm::Error err = rule.evaluate(input, local)) {
            out.push_back(ruleFailureFinding(rule, llvm::toString(std::move(err))));
            return;
        }
    } catch (const std::exception &e) {
        out.push_back(ruleFailureFinding(rule, e.what()));
        return;
    } catch (...) {
        out.push_back(ruleFailureFinding(rule, "unknown exception"));
        return;
    }

    for (auto &f : local)
        out.push_back(std::move(f));
}

} // namespace fqcheck
