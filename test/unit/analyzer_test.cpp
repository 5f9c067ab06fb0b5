#include "fqcheck/analysis/Analyzer.h"
#include "fqcheck/cache/ResultCache.h"
#include "fqcheck/core/Errors.h"
#include "fqcheck/core/RuleRegistry.h"

#include "TestUtil.h"

#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace fqcheck;
using fqcheck::test::TempDir;

namespace {

// Flags every file it sees with one Informational finding.
class MarkerRule : public Rule {
public:
    explicit MarkerRule(std::string id) : id_(std::move(id)) {}

    std::string_view getID() const override { return id_; }
    std::string_view getTitle() const override { return "Marker"; }
    Severity getBaseSeverity() const override { return Severity::Informational; }
    std::string describeConfig() const override { return {}; }
    bool appliesTo(const FileInput &) const override { return true; }

    llvm::Error evaluate(const FileInput &file,
                         std::vector<Finding> &out) const override {
        out.push_back(makeFinding(Severity::Informational,
                                  "seen " + file.relativePath));
        return llvm::Error::success();
    }

private:
    std::string id_;
};

// Emits a finding, then reports failure: the finding must not survive.
class FailingRule : public Rule {
public:
    std::string_view getID() const override { return "TST_FAIL"; }
    std::string_view getTitle() const override { return "Always Fails"; }
    Severity getBaseSeverity() const override { return Severity::High; }
    std::string describeConfig() const override { return {}; }
    bool appliesTo(const FileInput &) const override { return true; }

    llvm::Error evaluate(const FileInput &,
                         std::vector<Finding> &out) const override {
        out.push_back(makeFinding(Severity::High, "partial"));
        return llvm::make_error<RuleEvaluationError>("boom");
    }
};

class ThrowingRule : public Rule {
public:
    std::string_view getID() const override { return "TST_THROW"; }
    std::string_view getTitle() const override { return "Always Throws"; }
    Severity getBaseSeverity() const override { return Severity::High; }
    std::string describeConfig() const override { return {}; }
    bool appliesTo(const FileInput &) const override { return true; }

    llvm::Error evaluate(const FileInput &,
                         std::vector<Finding> &) const override {
        throw std::runtime_error("unexpected state");
    }
};

// Throws something that is not a std::exception.
class IntThrowingRule : public Rule {
public:
    std::string_view getID() const override { return "TST_INT"; }
    std::string_view getTitle() const override { return "Throws Int"; }
    Severity getBaseSeverity() const override { return Severity::High; }
    std::string describeConfig() const override { return {}; }
    bool appliesTo(const FileInput &) const override { return true; }

    llvm::Error evaluate(const FileInput &,
                         std::vector<Finding> &) const override {
        throw 42;
    }
};

class MarkdownOnlyRule : public MarkerRule {
public:
    MarkdownOnlyRule() : MarkerRule("TST_MD") {}
    bool appliesTo(const FileInput &file) const override {
        return file.extension() == ".md";
    }
};

RuleRegistry makeRegistry(std::vector<std::unique_ptr<Rule>> rules,
                          const Config &cfg) {
    return RuleRegistry(std::move(rules), cfg);
}

} // anonymous namespace

void test_fault_isolation() {
    std::cout << "Running test_fault_isolation...\n";
    Config cfg = fqcheck::test::quietConfig();

    std::vector<std::unique_ptr<Rule>> rules;
    rules.push_back(std::make_unique<MarkerRule>("TST_A"));
    rules.push_back(std::make_unique<FailingRule>());
    rules.push_back(std::make_unique<ThrowingRule>());
    rules.push_back(std::make_unique<MarkerRule>("TST_B"));
    auto registry = makeRegistry(std::move(rules), cfg);

    Analyzer analyzer(cfg, registry, nullptr);
    FileResult r = analyzer.analyzeContent("/v/a.txt", "a.txt", "hello\n");

    assert(r.rulesApplied == 4);
    assert(r.findings.size() == 4);
    assert(r.findings[0].ruleID == "TST_A");
    assert(r.findings[1].ruleID == "FQ900");
    assert(r.findings[1].message.find("TST_FAIL") != std::string::npos);
    assert(r.findings[1].message.find("boom") != std::string::npos);
    assert(r.findings[2].ruleID == "FQ900");
    assert(r.findings[2].message.find("unexpected state") != std::string::npos);
    assert(r.findings[3].ruleID == "TST_B");
    for (const auto &f : r.findings)
        assert(f.message != "partial");

    // baseline 100 - 4 informational
    assert(r.score == 96.0);
    assert(r.status == FileStatus::Pass);
    std::cout << "test_fault_isolation passed.\n";
}

void test_non_standard_throw_is_isolated() {
    std::cout << "Running test_non_standard_throw_is_isolated...\n";
    Config cfg = fqcheck::test::quietConfig();

    std::vector<std::unique_ptr<Rule>> rules;
    rules.push_back(std::make_unique<IntThrowingRule>());
    rules.push_back(std::make_unique<MarkerRule>("TST_B"));
    auto registry = makeRegistry(std::move(rules), cfg);

    Analyzer analyzer(cfg, registry, nullptr);
    FileResult r = analyzer.analyzeContent("/v/a.txt", "a.txt", "hello\n");

    assert(r.findings.size() == 2);
    assert(r.findings[0].ruleID == "FQ900");
    assert(r.findings[0].message.find("TST_INT") != std::string::npos);
    assert(r.findings[1].ruleID == "TST_B");
    std::cout << "test_non_standard_throw_is_isolated passed.\n";
}

void test_unreadable_file() {
    std::cout << "Running test_unreadable_file...\n";
    TempDir dir("analyzer_unreadable");
    Config cfg = fqcheck::test::quietConfig();
    auto registry = RuleRegistry::fromConfig(cfg);
    Analyzer analyzer(cfg, registry, nullptr);

    FileResult r = analyzer.analyze(dir.file("gone.txt"), "gone.txt");
    assert(r.findings.size() == 1);
    assert(r.findings[0].ruleID == "FQ901");
    assert(r.findings[0].severity == Severity::Critical);
    assert(r.fingerprint.empty());
    assert(r.score == 60.0);
    assert(r.status == FileStatus::Fail);
    std::cout << "test_unreadable_file passed.\n";
}

void test_not_graded() {
    std::cout << "Running test_not_graded...\n";
    Config cfg = fqcheck::test::quietConfig();
    std::vector<std::unique_ptr<Rule>> rules;
    rules.push_back(std::make_unique<MarkdownOnlyRule>());
    auto registry = makeRegistry(std::move(rules), cfg);
    Analyzer analyzer(cfg, registry, nullptr);

    FileResult txt = analyzer.analyzeContent("/v/a.txt", "a.txt", "x");
    assert(txt.rulesApplied == 0);
    assert(txt.findings.empty());
    assert(txt.status == FileStatus::NotGraded);
    assert(txt.score == 100.0);

    FileResult md = analyzer.analyzeContent("/v/README.md", "README.md", "x");
    assert(md.rulesApplied == 1);
    assert(md.status == FileStatus::Pass);
    std::cout << "test_not_graded passed.\n";
}

void test_builtin_rules_in_order() {
    std::cout << "Running test_builtin_rules_in_order...\n";
    TempDir dir("analyzer_builtin");
    Config cfg = fqcheck::test::quietConfig();
    cfg.rules.fileSize.maxFileSizeBytes = 4;
    std::string p = dir.write("bad name.txt", "a \r\nb\n\xff\n");

    auto registry = RuleRegistry::fromConfig(cfg);
    Analyzer analyzer(cfg, registry, nullptr);
    FileResult r = analyzer.analyze(p, "bad name.txt");

    assert(r.sizeBytes == 8);
    assert(r.fingerprint.size() == 32);
    assert(!r.findings.empty());
    // Registration order: FQ001, FQ010, FQ020, FQ040.
    assert(r.findings.front().ruleID == "FQ001");
    assert(r.findings.back().ruleID == "FQ040");
    for (size_t i = 1; i < r.findings.size(); ++i)
        assert(r.findings[i - 1].ruleID <= r.findings[i].ruleID);
    // Invalid UTF-8 is Critical, so the file fails whatever its score.
    assert(r.status == FileStatus::Fail);
    std::cout << "test_builtin_rules_in_order passed.\n";
}

void test_cache_write_through() {
    std::cout << "Running test_cache_write_through...\n";
    TempDir dir("analyzer_cache");
    Config cfg = fqcheck::test::quietConfig();
    auto registry = RuleRegistry::fromConfig(cfg);
    InMemoryResultCache cache;
    Analyzer analyzer(cfg, registry, &cache);

    std::string p = dir.write("a.txt", "one\n");
    FileResult first = analyzer.analyze(p, "a.txt");
    assert(cache.size() == 1);
    assert(cache.stats().misses == 1);

    FileResult second = analyzer.analyze(p, "a.txt");
    assert(cache.stats().hits == 1);
    assert(second == first);

    dir.write("a.txt", "two  \n");
    FileResult changed = analyzer.analyze(p, "a.txt");
    assert(cache.stats().misses == 2);
    assert(changed.fingerprint != first.fingerprint);
    assert(changed.findings.size() == 1); // trailing whitespace
    // The new content replaced the entry for the path.
    assert(cache.size() == 1);
    std::cout << "test_cache_write_through passed.\n";
}

void test_cache_respects_relative_path() {
    std::cout << "Running test_cache_respects_relative_path...\n";
    TempDir dir("analyzer_cache_rel");
    Config cfg = fqcheck::test::quietConfig();
    cfg.rules.naming.checkDirectories = true;
    auto registry = RuleRegistry::fromConfig(cfg);
    InMemoryResultCache cache;
    Analyzer analyzer(cfg, registry, &cache);

    std::string p = dir.write("Bad Dir/x.txt", "x\n");
    FileResult nested = analyzer.analyze(p, "Bad Dir/x.txt");
    assert(nested.findings.size() == 1);
    assert(nested.findings[0].ruleID == "FQ040");

    // Same bytes seen from inside the directory: no directory component left
    // to judge, so the cached finding must not be reused.
    FileResult inside = analyzer.analyze(p, "x.txt");
    assert(cache.stats().hits == 0);
    assert(inside.findings.empty());
    assert(inside.relativePath == "x.txt");

    FileResult again = analyzer.analyze(p, "x.txt");
    assert(cache.stats().hits == 1);
    assert(again == inside);
    std::cout << "test_cache_respects_relative_path passed.\n";
}

int main() {
    test_fault_isolation();
    test_non_standard_throw_is_isolated();
    test_unreadable_file();
    test_not_graded();
    test_builtin_rules_in_order();
    test_cache_write_through();
    test_cache_respects_relative_path();
    std::cout << "All analyzer tests passed.\n";
    return 0;
}
