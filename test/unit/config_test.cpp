#include "fqcheck/core/Config.h"
#include "fqcheck/core/RuleRegistry.h"

#include "TestUtil.h"

#include <cassert>
#include <iostream>

using namespace fqcheck;
using fqcheck::test::TempDir;

void test_defaults() {
    std::cout << "Running test_defaults...\n";
    Config cfg = Config::defaults();
    assert(cfg.includePatterns.empty());
    assert(cfg.excludePatterns.size() == 3);
    assert(cfg.cacheEnabled);
    assert(cfg.rules.fileSize.maxFileSizeBytes == 1024 * 1024);
    assert(cfg.scoring.baseline == 100.0);
    assert(cfg.scoring.weightOf(Severity::Medium) == 5.0);
    assert(cfg.scoring.weightOf(Severity::Critical) == 40.0);
    assert(cfg.scoring.aggregate == AggregateMode::Mean);
    std::cout << "test_defaults passed.\n";
}

void test_load_yaml() {
    std::cout << "Running test_load_yaml...\n";
    TempDir dir("config_load");
    std::string path = dir.write("fqcheck.config.yaml",
        "include: ['*.txt', '*.md']\n"
        "exclude: [build]\n"
        "maxDepth: 3\n"
        "workers: 2\n"
        "cacheDir: cache\n"
        "minSeverity: Medium\n"
        "disabledRules: [FQ040]\n"
        "scoring:\n"
        "  mediumWeight: 10\n"
        "  aggregate: min\n"
        "rules:\n"
        "  fileSize:\n"
        "    maxFileSizeBytes: 1000\n"
        "  lineEndings:\n"
        "    allowedLineEndings: [lf]\n"
        "    maxFindingsPerFile: 5\n"
        "  duplication:\n"
        "    normalizeWhitespace: true\n");

    Config cfg = Config::loadFromFile(path);
    assert(cfg.includePatterns.size() == 2);
    assert(cfg.includePatterns[1] == "*.md");
    assert(cfg.excludePatterns.size() == 1 && cfg.excludePatterns[0] == "build");
    assert(cfg.maxDepth == 3);
    assert(cfg.workers == 2);
    assert(cfg.cacheDir == "cache");
    assert(cfg.minSeverity == Severity::Medium);
    assert(cfg.isRuleDisabled("FQ040"));
    assert(!cfg.isRuleDisabled("FQ001"));
    assert(cfg.scoring.mediumWeight == 10.0);
    assert(cfg.scoring.highWeight == 15.0); // untouched keys keep defaults
    assert(cfg.scoring.aggregate == AggregateMode::Minimum);
    assert(cfg.rules.fileSize.maxFileSizeBytes == 1000);
    assert(cfg.rules.lineEndings.allowedLineEndings.size() == 1);
    assert(cfg.rules.lineEndings.maxFindingsPerFile == 5);
    assert(cfg.rules.duplication.normalizeWhitespace);
    assert(cfg.rules.naming.enabled);
    std::cout << "test_load_yaml passed.\n";
}

void test_fallback_to_defaults() {
    std::cout << "Running test_fallback_to_defaults...\n";
    TempDir dir("config_fallback");

    Config missing = Config::loadFromFile(dir.file("nope.yaml"));
    assert(missing.maxDepth == Config::defaults().maxDepth);

    std::string bad = dir.write("bad.yaml", "maxDepth: [not, a, number]\n");
    Config malformed = Config::loadFromFile(bad);
    assert(malformed.maxDepth == Config::defaults().maxDepth);
    std::cout << "test_fallback_to_defaults passed.\n";
}

void test_cache_dir_resolution() {
    std::cout << "Running test_cache_dir_resolution...\n";
    Config cfg = Config::defaults();
    assert(cfg.cacheDirFor("/work/tree") == "/work/tree/.fqcheck-cache");
    cfg.cacheDir = "../shared";
    assert(cfg.cacheDirFor("/work/tree") == "/work/shared");
    cfg.cacheDir = "/var/cache/fq";
    assert(cfg.cacheDirFor("/work/tree") == "/var/cache/fq");
    std::cout << "test_cache_dir_resolution passed.\n";
}

void test_rule_set_version() {
    std::cout << "Running test_rule_set_version...\n";
    Config cfg = Config::defaults();
    auto a = RuleRegistry::fromConfig(cfg);
    auto b = RuleRegistry::fromConfig(cfg);
    assert(a.version() == b.version());
    assert(a.version().size() == 32);

    Config threshold = cfg;
    threshold.rules.fileSize.maxFileSizeBytes = 10;
    assert(RuleRegistry::fromConfig(threshold).version() != a.version());

    Config disabled = cfg;
    disabled.disabledRules.push_back("FQ020");
    auto d = RuleRegistry::fromConfig(disabled);
    assert(d.findByID("FQ020") == nullptr);
    assert(d.version() != a.version());

    Config weights = cfg;
    weights.scoring.highWeight = 20.0;
    assert(RuleRegistry::fromConfig(weights).version() != a.version());

    // Registration order is by rule ID.
    const auto &rules = a.rules();
    assert(rules.size() == 4);
    for (size_t i = 1; i < rules.size(); ++i)
        assert(rules[i - 1]->getID() < rules[i]->getID());
    std::cout << "test_rule_set_version passed.\n";
}

int main() {
    test_defaults();
    test_load_yaml();
    test_fallback_to_defaults();
    test_cache_dir_resolution();
    test_rule_set_version();
    std::cout << "All config tests passed.\n";
    return 0;
}
