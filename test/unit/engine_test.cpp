#include "fqcheck/cache/ResultCache.h"
#include "fqcheck/core/Cancellation.h"
#include "fqcheck/core/Errors.h"
#include "fqcheck/core/RuleRegistry.h"
#include "fqcheck/engine/QualityEngine.h"
#include "fqcheck/output/OutputFormatter.h"

#include "TestUtil.h"

#include <cassert>
#include <iostream>
#include <sstream>

using namespace fqcheck;
using fqcheck::test::TempDir;

namespace {

QualityEngine makeEngine(const Config &cfg, llvm::StringRef root) {
    return QualityEngine(cfg, RuleRegistry::fromConfig(cfg),
                         makeResultCache(cfg, root));
}

std::string renderJSON(const QualityEngine &engine, const RunReport &report) {
    JSONOutputFormatter fmt;
    return fmt.format(report, engine.metadata(), RenderOptions{});
}

std::string withoutTimestamp(const std::string &json) {
    std::istringstream in(json);
    std::string line, out;
    while (std::getline(in, line)) {
        if (line.find("\"timestamp\"") != std::string::npos)
            continue;
        out += line;
        out += '\n';
    }
    return out;
}

void populate(const TempDir &dir) {
    dir.write("README.md", "# Readme\n\nText with trailing space \n");
    dir.write("src/main.txt", "line one\r\nline two\nline three\r\n");
    dir.write("src/copy.txt", "line one\r\nline two\nline three\r\n");
    dir.write("data/blob.bin", std::string("\x00\x01\x02\xff", 4));
    dir.write("odd name.txt", "fine\n");
    dir.write("latin1.txt", "caf\xe9\n");
}

} // anonymous namespace

void test_duplicate_pair_scenario() {
    std::cout << "Running test_duplicate_pair_scenario...\n";
    TempDir dir("engine_pair");
    dir.write("a.txt", "hello 12\n");
    dir.write("b.txt", "hello 12\n");

    Config cfg = fqcheck::test::quietConfig();
    cfg.rules.fileSize.maxFileSizeBytes = 1000;
    auto engine = makeEngine(cfg, dir.str());

    auto report = engine.run(dir.str());
    assert(report);
    assert(report->files().size() == 2);

    const FileResult *a = report->find("a.txt");
    const FileResult *b = report->find("b.txt");
    assert(a && b);
    assert(a->sizeBytes == 9);
    assert(a->findings.empty());
    assert(b->findings.size() == 1);
    assert(b->findings[0].ruleID == "FQ030");
    assert(b->findings[0].message == "duplicate of a.txt");

    assert(report->flaggedFiles() == 1);
    assert(report->aggregateScore() == 97.5);
    assert(report->statusCount(FileStatus::Pass) == 2);
    std::cout << "test_duplicate_pair_scenario passed.\n";
}

void test_idempotent_runs() {
    std::cout << "Running test_idempotent_runs...\n";
    TempDir dir("engine_idempotent");
    populate(dir);

    Config cfg = Config::defaults();
    cfg.workers = 4;

    auto first = makeEngine(cfg, dir.str());
    auto r1 = first.run(dir.str());
    assert(r1);
    assert(first.metadata().cache.misses == 6);
    assert(first.metadata().cache.hits == 0);
    std::string json1 = renderJSON(first, *r1);

    // A second invocation is served entirely from the on-disk cache.
    auto second = makeEngine(cfg, dir.str());
    auto r2 = second.run(dir.str());
    assert(r2);
    assert(second.metadata().cache.hits == 6);
    assert(second.metadata().cache.misses == 0);
    std::string json2 = renderJSON(second, *r2);

    assert(withoutTimestamp(json1) == withoutTimestamp(json2));
    assert(r1->files() == r2->files());

    // Caching never changes the outcome.
    Config uncached = cfg;
    uncached.cacheEnabled = false;
    uncached.workers = 1;
    auto third = makeEngine(uncached, dir.str());
    auto r3 = third.run(dir.str());
    assert(r3);
    assert(r3->files() == r1->files());
    assert(r3->aggregateScore() == r1->aggregateScore());

    // The cache directory never shows up as input.
    for (const auto &f : r2->files())
        assert(f.relativePath.find(".fqcheck-cache") == std::string::npos);
    std::cout << "test_idempotent_runs passed.\n";
}

void test_cache_follows_content() {
    std::cout << "Running test_cache_follows_content...\n";
    TempDir dir("engine_content");
    populate(dir);
    Config cfg = Config::defaults();
    cfg.workers = 2;

    auto warm = makeEngine(cfg, dir.str());
    auto before = warm.run(dir.str());
    assert(before);
    const FileResult *odd = before->find("odd name.txt");
    assert(odd && odd->findings.size() == 1); // naming only

    dir.write("odd name.txt", "fine   \n");
    auto changed = makeEngine(cfg, dir.str());
    auto edited = changed.run(dir.str());
    assert(edited);
    assert(changed.metadata().cache.misses == 1);
    assert(changed.metadata().cache.hits == 5);
    assert(edited->find("odd name.txt")->findings.size() == 2);

    // Back to the first bytes: the entry now holds the edit, so the file is
    // re-evaluated and comes out exactly as it did the first time.
    dir.write("odd name.txt", "fine\n");
    auto reverted = makeEngine(cfg, dir.str());
    auto again = reverted.run(dir.str());
    assert(again);
    assert(reverted.metadata().cache.hits == 5);
    assert(reverted.metadata().cache.misses == 1);
    assert(again->files() == before->files());

    // One entry per file, however often it was edited.
    assert(fqcheck::test::countEntries(dir.file(".fqcheck-cache")) == 6);

    // A different rule configuration never reuses entries.
    Config stricter = cfg;
    stricter.rules.fileSize.maxFileSizeBytes = 4;
    auto strict = makeEngine(stricter, dir.str());
    auto s = strict.run(dir.str());
    assert(s);
    assert(strict.metadata().cache.hits == 0);
    assert(s->ruleSetVersion() != before->ruleSetVersion());
    std::cout << "test_cache_follows_content passed.\n";
}

void test_shared_cache_across_roots() {
    std::cout << "Running test_shared_cache_across_roots...\n";
    TempDir dir("engine_roots");
    dir.write("Bad Dir/x.txt", "x\n");
    std::string inner = dir.file("Bad Dir");

    Config cfg = Config::defaults();
    cfg.workers = 1;
    cfg.cacheDir = dir.file("shared-cache");
    cfg.rules.naming.checkDirectories = true;

    auto fromInner = makeEngine(cfg, inner);
    auto r1 = fromInner.run(inner);
    assert(r1);
    assert(r1->find("x.txt")->findings.empty());

    auto fromOuter = makeEngine(cfg, dir.str());
    auto r2 = fromOuter.run(dir.str());
    assert(r2);
    assert(fromOuter.metadata().cache.hits == 0);
    assert(r2->find("Bad Dir/x.txt")->findings.size() == 1);

    // Back to the inner root: the outer run's finding must not leak in.
    auto again = makeEngine(cfg, inner);
    auto r3 = again.run(inner);
    assert(r3);
    assert(again.metadata().cache.hits == 0);
    assert(r3->files() == r1->files());
    std::cout << "test_shared_cache_across_roots passed.\n";
}

void test_non_utf8_file_name_is_cached() {
    std::cout << "Running test_non_utf8_file_name_is_cached...\n";
    TempDir dir("engine_utf8");
    dir.write("caf\xe9.txt", "latte\n");
    dir.write("ok.txt", "fine\n");
    Config cfg = Config::defaults();
    cfg.workers = 2;

    auto first = makeEngine(cfg, dir.str());
    auto r1 = first.run(dir.str());
    assert(r1);
    assert(first.metadata().cache.misses == 2);
    const FileResult *odd = r1->find("caf\xe9.txt");
    assert(odd && odd->findings.size() == 1);   // naming

    for (int i = 0; i < 2; ++i) {
        auto next = makeEngine(cfg, dir.str());
        auto r = next.run(dir.str());
        assert(r);
        assert(next.metadata().cache.hits == 2);
        assert(next.metadata().cache.misses == 0);
        assert(next.metadata().cache.corrupt == 0);
        assert(r->files() == r1->files());
    }
    std::cout << "test_non_utf8_file_name_is_cached passed.\n";
}

void test_cancellation() {
    std::cout << "Running test_cancellation...\n";
    TempDir dir("engine_cancel");
    populate(dir);
    Config cfg = fqcheck::test::quietConfig();
    auto engine = makeEngine(cfg, dir.str());

    CancellationToken token;
    token.requestStop();
    auto report = engine.run(dir.str(), &token);
    assert(report);
    assert(report->incomplete());
    assert(report->files().empty());
    assert(report->filesDiscovered() == 6);

    CancellationToken idle;
    auto full = engine.run(dir.str(), &idle);
    assert(full && !full->incomplete());
    assert(full->files().size() == 6);
    std::cout << "test_cancellation passed.\n";
}

void test_missing_root_fails() {
    std::cout << "Running test_missing_root_fails...\n";
    TempDir dir("engine_missing");
    Config cfg = fqcheck::test::quietConfig();
    auto engine = makeEngine(cfg, dir.str());

    auto report = engine.run(dir.file("absent"));
    assert(!report);
    std::error_code ec = llvm::errorToErrorCode(report.takeError());
    assert(ec == std::errc::no_such_file_or_directory);
    std::cout << "test_missing_root_fails passed.\n";
}

void test_explicit_files() {
    std::cout << "Running test_explicit_files...\n";
    TempDir dir("engine_files");
    populate(dir);
    Config cfg = fqcheck::test::quietConfig();
    auto engine = makeEngine(cfg, dir.str());

    auto report = engine.runFiles({"src/main.txt", "missing.txt", "src/copy.txt"},
                                  dir.str());
    assert(report);
    assert(report->files().size() == 2);
    assert(report->discoveryFindings().size() == 1);
    assert(report->find("src/copy.txt")->findings.size() == 1);  // mixed endings
    assert(report->find("src/main.txt")->findings.size() == 2);  // + duplicate
    std::cout << "test_explicit_files passed.\n";
}

void test_sample_tree() {
    std::cout << "Running test_sample_tree...\n";
    Config cfg = fqcheck::test::quietConfig();
    cfg.workers = 3;
    auto engine = makeEngine(cfg, FQCHECK_SAMPLES_DIR);

    auto report = engine.run(FQCHECK_SAMPLES_DIR);
    assert(report);
    const auto &files = report->files();
    assert(files.size() == 7);
    assert(files.front().relativePath == "Bad+Name.txt");
    assert(files.back().relativePath == "trailing.md");

    assert(report->find("clean.txt")->findings.empty());
    assert(report->find("copy_of_clean.txt")->findings[0].ruleID == "FQ030");
    assert(report->find("crlf_mixed.txt")->findings[0].location->line == 2);
    assert(report->find("latin1.txt")->status == FileStatus::Fail);
    assert(report->find("nested/deeper/notes.txt")->findings.empty());

    assert(report->severityCount(Severity::Critical) == 1);
    assert(report->severityCount(Severity::Medium) == 2);
    assert(report->severityCount(Severity::Informational) == 2);
    assert(report->statusCount(FileStatus::Fail) == 1);
    assert(report->extensionCounts().at(".txt") == 6);
    assert(report->aggregateScore() == 648.0 / 7.0);
    std::cout << "test_sample_tree passed.\n";
}

int main() {
    test_duplicate_pair_scenario();
    test_idempotent_runs();
    test_cache_follows_content();
    test_shared_cache_across_roots();
    test_non_utf8_file_name_is_cached();
    test_cancellation();
    test_missing_root_fails();
    test_explicit_files();
    test_sample_tree();
    std::cout << "All engine tests passed.\n";
    return 0;
}
