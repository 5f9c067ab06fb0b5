#include "fqcheck/cache/ResultCache.h"
#include "fqcheck/core/Cancellation.h"
#include "fqcheck/core/Config.h"
#include "fqcheck/core/RuleRegistry.h"
#include "fqcheck/core/Severity.h"
#include "fqcheck/core/Version.h"
#include "fqcheck/discovery/FileDiscoverer.h"
#include "fqcheck/engine/QualityEngine.h"
#include "fqcheck/output/OutputFormatter.h"

#include <llvm/Support/CommandLine.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/raw_ostream.h>

#include <csignal>
#include <memory>
#include <optional>
#include <string>
#include <vector>

static llvm::cl::OptionCategory FqcheckCat("fqcheck options");

static llvm::cl::list<std::string> Inputs(
    llvm::cl::Positional,
    llvm::cl::desc("[<root directory> | <file>...]"),
    llvm::cl::cat(FqcheckCat));

static llvm::cl::opt<std::string> ConfigPath(
    "config",
    llvm::cl::desc("Path to fqcheck.config.yaml"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(FqcheckCat));

static llvm::cl::opt<std::string> OutputFormat(
    "format",
    llvm::cl::desc("Output format (cli|json|sarif)"),
    llvm::cl::cat(FqcheckCat));

static llvm::cl::opt<std::string> OutputFile(
    "output",
    llvm::cl::desc("Write output to file instead of stdout"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(FqcheckCat));

static llvm::cl::opt<std::string> MinSev(
    "min-severity",
    llvm::cl::desc("Minimum severity to report (Informational|Medium|High|Critical)"),
    llvm::cl::cat(FqcheckCat));

static llvm::cl::opt<std::string> StatusFilter(
    "status",
    llvm::cl::desc("Only report files with this status (pass|fail|na)"),
    llvm::cl::cat(FqcheckCat));

static llvm::cl::opt<unsigned> Worst(
    "worst",
    llvm::cl::desc("Only report the N lowest-scoring files"),
    llvm::cl::value_desc("N"),
    llvm::cl::init(0),
    llvm::cl::cat(FqcheckCat));

static llvm::cl::opt<unsigned> Jobs(
    "jobs",
    llvm::cl::desc("Worker threads (0 = hardware concurrency)"),
    llvm::cl::cat(FqcheckCat));

static llvm::cl::opt<bool> NoCache(
    "no-cache",
    llvm::cl::desc("Disable the result cache"),
    llvm::cl::cat(FqcheckCat));

static llvm::cl::opt<std::string> CacheDir(
    "cache-dir",
    llvm::cl::desc("Result cache directory (relative paths resolve against the root)"),
    llvm::cl::value_desc("dir"),
    llvm::cl::cat(FqcheckCat));

static llvm::cl::opt<unsigned> MaxDepth(
    "max-depth",
    llvm::cl::desc("Maximum directory depth below the root"),
    llvm::cl::cat(FqcheckCat));

static llvm::cl::list<std::string> Include(
    "include",
    llvm::cl::desc("Only analyze paths matching this glob (repeatable)"),
    llvm::cl::value_desc("glob"),
    llvm::cl::cat(FqcheckCat));

static llvm::cl::list<std::string> Exclude(
    "exclude",
    llvm::cl::desc("Skip paths matching this glob (repeatable)"),
    llvm::cl::value_desc("glob"),
    llvm::cl::cat(FqcheckCat));

static llvm::cl::opt<bool> ListRules(
    "list-rules",
    llvm::cl::desc("List available rules and exit"),
    llvm::cl::cat(FqcheckCat));

static fqcheck::CancellationToken g_cancel;

extern "C" void handleInterrupt(int) {
    g_cancel.requestStop();
}

static std::optional<fqcheck::FileStatus> parseStatus(llvm::StringRef s) {
    if (s == "pass") return fqcheck::FileStatus::Pass;
    if (s == "fail") return fqcheck::FileStatus::Fail;
    if (s == "na")   return fqcheck::FileStatus::NotGraded;
    return std::nullopt;
}

static void printVersion(llvm::raw_ostream &os) {
    os << "fqcheck " << fqcheck::kToolVersion << "\n";
}

int main(int argc, const char **argv) {
    llvm::cl::SetVersionPrinter(printVersion);
    llvm::cl::HideUnrelatedOptions(FqcheckCat);
    llvm::cl::ParseCommandLineOptions(argc, argv,
        "fqcheck: file quality checker\n");

    // Load config.
    fqcheck::Config cfg = ConfigPath.empty()
        ? fqcheck::Config::defaults()
        : fqcheck::Config::loadFromFile(ConfigPath);

    if (ListRules) {
        auto registry = fqcheck::RuleRegistry::fromConfig(cfg);
        for (const auto &entry : fqcheck::RuleCatalog::instance().entries()) {
            bool active = registry.findByID(entry.id) != nullptr;
            llvm::outs() << entry.id << "  " << entry.title
                         << (active ? "" : "  (disabled)") << "\n";
        }
        llvm::outs() << fqcheck::ruleid::Duplication
                     << "  Duplicate Content (cross-file)"
                     << (cfg.rules.duplication.enabled ? "" : "  (disabled)")
                     << "\n";
        return 0;
    }

    // CLI overrides.
    if (!OutputFormat.empty())
        cfg.outputFormat = OutputFormat;
    if (!OutputFile.empty())
        cfg.outputFile = OutputFile;
    if (!MinSev.empty()) {
        auto sev = fqcheck::severityFromString(MinSev.getValue());
        if (!sev) {
            llvm::errs() << "fqcheck: error: unknown severity '" << MinSev
                         << "'\n";
            return 2;
        }
        cfg.minSeverity = *sev;
    }
    if (Jobs.getNumOccurrences())
        cfg.workers = Jobs;
    if (NoCache)
        cfg.cacheEnabled = false;
    if (!CacheDir.empty())
        cfg.cacheDir = CacheDir;
    if (MaxDepth.getNumOccurrences())
        cfg.maxDepth = MaxDepth;
    if (!Include.empty())
        cfg.includePatterns.assign(Include.begin(), Include.end());
    cfg.excludePatterns.insert(cfg.excludePatterns.end(),
                               Exclude.begin(), Exclude.end());

    fqcheck::RenderOptions render;
    render.minSeverity = cfg.minSeverity;
    render.worst = Worst;
    if (!StatusFilter.empty()) {
        render.status = parseStatus(StatusFilter);
        if (!render.status) {
            llvm::errs() << "fqcheck: error: unknown status '" << StatusFilter
                         << "' (expected pass, fail or na)\n";
            return 2;
        }
    }

    auto formatter = fqcheck::makeOutputFormatter(cfg.outputFormat);
    if (!formatter) {
        llvm::errs() << "fqcheck: error: unknown output format '"
                     << cfg.outputFormat << "'\n";
        return 2;
    }

    llvm::SmallString<256> cwd;
    if (std::error_code ec = llvm::sys::fs::current_path(cwd)) {
        llvm::errs() << "fqcheck: error: cannot determine working directory: "
                     << ec.message() << "\n";
        return 2;
    }

    std::vector<std::string> inputs(Inputs.begin(), Inputs.end());
    if (inputs.empty())
        inputs.push_back(".");
    bool rootMode = inputs.size() == 1;

    // The cache lives under the run root: the root directory, the parent of
    // a single-file root, or the working directory for a file list.
    std::string cacheRoot = std::string(cwd);
    if (rootMode) {
        auto normOrErr = fqcheck::FileDiscoverer::normalizePath(inputs.front(), cwd);
        if (!normOrErr) {
            llvm::logAllUnhandledErrors(normOrErr.takeError(), llvm::errs(),
                                        "fqcheck: error: ");
            return 2;
        }
        cacheRoot = *normOrErr;
        if (!llvm::sys::fs::is_directory(cacheRoot))
            cacheRoot = llvm::sys::path::parent_path(cacheRoot).str();
    }

    auto cache = fqcheck::makeResultCache(cfg, cacheRoot);
    auto registry = fqcheck::RuleRegistry::fromConfig(cfg);
    fqcheck::QualityEngine engine(cfg, std::move(registry), std::move(cache));

    std::signal(SIGINT, handleInterrupt);

    auto reportOrErr = rootMode
        ? engine.run(inputs.front(), &g_cancel)
        : engine.runFiles(inputs, cwd, &g_cancel);

    std::signal(SIGINT, SIG_DFL);

    if (!reportOrErr) {
        llvm::logAllUnhandledErrors(reportOrErr.takeError(), llvm::errs(),
                                    "fqcheck: error: ");
        return 2;
    }
    const fqcheck::RunReport &report = *reportOrErr;

    for (const auto &d : report.discoveryFindings())
        llvm::errs() << "fqcheck: warning: skipped " << d.path << ": "
                     << d.finding.message << "\n";

    fqcheck::ExecutionMetadata execMeta = engine.metadata();
    execMeta.configPath = ConfigPath.getValue();

    std::string output = formatter->format(report, execMeta, render);

    // Emit.
    if (cfg.outputFile.empty()) {
        llvm::outs() << output;
    } else {
        std::error_code EC;
        llvm::raw_fd_ostream file(cfg.outputFile, EC, llvm::sys::fs::OF_Text);
        if (EC) {
            llvm::errs() << "fqcheck: error: cannot open output file '"
                         << cfg.outputFile << "': " << EC.message() << "\n";
            return 2;
        }
        file << output;
    }

    if (report.incomplete()) {
        llvm::errs() << "fqcheck: warning: interrupted after "
                     << report.files().size() << " of "
                     << report.filesDiscovered() << " file(s)\n";
        return 3;
    }
    return report.statusCount(fqcheck::FileStatus::Fail) > 0 ? 1 : 0;
}
