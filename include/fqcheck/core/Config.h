#pragma once

#include "fqcheck/core/Severity.h"

#include <cstdint>
#include <string>
#include <vector>

namespace fqcheck {

enum class AggregateMode : uint8_t {
    Mean,         // arithmetic mean of per-file scores
    Minimum,      // worst file decides
    SizeWeighted, // mean weighted by file size in bytes
};

struct ScoringConfig {
    double baseline            = 100.0;
    double informationalWeight = 1.0;
    double mediumWeight        = 5.0;
    double highWeight          = 15.0;
    double criticalWeight      = 40.0;
    double passScore           = 70.0;
    AggregateMode aggregate    = AggregateMode::Mean;

    double weightOf(Severity s) const;
};

struct FileSizeRuleConfig {
    bool     enabled          = true;
    uint64_t maxFileSizeBytes = 1024 * 1024;
    std::vector<std::string> extensions;
};

struct EncodingRuleConfig {
    bool        enabled          = true;
    std::string expectedEncoding = "utf-8"; // utf-8 | ascii
    std::vector<std::string> extensions;
};

struct LineEndingRuleConfig {
    bool     enabled                 = true;
    std::vector<std::string> allowedLineEndings; // lf | crlf | cr; empty = any, but consistent
    bool     checkTrailingWhitespace = true;
    bool     requireFinalNewline     = false;
    unsigned maxFindingsPerFile      = 20;
    std::vector<std::string> extensions;
};

struct DuplicationConfig {
    bool     enabled             = true;
    bool     normalizeWhitespace = false;
    uint64_t minSizeBytes        = 1; // empty files are never duplicates
};

struct NamingRuleConfig {
    bool        enabled              = true;
    std::string namingPattern        = "^[A-Za-z0-9._-]+$";
    std::string disallowedCharacters;
    bool        checkDirectories     = false;
    std::vector<std::string> extensions;
};

struct RulesConfig {
    FileSizeRuleConfig   fileSize;
    EncodingRuleConfig   encoding;
    LineEndingRuleConfig lineEndings;
    DuplicationConfig    duplication;
    NamingRuleConfig     naming;
};

struct Config {
    // Discovery (fnmatch-style globs against root-relative path or base name)
    std::vector<std::string> includePatterns;
    std::vector<std::string> excludePatterns = {".git", ".svn", ".hg"};
    unsigned maxDepth        = 64;
    bool     followSymlinks  = false;

    // Worker pool; 0 = hardware concurrency
    unsigned workers         = 0;

    // Result cache, relative paths resolve against the run root
    bool        cacheEnabled = true;
    std::string cacheDir     = ".fqcheck-cache";

    // Output
    Severity    minSeverity  = Severity::Informational;
    std::string outputFormat = "cli";
    std::string outputFile;             // empty = stdout

    // Rule enable/disable by ID, applied on top of per-rule 'enabled'
    std::vector<std::string> disabledRules;

    ScoringConfig scoring;
    RulesConfig   rules;

    bool isRuleDisabled(const std::string &id) const;

    // Absolute cache directory for a run rooted at `root`.
    std::string cacheDirFor(const std::string &root) const;

    static Config loadFromFile(const std::string &path);
    static Config defaults();
};

} // namespace fqcheck
