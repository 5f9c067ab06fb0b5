#include "fqcheck/core/Config.h"

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/YAMLParser.h>
#include <llvm/Support/YAMLTraits.h>
#include <llvm/Support/raw_ostream.h>

#include <algorithm>

// YAML mapping for Config via llvm::yaml.

namespace llvm {
namespace yaml {

template <>
struct ScalarEnumerationTraits<fqcheck::Severity> {
    static void enumeration(IO &io, fqcheck::Severity &sev) {
        io.enumCase(sev, "Informational", fqcheck::Severity::Informational);
        io.enumCase(sev, "Medium",        fqcheck::Severity::Medium);
        io.enumCase(sev, "High",          fqcheck::Severity::High);
        io.enumCase(sev, "Critical",      fqcheck::Severity::Critical);
    }
};

template <>
struct ScalarEnumerationTraits<fqcheck::AggregateMode> {
    static void enumeration(IO &io, fqcheck::AggregateMode &mode) {
        io.enumCase(mode, "mean",         fqcheck::AggregateMode::Mean);
        io.enumCase(mode, "min",          fqcheck::AggregateMode::Minimum);
        io.enumCase(mode, "sizeWeighted", fqcheck::AggregateMode::SizeWeighted);
    }
};

template <>
struct MappingTraits<fqcheck::ScoringConfig> {
    static void mapping(IO &io, fqcheck::ScoringConfig &s) {
        io.mapOptional("baseline",            s.baseline);
        io.mapOptional("informationalWeight", s.informationalWeight);
        io.mapOptional("mediumWeight",        s.mediumWeight);
        io.mapOptional("highWeight",          s.highWeight);
        io.mapOptional("criticalWeight",      s.criticalWeight);
        io.mapOptional("passScore",           s.passScore);
        io.mapOptional("aggregate",           s.aggregate);
    }
};

template <>
struct MappingTraits<fqcheck::FileSizeRuleConfig> {
    static void mapping(IO &io, fqcheck::FileSizeRuleConfig &r) {
        io.mapOptional("enabled",          r.enabled);
        io.mapOptional("maxFileSizeBytes", r.maxFileSizeBytes);
        io.mapOptional("extensions",       r.extensions);
    }
};

template <>
struct MappingTraits<fqcheck::EncodingRuleConfig> {
    static void mapping(IO &io, fqcheck::EncodingRuleConfig &r) {
        io.mapOptional("enabled",          r.enabled);
        io.mapOptional("expectedEncoding", r.expectedEncoding);
        io.mapOptional("extensions",       r.extensions);
    }
};

template <>
struct MappingTraits<fqcheck::LineEndingRuleConfig> {
    static void mapping(IO &io, fqcheck::LineEndingRuleConfig &r) {
        io.mapOptional("enabled",                 r.enabled);
        io.mapOptional("allowedLineEndings",      r.allowedLineEndings);
        io.mapOptional("checkTrailingWhitespace", r.checkTrailingWhitespace);
        io.mapOptional("requireFinalNewline",     r.requireFinalNewline);
        io.mapOptional("maxFindingsPerFile",      r.maxFindingsPerFile);
        io.mapOptional("extensions",              r.extensions);
    }
};

template <>
struct MappingTraits<fqcheck::DuplicationConfig> {
    static void mapping(IO &io, fqcheck::DuplicationConfig &r) {
        io.mapOptional("enabled",             r.enabled);
        io.mapOptional("normalizeWhitespace", r.normalizeWhitespace);
        io.mapOptional("minSizeBytes",        r.minSizeBytes);
    }
};

template <>
struct MappingTraits<fqcheck::NamingRuleConfig> {
    static void mapping(IO &io, fqcheck::NamingRuleConfig &r) {
        io.mapOptional("enabled",              r.enabled);
        io.mapOptional("namingPattern",        r.namingPattern);
        io.mapOptional("disallowedCharacters", r.disallowedCharacters);
        io.mapOptional("checkDirectories",     r.checkDirectories);
        io.mapOptional("extensions",           r.extensions);
    }
};

template <>
struct MappingTraits<fqcheck::RulesConfig> {
    static void mapping(IO &io, fqcheck::RulesConfig &r) {
        io.mapOptional("fileSize",    r.fileSize);
        io.mapOptional("encoding",    r.encoding);
        io.mapOptional("lineEndings", r.lineEndings);
        io.mapOptional("duplication", r.duplication);
        io.mapOptional("naming",      r.naming);
    }
};

template <>
struct MappingTraits<fqcheck::Config> {
    static void mapping(IO &io, fqcheck::Config &cfg) {
        io.mapOptional("include",        cfg.includePatterns);
        io.mapOptional("exclude",        cfg.excludePatterns);
        io.mapOptional("maxDepth",       cfg.maxDepth);
        io.mapOptional("followSymlinks", cfg.followSymlinks);
        io.mapOptional("workers",        cfg.workers);
        io.mapOptional("cacheEnabled",   cfg.cacheEnabled);
        io.mapOptional("cacheDir",       cfg.cacheDir);
        io.mapOptional("minSeverity",    cfg.minSeverity);
        io.mapOptional("format",         cfg.outputFormat);
        io.mapOptional("outputFile",     cfg.outputFile);
        io.mapOptional("disabledRules",  cfg.disabledRules);
        io.mapOptional("scoring",        cfg.scoring);
        io.mapOptional("rules",          cfg.rules);
    }
};

} // namespace yaml
} // namespace llvm

namespace fqcheck {

double ScoringConfig::weightOf(Severity s) const {
    switch (s) {
        case Severity::Informational: return informationalWeight;
        case Severity::Medium:        return mediumWeight;
        case Severity::High:          return highWeight;
        case Severity::Critical:      return criticalWeight;
    }
    return 0.0;
}

bool Config::isRuleDisabled(const std::string &id) const {
    return std::find(disabledRules.begin(), disabledRules.end(), id) !=
           disabledRules.end();
}

std::string Config::cacheDirFor(const std::string &root) const {
    llvm::SmallString<256> dir(cacheDir);
    if (llvm::sys::path::is_relative(dir)) {
        dir = root;
        llvm::sys::path::append(dir, cacheDir);
    }
    llvm::sys::path::remove_dots(dir, /*remove_dot_dot=*/true);
    return std::string(dir);
}

Config Config::defaults() {
    return Config{};
}

Config Config::loadFromFile(const std::string &path) {
    auto bufOrErr = llvm::MemoryBuffer::getFile(path);
    if (!bufOrErr) {
        llvm::errs() << "fqcheck: warning: cannot open config '"
                     << path << "': " << bufOrErr.getError().message()
                     << ", using defaults\n";
        return defaults();
    }

    Config cfg = defaults();
    llvm::yaml::Input yin(bufOrErr.get()->getBuffer());
    yin >> cfg;

    if (yin.error()) {
        llvm::errs() << "fqcheck: warning: config parse error in '"
                     << path << "', using defaults\n";
        return defaults();
    }

    return cfg;
}

} // namespace fqcheck
