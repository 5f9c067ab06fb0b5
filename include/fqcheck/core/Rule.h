#pragma once

#include "fqcheck/core/Finding.h"
#include "fqcheck/core/Severity.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace fqcheck {

// Everything a rule may look at. Content is borrowed for the duration of
// one evaluate() call.
struct FileInput {
    std::string     path;
    std::string     relativePath;
    llvm::StringRef content;
    uint64_t        sizeBytes = 0;
    bool            isBinary  = false;

    // Lowercased extension including the dot, or empty.
    std::string extension() const;
};

// Which files a rule runs on.
struct RuleApplicability {
    std::vector<std::string> extensions; // empty = any; ".txt" or "txt"
    bool textOnly = false;

    bool matches(const FileInput &file) const;
    std::string describe() const;
};

class Rule {
public:
    virtual ~Rule() = default;

    virtual std::string_view getID() const = 0;
    virtual std::string_view getTitle() const = 0;
    virtual Severity getBaseSeverity() const = 0;

    // Canonical rendering of the rule's configuration. Folded into the
    // rule-set version, so two rules with different thresholds never share
    // cache entries.
    virtual std::string describeConfig() const = 0;

    virtual bool appliesTo(const FileInput &file) const = 0;

    // Pure function of the input. Appends findings to `out`; returns an
    // error instead of throwing when the rule cannot evaluate the file.
    virtual llvm::Error evaluate(const FileInput &file,
                                 std::vector<Finding> &out) const = 0;

protected:
    Finding makeFinding(Severity sev, std::string message) const;
    Finding makeFinding(Severity sev, std::string message,
                        unsigned line, uint64_t byteOffset) const;
};

} // namespace fqcheck
