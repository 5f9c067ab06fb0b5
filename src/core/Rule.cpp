#include "fqcheck/core/Rule.h"

#include <llvm/ADT/StringExtras.h>
#include <llvm/Support/Path.h>

namespace fqcheck {

std::string FileInput::extension() const {
    return llvm::sys::path::extension(relativePath).lower();
}

bool RuleApplicability::matches(const FileInput &file) const {
    if (textOnly && file.isBinary)
        return false;
    if (extensions.empty())
        return true;

    std::string dotted = file.extension();
    if (dotted.empty())
        return false;
    llvm::StringRef ext = llvm::StringRef(dotted).drop_front();
    for (const auto &want : extensions) {
        llvm::StringRef w(want);
        if (w.startswith("."))
            w = w.drop_front();
        if (!w.empty() && w.equals_insensitive(ext))
            return true;
    }
    return false;
}

std::string RuleApplicability::describe() const {
    std::string out = textOnly ? "text" : "any";
    out += "|";
    for (const auto &e : extensions) {
        out += e;
        out += ",";
    }
    return out;
}

Finding Rule::makeFinding(Severity sev, std::string message) const {
    Finding f;
    f.ruleID   = std::string(getID());
    f.title    = std::string(getTitle());
    f.severity = sev;
    f.message  = std::move(message);
    return f;
}

Finding Rule::makeFinding(Severity sev, std::string message,
                          unsigned line, uint64_t byteOffset) const {
    Finding f = makeFinding(sev, std::move(message));
    f.location = FindingLocation{line, byteOffset};
    return f;
}

} // namespace fqcheck
