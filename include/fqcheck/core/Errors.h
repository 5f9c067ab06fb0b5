#pragma once

#include <llvm/Support/Error.h>

#include <string>
#include <system_error>

namespace fqcheck {

// The run root (or an explicit input list as a whole) cannot be read.
// This is the only error that aborts a run.
class AccessError : public llvm::ErrorInfo<AccessError> {
public:
    static char ID;

    AccessError(std::string path, std::error_code ec);

    const std::string &path() const { return path_; }

    void log(llvm::raw_ostream &os) const override;
    std::error_code convertToErrorCode() const override { return ec_; }

private:
    std::string path_;
    std::error_code ec_;
};

// A rule could not evaluate a file. Contained by the Analyzer.
class RuleEvaluationError : public llvm::ErrorInfo<RuleEvaluationError> {
public:
    static char ID;

    explicit RuleEvaluationError(std::string message)
        : message_(std::move(message)) {}

    void log(llvm::raw_ostream &os) const override;
    std::error_code convertToErrorCode() const override {
        return llvm::inconvertibleErrorCode();
    }

private:
    std::string message_;
};

} // namespace fqcheck
