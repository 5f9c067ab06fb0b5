#include "fqcheck/core/Errors.h"

#include <llvm/Support/raw_ostream.h>

namespace fqcheck {

char AccessError::ID = 0;
char RuleEvaluationError::ID = 0;

AccessError::AccessError(std::string path, std::error_code ec)
    : path_(std::move(path)), ec_(ec) {}

void AccessError::log(llvm::raw_ostream &os) const {
    os << "cannot access '" << path_ << "': " << ec_.message();
}

void RuleEvaluationError::log(llvm::raw_ostream &os) const {
    os << message_;
}

} // namespace fqcheck
