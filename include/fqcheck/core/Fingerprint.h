#pragma once

#include <llvm/ADT/StringRef.h>

#include <cstdint>
#include <string>

namespace fqcheck {

// 32-char lowercase hex MD5 of the bytes.
std::string fingerprintBytes(llvm::StringRef bytes);

// Fingerprint with all ASCII whitespace removed, so files differing only in
// indentation, line endings or trailing blanks collide.
std::string normalizedFingerprint(llvm::StringRef bytes);

// Incremental digest over several fields; each field is length-prefixed so
// ("ab","c") and ("a","bc") differ.
class FingerprintBuilder {
public:
    FingerprintBuilder &add(llvm::StringRef field);
    FingerprintBuilder &addUnsigned(uint64_t value);
    FingerprintBuilder &addReal(double value);
    std::string finish();

private:
    std::string buffer_;
};

} // namespace fqcheck
