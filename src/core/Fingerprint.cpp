#include "fqcheck/core/Fingerprint.h"

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/MD5.h>

#include <cctype>
#include <cstdio>

namespace fqcheck {

namespace {

std::string md5Hex(llvm::MD5 &hasher) {
    llvm::MD5::MD5Result result;
    hasher.final(result);
    llvm::SmallString<32> hex;
    llvm::MD5::stringifyResult(result, hex);
    return std::string(hex);
}

} // anonymous namespace

std::string fingerprintBytes(llvm::StringRef bytes) {
    llvm::MD5 hasher;
    hasher.update(bytes);
    return md5Hex(hasher);
}

std::string normalizedFingerprint(llvm::StringRef bytes) {
    llvm::MD5 hasher;
    // Feed runs of non-whitespace; avoids copying the whole file.
    size_t start = 0;
    for (size_t i = 0; i <= bytes.size(); ++i) {
        bool boundary = i == bytes.size() ||
                        std::isspace(static_cast<unsigned char>(bytes[i]));
        if (!boundary)
            continue;
        if (i > start)
            hasher.update(bytes.slice(start, i));
        start = i + 1;
    }
    return md5Hex(hasher);
}

FingerprintBuilder &FingerprintBuilder::add(llvm::StringRef field) {
    buffer_ += std::to_string(field.size());
    buffer_ += ':';
    buffer_.append(field.data(), field.size());
    buffer_ += ';';
    return *this;
}

FingerprintBuilder &FingerprintBuilder::addUnsigned(uint64_t value) {
    return add(llvm::StringRef(std::to_string(value)));
}

FingerprintBuilder &FingerprintBuilder::addReal(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.17g", value);
    return add(llvm::StringRef(buf));
}

std::string FingerprintBuilder::finish() {
    llvm::MD5 hasher;
    hasher.update(buffer_);
    buffer_.clear();
    return md5Hex(hasher);
}

} // namespace fqcheck
