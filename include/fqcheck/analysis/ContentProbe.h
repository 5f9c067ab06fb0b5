#pragma once

#include <llvm/ADT/StringRef.h>

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace fqcheck {

// Bytes inspected when guessing whether content is binary.
inline constexpr size_t kBinaryProbeBytes = 8000;

// A NUL byte within the first kBinaryProbeBytes marks content as binary.
bool looksBinary(llvm::StringRef content);

enum class LineEnding : uint8_t {
    None, // last line without terminator
    LF,
    CRLF,
    CR,
};

std::string_view lineEndingName(LineEnding e);

struct LineView {
    llvm::StringRef text;       // without terminator
    LineEnding      ending = LineEnding::None;
    unsigned        number = 0; // 1-based
    uint64_t        offset = 0; // byte offset of first character
};

// Iterates lines, recognizing "\n", "\r\n" and lone "\r" terminators.
class LineCursor {
public:
    explicit LineCursor(llvm::StringRef content) : content_(content) {}

    bool next(LineView &line);

private:
    llvm::StringRef content_;
    size_t   pos_  = 0;
    unsigned line_ = 0;
};

// 1-based line containing `offset`.
unsigned lineNumberAt(llvm::StringRef content, uint64_t offset);

} // namespace fqcheck
