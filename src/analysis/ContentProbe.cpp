#include "fqcheck/analysis/ContentProbe.h"

#include <algorithm>

namespace fqcheck {

bool looksBinary(llvm::StringRef content) {
    llvm::StringRef head = content.take_front(kBinaryProbeBytes);
    return head.find('\0') != llvm::StringRef::npos;
}

std::string_view lineEndingName(LineEnding e) {
    switch (e) {
        case LineEnding::None: return "none";
        case LineEnding::LF:   return "lf";
        case LineEnding::CRLF: return "crlf";
        case LineEnding::CR:   return "cr";
    }
    return "none";
}

bool LineCursor::next(LineView &line) {
    if (pos_ >= content_.size())
        return false;

    size_t start = pos_;
    size_t brk = content_.find_first_of("\r\n", start);

    line.number = ++line_;
    line.offset = start;

    if (brk == llvm::StringRef::npos) {
        line.text   = content_.slice(start, content_.size());
        line.ending = LineEnding::None;
        pos_ = content_.size();
        return true;
    }

    line.text = content_.slice(start, brk);
    if (content_[brk] == '\n') {
        line.ending = LineEnding::LF;
        pos_ = brk + 1;
    } else if (brk + 1 < content_.size() && content_[brk + 1] == '\n') {
        line.ending = LineEnding::CRLF;
        pos_ = brk + 2;
    } else {
        line.ending = LineEnding::CR;
        pos_ = brk + 1;
    }
    return true;
}

unsigned lineNumberAt(llvm::StringRef content, uint64_t offset) {
    size_t end = std::min<size_t>(offset, content.size());
    LineCursor cursor(content.take_front(end));
    LineView line;
    unsigned last = 1;
    while (cursor.next(line))
        last = line.number;
    // An offset right after a terminator starts a new line.
    if (end > 0 && (content[end - 1] == '\n' ||
                    (content[end - 1] == '\r' &&
                     (end >= content.size() || content[end] != '\n'))))
        ++last;
    return last;
}

} // namespace fqcheck
