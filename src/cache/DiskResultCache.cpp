#include "fqcheck/cache/ResultCache.h"
#include "fqcheck/core/Config.h"
#include "fqcheck/core/Fingerprint.h"
#include "fqcheck/core/Version.h"

#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/StringExtras.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/JSON.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/raw_ostream.h>

namespace fqcheck {

namespace {

struct DecodedEntry {
    std::string path;
    std::string relativePath;
    std::string fingerprint;
    std::string ruleSetVersion;
    FileResult  result;
};

std::optional<FileStatus> statusFromString(llvm::StringRef s) {
    for (FileStatus st : {FileStatus::Pass, FileStatus::Fail, FileStatus::NotGraded})
        if (s == llvm::StringRef(fileStatusName(st)))
            return st;
    return std::nullopt;
}

// File names are arbitrary bytes but JSON strings must be UTF-8. Text that
// is not valid UTF-8 goes into a "<key>Hex" field instead.
void putText(llvm::json::Object &o, llvm::StringRef key, llvm::StringRef text) {
    if (llvm::json::isUTF8(text))
        o[key.str()] = text.str();
    else
        o[(key + "Hex").str()] = llvm::toHex(text, /*LowerCase=*/true);
}

std::optional<std::string> getText(const llvm::json::Object &o,
                                   llvm::StringRef key) {
    if (auto plain = o.getString(key))
        return plain->str();
    if (auto hex = o.getString((key + "Hex").str())) {
        std::string bytes;
        if (llvm::tryGetFromHex(*hex, bytes))
            return bytes;
    }
    return std::nullopt;
}

llvm::json::Value encodeFinding(const Finding &f) {
    llvm::json::Object o{
        {"severity", std::string(severityToString(f.severity))},
    };
    putText(o, "ruleID", f.ruleID);
    putText(o, "title", f.title);
    putText(o, "message", f.message);
    if (f.location) {
        o["line"]       = static_cast<int64_t>(f.location->line);
        o["byteOffset"] = static_cast<int64_t>(f.location->byteOffset);
    }
    return llvm::json::Value(std::move(o));
}

std::optional<Finding> decodeFinding(const llvm::json::Value &v) {
    const auto *o = v.getAsObject();
    if (!o)
        return std::nullopt;

    auto ruleID   = getText(*o, "ruleID");
    auto title    = getText(*o, "title");
    auto severity = o->getString("severity");
    auto message  = getText(*o, "message");
    if (!ruleID || !title || !severity || !message)
        return std::nullopt;

    auto sev = severityFromString(std::string_view(severity->data(), severity->size()));
    if (!sev)
        return std::nullopt;

    Finding f;
    f.ruleID   = std::move(*ruleID);
    f.title    = std::move(*title);
    f.severity = *sev;
    f.message  = std::move(*message);

    auto line   = o->getInteger("line");
    auto offset = o->getInteger("byteOffset");
    if (line && offset) {
        if (*line < 0 || *offset < 0)
            return std::nullopt;
        f.location = FindingLocation{static_cast<unsigned>(*line),
                                     static_cast<uint64_t>(*offset)};
    }
    return f;
}

std::optional<DecodedEntry> parseEntry(llvm::StringRef text) {
    auto parsed = llvm::json::parse(text);
    if (!parsed) {
        llvm::consumeError(parsed.takeError());
        return std::nullopt;
    }

    const auto *root = parsed->getAsObject();
    if (!root)
        return std::nullopt;

    auto schema = root->getInteger("schema");
    if (!schema || *schema != static_cast<int64_t>(kCacheSchemaVersion))
        return std::nullopt;

    auto path         = getText(*root, "path");
    auto relativePath = getText(*root, "relativePath");
    auto fingerprint  = root->getString("fingerprint");
    auto version      = root->getString("ruleSetVersion");
    const auto *res   = root->getObject("result");
    if (!path || !relativePath || !fingerprint || !version || !res)
        return std::nullopt;

    auto sizeBytes    = res->getInteger("sizeBytes");
    auto normalized   = res->getString("normalizedFingerprint");
    auto rulesApplied = res->getInteger("rulesApplied");
    auto score        = res->getNumber("score");
    auto status       = res->getString("status");
    const auto *findings = res->getArray("findings");
    if (!sizeBytes || !normalized || !rulesApplied ||
        !score || !status || !findings || *sizeBytes < 0 || *rulesApplied < 0)
        return std::nullopt;

    auto st = statusFromString(*status);
    if (!st)
        return std::nullopt;

    DecodedEntry entry;
    entry.path           = std::move(*path);
    entry.relativePath   = std::move(*relativePath);
    entry.fingerprint    = fingerprint->str();
    entry.ruleSetVersion = version->str();

    FileResult &r = entry.result;
    r.path                  = entry.path;
    r.relativePath          = entry.relativePath;
    r.sizeBytes             = static_cast<uint64_t>(*sizeBytes);
    r.fingerprint           = entry.fingerprint;
    r.normalizedFingerprint = normalized->str();
    r.rulesApplied          = static_cast<unsigned>(*rulesApplied);
    r.score                 = *score;
    r.status                = *st;

    for (const auto &fv : *findings) {
        auto f = decodeFinding(fv);
        if (!f)
            return std::nullopt;
        r.findings.push_back(std::move(*f));
    }
    return entry;
}

} // anonymous namespace

std::string encodeCacheEntry(llvm::StringRef path, llvm::StringRef relativePath,
                             llvm::StringRef fingerprint,
                             llvm::StringRef ruleSetVersion,
                             const FileResult &result) {
    llvm::json::Array findings;
    for (const auto &f : result.findings)
        findings.push_back(encodeFinding(f));

    llvm::json::Object res{
        {"sizeBytes",             static_cast<int64_t>(result.sizeBytes)},
        {"normalizedFingerprint", result.normalizedFingerprint},
        {"rulesApplied",          static_cast<int64_t>(result.rulesApplied)},
        {"score",                 result.score},
        {"status",                std::string(fileStatusName(result.status))},
        {"findings",              std::move(findings)},
    };

    llvm::json::Object root{
        {"schema",         static_cast<int64_t>(kCacheSchemaVersion)},
        {"fingerprint",    fingerprint.str()},
        {"ruleSetVersion", ruleSetVersion.str()},
        {"result",         std::move(res)},
    };
    putText(root, "path", path);
    putText(root, "relativePath", relativePath);

    std::string out;
    llvm::raw_string_ostream os(out);
    os << llvm::json::Value(std::move(root));
    os.flush();
    return out;
}

std::optional<FileResult> decodeCacheEntry(llvm::StringRef json,
                                           llvm::StringRef path,
                                           llvm::StringRef relativePath,
                                           llvm::StringRef fingerprint,
                                           llvm::StringRef ruleSetVersion) {
    auto entry = parseEntry(json);
    if (!entry || entry->path != path || entry->relativePath != relativePath ||
        entry->fingerprint != fingerprint ||
        entry->ruleSetVersion != ruleSetVersion)
        return std::nullopt;
    return std::move(entry->result);
}

DiskResultCache::DiskResultCache(std::string directory)
    : directory_(std::move(directory)) {
    if (auto ec = llvm::sys::fs::create_directories(directory_))
        warn("cannot create cache directory '" + directory_ + "': " +
             ec.message());
}

std::string DiskResultCache::entryPath(llvm::StringRef path) const {
    FingerprintBuilder key;
    key.add(path);
    llvm::SmallString<256> p(directory_);
    llvm::sys::path::append(p, key.finish() + ".json");
    return std::string(p);
}

std::optional<FileResult> DiskResultCache::get(llvm::StringRef path,
                                               llvm::StringRef relativePath,
                                               llvm::StringRef fingerprint,
                                               llvm::StringRef ruleSetVersion) {
    std::string file = entryPath(path);
    auto bufOrErr = llvm::MemoryBuffer::getFile(file, /*IsText=*/false,
                                                /*RequiresNullTerminator=*/false);
    if (!bufOrErr) {
        if (bufOrErr.getError() != std::errc::no_such_file_or_directory) {
            ++corrupt_;
            warn("cannot read cache entry '" + file + "': " +
                 bufOrErr.getError().message());
        }
        ++misses_;
        return std::nullopt;
    }

    auto entry = parseEntry((*bufOrErr)->getBuffer());
    if (!entry) {
        ++corrupt_;
        ++misses_;
        warn("ignoring corrupt cache entry '" + file + "'");
        return std::nullopt;
    }

    // A stale entry (other content, other root, other rules) is a plain
    // miss; the put that follows replaces it.
    if (entry->path != path || entry->relativePath != relativePath ||
        entry->fingerprint != fingerprint ||
        entry->ruleSetVersion != ruleSetVersion) {
        ++misses_;
        return std::nullopt;
    }

    ++hits_;
    return std::move(entry->result);
}

void DiskResultCache::put(llvm::StringRef path, llvm::StringRef relativePath,
                          llvm::StringRef fingerprint,
                          llvm::StringRef ruleSetVersion,
                          const FileResult &result) {
    std::string target = entryPath(path);
    std::string text = encodeCacheEntry(path, relativePath, fingerprint,
                                        ruleSetVersion, result);

    llvm::SmallString<256> model(directory_);
    llvm::sys::path::append(model, ".entry-%%%%%%%%%%%%.tmp");

    int fd = -1;
    llvm::SmallString<256> tmpPath;
    if (auto ec = llvm::sys::fs::createUniqueFile(model, fd, tmpPath)) {
        ++writeFailures_;
        warn("cannot create cache temp file in '" + directory_ + "': " +
             ec.message());
        return;
    }

    {
        llvm::raw_fd_ostream os(fd, /*shouldClose=*/true);
        os << text;
        os.close();
        if (os.has_error()) {
            std::error_code ec = os.error();
            os.clear_error();
            ++writeFailures_;
            warn("cannot write cache entry '" + target + "': " + ec.message());
            discardTemp(tmpPath);
            return;
        }
    }

    if (auto ec = llvm::sys::fs::rename(tmpPath, target)) {
        ++writeFailures_;
        warn("cannot replace cache entry '" + target + "': " + ec.message());
        discardTemp(tmpPath);
    }
}

void DiskResultCache::discardTemp(llvm::StringRef tmpPath) {
    if (auto ec = llvm::sys::fs::remove(tmpPath))
        warn("cannot remove cache temp file '" + tmpPath + "': " + ec.message());
}

void DiskResultCache::warn(const llvm::Twine &message) {
    std::lock_guard<std::mutex> lock(logMutex_);
    llvm::errs() << "fqcheck: warning: " << message << "\n";
}

std::unique_ptr<ResultCache> makeResultCache(const Config &cfg,
                                             llvm::StringRef root) {
    if (!cfg.cacheEnabled)
        return nullptr;

    return std::make_unique<DiskResultCache>(cfg.cacheDirFor(root.str()));
}

} // namespace fqcheck
