#pragma once

#include <cstdint>
#include <string>

namespace fqcheck {

struct CacheStats {
    uint64_t hits          = 0;
    uint64_t misses        = 0;
    uint64_t corrupt       = 0;
    uint64_t writeFailures = 0;
};

// Provenance of one run. Kept outside RunReport so that the report stays
// identical across cached and uncached runs.
struct ExecutionMetadata {
    std::string toolVersion;
    std::string configPath;
    std::string root;
    std::string ruleSetVersion;
    uint64_t timestampEpochSec = 0;
    unsigned workers           = 0;
    uint64_t elapsedMs         = 0;
    bool cacheEnabled          = false;
    CacheStats cache;
};

} // namespace fqcheck
