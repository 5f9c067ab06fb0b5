#include "fqcheck/output/OutputFormatter.h"

#include <map>
#include <sstream>

namespace fqcheck {

namespace {

std::string sarifLevel(Severity sev) {
    switch (sev) {
        case Severity::Critical: return "error";
        case Severity::High:     return "error";
        case Severity::Medium:   return "warning";
        default:                 return "note";
    }
}

struct SarifResult {
    const Finding *finding;
    std::string uri;
};

} // anonymous namespace

std::string SARIFOutputFormatter::format(const RunReport &report,
                                         const ExecutionMetadata &meta,
                                         const RenderOptions &options) {
    std::vector<SarifResult> results;
    for (const auto &d : report.discoveryFindings())
        if (d.finding.severity >= options.minSeverity)
            results.push_back({&d.finding, d.path});
    for (const FileResult *r : selectFiles(report, options))
        for (const Finding *f : visibleFindings(*r, options))
            results.push_back({f, r->relativePath});

    // Rule descriptors, ordered by ID.
    std::map<std::string, std::string> rules;
    for (const auto &res : results)
        rules.emplace(res.finding->ruleID, res.finding->title);

    std::ostringstream os;

    os << "{\n";
    os << "  \"$schema\": \"https://raw.githubusercontent.com/oasis-tcs/sarif-spec/main/sarif-2.1/schema/sarif-schema-2.1.0.json\",\n";
    os << "  \"version\": \"2.1.0\",\n";
    os << "  \"runs\": [{\n";

    os << "    \"tool\": {\n";
    os << "      \"driver\": {\n";
    os << "        \"name\": \"fqcheck\",\n";
    os << "        \"version\": \"" << escapeJSON(meta.toolVersion) << "\",\n";
    os << "        \"rules\": [";
    size_t i = 0;
    for (const auto &[id, title] : rules) {
        os << "\n          {\n";
        os << "            \"id\": \"" << escapeJSON(id) << "\",\n";
        os << "            \"shortDescription\": { \"text\": \"" << escapeJSON(title) << "\" }\n";
        os << "          }";
        if (++i < rules.size()) os << ",";
    }
    os << (rules.empty() ? "]\n" : "\n        ]\n");
    os << "      }\n";
    os << "    },\n";

    os << "    \"originalUriBaseIds\": {\n";
    os << "      \"ROOT\": { \"uri\": \"file://" << escapeJSON(report.root()) << "/\" }\n";
    os << "    },\n";

    // Invocations: execution provenance.
    os << "    \"invocations\": [{\n";
    os << "      \"executionSuccessful\": " << (report.incomplete() ? "false" : "true") << ",\n";
    os << "      \"properties\": {\n";
    os << "        \"timestampEpochSec\": " << report.timestamp() << ",\n";
    os << "        \"configPath\": \"" << escapeJSON(meta.configPath) << "\",\n";
    os << "        \"ruleSetVersion\": \"" << escapeJSON(report.ruleSetVersion()) << "\",\n";
    os << "        \"aggregateScore\": " << formatScore(report.aggregateScore()) << ",\n";
    os << "        \"incomplete\": " << (report.incomplete() ? "true" : "false") << "\n";
    os << "      }\n";
    os << "    }],\n";

    os << "    \"results\": [";
    for (size_t k = 0; k < results.size(); ++k) {
        const Finding &f = *results[k].finding;

        os << "\n      {\n";
        os << "        \"ruleId\": \"" << escapeJSON(f.ruleID) << "\",\n";
        os << "        \"level\": \"" << sarifLevel(f.severity) << "\",\n";
        os << "        \"message\": { \"text\": \"" << escapeJSON(f.message) << "\" },\n";

        os << "        \"locations\": [{\n";
        os << "          \"physicalLocation\": {\n";
        os << "            \"artifactLocation\": { \"uri\": \"" << escapeJSON(results[k].uri)
           << "\", \"uriBaseId\": \"ROOT\" }";
        if (f.location) {
            os << ",\n            \"region\": {\n";
            os << "              \"startLine\": " << (f.location->line > 0 ? f.location->line : 1) << ",\n";
            os << "              \"byteOffset\": " << f.location->byteOffset << "\n";
            os << "            }";
        }
        os << "\n          }\n";
        os << "        }],\n";

        os << "        \"properties\": { \"severity\": \"" << severityToString(f.severity) << "\" }\n";
        os << "      }";
        if (k + 1 < results.size()) os << ",";
    }
    os << (results.empty() ? "]\n" : "\n    ]\n");
    os << "  }]\n";
    os << "}\n";

    return os.str();
}

} // namespace fqcheck
