#include "fqcheck/core/RuleRegistry.h"
#include "fqcheck/core/Config.h"
#include "fqcheck/core/Fingerprint.h"
#include "fqcheck/core/Version.h"

#include <algorithm>

namespace fqcheck {

RuleCatalog &RuleCatalog::instance() {
    static RuleCatalog catalog;
    return catalog;
}

void RuleCatalog::registerFactory(std::string_view id, std::string_view title,
                                  RuleFactory factory) {
    entries_.push_back({std::string(id), std::string(title), std::move(factory)});
}

std::vector<RuleCatalog::Entry> RuleCatalog::entries() const {
    // Static initialization order across translation units is unspecified;
    // sorting makes the registration order stable.
    std::vector<Entry> sorted = entries_;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Entry &a, const Entry &b) { return a.id < b.id; });
    return sorted;
}

RuleRegistry RuleRegistry::fromConfig(const Config &cfg) {
    std::vector<std::unique_ptr<Rule>> rules;
    for (const auto &entry : RuleCatalog::instance().entries()) {
        if (cfg.isRuleDisabled(entry.id))
            continue;
        if (auto rule = entry.factory(cfg))
            rules.push_back(std::move(rule));
    }
    return RuleRegistry(std::move(rules), cfg);
}

RuleRegistry::RuleRegistry(std::vector<std::unique_ptr<Rule>> rules,
                           const Config &cfg)
    : rules_(std::move(rules)), version_(computeVersion(rules_, cfg)) {}

const Rule *RuleRegistry::findByID(std::string_view id) const {
    auto it = std::find_if(rules_.begin(), rules_.end(),
                           [id](const auto &r) { return r->getID() == id; });
    return (it != rules_.end()) ? it->get() : nullptr;
}

std::vector<const Rule *>
RuleRegistry::applicableRules(const FileInput &file) const {
    std::vector<const Rule *> out;
    for (const auto &rule : rules_) {
        if (rule->appliesTo(file))
            out.push_back(rule.get());
    }
    return out;
}

std::string RuleRegistry::computeVersion(
    const std::vector<std::unique_ptr<Rule>> &rules, const Config &cfg) {

    FingerprintBuilder fb;
    fb.add(kToolVersion);
    fb.addUnsigned(kCacheSchemaVersion);

    fb.addUnsigned(rules.size());
    for (const auto &rule : rules) {
        fb.add(rule->getID());
        fb.add(rule->describeConfig());
    }

    // Duplicate grouping happens after caching, but normalization decides
    // which fingerprint a cached result carries.
    const auto &dup = cfg.rules.duplication;
    fb.addUnsigned(dup.enabled ? 1 : 0);
    fb.addUnsigned(dup.normalizeWhitespace ? 1 : 0);

    const auto &s = cfg.scoring;
    fb.addReal(s.baseline);
    fb.addReal(s.informationalWeight);
    fb.addReal(s.mediumWeight);
    fb.addReal(s.highWeight);
    fb.addReal(s.criticalWeight);
    fb.addReal(s.passScore);

    return fb.finish();
}

} // namespace fqcheck
