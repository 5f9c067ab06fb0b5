#pragma once

#include "fqcheck/core/Rule.h"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace fqcheck {

struct Config;

// Builds a configured rule, or returns null when the configuration
// disables it.
using RuleFactory = std::function<std::unique_ptr<Rule>(const Config &)>;

// Process-wide catalog of rule implementations, filled at static
// initialization time by FQCHECK_REGISTER_RULE.
class RuleCatalog {
public:
    struct Entry {
        std::string id;
        std::string title;
        RuleFactory factory;
    };

    static RuleCatalog &instance();

    void registerFactory(std::string_view id, std::string_view title,
                         RuleFactory factory);

    // Sorted by rule ID; this is the registration order every run uses.
    std::vector<Entry> entries() const;

private:
    RuleCatalog() = default;
    std::vector<Entry> entries_;
};

// The immutable rule set of one analysis pass.
class RuleRegistry {
public:
    // Instantiates every catalog rule the configuration enables.
    static RuleRegistry fromConfig(const Config &cfg);

    // Explicit rule list, in the given order.
    RuleRegistry(std::vector<std::unique_ptr<Rule>> rules, const Config &cfg);

    RuleRegistry(RuleRegistry &&) = default;
    RuleRegistry &operator=(RuleRegistry &&) = default;

    const std::vector<std::unique_ptr<Rule>> &rules() const { return rules_; }

    const Rule *findByID(std::string_view id) const;

    std::vector<const Rule *> applicableRules(const FileInput &file) const;

    // Changes whenever the rule set, any rule's configuration, duplication
    // settings or scoring weights change.
    const std::string &version() const { return version_; }

private:
    static std::string computeVersion(
        const std::vector<std::unique_ptr<Rule>> &rules, const Config &cfg);

    std::vector<std::unique_ptr<Rule>> rules_;
    std::string version_;
};

// Macro for static self-registration in rule .cpp files. The rule class
// provides kID, kTitle and `static std::unique_ptr<Rule> create(const Config &)`.
#define FQCHECK_REGISTER_RULE(RuleClass)                                       \
    namespace {                                                                \
    struct RuleClass##Registrar {                                              \
        RuleClass##Registrar() {                                               \
            ::fqcheck::RuleCatalog::instance().registerFactory(                 \
                RuleClass::kID, RuleClass::kTitle,                             \
                [](const ::fqcheck::Config &cfg) {                             \
                    return RuleClass::create(cfg);                             \
                });                                                            \
        }                                                                      \
    };                                                                         \
    static RuleClass##Registrar g_##RuleClass##Registrar;                      \
    } // anonymous namespace

} // namespace fqcheck
