#include <pgrails/component_registry.h>

#include <pgrails/connection_analyzers.h>
#include <pgrails/schema_analyzers.h>
#include <pgrails/source_analyzers.h>
#include <pgrails/text_reporter.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace {

constexpr const char kDefaultReporter[] = "text";

template <typename Interface, typename Factory>
std::unique_ptr<Interface>
CreateRule(const std::string &name,
           const pgrails::ComponentRegistry::ComponentSet<Factory> &set,
           std::shared_ptr<pgrails::Logger> logger, const std::string &kind) {
  const auto found = set.factories.find(name);
  if (found == set.factories.end()) {
    throw std::invalid_argument("Unknown " + kind + " rule '" + name + "'");
  }
  auto instance = found->second(pgrails::EnsureLogger(std::move(logger)));
  if (!instance) {
    throw std::runtime_error("Factory for rule '" + name + "' returned null");
  }
  return instance;
}

} // namespace

namespace pgrails {

template <typename Factory>
std::vector<std::string>
ComponentRegistry::RegisteredNames(const ComponentSet<Factory> &set) {
  std::vector<std::string> names;
  names.reserve(set.factories.size());
  for (const auto &entry : set.factories) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::string ComponentRegistry::JoinRuleNames() const {
  const auto names = RuleNames();
  std::string message;
  for (std::size_t i = 0; i < names.size(); ++i) {
    message += names[i];
    if (i + 1 < names.size()) {
      message += ", ";
    }
  }
  return message;
}

template <typename Factory>
void ComponentRegistry::RegisterComponent(const std::string &name,
                                          Factory factory,
                                          bool set_as_default,
                                          ComponentSet<Factory> &set) {
  if (name.empty()) {
    throw std::invalid_argument("Component name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for '" + name + "' cannot be null");
  }
  if (set.factories.count(name) != 0) {
    throw std::invalid_argument("Component with name '" + name +
                                "' already registered");
  }
  set.factories.emplace(name, std::move(factory));
  if (set_as_default || set.default_name.empty()) {
    set.default_name = name;
  }
}

void ComponentRegistry::RequireUniqueRuleName(const std::string &name) const {
  if (schema_rules_.factories.count(name) != 0 ||
      source_rules_.factories.count(name) != 0 ||
      config_rules_.factories.count(name) != 0) {
    throw std::invalid_argument("Component with name '" + name +
                                "' already registered");
  }
}

void ComponentRegistry::RegisterSchemaRule(const std::string &name,
                                           SchemaRuleFactory factory) {
  RequireUniqueRuleName(name);
  RegisterComponent(name, std::move(factory), false, schema_rules_);
}

void ComponentRegistry::RegisterSourceRule(const std::string &name,
                                           SourceRuleFactory factory) {
  RequireUniqueRuleName(name);
  RegisterComponent(name, std::move(factory), false, source_rules_);
}

void ComponentRegistry::RegisterConfigRule(const std::string &name,
                                           ConfigRuleFactory factory) {
  RequireUniqueRuleName(name);
  RegisterComponent(name, std::move(factory), false, config_rules_);
}

void ComponentRegistry::RegisterReporter(const std::string &name,
                                         ReporterFactory factory,
                                         bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default, reporters_);
}

void ComponentRegistry::SetSuiteRules(AnalysisSuite suite,
                                      std::vector<std::string> names) {
  for (const auto &name : names) {
    KindOf(name);
  }
  suite_rules_[suite] = std::move(names);
}

std::vector<std::string> ComponentRegistry::SuiteRules(AnalysisSuite suite) const {
  const auto found = suite_rules_.find(suite);
  if (found == suite_rules_.end()) {
    return {};
  }
  return found->second;
}

RuleKind ComponentRegistry::KindOf(const std::string &name) const {
  if (schema_rules_.factories.count(name) != 0) {
    return RuleKind::kSchema;
  }
  if (source_rules_.factories.count(name) != 0) {
    return RuleKind::kSource;
  }
  if (config_rules_.factories.count(name) != 0) {
    return RuleKind::kConfig;
  }
  throw std::invalid_argument("Unknown rule '" + name +
                              "'. Registered: " + JoinRuleNames());
}

std::unique_ptr<SchemaAnalyzer>
ComponentRegistry::CreateSchemaRule(const std::string &name,
                                    std::shared_ptr<Logger> logger) const {
  return CreateRule<SchemaAnalyzer>(name, schema_rules_, std::move(logger),
                                    "schema");
}

std::unique_ptr<SourceAnalyzer>
ComponentRegistry::CreateSourceRule(const std::string &name,
                                    std::shared_ptr<Logger> logger) const {
  return CreateRule<SourceAnalyzer>(name, source_rules_, std::move(logger),
                                    "source");
}

std::unique_ptr<ConfigAnalyzer>
ComponentRegistry::CreateConfigRule(const std::string &name,
                                    std::shared_ptr<Logger> logger) const {
  return CreateRule<ConfigAnalyzer>(name, config_rules_, std::move(logger),
                                    "config");
}

std::unique_ptr<Reporter>
ComponentRegistry::CreateReporter(const std::string &name) const {
  const auto target_name = name.empty() ? reporters_.default_name : name;
  if (target_name.empty()) {
    throw std::invalid_argument("No default reporter registered");
  }
  const auto found = reporters_.factories.find(target_name);
  if (found == reporters_.factories.end()) {
    std::string registered;
    for (const auto &reporter : ReporterNames()) {
      registered += registered.empty() ? reporter : ", " + reporter;
    }
    throw std::invalid_argument("Unknown reporter '" + target_name +
                                "'. Registered: " + registered);
  }
  auto instance = found->second();
  if (!instance) {
    throw std::runtime_error("Factory for reporter '" + target_name +
                             "' returned null");
  }
  return instance;
}

std::vector<std::string> ComponentRegistry::RuleNames() const {
  auto names = RegisteredNames(schema_rules_);
  const auto source_names = RegisteredNames(source_rules_);
  const auto config_names = RegisteredNames(config_rules_);
  names.insert(names.end(), source_names.begin(), source_names.end());
  names.insert(names.end(), config_names.begin(), config_names.end());
  std::sort(names.begin(), names.end());
  return names;
}

std::vector<std::string> ComponentRegistry::ReporterNames() const {
  return RegisteredNames(reporters_);
}

const std::string &ComponentRegistry::DefaultReporterName() const {
  return reporters_.default_name;
}

ComponentRegistry MakeComponentRegistryWithDefaults() {
  ComponentRegistry registry;
  registry.RegisterSchemaRule("missing-foreign-key-index",
                              [](std::shared_ptr<Logger>) {
                                return std::make_unique<
                                    MissingForeignKeyIndexAnalyzer>();
                              });
  registry.RegisterSchemaRule("boolean-index-opportunity",
                              [](std::shared_ptr<Logger>) {
                                return std::make_unique<BooleanColumnAnalyzer>();
                              });
  registry.RegisterSourceRule("where-clause-column",
                              [](std::shared_ptr<Logger>) {
                                return std::make_unique<WhereClauseAnalyzer>();
                              });
  registry.RegisterSourceRule(
      "controller-n-plus-one", [](std::shared_ptr<Logger> logger) {
        return std::make_unique<ControllerNPlusOneAnalyzer>(std::move(logger));
      });
  registry.RegisterSourceRule("view-association-access",
                              [](std::shared_ptr<Logger>) {
                                return std::make_unique<ViewAssociationAnalyzer>();
                              });
  registry.RegisterConfigRule("connection-pool", [](std::shared_ptr<Logger>) {
    return std::make_unique<ConnectionPoolAnalyzer>();
  });
  registry.RegisterConfigRule("timeouts", [](std::shared_ptr<Logger>) {
    return std::make_unique<TimeoutAnalyzer>();
  });
  registry.RegisterConfigRule("prepared-statements",
                              [](std::shared_ptr<Logger>) {
                                return std::make_unique<PreparedStatementsAnalyzer>();
                              });
  registry.RegisterConfigRule("reaping-frequency", [](std::shared_ptr<Logger>) {
    return std::make_unique<ReapingFrequencyAnalyzer>();
  });
  registry.RegisterConfigRule("ssl-configuration", [](std::shared_ptr<Logger>) {
    return std::make_unique<SslConfigurationAnalyzer>();
  });
  registry.RegisterConfigRule("performance-extension",
                              [](std::shared_ptr<Logger>) {
                                return std::make_unique<PerformanceExtensionAnalyzer>();
                              });
  registry.RegisterReporter(
      kDefaultReporter, []() { return std::make_unique<TextReporter>(); },
      true);

  registry.SetSuiteRules(AnalysisSuite::kIndexes,
                         {"missing-foreign-key-index", "where-clause-column",
                          "boolean-index-opportunity"});
  registry.SetSuiteRules(AnalysisSuite::kNPlusOne,
                         {"controller-n-plus-one", "view-association-access"});
  registry.SetSuiteRules(AnalysisSuite::kConfig,
                         {"connection-pool", "timeouts", "prepared-statements",
                          "reaping-frequency", "ssl-configuration",
                          "performance-extension"});
  return registry;
}

const ComponentRegistry &GlobalComponentRegistry() {
  static const ComponentRegistry registry = MakeComponentRegistryWithDefaults();
  return registry;
}

} // namespace pgrails
