#pragma once

#include <pgrails/interfaces.h>
#include <pgrails/logging.h>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace pgrails {

enum class RuleKind { kSchema, kSource, kConfig };

class ComponentRegistry {
public:
  using SchemaRuleFactory = std::function<std::unique_ptr<SchemaAnalyzer>(
      std::shared_ptr<Logger>)>;
  using SourceRuleFactory = std::function<std::unique_ptr<SourceAnalyzer>(
      std::shared_ptr<Logger>)>;
  using ConfigRuleFactory = std::function<std::unique_ptr<ConfigAnalyzer>(
      std::shared_ptr<Logger>)>;
  using ReporterFactory = std::function<std::unique_ptr<Reporter>()>;

  void RegisterSchemaRule(const std::string &name, SchemaRuleFactory factory);
  void RegisterSourceRule(const std::string &name, SourceRuleFactory factory);
  void RegisterConfigRule(const std::string &name, ConfigRuleFactory factory);
  void RegisterReporter(const std::string &name, ReporterFactory factory,
                        bool set_as_default = false);

  // Rules a command runs when the user does not pick them explicitly.
  void SetSuiteRules(AnalysisSuite suite, std::vector<std::string> names);
  std::vector<std::string> SuiteRules(AnalysisSuite suite) const;

  // Throws std::invalid_argument for names no rule was registered under.
  RuleKind KindOf(const std::string &name) const;

  std::unique_ptr<SchemaAnalyzer>
  CreateSchemaRule(const std::string &name,
                   std::shared_ptr<Logger> logger) const;
  std::unique_ptr<SourceAnalyzer>
  CreateSourceRule(const std::string &name,
                   std::shared_ptr<Logger> logger) const;
  std::unique_ptr<ConfigAnalyzer>
  CreateConfigRule(const std::string &name,
                   std::shared_ptr<Logger> logger) const;
  std::unique_ptr<Reporter> CreateReporter(const std::string &name = "") const;

  std::vector<std::string> RuleNames() const;
  std::vector<std::string> ReporterNames() const;
  const std::string &DefaultReporterName() const;

  template <typename Factory> struct ComponentSet {
    std::unordered_map<std::string, Factory> factories;
    std::string default_name;
  };

private:
  template <typename Factory>
  static std::vector<std::string>
  RegisteredNames(const ComponentSet<Factory> &set);

  std::string JoinRuleNames() const;

  template <typename Factory>
  void RegisterComponent(const std::string &name, Factory factory,
                         bool set_as_default, ComponentSet<Factory> &set);

  void RequireUniqueRuleName(const std::string &name) const;

  ComponentSet<SchemaRuleFactory> schema_rules_;
  ComponentSet<SourceRuleFactory> source_rules_;
  ComponentSet<ConfigRuleFactory> config_rules_;
  ComponentSet<ReporterFactory> reporters_;
  std::map<AnalysisSuite, std::vector<std::string>> suite_rules_;
};

ComponentRegistry MakeComponentRegistryWithDefaults();
const ComponentRegistry &GlobalComponentRegistry();

} // namespace pgrails
