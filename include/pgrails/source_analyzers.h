#pragma once

#include <pgrails/interfaces.h>
#include <pgrails/logging.h>

#include <cstddef>
#include <memory>

namespace pgrails {

// Columns filtered on in `.where(...)` calls of models and controllers.
// One finding per column per file.
class WhereClauseAnalyzer : public SourceAnalyzer {
public:
  WhereClauseAnalyzer();
  const SourceScope &Scope() const override { return scope_; }
  std::vector<Finding> Analyze(const SourceFile &file) override;

private:
  SourceScope scope_;
};

// A fetch assigned to an instance variable with no eager loading nearby,
// followed by a two-level member access on that variable.
class ControllerNPlusOneAnalyzer : public SourceAnalyzer {
public:
  // Lines before and after the fetch searched for includes/preload/
  // eager_load.
  static constexpr std::size_t kEagerLoadLookbehind = 2;
  static constexpr std::size_t kEagerLoadLookahead = 2;
  // Lines after the fetch searched for `@var.a.b`.
  static constexpr std::size_t kAccessLookahead = 20;

  explicit ControllerNPlusOneAnalyzer(std::shared_ptr<Logger> logger = nullptr);
  const SourceScope &Scope() const override { return scope_; }
  std::vector<Finding> Analyze(const SourceFile &file) override;

private:
  SourceScope scope_;
  std::shared_ptr<Logger> logger_;
};

class ViewAssociationAnalyzer : public SourceAnalyzer {
public:
  ViewAssociationAnalyzer();
  const SourceScope &Scope() const override { return scope_; }
  std::vector<Finding> Analyze(const SourceFile &file) override;

private:
  SourceScope scope_;
};

} // namespace pgrails
