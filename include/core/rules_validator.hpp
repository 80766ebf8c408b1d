/**
 * @file rules_validator.hpp
 * @brief Workspace policy rule evaluation
 */

#pragma once

#include "core/dependency_graph.hpp"
#include "core/models.hpp"

#include <string>

namespace wsforge {

/**
 * @brief Check a project name against a naming convention
 *
 * Conventions: "kebab-case", "snake-case", "camel-case", "pascal-case" and
 * "custom", which matches the whole name against the regular expression in
 * pattern.
 *
 * @throws orchestration_error INVALID_CONFIGURATION for an unknown convention,
 * or a missing or malformed custom pattern
 */
bool is_valid_project_name(const std::string &name,
                           const std::string &convention,
                           const std::string &pattern = "");

/**
 * @brief Evaluates the enabled rules of a workspace snapshot
 *
 * The validator reads the workspace it was given on every call; the
 * workspace must outlive it. Violations are results, not errors: only a
 * malformed snapshot throws.
 */
class rules_validator {
public:
  explicit rules_validator(const workspace &ws);

  /**
   * @brief Evaluate every enabled rule in configuration order
   *
   * All rules run even after a violation. passed is true iff no violation
   * was found.
   *
   * @throws orchestration_error INVALID_CONFIGURATION for duplicate project
   * names, edges to unknown projects, unnamed rules or a bad naming
   * convention
   */
  validation_result validate_all() const;

  /**
   * @brief Evaluate the naming rules against a project not yet in the
   * workspace
   */
  validation_result validate_project(const project &candidate) const;

  /**
   * @brief Evaluate a dependency edge before it is added
   *
   * Reports a cycle if the workspace already leads from the edge's target
   * back to its source, and a boundary violation if the edge points to a
   * higher layer.
   */
  validation_result validate_dependency(const project_dependency &candidate) const;

private:
  void check_rules() const;
  dependency_graph build_graph() const;

  void check_cycles(const workspace_rule &rule, const dependency_graph &graph,
                    validation_result &result) const;
  void check_naming(const workspace_rule &rule,
                    const std::vector<project> &projects,
                    validation_result &result) const;
  void check_boundaries(const workspace_rule &rule,
                        const std::vector<project_dependency> &edges,
                        validation_result &result) const;

  const architecture_layer *find_layer(const std::string &project_name) const;

  const workspace &ws_;
};

} // namespace wsforge
