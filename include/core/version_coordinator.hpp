/**
 * @file version_coordinator.hpp
 * @brief Version coordination across dependent projects
 */

#pragma once

#include "core/dependency_graph.hpp"
#include "core/models.hpp"
#include "core/types.h"
#include "core/version.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace wsforge {

/**
 * @brief Record of one applied version update
 *
 * success is always equal to !error.has_value(). Precondition failures are
 * thrown by update_version() and never produce a record; error is reserved
 * for inconsistencies found after the update was applied.
 */
struct version_update_result {
  std::string project;
  std::string old_version;
  std::string new_version;
  std::vector<std::string> affected_projects; // Transitive dependents
  bool success = true;
  std::optional<std::string> error;
};

/**
 * @brief A single step in a version update plan
 */
struct version_update_step {
  std::string project;
  std::string new_version;
  bool is_breaking = false;
  std::vector<std::string> dependents; // Direct dependents
};

/**
 * @brief Plan for coordinating version updates
 *
 * is_valid is true iff every requested project is registered and every
 * target version parses. Constraint compatibility is not part of planning.
 * Malformed requests are left out of updates and described in
 * validation_errors.
 */
struct version_update_plan {
  std::vector<version_update_step> updates;
  bool is_valid = true;
  wsforge_size_t total_affected = 0; // Distinct direct dependents over all steps
  std::vector<std::string> validation_errors;
};

/**
 * @brief State of one dependency edge against its target's current version
 */
struct dependency_check {
  std::string target;
  std::string constraint; // Empty admits any version
  bool satisfied = true;
};

/**
 * @brief Edge constraint summary for one project
 */
struct dependency_report {
  std::string project;
  std::string version;
  std::vector<dependency_check> dependencies;
  std::vector<std::string> dependents; // Direct dependents
  std::vector<std::string> issues;     // Every unsatisfied edge in the graph
};

enum class impact_level {
  NONE,       // Nothing depends on the project
  COMPATIBLE, // Same major version
  BREAKING    // Major version changes
};

/**
 * @brief Get the name of an impact level
 */
inline const char *impact_level_to_string(impact_level level) {
  switch (level) {
  case impact_level::NONE:
    return "none";
  case impact_level::COMPATIBLE:
    return "compatible";
  case impact_level::BREAKING:
    return "breaking";
  }
  return "unknown";
}

/**
 * @brief What moving one project to a new version would touch
 */
struct impact_report {
  std::string project;
  std::string new_version;
  impact_level level = impact_level::NONE;
  std::vector<std::string> affected_projects; // Transitive dependents
};

/**
 * @brief Tracks project versions and constraints, validates and applies
 * version updates
 *
 * The coordinator keeps its own copy of the dependency graph given at
 * construction; later changes to the caller's graph are not seen here.
 */
class version_coordinator {
public:
  explicit version_coordinator(wsforge::dependency_graph graph);

  /**
   * @brief Record a project and its current version
   *
   * Registering the same name again overwrites the stored project.
   */
  void register_project(const project &p);

  /**
   * @brief Append a version constraint for a project
   *
   * The project does not need to be registered. The constraint text is
   * checked when it is used.
   */
  void register_constraint(const std::string &project_name,
                           const std::string &constraint);

  /**
   * @brief Get the constraints registered for a project, in order
   */
  std::vector<std::string> get_constraints(const std::string &project_name) const;

  /**
   * @brief Get the stored version of a project
   */
  std::optional<std::string> get_version(const std::string &project_name) const;

  /**
   * @brief Get all registered projects in registration order
   */
  std::vector<project> get_all_projects() const;

  /**
   * @brief Check a candidate version against every registered constraint
   *
   * @throws orchestration_error INVALID_VERSION if new_version does not parse
   * @throws orchestration_error INVALID_CONFIGURATION for a malformed
   * constraint
   * @throws orchestration_error INCOMPATIBLE_VERSION if a constraint rejects
   * the version
   */
  void validate_version_update(const std::string &project_name,
                               const std::string &new_version) const;

  /**
   * @brief Validate and apply a version update
   *
   * @throws orchestration_error INVALID_VERSION, UNKNOWN_PROJECT, or any
   * error of validate_version_update()
   */
  version_update_result update_version(const std::string &project_name,
                                       const std::string &new_version);

  /**
   * @brief Check if moving a project to a candidate version changes its
   * major component
   *
   * @throws orchestration_error UNKNOWN_PROJECT or INVALID_VERSION
   */
  bool is_breaking_change(const std::string &project_name,
                          const std::string &candidate_version) const;

  /**
   * @brief Build an ordered plan for a batch of updates
   *
   * Never throws for malformed requests; see version_update_plan.
   */
  version_update_plan plan_version_updates(
      const std::vector<std::pair<std::string, std::string>> &updates) const;

  /**
   * @brief Get every project transitively depending on a project
   *
   * Empty for unknown and leaf projects.
   */
  std::vector<project> get_affected_projects(const std::string &project_name) const;

  /**
   * @brief Check every edge constraint in the graph against the registered
   * version of the edge's target
   *
   * Edges without a constraint are skipped.
   *
   * @throws orchestration_error UNKNOWN_PROJECT if a constrained target is
   * not registered, INVALID_VERSION or INVALID_CONFIGURATION for unparseable
   * data, INCOMPATIBLE_VERSION for the first edge whose constraint rejects
   * its target
   */
  void validate_all_dependencies() const;

  /**
   * @brief Check a candidate version against the constraints dependents
   * declare on their edges to the project
   *
   * @throws orchestration_error INVALID_VERSION, INVALID_CONFIGURATION, or
   * INCOMPATIBLE_VERSION naming the dependent, the version and the constraint
   */
  void validate_dependent_constraints(const std::string &project_name,
                                      const std::string &new_version) const;

  /**
   * @brief Reject a breaking update that a dependent's edge constraint does
   * not admit
   *
   * Non-breaking updates always pass.
   *
   * @throws orchestration_error any error of is_breaking_change() or
   * validate_dependent_constraints()
   */
  void validate_no_breaking_changes(const std::string &project_name,
                                    const std::string &new_version) const;

  /**
   * @brief Summarize a project's edge constraints
   *
   * Never throws; a constraint that cannot be evaluated counts as
   * unsatisfied.
   */
  dependency_report get_dependency_report(const std::string &project_name) const;

  /**
   * @brief Classify what moving a project to a new version affects
   *
   * @throws orchestration_error UNKNOWN_PROJECT or INVALID_VERSION
   */
  impact_report analyze_impact(const std::string &project_name,
                               const std::string &new_version) const;

  /**
   * @brief Get the coordinator's copy of the dependency graph
   */
  const wsforge::dependency_graph &get_graph() const { return graph_; }

  /**
   * @brief Forget all projects, versions and constraints
   *
   * The wrapped graph is left as is.
   */
  void clear();

private:
  void check_edge(const project_dependency &dep) const;

  wsforge::dependency_graph graph_;
  std::vector<project> projects_;
  std::unordered_map<std::string, wsforge_size_t> project_index_;
  std::unordered_map<std::string, std::vector<std::string>> constraints_;
};

} // namespace wsforge
