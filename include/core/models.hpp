/**
 * @file models.hpp
 * @brief Data types shared by the dependency graph, version coordinator and
 * rules validator
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace wsforge {

/**
 * @brief Health of a project as last reported
 */
enum class project_status { HEALTHY, WARNING, CRITICAL, UNKNOWN };

/**
 * @brief Kind of an inter-project dependency edge
 */
enum class dependency_type { DIRECT, TRANSITIVE, DEV };

/**
 * @brief Kind of a workspace policy rule
 */
enum class rule_type {
  DEPENDENCY_CONSTRAINT, // Dependency shape, e.g. no cycles
  NAMING_CONVENTION,     // Project naming
  ARCHITECTURAL_BOUNDARY // Layering between projects
};

/**
 * @brief Severity of a rule violation, ordered from least to most severe
 */
enum class violation_severity { INFO, WARNING, CRITICAL };

/**
 * @brief A project within a workspace
 */
struct project {
  std::filesystem::path path;
  std::string name; // Unique key
  std::string project_type;
  std::string version; // Semver string
  project_status status = project_status::UNKNOWN;
};

/**
 * @brief Directed edge from a dependent project to its dependency
 */
struct project_dependency {
  std::string from;
  std::string to;
  dependency_type type = dependency_type::DIRECT;
  std::string version_constraint;
};

/**
 * @brief A configured policy rule
 */
struct workspace_rule {
  std::string name;
  rule_type type = rule_type::DEPENDENCY_CONSTRAINT;
  bool enabled = true;
  violation_severity severity = violation_severity::WARNING;
};

/**
 * @brief An architectural layer
 *
 * Members are project names, or prefixes terminated by '*'. A project in a
 * layer may depend on projects in the same or a lower level only.
 */
struct architecture_layer {
  std::string name;
  int level = 0;
  std::vector<std::string> members;

  /**
   * @brief Check if a project name belongs to this layer
   */
  bool contains(const std::string &project_name) const;
};

/**
 * @brief Policy settings of a workspace
 */
struct workspace_settings {
  std::vector<workspace_rule> rules;
  std::string naming_convention = "kebab-case";
  std::string naming_pattern; // Regular expression, for "custom" only
  std::vector<architecture_layer> layers;
};

/**
 * @brief Snapshot of a workspace: projects, edges and policy
 */
struct workspace {
  std::string name;
  std::filesystem::path root;
  std::vector<project> projects;
  std::vector<project_dependency> dependencies;
  workspace_settings settings;
};

/**
 * @brief A detected policy-rule non-compliance
 */
struct violation {
  std::string rule_name;
  rule_type type = rule_type::DEPENDENCY_CONSTRAINT;
  violation_severity severity = violation_severity::WARNING;
  std::string description;
  std::vector<std::string> affected_projects;
};

/**
 * @brief Outcome of a rules validation pass
 */
struct validation_result {
  bool passed = true; // Equals violations.empty()
  std::vector<violation> violations;
  std::vector<std::string> warnings;
};

// String conversions used by the configuration loader and the CLI

const char *project_status_to_string(project_status status);
const char *dependency_type_to_string(dependency_type type);
const char *rule_type_to_string(rule_type type);
const char *violation_severity_to_string(violation_severity severity);

std::optional<project_status> parse_project_status(const std::string &str);
std::optional<dependency_type> parse_dependency_type(const std::string &str);
std::optional<rule_type> parse_rule_type(const std::string &str);
std::optional<violation_severity>
parse_violation_severity(const std::string &str);

} // namespace wsforge
