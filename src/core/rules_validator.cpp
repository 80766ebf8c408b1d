/**
 * @file rules_validator.cpp
 * @brief Implementation of workspace policy rule evaluation
 */

#include "core/rules_validator.hpp"
#include "core/errors.hpp"
#include "wsforge/log.hpp"

#include <algorithm>
#include <regex>
#include <set>
#include <utility>

namespace wsforge {

namespace {

const char *KEBAB_CASE_PATTERN = "[a-z0-9]([a-z0-9-]*[a-z0-9])?";
const char *SNAKE_CASE_PATTERN = "[a-z0-9]([a-z0-9_]*[a-z0-9])?";
const char *CAMEL_CASE_PATTERN = "[a-z][a-zA-Z0-9]*";
const char *PASCAL_CASE_PATTERN = "[A-Z][a-zA-Z0-9]*";

std::string join_names(const std::vector<std::string> &names,
                       const std::string &separator) {
  std::string joined;
  for (wsforge_size_t i = 0; i < names.size(); ++i) {
    if (i > 0) {
      joined += separator;
    }
    joined += names[i];
  }
  return joined;
}

std::regex naming_regex(const std::string &convention,
                        const std::string &pattern) {
  std::string expr;
  if (convention == "kebab-case") {
    expr = KEBAB_CASE_PATTERN;
  } else if (convention == "snake-case") {
    expr = SNAKE_CASE_PATTERN;
  } else if (convention == "camel-case") {
    expr = CAMEL_CASE_PATTERN;
  } else if (convention == "pascal-case") {
    expr = PASCAL_CASE_PATTERN;
  } else if (convention == "custom") {
    if (pattern.empty()) {
      throw orchestration_error(error_kind::INVALID_CONFIGURATION,
                                "custom naming convention needs a pattern",
                                {convention});
    }
    expr = pattern;
  } else {
    throw orchestration_error(error_kind::INVALID_CONFIGURATION,
                              "unknown naming convention '" + convention + "'",
                              {convention});
  }

  try {
    return std::regex(expr);
  } catch (const std::regex_error &e) {
    throw orchestration_error(error_kind::INVALID_CONFIGURATION,
                              "invalid naming pattern '" + expr +
                                  "': " + e.what(),
                              {expr});
  }
}

} // namespace

bool is_valid_project_name(const std::string &name,
                           const std::string &convention,
                           const std::string &pattern) {
  return std::regex_match(name, naming_regex(convention, pattern));
}

rules_validator::rules_validator(const workspace &ws) : ws_(ws) {}

void rules_validator::check_rules() const {
  for (const auto &rule : ws_.settings.rules) {
    if (rule.name.empty()) {
      throw orchestration_error(error_kind::INVALID_CONFIGURATION,
                                "rule of type " +
                                    std::string(rule_type_to_string(rule.type)) +
                                    " has no name");
    }
  }
}

dependency_graph rules_validator::build_graph() const {
  dependency_graph graph(true);
  try {
    for (const auto &p : ws_.projects) {
      graph.add_project(p);
    }
    for (const auto &dep : ws_.dependencies) {
      graph.add_dependency(dep);
    }
  } catch (const orchestration_error &e) {
    throw orchestration_error(error_kind::INVALID_CONFIGURATION,
                              "workspace '" + ws_.name + "' is malformed (" +
                                  e.what() + ")",
                              e.subjects());
  }
  return graph;
}

const architecture_layer *
rules_validator::find_layer(const std::string &project_name) const {
  for (const auto &layer : ws_.settings.layers) {
    if (layer.contains(project_name)) {
      return &layer;
    }
  }
  return nullptr;
}

void rules_validator::check_cycles(const workspace_rule &rule,
                                   const dependency_graph &graph,
                                   validation_result &result) const {
  for (const auto &cycle : graph.find_cycles()) {
    violation v;
    v.rule_name = rule.name;
    v.type = rule.type;
    // A cycle is critical whatever severity the rule carries
    v.severity = violation_severity::CRITICAL;
    v.description = "Circular dependency: " + join_names(cycle, " -> ") +
                    " -> " + cycle.front();
    v.affected_projects = cycle;
    result.violations.push_back(v);
  }
}

void rules_validator::check_naming(const workspace_rule &rule,
                                   const std::vector<project> &projects,
                                   validation_result &result) const {
  const std::string &convention = ws_.settings.naming_convention;
  const std::regex name_regex =
      naming_regex(convention, ws_.settings.naming_pattern);

  for (const auto &p : projects) {
    if (std::regex_match(p.name, name_regex)) {
      continue;
    }

    violation v;
    v.rule_name = rule.name;
    v.type = rule.type;
    // Naming violations are never merely informational
    v.severity = std::max(rule.severity, violation_severity::WARNING);
    v.description =
        "Project name '" + p.name + "' does not follow " + convention;
    v.affected_projects = {p.name};
    result.violations.push_back(v);
  }
}

void rules_validator::check_boundaries(
    const workspace_rule &rule, const std::vector<project_dependency> &edges,
    validation_result &result) const {
  if (ws_.settings.layers.empty()) {
    result.warnings.push_back("Rule '" + rule.name +
                              "' is enabled but no architecture layers are "
                              "configured");
    return;
  }

  std::set<std::pair<std::string, std::string>> reported;

  for (const auto &dep : edges) {
    const architecture_layer *from_layer = find_layer(dep.from);
    const architecture_layer *to_layer = find_layer(dep.to);
    if (!from_layer || !to_layer || from_layer->level >= to_layer->level) {
      continue;
    }
    if (!reported.insert({dep.from, dep.to}).second) {
      continue;
    }

    violation v;
    v.rule_name = rule.name;
    v.type = rule.type;
    v.severity = rule.severity;
    v.description = "Project '" + dep.from + "' in layer '" + from_layer->name +
                    "' depends on '" + dep.to + "' in higher layer '" +
                    to_layer->name + "'";
    v.affected_projects = {dep.from, dep.to};
    result.violations.push_back(v);
  }
}

validation_result rules_validator::validate_all() const {
  check_rules();
  dependency_graph graph = build_graph();

  validation_result result;
  wsforge_size_t evaluated = 0;

  for (const auto &rule : ws_.settings.rules) {
    if (!rule.enabled) {
      continue;
    }
    ++evaluated;

    switch (rule.type) {
    case rule_type::DEPENDENCY_CONSTRAINT:
      check_cycles(rule, graph, result);
      break;
    case rule_type::NAMING_CONVENTION:
      check_naming(rule, ws_.projects, result);
      break;
    case rule_type::ARCHITECTURAL_BOUNDARY:
      check_boundaries(rule, ws_.dependencies, result);
      break;
    }
  }

  result.passed = result.violations.empty();
  logger::print_verbose("Evaluated " + std::to_string(evaluated) +
                        " rule(s), found " +
                        std::to_string(result.violations.size()) +
                        " violation(s)");
  return result;
}

validation_result
rules_validator::validate_project(const project &candidate) const {
  check_rules();

  validation_result result;
  for (const auto &rule : ws_.settings.rules) {
    if (rule.enabled && rule.type == rule_type::NAMING_CONVENTION) {
      check_naming(rule, {candidate}, result);
    }
  }

  result.passed = result.violations.empty();
  return result;
}

validation_result
rules_validator::validate_dependency(const project_dependency &candidate) const {
  check_rules();
  dependency_graph graph = build_graph();

  validation_result result;
  for (const auto &rule : ws_.settings.rules) {
    if (!rule.enabled) {
      continue;
    }

    if (rule.type == rule_type::DEPENDENCY_CONSTRAINT) {
      // The edge closes a cycle if its target already reaches its source
      if (candidate.from == candidate.to ||
          graph.can_reach(candidate.to, candidate.from)) {
        violation v;
        v.rule_name = rule.name;
        v.type = rule.type;
        v.severity = violation_severity::CRITICAL;
        v.description = "Dependency " + candidate.from + " -> " +
                        candidate.to + " would create a cycle";
        v.affected_projects = {candidate.from, candidate.to};
        result.violations.push_back(v);
      }
    } else if (rule.type == rule_type::ARCHITECTURAL_BOUNDARY) {
      check_boundaries(rule, {candidate}, result);
    }
  }

  result.passed = result.violations.empty();
  return result;
}

} // namespace wsforge
