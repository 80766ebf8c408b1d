/**
 * @file version_coordinator.cpp
 * @brief Implementation of version coordination across dependent projects
 */

#include "core/version_coordinator.hpp"
#include "core/errors.hpp"
#include "wsforge/log.hpp"

#include <set>

namespace wsforge {

static semver require_version(const std::string &version_str,
                              const std::string &project_name) {
  auto v = semver::parse(version_str);
  if (!v) {
    throw orchestration_error(error_kind::INVALID_VERSION,
                              "'" + version_str + "' is not a valid version for " +
                                  project_name,
                              {version_str, project_name});
  }
  return *v;
}

static version_constraint require_constraint(const std::string &constraint_str,
                                             const std::string &project_name) {
  auto constraint = version_constraint::parse(constraint_str);
  if (!constraint) {
    throw orchestration_error(error_kind::INVALID_CONFIGURATION,
                              "unrecognized constraint '" + constraint_str +
                                  "' on " + project_name,
                              {constraint_str, project_name});
  }
  return *constraint;
}

version_coordinator::version_coordinator(wsforge::dependency_graph graph)
    : graph_(std::move(graph)) {}

void version_coordinator::register_project(const project &p) {
  auto it = project_index_.find(p.name);
  if (it != project_index_.end()) {
    projects_[it->second] = p;
  } else {
    project_index_[p.name] = projects_.size();
    projects_.push_back(p);
  }
  logger::print_verbose("Tracking " + p.name + " at version " + p.version);
}

void version_coordinator::register_constraint(const std::string &project_name,
                                              const std::string &constraint) {
  constraints_[project_name].push_back(constraint);
}

std::vector<std::string>
version_coordinator::get_constraints(const std::string &project_name) const {
  auto it = constraints_.find(project_name);
  if (it == constraints_.end()) {
    return {};
  }
  return it->second;
}

std::optional<std::string>
version_coordinator::get_version(const std::string &project_name) const {
  auto it = project_index_.find(project_name);
  if (it == project_index_.end()) {
    return std::nullopt;
  }
  return projects_[it->second].version;
}

std::vector<project> version_coordinator::get_all_projects() const {
  return projects_;
}

void version_coordinator::validate_version_update(
    const std::string &project_name, const std::string &new_version) const {
  semver candidate = require_version(new_version, project_name);

  auto it = constraints_.find(project_name);
  if (it == constraints_.end()) {
    return;
  }

  for (const auto &constraint_str : it->second) {
    if (!require_constraint(constraint_str, project_name).satisfies(candidate)) {
      throw orchestration_error(error_kind::INCOMPATIBLE_VERSION,
                                project_name + " " + new_version +
                                    " does not satisfy " + constraint_str,
                                {project_name, new_version, constraint_str});
    }
  }
}

version_update_result
version_coordinator::update_version(const std::string &project_name,
                                    const std::string &new_version) {
  require_version(new_version, project_name);

  auto it = project_index_.find(project_name);
  if (it == project_index_.end()) {
    throw orchestration_error(error_kind::UNKNOWN_PROJECT,
                              "project '" + project_name + "' is not registered",
                              {project_name});
  }

  validate_version_update(project_name, new_version);

  version_update_result result;
  result.project = project_name;
  result.old_version = projects_[it->second].version;
  result.new_version = new_version;
  result.affected_projects = project_names(get_affected_projects(project_name));

  projects_[it->second].version = new_version;
  logger::print_verbose("Updated " + project_name + " " + result.old_version +
                        " -> " + new_version);
  return result;
}

bool version_coordinator::is_breaking_change(
    const std::string &project_name,
    const std::string &candidate_version) const {
  auto it = project_index_.find(project_name);
  if (it == project_index_.end()) {
    throw orchestration_error(error_kind::UNKNOWN_PROJECT,
                              "project '" + project_name + "' is not registered",
                              {project_name});
  }

  semver current = require_version(projects_[it->second].version, project_name);
  semver candidate = require_version(candidate_version, project_name);
  return wsforge::is_breaking_change(current, candidate);
}

version_update_plan version_coordinator::plan_version_updates(
    const std::vector<std::pair<std::string, std::string>> &updates) const {
  version_update_plan plan;
  std::set<std::string> affected;

  for (const auto &[name, version] : updates) {
    auto candidate = semver::parse(version);
    if (!candidate) {
      plan.is_valid = false;
      plan.validation_errors.push_back("Invalid version for " + name + ": '" +
                                       version + "'");
      continue;
    }

    auto it = project_index_.find(name);
    if (it == project_index_.end()) {
      plan.is_valid = false;
      plan.validation_errors.push_back("Project not found: " + name);
      continue;
    }

    auto current = semver::parse(projects_[it->second].version);
    if (!current) {
      plan.is_valid = false;
      plan.validation_errors.push_back("Current version of " + name + " '" +
                                       projects_[it->second].version +
                                       "' is not a valid version");
      continue;
    }

    version_update_step step;
    step.project = name;
    step.new_version = version;
    step.is_breaking = wsforge::is_breaking_change(*current, *candidate);
    step.dependents = project_names(graph_.get_dependents(name));
    affected.insert(step.dependents.begin(), step.dependents.end());
    plan.updates.push_back(step);
  }

  plan.total_affected = affected.size();
  if (!plan.is_valid) {
    logger::print_verbose("Version plan rejected " +
                          std::to_string(plan.validation_errors.size()) +
                          " request(s)");
  }
  return plan;
}

void version_coordinator::check_edge(const project_dependency &dep) const {
  if (dep.version_constraint.empty()) {
    return;
  }

  auto it = project_index_.find(dep.to);
  if (it == project_index_.end()) {
    throw orchestration_error(error_kind::UNKNOWN_PROJECT,
                              "project '" + dep.to + "' required by " +
                                  dep.from + " is not registered",
                              {dep.to, dep.from});
  }

  const std::string &version = projects_[it->second].version;
  semver current = require_version(version, dep.to);
  if (!require_constraint(dep.version_constraint, dep.from).satisfies(current)) {
    throw orchestration_error(error_kind::INCOMPATIBLE_VERSION,
                              dep.from + " requires " + dep.to + " " +
                                  dep.version_constraint + ", found " + version,
                              {dep.from, dep.to, version, dep.version_constraint});
  }
}

void version_coordinator::validate_all_dependencies() const {
  for (const auto &dep : graph_.get_all_dependencies()) {
    check_edge(dep);
  }
}

void version_coordinator::validate_dependent_constraints(
    const std::string &project_name, const std::string &new_version) const {
  semver candidate = require_version(new_version, project_name);

  for (const auto &dep : graph_.get_all_dependencies()) {
    if (dep.to != project_name || dep.version_constraint.empty()) {
      continue;
    }
    if (!require_constraint(dep.version_constraint, dep.from)
             .satisfies(candidate)) {
      throw orchestration_error(error_kind::INCOMPATIBLE_VERSION,
                                project_name + " " + new_version +
                                    " would break " + dep.from + " (requires " +
                                    dep.version_constraint + ")",
                                {project_name, new_version, dep.from,
                                 dep.version_constraint});
    }
  }
}

void version_coordinator::validate_no_breaking_changes(
    const std::string &project_name, const std::string &new_version) const {
  if (!is_breaking_change(project_name, new_version)) {
    return;
  }
  validate_dependent_constraints(project_name, new_version);
}

dependency_report
version_coordinator::get_dependency_report(const std::string &project_name) const {
  dependency_report report;
  report.project = project_name;
  report.version = get_version(project_name).value_or("");
  report.dependents = project_names(graph_.get_dependents(project_name));

  for (const auto &dep : graph_.get_all_dependencies()) {
    std::optional<std::string> issue;
    try {
      check_edge(dep);
    } catch (const orchestration_error &e) {
      issue = e.what();
      report.issues.push_back(*issue);
    }

    if (dep.from == project_name) {
      report.dependencies.push_back(
          {dep.to, dep.version_constraint, !issue.has_value()});
    }
  }
  return report;
}

impact_report version_coordinator::analyze_impact(
    const std::string &project_name, const std::string &new_version) const {
  impact_report report;
  report.project = project_name;
  report.new_version = new_version;

  bool breaking = is_breaking_change(project_name, new_version);
  report.affected_projects = project_names(get_affected_projects(project_name));
  if (!report.affected_projects.empty()) {
    report.level = breaking ? impact_level::BREAKING : impact_level::COMPATIBLE;
  }
  return report;
}

std::vector<project>
version_coordinator::get_affected_projects(const std::string &project_name) const {
  return graph_.get_transitive_dependents(project_name);
}

void version_coordinator::clear() {
  projects_.clear();
  project_index_.clear();
  constraints_.clear();
}

} // namespace wsforge
