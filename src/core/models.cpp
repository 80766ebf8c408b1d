/**
 * @file models.cpp
 * @brief String conversions for the shared data types
 */

#include "core/models.hpp"

#include <algorithm>
#include <cctype>

namespace wsforge {

static std::string normalize_key(const std::string &str) {
  std::string result = str;
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  std::replace(result.begin(), result.end(), '_', '-');
  return result;
}

bool architecture_layer::contains(const std::string &project_name) const {
  for (const auto &member : members) {
    if (!member.empty() && member.back() == '*') {
      std::string prefix = member.substr(0, member.size() - 1);
      if (project_name.compare(0, prefix.size(), prefix) == 0) {
        return true;
      }
    } else if (member == project_name) {
      return true;
    }
  }
  return false;
}

const char *project_status_to_string(project_status status) {
  switch (status) {
  case project_status::HEALTHY:
    return "healthy";
  case project_status::WARNING:
    return "warning";
  case project_status::CRITICAL:
    return "critical";
  case project_status::UNKNOWN:
    return "unknown";
  }
  return "unknown";
}

const char *dependency_type_to_string(dependency_type type) {
  switch (type) {
  case dependency_type::DIRECT:
    return "direct";
  case dependency_type::TRANSITIVE:
    return "transitive";
  case dependency_type::DEV:
    return "dev";
  }
  return "direct";
}

const char *rule_type_to_string(rule_type type) {
  switch (type) {
  case rule_type::DEPENDENCY_CONSTRAINT:
    return "dependency-constraint";
  case rule_type::NAMING_CONVENTION:
    return "naming-convention";
  case rule_type::ARCHITECTURAL_BOUNDARY:
    return "architectural-boundary";
  }
  return "dependency-constraint";
}

const char *violation_severity_to_string(violation_severity severity) {
  switch (severity) {
  case violation_severity::INFO:
    return "info";
  case violation_severity::WARNING:
    return "warning";
  case violation_severity::CRITICAL:
    return "critical";
  }
  return "warning";
}

std::optional<project_status> parse_project_status(const std::string &str) {
  std::string key = normalize_key(str);
  if (key == "healthy")
    return project_status::HEALTHY;
  if (key == "warning")
    return project_status::WARNING;
  if (key == "critical")
    return project_status::CRITICAL;
  if (key == "unknown")
    return project_status::UNKNOWN;
  return std::nullopt;
}

std::optional<dependency_type> parse_dependency_type(const std::string &str) {
  std::string key = normalize_key(str);
  if (key == "direct")
    return dependency_type::DIRECT;
  if (key == "transitive")
    return dependency_type::TRANSITIVE;
  if (key == "dev")
    return dependency_type::DEV;
  return std::nullopt;
}

std::optional<rule_type> parse_rule_type(const std::string &str) {
  std::string key = normalize_key(str);
  if (key == "dependency-constraint")
    return rule_type::DEPENDENCY_CONSTRAINT;
  if (key == "naming-convention")
    return rule_type::NAMING_CONVENTION;
  if (key == "architectural-boundary")
    return rule_type::ARCHITECTURAL_BOUNDARY;
  return std::nullopt;
}

std::optional<violation_severity>
parse_violation_severity(const std::string &str) {
  std::string key = normalize_key(str);
  if (key == "info")
    return violation_severity::INFO;
  if (key == "warning")
    return violation_severity::WARNING;
  if (key == "critical")
    return violation_severity::CRITICAL;
  return std::nullopt;
}

} // namespace wsforge
