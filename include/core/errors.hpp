/**
 * @file errors.hpp
 * @brief Error taxonomy for the orchestration core
 */

#pragma once

#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace wsforge {

/**
 * @brief Kind of failure reported by an orchestration operation
 */
enum class error_kind {
  DUPLICATE_PROJECT,     // A project with the same name is already registered
  UNKNOWN_PROJECT,       // An operation referenced an unregistered project
  INVALID_VERSION,       // Malformed semver string
  INCOMPATIBLE_VERSION,  // Version rejected by a registered constraint
  CIRCULAR_DEPENDENCY,   // Ordering impossible because of a cycle
  INVALID_CONFIGURATION  // Malformed rule, constraint or workspace data
};

/**
 * @brief Get the name of an error kind
 */
inline const char *error_kind_to_string(error_kind kind) {
  switch (kind) {
  case error_kind::DUPLICATE_PROJECT:
    return "duplicate project";
  case error_kind::UNKNOWN_PROJECT:
    return "unknown project";
  case error_kind::INVALID_VERSION:
    return "invalid version";
  case error_kind::INCOMPATIBLE_VERSION:
    return "incompatible version";
  case error_kind::CIRCULAR_DEPENDENCY:
    return "circular dependency";
  case error_kind::INVALID_CONFIGURATION:
    return "invalid configuration";
  }
  return "unknown error";
}

/**
 * @brief Exception thrown by the dependency graph, version coordinator and
 * rules validator
 *
 * Carries the error kind and the identifiers involved (project names,
 * version strings, constraint strings, rule names) so callers can render
 * their own message or pick a remediation.
 */
class orchestration_error : public std::exception {
public:
  orchestration_error(error_kind kind, std::string message,
                      std::vector<std::string> subjects = {})
      : kind_(kind), subjects_(std::move(subjects)) {
    message_ = std::string(error_kind_to_string(kind)) + ": " + message;
  }

  error_kind kind() const noexcept { return kind_; }

  /**
   * @brief Identifiers affected by the failure, most specific first
   */
  const std::vector<std::string> &subjects() const noexcept {
    return subjects_;
  }

  const char *what() const noexcept override { return message_.c_str(); }

private:
  error_kind kind_;
  std::string message_;
  std::vector<std::string> subjects_;
};

} // namespace wsforge
