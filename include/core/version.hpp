/**
 * @file version.hpp
 * @brief Semantic version parsing and constraint matching
 *
 * Versions are strict "major.minor.patch" triples (1.2.3). Supported
 * constraints:
 *   - Caret: "^1.2.3" (same major, at least 1.2.3)
 *   - Tilde: "~1.2.3" (same major.minor, at least 1.2.3)
 *   - Comparison: ">=1.2.3"
 */

#pragma once

#include <charconv>
#include <optional>
#include <string>
#include <vector>

namespace wsforge {

/**
 * @brief Parsed semantic version
 */
struct semver {
  int major = 0;
  int minor = 0;
  int patch = 0;

  /**
   * @brief Parse a version string
   *
   * Exactly three dot-separated non-negative integers without leading
   * zeros, so that to_string() reproduces the input.
   *
   * @param version_str Version string (e.g., "1.2.3")
   * @return Parsed version or nullopt if invalid
   */
  static std::optional<semver> parse(const std::string &version_str) {
    if (version_str.empty()) {
      return std::nullopt;
    }

    std::vector<int> parts;
    std::string::size_type start = 0;

    while (start <= version_str.size()) {
      std::string::size_type end = version_str.find('.', start);
      if (end == std::string::npos) {
        end = version_str.size();
      }

      std::string part = version_str.substr(start, end - start);
      auto value = parse_component(part);
      if (!value) {
        return std::nullopt;
      }
      parts.push_back(*value);

      if (end == version_str.size()) {
        break;
      }
      start = end + 1;
    }

    if (parts.size() != 3) {
      return std::nullopt;
    }

    semver v;
    v.major = parts[0];
    v.minor = parts[1];
    v.patch = parts[2];
    return v;
  }

  /**
   * @brief Convert version to its canonical string
   */
  std::string to_string() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." +
           std::to_string(patch);
  }

  /**
   * @brief Compare two versions
   * @return -1 if this < other, 0 if equal, 1 if this > other
   */
  int compare(const semver &other) const {
    if (major != other.major)
      return major < other.major ? -1 : 1;
    if (minor != other.minor)
      return minor < other.minor ? -1 : 1;
    if (patch != other.patch)
      return patch < other.patch ? -1 : 1;
    return 0;
  }

  bool operator<(const semver &other) const { return compare(other) < 0; }
  bool operator<=(const semver &other) const { return compare(other) <= 0; }
  bool operator>(const semver &other) const { return compare(other) > 0; }
  bool operator>=(const semver &other) const { return compare(other) >= 0; }
  bool operator==(const semver &other) const { return compare(other) == 0; }
  bool operator!=(const semver &other) const { return compare(other) != 0; }

private:
  static std::optional<int> parse_component(const std::string &part) {
    if (part.empty()) {
      return std::nullopt;
    }
    // "0" is fine, "01" is not
    if (part.size() > 1 && part[0] == '0') {
      return std::nullopt;
    }
    for (char c : part) {
      if (c < '0' || c > '9') {
        return std::nullopt;
      }
    }

    int value = 0;
    auto [ptr, ec] =
        std::from_chars(part.data(), part.data() + part.size(), value);
    if (ec != std::errc() || ptr != part.data() + part.size()) {
      return std::nullopt;
    }
    return value;
  }
};

/**
 * @brief Check if moving from one version to another changes the major
 * component
 */
inline bool is_breaking_change(const semver &current, const semver &candidate) {
  return current.major != candidate.major;
}

/**
 * @brief Single version constraint
 */
struct version_constraint {
  enum class op_type {
    CARET, // ^, compatible (same major)
    TILDE, // ~, approximately (same major.minor)
    GE     // >=
  };

  op_type op = op_type::GE;
  semver version;

  /**
   * @brief Parse a constraint string
   *
   * Only "^X.Y.Z", "~X.Y.Z" and ">=X.Y.Z" are recognized; surrounding
   * whitespace is ignored.
   *
   * @return Parsed constraint or nullopt for any other form
   */
  static std::optional<version_constraint> parse(const std::string &str) {
    std::string trimmed = str;
    trimmed.erase(0, trimmed.find_first_not_of(" \t"));
    trimmed.erase(trimmed.find_last_not_of(" \t") + 1);

    if (trimmed.empty()) {
      return std::nullopt;
    }

    version_constraint c;
    std::string version_part;

    if (trimmed[0] == '^') {
      c.op = op_type::CARET;
      version_part = trimmed.substr(1);
    } else if (trimmed[0] == '~') {
      c.op = op_type::TILDE;
      version_part = trimmed.substr(1);
    } else if (trimmed.length() > 1 && trimmed[0] == '>' && trimmed[1] == '=') {
      c.op = op_type::GE;
      version_part = trimmed.substr(2);
    } else {
      return std::nullopt;
    }

    version_part.erase(0, version_part.find_first_not_of(" \t"));

    auto v = semver::parse(version_part);
    if (!v) {
      return std::nullopt;
    }

    c.version = *v;
    return c;
  }

  /**
   * @brief Check if a version satisfies this constraint
   */
  bool satisfies(const semver &v) const {
    if (v < version)
      return false;

    switch (op) {
    case op_type::CARET:
      // ^1.2.3 means >=1.2.3 and <2.0.0
      return v.major == version.major;
    case op_type::TILDE:
      // ~1.2.3 means >=1.2.3 and <1.3.0
      return v.major == version.major && v.minor == version.minor;
    case op_type::GE:
      return true;
    }
    return false;
  }

  std::string to_string() const {
    switch (op) {
    case op_type::CARET:
      return "^" + version.to_string();
    case op_type::TILDE:
      return "~" + version.to_string();
    case op_type::GE:
      return ">=" + version.to_string();
    }
    return version.to_string();
  }
};

} // namespace wsforge
