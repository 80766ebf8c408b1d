/**
 * @file log.hpp
 * @brief Cargo-style logging utilities for wsforge
 *
 * Output format matches Rust's Cargo:
 *   - 12-character right-aligned status word (colored)
 *   - Message follows in default color
 *   - No emojis, no brackets
 */

#ifndef WSFORGE_LOG_HPP
#define WSFORGE_LOG_HPP

#include "core/types.h"

#include <cstdio>
#include <fmt/color.h>
#include <fmt/core.h>
#include <string>

namespace wsforge {

/**
 * @enum log_verbosity
 * @brief Verbosity levels for logging
 */
enum class log_verbosity {
  VERBOSITY_QUIET,  /**< Minimal output, only errors */
  VERBOSITY_NORMAL, /**< Standard output level */
  VERBOSITY_VERBOSE /**< Detailed output for debugging */
};

/**
 * @class logger
 * @brief Static class providing Cargo-style logging functionality
 *
 * All output follows Cargo's format:
 *   {status:>12} {message}
 *
 * Where status is a colored action word like "Checking", "Planning", etc.
 */
class logger {
public:
  // ============================================================
  // Configuration
  // ============================================================

  /**
   * @brief Sets the global verbosity level for logging
   * @param level The verbosity level to set
   */
  static void set_verbosity(log_verbosity level);

  // ============================================================
  // Cargo-style status messages (right-aligned status word)
  // ============================================================

  /**
   * @brief Print a cyan status message (info/progress)
   */
  static void print_status(const std::string &message);

  /**
   * @brief Print a yellow warning message
   */
  static void print_warning(const std::string &message);

  /**
   * @brief Print a red error message
   */
  static void print_error(const std::string &message);

  /**
   * @brief Print a gray verbose/debug message
   */
  static void print_verbose(const std::string &message);

  // ============================================================
  // Specific action helpers (Cargo-style)
  // ============================================================

  /// Print "Loading {target}"
  static void loading(const std::string &target);

  /// Print "Checking {target}"
  static void checking(const std::string &target);

  /// Print "Planning {target}"
  static void planning(const std::string &target);

  /// Print "Resolving {target}"
  static void resolving(const std::string &target);

  /**
   * @brief Print "Finished {what}" with an optional duration
   */
  static void finished(const std::string &what, const std::string &time = "");

  /**
   * @brief Print a violation line with a severity-colored status word
   *
   * @param severity One of "info", "warning", "critical"
   * @param message The violation description
   */
  static void violation(const std::string &severity,
                        const std::string &message);

  // ============================================================
  // Plain output
  // ============================================================

  /**
   * @brief Print a plain message (no status prefix)
   */
  static void print_plain(const std::string &message);

private:
  static log_verbosity s_verbosity;

  // Status width for right-alignment (Cargo uses 12)
  static constexpr int STATUS_WIDTH = 12;

  static bool is_quiet() { return s_verbosity == log_verbosity::VERBOSITY_QUIET; }

  /// Green progress line, suppressed when quiet
  static void print_progress(const std::string &status,
                             const std::string &target);

  /**
   * @brief Internal helper to print formatted status line
   */
  static void print_status_line(const std::string &status,
                                const std::string &message,
                                fmt::color status_color, bool is_bold = true,
                                FILE *stream = stdout);
};

} // namespace wsforge

#endif // WSFORGE_LOG_HPP
