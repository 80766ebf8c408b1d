/**
 * @file log.cpp
 * @brief Cargo-style logging implementation
 *
 * Output format:
 *   {status:>12} {message}
 *
 * Examples:
 *        Loading wsforge.workspace.toml
 *       Checking workspace demo
 *       critical [no-circular-deps] Circular dependency: core -> cli -> core
 *       Finished check of 4 project(s) in 0.01s
 */

#include "wsforge/log.hpp"

namespace wsforge {

log_verbosity logger::s_verbosity = log_verbosity::VERBOSITY_NORMAL;

void logger::set_verbosity(log_verbosity level) { s_verbosity = level; }

void logger::print_status_line(const std::string &status,
                               const std::string &message,
                               fmt::color status_color, bool is_bold,
                               FILE *stream) {
  // Right-align status word to STATUS_WIDTH characters
  if (is_bold) {
    fmt::print(stream, fg(status_color) | fmt::emphasis::bold, "{:>{}}", status,
               STATUS_WIDTH);
  } else {
    fmt::print(stream, fg(status_color), "{:>{}}", status, STATUS_WIDTH);
  }
  fmt::print(stream, " {}\n", message);
}

void logger::print_progress(const std::string &status,
                            const std::string &target) {
  if (!is_quiet()) {
    print_status_line(status, target, fmt::color::green);
  }
}

void logger::print_status(const std::string &message) {
  if (!is_quiet()) {
    print_status_line("", message, fmt::color::cyan);
  }
}

void logger::print_warning(const std::string &message) {
  if (!is_quiet()) {
    print_status_line("warning", message, fmt::color::yellow, true, stderr);
  }
}

void logger::print_error(const std::string &message) {
  // Errors always show
  print_status_line("error", message, fmt::color::red, true, stderr);
}

void logger::print_verbose(const std::string &message) {
  if (s_verbosity == log_verbosity::VERBOSITY_VERBOSE) {
    print_status_line("", message, fmt::color::gray, false);
  }
}

void logger::loading(const std::string &target) {
  print_progress("Loading", target);
}

void logger::checking(const std::string &target) {
  print_progress("Checking", target);
}

void logger::planning(const std::string &target) {
  print_progress("Planning", target);
}

void logger::resolving(const std::string &target) {
  print_progress("Resolving", target);
}

void logger::finished(const std::string &what, const std::string &time) {
  print_progress("Finished", time.empty() ? what : what + " in " + time);
}

void logger::violation(const std::string &severity,
                       const std::string &message) {
  // Violations are the result of a check and show even when quiet
  if (severity == "critical") {
    print_status_line(severity, message, fmt::color::red, true, stderr);
  } else if (severity == "warning") {
    print_status_line(severity, message, fmt::color::yellow, true, stderr);
  } else {
    print_status_line(severity, message, fmt::color::cyan, false);
  }
}

void logger::print_plain(const std::string &message) {
  fmt::print("{}\n", message);
}

} // namespace wsforge
