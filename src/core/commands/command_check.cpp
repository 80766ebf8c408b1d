/**
 * @file command_check.cpp
 * @brief Implementation of the 'check' command to evaluate workspace rules
 */

#include "core/commands.hpp"
#include "core/errors.hpp"
#include "core/rules_validator.hpp"
#include "wsforge/log.hpp"

#include <chrono>
#include <fmt/core.h>
#include <string>

namespace wsforge {

wsforge_int_t cmd_check(const command_context &ctx) {
  auto start = std::chrono::steady_clock::now();

  workspace_config config;
  if (!load_workspace(ctx, config)) {
    return 1;
  }

  // Apply rule toggles in the order they were given
  for (wsforge_size_t i = 0; i < ctx.args.size(); ++i) {
    const std::string &arg = ctx.args[i];
    if (arg != "--enable" && arg != "--disable") {
      logger::print_error("Unknown option for check: " + arg);
      return 1;
    }
    if (i + 1 >= ctx.args.size()) {
      logger::print_error("Missing rule name after " + arg);
      return 1;
    }

    const std::string &rule = ctx.args[++i];
    bool found = arg == "--enable" ? config.enable_rule(rule)
                                   : config.disable_rule(rule);
    if (!found) {
      logger::print_error("No rule named '" + rule + "'");
      return 1;
    }
  }

  const workspace &ws = config.get_workspace();
  logger::checking("workspace " + ws.name);

  validation_result result;
  try {
    rules_validator validator(ws);
    result = validator.validate_all();
  } catch (const orchestration_error &e) {
    logger::print_error(e.what());
    return 1;
  }

  for (const auto &note : result.warnings) {
    logger::print_warning(note);
  }
  for (const auto &v : result.violations) {
    logger::violation(violation_severity_to_string(v.severity),
                      "[" + v.rule_name + "] " + v.description);
  }

  auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - start)
                         .count();
  std::string duration_str = fmt::format("{:.2f}s", duration_ms / 1000.0);

  if (!result.passed) {
    logger::print_error(std::to_string(result.violations.size()) +
                        " violation(s) in workspace " + ws.name);
    return 1;
  }

  logger::finished("check of " + std::to_string(ws.projects.size()) +
                       " project(s)",
                   duration_str);
  return 0;
}

} // namespace wsforge
