/**
 * @file command_plan.cpp
 * @brief Implementation of the 'plan' command to coordinate version updates
 */

#include "core/commands.hpp"
#include "core/errors.hpp"
#include "core/version_coordinator.hpp"
#include "wsforge/log.hpp"

#include <fmt/color.h>
#include <fmt/core.h>
#include <string>
#include <utility>
#include <vector>

namespace wsforge {

/**
 * @brief Split "name=version" arguments
 *
 * @return false if an argument has no '=' or an empty side
 */
static bool parse_update_requests(
    const std::vector<std::string> &args,
    std::vector<std::pair<std::string, std::string>> &requests) {
  for (const auto &arg : args) {
    auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == arg.size()) {
      logger::print_error("Expected <project>=<version>, got '" + arg + "'");
      return false;
    }
    requests.emplace_back(arg.substr(0, eq), arg.substr(eq + 1));
  }
  return true;
}

wsforge_int_t cmd_plan(const command_context &ctx) {
  std::vector<std::pair<std::string, std::string>> requests;
  if (ctx.args.empty()) {
    logger::print_error("Usage: wsforge plan <project>=<version>...");
    return 1;
  }
  if (!parse_update_requests(ctx.args, requests)) {
    return 1;
  }

  workspace_config config;
  if (!load_workspace(ctx, config)) {
    return 1;
  }
  const workspace &ws = config.get_workspace();

  version_update_plan plan;
  std::vector<std::string> incompatible;

  try {
    version_coordinator coordinator(build_workspace_graph(ws));
    for (const auto &p : ws.projects) {
      coordinator.register_project(p);
    }

    try {
      coordinator.validate_all_dependencies();
    } catch (const orchestration_error &e) {
      logger::print_warning(std::string("Workspace is already inconsistent: ") +
                            e.what());
    }

    logger::planning(std::to_string(requests.size()) + " version update(s)");
    plan = coordinator.plan_version_updates(requests);

    for (const auto &step : plan.updates) {
      try {
        coordinator.validate_dependent_constraints(step.project,
                                                   step.new_version);
      } catch (const orchestration_error &e) {
        incompatible.push_back(e.what());
      }
    }

    for (const auto &step : plan.updates) {
      fmt::print("  {} {} -> {}", step.project,
                 coordinator.get_version(step.project).value_or("?"),
                 step.new_version);
      if (step.is_breaking) {
        fmt::print(fg(fmt::color::yellow), " (breaking)");
      }
      fmt::print("\n");
      for (const auto &dependent : step.dependents) {
        fmt::print(fg(fmt::color::dim_gray), "      needed by {}\n", dependent);
      }
    }
  } catch (const orchestration_error &e) {
    logger::print_error(e.what());
    return 1;
  }

  for (const auto &message : plan.validation_errors) {
    logger::print_error(message);
  }
  for (const auto &message : incompatible) {
    logger::print_error(message);
  }

  if (!plan.is_valid || !incompatible.empty()) {
    logger::print_error("Version plan is invalid");
    return 1;
  }

  logger::finished(std::to_string(plan.updates.size()) + " update(s) affecting " +
                   std::to_string(plan.total_affected) + " project(s)");
  return 0;
}

} // namespace wsforge
