/**
 * @file command_deps.cpp
 * @brief Implementation of the 'deps' and 'affected' commands
 */

#include "core/commands.hpp"
#include "core/dependency_graph.hpp"
#include "core/errors.hpp"
#include "core/version_coordinator.hpp"
#include "wsforge/log.hpp"

#include <fmt/color.h>
#include <fmt/core.h>
#include <string>
#include <utility>

namespace wsforge {

static void print_project_list(const std::string &title,
                               const std::vector<project> &projects) {
  fmt::print(fg(fmt::color::cyan) | fmt::emphasis::bold, "{}:\n", title);
  if (projects.empty()) {
    fmt::print("  (none)\n");
    return;
  }
  for (const auto &p : projects) {
    fmt::print("  {} ", p.name);
    fmt::print(fg(fmt::color::dim_gray), "v{}\n", p.version);
  }
}

static bool read_project_argument(const command_context &ctx,
                                  std::string &name) {
  if (ctx.args.size() != 1) {
    logger::print_error("Usage: wsforge " + ctx.command + " <project>");
    return false;
  }
  name = ctx.args[0];
  return true;
}

wsforge_int_t cmd_deps(const command_context &ctx) {
  std::string name;
  if (!read_project_argument(ctx, name)) {
    return 1;
  }

  workspace_config config;
  if (!load_workspace(ctx, config)) {
    return 1;
  }

  try {
    dependency_graph graph = build_workspace_graph(config.get_workspace());
    if (!graph.has_project(name)) {
      logger::print_error("No project named '" + name + "' in the workspace");
      return 1;
    }

    logger::resolving(name);
    print_project_list("Dependencies", graph.get_dependencies(name));
    print_project_list("Dependents", graph.get_dependents(name));

    version_coordinator coordinator(std::move(graph));
    for (const auto &p : config.get_workspace().projects) {
      coordinator.register_project(p);
    }
    dependency_report report = coordinator.get_dependency_report(name);
    for (const auto &check : report.dependencies) {
      if (check.constraint.empty()) {
        continue;
      }
      fmt::print("  {} {} ", check.target, check.constraint);
      if (check.satisfied) {
        fmt::print(fg(fmt::color::green), "ok\n");
      } else {
        fmt::print(fg(fmt::color::red), "unsatisfied\n");
      }
    }
  } catch (const orchestration_error &e) {
    logger::print_error(e.what());
    return 1;
  }

  return 0;
}

wsforge_int_t cmd_affected(const command_context &ctx) {
  if (ctx.args.empty() || ctx.args.size() > 2) {
    logger::print_error("Usage: wsforge affected <project> [version]");
    return 1;
  }
  const std::string &name = ctx.args[0];

  workspace_config config;
  if (!load_workspace(ctx, config)) {
    return 1;
  }

  try {
    version_coordinator coordinator(build_workspace_graph(config.get_workspace()));
    if (!coordinator.get_graph().has_project(name)) {
      logger::print_error("No project named '" + name + "' in the workspace");
      return 1;
    }

    logger::resolving(name);
    print_project_list("Affected by " + name,
                       coordinator.get_affected_projects(name));

    if (ctx.args.size() == 2) {
      for (const auto &p : config.get_workspace().projects) {
        coordinator.register_project(p);
      }
      impact_report impact = coordinator.analyze_impact(name, ctx.args[1]);
      fmt::print("Impact of {} {}: ", name, impact.new_version);
      fmt::print(impact.level == impact_level::BREAKING
                     ? fg(fmt::color::yellow)
                     : fg(fmt::color::green),
                 "{}\n", impact_level_to_string(impact.level));
    }
  } catch (const orchestration_error &e) {
    logger::print_error(e.what());
    return 1;
  }

  return 0;
}

} // namespace wsforge
