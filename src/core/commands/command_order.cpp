/**
 * @file command_order.cpp
 * @brief Implementation of the 'order' command to show execution levels
 */

#include "core/commands.hpp"
#include "core/errors.hpp"
#include "wsforge/log.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

namespace wsforge {

wsforge_int_t cmd_order(const command_context &ctx) {
  if (!ctx.args.empty()) {
    logger::print_error("Usage: wsforge order");
    return 1;
  }

  workspace_config config;
  if (!load_workspace(ctx, config)) {
    return 1;
  }

  try {
    dependency_graph graph = build_workspace_graph(config.get_workspace());
    logger::resolving("execution order");

    auto levels = graph.execution_levels();
    for (wsforge_size_t i = 0; i < levels.size(); ++i) {
      fmt::print(fg(fmt::color::cyan) | fmt::emphasis::bold, "Level {}:",
                 i);
      for (const auto &name : levels[i]) {
        fmt::print(" {}", name);
      }
      fmt::print("\n");
    }

    logger::finished(std::to_string(graph.project_count()) + " project(s) in " +
                     std::to_string(levels.size()) + " level(s)");
  } catch (const orchestration_error &e) {
    logger::print_error(e.what());
    if (e.kind() == error_kind::CIRCULAR_DEPENDENCY) {
      logger::print_status("Run 'wsforge check' to see the cycles");
    }
    return 1;
  }

  return 0;
}

} // namespace wsforge
