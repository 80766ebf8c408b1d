/**
 * @file command_dispatch.cpp
 * @brief Command line parsing and command dispatch
 */

#include "core/commands.hpp"
#include "core/constants.h"
#include "wsforge/log.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace wsforge {

bool parse_command_line(int argc, char *argv[], command_context &ctx) {
  ctx = command_context();
  ctx.workspace_file =
      (std::filesystem::current_path() / WORKSPACE_FILE).string();

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];

    if (arg == "-v" || arg == "--verbose") {
      logger::set_verbosity(log_verbosity::VERBOSITY_VERBOSE);
    } else if (arg == "-q" || arg == "--quiet") {
      logger::set_verbosity(log_verbosity::VERBOSITY_QUIET);
    } else if (arg == "-f" || arg == "--file") {
      if (i + 1 >= argc) {
        logger::print_error("Missing path after " + arg);
        return false;
      }
      ctx.workspace_file = argv[++i];
    } else if (ctx.command.empty()) {
      // First free argument is the command
      ctx.command = arg;
    } else {
      ctx.args.push_back(arg);
    }
  }

  return true;
}

bool load_workspace(const command_context &ctx, workspace_config &config) {
  if (!config.load(ctx.workspace_file)) {
    logger::print_status("Use --file to point at a " +
                         std::string(WORKSPACE_FILE));
    return false;
  }
  return true;
}

dependency_graph build_workspace_graph(const workspace &ws) {
  dependency_graph graph;
  for (const auto &p : ws.projects) {
    graph.add_project(p);
  }
  for (const auto &dep : ws.dependencies) {
    graph.add_dependency(dep);
  }
  return graph;
}

wsforge_int_t dispatch_command(const command_context &ctx) {
  // No command specified, show help
  if (ctx.command.empty()) {
    return cmd_help(ctx);
  }

  if (ctx.command == "check") {
    return cmd_check(ctx);
  } else if (ctx.command == "deps") {
    return cmd_deps(ctx);
  } else if (ctx.command == "affected") {
    return cmd_affected(ctx);
  } else if (ctx.command == "order") {
    return cmd_order(ctx);
  } else if (ctx.command == "plan") {
    return cmd_plan(ctx);
  } else if (ctx.command == "help" || ctx.command == "--help" ||
             ctx.command == "-h") {
    return cmd_help(ctx);
  } else if (ctx.command == "version" || ctx.command == "--version") {
    logger::print_plain(std::string("wsforge ") + WSFORGE_VERSION);
    return 0;
  }

  logger::print_error("Unknown command: " + ctx.command);
  logger::print_status("Run 'wsforge help' for usage information");
  return 1;
}

} // namespace wsforge
