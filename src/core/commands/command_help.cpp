/**
 * @file command_help.cpp
 * @brief Implementation of the 'help' command to provide usage information
 */

#include "core/commands.hpp"
#include "core/constants.h"
#include "wsforge/log.hpp"

#include <string>

namespace wsforge {

wsforge_int_t cmd_help(const command_context &ctx) {
  std::string specific_command;

  // Check if a specific command was requested
  if (!ctx.args.empty() && ctx.args[0][0] != '-') {
    specific_command = ctx.args[0];
  }

  if (specific_command.empty()) {
    logger::print_plain("wsforge - workspace dependency and policy tool");
    logger::print_plain("");
    logger::print_plain("Available commands:");
    logger::print_plain("  check     Evaluate the workspace rules");
    logger::print_plain("  deps      Show direct dependencies and dependents");
    logger::print_plain("  affected  Show every project depending on a project");
    logger::print_plain("  order     Show the dependency-first execution order");
    logger::print_plain("  plan      Plan a batch of version updates");
    logger::print_plain("  version   Show version information");
    logger::print_plain("  help      Show help for a specific command");
    logger::print_plain("");
    logger::print_plain("Usage: wsforge [--verbose|--quiet] [--file <path>] "
                        "<command> [options]");
    logger::print_plain("");
    logger::print_plain(std::string("The workspace is read from ./") +
                        WORKSPACE_FILE + " unless --file is given.");
    logger::print_plain("For more information on a specific command, run "
                        "'wsforge help <command>'");
  } else if (specific_command == "check") {
    logger::print_plain("wsforge check - Evaluate the workspace rules");
    logger::print_plain("");
    logger::print_plain("Usage: wsforge check [options]");
    logger::print_plain("");
    logger::print_plain("Options:");
    logger::print_plain("  --enable <rule>   Enable a configured rule");
    logger::print_plain("  --disable <rule>  Disable a configured rule");
    logger::print_plain("");
    logger::print_plain("Exits with 1 when any violation is found.");
  } else if (specific_command == "deps") {
    logger::print_plain("wsforge deps - Show direct dependencies and dependents");
    logger::print_plain("");
    logger::print_plain("Usage: wsforge deps <project>");
    logger::print_plain("");
    logger::print_plain("Version constraints on the project's dependencies "
                        "are checked against their current versions.");
  } else if (specific_command == "affected") {
    logger::print_plain(
        "wsforge affected - Show every project depending on a project");
    logger::print_plain("");
    logger::print_plain("Usage: wsforge affected <project> [version]");
    logger::print_plain("");
    logger::print_plain("With a version, also reports whether moving the "
                        "project to it is breaking.");
  } else if (specific_command == "order") {
    logger::print_plain("wsforge order - Show the execution order");
    logger::print_plain("");
    logger::print_plain("Usage: wsforge order");
    logger::print_plain("");
    logger::print_plain("Projects are grouped into levels; each level only "
                        "depends on earlier ones.");
    logger::print_plain("Exits with 1 when the workspace has a cycle.");
  } else if (specific_command == "plan") {
    logger::print_plain("wsforge plan - Plan a batch of version updates");
    logger::print_plain("");
    logger::print_plain("Usage: wsforge plan <project>=<version>...");
    logger::print_plain("");
    logger::print_plain("Each update is checked against the version constraints "
                        "declared on");
    logger::print_plain("dependency edges that target the project. Exits with 1 "
                        "when the plan is invalid.");
  } else {
    logger::print_error("Unknown command: " + specific_command);
    return 1;
  }

  return 0;
}

} // namespace wsforge
