/**
 * @file commands.hpp
 * @brief Declarations for wsforge command handlers
 */

#pragma once

#include "core/dependency_graph.hpp"
#include "core/types.h"
#include "core/workspace.hpp"

#include <string>
#include <vector>

namespace wsforge {

/**
 * @brief Parsed command line shared by all command handlers
 */
struct command_context {
  std::string command;
  std::string workspace_file; // Defaults to ./wsforge.workspace.toml
  std::vector<std::string> args; // Arguments after the command name
};

/**
 * @brief Parse command line arguments into a context
 *
 * Global options (--verbose, --quiet, --file) may appear anywhere; they
 * are applied to the logger or stored in the context.
 *
 * @return false if the arguments are malformed
 */
bool parse_command_line(int argc, char *argv[], command_context &ctx);

/**
 * @brief Dispatch a command based on the parsed context
 *
 * @return Exit code (0 for success)
 */
wsforge_int_t dispatch_command(const command_context &ctx);

/**
 * @brief Load the workspace named by the context
 *
 * @return false if the file could not be loaded; the reason is logged
 */
bool load_workspace(const command_context &ctx, workspace_config &config);

/**
 * @brief Build a graph from a loaded workspace
 *
 * @throws orchestration_error if the workspace repeats a project or points
 * at an undeclared one
 */
dependency_graph build_workspace_graph(const workspace &ws);

/**
 * @brief Handle the 'check' command: evaluate the workspace rules
 */
wsforge_int_t cmd_check(const command_context &ctx);

/**
 * @brief Handle the 'deps' command: direct dependencies and dependents
 */
wsforge_int_t cmd_deps(const command_context &ctx);

/**
 * @brief Handle the 'affected' command: transitive dependents
 */
wsforge_int_t cmd_affected(const command_context &ctx);

/**
 * @brief Handle the 'order' command: execution levels
 */
wsforge_int_t cmd_order(const command_context &ctx);

/**
 * @brief Handle the 'plan' command: version update planning
 */
wsforge_int_t cmd_plan(const command_context &ctx);

/**
 * @brief Handle the 'help' command
 */
wsforge_int_t cmd_help(const command_context &ctx);

} // namespace wsforge
