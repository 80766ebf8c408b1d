/**
 * @file main.cpp
 * @brief Main entry point for wsforge
 */

#include "core/commands.hpp"

/**
 * @brief Main function
 *
 * @param argc Argument count
 * @param argv Argument values
 * @return int Exit code
 */
int main(int argc, char *argv[]) {
  wsforge::command_context ctx;
  if (!wsforge::parse_command_line(argc, argv, ctx)) {
    return 1;
  }
  return wsforge::dispatch_command(ctx);
}
