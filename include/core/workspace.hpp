/**
 * @file workspace.hpp
 * @brief Workspace configuration loading for wsforge
 */

#pragma once

#include "core/models.hpp"
#include "core/toml_reader.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace wsforge {

/**
 * @brief Rules every workspace starts with
 *
 * no-circular-deps (enabled, critical), naming-convention (enabled,
 * warning) and no-cross-layer-deps (disabled, warning).
 */
std::vector<workspace_rule> default_rules();

/**
 * @brief Class for loading a workspace definition
 *
 * Reads the projects, dependency edges, rules and layers of a
 * wsforge.workspace.toml document into a workspace snapshot.
 */
class workspace_config {
public:
  /**
   * @brief Constructor
   *
   * Starts with an empty workspace carrying the default rules.
   */
  workspace_config();

  /**
   * @brief Load a workspace configuration file
   *
   * The workspace root is the directory containing the file.
   *
   * @param workspace_file Path to the workspace configuration file
   * @return true if successful; otherwise see last_error()
   */
  bool load(const std::string &workspace_file);

  /**
   * @brief Load a workspace configuration from TOML text
   *
   * @param content The document text
   * @param source_name Name used in error messages
   * @return true if successful; otherwise see last_error()
   */
  bool parse(const std::string &content,
             const std::string &source_name = "<memory>");

  const workspace &get_workspace() const { return workspace_; }
  workspace &get_workspace() { return workspace_; }

  /**
   * @brief Get the reason the last load failed
   */
  const std::string &last_error() const { return error_; }

  /**
   * @brief Get a configured rule by name
   *
   * @return Pointer to the rule, or nullptr if there is none
   */
  const workspace_rule *get_rule(const std::string &name) const;

  /**
   * @brief Enable a configured rule
   *
   * @return false if no rule has that name
   */
  bool enable_rule(const std::string &name);

  /**
   * @brief Disable a configured rule
   *
   * @return false if no rule has that name
   */
  bool disable_rule(const std::string &name);

private:
  bool read(const toml_reader &reader, const std::filesystem::path &root);
  bool read_projects(const toml_reader &reader, workspace &ws);
  bool read_dependencies(const toml_reader &reader, workspace &ws);
  bool read_rules(const toml_reader &reader, workspace &ws);
  bool read_layers(const toml_reader &reader, workspace &ws);
  bool fail(const std::string &message);

  workspace_rule *find_rule(const std::string &name);

  workspace workspace_;
  std::string error_;
};

} // namespace wsforge
