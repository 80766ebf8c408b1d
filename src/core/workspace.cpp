/**
 * @file workspace.cpp
 * @brief Implementation of workspace configuration loading
 */

#include "core/workspace.hpp"
#include "core/constants.h"
#include "wsforge/log.hpp"

#include <algorithm>
#include <limits>

namespace wsforge {

std::vector<workspace_rule> default_rules() {
  return {
      {RULE_NO_CIRCULAR_DEPS, rule_type::DEPENDENCY_CONSTRAINT, true,
       violation_severity::CRITICAL},
      {RULE_NAMING_CONVENTION, rule_type::NAMING_CONVENTION, true,
       violation_severity::WARNING},
      {RULE_NO_CROSS_LAYER_DEPS, rule_type::ARCHITECTURAL_BOUNDARY, false,
       violation_severity::WARNING},
  };
}

workspace_config::workspace_config() {
  workspace_.settings.rules = default_rules();
}

bool workspace_config::load(const std::string &workspace_file) {
  error_.clear();
  logger::loading(workspace_file);

  toml_reader reader;
  if (!reader.load(workspace_file)) {
    return fail(reader.last_error());
  }

  std::filesystem::path root =
      std::filesystem::absolute(workspace_file).parent_path();
  return read(reader, root);
}

bool workspace_config::parse(const std::string &content,
                             const std::string &source_name) {
  error_.clear();

  toml_reader reader;
  if (!reader.parse(content, source_name)) {
    return fail(reader.last_error());
  }
  return read(reader, std::filesystem::current_path());
}

bool workspace_config::fail(const std::string &message) {
  error_ = message;
  logger::print_error("Failed to load workspace configuration: " + message);
  return false;
}

bool workspace_config::read(const toml_reader &reader,
                            const std::filesystem::path &root) {
  static const std::vector<std::string> known_tables = {
      "workspace", "project", "dependency", "rule", "layer"};
  for (const auto &key : reader.get_table_keys()) {
    if (std::find(known_tables.begin(), known_tables.end(), key) ==
        known_tables.end()) {
      logger::print_warning("Ignoring unknown workspace key '" + key + "'");
    }
  }

  // Build into a fresh snapshot so a failed load leaves the old one intact
  workspace ws;
  ws.root = root;
  ws.name = reader.get_string("workspace.name", root.filename().string());
  ws.settings.rules = default_rules();
  ws.settings.naming_convention = reader.get_string(
      "workspace.naming_convention", DEFAULT_NAMING_CONVENTION);
  ws.settings.naming_pattern = reader.get_string("workspace.naming_pattern");

  if (!read_projects(reader, ws) || !read_dependencies(reader, ws) ||
      !read_rules(reader, ws) || !read_layers(reader, ws)) {
    return false;
  }

  workspace_ = std::move(ws);
  logger::print_verbose("Loaded workspace '" + workspace_.name + "' with " +
                        std::to_string(workspace_.projects.size()) +
                        " project(s) and " +
                        std::to_string(workspace_.dependencies.size()) +
                        " dependency edge(s)");
  return true;
}

bool workspace_config::read_projects(const toml_reader &reader, workspace &ws) {
  for (const auto &table : reader.get_table_array("project")) {
    project p;
    p.name = table.get_string("name");
    if (p.name.empty()) {
      return fail("[[project]] entry without a name");
    }

    p.path = table.get_string("path", p.name);
    p.project_type = table.get_string("type", DEFAULT_PROJECT_TYPE);
    p.version = table.get_string("version", DEFAULT_PROJECT_VERSION);

    std::string status = table.get_string("status", "unknown");
    auto parsed_status = parse_project_status(status);
    if (!parsed_status) {
      return fail("project '" + p.name + "' has unknown status '" + status +
                  "'");
    }
    p.status = *parsed_status;

    ws.projects.push_back(p);
  }
  return true;
}

bool workspace_config::read_dependencies(const toml_reader &reader,
                                         workspace &ws) {
  for (const auto &table : reader.get_table_array("dependency")) {
    project_dependency dep;
    dep.from = table.get_string("from");
    dep.to = table.get_string("to");
    if (dep.from.empty() || dep.to.empty()) {
      return fail("[[dependency]] entry needs both 'from' and 'to'");
    }

    std::string type = table.get_string("type", "direct");
    auto parsed_type = parse_dependency_type(type);
    if (!parsed_type) {
      return fail("dependency " + dep.from + " -> " + dep.to +
                  " has unknown type '" + type + "'");
    }
    dep.type = *parsed_type;
    dep.version_constraint = table.get_string("version");

    ws.dependencies.push_back(dep);
  }
  return true;
}

bool workspace_config::read_rules(const toml_reader &reader, workspace &ws) {
  for (const auto &table : reader.get_table_array("rule")) {
    std::string name = table.get_string("name");
    if (name.empty()) {
      return fail("[[rule]] entry without a name");
    }

    auto existing =
        std::find_if(ws.settings.rules.begin(), ws.settings.rules.end(),
                     [&](const workspace_rule &r) { return r.name == name; });

    workspace_rule rule;
    rule.name = name;
    if (existing != ws.settings.rules.end()) {
      rule = *existing;
    } else if (!table.has_key("type")) {
      return fail("rule '" + name + "' needs a type");
    }

    if (table.has_key("type")) {
      std::string type = table.get_string("type");
      auto parsed_type = parse_rule_type(type);
      if (!parsed_type) {
        return fail("rule '" + name + "' has unknown type '" + type + "'");
      }
      rule.type = *parsed_type;
    }

    if (table.has_key("severity")) {
      std::string severity = table.get_string("severity");
      auto parsed_severity = parse_violation_severity(severity);
      if (!parsed_severity) {
        return fail("rule '" + name + "' has unknown severity '" + severity +
                    "'");
      }
      rule.severity = *parsed_severity;
    }

    rule.enabled = table.get_bool("enabled", rule.enabled);

    if (existing != ws.settings.rules.end()) {
      *existing = rule;
    } else {
      ws.settings.rules.push_back(rule);
    }
  }
  return true;
}

bool workspace_config::read_layers(const toml_reader &reader, workspace &ws) {
  for (const auto &table : reader.get_table_array("layer")) {
    architecture_layer layer;
    layer.name = table.get_string("name");
    if (layer.name.empty()) {
      return fail("[[layer]] entry without a name");
    }
    int64_t level = table.get_int("level", 0);
    if (level < std::numeric_limits<int>::min() ||
        level > std::numeric_limits<int>::max()) {
      return fail("[[layer]] '" + layer.name + "' has out of range level " +
                  std::to_string(level));
    }
    layer.level = static_cast<int>(level);
    layer.members = table.get_string_array("members");
    ws.settings.layers.push_back(layer);
  }
  return true;
}

workspace_rule *workspace_config::find_rule(const std::string &name) {
  for (auto &rule : workspace_.settings.rules) {
    if (rule.name == name) {
      return &rule;
    }
  }
  return nullptr;
}

const workspace_rule *workspace_config::get_rule(const std::string &name) const {
  for (const auto &rule : workspace_.settings.rules) {
    if (rule.name == name) {
      return &rule;
    }
  }
  return nullptr;
}

bool workspace_config::enable_rule(const std::string &name) {
  workspace_rule *rule = find_rule(name);
  if (!rule) {
    return false;
  }
  rule->enabled = true;
  return true;
}

bool workspace_config::disable_rule(const std::string &name) {
  workspace_rule *rule = find_rule(name);
  if (!rule) {
    return false;
  }
  rule->enabled = false;
  return true;
}

} // namespace wsforge
