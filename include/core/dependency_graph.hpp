/**
 * @file dependency_graph.hpp
 * @brief Project dependency graph with adjacency queries and cycle detection
 */

#pragma once

#include "core/models.hpp"
#include "core/types.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace wsforge {

/**
 * @brief Directed graph of projects and their dependency edges
 *
 * Edges point from the dependent project to its dependency. Multiple edges
 * between the same pair are kept. Cycles are allowed in the graph; they are
 * reported by find_cycles() and refused by the ordering functions.
 *
 * Adjacency is indexed incrementally by add_dependency(), so both
 * get_dependencies() and get_dependents() cost O(edges incident to the
 * queried node).
 */
class dependency_graph {
public:
  /**
   * @brief Constructor
   *
   * @param directed When true, dependents are served from a mirrored reverse
   * index. When false, a single symmetric incidence index serves both
   * directions. Query results are the same either way.
   */
  explicit dependency_graph(bool directed = true);

  bool is_directed() const { return directed_; }

  /**
   * @brief Register a project
   *
   * @throws orchestration_error DUPLICATE_PROJECT if the name is taken; the
   * existing project is left unchanged
   */
  void add_project(const project &p);

  /**
   * @brief Add a dependency edge
   *
   * @throws orchestration_error UNKNOWN_PROJECT if either endpoint is not
   * registered
   */
  void add_dependency(const project_dependency &dep);

  /**
   * @brief Remove every edge from one project to another
   *
   * Removing an edge that does not exist is not an error.
   */
  void remove_dependency(const std::string &from, const std::string &to);

  /**
   * @brief Get all projects in registration order
   */
  std::vector<project> get_projects() const;

  /**
   * @brief Get the projects a project directly depends on
   *
   * Unique by target, in first-seen order. Empty for unknown projects.
   */
  std::vector<project> get_dependencies(const std::string &name) const;

  /**
   * @brief Get the projects that directly depend on a project
   *
   * Unique by source, in first-seen order. Empty for unknown projects.
   */
  std::vector<project> get_dependents(const std::string &name) const;

  /**
   * @brief Get everything a project depends on, directly or not
   *
   * Breadth-first, excluding the project itself.
   */
  std::vector<project>
  get_transitive_dependencies(const std::string &name) const;

  /**
   * @brief Get everything that depends on a project, directly or not
   *
   * Breadth-first, excluding the project itself.
   */
  std::vector<project> get_transitive_dependents(const std::string &name) const;

  bool has_project(const std::string &name) const;

  /**
   * @brief Get a project by name
   * @return Pointer to the project, or nullptr if not registered
   */
  const project *get_project(const std::string &name) const;

  /**
   * @brief Update the status of a registered project
   * @throws orchestration_error UNKNOWN_PROJECT
   */
  void set_project_status(const std::string &name, project_status status);

  /**
   * @brief Update the version of a registered project
   * @throws orchestration_error UNKNOWN_PROJECT
   */
  void set_project_version(const std::string &name, const std::string &version);

  bool has_dependency(const std::string &from, const std::string &to) const;

  /**
   * @brief Get all edges in insertion order
   */
  const std::vector<project_dependency> &get_all_dependencies() const {
    return edges_;
  }

  wsforge_size_t project_count() const { return projects_.size(); }
  wsforge_size_t dependency_count() const { return edges_.size(); }

  /**
   * @brief Check if a project can reach another through dependency edges
   *
   * A project always reaches itself.
   */
  bool can_reach(const std::string &from, const std::string &to) const;

  /**
   * @brief Find dependency cycles
   *
   * Iterative depth-first search. Every back edge yields one cycle, listed
   * from the first project on the cycle that the search entered. A project
   * depending on itself yields a single-element cycle.
   */
  std::vector<std::vector<std::string>> find_cycles() const;

  bool has_cycles() const { return !find_cycles().empty(); }

  /**
   * @brief Order projects so every dependency precedes its dependents
   *
   * @throws orchestration_error CIRCULAR_DEPENDENCY naming the projects that
   * could not be ordered
   */
  std::vector<std::string> topological_sort() const;

  /**
   * @brief Group projects into levels of mutually independent projects
   *
   * Level 0 holds the projects without dependencies; every project appears
   * after all of its dependencies.
   *
   * @throws orchestration_error CIRCULAR_DEPENDENCY
   */
  std::vector<std::vector<std::string>> execution_levels() const;

  /**
   * @brief Remove all projects and edges
   */
  void clear();

private:
  struct incidence {
    wsforge_size_t edge;
    bool outgoing; // True when the indexed project is the edge's source
  };

  void index_edge(wsforge_size_t edge);
  void rebuild_indices();

  /// Unique neighbor names in first-seen order
  std::vector<std::string> neighbor_names(const std::string &name,
                                          bool outgoing) const;
  std::vector<std::string> reachable_names(const std::string &name,
                                           bool outgoing) const;
  std::vector<project> to_projects(const std::vector<std::string> &names) const;

  bool directed_;
  std::vector<project> projects_;
  std::unordered_map<std::string, wsforge_size_t> project_index_;
  std::vector<project_dependency> edges_;

  // Directed: outgoing edges per project. Undirected: every incident edge.
  std::unordered_map<std::string, std::vector<incidence>> forward_;
  // Directed only: incoming edges per project
  std::unordered_map<std::string, std::vector<incidence>> reverse_;
};

/**
 * @brief Extract the names of a list of projects
 */
inline std::vector<std::string> project_names(const std::vector<project> &projects) {
  std::vector<std::string> names;
  names.reserve(projects.size());
  for (const auto &p : projects) {
    names.push_back(p.name);
  }
  return names;
}

} // namespace wsforge
