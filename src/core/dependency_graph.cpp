/**
 * @file dependency_graph.cpp
 * @brief Implementation of the project dependency graph
 */

#include "core/dependency_graph.hpp"
#include "core/errors.hpp"
#include "wsforge/log.hpp"

#include <algorithm>
#include <queue>
#include <unordered_set>

namespace wsforge {

dependency_graph::dependency_graph(bool directed) : directed_(directed) {}

void dependency_graph::add_project(const project &p) {
  if (project_index_.count(p.name)) {
    throw orchestration_error(error_kind::DUPLICATE_PROJECT,
                              "project '" + p.name + "' is already registered",
                              {p.name});
  }

  project_index_[p.name] = projects_.size();
  projects_.push_back(p);
  logger::print_verbose("Registered project " + p.name);
}

void dependency_graph::add_dependency(const project_dependency &dep) {
  if (!has_project(dep.from)) {
    throw orchestration_error(error_kind::UNKNOWN_PROJECT,
                              "dependency source '" + dep.from +
                                  "' is not registered",
                              {dep.from, dep.to});
  }
  if (!has_project(dep.to)) {
    throw orchestration_error(error_kind::UNKNOWN_PROJECT,
                              "dependency target '" + dep.to +
                                  "' is not registered",
                              {dep.to, dep.from});
  }

  edges_.push_back(dep);
  index_edge(edges_.size() - 1);
  logger::print_verbose("Added dependency " + dep.from + " -> " + dep.to);
}

void dependency_graph::remove_dependency(const std::string &from,
                                         const std::string &to) {
  auto it = std::remove_if(edges_.begin(), edges_.end(),
                           [&](const project_dependency &dep) {
                             return dep.from == from && dep.to == to;
                           });
  if (it == edges_.end()) {
    return;
  }

  edges_.erase(it, edges_.end());
  rebuild_indices();
  logger::print_verbose("Removed dependency " + from + " -> " + to);
}

void dependency_graph::index_edge(wsforge_size_t edge) {
  const auto &dep = edges_[edge];
  forward_[dep.from].push_back({edge, true});
  if (directed_) {
    reverse_[dep.to].push_back({edge, false});
  } else {
    forward_[dep.to].push_back({edge, false});
  }
}

void dependency_graph::rebuild_indices() {
  forward_.clear();
  reverse_.clear();
  for (wsforge_size_t i = 0; i < edges_.size(); ++i) {
    index_edge(i);
  }
}

std::vector<std::string>
dependency_graph::neighbor_names(const std::string &name,
                                 bool outgoing) const {
  std::vector<std::string> result;

  const auto &index = (directed_ && !outgoing) ? reverse_ : forward_;
  auto it = index.find(name);
  if (it == index.end()) {
    return result;
  }

  std::unordered_set<std::string> seen;
  for (const auto &inc : it->second) {
    if (inc.outgoing != outgoing) {
      continue;
    }
    const auto &dep = edges_[inc.edge];
    const std::string &peer = outgoing ? dep.to : dep.from;
    if (seen.insert(peer).second) {
      result.push_back(peer);
    }
  }

  return result;
}

std::vector<std::string>
dependency_graph::reachable_names(const std::string &name,
                                  bool outgoing) const {
  std::vector<std::string> result;
  std::unordered_set<std::string> visited;
  std::queue<std::string> to_visit;

  visited.insert(name);
  to_visit.push(name);

  while (!to_visit.empty()) {
    std::string current = to_visit.front();
    to_visit.pop();

    for (const auto &next : neighbor_names(current, outgoing)) {
      if (visited.insert(next).second) {
        result.push_back(next);
        to_visit.push(next);
      }
    }
  }

  return result;
}

std::vector<project>
dependency_graph::to_projects(const std::vector<std::string> &names) const {
  std::vector<project> result;
  result.reserve(names.size());
  for (const auto &n : names) {
    auto it = project_index_.find(n);
    if (it != project_index_.end()) {
      result.push_back(projects_[it->second]);
    }
  }
  return result;
}

std::vector<project> dependency_graph::get_projects() const {
  return projects_;
}

std::vector<project>
dependency_graph::get_dependencies(const std::string &name) const {
  return to_projects(neighbor_names(name, true));
}

std::vector<project>
dependency_graph::get_dependents(const std::string &name) const {
  return to_projects(neighbor_names(name, false));
}

std::vector<project>
dependency_graph::get_transitive_dependencies(const std::string &name) const {
  return to_projects(reachable_names(name, true));
}

std::vector<project>
dependency_graph::get_transitive_dependents(const std::string &name) const {
  return to_projects(reachable_names(name, false));
}

bool dependency_graph::has_project(const std::string &name) const {
  return project_index_.count(name) > 0;
}

const project *dependency_graph::get_project(const std::string &name) const {
  auto it = project_index_.find(name);
  if (it == project_index_.end()) {
    return nullptr;
  }
  return &projects_[it->second];
}

void dependency_graph::set_project_status(const std::string &name,
                                          project_status status) {
  auto it = project_index_.find(name);
  if (it == project_index_.end()) {
    throw orchestration_error(error_kind::UNKNOWN_PROJECT,
                              "project '" + name + "' is not registered",
                              {name});
  }
  projects_[it->second].status = status;
}

void dependency_graph::set_project_version(const std::string &name,
                                           const std::string &version) {
  auto it = project_index_.find(name);
  if (it == project_index_.end()) {
    throw orchestration_error(error_kind::UNKNOWN_PROJECT,
                              "project '" + name + "' is not registered",
                              {name});
  }
  projects_[it->second].version = version;
}

bool dependency_graph::has_dependency(const std::string &from,
                                      const std::string &to) const {
  auto deps = neighbor_names(from, true);
  return std::find(deps.begin(), deps.end(), to) != deps.end();
}

bool dependency_graph::can_reach(const std::string &from,
                                 const std::string &to) const {
  if (from == to) {
    return true;
  }
  auto reachable = reachable_names(from, true);
  return std::find(reachable.begin(), reachable.end(), to) != reachable.end();
}

std::vector<std::vector<std::string>> dependency_graph::find_cycles() const {
  enum class mark { WHITE, GRAY, BLACK };

  struct frame {
    std::string name;
    std::vector<std::string> neighbors;
    wsforge_size_t next = 0;
  };

  std::vector<std::vector<std::string>> cycles;
  std::unordered_map<std::string, mark> marks;
  std::unordered_map<std::string, std::string> parent;

  for (const auto &root : projects_) {
    if (marks[root.name] != mark::WHITE) {
      continue;
    }

    std::vector<frame> stack;
    marks[root.name] = mark::GRAY;
    stack.push_back({root.name, neighbor_names(root.name, true), 0});

    while (!stack.empty()) {
      frame &top = stack.back();

      if (top.next == top.neighbors.size()) {
        marks[top.name] = mark::BLACK;
        stack.pop_back();
        continue;
      }

      std::string next = top.neighbors[top.next++];
      mark next_mark = marks[next];

      if (next_mark == mark::WHITE) {
        parent[next] = top.name;
        marks[next] = mark::GRAY;
        // push_back may reallocate, so top is not used after this
        stack.push_back({next, neighbor_names(next, true), 0});
      } else if (next_mark == mark::GRAY) {
        // Back edge: walk parents from the current project to the target
        std::vector<std::string> cycle;
        std::string current = top.name;
        cycle.push_back(current);
        while (current != next) {
          current = parent[current];
          cycle.push_back(current);
        }
        std::reverse(cycle.begin(), cycle.end());
        cycles.push_back(cycle);
      }
    }
  }

  if (!cycles.empty()) {
    logger::print_verbose("Found " + std::to_string(cycles.size()) +
                          " dependency cycle(s)");
  }
  return cycles;
}

std::vector<std::string> dependency_graph::topological_sort() const {
  std::vector<std::string> order;
  for (const auto &level : execution_levels()) {
    order.insert(order.end(), level.begin(), level.end());
  }
  return order;
}

std::vector<std::vector<std::string>>
dependency_graph::execution_levels() const {
  std::vector<std::vector<std::string>> levels;
  std::unordered_map<std::string, wsforge_size_t> remaining;
  std::unordered_set<std::string> placed;

  for (const auto &p : projects_) {
    remaining[p.name] = neighbor_names(p.name, true).size();
  }

  while (placed.size() < projects_.size()) {
    std::vector<std::string> level;
    for (const auto &p : projects_) {
      if (!placed.count(p.name) && remaining[p.name] == 0) {
        level.push_back(p.name);
      }
    }

    if (level.empty()) {
      std::vector<std::string> unordered;
      for (const auto &p : projects_) {
        if (!placed.count(p.name)) {
          unordered.push_back(p.name);
        }
      }
      throw orchestration_error(
          error_kind::CIRCULAR_DEPENDENCY,
          std::to_string(unordered.size()) +
              " project(s) cannot be ordered because of dependency cycles",
          unordered);
    }

    for (const auto &name : level) {
      placed.insert(name);
      for (const auto &dependent : neighbor_names(name, false)) {
        if (!placed.count(dependent) && remaining[dependent] > 0) {
          --remaining[dependent];
        }
      }
    }

    levels.push_back(level);
  }

  return levels;
}

void dependency_graph::clear() {
  projects_.clear();
  project_index_.clear();
  edges_.clear();
  forward_.clear();
  reverse_.clear();
}

} // namespace wsforge
