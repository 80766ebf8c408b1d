/**
 * @file test_helpers.hpp
 * @brief Shared fixtures for the orchestration tests
 */

#pragma once

#include "core/errors.hpp"
#include "core/models.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace wsforge {
namespace test {

inline project make_project(const std::string &name,
                            const std::string &version = "1.0.0") {
    project p;
    p.name = name;
    p.path = name;
    p.project_type = "cpp";
    p.version = version;
    return p;
}

inline project_dependency make_dependency(const std::string &from,
                                          const std::string &to,
                                          const std::string &constraint = "") {
    project_dependency dep;
    dep.from = from;
    dep.to = to;
    dep.version_constraint = constraint;
    return dep;
}

/// Call fn and report whether it threw an orchestration_error of the given kind
template <typename Fn> bool throws_kind(Fn fn, error_kind kind) {
    try {
        fn();
    } catch (const orchestration_error &e) {
        return e.kind() == kind;
    }
    return false;
}

inline bool contains(const std::vector<std::string> &names,
                     const std::string &name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

/// core, storage -> core, api -> core, api -> storage
inline workspace layered_workspace() {
    workspace ws;
    ws.name = "demo";
    ws.projects = {make_project("core"), make_project("storage"),
                   make_project("api")};
    ws.dependencies = {make_dependency("storage", "core"),
                       make_dependency("api", "core"),
                       make_dependency("api", "storage")};
    ws.settings.rules = {
        {"no-circular-deps", rule_type::DEPENDENCY_CONSTRAINT, true,
         violation_severity::CRITICAL},
        {"naming-convention", rule_type::NAMING_CONVENTION, true,
         violation_severity::WARNING},
    };
    return ws;
}

} // namespace test
} // namespace wsforge
