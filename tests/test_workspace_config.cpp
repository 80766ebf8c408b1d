/**
 * @file test_workspace_config.cpp
 * @brief Tests for loading workspace definitions from TOML
 */

#include "test_framework.h"
#include "test_helpers.hpp"
#include "core/rules_validator.hpp"
#include "core/workspace.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace wsforge;
using namespace wsforge::test;

static const char *DEMO_WORKSPACE = R"(
[workspace]
name = "demo"

[[project]]
name = "core"
path = "libs/core"
version = "1.0.0"
status = "healthy"

[[project]]
name = "storage"

[[project]]
name = "api"
type = "service"
version = "2.1.0"

[[dependency]]
from = "storage"
to = "core"
version = "^1.0.0"

[[dependency]]
from = "api"
to = "storage"
type = "dev"

[[rule]]
name = "no-cross-layer-deps"
enabled = true
severity = "critical"

[[layer]]
name = "foundation"
level = 0
members = ["core", "storage"]

[[layer]]
name = "service"
level = 1
members = ["api"]
)";

// Helper to create a temporary test directory
static fs::path create_temp_dir() {
    fs::path temp = fs::temp_directory_path() /
                    ("wsforge_test_" + std::to_string(std::rand()));
    fs::create_directories(temp);
    return temp;
}

TEST(Config, DefaultRules) {
    workspace_config config;
    const auto &rules = config.get_workspace().settings.rules;
    cf_assert(rules.size() == 3);
    cf_assert(rules[0].name == "no-circular-deps");
    cf_assert(rules[0].enabled);
    cf_assert(rules[0].severity == violation_severity::CRITICAL);
    cf_assert(rules[1].name == "naming-convention");
    cf_assert(rules[1].severity == violation_severity::WARNING);
    cf_assert(rules[2].name == "no-cross-layer-deps");
    cf_assert(!rules[2].enabled);
    return 0;
}

TEST(Config, ParseProjects) {
    workspace_config config;
    cf_assert(config.parse(DEMO_WORKSPACE));

    const workspace &ws = config.get_workspace();
    cf_assert(ws.name == "demo");
    cf_assert(ws.projects.size() == 3);

    cf_assert(ws.projects[0].name == "core");
    cf_assert(ws.projects[0].path == fs::path("libs/core"));
    cf_assert(ws.projects[0].status == project_status::HEALTHY);

    // Defaults for omitted keys
    cf_assert(ws.projects[1].path == fs::path("storage"));
    cf_assert(ws.projects[1].project_type == "cpp");
    cf_assert(ws.projects[1].version == "0.1.0");
    cf_assert(ws.projects[1].status == project_status::UNKNOWN);

    cf_assert(ws.projects[2].project_type == "service");
    cf_assert(ws.projects[2].version == "2.1.0");
    return 0;
}

TEST(Config, ParseDependencies) {
    workspace_config config;
    cf_assert(config.parse(DEMO_WORKSPACE));

    const auto &deps = config.get_workspace().dependencies;
    cf_assert(deps.size() == 2);
    cf_assert(deps[0].from == "storage");
    cf_assert(deps[0].to == "core");
    cf_assert(deps[0].type == dependency_type::DIRECT);
    cf_assert(deps[0].version_constraint == "^1.0.0");
    cf_assert(deps[1].type == dependency_type::DEV);
    cf_assert(deps[1].version_constraint.empty());
    return 0;
}

TEST(Config, RulesOverrideDefaultsByName) {
    workspace_config config;
    cf_assert(config.parse(DEMO_WORKSPACE));

    const auto &rules = config.get_workspace().settings.rules;
    cf_assert(rules.size() == 3);
    const workspace_rule *boundary = config.get_rule("no-cross-layer-deps");
    cf_assert(boundary != nullptr);
    cf_assert(boundary->enabled);
    cf_assert(boundary->type == rule_type::ARCHITECTURAL_BOUNDARY);
    cf_assert(boundary->severity == violation_severity::CRITICAL);
    return 0;
}

TEST(Config, CustomRuleAppended) {
    workspace_config config;
    cf_assert(config.parse(R"(
[[rule]]
name = "strict-names"
type = "naming_convention"
severity = "critical"
)"));
    const auto &rules = config.get_workspace().settings.rules;
    cf_assert(rules.size() == 4);
    cf_assert(rules[3].name == "strict-names");
    cf_assert(rules[3].type == rule_type::NAMING_CONVENTION);
    cf_assert(rules[3].enabled);
    return 0;
}

TEST(Config, ParseLayers) {
    workspace_config config;
    cf_assert(config.parse(DEMO_WORKSPACE));

    const auto &layers = config.get_workspace().settings.layers;
    cf_assert(layers.size() == 2);
    cf_assert(layers[0].name == "foundation");
    cf_assert(layers[0].level == 0);
    cf_assert(layers[0].contains("storage"));
    cf_assert(layers[1].level == 1);
    cf_assert(layers[1].contains("api"));
    return 0;
}

TEST(Config, NamingSettings) {
    workspace_config config;
    cf_assert(config.parse(R"(
[workspace]
name = "custom"
naming_convention = "custom"
naming_pattern = "svc-[a-z]+"
)"));
    const auto &settings = config.get_workspace().settings;
    cf_assert(settings.naming_convention == "custom");
    cf_assert(settings.naming_pattern == "svc-[a-z]+");
    return 0;
}

TEST(Config, EnableDisableRules) {
    workspace_config config;
    cf_assert(config.disable_rule("no-circular-deps"));
    cf_assert(!config.get_rule("no-circular-deps")->enabled);
    cf_assert(config.enable_rule("no-cross-layer-deps"));
    cf_assert(config.get_rule("no-cross-layer-deps")->enabled);
    cf_assert(!config.enable_rule("no-such-rule"));
    cf_assert(!config.disable_rule("no-such-rule"));
    return 0;
}

TEST(Config, RejectsMalformedDocuments) {
    workspace_config config;
    cf_assert(!config.parse("[[project]\nname = "));
    cf_assert(!config.last_error().empty());

    cf_assert(!config.parse("[[project]]\nversion = \"1.0.0\"\n"));
    cf_assert(!config.parse("[[project]]\nname = \"a\"\nstatus = \"sleepy\"\n"));
    cf_assert(!config.parse("[[dependency]]\nfrom = \"a\"\n"));
    cf_assert(!config.parse("[[rule]]\nname = \"mystery\"\n"));
    cf_assert(!config.parse(
        "[[rule]]\nname = \"x\"\ntype = \"naming-convention\"\nseverity = \"fatal\"\n"));
    return 0;
}

TEST(Config, RejectsOutOfRangeLayerLevel) {
    workspace_config config;
    cf_assert(!config.parse("[[layer]]\nname = \"top\"\nlevel = 4294967296\n"));
    cf_assert(!config.last_error().empty());
    cf_assert(!config.parse("[[layer]]\nname = \"low\"\nlevel = -3000000000\n"));
    cf_assert(config.parse("[[layer]]\nname = \"high\"\nlevel = 2147483647\n"));
    cf_assert(config.get_workspace().settings.layers[0].level == 2147483647);
    return 0;
}

TEST(Config, CycleRuleSeverityCannotBeLowered) {
    workspace_config config;
    cf_assert(config.parse(R"(
[[project]]
name = "alpha"

[[project]]
name = "beta"

[[dependency]]
from = "alpha"
to = "beta"

[[dependency]]
from = "beta"
to = "alpha"

[[rule]]
name = "no-circular-deps"
severity = "info"
)"));
    cf_assert(config.get_rule("no-circular-deps")->severity ==
              violation_severity::INFO);

    rules_validator validator(config.get_workspace());
    auto result = validator.validate_all();
    cf_assert(result.violations.size() == 1);
    cf_assert(result.violations[0].severity == violation_severity::CRITICAL);
    return 0;
}

TEST(Config, FailedLoadKeepsPreviousWorkspace) {
    workspace_config config;
    cf_assert(config.parse(DEMO_WORKSPACE));
    cf_assert(!config.parse("[[project]]\nstatus = \"healthy\"\n"));
    cf_assert(config.get_workspace().name == "demo");
    cf_assert(config.get_workspace().projects.size() == 3);
    return 0;
}

TEST(Config, LoadFromFile) {
    fs::path temp = create_temp_dir();
    fs::path file = temp / "wsforge.workspace.toml";
    {
        std::ofstream out(file);
        out << DEMO_WORKSPACE;
    }

    workspace_config config;
    bool loaded = config.load(file.string());
    bool rooted = config.get_workspace().root == fs::absolute(temp);
    fs::remove_all(temp);

    cf_assert(loaded);
    cf_assert(rooted);
    cf_assert(config.get_workspace().projects.size() == 3);
    return 0;
}

TEST(Config, LoadMissingFile) {
    workspace_config config;
    cf_assert(!config.load("/nonexistent/wsforge.workspace.toml"));
    cf_assert(!config.last_error().empty());
    return 0;
}

TEST(Config, LoadedWorkspaceValidates) {
    workspace_config config;
    cf_assert(config.parse(DEMO_WORKSPACE));

    rules_validator validator(config.get_workspace());
    auto result = validator.validate_all();
    cf_assert(result.passed);

    // core -> api points up a layer and closes core -> api -> storage -> core
    config.get_workspace().dependencies.push_back(
        make_dependency("core", "api"));
    result = validator.validate_all();
    cf_assert(!result.passed);
    cf_assert(result.violations.size() == 2);
    cf_assert(result.violations[0].type == rule_type::DEPENDENCY_CONSTRAINT);
    cf_assert(result.violations[0].affected_projects.size() == 3);
    cf_assert(result.violations[1].type == rule_type::ARCHITECTURAL_BOUNDARY);
    cf_assert(result.violations[1].severity == violation_severity::CRITICAL);
    return 0;
}
