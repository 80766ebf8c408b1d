#include "test_framework.h"
#include <stdio.h>
#include <string>
#include <vector>
#include <algorithm>

int Version_ParseSimple();
int Version_ParseZeros();
int Version_ParseRejectsPrefixAndSuffix();
int Version_ParseRejectsWrongArity();
int Version_ParseInvalid();
int Version_RoundTrip();
int Version_CompareMajor();
int Version_CompareMinor();
int Version_ComparePatch();
int Version_CompareEqual();
int Version_CompareNumerically();
int Version_BreakingChange();
int Constraint_ParseForms();
int Constraint_ParseRejectsUnsupported();
int Constraint_Caret();
int Constraint_CaretZeroMajor();
int Constraint_Tilde();
int Constraint_GreaterThanOrEqual();
int Graph_ProjectsInInsertionOrder();
int Graph_DuplicateProjectRejected();
int Graph_UnknownEndpointRejected();
int Graph_DependenciesAndDependents();
int Graph_AdjacencySymmetry();
int Graph_ParallelEdgesListedOnce();
int Graph_UndirectedMatchesDirected();
int Graph_TransitiveQueries();
int Graph_CanReach();
int Graph_RemoveDependency();
int Graph_NoCyclesInDag();
int Graph_FindsTwoProjectCycle();
int Graph_FindsSelfLoop();
int Graph_TopologicalSortPutsDependenciesFirst();
int Graph_ExecutionLevels();
int Graph_OrderingRefusesCycles();
int Graph_ProjectUpdates();
int Graph_ClearIsTotal();
int Coordinator_RegisterAndQuery();
int Coordinator_ReRegisterOverwrites();
int Coordinator_ConstraintsKeepOrder();
int Coordinator_CompatibleUpdateApplies();
int Coordinator_IncompatibleUpdateRejected();
int Coordinator_ValidateChecksEveryConstraint();
int Coordinator_MalformedConstraintIsConfigurationError();
int Coordinator_UpdateErrorOrder();
int Coordinator_UpdateReportsAffectedProjects();
int Coordinator_BreakingChange();
int Coordinator_PlanUnknownProjectIsInvalid();
int Coordinator_PlanBadVersionIsInvalid();
int Coordinator_PlanSteps();
int Coordinator_PlanIgnoresConstraints();
int Coordinator_AffectedProjects();
int Coordinator_GraphIsCopied();
int Coordinator_ClearIsTotal();
int Coordinator_EdgeConstraintsSatisfied();
int Coordinator_EdgeConstraintTargetMustBeRegistered();
int Coordinator_DependentConstraintsCheckCandidate();
int Coordinator_NoBreakingChanges();
int Coordinator_DependencyReport();
int Coordinator_AnalyzeImpact();
int Rules_CleanWorkspacePasses();
int Rules_CircularDependencyIsCritical();
int Rules_CycleSeverityIgnoresRuleSeverity();
int Rules_DisabledRuleContributesNothing();
int Rules_NamingViolation();
int Rules_NamingInfoSeverityRaised();
int Rules_CollectsEveryViolation();
int Rules_ProjectNameConventions();
int Rules_CustomPatternAppliedToEveryProject();
int Rules_BadConventionIsConfigurationError();
int Rules_MalformedSnapshotIsConfigurationError();
int Rules_LayerBoundaryViolation();
int Rules_LayerPrefixMembers();
int Rules_UnlayeredProjectsUnconstrained();
int Rules_BoundaryWithoutLayersWarns();
int Rules_ValidateCandidateProject();
int Rules_ValidateCandidateDependency();
int Config_DefaultRules();
int Config_ParseProjects();
int Config_ParseDependencies();
int Config_RulesOverrideDefaultsByName();
int Config_CustomRuleAppended();
int Config_ParseLayers();
int Config_NamingSettings();
int Config_EnableDisableRules();
int Config_RejectsMalformedDocuments();
int Config_RejectsOutOfRangeLayerLevel();
int Config_CycleRuleSeverityCannotBeLowered();
int Config_FailedLoadKeepsPreviousWorkspace();
int Config_LoadFromFile();
int Config_LoadMissingFile();
int Config_LoadedWorkspaceValidates();

struct test_entry { const char* full; int (*fn)(); };
static test_entry tests[] = {
  {"Version.ParseSimple", Version_ParseSimple},
  {"Version.ParseZeros", Version_ParseZeros},
  {"Version.ParseRejectsPrefixAndSuffix", Version_ParseRejectsPrefixAndSuffix},
  {"Version.ParseRejectsWrongArity", Version_ParseRejectsWrongArity},
  {"Version.ParseInvalid", Version_ParseInvalid},
  {"Version.RoundTrip", Version_RoundTrip},
  {"Version.CompareMajor", Version_CompareMajor},
  {"Version.CompareMinor", Version_CompareMinor},
  {"Version.ComparePatch", Version_ComparePatch},
  {"Version.CompareEqual", Version_CompareEqual},
  {"Version.CompareNumerically", Version_CompareNumerically},
  {"Version.BreakingChange", Version_BreakingChange},
  {"Constraint.ParseForms", Constraint_ParseForms},
  {"Constraint.ParseRejectsUnsupported", Constraint_ParseRejectsUnsupported},
  {"Constraint.Caret", Constraint_Caret},
  {"Constraint.CaretZeroMajor", Constraint_CaretZeroMajor},
  {"Constraint.Tilde", Constraint_Tilde},
  {"Constraint.GreaterThanOrEqual", Constraint_GreaterThanOrEqual},
  {"Graph.ProjectsInInsertionOrder", Graph_ProjectsInInsertionOrder},
  {"Graph.DuplicateProjectRejected", Graph_DuplicateProjectRejected},
  {"Graph.UnknownEndpointRejected", Graph_UnknownEndpointRejected},
  {"Graph.DependenciesAndDependents", Graph_DependenciesAndDependents},
  {"Graph.AdjacencySymmetry", Graph_AdjacencySymmetry},
  {"Graph.ParallelEdgesListedOnce", Graph_ParallelEdgesListedOnce},
  {"Graph.UndirectedMatchesDirected", Graph_UndirectedMatchesDirected},
  {"Graph.TransitiveQueries", Graph_TransitiveQueries},
  {"Graph.CanReach", Graph_CanReach},
  {"Graph.RemoveDependency", Graph_RemoveDependency},
  {"Graph.NoCyclesInDag", Graph_NoCyclesInDag},
  {"Graph.FindsTwoProjectCycle", Graph_FindsTwoProjectCycle},
  {"Graph.FindsSelfLoop", Graph_FindsSelfLoop},
  {"Graph.TopologicalSortPutsDependenciesFirst", Graph_TopologicalSortPutsDependenciesFirst},
  {"Graph.ExecutionLevels", Graph_ExecutionLevels},
  {"Graph.OrderingRefusesCycles", Graph_OrderingRefusesCycles},
  {"Graph.ProjectUpdates", Graph_ProjectUpdates},
  {"Graph.ClearIsTotal", Graph_ClearIsTotal},
  {"Coordinator.RegisterAndQuery", Coordinator_RegisterAndQuery},
  {"Coordinator.ReRegisterOverwrites", Coordinator_ReRegisterOverwrites},
  {"Coordinator.ConstraintsKeepOrder", Coordinator_ConstraintsKeepOrder},
  {"Coordinator.CompatibleUpdateApplies", Coordinator_CompatibleUpdateApplies},
  {"Coordinator.IncompatibleUpdateRejected", Coordinator_IncompatibleUpdateRejected},
  {"Coordinator.ValidateChecksEveryConstraint", Coordinator_ValidateChecksEveryConstraint},
  {"Coordinator.MalformedConstraintIsConfigurationError", Coordinator_MalformedConstraintIsConfigurationError},
  {"Coordinator.UpdateErrorOrder", Coordinator_UpdateErrorOrder},
  {"Coordinator.UpdateReportsAffectedProjects", Coordinator_UpdateReportsAffectedProjects},
  {"Coordinator.BreakingChange", Coordinator_BreakingChange},
  {"Coordinator.PlanUnknownProjectIsInvalid", Coordinator_PlanUnknownProjectIsInvalid},
  {"Coordinator.PlanBadVersionIsInvalid", Coordinator_PlanBadVersionIsInvalid},
  {"Coordinator.PlanSteps", Coordinator_PlanSteps},
  {"Coordinator.PlanIgnoresConstraints", Coordinator_PlanIgnoresConstraints},
  {"Coordinator.AffectedProjects", Coordinator_AffectedProjects},
  {"Coordinator.GraphIsCopied", Coordinator_GraphIsCopied},
  {"Coordinator.ClearIsTotal", Coordinator_ClearIsTotal},
  {"Coordinator.EdgeConstraintsSatisfied", Coordinator_EdgeConstraintsSatisfied},
  {"Coordinator.EdgeConstraintTargetMustBeRegistered", Coordinator_EdgeConstraintTargetMustBeRegistered},
  {"Coordinator.DependentConstraintsCheckCandidate", Coordinator_DependentConstraintsCheckCandidate},
  {"Coordinator.NoBreakingChanges", Coordinator_NoBreakingChanges},
  {"Coordinator.DependencyReport", Coordinator_DependencyReport},
  {"Coordinator.AnalyzeImpact", Coordinator_AnalyzeImpact},
  {"Rules.CleanWorkspacePasses", Rules_CleanWorkspacePasses},
  {"Rules.CircularDependencyIsCritical", Rules_CircularDependencyIsCritical},
  {"Rules.CycleSeverityIgnoresRuleSeverity", Rules_CycleSeverityIgnoresRuleSeverity},
  {"Rules.DisabledRuleContributesNothing", Rules_DisabledRuleContributesNothing},
  {"Rules.NamingViolation", Rules_NamingViolation},
  {"Rules.NamingInfoSeverityRaised", Rules_NamingInfoSeverityRaised},
  {"Rules.CollectsEveryViolation", Rules_CollectsEveryViolation},
  {"Rules.ProjectNameConventions", Rules_ProjectNameConventions},
  {"Rules.CustomPatternAppliedToEveryProject", Rules_CustomPatternAppliedToEveryProject},
  {"Rules.BadConventionIsConfigurationError", Rules_BadConventionIsConfigurationError},
  {"Rules.MalformedSnapshotIsConfigurationError", Rules_MalformedSnapshotIsConfigurationError},
  {"Rules.LayerBoundaryViolation", Rules_LayerBoundaryViolation},
  {"Rules.LayerPrefixMembers", Rules_LayerPrefixMembers},
  {"Rules.UnlayeredProjectsUnconstrained", Rules_UnlayeredProjectsUnconstrained},
  {"Rules.BoundaryWithoutLayersWarns", Rules_BoundaryWithoutLayersWarns},
  {"Rules.ValidateCandidateProject", Rules_ValidateCandidateProject},
  {"Rules.ValidateCandidateDependency", Rules_ValidateCandidateDependency},
  {"Config.DefaultRules", Config_DefaultRules},
  {"Config.ParseProjects", Config_ParseProjects},
  {"Config.ParseDependencies", Config_ParseDependencies},
  {"Config.RulesOverrideDefaultsByName", Config_RulesOverrideDefaultsByName},
  {"Config.CustomRuleAppended", Config_CustomRuleAppended},
  {"Config.ParseLayers", Config_ParseLayers},
  {"Config.NamingSettings", Config_NamingSettings},
  {"Config.EnableDisableRules", Config_EnableDisableRules},
  {"Config.RejectsMalformedDocuments", Config_RejectsMalformedDocuments},
  {"Config.RejectsOutOfRangeLayerLevel", Config_RejectsOutOfRangeLayerLevel},
  {"Config.CycleRuleSeverityCannotBeLowered", Config_CycleRuleSeverityCannotBeLowered},
  {"Config.FailedLoadKeepsPreviousWorkspace", Config_FailedLoadKeepsPreviousWorkspace},
  {"Config.LoadFromFile", Config_LoadFromFile},
  {"Config.LoadMissingFile", Config_LoadMissingFile},
  {"Config.LoadedWorkspaceValidates", Config_LoadedWorkspaceValidates},
};

int main(int argc, char** argv) {
  std::string category;
  std::vector<std::string> test_filters;
  // Positional args: first is category (optional), rest are test names
  for (int i = 1; i < argc; ++i) {
    if (i == 1) category = argv[i]; else test_filters.emplace_back(argv[i]);
  }
  int failures = 0;
  size_t run_count = 0;
  for (auto& tc : tests) {
    std::string full(tc.full);
    std::string cat, name; auto pos = full.find('.');
    if (pos == std::string::npos) { name = full; } else { cat = full.substr(0,pos); name = full.substr(pos+1); }
    if (!category.empty() && cat != category) continue;
    if (!test_filters.empty() && std::find(test_filters.begin(), test_filters.end(), name) == test_filters.end()) continue;
    ++run_count;
    printf(COLOR_CYAN "[RUN] %s" COLOR_RESET "\n", tc.full);
    int res = tc.fn();
    if (res) { printf(COLOR_RED "[FAIL] %s" COLOR_RESET "\n", tc.full); ++failures; } else { printf(COLOR_GREEN "[PASS] %s" COLOR_RESET "\n", tc.full); }
  }
  printf("Ran %zu tests: %d failures\n", run_count, failures);
  if (run_count == 0) {
    fprintf(stderr, COLOR_RED "No tests matched '%s'" COLOR_RESET "\n", category.c_str());
    return 1;
  }
  return failures;
}
