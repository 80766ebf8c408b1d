/**
 * @file constants.h
 * @brief Core constants for the wsforge library
 */

#ifndef WSFORGE_CONSTANTS_H
#define WSFORGE_CONSTANTS_H

#ifndef WSFORGE_VERSION
#define WSFORGE_VERSION "0.1.0"
#endif

#define WORKSPACE_FILE "wsforge.workspace.toml"

/* Built-in rule names */
#define RULE_NO_CIRCULAR_DEPS "no-circular-deps"
#define RULE_NAMING_CONVENTION "naming-convention"
#define RULE_NO_CROSS_LAYER_DEPS "no-cross-layer-deps"

/* Defaults applied to projects declared without these keys */
#define DEFAULT_PROJECT_TYPE "cpp"
#define DEFAULT_PROJECT_VERSION "0.1.0"
#define DEFAULT_NAMING_CONVENTION "kebab-case"

#ifdef _MSC_VER
#pragma warning(disable : 4996)
#endif

#endif
