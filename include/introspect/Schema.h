/***
 * Name: pyspect::introspect (schema)
 * Purpose: Result model for one introspection run.
 * Inputs:
 *   - Filled by the analyzer, resolver, detector and enhancer
 * Outputs:
 *   - IntrospectionResult, serialized by ResultWriter
 * Theory of Operation:
 *   Plain value types. Sequences are always present (possibly empty) and
 *   optional fields are std::optional so the writer can emit explicit nulls.
 *   Every run builds a fresh result; nothing is shared between runs.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "metadata/InlineMetadata.h"

namespace pyspect::introspect {

inline constexpr const char* kSchemaVersion = "1.0.0";

enum class Provenance { Declared, Inferred };
enum class EntryPointKind { MainFunction, CliCommand };
enum class ErrorKind { SyntaxError, RuntimeError, ImportError };

const char* to_string(Provenance p);
const char* to_string(EntryPointKind k);
const char* to_string(ErrorKind k);

struct ParameterInfo {
  std::string name;
  std::optional<std::string> typeHint;
  std::optional<std::string> defaultValue;
  bool hasDefault{false};
};

struct FunctionInfo {
  std::string name;
  int line{0};
  std::optional<std::string> docstring;
  std::vector<ParameterInfo> parameters;
  std::optional<std::string> returns;
  std::vector<std::string> decorators;
  bool isAsync{false};
};

struct ClassInfo {
  std::string name;
  int line{0};
  std::optional<std::string> docstring;
  std::vector<FunctionInfo> methods;
  std::vector<std::string> baseClasses;
};

struct ImportInfo {
  std::string module; // dotted, without relative dots; empty for `from . import x`
  std::vector<std::string> names;
  std::optional<std::string> alias;
  bool isFromImport{false};
  int line{0};
};

struct DependencyInfo {
  std::string name;
  std::optional<std::string> versionSpec;
  Provenance provenance{Provenance::Inferred};
};

struct EntryPointInfo {
  std::string name;
  std::string callable;
  std::optional<std::string> module;
  EntryPointKind kind{EntryPointKind::MainFunction};
};

struct CliFrameworkInfo {
  std::string name;
  std::optional<std::string> version;            // reserved
  std::vector<std::string> detectedCommands;     // reserved
  std::optional<std::string> mainCallable;       // reserved
};

struct ErrorRecord {
  ErrorKind kind{ErrorKind::RuntimeError};
  std::string message;
  std::optional<int> line;
  int col{0}; // diagnostics only; not serialized
};

struct ScriptMetadata {
  std::string name;
  std::string path;
  std::optional<std::string> description;
  std::optional<std::string> docstring;
  std::optional<metadata::InlineMetadataBlock> inlineMetadata;
  std::vector<DependencyInfo> dependencies;
  std::vector<EntryPointInfo> entryPoints;
  std::vector<FunctionInfo> functions;
  std::vector<ClassInfo> classes;
  std::vector<ImportInfo> imports;
  std::optional<CliFrameworkInfo> cliFramework;
  std::vector<ErrorRecord> errors;
};

struct IntrospectionResult {
  std::string schemaVersion{kSchemaVersion};
  std::string interpreterVersion;
  std::string contentHash;
  ScriptMetadata metadata;
};

} // namespace pyspect::introspect
