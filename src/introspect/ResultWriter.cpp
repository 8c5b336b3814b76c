/***
 * Name: pyspect::introspect (result serialization impl)
 */
#include "introspect/ResultWriter.h"
#include "metadata/ConfigValue.h"
#include "pyspect/support/fs.h"
#include "pyspect/support/json_writer.h"

#include <ostream>
#include <string>

namespace pyspect::introspect {

namespace {

using support::JsonWriter;

void writeFunction(JsonWriter& json, const FunctionInfo& fn) {
  json.beginObject();
  json.key("name").str(fn.name);
  json.key("line").integer(fn.line);
  json.key("docstring").optStr(fn.docstring);
  json.key("parameters").beginArray();
  for (const auto& p : fn.parameters) {
    json.beginObject();
    json.key("name").str(p.name);
    json.key("type_hint").optStr(p.typeHint);
    json.key("default").optStr(p.defaultValue);
    json.key("has_default").boolean(p.hasDefault);
    json.endObject();
  }
  json.endArray();
  json.key("returns").optStr(fn.returns);
  json.key("decorators").strArray(fn.decorators);
  json.key("is_async").boolean(fn.isAsync);
  json.endObject();
}

void writeInlineBlock(JsonWriter& json, const std::optional<metadata::InlineMetadataBlock>& block) {
  if (!block) {
    json.null();
    return;
  }
  json.beginObject();
  json.key("dependencies").strArray(block->dependencies);
  json.key("min_interpreter").optStr(block->minInterpreter);
  json.key("tool_config");
  metadata::WriteConfigJson(json, block->toolConfig);
  json.endObject();
}

void writeMetadata(JsonWriter& json, const ScriptMetadata& md) {
  json.beginObject();
  json.key("name").str(md.name);
  json.key("path").str(md.path);
  json.key("description").optStr(md.description);
  json.key("docstring").optStr(md.docstring);
  json.key("inline_metadata_block");
  writeInlineBlock(json, md.inlineMetadata);

  json.key("dependencies").beginArray();
  for (const auto& dep : md.dependencies) {
    json.beginObject();
    json.key("name").str(dep.name);
    json.key("version_spec").optStr(dep.versionSpec);
    json.key("provenance").str(to_string(dep.provenance));
    json.endObject();
  }
  json.endArray();

  json.key("entry_points").beginArray();
  for (const auto& ep : md.entryPoints) {
    json.beginObject();
    json.key("name").str(ep.name);
    json.key("callable").str(ep.callable);
    json.key("module").optStr(ep.module);
    json.key("kind").str(to_string(ep.kind));
    json.endObject();
  }
  json.endArray();

  json.key("functions").beginArray();
  for (const auto& fn : md.functions) { writeFunction(json, fn); }
  json.endArray();

  json.key("classes").beginArray();
  for (const auto& cls : md.classes) {
    json.beginObject();
    json.key("name").str(cls.name);
    json.key("line").integer(cls.line);
    json.key("docstring").optStr(cls.docstring);
    json.key("methods").beginArray();
    for (const auto& m : cls.methods) { writeFunction(json, m); }
    json.endArray();
    json.key("base_classes").strArray(cls.baseClasses);
    json.endObject();
  }
  json.endArray();

  json.key("imports").beginArray();
  for (const auto& imp : md.imports) {
    json.beginObject();
    json.key("module").str(imp.module);
    json.key("names").strArray(imp.names);
    json.key("alias").optStr(imp.alias);
    json.key("is_from_import").boolean(imp.isFromImport);
    json.key("line").integer(imp.line);
    json.endObject();
  }
  json.endArray();

  json.key("cli_framework");
  if (md.cliFramework) {
    json.beginObject();
    json.key("name").str(md.cliFramework->name);
    json.key("version").optStr(md.cliFramework->version);
    json.key("detected_commands").strArray(md.cliFramework->detectedCommands);
    json.key("main_callable").optStr(md.cliFramework->mainCallable);
    json.endObject();
  } else {
    json.null();
  }

  json.key("errors").beginArray();
  for (const auto& err : md.errors) {
    json.beginObject();
    json.key("kind").str(to_string(err.kind));
    json.key("message").str(err.message);
    json.key("line").optInteger(err.line);
    json.endObject();
  }
  json.endArray();
  json.endObject();
}

} // namespace

std::string SerializeResult(const IntrospectionResult& result) {
  JsonWriter json;
  json.beginObject();
  json.key("schema_version").str(result.schemaVersion);
  json.key("interpreter_version").str(result.interpreterVersion);
  json.key("content_hash").str(result.contentHash);
  json.key("metadata");
  writeMetadata(json, result.metadata);
  json.endObject();
  return json.text();
}

bool WriteResult(const IntrospectionResult& result, const std::optional<std::string>& outputPath,
                 std::ostream& out, std::string& err) {
  const std::string text = SerializeResult(result);
  if (outputPath) { return support::WriteFile(*outputPath, text, err); }
  out << text << "\n";
  out.flush();
  if (!out) {
    err = "failed to write result to stdout";
    return false;
  }
  return true;
}

} // namespace pyspect::introspect
