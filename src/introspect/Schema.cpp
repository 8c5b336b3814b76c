/***
 * Name: pyspect::introspect (schema names)
 * Purpose: Stable spellings of the schema enumerations.
 */
#include "introspect/Schema.h"

namespace pyspect::introspect {

const char* to_string(const Provenance p) {
  switch (p) {
    case Provenance::Declared: return "Declared";
    case Provenance::Inferred: return "Inferred";
  }
  return "Inferred";
}

const char* to_string(const EntryPointKind k) {
  switch (k) {
    case EntryPointKind::MainFunction: return "MainFunction";
    case EntryPointKind::CliCommand: return "CliCommand";
  }
  return "MainFunction";
}

const char* to_string(const ErrorKind k) {
  switch (k) {
    case ErrorKind::SyntaxError: return "SyntaxError";
    case ErrorKind::RuntimeError: return "RuntimeError";
    case ErrorKind::ImportError: return "ImportError";
  }
  return "RuntimeError";
}

} // namespace pyspect::introspect
