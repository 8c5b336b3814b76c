/***
 * Name: pyspect::docgen
 * Purpose: Contract types for an external description generator.
 * Inputs:
 *   - Script text and the introspection facts a generator needs
 * Outputs:
 *   - DocumentationRequest as JSON; DocumentationResponse from the generator
 * Theory of Operation:
 *   pyspect does not generate prose itself. It only builds the request a
 *   generator consumes and enforces the length limit on whatever comes back.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "introspect/Schema.h"

namespace pyspect::docgen {

inline constexpr std::size_t kDefaultMaxLength = 80;

struct FunctionSummary {
  std::string name;
  std::optional<std::string> docstring;
};

struct DocumentationRequest {
  std::string scriptContent;
  std::string entryPoint; // EntryPointKind name, or "Unknown"
  std::vector<FunctionSummary> functions;
  std::vector<std::string> dependencies;
  std::optional<std::string> currentDescription;
  std::size_t maxLength{kDefaultMaxLength};
};

struct DocumentationResponse {
  bool success{false};
  std::optional<std::string> description;
  std::optional<std::string> error;
};

DocumentationRequest BuildRequest(std::string scriptContent, const introspect::ScriptMetadata& md,
                                  std::size_t maxLength = kDefaultMaxLength);

std::string SerializeRequest(const DocumentationRequest& request);

/*** TruncateDescription: Clamp to maxLength characters (code points).
 *   Cuts at a word boundary and appends "..." when the prefix holds more
 *   than one word; otherwise keeps maxLength-3 characters plus "...". */
std::string TruncateDescription(std::string_view description, std::size_t maxLength);

/*** Accept: Apply TruncateDescription to a successful response in place. */
void Accept(DocumentationResponse& response, std::size_t maxLength);

} // namespace pyspect::docgen
