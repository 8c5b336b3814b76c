/***
 * Name: pyspect::ast::ComputeGeometry
 * Purpose: Compute AST geometry (node count and maximum depth) via DFS.
 * Inputs:
 *   - module: AST root
 * Outputs:
 *   - populated geometry statistics; the module itself is depth 1
 * Theory of Operation: Performs a recursive traversal over ForEachChild
 *   counting nodes and tracking depth.
 */
#include <algorithm>
#include <cstdint>

#include "ast/ForEachChild.h"
#include "ast/GeometrySummary.h"

namespace pyspect::ast {

static void DepthFirstAccumulate(const Node& node, const uint64_t depth, GeometrySummary& out) {
  out.maxDepth = std::max(depth, out.maxDepth);
  ++out.nodes;
  ForEachChild(node, [&](const Node& child) { DepthFirstAccumulate(child, depth + 1, out); });
}

GeometrySummary ComputeGeometry(const Module& module) {
  GeometrySummary out{};
  constexpr uint64_t kInitialDepth = 1U;
  DepthFirstAccumulate(module, kInitialDepth, out);
  return out;
}

} // namespace pyspect::ast
