#pragma once

#include "export.hpp"

namespace digen {

class dependency_graph;
class diagnostic_sink;

/// Captive dependency check.  For every non-external type T with a resolved
/// lifetime and every edge T -> D:
///   - Singleton -> Scoped     : lifetime-narrower-error
///   - Singleton -> Transient  : lifetime-narrower-warning
/// Edges T inherited from a base report inheritance-lifetime-mismatch
/// instead (error for Scoped, warning for Transient).  Collection edges are
/// checked per candidate.
DIGEN_EXPORT void validate_lifetimes(const dependency_graph& graph, diagnostic_sink& sink);

} // namespace digen
