#pragma once

#include "export.hpp"

#include <string>
#include <vector>

namespace digen {

class dependency_graph;
class diagnostic_sink;

/// One reported cycle: node keys, closed by repeating the first node
/// (`A, B, C, A`).  A self-reference is `A, A`.
struct cycle {
    std::vector<std::string> path;
};

/// Three-color DFS over non-collection edges.  Nodes are visited in
/// declaration order and edges in dependency order; every back-edge yields
/// one `cycle-detected` diagnostic.
DIGEN_EXPORT std::vector<cycle> detect_cycles(const dependency_graph& graph,
                                              diagnostic_sink& sink);

} // namespace digen
