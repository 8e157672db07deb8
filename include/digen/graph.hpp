#pragma once

#include "export.hpp"
#include "descriptor.hpp"
#include "extractor.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace digen {

class diagnostic_sink;
struct analysis_options;

/// One dependency of a type after inheritance flattening, generic
/// substitution and collection unwrapping.
struct resolved_dependency {
    dependency_descriptor declaration;      // as written by `declared_in`
    type_ref declared;                      // substituted into the owner's terms
    type_ref target;                        // element type when via_collection
    bool via_collection = false;
    bool inherited = false;
    bool external = false;
    std::string declared_in;                // key of the declaring type
    std::string field_name;
    std::string parameter_name;
    std::vector<std::string> candidates;    // registered implementations
    std::optional<std::string> chosen;      // non-collection resolution
};

/// A declared type with its full, flattened dependency set.
struct type_node {
    type_descriptor type;
    std::vector<resolved_dependency> dependencies;  // inherited first, then own
    std::size_t inherited_count = 0;
    std::vector<type_ref> bases;                    // nearest first, substituted
    std::vector<type_ref> interfaces;               // transitive, substituted
    std::vector<std::size_t> base_arguments;        // per base constructor parameter
    bool identifiers_valid = true;
    bool base_call_resolved = true;
    bool inherits_configuration = false;            // a declared base binds configuration

    std::string key() const { return type.key(); }

    /// The constructor takes the configuration as its last parameter.
    bool needs_configuration() const noexcept {
        return !type.configuration.empty() || inherits_configuration;
    }

    std::span<const resolved_dependency> inherited() const noexcept {
        return {dependencies.data(), inherited_count};
    }
    std::span<const resolved_dependency> own() const noexcept {
        return std::span<const resolved_dependency>(dependencies).subspan(inherited_count);
    }
};

struct edge {
    std::string from;
    std::string to;
    bool via_collection = false;
    bool inherited = false;
    std::size_t dependency = 0;     // index into the from-node's dependencies
};

// ---------------------------------------------------------------
// dependency_graph: read-only result of build_graph()
// ---------------------------------------------------------------
class DIGEN_EXPORT dependency_graph {
public:
    dependency_graph();
    ~dependency_graph();

    dependency_graph(dependency_graph&&) noexcept;
    dependency_graph& operator=(dependency_graph&&) noexcept;

    dependency_graph(const dependency_graph&) = delete;
    dependency_graph& operator=(const dependency_graph&) = delete;

    /// Nodes in declaration order.
    const std::vector<type_node>& nodes() const noexcept;
    const type_node* find(std::string_view key) const;

    /// Edges in node order, then dependency order.  Edges to external
    /// types and from external, abstract or interface types are absent.
    const std::vector<edge>& edges() const noexcept;
    std::vector<const edge*> outgoing(std::string_view key) const;

    /// True when `node` implements `contract` directly, through a base
    /// class or through interface inheritance.
    bool implements(const type_node& node, const type_ref& contract) const;

    /// Keys of non-abstract classes satisfying `target`, in declaration
    /// order, whether they carry a lifetime or not.  External classes are
    /// left out unless `include_external` is set.  Names in `wildcards`
    /// inside `target` match anything.
    std::vector<std::string> implementations_of(const type_ref& target,
                                                const std::vector<std::string>& wildcards = {},
                                                bool include_external = false) const;

    const analysis_options& options() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    friend class graph_builder;
};

/// Build the dependency graph over every extracted type.  Merge-rule,
/// resolution and identifier problems are reported to `sink`; a fault in
/// one type is reported against that type and the others carry on.
DIGEN_EXPORT dependency_graph build_graph(std::vector<extraction_result> types,
                                          const analysis_options& options,
                                          diagnostic_sink& sink);

} // namespace digen
