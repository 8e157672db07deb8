#pragma once

/// @file fwd.hpp
/// Forward declarations for all public digen symbols.
/// Include this header when you only need to name a type (pointers,
/// references, function parameters) without requiring its full definition.

#include "export.hpp"

#include <cstddef>

namespace digen {

// lifetime.hpp
enum class lifetime_kind;

// type_ref.hpp
struct type_ref;

// declaration.hpp
struct marker;
struct field_declaration;
struct type_declaration;
struct declaration_set;

// descriptor.hpp
struct naming_options;
struct dependency_descriptor;
struct conditional_rule;
struct registration_directive;
struct type_descriptor;

// diagnostic.hpp
enum class severity;
enum class diagnostic_code;
struct diagnostic_options;
struct diagnostic;
class diagnostic_sink;

// options.hpp
struct generation_options;
struct analysis_options;

// exceptions.hpp
class digen_error;
class declaration_error;
class type_parse_error;
class substitution_error;
class config_error;
class snapshot_error;

// extractor.hpp
struct extraction_result;

// graph.hpp
struct resolved_dependency;
struct edge;
struct type_node;
class dependency_graph;

// cycle_detector.hpp
struct cycle;

// registration_planner.hpp
struct registration;
struct registration_plan;

// emitter.hpp
struct generated_source;

// generator.hpp
struct generation_result;
class generator;

} // namespace digen
