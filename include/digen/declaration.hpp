#pragma once

/// @file declaration.hpp
/// Front-end shaped input: the declarations and markers digen analyzes.
/// A front end (or the YAML snapshot loader) produces a declaration_set;
/// nothing in here has been validated yet.

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace digen {

enum class type_kind {
    class_type,
    interface_type
};

/// One annotation on a type or field, e.g.
/// `DependsOn<IDb, ICache>(naming = snake_case)`.
struct marker {
    std::string name;
    std::vector<std::string> types;                 // type arguments, unparsed
    std::map<std::string, std::string> args;        // named arguments
};

struct field_declaration {
    std::string name;
    std::string type;
    std::vector<marker> markers;
};

struct type_declaration {
    std::string name;                               // qualified, may carry <T>
    type_kind kind = type_kind::class_type;
    bool is_abstract = false;
    std::vector<std::string> generic_parameters;
    std::map<std::string, std::string> constraints;
    std::optional<std::string> base;
    std::vector<std::string> interfaces;
    std::vector<marker> markers;
    std::vector<field_declaration> fields;
    std::string location;
};

/// A declaration the front end could not turn into a type_declaration.
/// It is reported against `name` when the snapshot is analyzed.
struct rejected_declaration {
    std::string name;
    std::string location;
    std::string reason;
};

/// An immutable snapshot of every declaration in one compilation unit.
struct declaration_set {
    std::vector<type_declaration> types;
    std::vector<rejected_declaration> rejected;
};

} // namespace digen
