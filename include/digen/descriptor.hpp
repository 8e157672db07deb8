#pragma once

#include "lifetime.hpp"
#include "type_ref.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace digen {

enum class naming_convention {
    camel_case,
    pascal_case,
    snake_case
};

constexpr std::string_view to_string(naming_convention c) noexcept {
    constexpr std::string_view names[] = {"camel_case", "pascal_case", "snake_case"};
    return names[static_cast<int>(c)];
}

constexpr std::optional<naming_convention> parse_naming_convention(std::string_view text) noexcept {
    if (text == "camel_case" || text == "CamelCase") return naming_convention::camel_case;
    if (text == "pascal_case" || text == "PascalCase") return naming_convention::pascal_case;
    if (text == "snake_case" || text == "SnakeCase") return naming_convention::snake_case;
    return std::nullopt;
}

/// Where a dependency was declared.
enum class dependency_source {
    field_marker,       // Inject on an existing field
    bulk_declaration    // DependsOn<...> on the type
};

enum class registration_mode {
    direct_only,
    all,
    exclusionary
};

enum class instance_sharing {
    separate,
    shared
};

/// Naming options attached to one bulk declaration.
struct naming_options {
    naming_convention convention = naming_convention::camel_case;
    bool strip_leading_marker = true;
    std::string prefix = "_";
};

// ---------------------------------------------------------------
// dependency_descriptor: one declared dependency of one type
// ---------------------------------------------------------------
struct dependency_descriptor {
    std::string owner;                  // definition key of the declaring type
    type_ref target;                    // as written, possibly a collection
    dependency_source source = dependency_source::bulk_declaration;
    naming_options naming;
    bool external = false;
    std::size_t order = 0;              // declaration order within the owner
    std::size_t declaration_index = 0;  // which DependsOn, or which field
    std::string field_name;             // field markers only
};

// ---------------------------------------------------------------
// conditional_rule: one ConditionalService marker
// ---------------------------------------------------------------
struct conditional_rule {
    std::vector<std::string> environments;       // any-of
    std::vector<std::string> not_environments;   // none-of
    std::optional<std::string> config_key;
    std::optional<std::string> equals;
    std::vector<std::string> not_equals;         // none-of

    bool tests_environment() const noexcept {
        return !environments.empty() || !not_environments.empty();
    }
    bool tests_configuration() const noexcept {
        return config_key.has_value() && (equals.has_value() || !not_equals.empty());
    }
    bool empty() const noexcept {
        return !tests_environment() && !config_key && !equals && not_equals.empty();
    }

    bool operator==(const conditional_rule&) const = default;
};

// ---------------------------------------------------------------
// configuration_binding: one InjectConfiguration field
// ---------------------------------------------------------------
struct configuration_binding {
    std::string field_name;
    type_ref type;
    std::string key;                    // explicit, or inferred from the type name
    std::optional<std::string> fallback;    // C++ expression, emitted verbatim
    bool required = true;
};

/// BackgroundService marker; hosted services always run as Singleton.
struct background_service {
    bool auto_register = true;
    bool suppress_lifetime_warnings = false;
};

struct registration_directive {
    bool declared = false;                       // RegisterAsAll present
    registration_mode mode = registration_mode::all;
    std::optional<instance_sharing> sharing;     // unspecified: defaulted
    std::vector<type_ref> skip;
    bool skip_all = false;                       // SkipRegistration without types
    std::vector<type_ref> explicit_contracts;    // RegisterAs<...>
};

// ---------------------------------------------------------------
// type_descriptor: what the extractor learned about one type
// ---------------------------------------------------------------
struct type_descriptor {
    type_ref identity;                           // args are the parameter names
    std::vector<std::string> generic_parameters;
    std::map<std::string, std::string> constraints;
    lifetime_kind lifetime = lifetime_kind::unassigned;  // resolved
    bool lifetime_declared = false;
    bool external = false;
    bool is_abstract = false;
    bool is_interface = false;
    bool has_service_intent = false;
    std::optional<type_ref> base;
    std::vector<type_ref> interfaces;
    registration_directive registration;
    std::vector<conditional_rule> conditions;
    std::vector<configuration_binding> configuration;
    std::optional<background_service> background;
    std::string location;
    std::size_t declaration_order = 0;

    std::string key() const { return identity.definition_key(); }
    std::string display_name() const { return identity.to_string(); }
    bool is_generic() const noexcept { return !generic_parameters.empty(); }
    bool is_concrete() const noexcept { return !is_interface && !is_abstract; }
    bool is_conditional() const noexcept { return !conditions.empty(); }
};

} // namespace digen
