#pragma once

#include "export.hpp"
#include "diagnostic.hpp"
#include "lifetime.hpp"
#include "type_ref.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace digen {

/// Options that shape emitted code only.
struct generation_options {
    std::string unit = "app";                   // add_<unit>_services, <unit>.digen.hpp
    std::string namespace_name;                 // empty: global namespace
    std::string environment_variable = "DIGEN_ENVIRONMENT";
    std::string configuration_type = "Configuration";   // constructor parameter type
};

/// Options resolved once per run and shared read-only by every stage.
struct analysis_options {
    diagnostic_options diagnostics;
    bool lifetime_validation = true;
    lifetime_kind default_lifetime = lifetime_kind::scoped;
    char leading_marker = 'I';
    std::vector<std::string> collection_wrappers = {
        "IEnumerable", "IReadOnlyList", "IList", "ICollection",
        "IReadOnlyCollection", "List", "std::vector"};
    std::vector<std::string> external_prefixes = {"std::"};
    generation_options generation;

    /// True for a single-argument instance of a configured wrapper; the
    /// wrapper may be written qualified (`System.Collections.Generic.List`).
    bool is_collection_wrapper(const type_ref& type) const;

    /// True when `type` lives under one of the external prefixes.
    bool is_assumed_external(const type_ref& type) const;
};

/// Load options from a YAML file.  Throws config_error.
DIGEN_EXPORT analysis_options load_options(const std::filesystem::path& path);

/// Parse options from YAML text.  Throws config_error.
DIGEN_EXPORT analysis_options parse_options(std::string_view yaml_text);

} // namespace digen
