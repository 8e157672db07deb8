#pragma once

#include "export.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace digen {

enum class severity {
    hidden,
    info,
    warning,
    error
};

constexpr std::string_view to_string(severity s) noexcept {
    constexpr std::string_view names[] = {"hidden", "info", "warning", "error"};
    return names[static_cast<int>(s)];
}

constexpr std::optional<severity> parse_severity(std::string_view text) noexcept {
    if (text == "hidden" || text == "none") return severity::hidden;
    if (text == "info") return severity::info;
    if (text == "warning") return severity::warning;
    if (text == "error") return severity::error;
    return std::nullopt;
}

/// Stable diagnostic identities; the numeric value is the DGnnn suffix.
enum class diagnostic_code {
    unresolved_dependency = 1,
    unregistered_implementation,
    cycle_detected,
    duplicate_in_declaration,
    duplicate_across_declarations,
    conflicting_declaration_styles,
    lifetime_narrower_error,
    lifetime_narrower_warning,
    inheritance_lifetime_mismatch,
    skip_target_not_implemented,
    malformed_marker,
    identifier_collision,
    generic_substitution_failed,
    conditional_conflicting,
    conditional_incomplete,
    register_as_not_implemented,
    internal_error,
    invalid_configuration_key,
    unsupported_configuration_type,
    background_service_lifetime
};

/// Catalog entry: id, kebab-case name, default severity and a message
/// template with positional `{0}`, `{1}` ... placeholders.
struct diagnostic_descriptor {
    diagnostic_code code;
    std::string_view id;
    std::string_view name;
    severity default_severity;
    std::string_view message_format;
};

DIGEN_EXPORT const diagnostic_descriptor& describe(diagnostic_code code);

/// Look up a code by id (`DG007`) or name (`lifetime-narrower-error`).
DIGEN_EXPORT std::optional<diagnostic_code> find_code(std::string_view id_or_name);

DIGEN_EXPORT std::span<const diagnostic_descriptor> catalog() noexcept;

/// Substitute `{N}` placeholders in `format` with `args[N]`.
DIGEN_EXPORT std::string format_message(std::string_view format,
                                        const std::vector<std::string>& args);

struct diagnostic {
    diagnostic_code code = diagnostic_code::internal_error;
    severity level = severity::error;
    std::string message;
    std::vector<std::string> types;     // display names of involved types
    std::string location;
    std::string detail;

    std::string_view id() const { return describe(code).id; }

    /// `location: severity DGnnn: message`
    DIGEN_EXPORT std::string to_string() const;
};

/// Diagnostic configuration; see options.hpp for how it is loaded.
struct diagnostic_options {
    bool enabled = true;
    std::map<diagnostic_code, severity> overrides;
};

/// Optional parts of a report.
struct report_context {
    std::vector<std::string> types;
    std::string location;
    std::optional<severity> level;      // per-report default, e.g. DG009
    std::string detail;
};

// ---------------------------------------------------------------
// diagnostic_sink: collects diagnostics, honoring diagnostic_options
// ---------------------------------------------------------------
class DIGEN_EXPORT diagnostic_sink {
public:
    explicit diagnostic_sink(diagnostic_options options = {});

    /// Record one diagnostic.  Dropped when diagnostics are disabled or the
    /// effective severity is `hidden`.  An override in the options beats
    /// both the catalog default and `context.level`.
    void report(diagnostic_code code, const std::vector<std::string>& args,
                report_context context = {});

    const std::vector<diagnostic>& diagnostics() const noexcept { return diagnostics_; }

    /// Move the collected diagnostics out, leaving the sink empty.
    std::vector<diagnostic> take() noexcept;

    std::size_t count(diagnostic_code code) const;
    bool has_errors() const noexcept;

private:
    diagnostic_options options_;
    std::vector<diagnostic> diagnostics_;
};

DIGEN_EXPORT bool has_errors(const std::vector<diagnostic>& diagnostics) noexcept;

} // namespace digen
