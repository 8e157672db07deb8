#include "digen/diagnostic.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace digen {

namespace {

constexpr std::array<diagnostic_descriptor, 20> descriptors{{
    {diagnostic_code::unresolved_dependency, "DG001", "unresolved-dependency",
     severity::warning, "{0} depends on {1}, but no implementation of {1} is declared"},
    {diagnostic_code::unregistered_implementation, "DG002", "unregistered-implementation",
     severity::warning, "{0} depends on {1}; implementation {2} exists but is not registered"},
    {diagnostic_code::cycle_detected, "DG003", "cycle-detected",
     severity::warning, "Circular dependency detected: {0}"},
    {diagnostic_code::duplicate_in_declaration, "DG004", "duplicate-in-declaration",
     severity::warning, "{0} lists {1} more than once in one DependsOn declaration"},
    {diagnostic_code::duplicate_across_declarations, "DG005", "duplicate-across-declarations",
     severity::warning, "{0} declares dependency {1} more than once; {2}"},
    {diagnostic_code::conflicting_declaration_styles, "DG006", "conflicting-declaration-styles",
     severity::warning, "{0} declares {1} both on field '{2}' and in DependsOn; the field declaration is kept"},
    {diagnostic_code::lifetime_narrower_error, "DG007", "lifetime-narrower-error",
     severity::error, "Singleton {0} cannot capture shorter-lived dependency {1} (Scoped)"},
    {diagnostic_code::lifetime_narrower_warning, "DG008", "lifetime-narrower-warning",
     severity::warning, "Singleton {0} captures Transient dependency {1}; consider widening this transient"},
    {diagnostic_code::inheritance_lifetime_mismatch, "DG009", "inheritance-lifetime-mismatch",
     severity::error, "{0} ({1}) inherits a dependency on {2} ({3}) from {4}"},
    {diagnostic_code::skip_target_not_implemented, "DG010", "skip-target-not-implemented",
     severity::error, "{0} skips registration of {1}, which it does not implement"},
    {diagnostic_code::malformed_marker, "DG011", "malformed-marker",
     severity::error, "Malformed marker on {0}: {1}"},
    {diagnostic_code::identifier_collision, "DG012", "identifier-collision",
     severity::error, "{0}: generated identifier '{1}' is used for both {2} and {3}; constructor not generated"},
    {diagnostic_code::generic_substitution_failed, "DG013", "generic-substitution-failed",
     severity::warning, "{0}: {1}"},
    {diagnostic_code::conditional_conflicting, "DG014", "conditional-conflicting",
     severity::warning, "{0} has a conflicting ConditionalService rule: {1}"},
    {diagnostic_code::conditional_incomplete, "DG015", "conditional-incomplete",
     severity::warning, "{0} has an incomplete ConditionalService rule: {1}"},
    {diagnostic_code::register_as_not_implemented, "DG016", "register-as-not-implemented",
     severity::error, "{0} is registered as {1}, which it does not implement"},
    {diagnostic_code::internal_error, "DG017", "internal-error",
     severity::error, "Internal error while processing {0}: {1}"},
    {diagnostic_code::invalid_configuration_key, "DG018", "invalid-configuration-key",
     severity::error, "{0}: configuration key '{1}' is invalid: {2}"},
    {diagnostic_code::unsupported_configuration_type, "DG019", "unsupported-configuration-type",
     severity::warning, "{0}: field '{1}' of type {2} cannot be bound from configuration: {3}"},
    {diagnostic_code::background_service_lifetime, "DG020", "background-service-lifetime",
     severity::warning, "Background service {0} is declared {1}; hosted services run as Singleton"},
}};

} // anonymous namespace

const diagnostic_descriptor& describe(diagnostic_code code) {
    return descriptors[static_cast<std::size_t>(code) - 1];
}

std::optional<diagnostic_code> find_code(std::string_view id_or_name) {
    for (auto& d : descriptors) {
        if (internal::iequals(d.id, id_or_name) || d.name == id_or_name)
            return d.code;
    }
    return std::nullopt;
}

std::span<const diagnostic_descriptor> catalog() noexcept {
    return descriptors;
}

std::string format_message(std::string_view format,
                           const std::vector<std::string>& args) {
    std::string out;
    out.reserve(format.size());
    for (std::size_t i = 0; i < format.size(); ++i) {
        if (format[i] == '{') {
            auto close = format.find('}', i);
            if (close != std::string_view::npos && close > i + 1) {
                auto digits = format.substr(i + 1, close - i - 1);
                if (std::all_of(digits.begin(), digits.end(), [](char c) {
                        return std::isdigit(static_cast<unsigned char>(c));
                    })) {
                    std::size_t index = std::stoul(std::string(digits));
                    if (index < args.size()) out += args[index];
                    i = close;
                    continue;
                }
            }
        }
        out += format[i];
    }
    return out;
}

std::string diagnostic::to_string() const {
    std::string out;
    if (!location.empty()) out += location + ": ";
    out += std::string(digen::to_string(level)) + " " + std::string(id()) + ": " + message;
    return out;
}

diagnostic_sink::diagnostic_sink(diagnostic_options options)
    : options_(std::move(options))
{}

void diagnostic_sink::report(diagnostic_code code,
                             const std::vector<std::string>& args,
                             report_context context) {
    if (!options_.enabled) return;

    const auto& desc = describe(code);
    severity level = context.level.value_or(desc.default_severity);
    if (auto it = options_.overrides.find(code); it != options_.overrides.end())
        level = it->second;
    if (level == severity::hidden) return;

    diagnostic d;
    d.code = code;
    d.level = level;
    d.message = format_message(desc.message_format, args);
    d.types = std::move(context.types);
    d.location = std::move(context.location);
    d.detail = std::move(context.detail);
    diagnostics_.push_back(std::move(d));
}

std::vector<diagnostic> diagnostic_sink::take() noexcept {
    return std::exchange(diagnostics_, {});
}

std::size_t diagnostic_sink::count(diagnostic_code code) const {
    return static_cast<std::size_t>(std::count_if(
        diagnostics_.begin(), diagnostics_.end(),
        [code](const diagnostic& d) { return d.code == code; }));
}

bool diagnostic_sink::has_errors() const noexcept {
    return digen::has_errors(diagnostics_);
}

bool has_errors(const std::vector<diagnostic>& diagnostics) noexcept {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
                       [](const diagnostic& d) { return d.level == severity::error; });
}

} // namespace digen
