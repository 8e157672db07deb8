#include "digen/extractor.hpp"
#include "digen/diagnostic.hpp"
#include "digen/exceptions.hpp"
#include "digen/log.hpp"
#include "digen/options.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace digen {

namespace {

// ------------------------------------------------------------------
// Per-declaration extraction state
// ------------------------------------------------------------------
class marker_reader {
public:
    marker_reader(const type_declaration& decl, diagnostic_sink& sink)
        : decl_(decl), sink_(sink) {}

    void report(diagnostic_code code, const std::vector<std::string>& args) {
        sink_.report(code, args, {.types = {decl_.name}, .location = decl_.location});
    }

    const std::string& type_name() const noexcept { return decl_.name; }

    void malformed(const std::string& what) {
        report(diagnostic_code::malformed_marker, {decl_.name, what});
    }

    std::optional<type_ref> parse_type(const std::string& text, const std::string& context) {
        try {
            return type_ref::parse(text);
        } catch (const type_parse_error& e) {
            malformed(context + ": " + e.text() + " is not a valid type expression");
            return std::nullopt;
        }
    }

    std::vector<type_ref> parse_types(const marker& m) {
        std::vector<type_ref> out;
        for (auto& text : m.types) {
            if (auto t = parse_type(text, m.name)) out.push_back(std::move(*t));
        }
        return out;
    }

    bool flag(const marker& m, const std::string& arg, bool fallback) {
        auto it = m.args.find(arg);
        if (it == m.args.end()) return fallback;
        if (auto value = internal::parse_bool(it->second)) return *value;
        malformed(m.name + "(" + arg + " = " + it->second + "): expected a boolean");
        return fallback;
    }

    const std::string* arg(const marker& m, const std::string& name) const {
        auto it = m.args.find(name);
        return it == m.args.end() ? nullptr : &it->second;
    }

    void ignore_unknown_args(const marker& m, std::initializer_list<std::string_view> known) const {
        for (auto& [name, value] : m.args) {
            if (std::find(known.begin(), known.end(), name) == known.end()) {
                DIGEN_LOG_DEBUG << decl_.name << ": ignoring argument '" << name
                                << "' of marker " << m.name;
            }
        }
    }

private:
    const type_declaration& decl_;
    diagnostic_sink& sink_;
};

type_ref identify(const type_declaration& decl, std::vector<std::string>& params) {
    if (internal::is_blank(decl.name)) {
        throw declaration_error("", "type declaration without a name");
    }
    type_ref written;
    try {
        written = type_ref::parse(decl.name);
    } catch (const type_parse_error& e) {
        throw declaration_error(decl.name, e.what());
    }

    params = decl.generic_parameters;
    if (params.empty()) {
        for (auto& arg : written.args) {
            if (!arg.args.empty()) {
                throw declaration_error(decl.name,
                    "generic parameter '" + arg.to_string() + "' is not a plain name");
            }
            params.push_back(arg.name);
        }
    } else if (!written.args.empty() && written.args.size() != params.size()) {
        throw declaration_error(decl.name,
            "declares " + std::to_string(params.size())
            + " generic parameter(s) but is written with "
            + std::to_string(written.args.size()));
    }

    type_ref identity(written.name);
    for (auto& p : params) identity.args.emplace_back(p);
    return identity;
}

std::optional<registration_mode> parse_mode(std::string_view text) {
    if (internal::iequals(text, "DirectOnly") || text == "direct_only") return registration_mode::direct_only;
    if (internal::iequals(text, "All")) return registration_mode::all;
    if (internal::iequals(text, "Exclusionary")) return registration_mode::exclusionary;
    return std::nullopt;
}

std::optional<instance_sharing> parse_sharing(std::string_view text) {
    if (internal::iequals(text, "Separate")) return instance_sharing::separate;
    if (internal::iequals(text, "Shared")) return instance_sharing::shared;
    return std::nullopt;
}

// "DatabaseSettings" -> "Database"
std::string infer_configuration_key(const type_ref& type) {
    auto name = type.simple_name();
    for (std::string_view suffix : {"Settings", "Configuration", "Config", "Options", "Object"}) {
        if (name.size() > suffix.size() && name.ends_with(suffix))
            return name.substr(0, name.size() - suffix.size());
    }
    return name;
}

// Empty when `key` names a usable configuration section.
std::string configuration_key_problem(const std::string& key) {
    if (internal::is_blank(key)) return "empty key";
    if (key.find("::") != std::string::npos) return "empty section ('::')";
    if (key.front() == ':' || key.back() == ':') return "leading or trailing ':'";
    if (key.find_first_of(std::string_view("\0\r\n\t", 4)) != std::string::npos)
        return "control character";
    return {};
}

std::optional<configuration_binding> read_configuration(marker_reader& reader,
                                                        const marker& m,
                                                        const field_declaration& field) {
    reader.ignore_unknown_args(m, {"key", "default", "required"});
    if (internal::is_blank(field.name)) {
        reader.malformed("InjectConfiguration on a field without a name");
        return std::nullopt;
    }
    auto type = reader.parse_type(field.type, "InjectConfiguration field '" + field.name + "'");
    if (!type) return std::nullopt;

    configuration_binding binding;
    binding.field_name = field.name;
    binding.key = reader.arg(m, "key") ? *reader.arg(m, "key") : infer_configuration_key(*type);
    binding.type = std::move(*type);
    if (auto* fallback = reader.arg(m, "default")) binding.fallback = *fallback;
    binding.required = reader.flag(m, "required", true);

    if (auto problem = configuration_key_problem(binding.key); !problem.empty()) {
        reader.report(diagnostic_code::invalid_configuration_key,
                      {reader.type_name(), binding.key, problem});
        return std::nullopt;
    }
    return binding;
}

} // anonymous namespace

extraction_result extract(const type_declaration& decl,
                          const analysis_options& options,
                          diagnostic_sink& sink) {
    extraction_result result;
    auto& type = result.type;
    marker_reader reader(decl, sink);

    type.identity = identify(decl, type.generic_parameters);
    type.constraints = decl.constraints;
    type.is_interface = decl.kind == type_kind::interface_type;
    type.is_abstract = decl.is_abstract;
    type.location = decl.location;

    if (decl.base) {
        if (auto b = reader.parse_type(*decl.base, "base")) type.base = std::move(*b);
    }
    for (auto& text : decl.interfaces) {
        if (auto i = reader.parse_type(text, "interface")) type.interfaces.push_back(std::move(*i));
    }

    const std::string owner = type.key();
    std::size_t order = 0;
    std::size_t bulk_index = 0;
    bool intent = false;

    // ---- type-level markers ----
    for (auto& m : decl.markers) {
        if (auto lt = parse_lifetime(m.name); lt && m.name == marker_name(*lt)) {
            if (type.lifetime_declared) {
                reader.malformed("more than one lifetime marker ("
                                 + std::string(marker_name(type.lifetime)) + " kept, "
                                 + m.name + " ignored)");
                continue;
            }
            type.lifetime = *lt;
            type.lifetime_declared = true;
            intent = true;
        } else if (m.name == "DependsOn") {
            reader.ignore_unknown_args(m, {"naming", "strip_leading_marker", "prefix", "external"});
            if (m.types.empty()) {
                reader.malformed("DependsOn without dependency types");
                continue;
            }
            naming_options naming;
            if (auto* text = reader.arg(m, "naming")) {
                if (auto conv = parse_naming_convention(*text)) {
                    naming.convention = *conv;
                } else {
                    reader.malformed("DependsOn(naming = " + *text + "): unknown naming convention");
                }
            }
            naming.strip_leading_marker = reader.flag(m, "strip_leading_marker", true);
            if (auto* prefix = reader.arg(m, "prefix")) naming.prefix = *prefix;
            bool external = reader.flag(m, "external", false);

            std::size_t index = bulk_index++;
            for (auto& target : reader.parse_types(m)) {
                dependency_descriptor dep;
                dep.owner = owner;
                dep.target = std::move(target);
                dep.source = dependency_source::bulk_declaration;
                dep.naming = naming;
                dep.external = external;
                dep.order = order++;
                dep.declaration_index = index;
                result.dependencies.push_back(std::move(dep));
            }
            intent = true;
        } else if (m.name == "BackgroundService") {
            reader.ignore_unknown_args(m, {"auto_register", "suppress_lifetime_warnings"});
            if (type.is_interface) {
                reader.malformed("BackgroundService on an interface");
                continue;
            }
            background_service service;
            service.auto_register = reader.flag(m, "auto_register", true);
            service.suppress_lifetime_warnings = reader.flag(m, "suppress_lifetime_warnings", false);
            type.background = service;
            intent = true;
        } else if (m.name == "ExternalService") {
            type.external = true;
        } else if (m.name == "RegisterAsAll") {
            reader.ignore_unknown_args(m, {"mode", "sharing"});
            type.registration.declared = true;
            if (auto* text = reader.arg(m, "mode")) {
                if (auto mode = parse_mode(*text)) {
                    type.registration.mode = *mode;
                } else {
                    reader.malformed("RegisterAsAll(mode = " + *text + "): unknown registration mode");
                }
            }
            if (auto* text = reader.arg(m, "sharing")) {
                if (auto sharing = parse_sharing(*text)) {
                    type.registration.sharing = *sharing;
                } else {
                    reader.malformed("RegisterAsAll(sharing = " + *text + "): unknown instance sharing");
                }
            }
            intent = true;
        } else if (m.name == "RegisterAs") {
            reader.ignore_unknown_args(m, {"sharing"});
            if (m.types.empty()) {
                reader.malformed("RegisterAs without contract types");
                continue;
            }
            for (auto& contract : reader.parse_types(m)) {
                type.registration.explicit_contracts.push_back(std::move(contract));
            }
            if (auto* text = reader.arg(m, "sharing")) {
                if (auto sharing = parse_sharing(*text)) {
                    type.registration.sharing = *sharing;
                } else {
                    reader.malformed("RegisterAs(sharing = " + *text + "): unknown instance sharing");
                }
            }
            intent = true;
        } else if (m.name == "SkipRegistration") {
            if (m.types.empty()) {
                type.registration.skip_all = true;
            } else {
                for (auto& contract : reader.parse_types(m)) {
                    type.registration.skip.push_back(std::move(contract));
                }
            }
        } else if (m.name == "ConditionalService") {
            reader.ignore_unknown_args(m, {"environment", "not_environment", "config",
                                           "equals", "not_equals"});
            conditional_rule rule;
            if (auto* text = reader.arg(m, "environment")) rule.environments = internal::split_list(*text);
            if (auto* text = reader.arg(m, "not_environment")) rule.not_environments = internal::split_list(*text);
            if (auto* text = reader.arg(m, "config")) rule.config_key = *text;
            if (auto* text = reader.arg(m, "equals")) rule.equals = *text;
            if (auto* text = reader.arg(m, "not_equals")) rule.not_equals = internal::split_list(*text);
            type.conditions.push_back(std::move(rule));
            intent = true;
        } else {
            DIGEN_LOG_DEBUG << decl.name << ": ignoring unknown marker " << m.name;
        }
    }

    // ---- field markers ----
    for (std::size_t fi = 0; fi < decl.fields.size(); ++fi) {
        auto& field = decl.fields[fi];
        const bool injected = std::any_of(field.markers.begin(), field.markers.end(),
                                          [](const marker& m) { return m.name == "Inject"; });
        for (auto& m : field.markers) {
            if (m.name == "InjectConfiguration") {
                if (injected) {
                    reader.malformed("field '" + field.name
                                     + "' carries both Inject and InjectConfiguration; Inject is kept");
                } else if (auto binding = read_configuration(reader, m, field)) {
                    type.configuration.push_back(std::move(*binding));
                }
                continue;
            }
            if (m.name != "Inject") {
                DIGEN_LOG_DEBUG << decl.name << "::" << field.name
                                << ": ignoring unknown marker " << m.name;
                continue;
            }
            reader.ignore_unknown_args(m, {"external"});
            if (internal::is_blank(field.name)) {
                reader.malformed("Inject on a field without a name");
                continue;
            }
            auto target = reader.parse_type(field.type, "Inject field '" + field.name + "'");
            if (!target) continue;

            dependency_descriptor dep;
            dep.owner = owner;
            dep.target = std::move(*target);
            dep.source = dependency_source::field_marker;
            dep.external = reader.flag(m, "external", false);
            dep.order = order++;
            dep.declaration_index = fi;
            dep.field_name = field.name;
            result.dependencies.push_back(std::move(dep));
            intent = true;
        }
    }

    type.has_service_intent = intent;
    if (type.background) {
        if (type.lifetime_declared && type.lifetime != lifetime_kind::singleton
            && !type.background->suppress_lifetime_warnings) {
            reader.report(diagnostic_code::background_service_lifetime,
                          {decl.name, std::string(marker_name(type.lifetime))});
        }
        type.lifetime = lifetime_kind::singleton;
    } else if (!type.is_interface && !type.lifetime_declared && intent) {
        type.lifetime = options.default_lifetime;
    }

    DIGEN_LOG_TRACE << "Extracted " << type.display_name() << " ("
                    << to_string(type.lifetime) << ", "
                    << result.dependencies.size() << " dependencies, "
                    << type.configuration.size() << " configuration bindings)";
    return result;
}

} // namespace digen
