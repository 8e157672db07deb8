#include "digen/emitter.hpp"
#include "digen/graph.hpp"
#include "digen/options.hpp"
#include "digen/registration_planner.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <sstream>

namespace digen {

namespace {

constexpr std::string_view indent = "    ";

std::string quote(std::string_view text) {
    std::string out = "\"";
    for (char c : text) {
        switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        default:   out += c; break;
        }
    }
    out += '"';
    return out;
}

std::string parameter_type(const resolved_dependency& dep) {
    std::string pointer = "std::shared_ptr<" + dep.target.to_string() + ">";
    return dep.via_collection ? "std::vector<" + pointer + ">" : pointer;
}

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

std::string any_of_clause(const std::vector<std::string>& parts, std::string_view op) {
    auto text = join(parts, op);
    return parts.size() > 1 ? "(" + text + ")" : text;
}

std::string configuration_read(const configuration_binding& binding) {
    const auto type = binding.type.to_string();
    std::string call = "configuration.get<" + type + ">(" + quote(binding.key);
    if (binding.fallback) {
        call += ", " + *binding.fallback;
    } else if (!binding.required) {
        call += ", " + type + "{}";
    }
    return call + ")";
}

std::string registration_call(const registration& r) {
    if (r.hosted) {
        return "services.template add_hosted<" + r.implementation_type.to_string() + ">();";
    }
    const std::string lifetime(to_string(r.lifetime));
    std::string function;
    std::string contract;
    std::string implementation;
    if (r.open_generic) {
        function = r.forward ? "forward_open" : "add_" + lifetime + "_open";
        contract = r.contract.name;
        implementation = r.implementation_type.name;
    } else {
        function = r.forward ? "forward" : "add_" + lifetime;
        contract = r.contract.to_string();
        implementation = r.implementation_type.to_string();
    }
    return "services.template " + function + "<" + contract + ", " + implementation + ">();";
}

} // anonymous namespace

std::string fragment_file_name(const type_descriptor& type) {
    std::string stem;
    const auto& name = type.identity.name;
    for (std::size_t i = 0; i < name.size(); ++i) {
        if (name.compare(i, 2, "::") == 0) {
            if (!stem.empty()) stem += '_';
            ++i;
        } else if (name[i] == '.') {
            stem += '_';
        } else {
            stem += name[i];
        }
    }
    if (type.is_generic()) stem += "_" + std::to_string(type.generic_parameters.size());
    return stem + ".digen.inc";
}

// ------------------------------------------------------------------
// Constructor fragment
// ------------------------------------------------------------------
generated_source emit_constructor(const type_node& node, const generation_options& options) {
    const auto& type = node.type;
    const auto& deps = node.dependencies;
    const auto class_name = type.identity.simple_name();

    std::ostringstream out;
    out << "// Generated by digen from " << type.display_name() << ". Do not edit.\n"
        << "// Include inside the body of class " << class_name << ".\n\n"
        << "public:\n";

    std::vector<std::string> params;
    for (auto& dep : deps) {
        params.push_back(parameter_type(dep) + " " + dep.parameter_name);
    }
    if (node.needs_configuration()) {
        params.push_back("const " + options.configuration_type + "& configuration");
    }

    out << indent << (params.size() == 1 ? "explicit " : "") << class_name << "(";
    if (params.size() <= 1) {
        out << join(params, ", ");
    } else {
        for (std::size_t i = 0; i < params.size(); ++i) {
            out << "\n" << indent << indent << params[i] << (i + 1 < params.size() ? "," : "");
        }
    }
    out << ")\n";

    if ((!node.base_arguments.empty() || node.inherits_configuration) && type.base) {
        std::vector<std::string> forwarded;
        for (auto k : node.base_arguments) {
            const auto& param = deps[k].parameter_name;
            auto uses = std::count(node.base_arguments.begin(), node.base_arguments.end(), k);
            forwarded.push_back(uses > 1 ? param : "std::move(" + param + ")");
        }
        if (node.inherits_configuration) forwarded.push_back("configuration");
        out << indent << indent << ": " << type.base->to_string() << "("
            << join(forwarded, ", ") << ")\n";
    }

    const auto own = node.own();
    out << indent << "{\n";
    for (auto& dep : own) {
        out << indent << indent << dep.field_name << " = std::move(" << dep.parameter_name << ");\n";
    }
    for (auto& binding : type.configuration) {
        out << indent << indent << binding.field_name << " = " << configuration_read(binding) << ";\n";
    }
    out << indent << "}\n";

    bool members = std::any_of(own.begin(), own.end(), [](const resolved_dependency& d) {
        return d.declaration.source == dependency_source::bulk_declaration;
    });
    if (members) {
        out << "\nprivate:\n";
        for (auto& dep : own) {
            if (dep.declaration.source != dependency_source::bulk_declaration) continue;
            out << indent << parameter_type(dep) << " " << dep.field_name << ";\n";
        }
    }

    return {fragment_file_name(type), out.str(), type.key()};
}

// ------------------------------------------------------------------
// Registration entry point
// ------------------------------------------------------------------
std::string render_condition(const conditional_rule& rule) {
    std::vector<std::string> clauses;

    if (!rule.environments.empty()) {
        std::vector<std::string> parts;
        for (auto& env : rule.environments) parts.push_back("environment == " + quote(env));
        clauses.push_back(any_of_clause(parts, " || "));
    }
    if (!rule.not_environments.empty()) {
        std::vector<std::string> parts;
        for (auto& env : rule.not_environments) parts.push_back("environment != " + quote(env));
        clauses.push_back(any_of_clause(parts, " && "));
    }
    if (rule.config_key) {
        const auto value = "configuration.get(" + quote(internal::trim(*rule.config_key)) + ")";
        if (rule.equals) clauses.push_back(value + " == " + quote(*rule.equals));
        if (!rule.not_equals.empty()) {
            std::vector<std::string> parts;
            for (auto& v : rule.not_equals) parts.push_back(value + " != " + quote(v));
            clauses.push_back(any_of_clause(parts, " && "));
        }
    }

    if (clauses.empty()) return "true";
    return join(clauses, " && ");
}

generated_source emit_registrations(const registration_plan& plan,
                                    const generation_options& options) {
    const bool environment = plan.uses_environment();
    const bool configuration = plan.uses_configuration();
    const std::string function = "add_" + options.unit + "_services";

    std::ostringstream out;
    out << "// Generated by digen. Do not edit.\n"
        << "// Services must provide add_singleton/add_scoped/add_transient<I, T>(),\n"
        << "// forward<I, T>() and the *_open variants for open generic types.\n";
    if (plan.uses_hosted()) {
        out << "// Background services also need add_hosted<T>().\n";
    }
    out << "#pragma once\n";
    if (environment) {
        out << "\n#include <cstdlib>\n#include <string>\n";
    }
    out << "\n";
    if (!options.namespace_name.empty()) {
        out << "namespace " << options.namespace_name << " {\n\n";
    }

    if (configuration) {
        out << "template <typename Services, typename Configuration>\n"
            << "Services& " << function << "(Services& services, const Configuration& configuration)\n";
    } else {
        out << "template <typename Services>\n"
            << "Services& " << function << "(Services& services)\n";
    }
    out << "{\n";

    if (environment) {
        out << indent << "const char* environment_value = std::getenv("
            << quote(options.environment_variable) << ");\n"
            << indent << "const std::string environment = environment_value ? environment_value : \"\";\n";
    }

    bool first = true;
    for (auto& r : plan.registrations) {
        if (r.condition) continue;
        if (first && environment) out << "\n";
        first = false;
        out << indent << registration_call(r) << "\n";
    }

    // Conditional registrations, grouped per contract in first-seen order.
    std::vector<std::string> order;
    std::map<std::string, std::vector<const registration*>> groups;
    for (auto& r : plan.registrations) {
        if (!r.condition) continue;
        auto key = r.contract.to_string();
        auto [it, inserted] = groups.try_emplace(key);
        if (inserted) order.push_back(key);
        it->second.push_back(&r);
    }

    for (auto& key : order) {
        const auto& group = groups[key];
        std::set<std::string> implementations;
        for (auto* r : group) implementations.insert(r->implementation);

        bool exclusive = group.size() >= 2 && implementations.size() >= 2;
        for (std::size_t i = 0; exclusive && i < group.size(); ++i) {
            for (std::size_t j = i + 1; exclusive && j < group.size(); ++j) {
                exclusive = mutually_exclusive(*group[i]->condition, *group[j]->condition);
            }
        }

        out << "\n";
        for (std::size_t i = 0; i < group.size(); ++i) {
            const auto& r = *group[i];
            out << indent;
            if (exclusive && i > 0) {
                out << "} else if (";
            } else {
                out << "if (";
            }
            out << render_condition(*r.condition) << ") {\n"
                << indent << indent << registration_call(r) << "\n";
            if (!exclusive) out << indent << "}\n";
        }
        if (exclusive) out << indent << "}\n";
    }

    out << "\n" << indent << "return services;\n"
        << "}\n";
    if (!options.namespace_name.empty()) {
        out << "\n} // namespace " << options.namespace_name << "\n";
    }

    return {options.unit + ".digen.hpp", out.str(), {}};
}

} // namespace digen
