#include "digen/registration_planner.hpp"
#include "digen/diagnostic.hpp"
#include "digen/graph.hpp"
#include "digen/log.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <utility>

namespace digen {

namespace {

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

bool disjoint(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    return std::none_of(a.begin(), a.end(),
                        [&](const std::string& v) { return contains(b, v); });
}

bool subset(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    return std::all_of(a.begin(), a.end(),
                       [&](const std::string& v) { return contains(b, v); });
}

// ------------------------------------------------------------------
// ConditionalService rule checks
// ------------------------------------------------------------------
void validate_rule(const type_node& node, const conditional_rule& rule,
                   diagnostic_sink& sink) {
    const auto name = node.type.display_name();
    auto conflicting = [&](const std::string& what) {
        sink.report(diagnostic_code::conditional_conflicting, {name, what},
                    {.types = {name}, .location = node.type.location});
    };
    auto incomplete = [&](const std::string& what) {
        sink.report(diagnostic_code::conditional_incomplete, {name, what},
                    {.types = {name}, .location = node.type.location});
    };

    for (auto& env : rule.environments) {
        if (contains(rule.not_environments, env))
            conflicting("environment '" + env + "' is both required and excluded");
    }
    if (rule.equals && contains(rule.not_equals, *rule.equals))
        conflicting("config value '" + *rule.equals + "' is both required and excluded");

    if (rule.empty()) {
        incomplete("no environment or configuration condition");
        return;
    }
    if (rule.config_key) {
        if (internal::is_blank(*rule.config_key))
            incomplete("blank config key");
        else if (!rule.equals && rule.not_equals.empty())
            incomplete("config key '" + *rule.config_key + "' without equals or not_equals");
    } else if (rule.equals || !rule.not_equals.empty()) {
        incomplete("config comparison without config key");
    }
}

bool open_form(const type_ref& contract, const type_ref& identity) {
    return !contract.args.empty() && contract.args == identity.args;
}

void plan_hosted(const type_node& node, registration_plan& plan) {
    const auto& type = node.type;
    const auto name = type.display_name();
    if (!type.background->auto_register) {
        DIGEN_LOG_DEBUG << name << ": background service registered by hand";
        return;
    }
    if (type.is_generic()) {
        DIGEN_LOG_DEBUG << name << ": open generic background services are not hosted";
        return;
    }
    if (type.registration.declared || !type.registration.explicit_contracts.empty()
        || !type.registration.skip.empty()) {
        DIGEN_LOG_DEBUG << name << ": registration directives ignored for a background service";
    }

    registration r;
    r.implementation = type.key();
    r.implementation_type = type.identity;
    r.contract = type.identity;
    r.lifetime = lifetime_kind::singleton;
    r.hosted = true;
    if (type.conditions.empty()) {
        plan.registrations.push_back(std::move(r));
        return;
    }
    for (auto& rule : type.conditions) {
        r.condition = rule;
        plan.registrations.push_back(r);
    }
}

} // anonymous namespace

bool registration_plan::uses_environment() const {
    return std::any_of(registrations.begin(), registrations.end(), [](const registration& r) {
        return r.condition && r.condition->tests_environment();
    });
}

bool registration_plan::uses_configuration() const {
    return std::any_of(registrations.begin(), registrations.end(), [](const registration& r) {
        return r.condition && r.condition->tests_configuration();
    });
}

bool registration_plan::uses_hosted() const {
    return std::any_of(registrations.begin(), registrations.end(),
                       [](const registration& r) { return r.hosted; });
}

instance_sharing effective_sharing(const type_descriptor& type) {
    if (type.registration.sharing) return *type.registration.sharing;
    if (type.lifetime == lifetime_kind::singleton) return instance_sharing::shared;
    if (type.registration.declared && type.registration.mode == registration_mode::exclusionary)
        return instance_sharing::shared;
    return instance_sharing::separate;
}

bool mutually_exclusive(const conditional_rule& a, const conditional_rule& b) {
    if (!a.environments.empty() && !b.environments.empty()
        && disjoint(a.environments, b.environments))
        return true;
    if (!a.environments.empty() && subset(a.environments, b.not_environments)) return true;
    if (!b.environments.empty() && subset(b.environments, a.not_environments)) return true;

    if (a.config_key && b.config_key
        && internal::trim(*a.config_key) == internal::trim(*b.config_key)) {
        if (a.equals && b.equals && *a.equals != *b.equals) return true;
        if (a.equals && contains(b.not_equals, *a.equals)) return true;
        if (b.equals && contains(a.not_equals, *b.equals)) return true;
    }
    return false;
}

registration_plan plan_registrations(const dependency_graph& graph, diagnostic_sink& sink) {
    registration_plan plan;

    for (auto& node : graph.nodes()) {
        const auto& type = node.type;
        if (!type.is_concrete() || type.external || type.lifetime == lifetime_kind::unassigned)
            continue;

        const auto name = type.display_name();
        for (auto& rule : type.conditions) validate_rule(node, rule, sink);

        if (type.registration.skip_all) {
            DIGEN_LOG_DEBUG << name << ": registration skipped";
            continue;
        }

        if (type.background) {
            plan_hosted(node, plan);
            continue;
        }

        const auto& directive = type.registration;
        for (auto& skipped : directive.skip) {
            if (!graph.implements(node, skipped)) {
                sink.report(diagnostic_code::skip_target_not_implemented,
                            {name, skipped.to_string()},
                            {.types = {name}, .location = type.location});
            }
        }

        std::vector<type_ref> contracts;
        const bool explicit_list = !directive.explicit_contracts.empty();
        if (explicit_list) {
            for (auto& contract : directive.explicit_contracts) {
                if (!graph.implements(node, contract)) {
                    sink.report(diagnostic_code::register_as_not_implemented,
                                {name, contract.to_string()},
                                {.types = {name}, .location = type.location});
                    continue;
                }
                if (std::find(contracts.begin(), contracts.end(), contract) == contracts.end())
                    contracts.push_back(contract);
            }
        } else if (!(directive.declared && directive.mode == registration_mode::direct_only)) {
            contracts = node.interfaces;
        }

        std::erase_if(contracts, [&](const type_ref& contract) {
            return std::any_of(directive.skip.begin(), directive.skip.end(),
                               [&](const type_ref& skipped) {
                                   substitution_map bindings;
                                   return unify(skipped, contract, type.generic_parameters, bindings);
                               });
        });

        const bool open = type.is_generic();
        if (open) {
            std::erase_if(contracts, [&](const type_ref& contract) {
                if (open_form(contract, type.identity)) return false;
                DIGEN_LOG_DEBUG << name << ": " << contract.to_string()
                                << " cannot be registered as an open generic contract";
                return true;
            });
        }

        const auto sharing = effective_sharing(type);
        bool include_concrete = true;
        if (explicit_list) {
            include_concrete = sharing == instance_sharing::shared;
        } else if (directive.declared && directive.mode == registration_mode::exclusionary) {
            include_concrete = sharing == instance_sharing::shared && !contracts.empty();
        }
        const bool forward = include_concrete && sharing == instance_sharing::shared;

        std::vector<registration> planned;
        auto add = [&](const type_ref& contract, bool forwarding) {
            registration r;
            r.implementation = type.key();
            r.implementation_type = type.identity;
            r.contract = contract;
            r.lifetime = type.lifetime;
            r.forward = forwarding;
            r.open_generic = open;
            planned.push_back(std::move(r));
        };
        if (include_concrete) add(type.identity, false);
        for (auto& contract : contracts) add(contract, forward);

        if (type.conditions.empty()) {
            plan.registrations.insert(plan.registrations.end(), planned.begin(), planned.end());
        } else {
            for (auto& rule : type.conditions) {
                for (auto r : planned) {
                    r.condition = rule;
                    plan.registrations.push_back(std::move(r));
                }
            }
        }
        DIGEN_LOG_TRACE << name << ": " << planned.size() << " registration(s)";
    }

    DIGEN_LOG_DEBUG << "Planned " << plan.registrations.size() << " registrations";
    return plan;
}

} // namespace digen
