#include "digen/graph.hpp"
#include "digen/diagnostic.hpp"
#include "digen/exceptions.hpp"
#include "digen/log.hpp"
#include "digen/naming.hpp"
#include "digen/options.hpp"
#include "stacktrace_utils.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <set>
#include <tuple>
#include <utility>

namespace digen {

struct dependency_graph::Impl {
    analysis_options options;
    std::vector<type_node> nodes;
    std::map<std::string, std::size_t, std::less<>> index;
    std::vector<edge> edges;
};

dependency_graph::dependency_graph()
    : impl_(std::make_unique<Impl>())
{}

dependency_graph::~dependency_graph() = default;
dependency_graph::dependency_graph(dependency_graph&&) noexcept = default;
dependency_graph& dependency_graph::operator=(dependency_graph&&) noexcept = default;

const std::vector<type_node>& dependency_graph::nodes() const noexcept {
    return impl_->nodes;
}

const type_node* dependency_graph::find(std::string_view key) const {
    auto it = impl_->index.find(key);
    return it == impl_->index.end() ? nullptr : &impl_->nodes[it->second];
}

const std::vector<edge>& dependency_graph::edges() const noexcept {
    return impl_->edges;
}

std::vector<const edge*> dependency_graph::outgoing(std::string_view key) const {
    std::vector<const edge*> out;
    for (auto& e : impl_->edges) {
        if (e.from == key) out.push_back(&e);
    }
    return out;
}

bool dependency_graph::implements(const type_node& node, const type_ref& contract) const {
    for (auto& iface : node.interfaces) {
        substitution_map bindings;
        if (unify(contract, iface, node.type.generic_parameters, bindings)) return true;
    }
    return false;
}

std::vector<std::string> dependency_graph::implementations_of(
        const type_ref& target, const std::vector<std::string>& wildcards,
        bool include_external) const {
    std::vector<std::string> out;
    for (auto& node : impl_->nodes) {
        if (!node.type.is_concrete()) continue;
        if (node.type.external && !include_external) continue;

        auto w = wildcards;
        w.insert(w.end(), node.type.generic_parameters.begin(),
                 node.type.generic_parameters.end());
        auto provides = [&](const type_ref& provided) {
            substitution_map bindings;
            return unify(provided, target, w, bindings);
        };
        if (provides(node.type.identity)
            || std::any_of(node.bases.begin(), node.bases.end(), provides)
            || std::any_of(node.interfaces.begin(), node.interfaces.end(), provides)) {
            out.push_back(node.key());
        }
    }
    return out;
}

const analysis_options& dependency_graph::options() const noexcept {
    return impl_->options;
}

// ------------------------------------------------------------------
// graph_builder: the passes behind build_graph()
// ------------------------------------------------------------------
class graph_builder {
public:
    graph_builder(const analysis_options& options, diagnostic_sink& sink)
        : options_(options), sink_(sink) {}

    dependency_graph build(std::vector<extraction_result> types) {
        impl().options = options_;
        index_types(types);

        auto& nodes = impl().nodes;
        merged_.resize(nodes.size());
        for (std::size_t i = 0; i < nodes.size(); ++i) {
            guarded(nodes[i], "merging declarations", [&] {
                merged_[i] = merge_own(nodes[i], std::move(own_[i]));
            });
        }
        for (auto& node : nodes) {
            guarded(node, "collecting base types", [&] { collect_ancestry(node); });
        }
        for (std::size_t i = 0; i < nodes.size(); ++i) {
            guarded(nodes[i], "flattening inherited dependencies", [&] { flatten(i); });
        }
        for (auto& node : nodes) {
            guarded(node, "linking the base constructor", [&] { link_base_call(node); });
        }
        for (auto& node : nodes) {
            guarded(node, "resolving dependencies", [&] {
                check_identifiers(node);
                check_configuration(node);
                resolve_candidates(node);
            });
        }
        for (auto& node : nodes) {
            guarded(node, "connecting edges", [&] { connect(node); });
        }

        DIGEN_LOG_DEBUG << "Dependency graph: " << nodes.size() << " types, "
                        << impl().edges.size() << " edges";
        return std::move(graph_);
    }

private:
    const analysis_options& options_;
    diagnostic_sink& sink_;
    dependency_graph graph_;
    std::vector<std::vector<dependency_descriptor>> own_;
    std::vector<std::vector<dependency_descriptor>> merged_;
    std::set<std::tuple<std::string, std::string, bool>> edge_keys_;

    dependency_graph::Impl& impl() { return *graph_.impl_; }

    const type_node* lookup(const type_ref& ref) const {
        return graph_.find(ref.definition_key());
    }

    std::size_t index_of(const type_node& node) const {
        return graph_.impl_->index.at(node.key());
    }

    void report(diagnostic_code code, const type_node& node,
                std::vector<std::string> args, std::string detail = {}) {
        sink_.report(code, args, {.types = {node.type.display_name()},
                                  .location = node.type.location,
                                  .detail = std::move(detail)});
    }

    template <typename Fn>
    void guarded(const type_node& node, std::string_view stage, Fn&& fn) {
        const auto name = node.type.display_name();
        try {
            fn();
        } catch (substitution_error& e) {
            e.append_context(std::string(stage) + " of " + name);
            report(diagnostic_code::generic_substitution_failed, node, {name, e.what()},
                   internal::format_fault_detail(name, e));
        } catch (digen_error& e) {
            e.append_context(std::string(stage) + " of " + name);
            report(diagnostic_code::internal_error, node, {name, e.what()},
                   internal::format_fault_detail(name, e));
        } catch (const std::exception& e) {
            report(diagnostic_code::internal_error, node,
                   {name, std::string(e.what()) + " (while " + std::string(stage) + ")"});
        }
    }

    // ---- pass 0: index declarations ----
    void index_types(std::vector<extraction_result>& types) {
        auto& g = impl();
        for (auto& result : types) {
            auto key = result.type.key();
            if (g.index.count(key)) {
                sink_.report(diagnostic_code::malformed_marker,
                             {result.type.display_name(),
                              "type declared more than once; the first declaration is kept"},
                             {.types = {result.type.display_name()},
                              .location = result.type.location});
                continue;
            }
            result.type.declaration_order = g.nodes.size();
            g.index.emplace(key, g.nodes.size());
            type_node node;
            node.type = std::move(result.type);
            g.nodes.push_back(std::move(node));
            own_.push_back(std::move(result.dependencies));
        }
    }

    // ---- pass 1: merge rules on one type's own declarations ----
    std::vector<dependency_descriptor> merge_own(const type_node& node,
                                                 std::vector<dependency_descriptor> declared) {
        const auto name = node.type.display_name();
        std::vector<dependency_descriptor> kept;
        std::map<std::string, std::size_t> seen;

        for (auto& dep : declared) {
            auto target = dep.target.to_string();
            auto it = seen.find(target);
            if (it == seen.end()) {
                seen.emplace(target, kept.size());
                kept.push_back(std::move(dep));
                continue;
            }
            auto& first = kept[it->second];
            if (first.source != dep.source) {
                const auto& field = first.source == dependency_source::field_marker
                                        ? first.field_name : dep.field_name;
                report(diagnostic_code::conflicting_declaration_styles, node,
                       {name, target, field});
                if (dep.source == dependency_source::field_marker) {
                    first = std::move(dep);
                }
            } else if (dep.source == dependency_source::bulk_declaration
                       && dep.declaration_index == first.declaration_index) {
                report(diagnostic_code::duplicate_in_declaration, node, {name, target});
            } else {
                report(diagnostic_code::duplicate_across_declarations, node,
                       {name, target, "the first declaration is kept"});
            }
        }
        return kept;
    }

    // ---- pass 2: base classes and transitive interfaces ----
    void collect_ancestry(type_node& node) {
        std::set<std::string> seen{node.key()};
        substitution_map bindings;
        auto current = node.type.base;
        while (current) {
            type_ref base = substitute(*current, bindings);
            const type_node* decl = lookup(base);
            if (decl && decl->type.is_interface) break;
            node.bases.push_back(base);
            if (!decl) break;
            if (!seen.insert(decl->key()).second) {
                throw substitution_error(node.type.display_name(),
                    "inheritance cycle through " + decl->type.display_name());
            }
            bindings = bind_parameters(decl->type.display_name(),
                                       decl->type.generic_parameters, base.args);
            current = decl->type.base;
        }
        std::set<std::string> expanded;
        add_interfaces(node.type, {}, node.interfaces, expanded, 0);

        node.inherits_configuration = std::any_of(
            node.bases.begin(), node.bases.end(), [&](const type_ref& base) {
                const type_node* decl = lookup(base);
                return decl && !decl->type.configuration.empty();
            });
    }

    // `expanded` holds every applied type already walked, so shared
    // ancestors (diamonds) are expanded once.
    void add_interfaces(const type_descriptor& type, const substitution_map& bindings,
                        std::vector<type_ref>& out, std::set<std::string>& expanded,
                        int depth) {
        constexpr int max_depth = 64;
        if (depth > max_depth) {
            throw substitution_error(type.display_name(), "inheritance nesting too deep");
        }
        auto visit = [&](const type_ref& ref, bool is_interface_ref) {
            type_ref applied = substitute(ref, bindings);
            const type_node* decl = lookup(applied);
            bool is_interface = decl ? decl->type.is_interface : is_interface_ref;
            if (is_interface && std::find(out.begin(), out.end(), applied) == out.end()) {
                out.push_back(applied);
            }
            if (decl && expanded.insert(applied.to_string()).second) {
                add_interfaces(decl->type,
                               bind_parameters(decl->type.display_name(),
                                               decl->type.generic_parameters, applied.args),
                               out, expanded, depth + 1);
            }
        };
        for (auto& iface : type.interfaces) visit(iface, true);
        if (type.base) visit(*type.base, false);
    }

    // ---- pass 3: frames, substitution, flattening ----
    resolved_dependency resolve_dependency(const dependency_descriptor& dep,
                                           const substitution_map& bindings,
                                           bool inherited,
                                           const std::string& declared_in) {
        resolved_dependency r;
        r.declaration = dep;
        r.declared = bindings.empty() ? dep.target : substitute(dep.target, bindings);
        if (options_.is_collection_wrapper(r.declared)) {
            r.via_collection = true;
            r.target = r.declared.args.front();
        } else {
            r.target = r.declared;
        }
        r.inherited = inherited;
        r.declared_in = declared_in;
        r.external = dep.external || options_.is_assumed_external(r.target);
        if (!r.external) {
            if (const type_node* t = lookup(r.target); t && t->type.external) r.external = true;
        }

        if (dep.source == dependency_source::field_marker) {
            r.field_name = dep.field_name;
            r.parameter_name = escape_keyword(parameter_name_from_field(dep.field_name));
        } else {
            const auto simple = r.target.simple_name();
            auto body = resolve(simple, dep.naming.convention, dep.naming.strip_leading_marker,
                                "", options_.leading_marker);
            auto param = resolve(simple, naming_convention::camel_case,
                                 dep.naming.strip_leading_marker, "", options_.leading_marker);
            if (r.via_collection) {
                body = pluralize(body);
                param = pluralize(param);
            }
            r.field_name = escape_keyword(dep.naming.prefix + body);
            r.parameter_name = escape_keyword(param);
        }
        return r;
    }

    void flatten(std::size_t i) {
        auto& node = impl().nodes[i];
        const auto name = node.type.display_name();

        // Base chain, nearest first, each with the bindings that map its
        // generic parameters into this node's terms.
        std::vector<std::pair<const type_node*, substitution_map>> chain;
        std::set<std::string> seen{node.key()};
        substitution_map bindings;
        auto current = node.type.base;
        while (current) {
            type_ref base;
            try {
                base = substitute(*current, bindings);
            } catch (const substitution_error& e) {
                report(diagnostic_code::generic_substitution_failed, node, {name, e.what()});
                break;
            }
            const type_node* decl = lookup(base);
            if (!decl || decl->type.is_interface || !seen.insert(decl->key()).second) break;
            try {
                bindings = bind_parameters(decl->type.display_name(),
                                           decl->type.generic_parameters, base.args);
            } catch (const substitution_error& e) {
                report(diagnostic_code::generic_substitution_failed, node, {name, e.what()});
                break;
            }
            chain.emplace_back(decl, bindings);
            current = decl->type.base;
        }

        std::vector<resolved_dependency> flat;
        std::map<std::string, std::string> identities;     // target -> declaring type
        for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
            const auto& [base, base_bindings] = *it;
            for (auto& dep : merged_[index_of(*base)]) {
                resolved_dependency r;
                try {
                    r = resolve_dependency(dep, base_bindings, true, base->key());
                } catch (const substitution_error& e) {
                    report(diagnostic_code::generic_substitution_failed, node, {name, e.what()});
                    continue;
                }
                if (identities.emplace(r.declared.to_string(), base->type.display_name()).second) {
                    flat.push_back(std::move(r));
                }
            }
        }
        node.inherited_count = flat.size();

        for (auto& dep : merged_[i]) {
            auto r = resolve_dependency(dep, {}, false, node.key());
            auto identity = r.declared.to_string();
            if (auto it = identities.find(identity); it != identities.end()) {
                report(diagnostic_code::duplicate_across_declarations, node,
                       {name, identity,
                        "already inherited from " + it->second
                            + "; the inherited declaration is kept"});
                continue;
            }
            identities.emplace(identity, name);
            flat.push_back(std::move(r));
        }
        node.dependencies = std::move(flat);
    }

    // Map every parameter of the nearest base's constructor onto the
    // inherited dependency that feeds it.  Two base parameters can land on
    // one dependency once the base's arguments are substituted.
    void link_base_call(type_node& node) {
        if (node.inherited_count == 0 || node.bases.empty()) return;
        const type_node* base = lookup(node.bases.front());
        if (!base || base->type.is_interface) return;

        const auto name = node.type.display_name();
        const auto inherited = node.inherited();
        node.base_call_resolved = false;
        auto bindings = bind_parameters(base->type.display_name(),
                                        base->type.generic_parameters,
                                        node.bases.front().args);
        std::set<std::size_t> forwarded;
        for (auto& dep : base->dependencies) {
            const auto identity = substitute(dep.declared, bindings).to_string();
            auto it = std::find_if(inherited.begin(), inherited.end(),
                                   [&](const resolved_dependency& d) {
                                       return d.declared.to_string() == identity;
                                   });
            if (it == inherited.end()) {
                throw substitution_error(name,
                    "base parameter '" + dep.parameter_name + "' (" + identity
                    + ") has no inherited counterpart");
            }
            auto k = static_cast<std::size_t>(it - inherited.begin());
            if (!forwarded.insert(k).second) {
                report(diagnostic_code::duplicate_across_declarations, node,
                       {name, identity,
                        "declared twice by " + base->type.display_name()
                            + " once substituted; one parameter feeds both"});
            }
            node.base_arguments.push_back(k);
        }
        node.base_call_resolved = true;
    }

    // ---- pass 4: identifiers and candidate resolution ----
    void check_identifiers(type_node& node) {
        const auto name = node.type.display_name();
        std::map<std::string, std::string> fields;
        std::map<std::string, std::string> params;
        auto claim = [&](std::map<std::string, std::string>& used,
                         const std::string& identifier, const std::string& owner) {
            auto [it, inserted] = used.emplace(identifier, owner);
            if (inserted) return;
            report(diagnostic_code::identifier_collision, node,
                   {name, identifier, it->second, owner});
            node.identifiers_valid = false;
        };
        for (auto& d : node.dependencies) {
            claim(fields, d.field_name, d.declared.to_string());
            claim(params, d.parameter_name, d.declared.to_string());
        }
        for (auto& binding : node.type.configuration) {
            claim(fields, binding.field_name, "configuration '" + binding.key + "'");
        }
        if (node.needs_configuration()) claim(params, "configuration", "the configuration");
    }

    // Interfaces and abstract classes cannot be materialized from a
    // configuration section.
    void check_configuration(const type_node& node) {
        if (node.type.external || node.type.is_interface) return;
        const auto name = node.type.display_name();
        for (auto& binding : node.type.configuration) {
            const type_node* decl = lookup(binding.type);
            if (!decl || decl->type.is_concrete()) continue;
            report(diagnostic_code::unsupported_configuration_type, node,
                   {name, binding.field_name, binding.type.to_string(),
                    decl->type.is_interface ? "it is an interface" : "it is abstract"});
        }
    }

    void resolve_candidates(type_node& node) {
        const auto name = node.type.display_name();
        const bool reports = !node.type.external && !node.type.is_interface;
        for (std::size_t k = 0; k < node.dependencies.size(); ++k) {
            auto& d = node.dependencies[k];
            if (d.external) continue;

            std::vector<std::string> unregistered;
            for (auto& key : graph_.implementations_of(d.target, node.type.generic_parameters)) {
                if (graph_.find(key)->type.lifetime != lifetime_kind::unassigned) {
                    d.candidates.push_back(key);
                } else {
                    unregistered.push_back(key);
                }
            }

            // Only provided by external types: satisfied outside the graph.
            if (d.candidates.empty() && unregistered.empty()
                && !graph_.implementations_of(d.target, node.type.generic_parameters, true).empty()) {
                d.external = true;
                continue;
            }

            if (!d.via_collection && !d.candidates.empty()) {
                auto unconditional = std::find_if(
                    d.candidates.rbegin(), d.candidates.rend(),
                    [&](const std::string& key) { return !graph_.find(key)->type.is_conditional(); });
                d.chosen = unconditional != d.candidates.rend() ? *unconditional
                                                               : d.candidates.back();
            }

            if (!reports || k < node.inherited_count || d.via_collection || !d.candidates.empty())
                continue;
            if (!unregistered.empty()) {
                report(diagnostic_code::unregistered_implementation, node,
                       {name, d.declared.to_string(),
                        graph_.find(unregistered.front())->type.display_name()});
            } else {
                report(diagnostic_code::unresolved_dependency, node,
                       {name, d.target.to_string()});
            }
        }
    }

    // ---- pass 5: edges ----
    void connect(const type_node& node) {
        if (!node.type.is_concrete() || node.type.external) return;
        const auto from = node.key();
        auto add = [&](const resolved_dependency& d, std::size_t k, const std::string& to) {
            if (!edge_keys_.emplace(from, to, d.via_collection).second) return;
            impl().edges.push_back({from, to, d.via_collection, d.inherited, k});
        };
        for (std::size_t k = 0; k < node.dependencies.size(); ++k) {
            auto& d = node.dependencies[k];
            if (d.external) continue;
            // Open generic dependencies are only checked once closed by a
            // derived type.
            if (node.type.is_generic() && d.target.mentions(node.type.generic_parameters))
                continue;
            if (d.via_collection) {
                for (auto& to : d.candidates) add(d, k, to);
            } else if (d.chosen) {
                add(d, k, *d.chosen);
            }
        }
    }
};

dependency_graph build_graph(std::vector<extraction_result> types,
                             const analysis_options& options,
                             diagnostic_sink& sink) {
    return graph_builder(options, sink).build(std::move(types));
}

} // namespace digen
