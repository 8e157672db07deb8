#pragma once

#include "export.hpp"
#include "descriptor.hpp"

#include <optional>
#include <string>
#include <vector>

namespace digen {

class dependency_graph;
class diagnostic_sink;

/// One planned container registration.
struct registration {
    std::string implementation;             // node key
    type_ref implementation_type;
    type_ref contract;
    lifetime_kind lifetime = lifetime_kind::scoped;
    bool forward = false;                   // resolves the concrete registration
    bool open_generic = false;
    bool hosted = false;                    // background service, add_hosted<T>()
    std::optional<conditional_rule> condition;

    bool is_concrete() const { return contract == implementation_type; }
};

struct registration_plan {
    std::vector<registration> registrations;    // type declaration order

    bool uses_environment() const;
    bool uses_configuration() const;
    bool uses_hosted() const;
};

/// Sharing used when a directive leaves it unspecified: Shared for
/// singletons and for Exclusionary registration, Separate otherwise.
DIGEN_EXPORT instance_sharing effective_sharing(const type_descriptor& type);

/// True when no environment/configuration can satisfy both rules at once.
DIGEN_EXPORT bool mutually_exclusive(const conditional_rule& a, const conditional_rule& b);

/// Work out every registration of every concrete, non-external type with a
/// resolved lifetime.  Skip and RegisterAs targets the type does not
/// implement and questionable conditional rules are reported to `sink`.
/// A background service registers once, as a hosted service, unless its
/// marker turns auto registration off.
DIGEN_EXPORT registration_plan plan_registrations(const dependency_graph& graph,
                                                  diagnostic_sink& sink);

} // namespace digen
