#include "digen/lifetime_validator.hpp"
#include "digen/diagnostic.hpp"
#include "digen/graph.hpp"
#include "digen/lifetime.hpp"
#include "digen/log.hpp"

#include <string>

namespace digen {

// ------------------------------------------------------------------
// Lifetime validation (captive dependency check)
// ------------------------------------------------------------------
void validate_lifetimes(const dependency_graph& graph, diagnostic_sink& sink) {
    std::size_t checked = 0;
    for (auto& e : graph.edges()) {
        const type_node* consumer = graph.find(e.from);
        const type_node* dependency = graph.find(e.to);
        if (!consumer || !dependency) continue;
        if (consumer->type.external || dependency->type.external) continue;

        const auto consumer_lt = consumer->type.lifetime;
        const auto dependency_lt = dependency->type.lifetime;
        ++checked;
        if (!captures_shorter_lived(consumer_lt, dependency_lt)) continue;

        const auto consumer_name = consumer->type.display_name();
        const auto dependency_name = dependency->type.display_name();
        report_context context{.types = {consumer_name, dependency_name},
                               .location = consumer->type.location};

        if (e.inherited) {
            const auto& dep = consumer->dependencies[e.dependency];
            const type_node* base = graph.find(dep.declared_in);
            context.level = dependency_lt == lifetime_kind::scoped ? severity::error
                                                                   : severity::warning;
            sink.report(diagnostic_code::inheritance_lifetime_mismatch,
                        {consumer_name, std::string(marker_name(consumer_lt)),
                         dependency_name, std::string(marker_name(dependency_lt)),
                         base ? base->type.display_name() : dep.declared_in},
                        std::move(context));
        } else if (dependency_lt == lifetime_kind::scoped) {
            sink.report(diagnostic_code::lifetime_narrower_error,
                        {consumer_name, dependency_name}, std::move(context));
        } else {
            sink.report(diagnostic_code::lifetime_narrower_warning,
                        {consumer_name, dependency_name}, std::move(context));
        }
    }
    DIGEN_LOG_DEBUG << "Lifetime validation checked " << checked << " edges";
}

} // namespace digen
