#include "digen/generator.hpp"
#include "digen/exceptions.hpp"
#include "digen/extractor.hpp"
#include "digen/graph.hpp"
#include "digen/lifetime_validator.hpp"
#include "digen/log.hpp"
#include "stacktrace_utils.hpp"

#include <utility>

namespace digen {

namespace {

// Run `fn`, turning a fault into an internal-error (or malformed-marker)
// diagnostic attributed to `subject`.
template <typename Fn>
void isolated(diagnostic_sink& sink, const std::string& subject,
              const std::string& location, Fn&& fn) {
    try {
        fn();
        return;
    } catch (declaration_error& e) {
        sink.report(diagnostic_code::malformed_marker, {subject, e.what()},
                    {.types = {subject}, .location = location,
                     .detail = internal::format_fault_detail(subject, e)});
    } catch (digen_error& e) {
        sink.report(diagnostic_code::internal_error, {subject, e.what()},
                    {.types = {subject}, .location = location,
                     .detail = internal::format_fault_detail(subject, e)});
    } catch (const std::exception& e) {
        sink.report(diagnostic_code::internal_error, {subject, e.what()},
                    {.types = {subject}, .location = location});
    }
    DIGEN_LOG_DEBUG << "Fault isolated while processing " << subject;
}

} // anonymous namespace

const generated_source* generation_result::find_source(std::string_view path) const {
    for (auto& source : sources) {
        if (source.path == path) return &source;
    }
    return nullptr;
}

generator::generator(analysis_options options)
    : options_(std::move(options))
{}

generation_result generator::run(const declaration_set& declarations) const {
    generation_result result;
    diagnostic_sink sink(options_.diagnostics);

    DIGEN_LOG_INFO << "Analyzing " << declarations.types.size() << " declarations";

    for (auto& rejected : declarations.rejected) {
        const auto subject = rejected.name.empty() ? std::string("<unnamed type>") : rejected.name;
        sink.report(diagnostic_code::malformed_marker, {subject, rejected.reason},
                    {.types = {subject}, .location = rejected.location});
    }

    std::vector<extraction_result> extracted;
    extracted.reserve(declarations.types.size());
    for (auto& decl : declarations.types) {
        const auto subject = decl.name.empty() ? std::string("<unnamed type>") : decl.name;
        isolated(sink, subject, decl.location, [&] {
            extracted.push_back(extract(decl, options_, sink));
        });
    }

    auto graph = build_graph(std::move(extracted), options_, sink);

    isolated(sink, "cycle detection", {}, [&] {
        result.cycles = detect_cycles(graph, sink);
    });
    if (options_.lifetime_validation) {
        isolated(sink, "lifetime validation", {}, [&] { validate_lifetimes(graph, sink); });
    } else {
        DIGEN_LOG_DEBUG << "Lifetime validation disabled";
    }
    isolated(sink, "registration planning", {}, [&] {
        result.plan = plan_registrations(graph, sink);
    });

    for (auto& node : graph.nodes()) {
        if (node.type.is_interface || node.type.external) continue;
        if (node.dependencies.empty() && !node.needs_configuration()) continue;
        if (!node.identifiers_valid) {
            DIGEN_LOG_DEBUG << "Skipping constructor of " << node.type.display_name()
                            << ": identifier collision";
            continue;
        }
        if (!node.base_call_resolved) {
            DIGEN_LOG_DEBUG << "Skipping constructor of " << node.type.display_name()
                            << ": base constructor arguments unresolved";
            continue;
        }
        isolated(sink, node.type.display_name(), node.type.location, [&] {
            result.sources.push_back(emit_constructor(node, options_.generation));
        });
    }
    isolated(sink, "registration emission", {}, [&] {
        result.sources.push_back(emit_registrations(result.plan, options_.generation));
    });

    result.diagnostics = sink.take();
    DIGEN_LOG_INFO << "Generated " << result.sources.size() << " sources with "
                   << result.diagnostics.size() << " diagnostics";
    return result;
}

} // namespace digen
