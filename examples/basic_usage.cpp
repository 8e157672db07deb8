/// basic_usage.cpp - digen introductory example.
///
/// Demonstrates the declare -> generate -> inspect workflow:
///   1. Describe types and their markers as a declaration_set (normally a
///      front end or a YAML snapshot produces it).
///   2. Run the generator over the snapshot.
///   3. Print the diagnostics and the generated sources.

#include <digen.hpp>
#include <digen/log.hpp>

#include <iostream>

using namespace digen;

namespace {

marker lifetime(std::string name) {
    return marker{std::move(name), {}, {}};
}

marker depends_on(std::vector<std::string> types) {
    return marker{"DependsOn", std::move(types), {}};
}

} // namespace

int main() {
    digen::log::init(boost::log::trivial::info);

    // -----------------------------------------------------------------------
    // Declarations
    // -----------------------------------------------------------------------
    declaration_set snapshot;

    snapshot.types.push_back({.name = "app::ILogger", .kind = type_kind::interface_type});
    snapshot.types.push_back({.name = "app::IGreeter", .kind = type_kind::interface_type});
    snapshot.types.push_back({.name = "app::IRequestContext", .kind = type_kind::interface_type});

    // console_logger: singleton, one instance for the whole application.
    snapshot.types.push_back({.name = "app::ConsoleLogger",
                              .interfaces = {"app::ILogger"},
                              .markers = {lifetime("Singleton")},
                              .location = "logger.hpp:10"});

    // greeter: singleton, depends on the logger.
    snapshot.types.push_back({.name = "app::Greeter",
                              .interfaces = {"app::IGreeter"},
                              .markers = {lifetime("Singleton"), depends_on({"app::ILogger"})},
                              .location = "greeter.hpp:8"});

    // request_context: scoped, captured by a singleton below (reported).
    snapshot.types.push_back({.name = "app::RequestContext",
                              .interfaces = {"app::IRequestContext"},
                              .markers = {lifetime("Scoped")},
                              .location = "request.hpp:5"});

    snapshot.types.push_back({.name = "app::AuditTrail",
                              .markers = {lifetime("Singleton"),
                                          depends_on({"app::ILogger", "app::IRequestContext"})},
                              .location = "audit.hpp:14"});

    // -----------------------------------------------------------------------
    // Generation
    // -----------------------------------------------------------------------
    analysis_options options;
    options.generation.unit = "app";
    options.generation.namespace_name = "app";

    const auto result = generator(options).run(snapshot);

    for (auto& d : result.diagnostics) {
        std::cout << d.to_string() << '\n';
    }
    for (auto& source : result.sources) {
        std::cout << "\n===== " << source.path << " =====\n" << source.content;
    }

    std::cout << "\nDone.\n";
    return result.has_errors() ? 1 : 0;
}
