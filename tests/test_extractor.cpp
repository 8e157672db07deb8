#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "declarations.hpp"

using namespace digen;
using namespace digen::testing;
using Catch::Matchers::ContainsSubstring;

namespace {

struct extraction {
    analysis_options options;
    diagnostic_sink sink;
    extraction_result result;

    explicit extraction(const type_declaration& decl, analysis_options opts = {})
        : options(std::move(opts))
        , sink(options.diagnostics)
        , result(extract(decl, options, sink))
    {}
};

} // namespace

TEST_CASE("lifetime markers", "[extractor]") {
    extraction e(cls("app::Svc").singleton());
    REQUIRE(e.result.type.lifetime == lifetime_kind::singleton);
    REQUIRE(e.result.type.lifetime_declared);
    REQUIRE(e.result.type.has_service_intent);
    REQUIRE(e.sink.diagnostics().empty());
}

TEST_CASE("type without markers has no service intent", "[extractor]") {
    extraction e(cls("app::Plain"));
    REQUIRE(e.result.type.lifetime == lifetime_kind::unassigned);
    REQUIRE_FALSE(e.result.type.has_service_intent);
    REQUIRE(e.result.dependencies.empty());
}

TEST_CASE("dependencies without lifetime take the default lifetime", "[extractor]") {
    extraction scoped(cls("app::Svc").depends_on({"app::IDb"}));
    REQUIRE(scoped.result.type.lifetime == lifetime_kind::scoped);
    REQUIRE_FALSE(scoped.result.type.lifetime_declared);

    analysis_options options;
    options.default_lifetime = lifetime_kind::transient;
    extraction transient(cls("app::Svc").depends_on({"app::IDb"}), options);
    REQUIRE(transient.result.type.lifetime == lifetime_kind::transient);
}

TEST_CASE("interfaces never get a default lifetime", "[extractor]") {
    extraction e(iface("app::IFoo").depends_on({"app::IDb"}));
    REQUIRE(e.result.type.is_interface);
    REQUIRE(e.result.type.lifetime == lifetime_kind::unassigned);
    REQUIRE(e.result.dependencies.size() == 1);
}

TEST_CASE("second lifetime marker is reported and ignored", "[extractor]") {
    extraction e(cls("app::Svc").singleton().transient());
    REQUIRE(e.result.type.lifetime == lifetime_kind::singleton);
    REQUIRE(e.sink.count(diagnostic_code::malformed_marker) == 1);
    REQUIRE_THAT(e.sink.diagnostics().front().message,
                 ContainsSubstring("more than one lifetime marker (Singleton kept, Transient ignored)"));
}

TEST_CASE("bulk declarations come before field markers", "[extractor]") {
    extraction e(cls("app::Svc")
                     .inject("_log", "app::ILog")
                     .depends_on({"app::IDb", "app::ICache"})
                     .depends_on({"app::IClock"}));
    const auto& deps = e.result.dependencies;
    REQUIRE(deps.size() == 4);
    REQUIRE(deps[0].target.to_string() == "app::IDb");
    REQUIRE(deps[1].target.to_string() == "app::ICache");
    REQUIRE(deps[2].target.to_string() == "app::IClock");
    REQUIRE(deps[3].target.to_string() == "app::ILog");
    REQUIRE(deps[0].declaration_index == 0);
    REQUIRE(deps[1].declaration_index == 0);
    REQUIRE(deps[2].declaration_index == 1);
    REQUIRE(deps[3].source == dependency_source::field_marker);
    REQUIRE(deps[3].field_name == "_log");
    for (std::size_t i = 0; i < deps.size(); ++i) {
        REQUIRE(deps[i].order == i);
        REQUIRE(deps[i].owner == "app::Svc");
    }
}

TEST_CASE("DependsOn naming arguments", "[extractor]") {
    extraction e(cls("app::Svc").depends_on(
        {"app::IDb"},
        {{"naming", "snake_case"}, {"prefix", "m_"}, {"strip_leading_marker", "false"},
         {"external", "yes"}}));
    const auto& dep = e.result.dependencies.at(0);
    REQUIRE(dep.naming.convention == naming_convention::snake_case);
    REQUIRE(dep.naming.prefix == "m_");
    REQUIRE_FALSE(dep.naming.strip_leading_marker);
    REQUIRE(dep.external);
    REQUIRE(e.sink.diagnostics().empty());
}

TEST_CASE("bad DependsOn arguments are reported and defaulted", "[extractor]") {
    extraction e(cls("app::Svc").depends_on(
        {"app::IDb"}, {{"naming", "kebab"}, {"external", "maybe"}}));
    const auto& dep = e.result.dependencies.at(0);
    REQUIRE(dep.naming.convention == naming_convention::camel_case);
    REQUIRE_FALSE(dep.external);
    auto reported = e.sink.diagnostics();
    REQUIRE(reported.size() == 2);
    REQUIRE_THAT(reported[0].message, ContainsSubstring("unknown naming convention"));
    REQUIRE_THAT(reported[1].message, ContainsSubstring("external = maybe): expected a boolean"));
}

TEST_CASE("empty DependsOn is malformed and carries no intent", "[extractor]") {
    extraction e(cls("app::Svc").depends_on({}));
    REQUIRE(e.sink.count(diagnostic_code::malformed_marker) == 1);
    REQUIRE_FALSE(e.result.type.has_service_intent);
    REQUIRE(e.result.type.lifetime == lifetime_kind::unassigned);
}

TEST_CASE("unparsable dependency type is dropped", "[extractor]") {
    extraction e(cls("app::Svc").depends_on({"app::IDb", "IRepo<"}));
    REQUIRE(e.result.dependencies.size() == 1);
    REQUIRE(e.sink.count(diagnostic_code::malformed_marker) == 1);
    REQUIRE_THAT(e.sink.diagnostics().front().message,
                 ContainsSubstring("DependsOn: IRepo< is not a valid type expression"));
    REQUIRE(e.sink.diagnostics().front().location == "app::Svc.hpp:1");
}

TEST_CASE("registration markers", "[extractor]") {
    extraction e(cls("app::Svc")
                     .mark("RegisterAsAll", {}, {{"mode", "exclusionary"}, {"sharing", "shared"}})
                     .mark("SkipRegistration", {"app::IInternal"}));
    const auto& reg = e.result.type.registration;
    REQUIRE(reg.declared);
    REQUIRE(reg.mode == registration_mode::exclusionary);
    REQUIRE(reg.sharing == instance_sharing::shared);
    REQUIRE(reg.skip.size() == 1);
    REQUIRE_FALSE(reg.skip_all);
    REQUIRE(e.result.type.has_service_intent);
}

TEST_CASE("unknown registration mode is reported", "[extractor]") {
    extraction e(cls("app::Svc").mark("RegisterAsAll", {}, {{"mode", "Everything"}}));
    REQUIRE(e.result.type.registration.mode == registration_mode::all);
    REQUIRE(e.sink.count(diagnostic_code::malformed_marker) == 1);
}

TEST_CASE("SkipRegistration without types skips everything", "[extractor]") {
    extraction e(cls("app::Svc").scoped().mark("SkipRegistration"));
    REQUIRE(e.result.type.registration.skip_all);
}

TEST_CASE("RegisterAs collects explicit contracts", "[extractor]") {
    extraction e(cls("app::Svc").mark("RegisterAs", {"app::IFoo", "app::IBar"},
                                      {{"sharing", "Separate"}}));
    const auto& reg = e.result.type.registration;
    REQUIRE(reg.explicit_contracts.size() == 2);
    REQUIRE(reg.sharing == instance_sharing::separate);
    REQUIRE_FALSE(reg.declared);

    extraction empty(cls("app::Svc").mark("RegisterAs"));
    REQUIRE(empty.sink.count(diagnostic_code::malformed_marker) == 1);
}

TEST_CASE("ConditionalService arguments", "[extractor]") {
    extraction e(cls("app::Svc").when({{"environment", "Dev, Test"},
                                       {"config", "Cache"},
                                       {"not_equals", "off,none"}}));
    REQUIRE(e.result.type.conditions.size() == 1);
    const auto& rule = e.result.type.conditions.front();
    REQUIRE(rule.environments == std::vector<std::string>{"Dev", "Test"});
    REQUIRE(rule.config_key == "Cache");
    REQUIRE_FALSE(rule.equals);
    REQUIRE(rule.not_equals == std::vector<std::string>{"off", "none"});
    REQUIRE(e.result.type.is_conditional());
    REQUIRE(e.result.type.lifetime == lifetime_kind::scoped);
}

TEST_CASE("ExternalService alone carries no intent", "[extractor]") {
    extraction e(cls("app::Clock").external());
    REQUIRE(e.result.type.external);
    REQUIRE(e.result.type.lifetime == lifetime_kind::unassigned);
}

TEST_CASE("unknown markers are ignored silently", "[extractor]") {
    extraction e(cls("app::Svc").mark("Obsolete").scoped());
    REQUIRE(e.sink.diagnostics().empty());
    REQUIRE(e.result.type.lifetime == lifetime_kind::scoped);
}

TEST_CASE("generic parameters from the written name", "[extractor]") {
    extraction e(cls("app::Repo<T>").scoped());
    REQUIRE(e.result.type.generic_parameters == std::vector<std::string>{"T"});
    REQUIRE(e.result.type.key() == "app::Repo`1");
    REQUIRE(e.result.type.display_name() == "app::Repo<T>");
}

TEST_CASE("generic parameters from the parameter list", "[extractor]") {
    extraction e(cls("app::Map").params({"K", "V"}).scoped());
    REQUIRE(e.result.type.display_name() == "app::Map<K, V>");
    REQUIRE(e.result.type.key() == "app::Map`2");
}

TEST_CASE("unidentifiable declarations throw", "[extractor]") {
    analysis_options options;
    diagnostic_sink sink;
    REQUIRE_THROWS_AS(extract(cls(""), options, sink), declaration_error);
    REQUIRE_THROWS_AS(extract(cls("app::Repo<"), options, sink), declaration_error);
    REQUIRE_THROWS_AS(extract(cls("app::Repo<List<T>>"), options, sink), declaration_error);
    REQUIRE_THROWS_AS(extract(cls("app::Repo<T>").params({"A", "B"}), options, sink),
                      declaration_error);
}
