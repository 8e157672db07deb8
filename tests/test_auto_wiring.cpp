#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "declarations.hpp"

using namespace digen;
using namespace digen::testing;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("bulk dependencies produce members and a constructor", "[auto_wiring]") {
    auto result = run({
        iface("app::IDb"),
        iface("app::ICache"),
        cls("app::Db").implements("app::IDb").singleton(),
        cls("app::Cache").implements("app::ICache").singleton(),
        cls("app::Svc").scoped().depends_on({"app::IDb", "app::ICache"}),
    });
    REQUIRE(result.diagnostics.empty());
    const auto* source = result.find_source("app_Svc.digen.inc");
    REQUIRE(source != nullptr);
    REQUIRE(source->type_key == "app::Svc");
    REQUIRE(source->content ==
        "// Generated by digen from app::Svc. Do not edit.\n"
        "// Include inside the body of class Svc.\n"
        "\n"
        "public:\n"
        "    Svc(\n"
        "        std::shared_ptr<app::IDb> db,\n"
        "        std::shared_ptr<app::ICache> cache)\n"
        "    {\n"
        "        _db = std::move(db);\n"
        "        _cache = std::move(cache);\n"
        "    }\n"
        "\n"
        "private:\n"
        "    std::shared_ptr<app::IDb> _db;\n"
        "    std::shared_ptr<app::ICache> _cache;\n");
}

TEST_CASE("single parameter constructors are explicit", "[auto_wiring]") {
    auto result = run({cls("app::Svc").scoped().depends_on({"app::IDb"}, {{"external", "true"}})});
    REQUIRE_THAT(fragment_of(result, "app_Svc.digen.inc"),
                 ContainsSubstring("    explicit Svc(std::shared_ptr<app::IDb> db)\n    {\n"));
}

TEST_CASE("Inject fields are assigned but not redeclared", "[auto_wiring]") {
    auto result = run({
        iface("app::ILogger"),
        cls("app::Logger").implements("app::ILogger").singleton(),
        cls("app::Svc").scoped().inject("m_logger", "app::ILogger"),
    });
    REQUIRE(fragment_of(result, "app_Svc.digen.inc") ==
        "// Generated by digen from app::Svc. Do not edit.\n"
        "// Include inside the body of class Svc.\n"
        "\n"
        "public:\n"
        "    explicit Svc(std::shared_ptr<app::ILogger> logger)\n"
        "    {\n"
        "        m_logger = std::move(logger);\n"
        "    }\n");
}

TEST_CASE("mixed declarations keep bulk dependencies first", "[auto_wiring]") {
    auto result = run({
        cls("app::Svc").scoped()
            .inject("_clock", "app::IClock", {{"external", "true"}})
            .depends_on({"app::IDb"}, {{"external", "true"}}),
    });
    const auto text = fragment_of(result, "app_Svc.digen.inc");
    REQUIRE_THAT(text, ContainsSubstring(
        "    Svc(\n"
        "        std::shared_ptr<app::IDb> db,\n"
        "        std::shared_ptr<app::IClock> clock)\n"));
    REQUIRE_THAT(text, ContainsSubstring("        _clock = std::move(clock);\n"));
    REQUIRE_THAT(text, ContainsSubstring("\nprivate:\n    std::shared_ptr<app::IDb> _db;\n"));
    REQUIRE(text.find("std::shared_ptr<app::IClock> _clock;") == std::string::npos);
}

TEST_CASE("snake case naming and custom prefix", "[auto_wiring]") {
    auto a = analyze({
        cls("app::Svc").scoped()
            .depends_on({"app::IUserRepository"}, {{"naming", "snake_case"}})
            .depends_on({"app::IDb"}, {{"prefix", "m_"}, {"strip_leading_marker", "false"}}),
    });
    const auto& deps = a.node("app::Svc").dependencies;
    REQUIRE(deps[0].field_name == "_user_repository");
    REQUIRE(deps[0].parameter_name == "userRepository");
    REQUIRE(deps[1].field_name == "m_iDb");
    REQUIRE(deps[1].parameter_name == "iDb");
}

TEST_CASE("keyword parameter names are escaped", "[auto_wiring]") {
    auto a = analyze({
        cls("app::Svc").scoped().depends_on({"app::IDefault"}, {{"external", "true"}}),
    });
    const auto& dep = a.node("app::Svc").dependencies.at(0);
    REQUIRE(dep.field_name == "_default");
    REQUIRE(dep.parameter_name == "default_");
}

TEST_CASE("identifier collision suppresses the constructor", "[auto_wiring]") {
    auto result = run({
        cls("app::Svc").scoped().depends_on({"app::IDb", "legacy::IDb"}, {{"external", "true"}}),
    });
    auto collisions = with_code(result.diagnostics, diagnostic_code::identifier_collision);
    REQUIRE_FALSE(collisions.empty());
    REQUIRE(collisions[0].message
            == "app::Svc: generated identifier '_db' is used for both app::IDb and legacy::IDb; "
               "constructor not generated");
    REQUIRE(collisions[0].level == severity::error);
    REQUIRE(result.find_source("app_Svc.digen.inc") == nullptr);
    REQUIRE_THAT(registrations_of(result), ContainsSubstring("add_scoped<app::Svc, app::Svc>"));
}

TEST_CASE("no fragment for types without dependencies", "[auto_wiring]") {
    auto result = run({
        cls("app::Clock").singleton(),
        iface("app::IFoo").depends_on({"app::IDb"}),
        cls("app::Remote").external().depends_on({"app::IDb"}),
    });
    REQUIRE(result.sources.size() == 1);
    REQUIRE(result.sources[0].path == "app.digen.hpp");
    REQUIRE(result.sources[0].type_key.empty());
}

TEST_CASE("fragment file names", "[auto_wiring]") {
    type_descriptor plain;
    plain.identity = type_ref::parse("app::orders::Svc");
    REQUIRE(fragment_file_name(plain) == "app_orders_Svc.digen.inc");

    type_descriptor generic;
    generic.identity = type_ref::parse("app::Repo<T>");
    generic.generic_parameters = {"T"};
    REQUIRE(fragment_file_name(generic) == "app_Repo_1.digen.inc");

    type_descriptor dotted;
    dotted.identity = type_ref::parse("App.Services.Mailer");
    REQUIRE(fragment_file_name(dotted) == "App_Services_Mailer.digen.inc");
}

TEST_CASE("generic owners name the fragment after their arity", "[auto_wiring]") {
    auto result = run({
        cls("app::Repo<T>").scoped().depends_on({"app::IDb"}, {{"external", "true"}}),
    });
    REQUIRE_THAT(fragment_of(result, "app_Repo_1.digen.inc"),
                 ContainsSubstring("    explicit Repo(std::shared_ptr<app::IDb> db)\n"));
}
