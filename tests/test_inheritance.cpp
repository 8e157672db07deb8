#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "declarations.hpp"

using namespace digen;
using namespace digen::testing;
using Catch::Matchers::ContainsSubstring;

namespace {

// Interfaces and registered implementations shared by the scenarios below.
const std::vector<type_declaration> services = {
    iface("app::ILog"),
    iface("app::IDb"),
    iface("app::ICache"),
    cls("app::Log").implements("app::ILog").singleton(),
    cls("app::Db").implements("app::IDb").singleton(),
    cls("app::Cache").implements("app::ICache").singleton(),
};

generation_result run_with_services(std::initializer_list<type_declaration> types,
                                    analysis_options options = {}) {
    declaration_set set{services};
    set.types.insert(set.types.end(), types.begin(), types.end());
    return generator(std::move(options)).run(set);
}

} // namespace

TEST_CASE("inherited dependencies come first and are forwarded to the base", "[inheritance]") {
    auto result = run_with_services({
        cls("app::ServiceBase").abstract().depends_on({"app::ILog"}),
        cls("app::Orders").base("app::ServiceBase").scoped().depends_on({"app::IDb"}),
    });
    REQUIRE(result.diagnostics.empty());
    REQUIRE(fragment_of(result, "app_Orders.digen.inc") ==
        "// Generated by digen from app::Orders. Do not edit.\n"
        "// Include inside the body of class Orders.\n"
        "\n"
        "public:\n"
        "    Orders(\n"
        "        std::shared_ptr<app::ILog> log,\n"
        "        std::shared_ptr<app::IDb> db)\n"
        "        : app::ServiceBase(std::move(log))\n"
        "    {\n"
        "        _db = std::move(db);\n"
        "    }\n"
        "\n"
        "private:\n"
        "    std::shared_ptr<app::IDb> _db;\n");
}

TEST_CASE("abstract bases get their own constructor fragment", "[inheritance]") {
    auto result = run_with_services({
        cls("app::ServiceBase").abstract().depends_on({"app::ILog"}),
    });
    REQUIRE_THAT(fragment_of(result, "app_ServiceBase.digen.inc"),
                 ContainsSubstring("explicit ServiceBase(std::shared_ptr<app::ILog> log)"));
    for (auto& r : result.plan.registrations) {
        REQUIRE(r.implementation != "app::ServiceBase");
    }
}

TEST_CASE("multi-level inheritance is flattened root first", "[inheritance]") {
    auto a = analyze({
        cls("app::Root").abstract().depends_on({"app::ILog"}),
        cls("app::Middle").abstract().base("app::Root").depends_on({"app::IDb"}),
        cls("app::Leaf").base("app::Middle").scoped().depends_on({"app::ICache"}),
    });
    const auto& leaf = a.node("app::Leaf");
    REQUIRE(leaf.dependencies.size() == 3);
    REQUIRE(leaf.inherited_count == 2);
    REQUIRE(leaf.dependencies[0].declared.to_string() == "app::ILog");
    REQUIRE(leaf.dependencies[0].declared_in == "app::Root");
    REQUIRE(leaf.dependencies[1].declared.to_string() == "app::IDb");
    REQUIRE(leaf.dependencies[1].declared_in == "app::Middle");
    REQUIRE(leaf.dependencies[2].declared.to_string() == "app::ICache");
    REQUIRE_FALSE(leaf.dependencies[2].inherited);
    REQUIRE(leaf.bases.size() == 2);
    REQUIRE(leaf.bases[0].to_string() == "app::Middle");
    REQUIRE(leaf.bases[1].to_string() == "app::Root");
    REQUIRE(leaf.base_arguments == std::vector<std::size_t>{0, 1});
}

TEST_CASE("generic base dependencies are substituted", "[inheritance]") {
    auto a = analyze({
        iface("app::IValidator<T>"),
        cls("app::OrderValidator").implements("app::IValidator<app::Order>").scoped(),
        cls("app::Handler<TMsg>").abstract().depends_on({"app::IValidator<TMsg>"}),
        cls("app::OrderHandler").base("app::Handler<app::Order>").scoped(),
    });
    const auto& handler = a.node("app::OrderHandler");
    REQUIRE(handler.dependencies.size() == 1);
    const auto& dep = handler.dependencies.front();
    REQUIRE(dep.declared.to_string() == "app::IValidator<app::Order>");
    REQUIRE(dep.inherited);
    REQUIRE(dep.field_name == "_validator");
    REQUIRE(dep.parameter_name == "validator");
    REQUIRE(dep.chosen == "app::OrderValidator");
    REQUIRE(a.sink.diagnostics().empty());
}

TEST_CASE("generic arguments pass through several levels", "[inheritance]") {
    auto a = analyze({
        cls("app::Root<A>").abstract().depends_on({"app::IRepo<A>"}),
        cls("app::Middle<B>").abstract().base("app::Root<app::Box<B>>"),
        cls("app::Leaf").base("app::Middle<app::User>").scoped(),
    });
    const auto& leaf = a.node("app::Leaf");
    REQUIRE(leaf.dependencies.size() == 1);
    REQUIRE(leaf.dependencies[0].declared.to_string() == "app::IRepo<app::Box<app::User>>");
}

TEST_CASE("redeclared inherited dependency keeps the inherited one", "[inheritance]") {
    auto result = run_with_services({
        cls("app::ServiceBase").abstract().depends_on({"app::ILog"}),
        cls("app::Orders").base("app::ServiceBase").scoped().depends_on({"app::ILog"}),
    });
    auto duplicates = with_code(result.diagnostics, diagnostic_code::duplicate_across_declarations);
    REQUIRE(duplicates.size() == 1);
    REQUIRE(duplicates[0].message
            == "app::Orders declares dependency app::ILog more than once; already inherited "
               "from app::ServiceBase; the inherited declaration is kept");
    REQUIRE_THAT(fragment_of(result, "app_Orders.digen.inc"),
                 ContainsSubstring(": app::ServiceBase(std::move(log))"));
}

TEST_CASE("singleton inheriting a scoped dependency", "[inheritance]") {
    auto result = run({
        iface("app::IRepo"),
        cls("app::Repo").implements("app::IRepo").scoped(),
        cls("app::Base").abstract().depends_on({"app::IRepo"}),
        cls("app::Derived").base("app::Base").singleton(),
    });
    auto mismatch = with_code(result.diagnostics, diagnostic_code::inheritance_lifetime_mismatch);
    REQUIRE(mismatch.size() == 1);
    REQUIRE(mismatch[0].message
            == "app::Derived (Singleton) inherits a dependency on app::Repo (Scoped) from app::Base");
    REQUIRE(mismatch[0].level == severity::error);
    REQUIRE(count(result, diagnostic_code::lifetime_narrower_error) == 0);
}

TEST_CASE("singleton inheriting a transient dependency is a warning", "[inheritance]") {
    auto result = run({
        iface("app::IRepo"),
        cls("app::Repo").implements("app::IRepo").transient(),
        cls("app::Base").abstract().depends_on({"app::IRepo"}),
        cls("app::Derived").base("app::Base").singleton(),
    });
    auto mismatch = with_code(result.diagnostics, diagnostic_code::inheritance_lifetime_mismatch);
    REQUIRE(mismatch.size() == 1);
    REQUIRE(mismatch[0].level == severity::warning);
    REQUIRE_FALSE(result.has_errors());
}

TEST_CASE("parameter applied to arguments cannot be substituted", "[inheritance]") {
    auto result = run({
        cls("app::Handler<T>").abstract().depends_on({"T<int>"}, {{"external", "true"}}),
        cls("app::Broken").base("app::Handler<app::Order>").scoped(),
    });
    auto failures = with_code(result.diagnostics, diagnostic_code::generic_substitution_failed);
    REQUIRE(failures.size() == 1);
    REQUIRE_THAT(failures[0].message,
                 ContainsSubstring("generic parameter 'T' cannot take type arguments"));
    REQUIRE(failures[0].types == std::vector<std::string>{"app::Broken"});
    REQUIRE(failures[0].level == severity::warning);
    REQUIRE(result.find_source("app.digen.hpp") != nullptr);
}

TEST_CASE("interfaces are collected transitively", "[inheritance]") {
    auto a = analyze({
        iface("app::IParent"),
        iface("app::IChild").implements("app::IParent"),
        cls("app::Base").implements("app::IChild"),
        cls("app::Impl").base("app::Base").scoped(),
    });
    const auto& impl = a.node("app::Impl");
    REQUIRE(impl.interfaces.size() == 2);
    REQUIRE(impl.interfaces[0].to_string() == "app::IChild");
    REQUIRE(impl.interfaces[1].to_string() == "app::IParent");
    REQUIRE(a.graph.implements(impl, type_ref::parse("app::IParent")));
    REQUIRE_FALSE(a.graph.implements(impl, type_ref::parse("app::IOther")));
}

TEST_CASE("base parameters that collapse under substitution share one argument", "[inheritance]") {
    auto result = run({
        iface("app::IRepo<T>"),
        cls("app::Repo<T>").implements("app::IRepo<T>").scoped(),
        cls("app::Base<T, U>").abstract()
            .inject("_first", "app::IRepo<T>")
            .inject("_second", "app::IRepo<U>"),
        cls("app::Derived").base("app::Base<app::User, app::User>").scoped(),
    });
    REQUIRE_THAT(fragment_of(result, "app_Base_2.digen.inc"),
                 ContainsSubstring("    Base(\n"
                                   "        std::shared_ptr<app::IRepo<T>> first,\n"
                                   "        std::shared_ptr<app::IRepo<U>> second)\n"));
    REQUIRE_THAT(fragment_of(result, "app_Derived.digen.inc"),
                 ContainsSubstring("    explicit Derived(std::shared_ptr<app::IRepo<app::User>> first)\n"
                                   "        : app::Base<app::User, app::User>(first, first)\n"));

    auto duplicates = with_code(result.diagnostics, diagnostic_code::duplicate_across_declarations);
    REQUIRE(duplicates.size() == 1);
    REQUIRE(duplicates[0].types == std::vector<std::string>{"app::Derived"});
    REQUIRE_THAT(duplicates[0].message, ContainsSubstring("app::IRepo<app::User>"));
}

TEST_CASE("base call follows the base constructor's parameter order", "[inheritance]") {
    auto a = analyze({
        cls("app::Base<T, U>").abstract()
            .inject("_first", "app::IRepo<T>")
            .inject("_second", "app::IRepo<U>"),
        cls("app::Derived").base("app::Base<app::User, app::Order>").scoped(),
    });
    const auto& derived = a.node("app::Derived");
    REQUIRE(derived.inherited_count == 2);
    REQUIRE(derived.base_arguments == std::vector<std::size_t>{0, 1});
    REQUIRE(a.sink.count(diagnostic_code::duplicate_across_declarations) == 0);
}

TEST_CASE("shared interface ancestors are expanded once", "[inheritance]") {
    // Each rung extends both interfaces of the next rung.
    constexpr int rungs = 40;
    std::vector<type_declaration> types;
    for (int i = 0; i < rungs; ++i) {
        auto a = iface("app::IA" + std::to_string(i));
        auto b = iface("app::IB" + std::to_string(i));
        if (i + 1 < rungs) {
            for (auto* rung : {&a, &b}) {
                rung->implements("app::IA" + std::to_string(i + 1))
                     .implements("app::IB" + std::to_string(i + 1));
            }
        }
        types.push_back(a);
        types.push_back(b);
    }
    types.push_back(cls("app::Impl").implements("app::IA0").implements("app::IB0").scoped());

    auto a = analyze_all(types);
    const auto& impl = a.node("app::Impl");
    REQUIRE(impl.interfaces.size() == 2 * rungs);
    REQUIRE(a.graph.implements(impl, type_ref::parse("app::IB39")));
    REQUIRE(a.sink.diagnostics().empty());
}
