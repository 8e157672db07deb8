#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <digen.hpp>

using digen::type_ref;

TEST_CASE("parse qualified name without arguments", "[type_ref]") {
    auto t = type_ref::parse("app::IDb");
    REQUIRE(t.name == "app::IDb");
    REQUIRE(t.args.empty());
    REQUIRE(t.simple_name() == "IDb");
    REQUIRE(t.to_string() == "app::IDb");
}

TEST_CASE("parse nested generic arguments and normalize spacing", "[type_ref]") {
    auto t = type_ref::parse(" app::IRepo< app::Pair<int ,  app::User> > ");
    REQUIRE(t.name == "app::IRepo");
    REQUIRE(t.arity() == 1);
    REQUIRE(t.args[0].arity() == 2);
    REQUIRE(t.to_string() == "app::IRepo<app::Pair<int, app::User>>");
}

TEST_CASE("dotted names keep their separators", "[type_ref]") {
    auto t = type_ref::parse("System.Collections.Generic.IEnumerable<IHandler>");
    REQUIRE(t.name == "System.Collections.Generic.IEnumerable");
    REQUIRE(t.simple_name() == "IEnumerable");
    REQUIRE(t.args[0] == type_ref("IHandler"));
}

TEST_CASE("malformed type expressions are rejected", "[type_ref]") {
    REQUIRE_THROWS_AS(type_ref::parse(""), digen::type_parse_error);
    REQUIRE_THROWS_AS(type_ref::parse("   "), digen::type_parse_error);
    REQUIRE_THROWS_AS(type_ref::parse("IRepo<"), digen::type_parse_error);
    REQUIRE_THROWS_AS(type_ref::parse("IRepo<A,>"), digen::type_parse_error);
    REQUIRE_THROWS_AS(type_ref::parse("IRepo<>"), digen::type_parse_error);
    REQUIRE_THROWS_AS(type_ref::parse("a b"), digen::type_parse_error);
    REQUIRE_THROWS_AS(type_ref::parse("1abc"), digen::type_parse_error);
    REQUIRE_THROWS_AS(type_ref::parse("app::"), digen::type_parse_error);
}

TEST_CASE("deeply nested type expressions are rejected", "[type_ref]") {
    auto nested = [](std::size_t levels) {
        std::string text;
        for (std::size_t i = 0; i < levels; ++i) text += "app::W<";
        text += "app::X";
        text += std::string(levels, '>');
        return text;
    };
    REQUIRE(type_ref::parse(nested(200)).arity() == 1);
    REQUIRE_THROWS_AS(type_ref::parse(nested(300)), digen::type_parse_error);
    REQUIRE_THROWS_WITH(type_ref::parse(nested(200000)),
                        Catch::Matchers::ContainsSubstring("nested too deeply"));
}

TEST_CASE("type_parse_error reports text and offset", "[type_ref]") {
    try {
        (void)type_ref::parse("IRepo<A");
        FAIL("Expected type_parse_error");
    } catch (const digen::type_parse_error& e) {
        REQUIRE(e.text() == "IRepo<A");
        REQUIRE(e.position() == 7);
        REQUIRE_THAT(std::string(e.what()),
                     Catch::Matchers::ContainsSubstring("unterminated argument list"));
    }
}

TEST_CASE("definition key combines name and arity", "[type_ref]") {
    REQUIRE(type_ref::parse("app::IDb").definition_key() == "app::IDb");
    REQUIRE(type_ref::parse("app::IRepo<T>").definition_key() == "app::IRepo`1");
    REQUIRE(type_ref::parse("app::IRepo<app::User>").definition_key() == "app::IRepo`1");
    REQUIRE(type_ref::parse("app::IMap<K, V>").definition_key() == "app::IMap`2");
}

TEST_CASE("substitute replaces bound parameters at any depth", "[type_ref]") {
    digen::substitution_map bindings{{"T", type_ref::parse("app::User")}};
    REQUIRE(digen::substitute(type_ref::parse("app::IRepo<T>"), bindings).to_string()
            == "app::IRepo<app::User>");
    REQUIRE(digen::substitute(type_ref::parse("Pair<T, List<T>>"), bindings).to_string()
            == "Pair<app::User, List<app::User>>");
    REQUIRE(digen::substitute(type_ref::parse("app::IDb"), bindings).to_string() == "app::IDb");
}

TEST_CASE("substitute rejects a parameter applied to arguments", "[type_ref]") {
    digen::substitution_map bindings{{"T", type_ref::parse("app::User")}};
    REQUIRE_THROWS_AS(digen::substitute(type_ref::parse("T<int>"), bindings),
                      digen::substitution_error);
}

TEST_CASE("bind_parameters checks the argument count", "[type_ref]") {
    auto bound = digen::bind_parameters("app::Base<T>", {"T"}, {type_ref("int")});
    REQUIRE(bound.at("T") == type_ref("int"));

    try {
        (void)digen::bind_parameters("app::Base<T>", {"T"}, {type_ref("A"), type_ref("B")});
        FAIL("Expected substitution_error");
    } catch (const digen::substitution_error& e) {
        REQUIRE(e.type_name() == "app::Base<T>");
        REQUIRE_THAT(std::string(e.what()),
                     Catch::Matchers::ContainsSubstring("expects 1 type argument(s), got 2"));
    }
}

TEST_CASE("unify binds pattern wildcards consistently", "[type_ref]") {
    digen::substitution_map bindings;
    REQUIRE(digen::unify(type_ref::parse("IRepo<T>"), type_ref::parse("IRepo<app::User>"),
                         {"T"}, bindings));
    REQUIRE(bindings.at("T") == type_ref::parse("app::User"));

    digen::substitution_map pair_bindings;
    REQUIRE_FALSE(digen::unify(type_ref::parse("Pair<T, T>"), type_ref::parse("Pair<A, B>"),
                               {"T"}, pair_bindings));

    digen::substitution_map none;
    REQUIRE_FALSE(digen::unify(type_ref::parse("IRepo<A>"), type_ref::parse("IRepo<B>"), {}, none));
    REQUIRE_FALSE(digen::unify(type_ref::parse("IRepo<A>"), type_ref::parse("IOther<A>"), {}, none));
}

TEST_CASE("unify treats target wildcards as open", "[type_ref]") {
    digen::substitution_map bindings;
    REQUIRE(digen::unify(type_ref::parse("IRepo<app::User>"), type_ref::parse("IRepo<U>"),
                         {"U"}, bindings));
}

TEST_CASE("mentions finds parameters anywhere in the expression", "[type_ref]") {
    REQUIRE(type_ref::parse("IHandler<Msg<T>>").mentions({"T"}));
    REQUIRE_FALSE(type_ref::parse("IHandler<Msg<int>>").mentions({"T"}));
}
