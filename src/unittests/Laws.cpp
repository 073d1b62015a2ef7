#include <catch2/catch.hpp>

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <refract/Ascii.hpp>
#include <refract/Char.hpp>
#include <refract/Combinators.hpp>
#include <refract/Evaluate.hpp>

#include "Laws.hpp"

namespace refract::unittests {

using Text = std::string;

namespace {
    // key=value pairs separated by ';', e.g. "a=1;bc=-2;"
    Grammar<Text, std::vector<std::pair<std::string, int>>> settings()
    {
        auto entry = (letters() << literal<Text>('=')) & integral<int>();
        return many(entry << literal<Text>(';'));
    }
}

TEST_CASE("laws over a composite grammar", "[Laws]")
{
    auto g = settings();

    for ( auto s : {"", "a=1;", "a=1;bc=-2;", "a=1;b", "x=;", "=1;"} )
        checkMatchLaw(g, s);

    using V = std::vector<std::pair<std::string, int>>;
    checkConstructLaw(g, V{}, "");
    checkConstructLaw(g, V{{"a", 1}}, "");
    checkConstructLaw(g, V{{"width", 640}, {"height", -480}}, "!");

    CHECK(parse(g, "a=1;bc=-2;") == V{{"a", 1}, {"bc", -2}});
    CHECK(print(g, V{{"k", 0}}) == "k=0;");
}

TEST_CASE("laws over choices and options", "[Laws]")
{
    auto value = integral<long>() | (literal<Text>('"') >> letters() << literal<Text>('"'));
    auto g = opt(value) & eof<Text>();

    for ( auto s : {"", "42", "\"abc\"", "\"abc", "-"} )
        checkMatchLaw(g, s);

    using V = std::variant<long, std::string>;
    checkConstructLaw(g, std::make_pair(std::optional<V>(), Unit()), "");
    checkConstructLaw(g, std::make_pair(std::optional<V>(V(std::in_place_index<0>, -3L)), Unit()), "");
    checkConstructLaw(g, std::make_pair(std::optional<V>(V(std::in_place_index<1>, "xy")), Unit()), "");
}

TEST_CASE("construct law needs a rest that ends the greedy match", "[Laws]")
{
    auto g = letters();

    checkConstructLaw(g, "abc", "1");

    // Printing "abc" before "def" reads back as one run of letters
    auto m = g.match(g.construct("abc", "def"));
    REQUIRE(m);
    CHECK(m.value() == "abcdef");
    CHECK(m.rest().empty());
}

TEST_CASE("match law does not hold for non-canonical numerals", "[Laws]")
{
    auto g = integral<int>();

    auto m = g.match("007");
    REQUIRE(m);
    CHECK(m.value() == 7);
    CHECK(g.construct(m.value(), m.rest()) == "7");

    auto z = g.match("-0");
    REQUIRE(z);
    CHECK(z.value() == 0);
    CHECK(g.construct(z.value(), z.rest()) == "0");
}

} // namespace refract::unittests
