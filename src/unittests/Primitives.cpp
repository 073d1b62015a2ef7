#include <catch2/catch.hpp>

#include <string>

#include <refract/Ascii.hpp>
#include <refract/Evaluate.hpp>
#include <refract/Grammar.hpp>

#include "Laws.hpp"

namespace refract::unittests {

using Text = std::string;

TEST_CASE("element", "[Grammar][element]")
{
    auto g = element<Text>();

    auto m = g.match("ab");
    REQUIRE(m);
    CHECK(m.value() == 'a');
    CHECK(m.rest() == "b");

    auto e = g.match("");
    CHECK(!e);
    CHECK(e.rest() == "");

    CHECK(g.construct('x', "yz") == "xyz");
    CHECK(print(g, 'q') == "q");

    checkMatchLaw(g, "abc");
    checkConstructLaw(g, 'z', "tail");
}

TEST_CASE("satisfy", "[Grammar][satisfy]")
{
    auto g = satisfy<Text>(ascii::isDigit);

    auto m = g.match("7up");
    REQUIRE(m);
    CHECK(m.value() == '7');
    CHECK(m.rest() == "up");

    auto f = g.match("up7");
    CHECK(!f);
    CHECK(f.rest() == "up7");

    CHECK(!g.match(""));

    checkMatchLaw(g, "42");
    checkConstructLaw(g, '4', "2");
}

TEST_CASE("satisfy construct trusts its input", "[Grammar][satisfy]")
{
    auto g = satisfy<Text>(ascii::isDigit);

    // Printing is unchecked; the result simply does not match back
    auto s = print(g, 'x');
    CHECK(s == "x");
    CHECK(!parse(g, s));
}

TEST_CASE("symbol", "[Grammar][symbol]")
{
    auto g = symbol<Text>('$');

    CHECK(parse(g, "$1") == '$');
    CHECK(!parse(g, "1$"));
    CHECK(print(g, '$') == "$");

    auto f = g.match("x");
    CHECK(f.rest() == "x");

    checkMatchLaw(g, "$$");
    checkConstructLaw(g, '$', "");
}

TEST_CASE("literal", "[Grammar][literal]")
{
    auto g = literal<Text>('$');

    auto m = g.match("$~");
    REQUIRE(m);
    CHECK(m.rest() == "~");

    auto f = g.match("~$");
    CHECK(!f);
    CHECK(f.rest() == "~$");

    CHECK(!g.match(""));
    CHECK(print(g, Unit()) == "$");

    checkMatchLaw(g, "$");
    checkConstructLaw(g, Unit(), "$");
}

TEST_CASE("keyword", "[Grammar][keyword]")
{
    auto g = keyword<Text>("true");

    auto m = g.match("true!");
    REQUIRE(m);
    CHECK(m.rest() == "!");

    auto f = g.match("trust");
    CHECK(!f);
    CHECK(f.rest() == "trust");

    CHECK(!g.match("tru"));
    CHECK(print(g, Unit()) == "true");
    CHECK(g.construct(Unit(), " false") == "true false");

    checkMatchLaw(g, "truetrue");
    checkConstructLaw(g, Unit(), "x");
}

TEST_CASE("eof", "[Grammar][eof]")
{
    auto g = eof<Text>();

    CHECK(parse(g, "") == Unit());
    CHECK(!parse(g, "x"));
    CHECK(print(g, Unit()) == "");

    auto f = g.match("x");
    CHECK(f.rest() == "x");

    CHECK(g.construct(Unit(), "") == "");

    checkMatchLaw(g, "");
    checkConstructLaw(g, Unit(), "");
}

TEST_CASE("grammar copies share a definition", "[Grammar]")
{
    auto g = symbol<Text>('a');
    auto h = g;

    CHECK(h.match("ab") == g.match("ab"));
    CHECK(h.construct('a', "") == g.construct('a', ""));
}

} // namespace refract::unittests
