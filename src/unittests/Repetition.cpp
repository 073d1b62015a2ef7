#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include <refract/Ascii.hpp>
#include <refract/Char.hpp>
#include <refract/Combinators.hpp>
#include <refract/Evaluate.hpp>

#include "Laws.hpp"

namespace refract::unittests {

using Text = std::string;

TEST_CASE("many", "[Repetition][many]")
{
    auto g = many(satisfy<Text>(ascii::isLetter));

    CHECK(parse(g, "") == std::vector<char>());

    auto m = g.match("abc!");
    REQUIRE(m);
    CHECK(m.value() == std::vector<char>{'a', 'b', 'c'});
    CHECK(m.rest() == "!");

    CHECK(print(g, std::vector<char>{'x', 'y', 'z'}) == "xyz");
    CHECK(print(g, std::vector<char>()) == "");

    checkMatchLaw(g, "abc!");
    checkMatchLaw(g, "!");
    checkConstructLaw(g, std::vector<char>{'q', 'r'}, "1");
}

TEST_CASE("many stops where the failed attempt began", "[Repetition][many]")
{
    auto ab = literal<Text>('a') & literal<Text>('b');
    auto g = many(ab);

    // The third attempt consumes 'a' before failing on 'c'
    CHECK(!ab.match("ac").ok());
    CHECK(ab.match("ac").rest() == "c");

    auto m = g.match("ababac");
    REQUIRE(m);
    CHECK(m.value().size() == 2);
    CHECK(m.rest() == "ac");
}

TEST_CASE("many requires sub-grammars that consume", "[Repetition][many]")
{
    // Each of these succeeds without consuming anything and therefore must
    // never be repeated with many or many1.
    auto const input = Text("x");

    auto optionalMatch = opt(symbol<Text>('a')).match(input);
    REQUIRE(optionalMatch);
    CHECK(optionalMatch.rest() == input);

    auto defaulted = withDefault('a', symbol<Text>('a')).match(input);
    REQUIRE(defaulted);
    CHECK(defaulted.rest() == input);

    auto repeated = many(symbol<Text>('a')).match(input);
    REQUIRE(repeated);
    CHECK(repeated.rest() == input);

    // Whereas every success of these shrinks the input, so repeating them
    // terminates.
    for ( auto const& s : {Text("a"), Text("ab"), Text("aaa")} ) {
        auto m = symbol<Text>('a').match(s);
        REQUIRE(m);
        CHECK(m.rest().size() < s.size());

        auto n = (+symbol<Text>('a')).match(s);
        REQUIRE(n);
        CHECK(n.rest().size() < s.size());
    }

    CHECK(parse(many(+symbol<Text>('a') << literal<Text>(',')), "aa,a,b")->size() == 2);
}

TEST_CASE("many1", "[Repetition][many1]")
{
    auto g = many1(satisfy<Text>(ascii::isDigit));

    CHECK(!parse(g, ""));
    CHECK(!parse(g, "x1"));

    auto r = parse(g, "42");
    REQUIRE(r);
    CHECK(r->head() == '4');
    CHECK(r->tail() == std::vector<char>{'2'});

    CHECK(print(g, NonEmpty<char>('1', {'2', '3'})) == "123");
    CHECK(print(g, NonEmpty<char>('7')) == "7");

    auto f = g.match("x1");
    CHECK(f.rest() == "x1");

    checkMatchLaw(g, "2024-");
    checkConstructLaw(g, NonEmpty<char>('9', {'8'}), "x");
}

TEST_CASE("replicate", "[Repetition][replicate]")
{
    auto g = adapt(chars(), replicate(3, satisfy<Text>(ascii::isLetter)));

    CHECK(!parse(g, "ab3"));
    CHECK(parse(g, "abc") == "abc");
    CHECK(parse(g, "abcd") == "abc");

    auto f = g.match("ab3");
    CHECK(!f);
    CHECK(f.rest() == "3");

    checkMatchLaw(g, "abcd");
    checkConstructLaw(g, "xyz", "w");
}

TEST_CASE("replicate construct truncates and short-writes", "[Repetition][replicate]")
{
    auto g = adapt(chars(), replicate(3, satisfy<Text>(ascii::isLetter)));

    CHECK(print(g, "abcd") == "abc");
    CHECK(print(g, "ab") == "ab");
    CHECK(print(g, "") == "");

    // A short write does not match back
    CHECK(!parse(g, print(g, "ab")));
}

TEST_CASE("replicate zero times", "[Repetition][replicate]")
{
    auto g = replicate(0, element<Text>());

    auto m = g.match("abc");
    REQUIRE(m);
    CHECK(m.value().empty());
    CHECK(m.rest() == "abc");

    CHECK(print(g, std::vector<char>{'a'}) == "");
}

} // namespace refract::unittests
