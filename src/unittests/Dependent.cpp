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

namespace {
    // A count followed by exactly that many letters, e.g. "3abc"
    Grammar<Text, std::string> lengthPrefixed()
    {
        return dependent(
            integral<unsigned>(),
            [](unsigned const& n) {
                return adapt(chars(), replicate(n, satisfy<Text>(ascii::isLetter)));
            },
            [](std::string const& s) {
                return static_cast<unsigned>(s.size());
            });
    }
}

TEST_CASE("dependent", "[Dependent]")
{
    auto g = lengthPrefixed();

    CHECK(parse(g, "3abc2de?") == "abc");
    CHECK(!parse(g, "3ab2de?"));
    CHECK(parse(g, "0") == "");
    CHECK(parse(g, "12abcdefghijkl") == "abcdefghijkl");

    CHECK(print(g, "hello") == "5hello");
    CHECK(print(g, "") == "0");

    checkMatchLaw(g, "3abc2de?");
    checkConstructLaw(g, "abc", "?");
}

TEST_CASE("dependent failure states", "[Dependent]")
{
    auto g = lengthPrefixed();

    // The payload grammar fails on the digit after two letters
    auto payload = g.match("3ab2de?");
    CHECK(!payload);
    CHECK(payload.rest() == "2de?");

    // No determinant at all
    auto determinant = g.match("abc");
    CHECK(!determinant);
    CHECK(determinant.rest() == "abc");
}

TEST_CASE("dependent under many", "[Dependent][many]")
{
    auto g = many(lengthPrefixed());

    auto m = g.match("3abc2de1f?");
    REQUIRE(m);
    CHECK(m.value() == std::vector<std::string>{"abc", "de", "f"});
    CHECK(m.rest() == "?");

    CHECK(print(g, std::vector<std::string>{"hello", "world"}) == "5hello5world");
    CHECK(parse(g, print(g, std::vector<std::string>{"a", "bc", ""})) == std::vector<std::string>{"a", "bc", ""});

    checkMatchLaw(g, "3abc2de1f?");
}

} // namespace refract::unittests
