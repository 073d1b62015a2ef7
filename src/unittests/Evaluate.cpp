#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include <refract/Char.hpp>
#include <refract/Evaluate.hpp>
#include <refract/Utilities.hpp>

namespace refract::unittests {

using Text = std::string;

TEST_CASE("parse ignores trailing input", "[Evaluate]")
{
    auto g = integral<int>();

    CHECK(parse(g, "12 apples") == 12);
    CHECK(!parse(g, "apples"));
}

TEST_CASE("parseAll", "[Evaluate]")
{
    auto g = integral<int>();

    CHECK(parseAll(g, "12") == 12);
    CHECK(!parseAll(g, "12 apples"));
    CHECK(!parseAll(g, ""));

    CHECK(parseAll(eof<Text>(), "") == Unit());
    CHECK(parseAll(many(symbol<Text>('z')), "zzz") == std::vector<char>(3, 'z'));
}

TEST_CASE("print starts from an empty sequence", "[Evaluate]")
{
    CHECK(print(letters(), "abc") == "abc");
    CHECK(print(eof<Text>(), Unit()).empty());
    CHECK(print(many(element<std::vector<int>>()), std::vector<int>{1, 2}) == std::vector<int>{1, 2});
}

TEST_CASE("value of a failed match throws", "[Evaluate][Match]")
{
    auto m = symbol<Text>('a').match("b");
    REQUIRE(!m);
    CHECK(m.rest() == "b");
    CHECK_THROWS_AS(m.value(), RuntimeException);

    try {
        m.value();
        FAIL("expected an exception");
    }
    catch (RuntimeException const& e) {
        CHECK(std::string(e.what()) == "value of a failed match");
        CHECK(e.line() != 0);
    }
}

TEST_CASE("match equality", "[Evaluate][Match]")
{
    using M = Match<Text, int>;

    CHECK(M::success(1, "x") == M::success(1, "x"));
    CHECK(M::success(1, "x") != M::success(2, "x"));
    CHECK(M::success(1, "x") != M::success(1, "y"));
    CHECK(M::failure("x") == M::failure("x"));
    CHECK(M::failure("x") != M::success(1, "x"));
}

} // namespace refract::unittests
