#include <catch2/catch.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include <refract/Char.hpp>
#include <refract/Evaluate.hpp>

#include "Laws.hpp"

namespace refract::unittests {

TEST_CASE("integral", "[Integral]")
{
    auto g = integral<int>();

    CHECK(parse(g, "01.") == 1);
    CHECK(parse(g, "42") == 42);
    CHECK(parse(g, "-7x") == -7);
    CHECK(!parse(g, "-"));
    CHECK(!parse(g, "abc"));
    CHECK(!parse(g, ""));

    CHECK(print(g, -42) == "-42");
    CHECK(print(g, 42) == "42");
    CHECK(print(g, 0) == "0");

    for ( auto s : {"0", "7", "-7", "123456", "-2147483648", "2147483647"} )
        checkMatchLaw(g, s);

    for ( int n : {0, 1, -1, 99, std::numeric_limits<int>::min(), std::numeric_limits<int>::max()} )
        checkConstructLaw(g, n, "!");
}

TEST_CASE("integral unsigned", "[Integral]")
{
    auto g = integral<unsigned>();

    CHECK(!parse(g, "-1"));
    CHECK(parse(g, "1") == 1u);
    CHECK(print(g, 42u) == "42");
}

TEST_CASE("integral rejects after consuming the numeral", "[Integral]")
{
    auto m = integral<unsigned>().match("-1x");
    CHECK(!m);
    CHECK(m.rest() == "x");

    auto o = integral<std::int8_t>().match("300,");
    CHECK(!o);
    CHECK(o.rest() == ",");

    // Running out of digits after the sign is a plain sequence failure
    auto s = integral<int>().match("-x");
    CHECK(!s);
    CHECK(s.rest() == "x");
}

TEST_CASE("integral range", "[Integral]")
{
    auto g = integral<std::int8_t>();

    CHECK(parse(g, "127") == std::int8_t(127));
    CHECK(parse(g, "-128") == std::int8_t(-128));
    CHECK(!parse(g, "128"));
    CHECK(!parse(g, "-129"));

    auto u = integral<std::uint64_t>();
    CHECK(parse(u, "18446744073709551615") == std::numeric_limits<std::uint64_t>::max());
    CHECK(!parse(u, "18446744073709551616"));
    CHECK(print(u, std::numeric_limits<std::uint64_t>::max()) == "18446744073709551615");
}

TEST_CASE("integral over other character sequences", "[Integral]")
{
    using Chars = std::vector<char>;
    auto g = integral<long, Chars>();

    CHECK(parse(g, Chars{'-', '1', '5'}) == -15L);
    CHECK(print(g, 2048L) == Chars{'2', '0', '4', '8'});
}

} // namespace refract::unittests
