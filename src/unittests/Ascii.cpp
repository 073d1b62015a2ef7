#include <catch2/catch.hpp>

#include <cstdint>
#include <limits>
#include <sstream>
#include <string>

#include <refract/Ascii.hpp>

namespace refract::unittests {

TEST_CASE("ascii classes", "[Ascii]")
{
    for ( char c = '0'; c <= '9'; ++c ) {
        CHECK(ascii::isDigit(c));
        CHECK(!ascii::isLetter(c));
    }

    CHECK(ascii::isLower('a'));
    CHECK(ascii::isLower('z'));
    CHECK(!ascii::isLower('A'));
    CHECK(ascii::isUpper('Q'));
    CHECK(!ascii::isUpper('q'));
    CHECK(ascii::isLetter('m'));
    CHECK(ascii::isLetter('M'));
    CHECK(!ascii::isLetter('_'));
    CHECK(!ascii::isLetter('@'));
    CHECK(!ascii::isLetter('['));
    CHECK(!ascii::isDigit('/'));
    CHECK(!ascii::isDigit(':'));

    for ( char c : {' ', '\t', '\r', '\n', '\f', '\v'} )
        CHECK(ascii::isSpace(c));

    CHECK(!ascii::isSpace('x'));
    CHECK(!ascii::isSpace('\0'));
}

TEST_CASE("renderDecimal", "[Ascii]")
{
    CHECK(ascii::renderDecimal(0u) == "0");
    CHECK(ascii::renderDecimal(0) == "0");
    CHECK(ascii::renderDecimal(-5) == "-5");
    CHECK(ascii::renderDecimal(std::uint8_t(255)) == "255");
    CHECK(ascii::renderDecimal(std::int8_t(-128)) == "-128");
    CHECK(ascii::renderDecimal(std::numeric_limits<std::uint64_t>::max()) == "18446744073709551615");
    CHECK(ascii::renderDecimal(std::numeric_limits<std::int64_t>::min()) == "-9223372036854775808");
    CHECK(ascii::renderDecimal(std::numeric_limits<std::int64_t>::max()) == "9223372036854775807");
}

TEST_CASE("parseDecimal", "[Ascii]")
{
    CHECK(ascii::parseDecimal<int>("0") == 0);
    CHECK(ascii::parseDecimal<int>("007") == 7);
    CHECK(ascii::parseDecimal<int>("-12") == -12);
    CHECK(ascii::parseDecimal<int>("-0") == 0);

    CHECK(!ascii::parseDecimal<int>(""));
    CHECK(!ascii::parseDecimal<int>("-"));
    CHECK(!ascii::parseDecimal<int>("+1"));
    CHECK(!ascii::parseDecimal<int>("12a"));
    CHECK(!ascii::parseDecimal<int>(" 1"));
    CHECK(!ascii::parseDecimal<int>("--1"));
}

TEST_CASE("parseDecimal limits", "[Ascii]")
{
    CHECK(ascii::parseDecimal<std::uint64_t>("18446744073709551615") == std::numeric_limits<std::uint64_t>::max());
    CHECK(!ascii::parseDecimal<std::uint64_t>("18446744073709551616"));
    CHECK(!ascii::parseDecimal<std::uint64_t>("99999999999999999999"));

    CHECK(ascii::parseDecimal<std::int64_t>("-9223372036854775808") == std::numeric_limits<std::int64_t>::min());
    CHECK(!ascii::parseDecimal<std::int64_t>("9223372036854775808"));

    CHECK(ascii::parseDecimal<std::int8_t>("127") == std::int8_t(127));
    CHECK(ascii::parseDecimal<std::int8_t>("-128") == std::int8_t(-128));
    CHECK(!ascii::parseDecimal<std::int8_t>("128"));
    CHECK(!ascii::parseDecimal<std::int8_t>("-129"));
    CHECK(ascii::parseDecimal<std::int8_t>("-0") == std::int8_t(0));

    CHECK(ascii::parseDecimal<std::uint8_t>("255") == std::uint8_t(255));
    CHECK(!ascii::parseDecimal<std::uint8_t>("256"));
    CHECK(!ascii::parseDecimal<unsigned>("-0"));
    CHECK(!ascii::parseDecimal<unsigned>("-1"));
}

TEST_CASE("renderDecimal reads back", "[Ascii]")
{
    for ( int n : {0, 1, -1, 10, -10, 65535, std::numeric_limits<int>::min(), std::numeric_limits<int>::max()} )
        CHECK(ascii::parseDecimal<int>(ascii::renderDecimal(n)) == n);
}

TEST_CASE("Formatter", "[Ascii][Formatter]")
{
    std::ostringstream ss;
    DefaultOutStream out(ss);

    out('a')(42)("cs")(true);
    CHECK(ss.str() == "a42cstrue");

    out();
    CHECK(ss.str() == "a42cstrue\n");

    std::ostringstream other;
    DefaultOutStream mixed(other);
    mixed(-7)(std::string("/"))(std::uint8_t(200))(false);
    CHECK(other.str() == "-7/200false");
}

} // namespace refract::unittests
