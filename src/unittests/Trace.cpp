#include <catch2/catch.hpp>

#include <ostream>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <vector>

#include <refract/Ascii.hpp>
#include <refract/Combinators.hpp>
#include <refract/Evaluate.hpp>
#include <refract/Recursive.hpp>
#include <refract/Trace.hpp>

namespace refract::unittests {

using Text = std::string;

TEST_CASE("trace match", "[Trace]")
{
    std::ostringstream ss;
    DefaultOutStream out(ss);
    TraceLog log(out);

    auto digit = traced("digit", satisfy<Text>(ascii::isDigit), log);
    auto number = traced("number", many(digit), log);

    auto m = number.match("12x");
    REQUIRE(m);
    CHECK(m.rest() == "x");
    CHECK(log.depth() == 0);

    CHECK(ss.str() ==
        "match number\n"
        "  match digit\n"
        "  match digit: ok\n"
        "  match digit\n"
        "  match digit: ok\n"
        "  match digit\n"
        "  match digit: fail\n"
        "match number: ok\n");
}

TEST_CASE("trace construct", "[Trace]")
{
    std::ostringstream ss;
    DefaultOutStream out(ss);
    TraceLog log(out);

    auto digit = traced("digit", satisfy<Text>(ascii::isDigit), log);
    auto number = traced("number", many(digit), log);

    CHECK(print(number, std::vector<char>{'4', '2'}) == "42");
    CHECK(ss.str() ==
        "construct number\n"
        "  construct digit\n"
        "  construct digit: ok\n"
        "  construct digit\n"
        "  construct digit: ok\n"
        "construct number: ok\n");
}

TEST_CASE("trace disabled", "[Trace]")
{
    std::ostringstream ss;
    DefaultOutStream out(ss);
    TraceLog log(out);
    log.setEnabled(false);
    CHECK(!log.enabled());

    auto g = traced("digits", many(satisfy<Text>(ascii::isDigit)), log);
    CHECK(parse(g, "123") == std::vector<char>{'1', '2', '3'});
    CHECK(ss.str().empty());
    CHECK(log.depth() == 0);

    log.setEnabled(true);
    CHECK(parse(g, "") == std::vector<char>());
    CHECK(ss.str() == "match digits\nmatch digits: ok\n");
}

TEST_CASE("trace records a failure that throws", "[Trace]")
{
    std::ostringstream ss;
    DefaultOutStream out(ss);
    TraceLog log(out);

    auto unavailable = lazy<Text, char>([]() -> Grammar<Text, char> {
        REFRACT_ENFORCEU("grammar unavailable");
    });

    auto g = traced("unavailable", unavailable, log);
    CHECK_THROWS_AS(g.match("a"), RuntimeException);
    CHECK(log.depth() == 0);
    CHECK(ss.str() == "match unavailable\nmatch unavailable: fail\n");
}

namespace {
    // Accepts a fixed number of characters, then fails every write
    class LimitedBuf : public std::streambuf
    {
    public:
        explicit LimitedBuf(uz limit)
            : myLimit(limit)
        {
        }

    public:
        std::string const& text() const
        {
            return myText;
        }

    protected:
        int_type overflow(int_type c) override
        {
            if ( myText.size() == myLimit )
                throw std::runtime_error("trace sink full");

            myText += traits_type::to_char_type(c);
            return c;
        }

    private:
        uz myLimit;
        std::string myText;
    };
}

TEST_CASE("trace sink failing while a grammar throws", "[Trace]")
{
    std::string const entry = "match unavailable\n";
    LimitedBuf buf(entry.size());
    std::ostream stream(&buf);
    stream.exceptions(std::ios_base::badbit);

    DefaultOutStream out(stream);
    TraceLog log(out);

    auto unavailable = lazy<Text, char>([]() -> Grammar<Text, char> {
        REFRACT_ENFORCEU("grammar unavailable");
    });

    auto g = traced("unavailable", unavailable, log);
    CHECK_THROWS_AS(g.match("a"), std::runtime_error);
    CHECK(buf.text() == entry);
    CHECK(log.depth() == 0);
}

TEST_CASE("trace construct records a failure that throws", "[Trace]")
{
    std::ostringstream ss;
    DefaultOutStream out(ss);
    TraceLog log(out);

    auto unavailable = lazy<Text, char>([]() -> Grammar<Text, char> {
        REFRACT_ENFORCEU("grammar unavailable");
    });

    auto g = traced("unavailable", unavailable, log);
    CHECK_THROWS_AS(print(g, 'a'), RuntimeException);
    CHECK(log.depth() == 0);
    CHECK(ss.str() == "construct unavailable\nconstruct unavailable: fail\n");
}

} // namespace refract::unittests
