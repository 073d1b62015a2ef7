#include <catch2/catch.hpp>

#include <optional>
#include <string>
#include <utility>
#include <variant>

#include <refract/Ascii.hpp>
#include <refract/Char.hpp>
#include <refract/Combinators.hpp>
#include <refract/Evaluate.hpp>

#include "Laws.hpp"

namespace refract::unittests {

using Text = std::string;

namespace {
    char toUpper(char c)
    {
        if ( ascii::isLower(c) )
            return static_cast<char>(c - 'a' + 'A');

        return c;
    }

    char toLower(char c)
    {
        if ( ascii::isUpper(c) )
            return static_cast<char>(c - 'A' + 'a');

        return c;
    }

    Prism<std::string, std::string> shouting()
    {
        return prism<std::string, std::string>(
            [](std::string const& s) {
                std::string ret;
                for ( auto c : s )
                    ret += toUpper(c);

                return ret;
            },
            [](std::string const& s) -> std::optional<std::string> {
                std::string ret;
                for ( auto c : s ) {
                    if ( ascii::isLower(c) )
                        return std::nullopt;

                    ret += toLower(c);
                }

                return ret;
            });
    }
}

TEST_CASE("adapt", "[Combinators][adapt]")
{
    auto g = shouting() % (chars() % many(element<Text>()));

    CHECK(parse(g, "WOW!!!") == "wow!!!");
    CHECK(!parse(g, "meh"));
    CHECK(print(g, "hello world") == "HELLO WORLD");

    checkMatchLaw(g, "LOUD NOISES");
    checkConstructLaw(g, "quiet", "");
}

TEST_CASE("adapt reversed", "[Combinators][adapt]")
{
    auto g = adapt(chars(), adapt(reversed<char>(), many(satisfy<Text>(ascii::isLetter))));

    CHECK(parse(g, "live!") == "evil");
    CHECK(print(g, "evil") == "live");

    checkMatchLaw(g, "stressed!");
    checkConstructLaw(g, "desserts", "!");
}

TEST_CASE("adapt fails with the remainder after the match", "[Combinators][adapt]")
{
    auto evenDigit = prism<char, int>(
        [](int const& n) {
            return static_cast<char>('0' + n);
        },
        [](char const& c) -> std::optional<int> {
            if ( !ascii::isDigit(c) || (c - '0') % 2 )
                return std::nullopt;

            return c - '0';
        });

    auto g = adapt(evenDigit, element<Text>());

    auto m = g.match("4x");
    REQUIRE(m);
    CHECK(m.value() == 4);
    CHECK(m.rest() == "x");

    // The element was consumed before the conversion rejected it
    auto rejected = g.match("3x");
    CHECK(!rejected);
    CHECK(rejected.rest() == "x");

    // The underlying failure is passed through untouched
    auto empty = g.match("");
    CHECK(!empty);
    CHECK(empty.rest() == "");
}

TEST_CASE("sequence", "[Combinators][sequence]")
{
    auto g = integral<int>() & letters();

    auto r = parse(g, "-10abc");
    REQUIRE(r);
    CHECK(r->first == -10);
    CHECK(r->second == "abc");

    CHECK(print(g, std::make_pair(42, std::string("xyz"))) == "42xyz");

    checkMatchLaw(g, "7seven!");
    checkConstructLaw(g, std::make_pair(3, std::string("abc")), "!");
}

TEST_CASE("sequence does not give back consumed input", "[Combinators][sequence]")
{
    auto g = literal<Text>('a') & literal<Text>('b');

    CHECK(parse(g, "ab"));

    auto m = g.match("ac");
    CHECK(!m);
    CHECK(m.rest() == "c");

    auto first = g.match("bc");
    CHECK(!first);
    CHECK(first.rest() == "bc");
}

TEST_CASE("thenDiscard", "[Combinators][sequence]")
{
    auto g = integral<int>() << literal<Text>('~');

    CHECK(parse(g, "123~") == 123);
    CHECK(!parse(g, "123!"));
    CHECK(print(g, 123) == "123~");

    CHECK(thenDiscard(integral<int>(), literal<Text>('~')).match("5~x").rest() == "x");

    checkMatchLaw(g, "-4~");
    checkConstructLaw(g, 9, "");
}

TEST_CASE("discardThen", "[Combinators][sequence]")
{
    auto g = literal<Text>('~') >> integral<int>();

    CHECK(parse(g, "~123") == 123);
    CHECK(!parse(g, "123"));
    CHECK(print(g, 123) == "~123");

    auto m = g.match("~x");
    CHECK(!m);
    CHECK(m.rest() == "x");

    checkMatchLaw(g, "~-4");
    checkConstructLaw(g, 9, "~");
}

TEST_CASE("between", "[Combinators][between]")
{
    auto g = between(literal<Text>('<'), literal<Text>('>'), integral<int>());

    CHECK(parse(g, "<-123>") == -123);
    CHECK(!parse(g, "<-123"));
    CHECK(!parse(g, "-123>"));
    CHECK(print(g, 42) == "<42>");

    checkMatchLaw(g, "<0>");
    checkConstructLaw(g, 17, "<1>");
}

TEST_CASE("choice", "[Combinators][choice]")
{
    auto g = integral<int>() | letters();
    using V = std::variant<int, std::string>;

    auto n = parse(g, "-10!");
    REQUIRE(n);
    REQUIRE(n->index() == 0);
    CHECK(std::get<0>(*n) == -10);

    auto w = parse(g, "abc!");
    REQUIRE(w);
    REQUIRE(w->index() == 1);
    CHECK(std::get<1>(*w) == "abc");

    CHECK(print(g, V(std::in_place_index<0>, 42)) == "42");
    CHECK(print(g, V(std::in_place_index<1>, "xyz")) == "xyz");

    checkMatchLaw(g, "12");
    checkMatchLaw(g, "ab");
    checkConstructLaw(g, V(std::in_place_index<0>, 5), "!");
    checkConstructLaw(g, V(std::in_place_index<1>, "five"), "!");
}

TEST_CASE("choice retries on the original input", "[Combinators][choice]")
{
    auto ab = literal<Text>('a') & literal<Text>('b');
    auto ac = literal<Text>('a') & literal<Text>('c');
    auto g = ab | ac;

    auto m = g.match("ac!");
    REQUIRE(m);
    CHECK(m.value().index() == 1);
    CHECK(m.rest() == "!");

    auto f = (symbol<Text>('x') | symbol<Text>('y')).match("z");
    CHECK(!f);
    CHECK(f.rest() == "z");
}

TEST_CASE("choice between identical value types", "[Combinators][choice]")
{
    auto g = symbol<Text>('a') | symbol<Text>('b');
    using V = std::variant<char, char>;

    auto r = parse(g, "b");
    REQUIRE(r);
    CHECK(r->index() == 1);
    CHECK(print(g, V(std::in_place_index<1>, 'b')) == "b");
    CHECK(print(g, V(std::in_place_index<0>, 'a')) == "a");
}

TEST_CASE("opt", "[Combinators][opt]")
{
    auto g = opt(integral<int>());

    auto some = parse(g, "1~");
    REQUIRE(some);
    REQUIRE(some->has_value());
    CHECK(**some == 1);

    auto none = g.match("~");
    REQUIRE(none);
    CHECK(!none.value().has_value());
    CHECK(none.rest() == "~");

    CHECK(print(g, std::optional<int>(1)) == "1");
    CHECK(print(g, std::optional<int>()) == "");

    checkMatchLaw(g, "~");
    checkMatchLaw(g, "12~");
    checkConstructLaw(g, std::optional<int>(3), "~");
    checkConstructLaw(g, std::optional<int>(), "~");
}

TEST_CASE("withDefault", "[Combinators][withDefault]")
{
    auto g = withDefault(0, integral<int>());

    CHECK(parse(g, "1~") == 1);
    CHECK(parse(g, "~") == 0);
    CHECK(print(g, 1) == "1");
    CHECK(print(g, 0) == "");

    auto m = g.match("~");
    REQUIRE(m);
    CHECK(m.rest() == "~");
}

TEST_CASE("withDefault is lossy", "[Combinators][withDefault]")
{
    auto g = withDefault(0, integral<int>());

    CHECK(print(g, 0) == emptySequence<Text>());
    for ( int x : {0, 1, -1, 42} )
        CHECK(parse(g, print(g, x)) == x);

    // An explicit zero is read back as the default and printed as nothing
    CHECK(parse(g, "0") == 0);
    CHECK(print(g, *parse(g, "0")) == "");
}

TEST_CASE("operators", "[Combinators]")
{
    auto digit = satisfy<Text>(ascii::isDigit);

    auto all = *digit;
    CHECK(parse(all, "") == std::vector<char>());

    auto some = +digit;
    CHECK(!parse(some, ""));
    CHECK(parse(some, "12") == NonEmpty<char>('1', {'2'}));

    auto pair = digit & digit;
    CHECK(parse(pair, "12") == std::make_pair('1', '2'));

    auto either = digit | symbol<Text>('x');
    REQUIRE(parse(either, "x"));
    CHECK(parse(either, "x")->index() == 1);
}

} // namespace refract::unittests
