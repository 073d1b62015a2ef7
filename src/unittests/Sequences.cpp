#include <catch2/catch.hpp>

#include <deque>
#include <list>
#include <string>
#include <vector>

#include <refract/Combinators.hpp>
#include <refract/Evaluate.hpp>
#include <refract/Meta.hpp>
#include <refract/Sequence.hpp>
#include <refract/Types.hpp>

#include "Laws.hpp"

namespace refract::unittests {

static_assert(is_sequence<std::string>);
static_assert(is_sequence<std::vector<u8>>);
static_assert(is_sequence<std::deque<int>>);
static_assert(is_sequence<std::list<double>>);
static_assert(!is_sequence<int>);
static_assert(!is_sequence<char const*>);

TEST_CASE("sequence detection", "[Sequence][Meta]")
{
    CHECK(is_sequence<std::string>);
    CHECK(is_sequence<std::vector<u8>>);
    CHECK(is_sequence<std::deque<int>>);
    CHECK(is_sequence<std::list<double>>);
    CHECK(!is_sequence<int>);

    CHECK(has_equality<int>);
    CHECK(has_equality<std::string>);
    CHECK(has_equality<Unit>);
    CHECK(!has_equality<Grammar<std::string, char>>);
}

TEST_CASE("long sequences", "[Sequence]")
{
    std::string const text(2000, 'a');
    auto g = many(symbol<std::string>('a'));

    auto m = g.match(text + "!");
    REQUIRE(m);
    CHECK(m.value().size() == 2000);
    CHECK(m.rest() == "!");
    CHECK(print(g, m.value()) == text);
}

TEST_CASE("sequence traits", "[Sequence]")
{
    auto s = uncons(std::string("abc"));
    REQUIRE(s);
    CHECK(s->first == 'a');
    CHECK(s->second == "bc");
    CHECK(!uncons(std::string()));
    CHECK(cons('x', std::string("yz")) == "xyz");
    CHECK(emptySequence<std::string>().empty());

    auto d = uncons(std::deque<int>{1, 2});
    REQUIRE(d);
    CHECK(d->first == 1);
    CHECK(d->second == std::deque<int>{2});
    CHECK(cons(0, std::deque<int>{1}) == std::deque<int>{0, 1});

    auto l = uncons(std::list<int>{5});
    REQUIRE(l);
    CHECK(l->first == 5);
    CHECK(l->second.empty());
}

TEST_CASE("length-prefixed byte frames", "[Sequence][bytes]")
{
    using Bytes = std::vector<u8>;

    auto frame = dependent(
        element<Bytes>(),
        [](u8 const& n) {
            return replicate(n, element<Bytes>());
        },
        [](std::vector<u8> const& payload) {
            return static_cast<u8>(payload.size());
        });

    auto m = frame.match(Bytes{3, 1, 2, 3, 9});
    REQUIRE(m);
    CHECK(m.value() == std::vector<u8>{1, 2, 3});
    CHECK(m.rest() == Bytes{9});

    CHECK(print(frame, std::vector<u8>{7, 8}) == Bytes{2, 7, 8});
    CHECK(!parse(frame, Bytes{4, 1, 2}));

    auto frames = many(frame);
    auto all = parseAll(frames, Bytes{1, 42, 0, 2, 5, 6});
    REQUIRE(all);
    CHECK(all->size() == 3);
    CHECK((*all)[1].empty());

    checkMatchLaw(frame, Bytes{3, 1, 2, 3, 9});
    checkConstructLaw(frame, std::vector<u8>{255}, Bytes{1});
}

TEST_CASE("integer deques", "[Sequence][deque]")
{
    using Ints = std::deque<int>;
    auto positive = satisfy<Ints>([](int n) { return n > 0; });
    auto g = many(positive);

    auto m = g.match(Ints{1, 2, 0, 3});
    REQUIRE(m);
    CHECK(m.value() == std::vector<int>{1, 2});
    CHECK(m.rest() == Ints{0, 3});

    CHECK(print(g, std::vector<int>{4, 5}) == Ints{4, 5});

    checkMatchLaw(g, Ints{1, 2, 0, 3});
    checkConstructLaw(g, std::vector<int>{9}, Ints{-1});
}

namespace {
    enum class Tok
    {
        Open,
        Close,
        Word,
        Comma,
    };
}

TEST_CASE("token lists", "[Sequence][list]")
{
    using Toks = std::list<Tok>;
    auto words = many(symbol<Toks>(Tok::Word) << literal<Toks>(Tok::Comma));
    auto g = between(literal<Toks>(Tok::Open), literal<Toks>(Tok::Close), words);

    auto r = parseAll(g, Toks{Tok::Open, Tok::Word, Tok::Comma, Tok::Word, Tok::Comma, Tok::Close});
    REQUIRE(r);
    CHECK(r->size() == 2);

    CHECK(!parse(g, Toks{Tok::Open, Tok::Word, Tok::Close}));
    CHECK(print(g, std::vector<Tok>{Tok::Word}) == Toks{Tok::Open, Tok::Word, Tok::Comma, Tok::Close});
    CHECK(print(g, std::vector<Tok>()) == Toks{Tok::Open, Tok::Close});

    checkMatchLaw(g, Toks{Tok::Open, Tok::Close, Tok::Word});
}

} // namespace refract::unittests
