#include <catch2/catch.hpp>

#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <refract/Char.hpp>
#include <refract/Combinators.hpp>
#include <refract/Evaluate.hpp>
#include <refract/Recursive.hpp>

#include "Laws.hpp"

namespace refract::unittests {

using Text = std::string;

namespace {
    struct Tree
    {
        std::vector<Tree> children;

        bool operator == (Tree const& rhs) const
        {
            return children == rhs.children;
        }
    };

    Prism<std::vector<Tree>, Tree> node()
    {
        return iso<std::vector<Tree>, Tree>(
            [](std::vector<Tree> const& children) {
                return Tree{children};
            },
            [](Tree const& t) {
                return t.children;
            });
    }

    // Balanced parentheses, e.g. "(()(()))"
    Grammar<Text, Tree> fixedTree()
    {
        return fix<Text, Tree>([](Grammar<Text, Tree> const& self) {
            return adapt(node(), between(literal<Text>('('), literal<Text>(')'), many(self)));
        });
    }

    Grammar<Text, Tree> lazyTree()
    {
        return adapt(node(), between(literal<Text>('('),
                                     literal<Text>(')'),
                                     many(lazy<Text, Tree>(lazyTree))));
    }
}

TEST_CASE("fix", "[Recursive][fix]")
{
    auto g = fixedTree();

    auto t = parseAll(g, "(()(()))");
    REQUIRE(t);
    REQUIRE(t->children.size() == 2);
    CHECK(t->children[0].children.empty());
    REQUIRE(t->children[1].children.size() == 1);
    CHECK(t->children[1].children[0].children.empty());

    CHECK(print(g, *t) == "(()(()))");
    CHECK(print(g, Tree{}) == "()");

    CHECK(!parseAll(g, "(()"));
    CHECK(!parseAll(g, "())"));
    CHECK(!parse(g, ""));

    checkMatchLaw(g, "(()(()))()");
    checkConstructLaw(g, *t, ")");
}

TEST_CASE("lazy", "[Recursive][lazy]")
{
    auto g = lazyTree();

    auto t = parseAll(g, "((())())");
    REQUIRE(t);
    CHECK(t->children.size() == 2);
    CHECK(print(g, *t) == "((())())");

    CHECK(parse(g, "((())())") == parse(fixedTree(), "((())())"));

    checkMatchLaw(g, "(())x");
    checkConstructLaw(g, Tree{{Tree{}, Tree{}}}, "");
}

TEST_CASE("lazy builds once", "[Recursive][lazy]")
{
    int builds = 0;
    auto g = lazy<Text, char>([&builds] {
        ++builds;
        return symbol<Text>('a');
    });

    CHECK(builds == 0);
    CHECK(parse(g, "a") == 'a');
    CHECK(!parse(g, "b"));
    CHECK(print(g, 'a') == "a");
    CHECK(builds == 1);

    auto copy = g;
    CHECK(parse(copy, "a") == 'a');
    CHECK(builds == 1);
}

TEST_CASE("lazy is shared between threads", "[Recursive][lazy]")
{
    auto g = many(lazy<Text, Tree>(lazyTree));

    std::vector<std::optional<std::vector<Tree>>> results(4);
    std::vector<std::thread> threads;
    for ( auto& r : results )
        threads.emplace_back([&g, &r] { r = parseAll(g, "()(())((()))"); });

    for ( auto& t : threads )
        t.join();

    for ( auto const& r : results ) {
        REQUIRE(r);
        CHECK(r->size() == 3);
    }
}

TEST_CASE("fix handle used before its definition is complete", "[Recursive][fix]")
{
    auto premature = [] {
        return fix<Text, char>([](Grammar<Text, char> const& self) {
            self.match("a");
            return element<Text>();
        });
    };

    CHECK_THROWS_AS(premature(), RuntimeException);
}

TEST_CASE("fix handle outliving its definition", "[Recursive][fix]")
{
    std::optional<Grammar<Text, char>> escaped;

    {
        auto g = fix<Text, char>([&escaped](Grammar<Text, char> const& self) {
            escaped.emplace(self);
            return element<Text>();
        });

        CHECK(parse(g, "a") == 'a');
        REQUIRE(escaped);
        CHECK(parse(*escaped, "a") == 'a');
    }

    CHECK_THROWS_AS(escaped->match("a"), RuntimeException);
    CHECK_THROWS_AS(escaped->construct('a', ""), RuntimeException);
}

TEST_CASE("lazy releases its factory with the grammar", "[Recursive][lazy]")
{
    auto token = std::make_shared<int>(0);
    std::weak_ptr<int> watch = token;

    {
        auto g = lazy<Text, char>([token] {
            return symbol<Text>('a');
        });
        token.reset();

        CHECK(parse(g, "a") == 'a');
        CHECK(!watch.expired());
    }

    CHECK(watch.expired());
}

} // namespace refract::unittests
