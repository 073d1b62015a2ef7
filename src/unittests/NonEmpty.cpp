#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include <refract/NonEmpty.hpp>

namespace refract::unittests {

TEST_CASE("NonEmpty", "[NonEmpty]")
{
    NonEmpty<int> one(1);
    CHECK(one.head() == 1);
    CHECK(one.tail().empty());
    CHECK(one.size() == 1);
    CHECK(one.toVector() == std::vector<int>{1});

    NonEmpty<int> three(1, {2, 3});
    CHECK(three.size() == 3);
    CHECK(three[0] == 1);
    CHECK(three[1] == 2);
    CHECK(three[2] == 3);
    CHECK(three.toVector() == std::vector<int>{1, 2, 3});

    CHECK(one != three);
    CHECK(three == NonEmpty<int>(1, {2, 3}));
    CHECK(three != NonEmpty<int>(1, {3, 2}));
}

TEST_CASE("NonEmpty owns its elements", "[NonEmpty]")
{
    std::vector<std::string> tail{"b", "c"};
    NonEmpty<std::string> n("a", tail);
    tail.clear();

    CHECK(n.size() == 3);
    CHECK(n[2] == "c");
}

} // namespace refract::unittests
