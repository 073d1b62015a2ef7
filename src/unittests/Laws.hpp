#pragma once

#include <catch2/catch.hpp>

#include <refract/Grammar.hpp>

namespace refract::unittests {

/**
 * If g matches input, constructing the result onto the remainder gives
 * back input.
 */
template <typename S, typename A>
void checkMatchLaw(Grammar<S, A> const& g, typename Grammar<S, A>::sequence_type const& input)
{
    auto m = g.match(input);
    if ( !m )
        return;

    CHECK(g.construct(m.value(), m.rest()) == input);
}

/**
 * Matching what was just constructed gives back the value and the rest.
 *
 * \pre rest does not begin with anything g would go on to consume
 */
template <typename S, typename A>
void checkConstructLaw(Grammar<S, A> const& g,
                       typename Grammar<S, A>::value_type const& value,
                       typename Grammar<S, A>::sequence_type const& rest)
{
    auto m = g.match(g.construct(value, rest));
    REQUIRE(m);
    CHECK(m.value() == value);
    CHECK(m.rest() == rest);
}

} // namespace refract::unittests
