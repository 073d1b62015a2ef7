#pragma once

#include <optional>
#include <utility>

#include <refract/Combinators.hpp>
#include <refract/Grammar.hpp>
#include <refract/Sequence.hpp>

namespace refract {

/**
 * Runs \p g forwards. Input left over after a successful match is ignored;
 * use parseAll to require that everything is consumed.
 */
template <typename S, typename A>
std::optional<A> parse(Grammar<S, A> const& g, typename Grammar<S, A>::sequence_type const& input)
{
    auto m = g.match(input);
    if ( !m )
        return std::nullopt;

    return std::move(m).value();
}

template <typename S, typename A>
std::optional<A> parseAll(Grammar<S, A> const& g, typename Grammar<S, A>::sequence_type const& input)
{
    return parse(thenDiscard(g, eof<S>()), input);
}

template <typename S, typename A>
S print(Grammar<S, A> const& g, typename Grammar<S, A>::value_type const& value)
{
    return g.construct(value, emptySequence<S>());
}

} // namespace refract
