#pragma once

#include <algorithm>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <refract/Grammar.hpp>
#include <refract/Meta.hpp>
#include <refract/NonEmpty.hpp>
#include <refract/Prism.hpp>
#include <refract/Types.hpp>

namespace refract {

//
// adapt

/**
 * Lifts a grammar over \p A to one over \p B.
 *
 * When \p g matches but \p p rejects the matched value, the failure carries
 * the remainder after \p g's match, not the original input.
 */
template <typename S, typename A, typename B>
Grammar<S, B> adapt(Prism<A, B> const& p, Grammar<S, A> const& g)
{
    using R = Match<S, B>;
    return Grammar<S, B>(
        [p, g](B const& b, S s) {
            return g.construct(p.review(b), std::move(s));
        },
        [p, g](S const& s) {
            auto m = g.match(s);
            if ( !m )
                return R::failure(std::move(m).rest());

            auto b = p.preview(m.value());
            if ( !b )
                return R::failure(std::move(m).rest());

            return R::success(std::move(*b), std::move(m).rest());
        });
}

//
// sequence

/**
 * Runs \p first then \p second on what \p first left over. A failure in
 * \p second does not give back what \p first consumed.
 */
template <typename S, typename A, typename B>
Grammar<S, std::pair<A, B>> sequence(Grammar<S, A> const& first, Grammar<S, B> const& second)
{
    using R = Match<S, std::pair<A, B>>;
    return Grammar<S, std::pair<A, B>>(
        [first, second](std::pair<A, B> const& ab, S s) {
            return first.construct(ab.first, second.construct(ab.second, std::move(s)));
        },
        [first, second](S const& s) {
            auto ma = first.match(s);
            if ( !ma )
                return R::failure(std::move(ma).rest());

            auto mb = second.match(ma.rest());
            if ( !mb )
                return R::failure(std::move(mb).rest());

            return R::success(std::make_pair(std::move(ma).value(), std::move(mb).value()),
                              std::move(mb).rest());
        });
}

template <typename S, typename A>
Grammar<S, A> thenDiscard(Grammar<S, A> const& g, Grammar<S, Unit> const& unit)
{
    using R = Match<S, A>;
    return Grammar<S, A>(
        [g, unit](A const& a, S s) {
            return g.construct(a, unit.construct(Unit(), std::move(s)));
        },
        [g, unit](S const& s) {
            auto ma = g.match(s);
            if ( !ma )
                return ma;

            auto mu = unit.match(ma.rest());
            if ( !mu )
                return R::failure(std::move(mu).rest());

            return R::success(std::move(ma).value(), std::move(mu).rest());
        });
}

template <typename S, typename A>
Grammar<S, A> discardThen(Grammar<S, Unit> const& unit, Grammar<S, A> const& g)
{
    using R = Match<S, A>;
    return Grammar<S, A>(
        [unit, g](A const& a, S s) {
            return unit.construct(Unit(), g.construct(a, std::move(s)));
        },
        [unit, g](S const& s) {
            auto mu = unit.match(s);
            if ( !mu )
                return R::failure(std::move(mu).rest());

            return g.match(mu.rest());
        });
}

//
// choice

/**
 * Ordered choice. \p right is only tried, on the original input, when
 * \p left fails.
 */
template <typename S, typename A, typename B>
Grammar<S, std::variant<A, B>> choice(Grammar<S, A> const& left, Grammar<S, B> const& right)
{
    using V = std::variant<A, B>;
    using R = Match<S, V>;
    return Grammar<S, V>(
        [left, right](V const& v, S s) {
            if ( v.index() == 0 )
                return left.construct(std::get<0>(v), std::move(s));

            return right.construct(std::get<1>(v), std::move(s));
        },
        [left, right](S const& s) {
            auto ma = left.match(s);
            if ( ma )
                return R::success(V(std::in_place_index<0>, std::move(ma).value()),
                                  std::move(ma).rest());

            auto mb = right.match(s);
            if ( !mb )
                return R::failure(std::move(mb).rest());

            return R::success(V(std::in_place_index<1>, std::move(mb).value()),
                              std::move(mb).rest());
        });
}

//
// many

/**
 * Zero or more, greedy.
 *
 * \pre every successful match of \p g consumes at least one element;
 *      a grammar that can succeed without consuming never terminates here
 *
 * The remainder is the input of the attempt that failed, whatever \p g
 * reported as its failure state.
 */
template <typename S, typename A>
Grammar<S, std::vector<A>> many(Grammar<S, A> const& g)
{
    using R = Match<S, std::vector<A>>;
    return Grammar<S, std::vector<A>>(
        [g](std::vector<A> const& as, S s) {
            for ( auto a = as.rbegin(); a != as.rend(); ++a )
                s = g.construct(*a, std::move(s));

            return s;
        },
        [g](S const& s) {
            std::vector<A> values;
            S cur = s;
            for (;;) {
                auto m = g.match(cur);
                if ( !m )
                    break;

                values.push_back(std::move(m).value());
                cur = std::move(m).rest();
            }

            return R::success(std::move(values), std::move(cur));
        });
}

/**
 * One or more, greedy. Same precondition as many.
 */
template <typename S, typename A>
Grammar<S, NonEmpty<A>> many1(Grammar<S, A> const& g)
{
    using Parts = std::pair<A, std::vector<A>>;
    auto nonEmpty = iso<Parts, NonEmpty<A>>(
        [](Parts const& p) {
            return NonEmpty<A>(p.first, p.second);
        },
        [](NonEmpty<A> const& n) {
            return std::make_pair(n.head(), n.tail());
        });

    return adapt(nonEmpty, sequence(g, many(g)));
}

//
// replicate

/**
 * Exactly \p n matches of \p g.
 *
 * construct writes the first \p n values it is given. Extra values are
 * dropped and a shorter vector is written as is.
 */
template <typename S, typename A>
Grammar<S, std::vector<A>> replicate(uz n, Grammar<S, A> const& g)
{
    using R = Match<S, std::vector<A>>;
    return Grammar<S, std::vector<A>>(
        [n, g](std::vector<A> const& as, S s) {
            for ( auto i = std::min(n, as.size()); i-- > 0; )
                s = g.construct(as[i], std::move(s));

            return s;
        },
        [n, g](S const& s) {
            std::vector<A> values;
            values.reserve(n);
            S cur = s;
            for ( uz i = 0; i != n; ++i ) {
                auto m = g.match(cur);
                if ( !m )
                    return R::failure(std::move(m).rest());

                values.push_back(std::move(m).value());
                cur = std::move(m).rest();
            }

            return R::success(std::move(values), std::move(cur));
        });
}

//
// dependent

/**
 * The value matched by \p g selects the grammar for what follows.
 *
 * \p next maps a determinant to the grammar of the rest. \p extract recovers
 * the determinant from a result; next(extract(b)) must be the grammar that
 * would have produced b.
 */
template <typename S, typename A, typename Next, typename Extract>
auto dependent(Grammar<S, A> const& g, Next next, Extract extract)
    -> Grammar<S, typename std::invoke_result_t<Next, A const&>::value_type>
{
    using B = typename std::invoke_result_t<Next, A const&>::value_type;
    using R = Match<S, B>;
    static_assert(std::is_same_v<std::invoke_result_t<Next, A const&>, Grammar<S, B>>,
                  "next must return a grammar over the same sequence");

    return Grammar<S, B>(
        [g, next, extract](B const& b, S s) {
            A a = extract(b);
            return g.construct(a, next(a).construct(b, std::move(s)));
        },
        [g, next](S const& s) {
            auto ma = g.match(s);
            if ( !ma )
                return R::failure(std::move(ma).rest());

            return next(ma.value()).match(ma.rest());
        });
}

//
// withDefault

/**
 * Never fails to match; yields \p d without consuming when \p g fails.
 * Constructing \p d writes nothing.
 */
template <typename S, typename A>
Grammar<S, A> withDefault(A d, Grammar<S, A> const& g)
{
    static_assert(has_equality<A>, "withDefault requires equality on the value type");

    using R = Match<S, A>;
    return Grammar<S, A>(
        [d, g](A const& a, S s) {
            if ( a == d )
                return s;

            return g.construct(a, std::move(s));
        },
        [d, g](S const& s) {
            auto m = g.match(s);
            if ( !m )
                return R::success(d, s);

            return m;
        });
}

//
// opt

template <typename S, typename A>
Grammar<S, std::optional<A>> opt(Grammar<S, A> const& g)
{
    using R = Match<S, std::optional<A>>;
    return Grammar<S, std::optional<A>>(
        [g](std::optional<A> const& a, S s) {
            if ( !a )
                return s;

            return g.construct(*a, std::move(s));
        },
        [g](S const& s) {
            auto m = g.match(s);
            if ( !m )
                return R::success(std::nullopt, s);

            return R::success(std::optional<A>(std::move(m).value()), std::move(m).rest());
        });
}

//
// between

template <typename S, typename A>
Grammar<S, A> between(Grammar<S, Unit> const& open,
                      Grammar<S, Unit> const& close,
                      Grammar<S, A> const& inner)
{
    return discardThen(open, thenDiscard(inner, close));
}

//
// Operators

template <typename S, typename A, typename B>
Grammar<S, std::pair<A, B>> operator & (Grammar<S, A> const& lhs, Grammar<S, B> const& rhs)
{
    return sequence(lhs, rhs);
}

// Ordered

template <typename S, typename A, typename B>
Grammar<S, std::variant<A, B>> operator | (Grammar<S, A> const& lhs, Grammar<S, B> const& rhs)
{
    return choice(lhs, rhs);
}

template <typename S, typename A>
Grammar<S, A> operator << (Grammar<S, A> const& lhs, Grammar<S, Unit> const& rhs)
{
    return thenDiscard(lhs, rhs);
}

template <typename S, typename A>
Grammar<S, A> operator >> (Grammar<S, Unit> const& lhs, Grammar<S, A> const& rhs)
{
    return discardThen(lhs, rhs);
}

template <typename S, typename A>
Grammar<S, std::vector<A>> operator * (Grammar<S, A> const& rhs)
{
    return many(rhs);
}

template <typename S, typename A>
Grammar<S, NonEmpty<A>> operator + (Grammar<S, A> const& rhs)
{
    return many1(rhs);
}

template <typename S, typename A, typename B>
Grammar<S, B> operator % (Prism<A, B> const& lhs, Grammar<S, A> const& rhs)
{
    return adapt(lhs, rhs);
}

} // namespace refract
