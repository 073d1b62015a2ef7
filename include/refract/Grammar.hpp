#pragma once

#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include <refract/Match.hpp>
#include <refract/Sequence.hpp>
#include <refract/Types.hpp>

namespace refract {

/**
 * A bidirectional grammar over sequences \p S producing values \p A.
 *
 * construct(a, s) prepends the representation of a onto s.
 * match(s) splits a value off the front of s.
 *
 * Every grammar built from the primitives and combinators of this library
 * satisfies, for any a and s:
 *
 *   match(s) == success(a, s')  implies  construct(a, s') == s
 *   match(construct(a, s')) == success(a, s')
 *
 * Grammars are immutable. Copies share one definition and may be used from
 * any number of threads.
 */
template <typename S, typename A>
class Grammar
{
    static_assert(is_sequence<S>, "S must specialise refract::Sequence");

public:
    using sequence_type = S;
    using value_type = A;
    using Result = Match<S, A>;
    using ConstructFn = std::function<S(A const&, S)>;
    using MatchFn = std::function<Result(S const&)>;

public:
    Grammar(ConstructFn construct, MatchFn match)
        : myDef(std::make_shared<Def const>(Def{ std::move(construct), std::move(match) }))
    {
    }

public:
    S construct(A const& value, S rest) const
    {
        return myDef->construct(value, std::move(rest));
    }

    Result match(S const& input) const
    {
        return myDef->match(input);
    }

private:
    struct Def
    {
        ConstructFn construct;
        MatchFn match;
    };

    std::shared_ptr<Def const> myDef;
};

//
// element

template <typename S>
Grammar<S, Element<S>> element()
{
    using E = Element<S>;
    using R = Match<S, E>;
    return Grammar<S, E>(
        [](E const& e, S s) {
            return cons(e, std::move(s));
        },
        [](S const& s) {
            auto split = uncons(s);
            if ( !split )
                return R::failure(s);

            return R::success(std::move(split->first), std::move(split->second));
        });
}

//
// satisfy

/**
 * \pre every value given to construct satisfies \p pred
 *
 * construct does not re-check the predicate.
 */
template <typename S, typename Pred>
Grammar<S, Element<S>> satisfy(Pred pred)
{
    using E = Element<S>;
    using R = Match<S, E>;
    return Grammar<S, E>(
        [](E const& e, S s) {
            return cons(e, std::move(s));
        },
        [pred](S const& s) {
            auto split = uncons(s);
            if ( !split || !pred(split->first) )
                return R::failure(s);

            return R::success(std::move(split->first), std::move(split->second));
        });
}

//
// symbol

template <typename S>
Grammar<S, Element<S>> symbol(Element<S> x)
{
    return satisfy<S>([x](Element<S> const& e) { return e == x; });
}

//
// literal

template <typename S>
Grammar<S, Unit> literal(Element<S> x)
{
    using R = Match<S, Unit>;
    return Grammar<S, Unit>(
        [x](Unit const&, S s) {
            return cons(x, std::move(s));
        },
        [x](S const& s) {
            auto split = uncons(s);
            if ( !split || !(split->first == x) )
                return R::failure(s);

            return R::success(Unit(), std::move(split->second));
        });
}

//
// keyword

/**
 * Run of literals, e.g. keyword<std::string>("true"). Fails with the
 * original input if any element differs.
 */
template <typename S>
Grammar<S, Unit> keyword(S word)
{
    using R = Match<S, Unit>;
    return Grammar<S, Unit>(
        [word](Unit const&, S s) {
            std::vector<Element<S>> elements;
            for ( auto split = uncons(word); split; split = uncons(split->second) )
                elements.push_back(std::move(split->first));

            for ( auto e = elements.rbegin(); e != elements.rend(); ++e )
                s = cons(*e, std::move(s));

            return s;
        },
        [word](S const& s) {
            auto cur = s;
            for ( auto w = uncons(word); w; w = uncons(w->second) ) {
                auto split = uncons(cur);
                if ( !split || !(split->first == w->first) )
                    return R::failure(s);

                cur = std::move(split->second);
            }

            return R::success(Unit(), std::move(cur));
        });
}

//
// eof

template <typename S>
Grammar<S, Unit> eof()
{
    using R = Match<S, Unit>;
    return Grammar<S, Unit>(
        [](Unit const&, S s) {
            return s;
        },
        [](S const& s) {
            if ( uncons(s) )
                return R::failure(s);

            return R::success(Unit(), s);
        });
}

} // namespace refract
