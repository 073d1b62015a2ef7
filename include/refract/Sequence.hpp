#pragma once

#include <deque>
#include <iterator>
#include <list>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace refract {

/**
 * Capability contract for a container used as parser input and printer
 * output. Specialise for a container to make it usable with every grammar:
 *
 *   using Element = ...;
 *   static S cons(Element e, S s);
 *   static std::optional<std::pair<Element, S>> uncons(S const& s);
 *   static S empty();
 *
 * The shipped specialisations copy the tail on uncons and insert at the
 * front on cons, so each is linear in the length of the sequence and a
 * many over n elements is quadratic in n.
 */
template <typename S>
struct Sequence;

//
// Text

template <typename C, typename Traits, typename Alloc>
struct Sequence<std::basic_string<C, Traits, Alloc>>
{
    using Type = std::basic_string<C, Traits, Alloc>;
    using Element = C;

    static Type cons(Element e, Type s)
    {
        s.insert(s.begin(), e);
        return s;
    }

    static std::optional<std::pair<Element, Type>> uncons(Type const& s)
    {
        if ( s.empty() )
            return std::nullopt;

        return std::make_pair(s.front(), s.substr(1));
    }

    static Type empty()
    {
        return Type();
    }
};

//
// Buffers and token arrays

template <typename T, typename Alloc>
struct Sequence<std::vector<T, Alloc>>
{
    using Type = std::vector<T, Alloc>;
    using Element = T;

    static Type cons(Element e, Type s)
    {
        s.insert(s.begin(), std::move(e));
        return s;
    }

    static std::optional<std::pair<Element, Type>> uncons(Type const& s)
    {
        if ( s.empty() )
            return std::nullopt;

        return std::make_pair(s.front(), Type(std::next(s.begin()), s.end()));
    }

    static Type empty()
    {
        return Type();
    }
};

template <typename T, typename Alloc>
struct Sequence<std::deque<T, Alloc>>
{
    using Type = std::deque<T, Alloc>;
    using Element = T;

    static Type cons(Element e, Type s)
    {
        s.push_front(std::move(e));
        return s;
    }

    static std::optional<std::pair<Element, Type>> uncons(Type const& s)
    {
        if ( s.empty() )
            return std::nullopt;

        auto rest = s;
        rest.pop_front();
        return std::make_pair(s.front(), std::move(rest));
    }

    static Type empty()
    {
        return Type();
    }
};

//
// Token lists

template <typename T, typename Alloc>
struct Sequence<std::list<T, Alloc>>
{
    using Type = std::list<T, Alloc>;
    using Element = T;

    static Type cons(Element e, Type s)
    {
        s.push_front(std::move(e));
        return s;
    }

    static std::optional<std::pair<Element, Type>> uncons(Type const& s)
    {
        if ( s.empty() )
            return std::nullopt;

        return std::make_pair(s.front(), Type(std::next(s.begin()), s.end()));
    }

    static Type empty()
    {
        return Type();
    }
};

template <typename S>
using Element = typename Sequence<S>::Element;

namespace details {

template <typename S, typename = void>
struct is_sequence_impl : std::false_type {};

template <typename S>
struct is_sequence_impl<S, std::void_t<decltype(Sequence<S>::uncons(std::declval<S const&>()))>>
    : std::true_type {};

} // namespace details

template <typename S> constexpr bool is_sequence = details::is_sequence_impl<S>::value;

template <typename S>
S cons(Element<S> e, S s)
{
    return Sequence<S>::cons(std::move(e), std::move(s));
}

template <typename S>
std::optional<std::pair<Element<S>, S>> uncons(S const& s)
{
    return Sequence<S>::uncons(s);
}

template <typename S>
S emptySequence()
{
    return Sequence<S>::empty();
}

} // namespace refract
