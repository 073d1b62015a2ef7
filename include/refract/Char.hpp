#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <refract/Ascii.hpp>
#include <refract/Combinators.hpp>
#include <refract/Grammar.hpp>
#include <refract/NonEmpty.hpp>
#include <refract/Prism.hpp>

namespace refract {

//
// Character vectors

inline Prism<std::vector<char>, std::string> chars()
{
    return iso<std::vector<char>, std::string>(
        [](std::vector<char> const& v) {
            return std::string(v.begin(), v.end());
        },
        [](std::string const& s) {
            return std::vector<char>(s.begin(), s.end());
        });
}

template <typename T>
Prism<std::vector<T>, std::vector<T>> reversed()
{
    auto reverse = [](std::vector<T> const& v) {
        return std::vector<T>(v.rbegin(), v.rend());
    };

    return iso<std::vector<T>, std::vector<T>>(reverse, reverse);
}

//
// Text grammars

/**
 * Zero or more ASCII letters.
 */
template <typename S = std::string>
Grammar<S, std::string> letters()
{
    static_assert(std::is_same_v<Element<S>, char>, "letters requires a character sequence");
    return adapt(chars(), many(satisfy<S>(ascii::isLetter)));
}

/**
 * One or more decimal digits.
 *
 * \pre the text given to construct is a non-empty run of digits
 */
template <typename S = std::string>
Grammar<S, std::string> digits()
{
    static_assert(std::is_same_v<Element<S>, char>, "digits requires a character sequence");

    auto text = iso<NonEmpty<char>, std::string>(
        [](NonEmpty<char> const& ds) {
            auto v = ds.toVector();
            return std::string(v.begin(), v.end());
        },
        [](std::string const& s) {
            if ( s.empty() )
                return NonEmpty<char>('0');

            return NonEmpty<char>(s.front(), std::vector<char>(s.begin() + 1, s.end()));
        });

    return adapt(text, many1(satisfy<S>(ascii::isDigit)));
}

//
// integral

/**
 * Optionally negative decimal integer. Digits that do not fit \p T, or a
 * minus sign on an unsigned \p T, fail the match after the numeral has
 * been consumed.
 */
template <typename T, typename S = std::string>
Grammar<S, T> integral()
{
    static_assert(std::is_integral_v<T>, "integral requires an integer type");
    static_assert(std::is_same_v<Element<S>, char>, "integral requires a character sequence");

    using Numeral = std::pair<std::optional<char>, std::string>;

    auto text = iso<Numeral, std::string>(
        [](Numeral const& n) {
            std::string ret;
            if ( n.first )
                ret += *n.first;

            return ret + n.second;
        },
        [](std::string const& s) {
            if ( !s.empty() && s.front() == '-' )
                return Numeral('-', s.substr(1));

            return Numeral(std::nullopt, s);
        });

    auto decimal = prism<std::string, T>(
        [](T const& n) {
            return ascii::renderDecimal(n);
        },
        [](std::string const& s) {
            return ascii::parseDecimal<T>(s);
        });

    return adapt(compose(text, decimal), opt(symbol<S>('-')) & digits<S>());
}

} // namespace refract
