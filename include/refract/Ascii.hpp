#pragma once

#include <cstring>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <refract/Stream.hpp>
#include <refract/Types.hpp>

namespace refract {

namespace ascii {
    bool isDigit(char c) noexcept;
    bool isLetter(char c) noexcept;
    bool isLower(char c) noexcept;
    bool isUpper(char c) noexcept;
    bool isSpace(char c) noexcept;

    namespace details {
        /**
         * Renders \p rhs right-aligned in the buffer ending at \p end and
         * returns the first character written.
         */
        template <typename T>
        std::enable_if_t<std::is_unsigned_v<T>,
            char*> renderBackwards(char* end, T rhs) noexcept
        {
            auto c = end;
            do {
                --c;
                *c = static_cast<char>('0' + (rhs % 10));
                rhs /= 10;
            } while ( rhs );

            return c;
        }
    }

    template <typename T>
    std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T>,
        std::string> renderDecimal(T rhs)
    {
        char buffer[std::numeric_limits<T>::digits10 + 1];
        auto const end = buffer + sizeof(buffer);
        return std::string(details::renderBackwards(end, rhs), end);
    }

    template <typename T>
    std::enable_if_t<std::is_integral_v<T> && std::is_signed_v<T>,
        std::string> renderDecimal(T rhs)
    {
        using U = std::make_unsigned_t<T>;

        char buffer[std::numeric_limits<T>::digits10 + 2];
        auto const end = buffer + sizeof(buffer);
        auto const neg = rhs < 0;
        auto magnitude = neg ? static_cast<U>(U(0) - static_cast<U>(rhs)) : static_cast<U>(rhs);

        auto first = details::renderBackwards(end, magnitude);
        if ( neg )
            *--first = '-';

        return std::string(first, end);
    }

    /**
     * Reads an optionally negative run of decimal digits spanning all of
     * \p text. Rejects empty text, any other character, a sign on an
     * unsigned target, and values that do not fit \p T.
     */
    template <typename T>
    std::enable_if_t<std::is_integral_v<T>,
        std::optional<T>> parseDecimal(std::string_view text) noexcept
    {
        using U = std::make_unsigned_t<T>;

        auto first = text.begin();
        auto const last = text.end();

        bool neg = false;
        if ( first != last && *first == '-' ) {
            if constexpr ( std::is_unsigned_v<T> ) {
                return std::nullopt;
            }
            else {
                neg = true;
                ++first;
            }
        }

        if ( first == last )
            return std::nullopt;

        U const limit = neg
            ? static_cast<U>(U(0) - static_cast<U>(std::numeric_limits<T>::min()))
            : static_cast<U>(std::numeric_limits<T>::max());

        U ret = 0;
        for ( ; first != last; ++first ) {
            if ( !isDigit(*first) )
                return std::nullopt;

            auto const digit = static_cast<U>(*first - '0');
            if ( ret > (limit - digit) / 10 )
                return std::nullopt;

            ret = static_cast<U>(ret * 10 + digit);
        }

        if constexpr ( std::is_signed_v<T> ) {
            if ( neg && ret )
                return static_cast<T>(-static_cast<T>(ret - 1) - 1);
        }

        return static_cast<T>(ret);
    }

    template <typename Sink>
    class Formatter : public Sink
    {
    public:
        template <typename... Args>
        explicit Formatter(Args&&... args)
            : Sink(std::forward<Args>(args)...)
        {
        }

    public:
        template <typename T>
        Formatter& operator () (T const& rhs)
        {
            write(rhs);
            return *this;
        }

        Formatter& operator () ()
        {
            write('\n');
            Sink::flush();
            return *this;
        }

    public:
        using Sink::write;

        void write(char rhs)
        {
            Sink::write(&rhs, 1);
        }

        void write(bool rhs)
        {
            write(rhs ? "true" : "false");
        }

        template <typename T>
        std::enable_if_t<std::is_integral_v<T>
                      && !std::is_same_v<T, char>
                      && !std::is_same_v<T, bool>>
            write(T rhs)
        {
            write(renderDecimal(rhs));
        }

        void write(const char* rhs)
        {
            Sink::write(rhs, std::strlen(rhs));
        }

        void write(std::string_view rhs)
        {
            Sink::write(rhs.data(), rhs.size());
        }

        void write(std::string const& rhs)
        {
            Sink::write(rhs.data(), rhs.size());
        }
    };
} // namespace ascii

using DefaultOutStream = ascii::Formatter<OStreamSink>;

} // namespace refract
