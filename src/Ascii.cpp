#include <refract/Ascii.hpp>

namespace refract::ascii {

bool isDigit(char c) noexcept
{
    if ( '0' <= c && c <= '9' )
        return true;

    return false;
}

bool isLetter(char c) noexcept
{
    return isLower(c) || isUpper(c);
}

bool isLower(char c) noexcept
{
    return 'a' <= c && c <= 'z';
}

bool isUpper(char c) noexcept
{
    return 'A' <= c && c <= 'Z';
}

bool isSpace(char c) noexcept
{
    switch (c)
    {
    case ' ':
    case '\t':
    case '\r':
    case '\n':
    case '\f':
    case '\v':
        return true;
    }

    return false;
}

} // namespace refract::ascii
