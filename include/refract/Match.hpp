#pragma once

#include <optional>
#include <utility>

#include <refract/Utilities.hpp>

namespace refract {

/**
 * Outcome of running a grammar forwards. A success carries the decoded value
 * and the remaining input. A failure carries only a sequence: usually the
 * input the grammar was given, but not always (see adapt).
 */
template <typename S, typename A>
class Match
{
public:
    using sequence_type = S;
    using value_type = A;

public:
    static Match success(A value, S rest)
    {
        return Match(std::optional<A>(std::move(value)), std::move(rest));
    }

    static Match failure(S rest)
    {
        return Match(std::nullopt, std::move(rest));
    }

public:
    bool ok() const noexcept
    {
        return myValue.has_value();
    }

    explicit operator bool () const noexcept
    {
        return ok();
    }

    A const& value() const&
    {
        REFRACT_ENFORCE(ok(), "value of a failed match");
        return *myValue;
    }

    A&& value() &&
    {
        REFRACT_ENFORCE(ok(), "value of a failed match");
        return std::move(*myValue);
    }

    S const& rest() const& noexcept
    {
        return myRest;
    }

    S&& rest() && noexcept
    {
        return std::move(myRest);
    }

public:
    bool operator == (Match const& rhs) const
    {
        return myValue == rhs.myValue && myRest == rhs.myRest;
    }

    bool operator != (Match const& rhs) const
    {
        return !operator==(rhs);
    }

private:
    Match(std::optional<A> value, S rest)
        : myValue(std::move(value))
        , myRest(std::move(rest))
    {
    }

private:
    std::optional<A> myValue;
    S myRest;
};

} // namespace refract
