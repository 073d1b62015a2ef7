#pragma once

#include <utility>
#include <vector>

#include <refract/Types.hpp>

namespace refract {

/**
 * Ordered sequence with at least one element. There is no empty state to
 * construct, so the guarantee holds by construction.
 */
template <typename T>
class NonEmpty
{
public:
    using value_type = T;

public:
    explicit NonEmpty(T head)
        : myHead(std::move(head))
    {
    }

    NonEmpty(T head, std::vector<T> tail)
        : myHead(std::move(head))
        , myTail(std::move(tail))
    {
    }

public:
    T const& head() const noexcept
    {
        return myHead;
    }

    std::vector<T> const& tail() const noexcept
    {
        return myTail;
    }

    uz size() const noexcept
    {
        return myTail.size() + 1;
    }

    T const& operator [] (uz index) const
    {
        if ( !index )
            return myHead;

        return myTail[index - 1];
    }

    std::vector<T> toVector() const
    {
        std::vector<T> ret;
        ret.reserve(size());
        ret.push_back(myHead);
        ret.insert(ret.end(), myTail.begin(), myTail.end());
        return ret;
    }

public:
    bool operator == (NonEmpty const& rhs) const
    {
        return myHead == rhs.myHead && myTail == rhs.myTail;
    }

    bool operator != (NonEmpty const& rhs) const
    {
        return !operator==(rhs);
    }

private:
    T myHead;
    std::vector<T> myTail;
};

} // namespace refract
