#pragma once

#include <functional>
#include <optional>
#include <utility>

namespace refract {

/**
 * Conversion between a representation \p A and a value \p B.
 *
 * review is total. preview is partial; returning nullopt rejects an \p A
 * that has no corresponding \p B.
 */
template <typename A, typename B>
class Prism
{
public:
    using ReviewFn = std::function<A(B const&)>;
    using PreviewFn = std::function<std::optional<B>(A const&)>;

public:
    Prism(ReviewFn review, PreviewFn preview)
        : myReview(std::move(review))
        , myPreview(std::move(preview))
    {
    }

public:
    A review(B const& b) const
    {
        return myReview(b);
    }

    std::optional<B> preview(A const& a) const
    {
        return myPreview(a);
    }

private:
    ReviewFn myReview;
    PreviewFn myPreview;
};

template <typename A, typename B>
Prism<A, B> prism(typename Prism<A, B>::ReviewFn review,
                  typename Prism<A, B>::PreviewFn preview)
{
    return Prism<A, B>(std::move(review), std::move(preview));
}

/**
 * Total in both directions.
 */
template <typename A, typename B>
Prism<A, B> iso(std::function<B(A const&)> forward,
                std::function<A(B const&)> backward)
{
    return Prism<A, B>(std::move(backward),
                       [forward = std::move(forward)](A const& a) -> std::optional<B> {
                           return forward(a);
                       });
}

template <typename A, typename B, typename C>
Prism<A, C> compose(Prism<A, B> const& outer, Prism<B, C> const& inner)
{
    return Prism<A, C>(
        [outer, inner](C const& c) {
            return outer.review(inner.review(c));
        },
        [outer, inner](A const& a) -> std::optional<C> {
            auto b = outer.preview(a);
            if ( !b )
                return std::nullopt;

            return inner.preview(*b);
        });
}

} // namespace refract
