#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include <refract/Grammar.hpp>
#include <refract/Utilities.hpp>

namespace refract {

//
// lazy

/**
 * Defers building a grammar until it is first run. The result of
 * \p factory is built once and shared by every later use.
 *
 * \pre \p factory does not run the grammar it is building
 *
 * The grammar owns \p factory and \p factory's result. A factory that
 * captures the grammar it defines forms a cycle that is never freed; build
 * self-reference with fix, or call a function that makes a fresh lazy.
 */
template <typename S, typename A>
Grammar<S, A> lazy(std::function<Grammar<S, A>()> factory)
{
    class Thunk
    {
    public:
        explicit Thunk(std::function<Grammar<S, A>()> factory)
            : myFactory(std::move(factory))
        {
        }

    public:
        Grammar<S, A> const& force()
        {
            std::call_once(myOnce, [this] {
                myGrammar.emplace(myFactory());
            });

            return *myGrammar;
        }

    private:
        std::function<Grammar<S, A>()> myFactory;
        std::once_flag myOnce;
        std::optional<Grammar<S, A>> myGrammar;
    };

    auto thunk = std::make_shared<Thunk>(std::move(factory));
    return Grammar<S, A>(
        [thunk](A const& a, S s) {
            return thunk->force().construct(a, std::move(s));
        },
        [thunk](S const& s) {
            return thunk->force().match(s);
        });
}

//
// fix

/**
 * Ties a self-referential grammar: \p body receives a handle to the grammar
 * being defined and returns its definition.
 *
 * The handle refers back weakly, so the definition does not own itself.
 * Running the handle before \p body returns, or after every copy of the
 * result is gone, throws RuntimeException.
 */
template <typename S, typename A>
Grammar<S, A> fix(std::function<Grammar<S, A>(Grammar<S, A> const&)> body)
{
    struct Knot
    {
        std::optional<Grammar<S, A>> grammar;
    };

    auto knot = std::make_shared<Knot>();
    std::weak_ptr<Knot> weak = knot;

    auto tie = [weak]() {
        auto k = weak.lock();
        REFRACT_ENFORCE(k, "recursive grammar used after its definition was released");
        REFRACT_ENFORCE(k->grammar, "recursive grammar used before its definition is complete");
        return k;
    };

    Grammar<S, A> self(
        [tie](A const& a, S s) {
            auto k = tie();
            return k->grammar->construct(a, std::move(s));
        },
        [tie](S const& s) {
            auto k = tie();
            return k->grammar->match(s);
        });

    knot->grammar.emplace(body(self));

    return Grammar<S, A>(
        [knot](A const& a, S s) {
            return knot->grammar->construct(a, std::move(s));
        },
        [knot](S const& s) {
            return knot->grammar->match(s);
        });
}

} // namespace refract
