#pragma once

#include <string>
#include <utility>

#include <refract/Ascii.hpp>
#include <refract/Grammar.hpp>
#include <refract/Types.hpp>

namespace refract {

/**
 * Indented record of grammar activity written to a DefaultOutStream.
 *
 * A TraceLog is not synchronised; give each thread its own.
 */
class TraceLog
{
public:
    explicit TraceLog(DefaultOutStream& out) noexcept;

public:
    void begin(const char* operation, std::string const& name);
    void end(const char* operation, std::string const& name, bool ok);

    void setEnabled(bool enabled) noexcept;
    bool enabled() const noexcept;
    uz depth() const noexcept;

private:
    void indent();

private:
    DefaultOutStream* myOut = nullptr;
    uz myDepth = 0;
    bool myEnabled = true;
};

/**
 * Wraps \p g so that every match and construct is recorded in \p log under
 * \p name. Results are those of \p g. \p log must outlive the grammar.
 *
 * An exception from \p g is logged as a failure and rethrown. If writing
 * that exit line throws as well, the write error replaces the original.
 */
template <typename S, typename A>
Grammar<S, A> traced(std::string name, Grammar<S, A> const& g, TraceLog& log)
{
    return Grammar<S, A>(
        [name, g, &log](A const& a, S s) {
            log.begin("construct", name);
            auto ret = [&] {
                try {
                    return g.construct(a, std::move(s));
                }
                catch (...) {
                    log.end("construct", name, false);
                    throw;
                }
            }();

            log.end("construct", name, true);
            return ret;
        },
        [name, g, &log](S const& s) {
            log.begin("match", name);
            auto m = [&] {
                try {
                    return g.match(s);
                }
                catch (...) {
                    log.end("match", name, false);
                    throw;
                }
            }();

            log.end("match", name, m.ok());
            return m;
        });
}

} // namespace refract
