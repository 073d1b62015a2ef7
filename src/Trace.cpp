#include <refract/Trace.hpp>

namespace refract {

//
// TraceLog

TraceLog::TraceLog(DefaultOutStream& out) noexcept
    : myOut(&out)
{
}

void TraceLog::begin(const char* operation, std::string const& name)
{
    if ( myEnabled ) {
        indent();
        (*myOut)(operation)(' ')(name)();
    }

    ++myDepth;
}

void TraceLog::end(const char* operation, std::string const& name, bool ok)
{
    if ( myDepth )
        --myDepth;

    if ( !myEnabled )
        return;

    indent();
    (*myOut)(operation)(' ')(name)(": ")(ok ? "ok" : "fail")();
}

void TraceLog::setEnabled(bool enabled) noexcept
{
    myEnabled = enabled;
}

bool TraceLog::enabled() const noexcept
{
    return myEnabled;
}

uz TraceLog::depth() const noexcept
{
    return myDepth;
}

void TraceLog::indent()
{
    for ( uz i = 0; i != myDepth; ++i )
        (*myOut)("  ");
}

} // namespace refract
