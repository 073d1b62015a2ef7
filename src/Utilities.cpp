#include <refract/Utilities.hpp>

namespace refract {

void enforce(bool value, std::string msg, const char* file, unsigned line)
{
    if ( !value )
        throw RuntimeException(file, line, std::move(msg));
}

} // namespace refract
