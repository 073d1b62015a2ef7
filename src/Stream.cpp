#include <refract/Stream.hpp>

#include <ostream>

namespace refract {

//
// OStreamSink

OStreamSink::OStreamSink(std::ostream& stream) noexcept
    : myStream(&stream)
{
}

void OStreamSink::write(char const* data, uz length)
{
    myStream->write(data, static_cast<std::streamsize>(length));
}

void OStreamSink::flush()
{
    myStream->flush();
}

} // namespace refract
