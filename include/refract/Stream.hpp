#pragma once

#include <iosfwd>

#include <refract/Types.hpp>

namespace refract {

/**
 * Formatter sink writing to a std::ostream owned elsewhere.
 */
class OStreamSink
{
public:
    explicit OStreamSink(std::ostream& stream) noexcept;

public:
    void write(char const* data, uz length);
    void flush();

private:
    std::ostream* myStream = nullptr;
};

} // namespace refract
