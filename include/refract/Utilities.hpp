#pragma once

#include <exception>
#include <string>
#include <utility>

namespace refract {

class RuntimeException : public std::exception
{
public:
    RuntimeException(const char* file, unsigned line, std::string msg)
        : myFile(file)
        , myMsg(std::move(msg))
        , myLine(line)
    {
    }

    // std::exception
public:
    const char* what() const noexcept override { return myMsg.c_str(); }

public:
    const char* message() const noexcept { return myMsg.c_str(); }
    const char* file() const noexcept { return myFile; }
    unsigned line() const noexcept { return myLine; }

private:
    const char* myFile;
    std::string myMsg;
    unsigned myLine;
};

#define REFRACT_ENFORCE(V, M) ::refract::enforce(!!(V), M, __FILE__, __LINE__)
#define REFRACT_ENFORCEU(M) throw ::refract::RuntimeException(__FILE__, __LINE__, M)

void enforce(bool value, std::string msg, const char* file, unsigned line);

} // namespace refract
