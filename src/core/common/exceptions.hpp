#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP
#include <stdexcept>
#include <cstdint>

#define ERROR_STRING_MAX_LENGTH 255

namespace SEException
{
    //Raised on programming errors: bad key slots, out of range register arrays, unknown modes
    class FatalError : public std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    void die(const char* format, ...);
};

#endif // EXCEPTIONS_HPP
