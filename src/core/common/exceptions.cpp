#include <cstdarg>
#include <cstdio>
#include "exceptions.hpp"

namespace SEException
{

void die(const char* format, ...)
{
    char output[ERROR_STRING_MAX_LENGTH];
    va_list args;
    va_start(args, format);
    vsnprintf(output, ERROR_STRING_MAX_LENGTH, format, args);
    va_end(args);
    throw FatalError(output);
}

};
