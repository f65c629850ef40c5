#ifndef COMMON_HPP
#define COMMON_HPP
#include <cstdint>
#include "bswp.hpp"
#include "exceptions.hpp"

inline uint32_t rotr32(uint32_t n, unsigned int c)
{
    const unsigned int mask = 0x1F;
    c &= mask;
    return (n >> c) | (n << ((-c) & mask));
}

inline uint32_t rotl32(uint32_t n, unsigned int c)
{
    const unsigned int mask = 0x1F;
    c &= mask;
    return (n << c) | (n >> ((-c) & mask));
}

inline uint64_t rotr64(uint64_t n, unsigned int c)
{
    const unsigned int mask = 0x3F;
    c &= mask;
    return (n >> c) | (n << ((-c) & mask));
}

#endif // COMMON_HPP
