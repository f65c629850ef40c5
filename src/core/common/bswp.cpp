#include "bswp.hpp"

uint32_t bswp32(uint32_t value)
{
    return (value >> 24) |
            (((value >> 16) & 0xFF) << 8) |
            (((value >> 8) & 0xFF) << 16) |
            (value << 24);
}

uint64_t bswp64(uint64_t value)
{
    return ((uint64_t)bswp32(value & 0xFFFFFFFF) << 32) | bswp32(value >> 32);
}

uint32_t load_be32(const uint8_t* data)
{
    return ((uint32_t)data[0] << 24) | (data[1] << 16) | (data[2] << 8) | data[3];
}

uint32_t load_le32(const uint8_t* data)
{
    return data[0] | (data[1] << 8) | (data[2] << 16) | ((uint32_t)data[3] << 24);
}

uint64_t load_be64(const uint8_t* data)
{
    return ((uint64_t)load_be32(data) << 32) | load_be32(data + 4);
}

void store_be32(uint8_t* data, uint32_t value)
{
    data[0] = value >> 24;
    data[1] = (value >> 16) & 0xFF;
    data[2] = (value >> 8) & 0xFF;
    data[3] = value & 0xFF;
}

void store_le32(uint8_t* data, uint32_t value)
{
    data[0] = value & 0xFF;
    data[1] = (value >> 8) & 0xFF;
    data[2] = (value >> 16) & 0xFF;
    data[3] = value >> 24;
}

void store_be64(uint8_t* data, uint64_t value)
{
    store_be32(data, value >> 32);
    store_be32(data + 4, value & 0xFFFFFFFF);
}
