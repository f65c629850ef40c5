#ifndef BSWP_HPP
#define BSWP_HPP
#include <cstdint>

uint32_t bswp32(uint32_t value);
uint64_t bswp64(uint64_t value);

//Byte stream <-> word helpers. Buffers need not be aligned.
uint32_t load_be32(const uint8_t* data);
uint32_t load_le32(const uint8_t* data);
uint64_t load_be64(const uint8_t* data);
void store_be32(uint8_t* data, uint32_t value);
void store_le32(uint8_t* data, uint32_t value);
void store_be64(uint8_t* data, uint64_t value);

#endif // BSWP_HPP
