#include "address_translator.hpp"

bool IdentityTranslator::translate(const void* data, size_t len, uint32_t& phys)
{
    uint64_t start = (uintptr_t)data;
    uint64_t end = start + len;
    if (end > 0x100000000ULL)
        return false;

    phys = (uint32_t)start;
    return true;
}
