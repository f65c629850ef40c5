#include "address_translator.hpp"

#define PAR_FAULT (1ULL << 0)
#define PAR_PA_MASK 0x0000FFFFFFFFF000ULL

bool EL3Translator::translate(const void* data, size_t len, uint32_t& phys)
{
    uint64_t va = (uintptr_t)data;
    uint64_t par;

    asm volatile("at s1e3r, %0" :: "r"(va));
    asm volatile("isb" ::: "memory");
    asm volatile("mrs %0, par_el1" : "=r"(par));

    if (par & PAR_FAULT)
        return false;

    uint64_t pa = (par & PAR_PA_MASK) | (va & 0xFFF);

    //DMA buffers have to be physically contiguous, the page of the last byte is checked too
    if (len > 1)
    {
        uint64_t last_va = va + len - 1;
        uint64_t last_par;
        asm volatile("at s1e3r, %0" :: "r"(last_va));
        asm volatile("isb" ::: "memory");
        asm volatile("mrs %0, par_el1" : "=r"(last_par));
        if (last_par & PAR_FAULT)
            return false;
        uint64_t last_pa = (last_par & PAR_PA_MASK) | (last_va & 0xFFF);
        if (last_pa - pa != len - 1)
            return false;
    }

    if (pa + len > 0x100000000ULL)
        return false;

    phys = (uint32_t)pa;
    return true;
}
