#include "../common/common.hpp"
#include "mmio.hpp"

DirectMMIO::DirectMMIO(volatile void* window, uint32_t phys_base, uint32_t size) :
    window((volatile uint32_t*)window), phys_base(phys_base), size(size)
{

}

volatile uint32_t* DirectMMIO::reg_ptr(uint32_t addr)
{
    if (addr < phys_base || addr - phys_base >= size || (addr & 0x3))
        SEException::die("[MMIO] Access to $%08X outside window $%08X+$%X\n", addr, phys_base, size);
    return window + ((addr - phys_base) >> 2);
}

uint32_t DirectMMIO::read32(uint32_t addr)
{
    return *reg_ptr(addr);
}

void DirectMMIO::write32(uint32_t addr, uint32_t value)
{
    *reg_ptr(addr) = value;
}
