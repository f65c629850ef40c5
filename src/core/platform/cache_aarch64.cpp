#include "cache.hpp"

void AArch64Cache::flush_range(const void* data, size_t len)
{
    uintptr_t start = (uintptr_t)data & ~(uintptr_t)(DATA_CACHE_LINE_SIZE - 1);
    uintptr_t end = (uintptr_t)data + len;

    asm volatile("dmb sy" ::: "memory");
    for (uintptr_t line = start; line < end; line += DATA_CACHE_LINE_SIZE)
        asm volatile("dc civac, %0" :: "r"(line) : "memory");
    asm volatile("dmb sy" ::: "memory");
}

void AArch64Cache::barrier()
{
    asm volatile("dsb sy" ::: "memory");
}
