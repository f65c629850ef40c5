#include <cstdio>
#include <cstring>
#include "dma_mapper.hpp"

#define SIM_DRAM_BASE 0x80000000
#define SIM_DRAM_END 0xFFFFF000ULL

SimDMAMapper::SimDMAMapper() : next_phys(SIM_DRAM_BASE), fail_all(false), fail_host(0)
{

}

bool SimDMAMapper::translate(const void* data, size_t len, uint32_t& phys)
{
    if (fail_all)
        return false;

    uintptr_t host = (uintptr_t)data;
    if (fail_host && fail_host >= host && fail_host - host < (len ? len : 1))
        return false;

    for (size_t i = 0; i < windows.size(); i++)
    {
        Window& w = windows[i];
        if (host >= w.host && host - w.host + len <= w.len)
        {
            phys = w.phys + (uint32_t)(host - w.host);
            return true;
        }
    }

    //Keep the offset within a cache line so alignment carries over
    size_t window_len = len ? len : 1;
    uint64_t base = ((uint64_t)next_phys + 63) & ~63ULL;
    base += host & 63;
    if (base + window_len > SIM_DRAM_END)
    {
        printf("[SIM] DMA address space exhausted\n");
        return false;
    }

    Window w;
    w.host = host;
    w.len = window_len;
    w.phys = (uint32_t)base;
    windows.push_back(w);
    next_phys = (uint32_t)(base + window_len);

    phys = w.phys;
    return true;
}

SimDMAMapper::Window* SimDMAMapper::find_phys(uint32_t phys, size_t len)
{
    for (size_t i = 0; i < windows.size(); i++)
    {
        Window& w = windows[i];
        if (phys >= w.phys && (uint64_t)(phys - w.phys) + len <= w.len)
            return &w;
    }
    return nullptr;
}

bool SimDMAMapper::read(uint32_t phys, void* data, size_t len)
{
    if (!len)
        return true;

    Window* w = find_phys(phys, len);
    if (!w)
    {
        printf("[SIM] DMA read from unmapped $%08X (%zu bytes)\n", phys, len);
        return false;
    }
    memcpy(data, (const void*)(w->host + (phys - w->phys)), len);
    return true;
}

bool SimDMAMapper::write(uint32_t phys, const void* data, size_t len)
{
    if (!len)
        return true;

    Window* w = find_phys(phys, len);
    if (!w)
    {
        printf("[SIM] DMA write to unmapped $%08X (%zu bytes)\n", phys, len);
        return false;
    }
    memcpy((void*)(w->host + (phys - w->phys)), data, len);
    return true;
}

void SimDMAMapper::reset()
{
    windows.clear();
    next_phys = SIM_DRAM_BASE;
}
