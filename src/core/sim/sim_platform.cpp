#include <cstdio>
#include "../platform/ahb.hpp"
#include "sim_platform.hpp"

//Master IDs 13 and 14 are the engine's AHB write ports
#define SE_AHB_WRITE_PENDING 0x2000
#define SE_AHB_WRITE_STUCK 0x4000

uint64_t SimClock::milliseconds()
{
    uint64_t value = now;
    now += step;
    reads++;
    return value;
}

void SimCache::flush_range(const void* data, size_t len)
{
    (void)data;
    flushes++;
    flushed_bytes += len;
}

void SimCache::barrier()
{
    barriers++;
}

SimAhbArbiter::SimAhbArbiter(uint32_t base) : base(base), pending_reads(0), stuck(false)
{

}

uint32_t SimAhbArbiter::read32(uint32_t addr)
{
    if (addr == base + AHB_ARBITRATION_AHB_MEM_WRQUE_MST_ID)
    {
        if (stuck)
            return SE_AHB_WRITE_STUCK;
        if (pending_reads > 0)
        {
            pending_reads--;
            return SE_AHB_WRITE_PENDING;
        }
        return 0;
    }

    printf("[SIM AHB] Unrecognized read32 $%08X\n", addr);
    return 0;
}

void SimAhbArbiter::write32(uint32_t addr, uint32_t value)
{
    printf("[SIM AHB] Unrecognized write32 $%08X: $%08X\n", addr, value);
}
