#ifndef SIM_PLATFORM_HPP
#define SIM_PLATFORM_HPP
#include <cstddef>
#include <cstdint>
#include "../platform/cache.hpp"
#include "../platform/clock.hpp"
#include "../platform/mmio.hpp"

//Advances by a fixed step on every read, so busy-wait loops always make progress
class SimClock : public Clock
{
    private:
        uint64_t now;
        uint32_t step;
        uint64_t reads;
    public:
        SimClock(uint32_t step = 1) : now(0), step(step), reads(0) {}

        uint64_t milliseconds() override;

        void advance(uint64_t ms) { now += ms; }
        uint64_t peek() const { return now; }
        uint64_t read_count() const { return reads; }
};

//Counts maintenance calls. Host memory is coherent already.
class SimCache : public CacheMaintenance
{
    private:
        uint64_t flushes;
        uint64_t flushed_bytes;
        uint64_t barriers;
    public:
        SimCache() : flushes(0), flushed_bytes(0), barriers(0) {}

        void flush_range(const void* data, size_t len) override;
        void barrier() override;

        uint64_t flush_count() const { return flushes; }
        uint64_t flushed_byte_count() const { return flushed_bytes; }
        uint64_t barrier_count() const { return barriers; }
};

//AHB_ARBITRATION_AHB_MEM_WRQUE_MST_ID with engine writes that drain after a few reads
class SimAhbArbiter : public MMIO_Bus
{
    private:
        uint32_t base;
        int pending_reads;
        bool stuck;
    public:
        SimAhbArbiter(uint32_t base = 0x6000C000);

        uint32_t read32(uint32_t addr) override;
        void write32(uint32_t addr, uint32_t value) override;

        //Engine writes stay queued for the next `reads` status reads
        void post_writes(int reads) { pending_reads = reads; }
        void set_stuck(bool stuck) { this->stuck = stuck; }
};

#endif // SIM_PLATFORM_HPP
