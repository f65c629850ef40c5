#ifndef CACHE_HPP
#define CACHE_HPP
#include <cstddef>
#include <cstdint>

const static int DATA_CACHE_LINE_SIZE = 64;

//Data cache maintenance towards a non-coherent DMA master
class CacheMaintenance
{
    public:
        virtual ~CacheMaintenance() {}

        //Clean and invalidate every line covering [data, data + len)
        virtual void flush_range(const void* data, size_t len) = 0;

        //Full-system data synchronization barrier
        virtual void barrier() = 0;

        //Make CPU writes visible to the engine before it is triggered
        void publish(const void* data, size_t len);

        //Make engine writes visible to the CPU after completion
        void acquire(const void* data, size_t len);
};

//Caches already coherent with the engine, e.g. when running without a data cache
class CoherentCache : public CacheMaintenance
{
    public:
        void flush_range(const void* data, size_t len) override;
        void barrier() override;
};

//DC CIVAC by line followed by DSB SY
class AArch64Cache : public CacheMaintenance
{
    public:
        void flush_range(const void* data, size_t len) override;
        void barrier() override;
};

#endif // CACHE_HPP
