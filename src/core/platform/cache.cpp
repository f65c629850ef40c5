#include "cache.hpp"

void CacheMaintenance::publish(const void* data, size_t len)
{
    if (len)
        flush_range(data, len);
    barrier();
}

void CacheMaintenance::acquire(const void* data, size_t len)
{
    barrier();
    if (len)
    {
        flush_range(data, len);
        barrier();
    }
}

void CoherentCache::flush_range(const void* data, size_t len)
{
    (void)data;
    (void)len;
}

void CoherentCache::barrier()
{

}
