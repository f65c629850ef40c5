#include "clock.hpp"
#include "mmio.hpp"

#define APBDEV_RTC_SHADOW_SECONDS 0x0C
#define APBDEV_RTC_MILLI_SECONDS 0x10

RTC_Clock::RTC_Clock(MMIO_Bus* bus, uint32_t base) : bus(bus), base(base)
{

}

uint64_t RTC_Clock::milliseconds()
{
    uint64_t ms = bus->read32(base + APBDEV_RTC_MILLI_SECONDS);
    uint64_t seconds = bus->read32(base + APBDEV_RTC_SHADOW_SECONDS);
    return seconds * 1000 + ms;
}
