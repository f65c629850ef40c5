#ifndef CLOCK_HPP
#define CLOCK_HPP
#include <cstdint>

class MMIO_Bus;

//Monotonic millisecond counter used for operation deadlines
class Clock
{
    public:
        virtual ~Clock() {}

        virtual uint64_t milliseconds() = 0;
};

//The always-on RTC. Reading MILLI_SECONDS latches SECONDS into SHADOW_SECONDS.
class RTC_Clock : public Clock
{
    private:
        MMIO_Bus* bus;
        uint32_t base;
    public:
        RTC_Clock(MMIO_Bus* bus, uint32_t base = 0x7000E000);

        uint64_t milliseconds() override;
};

#endif // CLOCK_HPP
