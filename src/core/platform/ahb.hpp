#ifndef AHB_HPP
#define AHB_HPP
#include <cstdint>

class MMIO_Bus;

#define AHB_ARBITRATION_BASE 0x6000C000
#define AHB_ARBITRATION_AHB_MEM_WRQUE_MST_ID 0xFC

//Read side of the AHB arbiter. Only the write queue status is of interest here.
class AHB_Arbiter
{
    private:
        MMIO_Bus* bus;
        uint32_t base;
    public:
        AHB_Arbiter(MMIO_Bus* bus, uint32_t base = AHB_ARBITRATION_BASE);

        uint32_t read_mem_wrque_mst_id();
};

#endif // AHB_HPP
