#include "ahb.hpp"
#include "mmio.hpp"

AHB_Arbiter::AHB_Arbiter(MMIO_Bus* bus, uint32_t base) : bus(bus), base(base)
{

}

uint32_t AHB_Arbiter::read_mem_wrque_mst_id()
{
    return bus->read32(base + AHB_ARBITRATION_AHB_MEM_WRQUE_MST_ID);
}
