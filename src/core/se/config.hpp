#ifndef SE_CONFIG_HPP
#define SE_CONFIG_HPP
#include <cstdint>
#include "constants.hpp"

struct SE_Config
{
    //Deadline for each of the four waits of an operation
    uint32_t timeout_ms;

    //Blocks generated between two DRBG reseeds
    uint32_t reseed_interval;

    //Master IDs in AHB_MEM_WRQUE_MST_ID that belong to the engine
    uint32_t ahb_write_queue_mask;

    SE_Config() : timeout_ms(100), reseed_interval(RNG_RESEED_INTERVAL), ahb_write_queue_mask(0x6000) {}
};

#endif // SE_CONFIG_HPP
