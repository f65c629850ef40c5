#include <cstdio>
#include "../platform/address_translator.hpp"
#include "../platform/ahb.hpp"
#include "../platform/cache.hpp"
#include "../platform/clock.hpp"
#include "constants.hpp"
#include "operation.hpp"
#include "registers.hpp"

SE_Operation::SE_Operation(SE_Registers* regs, AHB_Arbiter* ahb, Clock* clock, CacheMaintenance* cache,
                           AddressTranslator* translator, const SE_Config& config) :
    regs(regs), ahb(ahb), clock(clock), cache(cache), translator(translator), config(config)
{

}

uint64_t SE_Operation::deadline()
{
    return clock->milliseconds() + config.timeout_ms;
}

bool SE_Operation::expired(uint64_t deadline)
{
    return clock->milliseconds() > deadline;
}

SE_Result SE_Operation::prepare()
{
    //Wait for the previous operation to drain
    uint64_t timeout = deadline();
    while (regs->read32(SE_STATUS) != 0)
    {
        if (expired(timeout))
        {
            printf("[SE] Timed out waiting for idle, STATUS: $%08X\n", regs->read32(SE_STATUS));
            return SE_Result::Timeout;
        }
    }

    //Both are write-1-to-clear
    regs->write32(SE_ERR_STATUS, regs->read32(SE_ERR_STATUS));
    regs->write32(SE_INT_STATUS, regs->read32(SE_INT_STATUS));
    return SE_Result::Success;
}

SE_Result SE_Operation::complete()
{
    uint64_t timeout = deadline();
    while (!(regs->read32(SE_INT_STATUS) & SE_INT_OP_DONE))
    {
        if (expired(timeout))
        {
            printf("[SE] Timed out waiting for OP_DONE, INT_STATUS: $%08X\n", regs->read32(SE_INT_STATUS));
            return SE_Result::Timeout;
        }
    }

    uint32_t int_status = regs->read32(SE_INT_STATUS);
    if (int_status & SE_INT_ERR_STAT)
    {
        printf("[SE] Operation raised ERR_STAT, INT_STATUS: $%08X ERR_STATUS: $%08X\n",
               int_status, regs->read32(SE_ERR_STATUS));
        return SE_Result::Exception;
    }

    timeout = deadline();
    while ((regs->read32(SE_STATUS) & SE_STATUS_STATE_MASK) != SE_State::IDLE)
    {
        if (expired(timeout))
        {
            printf("[SE] Timed out waiting for STATE idle, STATUS: $%08X\n", regs->read32(SE_STATUS));
            return SE_Result::Timeout;
        }
    }

    //The engine's writes must have left the AHB write queue
    timeout = deadline();
    while (ahb->read_mem_wrque_mst_id() & config.ahb_write_queue_mask)
    {
        if (expired(timeout))
        {
            printf("[SE] Timed out waiting for AHB write queue, MST_ID: $%08X\n", ahb->read_mem_wrque_mst_id());
            return SE_Result::AhbTimeout;
        }
    }

    uint32_t err_status = regs->read32(SE_ERR_STATUS);
    if (err_status)
    {
        printf("[SE] Operation finished with ERR_STATUS: $%08X\n", err_status);
        return SE_Result::Exception;
    }

    return SE_Result::Success;
}

bool SE_Operation::translate_lists(SE_LinkedList& source, SE_LinkedList& destination, uint32_t& source_addr,
                                   uint32_t& destination_addr)
{
    return translator->translate(&source, sizeof(source), source_addr) &&
           translator->translate(&destination, sizeof(destination), destination_addr);
}

SE_Result SE_Operation::check_lists(SE_LinkedList& source, SE_LinkedList& destination)
{
    uint32_t source_addr, destination_addr;
    if (!translate_lists(source, destination, source_addr, destination_addr))
    {
        printf("[SE] Linked lists are not addressable by the engine\n");
        return SE_Result::MalformedBuffer;
    }
    return SE_Result::Success;
}

SE_Result SE_Operation::trigger(uint32_t opcode, SE_LinkedList& source, SE_LinkedList& destination)
{
    uint32_t source_addr, destination_addr;
    if (!translate_lists(source, destination, source_addr, destination_addr))
    {
        printf("[SE] Linked lists are not addressable by the engine\n");
        return SE_Result::MalformedBuffer;
    }

    regs->write32(SE_IN_LL_ADDR, source_addr);
    regs->write32(SE_OUT_LL_ADDR, destination_addr);

    SE_Result result = prepare();
    if (result != SE_Result::Success)
        return result;

    cache->flush_range(&source, sizeof(source));
    cache->flush_range(&destination, sizeof(destination));
    cache->barrier();

    regs->modify32(SE_OPERATION, SE_OPERATION_OPCODE_MASK, opcode);

    result = complete();

    cache->barrier();
    cache->flush_range(&source, sizeof(source));
    cache->flush_range(&destination, sizeof(destination));
    cache->barrier();
    return result;
}

SE_Result SE_Operation::start_normal_operation(SE_LinkedList& source, SE_LinkedList& destination)
{
    return trigger(SE_Opcode::START, source, destination);
}

SE_Result SE_Operation::start_context_save_operation(SE_LinkedList& source, SE_LinkedList& destination)
{
    return trigger(SE_Opcode::CTX_SAVE, source, destination);
}

SE_Result SE_Operation::make_list(const void* data, size_t len, SE_LinkedList& list)
{
    return list.set_buffer(translator, data, len);
}

void SE_Operation::publish(const void* data, size_t len)
{
    cache->publish(data, len);
}

void SE_Operation::acquire(const void* data, size_t len)
{
    cache->acquire(data, len);
}
