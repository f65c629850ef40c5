#ifndef SE_OPERATION_HPP
#define SE_OPERATION_HPP
#include <cstddef>
#include <cstdint>
#include "../platform/cache.hpp"
#include "config.hpp"
#include "linked_list.hpp"
#include "result.hpp"

//One AES block padded out to a whole cache line, so flushing it cannot clobber neighbours
struct alignas(DATA_CACHE_LINE_SIZE) SE_CachePad
{
    uint8_t data[DATA_CACHE_LINE_SIZE];
};

class AddressTranslator;
class AHB_Arbiter;
class Clock;
class SE_Registers;

//Runs one engine operation to completion: idle wait, opcode issue and the completion checks.
//Synchronous, busy-polling and without retries.
class SE_Operation
{
    private:
        SE_Registers* regs;
        AHB_Arbiter* ahb;
        Clock* clock;
        CacheMaintenance* cache;
        AddressTranslator* translator;
        SE_Config config;

        uint64_t deadline();
        bool expired(uint64_t deadline);
        bool translate_lists(SE_LinkedList& source, SE_LinkedList& destination, uint32_t& source_addr,
                             uint32_t& destination_addr);
    public:
        SE_Operation(SE_Registers* regs, AHB_Arbiter* ahb, Clock* clock, CacheMaintenance* cache,
                     AddressTranslator* translator, const SE_Config& config);

        SE_Result prepare();
        SE_Result complete();
        SE_Result trigger(uint32_t opcode, SE_LinkedList& source, SE_LinkedList& destination);

        SE_Result start_normal_operation(SE_LinkedList& source, SE_LinkedList& destination);
        SE_Result start_context_save_operation(SE_LinkedList& source, SE_LinkedList& destination);

        //Buffer helpers shared by the front-ends
        SE_Result make_list(const void* data, size_t len, SE_LinkedList& list);

        //The lists themselves must be reachable by the engine, checked before any register write
        SE_Result check_lists(SE_LinkedList& source, SE_LinkedList& destination);
        void publish(const void* data, size_t len);
        void acquire(const void* data, size_t len);

        const SE_Config& get_config() const { return config; }
};

#endif // SE_OPERATION_HPP
