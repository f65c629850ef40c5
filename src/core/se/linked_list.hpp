#ifndef SE_LINKED_LIST_HPP
#define SE_LINKED_LIST_HPP
#include <cstddef>
#include <cstdint>
#include "result.hpp"

class AddressTranslator;

//One physically contiguous DMA buffer
struct SE_AddressInfo
{
    uint32_t address;
    uint32_t data_len;
};

//DMA scatter list in the layout the engine fetches it in.
//entries counts the descriptors beyond the first, at most 3.
struct SE_LinkedList
{
    uint32_t entries;
    SE_AddressInfo address_info[4];

    //Empty list: a single zero-length descriptor at address 0
    SE_LinkedList();

    //Replaces the list with a single descriptor covering the buffer
    SE_Result set_buffer(AddressTranslator* translator, const void* data, size_t len);

    //Adds another descriptor. The list is left untouched on failure.
    SE_Result append(AddressTranslator* translator, const void* data, size_t len);

    int count() const { return entries + 1; }
    uint64_t total_length() const;
};

static_assert(sizeof(SE_AddressInfo) == 8, "SE_AddressInfo must match the hardware layout");
static_assert(sizeof(SE_LinkedList) == 36, "SE_LinkedList must match the hardware layout");

SE_Result se_describe_buffer(AddressTranslator* translator, const void* data, size_t len,
                             SE_AddressInfo& info);

#endif // SE_LINKED_LIST_HPP
