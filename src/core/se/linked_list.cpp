#include <cstdio>
#include "../platform/address_translator.hpp"
#include "linked_list.hpp"

SE_Result se_describe_buffer(AddressTranslator* translator, const void* data, size_t len,
                             SE_AddressInfo& info)
{
    if ((uint64_t)len > 0xFFFFFFFFULL)
    {
        printf("[SE] Buffer of %zu bytes exceeds a single descriptor\n", len);
        return SE_Result::MalformedBuffer;
    }

    uint32_t phys = 0;
    if (data && !translator->translate(data, len, phys))
    {
        printf("[SE] Buffer %p (%zu bytes) has no 32-bit physical address\n", data, len);
        return SE_Result::MalformedBuffer;
    }

    info.address = phys;
    info.data_len = (uint32_t)len;
    return SE_Result::Success;
}

SE_LinkedList::SE_LinkedList() : entries(0)
{
    for (int i = 0; i < 4; i++)
    {
        address_info[i].address = 0;
        address_info[i].data_len = 0;
    }
}

SE_Result SE_LinkedList::set_buffer(AddressTranslator* translator, const void* data, size_t len)
{
    SE_AddressInfo info;
    SE_Result result = se_describe_buffer(translator, data, len, info);
    if (result != SE_Result::Success)
        return result;

    *this = SE_LinkedList();
    address_info[0] = info;
    return SE_Result::Success;
}

SE_Result SE_LinkedList::append(AddressTranslator* translator, const void* data, size_t len)
{
    if (entries >= 3)
        return SE_Result::MalformedBuffer;

    SE_AddressInfo info;
    SE_Result result = se_describe_buffer(translator, data, len, info);
    if (result != SE_Result::Success)
        return result;

    entries++;
    address_info[entries] = info;
    return SE_Result::Success;
}

uint64_t SE_LinkedList::total_length() const
{
    uint64_t total = 0;
    for (uint32_t i = 0; i <= entries && i < 4; i++)
        total += address_info[i].data_len;
    return total;
}
