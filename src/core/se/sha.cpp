#include <cstdio>
#include "../common/common.hpp"
#include "operation.hpp"
#include "registers.hpp"
#include "sha.hpp"

SE_SHA::SE_SHA(SE_Registers* regs, SE_Operation* op) : regs(regs), op(op)
{

}

int SE_SHA::digest_size(SHA_Mode mode)
{
    switch (mode)
    {
        case SHA_Mode::SHA1:
            return 20;
        case SHA_Mode::SHA224:
            return 28;
        case SHA_Mode::SHA256:
            return 32;
        case SHA_Mode::SHA384:
            return 48;
        case SHA_Mode::SHA512:
            return 64;
    }
    SEException::die("[SHA] Unrecognized hash mode %d\n", (int)mode);
    return 0;
}

uint8_t SE_SHA::mode_value(SHA_Mode mode)
{
    switch (mode)
    {
        case SHA_Mode::SHA1:
            return SE_Mode::SHA1;
        case SHA_Mode::SHA224:
            return SE_Mode::SHA224;
        case SHA_Mode::SHA256:
            return SE_Mode::SHA256;
        case SHA_Mode::SHA384:
            return SE_Mode::SHA384;
        case SHA_Mode::SHA512:
            return SE_Mode::SHA512;
    }
    SEException::die("[SHA] Unrecognized hash mode %d\n", (int)mode);
    return 0;
}

SE_Result SE_SHA::calculate(SHA_Mode mode, const uint8_t* source, size_t len, uint8_t* output, bool byteswap)
{
    int size = digest_size(mode);

    uint64_t bit_length = (uint64_t)len * 8;
    if (bit_length > 0xFFFFFFFFULL)
    {
        printf("[SHA] Message of %zu bytes is too long\n", len);
        return SE_Result::MalformedBuffer;
    }

    SE_LinkedList source_ll, destination_ll;
    SE_Result result = op->make_list(source, len, source_ll);
    if (result != SE_Result::Success)
        return result;
    result = op->check_lists(source_ll, destination_ll);
    if (result != SE_Result::Success)
        return result;

    SE_CONFIG_REG config;
    config.enc_mode = mode_value(mode);
    config.dec_mode = 0;
    config.enc_alg = SE_EncAlg::SHA;
    config.dec_alg = SE_DecAlg::NOP;
    config.destination = SE_Destination::HASHREG;
    regs->write_config(config);

    regs->write32(SE_SHA_CONFIG, SE_SHA_CONFIG_HW_INIT_HASH);

    //Only the low word of the 128-bit length counters is used
    for (int i = 0; i < SE_SHA_MSG_LENGTH_COUNT; i++)
    {
        uint32_t value = (i == 0) ? (uint32_t)bit_length : 0;
        regs->write_sha_msg_length(i, value);
        regs->write_sha_msg_left(i, value);
    }

    op->publish(source, len);
    result = op->start_normal_operation(source_ll, destination_ll);
    if (result != SE_Result::Success)
        return result;

    for (int i = 0; i < size / 4; i++)
    {
        uint32_t word = regs->read_hash_result(i);
        if (byteswap)
            store_be32(output + (i * 4), word);
        else
            store_le32(output + (i * 4), word);
    }
    return SE_Result::Success;
}

SE_Result SE_SHA::calculate_sha1(const uint8_t* source, size_t len, uint8_t* output)
{
    return calculate(SHA_Mode::SHA1, source, len, output);
}

SE_Result SE_SHA::calculate_sha224(const uint8_t* source, size_t len, uint8_t* output)
{
    return calculate(SHA_Mode::SHA224, source, len, output);
}

SE_Result SE_SHA::calculate_sha256(const uint8_t* source, size_t len, uint8_t* output)
{
    return calculate(SHA_Mode::SHA256, source, len, output);
}

SE_Result SE_SHA::calculate_sha384(const uint8_t* source, size_t len, uint8_t* output)
{
    return calculate(SHA_Mode::SHA384, source, len, output);
}

SE_Result SE_SHA::calculate_sha512(const uint8_t* source, size_t len, uint8_t* output)
{
    return calculate(SHA_Mode::SHA512, source, len, output);
}
