#include <cstring>
#include "../common/common.hpp"
#include "constants.hpp"
#include "operation.hpp"
#include "registers.hpp"
#include "rng.hpp"

SE_RNG::SE_RNG(SE_Registers* regs, SE_Operation* op) : regs(regs), op(op)
{

}

void SE_RNG::init_rng(uint8_t destination, uint8_t mode)
{
    SE_CONFIG_REG config;
    config.enc_mode = SE_Mode::AES128;
    config.dec_mode = SE_Mode::AES128;
    config.enc_alg = SE_EncAlg::RNG;
    config.dec_alg = SE_DecAlg::NOP;
    config.destination = destination;
    regs->write_config(config);

    SE_CRYPTO_CONFIG_REG crypto;
    crypto.memif_mcclient = false;
    crypto.ctr_cntn = 0;
    crypto.keysch_bypass = false;
    crypto.core_sel_encrypt = true;
    crypto.iv_select_updated = false;
    crypto.vctram_sel = SE_VctramSel::MEMORY;
    crypto.input_sel = SE_InputSel::RANDOM;
    crypto.xor_pos = SE_XorPos::BYPASS;
    crypto.hash_enb = false;
    crypto.key_index = 0;
    regs->write_crypto_config(crypto);

    SE_RNG_CONFIG_REG rng;
    rng.source = SE_RngSource::ENTROPY;
    rng.mode = mode;
    regs->write_rng_config(rng);
}

SE_Result SE_RNG::prepare_pad(RNG_Pad& pad)
{
    memset(&pad.data, 0, sizeof(pad.data));
    SE_Result result = op->make_list(pad.data.data, AES_BLOCK_SIZE, pad.destination_ll);
    if (result != SE_Result::Success)
        return result;
    return op->check_lists(pad.source_ll, pad.destination_ll);
}

//One DRBG block through the scratch pad, len bytes of it copied out
SE_Result SE_RNG::generate_block(RNG_Pad& pad, uint8_t* output, size_t len)
{
    regs->write32(SE_CRYPTO_LAST_BLOCK, 0);

    op->publish(pad.data.data, AES_BLOCK_SIZE);
    SE_Result result = op->start_normal_operation(pad.source_ll, pad.destination_ll);
    if (result != SE_Result::Success)
        return result;
    op->acquire(pad.data.data, AES_BLOCK_SIZE);

    if (output)
        memcpy(output, pad.data.data, len);
    return SE_Result::Success;
}

SE_Result SE_RNG::initialize()
{
    RNG_Pad pad;
    SE_Result result = prepare_pad(pad);
    if (result != SE_Result::Success)
        return result;

    regs->write32(SE_RNG_SRC_CONFIG, SE_RNG_SRC_CONFIG_ENTROPY_SOURCE | SE_RNG_SRC_CONFIG_ENTROPY_LOCK);
    regs->write32(SE_RNG_RESEED_INTERVAL, op->get_config().reseed_interval);

    init_rng(SE_Destination::MEMORY, SE_RngMode::FORCE_INSTANTIATION);

    //Instantiation happens on the first block, which is thrown away
    return generate_block(pad, nullptr, 0);
}

SE_Result SE_RNG::generate_random(uint8_t* output, size_t len)
{
    if (!len)
        return SE_Result::Success;

    size_t nblocks = len / AES_BLOCK_SIZE;
    size_t tail = len - (nblocks * AES_BLOCK_SIZE);

    //Every block must be addressable before the engine is touched
    SE_LinkedList source_ll, destination_ll;
    for (size_t i = 0; i < nblocks; i++)
    {
        SE_Result result = op->make_list(output + (i * AES_BLOCK_SIZE), AES_BLOCK_SIZE, destination_ll);
        if (result != SE_Result::Success)
            return result;
    }
    if (nblocks)
    {
        SE_Result result = op->check_lists(source_ll, destination_ll);
        if (result != SE_Result::Success)
            return result;
    }

    RNG_Pad pad;
    if (tail)
    {
        SE_Result result = prepare_pad(pad);
        if (result != SE_Result::Success)
            return result;
    }

    init_rng(SE_Destination::MEMORY, SE_RngMode::NORMAL);

    for (size_t i = 0; i < nblocks; i++)
    {
        uint8_t* block = output + (i * AES_BLOCK_SIZE);
        regs->write32(SE_CRYPTO_LAST_BLOCK, 0);

        SE_Result result = op->make_list(block, AES_BLOCK_SIZE, destination_ll);
        if (result != SE_Result::Success)
            return result;

        op->publish(block, AES_BLOCK_SIZE);
        result = op->start_normal_operation(source_ll, destination_ll);
        if (result != SE_Result::Success)
            return result;
        op->acquire(block, AES_BLOCK_SIZE);
    }

    if (tail)
        return generate_block(pad, output + (nblocks * AES_BLOCK_SIZE), tail);
    return SE_Result::Success;
}

SE_Result SE_RNG::set_random_key(int slot)
{
    if (slot < 0 || slot >= AES_KEY_SLOT_COUNT)
        SEException::die("[SE RNG] Invalid key slot %d\n", slot);

    SE_LinkedList source_ll, destination_ll;
    SE_Result result = op->check_lists(source_ll, destination_ll);
    if (result != SE_Result::Success)
        return result;

    init_rng(SE_Destination::KEYTABLE, SE_RngMode::NORMAL);

    const uint8_t quads[] = {SE_WordQuad::KEYS_0_3, SE_WordQuad::KEYS_4_7};
    for (int i = 0; i < 2; i++)
    {
        SE_KEYTABLE_DST_REG dst;
        dst.word_quad = quads[i];
        dst.key_index = slot;
        regs->write_keytable_dst(dst);

        regs->write32(SE_CRYPTO_LAST_BLOCK, 0);

        result = op->start_normal_operation(source_ll, destination_ll);
        if (result != SE_Result::Success)
            return result;
    }
    return SE_Result::Success;
}

SE_Result SE_RNG::generate_srk()
{
    SE_LinkedList source_ll, destination_ll;
    SE_Result result = op->check_lists(source_ll, destination_ll);
    if (result != SE_Result::Success)
        return result;

    init_rng(SE_Destination::SRK, SE_RngMode::FORCE_RESEED);
    regs->write32(SE_CRYPTO_LAST_BLOCK, 0);

    return op->start_normal_operation(source_ll, destination_ll);
}
