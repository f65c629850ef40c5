#include <cstdio>
#include <cstring>
#include "../common/common.hpp"
#include "aes.hpp"
#include "constants.hpp"
#include "operation.hpp"

//Left shift of a 128-bit big-endian value, folding Rb back in (RFC 4493 subkey doubling)
static void cmac_double(uint8_t* block)
{
    uint8_t carry = 0;
    for (int i = AES_BLOCK_SIZE - 1; i >= 0; i--)
    {
        uint8_t msb = block[i] >> 7;
        block[i] = (block[i] << 1) | carry;
        carry = msb;
    }

    if (carry)
        block[AES_BLOCK_SIZE - 1] ^= 0x87;
}

static void counter_add(uint8_t* ctr, uint64_t value)
{
    for (int i = AES_BLOCK_SIZE - 1; i >= 0 && value; i--)
    {
        value += ctr[i];
        ctr[i] = value & 0xFF;
        value >>= 8;
    }
}

SE_AES::SE_AES(SE_Registers* regs, SE_Operation* op) : regs(regs), op(op)
{

}

uint8_t SE_AES::mode_value(AES_Mode mode)
{
    switch (mode)
    {
        case AES_Mode::AES128:
            return SE_Mode::AES128;
        case AES_Mode::AES192:
            return SE_Mode::AES192;
        case AES_Mode::AES256:
            return SE_Mode::AES256;
    }
    SEException::die("[SE AES] Unrecognized key mode %d\n", (int)mode);
    return 0;
}

int SE_AES::key_size(AES_Mode mode)
{
    switch (mode)
    {
        case AES_Mode::AES128:
            return 16;
        case AES_Mode::AES192:
            return 24;
        case AES_Mode::AES256:
            return 32;
    }
    SEException::die("[SE AES] Unrecognized key mode %d\n", (int)mode);
    return 0;
}

SE_CRYPTO_CONFIG_REG SE_AES::crypto_config(AES_Chain chain, int slot, bool encrypt)
{
    SE_CRYPTO_CONFIG_REG config;
    config.memif_mcclient = false;
    config.keysch_bypass = false;
    config.iv_select_updated = false;
    config.key_index = slot;
    config.core_sel_encrypt = encrypt;
    config.ctr_cntn = 0;
    config.hash_enb = false;

    switch (chain)
    {
        case AES_Chain::ECB:
            config.vctram_sel = SE_VctramSel::MEMORY;
            config.input_sel = SE_InputSel::MEMORY;
            config.xor_pos = SE_XorPos::BYPASS;
            break;
        case AES_Chain::CBC_ENCRYPT:
            config.vctram_sel = SE_VctramSel::INIT_AESOUT;
            config.input_sel = SE_InputSel::MEMORY;
            config.xor_pos = SE_XorPos::TOP;
            break;
        case AES_Chain::CBC_DECRYPT:
            config.vctram_sel = SE_VctramSel::INIT_PREV_MEMORY;
            config.input_sel = SE_InputSel::MEMORY;
            config.xor_pos = SE_XorPos::BOTTOM;
            break;
        case AES_Chain::CTR:
            config.ctr_cntn = 1;
            config.vctram_sel = SE_VctramSel::MEMORY;
            config.input_sel = SE_InputSel::LINEAR_CTR;
            config.xor_pos = SE_XorPos::BOTTOM;
            break;
        case AES_Chain::CMAC:
            config.vctram_sel = SE_VctramSel::INIT_AESOUT;
            config.input_sel = SE_InputSel::MEMORY;
            config.xor_pos = SE_XorPos::TOP;
            config.hash_enb = true;
            break;
    }
    return config;
}

void SE_AES::check_slot(int slot)
{
    if (slot < 0 || slot >= AES_KEY_SLOT_COUNT)
        SEException::die("[SE AES] Invalid key slot %d\n", slot);
}

void SE_AES::init_aes(bool encrypt, uint8_t destination, AES_Mode mode)
{
    SE_CONFIG_REG config;
    config.enc_mode = mode_value(mode);
    config.dec_mode = mode_value(mode);
    config.enc_alg = encrypt ? SE_EncAlg::AES_ENC : SE_EncAlg::NOP;
    config.dec_alg = encrypt ? SE_DecAlg::NOP : SE_DecAlg::AES_DEC;
    config.destination = destination;
    regs->write_config(config);
}

void SE_AES::configure(AES_Chain chain, int slot, bool encrypt)
{
    regs->write_crypto_config(crypto_config(chain, slot, encrypt));
}

void SE_AES::set_iv(int slot, const uint8_t* iv)
{
    for (int i = 0; i < AES_BLOCK_SIZE / 4; i++)
        regs->write_keytable_word(slot, SE_KEYTABLE_ORIGINAL_IV_WORD(i), load_le32(iv + (i * 4)));
}

void SE_AES::set_counter(const uint8_t* ctr)
{
    for (int i = 0; i < SE_CRYPTO_LINEAR_CTR_COUNT; i++)
        regs->write_linear_ctr(i, load_le32(ctr + (i * 4)));
}

void SE_AES::fill_keyslot(int slot, const uint8_t* key, size_t len)
{
    check_slot(slot);
    if (len != 16 && len != 24 && len != 32)
        SEException::die("[SE AES] Invalid key length %zu\n", len);

    for (size_t i = 0; i < len / 4; i++)
        regs->write_keytable_word(slot, SE_KEYTABLE_KEY_WORD(i), load_le32(key + (i * 4)));
}

void SE_AES::get_key(int slot, uint8_t* key, size_t len)
{
    check_slot(slot);
    if ((len & 0x3) || len > AES_MAX_KEY_SIZE)
        SEException::die("[SE AES] Invalid key length %zu\n", len);

    for (size_t i = 0; i < len / 4; i++)
        store_le32(key + (i * 4), regs->read_keytable_word(slot, SE_KEYTABLE_KEY_WORD(i)));
}

void SE_AES::clear_keyslot(int slot)
{
    check_slot(slot);
    for (int i = 0; i < AES_KEYTABLE_WORDS; i++)
        regs->write_keytable_word(slot, i, 0);
}

void SE_AES::clear_key_iv(int slot)
{
    check_slot(slot);
    for (int i = 0; i < AES_BLOCK_SIZE / 4; i++)
    {
        regs->write_keytable_word(slot, SE_KEYTABLE_ORIGINAL_IV_WORD(i), 0);
        regs->write_keytable_word(slot, SE_KEYTABLE_UPDATED_IV_WORD(i), 0);
    }
}

SE_Result SE_AES::make_lists(const uint8_t* source, uint8_t* destination, size_t len,
                             SE_LinkedList& source_ll, SE_LinkedList& destination_ll)
{
    SE_Result result = op->make_list(source, len, source_ll);
    if (result != SE_Result::Success)
        return result;
    result = op->make_list(destination, len, destination_ll);
    if (result != SE_Result::Success)
        return result;
    return op->check_lists(source_ll, destination_ll);
}

SE_Result SE_AES::crypt_memory(SE_LinkedList& source_ll, SE_LinkedList& destination_ll,
                               const uint8_t* source, uint8_t* destination, size_t len)
{
    op->publish(source, len);
    op->publish(destination, len);

    SE_Result result = op->start_normal_operation(source_ll, destination_ll);
    if (result == SE_Result::Success)
        op->acquire(destination, len);
    return result;
}

SE_Result SE_AES::prepare_padded_block(AES_PaddedBlock& block)
{
    memset(&block.in, 0, sizeof(block.in));
    memset(&block.out, 0, sizeof(block.out));
    return make_lists(block.in.data, block.out.data, AES_BLOCK_SIZE, block.in_ll, block.out_ll);
}

//Runs a single block through the scratch pads, copying back len bytes
SE_Result SE_AES::crypt_padded_block(AES_PaddedBlock& block, const uint8_t* source, uint8_t* destination,
                                     size_t len)
{
    memcpy(block.in.data, source, len);

    regs->write32(SE_CRYPTO_LAST_BLOCK, 0);
    SE_Result result = crypt_memory(block.in_ll, block.out_ll, block.in.data, block.out.data, AES_BLOCK_SIZE);
    if (result != SE_Result::Success)
        return result;

    memcpy(destination, block.out.data, len);
    return SE_Result::Success;
}

SE_Result SE_AES::ecb_block(bool encrypt, int slot, AES_PaddedBlock& block, const uint8_t* source,
                            uint8_t* destination, AES_Mode mode)
{
    init_aes(encrypt, SE_Destination::MEMORY, mode);
    configure(AES_Chain::ECB, slot, encrypt);
    return crypt_padded_block(block, source, destination, AES_BLOCK_SIZE);
}

SE_Result SE_AES::ecb_operation(bool encrypt, int slot, const uint8_t* source, uint8_t* destination, AES_Mode mode)
{
    check_slot(slot);

    AES_PaddedBlock block;
    SE_Result result = prepare_padded_block(block);
    if (result != SE_Result::Success)
        return result;

    return ecb_block(encrypt, slot, block, source, destination, mode);
}

SE_Result SE_AES::ecb_encrypt(int slot, const uint8_t* source, uint8_t* destination, AES_Mode mode)
{
    return ecb_operation(true, slot, source, destination, mode);
}

SE_Result SE_AES::ecb_decrypt(int slot, const uint8_t* source, uint8_t* destination, AES_Mode mode)
{
    return ecb_operation(false, slot, source, destination, mode);
}

SE_Result SE_AES::cbc_operation(bool encrypt, int slot, const uint8_t* source, uint8_t* destination, size_t len,
                                const uint8_t* iv, AES_Mode mode)
{
    check_slot(slot);
    if (len % AES_BLOCK_SIZE)
    {
        printf("[SE AES] CBC length %zu is not a multiple of the block size\n", len);
        return SE_Result::MalformedBuffer;
    }

    if (!len)
        return SE_Result::Success;

    SE_LinkedList source_ll, destination_ll;
    SE_Result result = make_lists(source, destination, len, source_ll, destination_ll);
    if (result != SE_Result::Success)
        return result;

    init_aes(encrypt, SE_Destination::MEMORY, mode);
    configure(encrypt ? AES_Chain::CBC_ENCRYPT : AES_Chain::CBC_DECRYPT, slot, encrypt);
    set_iv(slot, iv);

    regs->write32(SE_CRYPTO_LAST_BLOCK, (uint32_t)(len / AES_BLOCK_SIZE) - 1);
    return crypt_memory(source_ll, destination_ll, source, destination, len);
}

SE_Result SE_AES::cbc_encrypt(int slot, const uint8_t* source, uint8_t* destination, size_t len,
                              const uint8_t* iv, AES_Mode mode)
{
    return cbc_operation(true, slot, source, destination, len, iv, mode);
}

SE_Result SE_AES::cbc_decrypt(int slot, const uint8_t* source, uint8_t* destination, size_t len,
                              const uint8_t* iv, AES_Mode mode)
{
    return cbc_operation(false, slot, source, destination, len, iv, mode);
}

SE_Result SE_AES::ctr_crypt(int slot, const uint8_t* source, uint8_t* destination, size_t len,
                            const uint8_t* ctr, AES_Mode mode)
{
    check_slot(slot);
    if (!len)
        return SE_Result::Success;

    size_t nblocks = len / AES_BLOCK_SIZE;
    size_t aligned_size = nblocks * AES_BLOCK_SIZE;
    size_t tail = len - aligned_size;

    SE_LinkedList source_ll, destination_ll;
    AES_PaddedBlock tail_block;
    SE_Result result;
    if (aligned_size)
    {
        result = make_lists(source, destination, aligned_size, source_ll, destination_ll);
        if (result != SE_Result::Success)
            return result;
    }
    if (tail)
    {
        result = prepare_padded_block(tail_block);
        if (result != SE_Result::Success)
            return result;
    }

    init_aes(true, SE_Destination::MEMORY, mode);
    configure(AES_Chain::CTR, slot, true);
    set_counter(ctr);

    if (aligned_size)
    {
        regs->write32(SE_CRYPTO_LAST_BLOCK, (uint32_t)nblocks - 1);
        result = crypt_memory(source_ll, destination_ll, source, destination, aligned_size);
        if (result != SE_Result::Success)
            return result;
    }

    if (tail)
    {
        //Reload the counter for the partial block instead of relying on the engine's copy
        uint8_t next_ctr[AES_BLOCK_SIZE];
        memcpy(next_ctr, ctr, AES_BLOCK_SIZE);
        counter_add(next_ctr, nblocks);
        set_counter(next_ctr);

        return crypt_padded_block(tail_block, source + aligned_size, destination + aligned_size, tail);
    }
    return SE_Result::Success;
}

SE_Result SE_AES::cmac(int slot, const uint8_t* source, size_t len, uint8_t* mac, AES_Mode mode)
{
    check_slot(slot);

    size_t nblocks = len ? (len + AES_BLOCK_SIZE - 1) / AES_BLOCK_SIZE : 1;
    size_t prefix_size = (nblocks - 1) * AES_BLOCK_SIZE;
    size_t last_size = len - prefix_size;

    //Every list is built before the first register write
    SE_LinkedList prefix_ll, last_ll, hash_ll;
    SE_CachePad last_block;
    AES_PaddedBlock subkey_block;
    SE_Result result;
    if (prefix_size)
    {
        result = op->make_list(source, prefix_size, prefix_ll);
        if (result != SE_Result::Success)
            return result;
        result = op->check_lists(prefix_ll, hash_ll);
        if (result != SE_Result::Success)
            return result;
    }
    result = op->make_list(last_block.data, AES_BLOCK_SIZE, last_ll);
    if (result != SE_Result::Success)
        return result;
    result = op->check_lists(last_ll, hash_ll);
    if (result != SE_Result::Success)
        return result;
    result = prepare_padded_block(subkey_block);
    if (result != SE_Result::Success)
        return result;

    //L = AES-K(0), K1 = dbl(L), K2 = dbl(K1)
    uint8_t subkey[AES_BLOCK_SIZE];
    uint8_t zero[AES_BLOCK_SIZE];
    memset(zero, 0, sizeof(zero));
    result = ecb_block(true, slot, subkey_block, zero, subkey, mode);
    if (result != SE_Result::Success)
        return result;

    cmac_double(subkey);
    if (last_size != AES_BLOCK_SIZE)
        cmac_double(subkey);

    init_aes(true, SE_Destination::HASHREG, mode);
    configure(AES_Chain::CMAC, slot, true);
    set_iv(slot, zero);

    if (prefix_size)
    {
        regs->write32(SE_CRYPTO_LAST_BLOCK, (uint32_t)(nblocks - 1) - 1);

        op->publish(source, prefix_size);
        result = op->start_normal_operation(prefix_ll, hash_ll);
        if (result != SE_Result::Success)
            return result;

        //Chain the last block off the engine's running MAC
        SE_CRYPTO_CONFIG_REG config = regs->read_crypto_config();
        config.iv_select_updated = true;
        regs->write_crypto_config(config);
    }

    memset(&last_block, 0, sizeof(last_block));
    if (last_size)
        memcpy(last_block.data, source + prefix_size, last_size);
    if (last_size < AES_BLOCK_SIZE)
        last_block.data[last_size] = 0x80;

    for (int i = 0; i < AES_BLOCK_SIZE; i++)
        last_block.data[i] ^= subkey[i];

    regs->write32(SE_CRYPTO_LAST_BLOCK, 0);

    op->publish(last_block.data, AES_BLOCK_SIZE);
    result = op->start_normal_operation(last_ll, hash_ll);
    if (result != SE_Result::Success)
        return result;

    for (int i = 0; i < AES_BLOCK_SIZE / 4; i++)
        store_le32(mac + (i * 4), regs->read_hash_result(i));
    return SE_Result::Success;
}
