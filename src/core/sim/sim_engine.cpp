#include <cstdio>
#include <cstring>
#include <openssl/rand.h>
#include "../common/common.hpp"
#include "dma_mapper.hpp"
#include "rsa_core.hpp"
#include "sim_engine.hpp"
#include "sim_platform.hpp"

#define SE_SECURITY_RESET (SE_SECURITY_HARD_SETTING | SE_SECURITY_PERKEY_SETTING | SE_SECURITY_SOFT_SETTING)
#define SE_ERR_STATUS_OP_FAULT (1 << 0)
#define SE_CTX_SAVE_SRC_SHIFT 29

static void xor_block(uint8_t* dest, const uint8_t* src)
{
    for (int i = 0; i < 16; i++)
        dest[i] ^= src[i];
}

static void counter_add(uint8_t* ctr, uint32_t value)
{
    uint32_t carry = value;
    for (int i = 15; i >= 0 && carry; i--)
    {
        carry += ctr[i];
        ctr[i] = carry & 0xFF;
        carry >>= 8;
    }
}

SimSecurityEngine::SimSecurityEngine(SimDMAMapper* dma, SimAhbArbiter* ahb, uint32_t base) :
    base(base), dma(dma), ahb(ahb), latency_polls(0), ahb_latency(0)
{
    uint8_t seed[8];
    if (RAND_bytes(seed, sizeof(seed)) != 1)
        SEException::die("[SIM] Unable to seed the entropy source\n");

    uint64_t value = 0;
    for (int i = 0; i < 8; i++)
        value = (value << 8) | seed[i];
    set_entropy_seed(value);
    reset();
}

void SimSecurityEngine::reset()
{
    memset(regs, 0, sizeof(regs));
    memset(keytable, 0, sizeof(keytable));
    memset(rsa_keytable, 0, sizeof(rsa_keytable));
    int_status = 0;
    err_status = 0;

    reg(SE_SECURITY) = SE_SECURITY_RESET;
    reg(SE_TZRAM_SECURITY) = SE_TZRAM_SECURITY_LOCKDOWN;
    reg(SE_CRYPTO_SECURITY_PERKEY) = 0xFFFF;
    reg(SE_RSA_SECURITY_PERKEY) = 0x3;
    for (int i = 0; i < SE_CRYPTO_KEYTABLE_ACCESS_COUNT; i++)
        reg(SE_CRYPTO_KEYTABLE_ACCESS + (i * 4)) = 0x7F;
    for (int i = 0; i < SE_RSA_KEYTABLE_ACCESS_COUNT; i++)
        reg(SE_RSA_KEYTABLE_ACCESS + (i * 4)) = 0x7;

    busy = false;
    stuck_state = false;
    remaining_polls = 0;
    pending_error = false;

    drbg_instantiated = false;
    memset(drbg_key, 0, sizeof(drbg_key));
    memset(drbg_v, 0, sizeof(drbg_v));
    drbg_blocks = 0;

    srk_valid = false;
    memset(srk, 0, sizeof(srk));

    sha.mode = SE_Mode::SHA256;
    sha.reset_hash();

    faults = SimFaults();
    log.clear();
}

void SimSecurityEngine::set_entropy_seed(uint64_t seed)
{
    memset(entropy_key, 0, sizeof(entropy_key));
    store_be64(entropy_key, seed);
    store_be64(entropy_key + 8, ~seed);
    entropy_aes.set_key(entropy_key, sizeof(entropy_key));
    entropy_counter = 0;
}

uint32_t SimSecurityEngine::peek_rsa_keytable(int slot, bool modulus, int word) const
{
    return rsa_keytable[slot][modulus][word];
}

void SimSecurityEngine::poll()
{
    if (!busy || faults.never_complete)
        return;

    if (remaining_polls > 0)
    {
        remaining_polls--;
        return;
    }
    finish_operation();
}

void SimSecurityEngine::finish_operation()
{
    busy = false;
    int_status |= SE_INT_IN_DONE | SE_INT_OUT_DONE | SE_INT_OP_DONE;

    if (pending_error || faults.raise_err_stat)
    {
        int_status |= SE_INT_ERR_STAT;
        err_status |= SE_ERR_STATUS_OP_FAULT;
    }
    err_status |= faults.err_status;

    if (faults.stuck_busy)
        stuck_state = true;

    if (ahb)
        ahb->post_writes(ahb_latency);
}

uint32_t SimSecurityEngine::read32(uint32_t addr)
{
    uint32_t offset = addr - base;
    if (addr < base || offset >= SE_REGISTER_SPACE || (offset & 0x3))
    {
        printf("[SIM] Unrecognized read32 $%08X\n", addr);
        return 0;
    }

    //printf("[SIM] Read32 $%03X\n", offset);
    switch (offset)
    {
        case SE_STATUS:
            poll();
            return (busy || stuck_state) ? SE_State::BUSY : SE_State::IDLE;
        case SE_INT_STATUS:
            poll();
            return int_status;
        case SE_ERR_STATUS:
            return err_status;
        case SE_CRYPTO_KEYTABLE_DATA:
        {
            uint32_t keyaddr = reg(SE_CRYPTO_KEYTABLE_ADDR);
            return keytable[(keyaddr >> 4) & 0xF][keyaddr & 0xF];
        }
        case SE_RSA_KEYTABLE_DATA:
        {
            SE_RSA_KEYTABLE_ADDR_REG rsa_addr = SE_RSA_KEYTABLE_ADDR_REG::unpack(reg(SE_RSA_KEYTABLE_ADDR));
            return rsa_keytable[rsa_addr.key_slot][rsa_addr.modulus][rsa_addr.word_addr];
        }
        default:
            return reg(offset);
    }
}

void SimSecurityEngine::write32(uint32_t addr, uint32_t value)
{
    uint32_t offset = addr - base;
    if (addr < base || offset >= SE_REGISTER_SPACE || (offset & 0x3))
    {
        printf("[SIM] Unrecognized write32 $%08X: $%08X\n", addr, value);
        return;
    }

    //printf("[SIM] Write32 $%03X: $%08X\n", offset, value);
    switch (offset)
    {
        case SE_INT_STATUS:
            int_status &= ~value;
            break;
        case SE_ERR_STATUS:
            err_status &= ~value;
            break;
        case SE_STATUS:
            break;
        case SE_OPERATION:
            reg(offset) = value;
            switch (value & SE_OPERATION_OPCODE_MASK)
            {
                case SE_Opcode::START:
                case SE_Opcode::CTX_SAVE:
                    start_operation(value & SE_OPERATION_OPCODE_MASK);
                    break;
                case SE_Opcode::ABORT:
                    busy = false;
                    break;
                default:
                    printf("[SIM] Unsupported opcode %d\n", value & SE_OPERATION_OPCODE_MASK);
                    break;
            }
            break;
        case SE_CRYPTO_KEYTABLE_DATA:
        {
            uint32_t keyaddr = reg(SE_CRYPTO_KEYTABLE_ADDR);
            keytable[(keyaddr >> 4) & 0xF][keyaddr & 0xF] = value;
            break;
        }
        case SE_RSA_KEYTABLE_DATA:
        {
            SE_RSA_KEYTABLE_ADDR_REG rsa_addr = SE_RSA_KEYTABLE_ADDR_REG::unpack(reg(SE_RSA_KEYTABLE_ADDR));
            rsa_keytable[rsa_addr.key_slot][rsa_addr.modulus][rsa_addr.word_addr] = value;
            break;
        }
        default:
            reg(offset) = value;
            break;
    }
}

bool SimSecurityEngine::read_list(uint32_t addr, SE_LinkedList& list)
{
    uint32_t entries;
    if (!dma->read(addr, &entries, sizeof(entries)))
        return false;

    if (entries > 3)
    {
        printf("[SIM] Linked list at $%08X has %d entries\n", addr, entries);
        return false;
    }

    list.entries = entries;
    return dma->read(addr + 4, list.address_info, (entries + 1) * sizeof(SE_AddressInfo));
}

bool SimSecurityEngine::gather(const SE_LinkedList& list, std::vector<uint8_t>& data)
{
    data.clear();
    for (uint32_t i = 0; i <= list.entries; i++)
    {
        const SE_AddressInfo& info = list.address_info[i];
        size_t offset = data.size();
        data.resize(offset + info.data_len);
        if (!dma->read(info.address, data.data() + offset, info.data_len))
            return false;
    }
    return true;
}

uint64_t SimSecurityEngine::capacity(const SE_LinkedList& list)
{
    return list.total_length();
}

bool SimSecurityEngine::scatter(const SE_LinkedList& list, const uint8_t* data, size_t len)
{
    if (capacity(list) < len)
    {
        printf("[SIM] Output of %zu bytes does not fit the destination list\n", len);
        return false;
    }

    for (uint32_t i = 0; i <= list.entries && len; i++)
    {
        const SE_AddressInfo& info = list.address_info[i];
        size_t chunk = info.data_len < len ? info.data_len : len;
        if (!dma->write(info.address, data, chunk))
            return false;
        data += chunk;
        len -= chunk;
    }
    return true;
}

void SimSecurityEngine::start_operation(uint32_t opcode)
{
    if (busy)
    {
        printf("[SIM] Opcode %d written while busy\n", opcode);
        return;
    }

    SimOperation entry;
    entry.opcode = opcode;
    entry.config = SE_CONFIG_REG::unpack(reg(SE_CONFIG));
    entry.crypto_config = SE_CRYPTO_CONFIG_REG::unpack(reg(SE_CRYPTO_CONFIG));
    entry.rng_config = SE_RNG_CONFIG_REG::unpack(reg(SE_RNG_CONFIG));
    entry.last_block = reg(SE_CRYPTO_LAST_BLOCK);
    entry.in_bytes = 0;
    entry.out_bytes = 0;

    SE_LinkedList in, out;
    bool ok = read_list(reg(SE_IN_LL_ADDR), in) && read_list(reg(SE_OUT_LL_ADDR), out);

    if (ok && (reg(SE_SECURITY) & SE_SECURITY_ENG_DIS))
    {
        printf("[SIM] Operation on a disabled engine\n");
        ok = false;
    }

    if (ok)
    {
        const SE_CONFIG_REG& config = entry.config;
        if (opcode == SE_Opcode::CTX_SAVE)
            ok = do_context_save(in, out, entry);
        else if (config.enc_alg == SE_EncAlg::AES_ENC || config.dec_alg == SE_DecAlg::AES_DEC)
            ok = do_aes(config, in, out, entry);
        else if (config.enc_alg == SE_EncAlg::RNG)
            ok = do_rng(config, out, entry);
        else if (config.enc_alg == SE_EncAlg::SHA)
            ok = do_sha(config, in, entry);
        else if (config.enc_alg == SE_EncAlg::RSA)
            ok = do_rsa(config, in, entry);
        else
        {
            printf("[SIM] Unrecognized SE_CONFIG $%08X\n", reg(SE_CONFIG));
            ok = false;
        }
    }

    entry.error = !ok;
    log.push_back(entry);

    busy = true;
    pending_error = !ok;
    remaining_polls = latency_polls;
}

void SimSecurityEngine::keytable_block(int slot, int first_word, uint8_t* out)
{
    for (int i = 0; i < 4; i++)
        store_le32(out + (i * 4), keytable[slot][first_word + i]);
}

void SimSecurityEngine::write_keytable_block(int slot, int first_word, const uint8_t* data)
{
    for (int i = 0; i < 4; i++)
        keytable[slot][first_word + i] = load_le32(data + (i * 4));
}

bool SimSecurityEngine::load_key(int slot, uint8_t mode)
{
    int key_len;
    switch (mode)
    {
        case SE_Mode::AES128:
            key_len = 16;
            break;
        case SE_Mode::AES192:
            key_len = 24;
            break;
        case SE_Mode::AES256:
            key_len = 32;
            break;
        default:
            printf("[SIM] Unrecognized AES mode %d\n", mode);
            return false;
    }

    uint8_t key[32];
    for (int i = 0; i < key_len / 4; i++)
        store_le32(key + (i * 4), keytable[slot][i]);
    aes.set_key(key, key_len);
    return true;
}

bool SimSecurityEngine::do_aes(const SE_CONFIG_REG& config, const SE_LinkedList& in, const SE_LinkedList& out,
                               SimOperation& entry)
{
    SE_CRYPTO_CONFIG_REG cc = SE_CRYPTO_CONFIG_REG::unpack(reg(SE_CRYPTO_CONFIG));
    uint8_t mode = (config.enc_alg == SE_EncAlg::AES_ENC) ? config.enc_mode : config.dec_mode;
    if (!load_key(cc.key_index, mode))
        return false;

    bool ctr_mode = cc.input_sel == SE_InputSel::LINEAR_CTR;
    if (cc.input_sel != SE_InputSel::MEMORY && !ctr_mode)
    {
        printf("[SIM] Unsupported AES input select %d\n", cc.input_sel);
        return false;
    }

    size_t nblocks = (size_t)reg(SE_CRYPTO_LAST_BLOCK) + 1;
    size_t len = nblocks * AES_BLOCK_SIZE;

    std::vector<uint8_t> input;
    if (!gather(in, input))
        return false;
    if (input.size() < len)
    {
        printf("[SIM] AES input of %zu bytes, %zu expected\n", input.size(), len);
        return false;
    }

    uint8_t iv[16], ctr[16];
    keytable_block(cc.key_index, cc.iv_select_updated ? SE_KEYTABLE_UPDATED_IV_WORD(0) :
                   SE_KEYTABLE_ORIGINAL_IV_WORD(0), iv);
    for (int i = 0; i < 4; i++)
        store_le32(ctr + (i * 4), reg(SE_CRYPTO_LINEAR_CTR + (i * 4)));

    std::vector<uint8_t> output(len);
    for (size_t b = 0; b < nblocks; b++)
    {
        const uint8_t* mem = &input[b * AES_BLOCK_SIZE];
        uint8_t block_in[16], core_out[16], result[16];

        memcpy(block_in, ctr_mode ? ctr : mem, 16);
        if (cc.xor_pos == SE_XorPos::TOP)
            xor_block(block_in, iv);

        if (cc.core_sel_encrypt)
            aes.encrypt_block(block_in, core_out);
        else
            aes.decrypt_block(block_in, core_out);

        memcpy(result, core_out, 16);
        if (cc.xor_pos == SE_XorPos::BOTTOM)
            xor_block(result, ctr_mode ? mem : iv);

        switch (cc.vctram_sel)
        {
            case SE_VctramSel::INIT_AESOUT:
                memcpy(iv, core_out, 16);
                break;
            case SE_VctramSel::INIT_PREV_MEMORY:
                memcpy(iv, mem, 16);
                break;
            default:
                break;
        }

        if (ctr_mode)
            counter_add(ctr, cc.ctr_cntn);

        memcpy(&output[b * AES_BLOCK_SIZE], result, 16);
    }

    write_keytable_block(cc.key_index, SE_KEYTABLE_UPDATED_IV_WORD(0), iv);
    if (ctr_mode)
    {
        for (int i = 0; i < 4; i++)
            reg(SE_CRYPTO_LINEAR_CTR + (i * 4)) = load_le32(ctr + (i * 4));
    }

    entry.in_bytes = len;
    const uint8_t* last = &output[len - AES_BLOCK_SIZE];
    switch (config.destination)
    {
        case SE_Destination::MEMORY:
            entry.out_bytes = len;
            return scatter(out, output.data(), len);
        case SE_Destination::HASHREG:
            for (int i = 0; i < 4; i++)
                reg(SE_HASH_RESULT + (i * 4)) = load_le32(last + (i * 4));
            return true;
        case SE_Destination::KEYTABLE:
        {
            SE_KEYTABLE_DST_REG dst = SE_KEYTABLE_DST_REG::unpack(reg(SE_CRYPTO_KEYTABLE_DST));
            write_keytable_block(dst.key_index, dst.word_quad * 4, output.data());
            return true;
        }
        default:
            printf("[SIM] Unsupported AES destination %d\n", config.destination);
            return false;
    }
}

void SimSecurityEngine::get_entropy(uint8_t* out)
{
    uint8_t counter[16];
    memset(counter, 0, sizeof(counter));
    store_be64(counter + 8, entropy_counter++);
    entropy_aes.encrypt_block(counter, out);
}

void SimSecurityEngine::drbg_update(bool reseed)
{
    uint8_t seed_key[16], seed_v[16];
    get_entropy(seed_key);
    get_entropy(seed_v);

    if (reseed && drbg_instantiated)
    {
        xor_block(drbg_key, seed_key);
        xor_block(drbg_v, seed_v);
    }
    else
    {
        memcpy(drbg_key, seed_key, 16);
        memcpy(drbg_v, seed_v, 16);
    }

    drbg_instantiated = true;
    drbg_blocks = 0;
}

bool SimSecurityEngine::drbg_generate(uint8_t* out)
{
    if (!drbg_instantiated)
    {
        printf("[SIM] RNG used before instantiation\n");
        return false;
    }

    uint32_t interval = reg(SE_RNG_RESEED_INTERVAL);
    if (interval && drbg_blocks >= interval)
    {
        drbg_update(true);
        int_status |= SE_INT_RESEED_CNTR_EXHAUSTED;
    }

    counter_add(drbg_v, 1);
    aes.set_key(drbg_key, 16);
    aes.encrypt_block(drbg_v, out);
    drbg_blocks++;
    return true;
}

bool SimSecurityEngine::do_rng(const SE_CONFIG_REG& config, const SE_LinkedList& out, SimOperation& entry)
{
    SE_RNG_CONFIG_REG rc = SE_RNG_CONFIG_REG::unpack(reg(SE_RNG_CONFIG));
    if (rc.source == SE_RngSource::NONE)
    {
        printf("[SIM] RNG without a source\n");
        return false;
    }

    switch (rc.mode)
    {
        case SE_RngMode::FORCE_INSTANTIATION:
            drbg_update(false);
            break;
        case SE_RngMode::FORCE_RESEED:
            drbg_update(true);
            break;
        default:
            break;
    }

    size_t nblocks = (size_t)reg(SE_CRYPTO_LAST_BLOCK) + 1;
    std::vector<uint8_t> output(nblocks * AES_BLOCK_SIZE);
    for (size_t b = 0; b < nblocks; b++)
    {
        if (!drbg_generate(&output[b * AES_BLOCK_SIZE]))
            return false;
    }

    switch (config.destination)
    {
        case SE_Destination::MEMORY:
            entry.out_bytes = output.size();
            return scatter(out, output.data(), output.size());
        case SE_Destination::KEYTABLE:
        {
            SE_KEYTABLE_DST_REG dst = SE_KEYTABLE_DST_REG::unpack(reg(SE_CRYPTO_KEYTABLE_DST));
            write_keytable_block(dst.key_index, dst.word_quad * 4, output.data());
            return true;
        }
        case SE_Destination::SRK:
            memcpy(srk, output.data(), sizeof(srk));
            srk_valid = true;
            return true;
        default:
            printf("[SIM] Unsupported RNG destination %d\n", config.destination);
            return false;
    }
}

bool SimSecurityEngine::do_sha(const SE_CONFIG_REG& config, const SE_LinkedList& in, SimOperation& entry)
{
    if (config.destination != SE_Destination::HASHREG)
    {
        printf("[SIM] Unsupported SHA destination %d\n", config.destination);
        return false;
    }

    sha.mode = config.enc_mode;
    if (!sha.valid_mode())
    {
        printf("[SIM] Unrecognized SHA mode %d\n", config.enc_mode);
        return false;
    }

    uint32_t bits = reg(SE_SHA_MSG_LENGTH);
    for (int i = 1; i < SE_SHA_MSG_LENGTH_COUNT; i++)
    {
        if (reg(SE_SHA_MSG_LENGTH + (i * 4)))
        {
            printf("[SIM] SHA messages over 4 GiB bits are not modelled\n");
            return false;
        }
    }

    if (bits & 0x7)
    {
        printf("[SIM] SHA message of %d bits is not byte aligned\n", bits);
        return false;
    }

    std::vector<uint8_t> input;
    if (!gather(in, input))
        return false;

    size_t bytes = bits / 8;
    if (input.size() < bytes)
    {
        printf("[SIM] SHA input of %zu bytes, %zu expected\n", input.size(), bytes);
        return false;
    }

    if (reg(SE_SHA_CONFIG) & SE_SHA_CONFIG_HW_INIT_HASH)
        sha.reset_hash();

    sha.update(input.data(), bytes);
    sha.finish();

    for (int i = 0; i < SE_HASH_RESULT_COUNT; i++)
        reg(SE_HASH_RESULT + (i * 4)) = (i < sha.digest_words()) ? sha.result_word(i) : 0;

    entry.in_bytes = bytes;
    return true;
}

bool SimSecurityEngine::do_rsa(const SE_CONFIG_REG& config, const SE_LinkedList& in, SimOperation& entry)
{
    if (config.destination != SE_Destination::RSAREG)
    {
        printf("[SIM] Unsupported RSA destination %d\n", config.destination);
        return false;
    }

    int slot = (reg(SE_RSA_CONFIG) >> SE_RSA_CONFIG_KEY_SLOT_SHIFT) & 0x1;
    int modulus_words = (reg(SE_RSA_KEY_SIZE) + 1) * 16;
    int exponent_words = reg(SE_RSA_EXP_SIZE);
    if (modulus_words > RSA_KEYTABLE_WORDS || !exponent_words || exponent_words > RSA_KEYTABLE_WORDS)
    {
        printf("[SIM] Bad RSA sizes, KEY_SIZE: %d EXP_SIZE: %d\n", reg(SE_RSA_KEY_SIZE), reg(SE_RSA_EXP_SIZE));
        return false;
    }

    std::vector<uint8_t> input;
    if (!gather(in, input))
        return false;

    uint32_t output[SE_RSA_OUTPUT_COUNT];
    if (!rsa_modexp(rsa_keytable[slot][1], modulus_words, rsa_keytable[slot][0], exponent_words,
                    input.data(), input.size(), output, SE_RSA_OUTPUT_COUNT))
    {
        printf("[SIM] RSA key slot %d has no modulus\n", slot);
        return false;
    }

    for (int i = 0; i < SE_RSA_OUTPUT_COUNT; i++)
        reg(SE_RSA_OUTPUT + (i * 4)) = output[i];

    entry.in_bytes = input.size();
    return true;
}

bool SimSecurityEngine::do_context_save(const SE_LinkedList& in, const SE_LinkedList& out, SimOperation& entry)
{
    if ((reg(SE_CTX_SAVE_CONFIG) >> SE_CTX_SAVE_SRC_SHIFT) != SE_CTX_SAVE_SRC_MEMORY)
    {
        printf("[SIM] Only memory context save is modelled\n");
        return false;
    }

    if (!srk_valid)
    {
        printf("[SIM] Context save without an SRK\n");
        return false;
    }

    std::vector<uint8_t> input;
    if (!gather(in, input))
        return false;
    if (input.size() % AES_BLOCK_SIZE)
    {
        printf("[SIM] Context save source of %zu bytes\n", input.size());
        return false;
    }

    aes.set_key(srk, sizeof(srk));
    std::vector<uint8_t> output(input.size());
    for (size_t i = 0; i < input.size(); i += AES_BLOCK_SIZE)
        aes.encrypt_block(&input[i], &output[i]);

    size_t len = output.size();
    if (len > capacity(out))
        len = capacity(out);

    entry.in_bytes = input.size();
    entry.out_bytes = len;
    return scatter(out, output.data(), len);
}
