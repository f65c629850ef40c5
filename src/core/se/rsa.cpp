#include <cstdio>
#include "../common/common.hpp"
#include "constants.hpp"
#include "operation.hpp"
#include "registers.hpp"
#include "rsa.hpp"

void RSA_KeyInfo::update(size_t modulus_bytes, size_t exponent_bytes)
{
    if (modulus_bytes < 64 || (modulus_bytes % 64) || modulus_bytes > RSA_MAX_SIZE)
        SEException::die("[SE RSA] Invalid modulus length %zu\n", modulus_bytes);
    if ((exponent_bytes & 0x3) || exponent_bytes > RSA_MAX_SIZE)
        SEException::die("[SE RSA] Invalid exponent length %zu\n", exponent_bytes);

    modulus_size = (uint32_t)(modulus_bytes / 64) - 1;
    exponent_size = (uint32_t)(exponent_bytes / 4);
}

void RSA_KeyInfo::reset()
{
    modulus_size = 0;
    exponent_size = 0;
}

SE_RSA::SE_RSA(SE_Registers* regs, SE_Operation* op) : regs(regs), op(op)
{

}

void SE_RSA::check_slot(int slot)
{
    if (slot < 0 || slot >= RSA_KEY_SLOT_COUNT)
        SEException::die("[SE RSA] Invalid key slot %d\n", slot);
}

void SE_RSA::select_word(int slot, bool modulus, int word)
{
    SE_RSA_KEYTABLE_ADDR_REG addr;
    addr.input_from_memory = false;
    addr.key_slot = slot;
    addr.modulus = modulus;
    addr.word_addr = word;
    regs->write_rsa_keytable_addr(addr);
}

//Word 0 of the key table is the least significant word
void SE_RSA::fill_keyslot_part(int slot, bool modulus, const uint8_t* key, size_t len)
{
    if ((len & 0x3) || len > RSA_MAX_SIZE)
        SEException::die("[SE RSA] Invalid %s length %zu\n", modulus ? "modulus" : "exponent", len);

    int nwords = len / 4;
    for (int i = 0; i < nwords; i++)
    {
        select_word(slot, modulus, i);
        regs->write32(SE_RSA_KEYTABLE_DATA, load_be32(key + ((nwords - 1 - i) * 4)));
    }
}

void SE_RSA::clear_keyslot_part(int slot, bool modulus)
{
    for (int i = 0; i < RSA_KEYTABLE_WORDS; i++)
    {
        select_word(slot, modulus, i);
        regs->write32(SE_RSA_KEYTABLE_DATA, 0);
    }
}

void SE_RSA::fill_keyslot(int slot, const uint8_t* modulus, size_t modulus_len,
                          const uint8_t* exponent, size_t exponent_len)
{
    check_slot(slot);
    fill_keyslot_part(slot, true, modulus, modulus_len);
    fill_keyslot_part(slot, false, exponent, exponent_len);
}

void SE_RSA::clear_keyslot(int slot)
{
    check_slot(slot);
    clear_keyslot_part(slot, true);
    clear_keyslot_part(slot, false);
}

SE_Result SE_RSA::encrypt(const RSA_KeyInfo& key_info, int slot, const uint8_t* source, size_t source_len,
                          uint8_t* destination, size_t destination_len)
{
    check_slot(slot);
    if ((destination_len & 0x3) || destination_len > RSA_MAX_SIZE || source_len > RSA_MAX_SIZE)
    {
        printf("[SE RSA] Bad buffer sizes, source: %zu destination: %zu\n", source_len, destination_len);
        return SE_Result::MalformedBuffer;
    }

    SE_LinkedList source_ll, destination_ll;
    SE_Result result = op->make_list(source, source_len, source_ll);
    if (result != SE_Result::Success)
        return result;
    result = op->check_lists(source_ll, destination_ll);
    if (result != SE_Result::Success)
        return result;

    regs->write32(SE_RSA_KEY_SIZE, key_info.modulus_size);
    regs->write32(SE_RSA_EXP_SIZE, key_info.exponent_size);

    SE_CONFIG_REG config;
    config.enc_mode = SE_Mode::AES128;
    config.dec_mode = SE_Mode::AES128;
    config.enc_alg = SE_EncAlg::RSA;
    config.dec_alg = SE_DecAlg::NOP;
    config.destination = SE_Destination::RSAREG;
    regs->write_config(config);

    regs->write32(SE_RSA_CONFIG, (uint32_t)slot << SE_RSA_CONFIG_KEY_SLOT_SHIFT);

    op->publish(source, source_len);
    result = op->start_normal_operation(source_ll, destination_ll);
    if (result != SE_Result::Success)
        return result;

    int nwords = destination_len / 4;
    for (int i = 0; i < nwords; i++)
        store_be32(destination + ((nwords - 1 - i) * 4), regs->read_rsa_output(i));
    return SE_Result::Success;
}
