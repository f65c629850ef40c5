#include <cstdio>
#include <cstring>
#include "../platform/cache.hpp"
#include "constants.hpp"
#include "security_engine.hpp"

SecurityEngine::SecurityEngine(MMIO_Bus* se_bus, uint32_t base, MMIO_Bus* ahb_bus, Clock* clock,
                               CacheMaintenance* cache, AddressTranslator* translator, const SE_Config& config) :
    regs(se_bus, base),
    ahb(ahb_bus),
    op(&regs, &ahb, clock, cache, translator, config),
    aes(&regs, &op),
    sha(&regs, &op),
    rng(&regs, &op),
    rsa(&regs, &op)
{

}

//Every security write is confirmed by reading the register back
void SecurityEngine::set_security(uint32_t mask, uint32_t value)
{
    regs.modify32(SE_SECURITY, mask, value);
    regs.read32(SE_SECURITY);
}

void SecurityEngine::lock()
{
    set_security(SE_SECURITY_SOFT_SETTING, 0);
}

void SecurityEngine::unlock()
{
    set_security(SE_SECURITY_SOFT_SETTING, SE_SECURITY_SOFT_SETTING);
}

void SecurityEngine::lock_per_key()
{
    regs.write32(SE_CRYPTO_SECURITY_PERKEY, 0);
    regs.read32(SE_CRYPTO_SECURITY_PERKEY);

    regs.write32(SE_RSA_SECURITY_PERKEY, 0);
    regs.read32(SE_RSA_SECURITY_PERKEY);

    set_security(SE_SECURITY_PERKEY_SETTING, 0);
}

void SecurityEngine::lock_tzram()
{
    regs.modify32(SE_TZRAM_SECURITY, SE_TZRAM_SECURITY_LOCKDOWN, 0);
    regs.read32(SE_TZRAM_SECURITY);
}

void SecurityEngine::lock_context_save()
{
    set_security(SE_SECURITY_TZ_CONTEXT_SAVE_LOCK, 0);
}

void SecurityEngine::disable()
{
    for (int i = 0; i < AES_KEY_SLOT_COUNT; i++)
        regs.write_crypto_keytable_access(i, 0);

    for (int i = 0; i < RSA_KEY_SLOT_COUNT; i++)
        regs.write_rsa_keytable_access(i, 0);

    lock_per_key();

    uint32_t mask = SE_SECURITY_HARD_SETTING | SE_SECURITY_ENG_DIS | SE_SECURITY_PERKEY_SETTING |
                    SE_SECURITY_SOFT_SETTING;
    set_security(mask, SE_SECURITY_ENG_DIS);
}

void SecurityEngine::fill_aes_keyslot(int slot, const uint8_t* key, size_t len)
{
    aes.fill_keyslot(slot, key, len);
}

void SecurityEngine::get_aes_key(int slot, uint8_t* key, size_t len)
{
    aes.get_key(slot, key, len);
}

void SecurityEngine::clear_aes_keyslot(int slot)
{
    aes.clear_keyslot(slot);
}

void SecurityEngine::clear_aes_key_iv(int slot)
{
    aes.clear_key_iv(slot);
}

SE_Result SecurityEngine::aes_ecb_encrypt(int slot, const uint8_t* source, uint8_t* destination, AES_Mode mode)
{
    return aes.ecb_encrypt(slot, source, destination, mode);
}

SE_Result SecurityEngine::aes_ecb_decrypt(int slot, const uint8_t* source, uint8_t* destination, AES_Mode mode)
{
    return aes.ecb_decrypt(slot, source, destination, mode);
}

SE_Result SecurityEngine::aes_cbc_encrypt(int slot, const uint8_t* source, uint8_t* destination, size_t len,
                                          const uint8_t* iv, AES_Mode mode)
{
    return aes.cbc_encrypt(slot, source, destination, len, iv, mode);
}

SE_Result SecurityEngine::aes_cbc_decrypt(int slot, const uint8_t* source, uint8_t* destination, size_t len,
                                          const uint8_t* iv, AES_Mode mode)
{
    return aes.cbc_decrypt(slot, source, destination, len, iv, mode);
}

SE_Result SecurityEngine::aes_ctr_crypt(int slot, const uint8_t* source, uint8_t* destination, size_t len,
                                        const uint8_t* ctr, AES_Mode mode)
{
    return aes.ctr_crypt(slot, source, destination, len, ctr, mode);
}

SE_Result SecurityEngine::aes_cmac(int slot, const uint8_t* source, size_t len, uint8_t* mac, AES_Mode mode)
{
    return aes.cmac(slot, source, len, mac, mode);
}

SE_Result SecurityEngine::calculate_sha(SHA_Mode mode, const uint8_t* source, size_t len, uint8_t* output,
                                        bool byteswap)
{
    return sha.calculate(mode, source, len, output, byteswap);
}

SE_Result SecurityEngine::calculate_sha1(const uint8_t* source, size_t len, uint8_t* output)
{
    return sha.calculate_sha1(source, len, output);
}

SE_Result SecurityEngine::calculate_sha224(const uint8_t* source, size_t len, uint8_t* output)
{
    return sha.calculate_sha224(source, len, output);
}

SE_Result SecurityEngine::calculate_sha256(const uint8_t* source, size_t len, uint8_t* output)
{
    return sha.calculate_sha256(source, len, output);
}

SE_Result SecurityEngine::calculate_sha384(const uint8_t* source, size_t len, uint8_t* output)
{
    return sha.calculate_sha384(source, len, output);
}

SE_Result SecurityEngine::calculate_sha512(const uint8_t* source, size_t len, uint8_t* output)
{
    return sha.calculate_sha512(source, len, output);
}

SE_Result SecurityEngine::initialize_rng()
{
    return rng.initialize();
}

SE_Result SecurityEngine::generate_random(uint8_t* output, size_t len)
{
    return rng.generate_random(output, len);
}

SE_Result SecurityEngine::set_random_key(int slot)
{
    return rng.set_random_key(slot);
}

SE_Result SecurityEngine::generate_srk()
{
    return rng.generate_srk();
}

void SecurityEngine::fill_rsa_keyslot(int slot, const uint8_t* modulus, size_t modulus_len,
                                      const uint8_t* exponent, size_t exponent_len)
{
    rsa.fill_keyslot(slot, modulus, modulus_len, exponent, exponent_len);
}

void SecurityEngine::clear_rsa_keyslot(int slot)
{
    rsa.clear_keyslot(slot);
}

SE_Result SecurityEngine::rsa_encrypt(const RSA_KeyInfo& key_info, int slot, const uint8_t* source,
                                      size_t source_len, uint8_t* destination, size_t destination_len)
{
    return rsa.encrypt(key_info, slot, source, source_len, destination, destination_len);
}

SE_Result SecurityEngine::context_save(const uint8_t* source, size_t source_len, uint8_t* destination,
                                       size_t destination_len)
{
    if (destination_len > AES_BLOCK_SIZE)
    {
        printf("[SE] Context save destination of %zu bytes exceeds one block\n", destination_len);
        return SE_Result::MalformedBuffer;
    }

    SE_CachePad pad;
    memset(&pad, 0, sizeof(pad));

    SE_LinkedList source_ll, destination_ll;
    SE_Result result = op.make_list(source, source_len, source_ll);
    if (result != SE_Result::Success)
        return result;
    result = op.make_list(pad.data, AES_BLOCK_SIZE, destination_ll);
    if (result != SE_Result::Success)
        return result;
    result = op.check_lists(source_ll, destination_ll);
    if (result != SE_Result::Success)
        return result;

    regs.write32(SE_CTX_SAVE_CONFIG, SE_CTX_SAVE_SRC_MEMORY);

    op.publish(pad.data, AES_BLOCK_SIZE);
    op.publish(source, source_len);

    result = op.start_context_save_operation(source_ll, destination_ll);
    if (result != SE_Result::Success)
        return result;

    op.acquire(pad.data, AES_BLOCK_SIZE);
    if (destination_len)
        memcpy(destination, pad.data, destination_len);
    return SE_Result::Success;
}
