#ifndef SECURITY_ENGINE_HPP
#define SECURITY_ENGINE_HPP
#include <cstddef>
#include <cstdint>
#include "../platform/ahb.hpp"
#include "aes.hpp"
#include "config.hpp"
#include "operation.hpp"
#include "registers.hpp"
#include "result.hpp"
#include "rng.hpp"
#include "rsa.hpp"
#include "sha.hpp"

class AddressTranslator;
class CacheMaintenance;
class Clock;
class MMIO_Bus;

//One physical engine instance. Not copyable, and every operation needs exclusive access
//for its whole duration.
class SecurityEngine
{
    private:
        SE_Registers regs;
        AHB_Arbiter ahb;
        SE_Operation op;

        SE_AES aes;
        SE_SHA sha;
        SE_RNG rng;
        SE_RSA rsa;

        void set_security(uint32_t mask, uint32_t value);
    public:
        SecurityEngine(MMIO_Bus* se_bus, uint32_t base, MMIO_Bus* ahb_bus, Clock* clock, CacheMaintenance* cache,
                       AddressTranslator* translator, const SE_Config& config = SE_Config());
        SecurityEngine(const SecurityEngine&) = delete;
        SecurityEngine& operator=(const SecurityEngine&) = delete;

        SE_Registers& registers() { return regs; }
        SE_Operation& operation() { return op; }

        //Access control
        void lock();
        void unlock();
        void lock_per_key();
        void lock_tzram();
        void lock_context_save();
        void disable();

        //AES
        void fill_aes_keyslot(int slot, const uint8_t* key, size_t len);
        void get_aes_key(int slot, uint8_t* key, size_t len);
        void clear_aes_keyslot(int slot);
        void clear_aes_key_iv(int slot);
        SE_Result aes_ecb_encrypt(int slot, const uint8_t* source, uint8_t* destination,
                                  AES_Mode mode = AES_Mode::AES128);
        SE_Result aes_ecb_decrypt(int slot, const uint8_t* source, uint8_t* destination,
                                  AES_Mode mode = AES_Mode::AES128);
        SE_Result aes_cbc_encrypt(int slot, const uint8_t* source, uint8_t* destination, size_t len,
                                  const uint8_t* iv, AES_Mode mode = AES_Mode::AES128);
        SE_Result aes_cbc_decrypt(int slot, const uint8_t* source, uint8_t* destination, size_t len,
                                  const uint8_t* iv, AES_Mode mode = AES_Mode::AES128);
        SE_Result aes_ctr_crypt(int slot, const uint8_t* source, uint8_t* destination, size_t len,
                                const uint8_t* ctr, AES_Mode mode = AES_Mode::AES128);
        SE_Result aes_cmac(int slot, const uint8_t* source, size_t len, uint8_t* mac,
                           AES_Mode mode = AES_Mode::AES128);

        //Hashing
        SE_Result calculate_sha(SHA_Mode mode, const uint8_t* source, size_t len, uint8_t* output,
                                bool byteswap = true);
        SE_Result calculate_sha1(const uint8_t* source, size_t len, uint8_t* output);
        SE_Result calculate_sha224(const uint8_t* source, size_t len, uint8_t* output);
        SE_Result calculate_sha256(const uint8_t* source, size_t len, uint8_t* output);
        SE_Result calculate_sha384(const uint8_t* source, size_t len, uint8_t* output);
        SE_Result calculate_sha512(const uint8_t* source, size_t len, uint8_t* output);

        //RNG
        SE_Result initialize_rng();
        SE_Result generate_random(uint8_t* output, size_t len);
        SE_Result set_random_key(int slot);
        SE_Result generate_srk();

        //RSA
        void fill_rsa_keyslot(int slot, const uint8_t* modulus, size_t modulus_len,
                              const uint8_t* exponent, size_t exponent_len);
        void clear_rsa_keyslot(int slot);
        SE_Result rsa_encrypt(const RSA_KeyInfo& key_info, int slot, const uint8_t* source, size_t source_len,
                              uint8_t* destination, size_t destination_len);

        //Encrypts source into destination (at most one AES block) under the SRK
        SE_Result context_save(const uint8_t* source, size_t source_len, uint8_t* destination, size_t destination_len);
};

#endif // SECURITY_ENGINE_HPP
