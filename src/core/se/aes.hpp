#ifndef SE_AES_HPP
#define SE_AES_HPP
#include <cstddef>
#include <cstdint>
#include "linked_list.hpp"
#include "operation.hpp"
#include "registers.hpp"
#include "result.hpp"

enum class AES_Mode
{
    AES128,
    AES192,
    AES256
};

enum class AES_Chain
{
    ECB,
    CBC_ENCRYPT,
    CBC_DECRYPT,
    CTR,
    CMAC
};

//A single block staged through cache-line scratch pads, lists built up front
struct AES_PaddedBlock
{
    SE_CachePad in, out;
    SE_LinkedList in_ll, out_ll;
};

class SE_AES
{
    private:
        SE_Registers* regs;
        SE_Operation* op;

        void check_slot(int slot);
        void init_aes(bool encrypt, uint8_t destination, AES_Mode mode);
        void configure(AES_Chain chain, int slot, bool encrypt);
        void set_iv(int slot, const uint8_t* iv);
        void set_counter(const uint8_t* ctr);
        SE_Result make_lists(const uint8_t* source, uint8_t* destination, size_t len,
                             SE_LinkedList& source_ll, SE_LinkedList& destination_ll);
        SE_Result crypt_memory(SE_LinkedList& source_ll, SE_LinkedList& destination_ll,
                               const uint8_t* source, uint8_t* destination, size_t len);
        SE_Result prepare_padded_block(AES_PaddedBlock& block);
        SE_Result crypt_padded_block(AES_PaddedBlock& block, const uint8_t* source, uint8_t* destination,
                                     size_t len);
        SE_Result ecb_block(bool encrypt, int slot, AES_PaddedBlock& block, const uint8_t* source,
                            uint8_t* destination, AES_Mode mode);
        SE_Result ecb_operation(bool encrypt, int slot, const uint8_t* source, uint8_t* destination, AES_Mode mode);
        SE_Result cbc_operation(bool encrypt, int slot, const uint8_t* source, uint8_t* destination, size_t len,
                                const uint8_t* iv, AES_Mode mode);
    public:
        SE_AES(SE_Registers* regs, SE_Operation* op);

        static uint8_t mode_value(AES_Mode mode);
        static int key_size(AES_Mode mode);
        static SE_CRYPTO_CONFIG_REG crypto_config(AES_Chain chain, int slot, bool encrypt);

        void fill_keyslot(int slot, const uint8_t* key, size_t len);
        void get_key(int slot, uint8_t* key, size_t len);
        void clear_keyslot(int slot);
        void clear_key_iv(int slot);

        SE_Result ecb_encrypt(int slot, const uint8_t* source, uint8_t* destination, AES_Mode mode);
        SE_Result ecb_decrypt(int slot, const uint8_t* source, uint8_t* destination, AES_Mode mode);
        SE_Result cbc_encrypt(int slot, const uint8_t* source, uint8_t* destination, size_t len,
                              const uint8_t* iv, AES_Mode mode);
        SE_Result cbc_decrypt(int slot, const uint8_t* source, uint8_t* destination, size_t len,
                              const uint8_t* iv, AES_Mode mode);
        SE_Result ctr_crypt(int slot, const uint8_t* source, uint8_t* destination, size_t len,
                            const uint8_t* ctr, AES_Mode mode);
        SE_Result cmac(int slot, const uint8_t* source, size_t len, uint8_t* mac, AES_Mode mode);
};

#endif // SE_AES_HPP
