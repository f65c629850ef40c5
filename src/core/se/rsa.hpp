#ifndef SE_RSA_HPP
#define SE_RSA_HPP
#include <cstddef>
#include <cstdint>
#include "result.hpp"

class SE_Operation;
class SE_Registers;

//Size codes as the engine expects them in SE_RSA_KEY_SIZE and SE_RSA_EXP_SIZE
struct RSA_KeyInfo
{
    uint32_t modulus_size;
    uint32_t exponent_size;

    RSA_KeyInfo() : modulus_size(0), exponent_size(0) {}

    void update(size_t modulus_bytes, size_t exponent_bytes);
    void reset();
};

class SE_RSA
{
    private:
        SE_Registers* regs;
        SE_Operation* op;

        void check_slot(int slot);
        void select_word(int slot, bool modulus, int word);
        void fill_keyslot_part(int slot, bool modulus, const uint8_t* key, size_t len);
        void clear_keyslot_part(int slot, bool modulus);
    public:
        SE_RSA(SE_Registers* regs, SE_Operation* op);

        //modulus and exponent are big-endian byte strings, at most 256 bytes, whole words
        void fill_keyslot(int slot, const uint8_t* modulus, size_t modulus_len,
                          const uint8_t* exponent, size_t exponent_len);
        void clear_keyslot(int slot);

        //destination receives the big-endian result; its length must be whole words
        SE_Result encrypt(const RSA_KeyInfo& key_info, int slot, const uint8_t* source, size_t source_len,
                          uint8_t* destination, size_t destination_len);
};

#endif // SE_RSA_HPP
