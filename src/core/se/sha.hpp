#ifndef SE_SHA_HPP
#define SE_SHA_HPP
#include <cstddef>
#include <cstdint>
#include "result.hpp"

class SE_Operation;
class SE_Registers;

enum class SHA_Mode
{
    SHA1,
    SHA224,
    SHA256,
    SHA384,
    SHA512
};

class SE_SHA
{
    private:
        SE_Registers* regs;
        SE_Operation* op;
    public:
        SE_SHA(SE_Registers* regs, SE_Operation* op);

        static int digest_size(SHA_Mode mode);
        static uint8_t mode_value(SHA_Mode mode);

        //output must hold digest_size(mode) bytes. byteswap selects big-endian words,
        //the byte order of published digests.
        SE_Result calculate(SHA_Mode mode, const uint8_t* source, size_t len, uint8_t* output, bool byteswap = true);

        SE_Result calculate_sha1(const uint8_t* source, size_t len, uint8_t* output);
        SE_Result calculate_sha224(const uint8_t* source, size_t len, uint8_t* output);
        SE_Result calculate_sha256(const uint8_t* source, size_t len, uint8_t* output);
        SE_Result calculate_sha384(const uint8_t* source, size_t len, uint8_t* output);
        SE_Result calculate_sha512(const uint8_t* source, size_t len, uint8_t* output);
};

#endif // SE_SHA_HPP
