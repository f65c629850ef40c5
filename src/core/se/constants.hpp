#ifndef SE_CONSTANTS_HPP
#define SE_CONSTANTS_HPP
#include <cstdint>

#define SE1_BASE 0x70012000
#define SE2_BASE 0x70412000
#define SE_REGISTER_SPACE 0x2000

namespace SE_Opcode
{
    const static uint32_t ABORT = 0;
    const static uint32_t START = 1;
    const static uint32_t RESTART_OUT = 2;
    const static uint32_t CTX_SAVE = 3;
    const static uint32_t RESTART_IN = 4;
};

const static int AES_BLOCK_SIZE = 16;
const static int AES_KEY_SLOT_COUNT = 16;
const static int AES_MIN_KEY_SIZE = 16;
const static int AES_MAX_KEY_SIZE = 32;
const static int AES_KEYTABLE_WORDS = 16;

const static uint32_t RNG_RESEED_INTERVAL = 70000 + 1;

const static int RSA_KEY_SLOT_COUNT = 2;
const static int RSA_MAX_SIZE = 256;
const static int RSA_KEYTABLE_WORDS = RSA_MAX_SIZE / 4;

const static int SHA_MAX_DIGEST_SIZE = 64;

//Context save buffer sizes
const static int SE_CTX_BUFFER_SIZE = 1072;
const static int SE_CTX_DRBG_BUFFER_SIZE = 2112;

#endif // SE_CONSTANTS_HPP
