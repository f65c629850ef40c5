#ifndef SE_REGISTERS_HPP
#define SE_REGISTERS_HPP
#include <cstdint>

class MMIO_Bus;

//Register offsets from the base of an engine instance
enum SE_Register
{
    SE_SECURITY = 0x000,
    SE_TZRAM_SECURITY = 0x004,
    SE_OPERATION = 0x008,
    SE_INT_ENABLE = 0x00C,
    SE_INT_STATUS = 0x010,
    SE_CONFIG = 0x014,
    SE_IN_LL_ADDR = 0x018,
    SE_IN_CUR_BYTE_ADDR = 0x01C,
    SE_IN_CUR_LL_ID = 0x020,
    SE_OUT_LL_ADDR = 0x024,
    SE_OUT_CUR_BYTE_ADDR = 0x028,
    SE_OUT_CUR_LL_ID = 0x02C,
    SE_HASH_RESULT = 0x030,
    SE_CTX_SAVE_CONFIG = 0x070,
    SE_SHA_CONFIG = 0x200,
    SE_SHA_MSG_LENGTH = 0x204,
    SE_SHA_MSG_LEFT = 0x214,
    SE_CRYPTO_SECURITY_PERKEY = 0x280,
    SE_CRYPTO_KEYTABLE_ACCESS = 0x284,
    SE_CRYPTO_CONFIG = 0x304,
    SE_CRYPTO_LINEAR_CTR = 0x308,
    SE_CRYPTO_LAST_BLOCK = 0x318,
    SE_CRYPTO_KEYTABLE_ADDR = 0x31C,
    SE_CRYPTO_KEYTABLE_DATA = 0x320,
    SE_CRYPTO_KEYTABLE_DST = 0x330,
    SE_RNG_CONFIG = 0x340,
    SE_RNG_SRC_CONFIG = 0x344,
    SE_RNG_RESEED_INTERVAL = 0x348,
    SE_RSA_CONFIG = 0x400,
    SE_RSA_KEY_SIZE = 0x404,
    SE_RSA_EXP_SIZE = 0x408,
    SE_RSA_SECURITY_PERKEY = 0x40C,
    SE_RSA_KEYTABLE_ACCESS = 0x410,
    SE_RSA_KEYTABLE_ADDR = 0x420,
    SE_RSA_KEYTABLE_DATA = 0x424,
    SE_RSA_OUTPUT = 0x428,
    SE_STATUS = 0x800,
    SE_ERR_STATUS = 0x804,
    SE_MISC = 0x808,
    SE_SPARE = 0x80C,
    SE_ENTROPY_DEBUG_COUNTER = 0x810
};

//Element counts of the register arrays
const static int SE_HASH_RESULT_COUNT = 16;
const static int SE_SHA_MSG_LENGTH_COUNT = 4;
const static int SE_CRYPTO_KEYTABLE_ACCESS_COUNT = 16;
const static int SE_CRYPTO_LINEAR_CTR_COUNT = 4;
const static int SE_RSA_KEYTABLE_ACCESS_COUNT = 2;
const static int SE_RSA_OUTPUT_COUNT = 64;

//SE_SECURITY. A cleared setting bit means secure.
#define SE_SECURITY_HARD_SETTING (1 << 0)
#define SE_SECURITY_ENG_DIS (1 << 1)
#define SE_SECURITY_PERKEY_SETTING (1 << 2)
#define SE_SECURITY_TZ_CONTEXT_SAVE_LOCK (1 << 5)
#define SE_SECURITY_SOFT_SETTING (1 << 16)

#define SE_TZRAM_SECURITY_LOCKDOWN (1 << 0)

#define SE_OPERATION_OPCODE_MASK 0x7

#define SE_INT_IN_LL_BUF_RD (1 << 0)
#define SE_INT_IN_DONE (1 << 1)
#define SE_INT_OUT_LL_BUF_WR (1 << 2)
#define SE_INT_OUT_DONE (1 << 3)
#define SE_INT_OP_DONE (1 << 4)
#define SE_INT_RESEED_CNTR_EXHAUSTED (1 << 5)
#define SE_INT_ERR_STAT (1 << 16)

#define SE_STATUS_STATE_MASK 0x3
#define SE_SHA_CONFIG_HW_INIT_HASH (1 << 0)
#define SE_CTX_SAVE_SRC_MEMORY 0

#define SE_RNG_SRC_CONFIG_ENTROPY_LOCK (1 << 0)
#define SE_RNG_SRC_CONFIG_ENTROPY_SOURCE (1 << 1)

namespace SE_State
{
    const static uint8_t IDLE = 0;
    const static uint8_t BUSY = 1;
    const static uint8_t WAIT_OUT = 2;
    const static uint8_t WAIT_IN = 3;
};

//Values of SE_CONFIG.ENC_MODE/DEC_MODE. SHA modes share the field.
namespace SE_Mode
{
    const static uint8_t AES128 = 0;
    const static uint8_t AES192 = 1;
    const static uint8_t AES256 = 2;
    const static uint8_t SHA1 = 0;
    const static uint8_t SHA224 = 4;
    const static uint8_t SHA256 = 5;
    const static uint8_t SHA384 = 6;
    const static uint8_t SHA512 = 7;
};

namespace SE_EncAlg
{
    const static uint8_t NOP = 0;
    const static uint8_t AES_ENC = 1;
    const static uint8_t RNG = 2;
    const static uint8_t SHA = 3;
    const static uint8_t RSA = 4;
};

namespace SE_DecAlg
{
    const static uint8_t NOP = 0;
    const static uint8_t AES_DEC = 1;
};

namespace SE_Destination
{
    const static uint8_t MEMORY = 0;
    const static uint8_t HASHREG = 1;
    const static uint8_t KEYTABLE = 2;
    const static uint8_t SRK = 3;
    const static uint8_t RSAREG = 4;
};

struct SE_CONFIG_REG
{
    uint8_t enc_mode;
    uint8_t dec_mode;
    uint8_t enc_alg;
    uint8_t dec_alg;
    uint8_t destination;

    uint32_t pack() const;
    static SE_CONFIG_REG unpack(uint32_t value);
};

namespace SE_XorPos
{
    const static uint8_t BYPASS = 0;
    const static uint8_t TOP = 2;
    const static uint8_t BOTTOM = 3;
};

namespace SE_InputSel
{
    const static uint8_t MEMORY = 0;
    const static uint8_t RANDOM = 1;
    const static uint8_t AESOUT = 2;
    const static uint8_t LINEAR_CTR = 3;
};

namespace SE_VctramSel
{
    const static uint8_t MEMORY = 0;
    const static uint8_t INIT_AESOUT = 2;
    const static uint8_t INIT_PREV_MEMORY = 3;
};

struct SE_CRYPTO_CONFIG_REG
{
    bool hash_enb;
    uint8_t xor_pos;
    uint8_t input_sel;
    uint8_t vctram_sel;
    bool iv_select_updated;
    bool core_sel_encrypt;
    bool keysch_bypass;
    uint8_t ctr_cntn;
    uint8_t key_index;
    bool memif_mcclient;

    uint32_t pack() const;
    static SE_CRYPTO_CONFIG_REG unpack(uint32_t value);
};

//SE_CRYPTO_KEYTABLE_ADDR word indices: 0-7 key, 8-11 original IV, 12-15 updated IV
#define SE_KEYTABLE_KEY_WORD(n) (n)
#define SE_KEYTABLE_ORIGINAL_IV_WORD(n) (8 + (n))
#define SE_KEYTABLE_UPDATED_IV_WORD(n) (12 + (n))

uint32_t se_keytable_addr(int slot, int word);

namespace SE_WordQuad
{
    const static uint8_t KEYS_0_3 = 0;
    const static uint8_t KEYS_4_7 = 1;
    const static uint8_t ORIGINAL_IV = 2;
    const static uint8_t UPDATED_IV = 3;
};

struct SE_KEYTABLE_DST_REG
{
    uint8_t word_quad;
    uint8_t key_index;

    uint32_t pack() const;
    static SE_KEYTABLE_DST_REG unpack(uint32_t value);
};

namespace SE_RngMode
{
    const static uint8_t NORMAL = 0;
    const static uint8_t FORCE_INSTANTIATION = 1;
    const static uint8_t FORCE_RESEED = 2;
};

namespace SE_RngSource
{
    const static uint8_t NONE = 0;
    const static uint8_t ENTROPY = 1;
    const static uint8_t LFSR = 2;
};

struct SE_RNG_CONFIG_REG
{
    uint8_t mode;
    uint8_t source;

    uint32_t pack() const;
    static SE_RNG_CONFIG_REG unpack(uint32_t value);
};

struct SE_RSA_KEYTABLE_ADDR_REG
{
    uint8_t word_addr;
    bool modulus;
    uint8_t key_slot;
    bool input_from_memory;

    uint32_t pack() const;
    static SE_RSA_KEYTABLE_ADDR_REG unpack(uint32_t value);
};

#define SE_RSA_CONFIG_KEY_SLOT_SHIFT 24

//Owned handle on one engine's register block. Every register address is computed here.
class SE_Registers
{
    private:
        MMIO_Bus* bus;
        uint32_t base;

        uint32_t addr_of(uint32_t offset);
        uint32_t array_addr(uint32_t offset, int count, int index);
    public:
        SE_Registers(MMIO_Bus* bus, uint32_t base);
        SE_Registers(const SE_Registers&) = delete;
        SE_Registers& operator=(const SE_Registers&) = delete;

        uint32_t get_base() const { return base; }

        uint32_t read32(uint32_t offset);
        void write32(uint32_t offset, uint32_t value);
        void modify32(uint32_t offset, uint32_t mask, uint32_t value);

        uint32_t read_array(uint32_t offset, int count, int index);
        void write_array(uint32_t offset, int count, int index, uint32_t value);

        uint32_t read_hash_result(int index);
        uint32_t read_rsa_output(int index);
        void write_linear_ctr(int index, uint32_t value);
        void write_sha_msg_length(int index, uint32_t value);
        void write_sha_msg_left(int index, uint32_t value);
        void write_crypto_keytable_access(int index, uint32_t value);
        void write_rsa_keytable_access(int index, uint32_t value);

        void write_config(const SE_CONFIG_REG& config);
        void write_crypto_config(const SE_CRYPTO_CONFIG_REG& config);
        SE_CRYPTO_CONFIG_REG read_crypto_config();
        void write_keytable_dst(const SE_KEYTABLE_DST_REG& dst);
        void write_rng_config(const SE_RNG_CONFIG_REG& config);
        void write_rsa_keytable_addr(const SE_RSA_KEYTABLE_ADDR_REG& addr);

        void write_keytable_word(int slot, int word, uint32_t value);
        uint32_t read_keytable_word(int slot, int word);
};

#endif // SE_REGISTERS_HPP
