#include "../common/common.hpp"
#include "../platform/mmio.hpp"
#include "constants.hpp"
#include "registers.hpp"

uint32_t SE_CONFIG_REG::pack() const
{
    uint32_t reg = 0;
    reg |= (destination & 0x7) << 2;
    reg |= (dec_alg & 0xF) << 8;
    reg |= (enc_alg & 0xF) << 12;
    reg |= dec_mode << 16;
    reg |= (uint32_t)enc_mode << 24;
    return reg;
}

SE_CONFIG_REG SE_CONFIG_REG::unpack(uint32_t value)
{
    SE_CONFIG_REG config;
    config.destination = (value >> 2) & 0x7;
    config.dec_alg = (value >> 8) & 0xF;
    config.enc_alg = (value >> 12) & 0xF;
    config.dec_mode = (value >> 16) & 0xFF;
    config.enc_mode = value >> 24;
    return config;
}

uint32_t SE_CRYPTO_CONFIG_REG::pack() const
{
    uint32_t reg = 0;
    reg |= hash_enb;
    reg |= (xor_pos & 0x3) << 1;
    reg |= (input_sel & 0x3) << 3;
    reg |= (vctram_sel & 0x3) << 5;
    reg |= iv_select_updated << 7;
    reg |= core_sel_encrypt << 8;
    reg |= keysch_bypass << 10;
    reg |= ctr_cntn << 11;
    reg |= (key_index & 0xF) << 24;
    reg |= (uint32_t)memif_mcclient << 31;
    return reg;
}

SE_CRYPTO_CONFIG_REG SE_CRYPTO_CONFIG_REG::unpack(uint32_t value)
{
    SE_CRYPTO_CONFIG_REG config;
    config.hash_enb = value & 0x1;
    config.xor_pos = (value >> 1) & 0x3;
    config.input_sel = (value >> 3) & 0x3;
    config.vctram_sel = (value >> 5) & 0x3;
    config.iv_select_updated = (value >> 7) & 0x1;
    config.core_sel_encrypt = (value >> 8) & 0x1;
    config.keysch_bypass = (value >> 10) & 0x1;
    config.ctr_cntn = (value >> 11) & 0xFF;
    config.key_index = (value >> 24) & 0xF;
    config.memif_mcclient = value >> 31;
    return config;
}

uint32_t se_keytable_addr(int slot, int word)
{
    return ((slot & 0xF) << 4) | (word & 0xF);
}

uint32_t SE_KEYTABLE_DST_REG::pack() const
{
    return (word_quad & 0x3) | ((key_index & 0xF) << 8);
}

SE_KEYTABLE_DST_REG SE_KEYTABLE_DST_REG::unpack(uint32_t value)
{
    SE_KEYTABLE_DST_REG dst;
    dst.word_quad = value & 0x3;
    dst.key_index = (value >> 8) & 0xF;
    return dst;
}

uint32_t SE_RNG_CONFIG_REG::pack() const
{
    return (mode & 0x3) | ((source & 0x3) << 2);
}

SE_RNG_CONFIG_REG SE_RNG_CONFIG_REG::unpack(uint32_t value)
{
    SE_RNG_CONFIG_REG config;
    config.mode = value & 0x3;
    config.source = (value >> 2) & 0x3;
    return config;
}

uint32_t SE_RSA_KEYTABLE_ADDR_REG::pack() const
{
    uint32_t reg = 0;
    reg |= word_addr & 0x3F;
    reg |= modulus << 6;
    reg |= (key_slot & 0x1) << 7;
    reg |= input_from_memory << 8;
    return reg;
}

SE_RSA_KEYTABLE_ADDR_REG SE_RSA_KEYTABLE_ADDR_REG::unpack(uint32_t value)
{
    SE_RSA_KEYTABLE_ADDR_REG addr;
    addr.word_addr = value & 0x3F;
    addr.modulus = (value >> 6) & 0x1;
    addr.key_slot = (value >> 7) & 0x1;
    addr.input_from_memory = (value >> 8) & 0x1;
    return addr;
}

SE_Registers::SE_Registers(MMIO_Bus* bus, uint32_t base) : bus(bus), base(base)
{

}

uint32_t SE_Registers::addr_of(uint32_t offset)
{
    if (offset >= SE_REGISTER_SPACE || (offset & 0x3))
        SEException::die("[SE] Invalid register offset $%03X\n", offset);
    return base + offset;
}

uint32_t SE_Registers::array_addr(uint32_t offset, int count, int index)
{
    if (index < 0 || index >= count)
        SEException::die("[SE] Index %d out of range for register array $%03X\n", index, offset);
    return addr_of(offset + (index * 4));
}

uint32_t SE_Registers::read32(uint32_t offset)
{
    return bus->read32(addr_of(offset));
}

void SE_Registers::write32(uint32_t offset, uint32_t value)
{
    bus->write32(addr_of(offset), value);
}

void SE_Registers::modify32(uint32_t offset, uint32_t mask, uint32_t value)
{
    uint32_t addr = addr_of(offset);
    uint32_t reg = bus->read32(addr);
    reg &= ~mask;
    reg |= value & mask;
    bus->write32(addr, reg);
}

uint32_t SE_Registers::read_array(uint32_t offset, int count, int index)
{
    return bus->read32(array_addr(offset, count, index));
}

void SE_Registers::write_array(uint32_t offset, int count, int index, uint32_t value)
{
    bus->write32(array_addr(offset, count, index), value);
}

uint32_t SE_Registers::read_hash_result(int index)
{
    return read_array(SE_HASH_RESULT, SE_HASH_RESULT_COUNT, index);
}

uint32_t SE_Registers::read_rsa_output(int index)
{
    return read_array(SE_RSA_OUTPUT, SE_RSA_OUTPUT_COUNT, index);
}

void SE_Registers::write_linear_ctr(int index, uint32_t value)
{
    write_array(SE_CRYPTO_LINEAR_CTR, SE_CRYPTO_LINEAR_CTR_COUNT, index, value);
}

void SE_Registers::write_sha_msg_length(int index, uint32_t value)
{
    write_array(SE_SHA_MSG_LENGTH, SE_SHA_MSG_LENGTH_COUNT, index, value);
}

void SE_Registers::write_sha_msg_left(int index, uint32_t value)
{
    write_array(SE_SHA_MSG_LEFT, SE_SHA_MSG_LENGTH_COUNT, index, value);
}

void SE_Registers::write_crypto_keytable_access(int index, uint32_t value)
{
    write_array(SE_CRYPTO_KEYTABLE_ACCESS, SE_CRYPTO_KEYTABLE_ACCESS_COUNT, index, value);
}

void SE_Registers::write_rsa_keytable_access(int index, uint32_t value)
{
    write_array(SE_RSA_KEYTABLE_ACCESS, SE_RSA_KEYTABLE_ACCESS_COUNT, index, value);
}

void SE_Registers::write_config(const SE_CONFIG_REG& config)
{
    write32(SE_CONFIG, config.pack());
}

void SE_Registers::write_crypto_config(const SE_CRYPTO_CONFIG_REG& config)
{
    write32(SE_CRYPTO_CONFIG, config.pack());
}

SE_CRYPTO_CONFIG_REG SE_Registers::read_crypto_config()
{
    return SE_CRYPTO_CONFIG_REG::unpack(read32(SE_CRYPTO_CONFIG));
}

void SE_Registers::write_keytable_dst(const SE_KEYTABLE_DST_REG& dst)
{
    write32(SE_CRYPTO_KEYTABLE_DST, dst.pack());
}

void SE_Registers::write_rng_config(const SE_RNG_CONFIG_REG& config)
{
    write32(SE_RNG_CONFIG, config.pack());
}

void SE_Registers::write_rsa_keytable_addr(const SE_RSA_KEYTABLE_ADDR_REG& addr)
{
    write32(SE_RSA_KEYTABLE_ADDR, addr.pack());
}

void SE_Registers::write_keytable_word(int slot, int word, uint32_t value)
{
    write32(SE_CRYPTO_KEYTABLE_ADDR, se_keytable_addr(slot, word));
    write32(SE_CRYPTO_KEYTABLE_DATA, value);
}

uint32_t SE_Registers::read_keytable_word(int slot, int word)
{
    write32(SE_CRYPTO_KEYTABLE_ADDR, se_keytable_addr(slot, word));
    return read32(SE_CRYPTO_KEYTABLE_DATA);
}
